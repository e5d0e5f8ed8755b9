#include "segue/structure/StructuralScorer.h"

#include <QtGlobal>

namespace segue::structure {
namespace {

static double meanBeatInterval(const QVector<double>& beats) {
    if (beats.size() < 2) return 0.0;
    return (beats.last() - beats.first()) / double(beats.size() - 1);
}

static double meanEnergyIn(const QVector<QPair<double, double>>& curve, double from, double to) {
    double sum = 0.0;
    int n = 0;
    for (const auto& s : curve) {
        if (s.first < from || s.first > to) continue;
        sum += s.second;
        ++n;
    }
    return n > 0 ? sum / double(n) : 0.5;
}

static double trackStability(const StructuralAnalysis& s) {
    const double minutes = s.durationSec / 60.0;
    if (minutes <= 0.0) return s.tempoChanges.isEmpty() ? 1.0 : 0.0;
    return 1.0 - qMin(double(s.tempoChanges.size()) / minutes, 1.0);
}

// 1.0 inside the 15..45 s window, falling off linearly around 30 s.
static double mixOutTimingScore(double remainingSec) {
    if (remainingSec >= 15.0 && remainingSec <= 45.0) return 1.0;
    return qMax(0.0, 1.0 - qAbs(remainingSec - 30.0) / 30.0);
}

static double mixInTimingScore(double timeSec) {
    if (timeSec >= 10.0) return 1.0;
    return qMax(0.0, timeSec / 10.0);
}

} // namespace

double StructuralScorer::durationScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    const double hi = qMax(a->durationSec, b->durationSec);
    if (hi <= 0.0) return 0.5;
    return qMin(a->durationSec, b->durationSec) / hi;
}

double StructuralScorer::beatScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    const double i1 = meanBeatInterval(a->beatGrid);
    const double i2 = meanBeatInterval(b->beatGrid);
    if (i1 <= 0.0 || i2 <= 0.0) return 0.5;
    return m_tempo.tempoScore(60.0 / i1, 60.0 / i2);
}

double StructuralScorer::energyContinuityScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    if (a->energyCurve.isEmpty() || b->energyCurve.isEmpty()) return 0.5;

    const double outro = meanEnergyIn(a->energyCurve, qMax(0.0, a->durationSec - kEdgeWindowSec), a->durationSec);
    const double intro = meanEnergyIn(b->energyCurve, 0.0, qMin(kEdgeWindowSec, b->durationSec));
    return qMax(0.0, 1.0 - qAbs(outro - intro));
}

double StructuralScorer::structuralScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    return 0.3 * durationScore(a, b) + 0.4 * beatScore(a, b) + 0.3 * energyContinuityScore(a, b);
}

double StructuralScorer::transitionQualityScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    const TransitionPoint* out = a->bestPoint();
    const TransitionPoint* in = b->bestPoint();
    if (!out || !in) return 0.5;
    return (out->mixSuitability + in->mixSuitability) / 2.0;
}

double StructuralScorer::tempoStability(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    return (trackStability(*a) + trackStability(*b)) / 2.0;
}

double StructuralScorer::elementPairScore(StructuralElement out, StructuralElement in) {
    using E = StructuralElement;
    switch (out) {
        case E::Outro:
            if (in == E::Intro) return 1.0;
            if (in == E::Verse) return 0.8;
            if (in == E::Break) return 0.9;
            break;
        case E::Break:
            if (in == E::Verse) return 0.9;
            if (in == E::Chorus) return 0.7;
            if (in == E::Buildup) return 0.8;
            break;
        case E::Verse:
            if (in == E::Verse) return 0.8;
            if (in == E::Chorus) return 0.6;
            if (in == E::Intro) return 0.7;
            break;
        default:
            break;
    }
    return 0.5;
}

double StructuralScorer::elementMatching(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    if (a->transitionPoints.isEmpty() || b->transitionPoints.isEmpty()) return 0.5;

    double best = 0.0;
    for (const auto& out : a->transitionPoints) {
        for (const auto& in : b->transitionPoints) {
            best = qMax(best, elementPairScore(out.element, in.element));
        }
    }
    return best;
}

double StructuralScorer::timingFeasibility(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    const TransitionPoint* out = a->bestPoint();
    const TransitionPoint* in = b->bestPoint();
    if (!out || !in) return 0.5;
    return (mixOutTimingScore(a->durationSec - out->timeSec) + mixInTimingScore(in->timeSec)) / 2.0;
}

double StructuralScorer::temporalScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const {
    if (!a || !b) return 0.5;
    return 0.4 * tempoStability(a, b) + 0.3 * elementMatching(a, b) + 0.3 * timingFeasibility(a, b);
}

double StructuralScorer::evaluatePair(const TransitionPoint& out,
                                      const TransitionPoint& in,
                                      const StructuralAnalysis& a) const {
    const double pointQuality = (out.mixSuitability + in.mixSuitability) / 2.0;
    const double timing = mixOutTimingScore(a.durationSec - out.timeSec);
    const double energy = qMax(0.0, 1.0 - qAbs(out.energyLevel - in.energyLevel));
    const double beat = qMin(out.beatStrength, in.beatStrength);
    return 0.4 * pointQuality + 0.3 * timing + 0.2 * energy + 0.1 * beat;
}

double StructuralScorer::estimateMixDuration(const TransitionPoint& out, const TransitionPoint& in) {
    double sec = 16.0;
    if (qAbs(out.energyLevel - in.energyLevel) > 0.3) sec += 8.0;

    const double minBeat = qMin(out.beatStrength, in.beatStrength);
    if (minBeat > 0.7) {
        sec -= 4.0;
    } else if (minBeat < 0.3) {
        sec += 8.0;
    }
    return qBound(8.0, sec, 32.0);
}

bool StructuralScorer::findOptimalTransition(const StructuralAnalysis& a,
                                             const StructuralAnalysis& b,
                                             MixTransition& out) const {
    if (a.transitionPoints.isEmpty() || b.transitionPoints.isEmpty()) return false;

    const int nOut = qMin(kSearchDepth, int(a.transitionPoints.size()));
    const int nIn = qMin(kSearchDepth, int(b.transitionPoints.size()));

    double best = -1.0;
    for (int i = 0; i < nOut; ++i) {
        const TransitionPoint& po = a.transitionPoints[i];
        for (int j = 0; j < nIn; ++j) {
            const TransitionPoint& pi = b.transitionPoints[j];
            const double q = evaluatePair(po, pi, a);
            if (q <= best) continue;
            best = q;
            out.fromTrackId = a.trackId;
            out.toTrackId = b.trackId;
            out.mixOut = po;
            out.mixIn = pi;
            out.transitionQuality = q;
            out.mixDurationSec = estimateMixDuration(po, pi);
        }
    }
    return true;
}

const TransitionPoint* StructuralScorer::bestMixOutPoint(const StructuralAnalysis& a, double targetTimeSec) {
    if (a.transitionPoints.isEmpty()) return nullptr;

    if (targetTimeSec >= 0.0) {
        const TransitionPoint* closest = nullptr;
        for (const auto& p : a.transitionPoints) {
            const double dist = qAbs(p.timeSec - targetTimeSec);
            if (p.mixSuitability <= 0.6 || dist >= kEdgeWindowSec) continue;
            if (!closest || dist < qAbs(closest->timeSec - targetTimeSec)) closest = &p;
        }
        if (closest) return closest;
    }
    return a.bestPoint();
}

const TransitionPoint* StructuralScorer::bestMixInPoint(const StructuralAnalysis& a) {
    if (a.transitionPoints.isEmpty()) return nullptr;

    const double introEnd = a.hasIntroEnd() ? a.introEndSec : 0.0;
    const double outroStart = a.hasOutroStart() ? a.outroStartSec : a.durationSec;

    const TransitionPoint* best = nullptr;
    for (const auto& p : a.transitionPoints) {
        if (p.timeSec <= introEnd || p.timeSec >= outroStart - kEdgeWindowSec) continue;
        if (p.mixSuitability <= 0.5) continue;
        if (!best || p.mixSuitability > best->mixSuitability) best = &p;
    }
    return best ? best : a.bestPoint();
}

} // namespace segue::structure
