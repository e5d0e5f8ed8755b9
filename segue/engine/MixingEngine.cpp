#include "segue/engine/MixingEngine.h"

#include <QtGlobal>

namespace segue::engine {

QString progressionCurveToString(ProgressionCurve c) {
    switch (c) {
        case ProgressionCurve::Neutral: return "neutral";
        case ProgressionCurve::Ascending: return "ascending";
        case ProgressionCurve::Descending: return "descending";
    }
    return "neutral";
}

ProgressionCurve progressionCurveFromString(const QString& s) {
    const QString k = s.trimmed().toLower();
    if (k == "ascending") return ProgressionCurve::Ascending;
    if (k == "descending") return ProgressionCurve::Descending;
    return ProgressionCurve::Neutral;
}

MixingEngine::MixingEngine(const CompatibilityOrchestrator* enhanced, harmonic::MixMode mode)
    : m_scorer(mode), m_enhanced(enhanced) {}

double MixingEngine::score(const model::Track& a, const model::Track& b) const {
    return m_scorer.compatibility(a, b);
}

double MixingEngine::scoreEnhanced(const model::Track& a,
                                   const model::Track& b,
                                   const structure::StructuralAnalysis* structuralA,
                                   const structure::StructuralAnalysis* structuralB,
                                   const model::TrackMetadata* metadataA,
                                   const model::TrackMetadata* metadataB) const {
    if (!m_enhanced) return score(a, b);
    return m_enhanced->scoreEnhanced(a, b, structuralA, structuralB, metadataA, metadataB);
}

QVector<QVector<double>> MixingEngine::compatibilityMatrix(const model::TrackList& tracks) const {
    return m_scorer.compatibilityMatrix(tracks);
}

model::TrackList MixingEngine::quickPlaylist(const model::TrackList& tracks,
                                             const QString& startId,
                                             int targetLength,
                                             ProgressionCurve curve) const {
    model::TrackList out;
    if (tracks.isEmpty() || targetLength <= 0) return out;

    const model::Track* start = startId.isEmpty() ? &tracks.first() : model::findTrack(tracks, startId);
    if (!start) return out;

    out.push_back(*start);
    model::TrackList remaining;
    for (const auto& t : tracks) {
        if (t.id != start->id) remaining.push_back(t);
    }

    while (out.size() < targetLength && !remaining.isEmpty()) {
        const model::Track& current = out.last();
        int bestIdx = -1;
        double best = 0.0;
        for (int i = 0; i < remaining.size(); ++i) {
            const model::Track& cand = remaining[i];
            double s = score(current, cand);
            if (cand.hasEnergy()) {
                if (curve == ProgressionCurve::Ascending && cand.energy > current.energy) s *= 1.2;
                if (curve == ProgressionCurve::Descending && cand.energy < current.energy) s *= 1.2;
            }
            if (bestIdx < 0 || s > best) {
                bestIdx = i;
                best = s;
            }
        }
        if (bestIdx < 0 || best <= kQuickMinScore) break;
        out.push_back(remaining.takeAt(bestIdx));
    }
    return out;
}

} // namespace segue::engine
