#include "segue/harmonic/HarmonicScorer.h"

#include "segue/harmonic/CamelotKey.h"

#include <QtGlobal>

namespace segue::harmonic {

QString mixModeToString(MixMode m) {
    switch (m) {
        case MixMode::Classic: return "classic";
        case MixMode::Intelligent: return "intelligent";
        case MixMode::EnergyFlow: return "energy";
        case MixMode::Emotional: return "emotional";
        case MixMode::Structural: return "structural";
    }
    return "intelligent";
}

MixMode mixModeFromString(const QString& s, bool* ok) {
    const QString k = s.trimmed().toLower();
    if (ok) *ok = true;
    if (k == "classic") return MixMode::Classic;
    if (k == "intelligent") return MixMode::Intelligent;
    if (k == "energy") return MixMode::EnergyFlow;
    if (k == "emotional") return MixMode::Emotional;
    if (k == "structural") return MixMode::Structural;
    if (ok) *ok = false;
    return MixMode::Intelligent;
}

HarmonicWeights HarmonicWeights::forMode(MixMode m) {
    HarmonicWeights w;
    switch (m) {
        case MixMode::Classic:
            w.key = 0.9; w.bpm = 0.1; w.energy = 0.0; w.emotional = 0.0;
            break;
        case MixMode::EnergyFlow:
            w.key = 0.2; w.bpm = 0.2; w.energy = 0.5; w.emotional = 0.1;
            break;
        case MixMode::Emotional:
            w.key = 0.2; w.bpm = 0.1; w.energy = 0.2; w.emotional = 0.5;
            break;
        case MixMode::Structural:
            w.key = 0.25; w.bpm = 0.25; w.energy = 0.25; w.emotional = 0.25;
            break;
        case MixMode::Intelligent:
            break;
    }
    return w;
}

QJsonObject HarmonicWeights::toJson() const {
    QJsonObject o;
    o.insert("key", key);
    o.insert("bpm", bpm);
    o.insert("energy", energy);
    o.insert("emotional", emotional);
    return o;
}

HarmonicWeights HarmonicWeights::fromJson(const QJsonObject& o) {
    HarmonicWeights w;
    w.key = qMax(0.0, o.value("key").toDouble(w.key));
    w.bpm = qMax(0.0, o.value("bpm").toDouble(w.bpm));
    w.energy = qMax(0.0, o.value("energy").toDouble(w.energy));
    w.emotional = qMax(0.0, o.value("emotional").toDouble(w.emotional));
    return w;
}

HarmonicScorer::HarmonicScorer(MixMode mode, HarmonicTolerances tol)
    : m_tol(tol) {
    setMode(mode);
}

void HarmonicScorer::setMode(MixMode mode) {
    m_mode = mode;
    m_weights = HarmonicWeights::forMode(mode);
}

double HarmonicScorer::compatibility(const model::Track& a, const model::Track& b) const {
    return compatibility(a, b, m_weights);
}

double HarmonicScorer::compatibility(const model::Track& a, const model::Track& b,
                                     const HarmonicWeights& w) const {
    double score = 0.0;
    if (a.hasKey() && b.hasKey()) score += w.key * keyScore(a.key, b.key);
    if (a.hasBpm() && b.hasBpm()) score += w.bpm * tempoScore(a.bpm, b.bpm);
    if (a.hasEnergy() && b.hasEnergy()) score += w.energy * energyScore(a.energy, b.energy);
    if (a.hasEmotionalIntensity() && b.hasEmotionalIntensity())
        score += w.emotional * emotionalScore(a.emotionalIntensity, b.emotionalIntensity);
    return qBound(0.0, score, 1.0);
}

double HarmonicScorer::keyScore(const QString& key1, const QString& key2) const {
    const CamelotKey k1 = CamelotKey::parse(key1);
    const CamelotKey k2 = CamelotKey::parse(key2);
    if (!k1.isValid() || !k2.isValid()) return 0.0;
    if (k1.number == k2.number && k1.letter == k2.letter) return 1.0;

    if (k1.compatibleKeys().contains(k2.toString())) return 0.8;

    // Relative major/minor. compatibleKeys() already contains the relative key, so this
    // never fires; kept until product decides whether relatives should score 0.7 or 0.8.
    if (k1.number == k2.number && k1.letter != k2.letter) return 0.7;

    const int d = wheelDistance(k1.number, k2.number);
    return qMax(0.0, 0.5 - 0.1 * double(d));
}

double HarmonicScorer::tempoScore(double bpm1, double bpm2) const {
    const double diff = qAbs(bpm1 - bpm2);
    if (diff <= 2.0) return 1.0;
    if (diff <= m_tol.bpm) return 1.0 - (diff / m_tol.bpm) * 0.5;
    if (qAbs(bpm1 * 2.0 - bpm2) <= 4.0 || qAbs(bpm1 - bpm2 * 2.0) <= 4.0) return 0.6;
    return qMax(0.0, 0.3 - (diff - m_tol.bpm) * 0.02);
}

double HarmonicScorer::energyScore(double e1, double e2) const {
    const double diff = qAbs(e1 - e2);
    if (diff <= 1.0) return 1.0;
    if (diff <= m_tol.energy) return 0.8;
    return qMax(0.0, 0.5 - (diff - m_tol.energy) * 0.1);
}

double HarmonicScorer::emotionalScore(double e1, double e2) {
    return qMax(0.0, 1.0 - qAbs(e1 - e2) / 10.0);
}

QVector<QVector<double>> HarmonicScorer::compatibilityMatrix(const model::TrackList& tracks) const {
    const int n = tracks.size();
    QVector<QVector<double>> m(n, QVector<double>(n, 0.0));
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i == j) continue;
            m[i][j] = compatibility(tracks[i], tracks[j]);
        }
    }
    return m;
}

} // namespace segue::harmonic
