#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "segue/model/Track.h"

namespace segue::harmonic {

enum class MixMode {
    Classic = 0,   // key-dominant Camelot mixing
    Intelligent,   // default blend
    EnergyFlow,
    Emotional,
    Structural,    // equal quarters, paired with structural analysis
};

QString mixModeToString(MixMode m);
// Unknown strings map to Intelligent; ok (if given) reports whether the string was recognised.
MixMode mixModeFromString(const QString& s, bool* ok = nullptr);

struct HarmonicWeights {
    double key = 0.4;
    double bpm = 0.3;
    double energy = 0.2;
    double emotional = 0.1;

    static HarmonicWeights forMode(MixMode m);

    QJsonObject toJson() const;
    static HarmonicWeights fromJson(const QJsonObject& o);
};

struct HarmonicTolerances {
    double bpm = 6.0;    // beyond the 2 BPM "identical" window
    double energy = 2.0; // energy levels
};

// Pairwise key/tempo/energy/emotion compatibility.
//
// Dimensions missing on either track contribute nothing and the total is NOT
// renormalised by the weight actually used (a pair with no emotional data tops
// out at 0.9 in Intelligent mode). The stylistic matrix does renormalise.
class HarmonicScorer {
public:
    HarmonicScorer() = default;
    explicit HarmonicScorer(MixMode mode, HarmonicTolerances tol = {});

    void setMode(MixMode mode);
    MixMode mode() const { return m_mode; }

    void setWeights(const HarmonicWeights& w) { m_weights = w; }
    const HarmonicWeights& weights() const { return m_weights; }

    void setTolerances(const HarmonicTolerances& t) { m_tol = t; }
    const HarmonicTolerances& tolerances() const { return m_tol; }

    double compatibility(const model::Track& a, const model::Track& b) const;
    double compatibility(const model::Track& a, const model::Track& b, const HarmonicWeights& w) const;

    double keyScore(const QString& key1, const QString& key2) const;
    double tempoScore(double bpm1, double bpm2) const;
    double energyScore(double e1, double e2) const;
    static double emotionalScore(double e1, double e2);

    // n x n pairwise scores, zero diagonal. Row = outgoing track.
    QVector<QVector<double>> compatibilityMatrix(const model::TrackList& tracks) const;

private:
    MixMode m_mode = MixMode::Intelligent;
    HarmonicWeights m_weights;
    HarmonicTolerances m_tol;
};

} // namespace segue::harmonic
