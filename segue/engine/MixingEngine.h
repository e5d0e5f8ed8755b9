#pragma once

#include <QString>

#include "segue/engine/CompatibilityOrchestrator.h"
#include "segue/harmonic/HarmonicScorer.h"
#include "segue/model/Track.h"

namespace segue::engine {

enum class ProgressionCurve {
    Neutral = 0,
    Ascending,  // favour rising energy
    Descending, // favour falling energy
};

QString progressionCurveToString(ProgressionCurve c);
ProgressionCurve progressionCurveFromString(const QString& s);

// Harmonic-only facade. Enhanced scoring is available only when an orchestrator is injected.
class MixingEngine {
public:
    explicit MixingEngine(const CompatibilityOrchestrator* enhanced = nullptr,
                          harmonic::MixMode mode = harmonic::MixMode::Intelligent);

    void setMode(harmonic::MixMode mode) { m_scorer.setMode(mode); }
    harmonic::MixMode mode() const { return m_scorer.mode(); }

    harmonic::HarmonicScorer& scorer() { return m_scorer; }
    const harmonic::HarmonicScorer& scorer() const { return m_scorer; }

    bool supportsEnhancedScoring() const { return m_enhanced != nullptr; }

    double score(const model::Track& a, const model::Track& b) const;

    // Falls back to score() without an orchestrator.
    double scoreEnhanced(const model::Track& a,
                         const model::Track& b,
                         const structure::StructuralAnalysis* structuralA = nullptr,
                         const structure::StructuralAnalysis* structuralB = nullptr,
                         const model::TrackMetadata* metadataA = nullptr,
                         const model::TrackMetadata* metadataB = nullptr) const;

    QVector<QVector<double>> compatibilityMatrix(const model::TrackList& tracks) const;

    // Greedy harmonic chain. Starts at startId (or the first track); stops when the best
    // remaining candidate scores <= kQuickMinScore. Unknown startId -> empty list.
    model::TrackList quickPlaylist(const model::TrackList& tracks,
                                   const QString& startId = QString(),
                                   int targetLength = 10,
                                   ProgressionCurve curve = ProgressionCurve::Neutral) const;

    static constexpr double kQuickMinScore = 0.3;

private:
    harmonic::HarmonicScorer m_scorer;
    const CompatibilityOrchestrator* m_enhanced = nullptr;
};

} // namespace segue::engine
