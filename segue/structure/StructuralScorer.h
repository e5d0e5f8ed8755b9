#pragma once

#include <QString>

#include "segue/harmonic/HarmonicScorer.h"
#include "segue/structure/StructuralAnalysis.h"

namespace segue::structure {

// A concrete mix-out / mix-in pairing between two analysed tracks.
struct MixTransition {
    QString fromTrackId;
    QString toTrackId;
    TransitionPoint mixOut;
    TransitionPoint mixIn;
    double compatibility = 0.0;     // filled by the orchestrator
    double transitionQuality = 0.0; // pair evaluation score
    double mixDurationSec = 16.0;
};

// Signal-derived compatibility between an outgoing track (a) and an incoming one (b).
// Every entry point accepts nullptr analyses and then reports the neutral 0.5.
class StructuralScorer {
public:
    StructuralScorer() = default;
    explicit StructuralScorer(const harmonic::HarmonicTolerances& tol) { m_tempo.setTolerances(tol); }

    void setTolerances(const harmonic::HarmonicTolerances& tol) { m_tempo.setTolerances(tol); }

    // 0.3 duration + 0.4 beat + 0.3 energy continuity.
    double structuralScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const;
    double durationScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const;
    double beatScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const;
    double energyContinuityScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const;

    // Mean of both tracks' best mix suitability.
    double transitionQualityScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const;

    // 0.4 tempo stability + 0.3 element matching + 0.3 timing feasibility.
    double temporalScore(const StructuralAnalysis* a, const StructuralAnalysis* b) const;
    double tempoStability(const StructuralAnalysis* a, const StructuralAnalysis* b) const;
    double elementMatching(const StructuralAnalysis* a, const StructuralAnalysis* b) const;
    double timingFeasibility(const StructuralAnalysis* a, const StructuralAnalysis* b) const;

    // Searches the first 5 points of each side. Returns false when either side has none.
    bool findOptimalTransition(const StructuralAnalysis& a,
                               const StructuralAnalysis& b,
                               MixTransition& out) const;

    double evaluatePair(const TransitionPoint& out,
                        const TransitionPoint& in,
                        const StructuralAnalysis& a) const;

    static double estimateMixDuration(const TransitionPoint& out, const TransitionPoint& in);
    static double elementPairScore(StructuralElement out, StructuralElement in);

    // nullptr when the analysis has no transition points.
    static const TransitionPoint* bestMixOutPoint(const StructuralAnalysis& a, double targetTimeSec = -1.0);
    static const TransitionPoint* bestMixInPoint(const StructuralAnalysis& a);

    static constexpr int kSearchDepth = 5;
    static constexpr double kEdgeWindowSec = 30.0;

private:
    harmonic::HarmonicScorer m_tempo;
};

} // namespace segue::structure
