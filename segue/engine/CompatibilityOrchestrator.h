#pragma once

#include <QJsonObject>
#include <QMap>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

#include "segue/harmonic/HarmonicScorer.h"
#include "segue/model/Track.h"
#include "segue/model/TrackMetadata.h"
#include "segue/structure/StructuralScorer.h"
#include "segue/style/StylisticMatrix.h"

namespace segue::policy {
class PolicyManager;
}

namespace segue::engine {

struct OrchestratorWeights {
    double harmonic = 0.25;
    double stylistic = 0.25;
    double structural = 0.20;
    double transition = 0.20;
    double temporal = 0.10;

    QJsonObject toJson() const;
    static OrchestratorWeights fromJson(const QJsonObject& o);
};

// Per-component scores of one scoreEnhanced() call. policy < 0 when no policy was folded in.
struct CompatibilityBreakdown {
    double harmonic = 0.0;
    double stylistic = 0.5;
    double structural = 0.5;
    double transition = 0.5;
    double temporal = 0.5;
    double policy = -1.0;
    double total = 0.0;

    QJsonObject toJson() const;
};

struct CompatibilityExplanation {
    double overallScore = 0.0;

    double harmonicScore = 0.0;
    QString keyMatch;
    QString bpmMatch;
    QString energyMatch;

    bool hasStylistic = false;
    double stylisticScore = 0.5;
    QString subgenreMatch;
    QString moodMatch;
    QString eraMatch;
    QString languageMatch;
    QMap<style::StyleDimension, double> stylisticBreakdown;

    QStringList recommendations;

    QJsonObject toJson() const;
};

// Blends harmonic, stylistic and structural scoring into one explainable value.
// Optional inputs are passed as nullptr; each missing input yields that component's neutral 0.5.
class CompatibilityOrchestrator {
public:
    explicit CompatibilityOrchestrator(harmonic::HarmonicScorer harmonic = harmonic::HarmonicScorer(),
                                       style::StylisticMatrix matrix = style::StylisticMatrix::builtins());

    void setWeights(const OrchestratorWeights& w) { m_weights = w; }
    const OrchestratorWeights& weights() const { return m_weights; }

    // Folds policyScore(b) into scoreEnhanced(): (1-blend)*score + blend*policy.
    // The manager must outlive this orchestrator.
    void setPolicy(const policy::PolicyManager* manager, const QString& policyId, double blend = 0.2);
    void clearPolicy();
    bool hasPolicy() const { return m_policyManager && !m_policyId.isEmpty(); }
    const QString& policyId() const { return m_policyId; }

    double scoreEnhanced(const model::Track& a,
                         const model::Track& b,
                         const structure::StructuralAnalysis* structuralA = nullptr,
                         const structure::StructuralAnalysis* structuralB = nullptr,
                         const model::TrackMetadata* metadataA = nullptr,
                         const model::TrackMetadata* metadataB = nullptr,
                         CompatibilityBreakdown* outBreakdown = nullptr) const;

    CompatibilityExplanation explain(const model::Track& a,
                                     const model::Track& b,
                                     const model::TrackMetadata* metadataA = nullptr,
                                     const model::TrackMetadata* metadataB = nullptr) const;

    // False when either analysis lacks transition points.
    bool findOptimalTransition(const model::Track& a,
                               const model::Track& b,
                               const structure::StructuralAnalysis& structuralA,
                               const structure::StructuralAnalysis& structuralB,
                               structure::MixTransition& out,
                               const model::TrackMetadata* metadataA = nullptr,
                               const model::TrackMetadata* metadataB = nullptr) const;

    QVector<style::BridgeCandidate> findBridgeTracks(
        const model::TrackMetadata& metadataA,
        const model::TrackMetadata& metadataB,
        const QVector<QPair<model::Track, model::TrackMetadata>>& pool) const;

    QMap<style::StyleDimension, double> stylisticBreakdown(const model::TrackMetadata& metadataA,
                                                           const model::TrackMetadata& metadataB) const;

    const harmonic::HarmonicScorer& harmonic() const { return m_harmonic; }
    const style::StylisticMatrix& stylistic() const { return m_matrix; }
    const structure::StructuralScorer& structural() const { return m_structural; }

private:
    double policyScore(const model::Track& b, const model::TrackMetadata* metadataB) const;

    harmonic::HarmonicScorer m_harmonic;
    style::StylisticMatrix m_matrix;
    structure::StructuralScorer m_structural;
    OrchestratorWeights m_weights;

    const policy::PolicyManager* m_policyManager = nullptr;
    QString m_policyId;
    double m_policyBlend = 0.2;
};

} // namespace segue::engine
