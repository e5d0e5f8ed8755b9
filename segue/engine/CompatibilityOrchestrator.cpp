#include "segue/engine/CompatibilityOrchestrator.h"

#include "segue/policy/PolicyManager.h"

#include <QJsonArray>
#include <QtGlobal>

#include <utility>

namespace segue::engine {
namespace {

static bool hasMetadata(const model::TrackMetadata* md) {
    return md && !md->isEmpty();
}

static QString labelOrUnknown(const QString& s) {
    return s.isEmpty() ? QString("unknown") : s;
}

static QString arrow(const QString& from, const QString& to) {
    return QString("%1 → %2").arg(from, to);
}

static QJsonObject breakdownToJson(const QMap<style::StyleDimension, double>& m) {
    QJsonObject o;
    for (auto it = m.constBegin(); it != m.constEnd(); ++it) o.insert(style::dimensionName(it.key()), it.value());
    return o;
}

} // namespace

QJsonObject OrchestratorWeights::toJson() const {
    QJsonObject o;
    o.insert("harmonic", harmonic);
    o.insert("stylistic", stylistic);
    o.insert("structural", structural);
    o.insert("transition", transition);
    o.insert("temporal", temporal);
    return o;
}

OrchestratorWeights OrchestratorWeights::fromJson(const QJsonObject& o) {
    OrchestratorWeights w;
    w.harmonic = o.value("harmonic").toDouble(w.harmonic);
    w.stylistic = o.value("stylistic").toDouble(w.stylistic);
    w.structural = o.value("structural").toDouble(w.structural);
    w.transition = o.value("transition").toDouble(w.transition);
    w.temporal = o.value("temporal").toDouble(w.temporal);
    return w;
}

QJsonObject CompatibilityBreakdown::toJson() const {
    QJsonObject o;
    o.insert("harmonic", harmonic);
    o.insert("stylistic", stylistic);
    o.insert("structural", structural);
    o.insert("transition", transition);
    o.insert("temporal", temporal);
    if (policy >= 0.0) o.insert("policy", policy);
    o.insert("total", total);
    return o;
}

QJsonObject CompatibilityExplanation::toJson() const {
    QJsonObject o;
    o.insert("overall_score", overallScore);

    QJsonObject h;
    h.insert("score", harmonicScore);
    h.insert("key_match", keyMatch);
    h.insert("bpm_match", bpmMatch);
    h.insert("energy_match", energyMatch);
    o.insert("harmonic", h);

    QJsonObject s;
    if (hasStylistic) {
        s.insert("score", stylisticScore);
        s.insert("subgenre_match", subgenreMatch);
        s.insert("mood_match", moodMatch);
        s.insert("era_match", eraMatch);
        s.insert("language_match", languageMatch);
        s.insert("breakdown", breakdownToJson(stylisticBreakdown));
    }
    o.insert("stylistic", s);
    o.insert("recommendations", QJsonArray::fromStringList(recommendations));
    return o;
}

CompatibilityOrchestrator::CompatibilityOrchestrator(harmonic::HarmonicScorer harmonic, style::StylisticMatrix matrix)
    : m_harmonic(std::move(harmonic)),
      m_matrix(std::move(matrix)),
      m_structural(m_harmonic.tolerances()) {}

void CompatibilityOrchestrator::setPolicy(const policy::PolicyManager* manager, const QString& policyId, double blend) {
    m_policyManager = manager;
    m_policyId = policyId;
    m_policyBlend = qBound(0.0, blend, 1.0);
}

void CompatibilityOrchestrator::clearPolicy() {
    m_policyManager = nullptr;
    m_policyId.clear();
}

double CompatibilityOrchestrator::policyScore(const model::Track& b, const model::TrackMetadata* metadataB) const {
    policy::PolicyApplicationResult r;
    QString err;
    if (!m_policyManager->evaluateTrack(m_policyId, b, metadataB, nullptr, r, &err)) return -1.0;
    return r.totalScore;
}

double CompatibilityOrchestrator::scoreEnhanced(const model::Track& a,
                                                const model::Track& b,
                                                const structure::StructuralAnalysis* structuralA,
                                                const structure::StructuralAnalysis* structuralB,
                                                const model::TrackMetadata* metadataA,
                                                const model::TrackMetadata* metadataB,
                                                CompatibilityBreakdown* outBreakdown) const {
    CompatibilityBreakdown c;
    c.harmonic = m_harmonic.compatibility(a, b);

    if (hasMetadata(metadataA) && hasMetadata(metadataB)) {
        c.stylistic = m_matrix.compatibility(style::StyleProfile::fromMetadata(*metadataA),
                                             style::StyleProfile::fromMetadata(*metadataB));
    }

    if (structuralA && structuralB) {
        c.structural = m_structural.structuralScore(structuralA, structuralB);
        c.transition = m_structural.transitionQualityScore(structuralA, structuralB);
        c.temporal = m_structural.temporalScore(structuralA, structuralB);
    }

    double total = m_weights.harmonic * c.harmonic + m_weights.stylistic * c.stylistic
                 + m_weights.structural * c.structural + m_weights.transition * c.transition
                 + m_weights.temporal * c.temporal;
    total = qMin(total, 1.0);

    if (hasPolicy()) {
        c.policy = policyScore(b, metadataB);
        if (c.policy >= 0.0) {
            total = (1.0 - m_policyBlend) * total + m_policyBlend * c.policy;
        }
    }

    c.total = qBound(0.0, total, 1.0);
    if (outBreakdown) *outBreakdown = c;
    return c.total;
}

CompatibilityExplanation CompatibilityOrchestrator::explain(const model::Track& a,
                                                            const model::Track& b,
                                                            const model::TrackMetadata* metadataA,
                                                            const model::TrackMetadata* metadataB) const {
    CompatibilityExplanation e;
    e.harmonicScore = m_harmonic.compatibility(a, b);
    e.keyMatch = (a.hasKey() && b.hasKey()) ? arrow(a.key, b.key) : QString("No key data");
    e.bpmMatch = (a.hasBpm() && b.hasBpm())
        ? arrow(QString::number(a.bpm), QString::number(b.bpm)) + " BPM"
        : QString("No BPM data");
    e.energyMatch = (a.hasEnergy() && b.hasEnergy())
        ? arrow(QString::number(a.energy), QString::number(b.energy))
        : QString("No energy data");

    if (hasMetadata(metadataA) && hasMetadata(metadataB)) {
        const auto p1 = style::StyleProfile::fromMetadata(*metadataA);
        const auto p2 = style::StyleProfile::fromMetadata(*metadataB);

        e.hasStylistic = true;
        e.stylisticScore = m_matrix.compatibility(p1, p2);
        e.stylisticBreakdown = stylisticBreakdown(*metadataA, *metadataB);
        e.subgenreMatch = arrow(labelOrUnknown(p1.subgenre), labelOrUnknown(p2.subgenre));
        e.moodMatch = arrow(labelOrUnknown(p1.mood), labelOrUnknown(p2.mood));
        e.eraMatch = arrow(labelOrUnknown(p1.era), labelOrUnknown(p2.era));
        e.languageMatch = arrow(labelOrUnknown(p1.language), labelOrUnknown(p2.language));

        if (e.stylisticScore < 0.5) {
            e.recommendations << "Consider using a bridge track for smoother transition";
        }
        if (e.stylisticBreakdown.value(style::StyleDimension::Mood, 1.0) < 0.5) {
            e.recommendations << "Mood mismatch - consider gradual energy transition";
        }
        if (e.stylisticBreakdown.value(style::StyleDimension::Era, 1.0) < 0.5) {
            e.recommendations << "Era mismatch - may create temporal disconnect";
        }
    }

    e.overallScore = scoreEnhanced(a, b, nullptr, nullptr, metadataA, metadataB);
    return e;
}

bool CompatibilityOrchestrator::findOptimalTransition(const model::Track& a,
                                                      const model::Track& b,
                                                      const structure::StructuralAnalysis& structuralA,
                                                      const structure::StructuralAnalysis& structuralB,
                                                      structure::MixTransition& out,
                                                      const model::TrackMetadata* metadataA,
                                                      const model::TrackMetadata* metadataB) const {
    if (!m_structural.findOptimalTransition(structuralA, structuralB, out)) return false;
    out.fromTrackId = a.id;
    out.toTrackId = b.id;
    out.compatibility = scoreEnhanced(a, b, &structuralA, &structuralB, metadataA, metadataB);
    return true;
}

QVector<style::BridgeCandidate> CompatibilityOrchestrator::findBridgeTracks(
    const model::TrackMetadata& metadataA,
    const model::TrackMetadata& metadataB,
    const QVector<QPair<model::Track, model::TrackMetadata>>& pool) const {
    return m_matrix.suggestBridgeTracks(style::StyleProfile::fromMetadata(metadataA),
                                        style::StyleProfile::fromMetadata(metadataB), pool);
}

QMap<style::StyleDimension, double> CompatibilityOrchestrator::stylisticBreakdown(
    const model::TrackMetadata& metadataA,
    const model::TrackMetadata& metadataB) const {
    return m_matrix.breakdown(style::StyleProfile::fromMetadata(metadataA),
                              style::StyleProfile::fromMetadata(metadataB));
}

} // namespace segue::engine
