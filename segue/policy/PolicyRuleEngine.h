#pragma once

#include <QString>
#include <QVariant>

#include "segue/model/Track.h"
#include "segue/model/TrackMetadata.h"
#include "segue/policy/FieldAccessors.h"
#include "segue/policy/PolicyTypes.h"

namespace segue::policy {

// Evaluates single rules and rule sets against one track.
// Stateless apart from the field table; safe to share between callers.
class PolicyRuleEngine {
public:
    PolicyRuleEngine();

    // Missing field -> satisfied=false, score=0. A rule that cannot be evaluated as
    // written (e.g. a regex that does not compile) sets configError and fills outError.
    PolicyEvaluationResult evaluateRule(const PolicyRule& rule,
                                        const model::Track& track,
                                        const model::TrackMetadata* metadata = nullptr,
                                        const model::ContextData* context = nullptr,
                                        QString* outError = nullptr) const;

    // Operator predicate. ok=false when the operands do not fit the operator.
    bool applyOperator(RuleOperator op,
                       const QVariant& actual,
                       const QVariant& expected,
                       double tolerance,
                       bool* ok = nullptr) const;

    // Partial credit for an unsatisfied rule (numeric operands only).
    static double partialScore(const PolicyRule& rule, const QVariant& actual);

    // Context multiplier in [0.1, 2.0].
    static double adaptiveMultiplier(const PolicyRule& rule, const model::ContextData& context);

    // Token Jaccard similarity on lower-cased, whitespace-split strings.
    static double similarity(const QVariant& a, const QVariant& b);

    // Weighted by rule weight * priority multiplier. Appends per-rule results to outResults.
    double evaluateRuleSet(const PolicyRuleSet& ruleSet,
                           const model::Track& track,
                           const model::TrackMetadata* metadata,
                           const model::ContextData* context,
                           QVector<PolicyEvaluationResult>* outResults = nullptr,
                           double* outWeight = nullptr) const;

    const FieldAccessorTable& fields() const { return m_fields; }

    static constexpr double kDefaultSimilarThreshold = 0.8;
    static constexpr double kDefaultCompatibleThreshold = 0.7;

private:
    FieldAccessorTable m_fields;
};

} // namespace segue::policy
