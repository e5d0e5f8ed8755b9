#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>

namespace segue::policy {

enum class PolicyType {
    Harmonic = 0,
    Energy,
    Stylistic,
    Temporal,
    Linguistic,
    Contextual,
    Quality,
    Diversity,
    Narrative,
    Custom,
};

enum class RuleOperator {
    Equals = 0,
    NotEquals,
    GreaterThan,
    LessThan,
    GreaterEqual,
    LessEqual,
    Contains,
    NotContains,
    InList,
    NotInList,
    SimilarTo,
    CompatibleWith,
    WithinRange,
    MatchesPattern,
};

enum class RulePriority {
    Critical = 0,
    High,
    Medium,
    Low,
    Suggestion,
};

QString policyTypeToString(PolicyType t);
bool policyTypeFromString(const QString& s, PolicyType& out);

QString operatorToString(RuleOperator op);
bool operatorFromString(const QString& s, RuleOperator& out);

QString priorityToString(RulePriority p);
bool priorityFromString(const QString& s, RulePriority& out);

// critical 3.0, high 2.0, medium 1.0, low 0.5, suggestion 0.2
double priorityMultiplier(RulePriority p);

struct PolicyRule {
    QString id;
    QString name;
    QString description;
    PolicyType type = PolicyType::Custom;

    QString field;
    RuleOperator op = RuleOperator::Equals;
    QVariant value;             // string, number or list
    QString context = "track";  // track | transition | sequence | global

    RulePriority priority = RulePriority::Medium;
    double weight = 1.0;
    bool enabled = true;

    double tolerance = 0.0;
    bool adaptive = false;
    bool timeSensitive = false;

    QString createdBy = "system";
    QStringList tags;
    QString notes;

    QJsonObject toJson() const;
    // Fails on unknown operator / type / priority strings.
    static bool fromJson(const QJsonObject& o, PolicyRule& out, QString* outError = nullptr);
};

struct PolicyRuleSet {
    QString id;
    QString name;
    QString description;
    QVector<PolicyRule> rules;

    QString combinationMode = "weighted_sum";
    double minimumScore = 0.6;

    QString version = "1.0";
    QString createdBy = "system";
    QStringList tags;
    bool enabled = true;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& o, PolicyRuleSet& out, QString* outError = nullptr);
};

struct MixingPolicy {
    QString id;
    QString name;
    QString description;
    QString version = "1.0";

    QVector<PolicyRuleSet> ruleSets;

    QMap<PolicyType, double> globalWeights;
    QString optimizationObjective = "balanced";
    QString fallbackStrategy = "greedy";

    bool strictMode = false;
    bool adaptiveWeights = true;

    QString createdBy = "user";
    QString createdAt;
    QString lastModified;
    int usageCount = 0;
    QStringList tags;

    double globalWeight(PolicyType t) const { return globalWeights.value(t, 1.0); }

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& o, MixingPolicy& out, QString* outError = nullptr);
};

struct PolicyEvaluationResult {
    QString ruleId;
    QString ruleName;
    bool satisfied = false;
    double score = 0.0;
    QVariant expected;
    QVariant actual; // invalid when the field was not available
    QString message;
    double weight = 1.0;
    RulePriority priority = RulePriority::Medium;
    bool configError = false; // rule could not be evaluated as written

    QJsonObject toJson() const;
};

struct PolicyApplicationResult {
    QString policyId;
    double totalScore = 0.0;
    QVector<PolicyEvaluationResult> ruleResults;
    QMap<QString, double> ruleSetScores;
    bool satisfiedCriticalRules = true;
    QStringList recommendations;
    QStringList warnings;

    QJsonObject toJson() const;
};

} // namespace segue::policy
