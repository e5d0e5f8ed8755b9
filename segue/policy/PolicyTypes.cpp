#include "segue/policy/PolicyTypes.h"

#include <QJsonArray>

namespace segue::policy {
namespace {

static bool jsonGetBool(const QJsonObject& o, const char* k, bool def) {
    const auto v = o.value(QString::fromUtf8(k));
    if (v.isBool()) return v.toBool();
    return def;
}

static double jsonGetDouble(const QJsonObject& o, const char* k, double def) {
    const auto v = o.value(QString::fromUtf8(k));
    if (v.isDouble()) return v.toDouble();
    return def;
}

static QString jsonGetString(const QJsonObject& o, const char* k, const QString& def = QString()) {
    const auto v = o.value(QString::fromUtf8(k));
    if (v.isString()) return v.toString();
    return def;
}

static QStringList jsonGetStringList(const QJsonObject& o, const char* k) {
    QStringList out;
    for (const auto& e : o.value(QString::fromUtf8(k)).toArray()) {
        if (e.isString()) out.push_back(e.toString());
    }
    return out;
}

static void setError(QString* outError, const QString& msg) {
    if (outError) *outError = msg;
}

} // namespace

QString policyTypeToString(PolicyType t) {
    switch (t) {
        case PolicyType::Harmonic: return "harmonic";
        case PolicyType::Energy: return "energy";
        case PolicyType::Stylistic: return "stylistic";
        case PolicyType::Temporal: return "temporal";
        case PolicyType::Linguistic: return "linguistic";
        case PolicyType::Contextual: return "contextual";
        case PolicyType::Quality: return "quality";
        case PolicyType::Diversity: return "diversity";
        case PolicyType::Narrative: return "narrative";
        case PolicyType::Custom: return "custom";
    }
    return "custom";
}

bool policyTypeFromString(const QString& s, PolicyType& out) {
    const QString k = s.trimmed().toLower();
    if (k == "harmonic") { out = PolicyType::Harmonic; return true; }
    if (k == "energy") { out = PolicyType::Energy; return true; }
    if (k == "stylistic") { out = PolicyType::Stylistic; return true; }
    if (k == "temporal") { out = PolicyType::Temporal; return true; }
    if (k == "linguistic") { out = PolicyType::Linguistic; return true; }
    if (k == "contextual") { out = PolicyType::Contextual; return true; }
    if (k == "quality") { out = PolicyType::Quality; return true; }
    if (k == "diversity") { out = PolicyType::Diversity; return true; }
    if (k == "narrative") { out = PolicyType::Narrative; return true; }
    if (k == "custom") { out = PolicyType::Custom; return true; }
    return false;
}

QString operatorToString(RuleOperator op) {
    switch (op) {
        case RuleOperator::Equals: return "equals";
        case RuleOperator::NotEquals: return "not_equals";
        case RuleOperator::GreaterThan: return "greater_than";
        case RuleOperator::LessThan: return "less_than";
        case RuleOperator::GreaterEqual: return "greater_equal";
        case RuleOperator::LessEqual: return "less_equal";
        case RuleOperator::Contains: return "contains";
        case RuleOperator::NotContains: return "not_contains";
        case RuleOperator::InList: return "in_list";
        case RuleOperator::NotInList: return "not_in_list";
        case RuleOperator::SimilarTo: return "similar_to";
        case RuleOperator::CompatibleWith: return "compatible_with";
        case RuleOperator::WithinRange: return "within_range";
        case RuleOperator::MatchesPattern: return "matches_pattern";
    }
    return QString();
}

bool operatorFromString(const QString& s, RuleOperator& out) {
    static const QVector<RuleOperator> kAll = {
        RuleOperator::Equals,       RuleOperator::NotEquals,   RuleOperator::GreaterThan,
        RuleOperator::LessThan,     RuleOperator::GreaterEqual, RuleOperator::LessEqual,
        RuleOperator::Contains,     RuleOperator::NotContains, RuleOperator::InList,
        RuleOperator::NotInList,    RuleOperator::SimilarTo,   RuleOperator::CompatibleWith,
        RuleOperator::WithinRange,  RuleOperator::MatchesPattern,
    };
    const QString k = s.trimmed().toLower();
    for (RuleOperator op : kAll) {
        if (operatorToString(op) == k) {
            out = op;
            return true;
        }
    }
    return false;
}

QString priorityToString(RulePriority p) {
    switch (p) {
        case RulePriority::Critical: return "critical";
        case RulePriority::High: return "high";
        case RulePriority::Medium: return "medium";
        case RulePriority::Low: return "low";
        case RulePriority::Suggestion: return "suggestion";
    }
    return "medium";
}

bool priorityFromString(const QString& s, RulePriority& out) {
    const QString k = s.trimmed().toLower();
    if (k == "critical") { out = RulePriority::Critical; return true; }
    if (k == "high") { out = RulePriority::High; return true; }
    if (k == "medium") { out = RulePriority::Medium; return true; }
    if (k == "low") { out = RulePriority::Low; return true; }
    if (k == "suggestion") { out = RulePriority::Suggestion; return true; }
    return false;
}

double priorityMultiplier(RulePriority p) {
    switch (p) {
        case RulePriority::Critical: return 3.0;
        case RulePriority::High: return 2.0;
        case RulePriority::Medium: return 1.0;
        case RulePriority::Low: return 0.5;
        case RulePriority::Suggestion: return 0.2;
    }
    return 1.0;
}

// --- PolicyRule ---

QJsonObject PolicyRule::toJson() const {
    QJsonObject o;
    o.insert("id", id);
    o.insert("name", name);
    o.insert("description", description);
    o.insert("policy_type", policyTypeToString(type));
    o.insert("field", field);
    o.insert("operator", operatorToString(op));
    o.insert("value", QJsonValue::fromVariant(value));
    o.insert("context", context);
    o.insert("priority", priorityToString(priority));
    o.insert("weight", weight);
    o.insert("enabled", enabled);
    o.insert("tolerance", tolerance);
    o.insert("adaptive", adaptive);
    o.insert("time_sensitive", timeSensitive);
    o.insert("created_by", createdBy);
    o.insert("tags", QJsonArray::fromStringList(tags));
    o.insert("notes", notes);
    return o;
}

bool PolicyRule::fromJson(const QJsonObject& o, PolicyRule& out, QString* outError) {
    PolicyRule r;
    r.id = jsonGetString(o, "id");
    if (r.id.isEmpty()) {
        setError(outError, "Rule without id");
        return false;
    }
    r.name = jsonGetString(o, "name", r.id);
    r.description = jsonGetString(o, "description");

    const QString typeStr = jsonGetString(o, "policy_type", "custom");
    if (!policyTypeFromString(typeStr, r.type)) {
        setError(outError, QString("Rule '%1': unknown policy type '%2'").arg(r.id, typeStr));
        return false;
    }

    r.field = jsonGetString(o, "field");
    const QString opStr = jsonGetString(o, "operator");
    if (!operatorFromString(opStr, r.op)) {
        setError(outError, QString("Rule '%1': unknown operator '%2'").arg(r.id, opStr));
        return false;
    }
    r.value = o.value("value").toVariant();
    r.context = jsonGetString(o, "context", r.context);

    const QString prioStr = jsonGetString(o, "priority", "medium");
    if (!priorityFromString(prioStr, r.priority)) {
        setError(outError, QString("Rule '%1': unknown priority '%2'").arg(r.id, prioStr));
        return false;
    }
    r.weight = jsonGetDouble(o, "weight", r.weight);
    r.enabled = jsonGetBool(o, "enabled", r.enabled);
    r.tolerance = jsonGetDouble(o, "tolerance", r.tolerance);
    r.adaptive = jsonGetBool(o, "adaptive", r.adaptive);
    r.timeSensitive = jsonGetBool(o, "time_sensitive", r.timeSensitive);
    r.createdBy = jsonGetString(o, "created_by", r.createdBy);
    r.tags = jsonGetStringList(o, "tags");
    r.notes = jsonGetString(o, "notes");

    out = r;
    return true;
}

// --- PolicyRuleSet ---

QJsonObject PolicyRuleSet::toJson() const {
    QJsonObject o;
    o.insert("id", id);
    o.insert("name", name);
    o.insert("description", description);
    QJsonArray arr;
    for (const auto& r : rules) arr.push_back(r.toJson());
    o.insert("rules", arr);
    o.insert("combination_mode", combinationMode);
    o.insert("minimum_score", minimumScore);
    o.insert("version", version);
    o.insert("created_by", createdBy);
    o.insert("tags", QJsonArray::fromStringList(tags));
    o.insert("enabled", enabled);
    return o;
}

bool PolicyRuleSet::fromJson(const QJsonObject& o, PolicyRuleSet& out, QString* outError) {
    PolicyRuleSet rs;
    rs.id = jsonGetString(o, "id");
    if (rs.id.isEmpty()) {
        setError(outError, "Rule set without id");
        return false;
    }
    rs.name = jsonGetString(o, "name", rs.id);
    rs.description = jsonGetString(o, "description");
    for (const auto& v : o.value("rules").toArray()) {
        PolicyRule r;
        if (!PolicyRule::fromJson(v.toObject(), r, outError)) return false;
        rs.rules.push_back(r);
    }
    rs.combinationMode = jsonGetString(o, "combination_mode", rs.combinationMode);
    rs.minimumScore = jsonGetDouble(o, "minimum_score", rs.minimumScore);
    rs.version = jsonGetString(o, "version", rs.version);
    rs.createdBy = jsonGetString(o, "created_by", rs.createdBy);
    rs.tags = jsonGetStringList(o, "tags");
    rs.enabled = jsonGetBool(o, "enabled", rs.enabled);

    out = rs;
    return true;
}

// --- MixingPolicy ---

QJsonObject MixingPolicy::toJson() const {
    QJsonObject o;
    o.insert("id", id);
    o.insert("name", name);
    o.insert("description", description);
    o.insert("version", version);

    QJsonArray sets;
    for (const auto& rs : ruleSets) sets.push_back(rs.toJson());
    o.insert("rule_sets", sets);

    QJsonObject gw;
    for (auto it = globalWeights.constBegin(); it != globalWeights.constEnd(); ++it) {
        gw.insert(policyTypeToString(it.key()), it.value());
    }
    o.insert("global_weights", gw);
    o.insert("optimization_objective", optimizationObjective);
    o.insert("fallback_strategy", fallbackStrategy);
    o.insert("strict_mode", strictMode);
    o.insert("adaptive_weights", adaptiveWeights);
    o.insert("created_by", createdBy);
    o.insert("created_at", createdAt);
    o.insert("last_modified", lastModified);
    o.insert("usage_count", usageCount);
    o.insert("tags", QJsonArray::fromStringList(tags));
    return o;
}

bool MixingPolicy::fromJson(const QJsonObject& o, MixingPolicy& out, QString* outError) {
    MixingPolicy p;
    p.id = jsonGetString(o, "id");
    if (p.id.isEmpty()) {
        setError(outError, "Policy without id");
        return false;
    }
    p.name = jsonGetString(o, "name", p.id);
    p.description = jsonGetString(o, "description");
    p.version = jsonGetString(o, "version", p.version);

    for (const auto& v : o.value("rule_sets").toArray()) {
        PolicyRuleSet rs;
        if (!PolicyRuleSet::fromJson(v.toObject(), rs, outError)) return false;
        p.ruleSets.push_back(rs);
    }

    const QJsonObject gw = o.value("global_weights").toObject();
    for (auto it = gw.constBegin(); it != gw.constEnd(); ++it) {
        PolicyType t;
        if (!policyTypeFromString(it.key(), t)) {
            setError(outError, QString("Policy '%1': unknown policy type '%2' in global_weights").arg(p.id, it.key()));
            return false;
        }
        p.globalWeights.insert(t, it.value().toDouble(1.0));
    }

    p.optimizationObjective = jsonGetString(o, "optimization_objective", p.optimizationObjective);
    p.fallbackStrategy = jsonGetString(o, "fallback_strategy", p.fallbackStrategy);
    p.strictMode = jsonGetBool(o, "strict_mode", p.strictMode);
    p.adaptiveWeights = jsonGetBool(o, "adaptive_weights", p.adaptiveWeights);
    p.createdBy = jsonGetString(o, "created_by", p.createdBy);
    p.createdAt = jsonGetString(o, "created_at");
    p.lastModified = jsonGetString(o, "last_modified");
    p.usageCount = int(jsonGetDouble(o, "usage_count", 0.0));
    p.tags = jsonGetStringList(o, "tags");

    out = p;
    return true;
}

// --- results ---

QJsonObject PolicyEvaluationResult::toJson() const {
    QJsonObject o;
    o.insert("rule_id", ruleId);
    o.insert("rule_name", ruleName);
    o.insert("satisfied", satisfied);
    o.insert("score", score);
    o.insert("expected_value", QJsonValue::fromVariant(expected));
    o.insert("actual_value", actual.isValid() ? QJsonValue::fromVariant(actual) : QJsonValue());
    o.insert("message", message);
    o.insert("weight", weight);
    o.insert("priority", priorityToString(priority));
    return o;
}

QJsonObject PolicyApplicationResult::toJson() const {
    QJsonObject o;
    o.insert("policy_id", policyId);
    o.insert("total_score", totalScore);
    QJsonArray rules;
    for (const auto& r : ruleResults) rules.push_back(r.toJson());
    o.insert("rule_results", rules);
    QJsonObject sets;
    for (auto it = ruleSetScores.constBegin(); it != ruleSetScores.constEnd(); ++it) {
        sets.insert(it.key(), it.value());
    }
    o.insert("rule_set_scores", sets);
    o.insert("satisfied_critical_rules", satisfiedCriticalRules);
    o.insert("recommendations", QJsonArray::fromStringList(recommendations));
    o.insert("warnings", QJsonArray::fromStringList(warnings));
    return o;
}

} // namespace segue::policy
