#include "segue/policy/PolicyRuleEngine.h"

#include "segue/util/ValueNormalize.h"

#include <QDebug>
#include <QRegularExpression>
#include <QSet>
#include <QtGlobal>

namespace segue::policy {
namespace {

static QString lowered(const QVariant& v) {
    return v.toString().trimmed().toLower();
}

static QStringList loweredList(const QVariant& v) {
    QStringList out;
    if (v.typeId() == QMetaType::QVariantList || v.typeId() == QMetaType::QStringList) {
        for (const auto& e : v.toList()) out << lowered(e);
    } else {
        out << lowered(v);
    }
    return out;
}

static bool numericPair(const QVariant& a, const QVariant& b, double& x, double& y) {
    return util::toNumber(a, x) && util::toNumber(b, y);
}

} // namespace

PolicyRuleEngine::PolicyRuleEngine() : m_fields(FieldAccessorTable::builtins()) {}

double PolicyRuleEngine::similarity(const QVariant& a, const QVariant& b) {
    const QString sa = lowered(a);
    const QString sb = lowered(b);
    if (sa == sb) return 1.0;

    const QStringList ta = sa.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    const QStringList tb = sb.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    const QSet<QString> setA(ta.begin(), ta.end());
    const QSet<QString> setB(tb.begin(), tb.end());
    if (setA.isEmpty() && setB.isEmpty()) return 1.0;
    if (setA.isEmpty() || setB.isEmpty()) return 0.0;

    const int inter = QSet<QString>(setA).intersect(setB).size();
    const int uni = QSet<QString>(setA).unite(setB).size();
    return uni > 0 ? double(inter) / double(uni) : 0.0;
}

bool PolicyRuleEngine::applyOperator(RuleOperator op,
                                     const QVariant& actual,
                                     const QVariant& expected,
                                     double tolerance,
                                     bool* ok) const {
    if (ok) *ok = true;
    double a = 0.0;
    double b = 0.0;

    auto numeric = [&]() -> bool {
        if (numericPair(actual, expected, a, b)) return true;
        if (ok) *ok = false;
        return false;
    };

    switch (op) {
        case RuleOperator::Equals:
            if (numericPair(actual, expected, a, b)) return qAbs(a - b) <= tolerance;
            return lowered(actual) == lowered(expected);
        case RuleOperator::NotEquals:
            return !applyOperator(RuleOperator::Equals, actual, expected, tolerance, ok);
        case RuleOperator::GreaterThan:
            return numeric() && a > b - tolerance;
        case RuleOperator::LessThan:
            return numeric() && a < b + tolerance;
        case RuleOperator::GreaterEqual:
            return numeric() && a >= b - tolerance;
        case RuleOperator::LessEqual:
            return numeric() && a <= b + tolerance;
        case RuleOperator::Contains:
            return lowered(actual).contains(lowered(expected));
        case RuleOperator::NotContains:
            return !lowered(actual).contains(lowered(expected));
        case RuleOperator::InList:
            return loweredList(expected).contains(lowered(actual));
        case RuleOperator::NotInList:
            return !loweredList(expected).contains(lowered(actual));
        case RuleOperator::SimilarTo:
            return similarity(actual, expected) >= (tolerance > 0.0 ? tolerance : kDefaultSimilarThreshold);
        case RuleOperator::CompatibleWith:
            return similarity(actual, expected) >= (tolerance > 0.0 ? tolerance : kDefaultCompatibleThreshold);
        case RuleOperator::WithinRange: {
            if (!util::toNumber(actual, a)) return false;
            const QVariantList range = expected.toList();
            if (range.size() != 2) return false;
            double lo = 0.0;
            double hi = 0.0;
            if (!util::toNumber(range.at(0), lo) || !util::toNumber(range.at(1), hi)) return false;
            return a >= lo - tolerance && a <= hi + tolerance;
        }
        case RuleOperator::MatchesPattern: {
            const QRegularExpression re(expected.toString());
            if (!re.isValid()) {
                if (ok) *ok = false;
                return false;
            }
            return re.match(actual.toString(), 0, QRegularExpression::NormalMatch,
                            QRegularExpression::AnchorAtOffsetMatchOption)
                .hasMatch();
        }
    }
    if (ok) *ok = false;
    return false;
}

double PolicyRuleEngine::partialScore(const PolicyRule& rule, const QVariant& actual) {
    double a = 0.0;
    double e = 0.0;
    if (!numericPair(actual, rule.value, a, e)) return 0.0;

    switch (rule.op) {
        case RuleOperator::Equals:
            if (rule.tolerance > 0.0) return qMax(0.0, 1.0 - qAbs(a - e) / (rule.tolerance * 2.0));
            break;
        case RuleOperator::GreaterThan:
        case RuleOperator::GreaterEqual:
            if (a < e && e > 0.0) return qMax(0.0, 1.0 - (e - a) / (e * 0.2));
            break;
        case RuleOperator::LessThan:
        case RuleOperator::LessEqual:
            if (a > e && e > 0.0) return qMax(0.0, 1.0 - (a - e) / (e * 0.2));
            break;
        default:
            break;
    }
    return 0.0;
}

double PolicyRuleEngine::adaptiveMultiplier(const PolicyRule& rule, const model::ContextData& context) {
    double m = 1.0;
    const bool energyField = rule.field.toLower().contains("energy");

    if (rule.timeSensitive && context.contains("time_of_day") && rule.type == PolicyType::Energy && energyField) {
        const QString tod = lowered(context.value("time_of_day"));
        if (tod == "morning" || tod == "evening") {
            m *= 1.2;
        } else if (tod == "night") {
            m *= 0.8;
        }
    }

    if (context.contains("activity")) {
        const QString activity = lowered(context.value("activity"));
        if (activity == "workout" && rule.type == PolicyType::Energy) {
            m *= 1.3;
        } else if (activity == "chill" && rule.type == PolicyType::Harmonic) {
            m *= 1.1;
        }
    }
    return qBound(0.1, m, 2.0);
}

PolicyEvaluationResult PolicyRuleEngine::evaluateRule(const PolicyRule& rule,
                                                      const model::Track& track,
                                                      const model::TrackMetadata* metadata,
                                                      const model::ContextData* context,
                                                      QString* outError) const {
    PolicyEvaluationResult r;
    r.ruleId = rule.id;
    r.ruleName = rule.name;
    r.expected = rule.value;
    r.weight = rule.weight;
    r.priority = rule.priority;

    r.actual = m_fields.extract(rule.field, track, metadata);
    if (!r.actual.isValid()) {
        r.message = QString("Field '%1' not available").arg(rule.field);
        return r;
    }

    bool ok = true;
    r.satisfied = applyOperator(rule.op, r.actual, rule.value, rule.tolerance, &ok);
    if (!ok) {
        r.satisfied = false;
        r.score = 0.0;
        if (rule.op == RuleOperator::MatchesPattern) {
            r.configError = true;
            r.message = QString("Error evaluating rule: invalid pattern '%1'").arg(rule.value.toString());
            if (outError) *outError = QString("Rule '%1': %2").arg(rule.id, r.message);
            qWarning().noquote() << "PolicyRuleEngine:" << rule.id << r.message;
        } else {
            r.message = QString("Error evaluating rule: cannot compare %1 with %2 using %3")
                            .arg(util::displayValue(r.actual), util::displayValue(rule.value),
                                 operatorToString(rule.op));
        }
        return r;
    }

    r.score = r.satisfied ? 1.0 : partialScore(rule, r.actual);
    if (rule.adaptive && context && !context->isEmpty()) {
        r.score = qMin(1.0, r.score * adaptiveMultiplier(rule, *context));
    }
    r.message = r.satisfied ? "Satisfied" : "Not satisfied";
    return r;
}

double PolicyRuleEngine::evaluateRuleSet(const PolicyRuleSet& ruleSet,
                                         const model::Track& track,
                                         const model::TrackMetadata* metadata,
                                         const model::ContextData* context,
                                         QVector<PolicyEvaluationResult>* outResults,
                                         double* outWeight) const {
    double total = 0.0;
    double weightSum = 0.0;
    for (const auto& rule : ruleSet.rules) {
        if (!rule.enabled) continue;
        const PolicyEvaluationResult r = evaluateRule(rule, track, metadata, context);
        const double w = r.weight * priorityMultiplier(rule.priority);
        total += r.score * w;
        weightSum += w;
        if (outResults) outResults->push_back(r);
    }
    if (outWeight) *outWeight = weightSum;
    return weightSum > 0.0 ? total / weightSum : 0.0;
}

} // namespace segue::policy
