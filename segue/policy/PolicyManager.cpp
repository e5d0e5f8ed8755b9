#include "segue/policy/PolicyManager.h"

#include "segue/util/ValueNormalize.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QVariantList>

namespace segue::policy {
namespace {

static void fail(QString* outError, const QString& msg) {
    qWarning().noquote() << "PolicyManager:" << msg;
    if (outError) *outError = msg;
}

static PolicyRule makeRule(const char* id,
                           const char* name,
                           const char* description,
                           PolicyType type,
                           const char* field,
                           RuleOperator op,
                           const QVariant& value,
                           RulePriority priority,
                           double weight) {
    PolicyRule r;
    r.id = QString::fromUtf8(id);
    r.name = QString::fromUtf8(name);
    r.description = QString::fromUtf8(description);
    r.type = type;
    r.field = QString::fromUtf8(field);
    r.op = op;
    r.value = value;
    r.priority = priority;
    r.weight = weight;
    return r;
}

static bool readJsonFile(const QString& path, QJsonDocument& doc, QString* outError) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        fail(outError, QString("Failed to open %1: %2").arg(path, f.errorString()));
        return false;
    }
    QJsonParseError err;
    doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        fail(outError, QString("Invalid JSON in %1: %2").arg(path, err.errorString()));
        return false;
    }
    return true;
}

static bool writeJsonFile(const QString& path, const QJsonObject& o, QString* outError) {
    const QFileInfo fi(path);
    if (!QDir().mkpath(fi.absolutePath())) {
        fail(outError, QString("Failed to create directory %1").arg(fi.absolutePath()));
        return false;
    }
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        fail(outError, QString("Failed to write %1: %2").arg(path, f.errorString()));
        return false;
    }
    const QByteArray bytes = QJsonDocument(o).toJson(QJsonDocument::Indented);
    if (f.write(bytes) != bytes.size()) {
        fail(outError, QString("Short write to %1").arg(path));
        return false;
    }
    return true;
}

} // namespace

PolicyManager::PolicyManager(const QString& configDir) : m_configDir(configDir) {
    loadBuiltins();
    if (!m_configDir.isEmpty()) {
        QString err;
        if (!loadUserPolicies(&err)) qWarning().noquote() << "PolicyManager: user policies not loaded:" << err;
    }
}

QString PolicyManager::policiesFilePath() const {
    if (m_configDir.isEmpty()) return QString();
    return QDir(m_configDir).filePath("policies.json");
}

void PolicyManager::loadBuiltins() {
    PolicyRuleSet classic;
    classic.id = "classic_harmonic";
    classic.name = "Classic Harmonic Mixing";
    classic.description = "Traditional Camelot wheel harmonic mixing rules";
    classic.rules.push_back(makeRule("key_compatibility", "Key Compatibility",
                                     "Tracks should be in compatible keys", PolicyType::Harmonic, "key",
                                     RuleOperator::CompatibleWith, QString("adjacent_camelot"),
                                     RulePriority::High, 2.0));
    {
        PolicyRule bpm = makeRule("bpm_proximity", "BPM Proximity", "BPM should be within 10% range",
                                  PolicyType::Energy, "bpm", RuleOperator::WithinRange,
                                  QVariantList{0.9, 1.1}, RulePriority::Medium, 1.5);
        bpm.tolerance = 5.0;
        classic.rules.push_back(bpm);
    }

    PolicyRuleSet stylistic;
    stylistic.id = "ai_stylistic";
    stylistic.name = "AI-Enhanced Stylistic Matching";
    stylistic.description = "LLM-powered stylistic compatibility rules";
    stylistic.rules.push_back(makeRule("subgenre_compatibility", "Subgenre Compatibility",
                                       "Subgenres should be compatible", PolicyType::Stylistic, "subgenre",
                                       RuleOperator::SimilarTo, QString("compatible_subgenres"),
                                       RulePriority::High, 1.8));
    stylistic.rules.push_back(makeRule("mood_progression", "Mood Progression",
                                       "Moods should create good progression", PolicyType::Stylistic, "mood",
                                       RuleOperator::CompatibleWith, QString("mood_transitions"),
                                       RulePriority::Medium, 1.3));
    {
        PolicyRule dance = makeRule("high_danceability", "High Danceability",
                                    "Maintain high danceability for parties", PolicyType::Quality,
                                    "danceability", RuleOperator::GreaterEqual, 0.7, RulePriority::Medium, 1.2);
        dance.adaptive = true;
        stylistic.rules.push_back(dance);
    }

    PolicyRuleSet cultural;
    cultural.id = "cultural_journey";
    cultural.name = "Cultural Journey Rules";
    cultural.description = "Rules for cross-cultural musical journeys";
    cultural.rules.push_back(makeRule("language_bridges", "Language Bridges",
                                      "Use instrumental tracks to bridge languages", PolicyType::Linguistic,
                                      "language", RuleOperator::InList,
                                      QVariantList{"instrumental", "spanish", "english"},
                                      RulePriority::Medium, 1.0));
    cultural.rules.push_back(makeRule("era_progression", "Era Progression",
                                      "Maintain reasonable era progression", PolicyType::Temporal, "era",
                                      RuleOperator::CompatibleWith, QString("era_transitions"),
                                      RulePriority::Low, 0.8));

    MixingPolicy classicDj;
    classicDj.id = "classic_dj";
    classicDj.name = "Classic DJ Mixing";
    classicDj.description = "Traditional harmonic mixing approach";
    classicDj.ruleSets = {classic};
    classicDj.globalWeights = {{PolicyType::Harmonic, 0.6}, {PolicyType::Energy, 0.3}, {PolicyType::Stylistic, 0.1}};
    classicDj.createdBy = "system";

    MixingPolicy modernAi;
    modernAi.id = "modern_ai";
    modernAi.name = "Modern AI Mixing";
    modernAi.description = "AI-enhanced mixing with LLM metadata";
    modernAi.ruleSets = {classic, stylistic};
    modernAi.globalWeights = {{PolicyType::Harmonic, 0.3},
                              {PolicyType::Stylistic, 0.4},
                              {PolicyType::Energy, 0.2},
                              {PolicyType::Quality, 0.1}};
    modernAi.adaptiveWeights = true;
    modernAi.createdBy = "system";

    MixingPolicy journey;
    journey.id = "cultural_journey";
    journey.name = "Cultural Journey";
    journey.description = "Cross-cultural mixing with intelligent transitions";
    journey.ruleSets = {cultural};
    journey.globalWeights = {{PolicyType::Linguistic, 0.4},
                             {PolicyType::Temporal, 0.3},
                             {PolicyType::Harmonic, 0.2},
                             {PolicyType::Stylistic, 0.1}};
    journey.createdBy = "system";

    for (const auto& p : {classicDj, modernAi, journey}) m_policies.insert(p.id, p);
    for (const auto& rs : {classic, stylistic, cultural}) m_ruleSets.insert(rs.id, rs);
}

QStringList PolicyManager::recommendationsFor(const QVector<PolicyEvaluationResult>& results) {
    QStringList out;
    for (const auto& r : results) {
        if (r.satisfied) continue;
        if (r.priority != RulePriority::Critical && r.priority != RulePriority::High) continue;

        const QString id = r.ruleId.toLower();
        if (id.contains("key")) {
            out << QString("Consider tracks in compatible keys (currently %1)").arg(util::displayValue(r.actual));
        } else if (id.contains("bpm")) {
            out << QString("Look for tracks with BPM closer to %1").arg(util::displayValue(r.expected));
        } else if (id.contains("energy") || id.contains("danceability")) {
            out << QString("Choose tracks with higher energy/danceability");
        }
    }
    return out;
}

PolicyApplicationResult PolicyManager::evaluatePolicy(const MixingPolicy& policy,
                                                      const model::Track& track,
                                                      const model::TrackMetadata* metadata,
                                                      const model::ContextData* context) const {
    PolicyApplicationResult res;
    res.policyId = policy.id;

    double total = 0.0;
    double weightSum = 0.0;
    for (const auto& rs : policy.ruleSets) {
        if (!rs.enabled) continue;

        const int firstResult = res.ruleResults.size();
        double rsWeight = 0.0;
        const double rsScore = m_engine.evaluateRuleSet(rs, track, metadata, context, &res.ruleResults, &rsWeight);
        res.ruleSetScores.insert(rs.id, rsScore);

        for (int i = firstResult; i < res.ruleResults.size(); ++i) {
            const auto& r = res.ruleResults[i];
            if (r.priority == RulePriority::Critical && !r.satisfied) {
                res.satisfiedCriticalRules = false;
                res.warnings << QString("Critical rule '%1' not satisfied").arg(r.ruleName);
            }
        }

        // The rule set is typed by its first rule.
        const PolicyType type = rs.rules.isEmpty() ? PolicyType::Custom : rs.rules.first().type;
        const double gw = policy.globalWeight(type);
        total += rsScore * gw * rsWeight;
        weightSum += gw * rsWeight;
    }

    res.totalScore = weightSum > 0.0 ? qBound(0.0, total / weightSum, 1.0) : 0.0;
    res.recommendations = recommendationsFor(res.ruleResults);
    return res;
}

bool PolicyManager::evaluateTrack(const QString& policyId,
                                  const model::Track& track,
                                  const model::TrackMetadata* metadata,
                                  const model::ContextData* context,
                                  PolicyApplicationResult& out,
                                  QString* outError) const {
    const MixingPolicy* p = policy(policyId);
    if (!p) {
        fail(outError, QString("Policy '%1' not found").arg(policyId));
        return false;
    }
    out = evaluatePolicy(*p, track, metadata, context);
    return true;
}

bool PolicyManager::applyPolicy(const QString& policyId,
                                const model::TrackList& tracks,
                                const model::MetadataMap& metadata,
                                const model::ContextData* context,
                                QVector<PolicyApplicationResult>& out,
                                QString* outError) const {
    const MixingPolicy* p = policy(policyId);
    if (!p) {
        fail(outError, QString("Policy '%1' not found").arg(policyId));
        return false;
    }
    out.clear();
    out.reserve(tracks.size());
    for (const auto& t : tracks) {
        const model::TrackMetadata md = metadata.value(t.id);
        out.push_back(evaluatePolicy(*p, t, &md, context));
    }
    return true;
}

// --- CRUD ---

bool PolicyManager::createPolicy(MixingPolicy policy, QString* outError) {
    if (policy.id.isEmpty()) {
        fail(outError, "Policy id must not be empty");
        return false;
    }
    if (m_policies.contains(policy.id)) {
        fail(outError, QString("Policy '%1' already exists").arg(policy.id));
        return false;
    }
    policy.createdBy = "user";
    m_policies.insert(policy.id, policy);
    return persist(outError);
}

bool PolicyManager::updatePolicy(const QString& policyId, const QJsonObject& patch, QString* outError) {
    auto it = m_policies.find(policyId);
    if (it == m_policies.end()) {
        fail(outError, QString("Policy '%1' not found").arg(policyId));
        return false;
    }

    // Validate against a merged copy so a bad patch leaves the policy untouched.
    QJsonObject merged = it->toJson();
    for (auto p = patch.constBegin(); p != patch.constEnd(); ++p) {
        if (p.key() == "id" || p.key() == "created_by" || !merged.contains(p.key())) continue;
        merged.insert(p.key(), p.value());
    }
    MixingPolicy updated;
    if (!MixingPolicy::fromJson(merged, updated, outError)) {
        qWarning().noquote() << "PolicyManager: update of" << policyId << "rejected";
        return false;
    }
    *it = updated;
    return persist(outError);
}

bool PolicyManager::deletePolicy(const QString& policyId, QString* outError) {
    auto it = m_policies.find(policyId);
    if (it == m_policies.end() || it->createdBy != "user") {
        fail(outError, QString("Policy '%1' is not a user policy").arg(policyId));
        return false;
    }
    m_policies.erase(it);
    return persist(outError);
}

const MixingPolicy* PolicyManager::policy(const QString& policyId) const {
    auto it = m_policies.constFind(policyId);
    return it == m_policies.constEnd() ? nullptr : &(*it);
}

QVector<MixingPolicy> PolicyManager::policies() const {
    QVector<MixingPolicy> out;
    out.reserve(m_policies.size());
    for (const auto& p : m_policies) out.push_back(p);
    return out;
}

bool PolicyManager::addRuleSet(PolicyRuleSet ruleSet, QString* outError) {
    if (ruleSet.id.isEmpty()) {
        fail(outError, "Rule set id must not be empty");
        return false;
    }
    if (m_ruleSets.contains(ruleSet.id)) {
        fail(outError, QString("Rule set '%1' already exists").arg(ruleSet.id));
        return false;
    }
    ruleSet.createdBy = "user";
    m_ruleSets.insert(ruleSet.id, ruleSet);
    return persist(outError);
}

const PolicyRuleSet* PolicyManager::ruleSet(const QString& ruleSetId) const {
    auto it = m_ruleSets.constFind(ruleSetId);
    return it == m_ruleSets.constEnd() ? nullptr : &(*it);
}

QVector<PolicyRuleSet> PolicyManager::ruleSets() const {
    QVector<PolicyRuleSet> out;
    out.reserve(m_ruleSets.size());
    for (const auto& rs : m_ruleSets) out.push_back(rs);
    return out;
}

// --- import / export ---

bool PolicyManager::exportPolicy(const QString& policyId, const QString& filePath, QString* outError) const {
    const MixingPolicy* p = policy(policyId);
    if (!p) {
        fail(outError, QString("Policy '%1' not found").arg(policyId));
        return false;
    }
    return writeJsonFile(filePath, p->toJson(), outError);
}

QString PolicyManager::importPolicy(const QString& filePath, QString* outError) {
    QJsonDocument doc;
    if (!readJsonFile(filePath, doc, outError)) return QString();

    MixingPolicy p;
    QString err;
    if (!MixingPolicy::fromJson(doc.object(), p, &err)) {
        fail(outError, QString("Error importing policy from %1: %2").arg(filePath, err));
        return QString();
    }
    p.createdBy = "user";

    const QString base = p.id;
    for (int n = 1; m_policies.contains(p.id); ++n) p.id = QString("%1_%2").arg(base).arg(n);

    m_policies.insert(p.id, p);
    if (!persist(outError)) return QString();
    return p.id;
}

// --- user store ---

bool PolicyManager::persist(QString* outError) const {
    if (m_configDir.isEmpty()) return true;
    return saveUserPolicies(outError);
}

bool PolicyManager::saveUserPolicies(QString* outError) const {
    if (m_configDir.isEmpty()) {
        fail(outError, "No config directory configured");
        return false;
    }

    QJsonArray policiesArr;
    for (const auto& p : m_policies) {
        if (p.createdBy != "system") policiesArr.push_back(p.toJson());
    }
    QJsonArray setsArr;
    for (const auto& rs : m_ruleSets) {
        if (rs.createdBy != "system") setsArr.push_back(rs.toJson());
    }

    QJsonObject root;
    root.insert("policies", policiesArr);
    root.insert("rule_sets", setsArr);
    return writeJsonFile(policiesFilePath(), root, outError);
}

bool PolicyManager::loadUserPolicies(QString* outError) {
    const QString path = policiesFilePath();
    if (path.isEmpty() || !QFile::exists(path)) return true;

    QJsonDocument doc;
    if (!readJsonFile(path, doc, outError)) return false;
    const QJsonObject root = doc.object();

    bool allOk = true;
    for (const auto& v : root.value("policies").toArray()) {
        MixingPolicy p;
        QString err;
        if (!MixingPolicy::fromJson(v.toObject(), p, &err)) {
            fail(outError, QString("Skipping stored policy: %1").arg(err));
            allOk = false;
            continue;
        }
        if (m_policies.contains(p.id) && m_policies.value(p.id).createdBy == "system") {
            fail(outError, QString("Skipping stored policy '%1': id is a built-in policy").arg(p.id));
            allOk = false;
            continue;
        }
        m_policies.insert(p.id, p);
    }
    for (const auto& v : root.value("rule_sets").toArray()) {
        PolicyRuleSet rs;
        QString err;
        if (!PolicyRuleSet::fromJson(v.toObject(), rs, &err)) {
            fail(outError, QString("Skipping stored rule set: %1").arg(err));
            allOk = false;
            continue;
        }
        if (m_ruleSets.contains(rs.id) && m_ruleSets.value(rs.id).createdBy == "system") {
            fail(outError, QString("Skipping stored rule set '%1': id is a built-in rule set").arg(rs.id));
            allOk = false;
            continue;
        }
        m_ruleSets.insert(rs.id, rs);
    }
    return allOk;
}

} // namespace segue::policy
