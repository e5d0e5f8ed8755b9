#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>

#include "segue/model/Track.h"
#include "segue/model/TrackMetadata.h"
#include "segue/policy/PolicyRuleEngine.h"
#include "segue/policy/PolicyTypes.h"

namespace segue::policy {

// Owns the built-in and user policies / rule sets.
//
// With a non-empty config directory the user store (<configDir>/policies.json) is loaded
// on construction and rewritten after every successful mutation. Built-ins carry
// created_by "system" and are never written to the store nor deletable.
class PolicyManager {
public:
    explicit PolicyManager(const QString& configDir = QString());

    const QString& configDir() const { return m_configDir; }
    QString policiesFilePath() const;

    // One result per track, in input order. Unknown id -> false.
    bool applyPolicy(const QString& policyId,
                     const model::TrackList& tracks,
                     const model::MetadataMap& metadata,
                     const model::ContextData* context,
                     QVector<PolicyApplicationResult>& out,
                     QString* outError = nullptr) const;

    bool evaluateTrack(const QString& policyId,
                       const model::Track& track,
                       const model::TrackMetadata* metadata,
                       const model::ContextData* context,
                       PolicyApplicationResult& out,
                       QString* outError = nullptr) const;

    PolicyApplicationResult evaluatePolicy(const MixingPolicy& policy,
                                           const model::Track& track,
                                           const model::TrackMetadata* metadata,
                                           const model::ContextData* context) const;

    // CRUD
    bool createPolicy(MixingPolicy policy, QString* outError = nullptr);
    // Applies known keys of the patch; unknown keys are ignored. False when id is unknown.
    bool updatePolicy(const QString& policyId, const QJsonObject& patch, QString* outError = nullptr);
    bool deletePolicy(const QString& policyId, QString* outError = nullptr);
    const MixingPolicy* policy(const QString& policyId) const;
    QVector<MixingPolicy> policies() const;

    bool addRuleSet(PolicyRuleSet ruleSet, QString* outError = nullptr);
    const PolicyRuleSet* ruleSet(const QString& ruleSetId) const;
    QVector<PolicyRuleSet> ruleSets() const;

    // Single policy object.
    bool exportPolicy(const QString& policyId, const QString& filePath, QString* outError = nullptr) const;
    // Returns the stored id (suffixed _1, _2... on collision) or a null string.
    QString importPolicy(const QString& filePath, QString* outError = nullptr);

    // {"policies": [...], "rule_sets": [...]} with user-created entries only.
    bool saveUserPolicies(QString* outError = nullptr) const;
    // Missing file is not an error. Stored entries never replace built-ins.
    bool loadUserPolicies(QString* outError = nullptr);

    const PolicyRuleEngine& engine() const { return m_engine; }

private:
    void loadBuiltins();
    bool persist(QString* outError) const;
    static QStringList recommendationsFor(const QVector<PolicyEvaluationResult>& results);

    PolicyRuleEngine m_engine;
    QMap<QString, MixingPolicy> m_policies;
    QMap<QString, PolicyRuleSet> m_ruleSets;
    QString m_configDir;
};

} // namespace segue::policy
