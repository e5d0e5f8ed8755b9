#pragma once

#include <QHash>
#include <QMap>
#include <QPair>
#include <QString>
#include <QVector>

#include "segue/model/Track.h"
#include "segue/model/TrackMetadata.h"
#include "segue/style/StyleProfile.h"

namespace segue::style {

enum class CompatibilityLevel {
    Perfect,
    Excellent,
    Good,
    Fair,
    Poor,
    Incompatible,
};

double levelValue(CompatibilityLevel l);

enum class StyleDimension {
    Subgenre = 0,
    Mood,
    Era,
    Language,
    Activity,
    TimeOfDay,
    Season,
    Danceability,
};

QString dimensionName(StyleDimension d);

struct StyleWeights {
    double subgenre = 0.25;
    double mood = 0.20;
    double era = 0.15;
    double language = 0.10;
    double activity = 0.10;
    double timeOfDay = 0.10;
    double season = 0.05;
    double danceability = 0.05;

    double weightFor(StyleDimension d) const;
};

struct BridgeCandidate {
    model::Track track;
    double score = 0.0;
    double toScore = 0.0;   // source -> bridge
    double fromScore = 0.0; // bridge -> target
};

// Categorical compatibility tables + weighted blend over two style profiles.
class StylisticMatrix {
public:
    using Table = QHash<QString, QHash<QString, CompatibilityLevel>>;

    static StylisticMatrix builtins();

    // table[a][b], else table[b][a], else Fair. Inputs are expected normalised.
    double lookup(StyleDimension d, const QString& a, const QString& b) const;

    // Renormalised weighted mean over the dimensions both profiles carry; 0.5 when none.
    double compatibility(const StyleProfile& p1, const StyleProfile& p2) const;

    // Per-dimension scores for dimensions both profiles carry (ordered by dimension).
    QMap<StyleDimension, double> breakdown(const StyleProfile& p1, const StyleProfile& p2) const;

    // Harmonic-mean bridge score; top 10, descending.
    QVector<BridgeCandidate> suggestBridgeTracks(
        const StyleProfile& source,
        const StyleProfile& target,
        const QVector<QPair<model::Track, model::TrackMetadata>>& pool) const;

    static double bridgeScore(double toBridge, double fromBridge);

    void setWeights(const StyleWeights& w) { m_weights = w; }
    const StyleWeights& weights() const { return m_weights; }

    static constexpr int kMaxBridgeCandidates = 10;

private:
    const Table* tableFor(StyleDimension d) const;

    Table m_subgenre;
    Table m_mood;
    Table m_era;
    Table m_language;
    Table m_activity;
    Table m_timeOfDay;
    Table m_season;
    StyleWeights m_weights;
};

} // namespace segue::style
