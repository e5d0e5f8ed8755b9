#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "segue/harmonic/HarmonicScorer.h"
#include "segue/model/Track.h"
#include "segue/model/TrackMetadata.h"
#include "segue/sequence/ContextualCurve.h"
#include "segue/style/StylisticMatrix.h"

namespace segue::sequence {

struct SequencerWeights {
    double harmonic = 0.25;
    double stylistic = 0.25;
    double context = 0.25;
    double energy = 0.15;
    double variety = 0.10;

    QJsonObject toJson() const;
    static SequencerWeights fromJson(const QJsonObject& o);
};

struct GenerationRequest {
    model::TrackList tracks;
    model::MetadataMap metadata;
    int targetLength = 10;

    QString timeOfDay;
    QString activity;
    QString moodPreference;
    QString season;
    QString energyPreference; // warm_up | peak_time | cool_down
    int durationMinutes = 0;

    QString startTrackId;
    bool allowRepeats = false;
    double minCompatibility = 0.3;

    CurveQuery curveQuery() const;
};

struct GenerationInfo {
    QString algorithm = "contextual_multi_factor";
    QString curveUsed;
    int iterations = 0;
    int fallbackSelections = 0;
    int perfectMatches = 0;
    int contextMismatches = 0;

    QJsonObject toJson() const;
};

struct GenerationResult {
    model::TrackList playlist;
    ContextualCurve curve;
    QVector<double> energyProgression;
    QVector<double> trackScores; // one per playlist entry
    GenerationInfo info;
    double totalScore = 0.0;     // mean of trackScores

    bool isEmpty() const { return playlist.isEmpty(); }
    QJsonObject toJson() const;
};

// Greedy, single-pass playlist builder.
//
// Each step scores every remaining candidate against the current track
// (harmonic, stylistic, context fit, energy flow, variety) and takes the best one.
// When the best score misses minCompatibility the candidate with the best context fit
// is taken instead and counted as a fallback. Unavailable tracks are never selected.
class PlaylistSequencer {
public:
    explicit PlaylistSequencer(harmonic::HarmonicScorer harmonic = harmonic::HarmonicScorer(),
                               style::StylisticMatrix matrix = style::StylisticMatrix::builtins(),
                               CurveLibrary curves = CurveLibrary::builtins());

    void setWeights(const SequencerWeights& w) { m_weights = w; }
    const SequencerWeights& weights() const { return m_weights; }

    const CurveLibrary& curves() const { return m_curves; }
    CurveLibrary& curves() { return m_curves; }

    GenerationResult generate(const GenerationRequest& request) const;

    // count runs with a relaxed threshold per run; runs after the first ignore the start track
    // and shuffle the pool with a fixed seed. Non-empty results, best total score first.
    QVector<GenerationResult> generateMultiple(const GenerationRequest& request, int count = 3) const;

    QJsonObject explain(const GenerationResult& result) const;

    double comprehensiveScore(const model::Track& current,
                              const model::Track& candidate,
                              const model::TrackMetadata& currentMd,
                              const model::TrackMetadata& candidateMd,
                              const ContextualCurve& curve,
                              double targetEnergy,
                              double position) const;

    // Danceability stands in for energy here (0.5 when the key is missing).
    static double energyFlowScore(const model::TrackMetadata& currentMd,
                                  const model::TrackMetadata& candidateMd,
                                  double targetEnergy);

    // 1.0 minus 0.2 / 0.1 / 0.1 for a repeated subgenre / mood / era, floored at 0.
    static double varietyScore(const model::TrackMetadata& currentMd, const model::TrackMetadata& candidateMd);

private:
    int selectStart(const model::TrackList& pool,
                    const model::MetadataMap& metadata,
                    const ContextualCurve& curve,
                    double targetEnergy) const;

    harmonic::HarmonicScorer m_harmonic;
    style::StylisticMatrix m_matrix;
    CurveLibrary m_curves;
    SequencerWeights m_weights;
};

} // namespace segue::sequence
