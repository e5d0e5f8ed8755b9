#include "segue/sequence/PlaylistSequencer.h"

#include "segue/util/StableRng.h"
#include "segue/util/ValueNormalize.h"

#include <QDebug>
#include <QJsonArray>
#include <QtGlobal>

#include <algorithm>
#include <utility>

namespace segue::sequence {
namespace {

static QJsonArray toJsonArray(const QVector<double>& v) {
    QJsonArray arr;
    for (double d : v) arr.push_back(d);
    return arr;
}

static bool sameLabel(const model::TrackMetadata& a, const model::TrackMetadata& b, const char* key) {
    const QString la = util::normalizeLabel(a.value(QString::fromUtf8(key)));
    return !la.isEmpty() && la == util::normalizeLabel(b.value(QString::fromUtf8(key)));
}

// Missing key -> 0.5; present but unusable -> false.
static bool danceabilityOf(const model::TrackMetadata& md, double& out) {
    if (!md.contains("danceability")) {
        out = 0.5;
        return true;
    }
    return util::normalizePercent(md.value("danceability"), out);
}

} // namespace

QJsonObject SequencerWeights::toJson() const {
    QJsonObject o;
    o.insert("harmonic", harmonic);
    o.insert("stylistic", stylistic);
    o.insert("context", context);
    o.insert("energy", energy);
    o.insert("variety", variety);
    return o;
}

SequencerWeights SequencerWeights::fromJson(const QJsonObject& o) {
    SequencerWeights w;
    w.harmonic = o.value("harmonic").toDouble(w.harmonic);
    w.stylistic = o.value("stylistic").toDouble(w.stylistic);
    w.context = o.value("context").toDouble(w.context);
    w.energy = o.value("energy").toDouble(w.energy);
    w.variety = o.value("variety").toDouble(w.variety);
    return w;
}

CurveQuery GenerationRequest::curveQuery() const {
    CurveQuery q;
    q.timeOfDay = timeOfDay;
    q.activity = activity;
    q.energy = energyPreference;
    q.mood = moodPreference;
    q.season = season;
    q.durationMinutes = durationMinutes;
    return q;
}

QJsonObject GenerationInfo::toJson() const {
    QJsonObject o;
    o.insert("algorithm", algorithm);
    o.insert("curve_used", curveUsed);
    o.insert("iterations", iterations);
    o.insert("fallback_selections", fallbackSelections);
    o.insert("perfect_matches", perfectMatches);
    o.insert("context_mismatches", contextMismatches);
    return o;
}

QJsonObject GenerationResult::toJson() const {
    QJsonObject o;
    QJsonArray tracks;
    for (const auto& t : playlist) tracks.push_back(t.toJson());
    o.insert("playlist", tracks);
    o.insert("curve", curve.toJson());
    o.insert("energy_progression", toJsonArray(energyProgression));
    o.insert("track_scores", toJsonArray(trackScores));
    o.insert("generation_info", info.toJson());
    o.insert("total_score", totalScore);
    return o;
}

PlaylistSequencer::PlaylistSequencer(harmonic::HarmonicScorer harmonic,
                                     style::StylisticMatrix matrix,
                                     CurveLibrary curves)
    : m_harmonic(std::move(harmonic)), m_matrix(std::move(matrix)), m_curves(std::move(curves)) {}

double PlaylistSequencer::energyFlowScore(const model::TrackMetadata& currentMd,
                                          const model::TrackMetadata& candidateMd,
                                          double targetEnergy) {
    double cur = 0.0;
    double cand = 0.0;
    if (!danceabilityOf(currentMd, cur) || !danceabilityOf(candidateMd, cand)) return 0.5;

    const double targetMatch = 1.0 - qAbs(cand - targetEnergy);
    const double transition = 1.0 - qMin(qAbs(cand - cur), 0.3) / 0.3;
    return targetMatch * 0.7 + transition * 0.3;
}

double PlaylistSequencer::varietyScore(const model::TrackMetadata& currentMd, const model::TrackMetadata& candidateMd) {
    double v = 1.0;
    if (sameLabel(currentMd, candidateMd, "subgenre")) v -= 0.2;
    if (sameLabel(currentMd, candidateMd, "mood")) v -= 0.1;
    if (sameLabel(currentMd, candidateMd, "era")) v -= 0.1;
    return qMax(0.0, v);
}

double PlaylistSequencer::comprehensiveScore(const model::Track& current,
                                             const model::Track& candidate,
                                             const model::TrackMetadata& currentMd,
                                             const model::TrackMetadata& candidateMd,
                                             const ContextualCurve& curve,
                                             double targetEnergy,
                                             double position) const {
    const double harmonic = m_harmonic.compatibility(current, candidate);
    const double stylistic = m_matrix.compatibility(style::StyleProfile::fromMetadata(currentMd),
                                                    style::StyleProfile::fromMetadata(candidateMd));
    const double context = m_curves.trackContextScore(candidateMd, curve, targetEnergy, position);
    const double energy = energyFlowScore(currentMd, candidateMd, targetEnergy);
    const double variety = varietyScore(currentMd, candidateMd);

    return m_weights.harmonic * harmonic + m_weights.stylistic * stylistic + m_weights.context * context
         + m_weights.energy * energy + m_weights.variety * variety;
}

int PlaylistSequencer::selectStart(const model::TrackList& pool,
                                   const model::MetadataMap& metadata,
                                   const ContextualCurve& curve,
                                   double targetEnergy) const {
    const bool openerBonus = curve.type == ContextType::Time
                          && (curve.contextValue == "morning" || curve.contextValue == "evening");
    int bestIdx = -1;
    double best = 0.0;
    for (int i = 0; i < pool.size(); ++i) {
        const model::TrackMetadata md = metadata.value(pool[i].id);
        double s = m_curves.trackContextScore(md, curve, targetEnergy, 0.0);
        double mix = 0.0;
        if (openerBonus && util::normalizePercent(md.value("mix_friendly"), mix) && mix > 0.7) s += 0.1;
        if (bestIdx < 0 || s > best) {
            bestIdx = i;
            best = s;
        }
    }
    return bestIdx;
}

GenerationResult PlaylistSequencer::generate(const GenerationRequest& request) const {
    GenerationResult res;
    res.curve = m_curves.selectCurve(request.curveQuery());
    res.energyProgression = m_curves.energyProgression(res.curve, request.targetLength);
    res.info.curveUsed = res.curve.name;

    model::TrackList pool;
    for (const auto& t : request.tracks) {
        if (t.isAvailable) pool.push_back(t);
    }
    if (pool.isEmpty() || request.targetLength <= 0) return res;

    const double firstTarget = res.energyProgression.isEmpty() ? 0.5 : res.energyProgression.first();

    // --- start track ---
    int startIdx = -1;
    if (!request.startTrackId.isEmpty()) {
        for (int i = 0; i < pool.size(); ++i) {
            if (pool[i].id == request.startTrackId) {
                startIdx = i;
                break;
            }
        }
        if (startIdx < 0) qDebug().noquote() << "PlaylistSequencer: start track" << request.startTrackId << "not available";
    }
    if (startIdx < 0) {
        startIdx = selectStart(pool, request.metadata, res.curve, firstTarget);
        if (startIdx < 0) return res;
        qDebug().noquote() << "PlaylistSequencer: start track" << pool[startIdx].id << "chosen for" << res.curve.name;
    }

    const int limit = request.allowRepeats ? request.targetLength : qMin(request.targetLength, int(pool.size()));

    model::Track current = pool[startIdx];
    res.playlist.push_back(current);
    res.trackScores.push_back(
        m_curves.trackContextScore(request.metadata.value(current.id), res.curve, firstTarget, 0.0));

    model::TrackList remaining = pool;
    if (!request.allowRepeats) remaining.removeAt(startIdx);

    // --- greedy steps ---
    for (int position = 1; position < limit; ++position) {
        ++res.info.iterations;

        QVector<int> candidates;
        for (int i = 0; i < remaining.size(); ++i) {
            if (request.allowRepeats && remaining[i].id == current.id) continue;
            candidates.push_back(i);
        }
        if (candidates.isEmpty()) break;

        const double target = position < res.energyProgression.size() ? res.energyProgression[position] : 0.5;
        const double ratio = request.targetLength > 1 ? double(position) / double(request.targetLength - 1) : 0.5;
        const model::TrackMetadata currentMd = request.metadata.value(current.id);

        int bestIdx = -1;
        double best = 0.0;
        for (int idx : candidates) {
            const model::Track& cand = remaining[idx];
            const double s = comprehensiveScore(current, cand, currentMd, request.metadata.value(cand.id),
                                                res.curve, target, ratio);
            if (bestIdx < 0 || s > best) {
                bestIdx = idx;
                best = s;
            }
        }

        const double bestContext =
            m_curves.trackContextScore(request.metadata.value(remaining[bestIdx].id), res.curve, target, ratio);
        if (bestContext < 0.4) ++res.info.contextMismatches;

        int chosen = bestIdx;
        double chosenScore = best;
        if (best >= request.minCompatibility) {
            if (best > 0.8) ++res.info.perfectMatches;
        } else {
            // Nothing reached the threshold: take the best context fit instead.
            chosen = -1;
            for (int idx : candidates) {
                const double s =
                    m_curves.trackContextScore(request.metadata.value(remaining[idx].id), res.curve, target, ratio);
                if (chosen < 0 || s > chosenScore) {
                    chosen = idx;
                    chosenScore = s;
                }
            }
            ++res.info.fallbackSelections;
            qDebug().noquote() << "PlaylistSequencer: fallback at position" << position << "->"
                               << remaining[chosen].id << "(best" << best << "<" << request.minCompatibility << ")";
        }

        current = remaining[chosen];
        res.playlist.push_back(current);
        res.trackScores.push_back(chosenScore);
        if (!request.allowRepeats) remaining.removeAt(chosen);
    }

    double sum = 0.0;
    for (double s : res.trackScores) sum += s;
    res.totalScore = res.trackScores.isEmpty() ? 0.0 : sum / double(res.trackScores.size());
    return res;
}

QVector<GenerationResult> PlaylistSequencer::generateMultiple(const GenerationRequest& request, int count) const {
    QVector<GenerationResult> out;
    for (int i = 0; i < count; ++i) {
        GenerationRequest varied = request;
        varied.minCompatibility = qMax(0.2, request.minCompatibility - 0.1 * i);
        // Run 0 keeps the caller's start track; later runs explore other openings.
        if (i > 0) {
            varied.startTrackId.clear();
            util::StableRng rng(util::StableRng::seedFromString(QString("sequence|shuffle|%1").arg(i).toUtf8()));
            rng.shuffle(varied.tracks);
        }
        GenerationResult r = generate(varied);
        if (!r.isEmpty()) out.push_back(std::move(r));
    }
    std::stable_sort(out.begin(), out.end(), [](const GenerationResult& a, const GenerationResult& b) {
        return a.totalScore > b.totalScore;
    });
    return out;
}

QJsonObject PlaylistSequencer::explain(const GenerationResult& result) const {
    QJsonObject curveInfo;
    curveInfo.insert("name", result.curve.name);
    curveInfo.insert("type", contextTypeToString(result.curve.type));
    curveInfo.insert("shape", curveShapeToString(result.curve.shape));
    curveInfo.insert("energy_range", QJsonArray{result.curve.energyRange.first, result.curve.energyRange.second});
    curveInfo.insert("duration", result.curve.durationMinutes);

    QJsonObject flow;
    flow.insert("progression", toJsonArray(result.energyProgression));
    flow.insert("track_scores", toJsonArray(result.trackScores));
    flow.insert("average_score", result.totalScore);

    const double n = double(result.playlist.size());
    QJsonArray recs;
    if (result.info.contextMismatches > n * 0.3) {
        recs.push_back("Consider adjusting context parameters - some tracks don't fit the selected context well");
    }
    if (result.info.fallbackSelections > n * 0.2) {
        recs.push_back("Some tracks were selected as fallbacks - consider expanding your music library for this context");
    }
    if (result.totalScore < 0.6) {
        recs.push_back("Overall compatibility could be improved - consider using different starting track or context");
    }

    QJsonObject o;
    o.insert("curve_info", curveInfo);
    o.insert("generation_stats", result.info.toJson());
    o.insert("energy_flow", flow);
    o.insert("recommendations", recs);
    return o;
}

} // namespace segue::sequence
