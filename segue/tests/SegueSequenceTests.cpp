#include "segue/sequence/ContextualCurve.h"
#include "segue/sequence/PlaylistSequencer.h"
#include "segue/util/StableRng.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonArray>
#include <QJsonObject>
#include <QSet>
#include <QtGlobal>

#include <algorithm>

using segue::model::MetadataMap;
using segue::model::Track;
using segue::model::TrackList;
using segue::model::TrackMetadata;
using namespace segue::sequence;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static void expectNear(double a, double b, const QString& msg, double eps = 1e-6) {
    expect(qAbs(a - b) <= eps, msg + QString(" (got %1 expected %2)").arg(a, 0, 'g', 10).arg(b, 0, 'g', 10));
}

static Track makeTrack(const QString& id, const QString& key, double bpm, double energy, bool available = true) {
    Track t;
    t.id = id;
    t.title = id;
    t.key = key;
    t.bpm = bpm;
    t.energy = energy;
    t.isAvailable = available;
    return t;
}

static TrackMetadata meta(const char* subgenre, const char* mood, const char* era, double danceability) {
    TrackMetadata md;
    md.insert("subgenre", subgenre);
    md.insert("mood", mood);
    md.insert("era", era);
    md.insert("danceability", danceability);
    md.insert("crowd_appeal", 0.7);
    return md;
}

static GenerationRequest sampleRequest() {
    GenerationRequest req;
    req.tracks = {
        makeTrack("s1", "8A", 120.0, 5.0),  makeTrack("s2", "9A", 122.0, 6.0),
        makeTrack("s3", "9B", 124.0, 7.0),  makeTrack("s4", "10A", 126.0, 8.0),
        makeTrack("s5", "3B", 95.0, 3.0),   makeTrack("s6", "8B", 121.0, 6.0),
        makeTrack("gone", "8A", 120.0, 5.0, /*available=*/false),
    };
    req.metadata.insert("s1", meta("salsa dura", "energetic", "90s", 0.7));
    req.metadata.insert("s2", meta("tropical salsa", "uplifting", "2000s", 0.75));
    req.metadata.insert("s3", meta("classic salsa", "festive", "80s", 0.85));
    req.metadata.insert("s4", meta("salsa dura", "energetic", "2010s", 0.9));
    req.metadata.insert("s5", meta("bachata", "romantic", "2020s", 0.4));
    req.metadata.insert("s6", meta("merengue", "happy", "90s", 0.8));
    req.metadata.insert("gone", meta("salsa dura", "energetic", "90s", 0.9));
    req.activity = "party";
    return req;
}

static QStringList ids(const TrackList& list) {
    QStringList out;
    for (const auto& t : list) out << t.id;
    return out;
}

} // namespace

static void testCurves() {
    const CurveLibrary lib = CurveLibrary::builtins();

    for (ContextType type : {ContextType::Time, ContextType::Activity, ContextType::Energy, ContextType::Mood,
                             ContextType::Season}) {
        for (const QString& key : lib.available(type)) {
            const ContextualCurve* c = lib.curve(type, key);
            expect(c != nullptr, "Curve lookup " + key);
            if (!c) continue;
            const QVector<double> p = lib.energyProgression(*c, 9);
            expectEq(p.size(), 9, "Progression length " + key);
            for (double e : p) {
                expect(e >= c->minEnergy() - 1e-9 && e <= c->maxEnergy() + 1e-9, "Progression in range " + key);
            }
        }
    }

    const ContextualCurve* lateNight = lib.curve(ContextType::Time, "late_night");
    expect(lateNight != nullptr, "late_night curve exists");
    if (lateNight) {
        const QVector<double> p = lib.energyProgression(*lateNight, 6);
        expect(p.first() > p.last(), "Descending curve falls");
        expectNear(p.first(), 0.6, "Descending starts at the high end");
    }

    const ContextualCurve* workout = lib.curve(ContextType::Activity, "workout");
    expect(workout != nullptr, "workout curve exists");
    if (workout) {
        expect(lib.energyProgression(*workout, 8) == lib.energyProgression(*workout, 8), "Flat jitter is repeatable");
        expect(lib.energyProgression(*workout, 0).isEmpty(), "Zero-length progression");
        expectEq(lib.energyProgression(*workout, 1).size(), 1, "Single-entry progression");
    }

    CurveQuery q;
    expectStrEq(lib.selectCurve(q).name, "Evening Prime Time", "Default curve");
    q.timeOfDay = "morning";
    q.activity = "party";
    expectStrEq(lib.selectCurve(q).name, "Party Energy", "Activity curve preferred");
    q.activity.clear();
    q.durationMinutes = 20;
    const ContextualCurve morning = lib.selectCurve(q);
    expectStrEq(morning.name, "Morning Warm-up", "Time curve");
    expectEq(morning.durationMinutes, 20, "Duration override");
    q.timeOfDay.clear();
    q.mood = "romantic";
    expectStrEq(lib.selectCurve(q).name, "Romantic Journey", "Mood curve keyed by mood");

    TrackMetadata md;
    expectNear(lib.trackContextScore(md, morning, 0.5, 0.0), 0.5, "Empty metadata is neutral");
    md.insert("time_of_day", "morning");
    md.insert("danceability", 0.5);
    expectNear(lib.trackContextScore(md, morning, 0.5, 0.0), 1.0, "Perfect time and energy fit");
}

static void testScores() {
    TrackMetadata none;
    expectNear(PlaylistSequencer::energyFlowScore(none, none, 0.5), 1.0, "Missing danceability defaults to 0.5");
    TrackMetadata junk;
    junk.insert("danceability", "lots");
    expectNear(PlaylistSequencer::energyFlowScore(junk, none, 0.5), 0.5, "Unparseable danceability is neutral");

    const TrackMetadata a = meta("salsa dura", "energetic", "90s", 0.5);
    const TrackMetadata b = meta("salsa dura", "energetic", "90s", 0.8);
    expectNear(PlaylistSequencer::energyFlowScore(a, b, 0.8), 0.7, "Big jump gets no transition credit");
    expectNear(PlaylistSequencer::varietyScore(a, b), 0.6, "Same subgenre, mood and era");
    expectNear(PlaylistSequencer::varietyScore(a, meta("bachata", "romantic", "2020s", 0.5)), 1.0, "All different");
}

static void testGenerate() {
    const PlaylistSequencer seq;
    GenerationRequest req = sampleRequest();
    req.targetLength = 10;

    const GenerationResult res = seq.generate(req);
    expectEq(res.playlist.size(), 6, "Length capped by available tracks");
    expectEq(res.trackScores.size(), res.playlist.size(), "One score per entry");
    expectEq(res.energyProgression.size(), 10, "Progression sized to target");
    expectStrEq(res.curve.name, "Party Energy", "Curve chosen from activity");
    expectStrEq(res.info.curveUsed, "Party Energy", "Curve recorded in info");
    expectEq(res.info.iterations, 5, "One iteration per step");

    const QStringList got = ids(res.playlist);
    expectEq(QSet<QString>(got.begin(), got.end()).size(), got.size(), "No duplicates");
    expect(!got.contains("gone"), "Unavailable track never selected");

    double sum = 0.0;
    for (double s : res.trackScores) sum += s;
    expectNear(res.totalScore, sum / res.trackScores.size(), "Total is the mean");

    req.targetLength = 3;
    req.startTrackId = "s5";
    const GenerationResult started = seq.generate(req);
    expectEq(started.playlist.size(), 3, "Target length respected");
    if (!started.isEmpty()) expectStrEq(started.playlist.first().id, "s5", "Start track honoured");

    req.startTrackId = "gone";
    const GenerationResult skipped = seq.generate(req);
    expect(!skipped.isEmpty() && skipped.playlist.first().id != "gone", "Unavailable start track replaced");

    GenerationRequest empty;
    expect(seq.generate(empty).isEmpty(), "Empty pool gives an empty playlist");
}

static void testFallback() {
    const PlaylistSequencer seq;
    GenerationRequest req = sampleRequest();
    req.targetLength = 5;
    req.minCompatibility = 1.0;

    const GenerationResult res = seq.generate(req);
    expectEq(res.playlist.size(), 5, "Fallbacks do not end generation");
    expectEq(res.info.fallbackSelections, 4, "Every step fell back");
    expectEq(res.info.perfectMatches, 0, "No perfect matches under fallback");

    const QJsonObject ex = seq.explain(res);
    const QJsonArray recs = ex.value("recommendations").toArray();
    bool mentionsFallback = false;
    for (const auto& r : recs) mentionsFallback = mentionsFallback || r.toString().contains("fallbacks");
    expect(mentionsFallback, "Explanation mentions fallbacks");
    expect(ex.contains("curve_info") && ex.contains("generation_stats") && ex.contains("energy_flow"),
           "Explanation sections");
    expectEq(ex.value("generation_stats").toObject().value("fallback_selections").toInt(), 4, "Stats serialised");
}

static void testRepeats() {
    const PlaylistSequencer seq;
    GenerationRequest req;
    req.tracks = {makeTrack("a", "8A", 120.0, 5.0), makeTrack("b", "9A", 121.0, 5.0)};
    req.targetLength = 5;
    req.allowRepeats = true;

    const GenerationResult res = seq.generate(req);
    expectEq(res.playlist.size(), 5, "Repeats fill the target length");
    for (int i = 1; i < res.playlist.size(); ++i) {
        expect(res.playlist[i].id != res.playlist[i - 1].id, "No immediate repeat");
    }
}

static void testMultiple() {
    const PlaylistSequencer seq;
    GenerationRequest req = sampleRequest();
    req.targetLength = 4;
    req.startTrackId = "s1";

    const QVector<GenerationResult> first = seq.generateMultiple(req, 3);
    const QVector<GenerationResult> second = seq.generateMultiple(req, 3);
    expectEq(first.size(), 3, "Three candidates");
    expectEq(second.size(), first.size(), "Same candidate count");
    for (int i = 0; i < first.size() && i < second.size(); ++i) {
        expect(ids(first[i].playlist) == ids(second[i].playlist), QString("Candidate %1 repeatable").arg(i));
        if (i > 0) expect(first[i - 1].totalScore >= first[i].totalScore, "Candidates sorted by score");
    }

    GenerationRequest empty;
    expect(seq.generateMultiple(empty, 3).isEmpty(), "Empty results dropped");
}

static void testEmptyLibrary() {
    const CurveLibrary none;
    const ContextualCurve flat = none.selectCurve(CurveQuery{});
    expectStrEq(flat.name, "Default", "Empty library falls back to a flat curve");
    expect(flat.shape == CurveShape::Flat, "Fallback curve is flat");

    CurveLibrary onlyWorkout;
    const ContextualCurve* workout = CurveLibrary::builtins().curve(ContextType::Activity, "workout");
    if (workout) onlyWorkout.add("workout", *workout);
    expectStrEq(onlyWorkout.selectCurve(CurveQuery{}).name, "Workout Motivation", "First registered curve used");

    const PlaylistSequencer seq(segue::harmonic::HarmonicScorer(), segue::style::StylisticMatrix::builtins(),
                                CurveLibrary());
    GenerationRequest req = sampleRequest();
    req.activity.clear();
    req.targetLength = 4;
    const GenerationResult res = seq.generate(req);
    expectEq(res.playlist.size(), 4, "Generation works without built-in curves");
    expectStrEq(res.info.curveUsed, "Default", "Fallback curve recorded");
    for (double e : res.energyProgression) expect(e >= 0.5 - 1e-9 && e <= 0.5 + 1e-9, "Flat default progression");
}

static void testStableRng() {
    segue::util::StableRng rng(7);
    QVector<int> hits(5, 0);
    bool inRange = true;
    for (int i = 0; i < 500; ++i) {
        const quint32 v = rng.bounded(5);
        if (v >= 5u) {
            inRange = false;
            break;
        }
        ++hits[int(v)];
    }
    expect(inRange, "bounded() stays below its bound");
    for (int h : hits) expect(h > 0, "Every bucket reached");
    expectEq(int(rng.bounded(1)), 0, "Bound of one");
    expectEq(int(rng.bounded(0)), 0, "Bound of zero");

    segue::util::StableRng a(42);
    segue::util::StableRng b(42);
    bool same = true;
    for (int i = 0; i < 20; ++i) same = same && a.bounded(1000) == b.bounded(1000);
    expect(same, "Same seed, same sequence");

    QVector<int> v = {0, 1, 2, 3, 4, 5, 6, 7};
    segue::util::StableRng(segue::util::StableRng::seedFromString("sequence|shuffle|1")).shuffle(v);
    QVector<int> sorted = v;
    std::sort(sorted.begin(), sorted.end());
    expect(sorted == QVector<int>({0, 1, 2, 3, 4, 5, 6, 7}), "Shuffle is a permutation");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testCurves();
    testScores();
    testGenerate();
    testFallback();
    testRepeats();
    testMultiple();
    testEmptyLibrary();
    testStableRng();

    if (g_failures == 0) {
        qInfo("SegueSequenceTests: PASS");
        return 0;
    }

    qWarning("SegueSequenceTests: FAIL (%d failures)", g_failures);
    return 1;
}
