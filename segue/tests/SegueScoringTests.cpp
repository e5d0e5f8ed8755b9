#include "segue/config/SegueSettings.h"
#include "segue/engine/CompatibilityOrchestrator.h"
#include "segue/engine/MixingEngine.h"
#include "segue/harmonic/CamelotKey.h"
#include "segue/harmonic/HarmonicScorer.h"
#include "segue/structure/StructuralScorer.h"
#include "segue/style/StylisticMatrix.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonObject>
#include <QSettings>
#include <QTemporaryDir>
#include <QtGlobal>

using segue::harmonic::CamelotKey;
using segue::harmonic::HarmonicScorer;
using segue::harmonic::MixMode;
using segue::model::Track;
using segue::model::TrackMetadata;
using segue::structure::StructuralAnalysis;
using segue::structure::StructuralElement;
using segue::structure::StructuralScorer;
using segue::structure::TransitionPoint;
using segue::style::StyleDimension;
using segue::style::StyleProfile;
using segue::style::StylisticMatrix;

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

static Track makeTrack(const QString& id, const QString& key, double bpm, double energy, double emotion = 0.0) {
    Track t;
    t.id = id;
    t.title = id;
    t.key = key;
    t.bpm = bpm;
    t.energy = energy;
    t.emotionalIntensity = emotion;
    return t;
}

static TransitionPoint point(double t, StructuralElement e, double suitability) {
    TransitionPoint p;
    p.timeSec = t;
    p.confidence = 0.9;
    p.element = e;
    p.energyLevel = 0.6;
    p.beatStrength = 0.8;
    p.mixSuitability = suitability;
    return p;
}

static StructuralAnalysis analysis(const QString& id, double duration) {
    StructuralAnalysis a;
    a.trackId = id;
    a.durationSec = duration;
    a.introEndSec = 16.0;
    a.outroStartSec = duration - 30.0;
    for (int i = 0; i < 8; ++i) a.beatGrid.push_back(0.48 * i);
    a.tempoChanges = {{0.0, 125.0}};
    a.energyCurve = {{0.0, 0.4}, {duration / 2.0, 0.8}, {duration, 0.5}};
    return a;
}

} // namespace

static void testCamelot() {
    const QStringList keys = CamelotKey::parse("8A").compatibleKeys();
    expectEq(keys.size(), 4, "8A has four compatible keys");
    expect(keys.contains("8A"), "8A compatible with itself");
    expect(keys.contains("7A") && keys.contains("9A"), "8A compatible with wheel neighbours");
    expect(keys.contains("8B"), "8A compatible with relative major");

    const QStringList wrap = CamelotKey::parse("12B").compatibleKeys();
    expect(wrap.contains("1B") && wrap.contains("11B") && wrap.contains("12A"), "12B wraps to 1B");

    expect(!CamelotKey::parse("13A").isValid(), "13A is invalid");
    expect(!CamelotKey::parse("8C").isValid(), "8C is invalid");
    expect(CamelotKey::parse(" 8a ").isValid(), "Lower-case and padded key parses");
    expect(CamelotKey::parse("bogus").compatibleKeys().isEmpty(), "Invalid key has no compatible keys");
    expectEq(segue::harmonic::wheelDistance(1, 12), 1, "Wheel distance wraps");
    expectStrEq(CamelotKey::parse("8A").musicalName(), "A minor", "8A is A minor");
    expectStrEq(CamelotKey::parse("8B").musicalName(), "C major", "8B is C major");
    expectStrEq(CamelotKey::parse("1A").musicalName(), "Ab minor", "1A is Ab minor");
    expect(CamelotKey::parse("0A").musicalName().isEmpty(), "Invalid key has no name");
    expectEq(segue::harmonic::wheelDistance(8, 2), 6, "Wheel distance 8->2");
}

static void testHarmonic() {
    const HarmonicScorer scorer(MixMode::Intelligent);

    const Track a = makeTrack("a", "8A", 125.0, 5.0);
    const Track b = makeTrack("b", "8A", 125.0, 5.0);
    expectNear(scorer.compatibility(a, b), 0.9, "Identical tracks without emotion data score 0.9");

    expectNear(scorer.keyScore("8A", "2A"), 0.0, "8A vs 2A key score");
    expectNear(scorer.keyScore("8A", "9A"), 0.8, "Adjacent key score");
    expectNear(scorer.keyScore("8A", "8B"), 0.8, "Relative key scores as compatible");
    expectNear(scorer.keyScore("8A", "10A"), 0.3, "Two steps away");
    expectNear(scorer.keyScore("8A", "xx"), 0.0, "Invalid key scores zero");

    // Tempo score never increases with distance inside the tolerance window.
    double prev = scorer.tempoScore(120.0, 120.0);
    expectNear(prev, 1.0, "Same tempo");
    for (double d = 0.5; d <= 6.0; d += 0.5) {
        const double s = scorer.tempoScore(120.0, 120.0 + d);
        expect(s <= prev + 1e-12, QString("Tempo score monotonic at +%1").arg(d));
        prev = s;
    }
    expectNear(scorer.tempoScore(64.0, 128.0), 0.6, "Half/double time tempo");
    expectNear(scorer.energyScore(5.0, 9.0), 0.3, "Energy gap of 4");

    const Track c = makeTrack("c", "", 0.0, 0.0);
    expectNear(scorer.compatibility(a, c), 0.0, "No shared data scores zero");

    const auto m = scorer.compatibilityMatrix({a, b, c});
    expectEq(m.size(), 3, "Matrix rows");
    for (int i = 0; i < m.size(); ++i) expectNear(m[i][i], 0.0, QString("Matrix diagonal %1").arg(i));
    expectNear(m[0][1], 0.9, "Matrix off-diagonal entry");

    const HarmonicScorer classic(MixMode::Classic);
    expect(classic.weights().key > scorer.weights().key, "Classic mode weights key higher");
}

static void testStylistic() {
    const StylisticMatrix matrix = StylisticMatrix::builtins();

    expectNear(StylisticMatrix::bridgeScore(0.8, 0.6), 2.0 * 0.8 * 0.6 / 1.4, "Bridge harmonic mean", 1e-9);
    expectNear(StylisticMatrix::bridgeScore(0.8, 0.6), 0.6857, "Bridge score approx", 1e-4);
    expectNear(StylisticMatrix::bridgeScore(0.9, 0.9), 1.0, "Bridge bonus is capped");
    expectNear(StylisticMatrix::bridgeScore(0.0, 0.9), 0.0, "Bridge needs both sides");

    expectNear(matrix.lookup(StyleDimension::Mood, "energetic", "uplifting"), 0.9, "Forward lookup");
    expectNear(matrix.lookup(StyleDimension::Mood, "happy", "energetic"), 0.9, "Reverse lookup");
    expectNear(matrix.lookup(StyleDimension::Mood, "energetic", "zzz"), 0.5, "Unknown pair is fair");

    const StyleProfile empty;
    expectNear(matrix.compatibility(empty, empty), 0.5, "Nothing comparable is neutral");

    TrackMetadata mdA;
    mdA.insert("subgenre", "Salsa Dura");
    mdA.insert("mood", "energetic");
    mdA.insert("danceability", 80);
    TrackMetadata mdB;
    mdB.insert("subgenre", "tropical salsa");
    mdB.insert("mood", "Energetic ");
    mdB.insert("danceability", "0.6");
    const StyleProfile pA = StyleProfile::fromMetadata(mdA);
    const StyleProfile pB = StyleProfile::fromMetadata(mdB);
    const auto br = matrix.breakdown(pA, pB);
    expectEq(br.size(), 3, "Breakdown covers shared dimensions only");
    expectNear(br.value(StyleDimension::Subgenre), 0.9, "Subgenre excellent");
    expectNear(br.value(StyleDimension::Mood), 1.0, "Mood normalised before lookup");
    expectNear(br.value(StyleDimension::Danceability), 0.8, "Danceability closeness");
    const double expected = (0.25 * 0.9 + 0.20 * 1.0 + 0.05 * 0.8) / 0.5;
    expectNear(matrix.compatibility(pA, pB), expected, "Renormalised stylistic blend", 1e-9);

    QVector<QPair<Track, TrackMetadata>> pool;
    for (int i = 0; i < 12; ++i) {
        TrackMetadata md;
        md.insert("mood", i % 2 == 0 ? "passionate" : "energetic");
        pool.push_back({makeTrack(QString("p%1").arg(i), "8A", 120.0, 5.0), md});
    }
    TrackMetadata src;
    src.insert("mood", "energetic");
    TrackMetadata dst;
    dst.insert("mood", "romantic");
    const auto bridges = matrix.suggestBridgeTracks(StyleProfile::fromMetadata(src), StyleProfile::fromMetadata(dst), pool);
    expectEq(bridges.size(), StylisticMatrix::kMaxBridgeCandidates, "Bridge list truncated to ten");
    for (int i = 1; i < bridges.size(); ++i) {
        expect(bridges[i - 1].score >= bridges[i].score, "Bridge list sorted descending");
    }
    if (!bridges.isEmpty()) expectStrEq(bridges.first().track.id, "p0", "Passionate bridge wins, first on ties");
}

static void testStructural() {
    const StructuralScorer scorer;
    expectNear(scorer.structuralScore(nullptr, nullptr), 0.5, "No analyses is neutral");
    expectNear(scorer.temporalScore(nullptr, nullptr), 0.5, "No analyses temporal neutral");
    expectNear(StructuralScorer::elementPairScore(StructuralElement::Outro, StructuralElement::Intro), 1.0,
               "Outro into intro");
    expectNear(StructuralScorer::elementPairScore(StructuralElement::Break, StructuralElement::Verse), 0.9,
               "Break into verse");
    expectNear(StructuralScorer::elementPairScore(StructuralElement::Drop, StructuralElement::Drop), 0.5,
               "Unlisted pair");

    StructuralAnalysis a = analysis("a", 300.0);
    a.transitionPoints = {point(30.0, StructuralElement::Verse, 0.4), point(270.0, StructuralElement::Outro, 0.9)};
    StructuralAnalysis b = analysis("b", 280.0);
    b.transitionPoints = {point(12.0, StructuralElement::Intro, 0.95), point(150.0, StructuralElement::Drop, 0.2)};

    segue::structure::MixTransition mt;
    expect(scorer.findOptimalTransition(a, b, mt), "Transition found");
    expect(mt.mixOut.element == StructuralElement::Outro, "Mix out of the outro");
    expect(mt.mixIn.element == StructuralElement::Intro, "Mix into the intro");
    expect(mt.mixDurationSec > 0.0, "Mix duration estimated");

    const StructuralAnalysis none = analysis("c", 200.0);
    expect(!scorer.findOptimalTransition(a, none, mt), "No points on one side");
    expectNear(scorer.transitionQualityScore(&a, &b), (0.9 + 0.95) / 2.0, "Transition quality mean");

    const double s = scorer.structuralScore(&a, &b);
    expect(s >= 0.0 && s <= 1.0, "Structural score in range");

    const StructuralAnalysis back = StructuralAnalysis::fromJson(a.toJson());
    expectEq(back.transitionPoints.size(), 2, "Analysis JSON keeps points");
    expect(back.transitionPoints[1].element == StructuralElement::Outro, "Element survives JSON");
}

static StructuralAnalysis outgoingAnalysis() {
    StructuralAnalysis a;
    a.trackId = "a";
    a.durationSec = 240.0;
    a.beatGrid = {0.0, 0.5, 1.0, 1.5};             // 120 BPM
    a.tempoChanges = {{0.0, 120.0}, {60.0, 122.0}}; // 2 changes over 4 minutes
    a.energyCurve = {{0.0, 0.3}, {215.0, 0.8}, {230.0, 0.6}};
    a.transitionPoints = {point(215.0, StructuralElement::Outro, 0.9), point(100.0, StructuralElement::Verse, 0.5),
                          point(120.0, StructuralElement::Break, 0.7)};
    return a;
}

static StructuralAnalysis incomingAnalysis() {
    StructuralAnalysis b;
    b.trackId = "b";
    b.durationSec = 200.0;
    b.beatGrid = {0.0, 0.48, 0.96}; // 125 BPM
    b.energyCurve = {{0.0, 0.4}, {20.0, 0.6}, {100.0, 0.9}};
    b.transitionPoints = {point(8.0, StructuralElement::Intro, 0.8), point(60.0, StructuralElement::Chorus, 0.6)};
    return b;
}

static void testStructuralFormulas() {
    const StructuralScorer scorer;
    const StructuralAnalysis a = outgoingAnalysis();
    const StructuralAnalysis b = incomingAnalysis();

    const double beat = 1.0 - (5.0 / 6.0) * 0.5;
    expectNear(scorer.durationScore(&a, &b), 200.0 / 240.0, "Duration ratio");
    expectNear(scorer.beatScore(&a, &b), beat, "Beat score from implied tempos 120 vs 125");
    expectNear(scorer.energyContinuityScore(&a, &b), 0.8, "Outro energy 0.7 vs intro energy 0.5");
    expectNear(scorer.structuralScore(&a, &b), 0.3 * (200.0 / 240.0) + 0.4 * beat + 0.3 * 0.8, "Structural blend");

    expectNear(scorer.tempoStability(&a, &b), 0.75, "Tempo stability averaged over both tracks");
    expectNear(scorer.elementMatching(&a, &b), 1.0, "Outro into intro is the best element pair");
    expectNear(scorer.timingFeasibility(&a, &b), 0.9, "25 s left after mix out, mix in at 8 s");
    expectNear(scorer.temporalScore(&a, &b), 0.4 * 0.75 + 0.3 * 1.0 + 0.3 * 0.9, "Temporal blend");

    StructuralAnalysis late = a;
    late.transitionPoints = {point(190.0, StructuralElement::Verse, 0.9)};
    StructuralAnalysis cold = b;
    cold.transitionPoints = {point(0.0, StructuralElement::Intro, 0.9)};
    expectNear(scorer.timingFeasibility(&late, &cold), (1.0 - 20.0 / 30.0) / 2.0, "50 s left and an immediate mix in");
    StructuralAnalysis early = a;
    early.transitionPoints = {point(40.0, StructuralElement::Verse, 0.9)};
    expectNear(scorer.timingFeasibility(&early, &cold), 0.0, "Mixing out far too early is infeasible");

    const TransitionPoint* out = StructuralScorer::bestMixOutPoint(a);
    expect(out && out->element == StructuralElement::Outro, "Best mix out without a target");
    out = StructuralScorer::bestMixOutPoint(a, 100.0);
    expect(out && out->element == StructuralElement::Break, "Closest suitable mix out near the target");
    out = StructuralScorer::bestMixOutPoint(a, 20.0);
    expect(out && out->element == StructuralElement::Outro, "No suitable point near the target");

    const TransitionPoint* in = StructuralScorer::bestMixInPoint(b);
    expect(in && in->element == StructuralElement::Intro, "Best mix in");
    StructuralAnalysis withIntro = b;
    withIntro.introEndSec = 16.0;
    in = StructuralScorer::bestMixInPoint(withIntro);
    expect(in && in->element == StructuralElement::Chorus, "Mix in after the intro ends");
    expect(StructuralScorer::bestMixInPoint(StructuralAnalysis()) == nullptr, "No points, no mix in");
}

static void testOrchestrator() {
    const segue::engine::CompatibilityOrchestrator orch;
    const Track a = makeTrack("a", "8A", 125.0, 5.0);
    const Track b = makeTrack("b", "8A", 125.0, 5.0);

    segue::engine::CompatibilityBreakdown br;
    const double s = orch.scoreEnhanced(a, b, nullptr, nullptr, nullptr, nullptr, &br);
    expectNear(s, 0.25 * 0.9 + 0.25 * 0.5 + 0.2 * 0.5 + 0.2 * 0.5 + 0.1 * 0.5, "Enhanced score with neutrals");
    expectNear(br.policy, -1.0, "No policy folded in");

    TrackMetadata mdA;
    mdA.insert("mood", "energetic");
    mdA.insert("era", "70s");
    TrackMetadata mdB;
    mdB.insert("mood", "chill");
    mdB.insert("era", "2020s");
    const auto e = orch.explain(a, makeTrack("c", "9A", 126.0, 6.0), &mdA, &mdB);
    expectStrEq(e.keyMatch, QString::fromUtf8("8A → 9A"), "Key transition string");
    expectStrEq(e.bpmMatch, QString::fromUtf8("125 → 126 BPM"), "BPM transition string");
    expectStrEq(e.energyMatch, QString::fromUtf8("5 → 6"), "Energy transition string");
    expect(e.hasStylistic, "Stylistic explanation present");
    expectStrEq(e.subgenreMatch, QString::fromUtf8("unknown → unknown"), "Missing subgenre shown as unknown");
    expectEq(e.recommendations.size(), 3, "Bridge, mood and era recommendations");

    const auto dims = orch.stylisticBreakdown(mdA, mdB);
    expectEq(dims.size(), 2, "Breakdown over mood and era");
    expectNear(dims.value(StyleDimension::Mood), 0.3, "Energetic to chill is poor");
    expectNear(e.stylisticBreakdown.value(StyleDimension::Era), dims.value(StyleDimension::Era), "Explanation breakdown");

    TrackMetadata passionate;
    passionate.insert("mood", "passionate");
    TrackMetadata romantic;
    romantic.insert("mood", "romantic");
    const QVector<QPair<Track, TrackMetadata>> pool = {
        {makeTrack("p1", "8A", 120.0, 5.0), mdB},
        {makeTrack("p2", "8A", 120.0, 5.0), passionate},
    };
    const auto bridges = orch.findBridgeTracks(mdA, romantic, pool);
    expectEq(bridges.size(), 2, "Both pool tracks scored as bridges");
    if (!bridges.isEmpty()) expectStrEq(bridges.first().track.id, "p2", "Passionate bridges energetic to romantic");

    const StructuralAnalysis sa = outgoingAnalysis();
    const StructuralAnalysis sb = incomingAnalysis();
    segue::structure::MixTransition mt;
    expect(orch.findOptimalTransition(a, b, sa, sb, mt), "Orchestrated transition found");
    expectStrEq(mt.fromTrackId, "a", "Transition from track");
    expectNear(mt.compatibility, orch.scoreEnhanced(a, b, &sa, &sb), "Transition carries the blended score");
    expect(!orch.findOptimalTransition(a, b, sa, StructuralAnalysis(), mt), "No transition without points");

    const auto plain = orch.explain(a, b);
    expect(plain.recommendations.isEmpty(), "No metadata, no recommendations");
    expect(!plain.toJson().isEmpty(), "Explanation serialises");

    const Track noKey = makeTrack("n", "", 0.0, 0.0);
    expectStrEq(orch.explain(a, noKey).keyMatch, "No key data", "Missing key string");

    const segue::engine::MixingEngine basic;
    expect(!basic.supportsEnhancedScoring(), "Engine without orchestrator");
    expectNear(basic.scoreEnhanced(a, b), basic.score(a, b), "Enhanced falls back to base score");
    const segue::engine::MixingEngine enhanced(&orch);
    expect(enhanced.supportsEnhancedScoring(), "Engine with orchestrator");
    expectNear(enhanced.scoreEnhanced(a, b), s, "Engine delegates to orchestrator");
}

static void testQuickPlaylist() {
    const segue::engine::MixingEngine engine;
    const segue::model::TrackList tracks = {
        makeTrack("t1", "8A", 124.0, 4.0), makeTrack("t2", "9A", 125.0, 5.0),
        makeTrack("t3", "2B", 90.0, 9.0),  makeTrack("t4", "8B", 124.0, 6.0),
    };
    const auto list = engine.quickPlaylist(tracks, "t1", 3, segue::engine::ProgressionCurve::Ascending);
    expectEq(list.size(), 3, "Quick playlist length");
    if (!list.isEmpty()) expectStrEq(list.first().id, "t1", "Quick playlist starts at start id");
    expect(engine.quickPlaylist(tracks, "missing").isEmpty(), "Unknown start id");
}

static void testSettings() {
    QTemporaryDir dir;
    expect(dir.isValid(), "Temporary directory");
    if (!dir.isValid()) return;

    QSettings ini(dir.filePath("segue.ini"), QSettings::IniFormat);
    const segue::config::SegueSettings defaults = segue::config::loadSegueSettings(ini, "segue");
    expect(defaults.mixMode == MixMode::Intelligent, "Default mix mode");
    expectNear(defaults.minCompatibility, 0.3, "Default minimum compatibility");

    segue::config::SegueSettings s = defaults;
    s.mixMode = MixMode::Classic;
    s.tolerances.bpm = 8.0;
    s.sequencerWeights.variety = 0.2;
    s.policyId = "modern_ai";
    segue::config::saveSegueSettings(ini, "segue", s);

    const segue::config::SegueSettings back = segue::config::loadSegueSettings(ini, "segue");
    expect(back.mixMode == MixMode::Classic, "Mix mode saved");
    expectNear(back.tolerances.bpm, 8.0, "BPM tolerance saved");
    expectNear(back.sequencerWeights.variety, 0.2, "Sequencer weight saved");
    expectStrEq(back.policyId, "modern_ai", "Policy id saved");

    ini.setValue("segue/policyBlend", 7.5);
    ini.setValue("segue/defaultLength", -3);
    ini.setValue("segue/mixMode", "wobble");
    const segue::config::SegueSettings clamped = segue::config::loadSegueSettings(ini, "segue");
    expectNear(clamped.policyBlend, 1.0, "Blend clamped");
    expectEq(clamped.defaultLength, 1, "Length clamped");
    expect(clamped.mixMode == MixMode::Intelligent, "Unknown mix mode falls back");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testCamelot();
    testHarmonic();
    testStylistic();
    testStructural();
    testStructuralFormulas();
    testOrchestrator();
    testQuickPlaylist();
    testSettings();

    if (g_failures == 0) {
        qInfo("SegueScoringTests: PASS");
        return 0;
    }

    qWarning("SegueScoringTests: FAIL (%d failures)", g_failures);
    return 1;
}
