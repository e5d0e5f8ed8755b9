#include "segue/style/StylisticMatrix.h"

#include <QtGlobal>

#include <algorithm>

namespace segue::style {
namespace {

using L = CompatibilityLevel;
using Row = QVector<QPair<const char*, CompatibilityLevel>>;

static void addRow(StylisticMatrix::Table& t, const char* from, const Row& row) {
    auto& dst = t[QString::fromUtf8(from)];
    for (const auto& e : row) dst.insert(QString::fromUtf8(e.first), e.second);
}

static const QString& labelFor(const StyleProfile& p, StyleDimension d) {
    switch (d) {
        case StyleDimension::Subgenre: return p.subgenre;
        case StyleDimension::Mood: return p.mood;
        case StyleDimension::Era: return p.era;
        case StyleDimension::Language: return p.language;
        case StyleDimension::Activity: return p.activity;
        case StyleDimension::TimeOfDay: return p.timeOfDay;
        case StyleDimension::Season: return p.season;
        case StyleDimension::Danceability: break;
    }
    static const QString kEmpty;
    return kEmpty;
}

static constexpr StyleDimension kCategorical[] = {
    StyleDimension::Subgenre, StyleDimension::Mood,     StyleDimension::Era,
    StyleDimension::Language, StyleDimension::Activity, StyleDimension::TimeOfDay,
    StyleDimension::Season,
};

} // namespace

double levelValue(CompatibilityLevel l) {
    switch (l) {
        case CompatibilityLevel::Perfect: return 1.0;
        case CompatibilityLevel::Excellent: return 0.9;
        case CompatibilityLevel::Good: return 0.7;
        case CompatibilityLevel::Fair: return 0.5;
        case CompatibilityLevel::Poor: return 0.3;
        case CompatibilityLevel::Incompatible: return 0.1;
    }
    return 0.5;
}

QString dimensionName(StyleDimension d) {
    switch (d) {
        case StyleDimension::Subgenre: return "subgenre";
        case StyleDimension::Mood: return "mood";
        case StyleDimension::Era: return "era";
        case StyleDimension::Language: return "language";
        case StyleDimension::Activity: return "activity";
        case StyleDimension::TimeOfDay: return "time_of_day";
        case StyleDimension::Season: return "season";
        case StyleDimension::Danceability: return "danceability";
    }
    return QString();
}

double StyleWeights::weightFor(StyleDimension d) const {
    switch (d) {
        case StyleDimension::Subgenre: return subgenre;
        case StyleDimension::Mood: return mood;
        case StyleDimension::Era: return era;
        case StyleDimension::Language: return language;
        case StyleDimension::Activity: return activity;
        case StyleDimension::TimeOfDay: return timeOfDay;
        case StyleDimension::Season: return season;
        case StyleDimension::Danceability: return danceability;
    }
    return 0.0;
}

StylisticMatrix StylisticMatrix::builtins() {
    StylisticMatrix m;

    // --- Subgenre: salsa family, other latin, latin jazz ---
    auto& sg = m.m_subgenre;
    addRow(sg, "salsa romantica", {{"salsa romantica", L::Perfect}, {"romantic salsa", L::Perfect},
                                   {"salsa dura", L::Good}, {"tropical salsa", L::Good},
                                   {"classic salsa", L::Excellent}, {"latin ballad", L::Fair},
                                   {"bachata", L::Fair}});
    addRow(sg, "salsa dura", {{"salsa dura", L::Perfect}, {"salsa romantica", L::Good},
                              {"tropical salsa", L::Excellent}, {"classic salsa", L::Excellent},
                              {"afro-cuban jazz", L::Good}, {"merengue", L::Fair}});
    addRow(sg, "tropical salsa", {{"tropical salsa", L::Perfect}, {"salsa dura", L::Excellent},
                                  {"salsa romantica", L::Good}, {"merengue", L::Good},
                                  {"cumbia", L::Fair}});
    addRow(sg, "classic salsa", {{"classic salsa", L::Perfect}, {"salsa dura", L::Excellent},
                                 {"salsa romantica", L::Excellent}, {"afro-cuban jazz", L::Good},
                                 {"son cubano", L::Good}});
    addRow(sg, "bachata", {{"bachata", L::Perfect}, {"salsa romantica", L::Fair},
                           {"latin ballad", L::Good}, {"reggaeton", L::Fair}});
    addRow(sg, "merengue", {{"merengue", L::Perfect}, {"tropical salsa", L::Good},
                            {"cumbia", L::Good}, {"reggaeton", L::Fair}});
    addRow(sg, "afro-cuban jazz", {{"afro-cuban jazz", L::Perfect}, {"classic salsa", L::Good},
                                   {"salsa dura", L::Good}, {"latin jazz", L::Excellent},
                                   {"smooth jazz", L::Fair}});

    // --- Mood ---
    auto& mo = m.m_mood;
    addRow(mo, "energetic", {{"energetic", L::Perfect}, {"uplifting", L::Excellent},
                             {"happy", L::Excellent}, {"passionate", L::Good},
                             {"festive", L::Excellent}, {"romantic", L::Fair},
                             {"melancholic", L::Poor}, {"chill", L::Poor}});
    addRow(mo, "passionate", {{"passionate", L::Perfect}, {"romantic", L::Excellent},
                              {"energetic", L::Good}, {"sensual", L::Excellent},
                              {"emotional", L::Good}, {"uplifting", L::Fair}, {"chill", L::Fair}});
    addRow(mo, "romantic", {{"romantic", L::Perfect}, {"passionate", L::Excellent},
                            {"sensual", L::Excellent}, {"emotional", L::Good},
                            {"nostalgic", L::Good}, {"energetic", L::Fair}, {"uplifting", L::Fair}});
    addRow(mo, "uplifting", {{"uplifting", L::Perfect}, {"happy", L::Excellent},
                             {"energetic", L::Excellent}, {"festive", L::Excellent},
                             {"positive", L::Excellent}, {"passionate", L::Fair},
                             {"melancholic", L::Poor}});
    addRow(mo, "chill", {{"chill", L::Perfect}, {"relaxed", L::Excellent}, {"smooth", L::Excellent},
                         {"romantic", L::Fair}, {"nostalgic", L::Good}, {"energetic", L::Poor}});

    // --- Era ---
    auto& er = m.m_era;
    addRow(er, "70s", {{"70s", L::Perfect}, {"80s", L::Excellent}, {"classic", L::Excellent},
                       {"vintage", L::Good}, {"90s", L::Good}, {"2000s", L::Fair},
                       {"2010s", L::Poor}, {"2020s", L::Poor}});
    addRow(er, "80s", {{"80s", L::Perfect}, {"70s", L::Excellent}, {"90s", L::Excellent},
                       {"classic", L::Excellent}, {"2000s", L::Good}, {"2010s", L::Fair},
                       {"2020s", L::Fair}});
    addRow(er, "90s", {{"90s", L::Perfect}, {"80s", L::Excellent}, {"2000s", L::Excellent},
                       {"classic", L::Good}, {"2010s", L::Good}, {"70s", L::Good},
                       {"2020s", L::Fair}});
    addRow(er, "2000s", {{"2000s", L::Perfect}, {"90s", L::Excellent}, {"2010s", L::Excellent},
                         {"80s", L::Good}, {"2020s", L::Good}, {"classic", L::Fair}});
    addRow(er, "2010s", {{"2010s", L::Perfect}, {"2000s", L::Excellent}, {"2020s", L::Excellent},
                         {"90s", L::Good}, {"modern", L::Good}, {"80s", L::Fair}});
    addRow(er, "2020s", {{"2020s", L::Perfect}, {"2010s", L::Excellent}, {"modern", L::Excellent},
                         {"2000s", L::Good}, {"contemporary", L::Excellent}, {"90s", L::Fair}});
    addRow(er, "classic", {{"classic", L::Perfect}, {"70s", L::Excellent}, {"80s", L::Excellent},
                           {"vintage", L::Excellent}, {"90s", L::Good}, {"traditional", L::Excellent}});

    // --- Language ---
    auto& la = m.m_language;
    addRow(la, "spanish", {{"spanish", L::Perfect}, {"instrumental", L::Good},
                           {"portuguese", L::Fair}, {"english", L::Fair}});
    addRow(la, "english", {{"english", L::Perfect}, {"instrumental", L::Good}, {"spanish", L::Fair}});
    addRow(la, "instrumental", {{"instrumental", L::Perfect}, {"spanish", L::Good},
                                {"english", L::Good}, {"portuguese", L::Good}});
    addRow(la, "portuguese", {{"portuguese", L::Perfect}, {"spanish", L::Fair},
                              {"instrumental", L::Good}});

    // --- Activity ---
    auto& ac = m.m_activity;
    addRow(ac, "party", {{"party", L::Perfect}, {"dance", L::Excellent}, {"celebration", L::Excellent},
                         {"social dancing", L::Excellent}, {"club", L::Good}, {"workout", L::Fair},
                         {"chill", L::Poor}});
    addRow(ac, "workout", {{"workout", L::Perfect}, {"fitness", L::Excellent}, {"energy", L::Excellent},
                           {"party", L::Fair}, {"dance", L::Fair}, {"chill", L::Poor}});
    addRow(ac, "chill", {{"chill", L::Perfect}, {"relax", L::Excellent}, {"background", L::Excellent},
                         {"lounge", L::Excellent}, {"focus", L::Good}, {"party", L::Poor},
                         {"workout", L::Poor}});
    addRow(ac, "social dancing", {{"social dancing", L::Perfect}, {"dance", L::Excellent},
                                  {"party", L::Excellent}, {"celebration", L::Good}, {"club", L::Good}});

    // --- Time of day ---
    auto& td = m.m_timeOfDay;
    addRow(td, "morning", {{"morning", L::Perfect}, {"afternoon", L::Good}, {"evening", L::Fair},
                           {"night", L::Poor}});
    addRow(td, "afternoon", {{"afternoon", L::Perfect}, {"morning", L::Good},
                             {"evening", L::Excellent}, {"night", L::Fair}});
    addRow(td, "evening", {{"evening", L::Perfect}, {"afternoon", L::Excellent},
                           {"night", L::Excellent}, {"morning", L::Fair}});
    addRow(td, "night", {{"night", L::Perfect}, {"evening", L::Excellent}, {"late night", L::Excellent},
                         {"afternoon", L::Fair}, {"morning", L::Poor}});

    // --- Season ---
    auto& se = m.m_season;
    addRow(se, "summer", {{"summer", L::Perfect}, {"spring", L::Good}, {"fall", L::Fair}, {"winter", L::Poor}});
    addRow(se, "winter", {{"winter", L::Perfect}, {"fall", L::Good}, {"spring", L::Fair}, {"summer", L::Poor}});
    addRow(se, "spring", {{"spring", L::Perfect}, {"summer", L::Good}, {"fall", L::Good}, {"winter", L::Fair}});
    addRow(se, "fall", {{"fall", L::Perfect}, {"winter", L::Good}, {"spring", L::Good}, {"summer", L::Fair}});

    return m;
}

const StylisticMatrix::Table* StylisticMatrix::tableFor(StyleDimension d) const {
    switch (d) {
        case StyleDimension::Subgenre: return &m_subgenre;
        case StyleDimension::Mood: return &m_mood;
        case StyleDimension::Era: return &m_era;
        case StyleDimension::Language: return &m_language;
        case StyleDimension::Activity: return &m_activity;
        case StyleDimension::TimeOfDay: return &m_timeOfDay;
        case StyleDimension::Season: return &m_season;
        case StyleDimension::Danceability: return nullptr;
    }
    return nullptr;
}

double StylisticMatrix::lookup(StyleDimension d, const QString& a, const QString& b) const {
    const Table* t = tableFor(d);
    if (!t) return levelValue(CompatibilityLevel::Fair);

    auto row = t->constFind(a);
    if (row != t->constEnd()) {
        auto cell = row->constFind(b);
        if (cell != row->constEnd()) return levelValue(*cell);
    }
    // Tables are not symmetric; try the reverse direction before defaulting.
    row = t->constFind(b);
    if (row != t->constEnd()) {
        auto cell = row->constFind(a);
        if (cell != row->constEnd()) return levelValue(*cell);
    }
    return levelValue(CompatibilityLevel::Fair);
}

QMap<StyleDimension, double> StylisticMatrix::breakdown(const StyleProfile& p1,
                                                        const StyleProfile& p2) const {
    QMap<StyleDimension, double> out;
    for (StyleDimension d : kCategorical) {
        const QString& a = labelFor(p1, d);
        const QString& b = labelFor(p2, d);
        if (a.isEmpty() || b.isEmpty()) continue;
        out.insert(d, lookup(d, a, b));
    }
    if (p1.hasDanceability() && p2.hasDanceability()) {
        out.insert(StyleDimension::Danceability,
                   qMax(0.0, 1.0 - qAbs(p1.danceability - p2.danceability)));
    }
    return out;
}

double StylisticMatrix::compatibility(const StyleProfile& p1, const StyleProfile& p2) const {
    double total = 0.0;
    double weightSum = 0.0;
    const auto scores = breakdown(p1, p2);
    for (auto it = scores.constBegin(); it != scores.constEnd(); ++it) {
        const double w = m_weights.weightFor(it.key());
        total += w * it.value();
        weightSum += w;
    }
    if (weightSum <= 0.0) return 0.5;
    return qBound(0.0, total / weightSum, 1.0);
}

double StylisticMatrix::bridgeScore(double toBridge, double fromBridge) {
    if (toBridge <= 0.0 || fromBridge <= 0.0) return 0.0;
    double s = 2.0 * toBridge * fromBridge / (toBridge + fromBridge);
    if (toBridge > 0.7 && fromBridge > 0.7) s *= 1.2;
    return qMin(s, 1.0);
}

QVector<BridgeCandidate> StylisticMatrix::suggestBridgeTracks(
    const StyleProfile& source,
    const StyleProfile& target,
    const QVector<QPair<model::Track, model::TrackMetadata>>& pool) const {
    QVector<BridgeCandidate> out;
    out.reserve(pool.size());
    for (const auto& entry : pool) {
        const StyleProfile bridge = StyleProfile::fromMetadata(entry.second);
        const double to = compatibility(source, bridge);
        const double from = compatibility(bridge, target);
        if (to <= 0.0 || from <= 0.0) continue;
        BridgeCandidate c;
        c.track = entry.first;
        c.toScore = to;
        c.fromScore = from;
        c.score = bridgeScore(to, from);
        out.push_back(c);
    }
    std::stable_sort(out.begin(), out.end(), [](const BridgeCandidate& a, const BridgeCandidate& b) {
        return a.score > b.score;
    });
    if (out.size() > kMaxBridgeCandidates) out.resize(kMaxBridgeCandidates);
    return out;
}

} // namespace segue::style
