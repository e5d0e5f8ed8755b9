#include "segue/sequence/ContextualCurve.h"

#include "segue/util/StableRng.h"
#include "segue/util/ValueNormalize.h"

#include <QDebug>
#include <QHash>
#include <QJsonArray>

#include <cmath>

namespace segue::sequence {
namespace {

static constexpr double kPi = 3.14159265358979323846;

static ContextualCurve makeCurve(const char* name,
                                 ContextType type,
                                 const char* value,
                                 CurveShape shape,
                                 double eStart,
                                 double eEnd,
                                 int minutes,
                                 const QStringList& moods = {},
                                 const QStringList& activities = {}) {
    ContextualCurve c;
    c.name = QString::fromUtf8(name);
    c.type = type;
    c.contextValue = QString::fromUtf8(value);
    c.shape = shape;
    c.energyRange = qMakePair(eStart, eEnd);
    c.durationMinutes = minutes;
    c.moodPreference = moods;
    c.activityPreference = activities;
    return c;
}

static bool containsLabel(const QStringList& list, const QString& label) {
    for (const auto& s : list) {
        if (s.compare(label, Qt::CaseInsensitive) == 0) return true;
    }
    return false;
}

} // namespace

QString curveShapeToString(CurveShape s) {
    switch (s) {
        case CurveShape::Flat: return "flat";
        case CurveShape::Ascending: return "ascending";
        case CurveShape::Descending: return "descending";
        case CurveShape::Peak: return "peak";
        case CurveShape::Valley: return "valley";
        case CurveShape::Wave: return "wave";
        case CurveShape::BuildDrop: return "build_drop";
    }
    return "flat";
}

QString contextTypeToString(ContextType t) {
    switch (t) {
        case ContextType::Time: return "time";
        case ContextType::Activity: return "activity";
        case ContextType::Energy: return "energy";
        case ContextType::Mood: return "mood";
        case ContextType::Season: return "season";
    }
    return "time";
}

QJsonObject ContextualCurve::toJson() const {
    QJsonObject o;
    o.insert("name", name);
    o.insert("type", contextTypeToString(type));
    o.insert("context_value", contextValue);
    o.insert("shape", curveShapeToString(shape));
    o.insert("energy_range", QJsonArray{energyRange.first, energyRange.second});
    o.insert("duration", durationMinutes);
    o.insert("peak_position", peakPosition);
    o.insert("transition_smoothness", transitionSmoothness);
    return o;
}

CurveLibrary CurveLibrary::builtins() {
    CurveLibrary lib;
    using T = ContextType;
    using S = CurveShape;

    // --- Time of day ---
    {
        auto c = makeCurve("Morning Warm-up", T::Time, "morning", S::Ascending, 0.3, 0.7, 45,
                           {"uplifting", "energetic", "positive"});
        c.peakPosition = 0.8;
        lib.add("morning", c);
    }
    lib.add("afternoon", makeCurve("Afternoon Energy", T::Time, "afternoon", S::Flat, 0.6, 0.8, 60,
                                   {"energetic", "uplifting", "happy"}));
    {
        auto c = makeCurve("Evening Prime Time", T::Time, "evening", S::BuildDrop, 0.7, 0.95, 90,
                           {"energetic", "passionate", "festive"});
        c.peakPosition = 0.6;
        lib.add("evening", c);
    }
    {
        auto c = makeCurve("Night Peak Experience", T::Time, "night", S::Peak, 0.8, 1.0, 120,
                           {"energetic", "passionate", "intense"});
        c.peakPosition = 0.5;
        lib.add("night", c);
    }
    lib.add("late_night", makeCurve("Late Night Wind Down", T::Time, "late_night", S::Descending, 0.6, 0.3, 60,
                                    {"romantic", "passionate", "chill"}));

    // --- Activity ---
    lib.add("party", makeCurve("Party Energy", T::Activity, "party", S::Wave, 0.7, 0.95, 90,
                               {"energetic", "festive", "uplifting"}, {"party", "dance", "celebration"}));
    lib.add("workout", makeCurve("Workout Motivation", T::Activity, "workout", S::Flat, 0.8, 0.95, 45,
                                 {"energetic", "motivational", "intense"}, {"workout", "fitness", "energy"}));
    lib.add("chill", makeCurve("Chill Vibes", T::Activity, "chill", S::Flat, 0.3, 0.6, 60,
                               {"chill", "relaxed", "smooth"}, {"chill", "relax", "background"}));
    lib.add("social_dancing", makeCurve("Social Dance Flow", T::Activity, "social_dancing", S::Wave, 0.6, 0.85, 120,
                                        {"passionate", "romantic", "energetic"},
                                        {"social dancing", "dance", "party"}));
    lib.add("focus", makeCurve("Focus Background", T::Activity, "focus", S::Flat, 0.2, 0.4, 90,
                               {"calm", "focused", "instrumental"}, {"focus", "work", "background"}));

    // --- Energy ---
    lib.add("warm_up", makeCurve("Warm Up", T::Energy, "warm_up", S::Ascending, 0.3, 0.7, 30));
    lib.add("peak_time", makeCurve("Peak Time", T::Energy, "peak_time", S::Flat, 0.8, 0.95, 60));
    lib.add("cool_down", makeCurve("Cool Down", T::Energy, "cool_down", S::Descending, 0.7, 0.3, 30));

    // --- Mood (keyed by the mood they serve) ---
    lib.add("romantic", makeCurve("Romantic Journey", T::Mood, "romantic", S::Wave, 0.4, 0.8, 75,
                                  {"romantic", "passionate", "sensual"}));
    lib.add("energetic", makeCurve("Energy Blast", T::Mood, "energetic", S::Ascending, 0.6, 1.0, 45,
                                   {"energetic", "intense", "powerful"}));

    // --- Season ---
    lib.add("summer", makeCurve("Summer Vibes", T::Season, "summer", S::Wave, 0.6, 0.9, 90,
                                {"uplifting", "festive", "energetic"}));
    lib.add("winter", makeCurve("Winter Warmth", T::Season, "winter", S::Ascending, 0.4, 0.8, 75,
                                {"warm", "cozy", "romantic"}));
    return lib;
}

const ContextualCurve* CurveLibrary::curve(ContextType type, const QString& key) const {
    auto byType = m_curves.constFind(type);
    if (byType == m_curves.constEnd()) return nullptr;
    auto it = byType->constFind(key.trimmed().toLower());
    return it == byType->constEnd() ? nullptr : &(*it);
}

QStringList CurveLibrary::available(ContextType type) const {
    return m_curves.value(type).keys();
}

ContextualCurve CurveLibrary::fallbackCurve() const {
    if (const ContextualCurve* evening = curve(ContextType::Time, "evening")) return *evening;
    for (auto byType = m_curves.constBegin(); byType != m_curves.constEnd(); ++byType) {
        if (!byType->isEmpty()) return byType->first();
    }
    qWarning() << "CurveLibrary: no curves registered, using a flat default";
    ContextualCurve flat;
    flat.name = "Default";
    return flat;
}

ContextualCurve CurveLibrary::selectCurve(const CurveQuery& q) const {
    QVector<const ContextualCurve*> candidates;
    const QVector<QPair<ContextType, QString>> lookups = {
        {ContextType::Time, q.timeOfDay},  {ContextType::Activity, q.activity}, {ContextType::Energy, q.energy},
        {ContextType::Mood, q.mood},       {ContextType::Season, q.season},
    };
    for (const auto& p : lookups) {
        if (p.second.trimmed().isEmpty()) continue;
        if (const ContextualCurve* c = curve(p.first, p.second)) candidates.push_back(c);
    }

    ContextualCurve chosen;
    if (candidates.isEmpty()) {
        chosen = fallbackCurve();
    } else {
        chosen = *candidates.first();
        for (const ContextualCurve* c : candidates) {
            if (c->type == ContextType::Activity) {
                chosen = *c;
                break;
            }
        }
    }
    if (q.durationMinutes > 0) chosen.durationMinutes = q.durationMinutes;
    return chosen;
}

QVector<double> CurveLibrary::energyProgression(const ContextualCurve& curve, int n) const {
    QVector<double> out;
    const double lo = curve.minEnergy();
    const double hi = curve.maxEnergy();
    const double range = hi - lo;

    if (n <= 0) return out;
    if (n == 1) {
        out.push_back((curve.energyRange.first + curve.energyRange.second) / 2.0);
        return out;
    }

    util::StableRng rng(util::StableRng::seedFromString(
        QString("curve|%1|%2").arg(curve.name).arg(n).toUtf8()));

    out.reserve(n);
    for (int i = 0; i < n; ++i) {
        const double pos = double(i) / double(n - 1);
        double e = lo;
        switch (curve.shape) {
            case CurveShape::Flat:
                e = (lo + hi) / 2.0 + rng.uniform(-0.05, 0.05);
                break;
            case CurveShape::Ascending:
                e = lo + range * pos;
                break;
            case CurveShape::Descending:
                e = hi - range * pos;
                break;
            case CurveShape::Peak: {
                const double peak = qBound(0.01, curve.peakPosition, 0.99);
                e = (pos <= peak) ? lo + range * (pos / peak)
                                  : hi - range * ((pos - peak) / (1.0 - peak)) * 0.5;
                break;
            }
            case CurveShape::Valley: {
                const double valley = 0.4;
                e = (pos <= valley) ? hi - range * (pos / valley) * 0.6
                                    : lo + range * ((pos - valley) / (1.0 - valley));
                break;
            }
            case CurveShape::Wave:
                e = lo + range * (std::sin(pos * kPi * 2.5) * 0.3 + 0.5);
                break;
            case CurveShape::BuildDrop: {
                const double build = 0.7;
                if (pos <= build) {
                    e = lo + range * (pos / build);
                } else {
                    e = (pos <= build + 0.1) ? hi * 0.6 : hi * 0.7;
                }
                break;
            }
        }
        out.push_back(qBound(lo, e, hi));
    }

    if (curve.transitionSmoothness > 0.5 && out.size() > 2) {
        const double k = curve.transitionSmoothness;
        const QVector<double> raw = out;
        for (int i = 1; i < raw.size() - 1; ++i) {
            out[i] = raw[i] * (1.0 - k) + (raw[i - 1] + raw[i + 1]) / 2.0 * k;
        }
    }
    return out;
}

bool CurveLibrary::isCompatibleTime(const QString& trackTime, const QString& curveTime) {
    static const QHash<QString, QStringList> kCompat = {
        {"morning", {"afternoon"}},
        {"afternoon", {"morning", "evening"}},
        {"evening", {"afternoon", "night"}},
        {"night", {"evening", "late_night"}},
        {"late_night", {"night"}},
    };
    return kCompat.value(curveTime).contains(trackTime);
}

bool CurveLibrary::isCompatibleActivity(const QString& trackActivity, const QStringList& curveActivities) {
    static const QHash<QString, QStringList> kCompat = {
        {"party", {"dance", "celebration", "social dancing"}},
        {"workout", {"fitness", "energy", "motivation"}},
        {"chill", {"relax", "background", "lounge"}},
        {"dance", {"party", "social dancing", "celebration"}},
        {"focus", {"work", "study", "background"}},
    };
    for (const auto& a : curveActivities) {
        if (kCompat.value(a.toLower()).contains(trackActivity)) return true;
    }
    return false;
}

bool CurveLibrary::isCompatibleMood(const QString& trackMood, const QStringList& curveMoods) {
    static const QHash<QString, QStringList> kCompat = {
        {"energetic", {"uplifting", "festive", "powerful"}},
        {"romantic", {"passionate", "sensual", "emotional"}},
        {"uplifting", {"happy", "positive", "energetic"}},
        {"chill", {"relaxed", "calm", "smooth"}},
        {"passionate", {"romantic", "intense", "emotional"}},
    };
    for (const auto& m : curveMoods) {
        if (kCompat.value(m.toLower()).contains(trackMood)) return true;
    }
    return false;
}

double CurveLibrary::trackContextScore(const model::TrackMetadata& metadata,
                                       const ContextualCurve& curve,
                                       double targetEnergy,
                                       double position) const {
    Q_UNUSED(position);
    double score = 0.0;
    double weight = 0.0;

    // Time of day only counts against time curves.
    const QString time = util::normalizeLabel(metadata.value("time_of_day"));
    if (!time.isEmpty() && curve.type == ContextType::Time) {
        double s = 0.2;
        if (time == curve.contextValue) {
            s = 1.0;
        } else if (isCompatibleTime(time, curve.contextValue)) {
            s = 0.7;
        }
        score += m_weights.time * s;
        weight += m_weights.time;
    }

    const QString activity = util::normalizeLabel(metadata.value("activity"));
    if (!activity.isEmpty() && !curve.activityPreference.isEmpty()) {
        double s = 0.1;
        if (containsLabel(curve.activityPreference, activity)) {
            s = 1.0;
        } else if (isCompatibleActivity(activity, curve.activityPreference)) {
            s = 0.6;
        }
        score += m_weights.activity * s;
        weight += m_weights.activity;
    }

    double dance = 0.0;
    if (util::normalizePercent(metadata.value("danceability"), dance)) {
        score += m_weights.energy * qMax(0.0, 1.0 - qAbs(dance - targetEnergy));
        weight += m_weights.energy;
    }

    const QString mood = util::normalizeLabel(metadata.value("mood"));
    if (!mood.isEmpty() && !curve.moodPreference.isEmpty()) {
        double s = 0.3;
        if (containsLabel(curve.moodPreference, mood)) {
            s = 1.0;
        } else if (isCompatibleMood(mood, curve.moodPreference)) {
            s = 0.6;
        }
        score += m_weights.mood * s;
        weight += m_weights.mood;
    }

    double crowd = 0.0;
    if (util::normalizePercent(metadata.value("crowd_appeal"), crowd)) {
        score += m_weights.crowd * crowd;
        weight += m_weights.crowd;
    }

    return weight > 0.0 ? qBound(0.0, score / weight, 1.0) : 0.5;
}

} // namespace segue::sequence
