#pragma once

#include <QJsonObject>
#include <QMap>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include "segue/model/TrackMetadata.h"

namespace segue::sequence {

enum class CurveShape {
    Flat = 0,
    Ascending,
    Descending,
    Peak,
    Valley,
    Wave,
    BuildDrop,
};

enum class ContextType {
    Time = 0,
    Activity,
    Energy,
    Mood,
    Season,
};

QString curveShapeToString(CurveShape s);
QString contextTypeToString(ContextType t);

// Target energy shape for a listening context. Energies are 0..1.
struct ContextualCurve {
    QString name;
    ContextType type = ContextType::Time;
    QString contextValue;
    CurveShape shape = CurveShape::Flat;
    QPair<double, double> energyRange{0.5, 0.5}; // start, end (descending curves list high first)
    int durationMinutes = 60;
    double peakPosition = 0.7;
    double transitionSmoothness = 0.8;
    QStringList moodPreference;
    QStringList activityPreference;

    double minEnergy() const { return qMin(energyRange.first, energyRange.second); }
    double maxEnergy() const { return qMax(energyRange.first, energyRange.second); }

    QJsonObject toJson() const;
};

// Context hints used to pick a curve. Empty strings are ignored.
struct CurveQuery {
    QString timeOfDay;
    QString activity;
    QString energy; // warm_up | peak_time | cool_down
    QString mood;
    QString season;
    int durationMinutes = 0; // > 0 overrides the curve's duration
};

struct ContextWeights {
    double time = 0.30;
    double activity = 0.25;
    double energy = 0.20;
    double mood = 0.15;
    double crowd = 0.10;
};

class CurveLibrary {
public:
    static CurveLibrary builtins();

    void add(const QString& key, const ContextualCurve& c) { m_curves[c.type].insert(key, c); }
    const ContextualCurve* curve(ContextType type, const QString& key) const;
    QStringList available(ContextType type) const;

    // Activity curves win over the others; "evening" when nothing matches.
    ContextualCurve selectCurve(const CurveQuery& q) const;

    // "evening", else the first registered curve, else a flat 0.5 curve.
    ContextualCurve fallbackCurve() const;

    // n target energies (0..1). Flat-curve variation is seeded from the curve name, so
    // identical inputs give identical output.
    QVector<double> energyProgression(const ContextualCurve& curve, int n) const;

    // How well a track's metadata fits the curve at a position. 0.5 when nothing is comparable.
    double trackContextScore(const model::TrackMetadata& metadata,
                             const ContextualCurve& curve,
                             double targetEnergy,
                             double position) const;

    void setWeights(const ContextWeights& w) { m_weights = w; }
    const ContextWeights& weights() const { return m_weights; }

private:
    static bool isCompatibleTime(const QString& trackTime, const QString& curveTime);
    static bool isCompatibleActivity(const QString& trackActivity, const QStringList& curveActivities);
    static bool isCompatibleMood(const QString& trackMood, const QStringList& curveMoods);

    QMap<ContextType, QMap<QString, ContextualCurve>> m_curves;
    ContextWeights m_weights;
};

} // namespace segue::sequence
