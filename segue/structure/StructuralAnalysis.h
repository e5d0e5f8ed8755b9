#pragma once

#include <QJsonObject>
#include <QPair>
#include <QString>
#include <QVector>

namespace segue::structure {

enum class StructuralElement {
    Intro = 0,
    Verse,
    Chorus,
    Bridge,
    Outro,
    Break,
    Buildup,
    Drop,
};

QString elementToString(StructuralElement e);
// Unknown strings map to Verse; ok (if given) reports whether the string was recognised.
StructuralElement elementFromString(const QString& s, bool* ok = nullptr);

struct TransitionPoint {
    double timeSec = 0.0;
    double confidence = 0.0;
    StructuralElement element = StructuralElement::Verse;
    double energyLevel = 0.0;  // 0..1
    double beatStrength = 0.0; // 0..1
    double mixSuitability = 0.0; // 0..1

    QJsonObject toJson() const;
    static TransitionPoint fromJson(const QJsonObject& o);
};

// Output of the (external) audio structure analyser for one track.
// Offsets < 0 mean "not detected".
struct StructuralAnalysis {
    QString trackId;
    double durationSec = 0.0;
    double introEndSec = -1.0;
    double outroStartSec = -1.0;

    QVector<double> beatGrid;                  // seconds, ascending
    QVector<QPair<double, double>> tempoChanges; // (time, bpm)
    QVector<QPair<double, double>> energyCurve;  // (time, energy 0..1)
    QVector<TransitionPoint> transitionPoints;   // ranked by the analyser

    bool hasIntroEnd() const { return introEndSec >= 0.0; }
    bool hasOutroStart() const { return outroStartSec >= 0.0; }

    // Highest mixSuitability; nullptr when there are no points.
    const TransitionPoint* bestPoint() const;

    QJsonObject toJson() const;
    static StructuralAnalysis fromJson(const QJsonObject& o);
};

} // namespace segue::structure
