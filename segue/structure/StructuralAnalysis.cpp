#include "segue/structure/StructuralAnalysis.h"

#include <QJsonArray>

namespace segue::structure {
namespace {

static QJsonArray pairsToJson(const QVector<QPair<double, double>>& v) {
    QJsonArray arr;
    for (const auto& p : v) arr.push_back(QJsonArray{p.first, p.second});
    return arr;
}

static QVector<QPair<double, double>> pairsFromJson(const QJsonArray& arr) {
    QVector<QPair<double, double>> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        const QJsonArray p = v.toArray();
        if (p.size() < 2) continue;
        out.push_back(qMakePair(p.at(0).toDouble(), p.at(1).toDouble()));
    }
    return out;
}

} // namespace

QString elementToString(StructuralElement e) {
    switch (e) {
        case StructuralElement::Intro: return "intro";
        case StructuralElement::Verse: return "verse";
        case StructuralElement::Chorus: return "chorus";
        case StructuralElement::Bridge: return "bridge";
        case StructuralElement::Outro: return "outro";
        case StructuralElement::Break: return "break";
        case StructuralElement::Buildup: return "buildup";
        case StructuralElement::Drop: return "drop";
    }
    return "verse";
}

StructuralElement elementFromString(const QString& s, bool* ok) {
    const QString k = s.trimmed().toLower();
    if (ok) *ok = true;
    if (k == "intro") return StructuralElement::Intro;
    if (k == "verse") return StructuralElement::Verse;
    if (k == "chorus") return StructuralElement::Chorus;
    if (k == "bridge") return StructuralElement::Bridge;
    if (k == "outro") return StructuralElement::Outro;
    if (k == "break") return StructuralElement::Break;
    if (k == "buildup") return StructuralElement::Buildup;
    if (k == "drop") return StructuralElement::Drop;
    if (ok) *ok = false;
    return StructuralElement::Verse;
}

QJsonObject TransitionPoint::toJson() const {
    QJsonObject o;
    o.insert("time", timeSec);
    o.insert("confidence", confidence);
    o.insert("element", elementToString(element));
    o.insert("energy_level", energyLevel);
    o.insert("beat_strength", beatStrength);
    o.insert("mix_suitability", mixSuitability);
    return o;
}

TransitionPoint TransitionPoint::fromJson(const QJsonObject& o) {
    TransitionPoint p;
    p.timeSec = o.value("time").toDouble(p.timeSec);
    p.confidence = o.value("confidence").toDouble(p.confidence);
    p.element = elementFromString(o.value("element").toString());
    p.energyLevel = o.value("energy_level").toDouble(p.energyLevel);
    p.beatStrength = o.value("beat_strength").toDouble(p.beatStrength);
    p.mixSuitability = o.value("mix_suitability").toDouble(p.mixSuitability);
    return p;
}

const TransitionPoint* StructuralAnalysis::bestPoint() const {
    const TransitionPoint* best = nullptr;
    for (const auto& p : transitionPoints) {
        if (!best || p.mixSuitability > best->mixSuitability) best = &p;
    }
    return best;
}

QJsonObject StructuralAnalysis::toJson() const {
    QJsonObject o;
    o.insert("track_id", trackId);
    o.insert("duration", durationSec);
    if (hasIntroEnd()) o.insert("intro_end", introEndSec);
    if (hasOutroStart()) o.insert("outro_start", outroStartSec);

    QJsonArray beats;
    for (double b : beatGrid) beats.push_back(b);
    o.insert("beat_grid", beats);
    o.insert("tempo_changes", pairsToJson(tempoChanges));
    o.insert("energy_curve", pairsToJson(energyCurve));

    QJsonArray points;
    for (const auto& p : transitionPoints) points.push_back(p.toJson());
    o.insert("transition_points", points);
    return o;
}

StructuralAnalysis StructuralAnalysis::fromJson(const QJsonObject& o) {
    StructuralAnalysis a;
    a.trackId = o.value("track_id").toString();
    a.durationSec = o.value("duration").toDouble(0.0);
    a.introEndSec = o.value("intro_end").toDouble(-1.0);
    a.outroStartSec = o.value("outro_start").toDouble(-1.0);

    for (const auto& v : o.value("beat_grid").toArray()) a.beatGrid.push_back(v.toDouble());
    a.tempoChanges = pairsFromJson(o.value("tempo_changes").toArray());
    a.energyCurve = pairsFromJson(o.value("energy_curve").toArray());
    for (const auto& v : o.value("transition_points").toArray()) {
        if (v.isObject()) a.transitionPoints.push_back(TransitionPoint::fromJson(v.toObject()));
    }
    return a;
}

} // namespace segue::structure
