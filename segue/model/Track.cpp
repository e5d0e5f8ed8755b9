#include "segue/model/Track.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace segue::model {

QJsonObject Track::toJson() const {
    QJsonObject o;
    o.insert("id", id);
    o.insert("title", title);
    o.insert("artist", artist);
    if (!filePath.isEmpty()) o.insert("filepath", filePath);
    if (hasKey()) o.insert("key", key);
    if (hasBpm()) o.insert("bpm", bpm);
    if (hasEnergy()) o.insert("energy", energy);
    if (hasEmotionalIntensity()) o.insert("emotional_intensity", emotionalIntensity);
    if (!genre.isEmpty()) o.insert("genre", genre);
    if (durationSec > 0.0) o.insert("duration", durationSec);
    o.insert("is_available", isAvailable);
    return o;
}

Track Track::fromJson(const QJsonObject& o) {
    Track t;
    t.id = o.value("id").toString();
    t.title = o.value("title").toString();
    t.artist = o.value("artist").toString();
    t.filePath = o.value("filepath").toString();
    t.key = o.value("key").toString().trimmed().toUpper();
    t.bpm = o.value("bpm").toDouble(0.0);
    t.energy = o.value("energy").toDouble(0.0);
    t.emotionalIntensity = o.value("emotional_intensity").toDouble(0.0);
    t.genre = o.value("genre").toString();
    t.durationSec = o.value("duration").toDouble(0.0);
    t.isAvailable = o.value("is_available").toBool(true);
    return t;
}

TrackList tracksFromJson(const QByteArray& json, QString* outError) {
    TrackList out;
    QJsonParseError pe;
    const auto doc = QJsonDocument::fromJson(json, &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isArray()) {
        if (outError) *outError = QString("Invalid track JSON: %1").arg(pe.errorString());
        return out;
    }
    const auto arr = doc.array();
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.isObject()) continue;
        Track t = Track::fromJson(v.toObject());
        if (t.id.trimmed().isEmpty()) continue;
        out.push_back(t);
    }
    return out;
}

const Track* findTrack(const TrackList& tracks, const QString& id) {
    for (const auto& t : tracks) {
        if (t.id == id) return &t;
    }
    return nullptr;
}

} // namespace segue::model
