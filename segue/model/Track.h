#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QVector>

namespace segue::model {

// A catalog track as seen by the scoring core.
// Numeric attributes <= 0 and empty strings mean "not analysed yet".
struct Track {
    QString id;
    QString title;
    QString artist;
    QString filePath;

    QString key;                   // Camelot notation, e.g. "8A"
    double bpm = 0.0;
    double energy = 0.0;           // 1..10
    double emotionalIntensity = 0.0; // 1..10
    QString genre;
    double durationSec = 0.0;
    bool isAvailable = true;       // file currently reachable

    bool hasKey() const { return !key.trimmed().isEmpty(); }
    bool hasBpm() const { return bpm > 0.0; }
    bool hasEnergy() const { return energy > 0.0; }
    bool hasEmotionalIntensity() const { return emotionalIntensity > 0.0; }

    QJsonObject toJson() const;
    static Track fromJson(const QJsonObject& o);

    bool operator==(const Track& other) const { return id == other.id; }
    bool operator!=(const Track& other) const { return id != other.id; }
};

using TrackList = QVector<Track>;

// Parses a JSON array of track objects (entries without an id are skipped).
TrackList tracksFromJson(const QByteArray& json, QString* outError = nullptr);

const Track* findTrack(const TrackList& tracks, const QString& id);

} // namespace segue::model
