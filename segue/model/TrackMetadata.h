#pragma once

#include <QHash>
#include <QString>
#include <QVariantMap>

namespace segue::model {

// Per-track enrichment dictionary (subgenre, mood, era, language, danceability,
// crowd_appeal, mix_friendly, time_of_day, activity, season).
// Percent-like values may be 0..1, 0..100 or strings such as "85%".
using TrackMetadata = QVariantMap;

// track id -> metadata
using MetadataMap = QHash<QString, TrackMetadata>;

// Context hints for adaptive scoring ("time_of_day", "activity").
using ContextData = QVariantMap;

// Parses {"<track id>": {...}, ...}. Non-object entries are skipped.
MetadataMap metadataFromJson(const QByteArray& json, QString* outError = nullptr);

} // namespace segue::model
