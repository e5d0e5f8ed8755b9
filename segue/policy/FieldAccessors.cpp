#include "segue/policy/FieldAccessors.h"

#include "segue/util/ValueNormalize.h"

#include <algorithm>

namespace segue::policy {
namespace {

static QVariant stringOrAbsent(const QString& s) {
    const QString t = s.trimmed();
    if (t.isEmpty() || t == "-") return QVariant();
    return t;
}

static QVariant positiveOrAbsent(double v) {
    return v > 0.0 ? QVariant(v) : QVariant();
}

static QVariant metadataValue(const model::TrackMetadata* md, const char* key) {
    if (!md) return QVariant();
    const QVariant v = md->value(QString::fromUtf8(key));
    if (!v.isValid() || v.isNull()) return QVariant();
    if (v.typeId() == QMetaType::QString) return stringOrAbsent(v.toString());
    return v;
}

static QVariant metadataPercent(const model::TrackMetadata* md, const char* key) {
    if (!md) return QVariant();
    double v = 0.0;
    if (!util::normalizePercent(md->value(QString::fromUtf8(key)), v)) return QVariant();
    return v;
}

} // namespace

FieldAccessorTable FieldAccessorTable::builtins() {
    using model::Track;
    using model::TrackMetadata;

    FieldAccessorTable t;

    // Track attributes
    t.add("id", [](const Track& tr, const TrackMetadata*) { return stringOrAbsent(tr.id); });
    t.add("title", [](const Track& tr, const TrackMetadata*) { return stringOrAbsent(tr.title); });
    t.add("artist", [](const Track& tr, const TrackMetadata*) { return stringOrAbsent(tr.artist); });
    t.add("key", [](const Track& tr, const TrackMetadata*) { return stringOrAbsent(tr.key); });
    t.add("bpm", [](const Track& tr, const TrackMetadata*) { return positiveOrAbsent(tr.bpm); });
    t.add("energy", [](const Track& tr, const TrackMetadata*) { return positiveOrAbsent(tr.energy); });
    t.add("emotional_intensity",
          [](const Track& tr, const TrackMetadata*) { return positiveOrAbsent(tr.emotionalIntensity); });
    t.add("genre", [](const Track& tr, const TrackMetadata*) { return stringOrAbsent(tr.genre); });
    t.add("duration", [](const Track& tr, const TrackMetadata*) { return positiveOrAbsent(tr.durationSec); });

    // Enrichment labels
    for (const char* k : {"subgenre", "mood", "era", "language", "time_of_day", "activity", "season"}) {
        t.add(QString::fromUtf8(k), [k](const Track&, const TrackMetadata* md) { return metadataValue(md, k); });
    }

    // Percent-like enrichment values, 0..1
    for (const char* k : {"danceability", "crowd_appeal", "mix_friendly"}) {
        t.add(QString::fromUtf8(k), [k](const Track&, const TrackMetadata* md) { return metadataPercent(md, k); });
    }
    return t;
}

QStringList FieldAccessorTable::fields() const {
    QStringList out = m_getters.keys();
    std::sort(out.begin(), out.end());
    return out;
}

QVariant FieldAccessorTable::extract(const QString& field,
                                     const model::Track& track,
                                     const model::TrackMetadata* metadata) const {
    auto it = m_getters.constFind(field);
    if (it != m_getters.constEnd()) return (*it)(track, metadata);
    return metadataValue(metadata, field.toUtf8().constData());
}

} // namespace segue::policy
