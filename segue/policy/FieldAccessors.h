#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVariant>

#include <functional>

#include "segue/model/Track.h"
#include "segue/model/TrackMetadata.h"

namespace segue::policy {

// Field name -> typed getter. Getters return an invalid QVariant when the value is absent.
class FieldAccessorTable {
public:
    using Getter = std::function<QVariant(const model::Track&, const model::TrackMetadata*)>;

    // Track attributes, enrichment labels and the normalised percent fields.
    static FieldAccessorTable builtins();

    bool contains(const QString& field) const { return m_getters.contains(field); }
    QStringList fields() const;

    // Unknown fields fall back to a direct metadata lookup ("-" and empty count as absent).
    QVariant extract(const QString& field,
                     const model::Track& track,
                     const model::TrackMetadata* metadata) const;

    void add(const QString& field, Getter g) { m_getters.insert(field, std::move(g)); }

private:
    QHash<QString, Getter> m_getters;
};

} // namespace segue::policy
