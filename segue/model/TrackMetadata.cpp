#include "segue/model/TrackMetadata.h"

#include <QJsonDocument>
#include <QJsonObject>

namespace segue::model {

MetadataMap metadataFromJson(const QByteArray& json, QString* outError) {
    MetadataMap out;
    QJsonParseError pe;
    const auto doc = QJsonDocument::fromJson(json, &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (outError) *outError = QString("Invalid metadata JSON: %1").arg(pe.errorString());
        return out;
    }
    const auto root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it.value().isObject()) continue;
        out.insert(it.key(), it.value().toObject().toVariantMap());
    }
    return out;
}

} // namespace segue::model
