#include "segue/util/ValueNormalize.h"

#include <QStringList>
#include <QVariantList>

namespace segue::util {
namespace {

static bool isNumberType(const QVariant& v) {
    switch (v.typeId()) {
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::LongLong:
        case QMetaType::ULongLong:
        case QMetaType::Double:
        case QMetaType::Float:
            return true;
        default:
            return false;
    }
}

static bool parseNumberString(QString s, double& out) {
    s = s.trimmed();
    if (s.isEmpty()) return false;
    bool percent = false;
    if (s.endsWith('%')) {
        percent = true;
        s.chop(1);
    }
    bool ok = false;
    const double d = s.trimmed().toDouble(&ok);
    if (!ok) return false;
    out = percent ? d / 100.0 : d;
    return true;
}

} // namespace

QString normalizeLabel(const QVariant& v) {
    if (!v.isValid() || v.isNull()) return QString();
    if (v.typeId() != QMetaType::QString) return QString();
    const QString s = v.toString().trimmed().toLower();
    if (s == "-") return QString();
    return s;
}

bool normalizePercent(const QVariant& v, double& out01) {
    if (!v.isValid() || v.isNull()) return false;
    if (isNumberType(v)) {
        const double d = v.toDouble();
        if (d == 0.0) return false;
        out01 = (d > 1.0) ? d / 100.0 : d;
        return true;
    }
    if (v.typeId() != QMetaType::QString) return false;
    const QString s = v.toString().trimmed();
    if (s.isEmpty() || s == "-") return false;
    double d = 0.0;
    if (!parseNumberString(s, d)) return false;
    if (s.endsWith('%')) {
        out01 = d;
        return true;
    }
    out01 = (d > 1.0) ? d / 100.0 : d;
    return true;
}

bool isNumeric(const QVariant& v) {
    double unused = 0.0;
    return toNumber(v, unused);
}

bool toNumber(const QVariant& v, double& out) {
    if (!v.isValid() || v.isNull()) return false;
    if (isNumberType(v)) {
        out = v.toDouble();
        return true;
    }
    if (v.typeId() == QMetaType::QString) return parseNumberString(v.toString(), out);
    return false;
}

QString displayValue(const QVariant& v) {
    if (!v.isValid() || v.isNull()) return QString("None");
    if (v.typeId() == QMetaType::QVariantList || v.typeId() == QMetaType::QStringList) {
        QStringList parts;
        for (const auto& e : v.toList()) parts << displayValue(e);
        return QString("[%1]").arg(parts.join(", "));
    }
    return v.toString();
}

} // namespace segue::util
