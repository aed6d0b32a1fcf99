#include "ecotrace/visit.hpp"

#include <QJsonDocument>
#include <QJsonValue>
#include <QTimeZone>
#include <QUrl>

#include <cmath>
#include <initializer_list>
#include <limits>

namespace ecotrace {

namespace {

// 2^53: larger doubles are not exact integers anymore.
constexpr double kMaxExactInteger = 9007199254740992.0;

// ECMAScript Date range, +-100 000 000 days around the epoch.
constexpr double kMaxEpochMs = 8.64e15;

QJsonValue pick(const QJsonObject &obj, std::initializer_list<const char *> names)
{
    for (const char *name : names) {
        const QJsonValue v = obj.value(QString::fromLatin1(name));
        if (!v.isUndefined() && !v.isNull()) {
            return v;
        }
    }
    return QJsonValue(QJsonValue::Undefined);
}

// Collectors send numbers either as JSON numbers or as strings.
// Anything that is not a finite, non-negative number becomes 0.
double nonNegative(const QJsonValue &v)
{
    double d = 0.0;
    if (v.isDouble()) {
        d = v.toDouble();
    } else if (v.isString()) {
        bool ok = false;
        d = v.toString().trimmed().toDouble(&ok);
        if (!ok) {
            return 0.0;
        }
    } else {
        return 0.0;
    }

    if (!std::isfinite(d) || d < 0.0) {
        return 0.0;
    }
    return d;
}

qint64 nonNegativeInt64(const QJsonValue &v)
{
    const double d = nonNegative(v);
    if (d >= static_cast<double>(std::numeric_limits<qint64>::max())) {
        return std::numeric_limits<qint64>::max();
    }
    return static_cast<qint64>(d);
}

int nonNegativeInt(const QJsonValue &v)
{
    const double d = nonNegative(v);
    if (d >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(d);
}

QString stringOf(const QJsonValue &v)
{
    if (v.isString()) {
        return v.toString().trimmed();
    }
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (!std::isfinite(d)) {
            return {};
        }
        // Integral ids print without exponent; anything else keeps full precision.
        if (std::trunc(d) == d && std::abs(d) < kMaxExactInteger) {
            return QString::number(static_cast<qint64>(d));
        }
        return QString::number(d, 'g', 17);
    }
    return {};
}

QDateTime timestampOf(const QJsonValue &v)
{
    if (v.isDouble()) {
        const double ms = v.toDouble();
        if (!std::isfinite(ms) || std::abs(ms) > kMaxEpochMs) {
            return {};
        }
        return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(ms), QTimeZone::utc());
    }

    if (!v.isString()) {
        return {};
    }

    const QString s = v.toString().trimmed();
    QDateTime dt = QDateTime::fromString(s, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(s, Qt::ISODate);
    }
    if (!dt.isValid()) {
        return {};
    }
    // Strings without an offset are taken as UTC.
    if (dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeZone(QTimeZone::utc());
    }
    return dt.toUTC();
}

} // namespace

bool isValid(const VisitRecord &record)
{
    return !record.id.isEmpty()
        && !record.origin.isEmpty()
        && record.timestamp.isValid();
}

QJsonObject visitToJson(const VisitRecord &record)
{
    QJsonObject obj;

    obj.insert(QStringLiteral("id"), record.id);
    if (record.timestamp.isValid()) {
        obj.insert(QStringLiteral("timestamp"),
                   record.timestamp.toUTC().toString(Qt::ISODateWithMs));
    }
    obj.insert(QStringLiteral("origin"), record.origin);
    obj.insert(QStringLiteral("transferBytes"), record.transferBytes);
    obj.insert(QStringLiteral("estimatedCO2_g"), record.estimatedCO2_g);
    obj.insert(QStringLiteral("estimatedEnergy_mJ"), record.estimatedEnergy_mJ);

    if (!record.url.isEmpty()) {
        obj.insert(QStringLiteral("url"), record.url);
    }
    if (!record.title.isEmpty()) {
        obj.insert(QStringLiteral("title"), record.title);
    }
    obj.insert(QStringLiteral("resourceCount"), record.resourceCount);
    obj.insert(QStringLiteral("loadTimeMs"), record.loadTimeMs);
    obj.insert(QStringLiteral("longTasks"), record.longTasks);

    return obj;
}

VisitRecord visitFromJson(const QJsonObject &obj, const Settings &settings)
{
    VisitRecord record;

    record.id        = stringOf(obj.value(QStringLiteral("id")));
    record.timestamp = timestampOf(pick(obj, {"timestamp", "ts", "date", "timestamp_ms"}));
    record.url       = stringOf(obj.value(QStringLiteral("url")));
    record.title     = obj.value(QStringLiteral("title")).toString();

    // Origin: explicit field, then host, then the url's hostname.
    record.origin = stringOf(pick(obj, {"origin", "host"}));
    if (record.origin.isEmpty() && !record.url.isEmpty()) {
        record.origin = QUrl(record.url).host();
    }

    record.transferBytes = nonNegativeInt64(pick(obj, {"transferBytes", "bytes", "transfer_bytes"}));
    record.resourceCount = nonNegativeInt(pick(obj, {"resourceCount", "resource_count"}));
    record.loadTimeMs    = nonNegativeInt(pick(obj, {"loadTimeMs", "load_time_ms"}));
    record.longTasks     = nonNegativeInt(pick(obj, {"longTasks", "long_tasks"}));

    const QJsonValue co2 = pick(obj, {"estimatedCO2_g", "co2", "estimated_co2_g"});
    if (co2.isUndefined()) {
        record.estimatedCO2_g = static_cast<double>(record.transferBytes) * settings.co2Factor;
    } else {
        record.estimatedCO2_g = nonNegative(co2);
    }

    const QJsonValue energy = pick(obj, {"estimatedEnergy_mJ", "energy_mj"});
    if (energy.isUndefined()) {
        record.estimatedEnergy_mJ = static_cast<double>(record.transferBytes) * settings.energyFactor;
    } else {
        record.estimatedEnergy_mJ = nonNegative(energy);
    }

    return record;
}

QString visitToJsonString(const VisitRecord &record)
{
    QJsonDocument doc(visitToJson(record));
    return QString::fromUtf8(doc.toJson(QJsonDocument::Compact));
}

VisitRecord visitFromJsonString(const QString &json, const Settings &settings)
{
    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        return VisitRecord{};
    }
    return visitFromJson(doc.object(), settings);
}

} // namespace ecotrace
