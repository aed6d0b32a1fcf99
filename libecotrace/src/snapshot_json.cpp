#include "ecotrace/snapshot_json.hpp"

#include "ecotrace/issues.hpp"

#include <QJsonDocument>
#include <QJsonValue>
#include <QTimeZone>

namespace ecotrace {

QJsonArray daySeriesToJson(const std::vector<DayPoint> &series)
{
    QJsonArray arr;
    for (const auto &point : series) {
        QJsonObject obj;
        obj.insert(QStringLiteral("day"), point.day.toString(Qt::ISODate));
        obj.insert(QStringLiteral("co2_g"), point.co2_g);
        arr.append(obj);
    }
    return arr;
}

std::vector<DayPoint> daySeriesFromJson(const QJsonArray &arr)
{
    std::vector<DayPoint> series;
    series.reserve(static_cast<std::size_t>(arr.size()));
    for (const QJsonValue &v : arr) {
        if (!v.isObject()) {
            continue;
        }
        const QJsonObject obj = v.toObject();
        DayPoint point;
        point.day   = QDate::fromString(obj.value(QStringLiteral("day")).toString(), Qt::ISODate);
        point.co2_g = obj.value(QStringLiteral("co2_g")).toDouble();
        series.push_back(point);
    }
    return series;
}

QJsonObject totalsToJson(const AggregateTotals &totals)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("visitCount"), totals.visitCount);
    obj.insert(QStringLiteral("totalBytes"), totals.totalBytes);
    obj.insert(QStringLiteral("totalCO2_g"), totals.totalCO2_g);
    return obj;
}

AggregateTotals totalsFromJson(const QJsonObject &obj)
{
    AggregateTotals totals;
    totals.visitCount = obj.value(QStringLiteral("visitCount")).toInteger();
    totals.totalBytes = obj.value(QStringLiteral("totalBytes")).toInteger();
    totals.totalCO2_g = obj.value(QStringLiteral("totalCO2_g")).toDouble();
    return totals;
}

QJsonArray originsToJson(const std::vector<OriginAggregate> &origins)
{
    QJsonArray arr;
    for (const auto &entry : origins) {
        QJsonObject obj = totalsToJson(entry.totals);
        obj.insert(QStringLiteral("origin"), entry.origin);
        arr.append(obj);
    }
    return arr;
}

std::vector<OriginAggregate> originsFromJson(const QJsonArray &arr)
{
    std::vector<OriginAggregate> origins;
    origins.reserve(static_cast<std::size_t>(arr.size()));
    for (const QJsonValue &v : arr) {
        if (!v.isObject()) {
            continue;
        }
        const QJsonObject obj = v.toObject();
        origins.push_back(OriginAggregate{obj.value(QStringLiteral("origin")).toString(),
                                          totalsFromJson(obj)});
    }
    return origins;
}

QJsonArray visitsToJson(const std::vector<VisitRecord> &visits)
{
    QJsonArray arr;
    for (const auto &record : visits) {
        QJsonObject obj = visitToJson(record);
        const auto issues = detectIssues(record);
        if (!issues.empty()) {
            obj.insert(QStringLiteral("issues"), issuesToJson(issues));
        }
        arr.append(obj);
    }
    return arr;
}

std::vector<VisitRecord> visitsFromJson(const QJsonArray &arr, const Settings &settings)
{
    std::vector<VisitRecord> visits;
    visits.reserve(static_cast<std::size_t>(arr.size()));
    for (const QJsonValue &v : arr) {
        if (!v.isObject()) {
            continue;
        }
        visits.push_back(visitFromJson(v.toObject(), settings));
    }
    return visits;
}

QJsonObject alertEventToJson(const AlertEvent &event)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("origin"), event.origin);
    obj.insert(QStringLiteral("windowSum_g"), event.windowSum_g);
    obj.insert(QStringLiteral("windowMinutes"), event.windowMinutes);
    obj.insert(QStringLiteral("firedAt"), event.firedAt.toUTC().toString(Qt::ISODateWithMs));
    return obj;
}

AlertEvent alertEventFromJson(const QJsonObject &obj)
{
    AlertEvent event;
    event.origin        = obj.value(QStringLiteral("origin")).toString();
    event.windowSum_g   = obj.value(QStringLiteral("windowSum_g")).toDouble();
    event.windowMinutes = obj.value(QStringLiteral("windowMinutes")).toInt();

    QDateTime firedAt = QDateTime::fromString(obj.value(QStringLiteral("firedAt")).toString(),
                                              Qt::ISODateWithMs);
    if (firedAt.isValid()) {
        event.firedAt = firedAt.toTimeZone(QTimeZone::utc());
    }
    return event;
}

QJsonObject alertStateToJson(const QString &origin,
                             const AlertState &state,
                             AlertPhase phase)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("origin"), origin);
    obj.insert(QStringLiteral("activeSeconds"), state.activeSeconds);
    obj.insert(QStringLiteral("phase"), alertPhaseToString(phase));
    if (state.lastAlertAt.has_value()) {
        obj.insert(QStringLiteral("lastAlertAt"),
                   state.lastAlertAt->toUTC().toString(Qt::ISODateWithMs));
    }
    return obj;
}

QString toCompactString(const QJsonObject &obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString toCompactString(const QJsonArray &arr)
{
    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Compact));
}

} // namespace ecotrace
