#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <vector>

#include "ecotrace/aggregate_index.hpp"
#include "ecotrace/alert_engine.hpp"
#include "ecotrace/visit.hpp"

namespace ecotrace {

// Wire form of the read-side views exchanged between the daemon and its
// clients.

QJsonArray daySeriesToJson(const std::vector<DayPoint> &series);
std::vector<DayPoint> daySeriesFromJson(const QJsonArray &arr);

QJsonObject totalsToJson(const AggregateTotals &totals);
AggregateTotals totalsFromJson(const QJsonObject &obj);

QJsonArray originsToJson(const std::vector<OriginAggregate> &origins);
std::vector<OriginAggregate> originsFromJson(const QJsonArray &arr);

QJsonArray visitsToJson(const std::vector<VisitRecord> &visits);
std::vector<VisitRecord> visitsFromJson(const QJsonArray &arr,
                                        const Settings &settings = Settings{});

QJsonObject alertEventToJson(const AlertEvent &event);
AlertEvent alertEventFromJson(const QJsonObject &obj);

QJsonObject alertStateToJson(const QString &origin,
                             const AlertState &state,
                             AlertPhase phase);

QString toCompactString(const QJsonObject &obj);
QString toCompactString(const QJsonArray &arr);

} // namespace ecotrace
