#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

#include "ecotrace/settings.hpp"

namespace ecotrace {

// One page visit as reported by a collector. Immutable once it has been
// appended to the event log.
struct VisitRecord
{
    QString   id;
    QDateTime timestamp;
    QString   origin;

    qint64 transferBytes  = 0;
    double estimatedCO2_g = 0.0;

    // Descriptive only; not aggregated.
    QString url;
    QString title;
    int     resourceCount = 0;
    int     loadTimeMs    = 0;
    int     longTasks     = 0;
    double  estimatedEnergy_mJ = 0.0;
};

// A record needs an id, an origin and a valid timestamp to be ingested.
bool isValid(const VisitRecord &record);

// JSON helpers. visitFromJson() is the single normalization boundary: it
// resolves field aliases, clamps negative or non-finite numbers to 0, and
// derives CO2/energy estimates from `settings` when the payload has none.
QJsonObject visitToJson(const VisitRecord &record);
VisitRecord visitFromJson(const QJsonObject &obj,
                          const Settings &settings = Settings{});

QString visitToJsonString(const VisitRecord &record);
VisitRecord visitFromJsonString(const QString &json,
                                const Settings &settings = Settings{});

} // namespace ecotrace

Q_DECLARE_METATYPE(ecotrace::VisitRecord)
