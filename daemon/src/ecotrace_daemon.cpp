#include "ecotrace_daemon.hpp"

#include "persistence_worker.hpp"

#include "ecotrace/snapshot_json.hpp"
#include "ecotrace/visit_store.hpp"

#include <QDBusConnection>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>

#include "ecotrace_daemon_adaptor.h"

namespace ecotrace {

namespace {
constexpr const char *kServiceName = "org.ecotrace.Daemon";
constexpr const char *kObjectPath  = "/org/ecotrace/Daemon";
} // namespace

EcoTraceDaemon::EcoTraceDaemon(const Settings &settings,
                               const QString &dbPath,
                               QSettings *config,
                               QObject *parent)
    : QObject(parent)
    , dbPath_(dbPath)
    , config_(config)
    , coordinator_(clock_, settings)
    , scheduler_([this](const QString &origin) { coordinator_.evaluateAlert(origin); },
                 checkIntervalMs(coordinator_.settings()))
{
    qRegisterMetaType<ecotrace::VisitRecord>();
    qRegisterMetaType<ecotrace::AlertEvent>();

    connect(&coordinator_, &IngestionCoordinator::recordAccepted,
            this, &EcoTraceDaemon::handleRecordAccepted);
    connect(&coordinator_, &IngestionCoordinator::alertFired,
            this, &EcoTraceDaemon::handleAlertFired);
    connect(&coordinator_, &IngestionCoordinator::recordEvicted,
            this, [](const ecotrace::VisitRecord &record) {
                qDebug() << "EcoTraceDaemon: evicted" << record.id << "from the visit log";
            });
}

EcoTraceDaemon::~EcoTraceDaemon()
{
    scheduler_.stopAll();
    persistThread_.quit();
    persistThread_.wait();
}

bool EcoTraceDaemon::init()
{
    if (dbPath_.isEmpty()) {
        qInfo() << "EcoTraceDaemon: persistence disabled";
        return true;
    }

    {
        VisitStore seed(dbPath_, QStringLiteral("ecotrace_seed"));
        if (seed.open() && seed.initSchema()) {
            const auto records = seed.loadRecent(coordinator_.settings().logCapacity);
            coordinator_.bulkLoad(records);
        } else {
            // Not fatal: the daemon keeps working in memory.
            qWarning() << "EcoTraceDaemon: could not seed from" << dbPath_;
        }
    }

    startPersistence();
    return true;
}

void EcoTraceDaemon::startPersistence()
{
    worker_ = new PersistenceWorker(dbPath_, coordinator_.settings().logCapacity);
    worker_->moveToThread(&persistThread_);

    connect(&persistThread_, &QThread::started, worker_, &PersistenceWorker::open);
    connect(&persistThread_, &QThread::finished, worker_, &QObject::deleteLater);
    connect(&coordinator_, &IngestionCoordinator::recordAccepted,
            worker_, &PersistenceWorker::persist);
    connect(&coordinator_, &IngestionCoordinator::recordEvicted,
            worker_, &PersistenceWorker::forget);
    connect(this, &EcoTraceDaemon::clearRequested,
            worker_, &PersistenceWorker::clearAll);

    persistThread_.setObjectName(QStringLiteral("ecotrace-persist"));
    persistThread_.start();
}

bool EcoTraceDaemon::registerOnBus()
{
    new DaemonAdaptor(this);

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.registerObject(QString::fromUtf8(kObjectPath), this,
                            QDBusConnection::ExportAdaptors)) {
        qCritical() << "EcoTraceDaemon: failed to register DBus object" << kObjectPath;
        return false;
    }
    if (!bus.registerService(QString::fromUtf8(kServiceName))) {
        qCritical() << "EcoTraceDaemon: failed to register DBus service" << kServiceName
                    << "-" << bus.lastError().message();
        return false;
    }
    return true;
}

QString EcoTraceDaemon::Ingest(const QString &json)
{
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        qWarning() << "EcoTraceDaemon: Ingest payload is not a JSON object";
        return ingestResultToString(IngestResult::Invalid);
    }

    const VisitRecord record = visitFromJson(doc.object(), coordinator_.settings());
    const IngestResult result = coordinator_.ingest(record);
    if (result == IngestResult::Accepted) {
        scheduler_.start(record.origin);
    }
    return ingestResultToString(result);
}

QString EcoTraceDaemon::Import(const QString &jsonArray)
{
    const QJsonDocument doc = QJsonDocument::fromJson(jsonArray.toUtf8());

    BulkLoadSummary summary;
    if (!doc.isArray()) {
        qWarning() << "EcoTraceDaemon: Import payload is not a JSON array";
    } else {
        const auto records = visitsFromJson(doc.array(), coordinator_.settings());
        for (const auto &record : records) {
            switch (coordinator_.ingest(record)) {
            case IngestResult::Accepted:
                ++summary.accepted;
                scheduler_.start(record.origin);
                break;
            case IngestResult::Duplicate:
                ++summary.duplicates;
                break;
            case IngestResult::Invalid:
                ++summary.invalid;
                break;
            }
        }
        qInfo() << "EcoTraceDaemon: imported" << summary.accepted << "of"
                << records.size() << "visits";
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("accepted"), summary.accepted);
    obj.insert(QStringLiteral("duplicates"), summary.duplicates);
    obj.insert(QStringLiteral("invalid"), summary.invalid);
    return toCompactString(obj);
}

void EcoTraceDaemon::ReportActivity(const QString &origin, bool active)
{
    if (origin.isEmpty()) {
        return;
    }
    coordinator_.recordActivity(origin, active);
    if (active) {
        scheduler_.start(origin);
    }
}

void EcoTraceDaemon::CloseContext(const QString &origin)
{
    scheduler_.stop(origin);
}

QString EcoTraceDaemon::GetVisits()
{
    return toCompactString(visitsToJson(coordinator_.logSnapshot()));
}

QString EcoTraceDaemon::GetDaySeries(int days)
{
    return toCompactString(daySeriesToJson(coordinator_.byDaySnapshot(days)));
}

QString EcoTraceDaemon::GetTopOrigins(int topK)
{
    return toCompactString(originsToJson(coordinator_.byOriginSnapshot(topK)));
}

QString EcoTraceDaemon::GetTotals()
{
    return toCompactString(totalsToJson(coordinator_.totals()));
}

QString EcoTraceDaemon::GetAlertState(const QString &origin)
{
    return toCompactString(alertStateToJson(origin,
                                            coordinator_.alertState(origin),
                                            coordinator_.alertPhase(origin)));
}

QString EcoTraceDaemon::GetSettings()
{
    return toCompactString(settingsToJson(coordinator_.settings()));
}

QString EcoTraceDaemon::UpdateSettings(const QString &json)
{
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        qWarning() << "EcoTraceDaemon: UpdateSettings payload is not a JSON object";
        return GetSettings();
    }

    // Keys not present in the payload keep their current value.
    const Settings next = settingsFromJson(doc.object(), coordinator_.settings());
    coordinator_.setSettings(next);
    scheduler_.setIntervalMs(checkIntervalMs(next));

    if (config_) {
        saveSettings(*config_, next);
    }

    qInfo() << "EcoTraceDaemon: settings updated";
    return GetSettings();
}

void EcoTraceDaemon::ResetActive(const QString &origin)
{
    coordinator_.resetActive(origin);
}

bool EcoTraceDaemon::ForceEvaluate(const QString &origin)
{
    return coordinator_.evaluateAlert(origin).has_value();
}

void EcoTraceDaemon::ClearData()
{
    coordinator_.resetAll();
    emit clearRequested();
}

void EcoTraceDaemon::handleRecordAccepted(const ecotrace::VisitRecord &record)
{
    emit VisitAdded(visitToJsonString(record));
}

void EcoTraceDaemon::handleAlertFired(const ecotrace::AlertEvent &event)
{
    emit AlertFired(toCompactString(alertEventToJson(event)));
}

} // namespace ecotrace
