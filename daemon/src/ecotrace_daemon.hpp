#pragma once

#include <QObject>
#include <QString>
#include <QThread>

#include "ecotrace/alert_scheduler.hpp"
#include "ecotrace/clock.hpp"
#include "ecotrace/ingestion_coordinator.hpp"
#include "ecotrace/settings.hpp"

class QSettings;

namespace ecotrace {

class PersistenceWorker;

class EcoTraceDaemon : public QObject
{
    Q_OBJECT
public:
    // `dbPath` may be empty to run without persistence. `config` (optional)
    // receives settings pushed through UpdateSettings.
    EcoTraceDaemon(const Settings &settings,
                   const QString &dbPath,
                   QSettings *config = nullptr,
                   QObject *parent = nullptr);
    ~EcoTraceDaemon() override;

    // Seed from the visit store and start the persistence thread.
    bool init();

    // Export the adaptor and claim the service name on the session bus.
    bool registerOnBus();

    IngestionCoordinator &coordinator() { return coordinator_; }
    const AlertScheduler &scheduler() const { return scheduler_; }

public slots:
    // DBus-exposed methods, see org.ecotrace.Daemon.xml.
    QString Ingest(const QString &json);
    QString Import(const QString &jsonArray);
    void ReportActivity(const QString &origin, bool active);
    void CloseContext(const QString &origin);
    QString GetVisits();
    QString GetDaySeries(int days);
    QString GetTopOrigins(int topK);
    QString GetTotals();
    QString GetAlertState(const QString &origin);
    QString GetSettings();
    QString UpdateSettings(const QString &json);
    void ResetActive(const QString &origin);
    bool ForceEvaluate(const QString &origin);
    void ClearData();

signals:
    // Relayed to DBus by the generated DaemonAdaptor.
    void VisitAdded(const QString &json);
    void AlertFired(const QString &json);

    void clearRequested();

private slots:
    void handleRecordAccepted(const ecotrace::VisitRecord &record);
    void handleAlertFired(const ecotrace::AlertEvent &event);

private:
    void startPersistence();

    QString dbPath_;
    QSettings *config_ = nullptr;

    SystemClock clock_;
    IngestionCoordinator coordinator_;
    AlertScheduler scheduler_;

    QThread persistThread_;
    PersistenceWorker *worker_ = nullptr;
};

} // namespace ecotrace
