#pragma once

#include <QObject>
#include <QString>

#include <optional>
#include <vector>

#include "ecotrace/aggregate_index.hpp"
#include "ecotrace/alert_engine.hpp"
#include "ecotrace/ingestion_coordinator.hpp"
#include "ecotrace/visit.hpp"

class QDBusInterface;

namespace ecotrace {

class IpcClient : public QObject
{
    Q_OBJECT
public:
    explicit IpcClient(QObject *parent = nullptr);
    ~IpcClient() override;

    // Try to connect to the EcoTrace daemon on the session bus.
    // Returns true if the DBus interface looks valid.
    bool connectToDaemon();

    bool isConnected() const { return connected_; }
    QString lastError() const { return lastError_; }

    // Synchronous calls. On failure they return an empty value and set
    // lastError().
    std::optional<IngestResult> ingest(const VisitRecord &record);
    std::optional<BulkLoadSummary> importVisits(const std::vector<VisitRecord> &records);
    bool reportActivity(const QString &origin, bool active);

    std::vector<VisitRecord> getVisits();
    std::vector<DayPoint> getDaySeries(int days);
    std::vector<OriginAggregate> getTopOrigins(int topK);
    std::optional<AggregateTotals> getTotals();
    QString getAlertStateJson(const QString &origin);

signals:
    void alertReceived(const ecotrace::AlertEvent &event);
    void visitReceived(const ecotrace::VisitRecord &record);
    void connectionChanged(bool connected);

private slots:
    void handleAlertJson(const QString &json);
    void handleVisitJson(const QString &json);

private:
    void setConnected(bool c);
    bool ensureInterface();
    std::optional<QString> callForString(const QString &method,
                                         const QList<QVariant> &args);

    QDBusInterface *iface_ = nullptr;
    bool connected_ = false;
    QString lastError_;
};

} // namespace ecotrace
