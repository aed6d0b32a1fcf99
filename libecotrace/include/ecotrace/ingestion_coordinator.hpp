#pragma once

#include <QDateTime>
#include <QMutex>
#include <QObject>
#include <QReadWriteLock>
#include <QString>

#include <cstddef>
#include <optional>
#include <vector>

#include "ecotrace/aggregate_index.hpp"
#include "ecotrace/alert_engine.hpp"
#include "ecotrace/clock.hpp"
#include "ecotrace/event_log.hpp"
#include "ecotrace/settings.hpp"
#include "ecotrace/visit.hpp"

namespace ecotrace {

enum class IngestResult {
    Accepted,
    Duplicate,
    Invalid
};

QString ingestResultToString(IngestResult r);

struct BulkLoadSummary
{
    int accepted   = 0;
    int duplicates = 0;
    int invalid    = 0;
};

// All dashboard views taken under one read lock.
struct DashboardSnapshot
{
    std::vector<DayPoint> days;
    std::vector<OriginAggregate> topOrigins;
    AggregateTotals totals;
    std::size_t logSize = 0;
};

// Owns the event log, aggregate index and alert engine. Every mutation of
// {log, index} happens under one write lock, so a reader never sees a record
// in the log without its aggregate contribution or the other way round.
class IngestionCoordinator : public QObject, public WindowSumSource
{
    Q_OBJECT
public:
    explicit IngestionCoordinator(const Clock &clock,
                                  const Settings &settings = Settings{},
                                  QObject *parent = nullptr);

    IngestResult ingest(const VisitRecord &record);

    // Seeds the core from de-serialized records (e.g. the visit store).
    // Same rules as ingest(); does not emit recordAccepted().
    BulkLoadSummary bulkLoad(const std::vector<VisitRecord> &records);

    void recordActivity(const QString &origin, bool active);

    // One evaluation tick for `origin` at clock.now(). Emits alertFired()
    // when an alert fires.
    std::optional<AlertEvent> evaluateAlert(const QString &origin);

    void resetActive(const QString &origin);
    AlertState alertState(const QString &origin) const;
    AlertPhase alertPhase(const QString &origin) const;

    std::vector<VisitRecord> logSnapshot() const;
    std::vector<DayPoint> byDaySnapshot(int lastNDays) const;
    std::vector<OriginAggregate> byOriginSnapshot(int topK = 10) const;
    std::vector<DayAggregate> dayAggregates() const;
    AggregateTotals totals() const;
    DashboardSnapshot dashboardSnapshot(int lastNDays, int topK = 10) const;
    std::size_t logSize() const;

    Settings settings() const;
    void setSettings(const Settings &settings);

    // Clears log, aggregates and alert state.
    void resetAll();

    double co2InWindow(const QString &origin,
                       const QDateTime &from,
                       const QDateTime &to) const override;

signals:
    void recordAccepted(const ecotrace::VisitRecord &record);
    void recordEvicted(const ecotrace::VisitRecord &record);
    void alertFired(const ecotrace::AlertEvent &event);

private:
    // Caller holds storeLock_ for writing.
    IngestResult ingestLocked(const VisitRecord &record,
                              std::vector<VisitRecord> &evicted);

    void emitEvicted(const std::vector<VisitRecord> &evicted);

    const Clock &clock_;

    mutable QReadWriteLock storeLock_;
    EventLog log_;
    AggregateIndex index_;

    AlertEngine alerts_;

    mutable QMutex settingsMutex_;
    Settings settings_;
};

} // namespace ecotrace
