#include "ecotrace/ingestion_coordinator.hpp"

#include "ecotrace/common.hpp"

#include <QDebug>
#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>

namespace ecotrace {

QString ingestResultToString(IngestResult r)
{
    switch (r) {
    case IngestResult::Accepted:
        return QStringLiteral("accepted");
    case IngestResult::Duplicate:
        return QStringLiteral("duplicate");
    case IngestResult::Invalid:
        return QStringLiteral("invalid");
    }

    return QStringLiteral("invalid");
}

IngestionCoordinator::IngestionCoordinator(const Clock &clock,
                                           const Settings &settings,
                                           QObject *parent)
    : QObject(parent)
    , clock_(clock)
    , settings_(sanitized(settings))
{
    log_.setCapacity(static_cast<std::size_t>(settings_.logCapacity));
}

IngestResult IngestionCoordinator::ingest(const VisitRecord &record)
{
    std::vector<VisitRecord> evicted;
    IngestResult result;
    {
        QWriteLocker locker(&storeLock_);
        result = ingestLocked(record, evicted);
    }

    // Persistence and other listeners run outside the critical section.
    if (result == IngestResult::Accepted) {
        emit recordAccepted(record);
    }
    emitEvicted(evicted);
    return result;
}

BulkLoadSummary IngestionCoordinator::bulkLoad(const std::vector<VisitRecord> &records)
{
    BulkLoadSummary summary;
    std::vector<VisitRecord> evicted;
    {
        QWriteLocker locker(&storeLock_);
        for (const auto &record : records) {
            switch (ingestLocked(record, evicted)) {
            case IngestResult::Accepted:
                ++summary.accepted;
                break;
            case IngestResult::Duplicate:
                ++summary.duplicates;
                break;
            case IngestResult::Invalid:
                ++summary.invalid;
                break;
            }
        }
    }

    emitEvicted(evicted);

    qInfo() << "IngestionCoordinator: bulk load accepted" << summary.accepted
            << "duplicates" << summary.duplicates
            << "invalid" << summary.invalid;
    return summary;
}

IngestResult IngestionCoordinator::ingestLocked(const VisitRecord &record,
                                                std::vector<VisitRecord> &evicted)
{
    if (!isValid(record)) {
        qWarning() << "IngestionCoordinator: rejecting invalid record"
                   << "id:" << record.id << "origin:" << record.origin;
        return IngestResult::Invalid;
    }

    if (log_.append(record, &evicted) == AppendResult::Duplicate) {
        return IngestResult::Duplicate;
    }

    index_.update(record);
    alerts_.onRecord(record.origin);
    return IngestResult::Accepted;
}

void IngestionCoordinator::emitEvicted(const std::vector<VisitRecord> &evicted)
{
    for (const auto &record : evicted) {
        emit recordEvicted(record);
    }
}

void IngestionCoordinator::recordActivity(const QString &origin, bool active)
{
    if (origin.isEmpty()) {
        return;
    }
    alerts_.recordActivity(origin, active);
}

std::optional<AlertEvent> IngestionCoordinator::evaluateAlert(const QString &origin)
{
    const Settings current = settings();
    std::optional<AlertEvent> event = alerts_.evaluate(origin, clock_.now(), current, *this);
    if (event) {
        qInfo() << "IngestionCoordinator: CO2 alert for" << event->origin
                << QString::number(event->windowSum_g, 'f', 2) << "g in last"
                << event->windowMinutes << "min";
        emit alertFired(*event);
    }
    return event;
}

void IngestionCoordinator::resetActive(const QString &origin)
{
    alerts_.resetActive(origin);
}

AlertState IngestionCoordinator::alertState(const QString &origin) const
{
    return alerts_.state(origin);
}

AlertPhase IngestionCoordinator::alertPhase(const QString &origin) const
{
    return alerts_.phase(origin, clock_.now(), settings());
}

std::vector<VisitRecord> IngestionCoordinator::logSnapshot() const
{
    QReadLocker locker(&storeLock_);
    return log_.snapshot();
}

std::vector<DayPoint> IngestionCoordinator::byDaySnapshot(int lastNDays) const
{
    const QDate today = utcDay(clock_.now());
    QReadLocker locker(&storeLock_);
    return index_.byDaySnapshot(lastNDays, today);
}

std::vector<OriginAggregate> IngestionCoordinator::byOriginSnapshot(int topK) const
{
    QReadLocker locker(&storeLock_);
    return index_.byOriginSnapshot(topK);
}

std::vector<DayAggregate> IngestionCoordinator::dayAggregates() const
{
    QReadLocker locker(&storeLock_);
    return index_.days();
}

AggregateTotals IngestionCoordinator::totals() const
{
    QReadLocker locker(&storeLock_);
    return index_.totals();
}

DashboardSnapshot IngestionCoordinator::dashboardSnapshot(int lastNDays, int topK) const
{
    const QDate today = utcDay(clock_.now());

    DashboardSnapshot snap;
    QReadLocker locker(&storeLock_);
    snap.days       = index_.byDaySnapshot(lastNDays, today);
    snap.topOrigins = index_.byOriginSnapshot(topK);
    snap.totals     = index_.totals();
    snap.logSize    = log_.size();
    return snap;
}

std::size_t IngestionCoordinator::logSize() const
{
    QReadLocker locker(&storeLock_);
    return log_.size();
}

Settings IngestionCoordinator::settings() const
{
    QMutexLocker locker(&settingsMutex_);
    return settings_;
}

void IngestionCoordinator::setSettings(const Settings &settings)
{
    const Settings clean = sanitized(settings);
    {
        QMutexLocker locker(&settingsMutex_);
        settings_ = clean;
    }

    std::vector<VisitRecord> evicted;
    {
        QWriteLocker locker(&storeLock_);
        log_.setCapacity(static_cast<std::size_t>(clean.logCapacity), &evicted);
    }
    emitEvicted(evicted);
}

void IngestionCoordinator::resetAll()
{
    {
        QWriteLocker locker(&storeLock_);
        log_.clear();
        index_.clear();
    }
    alerts_.clear();
    qInfo() << "IngestionCoordinator: all visit data cleared";
}

double IngestionCoordinator::co2InWindow(const QString &origin,
                                         const QDateTime &from,
                                         const QDateTime &to) const
{
    QReadLocker locker(&storeLock_);
    return log_.co2InWindow(origin, from, to);
}

} // namespace ecotrace
