#pragma once

#include <QDate>
#include <QHash>
#include <QString>

#include <cstddef>
#include <map>
#include <vector>

#include "ecotrace/visit.hpp"

namespace ecotrace {

struct AggregateTotals
{
    qint64 visitCount = 0;
    qint64 totalBytes = 0;
    double totalCO2_g = 0.0;

    void add(const VisitRecord &record);
};

struct DayAggregate
{
    QDate day;
    AggregateTotals totals;
};

struct OriginAggregate
{
    QString origin;
    AggregateTotals totals;
};

// One point of the fixed-width daily CO2 series.
struct DayPoint
{
    QDate  day;
    double co2_g = 0.0;
};

// Cumulative by-day and by-origin totals, updated per accepted record.
// Eviction from the log does not decrement anything here.
// Not synchronized; IngestionCoordinator owns the lock.
class AggregateIndex
{
public:
    void update(const VisitRecord &record);

    static constexpr int MaxDaySeries = 3660;

    // Exactly `lastNDays` points ending at `today`, oldest first.
    // Widths above MaxDaySeries are clamped to it.
    std::vector<DayPoint> byDaySnapshot(int lastNDays, const QDate &today) const;

    // Origins by totalBytes descending; equal totals keep first-seen order.
    std::vector<OriginAggregate> byOriginSnapshot(int topK) const;

    AggregateTotals day(const QDate &day) const;
    AggregateTotals origin(const QString &origin) const;
    AggregateTotals totals() const { return totals_; }

    std::size_t dayCount() const { return days_.size(); }
    std::size_t originCount() const { return origins_.size(); }

    // All day buckets in date order.
    std::vector<DayAggregate> days() const;

    void clear();

private:
    std::map<QDate, AggregateTotals> days_;

    // Creation order is the tie-breaker for byOriginSnapshot().
    std::vector<OriginAggregate> origins_;
    QHash<QString, std::size_t> originIndex_;

    AggregateTotals totals_;
};

} // namespace ecotrace
