#include "ecotrace/aggregate_index.hpp"

#include <QDebug>

#include "ecotrace/common.hpp"

#include <algorithm>

namespace ecotrace {

void AggregateTotals::add(const VisitRecord &record)
{
    visitCount += 1;
    totalBytes += record.transferBytes;
    totalCO2_g += record.estimatedCO2_g;
}

void AggregateIndex::update(const VisitRecord &record)
{
    days_[utcDay(record.timestamp)].add(record);

    auto it = originIndex_.constFind(record.origin);
    if (it == originIndex_.constEnd()) {
        originIndex_.insert(record.origin, origins_.size());
        origins_.push_back(OriginAggregate{record.origin, {}});
        origins_.back().totals.add(record);
    } else {
        origins_[it.value()].totals.add(record);
    }

    totals_.add(record);
}

std::vector<DayPoint> AggregateIndex::byDaySnapshot(int lastNDays, const QDate &today) const
{
    std::vector<DayPoint> series;
    if (lastNDays <= 0 || !today.isValid()) {
        return series;
    }
    if (lastNDays > MaxDaySeries) {
        qWarning() << "AggregateIndex: day series of" << lastNDays
                   << "days clamped to" << MaxDaySeries;
        lastNDays = MaxDaySeries;
    }

    series.reserve(static_cast<std::size_t>(lastNDays));
    for (int i = lastNDays - 1; i >= 0; --i) {
        DayPoint point;
        point.day = today.addDays(-i);
        auto it = days_.find(point.day);
        if (it != days_.end()) {
            point.co2_g = it->second.totalCO2_g;
        }
        series.push_back(point);
    }
    return series;
}

std::vector<OriginAggregate> AggregateIndex::byOriginSnapshot(int topK) const
{
    if (topK <= 0) {
        return {};
    }

    std::vector<OriginAggregate> sorted = origins_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const OriginAggregate &a, const OriginAggregate &b) {
                         return a.totals.totalBytes > b.totals.totalBytes;
                     });

    if (sorted.size() > static_cast<std::size_t>(topK)) {
        sorted.resize(static_cast<std::size_t>(topK));
    }
    return sorted;
}

AggregateTotals AggregateIndex::day(const QDate &day) const
{
    auto it = days_.find(day);
    return it == days_.end() ? AggregateTotals{} : it->second;
}

AggregateTotals AggregateIndex::origin(const QString &origin) const
{
    auto it = originIndex_.constFind(origin);
    return it == originIndex_.constEnd() ? AggregateTotals{} : origins_[it.value()].totals;
}

std::vector<DayAggregate> AggregateIndex::days() const
{
    std::vector<DayAggregate> out;
    out.reserve(days_.size());
    for (const auto &entry : days_) {
        out.push_back(DayAggregate{entry.first, entry.second});
    }
    return out;
}

void AggregateIndex::clear()
{
    days_.clear();
    origins_.clear();
    originIndex_.clear();
    totals_ = {};
}

} // namespace ecotrace
