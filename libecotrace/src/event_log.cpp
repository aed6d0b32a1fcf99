#include "ecotrace/event_log.hpp"

#include <QDebug>

namespace ecotrace {

EventLog::EventLog(std::size_t capacity)
    : capacity_(capacity == 0 ? DefaultCapacity : capacity)
{
}

AppendResult EventLog::append(const VisitRecord &record,
                              std::vector<VisitRecord> *evicted)
{
    if (ids_.contains(record.id)) {
        qDebug() << "EventLog: duplicate record skipped" << record.id;
        return AppendResult::Duplicate;
    }

    records_.push_back(record);
    ids_.insert(record.id);

    evictOverflow(evicted);
    return AppendResult::Accepted;
}

bool EventLog::contains(const QString &id) const
{
    return ids_.contains(id);
}

void EventLog::setCapacity(std::size_t capacity, std::vector<VisitRecord> *evicted)
{
    if (capacity == 0) {
        qWarning() << "EventLog: ignoring zero capacity";
        return;
    }
    capacity_ = capacity;
    evictOverflow(evicted);
}

std::vector<VisitRecord> EventLog::snapshot() const
{
    return std::vector<VisitRecord>(records_.begin(), records_.end());
}

double EventLog::co2InWindow(const QString &origin,
                             const QDateTime &from,
                             const QDateTime &to) const
{
    double sum = 0.0;
    for (const auto &record : records_) {
        if (record.origin != origin) {
            continue;
        }
        if (record.timestamp < from || record.timestamp > to) {
            continue;
        }
        sum += record.estimatedCO2_g;
    }
    return sum;
}

void EventLog::clear()
{
    records_.clear();
    ids_.clear();
}

void EventLog::evictOverflow(std::vector<VisitRecord> *evicted)
{
    while (records_.size() > capacity_) {
        ids_.remove(records_.front().id);
        if (evicted) {
            evicted->push_back(std::move(records_.front()));
        }
        records_.pop_front();
    }
}

} // namespace ecotrace
