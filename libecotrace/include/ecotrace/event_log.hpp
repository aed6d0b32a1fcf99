#pragma once

#include <QDateTime>
#include <QSet>
#include <QString>

#include <cstddef>
#include <deque>
#include <vector>

#include "ecotrace/visit.hpp"

namespace ecotrace {

enum class AppendResult {
    Accepted,
    Duplicate
};

// Deduplicated, capacity-bounded visit log with FIFO eviction.
// Not synchronized; IngestionCoordinator owns the lock.
class EventLog
{
public:
    static constexpr std::size_t DefaultCapacity = 10000;

    explicit EventLog(std::size_t capacity = DefaultCapacity);

    // Appends `record` unless its id is already present. Records evicted to
    // stay within capacity are moved into `evicted` when it is non-null.
    AppendResult append(const VisitRecord &record,
                        std::vector<VisitRecord> *evicted = nullptr);

    bool contains(const QString &id) const;

    std::size_t size() const { return records_.size(); }
    std::size_t capacity() const { return capacity_; }

    // Shrinking the capacity evicts immediately.
    void setCapacity(std::size_t capacity,
                     std::vector<VisitRecord> *evicted = nullptr);

    // Insertion order, oldest first.
    std::vector<VisitRecord> snapshot() const;

    // Sum of estimatedCO2_g for `origin` with from <= timestamp <= to.
    double co2InWindow(const QString &origin,
                       const QDateTime &from,
                       const QDateTime &to) const;

    void clear();

private:
    void evictOverflow(std::vector<VisitRecord> *evicted);

    std::size_t capacity_;
    std::deque<VisitRecord> records_;
    QSet<QString> ids_;
};

} // namespace ecotrace
