#pragma once

#include "ecotrace/visit.hpp"

#include <QSqlDatabase>
#include <vector>

namespace ecotrace {

// SQLite persistence of accepted visits. Used from one thread only; each
// instance owns its own named connection.
class VisitStore {
public:
    explicit VisitStore(const QString &dbPath,
                        const QString &connectionName = QStringLiteral("ecotrace_visit_store"));
    ~VisitStore();

    VisitStore(const VisitStore &) = delete;
    VisitStore &operator=(const VisitStore &) = delete;

    bool open();
    bool initSchema();
    void close();

    // Ignores ids that are already stored. `outInserted` reports whether a
    // row was actually written.
    bool insertVisit(const VisitRecord &record, bool *outInserted = nullptr);

    // The newest `limit` visits, returned oldest first.
    std::vector<VisitRecord> loadRecent(int limit);

    // Deletes one visit; a missing id is not an error.
    bool removeVisit(const QString &id);

    // Keeps only the newest `keep` visits.
    bool pruneTo(int keep);

    qint64 count();
    bool clear();

private:
    QString dbPath_;
    QString connectionName_;
    QSqlDatabase db_;

    bool ensureConnection();
};

} // namespace ecotrace
