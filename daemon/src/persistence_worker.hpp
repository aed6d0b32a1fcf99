#pragma once

#include <QObject>
#include <QString>

#include <memory>

#include "ecotrace/visit.hpp"
#include "ecotrace/visit_store.hpp"

namespace ecotrace {

// Lives on the persistence thread. Every failure is logged and dropped so
// that ingestion never waits on or fails because of storage. The table
// mirrors the in-memory log: evicted visits are deleted and at most
// `capacity` rows are kept.
class PersistenceWorker : public QObject
{
    Q_OBJECT
public:
    PersistenceWorker(const QString &dbPath, int capacity, QObject *parent = nullptr);
    ~PersistenceWorker() override;

public slots:
    void open();
    void persist(const ecotrace::VisitRecord &record);
    void forget(const ecotrace::VisitRecord &record);
    void clearAll();

private:
    QString dbPath_;
    int capacity_;
    std::unique_ptr<VisitStore> store_;
    bool available_ = false;
};

} // namespace ecotrace
