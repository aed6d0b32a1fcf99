#include "persistence_worker.hpp"

#include <QDebug>

namespace ecotrace {

PersistenceWorker::PersistenceWorker(const QString &dbPath, int capacity, QObject *parent)
    : QObject(parent)
    , dbPath_(dbPath)
    , capacity_(capacity)
{
}

PersistenceWorker::~PersistenceWorker() = default;

void PersistenceWorker::open()
{
    // The connection must be created on the thread that uses it.
    store_ = std::make_unique<VisitStore>(dbPath_, QStringLiteral("ecotrace_persist"));
    available_ = store_->open() && store_->initSchema();
    if (!available_) {
        qWarning() << "PersistenceWorker: store unavailable, visits will not be saved";
        return;
    }
    // A smaller capacity than on the previous run leaves extra rows behind.
    if (!store_->pruneTo(capacity_)) {
        qWarning() << "PersistenceWorker: could not trim stored visits to" << capacity_;
    }
}

void PersistenceWorker::persist(const ecotrace::VisitRecord &record)
{
    if (!available_) {
        return;
    }
    if (!store_->insertVisit(record)) {
        qWarning() << "PersistenceWorker: dropping visit" << record.id;
    }
}

void PersistenceWorker::forget(const ecotrace::VisitRecord &record)
{
    if (!available_) {
        return;
    }
    if (!store_->removeVisit(record.id)) {
        qWarning() << "PersistenceWorker: evicted visit" << record.id << "stays stored";
    }
}

void PersistenceWorker::clearAll()
{
    if (!available_) {
        return;
    }
    if (!store_->clear()) {
        qWarning() << "PersistenceWorker: failed to clear stored visits";
    }
}

} // namespace ecotrace
