#include "ecotrace/visit_store.hpp"

#include <QDateTime>
#include <QSqlError>
#include <QSqlQuery>
#include <QTimeZone>
#include <QVariant>
#include <QDebug>

namespace ecotrace {

namespace {
constexpr int kSchemaVersion = 1;

QString lastErrorString(const QSqlDatabase &db)
{
    return db.lastError().text();
}

QString lastErrorString(const QSqlQuery &query)
{
    return query.lastError().text();
}

QVariant textOrNull(const QString &s)
{
    return s.isEmpty() ? QVariant() : QVariant(s);
}

} // namespace

VisitStore::VisitStore(const QString &dbPath, const QString &connectionName)
    : dbPath_(dbPath)
    , connectionName_(connectionName)
{
}

VisitStore::~VisitStore()
{
    close();
}

bool VisitStore::ensureConnection()
{
    if (db_.isValid() && db_.isOpen()) {
        return true;
    }

    if (QSqlDatabase::contains(connectionName_)) {
        db_ = QSqlDatabase::database(connectionName_, false);
    } else {
        db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName_);
    }

    db_.setDatabaseName(dbPath_);

    if (!db_.open()) {
        qWarning() << "VisitStore: failed to open database:"
                   << dbPath_ << "-" << lastErrorString(db_);
        return false;
    }

    return true;
}

bool VisitStore::open()
{
    return ensureConnection();
}

void VisitStore::close()
{
    if (!db_.isValid()) {
        return;
    }
    db_.close();
    db_ = QSqlDatabase();
    QSqlDatabase::removeDatabase(connectionName_);
}

bool VisitStore::initSchema()
{
    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);

    // seq preserves insertion order, which is the log's eviction order.
    const char *createSql = R"(
        CREATE TABLE IF NOT EXISTS visits (
            seq            INTEGER PRIMARY KEY AUTOINCREMENT,
            id             TEXT    NOT NULL UNIQUE,
            ts_ms          INTEGER NOT NULL,
            origin         TEXT    NOT NULL,
            url            TEXT,
            title          TEXT,
            transfer_bytes INTEGER NOT NULL DEFAULT 0,
            resource_count INTEGER NOT NULL DEFAULT 0,
            load_time_ms   INTEGER NOT NULL DEFAULT 0,
            long_tasks     INTEGER NOT NULL DEFAULT 0,
            energy_mj      REAL    NOT NULL DEFAULT 0,
            co2_g          REAL    NOT NULL DEFAULT 0
        )
    )";

    if (!query.exec(QString::fromUtf8(createSql))) {
        qWarning() << "VisitStore: failed to create visits table:"
                   << lastErrorString(query);
        return false;
    }

    const char *metaSql = R"(
        CREATE TABLE IF NOT EXISTS meta (
            key   TEXT PRIMARY KEY,
            value TEXT NOT NULL
        )
    )";

    if (!query.exec(QString::fromUtf8(metaSql))) {
        qWarning() << "VisitStore: failed to create meta table:"
                   << lastErrorString(query);
        return false;
    }

    query.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO meta (key, value) VALUES ('schema_version', ?)"
    ));
    query.addBindValue(QString::number(kSchemaVersion));
    if (!query.exec()) {
        qWarning() << "VisitStore: failed to write schema version:"
                   << lastErrorString(query);
    }

    return true;
}

bool VisitStore::insertVisit(const VisitRecord &record, bool *outInserted)
{
    if (outInserted) {
        *outInserted = false;
    }

    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);

    query.prepare(QStringLiteral(R"(
        INSERT OR IGNORE INTO visits (
            id,
            ts_ms,
            origin,
            url,
            title,
            transfer_bytes,
            resource_count,
            load_time_ms,
            long_tasks,
            energy_mj,
            co2_g
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )"));

    query.addBindValue(record.id);
    query.addBindValue(record.timestamp.toMSecsSinceEpoch());
    query.addBindValue(record.origin);
    query.addBindValue(textOrNull(record.url));
    query.addBindValue(textOrNull(record.title));
    query.addBindValue(record.transferBytes);
    query.addBindValue(record.resourceCount);
    query.addBindValue(record.loadTimeMs);
    query.addBindValue(record.longTasks);
    query.addBindValue(record.estimatedEnergy_mJ);
    query.addBindValue(record.estimatedCO2_g);

    if (!query.exec()) {
        qWarning() << "VisitStore: insertVisit failed:" << lastErrorString(query);
        return false;
    }

    if (outInserted) {
        *outInserted = query.numRowsAffected() > 0;
    }

    return true;
}

std::vector<VisitRecord> VisitStore::loadRecent(int limit)
{
    std::vector<VisitRecord> results;

    if (limit <= 0 || !ensureConnection()) {
        return results;
    }

    QSqlQuery query(db_);

    const QString sql = QStringLiteral(
        "SELECT id, ts_ms, origin, url, title, transfer_bytes, resource_count, "
        "load_time_ms, long_tasks, energy_mj, co2_g FROM ("
        "  SELECT * FROM visits ORDER BY seq DESC LIMIT ?"
        ") ORDER BY seq ASC"
    );

    if (!query.prepare(sql)) {
        qWarning() << "VisitStore: loadRecent prepare failed:"
                   << lastErrorString(query);
        return results;
    }

    query.addBindValue(limit);

    if (!query.exec()) {
        qWarning() << "VisitStore: loadRecent exec failed:"
                   << lastErrorString(query);
        return results;
    }

    while (query.next()) {
        VisitRecord record;

        record.id        = query.value(0).toString();
        record.timestamp = QDateTime::fromMSecsSinceEpoch(query.value(1).toLongLong(),
                                                          QTimeZone::utc());
        record.origin    = query.value(2).toString();
        record.url       = query.value(3).toString();
        record.title     = query.value(4).toString();

        record.transferBytes      = query.value(5).toLongLong();
        record.resourceCount      = query.value(6).toInt();
        record.loadTimeMs         = query.value(7).toInt();
        record.longTasks          = query.value(8).toInt();
        record.estimatedEnergy_mJ = query.value(9).toDouble();
        record.estimatedCO2_g     = query.value(10).toDouble();

        results.push_back(std::move(record));
    }

    return results;
}

bool VisitStore::removeVisit(const QString &id)
{
    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);
    query.prepare(QStringLiteral("DELETE FROM visits WHERE id = ?"));
    query.addBindValue(id);
    if (!query.exec()) {
        qWarning() << "VisitStore: removeVisit failed:" << lastErrorString(query);
        return false;
    }
    return true;
}

bool VisitStore::pruneTo(int keep)
{
    if (keep < 0 || !ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);
    query.prepare(QStringLiteral(
        "DELETE FROM visits WHERE seq NOT IN ("
        "  SELECT seq FROM visits ORDER BY seq DESC LIMIT ?"
        ")"
    ));
    query.addBindValue(keep);
    if (!query.exec()) {
        qWarning() << "VisitStore: pruneTo failed:" << lastErrorString(query);
        return false;
    }

    const int removed = query.numRowsAffected();
    if (removed > 0) {
        qInfo() << "VisitStore: pruned" << removed << "visits beyond" << keep;
    }
    return true;
}

qint64 VisitStore::count()
{
    if (!ensureConnection()) {
        return 0;
    }

    QSqlQuery query(db_);
    if (!query.exec(QStringLiteral("SELECT COUNT(*) FROM visits")) || !query.next()) {
        qWarning() << "VisitStore: count failed:" << lastErrorString(query);
        return 0;
    }
    return query.value(0).toLongLong();
}

bool VisitStore::clear()
{
    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);
    if (!query.exec(QStringLiteral("DELETE FROM visits"))) {
        qWarning() << "VisitStore: clear failed:" << lastErrorString(query);
        return false;
    }
    return true;
}

} // namespace ecotrace
