// Daemon method handlers, called directly without a bus connection.

#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QThread>
#include <QTimeZone>

#include <functional>
#include <limits>
#include <memory>

#include "ecotrace_daemon.hpp"
#include "ecotrace/snapshot_json.hpp"
#include "ecotrace/visit_store.hpp"

namespace ecotrace {
namespace {

QJsonObject visitJson(const QString &id, const QString &origin)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), id);
    obj.insert(QStringLiteral("origin"), origin);
    obj.insert(QStringLiteral("timestamp"),
               QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    obj.insert(QStringLiteral("transferBytes"), 1000);
    return obj;
}

QString compact(const QJsonObject &obj)
{
    return toCompactString(obj);
}

bool pumpUntil(const std::function<bool()> &done, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!done()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(5);
    }
    return true;
}

// Reads the daemon's database through a connection of its own.
qint64 storedCount(const QString &dbPath)
{
    VisitStore reader(dbPath, QStringLiteral("ecotrace_test_reader"));
    if (!reader.open() || !reader.initSchema()) {
        return -1;
    }
    return reader.count();
}

TEST(EcoTraceDaemonTest, ImportStartsTickersForAcceptedOrigins) {
  EcoTraceDaemon daemon(Settings{}, QString());

  QJsonArray arr;
  arr.append(visitJson("v1", "a.test"));
  arr.append(visitJson("v2", "b.test"));
  arr.append(visitJson("v3", ""));
  const QString reply = daemon.Import(toCompactString(arr));

  const QJsonObject summary = QJsonDocument::fromJson(reply.toUtf8()).object();
  EXPECT_EQ(summary.value("accepted").toInt(), 2);
  EXPECT_EQ(summary.value("invalid").toInt(), 1);

  EXPECT_TRUE(daemon.scheduler().isRunning("a.test"));
  EXPECT_TRUE(daemon.scheduler().isRunning("b.test"));
  EXPECT_EQ(daemon.scheduler().origins().size(), 2);
}

TEST(EcoTraceDaemonTest, InactiveReportDoesNotStartTicker) {
  EcoTraceDaemon daemon(Settings{}, QString());

  daemon.ReportActivity("idle.test", false);
  EXPECT_FALSE(daemon.scheduler().isRunning("idle.test"));

  daemon.ReportActivity("busy.test", true);
  EXPECT_TRUE(daemon.scheduler().isRunning("busy.test"));
  EXPECT_EQ(daemon.coordinator().alertState("busy.test").activeSeconds, 1);

  daemon.CloseContext("busy.test");
  EXPECT_FALSE(daemon.scheduler().isRunning("busy.test"));
}

TEST(EcoTraceDaemonTest, DaySeriesWidthIsBounded) {
  EcoTraceDaemon daemon(Settings{}, QString());

  const QString reply = daemon.GetDaySeries(std::numeric_limits<int>::max());
  const QJsonArray series = QJsonDocument::fromJson(reply.toUtf8()).array();
  EXPECT_EQ(series.size(), AggregateIndex::MaxDaySeries);

  EXPECT_TRUE(QJsonDocument::fromJson(daemon.GetDaySeries(-1).toUtf8()).array().isEmpty());
}

TEST(EcoTraceDaemonTest, OversizeIntervalKeepsDefaultTicker) {
  EcoTraceDaemon daemon(Settings{}, QString());

  QJsonObject patch;
  patch.insert("checkIntervalS", 3000000);
  const QJsonObject applied =
      QJsonDocument::fromJson(daemon.UpdateSettings(compact(patch)).toUtf8()).object();

  EXPECT_EQ(applied.value("checkIntervalS").toInt(), 10);
  EXPECT_EQ(daemon.scheduler().intervalMs(), 10000);

  patch.insert("checkIntervalS", 60);
  daemon.UpdateSettings(compact(patch));
  EXPECT_EQ(daemon.scheduler().intervalMs(), 60000);
}

TEST(EcoTraceDaemonTest, EvictedVisitsLeaveTheStore) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString dbPath = dir.filePath("visits.db");

  Settings settings;
  settings.logCapacity = 3;
  {
    EcoTraceDaemon daemon(settings, dbPath);
    ASSERT_TRUE(daemon.init());

    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(daemon.Ingest(compact(visitJson(QStringLiteral("v%1").arg(i), "a.test"))),
                "accepted");
    }

    ASSERT_TRUE(pumpUntil([&dbPath]() {
      VisitStore reader(dbPath, QStringLiteral("ecotrace_test_reader"));
      if (!reader.open()) {
        return false;
      }
      const auto rows = reader.loadRecent(10);
      return rows.size() == 3u && rows.front().id == "v2";
    }));

    // Cumulative totals cover every accepted visit while the process runs.
    EXPECT_EQ(daemon.coordinator().totals().visitCount, 5);
  }

  EXPECT_EQ(storedCount(dbPath), 3);
}

TEST(EcoTraceDaemonTest, StartupTrimsStoreToCapacityAndSeedsLog) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString dbPath = dir.filePath("visits.db");

  {
    VisitStore seed(dbPath, QStringLiteral("ecotrace_test_seed"));
    ASSERT_TRUE(seed.open());
    ASSERT_TRUE(seed.initSchema());
    for (int i = 0; i < 6; ++i) {
      VisitRecord r;
      r.id = QStringLiteral("old%1").arg(i);
      r.origin = QStringLiteral("a.test");
      r.timestamp = QDateTime(QDate(2024, 3, 15), QTime(10, i), QTimeZone::utc());
      ASSERT_TRUE(seed.insertVisit(r));
    }
  }

  Settings settings;
  settings.logCapacity = 4;
  EcoTraceDaemon daemon(settings, dbPath);
  ASSERT_TRUE(daemon.init());

  const auto log = daemon.coordinator().logSnapshot();
  ASSERT_EQ(log.size(), 4u);
  EXPECT_EQ(log.front().id, "old2");
  EXPECT_EQ(daemon.coordinator().totals().visitCount, 4);

  EXPECT_TRUE(pumpUntil([&dbPath]() { return storedCount(dbPath) == 4; }));
}

}  // namespace
}  // namespace ecotrace
