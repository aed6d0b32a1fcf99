// Alert engine: active-time gate, inclusive thresholds, cooldown.

#include <gtest/gtest.h>

#include <QHash>
#include <QTimeZone>

#include "ecotrace/alert_engine.hpp"

namespace ecotrace {
namespace {

// Window source returning a fixed sum per origin and recording the last query.
class FixedWindow : public WindowSumSource
{
public:
    double co2InWindow(const QString &origin,
                       const QDateTime &from,
                       const QDateTime &to) const override
    {
        ++calls;
        lastFrom = from;
        lastTo = to;
        return sums.value(origin, 0.0);
    }

    QHash<QString, double> sums;
    mutable int calls = 0;
    mutable QDateTime lastFrom;
    mutable QDateTime lastTo;
};

QDateTime noon()
{
    return QDateTime(QDate(2024, 3, 15), QTime(12, 0), QTimeZone::utc());
}

Settings alertSettings()
{
    Settings s;
    s.co2ThresholdG = 5.0;
    s.timeThresholdS = 0;
    s.windowMinutes = 10;
    s.cooldownMinutes = 5;
    return s;
}

TEST(AlertEngineTest, DisabledNeverFiresOrQueries) {
  AlertEngine engine;
  FixedWindow window;
  window.sums.insert("a.test", 100.0);

  Settings s = alertSettings();
  s.alertEnabled = false;

  EXPECT_FALSE(engine.evaluate("a.test", noon(), s, window).has_value());
  EXPECT_EQ(window.calls, 0);
}

TEST(AlertEngineTest, DisabledReportsIdlePhase) {
  AlertEngine engine;
  FixedWindow window;
  window.sums.insert("a.test", 100.0);

  Settings s = alertSettings();
  ASSERT_TRUE(engine.evaluate("a.test", noon(), s, window).has_value());
  EXPECT_EQ(engine.phase("a.test", noon(), s), AlertPhase::Cooldown);

  s.alertEnabled = false;
  EXPECT_EQ(engine.phase("a.test", noon(), s), AlertPhase::Idle);
  EXPECT_EQ(engine.phase("a.test", noon().addSecs(3600), s), AlertPhase::Idle);
}

TEST(AlertEngineTest, BelowActiveTimeStaysIdle) {
  AlertEngine engine;
  FixedWindow window;
  window.sums.insert("a.test", 100.0);

  Settings s = alertSettings();
  s.timeThresholdS = 3;

  engine.recordActivity("a.test", true);
  engine.recordActivity("a.test", true);
  engine.recordActivity("a.test", false);  // inactive samples do not count

  EXPECT_EQ(engine.state("a.test").activeSeconds, 2);
  EXPECT_EQ(engine.phase("a.test", noon(), s), AlertPhase::Idle);
  EXPECT_FALSE(engine.evaluate("a.test", noon(), s, window).has_value());
  EXPECT_EQ(window.calls, 0);

  engine.recordActivity("a.test", true);
  EXPECT_EQ(engine.phase("a.test", noon(), s), AlertPhase::Armed);
  EXPECT_TRUE(engine.evaluate("a.test", noon(), s, window).has_value());
}

TEST(AlertEngineTest, QueriesTrailingWindowEndingNow) {
  AlertEngine engine;
  FixedWindow window;
  const Settings s = alertSettings();

  engine.evaluate("a.test", noon(), s, window);

  ASSERT_EQ(window.calls, 1);
  EXPECT_EQ(window.lastTo, noon());
  EXPECT_EQ(window.lastFrom, noon().addSecs(-10 * 60));
}

TEST(AlertEngineTest, ThresholdIsInclusive) {
  AlertEngine engine;
  FixedWindow window;
  const Settings s = alertSettings();

  window.sums.insert("a.test", 4.999);
  EXPECT_FALSE(engine.evaluate("a.test", noon(), s, window).has_value());

  window.sums.insert("a.test", 5.0);
  const auto event = engine.evaluate("a.test", noon(), s, window);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->origin, "a.test");
  EXPECT_DOUBLE_EQ(event->windowSum_g, 5.0);
  EXPECT_EQ(event->windowMinutes, 10);
  EXPECT_EQ(event->firedAt, noon());
  EXPECT_EQ(engine.state("a.test").lastAlertAt, noon());
}

TEST(AlertEngineTest, CooldownSuppressesUntilElapsed) {
  AlertEngine engine;
  FixedWindow window;
  window.sums.insert("a.test", 6.0);
  const Settings s = alertSettings();

  ASSERT_TRUE(engine.evaluate("a.test", noon(), s, window).has_value());
  EXPECT_EQ(engine.phase("a.test", noon(), s), AlertPhase::Cooldown);

  const QDateTime almost = noon().addSecs(5 * 60 - 1);
  EXPECT_FALSE(engine.evaluate("a.test", almost, s, window).has_value());
  EXPECT_EQ(engine.state("a.test").lastAlertAt, noon());

  const QDateTime elapsed = noon().addSecs(5 * 60);
  EXPECT_EQ(engine.phase("a.test", elapsed, s), AlertPhase::Armed);
  const auto second = engine.evaluate("a.test", elapsed, s, window);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(engine.state("a.test").lastAlertAt, elapsed);
}

TEST(AlertEngineTest, LastAlertNeverMovesBackwards) {
  AlertEngine engine;
  FixedWindow window;
  window.sums.insert("a.test", 6.0);
  Settings s = alertSettings();
  s.cooldownMinutes = 0;

  ASSERT_TRUE(engine.evaluate("a.test", noon(), s, window).has_value());

  // A clock that steps back is treated as still cooling down.
  EXPECT_FALSE(engine.evaluate("a.test", noon().addSecs(-60), s, window).has_value());
  EXPECT_EQ(engine.state("a.test").lastAlertAt, noon());
}

TEST(AlertEngineTest, OriginsAreIndependent) {
  AlertEngine engine;
  FixedWindow window;
  window.sums.insert("a.test", 6.0);
  window.sums.insert("b.test", 6.0);
  const Settings s = alertSettings();

  ASSERT_TRUE(engine.evaluate("a.test", noon(), s, window).has_value());
  EXPECT_TRUE(engine.evaluate("b.test", noon(), s, window).has_value());
  EXPECT_FALSE(engine.evaluate("a.test", noon(), s, window).has_value());
}

TEST(AlertEngineTest, ResetActiveOnlyClearsAccumulator) {
  AlertEngine engine;
  FixedWindow window;
  window.sums.insert("a.test", 6.0);
  const Settings s = alertSettings();

  engine.recordActivity("a.test", true);
  engine.recordActivity("a.test", true);
  ASSERT_TRUE(engine.evaluate("a.test", noon(), s, window).has_value());

  engine.resetActive("a.test");
  const AlertState state = engine.state("a.test");
  EXPECT_EQ(state.activeSeconds, 0);
  EXPECT_EQ(state.lastAlertAt, noon());
}

TEST(AlertEngineTest, OnRecordCreatesState) {
  AlertEngine engine;
  engine.onRecord("a.test");
  engine.onRecord("a.test");

  EXPECT_EQ(engine.origins(), QStringList{"a.test"});
  EXPECT_EQ(engine.state("a.test").activeSeconds, 0);
  EXPECT_FALSE(engine.state("a.test").lastAlertAt.has_value());

  engine.clear();
  EXPECT_TRUE(engine.origins().isEmpty());
}

}  // namespace
}  // namespace ecotrace
