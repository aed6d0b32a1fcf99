// Settings: defaults, JSON keys (current and legacy), INI persistence.

#include <gtest/gtest.h>

#include <QJsonObject>
#include <QSettings>
#include <QTemporaryDir>

#include <limits>

#include "ecotrace/settings.hpp"

namespace ecotrace {
namespace {

TEST(SettingsTest, Defaults) {
  const Settings s;
  EXPECT_DOUBLE_EQ(s.energyFactor, 1e-6);
  EXPECT_DOUBLE_EQ(s.co2Factor, 1e-6);
  EXPECT_TRUE(s.alertEnabled);
  EXPECT_DOUBLE_EQ(s.co2ThresholdG, 10.0);
  EXPECT_EQ(s.timeThresholdS, 30);
  EXPECT_EQ(s.windowMinutes, 10);
  EXPECT_EQ(s.checkIntervalS, 10);
  EXPECT_EQ(s.cooldownMinutes, 5);
  EXPECT_EQ(s.logCapacity, 10000);
  EXPECT_EQ(sanitized(s), s);
}

TEST(SettingsTest, SanitizedReplacesOutOfRangeFields) {
  Settings s;
  s.co2Factor = -1.0;
  s.co2ThresholdG = -3.0;
  s.windowMinutes = 0;
  s.cooldownMinutes = -1;
  s.logCapacity = 0;
  s.timeThresholdS = 0;  // zero is a valid gate

  const Settings clean = sanitized(s);
  const Settings defaults;
  EXPECT_DOUBLE_EQ(clean.co2Factor, defaults.co2Factor);
  EXPECT_DOUBLE_EQ(clean.co2ThresholdG, defaults.co2ThresholdG);
  EXPECT_EQ(clean.windowMinutes, defaults.windowMinutes);
  EXPECT_EQ(clean.cooldownMinutes, defaults.cooldownMinutes);
  EXPECT_EQ(clean.logCapacity, defaults.logCapacity);
  EXPECT_EQ(clean.timeThresholdS, 0);
}

TEST(SettingsTest, OversizeCheckIntervalFallsBackToDefault) {
  QJsonObject obj;
  obj.insert("checkIntervalS", 3000000);
  const Settings s = settingsFromJson(obj);
  EXPECT_EQ(s.checkIntervalS, 10);
  EXPECT_EQ(checkIntervalMs(s), 10000);

  obj.insert("checkIntervalS", Settings::MaxCheckIntervalS);
  EXPECT_EQ(checkIntervalMs(settingsFromJson(obj)), Settings::MaxCheckIntervalS * 1000);

  Settings raw;
  raw.checkIntervalS = std::numeric_limits<int>::max();
  EXPECT_EQ(checkIntervalMs(raw), std::numeric_limits<int>::max());
  EXPECT_EQ(sanitized(raw).checkIntervalS, 10);
}

TEST(SettingsTest, OversizeIniIntervalIsReplaced) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = dir.filePath("big.ini");
  {
    QSettings store(path, QSettings::IniFormat);
    store.setValue("alert/check_interval_s", 2147483647);
    store.sync();
  }

  QSettings store(path, QSettings::IniFormat);
  EXPECT_EQ(loadSettings(store).checkIntervalS, 10);
}

TEST(SettingsTest, JsonRoundTrip) {
  Settings s;
  s.co2ThresholdG = 2.5;
  s.alertEnabled = false;
  s.windowMinutes = 3;
  s.logCapacity = 50;

  EXPECT_EQ(settingsFromJson(settingsToJson(s)), s);
}

TEST(SettingsTest, LegacyKeysAreAccepted) {
  QJsonObject obj;
  obj.insert("energyFactor_mJ_per_byte", 2e-6);
  obj.insert("co2Factor_g_per_byte", 3e-6);
  obj.insert("alert_enabled", false);
  obj.insert("alert_co2_threshold_g", 4.0);
  obj.insert("alert_time_threshold_s", 12);
  obj.insert("alert_window_minutes", 7);
  obj.insert("alert_check_interval_s", 2);
  obj.insert("alert_cooldown_min", 1);
  obj.insert("log_capacity", 99);

  const Settings s = settingsFromJson(obj);
  EXPECT_DOUBLE_EQ(s.energyFactor, 2e-6);
  EXPECT_DOUBLE_EQ(s.co2Factor, 3e-6);
  EXPECT_FALSE(s.alertEnabled);
  EXPECT_DOUBLE_EQ(s.co2ThresholdG, 4.0);
  EXPECT_EQ(s.timeThresholdS, 12);
  EXPECT_EQ(s.windowMinutes, 7);
  EXPECT_EQ(s.checkIntervalS, 2);
  EXPECT_EQ(s.cooldownMinutes, 1);
  EXPECT_EQ(s.logCapacity, 99);
}

TEST(SettingsTest, MalformedValuesFallBackToDefaults) {
  QJsonObject obj;
  obj.insert("co2ThresholdG", "lots");
  obj.insert("windowMinutes", QJsonObject());
  obj.insert("logCapacity", -5);
  obj.insert("cooldownMinutes", "2");

  const Settings s = settingsFromJson(obj);
  const Settings defaults;
  EXPECT_DOUBLE_EQ(s.co2ThresholdG, defaults.co2ThresholdG);
  EXPECT_EQ(s.windowMinutes, defaults.windowMinutes);
  EXPECT_EQ(s.logCapacity, defaults.logCapacity);
  EXPECT_EQ(s.cooldownMinutes, 2);
}

TEST(SettingsTest, MissingKeysKeepBaseValues) {
  Settings base;
  base.co2ThresholdG = 1.0;
  base.windowMinutes = 4;

  QJsonObject patch;
  patch.insert("alert_window_minutes", 8);

  const Settings s = settingsFromJson(patch, base);
  EXPECT_DOUBLE_EQ(s.co2ThresholdG, 1.0);
  EXPECT_EQ(s.windowMinutes, 8);
}

TEST(SettingsTest, IniRoundTrip) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = dir.filePath("ecotrace.ini");

  Settings s;
  s.co2Factor = 5e-7;
  s.co2ThresholdG = 12.5;
  s.checkIntervalS = 30;
  s.logCapacity = 500;
  {
    QSettings store(path, QSettings::IniFormat);
    saveSettings(store, s);
  }

  QSettings store(path, QSettings::IniFormat);
  EXPECT_EQ(loadSettings(store), s);
  EXPECT_EQ(store.value("alert/co2_threshold_g").toDouble(), 12.5);
}

TEST(SettingsTest, MissingIniYieldsDefaults) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  QSettings store(dir.filePath("absent.ini"), QSettings::IniFormat);
  EXPECT_EQ(loadSettings(store), Settings{});
}

TEST(SettingsTest, InvalidIniValuesAreReplaced) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = dir.filePath("bad.ini");
  {
    QSettings store(path, QSettings::IniFormat);
    store.setValue("alert/window_minutes", "soon");
    store.setValue("log/capacity", 0);
    store.setValue("alert/cooldown_minutes", 9);
    store.sync();
  }

  QSettings store(path, QSettings::IniFormat);
  const Settings s = loadSettings(store);
  EXPECT_EQ(s.windowMinutes, 10);
  EXPECT_EQ(s.logCapacity, 10000);
  EXPECT_EQ(s.cooldownMinutes, 9);
}

}  // namespace
}  // namespace ecotrace
