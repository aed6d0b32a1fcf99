#include "ecotrace/settings.hpp"

#include <QDebug>
#include <QJsonValue>
#include <QSettings>
#include <QStringList>
#include <QVariant>

#include <cmath>
#include <initializer_list>
#include <limits>

namespace ecotrace {

namespace {

bool validFactor(double v)
{
    return std::isfinite(v) && v >= 0.0;
}

// First key of `names` present in `obj`, or an undefined value.
QJsonValue pick(const QJsonObject &obj, std::initializer_list<const char *> names)
{
    for (const char *name : names) {
        const QString key = QString::fromLatin1(name);
        if (obj.contains(key)) {
            return obj.value(key);
        }
    }
    return QJsonValue(QJsonValue::Undefined);
}

void readDouble(const QJsonValue &v, double &out)
{
    if (v.isDouble()) {
        out = v.toDouble();
    } else if (v.isString()) {
        bool ok = false;
        const double d = v.toString().toDouble(&ok);
        out = ok ? d : std::nan("");
    } else if (!v.isUndefined()) {
        out = std::nan("");
    }
}

void readInt(const QJsonValue &v, int &out)
{
    if (v.isDouble()) {
        const double d = v.toDouble();
        out = (std::isfinite(d) && std::abs(d) < 1e9) ? static_cast<int>(d) : -1;
    } else if (v.isString()) {
        bool ok = false;
        const int i = v.toString().toInt(&ok);
        out = ok ? i : -1;
    } else if (!v.isUndefined()) {
        out = -1;
    }
}

void readBool(const QJsonValue &v, bool &out)
{
    if (v.isBool()) {
        out = v.toBool();
    } else if (v.isDouble()) {
        out = v.toDouble() != 0.0;
    } else if (v.isString()) {
        const QString s = v.toString().trimmed().toLower();
        if (s == QLatin1String("true") || s == QLatin1String("1")) {
            out = true;
        } else if (s == QLatin1String("false") || s == QLatin1String("0")) {
            out = false;
        }
    }
}

double settingsDouble(QSettings &store, const QString &key, double fallback)
{
    const QVariant v = store.value(key);
    if (!v.isValid()) {
        return fallback;
    }
    bool ok = false;
    const double d = v.toDouble(&ok);
    return ok ? d : std::nan("");
}

int settingsInt(QSettings &store, const QString &key, int fallback)
{
    const QVariant v = store.value(key);
    if (!v.isValid()) {
        return fallback;
    }
    bool ok = false;
    const int i = v.toInt(&ok);
    return ok ? i : -1;
}

} // namespace

bool operator==(const Settings &a, const Settings &b)
{
    return a.energyFactor == b.energyFactor
        && a.co2Factor == b.co2Factor
        && a.alertEnabled == b.alertEnabled
        && a.co2ThresholdG == b.co2ThresholdG
        && a.timeThresholdS == b.timeThresholdS
        && a.windowMinutes == b.windowMinutes
        && a.checkIntervalS == b.checkIntervalS
        && a.cooldownMinutes == b.cooldownMinutes
        && a.logCapacity == b.logCapacity;
}

bool operator!=(const Settings &a, const Settings &b)
{
    return !(a == b);
}

Settings sanitized(const Settings &s)
{
    const Settings defaults;
    Settings out = s;
    QStringList replaced;

    if (!validFactor(out.energyFactor)) {
        out.energyFactor = defaults.energyFactor;
        replaced << QStringLiteral("energyFactor");
    }
    if (!validFactor(out.co2Factor)) {
        out.co2Factor = defaults.co2Factor;
        replaced << QStringLiteral("co2Factor");
    }
    if (!std::isfinite(out.co2ThresholdG) || out.co2ThresholdG < 0.0) {
        out.co2ThresholdG = defaults.co2ThresholdG;
        replaced << QStringLiteral("co2ThresholdG");
    }
    if (out.timeThresholdS < 0) {
        out.timeThresholdS = defaults.timeThresholdS;
        replaced << QStringLiteral("timeThresholdS");
    }
    if (out.windowMinutes < 1) {
        out.windowMinutes = defaults.windowMinutes;
        replaced << QStringLiteral("windowMinutes");
    }
    if (out.checkIntervalS < 1 || out.checkIntervalS > Settings::MaxCheckIntervalS) {
        out.checkIntervalS = defaults.checkIntervalS;
        replaced << QStringLiteral("checkIntervalS");
    }
    if (out.cooldownMinutes < 0) {
        out.cooldownMinutes = defaults.cooldownMinutes;
        replaced << QStringLiteral("cooldownMinutes");
    }
    if (out.logCapacity < 1) {
        out.logCapacity = defaults.logCapacity;
        replaced << QStringLiteral("logCapacity");
    }

    if (!replaced.isEmpty()) {
        qWarning() << "Settings: invalid values replaced by defaults:"
                   << replaced.join(QStringLiteral(", "));
    }
    return out;
}

int checkIntervalMs(const Settings &s)
{
    const qint64 ms = static_cast<qint64>(s.checkIntervalS) * 1000;
    return static_cast<int>(qBound<qint64>(1, ms, std::numeric_limits<int>::max()));
}

QJsonObject settingsToJson(const Settings &s)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("energyFactor"), s.energyFactor);
    obj.insert(QStringLiteral("co2Factor"), s.co2Factor);
    obj.insert(QStringLiteral("alertEnabled"), s.alertEnabled);
    obj.insert(QStringLiteral("co2ThresholdG"), s.co2ThresholdG);
    obj.insert(QStringLiteral("timeThresholdS"), s.timeThresholdS);
    obj.insert(QStringLiteral("windowMinutes"), s.windowMinutes);
    obj.insert(QStringLiteral("checkIntervalS"), s.checkIntervalS);
    obj.insert(QStringLiteral("cooldownMinutes"), s.cooldownMinutes);
    obj.insert(QStringLiteral("logCapacity"), s.logCapacity);
    return obj;
}

Settings settingsFromJson(const QJsonObject &obj, const Settings &base)
{
    Settings s = base;

    readDouble(pick(obj, {"energyFactor", "energyFactor_mJ_per_byte"}), s.energyFactor);
    readDouble(pick(obj, {"co2Factor", "co2Factor_g_per_byte"}), s.co2Factor);
    readBool(pick(obj, {"alertEnabled", "alert_enabled"}), s.alertEnabled);
    readDouble(pick(obj, {"co2ThresholdG", "alert_co2_threshold_g"}), s.co2ThresholdG);
    readInt(pick(obj, {"timeThresholdS", "alert_time_threshold_s"}), s.timeThresholdS);
    readInt(pick(obj, {"windowMinutes", "alert_window_minutes"}), s.windowMinutes);
    readInt(pick(obj, {"checkIntervalS", "alert_check_interval_s"}), s.checkIntervalS);
    readInt(pick(obj, {"cooldownMinutes", "alert_cooldown_min"}), s.cooldownMinutes);
    readInt(pick(obj, {"logCapacity", "log_capacity"}), s.logCapacity);

    return sanitized(s);
}

Settings loadSettings(QSettings &store)
{
    const Settings defaults;
    Settings s;

    store.beginGroup(QStringLiteral("model"));
    s.energyFactor = settingsDouble(store, QStringLiteral("energy_factor"), defaults.energyFactor);
    s.co2Factor    = settingsDouble(store, QStringLiteral("co2_factor"), defaults.co2Factor);
    store.endGroup();

    store.beginGroup(QStringLiteral("alert"));
    s.alertEnabled    = store.value(QStringLiteral("enabled"), defaults.alertEnabled).toBool();
    s.co2ThresholdG   = settingsDouble(store, QStringLiteral("co2_threshold_g"), defaults.co2ThresholdG);
    s.timeThresholdS  = settingsInt(store, QStringLiteral("time_threshold_s"), defaults.timeThresholdS);
    s.windowMinutes   = settingsInt(store, QStringLiteral("window_minutes"), defaults.windowMinutes);
    s.checkIntervalS  = settingsInt(store, QStringLiteral("check_interval_s"), defaults.checkIntervalS);
    s.cooldownMinutes = settingsInt(store, QStringLiteral("cooldown_minutes"), defaults.cooldownMinutes);
    store.endGroup();

    store.beginGroup(QStringLiteral("log"));
    s.logCapacity = settingsInt(store, QStringLiteral("capacity"), defaults.logCapacity);
    store.endGroup();

    if (store.status() != QSettings::NoError) {
        qWarning() << "Settings: failed to read" << store.fileName()
                   << "- using defaults";
        return Settings{};
    }

    return sanitized(s);
}

void saveSettings(QSettings &store, const Settings &s)
{
    store.beginGroup(QStringLiteral("model"));
    store.setValue(QStringLiteral("energy_factor"), s.energyFactor);
    store.setValue(QStringLiteral("co2_factor"), s.co2Factor);
    store.endGroup();

    store.beginGroup(QStringLiteral("alert"));
    store.setValue(QStringLiteral("enabled"), s.alertEnabled);
    store.setValue(QStringLiteral("co2_threshold_g"), s.co2ThresholdG);
    store.setValue(QStringLiteral("time_threshold_s"), s.timeThresholdS);
    store.setValue(QStringLiteral("window_minutes"), s.windowMinutes);
    store.setValue(QStringLiteral("check_interval_s"), s.checkIntervalS);
    store.setValue(QStringLiteral("cooldown_minutes"), s.cooldownMinutes);
    store.endGroup();

    store.beginGroup(QStringLiteral("log"));
    store.setValue(QStringLiteral("capacity"), s.logCapacity);
    store.endGroup();

    store.sync();
    if (store.status() != QSettings::NoError) {
        qWarning() << "Settings: failed to write" << store.fileName();
    }
}

} // namespace ecotrace
