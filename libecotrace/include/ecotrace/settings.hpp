#pragma once

#include <QJsonObject>
#include <QString>

class QSettings;

namespace ecotrace {

// Estimation factors and alert tuning. Values outside their valid range are
// replaced by the defaults below when read through any of the loaders.
struct Settings
{
    double energyFactor = 1e-6;   // mJ per transferred byte
    double co2Factor    = 1e-6;   // g CO2 per transferred byte

    bool   alertEnabled    = true;
    double co2ThresholdG   = 10.0;
    int    timeThresholdS  = 30;
    int    windowMinutes   = 10;
    int    checkIntervalS  = 10;
    int    cooldownMinutes = 5;

    int    logCapacity = 10000;

    static constexpr int MaxCheckIntervalS = 86400;
};

bool operator==(const Settings &a, const Settings &b);
bool operator!=(const Settings &a, const Settings &b);

// Replace every out-of-range field with its default.
Settings sanitized(const Settings &s);

// checkIntervalS as a timer interval, clamped to what QTimer accepts.
int checkIntervalMs(const Settings &s);

// JSON helpers. Unknown keys are ignored; both the camelCase names and the
// collector's legacy names (e.g. "alert_co2_threshold_g") are accepted.
// Keys missing from `obj` keep their value from `base`.
QJsonObject settingsToJson(const Settings &s);
Settings settingsFromJson(const QJsonObject &obj, const Settings &base = Settings{});

// INI-style persistence through QSettings, grouped as [model], [alert], [log].
Settings loadSettings(QSettings &store);
void saveSettings(QSettings &store, const Settings &s);

} // namespace ecotrace
