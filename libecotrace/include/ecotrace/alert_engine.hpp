#pragma once

#include <QDateTime>
#include <QHash>
#include <QMetaType>
#include <QMutex>
#include <QString>
#include <QStringList>

#include <optional>

#include "ecotrace/settings.hpp"

namespace ecotrace {

enum class AlertPhase {
    Idle,      // not enough active time yet
    Armed,     // active long enough; fires when the window sum crosses the threshold
    Cooldown   // fired recently; further alerts suppressed
};

QString alertPhaseToString(AlertPhase phase);

struct AlertState
{
    qint64 activeSeconds = 0;
    std::optional<QDateTime> lastAlertAt;
};

struct AlertEvent
{
    QString   origin;
    double    windowSum_g   = 0.0;
    int       windowMinutes = 0;
    QDateTime firedAt;
};

// Read access to the retained visits, used to compute the sliding window.
class WindowSumSource
{
public:
    virtual ~WindowSumSource() = default;

    // Sum of estimatedCO2_g for `origin` with from <= timestamp <= to.
    virtual double co2InWindow(const QString &origin,
                               const QDateTime &from,
                               const QDateTime &to) const = 0;
};

// Per-origin alert state machine: active-time gate, sliding CO2 window,
// cooldown. Thread-safe; the engine's lock is never held while the window
// source is queried.
class AlertEngine
{
public:
    // Makes sure the origin has a state entry.
    void onRecord(const QString &origin);

    // 1 Hz activity sample; adds one second while `active`.
    void recordActivity(const QString &origin, bool active);

    // One evaluation tick at `now`. Returns the alert that fired, if any.
    std::optional<AlertEvent> evaluate(const QString &origin,
                                       const QDateTime &now,
                                       const Settings &settings,
                                       const WindowSumSource &source);

    AlertState state(const QString &origin) const;

    // Always Idle while alerts are disabled.
    AlertPhase phase(const QString &origin,
                     const QDateTime &now,
                     const Settings &settings) const;

    // Debug helper; the accumulator never decreases otherwise.
    void resetActive(const QString &origin);

    QStringList origins() const;
    void clear();

private:
    static bool inCooldown(const AlertState &state,
                           const QDateTime &now,
                           const Settings &settings);

    mutable QMutex mutex_;
    QHash<QString, AlertState> states_;
};

} // namespace ecotrace

Q_DECLARE_METATYPE(ecotrace::AlertEvent)
