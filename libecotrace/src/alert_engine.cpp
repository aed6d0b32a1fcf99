#include "ecotrace/alert_engine.hpp"

#include <QDebug>
#include <QMutexLocker>

namespace ecotrace {

QString alertPhaseToString(AlertPhase phase)
{
    switch (phase) {
    case AlertPhase::Idle:
        return QStringLiteral("idle");
    case AlertPhase::Armed:
        return QStringLiteral("armed");
    case AlertPhase::Cooldown:
        return QStringLiteral("cooldown");
    }

    return QStringLiteral("idle");
}

void AlertEngine::onRecord(const QString &origin)
{
    QMutexLocker locker(&mutex_);
    if (!states_.contains(origin)) {
        states_.insert(origin, AlertState{});
    }
}

void AlertEngine::recordActivity(const QString &origin, bool active)
{
    QMutexLocker locker(&mutex_);
    AlertState &state = states_[origin];
    if (active) {
        state.activeSeconds += 1;
    }
}

std::optional<AlertEvent> AlertEngine::evaluate(const QString &origin,
                                                const QDateTime &now,
                                                const Settings &settings,
                                                const WindowSumSource &source)
{
    if (!settings.alertEnabled) {
        return std::nullopt;
    }

    {
        QMutexLocker locker(&mutex_);
        const qint64 active = states_.value(origin).activeSeconds;
        if (active < settings.timeThresholdS) {
            return std::nullopt;
        }
    }

    // The window slides with `now`, so the sum is taken fresh on every tick.
    const QDateTime from = now.addSecs(-static_cast<qint64>(settings.windowMinutes) * 60);
    const double windowSum = source.co2InWindow(origin, from, now);
    if (windowSum < settings.co2ThresholdG) {
        return std::nullopt;
    }

    QMutexLocker locker(&mutex_);
    AlertState &state = states_[origin];
    if (inCooldown(state, now, settings)) {
        qDebug() << "AlertEngine: alert for" << origin << "suppressed by cooldown";
        return std::nullopt;
    }

    if (!state.lastAlertAt.has_value() || *state.lastAlertAt < now) {
        state.lastAlertAt = now;
    }

    AlertEvent event;
    event.origin        = origin;
    event.windowSum_g   = windowSum;
    event.windowMinutes = settings.windowMinutes;
    event.firedAt       = now;
    return event;
}

AlertState AlertEngine::state(const QString &origin) const
{
    QMutexLocker locker(&mutex_);
    return states_.value(origin);
}

AlertPhase AlertEngine::phase(const QString &origin,
                              const QDateTime &now,
                              const Settings &settings) const
{
    if (!settings.alertEnabled) {
        return AlertPhase::Idle;
    }

    QMutexLocker locker(&mutex_);
    const AlertState state = states_.value(origin);

    if (inCooldown(state, now, settings)) {
        return AlertPhase::Cooldown;
    }
    if (state.activeSeconds < settings.timeThresholdS) {
        return AlertPhase::Idle;
    }
    return AlertPhase::Armed;
}

void AlertEngine::resetActive(const QString &origin)
{
    QMutexLocker locker(&mutex_);
    auto it = states_.find(origin);
    if (it != states_.end()) {
        it->activeSeconds = 0;
    }
}

QStringList AlertEngine::origins() const
{
    QMutexLocker locker(&mutex_);
    return states_.keys();
}

void AlertEngine::clear()
{
    QMutexLocker locker(&mutex_);
    states_.clear();
}

bool AlertEngine::inCooldown(const AlertState &state,
                             const QDateTime &now,
                             const Settings &settings)
{
    if (!state.lastAlertAt.has_value()) {
        return false;
    }
    const qint64 cooldownMs = static_cast<qint64>(settings.cooldownMinutes) * 60 * 1000;
    return state.lastAlertAt->msecsTo(now) < cooldownMs;
}

} // namespace ecotrace
