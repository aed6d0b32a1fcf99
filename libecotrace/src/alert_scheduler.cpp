#include "ecotrace/alert_scheduler.hpp"

#include <QDebug>
#include <QTimer>

#include <utility>

namespace ecotrace {

namespace {
constexpr int kMinIntervalMs = 10;
} // namespace

AlertScheduler::AlertScheduler(Evaluator evaluator, int intervalMs, QObject *parent)
    : QObject(parent)
    , evaluator_(std::move(evaluator))
    , intervalMs_(qMax(intervalMs, kMinIntervalMs))
{
}

AlertScheduler::~AlertScheduler()
{
    stopAll();
}

bool AlertScheduler::start(const QString &origin)
{
    if (origin.isEmpty() || timers_.contains(origin)) {
        return false;
    }

    auto *timer = new QTimer(this);
    timer->setInterval(intervalMs_);
    timer->setSingleShot(false);
    connect(timer, &QTimer::timeout, this, [this, origin]() {
        if (evaluator_) {
            evaluator_(origin);
        }
    });
    timers_.insert(origin, timer);
    timer->start();

    qDebug() << "AlertScheduler: started ticker for" << origin
             << "every" << intervalMs_ << "ms";
    return true;
}

void AlertScheduler::stop(const QString &origin)
{
    QTimer *timer = timers_.take(origin);
    if (!timer) {
        return;
    }
    timer->stop();
    // May be called from inside the timer's own timeout.
    timer->deleteLater();
    qDebug() << "AlertScheduler: stopped ticker for" << origin;
}

void AlertScheduler::stopAll()
{
    const QStringList names = timers_.keys();
    for (const QString &origin : names) {
        stop(origin);
    }
}

bool AlertScheduler::isRunning(const QString &origin) const
{
    return timers_.contains(origin);
}

QStringList AlertScheduler::origins() const
{
    return timers_.keys();
}

void AlertScheduler::setIntervalMs(int intervalMs)
{
    intervalMs_ = qMax(intervalMs, kMinIntervalMs);
    for (QTimer *timer : std::as_const(timers_)) {
        timer->setInterval(intervalMs_);
    }
}

} // namespace ecotrace
