#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

class QTimer;

namespace ecotrace {

// One repeating evaluation timer per origin. Timers live in the thread that
// owns the scheduler and are cancelled by stop(), stopAll() or destruction.
class AlertScheduler : public QObject
{
    Q_OBJECT
public:
    using Evaluator = std::function<void(const QString &origin)>;

    explicit AlertScheduler(Evaluator evaluator,
                            int intervalMs = 10000,
                            QObject *parent = nullptr);
    ~AlertScheduler() override;

    // Starts the origin's timer. Returns false if it is already running.
    bool start(const QString &origin);
    void stop(const QString &origin);
    void stopAll();

    bool isRunning(const QString &origin) const;
    QStringList origins() const;

    int intervalMs() const { return intervalMs_; }

    // Applies to running timers as well.
    void setIntervalMs(int intervalMs);

private:
    Evaluator evaluator_;
    int intervalMs_;
    QHash<QString, QTimer *> timers_;
};

} // namespace ecotrace
