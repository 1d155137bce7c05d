#pragma once

#include <chrono>
#include <functional>

#include <QObject>
#include <QString>
#include <QTimer>

namespace tracewatch {

/**
 * PeriodicTask runs a unit of work on a fixed cadence on the owning thread's
 * event loop. Ticks never overlap: a tick that is still running when the
 * timer fires again is skipped. Exceptions thrown by the work are logged and
 * confined to the tick that raised them.
 */
class PeriodicTask : public QObject
{
    Q_OBJECT
public:
    PeriodicTask(const QString &name,
                 std::chrono::milliseconds interval,
                 std::function<void()> work,
                 QObject *parent = nullptr);
    ~PeriodicTask() override;

    void start(bool runImmediately = false);
    void stop();
    bool isActive() const;

    std::chrono::milliseconds interval() const;
    QString name() const;

    // Runs one tick synchronously, honouring the overlap guard.
    void runOnce();

private:
    QString m_name;
    std::function<void()> m_work;
    QTimer m_timer;
    bool m_inTick = false;
};

} // namespace tracewatch
