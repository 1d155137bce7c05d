#include "common/periodic_task.hpp"

#include <exception>

#include "common/logging.hpp"

namespace tracewatch {

namespace {

// Clears the overlap flag however the tick ends.
class TickScope
{
public:
    explicit TickScope(bool &inTick)
        : m_inTick(inTick)
    {
        m_inTick = true;
    }
    ~TickScope() { m_inTick = false; }

    TickScope(const TickScope &) = delete;
    TickScope &operator=(const TickScope &) = delete;

private:
    bool &m_inTick;
};

} // namespace

PeriodicTask::PeriodicTask(const QString &name,
                           std::chrono::milliseconds interval,
                           std::function<void()> work,
                           QObject *parent)
    : QObject(parent)
    , m_name(name)
    , m_work(std::move(work))
{
    m_timer.setInterval(static_cast<int>(interval.count()));
    m_timer.setTimerType(Qt::CoarseTimer);
    connect(&m_timer, &QTimer::timeout, this, &PeriodicTask::runOnce);
}

PeriodicTask::~PeriodicTask()
{
    m_timer.stop();
}

void PeriodicTask::start(bool runImmediately)
{
    if (m_timer.isActive()) {
        return;
    }
    m_timer.start();
    if (runImmediately) {
        runOnce();
    }
}

void PeriodicTask::stop()
{
    m_timer.stop();
}

bool PeriodicTask::isActive() const
{
    return m_timer.isActive();
}

std::chrono::milliseconds PeriodicTask::interval() const
{
    return std::chrono::milliseconds(m_timer.interval());
}

QString PeriodicTask::name() const
{
    return m_name;
}

void PeriodicTask::runOnce()
{
    if (m_inTick || !m_work) {
        return;
    }

    TickScope scope(m_inTick);
    try {
        m_work();
    } catch (const std::exception &ex) {
        TWLOG_WARN(QStringLiteral("PeriodicTask"),
                   QStringLiteral("runOnce"),
                   QStringLiteral("tick_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("tick_abandoned"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"task", m_name.toStdString()},
                                   {"error", ex.what()}}));
    }
}

} // namespace tracewatch
