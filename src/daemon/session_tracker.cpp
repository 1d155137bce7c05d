#include "daemon/session_tracker.hpp"

#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/periodic_task.hpp"
#include "daemon/browser_history.hpp"
#include "daemon/categorizer.hpp"
#include "daemon/process_info.hpp"
#include "daemon/tracewatch_store.hpp"
#include "daemon/window_observer.hpp"

namespace tracewatch {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

bool sameWindow(const ActivitySession &session, const ForegroundWindow &window)
{
    return session.appName == window.appName && session.windowTitle == window.windowTitle;
}

} // namespace

SessionTracker::SessionTracker(TraceStore &store,
                               WindowObserver &observer,
                               const Categorizer &categorizer,
                               ProcessInfoProvider *processInfo,
                               TrackerConfig config)
    : m_store(store)
    , m_observer(observer)
    , m_categorizer(categorizer)
    , m_processInfo(processInfo)
    , m_config(config)
    , m_random(std::random_device{}())
{
}

SessionTracker::~SessionTracker() = default;

void SessionTracker::start()
{
    if (m_task && m_task->isActive()) {
        return;
    }
    if (!m_task) {
        m_task = std::make_unique<PeriodicTask>(
            QStringLiteral("session-poll"),
            std::chrono::milliseconds(m_config.pollIntervalMs),
            [this]() { poll(Clock::now()); });
    }
    m_task->start();
}

void SessionTracker::stop()
{
    if (m_task) {
        m_task->stop();
    }
    flush(Clock::now());
}

bool SessionTracker::isRunning() const
{
    return m_task && m_task->isActive();
}

void SessionTracker::poll(Clock::time_point now)
{
    try {
        pollOrThrow(now);
    } catch (const std::exception &ex) {
        TWLOG_WARN(QStringLiteral("SessionTracker"),
                   QStringLiteral("poll"),
                   QStringLiteral("tick_failed"),
                   QString::fromStdString(ex.what()),
                   QStringLiteral("tick_skipped"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
}

void SessionTracker::pollOrThrow(Clock::time_point now)
{
    const auto window = m_observer.currentWindow();
    if (!window) {
        return;
    }

    if (!m_current) {
        m_current = openSession(*window, now);
        return;
    }

    if (sameWindow(*m_current, *window)) {
        if (m_processInfo && m_unit(m_random) < m_config.resourceRefreshProbability) {
            applyResource(*m_current);
        }
        return;
    }

    flush(now);
    m_current = openSession(*window, now);
    ++m_totalSwitches;
}

void SessionTracker::flush(Clock::time_point now)
{
    if (!m_current) {
        return;
    }

    ActivitySession session = std::move(*m_current);
    m_current.reset();

    session.endTime = now;
    session.durationSeconds =
        std::chrono::duration<double>(session.endTime - session.startTime).count();
    if (session.durationSeconds < m_config.minDurationSeconds) {
        return;
    }

    try {
        session.id = m_store.addSession(session);
        ++m_totalLogged;
    } catch (const std::exception &ex) {
        TWLOG_ERROR(QStringLiteral("SessionTracker"),
                    QStringLiteral("flush"),
                    QStringLiteral("persist_failed"),
                    QString::fromStdString(ex.what()),
                    QStringLiteral("session_dropped"),
                    ::tracewatch::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"app", session.appName},
                                    {"durationSeconds", session.durationSeconds}}));
        return;
    }

    TWLOG_DEBUG(QStringLiteral("SessionTracker"),
                QStringLiteral("flush"),
                QStringLiteral("session_logged"),
                QStringLiteral("window_changed"),
                QStringLiteral("min_duration_met"),
                ::tracewatch::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"app", session.appName},
                                {"category", toCategoryString(session.category)},
                                {"durationSeconds", session.durationSeconds}}));
}

ActivitySession SessionTracker::openSession(const ForegroundWindow &window, Clock::time_point now)
{
    ActivitySession session;
    session.appName = window.appName;
    session.windowTitle = window.windowTitle;
    session.pid = window.processId;
    session.startTime = now;
    session.endTime = now;
    session.category = m_categorizer.categorize(window.appName, window.windowTitle);
    if (m_processInfo) {
        applyResource(session);
    }
    recordTitleSearch(window, now);
    return session;
}

void SessionTracker::applyResource(ActivitySession &session)
{
    const auto resource = m_processInfo->resource(session.pid);
    if (!resource) {
        return;
    }
    session.memoryMb = static_cast<double>(resource->memoryBytes) / kBytesPerMb;
    session.cpuPercent = resource->cpuPercent;
}

void SessionTracker::recordTitleSearch(const ForegroundWindow &window, Clock::time_point now)
{
    const auto search = extractSearchFromTitle(window.windowTitle, window.appName, now);
    if (!search) {
        return;
    }
    try {
        m_store.addSearch(*search);
    } catch (const std::exception &ex) {
        TWLOG_WARN(QStringLiteral("SessionTracker"),
                   QStringLiteral("recordTitleSearch"),
                   QStringLiteral("persist_failed"),
                   QString::fromStdString(ex.what()),
                   QStringLiteral("search_dropped"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
}

const std::optional<ActivitySession> &SessionTracker::currentSession() const
{
    return m_current;
}

int SessionTracker::totalLogged() const
{
    return m_totalLogged;
}

int SessionTracker::totalSwitches() const
{
    return m_totalSwitches;
}

} // namespace tracewatch
