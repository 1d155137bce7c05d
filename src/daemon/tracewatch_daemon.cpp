#include "daemon/tracewatch_daemon.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include <QDebug>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/format_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/periodic_task.hpp"
#include "common/tracewatch_version.hpp"
#include "daemon/browser_history.hpp"
#include "daemon/categorizer.hpp"
#include "daemon/proc_process_info.hpp"
#include "daemon/resource_sampler.hpp"
#include "daemon/session_tracker.hpp"
#include "daemon/tracewatch_store.hpp"
#include "daemon/x11_window_observer.hpp"

namespace tracewatch {

namespace {

constexpr int kStatusIntervalMs = 1000;
constexpr auto kAggregateInterval = std::chrono::minutes(5);
constexpr size_t kStatusTitleWidth = 48;

std::string truncateTitle(const std::string &title)
{
    if (title.size() <= kStatusTitleWidth) {
        return title;
    }
    return title.substr(0, kStatusTitleWidth - 3) + "...";
}

} // namespace

TraceDaemon::TraceDaemon(Config config, DaemonOptions options, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_options(options)
    , m_store(std::make_unique<TraceStore>())
    , m_categorizer(std::make_unique<Categorizer>(m_config.rules))
    , m_observer(std::make_unique<X11WindowObserver>())
    , m_trackerProcessInfo(std::make_unique<ProcProcessInfoProvider>())
    , m_samplerProcessInfo(std::make_unique<ProcProcessInfoProvider>())
{
    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        qWarning() << "Tracewatch: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
        m_storageHealthy = false;
    }

    m_tracker = std::make_unique<SessionTracker>(*m_store,
                                                 *m_observer,
                                                 *m_categorizer,
                                                 m_trackerProcessInfo.get(),
                                                 m_config.tracker);
    m_sampler = std::make_unique<ResourceSampler>(*m_store,
                                                  *m_samplerProcessInfo,
                                                  m_config.sampler);

    m_statusTimer.setInterval(kStatusIntervalMs);
    connect(&m_statusTimer, &QTimer::timeout, this, &TraceDaemon::printStatusLine);
}

TraceDaemon::~TraceDaemon()
{
    shutdown();
}

bool TraceDaemon::isStorageHealthy() const
{
    return m_storageHealthy;
}

void TraceDaemon::start()
{
    qInfo() << "Tracewatch: daemon starting (version" << TRACEWATCH_VERSION << ")";

    if (!m_storageHealthy) {
        qWarning() << "Tracewatch: tracking disabled until the database is repaired.";
        return;
    }
    if (m_running) {
        return;
    }

    if (!m_observer->open()) {
        qWarning() << "Tracewatch: no X display reachable, window tracking is idle.";
        TWLOG_WARN(QStringLiteral("TraceDaemon"),
                   QStringLiteral("start"),
                   QStringLiteral("display_unavailable"),
                   QStringLiteral("xopendisplay_failed"),
                   QStringLiteral("tracker_idle"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }

    m_tracker->start();
    m_sampler->start();

    if (m_options.browserSync && m_config.browserSync.enabled) {
        m_browserSync = std::make_unique<BrowserHistorySync>(*m_store);
        m_browserTask = std::make_unique<PeriodicTask>(
            QStringLiteral("browser-sync"),
            std::chrono::milliseconds(m_config.browserSync.intervalMs),
            [this]() { runBrowserSync(); });
        m_browserTask->start(true);
    }

    m_lastAggregatedDate = todayLocalDate();
    m_aggregateTask = std::make_unique<PeriodicTask>(
        QStringLiteral("aggregate-refresh"),
        std::chrono::duration_cast<std::chrono::milliseconds>(kAggregateInterval),
        [this]() { refreshAggregates(); });
    m_aggregateTask->start();

    if (m_options.statusLine && ::isatty(STDOUT_FILENO)) {
        m_statusTimer.start();
    }

    m_running = true;
    TWLOG_INFO(QStringLiteral("TraceDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_started"),
               QStringLiteral("user_start"),
               QStringLiteral("periodic_tasks"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pollIntervalMs", m_config.tracker.pollIntervalMs},
                               {"samplerIntervalMs", m_config.sampler.intervalMs},
                               {"browserSync", m_browserTask != nullptr}}));
}

void TraceDaemon::shutdown()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    m_statusTimer.stop();
    if (m_browserTask) {
        m_browserTask->stop();
    }
    if (m_aggregateTask) {
        m_aggregateTask->stop();
    }
    m_sampler->stop();
    m_tracker->stop();

    try {
        m_store->recomputeAggregates(todayLocalDate());
    } catch (const std::exception &ex) {
        TWLOG_ERROR(QStringLiteral("TraceDaemon"),
                    QStringLiteral("shutdown"),
                    QStringLiteral("aggregate_failed"),
                    QString::fromStdString(ex.what()),
                    QStringLiteral("aggregates_stale"),
                    ::tracewatch::logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
    }

    if (::isatty(STDOUT_FILENO)) {
        std::cout << "\r\033[K" << std::flush;
    }
    qInfo() << "Tracewatch: all data saved," << m_tracker->totalLogged()
            << "sessions logged," << m_tracker->totalSwitches() << "switches.";
    TWLOG_INFO(QStringLiteral("TraceDaemon"),
               QStringLiteral("shutdown"),
               QStringLiteral("daemon_stopped"),
               QStringLiteral("shutdown_requested"),
               QStringLiteral("flush_then_aggregate"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"sessionsLogged", m_tracker->totalLogged()},
                               {"switches", m_tracker->totalSwitches()}}));
    emit stopped();
}

void TraceDaemon::runBrowserSync()
{
    const HistorySyncResult result = m_browserSync->syncOnce(std::chrono::system_clock::now());
    TWLOG_DEBUG(QStringLiteral("TraceDaemon"),
                QStringLiteral("runBrowserSync"),
                QStringLiteral("browser_sync_done"),
                QStringLiteral("timer"),
                QStringLiteral("history_copy"),
                ::tracewatch::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"sources", result.sourcesRead},
                                {"visitsAdded", result.visitsAdded},
                                {"searchesAdded", result.searchesAdded}}));
}

void TraceDaemon::refreshAggregates()
{
    const std::string today = todayLocalDate();
    // Close out yesterday once after midnight.
    if (!m_lastAggregatedDate.empty() && m_lastAggregatedDate != today) {
        m_store->recomputeAggregates(m_lastAggregatedDate);
    }
    m_store->recomputeAggregates(today);
    m_lastAggregatedDate = today;
}

void TraceDaemon::printStatusLine()
{
    const auto &current = m_tracker->currentSession();
    std::cout << "\r\033[K";
    if (!current) {
        std::cout << "Waiting for window activity..." << std::flush;
        return;
    }

    const double elapsed = std::chrono::duration<double>(
        std::chrono::system_clock::now() - current->startTime).count();
    std::cout << current->appName << " | " << truncateTitle(current->windowTitle)
              << " | " << toCategoryString(current->category)
              << " | " << formatDuration(elapsed)
              << " | " << formatMemory(current->memoryMb)
              << " " << formatPercent(current->cpuPercent);

    const auto &system = m_sampler->latestSystemUsage();
    if (system) {
        std::cout << " | RAM " << formatPercent(system->memoryPercent, 0)
                  << " CPU " << formatPercent(system->cpuPercent, 0);
    }
    std::cout << std::flush;
}

} // namespace tracewatch
