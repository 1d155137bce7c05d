#pragma once

#include <memory>
#include <string>

#include <QObject>
#include <QTimer>

#include "common/config.hpp"

namespace tracewatch {

class BrowserHistorySync;
class Categorizer;
class PeriodicTask;
class ProcProcessInfoProvider;
class ResourceSampler;
class SessionTracker;
class TraceStore;
class X11WindowObserver;

struct DaemonOptions {
    bool browserSync = true;
    bool statusLine = true;
};

/**
 * TraceDaemon coordinates:
 * - the foreground-window session tracker (1 s poll)
 * - the resource sampler (top processes every 30 s)
 * - browser history import (every 5 min)
 * - a periodic refresh of today's aggregates
 *
 * It is owned from main() and driven by Qt's event loop. shutdown() flushes
 * the open session and recomputes today's aggregates before emitting
 * stopped().
 */
class TraceDaemon : public QObject
{
    Q_OBJECT
public:
    explicit TraceDaemon(Config config, DaemonOptions options = {}, QObject *parent = nullptr);
    ~TraceDaemon() override;

    void start();

    bool isStorageHealthy() const;

public slots:
    void shutdown();

signals:
    void stopped();

private slots:
    void printStatusLine();

private:
    void runBrowserSync();
    void refreshAggregates();

    Config m_config;
    DaemonOptions m_options;
    std::unique_ptr<TraceStore> m_store;
    std::unique_ptr<Categorizer> m_categorizer;
    std::unique_ptr<X11WindowObserver> m_observer;
    // Separate providers: per-pid CPU deltas are kept per instance.
    std::unique_ptr<ProcProcessInfoProvider> m_trackerProcessInfo;
    std::unique_ptr<ProcProcessInfoProvider> m_samplerProcessInfo;
    std::unique_ptr<SessionTracker> m_tracker;
    std::unique_ptr<ResourceSampler> m_sampler;
    std::unique_ptr<BrowserHistorySync> m_browserSync;
    std::unique_ptr<PeriodicTask> m_browserTask;
    std::unique_ptr<PeriodicTask> m_aggregateTask;
    QTimer m_statusTimer;

    bool m_storageHealthy = true;
    bool m_running = false;
    std::string m_lastAggregatedDate;
};

} // namespace tracewatch
