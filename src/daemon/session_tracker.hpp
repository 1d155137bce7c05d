#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <random>

#include "common/config.hpp"
#include "common/models.hpp"

namespace tracewatch {

class Categorizer;
class PeriodicTask;
class ProcessInfoProvider;
class TraceStore;
class WindowObserver;

/**
 * SessionTracker turns the foreground-window polling stream into session
 * records. A session is a maximal run of identical (app, title)
 * observations; it is persisted when it closes, provided it lasted at least
 * minDurationSeconds. Ticks without a foreground window leave the open
 * session running.
 *
 * poll() takes the clock reading explicitly so that tests can drive the
 * tracker without a timer. start() drives it from a PeriodicTask instead.
 */
class SessionTracker
{
public:
    using Clock = std::chrono::system_clock;

    SessionTracker(TraceStore &store,
                   WindowObserver &observer,
                   const Categorizer &categorizer,
                   ProcessInfoProvider *processInfo,
                   TrackerConfig config = {});
    ~SessionTracker();

    void start();
    // Stops polling and closes the open session.
    void stop();
    bool isRunning() const;

    void poll(Clock::time_point now);
    void flush(Clock::time_point now);

    const std::optional<ActivitySession> &currentSession() const;
    int totalLogged() const;
    int totalSwitches() const;

private:
    void pollOrThrow(Clock::time_point now);
    ActivitySession openSession(const ForegroundWindow &window, Clock::time_point now);
    void applyResource(ActivitySession &session);
    void recordTitleSearch(const ForegroundWindow &window, Clock::time_point now);

    TraceStore &m_store;
    WindowObserver &m_observer;
    const Categorizer &m_categorizer;
    ProcessInfoProvider *m_processInfo = nullptr;
    TrackerConfig m_config;

    std::optional<ActivitySession> m_current;
    int m_totalLogged = 0;
    int m_totalSwitches = 0;

    std::mt19937 m_random;
    std::uniform_real_distribution<double> m_unit{0.0, 1.0};
    std::unique_ptr<PeriodicTask> m_task;
};

} // namespace tracewatch
