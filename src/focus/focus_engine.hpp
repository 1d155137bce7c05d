#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include <QObject>
#include <QTimer>

#include "common/models.hpp"

namespace tracewatch {

class RelevanceOracle;
class SessionGuard;
class TraceStore;
class WindowObserver;

/**
 * FocusEngine runs one focus session against a declared goal.
 *
 * The first non-whitelisted window observed becomes the context lock. Each
 * one-second tick is then Focused (the locked app, or a browser tab judged
 * relevant), Distracted (any other app) or Neutral (a whitelisted system or
 * shell process). Focused ticks count toward the target; Distracted ticks
 * count as distraction, and a title change while distracted counts as an
 * interruption.
 *
 * A session holds the SessionGuard from start() to stop() and writes one
 * FocusSessionRecord when it stops.
 */
class FocusEngine : public QObject
{
    Q_OBJECT
public:
    using Clock = std::chrono::system_clock;

    FocusEngine(TraceStore &store,
                WindowObserver &observer,
                SessionGuard &guard,
                RelevanceOracle &oracle,
                int targetMinutes,
                std::string goalLabel,
                QObject *parent = nullptr);
    ~FocusEngine() override;

    // Throws SessionConflictError when another session holds the guard.
    void start();
    // Releases the guard and persists the record. Later calls do nothing.
    void stop();

    bool isRunning() const;
    bool isFinished() const;

    // Processes one tick. std::nullopt means no foreground window.
    virtual void evaluate(const std::optional<ForegroundWindow> &window);

    FocusSnapshot snapshot() const;
    FocusStatus status() const;
    double score() const;
    int actualFocusSeconds() const;
    int distractionSeconds() const;
    int interruptionCount() const;
    int targetMinutes() const;
    const std::string &goalLabel() const;
    const std::optional<std::string> &lockedApp() const;
    std::optional<bool> cachedVerdict(const std::string &title) const;
    // Id of the persisted record, once stop() has stored it.
    std::optional<int64_t> recordId() const;

    static bool isWhitelisted(const std::string &appName);
    static double computeScore(int focusSeconds, int distractionSeconds);
    static constexpr size_t kMaxCachedVerdicts = 50;

signals:
    void updated(const tracewatch::FocusSnapshot &snapshot);
    void goalReached();
    void finished(const tracewatch::FocusSessionRecord &record);

protected:
    virtual void onGoalReached();
    virtual FocusSessionRecord buildRecord() const;
    virtual PomodoroPhase phase() const;

    void setTarget(int targetMinutes, const std::string &goalLabel);
    void resetCounters();
    void publish();

    int m_actualFocusSeconds = 0;
    int m_distractionSeconds = 0;
    int m_interruptionCount = 0;
    FocusStatus m_status = FocusStatus::WaitingForContext;
    std::optional<std::string> m_currentApp;
    std::optional<std::string> m_currentTitle;
    Clock::time_point m_startTime;
    Clock::time_point m_endTime;

private slots:
    void tick();

private:
    bool isRelevantBrowserTitle(const std::string &title);
    void requestVerdict(const std::string &title);
    void storeVerdict(const std::string &title, bool relevant);

    enum class RunState {
        Idle,
        Running,
        Finished
    };

    TraceStore &m_store;
    WindowObserver &m_observer;
    SessionGuard &m_guard;
    RelevanceOracle &m_oracle;
    int m_targetMinutes;
    std::string m_goalLabel;
    RunState m_runState = RunState::Idle;

    std::optional<std::string> m_lockedApp;
    std::optional<std::string> m_lockedTitle;
    std::optional<std::string> m_lastTitle;
    std::unordered_map<std::string, bool> m_relevanceCache;
    std::set<std::string> m_pendingVerdicts;
    std::optional<int64_t> m_recordId;

    QTimer m_timer;
};

} // namespace tracewatch
