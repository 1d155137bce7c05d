#pragma once

#include "focus/focus_engine.hpp"

namespace tracewatch {

/**
 * PomodoroTimer alternates 25-minute work phases with breaks: a 5-minute
 * short break, or a 15-minute long break after every fourth work phase.
 * Work phases use the context-lock rules of FocusEngine. During a break
 * every tick counts toward the break, whatever window is in front.
 *
 * Counters restart at each phase boundary. The run persists a single record
 * when stopped, totalling its work phases.
 */
class PomodoroTimer : public FocusEngine
{
    Q_OBJECT
public:
    static constexpr int kWorkMinutes = 25;
    static constexpr int kShortBreakMinutes = 5;
    static constexpr int kLongBreakMinutes = 15;
    static constexpr int kWorkPhasesPerLongBreak = 4;

    PomodoroTimer(TraceStore &store,
                  WindowObserver &observer,
                  SessionGuard &guard,
                  RelevanceOracle &oracle,
                  QObject *parent = nullptr);
    ~PomodoroTimer() override;

    void evaluate(const std::optional<ForegroundWindow> &window) override;

    PomodoroPhase phase() const override;
    int completedWorkPhases() const;

signals:
    void phaseChanged(tracewatch::PomodoroPhase phase, int targetMinutes);

protected:
    void onGoalReached() override;
    FocusSessionRecord buildRecord() const override;

private:
    PomodoroPhase m_phase = PomodoroPhase::Work;
    int m_completedWorkPhases = 0;
    int m_workFocusSeconds = 0;
    int m_workDistractionSeconds = 0;
    int m_workInterruptions = 0;
};

} // namespace tracewatch
