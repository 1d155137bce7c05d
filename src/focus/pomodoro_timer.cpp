#include "focus/pomodoro_timer.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tracewatch {

namespace {

const char *const kWorkLabel = "Pomodoro Work";
const char *const kShortBreakLabel = "Short Break";
const char *const kLongBreakLabel = "Long Break";

} // namespace

PomodoroTimer::PomodoroTimer(TraceStore &store,
                             WindowObserver &observer,
                             SessionGuard &guard,
                             RelevanceOracle &oracle,
                             QObject *parent)
    : FocusEngine(store, observer, guard, oracle, kWorkMinutes, kWorkLabel, parent)
{
}

PomodoroTimer::~PomodoroTimer()
{
    // The base destructor would no longer see the overrides.
    stop();
}

void PomodoroTimer::evaluate(const std::optional<ForegroundWindow> &window)
{
    if (m_phase == PomodoroPhase::Work) {
        FocusEngine::evaluate(window);
        return;
    }

    if (!isRunning()) {
        return;
    }
    if (window) {
        m_currentApp = window->appName;
        m_currentTitle = window->windowTitle;
    }
    m_status = FocusStatus::Neutral;
    ++m_actualFocusSeconds;
    publish();

    if (m_actualFocusSeconds >= targetMinutes() * 60) {
        onGoalReached();
    }
}

PomodoroPhase PomodoroTimer::phase() const
{
    return m_phase;
}

int PomodoroTimer::completedWorkPhases() const
{
    return m_completedWorkPhases;
}

void PomodoroTimer::onGoalReached()
{
    if (m_phase == PomodoroPhase::Work) {
        m_workFocusSeconds += m_actualFocusSeconds;
        m_workDistractionSeconds += m_distractionSeconds;
        m_workInterruptions += m_interruptionCount;
        ++m_completedWorkPhases;

        const bool longBreak = m_completedWorkPhases % kWorkPhasesPerLongBreak == 0;
        m_phase = PomodoroPhase::Break;
        setTarget(longBreak ? kLongBreakMinutes : kShortBreakMinutes,
                  longBreak ? kLongBreakLabel : kShortBreakLabel);
        m_status = FocusStatus::Neutral;
    } else {
        m_phase = PomodoroPhase::Work;
        setTarget(kWorkMinutes, kWorkLabel);
        m_status = FocusStatus::Focused;
    }
    resetCounters();

    TWLOG_INFO(QStringLiteral("PomodoroTimer"),
               QStringLiteral("onGoalReached"),
               QStringLiteral("phase_changed"),
               QStringLiteral("phase_target_met"),
               QStringLiteral("phase_cycle"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"phase", toPhaseString(m_phase)},
                               {"targetMinutes", targetMinutes()},
                               {"completedWork", m_completedWorkPhases}}));
    emit phaseChanged(m_phase, targetMinutes());
    publish();
}

FocusSessionRecord PomodoroTimer::buildRecord() const
{
    FocusSessionRecord record = FocusEngine::buildRecord();
    int focus = m_workFocusSeconds;
    int distraction = m_workDistractionSeconds;
    int interruptions = m_workInterruptions;
    int workPhases = m_completedWorkPhases;
    if (m_phase == PomodoroPhase::Work) {
        focus += m_actualFocusSeconds;
        distraction += m_distractionSeconds;
        interruptions += m_interruptionCount;
        ++workPhases;
    }

    record.targetMinutes = workPhases * kWorkMinutes;
    record.actualFocusSeconds = focus;
    record.distractionSeconds = distraction;
    record.interruptionCount = interruptions;
    record.focusScore = computeScore(focus, distraction);
    record.goalLabel = kWorkLabel;
    return record;
}

} // namespace tracewatch
