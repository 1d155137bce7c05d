#include "focus/focus_engine.hpp"

#include <cctype>
#include <exception>

#include <QPointer>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/categorizer.hpp"
#include "daemon/tracewatch_store.hpp"
#include "daemon/window_observer.hpp"
#include "focus/relevance_oracle.hpp"
#include "focus/session_guard.hpp"

namespace tracewatch {

namespace {

constexpr int kTickIntervalMs = 1000;

// Shells, desktop chrome and system utilities never count for or against a
// session.
const std::set<std::string> kWhitelist = {
    "explorer", "searchhost", "shellexperiencehost", "taskmgr", "cmd", "powershell",
    "windowsterminal", "wt", "windows command processor", "windows explorer",
    "task manager", "system settings", "trace-cli", "terminal", "antigravity", "system",
    "tracewatch-focus", "tracewatch-daemon", "tracewatch-report", "gnome-shell",
    "plasmashell", "kwin_x11", "kwin_wayland", "krunner", "xfce4-panel", "xfdesktop",
    "nautilus", "dolphin", "thunar", "konsole", "gnome-terminal-server", "xterm",
    "alacritty", "kitty", "tilix", "systemsettings", "gnome-control-center",
    "gnome-system-monitor", "plasma-systemmonitor",
};

std::string lowered(const std::string &value)
{
    std::string result = value;
    for (auto &c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace

FocusEngine::FocusEngine(TraceStore &store,
                         WindowObserver &observer,
                         SessionGuard &guard,
                         RelevanceOracle &oracle,
                         int targetMinutes,
                         std::string goalLabel,
                         QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_observer(observer)
    , m_guard(guard)
    , m_oracle(oracle)
    , m_targetMinutes(targetMinutes)
    , m_goalLabel(std::move(goalLabel))
{
    m_timer.setInterval(kTickIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &FocusEngine::tick);
}

FocusEngine::~FocusEngine()
{
    stop();
}

void FocusEngine::start()
{
    if (m_runState != RunState::Idle) {
        return;
    }
    if (!m_guard.tryAcquire()) {
        throw SessionConflictError("another focus or pomodoro session is already running");
    }

    m_runState = RunState::Running;
    m_startTime = Clock::now();
    m_timer.start();

    TWLOG_INFO(QStringLiteral("FocusEngine"),
               QStringLiteral("start"),
               QStringLiteral("session_started"),
               QStringLiteral("user_request"),
               QStringLiteral("context_lock"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"goal", m_goalLabel}, {"targetMinutes", m_targetMinutes}}));
    publish();
}

void FocusEngine::stop()
{
    if (m_runState != RunState::Running) {
        return;
    }
    m_runState = RunState::Finished;
    m_timer.stop();
    m_endTime = Clock::now();
    m_guard.release();

    const FocusSessionRecord record = buildRecord();
    try {
        m_recordId = m_store.addFocusSession(record);
    } catch (const std::exception &ex) {
        TWLOG_ERROR(QStringLiteral("FocusEngine"),
                    QStringLiteral("stop"),
                    QStringLiteral("persist_failed"),
                    QString::fromStdString(ex.what()),
                    QStringLiteral("record_dropped"),
                    ::tracewatch::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"goal", record.goalLabel}}));
    }

    TWLOG_INFO(QStringLiteral("FocusEngine"),
               QStringLiteral("stop"),
               QStringLiteral("session_finished"),
               QStringLiteral("stop_requested"),
               QStringLiteral("single_record"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"focusSeconds", record.actualFocusSeconds},
                               {"distractionSeconds", record.distractionSeconds},
                               {"interruptions", record.interruptionCount},
                               {"score", record.focusScore}}));
    emit finished(record);
}

bool FocusEngine::isRunning() const
{
    return m_runState == RunState::Running;
}

bool FocusEngine::isFinished() const
{
    return m_runState == RunState::Finished;
}

void FocusEngine::tick()
{
    try {
        evaluate(m_observer.currentWindow());
    } catch (const std::exception &ex) {
        TWLOG_WARN(QStringLiteral("FocusEngine"),
                   QStringLiteral("tick"),
                   QStringLiteral("tick_failed"),
                   QString::fromStdString(ex.what()),
                   QStringLiteral("tick_skipped"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
}

void FocusEngine::evaluate(const std::optional<ForegroundWindow> &window)
{
    if (m_runState != RunState::Running || !window) {
        return;
    }

    const std::string &app = window->appName;
    const std::string &title = window->windowTitle;
    m_currentApp = app;
    m_currentTitle = title;

    if (isWhitelisted(app)) {
        m_status = FocusStatus::Neutral;
        m_lastTitle = title;
        publish();
        return;
    }

    bool focused = true;
    if (!m_lockedApp) {
        m_lockedApp = app;
        m_lockedTitle = title;
        if (Categorizer::isBrowser(app)) {
            storeVerdict(title, true);
        }
        TWLOG_INFO(QStringLiteral("FocusEngine"),
                   QStringLiteral("evaluate"),
                   QStringLiteral("context_locked"),
                   QStringLiteral("first_work_window"),
                   QStringLiteral("context_lock"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"app", app}}));
    } else if (lowered(*m_lockedApp) == lowered(app)) {
        if (Categorizer::isBrowser(app)) {
            focused = isRelevantBrowserTitle(title);
        }
    } else {
        focused = false;
    }

    if (focused) {
        m_status = FocusStatus::Focused;
        ++m_actualFocusSeconds;
    } else {
        m_status = FocusStatus::Distracted;
        ++m_distractionSeconds;
        if (!m_lastTitle || *m_lastTitle != title) {
            ++m_interruptionCount;
        }
    }
    m_lastTitle = title;
    publish();

    if (m_actualFocusSeconds >= m_targetMinutes * 60) {
        onGoalReached();
    }
}

bool FocusEngine::isRelevantBrowserTitle(const std::string &title)
{
    // Only a new destination is judged; staying on a page keeps the tick focused.
    if (m_lastTitle && *m_lastTitle == title) {
        return true;
    }
    const auto cached = m_relevanceCache.find(title);
    if (cached != m_relevanceCache.end()) {
        return cached->second;
    }
    // Unknown destination: stay focused while the oracle decides.
    requestVerdict(title);
    return true;
}

void FocusEngine::requestVerdict(const std::string &title)
{
    if (!m_pendingVerdicts.insert(title).second) {
        return;
    }

    QPointer<FocusEngine> self(this);
    m_oracle.checkRelevance(m_goalLabel, title, [self, title](bool relevant) {
        if (self) {
            self->storeVerdict(title, relevant);
        }
    });
}

void FocusEngine::storeVerdict(const std::string &title, bool relevant)
{
    m_pendingVerdicts.erase(title);
    if (m_relevanceCache.size() > kMaxCachedVerdicts) {
        m_relevanceCache.clear();
    }
    m_relevanceCache[title] = relevant;
}

void FocusEngine::onGoalReached()
{
    TWLOG_INFO(QStringLiteral("FocusEngine"),
               QStringLiteral("onGoalReached"),
               QStringLiteral("goal_reached"),
               QStringLiteral("target_met"),
               QStringLiteral("auto_stop"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"goal", m_goalLabel}, {"targetMinutes", m_targetMinutes}}));
    emit goalReached();
    stop();
}

FocusSessionRecord FocusEngine::buildRecord() const
{
    FocusSessionRecord record;
    record.startTime = m_startTime;
    record.endTime = m_endTime;
    record.targetMinutes = m_targetMinutes;
    record.actualFocusSeconds = m_actualFocusSeconds;
    record.distractionSeconds = m_distractionSeconds;
    record.interruptionCount = m_interruptionCount;
    record.focusScore = computeScore(m_actualFocusSeconds, m_distractionSeconds);
    record.goalLabel = m_goalLabel;
    return record;
}

PomodoroPhase FocusEngine::phase() const
{
    return PomodoroPhase::None;
}

void FocusEngine::setTarget(int targetMinutes, const std::string &goalLabel)
{
    m_targetMinutes = targetMinutes;
    m_goalLabel = goalLabel;
}

void FocusEngine::resetCounters()
{
    m_actualFocusSeconds = 0;
    m_distractionSeconds = 0;
    m_interruptionCount = 0;
}

void FocusEngine::publish()
{
    emit updated(snapshot());
}

FocusSnapshot FocusEngine::snapshot() const
{
    FocusSnapshot snap;
    snap.status = m_status;
    snap.phase = phase();
    snap.goalLabel = m_goalLabel;
    snap.lockedApp = m_lockedApp.value_or(std::string());
    snap.currentApp = m_currentApp.value_or(std::string());
    snap.currentTitle = m_currentTitle.value_or(std::string());
    snap.elapsedSeconds = m_actualFocusSeconds;
    snap.targetSeconds = m_targetMinutes * 60;
    snap.distractionSeconds = m_distractionSeconds;
    snap.interruptionCount = m_interruptionCount;
    snap.score = score();
    return snap;
}

FocusStatus FocusEngine::status() const
{
    return m_status;
}

double FocusEngine::score() const
{
    return computeScore(m_actualFocusSeconds, m_distractionSeconds);
}

int FocusEngine::actualFocusSeconds() const
{
    return m_actualFocusSeconds;
}

int FocusEngine::distractionSeconds() const
{
    return m_distractionSeconds;
}

int FocusEngine::interruptionCount() const
{
    return m_interruptionCount;
}

int FocusEngine::targetMinutes() const
{
    return m_targetMinutes;
}

const std::string &FocusEngine::goalLabel() const
{
    return m_goalLabel;
}

const std::optional<std::string> &FocusEngine::lockedApp() const
{
    return m_lockedApp;
}

std::optional<bool> FocusEngine::cachedVerdict(const std::string &title) const
{
    const auto it = m_relevanceCache.find(title);
    if (it == m_relevanceCache.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> FocusEngine::recordId() const
{
    return m_recordId;
}

bool FocusEngine::isWhitelisted(const std::string &appName)
{
    const std::string name = Categorizer::normalizeProcessName(appName);
    return kWhitelist.count(name) > 0 || name.find("terminal") != std::string::npos;
}

double FocusEngine::computeScore(int focusSeconds, int distractionSeconds)
{
    const int total = focusSeconds + distractionSeconds;
    if (total <= 0) {
        return 100.0;
    }
    return static_cast<double>(focusSeconds) / static_cast<double>(total) * 100.0;
}

} // namespace tracewatch
