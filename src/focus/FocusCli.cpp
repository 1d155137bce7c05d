#include "focus/FocusCli.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>

#include <QCoreApplication>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/format_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/shutdown_signals.hpp"
#include "daemon/tracewatch_store.hpp"
#include "daemon/x11_window_observer.hpp"
#include "focus/focus_engine.hpp"
#include "focus/pomodoro_timer.hpp"
#include "focus/relevance_oracle.hpp"
#include "focus/session_guard.hpp"

namespace tracewatch {

namespace {

constexpr int kProgressCells = 20;
constexpr int kMaxMinutes = 24 * 60;
constexpr size_t kTitleWidth = 50;

const char *const kReset = "\033[0m";
const char *const kBold = "\033[1m";
const char *const kDim = "\033[2m";
const char *const kRed = "\033[31m";
const char *const kGreen = "\033[32m";
const char *const kYellow = "\033[33m";
const char *const kCyan = "\033[36m";

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tracewatch-focus focus MINUTES [--goal LABEL]\n"
        "  tracewatch-focus pomodoro\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

const char *scoreColor(double score)
{
    if (score >= 80.0) {
        return kGreen;
    }
    if (score >= 50.0) {
        return kYellow;
    }
    return kRed;
}

std::string statusLabel(FocusStatus status)
{
    switch (status) {
    case FocusStatus::WaitingForContext:
        return std::string(kDim) + "WAITING FOR CONTEXT" + kReset;
    case FocusStatus::Focused:
        return std::string(kGreen) + kBold + "FOCUSED" + kReset;
    case FocusStatus::Distracted:
        return std::string(kRed) + kBold + "DISTRACTED" + kReset;
    case FocusStatus::Neutral:
        return std::string(kYellow) + "NEUTRAL" + kReset;
    }
    return {};
}

std::string progressBar(int elapsed, int target)
{
    const double ratio = target > 0
        ? std::min(1.0, static_cast<double>(elapsed) / static_cast<double>(target))
        : 0.0;
    const int filled = static_cast<int>(ratio * kProgressCells);
    std::string bar;
    for (int i = 0; i < kProgressCells; ++i) {
        bar += i < filled ? "█" : "░";
    }
    std::ostringstream out;
    out << bar << " " << static_cast<int>(ratio * 100.0) << "%";
    return out.str();
}

std::string clipped(const std::string &text)
{
    if (text.size() <= kTitleWidth) {
        return text;
    }
    return text.substr(0, kTitleWidth - 3) + "...";
}

void redraw(const std::string &panel)
{
    if (::isatty(STDOUT_FILENO)) {
        std::cout << "\033[H\033[2J";
    }
    std::cout << panel << std::flush;
}

} // namespace

int FocusCli::parseMinutes(const QString &value)
{
    bool ok = false;
    const int minutes = value.toInt(&ok);
    if (!ok || minutes < 1 || minutes > kMaxMinutes) {
        return 0;
    }
    return minutes;
}

std::string FocusCli::renderPanel(const FocusSnapshot &snapshot)
{
    std::ostringstream out;
    if (snapshot.phase == PomodoroPhase::Break) {
        out << kCyan << kBold << "  " << snapshot.goalLabel << kReset << "\n\n";
        out << "  Step away from the screen.\n";
        out << "  Progress:  " << kCyan << progressBar(snapshot.elapsedSeconds, snapshot.targetSeconds)
            << kReset << "\n";
        out << "  Remaining: "
            << formatDuration(std::max(0, snapshot.targetSeconds - snapshot.elapsedSeconds)) << "\n";
        return out.str();
    }

    out << kCyan << kBold << "  Focus: " << snapshot.goalLabel << kReset << "\n\n";
    out << "  Status:        " << statusLabel(snapshot.status) << "\n";
    out << "  Locked app:    "
        << (snapshot.lockedApp.empty() ? std::string("(first app you use)") : snapshot.lockedApp)
        << "\n";
    if (!snapshot.currentApp.empty()) {
        out << "  Current:       " << snapshot.currentApp << kDim << "  "
            << clipped(snapshot.currentTitle) << kReset << "\n";
    }
    out << "  Progress:      " << progressBar(snapshot.elapsedSeconds, snapshot.targetSeconds)
        << "  " << formatDuration(snapshot.elapsedSeconds) << " / "
        << formatDuration(snapshot.targetSeconds) << "\n";
    out << "  Score:         " << scoreColor(snapshot.score) << kBold
        << formatPercent(snapshot.score, 0) << kReset << "\n";
    out << "  Distracted:    " << formatDuration(snapshot.distractionSeconds)
        << "   Interruptions: " << snapshot.interruptionCount << "\n";
    out << kDim << "\n  Press Ctrl+C to end the session." << kReset << "\n";
    return out.str();
}

std::string FocusCli::renderSummary(const FocusSessionRecord &record)
{
    std::ostringstream out;
    out << "\n" << kBold << "  Session complete: " << record.goalLabel << kReset << "\n";
    out << "  Focused:       " << formatDuration(record.actualFocusSeconds)
        << " of " << record.targetMinutes << "m\n";
    out << "  Distracted:    " << formatDuration(record.distractionSeconds) << "\n";
    out << "  Interruptions: " << record.interruptionCount << "\n";
    out << "  Score:         " << scoreColor(record.focusScore) << kBold
        << formatPercent(record.focusScore, 0) << kReset << "\n";
    return out.str();
}

int FocusCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    TWLOG_INFO(QStringLiteral("FocusCli"),
               QStringLiteral("run"),
               QStringLiteral("focus_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});
    if (command == QStringLiteral("focus")) {
        return runFocus(args);
    }
    if (command == QStringLiteral("pomodoro")) {
        return runPomodoro(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int FocusCli::runFocus(const QStringList &args)
{
    if (args.size() < 3) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const int minutes = parseMinutes(args.at(2));
    if (minutes == 0) {
        std::cerr << "Minutes must be a whole number between 1 and " << kMaxMinutes << ".\n";
        return 1;
    }
    QString goal = getArgValue(args, QStringLiteral("--goal"));
    if (goal.isEmpty()) {
        goal = QStringLiteral("Deep Work");
    }

    return runSession([minutes, goal](TraceStore &store,
                                      WindowObserver &observer,
                                      SessionGuard &guard,
                                      RelevanceOracle &oracle) {
        return std::make_unique<FocusEngine>(store, observer, guard, oracle,
                                             minutes, goal.toStdString());
    });
}

int FocusCli::runPomodoro(const QStringList &args)
{
    if (args.size() > 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    return runSession([](TraceStore &store,
                         WindowObserver &observer,
                         SessionGuard &guard,
                         RelevanceOracle &oracle) -> std::unique_ptr<FocusEngine> {
        auto timer = std::make_unique<PomodoroTimer>(store, observer, guard, oracle);
        // The next panel shows the new phase; ring the terminal bell at the boundary.
        QObject::connect(timer.get(), &PomodoroTimer::phaseChanged,
                         [](PomodoroPhase, int) { std::cout << "\a" << std::flush; });
        return timer;
    });
}

int FocusCli::runSession(const EngineFactory &makeEngine)
{
    const Config config = loadConfig();

    std::unique_ptr<TraceStore> store;
    try {
        store = std::make_unique<TraceStore>();
    } catch (const std::exception &ex) {
        std::cerr << "Failed to open the tracewatch database: " << ex.what() << std::endl;
        return 1;
    }

    X11WindowObserver observer;
    if (!observer.open()) {
        std::cerr << "No X display reachable; focus sessions need the foreground window." << std::endl;
        return 1;
    }

    LockFileSessionGuard guard(LockFileSessionGuard::defaultLockPath());

    std::unique_ptr<RelevanceOracle> oracle;
    if (config.ai.isConfigured()) {
        oracle = std::make_unique<LlmRelevanceOracle>(config.ai);
    } else {
        oracle = std::make_unique<PermissiveRelevanceOracle>();
    }

    std::unique_ptr<FocusEngine> engine = makeEngine(*store, observer, guard, *oracle);

    QObject::connect(engine.get(), &FocusEngine::updated,
                     [](const FocusSnapshot &snapshot) { redraw(renderPanel(snapshot)); });
    QObject::connect(engine.get(), &FocusEngine::finished,
                     [](const FocusSessionRecord &record) {
                         std::cout << renderSummary(record) << std::flush;
                         QCoreApplication::quit();
                     });

    ShutdownSignals shutdownSignals;
    if (!shutdownSignals.install()) {
        std::cerr << "Signal handlers not installed; Ctrl+C will not save the session." << std::endl;
    }
    FocusEngine *rawEngine = engine.get();
    QObject::connect(&shutdownSignals, &ShutdownSignals::shutdownRequested,
                     [rawEngine](int) { rawEngine->stop(); });

    try {
        engine->start();
    } catch (const SessionConflictError &ex) {
        std::cerr << "Cannot start: " << ex.what() << "." << std::endl;
        std::cerr << "Lock file: " << guard.lockPath().toStdString();
        if (guard.holderPid() > 0) {
            std::cerr << " (held by pid " << guard.holderPid() << ")";
        }
        std::cerr << std::endl;
        return 1;
    }

    const int code = QCoreApplication::exec();
    // The engine must go before the guard and store it references.
    engine.reset();
    return code;
}

} // namespace tracewatch
