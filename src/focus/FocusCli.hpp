#pragma once

#include <functional>
#include <memory>
#include <string>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace tracewatch {

class FocusEngine;
class RelevanceOracle;
class SessionGuard;
class TraceStore;
class WindowObserver;

class FocusCli
{
public:
    // Runs a focus or pomodoro session on the current QCoreApplication's
    // event loop until the goal is met or the user interrupts.
    // returns exit code
    int run(int argc, char *argv[]);

    // Live terminal panel for one tick, ANSI colored.
    static std::string renderPanel(const FocusSnapshot &snapshot);
    static std::string renderSummary(const FocusSessionRecord &record);
    // Integer minutes in [1, 1440], 0 when the value is not one.
    static int parseMinutes(const QString &value);

private:
    using EngineFactory = std::function<std::unique_ptr<FocusEngine>(
        TraceStore &, WindowObserver &, SessionGuard &, RelevanceOracle &)>;

    int runFocus(const QStringList &args);
    int runPomodoro(const QStringList &args);
    int runSession(const EngineFactory &makeEngine);
};

} // namespace tracewatch
