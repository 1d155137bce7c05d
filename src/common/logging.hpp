#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tracewatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/**
 * Structured JSON-lines logging shared by the daemon and both CLIs.
 *
 * Every event is one object per line in <logsDir>/<process>.log. Debug events
 * are dropped unless debug trace is on; with debug trace on, every event is
 * also copied to <process>-trace.log. Files are rotated by size and the last
 * kRotatedGenerations files are kept as .1, .2, ...
 */
void initLogging(const QString &processName, bool debugTraceEnabled);

bool isDebugTraceEnabled();

// ~/.local/share/tracewatch/logs
QString logsDirPath();

// Routes qWarning()/qCritical()/qFatal() into the JSON log as well as stderr,
// so daemon warnings survive the terminal they were printed on.
void installQtMessageBridge();

QString levelName(LogLevel level);

// Thread-local id stamped on events that pass no correlation id of their own.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
// "user@host"
QString defaultWho();

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

} // namespace tracewatch::logging

#define TWLOG_EVENT_(level, component, where, what, why, how, who, corr, ctxJson) \
    ::tracewatch::logging::logEvent((level), ::tracewatch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), \
                                    (ctxJson))

#define TWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    TWLOG_EVENT_(::tracewatch::logging::LogLevel::Debug, component, where, what, why, how, who, \
                 corr, ctxJson)

#define TWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    TWLOG_EVENT_(::tracewatch::logging::LogLevel::Info, component, where, what, why, how, who, \
                 corr, ctxJson)

#define TWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    TWLOG_EVENT_(::tracewatch::logging::LogLevel::Warn, component, where, what, why, how, who, \
                 corr, ctxJson)

#define TWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    TWLOG_EVENT_(::tracewatch::logging::LogLevel::Error, component, where, what, why, how, who, \
                 corr, ctxJson)
