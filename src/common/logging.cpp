#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSysInfo>
#include <QThread>
#include <QtGlobal>

#include <unistd.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace tracewatch::logging {

namespace {

// Open log files, reused across events so the one-second poll does not reopen
// them every tick.
class LogSink
{
public:
    void configure(const QString &processName, bool debugTrace)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_processName = processName;
        m_debugTrace = debugTrace;
        m_files.clear();
    }

    bool debugTrace() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_debugTrace;
    }

    QString processName() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_processName;
    }

    void write(LogLevel level, const QString &process, const QByteArray &line)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const QString base = logsDirPath() + QLatin1Char('/')
            + (process.isEmpty() ? QStringLiteral("tracewatch") : process);
        if (level != LogLevel::Debug || m_debugTrace) {
            append(base + QStringLiteral(".log"), line);
        }
        if (m_debugTrace) {
            append(base + QStringLiteral("-trace.log"), line);
        }
    }

private:
    void append(const QString &path, const QByteArray &line)
    {
        auto &file = m_files[path];
        if (file && file->size() >= kMaxLogSizeBytes) {
            file.reset();
        }
        if (!file) {
            if (QFileInfo(path).size() >= kMaxLogSizeBytes) {
                rotate(path);
            }
            QDir().mkpath(logsDirPath());
            file = std::make_unique<QFile>(path);
            if (!file->open(QIODevice::WriteOnly | QIODevice::Append)) {
                file.reset();
                std::fprintf(stderr, "%s\n", line.constData());
                return;
            }
        }
        file->write(line);
        file->write("\n", 1);
        file->flush();
    }

    static void rotate(const QString &path)
    {
        QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
        for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
            QFile::rename(path + QStringLiteral(".%1").arg(generation),
                          path + QStringLiteral(".%1").arg(generation + 1));
        }
        QFile::rename(path, path + QStringLiteral(".1"));
    }

    mutable std::mutex m_mutex;
    QString m_processName;
    bool m_debugTrace = false;
    std::map<QString, std::unique_ptr<QFile>> m_files;
};

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

thread_local QString t_corrId;

QString threadTag()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

void qtMessageBridge(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    std::fprintf(stderr, "%s\n", message.toLocal8Bit().constData());
    if (type == QtDebugMsg || type == QtInfoMsg) {
        return;
    }

    const LogLevel level = type == QtWarningMsg ? LogLevel::Warn : LogLevel::Error;
    logEvent(level,
             defaultProcessName(),
             QStringLiteral("qt"),
             QString::fromUtf8(context.function ? context.function : ""),
             QStringLiteral("qt_message"),
             message,
             QStringLiteral("message_handler"),
             defaultWho(),
             QString(),
             nlohmann::json{{"category", context.category ? context.category : ""}});
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/tracewatch/logs");
    return home.isEmpty() ? relative : home + QLatin1Char('/') + relative;
}

void initLogging(const QString &processName, bool debugTraceEnabled)
{
    sink().configure(processName, debugTraceEnabled);
}

bool isDebugTraceEnabled()
{
    return sink().debugTrace();
}

void installQtMessageBridge()
{
    qInstallMessageHandler(qtMessageBridge);
}

QString levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    const QString configured = sink().processName();
    if (!configured.isEmpty()) {
        return configured;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("tracewatch");
}

QString defaultWho()
{
    static const QString who = [] {
        const QString user = qEnvironmentVariable("USER");
        return (user.isEmpty() ? QStringLiteral("uid%1").arg(::getuid()) : user)
            + QLatin1Char('@') + QSysInfo::machineHostName();
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json event = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadTag().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };
    // Invalid UTF-8 in window titles must not throw out of a logging call.
    const std::string line = event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    sink().write(level, process, QByteArray::fromStdString(line));
}

} // namespace tracewatch::logging
