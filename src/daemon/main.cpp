#include <QCoreApplication>
#include <QDebug>

#include <exception>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/shutdown_signals.hpp"
#include "daemon/tracewatch_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("tracewatch-daemon"));
    qInfo() << "Tracewatch daemon starting...";

    bool debugTrace = qEnvironmentVariableIntValue("TRACEWATCH_DEBUG_TRACE") == 1;
    tracewatch::DaemonOptions options;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--debug-trace")) {
            debugTrace = true;
        } else if (arg == QStringLiteral("--no-browser-sync")) {
            options.browserSync = false;
        } else if (arg == QStringLiteral("--no-status")) {
            options.statusLine = false;
        } else {
            qWarning().noquote() << "Usage: tracewatch-daemon [--debug-trace] [--no-browser-sync] [--no-status]";
            return 1;
        }
    }
    tracewatch::logging::initLogging(QStringLiteral("tracewatch-daemon"), debugTrace);
    tracewatch::logging::installQtMessageBridge();
    TWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("config_file"),
               tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"browserSync", options.browserSync}}));

    const tracewatch::Config config = tracewatch::loadConfig();

    std::unique_ptr<tracewatch::TraceDaemon> daemon;
    try {
        daemon = std::make_unique<tracewatch::TraceDaemon>(config, options);
    } catch (const std::exception &ex) {
        qCritical() << "Tracewatch: cannot open the database:" << ex.what();
        TWLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_init_failed"),
                    QString::fromStdString(ex.what()),
                    QStringLiteral("exit"),
                    tracewatch::logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
        return 1;
    }

    tracewatch::ShutdownSignals shutdownSignals;
    if (!shutdownSignals.install()) {
        qWarning() << "Tracewatch: signal handlers not installed, stop with SIGKILL loses the open session.";
    }
    QObject::connect(&shutdownSignals, &tracewatch::ShutdownSignals::shutdownRequested,
                     daemon.get(), &tracewatch::TraceDaemon::shutdown);
    QObject::connect(daemon.get(), &tracewatch::TraceDaemon::stopped,
                     &app, &QCoreApplication::quit, Qt::QueuedConnection);

    // The daemon lives for the lifetime of the process.
    daemon->start();
    if (!daemon->isStorageHealthy()) {
        return 1;
    }

    return app.exec();
}
