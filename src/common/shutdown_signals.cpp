#include "common/shutdown_signals.hpp"

#include <QSocketNotifier>

#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

#include "common/logging.hpp"

namespace tracewatch {

namespace {

int g_signalFds[2] = {-1, -1};

void signalHandler(int signalNumber)
{
    const unsigned char value = static_cast<unsigned char>(signalNumber);
    const ssize_t written = ::write(g_signalFds[0], &value, sizeof(value));
    (void)written;
}

} // namespace

ShutdownSignals::ShutdownSignals(QObject *parent)
    : QObject(parent)
{
}

ShutdownSignals::~ShutdownSignals()
{
    if (!m_notifier) {
        return;
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGHUP, SIG_DFL);

    delete m_notifier;
    m_notifier = nullptr;
    for (int &fd : g_signalFds) {
        ::close(fd);
        fd = -1;
    }
}

bool ShutdownSignals::install()
{
    if (m_notifier) {
        return true;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        TWLOG_ERROR(QStringLiteral("ShutdownSignals"),
                    QStringLiteral("install"),
                    QStringLiteral("socketpair_failed"),
                    QStringLiteral("os_error"),
                    QStringLiteral("signals_not_bridged"),
                    ::tracewatch::logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
        return false;
    }

    m_notifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated,
            this, &ShutdownSignals::handleSignalPipe);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
    return true;
}

void ShutdownSignals::handleSignalPipe()
{
    m_notifier->setEnabled(false);
    unsigned char value = 0;
    const ssize_t bytes = ::read(g_signalFds[1], &value, sizeof(value));
    m_notifier->setEnabled(true);
    if (bytes != sizeof(value)) {
        return;
    }

    TWLOG_INFO(QStringLiteral("ShutdownSignals"),
               QStringLiteral("handleSignalPipe"),
               QStringLiteral("shutdown_signal"),
               QStringLiteral("os_signal"),
               QStringLiteral("self_pipe"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"signal", static_cast<int>(value)}}));
    emit shutdownRequested(static_cast<int>(value));
}

} // namespace tracewatch
