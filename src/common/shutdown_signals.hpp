#pragma once

#include <QObject>

class QSocketNotifier;

namespace tracewatch {

// Bridges SIGINT/SIGTERM/SIGHUP into the Qt event loop through a self-pipe,
// so shutdown work runs as an ordinary slot instead of inside a signal handler.
class ShutdownSignals : public QObject
{
    Q_OBJECT
public:
    explicit ShutdownSignals(QObject *parent = nullptr);
    ~ShutdownSignals() override;

    bool install();

signals:
    void shutdownRequested(int signalNumber);

private slots:
    void handleSignalPipe();

private:
    QSocketNotifier *m_notifier = nullptr;
};

} // namespace tracewatch
