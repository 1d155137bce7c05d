#include <QtTest/QtTest>

#include <QDir>
#include <QSignalSpy>

#include <csignal>

#include "common/shutdown_signals.hpp"

class ShutdownSignalsTests : public QObject
{
    Q_OBJECT
private slots:
    void testSigtermDeliveredAsSignal();
    void testDestructionClosesSocketPair();
    void testReinstallAfterDestruction();
};

namespace {

int openDescriptorCount()
{
    return QDir(QStringLiteral("/proc/self/fd"))
        .entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::System)
        .size();
}

} // namespace

void ShutdownSignalsTests::testSigtermDeliveredAsSignal()
{
    tracewatch::ShutdownSignals signals_;
    QVERIFY(signals_.install());
    QVERIFY(signals_.install());

    QSignalSpy spy(&signals_, &tracewatch::ShutdownSignals::shutdownRequested);
    QCOMPARE(std::raise(SIGTERM), 0);
    QVERIFY(spy.wait(2000));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toInt(), SIGTERM);
}

void ShutdownSignalsTests::testDestructionClosesSocketPair()
{
    const int before = openDescriptorCount();
    for (int i = 0; i < 5; ++i) {
        tracewatch::ShutdownSignals signals_;
        QVERIFY(signals_.install());
        QCOMPARE(openDescriptorCount(), before + 2);
    }
    QCOMPARE(openDescriptorCount(), before);

    // Never installed: nothing to close.
    {
        tracewatch::ShutdownSignals idle;
    }
    QCOMPARE(openDescriptorCount(), before);
}

void ShutdownSignalsTests::testReinstallAfterDestruction()
{
    {
        tracewatch::ShutdownSignals first;
        QVERIFY(first.install());
    }

    tracewatch::ShutdownSignals second;
    QVERIFY(second.install());
    QSignalSpy spy(&second, &tracewatch::ShutdownSignals::shutdownRequested);
    QCOMPARE(std::raise(SIGHUP), 0);
    QVERIFY(spy.wait(2000));
    QCOMPARE(spy.at(0).at(0).toInt(), SIGHUP);
}

QTEST_MAIN(ShutdownSignalsTests)
#include "test_shutdown_signals.moc"
