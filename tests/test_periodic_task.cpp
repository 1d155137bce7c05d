#include <QtTest/QtTest>

#include <chrono>
#include <stdexcept>

#include "common/periodic_task.hpp"

using namespace std::chrono_literals;

class PeriodicTaskTests : public QObject
{
    Q_OBJECT
private slots:
    void testRunOnceInvokesWork();
    void testExceptionConfinedToTick();
    void testForeignExceptionReleasesTick();
    void testReentrantTickSkipped();
    void testStartImmediately();
    void testTimerDrivesTicks();
};

void PeriodicTaskTests::testRunOnceInvokesWork()
{
    int runs = 0;
    tracewatch::PeriodicTask task(QStringLiteral("count"), 1h, [&runs]() { ++runs; });
    QCOMPARE(task.name(), QStringLiteral("count"));
    QCOMPARE(task.interval(), std::chrono::milliseconds(3600000));
    QVERIFY(!task.isActive());

    task.runOnce();
    task.runOnce();
    QCOMPARE(runs, 2);
}

void PeriodicTaskTests::testExceptionConfinedToTick()
{
    int runs = 0;
    tracewatch::PeriodicTask task(QStringLiteral("flaky"), 1h, [&runs]() {
        ++runs;
        if (runs == 1) {
            throw std::runtime_error("database is locked");
        }
    });

    task.runOnce();
    task.runOnce();
    QCOMPARE(runs, 2);
}

void PeriodicTaskTests::testForeignExceptionReleasesTick()
{
    int runs = 0;
    tracewatch::PeriodicTask task(QStringLiteral("foreign"), 1h, [&runs]() {
        ++runs;
        if (runs == 1) {
            throw 42;
        }
    });

    bool propagated = false;
    try {
        task.runOnce();
    } catch (int code) {
        propagated = code == 42;
    }
    QVERIFY(propagated);

    task.runOnce();
    QCOMPARE(runs, 2);
}

void PeriodicTaskTests::testReentrantTickSkipped()
{
    int runs = 0;
    tracewatch::PeriodicTask *self = nullptr;
    tracewatch::PeriodicTask task(QStringLiteral("nested"), 1h, [&runs, &self]() {
        ++runs;
        self->runOnce();
    });
    self = &task;

    task.runOnce();
    QCOMPARE(runs, 1);
}

void PeriodicTaskTests::testStartImmediately()
{
    int runs = 0;
    tracewatch::PeriodicTask task(QStringLiteral("eager"), 1h, [&runs]() { ++runs; });
    task.start(true);
    QCOMPARE(runs, 1);
    QVERIFY(task.isActive());

    // Already active: no second immediate run.
    task.start(true);
    QCOMPARE(runs, 1);

    task.stop();
    QVERIFY(!task.isActive());
}

void PeriodicTaskTests::testTimerDrivesTicks()
{
    int runs = 0;
    tracewatch::PeriodicTask task(QStringLiteral("fast"), 10ms, [&runs]() { ++runs; });
    task.start();
    QTRY_VERIFY_WITH_TIMEOUT(runs >= 3, 5000);
    task.stop();

    const int stoppedAt = runs;
    QTest::qWait(50);
    QCOMPARE(runs, stoppedAt);
}

QTEST_MAIN(PeriodicTaskTests)
#include "test_periodic_task.moc"
