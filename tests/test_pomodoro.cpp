#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <utility>
#include <vector>

#include "daemon/tracewatch_store.hpp"
#include "focus/pomodoro_timer.hpp"
#include "focus/relevance_oracle.hpp"
#include "focus/session_guard.hpp"
#include "test_fakes.hpp"

using tracewatch::PomodoroPhase;
using tracewatch::PomodoroTimer;
using tracewatch::testing::FakeWindowObserver;

namespace {

void tickFor(PomodoroTimer &timer, int seconds, const std::string &app)
{
    const tracewatch::ForegroundWindow window{app, app + " window", 99};
    for (int i = 0; i < seconds; ++i) {
        timer.evaluate(window);
    }
}

} // namespace

class PomodoroTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();
    void testWorkPhaseEndsInShortBreak();
    void testBreakIgnoresDistraction();
    void testFourthBreakIsLong();
    void testContextLockSurvivesBreaks();
    void testStopPersistsSingleRecord();

private:
    QTemporaryDir m_tempDir;
    std::unique_ptr<tracewatch::TraceStore> m_store;
    FakeWindowObserver m_observer;
    tracewatch::PermissiveRelevanceOracle m_oracle;
    std::unique_ptr<tracewatch::InMemorySessionGuard> m_guard;
    std::vector<std::pair<PomodoroPhase, int>> m_phases;
};

void PomodoroTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void PomodoroTests::init()
{
    m_store = std::make_unique<tracewatch::TraceStore>(
        std::filesystem::path(m_tempDir.path().toStdString())
        / QTest::currentTestFunction() / "pomodoro.db");
    m_guard = std::make_unique<tracewatch::InMemorySessionGuard>(
        tracewatch::InMemorySessionGuard::makeSlot());
    m_phases.clear();
}

void PomodoroTests::cleanup()
{
    m_guard.reset();
    m_store.reset();
}

void PomodoroTests::testWorkPhaseEndsInShortBreak()
{
    PomodoroTimer timer(*m_store, m_observer, *m_guard, m_oracle);
    connect(&timer, &PomodoroTimer::phaseChanged, this, [this](PomodoroPhase phase, int minutes) {
        m_phases.emplace_back(phase, minutes);
    });
    timer.start();
    QCOMPARE(timer.phase(), PomodoroPhase::Work);
    QCOMPARE(timer.targetMinutes(), 25);

    tickFor(timer, 1499, "code");
    QCOMPARE(timer.phase(), PomodoroPhase::Work);
    tickFor(timer, 1, "code");

    QCOMPARE(timer.phase(), PomodoroPhase::Break);
    QCOMPARE(timer.targetMinutes(), 5);
    QCOMPARE(timer.goalLabel(), std::string("Short Break"));
    QCOMPARE(timer.completedWorkPhases(), 1);
    QCOMPARE(timer.actualFocusSeconds(), 0);
    QCOMPARE(timer.distractionSeconds(), 0);
    QCOMPARE(timer.interruptionCount(), 0);
    QVERIFY(timer.isRunning());

    QCOMPARE(m_phases.size(), size_t(1));
    QCOMPARE(m_phases[0].first, PomodoroPhase::Break);
    QCOMPARE(m_phases[0].second, 5);
    QCOMPARE(timer.snapshot().phase, PomodoroPhase::Break);
}

void PomodoroTests::testBreakIgnoresDistraction()
{
    PomodoroTimer timer(*m_store, m_observer, *m_guard, m_oracle);
    timer.start();
    tickFor(timer, 1500, "code");

    tickFor(timer, 120, "youtube");
    QCOMPARE(timer.status(), tracewatch::FocusStatus::Neutral);
    QCOMPARE(timer.actualFocusSeconds(), 120);
    QCOMPARE(timer.distractionSeconds(), 0);

    // The break also elapses with no window in front.
    for (int i = 0; i < 180; ++i) {
        timer.evaluate(std::nullopt);
    }
    QCOMPARE(timer.phase(), PomodoroPhase::Work);
    QCOMPARE(timer.targetMinutes(), 25);
    QCOMPARE(timer.actualFocusSeconds(), 0);
}

void PomodoroTests::testFourthBreakIsLong()
{
    PomodoroTimer timer(*m_store, m_observer, *m_guard, m_oracle);
    connect(&timer, &PomodoroTimer::phaseChanged, this, [this](PomodoroPhase phase, int minutes) {
        m_phases.emplace_back(phase, minutes);
    });
    timer.start();

    for (int cycle = 0; cycle < 3; ++cycle) {
        tickFor(timer, 1500, "code");
        QCOMPARE(timer.targetMinutes(), 5);
        tickFor(timer, 300, "code");
    }
    tickFor(timer, 1500, "code");
    QCOMPARE(timer.completedWorkPhases(), 4);
    QCOMPARE(timer.targetMinutes(), 15);
    QCOMPARE(timer.goalLabel(), std::string("Long Break"));

    tickFor(timer, 900, "code");
    QCOMPARE(timer.phase(), PomodoroPhase::Work);
    QCOMPARE(m_phases.size(), size_t(8));
    QCOMPARE(m_phases[6].first, PomodoroPhase::Break);
    QCOMPARE(m_phases[6].second, 15);
    QCOMPARE(m_phases[7].first, PomodoroPhase::Work);
    QCOMPARE(m_phases[7].second, 25);
}

void PomodoroTests::testContextLockSurvivesBreaks()
{
    PomodoroTimer timer(*m_store, m_observer, *m_guard, m_oracle);
    timer.start();
    tickFor(timer, 1500, "code");
    tickFor(timer, 300, "slack");

    QCOMPARE(*timer.lockedApp(), std::string("code"));
    tickFor(timer, 1, "slack");
    QCOMPARE(timer.status(), tracewatch::FocusStatus::Distracted);
    QCOMPARE(timer.distractionSeconds(), 1);
}

void PomodoroTests::testStopPersistsSingleRecord()
{
    {
        PomodoroTimer timer(*m_store, m_observer, *m_guard, m_oracle);
        timer.start();
        tickFor(timer, 1500, "code");
        tickFor(timer, 300, "code");
        tickFor(timer, 100, "code");
        tickFor(timer, 20, "slack");
        timer.stop();
        QVERIFY(!m_guard->isHeld());
    }

    const auto stored = m_store->getFocusSessions(std::nullopt, 10);
    QCOMPARE(stored.size(), size_t(1));
    QCOMPARE(stored[0].goalLabel, std::string("Pomodoro Work"));
    QCOMPARE(stored[0].targetMinutes, 50);
    QCOMPARE(stored[0].actualFocusSeconds, 1600);
    QCOMPARE(stored[0].distractionSeconds, 20);
    QCOMPARE(stored[0].interruptionCount, 1);
}

QTEST_MAIN(PomodoroTests)
#include "test_pomodoro.moc"
