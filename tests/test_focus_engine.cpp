#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <functional>
#include <vector>

#include "daemon/tracewatch_store.hpp"
#include "focus/focus_engine.hpp"
#include "focus/relevance_oracle.hpp"
#include "focus/session_guard.hpp"
#include "test_fakes.hpp"

using tracewatch::testing::FakeWindowObserver;

namespace {

// Holds callbacks until the test answers them.
class DeferredOracle : public tracewatch::RelevanceOracle
{
public:
    struct Request {
        std::string goal;
        std::string title;
        Callback done;
    };

    void checkRelevance(const std::string &goal, const std::string &title, Callback done) override
    {
        requests.push_back({goal, title, std::move(done)});
    }

    std::vector<Request> requests;
};

std::optional<tracewatch::ForegroundWindow> window(const std::string &app,
                                                   const std::string &title)
{
    return tracewatch::ForegroundWindow{app, title, 1234};
}

} // namespace

class FocusEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();
    void testComputeScore();
    void testTicksIgnoredBeforeStart();
    void testContextLockAndInterruptions();
    void testWhitelistedAppsAreNeutral();
    void testMissingWindowChangesNothing();
    void testBrowserTitleVerdicts();
    void testVerdictCacheWipedWhenFull();
    void testGoalReachedStopsAndPersists();
    void testStopPersistsOnce();
    void testConcurrentSessionRejected();

private:
    QTemporaryDir m_tempDir;
    std::unique_ptr<tracewatch::TraceStore> m_store;
    std::shared_ptr<tracewatch::InMemorySessionGuard::Slot> m_slot;
};

void FocusEngineTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void FocusEngineTests::init()
{
    m_store = std::make_unique<tracewatch::TraceStore>(
        std::filesystem::path(m_tempDir.path().toStdString())
        / QTest::currentTestFunction() / "focus.db");
    m_slot = tracewatch::InMemorySessionGuard::makeSlot();
}

void FocusEngineTests::cleanup()
{
    m_store.reset();
    m_slot.reset();
}

void FocusEngineTests::testComputeScore()
{
    QCOMPARE(tracewatch::FocusEngine::computeScore(0, 0), 100.0);
    QCOMPARE(tracewatch::FocusEngine::computeScore(3, 1), 75.0);
    QCOMPARE(tracewatch::FocusEngine::computeScore(0, 10), 0.0);
}

void FocusEngineTests::testTicksIgnoredBeforeStart()
{
    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    tracewatch::PermissiveRelevanceOracle oracle;
    tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 25, "Write");

    engine.evaluate(window("code", "main.cpp"));
    QCOMPARE(engine.actualFocusSeconds(), 0);
    QVERIFY(!engine.lockedApp().has_value());
    QCOMPARE(engine.status(), tracewatch::FocusStatus::WaitingForContext);
}

void FocusEngineTests::testContextLockAndInterruptions()
{
    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    tracewatch::PermissiveRelevanceOracle oracle;
    tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 25, "Write");
    engine.start();

    for (int i = 0; i < 3; ++i) {
        engine.evaluate(window("code", "main.cpp"));
    }
    QCOMPARE(*engine.lockedApp(), std::string("code"));
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Focused);

    // Another title in the locked app is still focus.
    engine.evaluate(window("Code", "other.cpp"));
    QCOMPARE(engine.actualFocusSeconds(), 4);

    engine.evaluate(window("slack", "general"));
    engine.evaluate(window("slack", "general"));
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Distracted);
    QCOMPARE(engine.distractionSeconds(), 2);
    QCOMPARE(engine.interruptionCount(), 1);

    engine.evaluate(window("slack", "random"));
    QCOMPARE(engine.interruptionCount(), 2);
    QCOMPARE(engine.score(), 4.0 / 7.0 * 100.0);

    const auto snap = engine.snapshot();
    QCOMPARE(snap.lockedApp, std::string("code"));
    QCOMPARE(snap.currentApp, std::string("slack"));
    QCOMPARE(snap.elapsedSeconds, 4);
    QCOMPARE(snap.targetSeconds, 25 * 60);
    QCOMPARE(snap.phase, tracewatch::PomodoroPhase::None);
}

void FocusEngineTests::testWhitelistedAppsAreNeutral()
{
    QVERIFY(tracewatch::FocusEngine::isWhitelisted("konsole"));
    QVERIFY(tracewatch::FocusEngine::isWhitelisted("WindowsTerminal.exe"));
    QVERIFY(tracewatch::FocusEngine::isWhitelisted("xfce4-terminal"));
    QVERIFY(!tracewatch::FocusEngine::isWhitelisted("code"));

    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    tracewatch::PermissiveRelevanceOracle oracle;
    tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 25, "Write");
    engine.start();

    for (int i = 0; i < 30; ++i) {
        engine.evaluate(window("konsole", "~/src"));
    }
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Neutral);
    QVERIFY(!engine.lockedApp().has_value());
    QCOMPARE(engine.actualFocusSeconds(), 0);
    QCOMPARE(engine.distractionSeconds(), 0);

    engine.evaluate(window("code", "main.cpp"));
    QCOMPARE(*engine.lockedApp(), std::string("code"));
    for (int i = 0; i < 30; ++i) {
        engine.evaluate(window("konsole", "make"));
    }
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Neutral);
    QCOMPARE(*engine.lockedApp(), std::string("code"));
    QCOMPARE(engine.distractionSeconds(), 0);
    QCOMPARE(engine.interruptionCount(), 0);
    QCOMPARE(engine.actualFocusSeconds(), 1);
}

void FocusEngineTests::testMissingWindowChangesNothing()
{
    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    tracewatch::PermissiveRelevanceOracle oracle;
    tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 25, "Write");
    engine.start();

    engine.evaluate(window("code", "main.cpp"));
    engine.evaluate(std::nullopt);
    engine.evaluate(std::nullopt);
    QCOMPARE(engine.actualFocusSeconds(), 1);
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Focused);
}

void FocusEngineTests::testBrowserTitleVerdicts()
{
    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    DeferredOracle oracle;
    tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 25, "Learn Qt");
    engine.start();

    engine.evaluate(window("firefox", "QObject | Qt Core"));
    QCOMPARE(*engine.lockedApp(), std::string("firefox"));
    QCOMPARE(engine.cachedVerdict("QObject | Qt Core"), std::optional<bool>(true));
    QVERIFY(oracle.requests.empty());

    // Unknown titles count as focus while the verdict is pending.
    engine.evaluate(window("firefox", "cats - YouTube"));
    engine.evaluate(window("firefox", "cats - YouTube"));
    QCOMPARE(oracle.requests.size(), size_t(1));
    QCOMPARE(oracle.requests[0].goal, std::string("Learn Qt"));
    QCOMPARE(oracle.requests[0].title, std::string("cats - YouTube"));
    QCOMPARE(engine.actualFocusSeconds(), 3);

    oracle.requests[0].done(false);
    QCOMPARE(engine.cachedVerdict("cats - YouTube"), std::optional<bool>(false));

    // Staying on the page is not a new destination.
    engine.evaluate(window("firefox", "cats - YouTube"));
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Focused);
    QCOMPARE(engine.distractionSeconds(), 0);

    engine.evaluate(window("firefox", "QObject | Qt Core"));
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Focused);

    // Coming back to it applies the cached verdict.
    engine.evaluate(window("firefox", "cats - YouTube"));
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Distracted);
    QCOMPARE(engine.distractionSeconds(), 1);
    QCOMPARE(engine.interruptionCount(), 1);
    QCOMPARE(oracle.requests.size(), size_t(1));

    engine.evaluate(window("firefox", "QTimer | Qt Core"));
    QCOMPARE(oracle.requests.size(), size_t(2));
    oracle.requests[1].done(true);
    engine.evaluate(window("firefox", "QTimer | Qt Core"));
    QCOMPARE(engine.status(), tracewatch::FocusStatus::Focused);
    QCOMPARE(engine.actualFocusSeconds(), 7);
}

void FocusEngineTests::testVerdictCacheWipedWhenFull()
{
    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    DeferredOracle oracle;
    tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 25, "Read docs");
    engine.start();

    engine.evaluate(window("chromium", "page 0"));
    const size_t limit = tracewatch::FocusEngine::kMaxCachedVerdicts;
    for (size_t i = 1; i <= limit; ++i) {
        engine.evaluate(window("chromium", "page " + std::to_string(i)));
        oracle.requests.back().done(true);
    }
    QCOMPARE(oracle.requests.size(), limit);
    QCOMPARE(engine.cachedVerdict("page 0"), std::optional<bool>(true));

    const std::string overflow = "page " + std::to_string(limit + 1);
    engine.evaluate(window("chromium", overflow));
    oracle.requests.back().done(false);
    QVERIFY(!engine.cachedVerdict("page 0").has_value());
    QVERIFY(!engine.cachedVerdict("page 1").has_value());
    QCOMPARE(engine.cachedVerdict(overflow), std::optional<bool>(false));
}

void FocusEngineTests::testGoalReachedStopsAndPersists()
{
    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    tracewatch::PermissiveRelevanceOracle oracle;
    tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 1, "Sprint");

    int goalSignals = 0;
    std::vector<tracewatch::FocusSessionRecord> finished;
    connect(&engine, &tracewatch::FocusEngine::goalReached, this, [&goalSignals]() {
        ++goalSignals;
    });
    connect(&engine, &tracewatch::FocusEngine::finished, this,
            [&finished](const tracewatch::FocusSessionRecord &record) {
                finished.push_back(record);
            });

    engine.start();
    QVERIFY(guard.isHeld());
    for (int i = 0; i < 59; ++i) {
        engine.evaluate(window("code", "main.cpp"));
    }
    QVERIFY(engine.isRunning());
    engine.evaluate(window("code", "main.cpp"));

    QVERIFY(engine.isFinished());
    QVERIFY(!guard.isHeld());
    QCOMPARE(goalSignals, 1);
    QCOMPARE(finished.size(), size_t(1));
    QCOMPARE(finished[0].actualFocusSeconds, 60);
    QCOMPARE(finished[0].focusScore, 100.0);
    QVERIFY(engine.recordId().has_value());

    engine.evaluate(window("code", "main.cpp"));
    QCOMPARE(engine.actualFocusSeconds(), 60);

    const auto stored = m_store->getFocusSessions(std::nullopt, 10);
    QCOMPARE(stored.size(), size_t(1));
    QCOMPARE(stored[0].goalLabel, std::string("Sprint"));
    QCOMPARE(stored[0].targetMinutes, 1);
}

void FocusEngineTests::testStopPersistsOnce()
{
    FakeWindowObserver observer;
    tracewatch::InMemorySessionGuard guard(m_slot);
    tracewatch::PermissiveRelevanceOracle oracle;
    {
        tracewatch::FocusEngine engine(*m_store, observer, guard, oracle, 25, "Write");
        engine.start();
        engine.evaluate(window("code", "main.cpp"));
        engine.evaluate(window("slack", "general"));
        engine.stop();
        engine.stop();
    }

    const auto stored = m_store->getFocusSessions(std::nullopt, 10);
    QCOMPARE(stored.size(), size_t(1));
    QCOMPARE(stored[0].actualFocusSeconds, 1);
    QCOMPARE(stored[0].distractionSeconds, 1);
    QCOMPARE(stored[0].interruptionCount, 1);
    QCOMPARE(stored[0].focusScore, 50.0);
}

void FocusEngineTests::testConcurrentSessionRejected()
{
    FakeWindowObserver observer;
    tracewatch::PermissiveRelevanceOracle oracle;
    tracewatch::InMemorySessionGuard firstGuard(m_slot);
    tracewatch::InMemorySessionGuard secondGuard(m_slot);
    tracewatch::FocusEngine first(*m_store, observer, firstGuard, oracle, 25, "One");
    tracewatch::FocusEngine second(*m_store, observer, secondGuard, oracle, 25, "Two");

    first.start();
    QVERIFY_EXCEPTION_THROWN(second.start(), tracewatch::SessionConflictError);
    QVERIFY(!second.isRunning());

    first.stop();
    second.start();
    QVERIFY(second.isRunning());
    second.stop();

    QCOMPARE(m_store->getFocusSessions(std::nullopt, 10).size(), size_t(2));
}

QTEST_MAIN(FocusEngineTests)
#include "test_focus_engine.moc"
