#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <sqlite3.h>

#include <chrono>
#include <filesystem>

#include "common/logging.hpp"
#include "daemon/categorizer.hpp"
#include "daemon/session_tracker.hpp"
#include "daemon/tracewatch_store.hpp"
#include "test_fakes.hpp"

using namespace std::chrono_literals;
using tracewatch::testing::FakeProcessInfo;
using tracewatch::testing::FakeWindowObserver;

class SessionTrackerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();
    void testShortSessionIsDiscarded();
    void testSwitchClosesSession();
    void testNoWindowKeepsSessionOpen();
    void testFlushClosesOpenSession();
    void testResourceAttached();
    void testSearchTitleRecorded();
    void testPersistFailureIsLoggedAndPollingContinues();
    void testResourceRefreshedWhileWindowUnchanged();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::unique_ptr<tracewatch::TraceStore> m_store;
    tracewatch::Categorizer m_categorizer;
    std::chrono::system_clock::time_point m_base;
};

void SessionTrackerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    tracewatch::logging::initLogging(QStringLiteral("tracker-test"), false);
    m_base = tracewatch::localDayBounds("2026-03-02")->first + 10h;
}

void SessionTrackerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SessionTrackerTests::init()
{
    m_store = std::make_unique<tracewatch::TraceStore>(
        std::filesystem::path(m_tempDir.path().toStdString())
        / QTest::currentTestFunction() / "tracker.db");
}

void SessionTrackerTests::cleanup()
{
    m_store.reset();
}

void SessionTrackerTests::testShortSessionIsDiscarded()
{
    FakeWindowObserver observer;
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, nullptr);

    observer.show("code", "main.cpp");
    tracker.poll(m_base);
    observer.show("firefox", "Docs");
    tracker.poll(m_base + 1s);
    observer.show("firefox", "Docs");
    for (int i = 2; i <= 11; ++i) {
        tracker.poll(m_base + std::chrono::seconds(i));
    }
    observer.show("code", "main.cpp");
    tracker.poll(m_base + 11s);

    const auto sessions = m_store->getSessionsForDate("2026-03-02");
    QCOMPARE(sessions.size(), size_t(1));
    QCOMPARE(sessions[0].appName, std::string("firefox"));
    QCOMPARE(sessions[0].durationSeconds, 10.0);
    QCOMPARE(tracker.totalLogged(), 1);
    QCOMPARE(tracker.totalSwitches(), 2);
}

void SessionTrackerTests::testSwitchClosesSession()
{
    FakeWindowObserver observer;
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, nullptr);

    observer.show("code", "a.cpp");
    tracker.poll(m_base);
    tracker.poll(m_base + 3s);
    observer.show("code", "b.cpp");
    tracker.poll(m_base + 5s);

    const auto sessions = m_store->getSessionsForDate("2026-03-02");
    QCOMPARE(sessions.size(), size_t(1));
    QCOMPARE(sessions[0].windowTitle, std::string("a.cpp"));
    QCOMPARE(sessions[0].category, tracewatch::ActivityCategory::Development);
    QCOMPARE(sessions[0].durationSeconds, 5.0);

    QVERIFY(tracker.currentSession().has_value());
    QCOMPARE(tracker.currentSession()->windowTitle, std::string("b.cpp"));
}

void SessionTrackerTests::testNoWindowKeepsSessionOpen()
{
    FakeWindowObserver observer;
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, nullptr);

    observer.show("slack", "general");
    tracker.poll(m_base);
    observer.clear();
    tracker.poll(m_base + 1s);
    tracker.poll(m_base + 2s);

    QVERIFY(m_store->getSessionsForDate("2026-03-02").empty());
    QVERIFY(tracker.currentSession().has_value());
    QCOMPARE(tracker.currentSession()->appName, std::string("slack"));

    observer.show("code", "main.cpp");
    tracker.poll(m_base + 4s);
    const auto sessions = m_store->getSessionsForDate("2026-03-02");
    QCOMPARE(sessions.size(), size_t(1));
    QCOMPARE(sessions[0].durationSeconds, 4.0);
}

void SessionTrackerTests::testFlushClosesOpenSession()
{
    FakeWindowObserver observer;
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, nullptr);

    observer.show("code", "main.cpp");
    tracker.poll(m_base);
    tracker.flush(m_base + 30s);
    tracker.flush(m_base + 60s);

    QVERIFY(!tracker.currentSession().has_value());
    const auto sessions = m_store->getSessionsForDate("2026-03-02");
    QCOMPARE(sessions.size(), size_t(1));
    QCOMPARE(sessions[0].durationSeconds, 30.0);
}

void SessionTrackerTests::testResourceAttached()
{
    FakeWindowObserver observer;
    FakeProcessInfo processInfo;
    processInfo.add(777, "code", 512.0, 12.5);
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, &processInfo);

    observer.show("code", "main.cpp", 777);
    tracker.poll(m_base);
    tracker.flush(m_base + 10s);

    const auto sessions = m_store->getSessionsForDate("2026-03-02");
    QCOMPARE(sessions.size(), size_t(1));
    QCOMPARE(sessions[0].pid, int64_t(777));
    QCOMPARE(sessions[0].memoryMb, 512.0);
    QCOMPARE(sessions[0].cpuPercent, 12.5);
}

void SessionTrackerTests::testSearchTitleRecorded()
{
    FakeWindowObserver observer;
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, nullptr);

    observer.show("firefox", "qt signals - Google Search - Mozilla Firefox");
    tracker.poll(m_base);
    observer.show("code", "qt signals - Google Search");
    tracker.poll(m_base + 5s);

    const auto searches = m_store->getSearches("2026-03-02");
    QCOMPARE(searches.size(), size_t(1));
    QCOMPARE(searches[0].query, std::string("qt signals"));
    QCOMPARE(searches[0].source, std::string("Google"));
    QCOMPARE(searches[0].browser, std::string("firefox"));
}

void SessionTrackerTests::testPersistFailureIsLoggedAndPollingContinues()
{
    FakeWindowObserver observer;
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, nullptr);

    sqlite3 *db = nullptr;
    QCOMPARE(sqlite3_open(m_store->databasePath().string().c_str(), &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, "DROP TABLE activity_log;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    observer.show("code", "main.cpp");
    tracker.poll(m_base);
    observer.show("firefox", "Docs");
    tracker.poll(m_base + 10s);

    QCOMPARE(tracker.totalLogged(), 0);
    QCOMPARE(tracker.totalSwitches(), 1);
    QVERIFY(tracker.currentSession().has_value());
    QCOMPARE(tracker.currentSession()->appName, std::string("firefox"));

    observer.show("code", "main.cpp");
    tracker.poll(m_base + 20s);
    QCOMPARE(tracker.totalSwitches(), 2);
    QCOMPARE(tracker.currentSession()->appName, std::string("code"));

    QFile log(tracewatch::logging::logsDirPath() + QStringLiteral("/tracker-test.log"));
    QVERIFY(log.open(QIODevice::ReadOnly));
    int failures = 0;
    for (const QByteArray &line : log.readAll().split('\n')) {
        if (line.isEmpty()) {
            continue;
        }
        const auto parsed = nlohmann::json::parse(line.toStdString());
        if (parsed.value("what", "") == "persist_failed"
            && parsed.value("where", "") == "flush") {
            QCOMPARE(parsed.value("level", ""), std::string("ERROR"));
            ++failures;
        }
    }
    QCOMPARE(failures, 2);
}

void SessionTrackerTests::testResourceRefreshedWhileWindowUnchanged()
{
    FakeWindowObserver observer;
    FakeProcessInfo processInfo;
    processInfo.add(777, "code", 100.0, 5.0);
    tracewatch::TrackerConfig config;
    config.resourceRefreshProbability = 1.0;
    tracewatch::SessionTracker tracker(*m_store, observer, m_categorizer, &processInfo, config);

    observer.show("code", "main.cpp", 777);
    tracker.poll(m_base);
    QCOMPARE(tracker.currentSession()->memoryMb, 100.0);
    QCOMPARE(tracker.currentSession()->cpuPercent, 5.0);

    processInfo.add(777, "code", 256.0, 40.0);
    tracker.poll(m_base + 1s);
    QCOMPARE(tracker.currentSession()->memoryMb, 256.0);
    QCOMPARE(tracker.currentSession()->cpuPercent, 40.0);
    QVERIFY(tracker.currentSession()->startTime == m_base);
    QCOMPARE(tracker.totalSwitches(), 0);

    tracker.flush(m_base + 10s);
    const auto sessions = m_store->getSessionsForDate("2026-03-02");
    QCOMPARE(sessions.size(), size_t(1));
    QCOMPARE(sessions[0].memoryMb, 256.0);
    QCOMPARE(sessions[0].cpuPercent, 40.0);
}

QTEST_MAIN(SessionTrackerTests)
#include "test_session_tracker.moc"
