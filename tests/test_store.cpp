#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>

#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "daemon/tracewatch_store.hpp"

using namespace std::chrono_literals;

class StoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testMetaPersistence();
    void testSessionsByLocalDate();
    void testAggregateRecomputeIsIdempotent();
    void testAggregateReflectsNewSessions();
    void testBatchedSnapshots();
    void testFocusSessionRoundTrip();
    void testBrowserVisitDeduplication();
    void testSearchesByDate();
    void testAppAnalytics();
    void testStreaks();
    void testInvalidDateThrows();
    void testIntegrityCheck();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::filesystem::path dbPath() const;
};

namespace {

// Noon of a local date, well inside the day whatever the DST rules.
std::chrono::system_clock::time_point noonOf(const std::string &date)
{
    return tracewatch::localDayBounds(date)->first + 12h;
}

std::string daysAgo(int days)
{
    return tracewatch::toLocalDate(noonOf(tracewatch::todayLocalDate()) - std::chrono::hours(24 * days));
}

tracewatch::ActivitySession makeSession(const std::string &app,
                                        const std::string &title,
                                        std::chrono::system_clock::time_point start,
                                        std::chrono::seconds length,
                                        tracewatch::ActivityCategory category)
{
    tracewatch::ActivitySession session;
    session.appName = app;
    session.windowTitle = title;
    session.startTime = start;
    session.endTime = start + length;
    session.durationSeconds = static_cast<double>(length.count());
    session.category = category;
    session.memoryMb = 256.0;
    session.cpuPercent = 3.5;
    session.pid = 4242;
    return session;
}

} // namespace

void StoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path StoreTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/tracewatch/tracewatch.db";
}

void StoreTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
    std::filesystem::remove(dbPath().string() + "-wal", error);
    std::filesystem::remove(dbPath().string() + "-shm", error);
}

void StoreTests::testMetaPersistence()
{
    resetDb();

    {
        tracewatch::TraceStore store;
        QCOMPARE(QString::fromStdString(store.databasePath().string()),
                 QString::fromStdString(dbPath().string()));
        store.setMeta("test_key", "value");
        store.setMeta("test_key", "value2");
    }

    {
        tracewatch::TraceStore store;
        const auto value = store.getMeta("test_key");
        QVERIFY(value.has_value());
        QCOMPARE(QString::fromStdString(*value), QStringLiteral("value2"));
        QVERIFY(!store.getMeta("absent").has_value());
    }
}

void StoreTests::testSessionsByLocalDate()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-10";
    const auto noon = noonOf(day);
    store.addSession(makeSession("code", "b.cpp", noon + 10min, 60s,
                                 tracewatch::ActivityCategory::Development));
    store.addSession(makeSession("code", "a.cpp", noon, 120s,
                                 tracewatch::ActivityCategory::Development));
    store.addSession(makeSession("code", "other day", noon + 24h, 60s,
                                 tracewatch::ActivityCategory::Development));

    const auto sessions = store.getSessionsForDate(day);
    QCOMPARE(sessions.size(), size_t(2));
    QCOMPARE(sessions[0].windowTitle, std::string("a.cpp"));
    QCOMPARE(sessions[1].windowTitle, std::string("b.cpp"));
    QVERIFY(sessions[0].id > 0);
    QCOMPARE(sessions[0].durationSeconds, 120.0);
    QCOMPARE(sessions[0].category, tracewatch::ActivityCategory::Development);
    QCOMPARE(sessions[0].pid, int64_t(4242));
}

void StoreTests::testAggregateRecomputeIsIdempotent()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-11";
    const auto noon = noonOf(day);
    store.addSession(makeSession("code", "main.cpp", noon, 600s,
                                 tracewatch::ActivityCategory::Development));
    store.addSession(makeSession("spotify", "Mix", noon + 15min, 120s,
                                 tracewatch::ActivityCategory::Distraction));

    const auto first = store.recomputeDailyAggregate(day);
    const auto second = store.recomputeDailyAggregate(day);
    QCOMPARE(first.totalSeconds, 720.0);
    QCOMPARE(second.totalSeconds, first.totalSeconds);
    QCOMPARE(second.productiveSeconds, first.productiveSeconds);
    QCOMPARE(second.distractionSeconds, 120.0);
    QCOMPARE(second.sessionCount, 2);
    QCOMPARE(second.topApp, std::string("code"));

    store.recomputeAggregates(day);
    store.recomputeAggregates(day);
    const auto stored = store.getDailyAggregate(day);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->totalSeconds, 720.0);
    QCOMPARE(store.getDailyRange(10).size(), size_t(1));

    const auto usage = store.getAppUsage(day);
    QCOMPARE(usage.size(), size_t(2));
    QCOMPARE(usage[0].appName, std::string("code"));
    QCOMPARE(usage[0].launchCount, 1);
}

void StoreTests::testAggregateReflectsNewSessions()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-12";
    const auto noon = noonOf(day);
    store.addSession(makeSession("slack", "general", noon, 100s,
                                 tracewatch::ActivityCategory::Communication));
    store.recomputeAggregates(day);
    QCOMPARE(store.getDailyAggregate(day)->topApp, std::string("slack"));

    store.addSession(makeSession("code", "main.cpp", noon + 5min, 300s,
                                 tracewatch::ActivityCategory::Development));
    store.recomputeAggregates(day);
    const auto daily = store.getDailyAggregate(day);
    QCOMPARE(daily->totalSeconds, 400.0);
    QCOMPARE(daily->productiveSeconds, 300.0);
    QCOMPARE(daily->topApp, std::string("code"));
    QVERIFY(!store.getDailyAggregate("2026-02-13").has_value());
}

void StoreTests::testBatchedSnapshots()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-14";
    const auto at = noonOf(day);
    std::vector<tracewatch::ProcessSnapshot> batch;
    for (int i = 0; i < 3; ++i) {
        tracewatch::ProcessSnapshot snapshot;
        snapshot.timestamp = at;
        snapshot.appName = i == 0 ? "firefox" : "code";
        snapshot.pid = 100 + i;
        snapshot.memoryMb = 100.0 * (i + 1);
        snapshot.cpuPercent = 2.0 * (i + 1);
        snapshot.status = "sleeping";
        snapshot.threads = 4;
        batch.push_back(snapshot);
    }
    store.addProcessSnapshots(batch);
    store.addProcessSnapshots({});

    QCOMPARE(store.getSnapshotCount(day), 1);

    const auto topMemory = store.getTopMemoryApps(day, 10);
    QCOMPARE(topMemory.size(), size_t(2));
    QCOMPARE(topMemory[0].appName, std::string("code"));
    QCOMPARE(topMemory[0].instanceCount, 2);
    QCOMPARE(topMemory[0].peakMemoryMb, 300.0);

    const auto topCpu = store.getTopCpuApps(day, 1);
    QCOMPARE(topCpu.size(), size_t(1));
    QCOMPARE(topCpu[0].appName, std::string("code"));
}

void StoreTests::testFocusSessionRoundTrip()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-15";
    tracewatch::FocusSessionRecord record;
    record.startTime = noonOf(day);
    record.endTime = record.startTime + 25min;
    record.targetMinutes = 25;
    record.actualFocusSeconds = 1200;
    record.distractionSeconds = 300;
    record.interruptionCount = 2;
    record.focusScore = 80.0;
    record.goalLabel = "Write docs";

    const int64_t id = store.addFocusSession(record);
    QVERIFY(id > 0);

    record.focusScore = 60.0;
    record.startTime += 24h;
    record.endTime += 24h;
    store.addFocusSession(record);

    const auto onDay = store.getFocusSessions(day, 10);
    QCOMPARE(onDay.size(), size_t(1));
    QCOMPARE(onDay[0].id, id);
    QCOMPARE(onDay[0].goalLabel, std::string("Write docs"));
    QCOMPARE(onDay[0].interruptionCount, 2);
    QCOMPARE(store.getFocusSessions(std::nullopt, 10).size(), size_t(2));

    const auto stats = store.getFocusStats();
    QCOMPARE(stats.totalSessions, 2);
    QCOMPARE(stats.totalFocusSeconds, 2400);
    QCOMPARE(stats.avgFocusScore, 70.0);
    QCOMPARE(stats.bestScore, 80.0);
    QCOMPARE(stats.totalInterruptions, 4);
}

void StoreTests::testBrowserVisitDeduplication()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-16";
    tracewatch::BrowserVisit visit;
    visit.timestamp = noonOf(day);
    visit.browser = "chrome";
    visit.url = "https://github.com/org/repo";
    visit.title = "org/repo";
    visit.visitDurationSeconds = 30.0;
    visit.domain = "github.com";

    QVERIFY(store.addBrowserVisit(visit));
    QVERIFY(!store.addBrowserVisit(visit));

    visit.timestamp += 1min;
    QVERIFY(store.addBrowserVisit(visit));

    const auto visits = store.getBrowserVisits(day, 50);
    QCOMPARE(visits.size(), size_t(2));
    QVERIFY(visits[0].timestamp > visits[1].timestamp);
    QCOMPARE(store.getBrowserVisits(day, 1).size(), size_t(1));

    const auto domains = store.getDomainBreakdown(day);
    QCOMPARE(domains.size(), size_t(1));
    QCOMPARE(domains[0].visitCount, 2);
    QCOMPARE(domains[0].totalDuration, 60.0);
}

void StoreTests::testSearchesByDate()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-17";
    tracewatch::SearchQuery search;
    search.timestamp = noonOf(day);
    search.browser = "firefox";
    search.query = "qt event loop";
    search.url = "https://www.google.com/search?q=qt+event+loop";
    search.source = "google";
    store.addSearch(search);

    const auto searches = store.getSearches(day);
    QCOMPARE(searches.size(), size_t(1));
    QCOMPARE(searches[0].query, std::string("qt event loop"));
    QVERIFY(store.getSearches("2026-02-18").empty());
}

void StoreTests::testAppAnalytics()
{
    resetDb();
    tracewatch::TraceStore store;

    const std::string day = "2026-02-19";
    const auto noon = noonOf(day);
    store.addSession(makeSession("firefox", "docs", noon, 200s,
                                 tracewatch::ActivityCategory::Research));
    store.addSession(makeSession("firefox", "video", noon + 10min, 50s,
                                 tracewatch::ActivityCategory::Distraction));
    store.addSession(makeSession("firefox", "docs", noon + 20min, 100s,
                                 tracewatch::ActivityCategory::Research));

    const auto analytics = store.getAppAnalytics("firefox", day);
    QVERIFY(analytics.has_value());
    QCOMPARE(analytics->sessionCount, 3);
    QCOMPARE(analytics->totalSeconds, 350.0);
    QCOMPARE(analytics->category, tracewatch::ActivityCategory::Research);
    QCOMPARE(analytics->topTitles.size(), size_t(2));
    QCOMPARE(analytics->topTitles[0].windowTitle, std::string("docs"));
    QCOMPARE(analytics->topTitles[0].count, 2);
    QVERIFY(analytics->firstSeen < analytics->lastSeen);

    QVERIFY(!store.getAppAnalytics("code", day).has_value());

    store.recomputeAggregates(day);
    const auto history = store.getAppHistory("firefox", 14);
    QCOMPARE(history.size(), size_t(1));
    QCOMPARE(history[0].totalDuration, 350.0);
}

void StoreTests::testStreaks()
{
    resetDb();
    tracewatch::TraceStore store;

    for (int ago : {0, 1, 2, 5, 6, 7, 8}) {
        const std::string day = daysAgo(ago);
        store.addSession(makeSession("code", "work", noonOf(day), 600s,
                                     tracewatch::ActivityCategory::Development));
        store.recomputeAggregates(day);
    }

    const auto streak = store.getStreakInfo(tracewatch::todayLocalDate());
    QCOMPARE(streak.currentStreak, 3);
    QCOMPARE(streak.longestStreak, 4);
    QCOMPARE(streak.totalDaysTracked, 7);
}

void StoreTests::testInvalidDateThrows()
{
    resetDb();
    tracewatch::TraceStore store;
    QVERIFY_EXCEPTION_THROWN(store.getSessionsForDate("not-a-date"), std::runtime_error);
    QVERIFY_EXCEPTION_THROWN(store.recomputeAggregates("2026-13-01"), std::runtime_error);
}

void StoreTests::testIntegrityCheck()
{
    resetDb();
    tracewatch::TraceStore store;
    std::string message;
    QVERIFY(store.integrityCheck(&message));
}

QTEST_MAIN(StoreTests)
#include "test_store.moc"
