#include "daemon/tracewatch_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <utility>

#include <sqlite3.h>

#include "common/json_utils.hpp"
#include "daemon/aggregator.hpp"

namespace tracewatch {

namespace {

constexpr const char *kCreateActivityTable =
    "CREATE TABLE IF NOT EXISTS activity_log ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    app_name TEXT NOT NULL,"
    "    window_title TEXT NOT NULL,"
    "    start_ms INTEGER NOT NULL,"
    "    end_ms INTEGER NOT NULL,"
    "    duration_seconds REAL NOT NULL,"
    "    category TEXT NOT NULL DEFAULT 'Other',"
    "    memory_mb REAL DEFAULT 0,"
    "    cpu_percent REAL DEFAULT 0,"
    "    pid INTEGER DEFAULT 0"
    ");";

constexpr const char *kCreateSearchTable =
    "CREATE TABLE IF NOT EXISTS search_history ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp_ms INTEGER NOT NULL,"
    "    browser TEXT NOT NULL,"
    "    query TEXT NOT NULL,"
    "    url TEXT NOT NULL DEFAULT '',"
    "    source TEXT NOT NULL DEFAULT 'Unknown'"
    ");";

constexpr const char *kCreateDailyTable =
    "CREATE TABLE IF NOT EXISTS daily_stats ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    date TEXT NOT NULL UNIQUE,"
    "    total_seconds REAL NOT NULL DEFAULT 0,"
    "    productive_seconds REAL NOT NULL DEFAULT 0,"
    "    distraction_seconds REAL NOT NULL DEFAULT 0,"
    "    top_app TEXT NOT NULL DEFAULT '',"
    "    top_category TEXT NOT NULL DEFAULT '',"
    "    session_count INTEGER NOT NULL DEFAULT 0"
    ");";

constexpr const char *kCreateSnapshotTable =
    "CREATE TABLE IF NOT EXISTS process_snapshots ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp_ms INTEGER NOT NULL,"
    "    app_name TEXT NOT NULL,"
    "    pid INTEGER NOT NULL,"
    "    memory_mb REAL NOT NULL DEFAULT 0,"
    "    cpu_percent REAL NOT NULL DEFAULT 0,"
    "    status TEXT NOT NULL DEFAULT 'running',"
    "    num_threads INTEGER NOT NULL DEFAULT 0"
    ");";

constexpr const char *kCreateAppUsageTable =
    "CREATE TABLE IF NOT EXISTS app_usage_history ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    date TEXT NOT NULL,"
    "    app_name TEXT NOT NULL,"
    "    total_duration REAL NOT NULL DEFAULT 0,"
    "    avg_memory_mb REAL NOT NULL DEFAULT 0,"
    "    avg_cpu_percent REAL NOT NULL DEFAULT 0,"
    "    launch_count INTEGER NOT NULL DEFAULT 0,"
    "    category TEXT NOT NULL DEFAULT 'Other',"
    "    UNIQUE(date, app_name)"
    ");";

constexpr const char *kCreateBrowserTable =
    "CREATE TABLE IF NOT EXISTS browser_urls ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp_ms INTEGER NOT NULL,"
    "    browser TEXT NOT NULL,"
    "    url TEXT NOT NULL,"
    "    title TEXT NOT NULL DEFAULT '',"
    "    visit_duration REAL NOT NULL DEFAULT 0,"
    "    domain TEXT NOT NULL DEFAULT '',"
    "    UNIQUE(browser, url, timestamp_ms)"
    ");";

constexpr const char *kCreateFocusTable =
    "CREATE TABLE IF NOT EXISTS focus_sessions ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    start_ms INTEGER NOT NULL,"
    "    end_ms INTEGER NOT NULL,"
    "    target_minutes INTEGER NOT NULL DEFAULT 25,"
    "    actual_focus_seconds INTEGER NOT NULL DEFAULT 0,"
    "    distraction_seconds INTEGER NOT NULL DEFAULT 0,"
    "    interruption_count INTEGER NOT NULL DEFAULT 0,"
    "    focus_score REAL NOT NULL DEFAULT 0,"
    "    goal_label TEXT NOT NULL DEFAULT ''"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_activity_start ON activity_log(start_ms);"
    "CREATE INDEX IF NOT EXISTS idx_activity_app ON activity_log(app_name);"
    "CREATE INDEX IF NOT EXISTS idx_search_timestamp ON search_history(timestamp_ms);"
    "CREATE INDEX IF NOT EXISTS idx_snapshot_timestamp ON process_snapshots(timestamp_ms);"
    "CREATE INDEX IF NOT EXISTS idx_snapshot_app ON process_snapshots(app_name);"
    "CREATE INDEX IF NOT EXISTS idx_app_usage_name ON app_usage_history(app_name);"
    "CREATE INDEX IF NOT EXISTS idx_browser_urls_timestamp ON browser_urls(timestamp_ms);"
    "CREATE INDEX IF NOT EXISTS idx_focus_start ON focus_sessions(start_ms);";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

void stepDone(sqlite3 *db, sqlite3_stmt *stmt, const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

std::pair<int64_t, int64_t> dayRangeMillis(const std::string &date)
{
    const auto bounds = localDayBounds(date);
    if (!bounds) {
        throw std::runtime_error("invalid date: " + date);
    }
    return {toEpochMillis(bounds->first), toEpochMillis(bounds->second)};
}

ActivitySession readSession(sqlite3_stmt *stmt)
{
    ActivitySession session;
    session.id = sqlite3_column_int64(stmt, 0);
    session.appName = columnText(stmt, 1);
    session.windowTitle = columnText(stmt, 2);
    session.startTime = fromEpochMillis(sqlite3_column_int64(stmt, 3));
    session.endTime = fromEpochMillis(sqlite3_column_int64(stmt, 4));
    session.durationSeconds = sqlite3_column_double(stmt, 5);
    session.category = parseCategoryString(columnText(stmt, 6));
    session.memoryMb = sqlite3_column_double(stmt, 7);
    session.cpuPercent = sqlite3_column_double(stmt, 8);
    session.pid = sqlite3_column_int64(stmt, 9);
    return session;
}

DailyAggregate readDaily(sqlite3_stmt *stmt)
{
    DailyAggregate daily;
    daily.date = columnText(stmt, 0);
    daily.totalSeconds = sqlite3_column_double(stmt, 1);
    daily.productiveSeconds = sqlite3_column_double(stmt, 2);
    daily.distractionSeconds = sqlite3_column_double(stmt, 3);
    daily.topApp = columnText(stmt, 4);
    daily.topCategory = columnText(stmt, 5);
    daily.sessionCount = sqlite3_column_int(stmt, 6);
    return daily;
}

AppUsageAggregate readAppUsage(sqlite3_stmt *stmt)
{
    AppUsageAggregate usage;
    usage.date = columnText(stmt, 0);
    usage.appName = columnText(stmt, 1);
    usage.totalDuration = sqlite3_column_double(stmt, 2);
    usage.avgMemoryMb = sqlite3_column_double(stmt, 3);
    usage.avgCpuPercent = sqlite3_column_double(stmt, 4);
    usage.launchCount = sqlite3_column_int(stmt, 5);
    usage.category = parseCategoryString(columnText(stmt, 6));
    return usage;
}

FocusSessionRecord readFocusSession(sqlite3_stmt *stmt)
{
    FocusSessionRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.startTime = fromEpochMillis(sqlite3_column_int64(stmt, 1));
    record.endTime = fromEpochMillis(sqlite3_column_int64(stmt, 2));
    record.targetMinutes = sqlite3_column_int(stmt, 3);
    record.actualFocusSeconds = sqlite3_column_int(stmt, 4);
    record.distractionSeconds = sqlite3_column_int(stmt, 5);
    record.interruptionCount = sqlite3_column_int(stmt, 6);
    record.focusScore = sqlite3_column_double(stmt, 7);
    record.goalLabel = columnText(stmt, 8);
    return record;
}

ResourceUsageSummary readResourceSummary(sqlite3_stmt *stmt)
{
    ResourceUsageSummary row;
    row.appName = columnText(stmt, 0);
    row.avgMemoryMb = sqlite3_column_double(stmt, 1);
    row.peakMemoryMb = sqlite3_column_double(stmt, 2);
    row.avgCpuPercent = sqlite3_column_double(stmt, 3);
    row.peakCpuPercent = sqlite3_column_double(stmt, 4);
    row.instanceCount = sqlite3_column_int(stmt, 5);
    return row;
}

constexpr const char *kSelectSessionColumns =
    "SELECT id, app_name, window_title, start_ms, end_ms, duration_seconds, "
    "category, memory_mb, cpu_percent, pid FROM activity_log ";

} // namespace

struct TraceStore::Impl {
    sqlite3 *db = nullptr;
    std::filesystem::path path;

    std::vector<ActivitySession> sessionsForDate(const std::string &date) const
    {
        const auto [from, to] = dayRangeMillis(date);
        const std::string sql = std::string(kSelectSessionColumns)
            + "WHERE start_ms >= ? AND start_ms < ? ORDER BY start_ms ASC, id ASC;";
        Statement stmt(db, sql.c_str());
        sqlite3_bind_int64(stmt.get(), 1, from);
        sqlite3_bind_int64(stmt.get(), 2, to);

        std::vector<ActivitySession> sessions;
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            sessions.push_back(readSession(stmt.get()));
        }
        return sessions;
    }

    void upsertDaily(const DailyAggregate &daily)
    {
        Statement stmt(db,
                       "INSERT INTO daily_stats (date, total_seconds, productive_seconds, "
                       "distraction_seconds, top_app, top_category, session_count) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?) "
                       "ON CONFLICT(date) DO UPDATE SET "
                       "total_seconds = excluded.total_seconds, "
                       "productive_seconds = excluded.productive_seconds, "
                       "distraction_seconds = excluded.distraction_seconds, "
                       "top_app = excluded.top_app, "
                       "top_category = excluded.top_category, "
                       "session_count = excluded.session_count;");
        bindText(stmt.get(), 1, daily.date);
        sqlite3_bind_double(stmt.get(), 2, daily.totalSeconds);
        sqlite3_bind_double(stmt.get(), 3, daily.productiveSeconds);
        sqlite3_bind_double(stmt.get(), 4, daily.distractionSeconds);
        bindText(stmt.get(), 5, daily.topApp);
        bindText(stmt.get(), 6, daily.topCategory);
        sqlite3_bind_int(stmt.get(), 7, daily.sessionCount);
        stepDone(db, stmt.get(), "failed to upsert daily stats");
    }

    void upsertAppUsage(const AppUsageAggregate &usage)
    {
        Statement stmt(db,
                       "INSERT INTO app_usage_history (date, app_name, total_duration, "
                       "avg_memory_mb, avg_cpu_percent, launch_count, category) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?) "
                       "ON CONFLICT(date, app_name) DO UPDATE SET "
                       "total_duration = excluded.total_duration, "
                       "avg_memory_mb = excluded.avg_memory_mb, "
                       "avg_cpu_percent = excluded.avg_cpu_percent, "
                       "launch_count = excluded.launch_count, "
                       "category = excluded.category;");
        bindText(stmt.get(), 1, usage.date);
        bindText(stmt.get(), 2, usage.appName);
        sqlite3_bind_double(stmt.get(), 3, usage.totalDuration);
        sqlite3_bind_double(stmt.get(), 4, usage.avgMemoryMb);
        sqlite3_bind_double(stmt.get(), 5, usage.avgCpuPercent);
        sqlite3_bind_int(stmt.get(), 6, usage.launchCount);
        bindText(stmt.get(), 7, toCategoryString(usage.category));
        stepDone(db, stmt.get(), "failed to upsert app usage");
    }

    std::vector<ResourceUsageSummary> resourceSummary(const std::string &date, int limit,
                                                      const char *orderBy) const
    {
        const auto [from, to] = dayRangeMillis(date);
        const std::string sql =
            std::string("SELECT app_name, AVG(memory_mb), MAX(memory_mb), AVG(cpu_percent), "
                        "MAX(cpu_percent), COUNT(DISTINCT pid) FROM process_snapshots "
                        "WHERE timestamp_ms >= ? AND timestamp_ms < ? "
                        "GROUP BY app_name ORDER BY ")
            + orderBy + " DESC, app_name ASC LIMIT ?;";
        Statement stmt(db, sql.c_str());
        sqlite3_bind_int64(stmt.get(), 1, from);
        sqlite3_bind_int64(stmt.get(), 2, to);
        sqlite3_bind_int(stmt.get(), 3, limit);

        std::vector<ResourceUsageSummary> rows;
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            rows.push_back(readResourceSummary(stmt.get()));
        }
        return rows;
    }
};

TraceStore::TraceStore()
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path basePath = defaultDataDir();
    std::filesystem::create_directories(basePath);
    open(basePath / "tracewatch.db");
}

TraceStore::TraceStore(const std::filesystem::path &dbPath)
    : impl(std::make_unique<Impl>())
{
    if (dbPath.has_parent_path()) {
        std::filesystem::create_directories(dbPath.parent_path());
    }
    open(dbPath);
}

TraceStore::~TraceStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::filesystem::path TraceStore::defaultDataDir()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/tracewatch";
    return basePath;
}

std::filesystem::path TraceStore::databasePath() const
{
    return impl->path;
}

void TraceStore::open(const std::filesystem::path &dbPath)
{
    impl->path = dbPath;
    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open tracewatch database: " + message);
    }

    // The daemon and a focus run write from separate processes.
    sqlite3_busy_timeout(impl->db, 5000);
    execOrThrow(impl->db, "PRAGMA journal_mode = WAL;");
    execOrThrow(impl->db, "PRAGMA synchronous = NORMAL;");

    execOrThrow(impl->db, kCreateActivityTable);
    execOrThrow(impl->db, kCreateSearchTable);
    execOrThrow(impl->db, kCreateDailyTable);
    execOrThrow(impl->db, kCreateSnapshotTable);
    execOrThrow(impl->db, kCreateAppUsageTable);
    execOrThrow(impl->db, kCreateBrowserTable);
    execOrThrow(impl->db, kCreateFocusTable);
    execOrThrow(impl->db, kCreateMetaTable);
    execOrThrow(impl->db, kCreateIndexes);
}

int64_t TraceStore::addSession(const ActivitySession &session)
{
    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "INSERT INTO activity_log (app_name, window_title, start_ms, end_ms, "
                   "duration_seconds, category, memory_mb, cpu_percent, pid) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, session.appName);
    bindText(stmt.get(), 2, session.windowTitle);
    sqlite3_bind_int64(stmt.get(), 3, toEpochMillis(session.startTime));
    sqlite3_bind_int64(stmt.get(), 4, toEpochMillis(session.endTime));
    sqlite3_bind_double(stmt.get(), 5, session.durationSeconds);
    bindText(stmt.get(), 6, toCategoryString(session.category));
    sqlite3_bind_double(stmt.get(), 7, session.memoryMb);
    sqlite3_bind_double(stmt.get(), 8, session.cpuPercent);
    sqlite3_bind_int64(stmt.get(), 9, session.pid);
    stepDone(impl->db, stmt.get(), "failed to insert session");
    const int64_t id = sqlite3_last_insert_rowid(impl->db);
    tx.commit();
    return id;
}

void TraceStore::addProcessSnapshots(const std::vector<ProcessSnapshot> &snapshots)
{
    if (snapshots.empty()) {
        return;
    }

    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "INSERT INTO process_snapshots (timestamp_ms, app_name, pid, memory_mb, "
                   "cpu_percent, status, num_threads) VALUES (?, ?, ?, ?, ?, ?, ?);");
    for (const auto &snapshot : snapshots) {
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(snapshot.timestamp));
        bindText(stmt.get(), 2, snapshot.appName);
        sqlite3_bind_int64(stmt.get(), 3, snapshot.pid);
        sqlite3_bind_double(stmt.get(), 4, snapshot.memoryMb);
        sqlite3_bind_double(stmt.get(), 5, snapshot.cpuPercent);
        bindText(stmt.get(), 6, snapshot.status.empty() ? "running" : snapshot.status);
        sqlite3_bind_int(stmt.get(), 7, snapshot.threads);
        stepDone(impl->db, stmt.get(), "failed to insert process snapshot");
    }
    tx.commit();
}

int64_t TraceStore::addFocusSession(const FocusSessionRecord &record)
{
    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "INSERT INTO focus_sessions (start_ms, end_ms, target_minutes, "
                   "actual_focus_seconds, distraction_seconds, interruption_count, "
                   "focus_score, goal_label) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(record.startTime));
    sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(record.endTime));
    sqlite3_bind_int(stmt.get(), 3, record.targetMinutes);
    sqlite3_bind_int(stmt.get(), 4, record.actualFocusSeconds);
    sqlite3_bind_int(stmt.get(), 5, record.distractionSeconds);
    sqlite3_bind_int(stmt.get(), 6, record.interruptionCount);
    sqlite3_bind_double(stmt.get(), 7, record.focusScore);
    bindText(stmt.get(), 8, record.goalLabel);
    stepDone(impl->db, stmt.get(), "failed to insert focus session");
    const int64_t id = sqlite3_last_insert_rowid(impl->db);
    tx.commit();
    return id;
}

void TraceStore::addSearch(const SearchQuery &search)
{
    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "INSERT INTO search_history (timestamp_ms, browser, query, url, source) "
                   "VALUES (?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(search.timestamp));
    bindText(stmt.get(), 2, search.browser);
    bindText(stmt.get(), 3, search.query);
    bindText(stmt.get(), 4, search.url);
    bindText(stmt.get(), 5, search.source.empty() ? "Unknown" : search.source);
    stepDone(impl->db, stmt.get(), "failed to insert search");
    tx.commit();
}

bool TraceStore::addBrowserVisit(const BrowserVisit &visit)
{
    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "INSERT OR IGNORE INTO browser_urls (timestamp_ms, browser, url, title, "
                   "visit_duration, domain) VALUES (?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(visit.timestamp));
    bindText(stmt.get(), 2, visit.browser);
    bindText(stmt.get(), 3, visit.url);
    bindText(stmt.get(), 4, visit.title);
    sqlite3_bind_double(stmt.get(), 5, visit.visitDurationSeconds);
    bindText(stmt.get(), 6, visit.domain);
    stepDone(impl->db, stmt.get(), "failed to insert browser visit");
    const bool inserted = sqlite3_changes(impl->db) > 0;
    tx.commit();
    return inserted;
}

DailyAggregate TraceStore::recomputeDailyAggregate(const std::string &date)
{
    Transaction tx(impl->db);
    const DailyAggregate daily = computeDailyAggregate(date, impl->sessionsForDate(date));
    impl->upsertDaily(daily);
    tx.commit();
    return daily;
}

std::vector<AppUsageAggregate> TraceStore::recomputeAppUsage(const std::string &date)
{
    Transaction tx(impl->db);
    const auto usage = computeAppUsage(date, impl->sessionsForDate(date));
    for (const auto &row : usage) {
        impl->upsertAppUsage(row);
    }
    tx.commit();
    return usage;
}

void TraceStore::recomputeAggregates(const std::string &date)
{
    Transaction tx(impl->db);
    const auto sessions = impl->sessionsForDate(date);
    impl->upsertDaily(computeDailyAggregate(date, sessions));
    for (const auto &row : computeAppUsage(date, sessions)) {
        impl->upsertAppUsage(row);
    }
    tx.commit();
}

std::optional<DailyAggregate> TraceStore::getDailyAggregate(const std::string &date) const
{
    Statement stmt(impl->db,
                   "SELECT date, total_seconds, productive_seconds, distraction_seconds, "
                   "top_app, top_category, session_count FROM daily_stats WHERE date = ?;");
    bindText(stmt.get(), 1, date);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return readDaily(stmt.get());
    }
    return std::nullopt;
}

std::vector<DailyAggregate> TraceStore::getDailyRange(int limit) const
{
    Statement stmt(impl->db,
                   "SELECT date, total_seconds, productive_seconds, distraction_seconds, "
                   "top_app, top_category, session_count FROM daily_stats "
                   "ORDER BY date DESC LIMIT ?;");
    sqlite3_bind_int(stmt.get(), 1, limit);

    std::vector<DailyAggregate> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(readDaily(stmt.get()));
    }
    return rows;
}

std::vector<AppUsageAggregate> TraceStore::getAppUsage(const std::string &date) const
{
    Statement stmt(impl->db,
                   "SELECT date, app_name, total_duration, avg_memory_mb, avg_cpu_percent, "
                   "launch_count, category FROM app_usage_history WHERE date = ? "
                   "ORDER BY total_duration DESC, app_name ASC;");
    bindText(stmt.get(), 1, date);

    std::vector<AppUsageAggregate> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(readAppUsage(stmt.get()));
    }
    return rows;
}

std::vector<HeatmapDay> TraceStore::getProductivityHeatmap(const std::string &fromDate) const
{
    Statement stmt(impl->db,
                   "SELECT date, total_seconds, productive_seconds FROM daily_stats "
                   "WHERE date >= ? ORDER BY date ASC;");
    bindText(stmt.get(), 1, fromDate);

    std::vector<HeatmapDay> days;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        HeatmapDay day;
        day.date = columnText(stmt.get(), 0);
        day.totalSeconds = sqlite3_column_double(stmt.get(), 1);
        day.productiveSeconds = sqlite3_column_double(stmt.get(), 2);
        day.score = day.totalSeconds > 0.0
            ? static_cast<int>(std::lround(day.productiveSeconds / day.totalSeconds * 100.0))
            : 0;
        days.push_back(day);
    }
    return days;
}

std::vector<AppUsageAggregate> TraceStore::getAppHistory(const std::string &appName,
                                                         int days) const
{
    Statement stmt(impl->db,
                   "SELECT date, app_name, total_duration, avg_memory_mb, avg_cpu_percent, "
                   "launch_count, category FROM app_usage_history WHERE app_name = ? "
                   "ORDER BY date DESC LIMIT ?;");
    bindText(stmt.get(), 1, appName);
    sqlite3_bind_int(stmt.get(), 2, days);

    std::vector<AppUsageAggregate> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(readAppUsage(stmt.get()));
    }
    return rows;
}

std::vector<ActivitySession> TraceStore::getSessionsForDate(const std::string &date) const
{
    return impl->sessionsForDate(date);
}

std::vector<ActivitySession> TraceStore::getAppSessions(const std::string &appName,
                                                        const std::string &fromDate,
                                                        const std::string &toDate) const
{
    const auto from = dayRangeMillis(fromDate).first;
    const auto to = dayRangeMillis(toDate).second;
    const std::string sql = std::string(kSelectSessionColumns)
        + "WHERE app_name = ? AND start_ms >= ? AND start_ms < ? ORDER BY start_ms ASC, id ASC;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, appName);
    sqlite3_bind_int64(stmt.get(), 2, from);
    sqlite3_bind_int64(stmt.get(), 3, to);

    std::vector<ActivitySession> sessions;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        sessions.push_back(readSession(stmt.get()));
    }
    return sessions;
}

std::vector<CategoryBreakdown> TraceStore::getCategoryBreakdown(const std::string &date) const
{
    const auto [from, to] = dayRangeMillis(date);
    Statement stmt(impl->db,
                   "SELECT category, SUM(duration_seconds), COUNT(*) FROM activity_log "
                   "WHERE start_ms >= ? AND start_ms < ? GROUP BY category "
                   "ORDER BY SUM(duration_seconds) DESC, category ASC;");
    sqlite3_bind_int64(stmt.get(), 1, from);
    sqlite3_bind_int64(stmt.get(), 2, to);

    std::vector<CategoryBreakdown> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        CategoryBreakdown row;
        row.category = parseCategoryString(columnText(stmt.get(), 0));
        row.totalSeconds = sqlite3_column_double(stmt.get(), 1);
        row.sessionCount = sqlite3_column_int(stmt.get(), 2);
        rows.push_back(row);
    }
    return rows;
}

std::vector<AppBreakdown> TraceStore::getAppBreakdown(const std::string &date) const
{
    const auto [from, to] = dayRangeMillis(date);
    Statement stmt(impl->db,
                   "SELECT app_name, SUM(duration_seconds), COUNT(*), AVG(memory_mb), "
                   "AVG(cpu_percent), MAX(memory_mb) FROM activity_log "
                   "WHERE start_ms >= ? AND start_ms < ? GROUP BY app_name "
                   "ORDER BY SUM(duration_seconds) DESC, app_name ASC;");
    sqlite3_bind_int64(stmt.get(), 1, from);
    sqlite3_bind_int64(stmt.get(), 2, to);

    std::vector<AppBreakdown> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        AppBreakdown row;
        row.appName = columnText(stmt.get(), 0);
        row.totalSeconds = sqlite3_column_double(stmt.get(), 1);
        row.sessionCount = sqlite3_column_int(stmt.get(), 2);
        row.avgMemoryMb = sqlite3_column_double(stmt.get(), 3);
        row.avgCpuPercent = sqlite3_column_double(stmt.get(), 4);
        row.peakMemoryMb = sqlite3_column_double(stmt.get(), 5);
        rows.push_back(row);
    }
    return rows;
}

std::optional<AppAnalytics> TraceStore::getAppAnalytics(const std::string &appName,
                                                        const std::string &date) const
{
    const auto [from, to] = dayRangeMillis(date);

    AppAnalytics analytics;
    analytics.appName = appName;
    {
        Statement stmt(impl->db,
                       "SELECT COUNT(*), SUM(duration_seconds), AVG(memory_mb), MAX(memory_mb), "
                       "AVG(cpu_percent), MAX(cpu_percent), MIN(start_ms), MAX(end_ms) "
                       "FROM activity_log WHERE app_name = ? AND start_ms >= ? AND start_ms < ?;");
        bindText(stmt.get(), 1, appName);
        sqlite3_bind_int64(stmt.get(), 2, from);
        sqlite3_bind_int64(stmt.get(), 3, to);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }
        analytics.sessionCount = sqlite3_column_int(stmt.get(), 0);
        if (analytics.sessionCount == 0) {
            return std::nullopt;
        }
        analytics.totalSeconds = sqlite3_column_double(stmt.get(), 1);
        analytics.avgMemoryMb = sqlite3_column_double(stmt.get(), 2);
        analytics.peakMemoryMb = sqlite3_column_double(stmt.get(), 3);
        analytics.avgCpuPercent = sqlite3_column_double(stmt.get(), 4);
        analytics.peakCpuPercent = sqlite3_column_double(stmt.get(), 5);
        analytics.firstSeen = fromEpochMillis(sqlite3_column_int64(stmt.get(), 6));
        analytics.lastSeen = fromEpochMillis(sqlite3_column_int64(stmt.get(), 7));
    }

    {
        Statement stmt(impl->db,
                       "SELECT category FROM activity_log "
                       "WHERE app_name = ? AND start_ms >= ? AND start_ms < ? "
                       "GROUP BY category ORDER BY SUM(duration_seconds) DESC, category ASC "
                       "LIMIT 1;");
        bindText(stmt.get(), 1, appName);
        sqlite3_bind_int64(stmt.get(), 2, from);
        sqlite3_bind_int64(stmt.get(), 3, to);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            analytics.category = parseCategoryString(columnText(stmt.get(), 0));
        }
    }

    {
        Statement stmt(impl->db,
                       "SELECT window_title, SUM(duration_seconds), COUNT(*) FROM activity_log "
                       "WHERE app_name = ? AND start_ms >= ? AND start_ms < ? "
                       "GROUP BY window_title ORDER BY SUM(duration_seconds) DESC, "
                       "window_title ASC LIMIT 15;");
        bindText(stmt.get(), 1, appName);
        sqlite3_bind_int64(stmt.get(), 2, from);
        sqlite3_bind_int64(stmt.get(), 3, to);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            TitleUsage title;
            title.windowTitle = columnText(stmt.get(), 0);
            title.totalSeconds = sqlite3_column_double(stmt.get(), 1);
            title.count = sqlite3_column_int(stmt.get(), 2);
            analytics.topTitles.push_back(title);
        }
    }

    {
        Statement stmt(impl->db,
                       "SELECT timestamp_ms, pid, memory_mb, cpu_percent, status, num_threads "
                       "FROM process_snapshots WHERE app_name = ? AND timestamp_ms >= ? "
                       "AND timestamp_ms < ? ORDER BY timestamp_ms ASC;");
        bindText(stmt.get(), 1, appName);
        sqlite3_bind_int64(stmt.get(), 2, from);
        sqlite3_bind_int64(stmt.get(), 3, to);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            ProcessSnapshot snapshot;
            snapshot.appName = appName;
            snapshot.timestamp = fromEpochMillis(sqlite3_column_int64(stmt.get(), 0));
            snapshot.pid = sqlite3_column_int64(stmt.get(), 1);
            snapshot.memoryMb = sqlite3_column_double(stmt.get(), 2);
            snapshot.cpuPercent = sqlite3_column_double(stmt.get(), 3);
            snapshot.status = columnText(stmt.get(), 4);
            snapshot.threads = sqlite3_column_int(stmt.get(), 5);
            analytics.resourceTimeline.push_back(snapshot);
        }
    }

    return analytics;
}

std::vector<ResourceUsageSummary> TraceStore::getTopMemoryApps(const std::string &date,
                                                               int limit) const
{
    return impl->resourceSummary(date, limit, "AVG(memory_mb)");
}

std::vector<ResourceUsageSummary> TraceStore::getTopCpuApps(const std::string &date,
                                                            int limit) const
{
    return impl->resourceSummary(date, limit, "AVG(cpu_percent)");
}

int TraceStore::getSnapshotCount(const std::string &date) const
{
    const auto [from, to] = dayRangeMillis(date);
    Statement stmt(impl->db,
                   "SELECT COUNT(DISTINCT timestamp_ms) FROM process_snapshots "
                   "WHERE timestamp_ms >= ? AND timestamp_ms < ?;");
    sqlite3_bind_int64(stmt.get(), 1, from);
    sqlite3_bind_int64(stmt.get(), 2, to);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return sqlite3_column_int(stmt.get(), 0);
    }
    return 0;
}

std::vector<FocusSessionRecord> TraceStore::getFocusSessions(
    const std::optional<std::string> &date, int limit) const
{
    constexpr const char *kColumns =
        "SELECT id, start_ms, end_ms, target_minutes, actual_focus_seconds, "
        "distraction_seconds, interruption_count, focus_score, goal_label "
        "FROM focus_sessions ";

    std::vector<FocusSessionRecord> rows;
    if (date) {
        const auto [from, to] = dayRangeMillis(*date);
        const std::string sql = std::string(kColumns)
            + "WHERE start_ms >= ? AND start_ms < ? ORDER BY start_ms DESC LIMIT ?;";
        Statement stmt(impl->db, sql.c_str());
        sqlite3_bind_int64(stmt.get(), 1, from);
        sqlite3_bind_int64(stmt.get(), 2, to);
        sqlite3_bind_int(stmt.get(), 3, limit);
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            rows.push_back(readFocusSession(stmt.get()));
        }
        return rows;
    }

    const std::string sql = std::string(kColumns) + "ORDER BY start_ms DESC LIMIT ?;";
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int(stmt.get(), 1, limit);
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(readFocusSession(stmt.get()));
    }
    return rows;
}

FocusStats TraceStore::getFocusStats() const
{
    Statement stmt(impl->db,
                   "SELECT COUNT(*), COALESCE(SUM(actual_focus_seconds), 0), "
                   "COALESCE(AVG(focus_score), 0), COALESCE(SUM(interruption_count), 0), "
                   "COALESCE(MAX(focus_score), 0) FROM focus_sessions;");
    FocusStats stats;
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        stats.totalSessions = sqlite3_column_int(stmt.get(), 0);
        stats.totalFocusSeconds = sqlite3_column_int(stmt.get(), 1);
        stats.avgFocusScore = sqlite3_column_double(stmt.get(), 2);
        stats.totalInterruptions = sqlite3_column_int(stmt.get(), 3);
        stats.bestScore = sqlite3_column_double(stmt.get(), 4);
    }
    return stats;
}

std::vector<SearchQuery> TraceStore::getSearches(const std::string &date) const
{
    const auto [from, to] = dayRangeMillis(date);
    Statement stmt(impl->db,
                   "SELECT timestamp_ms, browser, query, url, source FROM search_history "
                   "WHERE timestamp_ms >= ? AND timestamp_ms < ? ORDER BY timestamp_ms DESC;");
    sqlite3_bind_int64(stmt.get(), 1, from);
    sqlite3_bind_int64(stmt.get(), 2, to);

    std::vector<SearchQuery> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        SearchQuery search;
        search.timestamp = fromEpochMillis(sqlite3_column_int64(stmt.get(), 0));
        search.browser = columnText(stmt.get(), 1);
        search.query = columnText(stmt.get(), 2);
        search.url = columnText(stmt.get(), 3);
        search.source = columnText(stmt.get(), 4);
        rows.push_back(search);
    }
    return rows;
}

std::vector<BrowserVisit> TraceStore::getBrowserVisits(const std::string &date, int limit) const
{
    const auto [from, to] = dayRangeMillis(date);
    Statement stmt(impl->db,
                   "SELECT timestamp_ms, browser, url, title, visit_duration, domain "
                   "FROM browser_urls WHERE timestamp_ms >= ? AND timestamp_ms < ? "
                   "ORDER BY timestamp_ms DESC LIMIT ?;");
    sqlite3_bind_int64(stmt.get(), 1, from);
    sqlite3_bind_int64(stmt.get(), 2, to);
    sqlite3_bind_int(stmt.get(), 3, limit);

    std::vector<BrowserVisit> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        BrowserVisit visit;
        visit.timestamp = fromEpochMillis(sqlite3_column_int64(stmt.get(), 0));
        visit.browser = columnText(stmt.get(), 1);
        visit.url = columnText(stmt.get(), 2);
        visit.title = columnText(stmt.get(), 3);
        visit.visitDurationSeconds = sqlite3_column_double(stmt.get(), 4);
        visit.domain = columnText(stmt.get(), 5);
        rows.push_back(visit);
    }
    return rows;
}

std::vector<DomainUsage> TraceStore::getDomainBreakdown(const std::string &date) const
{
    const auto [from, to] = dayRangeMillis(date);
    Statement stmt(impl->db,
                   "SELECT domain, COUNT(*), SUM(visit_duration) FROM browser_urls "
                   "WHERE timestamp_ms >= ? AND timestamp_ms < ? AND domain != '' "
                   "GROUP BY domain ORDER BY COUNT(*) DESC, domain ASC LIMIT 30;");
    sqlite3_bind_int64(stmt.get(), 1, from);
    sqlite3_bind_int64(stmt.get(), 2, to);

    std::vector<DomainUsage> rows;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        DomainUsage row;
        row.domain = columnText(stmt.get(), 0);
        row.visitCount = sqlite3_column_int(stmt.get(), 1);
        row.totalDuration = sqlite3_column_double(stmt.get(), 2);
        rows.push_back(row);
    }
    return rows;
}

StreakInfo TraceStore::getStreakInfo(const std::string &today) const
{
    Statement stmt(impl->db,
                   "SELECT date FROM daily_stats WHERE total_seconds > 0 ORDER BY date ASC;");

    std::vector<std::string> dates;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        dates.push_back(columnText(stmt.get(), 0));
    }

    StreakInfo streak;
    streak.totalDaysTracked = static_cast<int>(dates.size());
    if (dates.empty()) {
        return streak;
    }

    // Whole days between two local dates; DST shifts are absorbed by rounding.
    const auto daysBetween = [](const std::string &a, const std::string &b) -> long {
        const auto boundsA = localDayBounds(a);
        const auto boundsB = localDayBounds(b);
        if (!boundsA || !boundsB) {
            return 0;
        }
        const auto hours = std::chrono::duration_cast<std::chrono::hours>(
                               boundsB->first - boundsA->first)
                               .count();
        return std::lround(static_cast<double>(hours) / 24.0);
    };

    int longest = 1;
    int run = 1;
    for (size_t i = 1; i < dates.size(); ++i) {
        if (daysBetween(dates[i - 1], dates[i]) == 1) {
            ++run;
            longest = std::max(longest, run);
        } else {
            run = 1;
        }
    }
    streak.longestStreak = longest;

    const std::set<std::string> dateSet(dates.begin(), dates.end());
    const auto todayBounds = localDayBounds(today);
    if (todayBounds) {
        auto cursor = todayBounds->first + std::chrono::hours(12);
        while (dateSet.count(toLocalDate(cursor)) > 0) {
            ++streak.currentStreak;
            cursor -= std::chrono::hours(24);
        }
    }
    return streak;
}

std::optional<std::string> TraceStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ?;");
    bindText(stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    return std::nullopt;
}

void TraceStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stepDone(impl->db, stmt.get(), "failed to set meta value");
}

bool TraceStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }
    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace tracewatch
