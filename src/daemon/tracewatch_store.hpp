#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tracewatch {

// TraceStore is the SQLite access layer for all persistent data: closed
// activity sessions, process snapshots, focus sessions, searches, browser
// visits, and the derived daily/per-app aggregates.
//
// Every public write is one transaction. Failures throw std::runtime_error.
class TraceStore {
public:
    // Opens ~/.local/share/tracewatch/tracewatch.db.
    TraceStore();
    explicit TraceStore(const std::filesystem::path &dbPath);
    ~TraceStore();

    TraceStore(const TraceStore &) = delete;
    TraceStore &operator=(const TraceStore &) = delete;

    static std::filesystem::path defaultDataDir();
    std::filesystem::path databasePath() const;

    // Append-only records.
    int64_t addSession(const ActivitySession &session);
    void addProcessSnapshots(const std::vector<ProcessSnapshot> &snapshots);
    int64_t addFocusSession(const FocusSessionRecord &record);
    void addSearch(const SearchQuery &search);
    // Returns false when the (browser, url, timestamp) visit is already stored.
    bool addBrowserVisit(const BrowserVisit &visit);

    // Aggregates are recomputed from the sessions of a local date and
    // upserted; repeated calls with unchanged sessions leave them unchanged.
    DailyAggregate recomputeDailyAggregate(const std::string &date);
    std::vector<AppUsageAggregate> recomputeAppUsage(const std::string &date);
    void recomputeAggregates(const std::string &date);

    std::optional<DailyAggregate> getDailyAggregate(const std::string &date) const;
    std::vector<DailyAggregate> getDailyRange(int limit) const;
    std::vector<AppUsageAggregate> getAppUsage(const std::string &date) const;
    std::vector<AppUsageAggregate> getAppHistory(const std::string &appName, int days) const;
    // Daily totals on or after fromDate, oldest first, with a 0-100 productive share.
    std::vector<HeatmapDay> getProductivityHeatmap(const std::string &fromDate) const;

    // Session queries.
    std::vector<ActivitySession> getSessionsForDate(const std::string &date) const;
    std::vector<CategoryBreakdown> getCategoryBreakdown(const std::string &date) const;
    std::vector<AppBreakdown> getAppBreakdown(const std::string &date) const;
    std::optional<AppAnalytics> getAppAnalytics(const std::string &appName,
                                                const std::string &date) const;
    // Sessions of one app starting on local dates [fromDate, toDate].
    std::vector<ActivitySession> getAppSessions(const std::string &appName,
                                                const std::string &fromDate,
                                                const std::string &toDate) const;

    // Telemetry queries.
    std::vector<ResourceUsageSummary> getTopMemoryApps(const std::string &date, int limit) const;
    std::vector<ResourceUsageSummary> getTopCpuApps(const std::string &date, int limit) const;
    int getSnapshotCount(const std::string &date) const;

    // Focus queries.
    std::vector<FocusSessionRecord> getFocusSessions(const std::optional<std::string> &date,
                                                     int limit) const;
    FocusStats getFocusStats() const;

    // Browser queries.
    std::vector<SearchQuery> getSearches(const std::string &date) const;
    std::vector<BrowserVisit> getBrowserVisits(const std::string &date, int limit) const;
    std::vector<DomainUsage> getDomainBreakdown(const std::string &date) const;

    StreakInfo getStreakInfo(const std::string &today) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;

    void open(const std::filesystem::path &dbPath);
};

} // namespace tracewatch
