#include "report/ReportCli.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

#include <QSaveFile>

#include "common/format_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "daemon/aggregator.hpp"
#include "daemon/tracewatch_store.hpp"

namespace tracewatch {

namespace {

constexpr int kStatsDays = 7;
constexpr int kAppHistoryDays = 14;
constexpr int kTopApps = 10;
constexpr int kTopResources = 10;
constexpr int kTopDomains = 15;
constexpr int kDefaultUrlLimit = 50;
constexpr int kFocusHistoryLimit = 50;
constexpr size_t kTitleWidth = 60;
constexpr int kHeatmapWeeks = 20;
constexpr int kHeatmapMaxApps = 15;
constexpr int kAppDistDays = 30;
constexpr int kWeekDays = 7;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tracewatch-report report [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  tracewatch-report stats [--days N] [--format markdown|json]\n"
        "  tracewatch-report timeline [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  tracewatch-report app NAME [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  tracewatch-report focus [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  tracewatch-report system [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  tracewatch-report urls [--date YYYY-MM-DD] [--limit N] [--format markdown|json]\n"
        "  tracewatch-report searches [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  tracewatch-report streak [--format markdown|json]\n"
        "  tracewatch-report heatmap [--weeks N] [--format markdown|json]\n"
        "  tracewatch-report heatmap --day [YYYY-MM-DD] [--app NAME]... [--format markdown|json]\n"
        "  tracewatch-report week [--format markdown|json]\n"
        "  tracewatch-report app-dist NAME [--days N] [--format markdown|json]\n"
        "  tracewatch-report export [--date YYYY-MM-DD] [--format csv|json] [--output PATH]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

// export writes csv or json files; every other command renders markdown or json.
bool isKnownFormat(const QString &command, const QString &format)
{
    if (command == QStringLiteral("export")) {
        return format == QStringLiteral("markdown") || format == QStringLiteral("csv")
            || format == QStringLiteral("json");
    }
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

// All values following each occurrence of key.
std::vector<std::string> getArgValues(const QStringList &args, const QString &key)
{
    std::vector<std::string> values;
    for (int i = 0; i + 1 < args.size(); ++i) {
        if (args.at(i) == key && !args.at(i + 1).startsWith(QStringLiteral("--"))) {
            values.push_back(args.at(i + 1).toStdString());
        }
    }
    return values;
}

// Productivity share of a day; a dot when nothing was tracked.
const char *scoreGlyph(const HeatmapDay *day)
{
    if (!day) {
        return "·";
    }
    if (day->score >= 80) {
        return "█";
    }
    if (day->score >= 60) {
        return "▓";
    }
    if (day->score >= 40) {
        return "▒";
    }
    if (day->score >= 20) {
        return "░";
    }
    return "-";
}

const char *durationGlyph(double seconds)
{
    if (seconds <= 0.0) {
        return "·";
    }
    if (seconds > 1800.0) {
        return "█";
    }
    if (seconds > 900.0) {
        return "▓";
    }
    if (seconds > 300.0) {
        return "▒";
    }
    return "░";
}

std::string twoDigits(int value)
{
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << value;
    return out.str();
}

std::string csvField(const std::string &value)
{
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string sessionsToCsv(const std::vector<ActivitySession> &sessions)
{
    std::ostringstream out;
    out << "id,app_name,window_title,start_time,end_time,duration_seconds,category,"
           "memory_mb,cpu_percent,pid\n";
    for (const auto &session : sessions) {
        out << session.id << ',' << csvField(session.appName) << ','
            << csvField(session.windowTitle) << ',' << toIso8601Utc(session.startTime) << ','
            << toIso8601Utc(session.endTime) << ',' << session.durationSeconds << ','
            << toCategoryString(session.category) << ',' << session.memoryMb << ','
            << session.cpuPercent << ',' << session.pid << '\n';
    }
    return out.str();
}

// Positive integer option; fallback when absent, 0 when malformed.
int getPositiveInt(const QStringList &args, const QString &key, int fallback)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    return ok && parsed > 0 ? parsed : 0;
}

std::string clipped(const std::string &text, size_t width = kTitleWidth)
{
    if (text.size() <= width) {
        return text;
    }
    return text.substr(0, width - 3) + "...";
}

// Pipes would break a markdown table row.
std::string cell(const std::string &text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '|') {
            result += "\\|";
        } else if (c == '\n') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

double percentOf(double part, double whole)
{
    return whole > 0.0 ? part / whole * 100.0 : 0.0;
}

void printJson(const nlohmann::json &payload)
{
    // Titles from legacy WM_NAME windows may not be valid UTF-8.
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

void logCommandDone(const QString &where, const nlohmann::json &context)
{
    TWLOG_INFO(QStringLiteral("ReportCli"),
               where,
               QStringLiteral("report_rendered"),
               QStringLiteral("user_invocation"),
               QStringLiteral("sqlite_query"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               context);
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the report handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString command = args.at(1);
    if (!isKnownFormat(command, getFormat(args))) {
        std::cerr << (command == QStringLiteral("export")
                          ? "Unknown format; expected csv or json.\n"
                          : "Unknown format; expected markdown or json.\n");
        std::cerr << usageText().toStdString();
        return 1;
    }

    TWLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});

    using Handler = int (ReportCli::*)(TraceStore &, const QStringList &);
    Handler handler = nullptr;
    if (command == QStringLiteral("report")) {
        handler = &ReportCli::runDailyReport;
    } else if (command == QStringLiteral("stats")) {
        handler = &ReportCli::runStatsReport;
    } else if (command == QStringLiteral("timeline")) {
        handler = &ReportCli::runTimelineReport;
    } else if (command == QStringLiteral("app")) {
        handler = &ReportCli::runAppReport;
    } else if (command == QStringLiteral("focus")) {
        handler = &ReportCli::runFocusReport;
    } else if (command == QStringLiteral("system")) {
        handler = &ReportCli::runSystemReport;
    } else if (command == QStringLiteral("urls")) {
        handler = &ReportCli::runUrlsReport;
    } else if (command == QStringLiteral("searches")) {
        handler = &ReportCli::runSearchesReport;
    } else if (command == QStringLiteral("streak")) {
        handler = &ReportCli::runStreakReport;
    } else if (command == QStringLiteral("heatmap")) {
        handler = &ReportCli::runHeatmapReport;
    } else if (command == QStringLiteral("week")) {
        handler = &ReportCli::runWeekReport;
    } else if (command == QStringLiteral("app-dist")) {
        handler = &ReportCli::runAppDistributionReport;
    } else if (command == QStringLiteral("export")) {
        handler = &ReportCli::runExport;
    }
    if (!handler) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        TraceStore store;
        return (this->*handler)(store, args);
    } catch (const std::exception &ex) {
        TWLOG_ERROR(QStringLiteral("ReportCli"),
                    QStringLiteral("run"),
                    QStringLiteral("report_failed"),
                    QString::fromStdString(ex.what()),
                    QStringLiteral("exit_code_1"),
                    ::tracewatch::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"command", command.toStdString()}});
        std::cerr << "Report failed: " << ex.what() << std::endl;
        return 1;
    }
}

std::optional<std::string> ReportCli::parseDate(const QStringList &args) const
{
    const QString value = getArgValue(args, QStringLiteral("--date"));
    if (value.isEmpty()) {
        if (args.contains(QStringLiteral("--date"))) {
            return std::nullopt;
        }
        return todayLocalDate();
    }
    const std::string date = value.toStdString();
    if (!localDayBounds(date)) {
        return std::nullopt;
    }
    return date;
}

int ReportCli::runDailyReport(TraceStore &store, const QStringList &args)
{
    // Aggregates are refreshed first so the summary reflects every closed session.
    const auto date = parseDate(args);
    if (!date) {
        std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
        return 1;
    }

    store.recomputeAggregates(*date);
    const DailyAggregate daily = store.getDailyAggregate(*date).value_or(DailyAggregate{*date});
    const auto categories = store.getCategoryBreakdown(*date);
    auto apps = store.getAppBreakdown(*date);
    if (apps.size() > static_cast<size_t>(kTopApps)) {
        apps.resize(kTopApps);
    }

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = *date;
        payload["summary"] = daily;
        payload["productivityScore"] = percentOf(daily.productiveSeconds, daily.totalSeconds);
        payload["categories"] = categories;
        payload["topApps"] = apps;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch Activity Report\n\n";
        std::cout << "Date: " << *date << "\n\n";
        if (categories.empty()) {
            std::cout << "No data logged for this date yet.\n";
        } else {
            std::cout << "- Total tracked: " << formatDuration(daily.totalSeconds) << "\n";
            std::cout << "- Productive: " << formatDuration(daily.productiveSeconds) << " ("
                      << formatPercent(percentOf(daily.productiveSeconds, daily.totalSeconds), 0)
                      << ")\n";
            std::cout << "- Distraction: " << formatDuration(daily.distractionSeconds) << "\n";
            std::cout << "- Sessions: " << daily.sessionCount << "\n";
            std::cout << "- Top app: " << daily.topApp << "\n\n";

            std::cout << "## Categories\n\n";
            std::cout << "| Category | Duration | Share | Sessions |\n";
            std::cout << "|---|---|---|---|\n";
            for (const auto &row : categories) {
                std::cout << "| " << toCategoryString(row.category)
                          << " | " << formatDuration(row.totalSeconds)
                          << " | " << formatPercent(percentOf(row.totalSeconds, daily.totalSeconds))
                          << " | " << row.sessionCount << " |\n";
            }

            std::cout << "\n## Top Applications\n\n";
            std::cout << "| App | Duration | Sessions | Avg RAM | Avg CPU |\n";
            std::cout << "|---|---|---|---|---|\n";
            for (const auto &row : apps) {
                std::cout << "| " << cell(row.appName)
                          << " | " << formatDuration(row.totalSeconds)
                          << " | " << row.sessionCount
                          << " | " << formatMemory(row.avgMemoryMb)
                          << " | " << formatPercent(row.avgCpuPercent) << " |\n";
            }
        }
    }

    logCommandDone(QStringLiteral("runDailyReport"),
                   nlohmann::json{{"date", *date}, {"sessions", daily.sessionCount}});
    return 0;
}

int ReportCli::runStatsReport(TraceStore &store, const QStringList &args)
{
    const int days = getPositiveInt(args, QStringLiteral("--days"), kStatsDays);
    if (days == 0) {
        std::cerr << "Invalid --days, expected a positive number." << std::endl;
        return 1;
    }

    store.recomputeAggregates(todayLocalDate());
    auto records = store.getDailyRange(days);
    std::reverse(records.begin(), records.end());

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["days"] = days;
        payload["records"] = records;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch Productivity Trends\n\n";
        std::cout << "Last " << days << " tracked days\n\n";
        if (records.empty()) {
            std::cout << "No daily stats recorded yet.\n";
        } else {
            double total = 0.0;
            double productive = 0.0;
            double distraction = 0.0;
            std::cout << "| Date | Total | Productive | Distraction | Score | Top App |\n";
            std::cout << "|---|---|---|---|---|---|\n";
            for (const auto &record : records) {
                total += record.totalSeconds;
                productive += record.productiveSeconds;
                distraction += record.distractionSeconds;
                std::cout << "| " << record.date
                          << " | " << formatDuration(record.totalSeconds)
                          << " | " << formatDuration(record.productiveSeconds)
                          << " | " << formatDuration(record.distractionSeconds)
                          << " | " << formatPercent(percentOf(record.productiveSeconds,
                                                              record.totalSeconds), 0)
                          << " | " << cell(record.topApp) << " |\n";
            }
            std::cout << "\nTotal " << formatDuration(total) << ", productive "
                      << formatDuration(productive) << ", distraction "
                      << formatDuration(distraction) << ", average score "
                      << formatPercent(percentOf(productive, total), 0) << "\n";
        }
    }

    logCommandDone(QStringLiteral("runStatsReport"),
                   nlohmann::json{{"days", days}, {"records", records.size()}});
    return 0;
}

int ReportCli::runTimelineReport(TraceStore &store, const QStringList &args)
{
    const auto date = parseDate(args);
    if (!date) {
        std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
        return 1;
    }

    const auto sessions = store.getSessionsForDate(*date);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = *date;
        payload["sessions"] = sessions;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch Activity Timeline\n\n";
        std::cout << "Date: " << *date << "\n\n";
        if (sessions.empty()) {
            std::cout << "No activities found for this date.\n";
        } else {
            for (const auto &session : sessions) {
                std::cout << "- [" << toLocalTimeOfDay(session.startTime) << "] "
                          << formatDuration(session.durationSeconds) << " "
                          << session.appName << " ("
                          << toCategoryString(session.category) << "): "
                          << clipped(session.windowTitle) << "\n";
            }
        }
    }

    logCommandDone(QStringLiteral("runTimelineReport"),
                   nlohmann::json{{"date", *date}, {"sessions", sessions.size()}});
    return 0;
}

int ReportCli::runAppReport(TraceStore &store, const QStringList &args)
{
    if (args.size() < 3 || args.at(2).startsWith(QStringLiteral("--"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const std::string appName = args.at(2).toStdString();
    const auto date = parseDate(args);
    if (!date) {
        std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
        return 1;
    }

    const auto analytics = store.getAppAnalytics(appName, *date);
    const auto history = store.getAppHistory(appName, kAppHistoryDays);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = *date;
        payload["app"] = appName;
        payload["analytics"] = analytics ? nlohmann::json(*analytics) : nlohmann::json();
        payload["history"] = history;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch App Analytics: " << appName << "\n\n";
        std::cout << "Date: " << *date << "\n\n";
        if (!analytics) {
            std::cout << "No data for '" << appName << "' on this date.\n";
        } else {
            std::cout << "- Total time: " << formatDuration(analytics->totalSeconds) << "\n";
            std::cout << "- Sessions: " << analytics->sessionCount << "\n";
            std::cout << "- Category: " << toCategoryString(analytics->category) << "\n";
            std::cout << "- Memory: avg " << formatMemory(analytics->avgMemoryMb)
                      << ", peak " << formatMemory(analytics->peakMemoryMb) << "\n";
            std::cout << "- CPU: avg " << formatPercent(analytics->avgCpuPercent)
                      << ", peak " << formatPercent(analytics->peakCpuPercent) << "\n";
            std::cout << "- First seen: " << toLocalTimeOfDay(analytics->firstSeen) << "\n";
            std::cout << "- Last seen: " << toLocalTimeOfDay(analytics->lastSeen) << "\n";

            if (!analytics->topTitles.empty()) {
                std::cout << "\n## Window Titles\n\n";
                std::cout << "| # | Window Title | Duration | Count |\n";
                std::cout << "|---|---|---|---|\n";
                int rank = 1;
                for (const auto &title : analytics->topTitles) {
                    std::cout << "| " << rank++ << " | " << cell(clipped(title.windowTitle, 50))
                              << " | " << formatDuration(title.totalSeconds)
                              << " | " << title.count << " |\n";
                }
            }
            if (!analytics->resourceTimeline.empty()) {
                std::cout << "\nResource samples: " << analytics->resourceTimeline.size() << "\n";
            }
        }

        if (history.size() > 1) {
            std::cout << "\n## Usage History\n\n";
            std::cout << "| Date | Duration | Sessions | Avg RAM |\n";
            std::cout << "|---|---|---|---|\n";
            for (const auto &day : history) {
                std::cout << "| " << day.date
                          << " | " << formatDuration(day.totalDuration)
                          << " | " << day.launchCount
                          << " | " << formatMemory(day.avgMemoryMb) << " |\n";
            }
        }
    }

    logCommandDone(QStringLiteral("runAppReport"),
                   nlohmann::json{{"date", *date}, {"app", appName}, {"found", analytics.has_value()}});
    return 0;
}

int ReportCli::runFocusReport(TraceStore &store, const QStringList &args)
{
    // Without --date the most recent sessions across all days are listed.
    std::optional<std::string> date;
    if (args.contains(QStringLiteral("--date"))) {
        date = parseDate(args);
        if (!date) {
            std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
            return 1;
        }
    }

    const auto sessions = store.getFocusSessions(date, kFocusHistoryLimit);
    const FocusStats stats = store.getFocusStats();

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = date ? nlohmann::json(*date) : nlohmann::json();
        payload["stats"] = stats;
        payload["sessions"] = sessions;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch Focus History\n\n";
        std::cout << stats.totalSessions << " sessions, "
                  << formatDuration(stats.totalFocusSeconds) << " focused, average score "
                  << formatPercent(stats.avgFocusScore) << ", best "
                  << formatPercent(stats.bestScore) << ", "
                  << stats.totalInterruptions << " interruptions\n\n";
        if (sessions.empty()) {
            std::cout << "No focus sessions found.\n";
        } else {
            std::cout << "| Date | Time | Target | Focused | Distracted | Interruptions | Score | Goal |\n";
            std::cout << "|---|---|---|---|---|---|---|---|\n";
            for (const auto &session : sessions) {
                std::cout << "| " << toLocalDate(session.startTime)
                          << " | " << toLocalTimeOfDay(session.startTime)
                          << " | " << session.targetMinutes << "m"
                          << " | " << formatDuration(session.actualFocusSeconds)
                          << " | " << formatDuration(session.distractionSeconds)
                          << " | " << session.interruptionCount
                          << " | " << formatPercent(session.focusScore, 0)
                          << " | " << cell(session.goalLabel.empty() ? "-" : session.goalLabel)
                          << " |\n";
            }
        }
    }

    logCommandDone(QStringLiteral("runFocusReport"),
                   nlohmann::json{{"sessions", sessions.size()}});
    return 0;
}

int ReportCli::runSystemReport(TraceStore &store, const QStringList &args)
{
    const auto date = parseDate(args);
    if (!date) {
        std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
        return 1;
    }

    const auto topMemory = store.getTopMemoryApps(*date, kTopResources);
    const auto topCpu = store.getTopCpuApps(*date, kTopResources);
    const int samples = store.getSnapshotCount(*date);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = *date;
        payload["sampleCount"] = samples;
        payload["topMemory"] = topMemory;
        payload["topCpu"] = topCpu;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch System Overview\n\n";
        std::cout << "Date: " << *date << " (" << samples << " samples)\n\n";
        if (topMemory.empty()) {
            std::cout << "No process snapshots recorded for this date.\n";
        } else {
            std::cout << "## Top Memory Consumers\n\n";
            std::cout << "| App | Avg RAM | Peak RAM | Instances | Avg CPU |\n";
            std::cout << "|---|---|---|---|---|\n";
            for (const auto &row : topMemory) {
                std::cout << "| " << cell(row.appName)
                          << " | " << formatMemory(row.avgMemoryMb)
                          << " | " << formatMemory(row.peakMemoryMb)
                          << " | " << row.instanceCount
                          << " | " << formatPercent(row.avgCpuPercent) << " |\n";
            }

            std::cout << "\n## Top CPU Consumers\n\n";
            std::cout << "| App | Avg CPU | Peak CPU | Avg RAM | Instances |\n";
            std::cout << "|---|---|---|---|---|\n";
            for (const auto &row : topCpu) {
                std::cout << "| " << cell(row.appName)
                          << " | " << formatPercent(row.avgCpuPercent)
                          << " | " << formatPercent(row.peakCpuPercent)
                          << " | " << formatMemory(row.avgMemoryMb)
                          << " | " << row.instanceCount << " |\n";
            }
        }
    }

    logCommandDone(QStringLiteral("runSystemReport"),
                   nlohmann::json{{"date", *date}, {"samples", samples}});
    return 0;
}

int ReportCli::runUrlsReport(TraceStore &store, const QStringList &args)
{
    const auto date = parseDate(args);
    if (!date) {
        std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
        return 1;
    }
    const int limit = getPositiveInt(args, QStringLiteral("--limit"), kDefaultUrlLimit);
    if (limit == 0) {
        std::cerr << "Invalid --limit, expected a positive number." << std::endl;
        return 1;
    }

    auto domains = store.getDomainBreakdown(*date);
    if (domains.size() > static_cast<size_t>(kTopDomains)) {
        domains.resize(kTopDomains);
    }
    const auto visits = store.getBrowserVisits(*date, limit);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = *date;
        payload["domains"] = domains;
        payload["visits"] = visits;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch Browser History\n\n";
        std::cout << "Date: " << *date << "\n\n";
        if (!domains.empty()) {
            std::cout << "## Domains\n\n";
            std::cout << "| # | Domain | Visits | Total Time |\n";
            std::cout << "|---|---|---|---|\n";
            int rank = 1;
            for (const auto &domain : domains) {
                std::cout << "| " << rank++ << " | " << cell(domain.domain)
                          << " | " << domain.visitCount
                          << " | " << formatDuration(domain.totalDuration) << " |\n";
            }
            std::cout << "\n";
        }
        if (visits.empty()) {
            std::cout << "No browser URLs recorded for this date.\n";
        } else {
            std::cout << "## Recent URLs\n\n";
            std::cout << "| Time | Title | Domain | Browser |\n";
            std::cout << "|---|---|---|---|\n";
            for (const auto &visit : visits) {
                std::cout << "| " << toLocalTimeOfDay(visit.timestamp)
                          << " | " << cell(clipped(visit.title, 40))
                          << " | " << cell(visit.domain)
                          << " | " << visit.browser << " |\n";
            }
        }
    }

    logCommandDone(QStringLiteral("runUrlsReport"),
                   nlohmann::json{{"date", *date}, {"visits", visits.size()}});
    return 0;
}

int ReportCli::runSearchesReport(TraceStore &store, const QStringList &args)
{
    const auto date = parseDate(args);
    if (!date) {
        std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
        return 1;
    }

    const auto searches = store.getSearches(*date);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = *date;
        payload["searches"] = searches;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch Searches\n\n";
        std::cout << "Date: " << *date << "\n\n";
        if (searches.empty()) {
            std::cout << "No searches found.\n";
        } else {
            for (const auto &search : searches) {
                std::cout << "- [" << toLocalTimeOfDay(search.timestamp) << "] "
                          << search.query << " (" << search.browser << ", "
                          << search.source << ")\n";
            }
        }
    }

    logCommandDone(QStringLiteral("runSearchesReport"),
                   nlohmann::json{{"date", *date}, {"searches", searches.size()}});
    return 0;
}

int ReportCli::runStreakReport(TraceStore &store, const QStringList &args)
{
    const std::string today = todayLocalDate();
    store.recomputeAggregates(today);
    const StreakInfo streak = store.getStreakInfo(today);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload = streak;
        payload["today"] = today;
        printJson(payload);
    } else {
        std::cout << "# Tracewatch Streak\n\n";
        std::cout << "- Current streak: " << streak.currentStreak << " days\n";
        std::cout << "- Longest streak: " << streak.longestStreak << " days\n";
        std::cout << "- Days tracked: " << streak.totalDaysTracked << "\n";
    }

    logCommandDone(QStringLiteral("runStreakReport"),
                   nlohmann::json{{"current", streak.currentStreak}});
    return 0;
}

int ReportCli::runHeatmapReport(TraceStore &store, const QStringList &args)
{
    if (args.contains(QStringLiteral("--day"))) {
        return runDayHeatmap(store, args);
    }

    const int weeks = getPositiveInt(args, QStringLiteral("--weeks"), kHeatmapWeeks);
    if (weeks == 0) {
        std::cerr << "Invalid --weeks, expected a positive number." << std::endl;
        return 1;
    }

    const std::string today = todayLocalDate();
    store.recomputeAggregates(today);
    // The grid starts on the Monday (weeks - 1) weeks before this week's.
    const std::string from =
        shiftLocalDate(today, -localWeekday(today) - 7 * (weeks - 1)).value_or(today);
    const auto days = store.getProductivityHeatmap(from);
    const StreakInfo streak = store.getStreakInfo(today);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["weeks"] = weeks;
        payload["from"] = from;
        payload["to"] = today;
        payload["days"] = days;
        payload["streak"] = streak;
        printJson(payload);
    } else {
        std::map<std::string, const HeatmapDay *> byDate;
        for (const auto &day : days) {
            byDate[day.date] = &day;
        }

        static const std::array<const char *, 7> kRowLabels = {
            "Mon", "   ", "Wed", "   ", "Fri", "   ", "Sun"};
        std::cout << "# Tracewatch Productivity Heatmap\n\n";
        std::cout << "From " << from << " to " << today << "\n\n```\n";
        for (int weekday = 0; weekday < 7; ++weekday) {
            std::cout << kRowLabels[static_cast<size_t>(weekday)] << ' ';
            for (int week = 0; week < weeks; ++week) {
                const auto date = shiftLocalDate(from, week * 7 + weekday);
                if (!date || *date > today) {
                    std::cout << "  ";
                    continue;
                }
                const auto found = byDate.find(*date);
                std::cout << scoreGlyph(found == byDate.end() ? nullptr : found->second) << ' ';
            }
            std::cout << "\n";
        }
        std::cout << "```\n\n";
        std::cout << "Legend: · none, - <20%, ░ <40%, ▒ <60%, ▓ <80%, "
                     "█ 80%+ productive\n\n";
        std::cout << "- Current streak: " << streak.currentStreak << " days\n";
        std::cout << "- Longest streak: " << streak.longestStreak << " days\n";
        std::cout << "- Days tracked: " << streak.totalDaysTracked << "\n";
    }

    logCommandDone(QStringLiteral("runHeatmapReport"),
                   nlohmann::json{{"weeks", weeks}, {"days", days.size()}});
    return 0;
}

int ReportCli::runDayHeatmap(TraceStore &store, const QStringList &args)
{
    // --day takes an optional date; a bare --day means today.
    std::string date = todayLocalDate();
    const QString value = getArgValue(args, QStringLiteral("--day"));
    if (!value.isEmpty() && !value.startsWith(QStringLiteral("--"))) {
        date = value.toStdString();
        if (!localDayBounds(date)) {
            std::cerr << "Invalid --day, expected YYYY-MM-DD." << std::endl;
            return 1;
        }
    }
    const std::vector<std::string> appFilter = getArgValues(args, QStringLiteral("--app"));

    std::map<std::string, std::array<double, 24>> perApp;
    for (const auto &row : computeHourlyUsage(store.getSessionsForDate(date))) {
        if (!appFilter.empty()
            && std::find(appFilter.begin(), appFilter.end(), row.appName) == appFilter.end()) {
            continue;
        }
        auto &hours = perApp[row.appName];
        hours[static_cast<size_t>(row.hour)] += row.totalSeconds;
    }

    struct AppRow {
        std::string appName;
        double totalSeconds = 0.0;
        std::array<double, 24> hours{};
    };
    std::vector<AppRow> rows;
    for (const auto &[appName, hours] : perApp) {
        AppRow row{appName, 0.0, hours};
        for (double seconds : hours) {
            row.totalSeconds += seconds;
        }
        rows.push_back(row);
    }
    std::stable_sort(rows.begin(), rows.end(), [](const AppRow &a, const AppRow &b) {
        return a.totalSeconds > b.totalSeconds;
    });
    if (rows.size() > static_cast<size_t>(kHeatmapMaxApps)) {
        rows.resize(kHeatmapMaxApps);
    }

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json apps = nlohmann::json::array();
        for (const auto &row : rows) {
            apps.push_back({{"app", row.appName},
                            {"totalSeconds", row.totalSeconds},
                            {"hours", row.hours}});
        }
        nlohmann::json payload;
        payload["date"] = date;
        payload["apps"] = apps;
        printJson(payload);
    } else if (rows.empty()) {
        std::cout << "No activity data for " << date << ".\n";
    } else {
        std::cout << "# Tracewatch Hourly Heatmap\n\n";
        std::cout << "Date: " << date << "\n\n```\n";
        std::cout << std::string(22, ' ');
        for (int hour = 0; hour < 24; ++hour) {
            std::cout << twoDigits(hour) << ' ';
        }
        std::cout << "\n";
        for (const auto &row : rows) {
            std::string label = row.appName.substr(0, 20);
            label.resize(22, ' ');
            std::cout << label;
            for (double seconds : row.hours) {
                std::cout << durationGlyph(seconds) << "  ";
            }
            std::cout << "\n";
        }
        std::cout << "```\n\n";
        std::cout << "Legend: ░ <5m, ▒ <15m, ▓ <30m, █ 30m+\n";
    }

    logCommandDone(QStringLiteral("runDayHeatmap"),
                   nlohmann::json{{"date", date}, {"apps", rows.size()}});
    return 0;
}

int ReportCli::runWeekReport(TraceStore &store, const QStringList &args)
{
    store.recomputeAggregates(todayLocalDate());
    const auto records = store.getDailyRange(kWeekDays);

    double total = 0.0;
    double productive = 0.0;
    double distraction = 0.0;
    const DailyAggregate *best = nullptr;
    // Ascending dates, so '>' keeps the earlier day on equal productive time.
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        total += it->totalSeconds;
        productive += it->productiveSeconds;
        distraction += it->distractionSeconds;
        if (!best || it->productiveSeconds > best->productiveSeconds) {
            best = &*it;
        }
    }

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["days"] = records.size();
        payload["totalSeconds"] = total;
        payload["productiveSeconds"] = productive;
        payload["distractionSeconds"] = distraction;
        payload["score"] = percentOf(productive, total);
        payload["bestDay"] = best ? nlohmann::json(best->date) : nlohmann::json();
        printJson(payload);
    } else if (records.empty()) {
        std::cout << "No data for the past week.\n";
    } else {
        std::cout << "# Tracewatch Weekly Summary\n\n";
        std::cout << "- Total time: " << formatDuration(total) << "\n";
        std::cout << "- Productive: " << formatDuration(productive) << "\n";
        std::cout << "- Distraction: " << formatDuration(distraction) << "\n";
        std::cout << "- Average score: " << formatPercent(percentOf(productive, total), 0) << "\n";
        std::cout << "- Best day: " << best->date << "\n";
    }

    logCommandDone(QStringLiteral("runWeekReport"),
                   nlohmann::json{{"records", records.size()}});
    return 0;
}

int ReportCli::runAppDistributionReport(TraceStore &store, const QStringList &args)
{
    if (args.size() < 3 || args.at(2).startsWith(QStringLiteral("--"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const std::string appName = args.at(2).toStdString();
    const int days = getPositiveInt(args, QStringLiteral("--days"), kAppDistDays);
    if (days == 0) {
        std::cerr << "Invalid --days, expected a positive number." << std::endl;
        return 1;
    }

    const std::string today = todayLocalDate();
    const std::string from = shiftLocalDate(today, -(days - 1)).value_or(today);
    const auto sessions = store.getAppSessions(appName, from, today);
    const auto hours = averageSecondsByHour(sessions, days);

    std::optional<int> peakHour;
    for (int hour = 0; hour < 24; ++hour) {
        const double value = hours[static_cast<size_t>(hour)];
        if (value > 0.0 && (!peakHour || value > hours[static_cast<size_t>(*peakHour)])) {
            peakHour = hour;
        }
    }

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["app"] = appName;
        payload["days"] = days;
        payload["sessions"] = sessions.size();
        payload["avgSecondsByHour"] = hours;
        payload["peakHour"] = peakHour ? nlohmann::json(*peakHour) : nlohmann::json();
        printJson(payload);
    } else if (sessions.empty()) {
        std::cout << "No data found for '" << appName << "' in the last " << days << " days.\n";
    } else {
        const double peak = hours[static_cast<size_t>(*peakHour)];
        std::cout << "# Tracewatch Usage Distribution: " << appName << "\n\n";
        std::cout << "Average over " << days << " days\n\n```\n";
        for (double value : hours) {
            const double share = value / peak;
            const char *glyph = value <= 0.0 ? "·"
                : share > 0.8                ? "█"
                : share > 0.5                ? "▓"
                : share > 0.2                ? "▒"
                                             : "░";
            std::cout << glyph << "  ";
        }
        std::cout << "\n";
        for (int hour = 0; hour < 24; ++hour) {
            std::cout << twoDigits(hour) << ' ';
        }
        std::cout << "\n```\n\n";
        std::cout << "Peak usage at: " << twoDigits(*peakHour) << ":00 ("
                  << formatDuration(peak) << " per day)\n";
    }

    logCommandDone(QStringLiteral("runAppDistributionReport"),
                   nlohmann::json{{"app", appName}, {"days", days}, {"sessions", sessions.size()}});
    return 0;
}

int ReportCli::runExport(TraceStore &store, const QStringList &args)
{
    const auto date = parseDate(args);
    if (!date) {
        std::cerr << "Invalid --date, expected YYYY-MM-DD." << std::endl;
        return 1;
    }
    const QString format = getArgValue(args, QStringLiteral("--format")).isEmpty()
        ? QStringLiteral("csv")
        : getFormat(args);
    if (format == QStringLiteral("markdown")) {
        std::cerr << "Unknown format; expected csv or json." << std::endl;
        return 1;
    }

    const auto sessions = store.getSessionsForDate(*date);
    if (sessions.empty()) {
        std::cout << "No data to export for this date." << std::endl;
        return 0;
    }

    QString outPath = getArgValue(args, QStringLiteral("--output"));
    if (outPath.isEmpty()) {
        outPath = QStringLiteral("tracewatch_export_%1.%2")
                      .arg(QString::fromStdString(*date), format);
    }

    const std::string content = format == QStringLiteral("json")
        ? nlohmann::json(sessions).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
        : sessionsToCsv(sessions);

    QSaveFile file(outPath);
    if (!file.open(QIODevice::WriteOnly)) {
        std::cerr << "Cannot write " << outPath.toStdString() << ": "
                  << file.errorString().toStdString() << std::endl;
        return 1;
    }
    file.write(content.data(), static_cast<qint64>(content.size()));
    if (!file.commit()) {
        std::cerr << "Cannot write " << outPath.toStdString() << ": "
                  << file.errorString().toStdString() << std::endl;
        return 1;
    }

    std::cout << "Exported " << sessions.size() << " records to " << outPath.toStdString()
              << std::endl;
    logCommandDone(QStringLiteral("runExport"),
                   nlohmann::json{{"date", *date},
                                  {"format", format.toStdString()},
                                  {"records", sessions.size()}});
    return 0;
}

} // namespace tracewatch
