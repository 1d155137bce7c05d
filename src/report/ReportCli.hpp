#pragma once

#include <optional>
#include <string>

#include <QString>
#include <QStringList>

namespace tracewatch {

class TraceStore;

class ReportCli
{
public:
    // CLI dispatcher for activity, focus, telemetry and browser reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand reads from SQLite and renders markdown or json.
    int runDailyReport(TraceStore &store, const QStringList &args);
    int runStatsReport(TraceStore &store, const QStringList &args);
    int runTimelineReport(TraceStore &store, const QStringList &args);
    int runAppReport(TraceStore &store, const QStringList &args);
    int runFocusReport(TraceStore &store, const QStringList &args);
    int runSystemReport(TraceStore &store, const QStringList &args);
    int runUrlsReport(TraceStore &store, const QStringList &args);
    int runSearchesReport(TraceStore &store, const QStringList &args);
    int runStreakReport(TraceStore &store, const QStringList &args);
    int runHeatmapReport(TraceStore &store, const QStringList &args);
    int runDayHeatmap(TraceStore &store, const QStringList &args);
    int runWeekReport(TraceStore &store, const QStringList &args);
    int runAppDistributionReport(TraceStore &store, const QStringList &args);
    // Writes the sessions of a date to a csv or json file.
    int runExport(TraceStore &store, const QStringList &args);

    // --date value, today when absent, std::nullopt when malformed.
    std::optional<std::string> parseDate(const QStringList &args) const;
};

} // namespace tracewatch
