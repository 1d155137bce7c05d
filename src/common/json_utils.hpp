#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tracewatch {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

// Local calendar date (YYYY-MM-DD) of a timestamp.
inline std::string toLocalDate(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

inline std::string toLocalTimeOfDay(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%H:%M:%S");
    return out.str();
}

// [start of day, start of next day) in local time for a YYYY-MM-DD date.
inline std::optional<std::pair<std::chrono::system_clock::time_point,
                               std::chrono::system_clock::time_point>>
localDayBounds(const std::string &date)
{
    int year = 0;
    int month = 0;
    int day = 0;
    char trailing = '\0';
    if (std::sscanf(date.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) != 3) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    std::tm start{};
    start.tm_year = year - 1900;
    start.tm_mon = month - 1;
    start.tm_mday = day;
    start.tm_isdst = -1;

    std::tm next = start;
    next.tm_mday += 1;

    const std::time_t startTime = std::mktime(&start);
    const std::time_t nextTime = std::mktime(&next);
    if (startTime == static_cast<std::time_t>(-1)
        || nextTime == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::make_pair(std::chrono::system_clock::from_time_t(startTime),
                          std::chrono::system_clock::from_time_t(nextTime));
}

inline int localHourOf(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    return tm.tm_hour;
}

// date + days, normalized at local noon so DST changes never skip a day.
inline std::optional<std::string> shiftLocalDate(const std::string &date, int days)
{
    const auto bounds = localDayBounds(date);
    if (!bounds) {
        return std::nullopt;
    }
    std::time_t time = std::chrono::system_clock::to_time_t(bounds->first);
    std::tm tm{};
    localtime_r(&time, &tm);
    tm.tm_mday += days;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    if (std::mktime(&tm) == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

// 0 for Monday through 6 for Sunday.
inline int localWeekday(const std::string &date)
{
    const auto bounds = localDayBounds(date);
    if (!bounds) {
        return 0;
    }
    std::time_t time = std::chrono::system_clock::to_time_t(bounds->first);
    std::tm tm{};
    localtime_r(&time, &tm);
    return (tm.tm_wday + 6) % 7;
}

inline std::string todayLocalDate()
{
    return toLocalDate(std::chrono::system_clock::now());
}

inline std::string toCategoryString(ActivityCategory category)
{
    switch (category) {
    case ActivityCategory::Development:
        return "Development";
    case ActivityCategory::Browsing:
        return "Browsing";
    case ActivityCategory::Research:
        return "Research";
    case ActivityCategory::Communication:
        return "Communication";
    case ActivityCategory::Productivity:
        return "Productivity";
    case ActivityCategory::Distraction:
        return "Distraction";
    case ActivityCategory::Other:
        return "Other";
    }
    return "Other";
}

inline ActivityCategory parseCategoryString(const std::string &value)
{
    if (value == "Development") {
        return ActivityCategory::Development;
    }
    if (value == "Browsing") {
        return ActivityCategory::Browsing;
    }
    if (value == "Research") {
        return ActivityCategory::Research;
    }
    if (value == "Communication") {
        return ActivityCategory::Communication;
    }
    if (value == "Productivity") {
        return ActivityCategory::Productivity;
    }
    if (value == "Distraction") {
        return ActivityCategory::Distraction;
    }
    return ActivityCategory::Other;
}

inline std::string toStatusString(FocusStatus status)
{
    switch (status) {
    case FocusStatus::WaitingForContext:
        return "waiting_for_context";
    case FocusStatus::Focused:
        return "focused";
    case FocusStatus::Distracted:
        return "distracted";
    case FocusStatus::Neutral:
        return "neutral";
    }
    return "neutral";
}

inline std::string toPhaseString(PomodoroPhase phase)
{
    switch (phase) {
    case PomodoroPhase::None:
        return "none";
    case PomodoroPhase::Work:
        return "work";
    case PomodoroPhase::Break:
        return "break";
    }
    return "none";
}

inline void to_json(nlohmann::json &j, const ActivityCategory &category)
{
    j = toCategoryString(category);
}

inline void from_json(const nlohmann::json &j, ActivityCategory &category)
{
    if (j.is_string()) {
        category = parseCategoryString(j.get<std::string>());
    } else {
        category = ActivityCategory::Other;
    }
}

inline void to_json(nlohmann::json &j, const ActivitySession &session)
{
    j = nlohmann::json{
        {"id", session.id},
        {"appName", session.appName},
        {"windowTitle", session.windowTitle},
        {"startTime", toIso8601Utc(session.startTime)},
        {"endTime", toIso8601Utc(session.endTime)},
        {"durationSeconds", session.durationSeconds},
        {"category", session.category},
        {"memoryMb", session.memoryMb},
        {"cpuPercent", session.cpuPercent},
        {"pid", session.pid}
    };
}

inline void to_json(nlohmann::json &j, const DailyAggregate &daily)
{
    j = nlohmann::json{
        {"date", daily.date},
        {"totalSeconds", daily.totalSeconds},
        {"productiveSeconds", daily.productiveSeconds},
        {"distractionSeconds", daily.distractionSeconds},
        {"topApp", daily.topApp},
        {"topCategory", daily.topCategory},
        {"sessionCount", daily.sessionCount}
    };
}

inline void to_json(nlohmann::json &j, const AppUsageAggregate &usage)
{
    j = nlohmann::json{
        {"date", usage.date},
        {"appName", usage.appName},
        {"totalDuration", usage.totalDuration},
        {"avgMemoryMb", usage.avgMemoryMb},
        {"avgCpuPercent", usage.avgCpuPercent},
        {"launchCount", usage.launchCount},
        {"category", usage.category}
    };
}

inline void to_json(nlohmann::json &j, const ProcessSnapshot &snapshot)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"appName", snapshot.appName},
        {"pid", snapshot.pid},
        {"memoryMb", snapshot.memoryMb},
        {"cpuPercent", snapshot.cpuPercent},
        {"status", snapshot.status},
        {"threads", snapshot.threads}
    };
}

inline void to_json(nlohmann::json &j, const FocusSessionRecord &record)
{
    j = nlohmann::json{
        {"id", record.id},
        {"startTime", toIso8601Utc(record.startTime)},
        {"endTime", toIso8601Utc(record.endTime)},
        {"targetMinutes", record.targetMinutes},
        {"actualFocusSeconds", record.actualFocusSeconds},
        {"distractionSeconds", record.distractionSeconds},
        {"interruptionCount", record.interruptionCount},
        {"focusScore", record.focusScore},
        {"goalLabel", record.goalLabel}
    };
}

inline void to_json(nlohmann::json &j, const SearchQuery &search)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(search.timestamp)},
        {"browser", search.browser},
        {"query", search.query},
        {"url", search.url},
        {"source", search.source}
    };
}

inline void to_json(nlohmann::json &j, const BrowserVisit &visit)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(visit.timestamp)},
        {"browser", visit.browser},
        {"url", visit.url},
        {"title", visit.title},
        {"visitDurationSeconds", visit.visitDurationSeconds},
        {"domain", visit.domain}
    };
}

inline void to_json(nlohmann::json &j, const FocusSnapshot &snapshot)
{
    j = nlohmann::json{
        {"status", toStatusString(snapshot.status)},
        {"phase", toPhaseString(snapshot.phase)},
        {"goalLabel", snapshot.goalLabel},
        {"lockedApp", snapshot.lockedApp},
        {"currentApp", snapshot.currentApp},
        {"elapsedSeconds", snapshot.elapsedSeconds},
        {"targetSeconds", snapshot.targetSeconds},
        {"distractionSeconds", snapshot.distractionSeconds},
        {"interruptionCount", snapshot.interruptionCount},
        {"score", snapshot.score}
    };
}

inline void to_json(nlohmann::json &j, const CategoryBreakdown &row)
{
    j = nlohmann::json{
        {"category", row.category},
        {"totalSeconds", row.totalSeconds},
        {"sessionCount", row.sessionCount}
    };
}

inline void to_json(nlohmann::json &j, const AppBreakdown &row)
{
    j = nlohmann::json{
        {"appName", row.appName},
        {"totalSeconds", row.totalSeconds},
        {"sessionCount", row.sessionCount},
        {"avgMemoryMb", row.avgMemoryMb},
        {"avgCpuPercent", row.avgCpuPercent},
        {"peakMemoryMb", row.peakMemoryMb}
    };
}

inline void to_json(nlohmann::json &j, const TitleUsage &row)
{
    j = nlohmann::json{
        {"windowTitle", row.windowTitle},
        {"totalSeconds", row.totalSeconds},
        {"count", row.count}
    };
}

inline void to_json(nlohmann::json &j, const AppAnalytics &analytics)
{
    j = nlohmann::json{
        {"appName", analytics.appName},
        {"category", analytics.category},
        {"sessionCount", analytics.sessionCount},
        {"totalSeconds", analytics.totalSeconds},
        {"avgMemoryMb", analytics.avgMemoryMb},
        {"peakMemoryMb", analytics.peakMemoryMb},
        {"avgCpuPercent", analytics.avgCpuPercent},
        {"peakCpuPercent", analytics.peakCpuPercent},
        {"firstSeen", toIso8601Utc(analytics.firstSeen)},
        {"lastSeen", toIso8601Utc(analytics.lastSeen)},
        {"topTitles", analytics.topTitles},
        {"resourceTimeline", analytics.resourceTimeline}
    };
}

inline void to_json(nlohmann::json &j, const ResourceUsageSummary &row)
{
    j = nlohmann::json{
        {"appName", row.appName},
        {"avgMemoryMb", row.avgMemoryMb},
        {"peakMemoryMb", row.peakMemoryMb},
        {"avgCpuPercent", row.avgCpuPercent},
        {"peakCpuPercent", row.peakCpuPercent},
        {"instanceCount", row.instanceCount}
    };
}

inline void to_json(nlohmann::json &j, const FocusStats &stats)
{
    j = nlohmann::json{
        {"totalSessions", stats.totalSessions},
        {"totalFocusSeconds", stats.totalFocusSeconds},
        {"avgFocusScore", stats.avgFocusScore},
        {"totalInterruptions", stats.totalInterruptions},
        {"bestScore", stats.bestScore}
    };
}

inline void to_json(nlohmann::json &j, const DomainUsage &row)
{
    j = nlohmann::json{
        {"domain", row.domain},
        {"visitCount", row.visitCount},
        {"totalDuration", row.totalDuration}
    };
}

inline void to_json(nlohmann::json &j, const HeatmapDay &day)
{
    j = nlohmann::json{
        {"date", day.date},
        {"totalSeconds", day.totalSeconds},
        {"productiveSeconds", day.productiveSeconds},
        {"score", day.score}
    };
}

inline void to_json(nlohmann::json &j, const StreakInfo &streak)
{
    j = nlohmann::json{
        {"currentStreak", streak.currentStreak},
        {"longestStreak", streak.longestStreak},
        {"totalDaysTracked", streak.totalDaysTracked}
    };
}

} // namespace tracewatch
