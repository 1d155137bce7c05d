#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace tracewatch {

struct ForegroundWindow {
    std::string appName;
    std::string windowTitle;
    int64_t processId = 0;
};

struct ProcessResource {
    int64_t pid = 0;
    std::string name;
    uint64_t memoryBytes = 0;
    double cpuPercent = 0.0;
    int threads = 0;
    std::string status;
};

struct SystemUsage {
    uint64_t totalMemoryBytes = 0;
    uint64_t usedMemoryBytes = 0;
    double memoryPercent = 0.0;
    double cpuPercent = 0.0;
    int cpuCount = 0;
};

struct ActivitySession {
    int64_t id = 0;
    std::string appName;
    std::string windowTitle;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;
    double durationSeconds = 0.0;
    ActivityCategory category = ActivityCategory::Other;
    double memoryMb = 0.0;
    double cpuPercent = 0.0;
    int64_t pid = 0;
};

struct DailyAggregate {
    std::string date;
    double totalSeconds = 0.0;
    double productiveSeconds = 0.0;
    double distractionSeconds = 0.0;
    std::string topApp;
    std::string topCategory;
    int sessionCount = 0;
};

struct AppUsageAggregate {
    std::string date;
    std::string appName;
    double totalDuration = 0.0;
    double avgMemoryMb = 0.0;
    double avgCpuPercent = 0.0;
    int launchCount = 0;
    ActivityCategory category = ActivityCategory::Other;
};

struct ProcessSnapshot {
    std::chrono::system_clock::time_point timestamp;
    std::string appName;
    int64_t pid = 0;
    double memoryMb = 0.0;
    double cpuPercent = 0.0;
    std::string status;
    int threads = 0;
};

struct FocusSessionRecord {
    int64_t id = 0;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;
    int targetMinutes = 0;
    int actualFocusSeconds = 0;
    int distractionSeconds = 0;
    int interruptionCount = 0;
    double focusScore = 100.0;
    std::string goalLabel;
};

struct SearchQuery {
    std::chrono::system_clock::time_point timestamp;
    std::string browser;
    std::string query;
    std::string url;
    std::string source;
};

struct BrowserVisit {
    std::chrono::system_clock::time_point timestamp;
    std::string browser;
    std::string url;
    std::string title;
    double visitDurationSeconds = 0.0;
    std::string domain;
};

// Live view of a focus run, handed to the presentation layer every tick.
struct FocusSnapshot {
    FocusStatus status = FocusStatus::WaitingForContext;
    PomodoroPhase phase = PomodoroPhase::None;
    std::string goalLabel;
    std::string lockedApp;
    std::string currentApp;
    std::string currentTitle;
    int elapsedSeconds = 0;
    int targetSeconds = 0;
    int distractionSeconds = 0;
    int interruptionCount = 0;
    double score = 100.0;
};

struct CategoryBreakdown {
    ActivityCategory category = ActivityCategory::Other;
    double totalSeconds = 0.0;
    int sessionCount = 0;
};

struct AppBreakdown {
    std::string appName;
    double totalSeconds = 0.0;
    int sessionCount = 0;
    double avgMemoryMb = 0.0;
    double avgCpuPercent = 0.0;
    double peakMemoryMb = 0.0;
};

struct TitleUsage {
    std::string windowTitle;
    double totalSeconds = 0.0;
    int count = 0;
};

struct AppAnalytics {
    std::string appName;
    ActivityCategory category = ActivityCategory::Other;
    int sessionCount = 0;
    double totalSeconds = 0.0;
    double avgMemoryMb = 0.0;
    double peakMemoryMb = 0.0;
    double avgCpuPercent = 0.0;
    double peakCpuPercent = 0.0;
    std::chrono::system_clock::time_point firstSeen;
    std::chrono::system_clock::time_point lastSeen;
    std::vector<TitleUsage> topTitles;
    std::vector<ProcessSnapshot> resourceTimeline;
};

struct ResourceUsageSummary {
    std::string appName;
    double avgMemoryMb = 0.0;
    double peakMemoryMb = 0.0;
    double avgCpuPercent = 0.0;
    double peakCpuPercent = 0.0;
    int instanceCount = 0;
};

struct FocusStats {
    int totalSessions = 0;
    int totalFocusSeconds = 0;
    double avgFocusScore = 0.0;
    int totalInterruptions = 0;
    double bestScore = 0.0;
};

struct DomainUsage {
    std::string domain;
    int visitCount = 0;
    double totalDuration = 0.0;
};

struct HeatmapDay {
    std::string date;
    double totalSeconds = 0.0;
    double productiveSeconds = 0.0;
    int score = 0;
};

// Seconds of one app's sessions that started in a local hour of the day.
struct HourlyUsage {
    std::string appName;
    int hour = 0;
    double totalSeconds = 0.0;
};

struct StreakInfo {
    int currentStreak = 0;
    int longestStreak = 0;
    int totalDaysTracked = 0;
};

} // namespace tracewatch
