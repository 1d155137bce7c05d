#include "daemon/aggregator.hpp"

#include <map>

#include "common/json_utils.hpp"

namespace tracewatch {

namespace {

template <typename Key>
Key largestKey(const std::map<Key, double> &totals)
{
    Key best{};
    double bestTotal = -1.0;
    // std::map iterates keys in ascending order, so strict '>' keeps the
    // smaller key on equal totals.
    for (const auto &[key, total] : totals) {
        if (total > bestTotal) {
            best = key;
            bestTotal = total;
        }
    }
    return best;
}

struct AppAccumulator {
    double totalDuration = 0.0;
    double memorySum = 0.0;
    double cpuSum = 0.0;
    int count = 0;
    std::map<std::string, double> categoryTotals;
};

} // namespace

bool isProductiveCategory(ActivityCategory category)
{
    return category == ActivityCategory::Development
        || category == ActivityCategory::Research
        || category == ActivityCategory::Productivity;
}

bool isDistractionCategory(ActivityCategory category)
{
    return category == ActivityCategory::Distraction;
}

DailyAggregate computeDailyAggregate(const std::string &date,
                                     const std::vector<ActivitySession> &sessions)
{
    DailyAggregate daily;
    daily.date = date;

    std::map<std::string, double> appTotals;
    std::map<std::string, double> categoryTotals;

    for (const auto &session : sessions) {
        daily.totalSeconds += session.durationSeconds;
        if (isProductiveCategory(session.category)) {
            daily.productiveSeconds += session.durationSeconds;
        } else if (isDistractionCategory(session.category)) {
            daily.distractionSeconds += session.durationSeconds;
        }
        appTotals[session.appName] += session.durationSeconds;
        categoryTotals[toCategoryString(session.category)] += session.durationSeconds;
        ++daily.sessionCount;
    }

    if (!sessions.empty()) {
        daily.topApp = largestKey(appTotals);
        daily.topCategory = largestKey(categoryTotals);
    }
    return daily;
}

std::vector<AppUsageAggregate> computeAppUsage(const std::string &date,
                                               const std::vector<ActivitySession> &sessions)
{
    std::map<std::string, AppAccumulator> perApp;
    for (const auto &session : sessions) {
        auto &acc = perApp[session.appName];
        acc.totalDuration += session.durationSeconds;
        acc.memorySum += session.memoryMb;
        acc.cpuSum += session.cpuPercent;
        ++acc.count;
        acc.categoryTotals[toCategoryString(session.category)] += session.durationSeconds;
    }

    std::vector<AppUsageAggregate> result;
    result.reserve(perApp.size());
    for (const auto &[appName, acc] : perApp) {
        AppUsageAggregate usage;
        usage.date = date;
        usage.appName = appName;
        usage.totalDuration = acc.totalDuration;
        usage.avgMemoryMb = acc.count > 0 ? acc.memorySum / acc.count : 0.0;
        usage.avgCpuPercent = acc.count > 0 ? acc.cpuSum / acc.count : 0.0;
        usage.launchCount = acc.count;
        usage.category = parseCategoryString(largestKey(acc.categoryTotals));
        result.push_back(usage);
    }
    return result;
}

std::vector<HourlyUsage> computeHourlyUsage(const std::vector<ActivitySession> &sessions)
{
    std::map<std::pair<std::string, int>, double> totals;
    for (const auto &session : sessions) {
        totals[{session.appName, localHourOf(session.startTime)}] += session.durationSeconds;
    }

    std::vector<HourlyUsage> rows;
    rows.reserve(totals.size());
    for (const auto &[key, total] : totals) {
        rows.push_back(HourlyUsage{key.first, key.second, total});
    }
    return rows;
}

std::array<double, 24> averageSecondsByHour(const std::vector<ActivitySession> &sessions,
                                            int days)
{
    std::array<double, 24> hours{};
    if (days <= 0) {
        return hours;
    }
    for (const auto &session : sessions) {
        hours[static_cast<size_t>(localHourOf(session.startTime))] += session.durationSeconds;
    }
    for (auto &total : hours) {
        total /= days;
    }
    return hours;
}

} // namespace tracewatch
