#pragma once

#include <array>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tracewatch {

bool isProductiveCategory(ActivityCategory category);
bool isDistractionCategory(ActivityCategory category);

// Pure functions of a date's sessions. Ties on duration are broken by the
// lexicographically smaller name so the result never depends on row order.
DailyAggregate computeDailyAggregate(const std::string &date,
                                     const std::vector<ActivitySession> &sessions);

// One entry per app, sorted by app name.
std::vector<AppUsageAggregate> computeAppUsage(const std::string &date,
                                               const std::vector<ActivitySession> &sessions);

// Session seconds per (app, local start hour), sorted by app then hour.
std::vector<HourlyUsage> computeHourlyUsage(const std::vector<ActivitySession> &sessions);

// Average seconds per local start hour over a window of days.
std::array<double, 24> averageSecondsByHour(const std::vector<ActivitySession> &sessions,
                                            int days);

} // namespace tracewatch
