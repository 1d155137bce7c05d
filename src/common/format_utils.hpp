#pragma once

#include <cmath>
#include <cstdio>
#include <string>

namespace tracewatch {

// "42s", "3m 5s" below an hour, "2h 14m" above.
inline std::string formatDuration(double seconds)
{
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    char buffer[64];
    if (seconds < 60.0) {
        std::snprintf(buffer, sizeof(buffer), "%lds", std::lround(seconds));
        return buffer;
    }
    if (seconds < 3600.0) {
        const long minutes = static_cast<long>(seconds / 60.0);
        const long rest = std::lround(std::fmod(seconds, 60.0));
        std::snprintf(buffer, sizeof(buffer), "%ldm %lds", minutes, rest);
        return buffer;
    }
    const long hours = static_cast<long>(seconds / 3600.0);
    const long minutes = static_cast<long>(std::fmod(seconds, 3600.0) / 60.0);
    std::snprintf(buffer, sizeof(buffer), "%ldh %ldm", hours, minutes);
    return buffer;
}

inline std::string formatMemory(double megabytes)
{
    char buffer[64];
    if (megabytes < 1.0) {
        std::snprintf(buffer, sizeof(buffer), "%.0f KB", megabytes * 1024.0);
    } else if (megabytes < 1024.0) {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB", megabytes);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.2f GB", megabytes / 1024.0);
    }
    return buffer;
}

inline std::string formatPercent(double value, int decimals = 1)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.*f%%", decimals, value);
    return buffer;
}

} // namespace tracewatch
