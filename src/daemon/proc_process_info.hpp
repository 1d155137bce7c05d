#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "daemon/process_info.hpp"

namespace tracewatch {

struct ProcStat {
    std::string comm;
    char state = '?';
    uint64_t utime = 0;
    uint64_t stime = 0;
    int threads = 0;
    int64_t rssPages = 0;
};

// /proc scanner. The root is injectable so tests can point it at a fixture tree.
class ProcProcessInfoProvider : public ProcessInfoProvider {
public:
    explicit ProcProcessInfoProvider(std::filesystem::path procRoot = "/proc");

    std::optional<ProcessResource> resource(int64_t pid) override;
    std::vector<ProcessResource> snapshotAll() override;
    std::optional<SystemUsage> systemUsage() override;

    static std::optional<ProcStat> parseStatLine(const std::string &content);
    static std::string statusName(char state);
    // Name from <pid>/comm. The kernel cuts comm at 15 characters, so a name
    // of that length is completed from argv[0] or the exe link.
    static std::string processName(int64_t pid,
                                   const std::filesystem::path &procRoot = "/proc");

private:
    struct CpuSample {
        uint64_t processTicks = 0;
        uint64_t totalTicks = 0;
    };

    std::optional<uint64_t> readTotalCpuTicks(uint64_t *idleTicks = nullptr) const;
    std::optional<ProcessResource> readProcess(int64_t pid, uint64_t totalTicks);

    std::filesystem::path m_procRoot;
    std::unordered_map<int64_t, CpuSample> m_lastPerPid;
    uint64_t m_lastSystemTotal = 0;
    uint64_t m_lastSystemIdle = 0;
    long m_pageSize = 4096;
    int m_cpuCount = 1;
};

} // namespace tracewatch
