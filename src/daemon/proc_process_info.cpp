#include "daemon/proc_process_info.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

#include <unistd.h>

namespace tracewatch {

namespace {

std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in) {
        return {};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool isPidName(const std::string &name)
{
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// TASK_COMM_LEN minus the terminating NUL.
constexpr size_t kCommMaxLength = 15;

std::string trimmedLine(std::string value)
{
    while (!value.empty() && (value.back() == '\n' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

// Basename of argv[0] or of the exe link, when it extends a truncated comm.
std::string untruncatedName(const std::filesystem::path &pidDir, const std::string &comm)
{
    const std::string cmdline = readFile(pidDir / "cmdline");
    const std::string argv0 = cmdline.substr(0, cmdline.find('\0'));
    std::vector<std::string> candidates;
    if (!argv0.empty()) {
        candidates.push_back(std::filesystem::path(argv0).filename().string());
    }
    std::error_code ec;
    const auto exe = std::filesystem::read_symlink(pidDir / "exe", ec);
    if (!ec) {
        candidates.push_back(exe.filename().string());
    }
    for (const auto &candidate : candidates) {
        if (candidate.size() > comm.size() && candidate.compare(0, comm.size(), comm) == 0) {
            return candidate;
        }
    }
    return comm;
}

} // namespace

std::string ProcProcessInfoProvider::processName(int64_t pid,
                                                 const std::filesystem::path &procRoot)
{
    if (pid <= 0) {
        return {};
    }
    const std::filesystem::path pidDir = procRoot / std::to_string(pid);
    const std::string comm = trimmedLine(readFile(pidDir / "comm"));
    if (comm.size() < kCommMaxLength) {
        return comm;
    }
    return untruncatedName(pidDir, comm);
}

ProcProcessInfoProvider::ProcProcessInfoProvider(std::filesystem::path procRoot)
    : m_procRoot(std::move(procRoot))
{
    const long pageSize = ::sysconf(_SC_PAGESIZE);
    if (pageSize > 0) {
        m_pageSize = pageSize;
    }
    const long cpus = ::sysconf(_SC_NPROCESSORS_ONLN);
    if (cpus > 0) {
        m_cpuCount = static_cast<int>(cpus);
    }
}

std::optional<ProcStat> ProcProcessInfoProvider::parseStatLine(const std::string &content)
{
    // comm may contain spaces and parentheses; it spans to the last ')'.
    const auto open = content.find('(');
    const auto close = content.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcStat stat;
    stat.comm = content.substr(open + 1, close - open - 1);

    std::istringstream rest(content.substr(close + 1));
    std::vector<std::string> fields;
    std::string token;
    while (rest >> token) {
        fields.push_back(token);
    }
    // fields[0] is field 3 (state) of proc(5).
    if (fields.size() < 22) {
        return std::nullopt;
    }

    try {
        stat.state = fields[0].empty() ? '?' : fields[0][0];
        stat.utime = std::stoull(fields[11]);
        stat.stime = std::stoull(fields[12]);
        stat.threads = std::stoi(fields[17]);
        stat.rssPages = std::stoll(fields[21]);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    return stat;
}

std::string ProcProcessInfoProvider::statusName(char state)
{
    switch (state) {
    case 'R':
        return "running";
    case 'S':
        return "sleeping";
    case 'D':
        return "disk-sleep";
    case 'Z':
        return "zombie";
    case 'T':
    case 't':
        return "stopped";
    case 'I':
        return "idle";
    default:
        return "unknown";
    }
}

std::optional<uint64_t> ProcProcessInfoProvider::readTotalCpuTicks(uint64_t *idleTicks) const
{
    std::ifstream in(m_procRoot / "stat");
    std::string label;
    if (!in || !(in >> label) || label != "cpu") {
        return std::nullopt;
    }

    uint64_t total = 0;
    uint64_t value = 0;
    int index = 0;
    uint64_t idle = 0;
    while (index < 10 && in >> value) {
        total += value;
        // idle and iowait
        if (index == 3 || index == 4) {
            idle += value;
        }
        ++index;
    }
    if (index < 4) {
        return std::nullopt;
    }
    if (idleTicks) {
        *idleTicks = idle;
    }
    return total;
}

std::optional<ProcessResource> ProcProcessInfoProvider::readProcess(int64_t pid,
                                                                    uint64_t totalTicks)
{
    const std::string content = readFile(m_procRoot / std::to_string(pid) / "stat");
    if (content.empty()) {
        m_lastPerPid.erase(pid);
        return std::nullopt;
    }
    const auto stat = parseStatLine(content);
    if (!stat) {
        return std::nullopt;
    }

    ProcessResource resource;
    resource.pid = pid;
    resource.name = stat->comm.size() < kCommMaxLength
        ? stat->comm
        : untruncatedName(m_procRoot / std::to_string(pid), stat->comm);
    resource.threads = stat->threads;
    resource.status = statusName(stat->state);
    resource.memoryBytes = stat->rssPages > 0
        ? static_cast<uint64_t>(stat->rssPages) * static_cast<uint64_t>(m_pageSize)
        : 0;

    const uint64_t processTicks = stat->utime + stat->stime;
    auto it = m_lastPerPid.find(pid);
    if (it != m_lastPerPid.end() && totalTicks > it->second.totalTicks
        && processTicks >= it->second.processTicks) {
        const double processDelta = static_cast<double>(processTicks - it->second.processTicks);
        const double totalDelta = static_cast<double>(totalTicks - it->second.totalTicks);
        resource.cpuPercent = processDelta / totalDelta * m_cpuCount * 100.0;
    }
    m_lastPerPid[pid] = CpuSample{processTicks, totalTicks};
    return resource;
}

std::optional<ProcessResource> ProcProcessInfoProvider::resource(int64_t pid)
{
    if (pid <= 0) {
        return std::nullopt;
    }
    const auto total = readTotalCpuTicks();
    return readProcess(pid, total.value_or(0));
}

std::vector<ProcessResource> ProcProcessInfoProvider::snapshotAll()
{
    std::vector<ProcessResource> processes;
    const uint64_t total = readTotalCpuTicks().value_or(0);

    std::error_code ec;
    std::filesystem::directory_iterator it(m_procRoot, ec);
    if (ec) {
        return processes;
    }

    std::unordered_set<int64_t> seen;
    for (const auto &entry : it) {
        const std::string name = entry.path().filename().string();
        if (!isPidName(name)) {
            continue;
        }
        const int64_t pid = std::stoll(name);
        auto process = readProcess(pid, total);
        if (!process) {
            continue;
        }
        seen.insert(pid);
        // Kernel threads have no resident memory of their own.
        if (process->memoryBytes == 0) {
            continue;
        }
        processes.push_back(std::move(*process));
    }

    for (auto cached = m_lastPerPid.begin(); cached != m_lastPerPid.end();) {
        if (seen.count(cached->first) == 0) {
            cached = m_lastPerPid.erase(cached);
        } else {
            ++cached;
        }
    }
    return processes;
}

std::optional<SystemUsage> ProcProcessInfoProvider::systemUsage()
{
    std::ifstream meminfo(m_procRoot / "meminfo");
    if (!meminfo) {
        return std::nullopt;
    }

    uint64_t totalKb = 0;
    uint64_t availableKb = 0;
    bool haveAvailable = false;
    std::string key;
    uint64_t value = 0;
    std::string unit;
    std::string line;
    while (std::getline(meminfo, line)) {
        std::istringstream fields(line);
        if (!(fields >> key >> value)) {
            continue;
        }
        if (key == "MemTotal:") {
            totalKb = value;
        } else if (key == "MemAvailable:") {
            availableKb = value;
            haveAvailable = true;
        }
    }
    if (totalKb == 0 || !haveAvailable) {
        return std::nullopt;
    }

    SystemUsage usage;
    usage.cpuCount = m_cpuCount;
    usage.totalMemoryBytes = totalKb * 1024;
    usage.usedMemoryBytes = (totalKb - std::min(availableKb, totalKb)) * 1024;
    usage.memoryPercent = static_cast<double>(usage.usedMemoryBytes) * 100.0
        / static_cast<double>(usage.totalMemoryBytes);

    uint64_t idle = 0;
    const auto total = readTotalCpuTicks(&idle);
    if (total) {
        if (m_lastSystemTotal > 0 && *total > m_lastSystemTotal && idle >= m_lastSystemIdle) {
            const double totalDelta = static_cast<double>(*total - m_lastSystemTotal);
            const double idleDelta = static_cast<double>(idle - m_lastSystemIdle);
            usage.cpuPercent = (1.0 - idleDelta / totalDelta) * 100.0;
        }
        m_lastSystemTotal = *total;
        m_lastSystemIdle = idle;
    }
    return usage;
}

} // namespace tracewatch
