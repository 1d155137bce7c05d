#include "daemon/resource_sampler.hpp"

#include <algorithm>

#include "common/logging.hpp"
#include "common/periodic_task.hpp"
#include "daemon/process_info.hpp"
#include "daemon/tracewatch_store.hpp"

namespace tracewatch {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

} // namespace

ResourceSampler::ResourceSampler(TraceStore &store,
                                 ProcessInfoProvider &processInfo,
                                 SamplerConfig config)
    : m_store(store)
    , m_processInfo(processInfo)
    , m_config(config)
{
}

ResourceSampler::~ResourceSampler() = default;

void ResourceSampler::start()
{
    if (!m_task) {
        m_task = std::make_unique<PeriodicTask>(
            QStringLiteral("resource-sampler"),
            std::chrono::milliseconds(m_config.intervalMs),
            [this]() { sampleOnce(std::chrono::system_clock::now()); });
    }
    m_task->start(true);
}

void ResourceSampler::stop()
{
    if (m_task) {
        m_task->stop();
    }
}

bool ResourceSampler::isRunning() const
{
    return m_task && m_task->isActive();
}

void ResourceSampler::sampleOnce(std::chrono::system_clock::time_point now)
{
    m_latestSystem = m_processInfo.systemUsage();

    std::vector<ProcessResource> processes = m_processInfo.snapshotAll();
    std::sort(processes.begin(), processes.end(),
              [](const ProcessResource &a, const ProcessResource &b) {
                  if (a.memoryBytes != b.memoryBytes) {
                      return a.memoryBytes > b.memoryBytes;
                  }
                  return a.pid < b.pid;
              });
    if (processes.size() > static_cast<size_t>(m_config.topN)) {
        processes.resize(static_cast<size_t>(m_config.topN));
    }
    m_latestProcesses = processes;

    std::vector<ProcessSnapshot> snapshots;
    snapshots.reserve(processes.size());
    for (const auto &process : processes) {
        ProcessSnapshot snapshot;
        snapshot.timestamp = now;
        snapshot.appName = process.name;
        snapshot.pid = process.pid;
        snapshot.memoryMb = static_cast<double>(process.memoryBytes) / kBytesPerMb;
        snapshot.cpuPercent = process.cpuPercent;
        snapshot.status = process.status;
        snapshot.threads = process.threads;
        snapshots.push_back(std::move(snapshot));
    }
    m_store.addProcessSnapshots(snapshots);

    TWLOG_DEBUG(QStringLiteral("ResourceSampler"),
                QStringLiteral("sampleOnce"),
                QStringLiteral("sample_stored"),
                QStringLiteral("periodic"),
                QStringLiteral("batched_insert"),
                ::tracewatch::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"processes", snapshots.size()},
                                {"memoryPercent",
                                 m_latestSystem ? m_latestSystem->memoryPercent : 0.0}}));
}

const std::optional<SystemUsage> &ResourceSampler::latestSystemUsage() const
{
    return m_latestSystem;
}

const std::vector<ProcessResource> &ResourceSampler::latestProcesses() const
{
    return m_latestProcesses;
}

} // namespace tracewatch
