#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace tracewatch {

class PeriodicTask;
class ProcessInfoProvider;
class TraceStore;

// Periodic system and per-process telemetry. Each tick stores the top-N
// processes by resident memory in one batched write and keeps the latest
// readings for live display.
class ResourceSampler
{
public:
    ResourceSampler(TraceStore &store, ProcessInfoProvider &processInfo, SamplerConfig config = {});
    ~ResourceSampler();

    // The first sample is taken immediately.
    void start();
    void stop();
    bool isRunning() const;

    // Throws std::runtime_error when the batch cannot be stored.
    void sampleOnce(std::chrono::system_clock::time_point now);

    const std::optional<SystemUsage> &latestSystemUsage() const;
    const std::vector<ProcessResource> &latestProcesses() const;

private:
    TraceStore &m_store;
    ProcessInfoProvider &m_processInfo;
    SamplerConfig m_config;

    std::optional<SystemUsage> m_latestSystem;
    std::vector<ProcessResource> m_latestProcesses;
    std::unique_ptr<PeriodicTask> m_task;
};

} // namespace tracewatch
