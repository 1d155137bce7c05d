#pragma once

#include <optional>
#include <vector>

#include "common/models.hpp"

namespace tracewatch {

// Process and system telemetry. CPU percentages are relative to one core and
// are computed from the delta since the previous observation of the same
// pid, so the first reading of a process reports 0.
class ProcessInfoProvider {
public:
    virtual ~ProcessInfoProvider() = default;

    virtual std::optional<ProcessResource> resource(int64_t pid) = 0;
    virtual std::vector<ProcessResource> snapshotAll() = 0;
    virtual std::optional<SystemUsage> systemUsage() = 0;
};

} // namespace tracewatch
