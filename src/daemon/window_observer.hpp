#pragma once

#include <optional>

#include "common/models.hpp"

namespace tracewatch {

// Foreground window introspection. Implementations return std::nullopt when
// no window has focus or the platform query fails.
class WindowObserver {
public:
    virtual ~WindowObserver() = default;

    virtual std::optional<ForegroundWindow> currentWindow() = 0;
};

} // namespace tracewatch
