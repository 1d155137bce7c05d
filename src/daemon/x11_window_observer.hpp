#pragma once

#include <memory>
#include <optional>
#include <string>

#include "daemon/window_observer.hpp"

namespace tracewatch {

// EWMH-based observer: _NET_ACTIVE_WINDOW on the root window, the title from
// _NET_WM_NAME (falling back to WM_NAME) and the process from _NET_WM_PID.
// The app name is the process name of that pid, or the WM_CLASS instance when
// the window carries no pid.
class X11WindowObserver : public WindowObserver {
public:
    X11WindowObserver();
    ~X11WindowObserver() override;

    X11WindowObserver(const X11WindowObserver &) = delete;
    X11WindowObserver &operator=(const X11WindowObserver &) = delete;

    // Opens the display named by $DISPLAY. Returns false when no X server
    // is reachable; currentWindow() then always yields std::nullopt.
    bool open();
    bool isOpen() const;

    std::optional<ForegroundWindow> currentWindow() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace tracewatch
