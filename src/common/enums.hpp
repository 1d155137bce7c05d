#pragma once

namespace tracewatch {

enum class ActivityCategory {
    Development,
    Browsing,
    Research,
    Communication,
    Productivity,
    Distraction,
    Other
};

enum class FocusStatus {
    WaitingForContext,
    Focused,
    Distracted,
    Neutral
};

enum class PomodoroPhase {
    None,
    Work,
    Break
};

} // namespace tracewatch
