#pragma once

#include <optional>
#include <string>
#include <variant>

#include "capture/CaptureTypes.hpp"

namespace winshot {

struct ByHandle {
    WindowHandle handle = 0;
};

struct ByIndex {
    int index = 0;
};

struct ByTitle {
    std::string title;
};

struct ByProcess {
    std::string processName;
};

// Exactly one way of picking a window. `filter` narrows the enumeration
// used by the index, title and process cases; a handle ignores it.
struct WindowSelector {
    std::variant<ByHandle, ByIndex, ByTitle, ByProcess> target;
    std::string filter;
};

struct AllMonitors {};

struct PrimaryMonitor {};

struct MonitorOrdinal {
    int ordinal = 0;
};

using MonitorSelector = std::variant<AllMonitors, PrimaryMonitor, MonitorOrdinal>;

struct CaptureOptions {
    bool allowFocus = false;
    bool restoreIfMinimized = false;
};

struct CaptureRequest {
    std::variant<MonitorSelector, WindowSelector> target;
    CaptureOptions options;
    std::string filename = "screenshot.png";
    std::optional<std::string> folder;
};

}  // namespace winshot
