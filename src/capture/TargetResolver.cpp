#include "capture/TargetResolver.hpp"

#include <vector>

#include "capture/MonitorEnumerator.hpp"
#include "capture/WindowEnumerator.hpp"
#include "platform/Log.hpp"
#include "platform/StringUtil.hpp"

namespace winshot {

namespace {

constexpr const char* kStage = "resolve";

bool pickByIndex(IDesktop& desktop, const ByIndex& sel,
                 const std::string& filter, WindowDescriptor& out,
                 Failure& err) {
    auto windows = enumerateWindows(desktop, filter);
    int count = static_cast<int>(windows.size());
    if (sel.index < 1 || sel.index > count) {
        return fail(err, ErrorKind::Resolution, kStage,
                    "Invalid windowNumber: " + std::to_string(sel.index) +
                        ". Available: 1.." + std::to_string(count));
    }
    out = windows[static_cast<size_t>(sel.index - 1)];
    return true;
}

bool pickByTitle(IDesktop& desktop, const ByTitle& sel,
                 const std::string& filter, WindowDescriptor& out,
                 Failure& err) {
    for (const auto& window : enumerateWindows(desktop, filter)) {
        if (containsIgnoreCase(window.title, sel.title)) {
            out = window;
            return true;
        }
    }
    return fail(err, ErrorKind::Resolution, kStage,
                "No window found with title containing: " + sel.title);
}

bool pickByProcess(IDesktop& desktop, const ByProcess& sel,
                   const std::string& filter, WindowDescriptor& out,
                   Failure& err) {
    std::string search = stripExeSuffix(sel.processName);
    for (const auto& window : enumerateWindows(desktop, filter)) {
        if (containsIgnoreCase(window.processName, search)) {
            out = window;
            return true;
        }
    }
    return fail(err, ErrorKind::Resolution, kStage,
                "No window found for process: " + sel.processName);
}

}  // namespace

bool resolveWindow(IDesktop& desktop, const WindowSelector& selector,
                   WindowDescriptor& out, Failure& err) {
    bool ok = false;
    if (const auto* byHandle = std::get_if<ByHandle>(&selector.target)) {
        if (byHandle->handle == 0) {
            return fail(err, ErrorKind::Resolution, kStage,
                        "No target window resolved");
        }
        out = WindowDescriptor{};
        out.handle = byHandle->handle;
        ok = true;
    } else if (const auto* byIndex = std::get_if<ByIndex>(&selector.target)) {
        ok = pickByIndex(desktop, *byIndex, selector.filter, out, err);
    } else if (const auto* byTitle = std::get_if<ByTitle>(&selector.target)) {
        ok = pickByTitle(desktop, *byTitle, selector.filter, out, err);
    } else {
        ok = pickByProcess(desktop, std::get<ByProcess>(selector.target),
                           selector.filter, out, err);
    }
    if (ok) {
        LOG_DEBUG("resolved window %s '%s' (%s)",
                  formatHandle(out.handle).c_str(), out.title.c_str(),
                  out.processName.c_str());
    }
    return ok;
}

bool resolveMonitorRegion(IDesktop& desktop, const MonitorSelector& selector,
                          Rect& out, Failure& err) {
    if (std::holds_alternative<AllMonitors>(selector)) {
        out = virtualScreen(desktop);
        if (out.empty()) {
            return fail(err, ErrorKind::Resolution, kStage,
                        "No monitors available");
        }
        return true;
    }

    auto monitors = enumerateMonitors(desktop);
    if (std::holds_alternative<PrimaryMonitor>(selector)) {
        for (const auto& mon : monitors) {
            if (mon.primary) {
                out = mon.bounds;
                return true;
            }
        }
        return fail(err, ErrorKind::Resolution, kStage,
                    "No primary monitor available");
    }

    int ordinal = std::get<MonitorOrdinal>(selector).ordinal;
    int count = static_cast<int>(monitors.size());
    if (ordinal < 1 || ordinal > count) {
        return fail(err, ErrorKind::Resolution, kStage,
                    "Monitor " + std::to_string(ordinal) +
                        " not found. Available monitors: 1 to " +
                        std::to_string(count));
    }
    out = monitors[static_cast<size_t>(ordinal - 1)].bounds;
    return true;
}

bool parseMonitorSelector(const std::string& text, MonitorSelector& out,
                          Failure& err) {
    std::string lower = toLower(text);
    if (lower.empty() || lower == "all") {
        out = AllMonitors{};
        return true;
    }
    if (lower == "primary") {
        out = PrimaryMonitor{};
        return true;
    }
    std::uint64_t value = 0;
    if (text.find_first_not_of("0123456789") == std::string::npos &&
        parseUnsigned(text, value) && value <= 1000000u) {
        out = MonitorOrdinal{static_cast<int>(value)};
        return true;
    }
    return fail(err, ErrorKind::Resolution, kStage,
                "Invalid monitor parameter: " + text);
}

bool parseWindowHandle(const std::string& text, WindowHandle& out,
                       Failure& err) {
    std::uint64_t value = 0;
    if (!parseUnsigned(text, value)) {
        return fail(err, ErrorKind::Resolution, kStage,
                    "Invalid windowHandle: " + text +
                        " (expected hex like 0x04000007 or decimal)");
    }
    out = value;
    return true;
}

}  // namespace winshot
