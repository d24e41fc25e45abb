#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"

namespace winshot {

// Raw window record as reported by the windowing system, before filtering
// and index assignment.
struct TopLevelWindow {
    WindowHandle handle = 0;
    std::string title;
    std::string processName;
    std::uint32_t pid = 0;
    WindowState state = WindowState::Normal;
};

struct ReportedMonitor {
    std::string name;
    Rect bounds;
    bool primary = false;
};

// Typed primitives over one connection to the desktop. Every call reports
// success explicitly; nothing is parsed from text.
class IDesktop {
public:
    virtual ~IDesktop() = default;
    virtual std::string name() const = 0;

    // Managed top-level windows in window-manager order, untitled included.
    virtual std::vector<TopLevelWindow> listTopLevelWindows() = 0;
    virtual std::vector<ReportedMonitor> listMonitors() = 0;
    virtual Rect screenBounds() = 0;

    virtual std::optional<WindowState> windowState(WindowHandle window) = 0;
    // Outer rectangle in root coordinates, window-manager frame included.
    virtual std::optional<Rect> windowRect(WindowHandle window) = 0;

    virtual WindowHandle foregroundWindow() = 0;
    virtual bool setForeground(WindowHandle window) = 0;
    virtual bool minimize(WindowHandle window) = 0;
    virtual bool unminimize(WindowHandle window) = 0;

    // Renders the window's own pixels into `out`, sized to `bounds`, with the
    // window placed at its position relative to `bounds`. Does not touch
    // focus or stacking. Returns false whenever the result could contain
    // other windows' pixels, e.g. when no compositor keeps an off-screen copy.
    virtual bool composeWindow(WindowHandle window, const Rect& bounds,
                               ImageRGBA& out) = 0;
    // Copies what is currently on screen inside `region`.
    virtual bool copyScreenRegion(const Rect& region, ImageRGBA& out) = 0;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

}  // namespace winshot
