#pragma once

#include <string>

#include "capture/CaptureError.hpp"
#include "capture/CaptureRequest.hpp"
#include "capture/CaptureTypes.hpp"
#include "desktop/IDesktop.hpp"

namespace winshot {

// Produces exactly one window for the selector or fails with a
// ResolutionError. A handle is taken as-is; only the live calls made during
// capture find out whether it still names a window.
bool resolveWindow(IDesktop& desktop, const WindowSelector& selector,
                   WindowDescriptor& out, Failure& err);

// AllMonitors resolves to the virtual screen; the others to one monitor's
// bounds.
bool resolveMonitorRegion(IDesktop& desktop, const MonitorSelector& selector,
                          Rect& out, Failure& err);

// Parses the caller's monitor argument: empty or "all", "primary", or a
// decimal ordinal.
bool parseMonitorSelector(const std::string& text, MonitorSelector& out,
                          Failure& err);

bool parseWindowHandle(const std::string& text, WindowHandle& out,
                       Failure& err);

}  // namespace winshot
