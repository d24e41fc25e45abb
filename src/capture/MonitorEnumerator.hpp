#pragma once

#include <vector>

#include "capture/CaptureTypes.hpp"
#include "desktop/IDesktop.hpp"

namespace winshot {

// Monitors sorted left to right (then top to bottom) with ordinals from 1
// and exactly one primary. Recomputed on every call.
std::vector<MonitorDescriptor> enumerateMonitors(IDesktop& desktop);

// Bounding box of all monitors; the screen size when none are reported.
Rect virtualScreen(IDesktop& desktop);
Rect unionOf(const std::vector<MonitorDescriptor>& monitors);

}  // namespace winshot
