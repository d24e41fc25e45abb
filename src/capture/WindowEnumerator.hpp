#pragma once

#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"
#include "desktop/IDesktop.hpp"

namespace winshot {

bool windowMatchesFilter(const TopLevelWindow& window,
                         const std::string& filter);

// Titled windows matching `filter` (case-insensitive, title or process
// name), indexed from 1 in window-manager order.
std::vector<WindowDescriptor> enumerateWindows(IDesktop& desktop,
                                               const std::string& filter = "");

}  // namespace winshot
