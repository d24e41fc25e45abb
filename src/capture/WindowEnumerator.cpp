#include "capture/WindowEnumerator.hpp"

#include <utility>

#include "platform/Log.hpp"
#include "platform/StringUtil.hpp"

namespace winshot {

bool windowMatchesFilter(const TopLevelWindow& window,
                         const std::string& filter) {
    if (filter.empty()) {
        return true;
    }
    return containsIgnoreCase(window.title, filter) ||
           containsIgnoreCase(window.processName, filter);
}

std::vector<WindowDescriptor> enumerateWindows(IDesktop& desktop,
                                               const std::string& filter) {
    std::vector<WindowDescriptor> result;
    auto windows = desktop.listTopLevelWindows();
    for (const auto& window : windows) {
        if (window.title.empty()) {
            continue;
        }
        if (!windowMatchesFilter(window, filter)) {
            continue;
        }
        WindowDescriptor desc;
        desc.handle = window.handle;
        desc.title = window.title;
        desc.processName = window.processName;
        desc.pid = window.pid;
        desc.state = window.state;
        desc.index = static_cast<int>(result.size()) + 1;
        result.push_back(std::move(desc));
    }
    LOG_DEBUG("enumerated %zu of %zu windows (filter '%s')", result.size(),
              windows.size(), filter.c_str());
    return result;
}

}  // namespace winshot
