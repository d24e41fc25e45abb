#include "capture/MonitorEnumerator.hpp"

#include <algorithm>

#include "platform/Log.hpp"

namespace winshot {

namespace {

bool containsOrigin(const Rect& r) {
    return r.x <= 0 && r.y <= 0 && r.right() > 0 && r.bottom() > 0;
}

void normalizePrimary(std::vector<MonitorDescriptor>& monitors) {
    auto primaries = std::count_if(
        monitors.begin(), monitors.end(),
        [](const MonitorDescriptor& m) { return m.primary; });
    if (primaries == 1) {
        return;
    }
    LOG_DEBUG("monitors: %zu reported primaries, picking one",
              static_cast<size_t>(primaries));
    size_t chosen = 0;
    for (size_t i = 0; i < monitors.size(); ++i) {
        if (containsOrigin(monitors[i].bounds)) {
            chosen = i;
            break;
        }
    }
    for (size_t i = 0; i < monitors.size(); ++i) {
        monitors[i].primary = (i == chosen);
    }
}

}  // namespace

std::vector<MonitorDescriptor> enumerateMonitors(IDesktop& desktop) {
    std::vector<MonitorDescriptor> result;
    for (const auto& reported : desktop.listMonitors()) {
        if (reported.bounds.empty()) {
            continue;
        }
        MonitorDescriptor mon;
        mon.name = reported.name;
        mon.bounds = reported.bounds;
        mon.primary = reported.primary;
        result.push_back(mon);
    }

    if (result.empty()) {
        MonitorDescriptor whole;
        whole.name = "screen";
        whole.bounds = desktop.screenBounds();
        whole.primary = true;
        if (!whole.bounds.empty()) {
            result.push_back(whole);
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const MonitorDescriptor& a, const MonitorDescriptor& b) {
                         if (a.bounds.x != b.bounds.x) {
                             return a.bounds.x < b.bounds.x;
                         }
                         return a.bounds.y < b.bounds.y;
                     });
    for (size_t i = 0; i < result.size(); ++i) {
        result[i].ordinal = static_cast<int>(i) + 1;
    }
    normalizePrimary(result);
    return result;
}

Rect unionOf(const std::vector<MonitorDescriptor>& monitors) {
    bool hasBounds = false;
    int minX = 0;
    int minY = 0;
    int maxX = 0;
    int maxY = 0;
    for (const auto& mon : monitors) {
        if (mon.bounds.empty()) {
            continue;
        }
        if (!hasBounds) {
            minX = mon.bounds.x;
            minY = mon.bounds.y;
            maxX = mon.bounds.right();
            maxY = mon.bounds.bottom();
            hasBounds = true;
            continue;
        }
        minX = std::min(minX, mon.bounds.x);
        minY = std::min(minY, mon.bounds.y);
        maxX = std::max(maxX, mon.bounds.right());
        maxY = std::max(maxY, mon.bounds.bottom());
    }
    if (!hasBounds) {
        return {};
    }
    return Rect{minX, minY, maxX - minX, maxY - minY};
}

Rect virtualScreen(IDesktop& desktop) {
    Rect bounds = unionOf(enumerateMonitors(desktop));
    if (bounds.empty()) {
        bounds = desktop.screenBounds();
    }
    return bounds;
}

}  // namespace winshot
