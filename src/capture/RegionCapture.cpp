#include "capture/RegionCapture.hpp"

#include <string>

#include "platform/Log.hpp"

namespace winshot {

bool captureRegion(IDesktop& desktop, const Rect& region, ImageRGBA& out,
                   Failure& err) {
    if (region.empty()) {
        return fail(err, ErrorKind::Capture, "capture-region",
                    "Capture region is empty");
    }
    LOG_DEBUG("region capture %d,%d %dx%d on %s", region.x, region.y,
              region.w, region.h, desktop.name().c_str());
    if (!desktop.copyScreenRegion(region, out)) {
        return fail(err, ErrorKind::Capture, "capture-region",
                    "Screen copy of " + std::to_string(region.w) + "x" +
                        std::to_string(region.h) + " at " +
                        std::to_string(region.x) + "," +
                        std::to_string(region.y) + " failed");
    }
    if (out.w != region.w || out.h != region.h) {
        return fail(err, ErrorKind::Capture, "capture-region",
                    "Screen copy returned " + std::to_string(out.w) + "x" +
                        std::to_string(out.h) + ", expected " +
                        std::to_string(region.w) + "x" +
                        std::to_string(region.h));
    }
    return true;
}

}  // namespace winshot
