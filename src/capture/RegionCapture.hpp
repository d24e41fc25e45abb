#pragma once

#include "capture/CaptureError.hpp"
#include "capture/CaptureTypes.hpp"
#include "desktop/IDesktop.hpp"

namespace winshot {

// Straight screen copy of `region`; the image is exactly region.w x region.h.
bool captureRegion(IDesktop& desktop, const Rect& region, ImageRGBA& out,
                   Failure& err);

}  // namespace winshot
