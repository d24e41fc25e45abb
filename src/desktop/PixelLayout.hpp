#pragma once

#include <cstddef>
#include <cstdint>

#include "capture/CaptureTypes.hpp"

namespace winshot {

struct ChannelMasks {
    unsigned long red = 0;
    unsigned long green = 0;
    unsigned long blue = 0;

    bool empty() const {
        return red == 0 && green == 0 && blue == 0;
    }
};

// Shift and range of each colour channel inside a TrueColor pixel.
struct PixelLayout {
    ChannelMasks masks;
    int redShift = 0;
    int greenShift = 0;
    int blueShift = 0;
    unsigned long redMax = 0;
    unsigned long greenMax = 0;
    unsigned long blueMax = 0;
};

PixelLayout makePixelLayout(const ChannelMasks& masks);

// GetImage on a pixmap reports no visual, so the image masks come back zero.
// The drawable's visual supplies them in that case.
PixelLayout pixelLayoutFor(const ChannelMasks& imageMasks,
                           const ChannelMasks& visualMasks);

void pixelToRgba(unsigned long pixel, const PixelLayout& layout,
                 std::uint8_t* rgba);

// Converts a width x height source into RGBA, written at (dstX, dstY) of
// `out`. Pixels falling outside `out` are dropped.
template <typename GetPixel>
void blitPixels(int width, int height, GetPixel getPixel,
                const PixelLayout& layout, ImageRGBA& out, int dstX,
                int dstY) {
    for (int iy = 0; iy < height; ++iy) {
        int oy = dstY + iy;
        if (oy < 0 || oy >= out.h) {
            continue;
        }
        for (int ix = 0; ix < width; ++ix) {
            int ox = dstX + ix;
            if (ox < 0 || ox >= out.w) {
                continue;
            }
            size_t idx = (static_cast<size_t>(oy) * static_cast<size_t>(out.w) +
                          static_cast<size_t>(ox)) *
                         4u;
            pixelToRgba(getPixel(ix, iy), layout, &out.rgba[idx]);
        }
    }
}

}  // namespace winshot
