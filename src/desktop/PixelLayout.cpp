#include "desktop/PixelLayout.hpp"

namespace winshot {

namespace {

int lowestBit(unsigned long mask) {
    return mask ? __builtin_ctzl(mask) : 0;
}

std::uint8_t scaleChannel(unsigned long value, unsigned long max) {
    return static_cast<std::uint8_t>(max ? (value * 255ul / max) : 0);
}

}  // namespace

PixelLayout makePixelLayout(const ChannelMasks& masks) {
    PixelLayout layout;
    layout.masks = masks;
    layout.redShift = lowestBit(masks.red);
    layout.greenShift = lowestBit(masks.green);
    layout.blueShift = lowestBit(masks.blue);
    layout.redMax = masks.red >> layout.redShift;
    layout.greenMax = masks.green >> layout.greenShift;
    layout.blueMax = masks.blue >> layout.blueShift;
    return layout;
}

PixelLayout pixelLayoutFor(const ChannelMasks& imageMasks,
                           const ChannelMasks& visualMasks) {
    return makePixelLayout(imageMasks.empty() ? visualMasks : imageMasks);
}

void pixelToRgba(unsigned long pixel, const PixelLayout& layout,
                 std::uint8_t* rgba) {
    rgba[0] = scaleChannel((pixel & layout.masks.red) >> layout.redShift,
                           layout.redMax);
    rgba[1] = scaleChannel((pixel & layout.masks.green) >> layout.greenShift,
                           layout.greenMax);
    rgba[2] = scaleChannel((pixel & layout.masks.blue) >> layout.blueShift,
                           layout.blueMax);
    rgba[3] = 255;
}

}  // namespace winshot
