#pragma once

#include <string>

#include "capture/CaptureError.hpp"
#include "capture/CaptureTypes.hpp"

namespace winshot {

enum class ImageFormat { Png, Bmp, Jpeg, Tga };

// By file extension; anything unrecognised is written as PNG.
ImageFormat imageFormatForPath(const std::string& path);

bool writeImage(const std::string& path, const ImageRGBA& image,
                Failure& err);

}  // namespace winshot
