#include "output/ImageWriter.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"

namespace winshot {

namespace {

constexpr int kJpegQuality = 90;

}  // namespace

ImageFormat imageFormatForPath(const std::string& path) {
    std::string ext = fileExtensionLower(path);
    if (ext == ".bmp") {
        return ImageFormat::Bmp;
    }
    if (ext == ".jpg" || ext == ".jpeg") {
        return ImageFormat::Jpeg;
    }
    if (ext == ".tga") {
        return ImageFormat::Tga;
    }
    return ImageFormat::Png;
}

bool writeImage(const std::string& path, const ImageRGBA& image,
                Failure& err) {
    if (image.w <= 0 || image.h <= 0 ||
        image.rgba.size() !=
            static_cast<size_t>(image.w) * static_cast<size_t>(image.h) * 4u) {
        return fail(err, ErrorKind::IO, "write",
                    "Refusing to write an empty or malformed image");
    }

    const void* pixels = image.rgba.data();
    int ok = 0;
    switch (imageFormatForPath(path)) {
        case ImageFormat::Png:
            ok = stbi_write_png(path.c_str(), image.w, image.h, 4, pixels,
                                image.w * 4);
            break;
        case ImageFormat::Bmp:
            ok = stbi_write_bmp(path.c_str(), image.w, image.h, 4, pixels);
            break;
        case ImageFormat::Jpeg:
            ok = stbi_write_jpg(path.c_str(), image.w, image.h, 4, pixels,
                                kJpegQuality);
            break;
        case ImageFormat::Tga:
            ok = stbi_write_tga(path.c_str(), image.w, image.h, 4, pixels);
            break;
    }
    if (!ok) {
        return fail(err, ErrorKind::IO, "write",
                    "Failed to encode image to " + path);
    }
    if (!fileExists(path)) {
        return fail(err, ErrorKind::IO, "write",
                    "Image reported written but " + path + " is missing");
    }
    LOG_DEBUG("wrote %dx%d image to %s", image.w, image.h, path.c_str());
    return true;
}

}  // namespace winshot
