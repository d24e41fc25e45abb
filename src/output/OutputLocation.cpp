#include "output/OutputLocation.hpp"

#include <cstdlib>
#include <filesystem>

#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"

namespace winshot {

namespace {

constexpr const char* kStage = "output";

std::string defaultBase() {
    const char* base = std::getenv("WINSHOT_OUTPUT_DIR");
    if (base && base[0] != '\0') {
        return expandHome(base);
    }
    return ".";
}

}  // namespace

bool resolveOutputLocation(const std::optional<std::string>& folder,
                           const std::string& filename, OutputLocation& out,
                           Failure& err) {
    if (!isPlainFileName(filename)) {
        return fail(err, ErrorKind::IO, kStage,
                    "Invalid filename: " + filename +
                        " (use the folder option for directories)");
    }

    std::string directory;
    if (folder && !folder->empty()) {
        directory = absolutePath(expandHome(*folder));
        std::string shown = *folder;
        while (shown.size() > 1 && shown.back() == '/') {
            shown.pop_back();
        }
        out.displayPath = shown + "/" + filename;
    } else {
        directory = absolutePath(
            (std::filesystem::path(defaultBase()) / "screenshots").string());
        out.displayPath = "screenshots/" + filename;
    }

    std::string why;
    if (!ensureDirectory(directory, &why)) {
        return fail(err, ErrorKind::IO, kStage, why);
    }
    out.directory = directory;
    out.outputPath = (std::filesystem::path(directory) / filename).string();
    LOG_DEBUG("output: %s", out.outputPath.c_str());
    return true;
}

}  // namespace winshot
