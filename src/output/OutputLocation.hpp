#pragma once

#include <optional>
#include <string>

#include "capture/CaptureError.hpp"

namespace winshot {

struct OutputLocation {
    std::string directory;    // absolute, exists once resolved
    std::string outputPath;   // directory + filename
    std::string displayPath;  // what the caller is told
};

// Maps an optional caller folder and a file name onto the local filesystem
// and creates the directory. Without a folder the file goes to
// "<base>/screenshots", base being $WINSHOT_OUTPUT_DIR or the working
// directory.
bool resolveOutputLocation(const std::optional<std::string>& folder,
                           const std::string& filename, OutputLocation& out,
                           Failure& err);

}  // namespace winshot
