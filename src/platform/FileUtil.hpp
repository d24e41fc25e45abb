#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

#include "platform/StringUtil.hpp"

namespace winshot {

inline bool ensureDirectory(const std::string& path, std::string* err) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        if (err) {
            *err = "failed to create directory " + path + ": " + ec.message();
        }
        return false;
    }
    if (!std::filesystem::is_directory(path, ec)) {
        if (err) {
            *err = "not a directory: " + path;
        }
        return false;
    }
    return true;
}

inline bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

inline std::string expandHome(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home && home[0] != '\0') {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

inline std::string absolutePath(const std::string& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    if (ec) {
        return path;
    }
    return abs.lexically_normal().string();
}

// A bare file name: no separators, not "." or "..".
inline bool isPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos;
}

inline std::string fileExtensionLower(const std::string& name) {
    return toLower(std::filesystem::path(name).extension().string());
}

}  // namespace winshot
