#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace winshot {

// Executable base name of `pid`. /proc/<pid>/comm is cut at 15 characters,
// so it is only used when the exe link cannot be read (other users' processes).
inline std::string processName(std::uint32_t pid) {
    if (pid == 0) {
        return {};
    }
    const std::string procDir = "/proc/" + std::to_string(pid);

    std::error_code ec;
    std::filesystem::path exe =
        std::filesystem::read_symlink(procDir + "/exe", ec);
    if (!ec) {
        std::string name = exe.filename().string();
        const std::string deleted = " (deleted)";
        if (name.size() > deleted.size() &&
            name.compare(name.size() - deleted.size(), deleted.size(),
                         deleted) == 0) {
            name.erase(name.size() - deleted.size());
        }
        if (!name.empty()) {
            return name;
        }
    }

    std::ifstream comm(procDir + "/comm");
    std::string name;
    if (!comm || !std::getline(comm, name)) {
        return {};
    }
    while (!name.empty() && (name.back() == '\n' || name.back() == ' ')) {
        name.pop_back();
    }
    return name;
}

}  // namespace winshot
