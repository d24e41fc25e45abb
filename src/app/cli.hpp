#pragma once

#include <ostream>
#include <string>

#include "app/ScreenshotService.hpp"

namespace winshot {

enum class Command { None, ListWindows, ListMonitors, Screenshot };

struct CliOptions {
    Command command = Command::None;
    bool debug = false;
    bool help = false;
    ListWindowsArgs listWindows;
    TakeScreenshotArgs screenshot;
};

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err);
void printUsage(std::ostream& os, const char* exe);

}  // namespace winshot
