#include "app/cli.hpp"

#include "platform/StringUtil.hpp"

namespace winshot {

void printUsage(std::ostream& os, const char* exe) {
    os << "Usage: " << exe << " [--debug] <command> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  list-windows           List capturable windows, numbered from 1\n"
       << "    --filter <text>      Only windows whose title or process "
          "contains text\n"
       << "    --format <fmt>       simple (default) or detailed (pid, "
          "handle, state)\n"
       << "  list-monitors          List monitors, left to right\n"
       << "  screenshot             Capture the screen, a monitor or a "
          "window\n"
       << "    --filename <name>    Output file name (default: "
          "screenshot.png)\n"
       << "    --folder <dir>       Output folder (default: ./screenshots)\n"
       << "    --monitor <m>        all (default), primary, or a monitor "
          "number\n"
       << "    --window-title <t>   First window whose title contains t\n"
       << "    --process-name <p>   First window whose process name "
          "contains p\n"
       << "    --window-number <n>  Window n from list-windows\n"
       << "    --window-handle <h>  Exact window id (0x... or decimal)\n"
       << "    --filter <text>      Narrow the list used by the selectors "
          "above\n"
       << "    --allow-focus        Raise the window if background capture "
          "fails\n"
       << "    --restore-if-minimized\n"
       << "                         Un-minimize for the capture, minimize "
          "again after\n"
       << "\n"
       << "Options:\n"
       << "  --debug                Enable debug logging\n"
       << "  --help, -h             Show this help message\n"
       << "\n"
       << "Environment:\n"
       << "  WINSHOT_LOG_FILE       Also append log lines to this file\n"
       << "  WINSHOT_OUTPUT_DIR     Base directory for the default "
          "screenshots folder\n";
}

namespace {

bool takeValue(int argc, char** argv, int& i, const std::string& flag,
               std::string& value, std::string& err) {
    if (i + 1 >= argc) {
        err = flag + " requires a value";
        return false;
    }
    value = argv[++i];
    return true;
}

bool parseListWindows(int argc, char** argv, int i, ListWindowsArgs& out,
                      std::string& err) {
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--filter") {
            if (!takeValue(argc, argv, i, arg, out.filter, err)) {
                return false;
            }
        } else if (arg == "--format") {
            if (!takeValue(argc, argv, i, arg, out.format, err)) {
                return false;
            }
            if (out.format != "simple" && out.format != "detailed") {
                err = "unknown format: " + out.format;
                return false;
            }
        } else {
            err = "unknown argument for list-windows: " + arg;
            return false;
        }
    }
    return true;
}

bool parseScreenshot(int argc, char** argv, int i, TakeScreenshotArgs& out,
                     std::string& err) {
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (arg == "--allow-focus") {
            out.allowFocus = true;
            continue;
        }
        if (arg == "--restore-if-minimized") {
            out.restoreIfMinimized = true;
            continue;
        }
        if (arg != "--filename" && arg != "--folder" && arg != "--monitor" &&
            arg != "--window-title" && arg != "--process-name" &&
            arg != "--window-number" && arg != "--window-handle" &&
            arg != "--filter") {
            err = "unknown argument for screenshot: " + arg;
            return false;
        }
        if (!takeValue(argc, argv, i, arg, value, err)) {
            return false;
        }
        if (arg == "--filename") {
            out.filename = value;
        } else if (arg == "--folder") {
            out.folder = value;
        } else if (arg == "--monitor") {
            out.monitor = value;
        } else if (arg == "--window-title") {
            out.windowTitle = value;
        } else if (arg == "--process-name") {
            out.processName = value;
        } else if (arg == "--window-number") {
            int number = 0;
            if (!parseInt(value, number)) {
                err = "--window-number expects an integer, got " + value;
                return false;
            }
            out.windowNumber = number;
        } else if (arg == "--window-handle") {
            out.windowHandle = value;
        } else {
            out.filter = value;
        }
    }
    return true;
}

}  // namespace

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--debug") {
            out.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            out.help = true;
            return true;
        } else {
            break;
        }
    }
    if (i >= argc) {
        err = "missing command";
        return false;
    }

    std::string command = argv[i++];
    for (int j = i; j < argc; ++j) {
        std::string arg = argv[j];
        if (arg == "-h" || arg == "--help") {
            out.help = true;
            return true;
        }
    }
    if (command == "list-windows") {
        out.command = Command::ListWindows;
        return parseListWindows(argc, argv, i, out.listWindows, err);
    }
    if (command == "list-monitors") {
        out.command = Command::ListMonitors;
        if (i < argc) {
            err = std::string("unknown argument for list-monitors: ") +
                  argv[i];
            return false;
        }
        return true;
    }
    if (command == "screenshot") {
        out.command = Command::Screenshot;
        return parseScreenshot(argc, argv, i, out.screenshot, err);
    }
    err = "unknown command: " + command;
    return false;
}

}  // namespace winshot
