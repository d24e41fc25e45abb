#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "app/cli.hpp"

using namespace winshot;

namespace {

bool parse(std::vector<std::string> args, CliOptions& out, std::string& err) {
    args.insert(args.begin(), "winshot");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    return parseCli(static_cast<int>(args.size()), argv.data(), out, err);
}

}  // namespace

TEST_CASE("list-windows options", "[cli]") {
    CliOptions opts;
    std::string err;
    REQUIRE(parse({"--debug", "list-windows", "--filter", "term", "--format",
                   "detailed"},
                  opts, err));
    CHECK(opts.debug);
    CHECK(opts.command == Command::ListWindows);
    CHECK(opts.listWindows.filter == "term");
    CHECK(opts.listWindows.format == "detailed");

    CliOptions bad;
    CHECK_FALSE(parse({"list-windows", "--format", "json"}, bad, err));
    CHECK(err == "unknown format: json");
}

TEST_CASE("screenshot options", "[cli]") {
    CliOptions opts;
    std::string err;
    REQUIRE(parse({"screenshot", "--window-number", "3", "--filter", "chrome",
                   "--allow-focus", "--restore-if-minimized", "--filename",
                   "shot.jpg", "--folder", "~/shots"},
                  opts, err));
    CHECK(opts.command == Command::Screenshot);
    const TakeScreenshotArgs& s = opts.screenshot;
    REQUIRE(s.windowNumber);
    CHECK(*s.windowNumber == 3);
    CHECK(s.filter == std::optional<std::string>("chrome"));
    CHECK(s.allowFocus);
    CHECK(s.restoreIfMinimized);
    CHECK(s.filename == std::optional<std::string>("shot.jpg"));
    CHECK(s.folder == std::optional<std::string>("~/shots"));
    CHECK_FALSE(s.windowTitle);
    CHECK_FALSE(s.monitor);
}

TEST_CASE("screenshot option errors", "[cli]") {
    std::string err;

    CliOptions a;
    CHECK_FALSE(parse({"screenshot", "--window-number", "two"}, a, err));
    CHECK(err == "--window-number expects an integer, got two");

    CliOptions b;
    CHECK_FALSE(parse({"screenshot", "--monitor"}, b, err));
    CHECK(err == "--monitor requires a value");

    CliOptions c;
    CHECK_FALSE(parse({"screenshot", "--verbose"}, c, err));
    CHECK(err == "unknown argument for screenshot: --verbose");
}

TEST_CASE("command errors and help", "[cli]") {
    std::string err;

    CliOptions none;
    CHECK_FALSE(parse({}, none, err));
    CHECK(err == "missing command");

    CliOptions unknown;
    CHECK_FALSE(parse({"record"}, unknown, err));
    CHECK(err == "unknown command: record");

    CliOptions extra;
    CHECK_FALSE(parse({"list-monitors", "--all"}, extra, err));

    CliOptions help;
    REQUIRE(parse({"screenshot", "--bogus", "-h"}, help, err));
    CHECK(help.help);

    std::ostringstream usage;
    printUsage(usage, "winshot");
    CHECK(usage.str().find("list-windows") != std::string::npos);
    CHECK(usage.str().find("--restore-if-minimized") != std::string::npos);
}
