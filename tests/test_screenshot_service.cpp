#include <catch2/catch.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>

#include "FakeDesktop.hpp"
#include "app/ScreenshotService.hpp"

using namespace winshot;
using winshot::test::FakeDesktop;
using winshot::test::SharedFakeDesktop;

namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp dir, removed on scope exit.
class ScratchDir {
public:
    ScratchDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("winshot-test-" + std::to_string(::getpid()) + "-" +
                 std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string str() const {
        return path_.string();
    }
    fs::path operator/(const std::string& name) const {
        return path_ / name;
    }

private:
    fs::path path_;
};

struct PngSize {
    uint32_t w = 0;
    uint32_t h = 0;
};

// Width and height from the IHDR chunk.
bool readPngSize(const fs::path& path, PngSize& out) {
    std::ifstream in(path, std::ios::binary);
    unsigned char header[24] = {};
    if (!in.read(reinterpret_cast<char*>(header), sizeof(header))) {
        return false;
    }
    if (header[1] != 'P' || header[2] != 'N' || header[3] != 'G') {
        return false;
    }
    auto be32 = [&header](int at) {
        return (uint32_t(header[at]) << 24) | (uint32_t(header[at + 1]) << 16) |
               (uint32_t(header[at + 2]) << 8) | uint32_t(header[at + 3]);
    };
    out.w = be32(16);
    out.h = be32(20);
    return true;
}

DesktopFactory factoryFor(const std::shared_ptr<FakeDesktop>& fake) {
    return [fake](std::string*) -> std::unique_ptr<IDesktop> {
        return std::make_unique<SharedFakeDesktop>(fake);
    };
}

std::shared_ptr<FakeDesktop> browserDesktop() {
    auto fake = std::make_shared<FakeDesktop>();
    fake->addWindow(0x4001, "Mozilla Firefox", "firefox");
    fake->addWindow(0x4002, "New Tab - Google Chrome", "chrome",
                    Rect{200, 150, 640, 480});
    fake->addWindow(0x4003, "Terminal", "konsole");
    fake->monitors = {
        {"eDP-1", Rect{0, 0, 1920, 1080}, true},
        {"HDMI-1", Rect{1920, 0, 1280, 1024}, false},
    };
    return fake;
}

}  // namespace

TEST_CASE("selection priority is handle, number, title, process",
          "[service]") {
    TakeScreenshotArgs args;
    args.windowHandle = "0x10";
    args.windowNumber = 2;
    args.windowTitle = "chrome";
    args.processName = "firefox";
    args.monitor = "primary";

    CaptureRequest request;
    Failure err;
    REQUIRE(buildCaptureRequest(args, request, err));
    auto* window = std::get_if<WindowSelector>(&request.target);
    REQUIRE(window);
    REQUIRE(std::holds_alternative<ByHandle>(window->target));
    CHECK(std::get<ByHandle>(window->target).handle == 0x10);

    args.windowHandle.reset();
    REQUIRE(buildCaptureRequest(args, request, err));
    window = std::get_if<WindowSelector>(&request.target);
    REQUIRE(window);
    CHECK(std::holds_alternative<ByIndex>(window->target));

    args.windowNumber.reset();
    REQUIRE(buildCaptureRequest(args, request, err));
    window = std::get_if<WindowSelector>(&request.target);
    REQUIRE(window);
    CHECK(std::holds_alternative<ByTitle>(window->target));

    args.windowTitle.reset();
    REQUIRE(buildCaptureRequest(args, request, err));
    window = std::get_if<WindowSelector>(&request.target);
    REQUIRE(window);
    CHECK(std::holds_alternative<ByProcess>(window->target));

    args.processName.reset();
    REQUIRE(buildCaptureRequest(args, request, err));
    auto* monitor = std::get_if<MonitorSelector>(&request.target);
    REQUIRE(monitor);
    CHECK(std::holds_alternative<PrimaryMonitor>(*monitor));
}

TEST_CASE("defaults capture every monitor into screenshot.png",
          "[service]") {
    TakeScreenshotArgs args;
    CaptureRequest request;
    Failure err;
    REQUIRE(buildCaptureRequest(args, request, err));
    CHECK(request.filename == "screenshot.png");
    CHECK_FALSE(request.folder);
    CHECK_FALSE(request.options.allowFocus);
    CHECK_FALSE(request.options.restoreIfMinimized);
    auto* monitor = std::get_if<MonitorSelector>(&request.target);
    REQUIRE(monitor);
    CHECK(std::holds_alternative<AllMonitors>(*monitor));
}

TEST_CASE("malformed handle is rejected before any capture", "[service]") {
    TakeScreenshotArgs args;
    args.windowHandle = "not-a-handle";
    CaptureRequest request;
    Failure err;
    CHECK_FALSE(buildCaptureRequest(args, request, err));
    CHECK(err.kind == ErrorKind::Resolution);
}

TEST_CASE("unknown process yields a resolution error and no file",
          "[service]") {
    ScratchDir dir;
    auto fake = browserDesktop();
    ScreenshotService service(factoryFor(fake));

    TakeScreenshotArgs args;
    args.processName = "notepad";
    args.folder = dir.str();
    ToolResponse response = service.takeScreenshot(args);

    CHECK(response.isError);
    REQUIRE(response.errorKind);
    CHECK(*response.errorKind == ErrorKind::Resolution);
    CHECK(response.text ==
          "Failed to take screenshot: No window found for process: notepad "
          "[ResolutionError]");
    CHECK_FALSE(fs::exists(dir / "screenshot.png"));
    CHECK(fake->composeCalls == 0);
    CHECK(fake->copyCalls == 0);
}

TEST_CASE("primary monitor capture has the monitor's size", "[service]") {
    ScratchDir dir;
    auto fake = browserDesktop();
    ScreenshotService service(factoryFor(fake));

    TakeScreenshotArgs args;
    args.monitor = "primary";
    args.folder = dir.str();
    args.filename = "primary.png";
    ToolResponse response = service.takeScreenshot(args);

    REQUIRE_FALSE(response.isError);
    CHECK(response.text ==
          "Screenshot saved successfully to: " + dir.str() + "/primary.png");
    PngSize size;
    REQUIRE(readPngSize(dir / "primary.png", size));
    CHECK(size.w == 1920);
    CHECK(size.h == 1080);
}

TEST_CASE("all monitors capture spans the virtual screen", "[service]") {
    ScratchDir dir;
    auto fake = browserDesktop();
    ScreenshotService service(factoryFor(fake));

    TakeScreenshotArgs args;
    args.folder = dir.str();
    REQUIRE_FALSE(service.takeScreenshot(args).isError);
    REQUIRE(fake->lastCopyRegion);
    CHECK(*fake->lastCopyRegion == Rect{0, 0, 3200, 1080});
}

TEST_CASE("missing monitor number", "[service]") {
    ScratchDir dir;
    auto fake = browserDesktop();
    ScreenshotService service(factoryFor(fake));

    TakeScreenshotArgs args;
    args.monitor = "7";
    args.folder = dir.str();
    ToolResponse response = service.takeScreenshot(args);
    CHECK(response.isError);
    CHECK(response.text ==
          "Failed to take screenshot: Monitor 7 not found. Available "
          "monitors: 1 to 2 [ResolutionError]");
}

TEST_CASE("numbered window in a filtered list falls back to foreground",
          "[service]") {
    ScratchDir dir;
    auto fake = browserDesktop();
    fake->find(0x4002)->composeWorks = false;
    fake->focus = 0x4003;
    ScreenshotService service(factoryFor(fake));

    TakeScreenshotArgs args;
    args.windowNumber = 1;
    args.filter = "chrome";
    args.allowFocus = true;
    args.folder = dir.str();
    args.filename = "chrome.png";
    ToolResponse response = service.takeScreenshot(args);

    REQUIRE_FALSE(response.isError);
    PngSize size;
    REQUIRE(readPngSize(dir / "chrome.png", size));
    CHECK(size.w == 660);
    CHECK(size.h == 500);
    CHECK(fake->focus == 0x4003);
}

TEST_CASE("background failure without focus permission is reported",
          "[service]") {
    ScratchDir dir;
    auto fake = browserDesktop();
    fake->find(0x4001)->composeWorks = false;
    ScreenshotService service(factoryFor(fake));

    TakeScreenshotArgs args;
    args.windowTitle = "firefox";
    args.folder = dir.str();
    ToolResponse response = service.takeScreenshot(args);

    CHECK(response.isError);
    REQUIRE(response.errorKind);
    CHECK(*response.errorKind == ErrorKind::Capture);
    CHECK(response.text ==
          "Failed to take screenshot: Background capture failed for this "
          "window. Retry with allowFocus: true. [CaptureError]");
    CHECK_FALSE(fs::exists(dir / "screenshot.png"));
}

TEST_CASE("filename with a directory part is an IO error", "[service]") {
    ScratchDir dir;
    auto fake = browserDesktop();
    ScreenshotService service(factoryFor(fake));

    TakeScreenshotArgs args;
    args.filename = "../escape.png";
    args.folder = dir.str();
    ToolResponse response = service.takeScreenshot(args);
    CHECK(response.isError);
    REQUIRE(response.errorKind);
    CHECK(*response.errorKind == ErrorKind::IO);
}

TEST_CASE("no desktop is an environment error", "[service]") {
    ScratchDir dir;
    ScreenshotService service([](std::string* err) {
        *err = "Cannot open X display";
        return std::unique_ptr<IDesktop>();
    });

    TakeScreenshotArgs args;
    args.folder = dir.str();
    ToolResponse response = service.takeScreenshot(args);
    CHECK(response.isError);
    REQUIRE(response.errorKind);
    CHECK(*response.errorKind == ErrorKind::Environment);
    CHECK(response.text ==
          "Failed to take screenshot: Cannot open X display "
          "[EnvironmentError]");

    ToolResponse listed = service.listWindows(ListWindowsArgs{});
    CHECK(listed.isError);
}

TEST_CASE("window list formats", "[service]") {
    auto fake = browserDesktop();
    ScreenshotService service(factoryFor(fake));

    ListWindowsArgs args;
    ToolResponse simple = service.listWindows(args);
    REQUIRE_FALSE(simple.isError);
    CHECK(simple.text ==
          "1. Mozilla Firefox (Process: firefox)\n"
          "2. New Tab - Google Chrome (Process: chrome)\n"
          "3. Terminal (Process: konsole)");

    args.filter = "chrome";
    args.format = "detailed";
    ToolResponse detailed = service.listWindows(args);
    REQUIRE_FALSE(detailed.isError);
    CHECK(detailed.text ==
          "1. New Tab - Google Chrome (Process: chrome, PID: 1001, Handle: "
          "0x00004002, State: Normal)");

    args.filter = "nothing-matches";
    ToolResponse none = service.listWindows(args);
    CHECK_FALSE(none.isError);
    CHECK(none.text == "No windows found");
}

TEST_CASE("monitor list", "[service]") {
    auto fake = browserDesktop();
    ScreenshotService service(factoryFor(fake));

    ToolResponse response = service.listMonitors();
    REQUIRE_FALSE(response.isError);
    CHECK(response.text ==
          "1. eDP-1 0,0 1920x1080 (primary)\n"
          "2. HDMI-1 1920,0 1280x1024\n"
          "Virtual screen: 0,0 3200x1080");
}
