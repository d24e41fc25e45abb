#include <catch2/catch.hpp>

#include <algorithm>

#include "FakeDesktop.hpp"
#include "capture/MonitorEnumerator.hpp"
#include "capture/WindowEnumerator.hpp"
#include "platform/StringUtil.hpp"

using namespace winshot;
using winshot::test::FakeDesktop;

namespace {

void populate(FakeDesktop& desktop) {
    desktop.addWindow(0x1001, "Mozilla Firefox", "firefox");
    desktop.addWindow(0x1002, "", "plasmashell");
    desktop.addWindow(0x1003, "Terminal - vim notes.txt", "konsole");
    desktop.addWindow(0x1004, "chrome://settings", "Chrome");
    desktop.addWindow(0x1005, "Untitled", "");
    desktop.addWindow(0x1006, "FIREFOX downloads", "firefox");
}

}  // namespace

TEST_CASE("untitled windows are skipped and indexes start at 1",
          "[enumerator]") {
    FakeDesktop desktop;
    populate(desktop);

    auto windows = enumerateWindows(desktop);
    REQUIRE(windows.size() == 5);
    for (size_t i = 0; i < windows.size(); ++i) {
        CHECK(windows[i].index == static_cast<int>(i) + 1);
        CHECK_FALSE(windows[i].title.empty());
    }
    CHECK(windows[0].handle == 0x1001);
    CHECK(windows[1].handle == 0x1003);
}

TEST_CASE("filter matches title or process name ignoring case",
          "[enumerator]") {
    FakeDesktop desktop;
    populate(desktop);

    auto all = enumerateWindows(desktop);
    for (const std::string filter :
         {"firefox", "FIREFOX", "chrome", "konsole", "o", "zzz", "notes"}) {
        auto filtered = enumerateWindows(desktop, filter);
        for (const auto& w : filtered) {
            CHECK((containsIgnoreCase(w.title, filter) ||
                   containsIgnoreCase(w.processName, filter)));
            bool inAll = std::any_of(all.begin(), all.end(),
                                     [&w](const WindowDescriptor& a) {
                                         return a.handle == w.handle;
                                     });
            CHECK(inAll);
        }
        CHECK(filtered.size() <= all.size());
    }

    auto firefox = enumerateWindows(desktop, "FireFox");
    REQUIRE(firefox.size() == 2);
    CHECK(firefox[0].index == 1);
    CHECK(firefox[1].index == 2);
    CHECK(firefox[1].handle == 0x1006);
}

TEST_CASE("window with unknown process keeps an empty process name",
          "[enumerator]") {
    FakeDesktop desktop;
    populate(desktop);

    auto windows = enumerateWindows(desktop, "untitled");
    REQUIRE(windows.size() == 1);
    CHECK(windows[0].processName.empty());
}

TEST_CASE("minimized windows are listed with their state", "[enumerator]") {
    FakeDesktop desktop;
    desktop.addWindow(0x2001, "Editor", "gedit");
    desktop.find(0x2001)->state = WindowState::Minimized;

    auto windows = enumerateWindows(desktop);
    REQUIRE(windows.size() == 1);
    CHECK(windows[0].state == WindowState::Minimized);
}

TEST_CASE("monitors are ordered by horizontal origin", "[monitor]") {
    FakeDesktop desktop;
    desktop.monitors = {
        {"HDMI-1", Rect{1920, 0, 2560, 1440}, false},
        {"DP-2", Rect{-1280, 200, 1280, 1024}, false},
        {"eDP-1", Rect{0, 0, 1920, 1080}, true},
    };

    auto monitors = enumerateMonitors(desktop);
    REQUIRE(monitors.size() == 3);
    CHECK(monitors[0].name == "DP-2");
    CHECK(monitors[1].name == "eDP-1");
    CHECK(monitors[2].name == "HDMI-1");
    for (size_t i = 0; i < monitors.size(); ++i) {
        CHECK(monitors[i].ordinal == static_cast<int>(i) + 1);
    }
    CHECK(monitors[1].primary);
    CHECK_FALSE(monitors[0].primary);
    CHECK_FALSE(monitors[2].primary);
}

TEST_CASE("exactly one primary monitor", "[monitor]") {
    FakeDesktop desktop;

    SECTION("none reported: the one at the origin") {
        desktop.monitors = {
            {"left", Rect{-1920, 0, 1920, 1080}, false},
            {"main", Rect{0, 0, 1920, 1080}, false},
        };
        auto monitors = enumerateMonitors(desktop);
        REQUIRE(monitors.size() == 2);
        CHECK_FALSE(monitors[0].primary);
        CHECK(monitors[1].primary);
    }

    SECTION("several reported") {
        desktop.monitors = {
            {"a", Rect{100, 0, 800, 600}, true},
            {"b", Rect{900, 0, 800, 600}, true},
        };
        auto monitors = enumerateMonitors(desktop);
        auto primaries = std::count_if(
            monitors.begin(), monitors.end(),
            [](const MonitorDescriptor& m) { return m.primary; });
        CHECK(primaries == 1);
        CHECK(monitors[0].primary);
    }

    SECTION("no monitors: the screen") {
        desktop.screen = Rect{0, 0, 1024, 768};
        auto monitors = enumerateMonitors(desktop);
        REQUIRE(monitors.size() == 1);
        CHECK(monitors[0].primary);
        CHECK(monitors[0].bounds == Rect{0, 0, 1024, 768});
    }
}

TEST_CASE("virtual screen spans every monitor", "[monitor]") {
    FakeDesktop desktop;
    desktop.monitors = {
        {"DP-2", Rect{-1280, 200, 1280, 1024}, false},
        {"eDP-1", Rect{0, 0, 1920, 1080}, true},
        {"HDMI-1", Rect{1920, 0, 2560, 1440}, false},
    };
    CHECK(virtualScreen(desktop) == Rect{-1280, 0, 1280 + 1920 + 2560, 1440});
}
