#include "desktop/X11Desktop.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xcomposite.h>
#include <X11/extensions/Xrandr.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "desktop/PixelLayout.hpp"
#include "platform/Log.hpp"
#include "platform/ProcessInfo.hpp"
#include "platform/StringUtil.hpp"
#include "platform/Time.hpp"

namespace winshot {

namespace {

// Collects X protocol errors raised between construction and failed().
// Xlib reports errors asynchronously, so both ends sync with the server.
// Traps must not nest: an inner trap resets the recorded error.
class X11ErrorTrap {
public:
    explicit X11ErrorTrap(Display* display) : display_(display) {
        XSync(display_, False);
        s_errorCode = 0;
        previous_ = XSetErrorHandler(&X11ErrorTrap::handler);
    }

    ~X11ErrorTrap() {
        XSync(display_, False);
        XSetErrorHandler(previous_);
    }

    X11ErrorTrap(const X11ErrorTrap&) = delete;
    X11ErrorTrap& operator=(const X11ErrorTrap&) = delete;

    bool failed() {
        XSync(display_, False);
        return s_errorCode != 0;
    }

    int errorCode() const {
        return s_errorCode;
    }

private:
    static int handler(Display*, XErrorEvent* event) {
        s_errorCode = event->error_code;
        return 0;
    }

    static inline int s_errorCode = 0;
    Display* display_;
    XErrorHandler previous_ = nullptr;
};

ChannelMasks visualMasks(const Visual* visual) {
    ChannelMasks masks;
    if (visual) {
        masks.red = visual->red_mask;
        masks.green = visual->green_mask;
        masks.blue = visual->blue_mask;
    }
    return masks;
}

// Converts an XImage into RGBA, writing it at (dstX, dstY) of `out`.
// `visual` is the drawable's visual, used when the image carries no masks.
void blitXImage(XImage* image, const Visual* visual, ImageRGBA& out,
                int dstX, int dstY) {
    ChannelMasks imageMasks;
    imageMasks.red = image->red_mask;
    imageMasks.green = image->green_mask;
    imageMasks.blue = image->blue_mask;
    PixelLayout layout = pixelLayoutFor(imageMasks, visualMasks(visual));
    blitPixels(
        image->width, image->height,
        [image](int x, int y) { return XGetPixel(image, x, y); }, layout, out,
        dstX, dstY);
}

Rect intersect(const Rect& a, const Rect& b) {
    int left = std::max(a.x, b.x);
    int top = std::max(a.y, b.y);
    int right = std::min(a.right(), b.right());
    int bottom = std::min(a.bottom(), b.bottom());
    if (right <= left || bottom <= top) {
        return {};
    }
    return Rect{left, top, right - left, bottom - top};
}

}  // namespace

class X11Desktop final : public IDesktop {
public:
    explicit X11Desktop(Display* display)
        : display_(display), root_(DefaultRootWindow(display)) {
        netClientList_ = atom("_NET_CLIENT_LIST");
        netActiveWindow_ = atom("_NET_ACTIVE_WINDOW");
        netWmName_ = atom("_NET_WM_NAME");
        netWmPid_ = atom("_NET_WM_PID");
        netWmState_ = atom("_NET_WM_STATE");
        netWmStateHidden_ = atom("_NET_WM_STATE_HIDDEN");
        netWmStateMaxVert_ = atom("_NET_WM_STATE_MAXIMIZED_VERT");
        netWmStateMaxHorz_ = atom("_NET_WM_STATE_MAXIMIZED_HORZ");
        netFrameExtents_ = atom("_NET_FRAME_EXTENTS");
        wmState_ = atom("WM_STATE");
        utf8String_ = atom("UTF8_STRING");
        std::string cmSelection =
            "_NET_WM_CM_S" + std::to_string(DefaultScreen(display_));
        compositorSelection_ = atom(cmSelection.c_str());

        int eventBase = 0;
        int errorBase = 0;
        if (XCompositeQueryExtension(display_, &eventBase, &errorBase)) {
            int major = 0;
            int minor = 2;
            XCompositeQueryVersion(display_, &major, &minor);
            // NameWindowPixmap needs Composite 0.2.
            hasComposite_ = major > 0 || minor >= 2;
        }
        if (!hasComposite_) {
            LOG_WARN("X11: Composite extension unavailable, background "
                     "window capture disabled");
        }
        hasRandr_ = XRRQueryExtension(display_, &eventBase, &errorBase);
    }

    ~X11Desktop() override {
        if (display_) {
            XCloseDisplay(display_);
        }
    }

    X11Desktop(const X11Desktop&) = delete;
    X11Desktop& operator=(const X11Desktop&) = delete;

    std::string name() const override {
        return "x11";
    }

    std::vector<TopLevelWindow> listTopLevelWindows() override {
        std::vector<TopLevelWindow> result;
        std::vector<Window> clients = windowListProperty(root_, netClientList_);
        bool managed = !clients.empty();
        if (!managed) {
            LOG_DEBUG("X11: no _NET_CLIENT_LIST, walking root children");
            clients = rootChildren();
        }

        for (Window client : clients) {
            if (!isVisible(client, managed)) {
                continue;
            }
            auto state = windowState(client);
            if (!state) {
                continue;
            }
            TopLevelWindow window;
            window.handle = client;
            window.title = windowTitle(client);
            window.pid = windowPid(client);
            window.processName = processName(window.pid);
            window.state = *state;
            result.push_back(std::move(window));
        }
        return result;
    }

    std::vector<ReportedMonitor> listMonitors() override {
        std::vector<ReportedMonitor> result;
        if (!hasRandr_) {
            return result;
        }
        XRRScreenResources* resources =
            XRRGetScreenResourcesCurrent(display_, root_);
        if (!resources) {
            LOG_ERROR("X11: failed to get screen resources");
            return result;
        }

        RROutput primary = XRRGetOutputPrimary(display_, root_);
        for (int i = 0; i < resources->noutput; ++i) {
            RROutput output = resources->outputs[i];
            XRROutputInfo* info = XRRGetOutputInfo(display_, resources, output);
            if (!info) {
                continue;
            }
            if (info->connection == RR_Connected && info->crtc) {
                XRRCrtcInfo* crtc =
                    XRRGetCrtcInfo(display_, resources, info->crtc);
                if (crtc) {
                    ReportedMonitor mon;
                    mon.name.assign(info->name, info->nameLen);
                    mon.bounds = Rect{crtc->x, crtc->y,
                                      static_cast<int>(crtc->width),
                                      static_cast<int>(crtc->height)};
                    mon.primary = (output == primary);
                    result.push_back(mon);
                    XRRFreeCrtcInfo(crtc);
                }
            }
            XRRFreeOutputInfo(info);
        }

        XRRFreeScreenResources(resources);
        return result;
    }

    Rect screenBounds() override {
        int screen = DefaultScreen(display_);
        return Rect{0, 0, DisplayWidth(display_, screen),
                    DisplayHeight(display_, screen)};
    }

    std::optional<WindowState> windowState(WindowHandle handle) override {
        Window window = static_cast<Window>(handle);
        XWindowAttributes attrs{};
        {
            X11ErrorTrap trap(display_);
            Status ok = XGetWindowAttributes(display_, window, &attrs);
            if (trap.failed() || !ok) {
                return std::nullopt;
            }
        }

        std::vector<long> wmState = longProperty(window, wmState_, wmState_);
        if (!wmState.empty() && wmState[0] == IconicState) {
            return WindowState::Minimized;
        }
        std::vector<long> netState = longProperty(window, netWmState_, XA_ATOM);
        auto has = [&netState](Atom a) {
            return std::find(netState.begin(), netState.end(),
                             static_cast<long>(a)) != netState.end();
        };
        if (has(netWmStateHidden_)) {
            return WindowState::Minimized;
        }
        if (has(netWmStateMaxVert_) && has(netWmStateMaxHorz_)) {
            return WindowState::Maximized;
        }
        return WindowState::Normal;
    }

    std::optional<Rect> windowRect(WindowHandle handle) override {
        Window window = static_cast<Window>(handle);
        XWindowAttributes attrs{};
        int rootX = 0;
        int rootY = 0;
        {
            X11ErrorTrap trap(display_);
            Window child = 0;
            if (!XGetWindowAttributes(display_, window, &attrs) ||
                !XTranslateCoordinates(display_, window, root_, 0, 0, &rootX,
                                       &rootY, &child) ||
                trap.failed()) {
                return std::nullopt;
            }
        }
        Rect rect{rootX - attrs.border_width, rootY - attrs.border_width,
                  attrs.width + 2 * attrs.border_width,
                  attrs.height + 2 * attrs.border_width};

        // left, right, top, bottom
        std::vector<long> extents =
            longProperty(window, netFrameExtents_, XA_CARDINAL);
        if (extents.size() == 4) {
            rect.x -= static_cast<int>(extents[0]);
            rect.y -= static_cast<int>(extents[2]);
            rect.w += static_cast<int>(extents[0] + extents[1]);
            rect.h += static_cast<int>(extents[2] + extents[3]);
        }
        return rect;
    }

    WindowHandle foregroundWindow() override {
        std::vector<Window> active = windowListProperty(root_, netActiveWindow_);
        if (!active.empty() && active[0] != None) {
            return active[0];
        }
        Window focus = None;
        int revert = 0;
        XGetInputFocus(display_, &focus, &revert);
        if (focus == None || focus == PointerRoot || focus == root_) {
            return 0;
        }
        return focus;
    }

    bool setForeground(WindowHandle handle) override {
        Window window = static_cast<Window>(handle);
        Window frame = frameWindow(window);
        WindowHandle current = foregroundWindow();
        X11ErrorTrap trap(display_);

        XEvent event{};
        event.xclient.type = ClientMessage;
        event.xclient.window = window;
        event.xclient.message_type = netActiveWindow_;
        event.xclient.format = 32;
        event.xclient.data.l[0] = 2;  // source: pager, honoured as a user action
        event.xclient.data.l[1] = CurrentTime;
        event.xclient.data.l[2] = static_cast<long>(current);
        Status sent = XSendEvent(display_, root_, False,
                                 SubstructureRedirectMask |
                                     SubstructureNotifyMask,
                                 &event);
        XRaiseWindow(display_, frame);
        XFlush(display_);
        if (trap.failed()) {
            LOG_DEBUG("X11: activating %s raised error %d",
                      formatHandle(handle).c_str(), trap.errorCode());
            return false;
        }
        return sent != 0;
    }

    bool minimize(WindowHandle handle) override {
        X11ErrorTrap trap(display_);
        Status ok = XIconifyWindow(display_, static_cast<Window>(handle),
                                   DefaultScreen(display_));
        XFlush(display_);
        return ok != 0 && !trap.failed();
    }

    bool unminimize(WindowHandle handle) override {
        // ICCCM 4.1.4: mapping an iconic client asks the WM for NormalState.
        X11ErrorTrap trap(display_);
        XMapWindow(display_, static_cast<Window>(handle));
        XFlush(display_);
        return !trap.failed();
    }

    bool composeWindow(WindowHandle handle, const Rect& bounds,
                       ImageRGBA& out) override {
        if (!hasComposite_) {
            return false;
        }
        // Without a compositing manager the window is not redirected yet, and
        // a fresh backing pixmap only holds its visible part.
        if (!compositorRunning()) {
            LOG_DEBUG("X11: no compositing manager, background capture of %s "
                      "unavailable",
                      formatHandle(handle).c_str());
            return false;
        }
        Window frame = frameWindow(static_cast<Window>(handle));
        XWindowAttributes attrs{};
        int frameX = 0;
        int frameY = 0;
        {
            X11ErrorTrap trap(display_);
            Window child = 0;
            if (!XGetWindowAttributes(display_, frame, &attrs) ||
                !XTranslateCoordinates(display_, frame, root_, 0, 0, &frameX,
                                       &frameY, &child) ||
                trap.failed()) {
                return false;
            }
        }
        if (attrs.map_state != IsViewable) {
            LOG_DEBUG("X11: %s is not viewable, no pixmap to compose",
                      formatHandle(handle).c_str());
            return false;
        }

        const int fullW = attrs.width + 2 * attrs.border_width;
        const int fullH = attrs.height + 2 * attrs.border_width;
        frameX -= attrs.border_width;
        frameY -= attrs.border_width;

        X11ErrorTrap trap(display_);
        XCompositeRedirectWindow(display_, frame, CompositeRedirectAutomatic);
        Pixmap pixmap = XCompositeNameWindowPixmap(display_, frame);
        if (trap.failed() || pixmap == None) {
            LOG_DEBUG("X11: NameWindowPixmap failed with error %d",
                      trap.errorCode());
            XCompositeUnredirectWindow(display_, frame,
                                       CompositeRedirectAutomatic);
            return false;
        }

        XImage* image =
            XGetImage(display_, pixmap, 0, 0, static_cast<unsigned int>(fullW),
                      static_cast<unsigned int>(fullH), AllPlanes, ZPixmap);
        bool ok = image != nullptr && !trap.failed();
        if (ok) {
            out.allocate(bounds.w, bounds.h);
            blitXImage(image, attrs.visual, out, frameX - bounds.x,
                       frameY - bounds.y);
        }
        if (image) {
            XDestroyImage(image);
        }
        XFreePixmap(display_, pixmap);
        XCompositeUnredirectWindow(display_, frame, CompositeRedirectAutomatic);
        return ok;
    }

    bool copyScreenRegion(const Rect& region, ImageRGBA& out) override {
        Rect visible = intersect(region, screenBounds());
        if (visible.empty()) {
            LOG_ERROR("X11: region %d,%d %dx%d lies outside the screen",
                      region.x, region.y, region.w, region.h);
            return false;
        }

        X11ErrorTrap trap(display_);
        XImage* image = XGetImage(display_, root_, visible.x, visible.y,
                                  static_cast<unsigned int>(visible.w),
                                  static_cast<unsigned int>(visible.h),
                                  AllPlanes, ZPixmap);
        if (!image || trap.failed()) {
            LOG_ERROR("X11: XGetImage failed (permissions or remote session?)");
            if (image) {
                XDestroyImage(image);
            }
            return false;
        }

        out.allocate(region.w, region.h);
        Visual* rootVisual = DefaultVisual(display_, DefaultScreen(display_));
        blitXImage(image, rootVisual, out, visible.x - region.x,
                   visible.y - region.y);
        XDestroyImage(image);
        return true;
    }

    void sleepFor(std::chrono::milliseconds duration) override {
        sleepMillis(duration);
    }

private:
    Atom atom(const char* atomName) {
        return XInternAtom(display_, atomName, False);
    }

    bool compositorRunning() {
        return XGetSelectionOwner(display_, compositorSelection_) != None;
    }

    std::vector<long> longProperty(Window window, Atom property, Atom type) {
        std::vector<long> values;
        Atom actualType = None;
        int actualFormat = 0;
        unsigned long count = 0;
        unsigned long remaining = 0;
        unsigned char* data = nullptr;
        X11ErrorTrap trap(display_);
        int status = XGetWindowProperty(display_, window, property, 0, 4096,
                                        False, type, &actualType,
                                        &actualFormat, &count, &remaining,
                                        &data);
        if (status == Success && !trap.failed() && data &&
            actualFormat == 32) {
            // Format-32 properties come back as arrays of long.
            const long* items = reinterpret_cast<const long*>(data);
            values.assign(items, items + count);
        }
        if (data) {
            XFree(data);
        }
        return values;
    }

    std::vector<Window> windowListProperty(Window window, Atom property) {
        std::vector<Window> windows;
        for (long value : longProperty(window, property, XA_WINDOW)) {
            windows.push_back(static_cast<Window>(value));
        }
        return windows;
    }

    std::vector<Window> rootChildren() {
        std::vector<Window> windows;
        Window rootReturn = 0;
        Window parent = 0;
        Window* children = nullptr;
        unsigned int count = 0;
        if (XQueryTree(display_, root_, &rootReturn, &parent, &children,
                       &count)) {
            windows.assign(children, children + count);
        }
        if (children) {
            XFree(children);
        }
        return windows;
    }

    bool isVisible(Window window, bool managed) {
        std::vector<long> wmState = longProperty(window, wmState_, wmState_);
        if (!wmState.empty()) {
            return wmState[0] != WithdrawnState;
        }
        if (managed) {
            return true;
        }
        XWindowAttributes attrs{};
        X11ErrorTrap trap(display_);
        if (!XGetWindowAttributes(display_, window, &attrs) || trap.failed()) {
            return false;
        }
        return attrs.map_state == IsViewable && !attrs.override_redirect;
    }

    std::string windowTitle(Window window) {
        std::string title;
        Atom actualType = None;
        int actualFormat = 0;
        unsigned long count = 0;
        unsigned long remaining = 0;
        unsigned char* data = nullptr;
        {
            X11ErrorTrap trap(display_);
            int status = XGetWindowProperty(
                display_, window, netWmName_, 0, 4096, False, utf8String_,
                &actualType, &actualFormat, &count, &remaining, &data);
            if (status == Success && !trap.failed() && data &&
                actualFormat == 8) {
                title.assign(reinterpret_cast<const char*>(data), count);
            }
            if (data) {
                XFree(data);
            }
        }
        if (!title.empty()) {
            return title;
        }

        X11ErrorTrap trap(display_);
        char* legacy = nullptr;
        if (XFetchName(display_, window, &legacy) && legacy) {
            title = legacy;
        }
        if (legacy) {
            XFree(legacy);
        }
        return title;
    }

    std::uint32_t windowPid(Window window) {
        std::vector<long> pid = longProperty(window, netWmPid_, XA_CARDINAL);
        if (pid.empty() || pid[0] <= 0) {
            return 0;
        }
        return static_cast<std::uint32_t>(pid[0]);
    }

    // Top-level ancestor below the root: the WM frame when reparented.
    Window frameWindow(Window window) {
        Window current = window;
        X11ErrorTrap trap(display_);
        for (int depth = 0; depth < 16; ++depth) {
            Window rootReturn = 0;
            Window parent = 0;
            Window* children = nullptr;
            unsigned int count = 0;
            if (!XQueryTree(display_, current, &rootReturn, &parent, &children,
                            &count)) {
                break;
            }
            if (children) {
                XFree(children);
            }
            if (parent == 0 || parent == rootReturn) {
                break;
            }
            current = parent;
        }
        return current;
    }

    Display* display_;
    Window root_;
    bool hasComposite_ = false;
    bool hasRandr_ = false;

    Atom netClientList_ = None;
    Atom netActiveWindow_ = None;
    Atom netWmName_ = None;
    Atom netWmPid_ = None;
    Atom netWmState_ = None;
    Atom netWmStateHidden_ = None;
    Atom netWmStateMaxVert_ = None;
    Atom netWmStateMaxHorz_ = None;
    Atom netFrameExtents_ = None;
    Atom wmState_ = None;
    Atom utf8String_ = None;
    Atom compositorSelection_ = None;
};

std::unique_ptr<IDesktop> CreateX11Desktop(std::string* err) {
    const char* displayEnv = std::getenv("DISPLAY");
    if (!displayEnv || displayEnv[0] == '\0') {
        if (err) {
            *err = "DISPLAY is not set; no X server to capture from";
        }
        return nullptr;
    }
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        if (err) {
            *err = std::string("cannot open X display ") + displayEnv;
        }
        return nullptr;
    }
    LOG_DEBUG("X11: connected to %s", displayEnv);
    return std::make_unique<X11Desktop>(display);
}

}  // namespace winshot
