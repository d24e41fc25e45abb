#include "app/ScreenshotService.hpp"

#include <exception>
#include <filesystem>
#include <sstream>
#include <utility>
#include <vector>

#include "capture/MonitorEnumerator.hpp"
#include "capture/RegionCapture.hpp"
#include "capture/TargetResolver.hpp"
#include "capture/WindowEnumerator.hpp"
#include "output/ImageWriter.hpp"
#include "output/OutputLocation.hpp"
#include "platform/Log.hpp"
#include "platform/StringUtil.hpp"
#include "platform/Time.hpp"

namespace winshot {

namespace {

bool present(const std::optional<std::string>& value) {
    return value && !value->empty();
}

ToolResponse errorResponse(const char* prefix, const Failure& failure) {
    ToolResponse response;
    response.text = std::string(prefix) + " " + failure.message + " [" +
                    errorKindName(failure.kind) + "]";
    response.isError = true;
    response.errorKind = failure.kind;
    return response;
}

std::string renderWindowLine(const WindowDescriptor& window, bool detailed) {
    std::ostringstream line;
    line << window.index << ". " << window.title
         << " (Process: " << window.processName;
    if (detailed) {
        line << ", PID: " << window.pid
             << ", Handle: " << formatHandle(window.handle)
             << ", State: " << windowStateName(window.state);
    }
    line << ")";
    return line.str();
}

}  // namespace

bool buildCaptureRequest(const TakeScreenshotArgs& args, CaptureRequest& out,
                         Failure& err) {
    CaptureRequest request;
    request.options.allowFocus = args.allowFocus;
    request.options.restoreIfMinimized = args.restoreIfMinimized;
    if (present(args.filename)) {
        request.filename = *args.filename;
    }
    request.folder = args.folder;

    WindowSelector selector;
    selector.filter = args.filter.value_or("");
    if (present(args.windowHandle)) {
        WindowHandle handle = 0;
        if (!parseWindowHandle(*args.windowHandle, handle, err)) {
            return false;
        }
        selector.target = ByHandle{handle};
        request.target = selector;
    } else if (args.windowNumber) {
        selector.target = ByIndex{*args.windowNumber};
        request.target = selector;
    } else if (present(args.windowTitle)) {
        selector.target = ByTitle{*args.windowTitle};
        request.target = selector;
    } else if (present(args.processName)) {
        selector.target = ByProcess{*args.processName};
        request.target = selector;
    } else {
        MonitorSelector monitor;
        if (!parseMonitorSelector(args.monitor.value_or("all"), monitor,
                                  err)) {
            return false;
        }
        request.target = monitor;
    }

    out = std::move(request);
    return true;
}

ScreenshotService::ScreenshotService(DesktopFactory factory,
                                     CaptureTuning tuning)
    : factory_(std::move(factory)), tuning_(tuning) {}

bool ScreenshotService::openDesktop(std::unique_ptr<IDesktop>& out,
                                    Failure& err) {
    std::string why;
    out = factory_ ? factory_(&why) : nullptr;
    if (!out) {
        return fail(err, ErrorKind::Environment, "connect",
                    why.empty() ? "No desktop available" : why);
    }
    return true;
}

ToolResponse ScreenshotService::listWindows(const ListWindowsArgs& args) {
    Failure failure;
    try {
        std::unique_ptr<IDesktop> desktop;
        if (!openDesktop(desktop, failure)) {
            LOG_ERROR("list windows: %s", failure.message.c_str());
            return errorResponse("Failed to list windows:", failure);
        }
        const bool detailed = toLower(args.format) == "detailed";
        auto windows = enumerateWindows(*desktop, args.filter);
        ToolResponse response;
        if (windows.empty()) {
            response.text = "No windows found";
            return response;
        }
        for (size_t i = 0; i < windows.size(); ++i) {
            if (i > 0) {
                response.text += "\n";
            }
            response.text += renderWindowLine(windows[i], detailed);
        }
        return response;
    } catch (const std::exception& e) {
        fail(failure, ErrorKind::Environment, "list", e.what());
        LOG_ERROR("list windows: %s", e.what());
        return errorResponse("Failed to list windows:", failure);
    }
}

ToolResponse ScreenshotService::listMonitors() {
    Failure failure;
    try {
        std::unique_ptr<IDesktop> desktop;
        if (!openDesktop(desktop, failure)) {
            LOG_ERROR("list monitors: %s", failure.message.c_str());
            return errorResponse("Failed to list monitors:", failure);
        }
        auto monitors = enumerateMonitors(*desktop);
        ToolResponse response;
        if (monitors.empty()) {
            response.text = "No monitors found";
            return response;
        }
        std::ostringstream text;
        for (size_t i = 0; i < monitors.size(); ++i) {
            const auto& m = monitors[i];
            if (i > 0) {
                text << "\n";
            }
            text << m.ordinal << ". " << m.name << " " << m.bounds.x << ","
                 << m.bounds.y << " " << m.bounds.w << "x" << m.bounds.h;
            if (m.primary) {
                text << " (primary)";
            }
        }
        Rect all = unionOf(monitors);
        text << "\nVirtual screen: " << all.x << "," << all.y << " " << all.w
             << "x" << all.h;
        response.text = text.str();
        return response;
    } catch (const std::exception& e) {
        fail(failure, ErrorKind::Environment, "list", e.what());
        LOG_ERROR("list monitors: %s", e.what());
        return errorResponse("Failed to list monitors:", failure);
    }
}

bool ScreenshotService::captureTarget(IDesktop& desktop,
                                      const CaptureRequest& request,
                                      ImageRGBA& image, Failure& err) {
    if (const auto* monitor = std::get_if<MonitorSelector>(&request.target)) {
        Rect region;
        if (!resolveMonitorRegion(desktop, *monitor, region, err)) {
            return false;
        }
        return captureRegion(desktop, region, image, err);
    }

    const auto& selector = std::get<WindowSelector>(request.target);
    WindowDescriptor target;
    if (!resolveWindow(desktop, selector, target, err)) {
        return false;
    }
    CaptureStrategy strategy(desktop, request.options, tuning_);
    WindowCapture capture;
    if (!strategy.run(target, capture, err)) {
        return false;
    }
    LOG_INFO("captured window %s via %s capture",
             formatHandle(target.handle).c_str(),
             capturePathName(capture.path));
    image = std::move(capture.image);
    return true;
}

bool ScreenshotService::takeScreenshotImpl(const TakeScreenshotArgs& args,
                                           std::string& savedTo,
                                           Failure& err) {
    CaptureRequest request;
    if (!buildCaptureRequest(args, request, err)) {
        return false;
    }

    OutputLocation location;
    if (!resolveOutputLocation(request.folder, request.filename, location,
                               err)) {
        return false;
    }

    std::unique_ptr<IDesktop> desktop;
    if (!openDesktop(desktop, err)) {
        return false;
    }

    ImageRGBA image;
    if (!captureTarget(*desktop, request, image, err)) {
        return false;
    }
    if (!writeImage(location.outputPath, image, err)) {
        return false;
    }
    savedTo = location.displayPath;
    return true;
}

ToolResponse ScreenshotService::takeScreenshot(const TakeScreenshotArgs& args) {
    const double started = nowSeconds();
    Failure failure;
    std::string savedTo;
    bool ok = false;
    try {
        ok = takeScreenshotImpl(args, savedTo, failure);
    } catch (const std::filesystem::filesystem_error& e) {
        fail(failure, ErrorKind::IO, "output", e.what());
    } catch (const std::exception& e) {
        fail(failure, ErrorKind::Environment, "capture", e.what());
    }

    if (!ok) {
        LOG_ERROR("screenshot failed in %s: %s", failure.stage.c_str(),
                  failure.message.c_str());
        return errorResponse("Failed to take screenshot:", failure);
    }
    LOG_DEBUG("screenshot took %.3fs", nowSeconds() - started);
    ToolResponse response;
    response.text = "Screenshot saved successfully to: " + savedTo;
    return response;
}

}  // namespace winshot
