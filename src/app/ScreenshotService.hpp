#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "capture/CaptureError.hpp"
#include "capture/CaptureRequest.hpp"
#include "capture/CaptureStrategy.hpp"
#include "desktop/IDesktop.hpp"

namespace winshot {

struct ListWindowsArgs {
    std::string filter;
    std::string format = "simple";
};

// Caller-facing request: every field optional, several may be set at once.
// buildCaptureRequest() decides which one is honoured.
struct TakeScreenshotArgs {
    std::optional<std::string> filename;
    std::optional<std::string> monitor;
    std::optional<std::string> windowTitle;
    std::optional<std::string> processName;
    std::optional<int> windowNumber;
    std::optional<std::string> windowHandle;
    std::optional<std::string> filter;
    bool allowFocus = false;
    bool restoreIfMinimized = false;
    std::optional<std::string> folder;
};

struct ToolResponse {
    std::string text;
    bool isError = false;
    std::optional<ErrorKind> errorKind;
};

using DesktopFactory =
    std::function<std::unique_ptr<IDesktop>(std::string* err)>;

// Window selection priority: handle, then number, then title, then process
// name. With none of them the request targets monitors.
bool buildCaptureRequest(const TakeScreenshotArgs& args, CaptureRequest& out,
                         Failure& err);

// Request boundary. Each call opens its own desktop connection, and no
// failure escapes as an exception: everything becomes an error response.
class ScreenshotService {
public:
    explicit ScreenshotService(DesktopFactory factory,
                               CaptureTuning tuning = {});

    ToolResponse listWindows(const ListWindowsArgs& args);
    ToolResponse listMonitors();
    ToolResponse takeScreenshot(const TakeScreenshotArgs& args);

private:
    bool openDesktop(std::unique_ptr<IDesktop>& out, Failure& err);
    bool captureTarget(IDesktop& desktop, const CaptureRequest& request,
                       ImageRGBA& image, Failure& err);
    bool takeScreenshotImpl(const TakeScreenshotArgs& args,
                            std::string& savedTo, Failure& err);

    DesktopFactory factory_;
    CaptureTuning tuning_;
};

}  // namespace winshot
