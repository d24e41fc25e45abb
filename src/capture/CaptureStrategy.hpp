#pragma once

#include <chrono>
#include <string>

#include "capture/CaptureError.hpp"
#include "capture/CaptureRequest.hpp"
#include "capture/CaptureTypes.hpp"
#include "desktop/IDesktop.hpp"

namespace winshot {

struct CaptureTuning {
    int padding = 10;
    int restorePollAttempts = 40;
    std::chrono::milliseconds restorePollInterval{50};
    std::chrono::milliseconds foregroundSettle{200};
};

enum class CaptureStage {
    Resolved,
    CheckState,
    RestoreWindow,
    CaptureBackground,
    CaptureForegroundFallback,
    RestoreOriginalState,
    Done,
    Failed
};

const char* captureStageName(CaptureStage stage);

enum class CapturePath { Background, Foreground };

const char* capturePathName(CapturePath path);

struct WindowCapture {
    ImageRGBA image;
    Rect bounds;
    CapturePath path = CapturePath::Background;
};

// Window rectangle grown by `padding` on every side, origin clamped to the
// non-negative quadrant.
Rect computeCaptureBounds(const Rect& windowRect, int padding);

// Drives one window capture:
//   Resolved -> CheckState -> [RestoreWindow] -> CaptureBackground
//     -> [CaptureForegroundFallback] -> RestoreOriginalState -> Done
// Any stage may end in Failed. An instance handles a single request.
class CaptureStrategy {
public:
    CaptureStrategy(IDesktop& desktop, CaptureOptions options,
                    CaptureTuning tuning = {});

    bool run(const WindowDescriptor& target, WindowCapture& out,
             Failure& err);

    CaptureStage stage() const {
        return stage_;
    }

private:
    // What RestoreOriginalState has to undo.
    struct Changes {
        WindowHandle priorFocus = 0;
        bool wasMinimized = false;
        bool restored = false;
        bool focusChanged = false;
    };

    void enter(CaptureStage next);
    bool abort(Failure& err, ErrorKind kind, std::string message,
               WindowHandle window, const Changes& changes);

    void restoreFromMinimized(WindowHandle window);
    bool captureBounds(WindowHandle window, Rect& bounds, std::string& why);
    void restoreOriginalState(WindowHandle window, const Changes& changes);

    IDesktop& desktop_;
    CaptureOptions options_;
    CaptureTuning tuning_;
    CaptureStage stage_ = CaptureStage::Resolved;
};

}  // namespace winshot
