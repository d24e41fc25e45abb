#include "capture/CaptureStrategy.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "platform/Log.hpp"
#include "platform/StringUtil.hpp"

namespace winshot {

const char* captureStageName(CaptureStage stage) {
    switch (stage) {
        case CaptureStage::Resolved:
            return "resolved";
        case CaptureStage::CheckState:
            return "check-state";
        case CaptureStage::RestoreWindow:
            return "restore-window";
        case CaptureStage::CaptureBackground:
            return "capture-background";
        case CaptureStage::CaptureForegroundFallback:
            return "capture-foreground";
        case CaptureStage::RestoreOriginalState:
            return "restore-original-state";
        case CaptureStage::Done:
            return "done";
        case CaptureStage::Failed:
            return "failed";
    }
    return "unknown";
}

const char* capturePathName(CapturePath path) {
    return path == CapturePath::Background ? "background" : "foreground";
}

Rect computeCaptureBounds(const Rect& windowRect, int padding) {
    int left = std::max(0, windowRect.x - padding);
    int top = std::max(0, windowRect.y - padding);
    int right = windowRect.right() + padding;
    int bottom = windowRect.bottom() + padding;
    return Rect{left, top, right - left, bottom - top};
}

CaptureStrategy::CaptureStrategy(IDesktop& desktop, CaptureOptions options,
                                 CaptureTuning tuning)
    : desktop_(desktop), options_(options), tuning_(tuning) {}

void CaptureStrategy::enter(CaptureStage next) {
    LOG_DEBUG("capture: %s -> %s", captureStageName(stage_),
              captureStageName(next));
    stage_ = next;
}

bool CaptureStrategy::abort(Failure& err, ErrorKind kind, std::string message,
                            WindowHandle window, const Changes& changes) {
    const char* failedIn = captureStageName(stage_);
    if (changes.restored || changes.focusChanged) {
        restoreOriginalState(window, changes);
    }
    enter(CaptureStage::Failed);
    return fail(err, kind, failedIn, std::move(message));
}

bool CaptureStrategy::run(const WindowDescriptor& target, WindowCapture& out,
                          Failure& err) {
    const WindowHandle window = target.handle;
    Changes changes;
    changes.priorFocus = desktop_.foregroundWindow();

    Rect bounds;
    ImageRGBA image;
    CapturePath path = CapturePath::Background;

    stage_ = CaptureStage::Resolved;
    while (stage_ != CaptureStage::Done) {
        switch (stage_) {
            case CaptureStage::Resolved:
                enter(CaptureStage::CheckState);
                break;

            case CaptureStage::CheckState: {
                auto state = desktop_.windowState(window);
                if (!state) {
                    return abort(err, ErrorKind::Capture,
                                 "Window " + formatHandle(window) +
                                     " does not exist or cannot be queried",
                                 window, changes);
                }
                changes.wasMinimized = (*state == WindowState::Minimized);
                if (changes.wasMinimized && !options_.restoreIfMinimized) {
                    return abort(err, ErrorKind::State,
                                 "Target window is minimized. Set "
                                 "restoreIfMinimized: true to capture.",
                                 window, changes);
                }
                enter(changes.wasMinimized ? CaptureStage::RestoreWindow
                                           : CaptureStage::CaptureBackground);
                break;
            }

            case CaptureStage::RestoreWindow:
                restoreFromMinimized(window);
                changes.restored = true;
                enter(CaptureStage::CaptureBackground);
                break;

            case CaptureStage::CaptureBackground: {
                std::string why;
                if (!captureBounds(window, bounds, why)) {
                    return abort(err, ErrorKind::Capture, why, window,
                                 changes);
                }
                if (desktop_.composeWindow(window, bounds, image)) {
                    path = CapturePath::Background;
                    enter(CaptureStage::RestoreOriginalState);
                } else {
                    LOG_DEBUG("capture: background capture of %s failed",
                              formatHandle(window).c_str());
                    enter(CaptureStage::CaptureForegroundFallback);
                }
                break;
            }

            case CaptureStage::CaptureForegroundFallback:
                if (!options_.allowFocus) {
                    return abort(err, ErrorKind::Capture,
                                 "Background capture failed for this window. "
                                 "Retry with allowFocus: true.",
                                 window, changes);
                }
                if (!desktop_.setForeground(window)) {
                    LOG_WARN("capture: could not raise %s, copying anyway",
                             formatHandle(window).c_str());
                }
                changes.focusChanged = true;
                desktop_.sleepFor(tuning_.foregroundSettle);
                if (!desktop_.copyScreenRegion(bounds, image)) {
                    return abort(err, ErrorKind::Capture,
                                 "Foreground capture failed for window " +
                                     formatHandle(window),
                                 window, changes);
                }
                path = CapturePath::Foreground;
                enter(CaptureStage::RestoreOriginalState);
                break;

            case CaptureStage::RestoreOriginalState:
                restoreOriginalState(window, changes);
                enter(CaptureStage::Done);
                break;

            case CaptureStage::Done:
            case CaptureStage::Failed:
                break;
        }
    }

    out.image = std::move(image);
    out.bounds = bounds;
    out.path = path;
    LOG_DEBUG("capture: %s captured %dx%d via %s", formatHandle(window).c_str(),
              out.image.w, out.image.h, capturePathName(path));
    return true;
}

void CaptureStrategy::restoreFromMinimized(WindowHandle window) {
    if (!desktop_.unminimize(window)) {
        LOG_WARN("capture: un-minimize request for %s was rejected",
                 formatHandle(window).c_str());
    }
    for (int attempt = 0; attempt < tuning_.restorePollAttempts; ++attempt) {
        auto state = desktop_.windowState(window);
        if (state && *state != WindowState::Minimized) {
            LOG_DEBUG("capture: window restored after %d polls", attempt);
            return;
        }
        desktop_.sleepFor(tuning_.restorePollInterval);
    }
    LOG_WARN("capture: %s still minimized after %d polls, continuing",
             formatHandle(window).c_str(), tuning_.restorePollAttempts);
}

bool CaptureStrategy::captureBounds(WindowHandle window, Rect& bounds,
                                    std::string& why) {
    auto rect = desktop_.windowRect(window);
    if (!rect) {
        why = "Could not read the bounds of window " + formatHandle(window);
        return false;
    }
    bounds = computeCaptureBounds(*rect, tuning_.padding);
    if (bounds.empty()) {
        why = "Window " + formatHandle(window) + " has an empty area";
        return false;
    }
    LOG_DEBUG("capture: window rect %d,%d %dx%d, bounds %d,%d %dx%d", rect->x,
              rect->y, rect->w, rect->h, bounds.x, bounds.y, bounds.w,
              bounds.h);
    return true;
}

void CaptureStrategy::restoreOriginalState(WindowHandle window,
                                           const Changes& changes) {
    if (changes.wasMinimized && changes.restored) {
        if (!desktop_.minimize(window)) {
            LOG_WARN("capture: could not minimize %s again",
                     formatHandle(window).c_str());
        }
    }
    const WindowHandle prior = changes.priorFocus;
    if (prior != 0 && prior != window &&
        desktop_.foregroundWindow() != prior) {
        if (!desktop_.setForeground(prior)) {
            LOG_WARN("capture: could not return focus to %s",
                     formatHandle(prior).c_str());
        }
    }
}

}  // namespace winshot
