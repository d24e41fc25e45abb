#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace winshot {

using WindowHandle = std::uint64_t;

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int right() const {
        return x + w;
    }
    int bottom() const {
        return y + h;
    }
    bool empty() const {
        return w <= 0 || h <= 0;
    }
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

inline bool operator!=(const Rect& a, const Rect& b) {
    return !(a == b);
}

struct ImageRGBA {
    int w = 0;
    int h = 0;
    std::vector<std::uint8_t> rgba;

    void allocate(int width, int height) {
        w = width;
        h = height;
        rgba.assign(static_cast<size_t>(width) * static_cast<size_t>(height) *
                        4u,
                    0);
    }
};

enum class WindowState { Normal, Minimized, Maximized };

inline const char* windowStateName(WindowState state) {
    switch (state) {
        case WindowState::Normal:
            return "Normal";
        case WindowState::Minimized:
            return "Minimized";
        case WindowState::Maximized:
            return "Maximized";
    }
    return "Normal";
}

// Snapshot of one top-level window. Only meaningful for the enumeration
// that produced it; the window may close or move afterwards.
struct WindowDescriptor {
    WindowHandle handle = 0;
    std::string title;
    std::string processName;
    std::uint32_t pid = 0;
    WindowState state = WindowState::Normal;
    int index = 0;
};

struct MonitorDescriptor {
    int ordinal = 0;
    std::string name;
    Rect bounds;
    bool primary = false;
};

}  // namespace winshot
