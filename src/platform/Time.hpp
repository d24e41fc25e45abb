#pragma once

#include <chrono>
#include <thread>

namespace winshot {

inline double nowSeconds() {
    using clock = std::chrono::steady_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

inline void sleepMillis(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

}  // namespace winshot
