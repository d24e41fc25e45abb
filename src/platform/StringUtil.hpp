#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <string>

namespace winshot {

inline std::string toLower(const std::string& in) {
    std::string out = in;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Case-insensitive (ASCII) substring test. An empty needle always matches.
inline bool containsIgnoreCase(const std::string& haystack,
                               const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

// Removes every ".exe" occurrence regardless of case.
inline std::string stripExeSuffix(const std::string& in) {
    std::string out = in;
    std::string lower = toLower(out);
    const std::string exe = ".exe";
    size_t pos = lower.find(exe);
    while (pos != std::string::npos) {
        out.erase(pos, exe.size());
        lower.erase(pos, exe.size());
        pos = lower.find(exe, pos);
    }
    return out;
}

inline int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

// Accepts "0x1a2b" / "0X1A2B" or plain decimal. Rejects empty input, signs,
// stray characters and values that do not fit in 64 bits.
inline bool parseUnsigned(const std::string& text, std::uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    std::uint64_t value = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        for (size_t i = 2; i < text.size(); ++i) {
            int digit = hexValue(text[i]);
            if (digit < 0 || value > (UINT64_MAX >> 4)) {
                return false;
            }
            value = (value << 4) | static_cast<std::uint64_t>(digit);
        }
    } else {
        for (char c : text) {
            if (c < '0' || c > '9') {
                return false;
            }
            auto digit = static_cast<std::uint64_t>(c - '0');
            if (value > (UINT64_MAX - digit) / 10) {
                return false;
            }
            value = value * 10 + digit;
        }
    }
    out = value;
    return true;
}

inline bool parseInt(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    size_t i = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        i = 1;
    }
    if (i == text.size()) {
        return false;
    }
    long long value = 0;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
        if (value > 2147483648LL) {
            return false;
        }
    }
    if (negative) {
        value = -value;
    }
    if (value > 2147483647LL) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

inline std::string formatHandle(std::uint64_t handle) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "0x%08llX",
                  static_cast<unsigned long long>(handle));
    return buf;
}

}  // namespace winshot
