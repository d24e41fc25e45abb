#pragma once

#include <string>
#include <utility>

namespace winshot {

enum class ErrorKind { Resolution, State, Capture, Environment, IO };

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Resolution:
            return "ResolutionError";
        case ErrorKind::State:
            return "StateError";
        case ErrorKind::Capture:
            return "CaptureError";
        case ErrorKind::Environment:
            return "EnvironmentError";
        case ErrorKind::IO:
            return "IOError";
    }
    return "CaptureError";
}

struct Failure {
    ErrorKind kind = ErrorKind::Capture;
    std::string stage;
    std::string message;
};

inline bool fail(Failure& out, ErrorKind kind, std::string stage,
                 std::string message) {
    out.kind = kind;
    out.stage = std::move(stage);
    out.message = std::move(message);
    return false;
}

}  // namespace winshot
