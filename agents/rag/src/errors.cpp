#include "../include/errors.hpp"

const char* to_string(BackendErrorKind kind) {
    switch (kind) {
        case BackendErrorKind::Unavailable: return "unavailable";
        case BackendErrorKind::Timeout: return "timeout";
        case BackendErrorKind::InvalidResponse: return "invalid response";
    }
    return "unknown";
}
