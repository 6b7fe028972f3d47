#pragma once
#include <stdexcept>
#include <string>

namespace cordbridge {

// Failure taxonomy shared by every component boundary.
enum class ErrorKind {
    Auth,          // credential rejected fatal
    Directory,     // per-guild fetch failed guild degrades to empty
    Resolution,    // guild/channel not found terminal, never retried
    Transport,     // upstream call failed while connected retryable
    Availability,  // upstream not connected request parked
    Persistence,   // state file read/write failed logged only
};

const char* error_kind_name(ErrorKind kind);

struct UpstreamError {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
};

// Thrown when the process cannot continue without a valid credential.
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& what) : std::runtime_error(what) {}
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Auth:         return "auth";
        case ErrorKind::Directory:    return "directory";
        case ErrorKind::Resolution:   return "resolution";
        case ErrorKind::Transport:    return "transport";
        case ErrorKind::Availability: return "availability";
        case ErrorKind::Persistence:  return "persistence";
    }
    return "unknown";
}

} // namespace cordbridge
