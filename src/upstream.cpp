#include "upstream.hpp"
#include "util.hpp"

namespace cordbridge {

const char* upstream_status_name(UpstreamStatus status) {
    switch (status) {
        case UpstreamStatus::Disconnected: return "disconnected";
        case UpstreamStatus::Connecting:   return "connecting";
        case UpstreamStatus::Connected:    return "connected";
        case UpstreamStatus::AuthFailed:   return "auth-failed";
    }
    return "unknown";
}

std::optional<PresenceKind> presence_kind_from_name(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "playing")   return PresenceKind::Playing;
    if (n == "listening") return PresenceKind::Listening;
    if (n == "watching")  return PresenceKind::Watching;
    if (n == "competing") return PresenceKind::Competing;
    return std::nullopt;
}

} // namespace cordbridge
