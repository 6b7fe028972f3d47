#include "model.hpp"
#include "util.hpp"

namespace cordbridge {

bool is_sendable(ChannelKind kind) {
    return kind == ChannelKind::Text || kind == ChannelKind::News ||
           kind == ChannelKind::Thread;
}

const char* channel_kind_name(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::Text:     return "text";
        case ChannelKind::News:     return "news";
        case ChannelKind::Thread:   return "thread";
        case ChannelKind::Voice:    return "voice";
        case ChannelKind::Category: return "category";
        case ChannelKind::Other:    return "other";
    }
    return "other";
}

ChannelKind channel_kind_from_name(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "text" || n.empty()) return ChannelKind::Text;  // older state files omit kind
    if (n == "news")     return ChannelKind::News;
    if (n == "thread")   return ChannelKind::Thread;
    if (n == "voice")    return ChannelKind::Voice;
    if (n == "category") return ChannelKind::Category;
    return ChannelKind::Other;
}

} // namespace cordbridge
