#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace cordbridge {

// Normalized channel kind. Produced only by upstream adapters; every other
// component sees this enum, never platform type codes.
enum class ChannelKind { Text, News, Thread, Voice, Category, Other };

// Text, News and Thread channels accept messages.
bool is_sendable(ChannelKind kind);

const char* channel_kind_name(ChannelKind kind);
ChannelKind channel_kind_from_name(const std::string& name);

struct Channel {
    std::string id;
    std::string name;
    ChannelKind kind = ChannelKind::Text;
};

struct Guild {
    std::string id;
    std::string name;
    std::vector<Channel> channels;
};

// Each half is one reference: either field may hold an id or a name.
struct SendTarget {
    std::string guild_id;
    std::string guild_name;
    std::string channel_id;
    std::string channel_name;
};

struct SendRequest {
    std::string ref;
    SendTarget target;
    std::string content;
    uint64_t queued_at = 0;  // epoch ms
    uint32_t tries = 0;
};

struct UserRef {
    std::string id;
    std::string username;
    bool bot = false;
};

struct Attachment {
    std::string url;
    std::string name;
    std::string content_type;
};

struct Embed {
    std::string title;
    std::string description;
    std::string type;
};

// One inbound platform message. The adapter fills the raw fields;
// EventPipeline fills trimmed_content, display_text and from_self.
struct InboundMessage {
    std::string id;
    UserRef author;
    std::string webhook_id;
    std::string guild_id;
    std::string guild_name;
    std::string channel_id;
    std::string channel_name;
    std::string raw_content;
    std::string trimmed_content;
    std::string display_text;
    std::vector<Attachment> attachments;
    std::vector<Embed> embeds;
    std::vector<UserRef> mentions;
    bool is_reply = false;
    bool from_self = false;
    uint64_t timestamp = 0;  // epoch ms
};

// Derived from an InboundMessage whose mentions include the upstream identity.
struct PingNotice {
    std::string message_id;
    UserRef from;
    std::string guild_id;
    std::string guild_name;
    std::string channel_id;
    std::string channel_name;
    std::string content;
    uint64_t timestamp = 0;
};

struct HistoryEntry {
    std::string id;
    UserRef author;
    std::string content;
    uint64_t timestamp = 0;
};

} // namespace cordbridge
