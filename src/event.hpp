#pragma once
#include "model.hpp"
#include "upstream.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace cordbridge {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* UpstreamStatusChanged = "UpstreamStatusChanged";
    constexpr const char* SelfIdentity          = "SelfIdentity";
    constexpr const char* MessageReceived       = "MessageReceived";
    constexpr const char* MessageForwarded      = "MessageForwarded";
    constexpr const char* PingDetected          = "PingDetected";
    constexpr const char* DirectoryBuildStarted = "DirectoryBuildStarted";
    constexpr const char* GuildCached           = "GuildCached";
    constexpr const char* DirectoryBuilt        = "DirectoryBuilt";
    constexpr const char* SendAck               = "SendAck";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct UpstreamStatusEvent : Event {
    static constexpr const char* TAG = event_tags::UpstreamStatusChanged;
    UpstreamStatus status = UpstreamStatus::Disconnected;
    UpstreamStatus previous = UpstreamStatus::Disconnected;

    UpstreamStatusEvent() { type_tag = TAG; }
};

struct SelfIdentityEvent : Event {
    static constexpr const char* TAG = event_tags::SelfIdentity;
    UserRef self;

    SelfIdentityEvent() { type_tag = TAG; }
};

// Raw inbound message straight from the upstream adapter.
struct MessageReceivedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageReceived;
    InboundMessage message;

    MessageReceivedEvent() { type_tag = TAG; }
};

// Message that passed filtering and dedupe, display fields resolved.
struct MessageForwardedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageForwarded;
    InboundMessage message;

    MessageForwardedEvent() { type_tag = TAG; }
};

struct PingDetectedEvent : Event {
    static constexpr const char* TAG = event_tags::PingDetected;
    PingNotice ping;

    PingDetectedEvent() { type_tag = TAG; }
};

struct DirectoryBuildStartedEvent : Event {
    static constexpr const char* TAG = event_tags::DirectoryBuildStarted;
    size_t guild_count = 0;

    DirectoryBuildStartedEvent() { type_tag = TAG; }
};

// One guild visited during a progressive build.
struct GuildCachedEvent : Event {
    static constexpr const char* TAG = event_tags::GuildCached;
    Guild guild;  // sendable channels only

    GuildCachedEvent() { type_tag = TAG; }
};

struct DirectoryBuiltEvent : Event {
    static constexpr const char* TAG = event_tags::DirectoryBuilt;
    std::vector<Guild> servers;  // sendable channels only

    DirectoryBuiltEvent() { type_tag = TAG; }
};

struct SendAck {
    std::string ref;
    bool ok = false;
    bool queued = false;
    bool skipped = false;
    std::string error;
};

struct SendAckEvent : Event {
    static constexpr const char* TAG = event_tags::SendAck;
    SendAck ack;

    SendAckEvent() { type_tag = TAG; }
};

} // namespace cordbridge
