#pragma once
#include "model.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include <string>
#include <unordered_map>
#include <cstdint>

namespace cordbridge {

struct PipelineOptions {
    uint32_t dedupe_window_ms = 1500;
    bool drop_other_bots = true;
};

enum class PipelineVerdict {
    Forwarded,
    DroppedDirect,   // no guild/channel context
    DroppedWebhook,
    DroppedBot,      // another automated account
    Duplicate,       // same id seen on the channel within the window
};

const char* pipeline_verdict_name(PipelineVerdict verdict);

// First non-empty of: trimmed text, first embed description, first embed
// title, first attachment URL; "[no content]" otherwise.
std::string resolve_display_text(const InboundMessage& msg);

// Turns raw MessageReceivedEvents into MessageForwardedEvents, plus a
// PingDetectedEvent when the message mentions the upstream identity.
class EventPipeline {
public:
    EventPipeline(EventLoop& loop, EventBus& bus, PipelineOptions options = {});
    ~EventPipeline();

    EventPipeline(const EventPipeline&) = delete;
    EventPipeline& operator=(const EventPipeline&) = delete;

    PipelineVerdict process(InboundMessage msg);

    void set_self(const UserRef& self) { self_ = self; }
    const UserRef& self() const { return self_; }

private:
    struct LastSeen {
        std::string message_id;
        uint64_t seen_at = 0;  // loop ms
    };

    bool is_duplicate(const InboundMessage& msg);

    EventLoop& loop_;
    EventBus& bus_;
    PipelineOptions options_;
    UserRef self_;
    std::unordered_map<std::string, LastSeen> last_seen_;  // by channel id

    uint64_t message_sub_ = 0;
    uint64_t identity_sub_ = 0;
};

} // namespace cordbridge
