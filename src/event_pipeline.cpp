#include "event_pipeline.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace cordbridge {

static constexpr const char* kNoContent = "[no content]";

const char* pipeline_verdict_name(PipelineVerdict verdict) {
    switch (verdict) {
        case PipelineVerdict::Forwarded:      return "forwarded";
        case PipelineVerdict::DroppedDirect:  return "dropped-direct";
        case PipelineVerdict::DroppedWebhook: return "dropped-webhook";
        case PipelineVerdict::DroppedBot:     return "dropped-bot";
        case PipelineVerdict::Duplicate:      return "duplicate";
    }
    return "unknown";
}

std::string resolve_display_text(const InboundMessage& msg) {
    std::string text = msg.trimmed_content.empty()
        ? strip_invisible(msg.raw_content)
        : msg.trimmed_content;
    if (!text.empty()) return text;

    if (!msg.embeds.empty()) {
        std::string desc = strip_invisible(msg.embeds.front().description);
        if (!desc.empty()) return desc;
        std::string title = strip_invisible(msg.embeds.front().title);
        if (!title.empty()) return title;
    }
    if (!msg.attachments.empty() && !msg.attachments.front().url.empty()) {
        return msg.attachments.front().url;
    }
    return kNoContent;
}

EventPipeline::EventPipeline(EventLoop& loop, EventBus& bus, PipelineOptions options)
    : loop_(loop), bus_(bus), options_(options)
{
    message_sub_ = subscribe<MessageReceivedEvent>(bus_,
        [this](const MessageReceivedEvent& ev) {
            PipelineVerdict verdict = process(ev.message);
            if (verdict != PipelineVerdict::Forwarded && verdict != PipelineVerdict::Duplicate) {
                std::cerr << "[pipeline] Message " << ev.message.id << " "
                          << pipeline_verdict_name(verdict) << "\n";
            }
        });
    identity_sub_ = subscribe<SelfIdentityEvent>(bus_,
        [this](const SelfIdentityEvent& ev) { set_self(ev.self); });
}

EventPipeline::~EventPipeline() {
    bus_.unsubscribe(message_sub_);
    bus_.unsubscribe(identity_sub_);
}

bool EventPipeline::is_duplicate(const InboundMessage& msg) {
    uint64_t now = loop_.now_ms();
    auto& last = last_seen_[msg.channel_id];
    bool dup = !last.message_id.empty() && last.message_id == msg.id &&
               now - last.seen_at < options_.dedupe_window_ms;
    last.message_id = msg.id;
    last.seen_at = now;
    return dup;
}

PipelineVerdict EventPipeline::process(InboundMessage msg) {
    if (msg.guild_id.empty() || msg.channel_id.empty())
        return PipelineVerdict::DroppedDirect;
    if (!msg.webhook_id.empty())
        return PipelineVerdict::DroppedWebhook;

    bool from_self = !self_.id.empty() && msg.author.id == self_.id;
    if (options_.drop_other_bots && msg.author.bot && !from_self)
        return PipelineVerdict::DroppedBot;

    if (is_duplicate(msg)) {
        std::cerr << "[pipeline] Suppressed duplicate " << msg.id << " in channel "
                  << msg.channel_id << "\n";
        return PipelineVerdict::Duplicate;
    }

    msg.trimmed_content = strip_invisible(msg.raw_content);
    msg.display_text = resolve_display_text(msg);
    msg.from_self = from_self;

    bool pinged = !self_.id.empty() &&
        std::any_of(msg.mentions.begin(), msg.mentions.end(),
                    [this](const UserRef& u) { return u.id == self_.id; });

    PingDetectedEvent ping_ev;
    if (pinged) {
        PingNotice& p = ping_ev.ping;
        p.message_id = msg.id;
        p.from = msg.author;
        p.guild_id = msg.guild_id;
        p.guild_name = msg.guild_name;
        p.channel_id = msg.channel_id;
        p.channel_name = msg.channel_name;
        p.content = msg.display_text;
        p.timestamp = msg.timestamp;
    }

    MessageForwardedEvent fwd;
    fwd.message = std::move(msg);
    bus_.publish(fwd);

    if (pinged) {
        std::cerr << "[pipeline] Ping from " << ping_ev.ping.from.username << " in #"
                  << ping_ev.ping.channel_name << "\n";
        bus_.publish(ping_ev);
    }
    return PipelineVerdict::Forwarded;
}

} // namespace cordbridge
