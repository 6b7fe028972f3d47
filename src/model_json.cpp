#include "model_json.hpp"

#include <cmath>
#include <limits>

namespace cordbridge {

std::string json_string(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return {};
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_unsigned()) return std::to_string(it->get<uint64_t>());
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    return {};
}

// Negative, non-finite or out-of-range numbers read as 0.
static uint64_t json_u64(const nlohmann::json& j, const char* key,
                         uint64_t max = std::numeric_limits<uint64_t>::max()) {
    if (!j.is_object()) return 0;
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0;
    if (it->is_number_float()) {
        double d = it->get<double>();
        if (!std::isfinite(d) || d < 0 || d >= static_cast<double>(max)) return 0;
        return static_cast<uint64_t>(d);
    }
    if (it->is_number_integer() && !it->is_number_unsigned()) {
        int64_t v = it->get<int64_t>();
        if (v < 0) return 0;
        return static_cast<uint64_t>(v) > max ? 0 : static_cast<uint64_t>(v);
    }
    uint64_t v = it->get<uint64_t>();
    return v > max ? 0 : v;
}

// ── Directory ───────────────────────────────────────────────────

nlohmann::json channel_to_json(const Channel& ch) {
    return {{"id", ch.id}, {"name", ch.name}, {"kind", channel_kind_name(ch.kind)}};
}

Channel channel_from_json(const nlohmann::json& j) {
    Channel ch;
    ch.id = json_string(j, "id");
    ch.name = json_string(j, "name");
    ch.kind = channel_kind_from_name(json_string(j, "kind"));
    return ch;
}

nlohmann::json guild_to_json(const Guild& g) {
    nlohmann::json channels = nlohmann::json::array();
    for (const auto& ch : g.channels) {
        channels.push_back(channel_to_json(ch));
    }
    return {{"id", g.id}, {"name", g.name}, {"channels", channels}};
}

Guild guild_from_json(const nlohmann::json& j) {
    Guild g;
    g.id = json_string(j, "id");
    g.name = json_string(j, "name");
    if (j.contains("channels") && j["channels"].is_array()) {
        for (const auto& item : j["channels"]) {
            if (!item.is_object()) continue;
            g.channels.push_back(channel_from_json(item));
        }
    }
    return g;
}

nlohmann::json servers_to_json(const std::vector<Guild>& servers) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& g : servers) {
        arr.push_back(guild_to_json(g));
    }
    return arr;
}

std::vector<Guild> servers_from_json(const nlohmann::json& j) {
    std::vector<Guild> servers;
    if (!j.is_array()) return servers;
    for (const auto& item : j) {
        if (!item.is_object()) continue;
        Guild g = guild_from_json(item);
        if (g.id.empty()) continue;
        servers.push_back(std::move(g));
    }
    return servers;
}

// ── Send requests ───────────────────────────────────────────────

static SendTarget target_from_json(const nlohmann::json& j) {
    SendTarget t;
    t.guild_id = json_string(j, "guildId");
    t.guild_name = json_string(j, "guildName");
    t.channel_id = json_string(j, "channelId");
    t.channel_name = json_string(j, "channelName");
    return t;
}

nlohmann::json send_request_to_json(const SendRequest& req) {
    return {
        {"ref", req.ref},
        {"guildId", req.target.guild_id},
        {"guildName", req.target.guild_name},
        {"channelId", req.target.channel_id},
        {"channelName", req.target.channel_name},
        {"content", req.content},
        {"queuedAt", req.queued_at},
        {"tries", req.tries}
    };
}

SendRequest send_request_from_json(const nlohmann::json& j) {
    SendRequest req;
    if (!j.is_object()) return req;
    const nlohmann::json& body =
        (j.contains("req") && j["req"].is_object()) ? j["req"] : j;
    req.ref = json_string(body, "ref");
    req.target = target_from_json(body);
    req.content = json_string(body, "content");
    req.queued_at = json_u64(j, "queuedAt");
    req.tries = static_cast<uint32_t>(
        json_u64(j, "tries", std::numeric_limits<uint32_t>::max()));
    return req;
}

SendRequest send_request_from_client(const nlohmann::json& msg) {
    SendRequest req;
    req.ref = json_string(msg, "ref");
    req.target = target_from_json(msg);
    req.content = json_string(msg, "content");
    return req;
}

// ── Inbound events ──────────────────────────────────────────────

nlohmann::json user_to_json(const UserRef& u, bool with_bot_flag) {
    nlohmann::json j = {{"id", u.id}, {"username", u.username}};
    if (with_bot_flag) j["bot"] = u.bot;
    return j;
}

static nlohmann::json nullable(const std::string& s) {
    if (s.empty()) return nullptr;
    return s;
}

nlohmann::json message_to_json(const InboundMessage& m) {
    nlohmann::json attachments = nlohmann::json::array();
    for (const auto& a : m.attachments) {
        attachments.push_back({
            {"url", a.url},
            {"name", nullable(a.name)},
            {"contentType", nullable(a.content_type)}
        });
    }
    nlohmann::json embeds = nlohmann::json::array();
    for (const auto& e : m.embeds) {
        embeds.push_back({
            {"title", nullable(e.title)},
            {"description", nullable(e.description)},
            {"type", nullable(e.type)}
        });
    }
    nlohmann::json mentions = nlohmann::json::array();
    for (const auto& u : m.mentions) {
        mentions.push_back(user_to_json(u, false));
    }

    return {
        {"messageId", m.id},
        {"rawContent", m.raw_content},
        {"trimmedContent", m.trimmed_content},
        {"contentLength", m.trimmed_content.size()},
        {"displayText", m.display_text},
        {"attachments", attachments},
        {"embeds", embeds},
        {"mentions", mentions},
        {"isReply", m.is_reply},
        {"author", user_to_json(m.author, true)},
        {"guildId", m.guild_id},
        {"guildName", m.guild_name},
        {"channelId", m.channel_id},
        {"channelName", m.channel_name},
        {"timestamp", m.timestamp},
        {"fromSelf", m.from_self}
    };
}

nlohmann::json ping_to_json(const PingNotice& p) {
    return {
        {"messageId", p.message_id},
        {"from", user_to_json(p.from, false)},
        {"guildId", p.guild_id},
        {"guildName", p.guild_name},
        {"channelId", p.channel_id},
        {"channelName", p.channel_name},
        {"content", p.content},
        {"timestamp", p.timestamp}
    };
}

nlohmann::json history_to_json(const std::vector<HistoryEntry>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        arr.push_back({
            {"id", e.id},
            {"author", user_to_json(e.author, false)},
            {"content", e.content},
            {"timestamp", e.timestamp}
        });
    }
    return arr;
}

} // namespace cordbridge
