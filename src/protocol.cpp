#include "protocol.hpp"
#include "model_json.hpp"

namespace cordbridge {
namespace protocol {

nlohmann::json bridge_status(bool discord_ready) {
    // The bridge itself is up whenever it can answer.
    return {{"type", "bridgeStatus"}, {"bridgeConnected", true}, {"discordReady", discord_ready}};
}

nlohmann::json ready(bool value) {
    return {{"type", "ready"}, {"value", value}};
}

nlohmann::json discord_ready(const UserRef& self) {
    return {{"type", "discordReady"}, {"data", user_to_json(self, false)}};
}

nlohmann::json server_partial(const Guild& guild) {
    return {{"type", "serverPartial"}, {"guild", guild_to_json(guild)}};
}

nlohmann::json server_list(const std::vector<Guild>& servers) {
    return {{"type", "serverList"}, {"servers", servers_to_json(servers)}};
}

nlohmann::json message(const InboundMessage& msg) {
    return {{"type", "message"}, {"data", message_to_json(msg)}};
}

nlohmann::json ping(const PingNotice& ping) {
    return {{"type", "ping"}, {"data", ping_to_json(ping)}};
}

nlohmann::json ack(const SendAck& ack) {
    nlohmann::json j = {{"type", "ack"}, {"ok", ack.ok}, {"ref", ack.ref}};
    if (!ack.error.empty()) j["error"] = ack.error;
    if (ack.queued) j["queued"] = true;
    if (ack.skipped) j["skipped"] = true;
    return j;
}

nlohmann::json pong(uint64_t ts) {
    return {{"type", "pong"}, {"ts", ts}};
}

nlohmann::json heartbeat(uint64_t ts) {
    return {{"type", "hb"}, {"ts", ts}};
}

nlohmann::json error(const std::string& error, const std::string& raw) {
    nlohmann::json j = {{"type", "error"}, {"error", error}};
    if (!raw.empty()) j["raw"] = raw;
    return j;
}

nlohmann::json messages(const std::string& ref, const std::vector<HistoryEntry>& entries) {
    return {{"type", "messages"}, {"ref", ref}, {"data", history_to_json(entries)}};
}

nlohmann::json messages_error(const std::string& ref, const std::string& error) {
    return {{"type", "messages"}, {"ref", ref}, {"error", error}};
}

nlohmann::json guild_channels(const std::string& ref, const Guild& guild) {
    return {{"type", "guildChannels"}, {"ref", ref}, {"guild", guild_to_json(guild)}};
}

std::string dump(const nlohmann::json& msg) {
    return msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace protocol
} // namespace cordbridge
