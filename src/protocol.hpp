#pragma once
#include "model.hpp"
#include "event.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cordbridge {

// Server -> client message builders. Every message is a JSON object with a
// "type" member; the remaining members depend on the type.
namespace protocol {

nlohmann::json bridge_status(bool discord_ready);
nlohmann::json ready(bool value);
nlohmann::json discord_ready(const UserRef& self);
nlohmann::json server_partial(const Guild& guild);
nlohmann::json server_list(const std::vector<Guild>& servers);
nlohmann::json message(const InboundMessage& msg);
nlohmann::json ping(const PingNotice& ping);
nlohmann::json ack(const SendAck& ack);
nlohmann::json pong(uint64_t ts);
nlohmann::json heartbeat(uint64_t ts);
nlohmann::json error(const std::string& error, const std::string& raw = "");
nlohmann::json messages(const std::string& ref, const std::vector<HistoryEntry>& entries);
nlohmann::json messages_error(const std::string& ref, const std::string& error);
nlohmann::json guild_channels(const std::string& ref, const Guild& guild);

// Serialise for the wire. Invalid UTF-8 is replaced, never thrown.
std::string dump(const nlohmann::json& msg);

} // namespace protocol
} // namespace cordbridge
