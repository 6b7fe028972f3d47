#pragma once
#include "model.hpp"
#include <nlohmann/json.hpp>

namespace cordbridge {

// JSON <-> model conversion shared by the state file, the wire protocol and
// the Discord adapter. Readers are lenient: wrong-typed or missing fields
// become empty values, never exceptions.

// String field that may arrive as a JSON string or number (snowflakes).
std::string json_string(const nlohmann::json& j, const char* key);

nlohmann::json channel_to_json(const Channel& ch);
Channel channel_from_json(const nlohmann::json& j);

nlohmann::json guild_to_json(const Guild& g);
Guild guild_from_json(const nlohmann::json& j);

nlohmann::json servers_to_json(const std::vector<Guild>& servers);
std::vector<Guild> servers_from_json(const nlohmann::json& j);

// Persisted queue entry (flat). Also accepts the legacy {req:{...}, tries,
// queuedAt} shape.
nlohmann::json send_request_to_json(const SendRequest& req);
SendRequest send_request_from_json(const nlohmann::json& j);

// Client sendMessage payload (ref may be absent; caller generates one).
SendRequest send_request_from_client(const nlohmann::json& msg);

nlohmann::json user_to_json(const UserRef& u, bool with_bot_flag);

// Wire "message" event data
nlohmann::json message_to_json(const InboundMessage& m);

// Wire "ping" event data
nlohmann::json ping_to_json(const PingNotice& p);

nlohmann::json history_to_json(const std::vector<HistoryEntry>& entries);

} // namespace cordbridge
