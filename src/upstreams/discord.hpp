#pragma once
#include "../upstream.hpp"
#include "../http.hpp"
#include "../event_loop.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace boost { namespace asio { class io_context; } }

namespace cordbridge {

// GUILDS | GUILD_MESSAGES | MESSAGE_CONTENT
constexpr uint32_t kDiscordIntents = (1u << 0) | (1u << 9) | (1u << 15);

// Platform-format helpers. Nothing outside this adapter sees Discord codes.
namespace discord {

ChannelKind channel_kind_from_type(int type);

// Creation time (epoch ms) encoded in a snowflake; 0 if not a snowflake.
uint64_t snowflake_timestamp(const std::string& id);

std::vector<GuildSummary> parse_guilds(const nlohmann::json& arr);
std::vector<Channel> parse_channels(const nlohmann::json& arr);

// MESSAGE_CREATE payload. Guild and channel names are left empty.
InboundMessage parse_message(const nlohmann::json& d);

std::vector<HistoryEntry> parse_history(const nlohmann::json& arr);

// Map a failed REST status to the error taxonomy. `client_kind` is used for
// 400/403/404, which depend on the operation.
UpstreamError error_from_status(long status, const std::string& body, ErrorKind client_kind);

nlohmann::json identify_payload(const std::string& token, uint32_t intents);
nlohmann::json presence_payload(PresenceKind kind, const std::string& text);

// Gateway close codes after which reconnecting cannot help.
bool is_fatal_close_code(int code);

} // namespace discord

// Blocking Discord REST calls. Used from the adapter's worker thread;
// tests drive it directly with a MockHttpClient.
class DiscordRest {
public:
    DiscordRest(HttpClient& http, std::string api_base, std::string token);

    UpstreamResult<std::vector<GuildSummary>> list_guilds();
    UpstreamResult<std::vector<Channel>> list_channels(const std::string& guild_id);
    UpstreamResult<std::string> send_message(const std::string& channel_id,
                                             const std::string& content);
    UpstreamResult<std::vector<HistoryEntry>> fetch_messages(const std::string& channel_id,
                                                             const std::string& before,
                                                             uint32_t limit);

private:
    std::vector<Header> headers(bool with_body) const;

    HttpClient& http_;
    std::string api_base_;
    std::string token_;
};

struct DiscordOptions {
    std::string token;
    std::string api_base = "https://discord.com/api/v10";
    std::string gateway_url = "wss://gateway.discord.gg/?v=10&encoding=json";
    uint32_t intents = kDiscordIntents;
};

// Upstream implementation for Discord. REST calls run on one worker thread
// and complete on the event loop; the gateway WebSocket runs on the loop's
// io_context.
class DiscordUpstream : public Upstream {
public:
    DiscordUpstream(AsioEventLoop& loop, HttpClient& http, DiscordOptions options);
    ~DiscordUpstream() override;

    std::string upstream_name() const override { return "discord"; }
    void set_listener(UpstreamListener listener) override { listener_ = std::move(listener); }

    void connect() override;
    void disconnect() override;
    UpstreamStatus status() const override { return status_; }
    std::optional<UserRef> self_identity() const override { return self_; }

    void list_guilds(GuildsCallback done) override;
    void list_channels(const std::string& guild_id, ChannelsCallback done) override;
    void send_message(const std::string& channel_id, const std::string& content,
                      SendCallback done) override;
    void fetch_messages(const std::string& channel_id, const std::string& before,
                        uint32_t limit, HistoryCallback done) override;
    void set_presence(PresenceKind kind, const std::string& text,
                      UnitCallback done) override;

private:
    class Gateway;
    friend class Gateway;

    // Run job on the worker thread, then deliver its result on the loop.
    template<typename T>
    void run_rest(std::function<UpstreamResult<T>()> job,
                  std::function<void(UpstreamResult<T>)> done);

    void worker_loop();
    void set_status(UpstreamStatus status);
    void check_auth(const UpstreamError& err);

    // Gateway callbacks (loop thread)
    void on_gateway_ready(const UserRef& self);
    void on_gateway_dispatch(const std::string& type, const nlohmann::json& d);
    void on_gateway_lost(int close_code, const std::string& reason);

    void remember_guild(const nlohmann::json& guild);
    void remember_channel(const nlohmann::json& channel);

    AsioEventLoop& loop_;
    DiscordRest rest_;
    DiscordOptions options_;
    UpstreamListener listener_;
    UpstreamStatus status_ = UpstreamStatus::Disconnected;
    std::optional<UserRef> self_;

    std::unordered_map<std::string, std::string> guild_names_;
    std::unordered_map<std::string, std::string> channel_names_;

    std::shared_ptr<Gateway> gateway_;
    bool want_connected_ = false;
    uint32_t reconnect_attempt_ = 0;
    TimerId reconnect_timer_ = 0;

    // Worker thread
    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool stopping_ = false;
};

} // namespace cordbridge
