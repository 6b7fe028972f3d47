#include "discord.hpp"
#include "../model_json.hpp"
#include "../util.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>

namespace cordbridge {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static constexpr uint64_t kDiscordEpochMs = 1420070400000ULL;
static constexpr size_t kGuildPageSize = 200;
static constexpr size_t kMaxGuildPages = 100;
static constexpr uint32_t kMaxHistoryPage = 100;
static constexpr uint32_t kReconnectBaseMs = 1000;
static constexpr uint32_t kReconnectMaxMs = 30000;
static constexpr const char* kUserAgent = "DiscordBot (https://github.com/cordbridge/cordbridge, 1.0)";

// ── Format helpers ──────────────────────────────────────────────

namespace discord {

ChannelKind channel_kind_from_type(int type) {
    switch (type) {
        case 0:  return ChannelKind::Text;
        case 5:  return ChannelKind::News;
        case 10:
        case 11:
        case 12: return ChannelKind::Thread;
        case 2:
        case 13: return ChannelKind::Voice;
        case 4:  return ChannelKind::Category;
        default: return ChannelKind::Other;
    }
}

uint64_t snowflake_timestamp(const std::string& id) {
    if (id.empty() || !std::all_of(id.begin(), id.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return 0;
    }
    char* end = nullptr;
    unsigned long long raw = std::strtoull(id.c_str(), &end, 10);
    if (!end || *end != '\0') return 0;
    return (static_cast<uint64_t>(raw) >> 22) + kDiscordEpochMs;
}

static UserRef parse_user(const nlohmann::json& u) {
    UserRef user;
    if (!u.is_object()) return user;
    user.id = json_string(u, "id");
    user.username = json_string(u, "username");
    user.bot = u.contains("bot") && u["bot"].is_boolean() && u["bot"].get<bool>();
    return user;
}

std::vector<GuildSummary> parse_guilds(const nlohmann::json& arr) {
    std::vector<GuildSummary> guilds;
    if (!arr.is_array()) return guilds;
    for (const auto& g : arr) {
        GuildSummary s;
        s.id = json_string(g, "id");
        s.name = json_string(g, "name");
        if (!s.id.empty()) guilds.push_back(std::move(s));
    }
    return guilds;
}

std::vector<Channel> parse_channels(const nlohmann::json& arr) {
    std::vector<Channel> channels;
    if (!arr.is_array()) return channels;
    for (const auto& c : arr) {
        Channel ch;
        ch.id = json_string(c, "id");
        if (ch.id.empty()) continue;
        ch.name = json_string(c, "name");
        int type = (c.contains("type") && c["type"].is_number_integer())
            ? c["type"].get<int>() : -1;
        ch.kind = channel_kind_from_type(type);
        channels.push_back(std::move(ch));
    }
    return channels;
}

InboundMessage parse_message(const nlohmann::json& d) {
    InboundMessage m;
    if (!d.is_object()) return m;
    m.id = json_string(d, "id");
    m.guild_id = json_string(d, "guild_id");
    m.channel_id = json_string(d, "channel_id");
    m.webhook_id = json_string(d, "webhook_id");
    m.raw_content = json_string(d, "content");
    if (d.contains("author")) m.author = parse_user(d["author"]);

    if (d.contains("attachments") && d["attachments"].is_array()) {
        for (const auto& a : d["attachments"]) {
            Attachment att;
            att.url = json_string(a, "url");
            att.name = json_string(a, "filename");
            att.content_type = json_string(a, "content_type");
            m.attachments.push_back(std::move(att));
        }
    }
    if (d.contains("embeds") && d["embeds"].is_array()) {
        for (const auto& e : d["embeds"]) {
            Embed emb;
            emb.title = json_string(e, "title");
            emb.description = json_string(e, "description");
            emb.type = json_string(e, "type");
            m.embeds.push_back(std::move(emb));
        }
    }
    if (d.contains("mentions") && d["mentions"].is_array()) {
        for (const auto& u : d["mentions"]) {
            UserRef user = parse_user(u);
            if (!user.id.empty()) m.mentions.push_back(std::move(user));
        }
    }

    // 19 = REPLY
    bool reply_type = d.contains("type") && d["type"].is_number_integer() &&
                      d["type"].get<int>() == 19;
    bool has_ref = d.contains("message_reference") && d["message_reference"].is_object() &&
                   !json_string(d["message_reference"], "message_id").empty();
    m.is_reply = reply_type || has_ref;
    m.timestamp = snowflake_timestamp(m.id);
    return m;
}

std::vector<HistoryEntry> parse_history(const nlohmann::json& arr) {
    std::vector<HistoryEntry> entries;
    if (!arr.is_array()) return entries;
    for (const auto& d : arr) {
        HistoryEntry e;
        e.id = json_string(d, "id");
        if (e.id.empty()) continue;
        if (d.contains("author")) e.author = parse_user(d["author"]);
        e.content = json_string(d, "content");
        e.timestamp = snowflake_timestamp(e.id);
        entries.push_back(std::move(e));
    }
    return entries;
}

UpstreamError error_from_status(long status, const std::string& body, ErrorKind client_kind) {
    UpstreamError err;
    if (status == 0) {
        err.kind = ErrorKind::Transport;
        err.message = "no response from Discord";
        return err;
    }

    std::string detail;
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        detail = json_string(j, "message");
        if (status == 429 && j.contains("retry_after") && j["retry_after"].is_number()) {
            detail += " (retry after " + std::to_string(j["retry_after"].get<double>()) + "s)";
        }
    }

    if (status == 401) {
        err.kind = ErrorKind::Auth;
    } else if (status == 400 || status == 403 || status == 404) {
        err.kind = client_kind;
    } else {
        // 429, 5xx and anything unexpected
        err.kind = ErrorKind::Transport;
    }
    err.message = "HTTP " + std::to_string(status);
    if (!detail.empty()) err.message += ": " + detail;
    return err;
}

nlohmann::json identify_payload(const std::string& token, uint32_t intents) {
    return {
        {"op", 2},
        {"d", {
            {"token", token},
            {"intents", intents},
            {"properties", {
                {"os", "linux"},
                {"browser", "cordbridge"},
                {"device", "cordbridge"}
            }}
        }}
    };
}

nlohmann::json presence_payload(PresenceKind kind, const std::string& text) {
    int type = 0;
    switch (kind) {
        case PresenceKind::Playing:   type = 0; break;
        case PresenceKind::Listening: type = 2; break;
        case PresenceKind::Watching:  type = 3; break;
        case PresenceKind::Competing: type = 5; break;
    }
    return {
        {"op", 3},
        {"d", {
            {"since", nullptr},
            {"activities", nlohmann::json::array({{{"name", text}, {"type", type}}})},
            {"status", "online"},
            {"afk", false}
        }}
    };
}

bool is_fatal_close_code(int code) {
    // 4004 authentication failed; 4010-4014 shard, version or intent errors
    return code == 4004 || (code >= 4010 && code <= 4014);
}

} // namespace discord

// ── DiscordRest ─────────────────────────────────────────────────

DiscordRest::DiscordRest(HttpClient& http, std::string api_base, std::string token)
    : http_(http), api_base_(std::move(api_base)), token_(std::move(token))
{
    while (!api_base_.empty() && api_base_.back() == '/') api_base_.pop_back();
}

std::vector<Header> DiscordRest::headers(bool with_body) const {
    std::vector<Header> h = {
        {"Authorization", "Bot " + token_},
        {"User-Agent", kUserAgent},
        {"Accept", "application/json"}
    };
    if (with_body) h.emplace_back("Content-Type", "application/json");
    return h;
}

UpstreamResult<std::vector<GuildSummary>> DiscordRest::list_guilds() {
    using Result = UpstreamResult<std::vector<GuildSummary>>;
    std::vector<GuildSummary> all;
    std::string after;

    for (size_t page = 0; page < kMaxGuildPages; ++page) {
        std::string url = api_base_ + "/users/@me/guilds?limit=" + std::to_string(kGuildPageSize);
        if (!after.empty()) url += "&after=" + after;

        HttpResponse resp = http_.get(url, headers(false));
        if (resp.status_code != 200) {
            UpstreamError err = discord::error_from_status(resp.status_code, resp.body,
                                                           ErrorKind::Directory);
            return Result::failure(err.kind, err.message);
        }
        auto j = nlohmann::json::parse(resp.body, nullptr, false);
        if (j.is_discarded() || !j.is_array())
            return Result::failure(ErrorKind::Directory, "malformed guild list");

        auto guilds = discord::parse_guilds(j);
        size_t got = guilds.size();
        for (auto& g : guilds) all.push_back(std::move(g));
        if (got < kGuildPageSize) break;
        after = all.back().id;
    }
    return Result::success(std::move(all));
}

UpstreamResult<std::vector<Channel>> DiscordRest::list_channels(const std::string& guild_id) {
    using Result = UpstreamResult<std::vector<Channel>>;

    HttpResponse resp = http_.get(api_base_ + "/guilds/" + guild_id + "/channels", headers(false));
    if (resp.status_code != 200) {
        UpstreamError err = discord::error_from_status(resp.status_code, resp.body,
                                                       ErrorKind::Directory);
        return Result::failure(err.kind, err.message);
    }
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_array())
        return Result::failure(ErrorKind::Directory, "malformed channel list");
    std::vector<Channel> channels = discord::parse_channels(j);

    // Active threads are not part of the channel list
    HttpResponse threads = http_.get(api_base_ + "/guilds/" + guild_id + "/threads/active",
                                     headers(false));
    if (threads.status_code == 200) {
        auto tj = nlohmann::json::parse(threads.body, nullptr, false);
        if (!tj.is_discarded() && tj.is_object() && tj.contains("threads")) {
            for (auto& t : discord::parse_channels(tj["threads"])) {
                channels.push_back(std::move(t));
            }
        }
    } else {
        std::cerr << "[discord] Active threads of guild " << guild_id
                  << " unavailable (HTTP " << threads.status_code << ")\n";
    }
    return Result::success(std::move(channels));
}

UpstreamResult<std::string> DiscordRest::send_message(const std::string& channel_id,
                                                      const std::string& content) {
    using Result = UpstreamResult<std::string>;

    std::string body;
    try {
        body = nlohmann::json{{"content", content}}.dump();
    } catch (const nlohmann::json::exception& e) {
        return Result::failure(ErrorKind::Resolution, std::string("invalid content: ") + e.what());
    }

    HttpResponse resp = http_.post(api_base_ + "/channels/" + channel_id + "/messages",
                                   body, headers(true));
    if (resp.status_code != 200 && resp.status_code != 201) {
        UpstreamError err = discord::error_from_status(resp.status_code, resp.body,
                                                       ErrorKind::Resolution);
        return Result::failure(err.kind, err.message);
    }
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    std::string id = j.is_discarded() ? std::string() : json_string(j, "id");
    return Result::success(id);
}

UpstreamResult<std::vector<HistoryEntry>> DiscordRest::fetch_messages(const std::string& channel_id,
                                                                     const std::string& before,
                                                                     uint32_t limit) {
    using Result = UpstreamResult<std::vector<HistoryEntry>>;
    limit = std::max<uint32_t>(1, std::min(limit, kMaxHistoryPage));

    std::string url = api_base_ + "/channels/" + channel_id + "/messages?limit=" +
                      std::to_string(limit);
    if (!before.empty()) url += "&before=" + before;

    HttpResponse resp = http_.get(url, headers(false));
    if (resp.status_code != 200) {
        UpstreamError err = discord::error_from_status(resp.status_code, resp.body,
                                                       ErrorKind::Resolution);
        return Result::failure(err.kind, err.message);
    }
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_array())
        return Result::failure(ErrorKind::Transport, "malformed message list");
    return Result::success(discord::parse_history(j));
}

// ── Gateway ─────────────────────────────────────────────────────

class DiscordUpstream::Gateway : public std::enable_shared_from_this<DiscordUpstream::Gateway> {
public:
    Gateway(DiscordUpstream* owner, net::io_context& io, ParsedUrl url,
            std::string token, uint32_t intents)
        : owner_(owner)
        , ssl_ctx_(net::ssl::context::tls_client)
        , resolver_(io)
        , ws_(io, init_ssl(ssl_ctx_))
        , heartbeat_timer_(io)
        , url_(std::move(url))
        , token_(std::move(token))
        , intents_(intents)
    {}

    void start() {
        resolver_.async_resolve(url_.host, url_.port,
            beast::bind_front_handler(&Gateway::on_resolve, shared_from_this()));
    }

    // Detach from the owner and drop the connection.
    void shutdown() {
        owner_ = nullptr;
        if (closed_) return;
        closed_ = true;
        heartbeat_timer_.cancel();
        resolver_.cancel();
        beast::get_lowest_layer(ws_).close();
    }

    void send(const nlohmann::json& payload) {
        if (closed_) return;
        outbox_.push_back(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        if (!writing_ && open_) do_write();
    }

private:
    static net::ssl::context& init_ssl(net::ssl::context& ctx) {
        ctx.set_default_verify_paths();
        ctx.set_options(net::ssl::context::default_workarounds);
        ctx.set_verify_mode(net::ssl::verify_peer);
        return ctx;
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve: " + ec.message(), 0);
        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        beast::get_lowest_layer(ws_).async_connect(results,
            beast::bind_front_handler(&Gateway::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail("connect: " + ec.message(), 0);
        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
            return fail("SNI setup failed", 0);
        }
        ws_.next_layer().set_verify_callback(net::ssl::host_name_verification(url_.host));
        ws_.next_layer().async_handshake(net::ssl::stream_base::client,
            beast::bind_front_handler(&Gateway::on_tls, shared_from_this()));
    }

    void on_tls(beast::error_code ec) {
        if (ec) return fail("tls: " + ec.message(), 0);
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, kUserAgent);
            }));
        ws_.async_handshake(url_.host, url_.path,
            beast::bind_front_handler(&Gateway::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail("handshake: " + ec.message(), 0);
        open_ = true;
        std::cerr << "[discord] Gateway connected to " << url_.host << "\n";
        if (!outbox_.empty() && !writing_) do_write();
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Gateway::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            int code = 0;
            if (ec == websocket::error::closed) code = static_cast<int>(ws_.reason().code);
            return fail("read: " + ec.message(), code);
        }
        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[discord] Ignoring unparseable gateway frame\n";
        } else {
            handle(j);
        }
        if (!closed_) do_read();
    }

    void handle(const nlohmann::json& j) {
        if (j.contains("s") && j["s"].is_number_integer()) seq_ = j["s"].get<int64_t>();
        int op = (j.contains("op") && j["op"].is_number_integer()) ? j["op"].get<int>() : -1;
        const nlohmann::json& d = j.contains("d") ? j["d"] : j;

        switch (op) {
            case 10:  // HELLO
                heartbeat_interval_ms_ = (d.contains("heartbeat_interval") &&
                                          d["heartbeat_interval"].is_number())
                    ? d["heartbeat_interval"].get<uint32_t>() : 41250;
                ack_pending_ = false;
                schedule_heartbeat();
                send(discord::identify_payload(token_, intents_));
                break;
            case 11:  // HEARTBEAT_ACK
                ack_pending_ = false;
                break;
            case 1:   // HEARTBEAT request
                send_heartbeat();
                break;
            case 7:   // RECONNECT
                fail("server requested reconnect", 0);
                break;
            case 9:   // INVALID_SESSION
                fail("session invalidated", 0);
                break;
            case 0: { // DISPATCH
                std::string type = json_string(j, "t");
                if (!owner_) break;
                if (type == "READY") {
                    UserRef self;
                    if (d.contains("user") && d["user"].is_object()) {
                        self.id = json_string(d["user"], "id");
                        self.username = json_string(d["user"], "username");
                        self.bot = true;
                    }
                    owner_->on_gateway_ready(self);
                } else {
                    owner_->on_gateway_dispatch(type, d);
                }
                break;
            }
            default:
                break;
        }
    }

    void schedule_heartbeat() {
        heartbeat_timer_.expires_after(std::chrono::milliseconds(heartbeat_interval_ms_));
        heartbeat_timer_.async_wait(
            beast::bind_front_handler(&Gateway::on_heartbeat, shared_from_this()));
    }

    void on_heartbeat(beast::error_code ec) {
        if (ec || closed_) return;
        if (ack_pending_) return fail("heartbeat not acknowledged", 0);
        send_heartbeat();
        schedule_heartbeat();
    }

    void send_heartbeat() {
        ack_pending_ = true;
        nlohmann::json payload = {{"op", 1}, {"d", nullptr}};
        if (seq_) payload["d"] = *seq_;
        send(payload);
    }

    void do_write() {
        writing_ = true;
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
            beast::bind_front_handler(&Gateway::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) return fail("write: " + ec.message(), 0);
        outbox_.pop_front();
        if (!outbox_.empty() && !closed_) do_write();
    }

    void fail(const std::string& reason, int close_code) {
        if (closed_) return;
        closed_ = true;
        open_ = false;
        heartbeat_timer_.cancel();
        beast::get_lowest_layer(ws_).close();
        if (owner_) {
            DiscordUpstream* owner = owner_;
            owner_ = nullptr;
            owner->on_gateway_lost(close_code, reason);
        }
    }

    DiscordUpstream* owner_;
    net::ssl::context ssl_ctx_;
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    net::steady_timer heartbeat_timer_;
    beast::flat_buffer buffer_;
    ParsedUrl url_;
    std::string token_;
    uint32_t intents_;

    std::optional<int64_t> seq_;
    uint32_t heartbeat_interval_ms_ = 41250;
    bool ack_pending_ = false;
    std::deque<std::string> outbox_;
    bool writing_ = false;
    bool open_ = false;
    bool closed_ = false;
};

// ── DiscordUpstream ─────────────────────────────────────────────

DiscordUpstream::DiscordUpstream(AsioEventLoop& loop, HttpClient& http, DiscordOptions options)
    : loop_(loop)
    , rest_(http, options.api_base, options.token)
    , options_(std::move(options))
{
    worker_ = std::thread([this]() { worker_loop(); });
}

DiscordUpstream::~DiscordUpstream() {
    want_connected_ = false;
    if (reconnect_timer_ != 0) loop_.cancel(reconnect_timer_);
    if (gateway_) gateway_->shutdown();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void DiscordUpstream::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}

template<typename T>
void DiscordUpstream::run_rest(std::function<UpstreamResult<T>()> job,
                               std::function<void(UpstreamResult<T>)> done) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back([this, job = std::move(job), done = std::move(done)]() {
            UpstreamResult<T> result;
            try {
                result = job();
            } catch (const std::exception& e) {
                result = UpstreamResult<T>::failure(ErrorKind::Transport, e.what());
            }
            loop_.post([this, result = std::move(result), done]() mutable {
                if (!result.ok()) check_auth(result.error);
                done(std::move(result));
            });
        });
    }
    cv_.notify_one();
}

void DiscordUpstream::set_status(UpstreamStatus status) {
    if (status == status_) return;
    status_ = status;
    if (listener_.on_status) listener_.on_status(status);
}

void DiscordUpstream::check_auth(const UpstreamError& err) {
    if (err.kind != ErrorKind::Auth || status_ == UpstreamStatus::AuthFailed) return;
    std::cerr << "[discord] Credential rejected: " << err.message << "\n";
    want_connected_ = false;
    if (reconnect_timer_ != 0) {
        loop_.cancel(reconnect_timer_);
        reconnect_timer_ = 0;
    }
    if (gateway_) {
        gateway_->shutdown();
        gateway_.reset();
    }
    set_status(UpstreamStatus::AuthFailed);
}

void DiscordUpstream::connect() {
    if (status_ == UpstreamStatus::AuthFailed) return;
    want_connected_ = true;
    if (gateway_) return;

    ParsedUrl url;
    try {
        url = parse_url(options_.gateway_url);
    } catch (const std::exception& e) {
        std::cerr << "[discord] " << e.what() << "\n";
        set_status(UpstreamStatus::Disconnected);
        return;
    }

    set_status(UpstreamStatus::Connecting);
    gateway_ = std::make_shared<Gateway>(this, loop_.context(), std::move(url),
                                         options_.token, options_.intents);
    gateway_->start();
}

void DiscordUpstream::disconnect() {
    want_connected_ = false;
    if (reconnect_timer_ != 0) {
        loop_.cancel(reconnect_timer_);
        reconnect_timer_ = 0;
    }
    if (gateway_) {
        gateway_->shutdown();
        gateway_.reset();
    }
    if (status_ != UpstreamStatus::AuthFailed) set_status(UpstreamStatus::Disconnected);
}

void DiscordUpstream::on_gateway_ready(const UserRef& self) {
    self_ = self;
    reconnect_attempt_ = 0;
    std::cerr << "[discord] READY as " << self.username << " (" << self.id << ")\n";
    if (listener_.on_identity) listener_.on_identity(self);
    set_status(UpstreamStatus::Connected);
}

void DiscordUpstream::on_gateway_lost(int close_code, const std::string& reason) {
    gateway_.reset();
    std::cerr << "[discord] Gateway lost: " << reason;
    if (close_code != 0) std::cerr << " (close code " << close_code << ")";
    std::cerr << "\n";

    if (discord::is_fatal_close_code(close_code)) {
        want_connected_ = false;
        set_status(UpstreamStatus::AuthFailed);
        return;
    }

    set_status(UpstreamStatus::Disconnected);
    if (!want_connected_) return;

    uint32_t shift = std::min<uint32_t>(reconnect_attempt_, 5);
    uint32_t delay = std::min(kReconnectBaseMs << shift, kReconnectMaxMs);
    ++reconnect_attempt_;
    std::cerr << "[discord] Reconnecting in " << delay << "ms\n";
    reconnect_timer_ = loop_.schedule(std::chrono::milliseconds(delay), [this]() {
        reconnect_timer_ = 0;
        if (want_connected_) connect();
    });
}

void DiscordUpstream::remember_guild(const nlohmann::json& guild) {
    std::string id = json_string(guild, "id");
    if (id.empty()) return;
    std::string name = json_string(guild, "name");
    if (!name.empty()) guild_names_[id] = name;
    for (const char* key : {"channels", "threads"}) {
        if (!guild.contains(key) || !guild[key].is_array()) continue;
        for (const auto& ch : guild[key]) remember_channel(ch);
    }
}

void DiscordUpstream::remember_channel(const nlohmann::json& channel) {
    std::string id = json_string(channel, "id");
    std::string name = json_string(channel, "name");
    if (!id.empty() && !name.empty()) channel_names_[id] = name;
}

void DiscordUpstream::on_gateway_dispatch(const std::string& type, const nlohmann::json& d) {
    if (type == "GUILD_CREATE" || type == "GUILD_UPDATE") {
        remember_guild(d);
    } else if (type == "CHANNEL_CREATE" || type == "CHANNEL_UPDATE" ||
               type == "THREAD_CREATE" || type == "THREAD_UPDATE") {
        remember_channel(d);
    } else if (type == "MESSAGE_CREATE") {
        InboundMessage msg = discord::parse_message(d);
        auto g = guild_names_.find(msg.guild_id);
        if (g != guild_names_.end()) msg.guild_name = g->second;
        auto c = channel_names_.find(msg.channel_id);
        if (c != channel_names_.end()) msg.channel_name = c->second;
        if (listener_.on_message) listener_.on_message(std::move(msg));
    }
}

// ── Upstream operations ─────────────────────────────────────────

void DiscordUpstream::list_guilds(GuildsCallback done) {
    run_rest<std::vector<GuildSummary>>([this]() { return rest_.list_guilds(); },
                                        std::move(done));
}

void DiscordUpstream::list_channels(const std::string& guild_id, ChannelsCallback done) {
    run_rest<std::vector<Channel>>([this, guild_id]() { return rest_.list_channels(guild_id); },
                                   std::move(done));
}

void DiscordUpstream::send_message(const std::string& channel_id, const std::string& content,
                                   SendCallback done) {
    run_rest<std::string>([this, channel_id, content]() {
        return rest_.send_message(channel_id, content);
    }, std::move(done));
}

void DiscordUpstream::fetch_messages(const std::string& channel_id, const std::string& before,
                                     uint32_t limit, HistoryCallback done) {
    run_rest<std::vector<HistoryEntry>>([this, channel_id, before, limit]() {
        return rest_.fetch_messages(channel_id, before, limit);
    }, std::move(done));
}

void DiscordUpstream::set_presence(PresenceKind kind, const std::string& text,
                                   UnitCallback done) {
    UpstreamResult<Unit> result;
    if (!gateway_ || status_ != UpstreamStatus::Connected) {
        result = UpstreamResult<Unit>::failure(ErrorKind::Availability, "not connected");
    } else {
        gateway_->send(discord::presence_payload(kind, text));
        result = UpstreamResult<Unit>::success(Unit{});
    }
    loop_.post([done = std::move(done), result]() { done(result); });
}

} // namespace cordbridge
