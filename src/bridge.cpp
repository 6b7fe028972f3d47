#include "bridge.hpp"
#include "model_json.hpp"
#include "protocol.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace cordbridge {

static constexpr uint32_t kHistoryPageSize = 100;
static constexpr uint32_t kHistoryDefaultLimit = 50;

Bridge::Bridge(EventLoop& loop, Upstream& upstream, const Config& config)
    : loop_(loop)
    , upstream_(upstream)
    , config_(config)
    , store_(config.state_path)
    , processed_(config.bridge.processed_ref_limit)
{
    DirectoryOptions dir_opts;
    dir_opts.batch_size = config_.bridge.build_batch_size;
    dir_opts.batch_pause_ms = config_.bridge.build_batch_pause_ms;
    directory_ = std::make_unique<DirectoryCache>(loop_, bus_, upstream_, dir_opts);

    SendQueueOptions queue_opts;
    queue_opts.max_retries = config_.bridge.max_send_retries;
    queue_opts.base_backoff_ms = config_.bridge.base_backoff_ms;
    queue_opts.max_backoff_ms = config_.bridge.max_backoff_ms;
    queue_opts.replay_pacing_ms = config_.bridge.replay_pacing_ms;
    queue_ = std::make_unique<SendQueue>(loop_, bus_, upstream_, *directory_, processed_,
                                         queue_opts, [this]() { mark_dirty(); });

    PipelineOptions pipe_opts;
    pipe_opts.dedupe_window_ms = config_.bridge.dedupe_window_ms;
    pipe_opts.drop_other_bots = config_.bridge.drop_other_bots;
    pipeline_ = std::make_unique<EventPipeline>(loop_, bus_, pipe_opts);

    HubOptions hub_opts;
    hub_opts.heartbeat_interval_ms = config_.bridge.heartbeat_interval_ms;
    hub_opts.heartbeat_stale_ms = config_.bridge.heartbeat_stale_ms;
    hub_ = std::make_unique<FanoutHub>(loop_, bus_, *directory_, upstream_, hub_opts);
    hub_->set_inbound_handler([this](ClientConnection& conn, const std::string& text) {
        handle_client_text(conn, text);
    });

    writer_ = std::make_unique<CoalescingWriter>(
        loop_, std::chrono::milliseconds(config_.bridge.save_debounce_ms),
        [this]() { flush_state(); });

    subs_.push_back(subscribe<GuildCachedEvent>(bus_,
        [this](const GuildCachedEvent&) { mark_dirty(); }));
    subs_.push_back(subscribe<DirectoryBuiltEvent>(bus_,
        [this](const DirectoryBuiltEvent&) { mark_dirty(); }));
}

Bridge::~Bridge() {
    // Final flush while every component is still alive.
    writer_.reset();
    for (uint64_t id : subs_) bus_.unsubscribe(id);
}

PersistedState Bridge::collect_state() const {
    PersistedState state;
    state.ready = directory_->ready();
    state.servers = directory_->servers();
    state.processed_refs = processed_.to_vector();
    state.queue = queue_->pending();
    return state;
}

void Bridge::mark_dirty() {
    if (writer_) writer_->mark_dirty();
}

void Bridge::flush_state() {
    if (!store_.write(collect_state())) {
        // Keep running in memory; try again after the next quiet period.
        mark_dirty();
    }
}

void Bridge::start() {
    if (started_) return;
    started_ = true;

    PersistedState state = store_.load();
    directory_->restore(std::move(state.servers), state.ready);
    processed_.assign(state.processed_refs);
    queue_->restore(std::move(state.queue));

    upstream_.set_listener(UpstreamListener{
        [this](UpstreamStatus status) { on_upstream_status(status); },
        [this](const UserRef& self) {
            std::cerr << "[bridge] Signed in as " << self.username << " (" << self.id << ")\n";
            SelfIdentityEvent ev;
            ev.self = self;
            bus_.publish(ev);
        },
        [this](InboundMessage message) {
            MessageReceivedEvent ev;
            ev.message = std::move(message);
            bus_.publish(ev);
        }
    });

    hub_->start_heartbeat();
    std::cerr << "[bridge] Connecting to " << upstream_.upstream_name() << "\n";
    upstream_.connect();
}

void Bridge::shutdown() {
    if (!started_) return;
    started_ = false;
    hub_->stop_heartbeat();
    upstream_.disconnect();
    writer_->mark_dirty();
    writer_->flush_now();
    std::cerr << "[bridge] State written to " << store_.path() << "\n";
}

void Bridge::on_upstream_status(UpstreamStatus status) {
    UpstreamStatus previous = last_status_;
    if (status == previous) return;
    last_status_ = status;
    std::cerr << "[bridge] Upstream " << upstream_status_name(previous) << " -> "
              << upstream_status_name(status) << "\n";

    UpstreamStatusEvent ev;
    ev.status = status;
    ev.previous = previous;
    bus_.publish(ev);

    if (status == UpstreamStatus::AuthFailed) {
        if (fatal_) fatal_("upstream rejected the credential");
        return;
    }

    if (status == UpstreamStatus::Connected &&
        (directory_->empty() || !directory_->ready()) && !directory_->building()) {
        directory_->build(true);
    }
}

// ── Client requests ─────────────────────────────────────────────

void Bridge::handle_client_text(ClientConnection& conn, const std::string& text) {
    uint64_t conn_id = conn.id();
    auto msg = nlohmann::json::parse(text, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        hub_->send_to(conn_id, protocol::error("bad-json"));
        return;
    }

    std::string type = json_string(msg, "type");
    if (type == "getServerList") {
        bool force = msg.contains("force") && msg["force"].is_boolean() &&
                     msg["force"].get<bool>();
        if (force) {
            request_refresh(conn_id);
        } else {
            hub_->send_to(conn_id, protocol::server_list(directory_->servers()));
        }
    } else if (type == "refreshServers" || type == "forceRefresh") {
        request_refresh(conn_id);
    } else if (type == "sendMessage") {
        queue_->submit(send_request_from_client(msg));
    } else if (type == "ping") {
        hub_->send_to(conn_id, protocol::pong(epoch_millis()));
    } else if (type == "hb_ack") {
        // liveness already recorded by the hub
    } else if (type == "getMessages") {
        handle_get_messages(conn_id, msg);
    } else if (type == "setPresence") {
        handle_set_presence(conn_id, msg);
    } else if (type == "getGuildChannels") {
        handle_get_guild_channels(conn_id, msg, text);
    } else {
        hub_->send_to(conn_id, protocol::error("unknown-request", text));
    }
}

void Bridge::request_refresh(uint64_t conn_id) {
    if (directory_->build(true)) {
        std::cerr << "[bridge] Directory refresh requested by client#" << conn_id << "\n";
    }
    // An in-flight build answers this request when it broadcasts serverList.
}

void Bridge::handle_get_messages(uint64_t conn_id, const nlohmann::json& msg) {
    auto fetch = std::make_shared<HistoryFetch>();
    fetch->conn_id = conn_id;
    fetch->ref = json_string(msg, "ref");
    if (fetch->ref.empty()) fetch->ref = generate_id();

    uint32_t limit = kHistoryDefaultLimit;
    if (msg.contains("limit") && msg["limit"].is_number()) {
        double requested = msg["limit"].get<double>();
        // Zero, negative and NaN limits keep the default.
        if (requested >= 1) {
            limit = static_cast<uint32_t>(
                std::min<double>(requested, config_.bridge.history_limit_max));
        }
    }
    limit = std::min(limit, config_.bridge.history_limit_max);
    fetch->remaining = limit;

    auto target = directory_->resolve(send_request_from_client(msg).target);
    if (!target) {
        hub_->send_to(conn_id, protocol::messages_error(fetch->ref, "not found"));
        return;
    }
    fetch->channel_id = target->channel_id;
    fetch_history_page(std::move(fetch));
}

void Bridge::fetch_history_page(std::shared_ptr<HistoryFetch> fetch) {
    uint32_t page = std::min(fetch->remaining, kHistoryPageSize);
    upstream_.fetch_messages(fetch->channel_id, fetch->before, page,
        [this, fetch, page](UpstreamResult<std::vector<HistoryEntry>> result) {
            if (!result.ok()) {
                std::cerr << "[bridge] History of channel " << fetch->channel_id
                          << " failed: " << result.error.message << "\n";
                hub_->send_to(fetch->conn_id,
                              protocol::messages_error(fetch->ref, result.error.message));
                return;
            }

            auto& entries = *result.value;
            size_t got = entries.size();
            if (got > 0) fetch->before = entries.back().id;
            for (auto& e : entries) fetch->entries.push_back(std::move(e));
            fetch->remaining -= static_cast<uint32_t>(std::min<size_t>(got, fetch->remaining));

            if (got == page && fetch->remaining > 0) {
                fetch_history_page(fetch);
                return;
            }

            // Pages arrive newest first; clients get chronological order.
            std::stable_sort(fetch->entries.begin(), fetch->entries.end(),
                             [](const HistoryEntry& a, const HistoryEntry& b) {
                                 return a.timestamp < b.timestamp;
                             });
            hub_->send_to(fetch->conn_id, protocol::messages(fetch->ref, fetch->entries));
        });
}

void Bridge::handle_set_presence(uint64_t conn_id, const nlohmann::json& msg) {
    SendAck ack;
    ack.ref = json_string(msg, "ref");
    if (ack.ref.empty()) ack.ref = generate_id();

    auto kind = presence_kind_from_name(json_string(msg, "kind"));
    if (!kind) {
        ack.error = "bad-presence-kind";
        hub_->send_to(conn_id, protocol::ack(ack));
        return;
    }
    if (!upstream_.connected()) {
        ack.error = "not-connected";
        hub_->send_to(conn_id, protocol::ack(ack));
        return;
    }

    upstream_.set_presence(*kind, json_string(msg, "text"),
        [this, conn_id, ack](UpstreamResult<Unit> result) mutable {
            ack.ok = result.ok();
            if (!ack.ok) ack.error = result.error.message;
            hub_->send_to(conn_id, protocol::ack(ack));
        });
}

void Bridge::handle_get_guild_channels(uint64_t conn_id, const nlohmann::json& msg,
                                       const std::string& raw) {
    auto guild = directory_->find_guild(json_string(msg, "guildId"),
                                        json_string(msg, "guildName"));
    if (!guild) {
        hub_->send_to(conn_id, protocol::error("not found", raw));
        return;
    }
    hub_->send_to(conn_id, protocol::guild_channels(json_string(msg, "ref"), *guild));
}

} // namespace cordbridge
