#include "fanout_hub.hpp"
#include "protocol.hpp"
#include "util.hpp"

#include <iostream>

namespace cordbridge {

FanoutHub::FanoutHub(EventLoop& loop, EventBus& bus, const DirectoryCache& directory,
                     const Upstream& upstream, HubOptions options)
    : loop_(loop), bus_(bus), directory_(directory), upstream_(upstream), options_(options)
{
    subs_.push_back(subscribe<UpstreamStatusEvent>(bus_,
        [this](const UpstreamStatusEvent& ev) {
            bool connected = ev.status == UpstreamStatus::Connected;
            broadcast(protocol::bridge_status(connected));
            if (connected && ev.previous != UpstreamStatus::Connected)
                broadcast(protocol::ready(directory_.ready()));
        }));
    subs_.push_back(subscribe<SelfIdentityEvent>(bus_,
        [this](const SelfIdentityEvent& ev) {
            broadcast(protocol::discord_ready(ev.self));
        }));
    subs_.push_back(subscribe<DirectoryBuildStartedEvent>(bus_,
        [this](const DirectoryBuildStartedEvent&) {
            broadcast(protocol::ready(false));
        }));
    subs_.push_back(subscribe<GuildCachedEvent>(bus_,
        [this](const GuildCachedEvent& ev) {
            broadcast(protocol::server_partial(ev.guild));
        }));
    subs_.push_back(subscribe<DirectoryBuiltEvent>(bus_,
        [this](const DirectoryBuiltEvent& ev) {
            broadcast(protocol::ready(true));
            broadcast(protocol::server_list(ev.servers));
        }));
    subs_.push_back(subscribe<MessageForwardedEvent>(bus_,
        [this](const MessageForwardedEvent& ev) {
            broadcast(protocol::message(ev.message));
        }));
    subs_.push_back(subscribe<PingDetectedEvent>(bus_,
        [this](const PingDetectedEvent& ev) {
            broadcast(protocol::ping(ev.ping));
        }));
    subs_.push_back(subscribe<SendAckEvent>(bus_,
        [this](const SendAckEvent& ev) {
            broadcast(protocol::ack(ev.ack));
        }));
}

FanoutHub::~FanoutHub() {
    stop_heartbeat();
    for (uint64_t id : subs_) bus_.unsubscribe(id);
}

bool FanoutHub::deliver(ConnectionState& state, const std::string& text) {
    try {
        state.conn->send_text(text);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[hub] Send to " << state.conn->describe() << " failed: "
                  << e.what() << "\n";
        return false;
    }
}

void FanoutHub::attach(std::shared_ptr<ClientConnection> conn) {
    uint64_t id = conn->id();
    ConnectionState state;
    state.conn = std::move(conn);
    state.last_seen_at = loop_.now_ms();
    auto& slot = conns_[id];
    slot = std::move(state);
    std::cerr << "[hub] " << slot.conn->describe() << " connected ("
              << conns_.size() << " open)\n";

    bool ok = deliver(slot, protocol::dump(protocol::bridge_status(upstream_.connected())))
           && deliver(slot, protocol::dump(protocol::ready(directory_.ready())));
    if (ok && !directory_.empty())
        ok = deliver(slot, protocol::dump(protocol::server_list(directory_.servers())));
    if (!ok) drop(id, "initial state replay failed");
}

void FanoutHub::detach(uint64_t conn_id) {
    auto it = conns_.find(conn_id);
    if (it == conns_.end()) return;
    std::cerr << "[hub] " << it->second.conn->describe() << " disconnected\n";
    conns_.erase(it);
}

void FanoutHub::drop(uint64_t conn_id, const char* reason) {
    auto it = conns_.find(conn_id);
    if (it == conns_.end()) return;
    auto conn = it->second.conn;
    conns_.erase(it);
    std::cerr << "[hub] Closing " << conn->describe() << ": " << reason << "\n";
    try {
        conn->close();
    } catch (const std::exception& e) {
        std::cerr << "[hub] Close of " << conn->describe() << " failed: " << e.what() << "\n";
    }
}

void FanoutHub::on_text(uint64_t conn_id, const std::string& text) {
    auto it = conns_.find(conn_id);
    if (it == conns_.end()) return;
    // Any inbound frame proves the peer is alive.
    it->second.last_seen_at = loop_.now_ms();
    auto conn = it->second.conn;
    if (inbound_) inbound_(*conn, text);
}

void FanoutHub::broadcast(const nlohmann::json& msg) {
    if (conns_.empty()) return;
    std::string text = protocol::dump(msg);

    std::vector<uint64_t> failed;
    for (auto& [id, state] : conns_) {
        if (!deliver(state, text)) failed.push_back(id);
    }
    for (uint64_t id : failed) drop(id, "broadcast failed");
}

bool FanoutHub::send_to(uint64_t conn_id, const nlohmann::json& msg) {
    auto it = conns_.find(conn_id);
    if (it == conns_.end()) return false;
    if (deliver(it->second, protocol::dump(msg))) return true;
    drop(conn_id, "send failed");
    return false;
}

// ── Heartbeat ───────────────────────────────────────────────────

void FanoutHub::start_heartbeat() {
    if (heartbeat_running_) return;
    heartbeat_running_ = true;
    heartbeat_timer_ = loop_.schedule(std::chrono::milliseconds(options_.heartbeat_interval_ms),
                                      [this]() { heartbeat_tick(); });
}

void FanoutHub::stop_heartbeat() {
    heartbeat_running_ = false;
    if (heartbeat_timer_ != 0) {
        loop_.cancel(heartbeat_timer_);
        heartbeat_timer_ = 0;
    }
}

void FanoutHub::heartbeat_tick() {
    heartbeat_timer_ = 0;
    if (!heartbeat_running_) return;

    uint64_t now = loop_.now_ms();
    std::vector<uint64_t> stale;
    for (const auto& [id, state] : conns_) {
        if (now - state.last_seen_at > options_.heartbeat_stale_ms) stale.push_back(id);
    }
    for (uint64_t id : stale) drop(id, "heartbeat timeout");

    broadcast(protocol::heartbeat(epoch_millis()));

    heartbeat_timer_ = loop_.schedule(std::chrono::milliseconds(options_.heartbeat_interval_ms),
                                      [this]() { heartbeat_tick(); });
}

} // namespace cordbridge
