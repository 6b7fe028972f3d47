#pragma once
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "directory_cache.hpp"
#include "upstream.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace cordbridge {

// One downstream client. Implemented by the WebSocket session; tests use an
// in-memory double.
class ClientConnection {
public:
    virtual ~ClientConnection() = default;

    virtual uint64_t id() const = 0;

    // Queue one text frame. Throws std::runtime_error if the connection is
    // no longer writable.
    virtual void send_text(const std::string& text) = 0;

    virtual void close() = 0;

    virtual std::string describe() const { return "client#" + std::to_string(id()); }
};

struct HubOptions {
    uint32_t heartbeat_interval_ms = 20000;
    uint32_t heartbeat_stale_ms = 60000;
};

// Tracks open client connections, replays the current state to new ones,
// broadcasts bus events and closes connections that stop answering
// heartbeats.
class FanoutHub {
public:
    using InboundHandler = std::function<void(ClientConnection&, const std::string& text)>;

    FanoutHub(EventLoop& loop, EventBus& bus, const DirectoryCache& directory,
              const Upstream& upstream, HubOptions options = {});
    ~FanoutHub();

    FanoutHub(const FanoutHub&) = delete;
    FanoutHub& operator=(const FanoutHub&) = delete;

    void set_inbound_handler(InboundHandler handler) { inbound_ = std::move(handler); }

    // Register a connection and send bridgeStatus, ready and (if non-empty)
    // serverList. Never triggers a directory build.
    void attach(std::shared_ptr<ClientConnection> conn);

    void detach(uint64_t conn_id);

    // Text frame from a client.
    void on_text(uint64_t conn_id, const std::string& text);

    // Serialise once, deliver to every connection. A connection that fails
    // is closed and dropped; the rest still receive the message.
    void broadcast(const nlohmann::json& msg);

    // Returns false if the connection is unknown or the send failed.
    bool send_to(uint64_t conn_id, const nlohmann::json& msg);

    void start_heartbeat();
    void stop_heartbeat();

    size_t connection_count() const { return conns_.size(); }

private:
    struct ConnectionState {
        std::shared_ptr<ClientConnection> conn;
        uint64_t last_seen_at = 0;  // loop ms
    };

    bool deliver(ConnectionState& state, const std::string& text);
    void heartbeat_tick();
    void drop(uint64_t conn_id, const char* reason);

    EventLoop& loop_;
    EventBus& bus_;
    const DirectoryCache& directory_;
    const Upstream& upstream_;
    HubOptions options_;
    InboundHandler inbound_;

    std::map<uint64_t, ConnectionState> conns_;
    TimerId heartbeat_timer_ = 0;
    bool heartbeat_running_ = false;

    std::vector<uint64_t> subs_;
};

} // namespace cordbridge
