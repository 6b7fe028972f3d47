#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "upstream.hpp"
#include "directory_cache.hpp"
#include "processed_refs.hpp"
#include "persistence_store.hpp"
#include "send_queue.hpp"
#include "event_pipeline.hpp"
#include "fanout_hub.hpp"
#include <memory>
#include <string>
#include <functional>
#include <nlohmann/json.hpp>

namespace cordbridge {

// Owns the bridge state (directory, processed refs, pending queue) and the
// components working on it. Routes upstream callbacks onto the bus and
// client requests to the right component. Loop thread only.
class Bridge {
public:
    using FatalHandler = std::function<void(const std::string& reason)>;

    Bridge(EventLoop& loop, Upstream& upstream, const Config& config);
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Called when the upstream reports a rejected credential.
    void set_fatal_handler(FatalHandler handler) { fatal_ = std::move(handler); }

    // Load the state file, connect the upstream, start heartbeats.
    void start();

    // Stop heartbeats, disconnect, write the state file.
    void shutdown();

    // One text frame from a client.
    void handle_client_text(ClientConnection& conn, const std::string& text);

    // Current state as it would be written to disk.
    PersistedState collect_state() const;

    EventBus& bus() { return bus_; }
    FanoutHub& hub() { return *hub_; }
    DirectoryCache& directory() { return *directory_; }
    SendQueue& queue() { return *queue_; }
    const ProcessedRefSet& processed() const { return processed_; }
    CoalescingWriter& writer() { return *writer_; }

private:
    struct HistoryFetch {
        uint64_t conn_id = 0;
        std::string ref;
        std::string channel_id;
        uint32_t remaining = 0;
        std::string before;
        std::vector<HistoryEntry> entries;
    };

    void on_upstream_status(UpstreamStatus status);
    void mark_dirty();
    void flush_state();

    void request_refresh(uint64_t conn_id);
    void handle_get_messages(uint64_t conn_id, const nlohmann::json& msg);
    void fetch_history_page(std::shared_ptr<HistoryFetch> fetch);
    void handle_set_presence(uint64_t conn_id, const nlohmann::json& msg);
    void handle_get_guild_channels(uint64_t conn_id, const nlohmann::json& msg,
                                   const std::string& raw);

    EventLoop& loop_;
    Upstream& upstream_;
    Config config_;
    FatalHandler fatal_;

    EventBus bus_;
    PersistenceStore store_;
    ProcessedRefSet processed_;
    UpstreamStatus last_status_ = UpstreamStatus::Disconnected;
    bool started_ = false;

    std::unique_ptr<DirectoryCache> directory_;
    std::unique_ptr<SendQueue> queue_;
    std::unique_ptr<EventPipeline> pipeline_;
    std::unique_ptr<FanoutHub> hub_;
    std::unique_ptr<CoalescingWriter> writer_;

    std::vector<uint64_t> subs_;
};

} // namespace cordbridge
