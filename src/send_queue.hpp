#pragma once
#include "model.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "upstream.hpp"
#include "directory_cache.hpp"
#include "processed_refs.hpp"
#include <string>
#include <vector>
#include <deque>
#include <functional>
#include <unordered_map>
#include <cstdint>

namespace cordbridge {

struct SendQueueOptions {
    uint32_t max_retries = 5;
    uint32_t base_backoff_ms = 400;
    uint32_t max_backoff_ms = 25600;
    uint32_t replay_pacing_ms = 150;
};

// Delay before the next attempt of an item that has failed `tries` times:
// base * 2^tries, capped. Non-decreasing in tries.
uint32_t retry_backoff_ms(uint32_t tries, uint32_t base_ms, uint32_t max_ms);

// At-most-once outbound delivery.
//
// submit() acks every request exactly once on the bus (SendAckEvent):
// skipped when the ref was already delivered, delivered or failed when the
// upstream is connected, queued otherwise. A target that does not resolve
// while a directory build is running is queued as well. Queued requests
// are replayed on the next transition to connected (or once the build
// finishes), one at a time, with exponential backoff per item; replay emits
// only terminal acks. Replay never runs while a directory build is in
// flight and resumes when the build finishes.
class SendQueue {
public:
    using DirtyFn = std::function<void()>;

    SendQueue(EventLoop& loop, EventBus& bus, Upstream& upstream,
              DirectoryCache& directory, ProcessedRefSet& processed,
              SendQueueOptions options, DirtyFn mark_dirty);
    ~SendQueue();

    SendQueue(const SendQueue&) = delete;
    SendQueue& operator=(const SendQueue&) = delete;

    // A request without ref gets a generated one. Returns the ref used.
    std::string submit(SendRequest req);

    // Install persisted queue entries (startup only). Duplicate refs dropped.
    void restore(std::vector<SendRequest> queue);

    // Start draining the queue. No-op while a replay is already running.
    void start_replay();

    bool replaying() const { return replaying_; }
    size_t pending_count() const { return pending_.size(); }
    bool is_pending(const std::string& ref) const;

    // Parked requests in queue order, for persistence.
    std::vector<SendRequest> pending() const;

private:
    enum class Outcome { Delivered, NotFound, Rejected, Unavailable, Failed };
    using OutcomeFn = std::function<void(Outcome, const std::string& error)>;

    struct PendingItem {
        SendRequest req;
        uint64_t next_attempt_at = 0;  // loop ms
        bool in_flight = false;
    };

    void deliver(const SendRequest& req, OutcomeFn done);
    void park(SendRequest req);
    void finish_direct(const std::string& ref, Outcome outcome, const std::string& error);

    void schedule_step(uint32_t delay_ms);
    void replay_step();
    void on_replay_outcome(const std::string& ref, Outcome outcome, const std::string& error);
    void stop_replay(const char* reason);
    std::deque<PendingItem>::iterator find_pending(const std::string& ref);

    void emit(SendAck ack);

    EventLoop& loop_;
    EventBus& bus_;
    Upstream& upstream_;
    DirectoryCache& directory_;
    ProcessedRefSet& processed_;
    SendQueueOptions options_;
    DirtyFn mark_dirty_;

    std::deque<PendingItem> pending_;

    // Direct sends awaiting the upstream, with the number of duplicate
    // submissions that arrived meanwhile.
    std::unordered_map<std::string, size_t> in_flight_;

    bool replaying_ = false;
    bool waiting_for_directory_ = false;
    TimerId step_timer_ = 0;

    uint64_t status_sub_ = 0;
    uint64_t built_sub_ = 0;
};

} // namespace cordbridge
