#pragma once
#include "model.hpp"
#include "event_loop.hpp"
#include <string>
#include <vector>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace cordbridge {

// Everything that survives a restart.
struct PersistedState {
    bool ready = false;
    std::vector<Guild> servers;
    std::vector<std::string> processed_refs;
    std::vector<SendRequest> queue;
};

nlohmann::json state_to_json(const PersistedState& state);

// Lenient: unknown or mistyped members are ignored.
PersistedState state_from_json(const nlohmann::json& j);

// The state file: {ready, servers, processedRefs, queue}.
class PersistenceStore {
public:
    explicit PersistenceStore(std::string path);

    // Missing or unreadable file yields a default state. Never throws.
    PersistedState load() const;

    // Atomic replace (temp file + rename). Logs and returns false on failure;
    // the previously committed file is left intact.
    bool write(const PersistedState& state) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Mark-dirty / flush-after-quiet-period. Calls made while a flush is pending
// coalesce into that flush. Destruction flushes any pending change.
class CoalescingWriter {
public:
    using FlushFn = std::function<void()>;

    CoalescingWriter(EventLoop& loop, std::chrono::milliseconds quiet, FlushFn flush);
    ~CoalescingWriter();

    CoalescingWriter(const CoalescingWriter&) = delete;
    CoalescingWriter& operator=(const CoalescingWriter&) = delete;

    void mark_dirty();

    // Flush now if dirty and cancel the pending timer.
    void flush_now();

    bool dirty() const { return dirty_; }
    uint64_t flush_count() const { return flushes_; }

private:
    void run_flush();

    EventLoop& loop_;
    std::chrono::milliseconds quiet_;
    FlushFn flush_;
    bool dirty_ = false;
    bool closing_ = false;
    TimerId timer_ = 0;
    uint64_t flushes_ = 0;
};

} // namespace cordbridge
