#include "persistence_store.hpp"
#include "model_json.hpp"
#include "util.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace cordbridge {

nlohmann::json state_to_json(const PersistedState& state) {
    nlohmann::json queue = nlohmann::json::array();
    for (const auto& req : state.queue) {
        queue.push_back(send_request_to_json(req));
    }
    return {
        {"ready", state.ready},
        {"servers", servers_to_json(state.servers)},
        {"processedRefs", state.processed_refs},
        {"queue", queue}
    };
}

PersistedState state_from_json(const nlohmann::json& j) {
    PersistedState state;
    if (!j.is_object()) return state;

    if (j.contains("ready") && j["ready"].is_boolean())
        state.ready = j["ready"].get<bool>();
    if (j.contains("servers"))
        state.servers = servers_from_json(j["servers"]);

    if (j.contains("processedRefs") && j["processedRefs"].is_array()) {
        for (const auto& ref : j["processedRefs"]) {
            if (ref.is_string()) state.processed_refs.push_back(ref.get<std::string>());
        }
    }

    if (j.contains("queue") && j["queue"].is_array()) {
        for (const auto& item : j["queue"]) {
            SendRequest req = send_request_from_json(item);
            if (req.ref.empty()) continue;
            state.queue.push_back(std::move(req));
        }
    }
    return state;
}

// ── PersistenceStore ────────────────────────────────────────────

PersistenceStore::PersistenceStore(std::string path)
    : path_(expand_home(path))
{}

PersistedState PersistenceStore::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        std::cerr << "[persist] No state file at " << path_ << ", starting empty\n";
        return {};
    }

    std::stringstream buf;
    buf << file.rdbuf();
    auto j = nlohmann::json::parse(buf.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[persist] Unreadable state file " << path_ << ", starting empty\n";
        return {};
    }

    PersistedState state = state_from_json(j);
    std::cerr << "[persist] Loaded " << state.servers.size() << " servers, "
              << state.processed_refs.size() << " processed refs, "
              << state.queue.size() << " queued from " << path_ << "\n";
    return state;
}

bool PersistenceStore::write(const PersistedState& state) const {
    std::string content;
    try {
        content = state_to_json(state).dump(2) + "\n";
    } catch (const nlohmann::json::exception& e) {
        // Invalid UTF-8 in a name or message body
        std::cerr << "[persist] Failed to serialise state: " << e.what() << "\n";
        return false;
    }
    if (!atomic_write_file(path_, content)) {
        std::cerr << "[persist] Failed to write " << path_ << "\n";
        return false;
    }
    return true;
}

// ── CoalescingWriter ────────────────────────────────────────────

CoalescingWriter::CoalescingWriter(EventLoop& loop,
                                   std::chrono::milliseconds quiet,
                                   FlushFn flush)
    : loop_(loop), quiet_(quiet), flush_(std::move(flush))
{}

CoalescingWriter::~CoalescingWriter() {
    closing_ = true;
    flush_now();
}

void CoalescingWriter::mark_dirty() {
    dirty_ = true;
    if (timer_ != 0 || closing_) return;
    timer_ = loop_.schedule(quiet_, [this]() {
        timer_ = 0;
        run_flush();
    });
}

void CoalescingWriter::flush_now() {
    if (timer_ != 0) {
        loop_.cancel(timer_);
        timer_ = 0;
    }
    run_flush();
}

void CoalescingWriter::run_flush() {
    if (!dirty_) return;
    dirty_ = false;
    ++flushes_;
    try {
        flush_();
    } catch (const std::exception& e) {
        std::cerr << "[persist] Flush failed: " << e.what() << "\n";
    }
}

} // namespace cordbridge
