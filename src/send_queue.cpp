#include "send_queue.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace cordbridge {

static constexpr const char* kQueuedNotConnected = "queued-not-connected";
static constexpr const char* kAlreadyQueued = "already-queued";
static constexpr const char* kQueuedDirectoryBuilding = "queued-directory-building";
static constexpr const char* kNotFound = "not found";
static constexpr const char* kMaxRetries = "max-retries";

uint32_t retry_backoff_ms(uint32_t tries, uint32_t base_ms, uint32_t max_ms) {
    uint32_t shift = std::min<uint32_t>(tries, 16);
    uint64_t delay = static_cast<uint64_t>(base_ms) << shift;
    return static_cast<uint32_t>(std::min<uint64_t>(delay, max_ms));
}

SendQueue::SendQueue(EventLoop& loop, EventBus& bus, Upstream& upstream,
                     DirectoryCache& directory, ProcessedRefSet& processed,
                     SendQueueOptions options, DirtyFn mark_dirty)
    : loop_(loop), bus_(bus), upstream_(upstream), directory_(directory)
    , processed_(processed), options_(options), mark_dirty_(std::move(mark_dirty))
{
    if (options_.max_retries == 0) options_.max_retries = 1;

    status_sub_ = subscribe<UpstreamStatusEvent>(bus_,
        [this](const UpstreamStatusEvent& ev) {
            if (ev.status == UpstreamStatus::Connected &&
                ev.previous != UpstreamStatus::Connected) {
                start_replay();
            }
        });

    built_sub_ = subscribe<DirectoryBuiltEvent>(bus_,
        [this](const DirectoryBuiltEvent&) {
            if (!waiting_for_directory_) return;
            waiting_for_directory_ = false;
            if (replaying_) {
                std::cerr << "[queue] Directory ready, resuming replay\n";
                schedule_step(0);
            }
        });
}

SendQueue::~SendQueue() {
    if (step_timer_ != 0) loop_.cancel(step_timer_);
    bus_.unsubscribe(status_sub_);
    bus_.unsubscribe(built_sub_);
}

void SendQueue::emit(SendAck ack) {
    std::cerr << "[queue] ack ref=" << ack.ref << " ok=" << (ack.ok ? "true" : "false");
    if (ack.skipped) std::cerr << " skipped";
    if (ack.queued) std::cerr << " queued";
    if (!ack.error.empty()) std::cerr << " error=" << ack.error;
    std::cerr << "\n";

    SendAckEvent ev;
    ev.ack = std::move(ack);
    bus_.publish(ev);
}

std::deque<SendQueue::PendingItem>::iterator SendQueue::find_pending(const std::string& ref) {
    return std::find_if(pending_.begin(), pending_.end(),
                        [&ref](const PendingItem& item) { return item.req.ref == ref; });
}

bool SendQueue::is_pending(const std::string& ref) const {
    return std::any_of(pending_.begin(), pending_.end(),
                       [&ref](const PendingItem& item) { return item.req.ref == ref; });
}

std::vector<SendRequest> SendQueue::pending() const {
    std::vector<SendRequest> out;
    out.reserve(pending_.size());
    for (const auto& item : pending_) {
        out.push_back(item.req);
    }
    return out;
}

// ── Submission ──────────────────────────────────────────────────

std::string SendQueue::submit(SendRequest req) {
    if (req.ref.empty()) req.ref = generate_id();
    if (req.queued_at == 0) req.queued_at = epoch_millis();
    const std::string ref = req.ref;

    if (processed_.contains(ref)) {
        SendAck ack;
        ack.ref = ref;
        ack.ok = true;
        ack.skipped = true;
        emit(std::move(ack));
        return ref;
    }

    auto inflight = in_flight_.find(ref);
    if (inflight != in_flight_.end()) {
        // Answered together with the original submission.
        ++inflight->second;
        std::cerr << "[queue] ref=" << ref << " already being sent, waiting for it\n";
        return ref;
    }

    if (is_pending(ref)) {
        std::cerr << "[queue] ref=" << ref << " already queued, ignoring resubmission\n";
        SendAck ack;
        ack.ref = ref;
        ack.queued = true;
        ack.error = upstream_.connected() ? kAlreadyQueued : kQueuedNotConnected;
        emit(std::move(ack));
        return ref;
    }

    if (!upstream_.connected()) {
        park(req);
        SendAck ack;
        ack.ref = ref;
        ack.queued = true;
        ack.error = kQueuedNotConnected;
        emit(std::move(ack));
        return ref;
    }

    if (directory_.building() && !directory_.resolve(req.target)) {
        // The target may be in a guild the running build has not reached.
        std::cerr << "[queue] ref=" << ref << " not resolvable until the directory is built\n";
        park(req);
        SendAck ack;
        ack.ref = ref;
        ack.queued = true;
        ack.error = kQueuedDirectoryBuilding;
        emit(std::move(ack));
        start_replay();
        return ref;
    }

    in_flight_[ref] = 0;
    deliver(req, [this, req](Outcome outcome, const std::string& error) {
        if (outcome == Outcome::Unavailable) park(req);
        finish_direct(req.ref, outcome, error);
    });
    return ref;
}

void SendQueue::finish_direct(const std::string& ref, Outcome outcome,
                              const std::string& error) {
    size_t duplicates = 0;
    auto it = in_flight_.find(ref);
    if (it != in_flight_.end()) {
        duplicates = it->second;
        in_flight_.erase(it);
    }

    SendAck ack;
    ack.ref = ref;
    switch (outcome) {
        case Outcome::Delivered:
            ack.ok = true;
            break;
        case Outcome::NotFound:
            ack.error = kNotFound;
            break;
        case Outcome::Unavailable:
            ack.queued = true;
            ack.error = kQueuedNotConnected;
            break;
        case Outcome::Rejected:
        case Outcome::Failed:
            ack.error = error;
            break;
    }

    SendAck dup = ack;
    if (outcome == Outcome::Delivered) dup.skipped = true;
    emit(std::move(ack));
    for (size_t i = 0; i < duplicates; ++i) {
        emit(dup);
    }
}

void SendQueue::park(SendRequest req) {
    if (is_pending(req.ref)) {
        std::cerr << "[queue] ref=" << req.ref << " already queued\n";
        return;
    }
    std::cerr << "[queue] Parked ref=" << req.ref << " (" << pending_.size() + 1
              << " queued)\n";
    PendingItem item;
    item.req = std::move(req);
    pending_.push_back(std::move(item));
    mark_dirty_();
}

void SendQueue::restore(std::vector<SendRequest> queue) {
    for (auto& req : queue) {
        if (req.ref.empty() || is_pending(req.ref)) continue;
        PendingItem item;
        item.req = std::move(req);
        pending_.push_back(std::move(item));
    }
}

// ── Delivery ────────────────────────────────────────────────────

void SendQueue::deliver(const SendRequest& req, OutcomeFn done) {
    auto target = directory_.resolve(req.target);
    if (!target) {
        std::cerr << "[queue] ref=" << req.ref << " target not found (guild '"
                  << (req.target.guild_id.empty() ? req.target.guild_name : req.target.guild_id)
                  << "', channel '"
                  << (req.target.channel_id.empty() ? req.target.channel_name : req.target.channel_id)
                  << "')\n";
        done(Outcome::NotFound, kNotFound);
        return;
    }

    std::string ref = req.ref;
    std::string channel_id = target->channel_id;
    upstream_.send_message(channel_id, req.content,
        [this, ref, channel_id, done](UpstreamResult<std::string> result) {
            if (result.ok()) {
                processed_.add(ref);
                mark_dirty_();
                std::cerr << "[queue] Delivered ref=" << ref << " to channel "
                          << channel_id << " as " << *result.value << "\n";
                done(Outcome::Delivered, "");
                return;
            }

            const UpstreamError& err = result.error;
            std::cerr << "[queue] Send of ref=" << ref << " failed ("
                      << error_kind_name(err.kind) << "): " << err.message << "\n";
            if (err.kind == ErrorKind::Resolution) {
                done(Outcome::Rejected, err.message);
            } else if (err.kind == ErrorKind::Availability || !upstream_.connected()) {
                done(Outcome::Unavailable, err.message);
            } else {
                done(Outcome::Failed, err.message);
            }
        });
}

// ── Replay ──────────────────────────────────────────────────────

void SendQueue::start_replay() {
    if (replaying_) return;
    if (pending_.empty()) return;
    replaying_ = true;
    std::cerr << "[queue] Replaying " << pending_.size() << " queued sends\n";
    schedule_step(0);
}

void SendQueue::stop_replay(const char* reason) {
    replaying_ = false;
    waiting_for_directory_ = false;
    if (step_timer_ != 0) {
        loop_.cancel(step_timer_);
        step_timer_ = 0;
    }
    std::cerr << "[queue] Replay stopped: " << reason << " (" << pending_.size()
              << " queued)\n";
}

void SendQueue::schedule_step(uint32_t delay_ms) {
    if (step_timer_ != 0) loop_.cancel(step_timer_);
    step_timer_ = loop_.schedule(std::chrono::milliseconds(delay_ms), [this]() {
        step_timer_ = 0;
        replay_step();
    });
}

void SendQueue::replay_step() {
    if (!replaying_) return;
    if (!upstream_.connected()) {
        stop_replay("upstream disconnected");
        return;
    }
    if (directory_.building()) {
        if (!waiting_for_directory_)
            std::cerr << "[queue] Directory build in progress, replay waits\n";
        waiting_for_directory_ = true;
        return;
    }
    if (pending_.empty()) {
        stop_replay("queue drained");
        return;
    }
    for (const auto& item : pending_) {
        if (item.in_flight) return;
    }

    uint64_t now = loop_.now_ms();
    auto due = std::find_if(pending_.begin(), pending_.end(),
                            [now](const PendingItem& item) { return item.next_attempt_at <= now; });
    if (due == pending_.end()) {
        uint64_t earliest = pending_.front().next_attempt_at;
        for (const auto& item : pending_) {
            earliest = std::min(earliest, item.next_attempt_at);
        }
        schedule_step(static_cast<uint32_t>(earliest - now));
        return;
    }

    if (processed_.contains(due->req.ref)) {
        SendAck ack;
        ack.ref = due->req.ref;
        ack.ok = true;
        ack.skipped = true;
        pending_.erase(due);
        mark_dirty_();
        emit(std::move(ack));
        schedule_step(0);
        return;
    }

    due->in_flight = true;
    SendRequest req = due->req;
    deliver(req, [this, ref = req.ref](Outcome outcome, const std::string& error) {
        on_replay_outcome(ref, outcome, error);
    });
}

void SendQueue::on_replay_outcome(const std::string& ref, Outcome outcome,
                                  const std::string& error) {
    auto it = find_pending(ref);
    if (it == pending_.end()) return;
    it->in_flight = false;

    SendAck ack;
    ack.ref = ref;
    uint32_t next_delay = 0;

    switch (outcome) {
        case Outcome::Delivered:
            ack.ok = true;
            next_delay = options_.replay_pacing_ms;
            break;
        case Outcome::NotFound:
            ack.error = kNotFound;
            break;
        case Outcome::Rejected:
            ack.error = error;
            break;
        case Outcome::Unavailable:
            // Not the item's fault: keep it, do not count the attempt.
            stop_replay("upstream disconnected during send");
            return;
        case Outcome::Failed: {
            it->req.tries++;
            if (it->req.tries < options_.max_retries) {
                uint32_t delay = retry_backoff_ms(it->req.tries, options_.base_backoff_ms,
                                                  options_.max_backoff_ms);
                it->next_attempt_at = loop_.now_ms() + delay;
                std::cerr << "[queue] ref=" << ref << " retry " << it->req.tries << "/"
                          << options_.max_retries << " in " << delay << "ms\n";
                mark_dirty_();
                schedule_step(0);
                return;
            }
            std::cerr << "[queue] ref=" << ref << " giving up after " << it->req.tries
                      << " attempts, last error: " << error << "\n";
            ack.error = kMaxRetries;
            break;
        }
    }

    pending_.erase(it);
    mark_dirty_();
    emit(std::move(ack));
    schedule_step(next_delay);
}

} // namespace cordbridge
