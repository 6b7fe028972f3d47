#include <catch2/catch.hpp>
#include "send_queue.hpp"
#include "manual_event_loop.hpp"
#include "fake_upstream.hpp"

using namespace cordbridge;

namespace {

struct QueueFixture {
    ManualEventLoop loop;
    EventBus bus;
    FakeUpstream upstream{loop};
    DirectoryCache directory{loop, bus, upstream};
    ProcessedRefSet processed;
    int dirty_marks = 0;
    std::vector<SendAck> acks;
    std::unique_ptr<SendQueue> queue;

    explicit QueueFixture(SendQueueOptions opts = {}) {
        Guild g;
        g.id = "g1";
        g.name = "Alpha";
        g.channels = {{"c1", "general", ChannelKind::Text}};
        directory.restore({g}, true);

        queue = std::make_unique<SendQueue>(loop, bus, upstream, directory, processed, opts,
                                            [this]() { dirty_marks++; });
        subscribe<SendAckEvent>(bus, [this](const SendAckEvent& ev) { acks.push_back(ev.ack); });
    }

    // Connected without going through a status transition.
    void connect_quietly() {
        upstream.set_status(UpstreamStatus::Connected);
    }

    void go_connected() {
        upstream.set_status(UpstreamStatus::Connected);
        UpstreamStatusEvent ev;
        ev.status = UpstreamStatus::Connected;
        ev.previous = UpstreamStatus::Connecting;
        bus.publish(ev);
    }

    void go_disconnected() {
        upstream.set_status(UpstreamStatus::Disconnected);
        UpstreamStatusEvent ev;
        ev.status = UpstreamStatus::Disconnected;
        ev.previous = UpstreamStatus::Connected;
        bus.publish(ev);
    }

    static SendRequest request(const std::string& ref, const std::string& content = "hi") {
        SendRequest req;
        req.ref = ref;
        req.target.guild_name = "alpha";
        req.target.channel_name = "general";
        req.content = content;
        return req;
    }
};

} // namespace

// ── retry_backoff_ms ────────────────────────────────────────────

TEST_CASE("retry_backoff_ms: doubles and caps", "[send_queue]") {
    REQUIRE(retry_backoff_ms(0, 400, 25600) == 400);
    REQUIRE(retry_backoff_ms(1, 400, 25600) == 800);
    REQUIRE(retry_backoff_ms(4, 400, 25600) == 6400);
    REQUIRE(retry_backoff_ms(6, 400, 25600) == 25600);
    REQUIRE(retry_backoff_ms(40, 400, 25600) == 25600);
}

TEST_CASE("retry_backoff_ms: non-decreasing in tries", "[send_queue]") {
    uint32_t prev = 0;
    for (uint32_t t = 0; t < 64; ++t) {
        uint32_t d = retry_backoff_ms(t, 400, 25600);
        REQUIRE(d >= prev);
        prev = d;
    }
}

// ── Direct delivery ─────────────────────────────────────────────

TEST_CASE("SendQueue: connected submit delivers and records the ref", "[send_queue]") {
    QueueFixture f;
    f.connect_quietly();

    f.queue->submit(QueueFixture::request("r1", "hello"));
    f.loop.run_until_idle();

    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.upstream.sent[0].channel_id == "c1");
    REQUIRE(f.upstream.sent[0].content == "hello");
    REQUIRE(f.acks.size() == 1);
    REQUIRE(f.acks[0].ok);
    REQUIRE_FALSE(f.acks[0].skipped);
    REQUIRE(f.processed.contains("r1"));
    REQUIRE(f.dirty_marks > 0);
}

TEST_CASE("SendQueue: resubmitting a delivered ref is skipped", "[send_queue]") {
    QueueFixture f;
    f.connect_quietly();

    f.queue->submit(QueueFixture::request("r1"));
    f.loop.run_until_idle();
    f.queue->submit(QueueFixture::request("r1"));
    f.loop.run_until_idle();

    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.acks.size() == 2);
    REQUIRE(f.acks[1].ok);
    REQUIRE(f.acks[1].skipped);
}

TEST_CASE("SendQueue: processed refs restored from disk are skipped", "[send_queue]") {
    QueueFixture f;
    f.processed.assign({"persisted"});
    f.connect_quietly();

    f.queue->submit(QueueFixture::request("persisted"));
    f.loop.run_until_idle();

    REQUIRE(f.upstream.sent.empty());
    REQUIRE(f.acks.size() == 1);
    REQUIRE(f.acks[0].skipped);
}

TEST_CASE("SendQueue: duplicate while in flight waits for the original", "[send_queue]") {
    QueueFixture f;
    f.connect_quietly();
    f.upstream.hold_sends = true;

    f.queue->submit(QueueFixture::request("r1"));
    f.queue->submit(QueueFixture::request("r1"));
    f.loop.run_until_idle();
    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.acks.empty());

    f.upstream.release_send(UpstreamResult<std::string>::success("m1"));
    f.loop.run_until_idle();

    REQUIRE(f.acks.size() == 2);
    REQUIRE(f.acks[0].ok);
    REQUIRE_FALSE(f.acks[0].skipped);
    REQUIRE(f.acks[1].ok);
    REQUIRE(f.acks[1].skipped);
}

TEST_CASE("SendQueue: request without ref gets one", "[send_queue]") {
    QueueFixture f;
    f.connect_quietly();
    SendRequest req = QueueFixture::request("");
    std::string ref = f.queue->submit(req);
    f.loop.run_until_idle();
    REQUIRE_FALSE(ref.empty());
    REQUIRE(f.acks.size() == 1);
    REQUIRE(f.acks[0].ref == ref);
}

TEST_CASE("SendQueue: unresolvable target fails with not found", "[send_queue]") {
    QueueFixture f;
    f.connect_quietly();

    SendRequest req = QueueFixture::request("r1");
    req.target.channel_name = "missing";
    f.queue->submit(req);
    f.loop.run_until_idle();

    REQUIRE(f.upstream.sent.empty());
    REQUIRE(f.acks.size() == 1);
    REQUIRE_FALSE(f.acks[0].ok);
    REQUIRE(f.acks[0].error == "not found");
    REQUIRE_FALSE(f.processed.contains("r1"));
}

TEST_CASE("SendQueue: transport failure on direct path is terminal", "[send_queue]") {
    QueueFixture f;
    f.connect_quietly();
    f.upstream.send_results.push_back(
        UpstreamResult<std::string>::failure(ErrorKind::Transport, "HTTP 500"));

    f.queue->submit(QueueFixture::request("r1"));
    f.loop.run_until_idle();

    REQUIRE(f.acks.size() == 1);
    REQUIRE_FALSE(f.acks[0].ok);
    REQUIRE(f.acks[0].error == "HTTP 500");
    REQUIRE(f.queue->pending_count() == 0);
}

// ── Parking and replay ──────────────────────────────────────────

TEST_CASE("SendQueue: disconnected submit is queued then delivered on connect", "[send_queue]") {
    QueueFixture f;

    f.queue->submit(QueueFixture::request("r1"));
    f.loop.run_until_idle();
    REQUIRE(f.acks.size() == 1);
    REQUIRE_FALSE(f.acks[0].ok);
    REQUIRE(f.acks[0].queued);
    REQUIRE(f.acks[0].error == "queued-not-connected");
    REQUIRE(f.queue->is_pending("r1"));
    REQUIRE(f.upstream.sent.empty());

    f.go_connected();
    f.loop.run_until_idle();

    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.acks.size() == 2);
    REQUIRE(f.acks[1].ok);
    REQUIRE(f.queue->pending_count() == 0);

    f.loop.advance(1000);
    REQUIRE_FALSE(f.queue->replaying());
}

TEST_CASE("SendQueue: queued ref resubmitted is not queued twice", "[send_queue]") {
    QueueFixture f;
    f.queue->submit(QueueFixture::request("r1"));
    f.queue->submit(QueueFixture::request("r1"));
    REQUIRE(f.queue->pending_count() == 1);
    REQUIRE(f.acks.size() == 2);
    REQUIRE(f.acks[1].queued);
}

TEST_CASE("SendQueue: replay is paced and keeps queue order", "[send_queue]") {
    SendQueueOptions opts;
    opts.replay_pacing_ms = 150;
    QueueFixture f(opts);
    f.queue->submit(QueueFixture::request("a", "first"));
    f.queue->submit(QueueFixture::request("b", "second"));

    f.go_connected();
    f.loop.run_until_idle();
    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.upstream.sent[0].content == "first");

    f.loop.advance(149);
    REQUIRE(f.upstream.sent.size() == 1);
    f.loop.advance(1);
    REQUIRE(f.upstream.sent.size() == 2);
    REQUIRE(f.upstream.sent[1].content == "second");
}

TEST_CASE("SendQueue: replay retries with growing backoff then gives up", "[send_queue]") {
    SendQueueOptions opts;
    opts.max_retries = 3;
    opts.base_backoff_ms = 400;
    opts.max_backoff_ms = 25600;
    QueueFixture f(opts);
    for (int i = 0; i < 3; ++i) {
        f.upstream.send_results.push_back(
            UpstreamResult<std::string>::failure(ErrorKind::Transport, "HTTP 502"));
    }

    f.queue->submit(QueueFixture::request("r1"));
    f.go_connected();
    f.loop.run_until_idle();
    REQUIRE(f.upstream.sent.size() == 1);

    f.loop.advance(799);
    REQUIRE(f.upstream.sent.size() == 1);
    f.loop.advance(1);
    REQUIRE(f.upstream.sent.size() == 2);

    f.loop.advance(1599);
    REQUIRE(f.upstream.sent.size() == 2);
    f.loop.advance(1);
    REQUIRE(f.upstream.sent.size() == 3);

    REQUIRE(f.acks.size() == 2);
    REQUIRE_FALSE(f.acks[1].ok);
    REQUIRE(f.acks[1].error == "max-retries");
    REQUIRE(f.queue->pending_count() == 0);
}

TEST_CASE("SendQueue: intermediate retries emit no ack", "[send_queue]") {
    QueueFixture f;
    f.upstream.send_results.push_back(
        UpstreamResult<std::string>::failure(ErrorKind::Transport, "timeout"));

    f.queue->submit(QueueFixture::request("r1"));
    f.go_connected();
    f.loop.run_until_idle();
    REQUIRE(f.acks.size() == 1);  // only the queued ack
    REQUIRE(f.queue->pending()[0].tries == 1);

    f.loop.advance(800);
    REQUIRE(f.acks.size() == 2);
    REQUIRE(f.acks[1].ok);
}

TEST_CASE("SendQueue: disconnect during replay keeps the item and its tries", "[send_queue]") {
    QueueFixture f;
    f.queue->submit(QueueFixture::request("r1"));
    f.go_connected();
    f.upstream.hold_sends = true;
    f.loop.run_until_idle();
    REQUIRE(f.upstream.held_sends.size() == 1);

    f.go_disconnected();
    f.upstream.release_send(
        UpstreamResult<std::string>::failure(ErrorKind::Availability, "not connected"));
    f.loop.run_until_idle();

    REQUIRE(f.queue->is_pending("r1"));
    REQUIRE(f.queue->pending()[0].tries == 0);
    REQUIRE_FALSE(f.queue->replaying());
    REQUIRE(f.acks.size() == 1);

    f.upstream.hold_sends = false;
    f.go_connected();
    f.loop.run_until_idle();
    REQUIRE(f.acks.size() == 2);
    REQUIRE(f.acks[1].ok);
}

TEST_CASE("SendQueue: restored item already processed is skipped on replay", "[send_queue]") {
    QueueFixture f;
    f.processed.assign({"r1"});
    f.queue->restore({QueueFixture::request("r1"), QueueFixture::request("r2")});

    f.go_connected();
    f.loop.advance(1000);

    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.acks.size() == 2);
    REQUIRE(f.acks[0].ref == "r1");
    REQUIRE(f.acks[0].skipped);
    REQUIRE(f.acks[1].ref == "r2");
    REQUIRE(f.acks[1].ok);
}

TEST_CASE("SendQueue: restore drops duplicate refs", "[send_queue]") {
    QueueFixture f;
    f.queue->restore({QueueFixture::request("r1"), QueueFixture::request("r1"),
                      QueueFixture::request("")});
    REQUIRE(f.queue->pending_count() == 1);
}

TEST_CASE("SendQueue: replay waits for a directory build", "[send_queue]") {
    QueueFixture f;
    for (int i = 0; i < 6; ++i) {
        std::string id = "g" + std::to_string(i);
        f.upstream.guilds.push_back({id, i == 0 ? "Alpha" : "Other"});
        f.upstream.channels[id] = {{"c" + std::to_string(i), "general", ChannelKind::Text}};
    }
    f.queue->submit(QueueFixture::request("r1"));

    f.upstream.set_status(UpstreamStatus::Connected);
    f.directory.build(true);
    UpstreamStatusEvent ev;
    ev.status = UpstreamStatus::Connected;
    ev.previous = UpstreamStatus::Connecting;
    f.bus.publish(ev);

    // First batch visited, build paused before the second one.
    f.loop.run_until_idle();
    REQUIRE(f.directory.building());
    REQUIRE(f.queue->replaying());
    REQUIRE(f.upstream.sent.empty());

    f.loop.advance(120);
    REQUIRE_FALSE(f.directory.building());
    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.upstream.sent[0].channel_id == "c0");
    REQUIRE(f.acks.back().ok);
}

TEST_CASE("SendQueue: target unknown during a build is queued until it finishes", "[send_queue]") {
    QueueFixture f;
    for (int i = 0; i < 6; ++i) {
        std::string id = "n" + std::to_string(i);
        f.upstream.guilds.push_back({id, i == 5 ? "Late" : "G" + std::to_string(i)});
        f.upstream.channels[id] = {{"c" + std::to_string(i), "general", ChannelKind::Text}};
    }
    f.connect_quietly();
    f.directory.build(true);
    f.loop.run_until_idle();
    REQUIRE(f.directory.building());

    // Committed guilds still resolve directly.
    f.queue->submit(QueueFixture::request("direct"));
    f.loop.run_until_idle();
    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.acks.back().ok);

    SendRequest late = QueueFixture::request("late");
    late.target.guild_name = "Late";
    f.queue->submit(late);
    f.loop.run_until_idle();
    REQUIRE(f.upstream.sent.size() == 1);
    REQUIRE(f.acks.back().ref == "late");
    REQUIRE(f.acks.back().queued);
    REQUIRE(f.acks.back().error == "queued-directory-building");
    REQUIRE(f.queue->is_pending("late"));

    f.loop.advance(120);
    REQUIRE_FALSE(f.directory.building());
    REQUIRE(f.upstream.sent.size() == 2);
    REQUIRE(f.upstream.sent[1].channel_id == "c5");
    REQUIRE(f.acks.back().ref == "late");
    REQUIRE(f.acks.back().ok);
    REQUIRE(f.processed.contains("late"));
}

TEST_CASE("SendQueue: target unknown with no build running is not found", "[send_queue]") {
    QueueFixture f;
    f.connect_quietly();
    SendRequest req = QueueFixture::request("r1");
    req.target.guild_name = "Late";
    f.queue->submit(req);
    f.loop.run_until_idle();
    REQUIRE(f.acks.size() == 1);
    REQUIRE(f.acks[0].error == "not found");
    REQUIRE_FALSE(f.queue->is_pending("r1"));
}

TEST_CASE("SendQueue: replay is single-flight", "[send_queue]") {
    QueueFixture f;
    f.queue->submit(QueueFixture::request("r1"));
    f.upstream.set_status(UpstreamStatus::Connected);
    f.upstream.hold_sends = true;

    f.queue->start_replay();
    f.queue->start_replay();
    f.loop.run_until_idle();
    f.queue->start_replay();
    f.loop.run_until_idle();

    REQUIRE(f.upstream.sent.size() == 1);
}
