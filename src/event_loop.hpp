#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace boost { namespace asio { class io_context; } }

namespace cordbridge {

using Task = std::function<void()>;
using TimerId = uint64_t;

// Single dispatch loop. Every component mutates shared state only from tasks
// run here; I/O completions from other threads are handed over with post().
class EventLoop {
public:
    virtual ~EventLoop() = default;

    // Queue a task to run on the loop thread. Safe from any thread.
    virtual void post(Task task) = 0;

    // Run task once after delay. Loop thread only.
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

    // Cancel a pending timer. Returns false if it already fired or is unknown.
    virtual bool cancel(TimerId id) = 0;

    // Monotonic time in milliseconds (arbitrary epoch).
    virtual uint64_t now_ms() const = 0;
};

// Production loop backed by boost::asio::io_context.
class AsioEventLoop : public EventLoop {
public:
    AsioEventLoop();
    ~AsioEventLoop() override;

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;
    uint64_t now_ms() const override;

    // Blocks until stop() or until no work remains.
    void run();
    void stop();

    boost::asio::io_context& context();

private:
    struct Timers;

    std::unique_ptr<boost::asio::io_context> io_;
    std::unique_ptr<Timers> timers_;
    TimerId next_id_ = 1;
};

} // namespace cordbridge
