#include "event_loop.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/executor_work_guard.hpp>

#include <iostream>

namespace cordbridge {

struct AsioEventLoop::Timers {
    std::unordered_map<TimerId, std::unique_ptr<boost::asio::steady_timer>> pending;
    std::unique_ptr<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>> work;
};

AsioEventLoop::AsioEventLoop()
    : io_(std::make_unique<boost::asio::io_context>())
    , timers_(std::make_unique<Timers>())
{
    // Keep run() alive while the server waits for its first connection
    timers_->work = std::make_unique<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>>(io_->get_executor());
}

AsioEventLoop::~AsioEventLoop() {
    timers_->pending.clear();
}

void AsioEventLoop::post(Task task) {
    boost::asio::post(*io_, [t = std::move(task)]() {
        try {
            t();
        } catch (const std::exception& e) {
            std::cerr << "[loop] Task failed: " << e.what() << "\n";
        }
    });
}

TimerId AsioEventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id = next_id_++;
    auto timer = std::make_unique<boost::asio::steady_timer>(*io_, delay);
    timer->async_wait([this, id, t = std::move(task)](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        // An expired wait can already be queued when cancel() runs.
        if (timers_->pending.erase(id) == 0) return;
        try {
            t();
        } catch (const std::exception& e) {
            std::cerr << "[loop] Timer task failed: " << e.what() << "\n";
        }
    });
    timers_->pending.emplace(id, std::move(timer));
    return id;
}

bool AsioEventLoop::cancel(TimerId id) {
    auto it = timers_->pending.find(id);
    if (it == timers_->pending.end()) return false;
    it->second->cancel();
    timers_->pending.erase(it);
    return true;
}

uint64_t AsioEventLoop::now_ms() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

void AsioEventLoop::run() {
    io_->run();
}

void AsioEventLoop::stop() {
    timers_->work.reset();
    io_->stop();
}

boost::asio::io_context& AsioEventLoop::context() {
    return *io_;
}

} // namespace cordbridge
