#include "ws_server.hpp"

#include <boost/asio/ip/address.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace cordbridge {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static constexpr size_t kMaxOutbox = 1024;
static constexpr size_t kMaxFrameBytes = 1 << 20;

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;

    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5) return false;
    char* end = nullptr;
    long p = std::strtol(digits.c_str(), &end, 10);
    if (!end || *end != '\0' || p <= 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ── WsSession ─────────────────────────────────────────────────────────

WsSession::WsSession(tcp::socket socket, FanoutHub& hub, uint64_t id)
    : ws_(std::move(socket)), hub_(hub), id_(id)
{
    beast::error_code ec;
    auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    description_ = "client#" + std::to_string(id_);
    if (!ec) description_ += " (" + ep.address().to_string() + ":" +
                             std::to_string(ep.port()) + ")";
}

void WsSession::run() {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(beast::http::field::server, "cordbridge");
        }));
    ws_.read_message_max(kMaxFrameBytes);
    ws_.async_accept(beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
}

void WsSession::on_accept(beast::error_code ec) {
    if (ec) {
        std::cerr << "[ws] Handshake with " << description_ << " failed: "
                  << ec.message() << "\n";
        closed_ = true;
        return;
    }
    hub_.attach(shared_from_this());
    if (closed_) return;  // replay failed and the hub already dropped us
    do_read();
}

void WsSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
}

void WsSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        on_closed(ec == websocket::error::closed ? "closed by peer" : ec.message());
        return;
    }
    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (ws_.got_text()) {
        hub_.on_text(id_, text);
    }
    if (!closed_) do_read();
}

void WsSession::send_text(const std::string& text) {
    if (closed_) throw std::runtime_error("connection closed");
    if (outbox_.size() >= kMaxOutbox) throw std::runtime_error("write queue full");
    outbox_.push_back(text);
    if (!writing_) do_write();
}

void WsSession::do_write() {
    writing_ = true;
    ws_.text(true);
    ws_.async_write(net::buffer(outbox_.front()),
                    beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
}

void WsSession::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
        on_closed("write failed: " + ec.message());
        return;
    }
    outbox_.pop_front();
    if (!outbox_.empty() && !closed_) do_write();
}

void WsSession::close() {
    if (closed_) return;
    closed_ = true;
    outbox_.clear();
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(ws_).close();
}

void WsSession::on_closed(const std::string& reason) {
    closed_ = true;
    if (detached_) return;
    detached_ = true;
    std::cerr << "[ws] " << description_ << " gone: " << reason << "\n";
    hub_.detach(id_);
}

// ── WsServer ──────────────────────────────────────────────────────────

WsServer::WsServer(net::io_context& io, FanoutHub& hub, std::string listen_addr)
    : io_(io), acceptor_(io), hub_(hub), listen_addr_(std::move(listen_addr))
{}

WsServer::~WsServer() {
    stop();
}

bool WsServer::start(std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (ec) {
        error = "Invalid listen host: " + host;
        return false;
    }
    tcp::endpoint ep(address, port);

    acceptor_.open(ep.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(ep, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        error = "Failed to listen on " + listen_addr_ + ": " + ec.message();
        beast::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    port_ = acceptor_.local_endpoint().port();
    std::cerr << "[ws] Listening on " << host << ":" << port_ << "\n";
    do_accept();
    return true;
}

void WsServer::stop() {
    if (!acceptor_.is_open()) return;
    beast::error_code ec;
    acceptor_.close(ec);
}

void WsServer::do_accept() {
    acceptor_.async_accept(io_, [this](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
            std::cerr << "[ws] Accept failed: " << ec.message() << "\n";
        } else {
            std::make_shared<WsSession>(std::move(socket), hub_, next_id_++)->run();
        }
        if (acceptor_.is_open()) do_accept();
    });
}

} // namespace cordbridge
