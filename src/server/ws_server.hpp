#pragma once
#include "../fanout_hub.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <memory>
#include <string>
#include <cstdint>

namespace cordbridge {

// One client WebSocket. Reads and writes run on the event loop's
// io_context; outgoing frames are queued and written one at a time.
class WsSession : public ClientConnection,
                  public std::enable_shared_from_this<WsSession> {
public:
    WsSession(boost::asio::ip::tcp::socket socket, FanoutHub& hub, uint64_t id);

    void run();

    uint64_t id() const override { return id_; }
    void send_text(const std::string& text) override;
    void close() override;
    std::string describe() const override { return description_; }

private:
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);
    void do_write();
    void on_write(boost::beast::error_code ec, std::size_t bytes);
    void on_closed(const std::string& reason);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    FanoutHub& hub_;
    uint64_t id_;
    std::string description_;
    bool writing_ = false;
    bool closed_ = false;
    bool detached_ = false;
};

// Accepts client WebSocket connections on "host:port" and hands each one
// to the FanoutHub.
class WsServer {
public:
    WsServer(boost::asio::io_context& io, FanoutHub& hub, std::string listen_addr);
    ~WsServer();

    // Bind and start accepting. Returns false and populates error on failure.
    bool start(std::string& error);

    void stop();

    uint16_t port() const { return port_; }

private:
    void do_accept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    FanoutHub& hub_;
    std::string listen_addr_;
    uint16_t port_ = 0;
    uint64_t next_id_ = 1;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

} // namespace cordbridge
