#include <catch2/catch.hpp>
#include "server/ws_server.hpp"
#include "http.hpp"
#include "fake_upstream.hpp"

#include <boost/asio/connect.hpp>

using namespace cordbridge;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

// ── parse_listen_addr ───────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid host:port", "[ws_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("0.0.0.0:3001", host, port));
    REQUIRE(host == "0.0.0.0");
    REQUIRE(port == 3001);
}

TEST_CASE("parse_listen_addr: missing colon returns false", "[ws_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("localhost", host, port));
}

TEST_CASE("parse_listen_addr: non-numeric or out of range port", "[ws_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:http", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:70000", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:0", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:", host, port));
}

TEST_CASE("parse_listen_addr: empty host returns false", "[ws_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr(":3001", host, port));
    REQUIRE_FALSE(parse_listen_addr("", host, port));
}

// ── parse_url ───────────────────────────────────────────────────

TEST_CASE("parse_url: wss implies TLS and port 443", "[http]") {
    ParsedUrl u = parse_url("wss://gateway.discord.gg/?v=10&encoding=json");
    REQUIRE(u.tls);
    REQUIRE(u.host == "gateway.discord.gg");
    REQUIRE(u.port == "443");
    REQUIRE(u.path == "/?v=10&encoding=json");
}

TEST_CASE("parse_url: explicit port and plain http", "[http]") {
    ParsedUrl u = parse_url("http://127.0.0.1:8080/api/v10");
    REQUIRE_FALSE(u.tls);
    REQUIRE(u.port == "8080");
    REQUIRE(u.path == "/api/v10");
}

TEST_CASE("parse_url: scheme required", "[http]") {
    REQUIRE_THROWS(parse_url("discord.com/api"));
}

// ── Loopback ────────────────────────────────────────────────────

TEST_CASE("WsServer: client receives the state replay and gets answers", "[ws_server]") {
    AsioEventLoop loop;
    EventBus bus;
    FakeUpstream upstream(loop);
    DirectoryCache directory(loop, bus, upstream);
    FanoutHub hub(loop, bus, directory, upstream);
    hub.set_inbound_handler([&](ClientConnection& conn, const std::string& text) {
        if (text == "hello") hub.send_to(conn.id(), nlohmann::json{{"type", "pong"}, {"ts", 1}});
    });

    WsServer server(loop.context(), hub, "127.0.0.1:38471");
    std::string error;
    if (!server.start(error)) {
        WARN("loopback port unavailable: " << error);
        return;
    }
    REQUIRE(server.port() == 38471);

    std::vector<std::string> received;
    websocket::stream<beast::tcp_stream> client(loop.context());
    beast::flat_buffer buffer;

    std::function<void()> read_next;
    read_next = [&]() {
        client.async_read(buffer, [&](beast::error_code ec, std::size_t) {
            if (ec) return loop.stop();
            received.push_back(beast::buffers_to_string(buffer.data()));
            buffer.consume(buffer.size());
            if (received.size() == 2) {
                client.text(true);
                client.write(boost::asio::buffer(std::string("hello")));
            }
            if (received.size() == 3) {
                server.stop();
                return loop.stop();
            }
            read_next();
        });
    };

    tcp::resolver resolver(loop.context());
    auto results = resolver.resolve("127.0.0.1", "38471");
    beast::get_lowest_layer(client).async_connect(results,
        [&](beast::error_code ec, tcp::endpoint) {
            if (ec) return loop.stop();
            client.async_handshake("127.0.0.1", "/", [&](beast::error_code hec) {
                if (hec) return loop.stop();
                read_next();
            });
        });

    loop.schedule(std::chrono::milliseconds(5000), [&]() { loop.stop(); });
    loop.run();

    REQUIRE(received.size() == 3);
    REQUIRE(nlohmann::json::parse(received[0])["type"] == "bridgeStatus");
    REQUIRE(nlohmann::json::parse(received[1])["type"] == "ready");
    REQUIRE(nlohmann::json::parse(received[2])["type"] == "pong");
    REQUIRE(hub.connection_count() == 1);
}
