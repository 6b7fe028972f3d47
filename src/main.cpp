#include "config.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "http.hpp"
#include "bridge.hpp"
#include "upstreams/discord.hpp"
#include "server/ws_server.hpp"

#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void print_usage() {
    std::cout << "Usage: cordbridge [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Config file (default: ~/.cordbridge/config.json)\n"
              << "  -p, --port PORT      Override the listen port\n"
              << "  --state PATH         Override the state file path\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  DISCORD_TOKEN        Bot token (TOKEN is also accepted)\n"
              << "  PORT                 Listen port\n"
              << "  CORDBRIDGE_STATE     State file path\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string state_path;
    long port = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--port") == 0) && i + 1 < argc) {
            char* end = nullptr;
            port = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0' || port <= 0 || port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--state") == 0 && i + 1 < argc) {
            state_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    cordbridge::Config config = cordbridge::Config::load(config_path);
    if (port != 0) config.set_port(static_cast<uint16_t>(port));
    if (!state_path.empty()) config.state_path = state_path;

    try {
        config.validate();
    } catch (const cordbridge::AuthError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    cordbridge::http_set_abort_flag(&g_shutdown);

    cordbridge::AsioEventLoop loop;
    cordbridge::SocketHttpClient http_client;

    cordbridge::DiscordOptions options;
    options.token = config.token;
    options.api_base = config.api_base;
    options.gateway_url = config.gateway_url;
    cordbridge::DiscordUpstream upstream(loop, http_client, options);

    int exit_code = 0;
    cordbridge::Bridge bridge(loop, upstream, config);
    bridge.set_fatal_handler([&](const std::string& reason) {
        std::cerr << "Fatal: " << reason << "\n";
        exit_code = 1;
        g_shutdown.store(true);
        bridge.shutdown();
        loop.stop();
    });

    cordbridge::WsServer server(loop.context(), bridge.hub(), config.listen);
    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    boost::asio::signal_set signals(loop.context(), SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        std::cerr << "\n[main] Signal " << sig << ", shutting down\n";
        g_shutdown.store(true);
        server.stop();
        bridge.shutdown();
        loop.stop();
    });

    bridge.start();
    loop.run();

    server.stop();
    return exit_code;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
