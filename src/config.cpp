#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "server/ws_server.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cordbridge {

nlohmann::json Config::defaults_json() {
    return {
        {"listen", "0.0.0.0:3001"},
        {"token", ""},
        {"state_path", "~/.cordbridge/state.json"},
        {"api_base", "https://discord.com/api/v10"},
        {"gateway_url", "wss://gateway.discord.gg/?v=10&encoding=json"},
        {"bridge", {
            {"save_debounce_ms", 800},
            {"heartbeat_interval_ms", 20000},
            {"heartbeat_stale_ms", 60000},
            {"dedupe_window_ms", 1500},
            {"max_send_retries", 5},
            {"base_backoff_ms", 400},
            {"max_backoff_ms", 25600},
            {"replay_pacing_ms", 150},
            {"build_batch_size", 5},
            {"build_batch_pause_ms", 120},
            {"drop_other_bots", true},
            {"processed_ref_limit", 0},
            {"history_limit_max", 250}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_str(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_str(j, "listen", cfg.listen);
    read_str(j, "token", cfg.token);
    read_str(j, "state_path", cfg.state_path);
    read_str(j, "api_base", cfg.api_base);
    read_str(j, "gateway_url", cfg.gateway_url);

    if (j.contains("bridge") && j["bridge"].is_object()) {
        auto& b = j["bridge"];
        read_u32(b, "save_debounce_ms", cfg.bridge.save_debounce_ms);
        read_u32(b, "heartbeat_interval_ms", cfg.bridge.heartbeat_interval_ms);
        read_u32(b, "heartbeat_stale_ms", cfg.bridge.heartbeat_stale_ms);
        read_u32(b, "dedupe_window_ms", cfg.bridge.dedupe_window_ms);
        read_u32(b, "max_send_retries", cfg.bridge.max_send_retries);
        read_u32(b, "base_backoff_ms", cfg.bridge.base_backoff_ms);
        read_u32(b, "max_backoff_ms", cfg.bridge.max_backoff_ms);
        read_u32(b, "replay_pacing_ms", cfg.bridge.replay_pacing_ms);
        read_u32(b, "build_batch_size", cfg.bridge.build_batch_size);
        read_u32(b, "build_batch_pause_ms", cfg.bridge.build_batch_pause_ms);
        read_u32(b, "processed_ref_limit", cfg.bridge.processed_ref_limit);
        read_u32(b, "history_limit_max", cfg.bridge.history_limit_max);
        if (b.contains("drop_other_bots") && b["drop_other_bots"].is_boolean())
            cfg.bridge.drop_other_bots = b["drop_other_bots"].get<bool>();
    }

    if (cfg.bridge.build_batch_size == 0) cfg.bridge.build_batch_size = 1;
    if (cfg.bridge.max_send_retries == 0) cfg.bridge.max_send_retries = 1;
    return cfg;
}

Config Config::load(const std::string& config_path_override) {
    std::string config_path = config_path_override.empty()
        ? expand_home("~/.cordbridge/config.json")
        : expand_home(config_path_override);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("TOKEN"); v && *v)
        token = v;
    if (const char* v = std::getenv("DISCORD_TOKEN"); v && *v)
        token = v;
    if (const char* v = std::getenv("CORDBRIDGE_STATE"); v && *v)
        state_path = v;
    if (const char* v = std::getenv("PORT"); v && *v) {
        char* end = nullptr;
        unsigned long port = std::strtoul(v, &end, 10);
        if (end && *end == '\0' && port > 0 && port <= 65535) {
            set_port(static_cast<uint16_t>(port));
        } else {
            std::cerr << "[config] Ignoring invalid PORT=" << v << "\n";
        }
    }
}

void Config::set_port(uint16_t port) {
    std::string host = "0.0.0.0";
    uint16_t old_port = 0;
    if (!parse_listen_addr(listen, host, old_port)) {
        size_t colon = listen.rfind(':');
        if (colon != std::string::npos && colon > 0) host = listen.substr(0, colon);
    }
    listen = host + ":" + std::to_string(port);
}

void Config::validate() const {
    if (trim(token).empty())
        throw AuthError("No Discord bot token configured "
                        "(set \"token\" in the config file or DISCORD_TOKEN)");
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen, host, port))
        throw std::invalid_argument("Invalid listen address: " + listen);
}

} // namespace cordbridge
