#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace cordbridge {

struct BridgeConfig {
    uint32_t save_debounce_ms = 800;
    uint32_t heartbeat_interval_ms = 20000;
    uint32_t heartbeat_stale_ms = 60000;
    uint32_t dedupe_window_ms = 1500;
    uint32_t max_send_retries = 5;
    uint32_t base_backoff_ms = 400;
    uint32_t max_backoff_ms = 25600;
    uint32_t replay_pacing_ms = 150;
    uint32_t build_batch_size = 5;
    uint32_t build_batch_pause_ms = 120;
    bool drop_other_bots = true;
    uint32_t processed_ref_limit = 0;  // 0 = keep every ref
    uint32_t history_limit_max = 250;
};

struct Config {
    std::string listen = "0.0.0.0:3001";
    std::string token;
    std::string state_path = "~/.cordbridge/state.json";
    std::string api_base = "https://discord.com/api/v10";
    std::string gateway_url = "wss://gateway.discord.gg/?v=10&encoding=json";

    BridgeConfig bridge;

    // Load from ~/.cordbridge/config.json (or config_path) + env vars
    static Config load(const std::string& config_path = "");

    // Parse an already-merged JSON document (no file or env access)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply DISCORD_TOKEN / TOKEN / PORT / CORDBRIDGE_STATE
    void apply_env();

    // Replace the port part of `listen`
    void set_port(uint16_t port);

    // Throws AuthError when no credential is configured,
    // std::invalid_argument on an unusable listen address.
    void validate() const;
};

// Fill keys missing from existing with values from defaults (recursively).
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace cordbridge
