#include <catch2/catch.hpp>
#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace cordbridge;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.listen == "0.0.0.0:3001");
    REQUIRE(cfg.token.empty());
    REQUIRE(cfg.state_path == "~/.cordbridge/state.json");
}

TEST_CASE("BridgeConfig: default timings", "[config]") {
    BridgeConfig b;
    REQUIRE(b.save_debounce_ms == 800);
    REQUIRE(b.heartbeat_interval_ms == 20000);
    REQUIRE(b.dedupe_window_ms == 1500);
    REQUIRE(b.max_send_retries == 5);
    REQUIRE(b.build_batch_size == 5);
    REQUIRE(b.build_batch_pause_ms == 120);
    REQUIRE(b.drop_other_bots);
    REQUIRE(b.processed_ref_limit == 0);
}

TEST_CASE("Config::from_json: defaults_json matches struct defaults", "[config]") {
    Config from_defaults = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(from_defaults.listen == plain.listen);
    REQUIRE(from_defaults.api_base == plain.api_base);
    REQUIRE(from_defaults.gateway_url == plain.gateway_url);
    REQUIRE(from_defaults.bridge.max_backoff_ms == plain.bridge.max_backoff_ms);
    REQUIRE(from_defaults.bridge.history_limit_max == plain.bridge.history_limit_max);
}

TEST_CASE("Config::from_json: wrong-typed values are ignored", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "listen": 3001,
        "bridge": { "dedupe_window_ms": "fast", "max_send_retries": 9 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.listen == "0.0.0.0:3001");
    REQUIRE(cfg.bridge.dedupe_window_ms == 1500);
    REQUIRE(cfg.bridge.max_send_retries == 9);
}

TEST_CASE("Config::from_json: zero batch size and retries are clamped", "[config]") {
    auto j = nlohmann::json::parse(R"({"bridge": {"build_batch_size": 0, "max_send_retries": 0}})");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.bridge.build_batch_size == 1);
    REQUIRE(cfg.bridge.max_send_retries == 1);
}

// ── set_port / validate ─────────────────────────────────────────

TEST_CASE("Config::set_port: keeps host", "[config]") {
    Config cfg;
    cfg.listen = "127.0.0.1:3001";
    cfg.set_port(4000);
    REQUIRE(cfg.listen == "127.0.0.1:4000");
}

TEST_CASE("Config::validate: missing token is an AuthError", "[config]") {
    Config cfg;
    cfg.token = "   ";
    REQUIRE_THROWS_AS(cfg.validate(), AuthError);
}

TEST_CASE("Config::validate: bad listen address rejected", "[config]") {
    Config cfg;
    cfg.token = "abc";
    cfg.listen = "localhost";
    REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    cfg.listen = "0.0.0.0:3001";
    REQUIRE_NOTHROW(cfg.validate());
}

// ── merge_defaults ──────────────────────────────────────────────

TEST_CASE("merge_defaults: fills missing nested keys only", "[config]") {
    auto existing = nlohmann::json::parse(R"({"token": "t", "bridge": {"max_send_retries": 2}})");
    auto merged = merge_defaults(existing, Config::defaults_json());
    REQUIRE(merged["token"] == "t");
    REQUIRE(merged["bridge"]["max_send_retries"] == 2);
    REQUIRE(merged["bridge"]["save_debounce_ms"] == 800);
    REQUIRE(merged["listen"] == "0.0.0.0:3001");
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "cordbridge_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("TOKEN");
        unsetenv("DISCORD_TOKEN");
        unsetenv("CORDBRIDGE_STATE");
        unsetenv("PORT");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("TOKEN");
        unsetenv("DISCORD_TOKEN");
        unsetenv("CORDBRIDGE_STATE");
        unsetenv("PORT");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.cordbridge/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.cordbridge");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "listen": "127.0.0.1:9000",
        "token": "file-token",
        "state_path": "/tmp/cb-state.json",
        "bridge": { "heartbeat_interval_ms": 5000, "drop_other_bots": false }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.listen == "127.0.0.1:9000");
    REQUIRE(cfg.token == "file-token");
    REQUIRE(cfg.state_path == "/tmp/cb-state.json");
    REQUIRE(cfg.bridge.heartbeat_interval_ms == 5000);
    REQUIRE_FALSE(cfg.bridge.drop_other_bots);
    REQUIRE(cfg.bridge.save_debounce_ms == 800);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"token": "file-token", "listen": "127.0.0.1:9000"})");

    setenv("TOKEN", "plain-token", 1);
    setenv("DISCORD_TOKEN", "discord-token", 1);
    setenv("PORT", "4100", 1);
    setenv("CORDBRIDGE_STATE", "/tmp/other.json", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.token == "discord-token");
    REQUIRE(cfg.listen == "127.0.0.1:4100");
    REQUIRE(cfg.state_path == "/tmp/other.json");
}

TEST_CASE("Config::load: TOKEN used when DISCORD_TOKEN absent", "[config]") {
    ConfigTestGuard g;
    setenv("TOKEN", "plain-token", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.token == "plain-token");
}

TEST_CASE("Config::load: invalid PORT ignored", "[config]") {
    ConfigTestGuard g;
    setenv("PORT", "99999", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.listen == "0.0.0.0:3001");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    Config cfg = Config::load();
    REQUIRE(cfg.listen == "0.0.0.0:3001");
    REQUIRE(cfg.token.empty());
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));

    Config cfg = Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    auto j = nlohmann::json::parse(f);
    REQUIRE(j["listen"] == "0.0.0.0:3001");
    REQUIRE(j["bridge"]["dedupe_window_ms"] == 1500);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"token": "keep-me"})");

    Config cfg = Config::load();
    REQUIRE(cfg.token == "keep-me");

    std::ifstream f(g.config_path());
    auto j = nlohmann::json::parse(f);
    REQUIRE(j["token"] == "keep-me");
    REQUIRE(j.contains("bridge"));
    REQUIRE(j["bridge"]["max_send_retries"] == 5);
}

TEST_CASE("Config::load: explicit path is used", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"token": "custom"})";
    }
    Config cfg = Config::load(path);
    REQUIRE(cfg.token == "custom");
}
