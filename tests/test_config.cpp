#include <catch2/catch.hpp>
#include "config.hpp"
#include "lifecycle.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace fanrelay;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.listen == "0.0.0.0:8080");
    REQUIRE(cfg.eviction_delay_ms == 30000);
    REQUIRE(cfg.idle_session_timeout_ms == 0);
    REQUIRE(cfg.log_file.empty());
    REQUIRE(cfg.upstream.connect_timeout_seconds == 10);
    REQUIRE(cfg.upstream.idle_timeout_seconds == 30);
    REQUIRE(cfg.client.send_timeout_seconds == 5);
    REQUIRE(cfg.client.max_header_bytes == 16384);
}

TEST_CASE("Config: defaults_json matches struct defaults", "[config]") {
    Config from_json;
    from_json.apply_json(Config::defaults_json());
    Config plain;
    REQUIRE(from_json.listen == plain.listen);
    REQUIRE(from_json.eviction_delay_ms == plain.eviction_delay_ms);
    REQUIRE(from_json.upstream.idle_timeout_seconds == plain.upstream.idle_timeout_seconds);
    REQUIRE(from_json.client.max_header_bytes == plain.client.max_header_bytes);
}

TEST_CASE("Config::apply_json: ignores wrong types", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "listen": 8080,
        "eviction_delay_ms": "soon",
        "upstream": {"idle_timeout_seconds": -1}
    })"));
    REQUIRE(cfg.listen == "0.0.0.0:8080");
    REQUIRE(cfg.eviction_delay_ms == 30000);
    REQUIRE(cfg.upstream.idle_timeout_seconds == 30);
}

TEST_CASE("LifecycleOptions::from_config: copies timings", "[config]") {
    Config cfg;
    cfg.eviction_delay_ms = 1500;
    cfg.idle_session_timeout_ms = 700;
    cfg.upstream.connect_timeout_seconds = 3;
    cfg.upstream.idle_timeout_seconds = 9;

    auto opts = LifecycleOptions::from_config(cfg);
    REQUIRE(opts.eviction_delay.count() == 1500);
    REQUIRE(opts.idle_session_timeout.count() == 700);
    REQUIRE(opts.upstream.connect_timeout_seconds == 3);
    REQUIRE(opts.upstream.idle_timeout_seconds == 9);
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "fanrelay_cfg_XXXXXX";
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
        clear_env();
    }

    ~ConfigTestGuard() {
        clear_env();
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    static void clear_env() {
        unsetenv("FANRELAY_LISTEN");
        unsetenv("FANRELAY_EVICTION_DELAY_MS");
        unsetenv("FANRELAY_UPSTREAM_IDLE_TIMEOUT");
        unsetenv("FANRELAY_LOG_FILE");
    }

    std::string config_path() const { return dir + "/.fanrelay/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.fanrelay");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "listen": "127.0.0.1:9000",
        "eviction_delay_ms": 5000,
        "idle_session_timeout_ms": 60000,
        "log_file": "/tmp/relay.log",
        "upstream": { "connect_timeout_seconds": 4, "idle_timeout_seconds": 12 },
        "client": { "send_timeout_seconds": 2, "max_header_bytes": 8192 }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.listen == "127.0.0.1:9000");
    REQUIRE(cfg.eviction_delay_ms == 5000);
    REQUIRE(cfg.idle_session_timeout_ms == 60000);
    REQUIRE(cfg.log_file == "/tmp/relay.log");
    REQUIRE(cfg.upstream.connect_timeout_seconds == 4);
    REQUIRE(cfg.upstream.idle_timeout_seconds == 12);
    REQUIRE(cfg.client.send_timeout_seconds == 2);
    REQUIRE(cfg.client.max_header_bytes == 8192);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"listen": "127.0.0.1:9000", "eviction_delay_ms": 5000})");
    setenv("FANRELAY_LISTEN", "0.0.0.0:7000", 1);
    setenv("FANRELAY_EVICTION_DELAY_MS", "250", 1);
    setenv("FANRELAY_UPSTREAM_IDLE_TIMEOUT", "3", 1);
    setenv("FANRELAY_LOG_FILE", "/tmp/env.log", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.listen == "0.0.0.0:7000");
    REQUIRE(cfg.eviction_delay_ms == 250);
    REQUIRE(cfg.upstream.idle_timeout_seconds == 3);
    REQUIRE(cfg.log_file == "/tmp/env.log");
}

TEST_CASE("Config::load: non-numeric env var is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("FANRELAY_EVICTION_DELAY_MS", "later", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.eviction_delay_ms == 30000);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.listen == "0.0.0.0:8080");
    REQUIRE(cfg.eviction_delay_ms == 30000);
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));
    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["listen"] == "0.0.0.0:8080");
    REQUIRE(j["eviction_delay_ms"] == 30000);
    REQUIRE(j["upstream"]["idle_timeout_seconds"] == 30);
    REQUIRE(j["client"]["send_timeout_seconds"] == 5);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"listen": "127.0.0.1:9000", "upstream": {"idle_timeout_seconds": 90}})");

    Config cfg = Config::load();
    REQUIRE(cfg.listen == "127.0.0.1:9000");
    REQUIRE(cfg.upstream.idle_timeout_seconds == 90);

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["listen"] == "127.0.0.1:9000");
    REQUIRE(j["upstream"]["idle_timeout_seconds"] == 90);
    REQUIRE(j["upstream"]["connect_timeout_seconds"] == 10);
    REQUIRE(j.contains("client"));
    REQUIRE(j["eviction_delay_ms"] == 30000);
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["eviction_delay_ms"] = 1000;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();
    REQUIRE(cfg.eviction_delay_ms == 1000);
    REQUIRE(g.read_config() == before);
}

// ── Config::load_file ────────────────────────────────────────────

TEST_CASE("Config::load_file: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/relay.json";
    {
        std::ofstream f(path);
        f << R"({"listen": "127.0.0.1:8181", "client": {"max_header_bytes": 4096}})";
    }

    Config cfg = Config::load_file(path);
    REQUIRE(cfg.listen == "127.0.0.1:8181");
    REQUIRE(cfg.client.max_header_bytes == 4096);
    REQUIRE(cfg.eviction_delay_ms == 30000);
    // load_file never creates the home config
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load_file: missing or malformed file throws", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    REQUIRE_THROWS_AS(Config::load_file(g.dir + "/absent.json"), std::runtime_error);

    std::string path = g.dir + "/broken.json";
    {
        std::ofstream f(path);
        f << "{ nope";
    }
    REQUIRE_THROWS_AS(Config::load_file(path), std::runtime_error);
}
