#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace fanrelay {

struct UpstreamConfig {
    uint32_t connect_timeout_seconds = 10;
    uint32_t idle_timeout_seconds = 30;  // 0 = wait forever on a silent upstream
};

struct ClientConfig {
    uint32_t send_timeout_seconds = 5;   // slow sinks fail after this
    uint32_t max_header_bytes = 16384;
};

struct Config {
    std::string listen = "0.0.0.0:8080";
    uint32_t eviction_delay_ms = 30000;
    uint32_t idle_session_timeout_ms = 0;  // 0 = never-joined sessions are kept
    std::string log_file;                  // empty = stderr

    UpstreamConfig upstream;
    ClientConfig client;

    // Load from ~/.fanrelay/config.json + env vars
    static Config load();

    // Load from an explicit path (not created if missing) + env vars
    static Config load_file(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed JSON document on top of the current values
    void apply_json(const nlohmann::json& j);

    // Apply FANRELAY_* environment overrides
    void apply_env();
};

} // namespace fanrelay
