#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fanrelay {

nlohmann::json Config::defaults_json() {
    return {
        {"listen", "0.0.0.0:8080"},
        {"eviction_delay_ms", 30000},
        {"idle_session_timeout_ms", 0},
        {"log_file", ""},
        {"upstream", {
            {"connect_timeout_seconds", 10},
            {"idle_timeout_seconds", 30}
        }},
        {"client", {
            {"send_timeout_seconds", 5},
            {"max_header_bytes", 16384}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
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

static bool read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return false;
    out = obj[key].get<uint32_t>();
    return true;
}

static bool env_uint(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    try {
        unsigned long parsed = std::stoul(v);
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
        return false;
    }
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;

    if (j.contains("listen") && j["listen"].is_string())
        listen = j["listen"].get<std::string>();
    read_uint(j, "eviction_delay_ms", eviction_delay_ms);
    read_uint(j, "idle_session_timeout_ms", idle_session_timeout_ms);
    if (j.contains("log_file") && j["log_file"].is_string())
        log_file = j["log_file"].get<std::string>();

    if (j.contains("upstream") && j["upstream"].is_object()) {
        auto& u = j["upstream"];
        read_uint(u, "connect_timeout_seconds", upstream.connect_timeout_seconds);
        read_uint(u, "idle_timeout_seconds", upstream.idle_timeout_seconds);
    }

    if (j.contains("client") && j["client"].is_object()) {
        auto& c = j["client"];
        read_uint(c, "send_timeout_seconds", client.send_timeout_seconds);
        read_uint(c, "max_header_bytes", client.max_header_bytes);
    }
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("FANRELAY_LISTEN"))
        listen = v;
    env_uint("FANRELAY_EVICTION_DELAY_MS", eviction_delay_ms);
    env_uint("FANRELAY_UPSTREAM_IDLE_TIMEOUT", upstream.idle_timeout_seconds);
    if (const char* v = std::getenv("FANRELAY_LOG_FILE"))
        log_file = v;
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.fanrelay/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception&) {
            // Malformed config file: fall back to defaults
            std::cerr << "[config] Malformed config, using defaults: " << config_path << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    cfg.apply_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open config file: " + path);

    Config cfg;
    try {
        cfg.apply_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    cfg.apply_env();
    return cfg;
}

} // namespace fanrelay
