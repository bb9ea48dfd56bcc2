#include "config.hpp"
#include "event_bus.hpp"
#include "event_log.hpp"
#include "gateway.hpp"
#include "http.hpp"
#include "lifecycle.hpp"
#include "server/http_server.hpp"
#include "session_registry.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

// Outlives main so late writes to std::cerr stay valid after redirection.
static std::ofstream g_log_stream;

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: fanrelay [options]\n"
              << "\n"
              << "Relays one upstream HTTP stream per session to many WebSocket clients.\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to listen on (default: 0.0.0.0:8080)\n"
              << "  --config PATH        Read configuration from PATH instead of\n"
              << "                       ~/.fanrelay/config.json\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  /create-relay?url=U[&sessionId=ID]   Create or resolve a relay session\n"
              << "  /relay/ID                            WebSocket subscriber endpoint\n"
              << "  /stream/ID                           Metadata for an active session\n"
              << "  /status                              All sessions\n"
              << "\n"
              << "Environment variables:\n"
              << "  FANRELAY_LISTEN                 Listen address\n"
              << "  FANRELAY_EVICTION_DELAY_MS      Grace period before an empty session is evicted\n"
              << "  FANRELAY_UPSTREAM_IDLE_TIMEOUT  Seconds of upstream silence before giving up\n"
              << "  FANRELAY_LOG_FILE               Append log output to this file\n";
}

int main(int argc, char* argv[]) try {
    std::string listen_override;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen_override = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    fanrelay::http_init();
    auto config = config_path.empty() ? fanrelay::Config::load()
                                      : fanrelay::Config::load_file(config_path);
    if (!listen_override.empty()) {
        config.listen = listen_override;
    }

    if (!config.log_file.empty()) {
        g_log_stream.open(fanrelay::expand_home(config.log_file), std::ios::app);
        if (!g_log_stream.is_open()) {
            std::cerr << "Error: cannot open log file " << config.log_file << "\n";
            fanrelay::http_cleanup();
            return 1;
        }
        std::cerr.rdbuf(g_log_stream.rdbuf());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    fanrelay::http_set_abort_flag(&g_shutdown);

    fanrelay::EventBus bus;
    auto event_log = fanrelay::attach_event_log(bus);

    fanrelay::PlatformHttpClient http_client;
    fanrelay::SessionRegistry registry;
    fanrelay::LifecycleController lifecycle(registry, http_client,
                                            fanrelay::LifecycleOptions::from_config(config));
    lifecycle.set_event_bus(&bus);

    fanrelay::Gateway gateway(lifecycle, config.client.send_timeout_seconds);
    fanrelay::HttpServer server(config.listen, config.client.max_header_bytes,
                                64 * 1024, gateway.handler());

    std::string error;
    if (!server.start(error)) {
        std::cerr << "[server] " << error << "\n";
        fanrelay::http_cleanup();
        return 1;
    }
    std::cerr << "[server] Listening on " << config.listen
              << " (port " << server.port() << ")\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    // Sinks get 1001 before the server tears down their connections.
    lifecycle.shutdown();
    server.stop();

    fanrelay::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
