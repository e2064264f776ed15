/*
 * Copyright 2026 Switchback Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Switchback - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "control/config_manager.hpp"
#include "control/management_api.hpp"
#include "core/logging.hpp"
#include "core/server.hpp"
#include "gateway/circuit_breaker.hpp"
#include "gateway/forwarder.hpp"
#include "gateway/http_client.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s [--config <config.json>] [--port <port>] [--log-level <level>]\n"
            "  --config     configuration file (default: config.json)\n"
            "  --port       override the listening port\n"
            "  --log-level  override the log level (debug, info, warning, error)\n",
            program);
}

void print_validation(const switchback::control::ValidationResult& validation) {
    for (const auto& error : validation.errors) {
        fprintf(stderr, "  - error: %s\n", error.c_str());
    }
    for (const auto& warning : validation.warnings) {
        printf("  - warning: %s\n", warning.c_str());
    }
}

// Re-read the config file; only the log level is applied without a restart
void reload_config(switchback::control::ConfigManager& config_manager) {
    auto* logger = switchback::logging::get_logger();
    if (!config_manager.reload()) {
        LOG_ERROR(logger, "SIGHUP: failed to reload {}, keeping current configuration",
                  config_manager.config_path());
        for (const auto& error : config_manager.last_validation().errors) {
            LOG_ERROR(logger, "  - {}", error);
        }
        return;
    }

    auto config = config_manager.get();
    if (!switchback::logging::set_log_level(config->logging.level)) {
        LOG_WARNING(logger, "SIGHUP: unknown log level '{}'", config->logging.level);
    }
    LOG_INFO(logger, "SIGHUP: configuration reloaded (log level {}); backend changes need a restart",
             config->logging.level);
}

}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true);
    } else if (signal == SIGHUP) {
        g_reload_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    printf("Switchback failover proxy v0.1.0\n\n");

    std::string config_path = "config.json";
    int port_override = -1;
    std::string log_level_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (i + 1 >= argc) {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--port") {
            char* end = nullptr;
            long port = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || port <= 0 || port > 65535) {
                fprintf(stderr, "Invalid port: %s\n", argv[i]);
                return EXIT_FAILURE;
            }
            port_override = static_cast<int>(port);
        } else if (arg == "--log-level") {
            log_level_override = argv[++i];
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    printf("Loading configuration from %s...\n", config_path.c_str());
    switchback::control::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        fprintf(stderr, "Failed to load configuration\n");
        print_validation(config_manager.last_validation());
        return EXIT_FAILURE;
    }
    print_validation(config_manager.last_validation());

    // Runtime copy: CLI overrides are never written back to the file
    switchback::control::Config config = *config_manager.get();
    if (port_override > 0) {
        config.port = static_cast<uint16_t>(port_override);
    }
    if (!log_level_override.empty()) {
        config.logging.level = log_level_override;
    }

    switchback::logging::init_logging_system();
    auto* logger = switchback::logging::init_logger(config.logging);
    if (!log_level_override.empty() && !switchback::logging::set_log_level(log_level_override)) {
        LOG_WARNING(logger, "unknown --log-level '{}', using info", log_level_override);
    }

    switchback::gateway::CircuitBreaker breaker(switchback::control::make_backends(config),
                                                switchback::control::make_breaker_config(config));
    switchback::gateway::HttpClientTransport transport;

    switchback::gateway::ForwarderConfig forwarder_config;
    forwarder_config.request_timeout = std::chrono::seconds(config.retry.timeout_seconds);
    switchback::gateway::Forwarder forwarder(breaker, transport, forwarder_config);

    switchback::control::ManagementApi management(config_manager, breaker);
    switchback::core::Server server(config, management, forwarder);

    LOG_INFO(logger, "{} backends configured, request timeout {}s, failure threshold {}, open timeout {}s",
             config.backends.size(), config.retry.timeout_seconds,
             config.failover.circuit_breaker.failure_threshold,
             config.failover.circuit_breaker.open_timeout_seconds);

    if (auto ec = server.start()) {
        fprintf(stderr, "Server error: %s\n", ec.message().c_str());
        switchback::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    // Install signal handlers for graceful shutdown and config reload
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGHUP, signal_handler);   // Config reload

    // Signal flags are acted on here, outside the handler
    std::thread watcher([&] {
        while (!g_shutdown_requested.load()) {
            if (g_reload_requested.exchange(false)) {
                reload_config(config_manager);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOG_INFO(logger, "shutdown signal received, stopping listener");
        server.stop();
    });

    server.run();

    g_shutdown_requested.store(true);
    watcher.join();

    LOG_INFO(logger, "Switchback stopped");
    switchback::logging::shutdown_logging();
    printf("Switchback stopped.\n");
    return EXIT_SUCCESS;
}
