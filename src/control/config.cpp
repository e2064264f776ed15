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

// Switchback Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace switchback::control {

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Parse error - log detailed error message
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    apply_defaults(config);

    auto validation = validate(config);
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

void ConfigLoader::apply_defaults(Config& config) {
    if (config.port == 0) {
        config.port = 8080;
    }
    if (config.listen_address.empty()) {
        config.listen_address = "0.0.0.0";
    }
    if (config.retry.max_attempts == 0) {
        config.retry.max_attempts = 3;
    }
    if (config.retry.timeout_seconds == 0) {
        config.retry.timeout_seconds = 30;
    }

    auto& breaker = config.failover.circuit_breaker;
    if (breaker.failure_threshold == 0) {
        breaker.failure_threshold = 3;
    }
    if (breaker.open_timeout_seconds == 0) {
        breaker.open_timeout_seconds = 30;
    }
    if (breaker.half_open_requests == 0) {
        breaker.half_open_requests = 1;
    }
    if (config.failover.rate_limit.cooldown_seconds == 0) {
        config.failover.rate_limit.cooldown_seconds = 60;
    }

    if (config.logging.rotation.max_size_mb == 0) {
        config.logging.rotation.max_size_mb = 100;
    }
    if (config.logging.rotation.max_files == 0) {
        config.logging.rotation.max_files = 10;
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    if (config.backends.empty()) {
        result.add_error("No backends configured");
    }

    core::fast_set<std::string> seen_names;
    bool any_enabled = false;

    for (size_t i = 0; i < config.backends.size(); ++i) {
        const auto& backend = config.backends[i];
        std::string context = backend.name.empty() ? "backend[" + std::to_string(i) + "]"
                                                   : "backend '" + backend.name + "'";

        if (backend.name.empty()) {
            result.add_error(context + ": name cannot be empty");
        } else if (!seen_names.insert(backend.name).second) {
            result.add_error("Duplicate backend name '" + backend.name + "'");
        }

        if (backend.base_url.empty()) {
            result.add_error(context + ": base_url cannot be empty");
        } else if (!http::parse_url(backend.base_url)) {
            result.add_error(context + ": base_url '" + backend.base_url +
                             "' must be an absolute http:// or https:// URL");
        }

        if (!gateway::platform_from_string(backend.platform)) {
            result.add_error(context + ": unknown platform '" + backend.platform +
                             "' (must be 'anthropic' or 'openai')");
        }

        if (backend.token.empty()) {
            result.add_warning(context + ": token is empty");
        }

        any_enabled = any_enabled || backend.enabled;
    }

    if (!config.backends.empty() && !any_enabled) {
        result.add_warning("All backends are disabled; every request will fail with 502");
    }

    // Validate logging level
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    // Validate logging format
    if (config.logging.format != "console" && config.logging.format != "json" &&
        config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format +
                         "' (must be 'console', 'text' or 'json')");
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str, std::ios::trunc};
    if (!file.is_open()) {
        return false;
    }

    file << json << '\n';
    file.flush();
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

std::vector<gateway::Backend> make_backends(const Config& config) {
    std::vector<gateway::Backend> backends;
    backends.reserve(config.backends.size());

    for (const auto& entry : config.backends) {
        gateway::Backend backend;
        backend.name = entry.name;
        backend.base_url = entry.base_url;
        backend.token = entry.token;
        backend.enabled = entry.enabled;
        backend.model = entry.model;
        backend.platform =
            gateway::platform_from_string(entry.platform).value_or(gateway::Platform::ANTHROPIC);
        backends.push_back(std::move(backend));
    }
    return backends;
}

gateway::CircuitBreakerConfig make_breaker_config(const Config& config) {
    const auto& settings = config.failover.circuit_breaker;
    gateway::CircuitBreakerConfig breaker;
    breaker.failure_threshold = settings.failure_threshold;
    breaker.open_timeout = std::chrono::seconds(settings.open_timeout_seconds);
    breaker.half_open_requests = settings.half_open_requests;
    breaker.rate_limit_cooldown = std::chrono::seconds(config.failover.rate_limit.cooldown_seconds);
    return breaker;
}

}  // namespace switchback::control
