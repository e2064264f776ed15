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

// Switchback Configuration - Header
// JSON configuration schema with defaults and validation

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../gateway/circuit_breaker.hpp"
#include "../gateway/upstream.hpp"

namespace switchback::control {

/// Upstream backend entry (order in the file is failover priority)
struct BackendConfig {
    std::string name;
    std::string base_url;
    std::string token;
    bool enabled = true;
    std::string model;     // Optional model override
    std::string platform;  // "anthropic" (default) or "openai"
};

/// Non-streaming request settings
struct RetryConfig {
    uint32_t max_attempts = 3;     // Kept for compatibility; every candidate is tried
    uint32_t timeout_seconds = 30;  // Deadline for non-streaming requests
};

struct CircuitBreakerSettings {
    uint32_t failure_threshold = 3;
    uint32_t open_timeout_seconds = 30;
    uint32_t half_open_requests = 1;
};

struct RateLimitSettings {
    uint32_t cooldown_seconds = 60;
};

struct FailoverConfig {
    CircuitBreakerSettings circuit_breaker;
    RateLimitSettings rate_limit;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";       // debug, info, warning, error
    std::string format = "console";   // console, text, json
    std::string output = "logs";      // Log directory for text/json (switchback.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Switchback configuration
struct Config {
    uint16_t port = 8080;
    std::string listen_address = "0.0.0.0";
    std::vector<BackendConfig> backends;
    RetryConfig retry;
    FailoverConfig failover;
    LogConfig logging;
};

// All config types use custom from_json/to_json (no macros - avoids conflicts)

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    b.name = j.value("name", std::string{});
    b.base_url = j.value("base_url", std::string{});
    b.token = j.value("token", std::string{});
    b.enabled = j.value("enabled", true);
    b.model = j.value("model", std::string{});
    b.platform = j.value("platform", std::string{});
}

inline void from_json(const nlohmann::json& j, RetryConfig& r) {
    r.max_attempts = j.value("max_attempts", 3u);
    r.timeout_seconds = j.value("timeout_seconds", 30u);
}

inline void from_json(const nlohmann::json& j, CircuitBreakerSettings& c) {
    c.failure_threshold = j.value("failure_threshold", 3u);
    c.open_timeout_seconds = j.value("open_timeout_seconds", 30u);
    c.half_open_requests = j.value("half_open_requests", 1u);
}

inline void from_json(const nlohmann::json& j, RateLimitSettings& r) {
    r.cooldown_seconds = j.value("cooldown_seconds", 60u);
}

inline void from_json(const nlohmann::json& j, FailoverConfig& f) {
    if (j.contains("circuit_breaker")) {
        j.at("circuit_breaker").get_to(f.circuit_breaker);
    }
    if (j.contains("rate_limit")) {
        j.at("rate_limit").get_to(f.rate_limit);
    }
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("console"));
    l.output = j.value("output", std::string("logs"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() for nested structs so defaults stay in one place
    c.port = j.value("port", uint16_t(8080));
    c.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    if (j.contains("backends")) {
        j.at("backends").get_to(c.backends);
    }
    if (j.contains("retry")) {
        j.at("retry").get_to(c.retry);
    }
    if (j.contains("failover")) {
        j.at("failover").get_to(c.failover);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

// ============================================================================
// to_json functions for all config types
// ============================================================================

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = nlohmann::json{{"name", b.name},       {"base_url", b.base_url}, {"token", b.token},
                       {"enabled", b.enabled}, {"model", b.model},       {"platform", b.platform}};
}

inline void to_json(nlohmann::json& j, const RetryConfig& r) {
    j = nlohmann::json{{"max_attempts", r.max_attempts}, {"timeout_seconds", r.timeout_seconds}};
}

inline void to_json(nlohmann::json& j, const CircuitBreakerSettings& c) {
    j = nlohmann::json{{"failure_threshold", c.failure_threshold},
                       {"open_timeout_seconds", c.open_timeout_seconds},
                       {"half_open_requests", c.half_open_requests}};
}

inline void to_json(nlohmann::json& j, const RateLimitSettings& r) {
    j = nlohmann::json{{"cooldown_seconds", r.cooldown_seconds}};
}

inline void to_json(nlohmann::json& j, const FailoverConfig& f) {
    j = nlohmann::json{{"circuit_breaker", f.circuit_breaker}, {"rate_limit", f.rate_limit}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["port"] = c.port;
    j["listen_address"] = c.listen_address;
    j["backends"] = c.backends;
    j["retry"] = c.retry;
    j["failover"] = c.failover;
    j["logging"] = c.logging;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (defaults applied, validated)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (defaults applied, validated)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Replace zero numeric settings with their defaults
    static void apply_defaults(Config& config);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Runtime backend list in configured order (platform tags already validated)
[[nodiscard]] std::vector<gateway::Backend> make_backends(const Config& config);

/// Breaker settings in the units the gateway uses
[[nodiscard]] gateway::CircuitBreakerConfig make_breaker_config(const Config& config);

}  // namespace switchback::control
