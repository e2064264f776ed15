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

// Switchback Management API - Implementation

#include "management_api.hpp"

#include <fmt/format.h>

#include <ctime>
#include <vector>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace switchback::control {

using json = nlohmann::json;

namespace {

constexpr std::string_view BACKEND_PREFIX = "/backend/";

// Split "/backend/{name}/{action}"; false for anything else
bool parse_backend_action(std::string_view path, std::string_view& name,
                          std::string_view& action) noexcept {
    if (!path.starts_with(BACKEND_PREFIX)) {
        return false;
    }
    std::string_view rest = path.substr(BACKEND_PREFIX.size());
    size_t slash = rest.rfind('/');
    if (slash == std::string_view::npos) {
        return false;
    }
    name = rest.substr(0, slash);
    action = rest.substr(slash + 1);
    return action == "enable" || action == "disable";
}

json optional_time(const std::optional<std::chrono::system_clock::time_point>& time) {
    if (!time) {
        return nullptr;
    }
    return format_rfc3339(*time);
}

json error_body(std::string_view error, std::string_view message) {
    return {{"error", error}, {"message", message}};
}

}  // namespace

std::string format_rfc3339(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buffer[32];
    size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, len);
}

ManagementApi::ManagementApi(ConfigManager& config_manager, gateway::CircuitBreaker& breaker)
    : config_manager_(config_manager), breaker_(breaker) {}

bool ManagementApi::is_management_path(std::string_view path) noexcept {
    std::string_view name;
    std::string_view action;
    return path == "/backends" || path == "/backends/status" || path == "/health" ||
           parse_backend_action(path, name, action);
}

std::optional<ApiResponse> ManagementApi::handle(std::string_view method, std::string_view path) {
    if (!is_management_path(path)) {
        return std::nullopt;
    }

    std::string_view name;
    std::string_view action;
    if (parse_backend_action(path, name, action)) {
        if (method != "GET" && method != "POST") {
            return ApiResponse{405, error_body("Method not allowed", "use GET or POST")};
        }
        return toggle_backend(name, action == "enable");
    }

    if (method != "GET") {
        return ApiResponse{405, error_body("Method not allowed", "use GET")};
    }
    if (path == "/backends") {
        return list_backends();
    }
    if (path == "/backends/status") {
        return backend_status();
    }
    return health();
}

ApiResponse ManagementApi::list_backends() const {
    auto config = config_manager_.get();
    json backends = json::array();

    for (const auto& backend : config->backends) {
        json entry = {{"name", backend.name},
                      {"base_url", backend.base_url},
                      {"enabled", backend.enabled},
                      {"platform", backend.platform.empty() ? "anthropic" : backend.platform},
                      {"token_masked", core::mask_token(backend.token)}};
        if (!backend.model.empty()) {
            entry["model"] = backend.model;
        }
        backends.push_back(std::move(entry));
    }

    size_t count = backends.size();
    return {200, {{"backends", std::move(backends)}, {"count", count}}};
}

ApiResponse ManagementApi::backend_status() const {
    auto config = config_manager_.get();
    json backends = json::array();

    for (const auto& backend : config->backends) {
        json entry = {{"name", backend.name}, {"enabled", backend.enabled}};

        auto circuit = breaker_.circuit_status(backend.name);
        auto rate = breaker_.rate_limit_status(backend.name);

        json breaker_json = {{"state", "closed"},
                             {"consecutive_failures", 0},
                             {"last_failure_time", nullptr}};
        if (circuit) {
            breaker_json = {{"state", gateway::to_string(circuit->state)},
                            {"consecutive_failures", circuit->consecutive_failures},
                            {"half_open_tries", circuit->half_open_tries},
                            {"last_failure_time", optional_time(circuit->last_failure_time)}};
            if (!circuit->last_error.empty()) {
                entry["last_error"] = circuit->last_error;
            }
        }
        entry["circuit_breaker"] = std::move(breaker_json);

        json rate_json = {{"cooldown_until", nullptr}, {"retry_after_seconds", 0}};
        if (rate) {
            rate_json = {{"cooldown_until", optional_time(rate->cooldown_until)},
                         {"retry_after_seconds", rate->retry_after_seconds},
                         {"retry_after_until", optional_time(rate->retry_after_until)}};
        }
        entry["rate_limit"] = std::move(rate_json);

        backends.push_back(std::move(entry));
    }

    size_t count = backends.size();
    return {200, {{"backends", std::move(backends)}, {"count", count}}};
}

ApiResponse ManagementApi::health() const {
    auto config = config_manager_.get();
    size_t enabled = 0;
    for (const auto& backend : config->backends) {
        if (backend.enabled) {
            ++enabled;
        }
    }

    return {200,
            {{"status", "healthy"},
             {"total_backends", config->backends.size()},
             {"enabled_backends", enabled},
             {"timestamp", format_rfc3339(std::chrono::system_clock::now())}}};
}

ApiResponse ManagementApi::toggle_backend(std::string_view name, bool enable) {
    const char* failure = enable ? "Failed to enable backend" : "Failed to disable backend";
    if (name.empty()) {
        return {400, error_body("Missing backend name", "Backend name is required")};
    }

    auto ec = enable ? config_manager_.enable_backend(name) : config_manager_.disable_backend(name);
    if (ec) {
        std::string message = fmt::format("backend '{}': {}", name, ec.message());
        auto config = config_manager_.get();
        if (ec == ConfigErrc::backend_not_found && config) {
            std::vector<std::string> names;
            for (const auto& backend : config->backends) {
                names.push_back(backend.name);
            }
            auto similar = core::find_similar_strings(name, names);
            if (!similar.empty()) {
                message += fmt::format(". Did you mean '{}'?", similar.front());
            }
        }
        LOG_WARNING(logging::get_logger(), "management: {}", message);
        return {400, error_body(failure, message)};
    }

    // Persisted; bring the runtime state in line
    bool applied = enable ? breaker_.on_backend_enabled(name) : breaker_.on_backend_disabled(name);
    if (!applied) {
        LOG_WARNING(logging::get_logger(),
                    "management: backend {} is not loaded in the running proxy; the change takes "
                    "effect after a restart",
                    name);
    }

    return {200,
            {{"success", true},
             {"message", fmt::format("Backend '{}' has been {}", name,
                                     enable ? "enabled" : "disabled")}}};
}

}  // namespace switchback::control
