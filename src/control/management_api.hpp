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

// Switchback Management API - Header
// Backend listing, status and runtime enable/disable

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "../gateway/circuit_breaker.hpp"
#include "config_manager.hpp"

namespace switchback::control {

/// JSON response produced by a management route
struct ApiResponse {
    int status = 200;
    nlohmann::json body;

    /// Serialized body. Names taken from the request path may hold invalid
    /// UTF-8; those bytes become U+FFFD instead of failing the response.
    [[nodiscard]] std::string serialize() const {
        return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

/// Management routes served ahead of the proxy on the same listener:
///
///   GET       /backends                  configured backends, tokens masked
///   GET       /backends/status           breaker and rate-limit state
///   GET|POST  /backend/{name}/enable     persist, then reset breaker state
///   GET|POST  /backend/{name}/disable    persist, then mark disabled
///   GET       /health                    liveness and backend counts
///
/// Any other path is not a management route and belongs to the proxy.
class ManagementApi {
public:
    ManagementApi(ConfigManager& config_manager, gateway::CircuitBreaker& breaker);

    // Non-copyable
    ManagementApi(const ManagementApi&) = delete;
    ManagementApi& operator=(const ManagementApi&) = delete;

    /// Route a request; nullopt when the path is not a management route
    [[nodiscard]] std::optional<ApiResponse> handle(std::string_view method,
                                                    std::string_view path);

    /// True when `path` is served by handle()
    [[nodiscard]] static bool is_management_path(std::string_view path) noexcept;

private:
    [[nodiscard]] ApiResponse list_backends() const;
    [[nodiscard]] ApiResponse backend_status() const;
    [[nodiscard]] ApiResponse health() const;
    [[nodiscard]] ApiResponse toggle_backend(std::string_view name, bool enable);

    ConfigManager& config_manager_;
    gateway::CircuitBreaker& breaker_;
};

/// RFC 3339 UTC timestamp with second precision ("2026-01-02T03:04:05Z")
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point time);

}  // namespace switchback::control
