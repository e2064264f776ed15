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

// Switchback Upstream - Header
// Backend definitions and the outbound transport seam

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "../http/http.hpp"

namespace switchback::gateway {

/// Wire dialect spoken by a backend
enum class Platform : uint8_t {
    ANTHROPIC,  // Native messages API, relayed as-is
    OPENAI      // Chat-completions API, converted both ways
};

[[nodiscard]] constexpr std::string_view to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::ANTHROPIC:
            return "anthropic";
        case Platform::OPENAI:
            return "openai";
    }
    return "unknown";
}

/// Parse a platform tag; an empty tag means the native dialect
[[nodiscard]] std::optional<Platform> platform_from_string(std::string_view tag) noexcept;

/// Configured upstream endpoint
struct Backend {
    std::string name;
    std::string base_url;  // May carry a path prefix
    std::string token;     // Sent as "Authorization: Bearer <token>"
    bool enabled = true;
    std::string model;  // Overrides the request's model when non-empty
    Platform platform = Platform::ANTHROPIC;

    [[nodiscard]] bool needs_conversion() const noexcept { return platform == Platform::OPENAI; }
};

/// Transport-level failures (always retried on the next backend)
enum class UpstreamErrc {
    invalid_url = 1,
    connection_failed,
    timeout,
    read_error,
    cancelled,
    request_conversion_failed,
};

class UpstreamErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "switchback.upstream"; }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const UpstreamErrorCategory& upstream_category() noexcept;

[[nodiscard]] std::error_code make_error_code(UpstreamErrc errc) noexcept;

/// Outbound request, fully built by the forwarder
struct UpstreamRequest {
    std::string method;
    std::string origin;  // scheme://host:port
    std::string target;  // Path plus "?query"
    http::Headers headers;
    std::string body;

    /// Deadline for the whole exchange; nullopt for streaming requests
    std::optional<std::chrono::milliseconds> timeout;

    [[nodiscard]] std::string url() const { return origin + target; }
};

/// Body of an in-flight upstream response, consumed incrementally
class UpstreamBody {
public:
    virtual ~UpstreamBody() = default;

    /// Block for the next chunk. Returns false at the end of the body;
    /// `ec` is set when the body ended abnormally.
    [[nodiscard]] virtual bool read(std::string& chunk, std::error_code& ec) = 0;

    /// Abandon the body and stop the upstream read
    virtual void cancel() noexcept = 0;
};

/// Body already held in memory
class BufferedBody final : public UpstreamBody {
public:
    explicit BufferedBody(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] bool read(std::string& chunk, std::error_code& ec) override;
    void cancel() noexcept override { done_ = true; }

private:
    std::string data_;
    bool done_ = false;
};

/// Drain a body. Whatever arrived before an error is kept in `out`.
[[nodiscard]] std::error_code read_all(UpstreamBody& body, std::string& out);

/// Status and headers of an upstream response; the body streams behind them
struct UpstreamResponse {
    int status = 0;
    http::Headers headers;
    std::unique_ptr<UpstreamBody> body;
};

/// Outbound HTTP seam: HttpClientTransport in production, scripted fakes in tests
class UpstreamTransport {
public:
    virtual ~UpstreamTransport() = default;

    /// Send a request and return once status and headers have arrived
    [[nodiscard]] virtual std::error_code send(const UpstreamRequest& request,
                                               UpstreamResponse& response) = 0;
};

}  // namespace switchback::gateway

template <>
struct std::is_error_code_enum<switchback::gateway::UpstreamErrc> : std::true_type {};
