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

// Switchback Request Forwarder - Header
// Failover loop: walks backends in priority order until one answers

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "../http/http.hpp"
#include "circuit_breaker.hpp"
#include "stream_relay.hpp"
#include "upstream.hpp"

namespace switchback::gateway {

struct ForwarderConfig {
    /// Deadline for non-streaming attempts; streaming attempts have none
    std::chrono::milliseconds request_timeout{30000};
};

/// Response handed back to the HTTP server.
/// When `stream` is set the status and headers are final and the body is
/// produced by running the relay against the client connection.
struct ProxyResponse {
    int status = 200;
    http::Headers headers;
    std::string body;
    std::shared_ptr<StreamRelay> stream;

    [[nodiscard]] bool streaming() const noexcept { return stream != nullptr; }
};

/// Result of one backend attempt
enum class AttemptOutcome : uint8_t {
    RETRY,   // Try the next backend
    RESPOND  // The response is final for this client request
};

/// Request forwarder.
///
/// For each client request the buffered body is replayed against backends
/// from CircuitBreaker::sort_by_priority(), one at a time:
///   - transport errors and 5xx are recorded as failures and retried
///   - 429 is recorded as a rate limit and retried
///   - any other status is returned to the client
/// When every backend is skipped or fails the client receives 502.
///
/// Thread-safety: handle() may run concurrently; shared state lives in the
/// CircuitBreaker.
class Forwarder {
public:
    Forwarder(CircuitBreaker& breaker, UpstreamTransport& transport, ForwarderConfig config);

    // Non-copyable
    Forwarder(const Forwarder&) = delete;
    Forwarder& operator=(const Forwarder&) = delete;

    /// Forward one client request. An empty request_id gets a fresh correlation ID.
    [[nodiscard]] ProxyResponse handle(const http::Request& request,
                                       std::string_view request_id = {});

    [[nodiscard]] const ForwarderConfig& config() const noexcept { return config_; }

private:
    struct AttemptContext {
        const http::Request& request;
        const std::string& request_id;
        uint32_t number;
        uint32_t trial;  // Half-open trial number, 0 for a regular attempt
    };

    [[nodiscard]] AttemptOutcome attempt(BackendState& state, const AttemptContext& ctx,
                                         ProxyResponse& out, std::string& last_error);

    [[nodiscard]] AttemptOutcome respond_success(BackendState& state, const AttemptContext& ctx,
                                                 UpstreamResponse& upstream,
                                                 const std::string& model, bool convert,
                                                 ProxyResponse& out);

    CircuitBreaker& breaker_;
    UpstreamTransport& transport_;
    ForwarderConfig config_;
};

/// Headers safe to copy from one hop to the next
[[nodiscard]] http::Headers forwardable_headers(const http::Headers& headers);

}  // namespace switchback::gateway
