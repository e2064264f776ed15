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

// Switchback Circuit Breaker - Header
// Per-backend failure tracking, open/half-open windows and 429 cooldowns

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "upstream.hpp"

namespace switchback::gateway {

/// Circuit breaker state as reported to operators
enum class CircuitState : uint8_t {
    CLOSED,    // Normal operation
    OPEN,      // Skipped until the open timeout elapses
    HALF_OPEN  // Open timeout elapsed, trial requests allowed
};

/// Circuit breaker and rate-limit settings shared by all backends
struct CircuitBreakerConfig {
    /// Consecutive failures that open the circuit
    uint32_t failure_threshold = 3;

    /// Time an open circuit blocks traffic before trials are allowed
    std::chrono::milliseconds open_timeout{30000};

    /// Trial requests allowed per open window once the timeout has elapsed
    uint32_t half_open_requests = 1;

    /// Time a backend stays demoted after answering 429
    std::chrono::milliseconds rate_limit_cooldown{60000};
};

/// Runtime state of one configured backend.
/// Created once at startup; mutable fields are only touched by CircuitBreaker
/// under its lock. backend() exposes the immutable configuration.
class BackendState {
public:
    using Clock = std::chrono::steady_clock;
    using WallClock = std::chrono::system_clock;

    explicit BackendState(Backend backend);

    [[nodiscard]] const Backend& backend() const noexcept { return backend_; }
    [[nodiscard]] const std::string& name() const noexcept { return backend_.name; }

private:
    friend class CircuitBreaker;

    const Backend backend_;
    bool enabled_;

    uint32_t consecutive_failures_ = 0;
    bool circuit_open_ = false;
    uint32_t half_open_tries_ = 0;
    Clock::time_point window_start_{};  // Start of the current open window
    std::optional<WallClock::time_point> last_failure_at_;
    std::string last_error_;

    std::optional<Clock::time_point> last_rate_limited_;
    std::optional<WallClock::time_point> retry_after_until_;
};

/// Hard-skip decision for one backend
struct SkipDecision {
    bool skip = false;
    std::string reason;
    std::chrono::seconds remaining{0};  // Seconds left in the open window
};

/// Admission of one attempt. A non-zero trial means the attempt is a
/// half-open probe and must end in record_success, record_failure or
/// end_half_open_trial.
struct Admission {
    SkipDecision decision;
    uint32_t trial = 0;
};

/// Circuit snapshot for status reporting
struct CircuitStatus {
    CircuitState state = CircuitState::CLOSED;
    bool enabled = true;
    uint32_t consecutive_failures = 0;
    uint32_t half_open_tries = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    std::string last_error;
};

/// Rate-limit snapshot for status reporting
struct RateLimitStatus {
    std::optional<std::chrono::system_clock::time_point> cooldown_until;
    int64_t retry_after_seconds = 0;  // Seconds left in the cooldown
    std::optional<std::chrono::system_clock::time_point> retry_after_until;  // From Retry-After
};

/// Circuit breaker registry for all backends.
///
/// State machine per backend:
///   CLOSED -> OPEN       failure_threshold consecutive failures
///   OPEN -> HALF_OPEN    open_timeout elapsed since the window started
///   HALF_OPEN -> CLOSED  any success
///   HALF_OPEN -> OPEN    trial budget spent and the last trial failed
///                        (window restarts from that failure), or a trial
///                        answered neither success nor failure
///
/// 429 responses never count as failures; they demote the backend in
/// sort_by_priority() for rate_limit_cooldown.
///
/// Thread-safety: one shared_mutex guards every BackendState. No lock is
/// held across upstream I/O.
class CircuitBreaker {
public:
    CircuitBreaker(std::vector<Backend> backends, CircuitBreakerConfig config);
    ~CircuitBreaker() = default;

    // Non-copyable, non-movable (consumers hold references and state pointers)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Enabled backends, non-rate-limited first, configured order within each group
    [[nodiscard]] std::vector<BackendState*> sort_by_priority() const;

    /// Hard skip for disabled backends and open circuits without trial budget
    [[nodiscard]] SkipDecision should_skip(const BackendState& state) const;

    /// Skip decision and, for a half-open circuit, the claim on a trial,
    /// taken under one lock so concurrent requests never exceed the budget
    [[nodiscard]] Admission try_admit(BackendState& state);

    /// Trial answered with a status that is neither success nor failure
    /// (429, 4xx): the circuit stays open for a fresh window
    void end_half_open_trial(BackendState& state, int status);

    /// Any success closes the circuit and clears the failure count
    void record_success(BackendState& state);

    /// Transport failure (status 0) or 5xx response
    void record_failure(BackendState& state, int status);

    /// 429 response; Retry-After (integer seconds) is kept for diagnostics
    void record_rate_limit(BackendState& state, std::string_view retry_after);

    [[nodiscard]] std::optional<CircuitStatus> circuit_status(std::string_view name) const;

    [[nodiscard]] std::optional<RateLimitStatus> rate_limit_status(std::string_view name) const;

    /// Management hook: enable and reset breaker state. False if unknown.
    bool on_backend_enabled(std::string_view name);

    /// Management hook: disable only. False if unknown.
    bool on_backend_disabled(std::string_view name);

    [[nodiscard]] size_t size() const noexcept { return states_.size(); }

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    /// State for a configured backend, nullptr if unknown
    [[nodiscard]] BackendState* find(std::string_view name) const;

private:
    [[nodiscard]] CircuitState state_locked(const BackendState& state,
                                            BackendState::Clock::time_point now) const;
    [[nodiscard]] SkipDecision skip_locked(const BackendState& state,
                                           BackendState::Clock::time_point now) const;
    [[nodiscard]] bool rate_limited_locked(const BackendState& state,
                                           BackendState::Clock::time_point now) const;

    CircuitBreakerConfig config_;
    std::vector<std::unique_ptr<BackendState>> states_;
    core::fast_map<std::string, size_t> index_;
    mutable std::shared_mutex mutex_;
};

/// Lower-case state name used in status output
[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::CLOSED:
            return "closed";
        case CircuitState::OPEN:
            return "open";
        case CircuitState::HALF_OPEN:
            return "half-open";
    }
    return "unknown";
}

}  // namespace switchback::gateway
