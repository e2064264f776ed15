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

// Switchback Circuit Breaker - Implementation

#include "circuit_breaker.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <cmath>

#include "../core/logging.hpp"

namespace switchback::gateway {

using Clock = BackendState::Clock;
using WallClock = BackendState::WallClock;

BackendState::BackendState(Backend backend)
    : backend_(std::move(backend)), enabled_(backend_.enabled) {}

CircuitBreaker::CircuitBreaker(std::vector<Backend> backends, CircuitBreakerConfig config)
    : config_(config) {
    // Zero would make every backend trip or skip immediately
    if (config_.failure_threshold == 0) {
        config_.failure_threshold = 1;
    }
    if (config_.half_open_requests == 0) {
        config_.half_open_requests = 1;
    }

    states_.reserve(backends.size());
    for (auto& backend : backends) {
        // First definition wins for name lookups
        index_.emplace(backend.name, states_.size());
        states_.push_back(std::make_unique<BackendState>(std::move(backend)));
    }
}

BackendState* CircuitBreaker::find(std::string_view name) const {
    auto it = index_.find(std::string{name});
    if (it == index_.end()) {
        return nullptr;
    }
    return states_[it->second].get();
}

CircuitState CircuitBreaker::state_locked(const BackendState& state, Clock::time_point now) const {
    if (!state.circuit_open_) {
        return CircuitState::CLOSED;
    }
    return now - state.window_start_ >= config_.open_timeout ? CircuitState::HALF_OPEN
                                                             : CircuitState::OPEN;
}

bool CircuitBreaker::rate_limited_locked(const BackendState& state, Clock::time_point now) const {
    return state.last_rate_limited_.has_value() &&
           now - *state.last_rate_limited_ < config_.rate_limit_cooldown;
}

std::vector<BackendState*> CircuitBreaker::sort_by_priority() const {
    std::shared_lock lock(mutex_);
    auto now = Clock::now();

    std::vector<BackendState*> normal;
    std::vector<BackendState*> rate_limited;
    normal.reserve(states_.size());

    for (const auto& state : states_) {
        if (!state->enabled_) {
            continue;
        }
        if (rate_limited_locked(*state, now)) {
            rate_limited.push_back(state.get());
        } else {
            normal.push_back(state.get());
        }
    }

    normal.insert(normal.end(), rate_limited.begin(), rate_limited.end());
    return normal;
}

SkipDecision CircuitBreaker::skip_locked(const BackendState& state, Clock::time_point now) const {
    SkipDecision decision;

    if (!state.enabled_) {
        decision.skip = true;
        decision.reason = "backend disabled";
        return decision;
    }

    switch (state_locked(state, now)) {
        case CircuitState::CLOSED:
            break;
        case CircuitState::OPEN: {
            auto elapsed = now - state.window_start_;
            auto left = std::chrono::duration<double>(config_.open_timeout - elapsed).count();
            decision.skip = true;
            decision.remaining = std::chrono::seconds(static_cast<int64_t>(std::ceil(left)));
            decision.reason =
                fmt::format("circuit open ({:.0f}s remaining)", std::max(left, 0.0));
            break;
        }
        case CircuitState::HALF_OPEN:
            if (state.half_open_tries_ >= config_.half_open_requests) {
                decision.skip = true;
                decision.reason = fmt::format("half-open trials in use ({}/{})",
                                              state.half_open_tries_, config_.half_open_requests);
            }
            break;
    }

    // Rate limiting never hard-skips; sort_by_priority() demotes instead
    return decision;
}

SkipDecision CircuitBreaker::should_skip(const BackendState& state) const {
    std::shared_lock lock(mutex_);
    return skip_locked(state, Clock::now());
}

Admission CircuitBreaker::try_admit(BackendState& state) {
    std::unique_lock lock(mutex_);
    auto now = Clock::now();

    Admission admission;
    admission.decision = skip_locked(state, now);
    if (!admission.decision.skip && state_locked(state, now) == CircuitState::HALF_OPEN) {
        admission.trial = ++state.half_open_tries_;
    }
    return admission;
}

void CircuitBreaker::end_half_open_trial(BackendState& state, int status) {
    std::unique_lock lock(mutex_);
    if (!state.circuit_open_) {
        return;  // Closed meanwhile by another request's success
    }

    state.window_start_ = Clock::now();
    state.half_open_tries_ = 0;
    LOG_WARNING(logging::get_logger(),
                "circuit trial inconclusive: {} answered HTTP {}, stays open for {} ms",
                state.name(), status, config_.open_timeout.count());
}

void CircuitBreaker::record_success(BackendState& state) {
    std::unique_lock lock(mutex_);

    if (state.circuit_open_) {
        LOG_INFO(logging::get_logger(), "circuit recovered: {} is healthy again", state.name());
    }

    state.consecutive_failures_ = 0;
    state.circuit_open_ = false;
    state.half_open_tries_ = 0;
    state.window_start_ = {};
}

void CircuitBreaker::record_failure(BackendState& state, int status) {
    std::unique_lock lock(mutex_);
    auto* logger = logging::get_logger();
    auto now = Clock::now();

    ++state.consecutive_failures_;
    state.last_failure_at_ = WallClock::now();
    state.last_error_ = fmt::format("HTTP {}", status);

    if (state.circuit_open_) {
        if (state.half_open_tries_ == 0) {
            // In flight before the circuit opened, or after an inconclusive trial
            LOG_WARNING(logger, "failure while open: {} (HTTP {})", state.name(), status);
        } else if (state.half_open_tries_ >= config_.half_open_requests) {
            // Trial budget spent: start a fresh open window from this failure
            state.window_start_ = now;
            state.half_open_tries_ = 0;
            LOG_WARNING(logger, "circuit trial failed: {} stays open for {} ms (HTTP {})",
                        state.name(), config_.open_timeout.count(), status);
        } else {
            LOG_WARNING(logger, "circuit trial {}/{} failed: {} (HTTP {})", state.half_open_tries_,
                        config_.half_open_requests, state.name(), status);
        }
        return;
    }

    state.window_start_ = now;
    if (state.consecutive_failures_ >= config_.failure_threshold) {
        state.circuit_open_ = true;
        state.half_open_tries_ = 0;
        LOG_WARNING(logger, "circuit tripped: {} after {} consecutive failures, open for {} ms (HTTP {})",
                    state.name(), state.consecutive_failures_, config_.open_timeout.count(),
                    status);
    }
}

void CircuitBreaker::record_rate_limit(BackendState& state, std::string_view retry_after) {
    std::unique_lock lock(mutex_);
    auto* logger = logging::get_logger();

    state.last_rate_limited_ = Clock::now();

    int64_t seconds = 0;
    auto [ptr, ec] =
        std::from_chars(retry_after.data(), retry_after.data() + retry_after.size(), seconds);
    if (!retry_after.empty() && ec == std::errc{} && ptr == retry_after.data() + retry_after.size()) {
        state.retry_after_until_ = WallClock::now() + std::chrono::seconds(seconds);
        LOG_WARNING(logger, "rate limited: {} answered 429, Retry-After {}s", state.name(), seconds);
    } else {
        LOG_WARNING(logger, "rate limited: {} answered 429, demoted for {} ms", state.name(),
                    config_.rate_limit_cooldown.count());
    }
}

std::optional<CircuitStatus> CircuitBreaker::circuit_status(std::string_view name) const {
    const BackendState* state = find(name);
    if (!state) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    CircuitStatus status;
    status.state = state_locked(*state, Clock::now());
    status.enabled = state->enabled_;
    status.consecutive_failures = state->consecutive_failures_;
    status.half_open_tries = state->half_open_tries_;
    status.last_failure_time = state->last_failure_at_;
    status.last_error = state->last_error_;
    return status;
}

std::optional<RateLimitStatus> CircuitBreaker::rate_limit_status(std::string_view name) const {
    const BackendState* state = find(name);
    if (!state) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    RateLimitStatus status;
    auto now = Clock::now();
    if (rate_limited_locked(*state, now)) {
        auto left = config_.rate_limit_cooldown - (now - *state->last_rate_limited_);
        auto left_wall = std::chrono::duration_cast<WallClock::duration>(left);
        status.cooldown_until = WallClock::now() + left_wall;
        status.retry_after_seconds = std::chrono::duration_cast<std::chrono::seconds>(left).count();
    }
    status.retry_after_until = state->retry_after_until_;
    return status;
}

bool CircuitBreaker::on_backend_enabled(std::string_view name) {
    BackendState* state = find(name);
    if (!state) {
        return false;
    }

    std::unique_lock lock(mutex_);
    state->enabled_ = true;
    state->consecutive_failures_ = 0;
    state->circuit_open_ = false;
    state->half_open_tries_ = 0;
    LOG_INFO(logging::get_logger(), "backend enabled: {} (circuit state reset)", state->name());
    return true;
}

bool CircuitBreaker::on_backend_disabled(std::string_view name) {
    BackendState* state = find(name);
    if (!state) {
        return false;
    }

    std::unique_lock lock(mutex_);
    state->enabled_ = false;
    LOG_INFO(logging::get_logger(), "backend disabled: {}", state->name());
    return true;
}

}  // namespace switchback::gateway
