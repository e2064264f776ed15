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

// Switchback Request Forwarder - Implementation

#include "forwarder.hpp"

#include <fmt/format.h>

#include "../core/compression.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "protocol_converter.hpp"

namespace switchback::gateway {

namespace {

constexpr std::string_view NATIVE_MESSAGES_PATH = "/v1/messages";
constexpr std::string_view FOREIGN_COMPLETIONS_PATH = "/v1/chat/completions";

std::string status_error(int status) {
    return fmt::format("HTTP {}", status);
}

}  // namespace

http::Headers forwardable_headers(const http::Headers& headers) {
    http::Headers out;
    out.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        if (!http::is_hop_by_hop(name)) {
            out.emplace_back(name, value);
        }
    }
    return out;
}

Forwarder::Forwarder(CircuitBreaker& breaker, UpstreamTransport& transport, ForwarderConfig config)
    : breaker_(breaker), transport_(transport), config_(config) {}

ProxyResponse Forwarder::handle(const http::Request& request, std::string_view request_id) {
    auto* logger = logging::get_logger();
    const std::string rid =
        request_id.empty() ? logging::generate_correlation_id() : std::string{request_id};

    auto candidates = breaker_.sort_by_priority();
    LOG_INFO(logger, "[{}] request start: {} {} ({} backends configured, {} candidates)", rid,
             request.method, request.path, breaker_.size(), candidates.size());

    std::string last_error;
    uint32_t attempted = 0;
    uint32_t skipped = 0;

    for (BackendState* state : candidates) {
        auto admission = breaker_.try_admit(*state);
        if (admission.decision.skip) {
            ++skipped;
            LOG_INFO(logger, "[{}] skip {} - {}", rid, state->name(), admission.decision.reason);
            continue;
        }

        ++attempted;
        ProxyResponse response;
        AttemptContext ctx{request, rid, attempted, admission.trial};
        if (attempt(*state, ctx, response, last_error) == AttemptOutcome::RESPOND) {
            return response;
        }
    }

    LOG_WARNING(logger, "[{}] all backends unavailable (attempted {}, skipped {})", rid, attempted,
                skipped);
    std::string message = "all backends unavailable";
    if (!last_error.empty()) {
        message += ": " + last_error;
    }
    auto error = http::make_text_response(static_cast<int>(http::StatusCode::BadGateway), message);
    return ProxyResponse{error.status, std::move(error.headers), std::move(error.body), nullptr};
}

AttemptOutcome Forwarder::attempt(BackendState& state, const AttemptContext& ctx,
                                  ProxyResponse& out, std::string& last_error) {
    auto* logger = logging::get_logger();
    const Backend& backend = state.backend();
    const http::Request& request = ctx.request;
    const std::string& rid = ctx.request_id;

    // Target: base URL path prefix + client path + query
    auto base = http::parse_url(backend.base_url);
    if (!base) {
        breaker_.record_failure(state, 0);
        last_error = make_error_code(UpstreamErrc::invalid_url).message();
        LOG_WARNING(logger, "[{}] failed #{} {} - invalid base URL '{}'", rid, ctx.number,
                    backend.name, backend.base_url);
        return AttemptOutcome::RETRY;
    }

    std::string path = base->path + request.path;
    if (backend.needs_conversion() && request.path.ends_with(NATIVE_MESSAGES_PATH)) {
        path.resize(path.size() - NATIVE_MESSAGES_PATH.size());
        path += FOREIGN_COMPLETIONS_PATH;
        LOG_INFO(logger, "[{}] path rewrite {} - {} -> {}", rid, backend.name, NATIVE_MESSAGES_PATH,
                 FOREIGN_COMPLETIONS_PATH);
    }

    UpstreamRequest upstream;
    upstream.method = request.method;
    upstream.origin = base->origin();
    upstream.target = request.query.empty() ? path : fmt::format("{}?{}", path, request.query);

    // Model override happens before any conversion
    std::string body = request.body;
    if (!backend.model.empty() && !body.empty()) {
        if (auto overridden = override_model(body, backend.model)) {
            body = std::move(*overridden);
            LOG_INFO(logger, "[{}] model override {} - using {}", rid, backend.name, backend.model);
        }
    }

    // Bodiless requests (GET /v1/models) have nothing to convert, and their
    // responses are relayed as they come
    const bool convert = backend.needs_conversion() && !body.empty();
    if (convert) {
        auto converted = convert_request(body);
        if (!converted) {
            breaker_.record_failure(state, 0);
            last_error = fmt::format("{}: {}",
                                     make_error_code(UpstreamErrc::request_conversion_failed).message(),
                                     converted.error);
            LOG_WARNING(logger, "[{}] failed #{} {} - {}", rid, ctx.number, backend.name, last_error);
            return AttemptOutcome::RETRY;
        }
        body = std::move(converted.body);
        LOG_DEBUG(logger, "[{}] converted request for {} to chat-completions format", rid,
                  backend.name);
    }

    auto probe = probe_request(body);
    upstream.body = std::move(body);

    upstream.headers = forwardable_headers(request.headers);
    http::set_header(upstream.headers, "Authorization", fmt::format("Bearer {}", backend.token));
    if (convert) {
        // Converted responses are rebuilt here, so the client's encoding choice does not apply
        http::set_header(upstream.headers, "Content-Type", "application/json");
        http::set_header(upstream.headers, "Accept-Encoding", "identity");
    }

    if (!probe.stream) {
        upstream.timeout = config_.request_timeout;
        LOG_DEBUG(logger, "[{}] non-streaming request to {}, timeout {} ms", rid, backend.name,
                  config_.request_timeout.count());
    }

    std::string token_preview = core::preview_token(backend.token);
    if (ctx.trial > 0) {
        LOG_INFO(logger, "[{}] attempt #{} {} - {} {} (token: {}) [half-open trial {}/{}]", rid,
                 ctx.number, backend.name, request.method, upstream.url(), token_preview,
                 ctx.trial, breaker_.config().half_open_requests);
    } else {
        LOG_ATTEMPT(logger, rid, ctx.number, backend.name, request.method, upstream.url(),
                    token_preview);
    }

    UpstreamResponse response;
    if (auto ec = transport_.send(upstream, response)) {
        breaker_.record_failure(state, 0);
        last_error = ec.message();
        if (ec == UpstreamErrc::timeout) {
            LOG_WARNING(logger, "[{}] timeout #{} {} - no response within {} ms", rid, ctx.number,
                        backend.name, config_.request_timeout.count());
        } else {
            LOG_WARNING(logger, "[{}] failed #{} {} - {}", rid, ctx.number, backend.name,
                        last_error);
        }
        return AttemptOutcome::RETRY;
    }

    if (http::is_success(response.status)) {
        breaker_.record_success(state);
        LOG_INFO(logger, "[{}] success #{} {} - HTTP {}", rid, ctx.number, backend.name,
                 response.status);
        return respond_success(state, ctx, response, probe.model, convert, out);
    }

    // Error bodies are read in full for diagnostics
    std::string raw;
    auto read_ec = read_all(*response.body, raw);
    if (read_ec && raw.empty()) {
        breaker_.record_failure(state, response.status);
        last_error = fmt::format("{} ({})", status_error(response.status), read_ec.message());
        LOG_WARNING(logger, "[{}] failed #{} {} - {}", rid, ctx.number, backend.name, last_error);
        return AttemptOutcome::RETRY;
    }

    std::string readable =
        core::read_body(http::get_header(response.headers, "Content-Encoding"), raw);
    LOG_UPSTREAM_ERROR(logger, rid, backend.name, response.status,
                       core::truncate_for_log(readable));

    if (response.status == static_cast<int>(http::StatusCode::TooManyRequests)) {
        breaker_.record_rate_limit(state, http::get_header(response.headers, "Retry-After"));
        if (ctx.trial > 0) {
            breaker_.end_half_open_trial(state, response.status);
        }
        last_error = status_error(response.status);
        return AttemptOutcome::RETRY;
    }

    if (response.status >= 500) {
        breaker_.record_failure(state, response.status);
        last_error = status_error(response.status);
        return AttemptOutcome::RETRY;
    }

    if (response.status == static_cast<int>(http::StatusCode::Unauthorized) ||
        response.status == static_cast<int>(http::StatusCode::Forbidden)) {
        LOG_WARNING(logger, "[{}] auth error from {} - HTTP {}, not retrying", rid, backend.name,
                    response.status);
    } else {
        LOG_INFO(logger, "[{}] returning HTTP {} from {} to client, not retrying", rid,
                 response.status, backend.name);
    }

    if (ctx.trial > 0) {
        breaker_.end_half_open_trial(state, response.status);
    }

    out.status = response.status;
    out.headers = forwardable_headers(response.headers);
    out.body = std::move(raw);
    return AttemptOutcome::RESPOND;
}

AttemptOutcome Forwarder::respond_success(BackendState& state, const AttemptContext& ctx,
                                          UpstreamResponse& upstream, const std::string& model,
                                          bool convert, ProxyResponse& out) {
    auto* logger = logging::get_logger();
    const Backend& backend = state.backend();
    const std::string& rid = ctx.request_id;

    out.status = upstream.status;
    out.headers = forwardable_headers(upstream.headers);
    std::string_view content_type = http::get_header(upstream.headers, "Content-Type");

    if (http::is_event_stream(content_type)) {
        RelayMode mode = RelayMode::PASSTHROUGH;
        if (convert) {
            mode = RelayMode::CONVERT;
            http::remove_header(out.headers, "Content-Encoding");
            http::set_header(out.headers, "Content-Type", "text/event-stream");
            http::set_header(out.headers, "Cache-Control", "no-cache");
            http::set_header(out.headers, "X-Accel-Buffering", "no");
            LOG_INFO(logger, "[{}] converting event stream from {}", rid, backend.name);
        }
        out.stream = std::make_shared<StreamRelay>(std::move(upstream.body), mode, model,
                                                   backend.name, rid);
        return AttemptOutcome::RESPOND;
    }

    std::string raw;
    if (auto ec = read_all(*upstream.body, raw)) {
        LOG_WARNING(logger, "[{}] response body from {} cut short after {} bytes: {}", rid,
                    backend.name, raw.size(), ec.message());
    }

    if (!convert) {
        out.body = std::move(raw);
        return AttemptOutcome::RESPOND;
    }

    std::string readable =
        core::read_body(http::get_header(upstream.headers, "Content-Encoding"), raw);
    auto converted = convert_response(readable);
    if (!converted) {
        LOG_ERROR(logger, "[{}] response conversion failed for {}: {}", rid, backend.name,
                  converted.error);
        auto error = http::make_text_response(
            static_cast<int>(http::StatusCode::InternalServerError),
            fmt::format("response conversion failed: {}", converted.error));
        out.status = error.status;
        out.headers = std::move(error.headers);
        out.body = std::move(error.body);
        return AttemptOutcome::RESPOND;
    }

    http::remove_header(out.headers, "Content-Encoding");
    http::set_header(out.headers, "Content-Type", "application/json");
    out.body = std::move(converted.body);
    LOG_DEBUG(logger, "[{}] converted response from {} to native format", rid, backend.name);
    return AttemptOutcome::RESPOND;
}

}  // namespace switchback::gateway
