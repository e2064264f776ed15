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

// Switchback HTTP Types - Header
// Owned request/response value types shared by the proxy, the upstream
// transport and the management API

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace switchback::http {

/// HTTP status codes used by the proxy
enum class StatusCode : uint16_t {
    OK = 200,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    TooManyRequests = 429,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
};

/// Ordered header list; names keep their original case, duplicates allowed
using Headers = std::vector<std::pair<std::string, std::string>>;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// First value for a header, or default_value when absent
[[nodiscard]] std::string_view get_header(const Headers& headers, std::string_view name,
                                          std::string_view default_value = {}) noexcept;

[[nodiscard]] bool has_header(const Headers& headers, std::string_view name) noexcept;

/// Replace every occurrence of a header with a single value
void set_header(Headers& headers, std::string_view name, std::string_view value);

/// Remove every occurrence of a header
void remove_header(Headers& headers, std::string_view name);

/// Connection-scoped headers that a proxy must not forward, plus the
/// framing headers the HTTP library regenerates (Host, Content-Length)
[[nodiscard]] bool is_hop_by_hop(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_success(int status) noexcept {
    return status >= 200 && status < 300;
}

/// Inbound client request with a fully buffered body
struct Request {
    std::string method = "GET";
    std::string path = "/";
    std::string query;  // Raw query string without '?'
    Headers headers;
    std::string body;
};

/// Response returned to the client when the body is already complete
struct Response {
    int status = 200;
    Headers headers;
    std::string body;

    [[nodiscard]] std::string_view content_type() const noexcept {
        return get_header(headers, "Content-Type");
    }
};

/// Split absolute URL (scheme://host[:port][/path])
struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string path;  // Prefix without trailing '/', may be empty

    /// scheme://host:port (form accepted by the HTTP client)
    [[nodiscard]] std::string origin() const;
};

/// Parse an absolute http(s) URL; nullopt for anything else
[[nodiscard]] std::optional<Url> parse_url(std::string_view url);

/// Plain-text response helper
[[nodiscard]] Response make_text_response(int status, std::string_view body);

/// Server-Sent Events content type check
[[nodiscard]] bool is_event_stream(std::string_view content_type) noexcept;

}  // namespace switchback::http
