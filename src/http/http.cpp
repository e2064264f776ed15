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

// Switchback HTTP Types - Implementation

#include "http.hpp"

#include <algorithm>
#include <array>
#include <charconv>

namespace switchback::http {

namespace {

// ASCII-only fold; header names and URL schemes are never locale-dependent
constexpr char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

}  // namespace

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) {
            return false;
        }
    }
    return true;
}

std::string_view get_header(const Headers& headers, std::string_view name,
                            std::string_view default_value) noexcept {
    for (const auto& [key, value] : headers) {
        if (header_name_equals(key, name)) {
            return value;
        }
    }
    return default_value;
}

bool has_header(const Headers& headers, std::string_view name) noexcept {
    return std::any_of(headers.begin(), headers.end(),
                       [name](const auto& h) { return header_name_equals(h.first, name); });
}

void set_header(Headers& headers, std::string_view name, std::string_view value) {
    remove_header(headers, name);
    headers.emplace_back(std::string{name}, std::string{value});
}

void remove_header(Headers& headers, std::string_view name) {
    std::erase_if(headers, [name](const auto& h) { return header_name_equals(h.first, name); });
}

bool is_hop_by_hop(std::string_view name) noexcept {
    static constexpr std::array<std::string_view, 10> HOP_BY_HOP = {
        "connection",        "keep-alive", "proxy-authenticate", "proxy-authorization",
        "te",                "trailer",    "transfer-encoding",  "upgrade",
        "host",              "content-length"};
    for (auto hop : HOP_BY_HOP) {
        if (header_name_equals(name, hop)) {
            return true;
        }
    }
    return false;
}

std::string Url::origin() const {
    if (host.find(':') != std::string::npos) {
        return scheme + "://[" + host + "]:" + std::to_string(port);
    }
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::optional<Url> parse_url(std::string_view url) {
    Url result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    result.scheme = std::string(url.substr(0, scheme_end));
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   ascii_lower);
    if (result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    std::string_view rest = url.substr(scheme_end + 3);
    size_t path_start = rest.find('/');
    std::string_view authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        result.path = std::string(rest.substr(path_start));
    }
    // Query strings on a base URL are not supported
    if (result.path.find('?') != std::string::npos || authority.find('?') != std::string::npos) {
        return std::nullopt;
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    result.port = result.scheme == "https" ? 443 : 80;

    // Bracketed IPv6 literal
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        result.host = std::string(authority.substr(1, close - 1));
        authority.remove_prefix(close + 1);
        if (!authority.empty() && authority.front() != ':') {
            return std::nullopt;
        }
    } else {
        size_t colon = authority.find(':');
        result.host = std::string(authority.substr(0, colon));
        authority = colon == std::string_view::npos ? std::string_view{} : authority.substr(colon);
    }

    if (!authority.empty()) {
        std::string_view port_str = authority.substr(1);
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 ||
            port > 65535) {
            return std::nullopt;
        }
        result.port = static_cast<uint16_t>(port);
    }

    if (result.host.empty()) {
        return std::nullopt;
    }

    // Trailing slashes would double up when the client path is appended
    while (!result.path.empty() && result.path.back() == '/') {
        result.path.pop_back();
    }
    return result;
}

Response make_text_response(int status, std::string_view body) {
    Response response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
    response.body = std::string{body};
    return response;
}

bool is_event_stream(std::string_view content_type) noexcept {
    return content_type.find("text/event-stream") != std::string_view::npos;
}

}  // namespace switchback::http
