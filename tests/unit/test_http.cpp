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

// HTTP Types Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../../src/http/http.hpp"

using namespace switchback::http;

TEST_CASE("Header helpers are case-insensitive", "[http][headers]") {
    Headers headers = {{"Content-Type", "application/json"},
                       {"x-api-key", "one"},
                       {"X-Api-Key", "two"}};

    REQUIRE(get_header(headers, "content-type") == "application/json");
    REQUIRE(get_header(headers, "X-API-KEY") == "one");
    REQUIRE(get_header(headers, "missing", "fallback") == "fallback");
    REQUIRE(has_header(headers, "CONTENT-TYPE"));
    REQUIRE_FALSE(has_header(headers, "Authorization"));

    SECTION("set_header replaces every occurrence") {
        set_header(headers, "X-Api-Key", "three");
        REQUIRE(headers.size() == 2);
        REQUIRE(get_header(headers, "x-api-key") == "three");
    }

    SECTION("remove_header removes every occurrence") {
        remove_header(headers, "x-api-key");
        REQUIRE(headers.size() == 1);
        REQUIRE_FALSE(has_header(headers, "X-Api-Key"));
    }
}

TEST_CASE("Hop-by-hop headers", "[http][headers]") {
    REQUIRE(is_hop_by_hop("Connection"));
    REQUIRE(is_hop_by_hop("transfer-encoding"));
    REQUIRE(is_hop_by_hop("Host"));
    REQUIRE(is_hop_by_hop("Content-Length"));
    REQUIRE_FALSE(is_hop_by_hop("Authorization"));
    REQUIRE_FALSE(is_hop_by_hop("Content-Encoding"));
    REQUIRE_FALSE(is_hop_by_hop("anthropic-version"));
}

TEST_CASE("parse_url", "[http][url]") {
    SECTION("Default ports") {
        auto https = parse_url("https://api.example.com");
        REQUIRE(https.has_value());
        REQUIRE(https->scheme == "https");
        REQUIRE(https->host == "api.example.com");
        REQUIRE(https->port == 443);
        REQUIRE(https->path.empty());
        REQUIRE(https->origin() == "https://api.example.com:443");

        auto http = parse_url("HTTP://localhost/");
        REQUIRE(http.has_value());
        REQUIRE(http->scheme == "http");
        REQUIRE(http->port == 80);
        REQUIRE(http->path.empty());
    }

    SECTION("Explicit port and path prefix") {
        auto url = parse_url("http://127.0.0.1:8081/api/v2/");
        REQUIRE(url.has_value());
        REQUIRE(url->host == "127.0.0.1");
        REQUIRE(url->port == 8081);
        REQUIRE(url->path == "/api/v2");
    }

    SECTION("IPv6 literal") {
        auto url = parse_url("http://[::1]:9000");
        REQUIRE(url.has_value());
        REQUIRE(url->host == "::1");
        REQUIRE(url->port == 9000);
        REQUIRE(url->origin() == "http://[::1]:9000");
    }

    SECTION("Rejected forms") {
        REQUIRE_FALSE(parse_url("").has_value());
        REQUIRE_FALSE(parse_url("api.example.com").has_value());
        REQUIRE_FALSE(parse_url("ftp://example.com").has_value());
        REQUIRE_FALSE(parse_url("http://").has_value());
        REQUIRE_FALSE(parse_url("http://host:0").has_value());
        REQUIRE_FALSE(parse_url("http://host:70000").has_value());
        REQUIRE_FALSE(parse_url("http://host:abc").has_value());
        REQUIRE_FALSE(parse_url("http://host/path?x=1").has_value());
    }

    SECTION("Scheme folding is ASCII-only") {
        auto url = parse_url("HtTpS://api.example.com/v1");
        REQUIRE(url.has_value());
        REQUIRE(url->scheme == "https");
        REQUIRE(url->port == 443);

        REQUIRE_FALSE(parse_url("\xC3\x89ttp://api.example.com").has_value());
        REQUIRE_FALSE(parse_url("htt\xD0\xA0://api.example.com").has_value());
    }
}

TEST_CASE("Response helpers", "[http]") {
    auto response = make_text_response(502, "all backends unavailable");
    REQUIRE(response.status == 502);
    REQUIRE(response.body == "all backends unavailable");
    REQUIRE(response.content_type().starts_with("text/plain"));

    REQUIRE(is_event_stream("text/event-stream; charset=utf-8"));
    REQUIRE_FALSE(is_event_stream("application/json"));

    REQUIRE(is_success(200));
    REQUIRE(is_success(204));
    REQUIRE_FALSE(is_success(301));
    REQUIRE_FALSE(is_success(500));
}
