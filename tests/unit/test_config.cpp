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

// Configuration Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../../src/control/config.hpp"

using namespace switchback::control;
using namespace std::chrono_literals;

namespace {

BackendConfig make_backend(std::string name, std::string url = "https://api.example.com") {
    BackendConfig backend;
    backend.name = std::move(name);
    backend.base_url = std::move(url);
    backend.token = "sk-test-0000000000";
    return backend;
}

bool has_error_containing(const ValidationResult& result, std::string_view needle) {
    for (const auto& error : result.errors) {
        if (error.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Config defaults", "[control][config]") {
    Config config;
    REQUIRE(config.port == 8080);
    REQUIRE(config.retry.timeout_seconds == 30);
    REQUIRE(config.failover.circuit_breaker.failure_threshold == 3);
    REQUIRE(config.failover.circuit_breaker.open_timeout_seconds == 30);
    REQUIRE(config.failover.circuit_breaker.half_open_requests == 1);
    REQUIRE(config.failover.rate_limit.cooldown_seconds == 60);
    REQUIRE(config.logging.level == "info");
    REQUIRE(config.logging.format == "console");
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "port": 9090,
        "backends": [
            {"name": "primary", "base_url": "https://api.anthropic.com", "token": "sk-ant-1"},
            {"name": "compat", "base_url": "https://openrouter.ai/api", "token": "sk-or-1",
             "enabled": false, "model": "qwen3-coder", "platform": "openai"}
        ],
        "retry": {"timeout_seconds": 45},
        "failover": {
            "circuit_breaker": {"failure_threshold": 5, "open_timeout_seconds": 10},
            "rate_limit": {"cooldown_seconds": 20}
        },
        "logging": {"level": "debug", "format": "json", "output": "/var/log/switchback"}
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());
    const auto& config = *maybe_config;

    REQUIRE(config.port == 9090);
    REQUIRE(config.backends.size() == 2);
    REQUIRE(config.backends[0].name == "primary");
    REQUIRE(config.backends[0].enabled);
    REQUIRE(config.backends[0].platform.empty());
    REQUIRE(config.backends[1].name == "compat");
    REQUIRE_FALSE(config.backends[1].enabled);
    REQUIRE(config.backends[1].model == "qwen3-coder");
    REQUIRE(config.backends[1].platform == "openai");
    REQUIRE(config.retry.timeout_seconds == 45);
    REQUIRE(config.failover.circuit_breaker.failure_threshold == 5);
    REQUIRE(config.failover.circuit_breaker.open_timeout_seconds == 10);
    REQUIRE(config.failover.circuit_breaker.half_open_requests == 1);
    REQUIRE(config.failover.rate_limit.cooldown_seconds == 20);
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.format == "json");
    REQUIRE(config.logging.output == "/var/log/switchback");
}

TEST_CASE("Config zero values fall back to defaults", "[control][config]") {
    const char* json = R"({
        "port": 0,
        "backends": [{"name": "a", "base_url": "http://localhost:9000", "token": "t"}],
        "retry": {"timeout_seconds": 0},
        "failover": {
            "circuit_breaker": {"failure_threshold": 0, "open_timeout_seconds": 0,
                                "half_open_requests": 0},
            "rate_limit": {"cooldown_seconds": 0}
        }
    })";

    auto config = ConfigLoader::load_from_json(json);
    REQUIRE(config.has_value());
    REQUIRE(config->port == 8080);
    REQUIRE(config->retry.timeout_seconds == 30);
    REQUIRE(config->failover.circuit_breaker.failure_threshold == 3);
    REQUIRE(config->failover.circuit_breaker.open_timeout_seconds == 30);
    REQUIRE(config->failover.circuit_breaker.half_open_requests == 1);
    REQUIRE(config->failover.rate_limit.cooldown_seconds == 60);
}

TEST_CASE("Config loading rejects bad input", "[control][config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json("{not json").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"backends": []})").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/switchback.json").has_value());
}

TEST_CASE("Config validation", "[control][config]") {
    Config config;
    config.backends = {make_backend("a"), make_backend("b")};

    SECTION("Valid config") {
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.errors.empty());
        REQUIRE(result.warnings.empty());
    }

    SECTION("No backends") {
        config.backends.clear();
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(has_error_containing(result, "No backends"));
    }

    SECTION("Empty and duplicate names") {
        config.backends.push_back(make_backend(""));
        config.backends.push_back(make_backend("a"));
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_error_containing(result, "backend[2]: name cannot be empty"));
        REQUIRE(has_error_containing(result, "Duplicate backend name 'a'"));
    }

    SECTION("Bad URLs") {
        config.backends[0].base_url = "";
        config.backends[1].base_url = "api.example.com";
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_error_containing(result, "backend 'a': base_url cannot be empty"));
        REQUIRE(has_error_containing(result, "must be an absolute"));
    }

    SECTION("Unknown platform") {
        config.backends[0].platform = "gemini";
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_error_containing(result, "unknown platform 'gemini'"));
    }

    SECTION("Platform tags are case-insensitive") {
        config.backends[0].platform = "OpenAI";
        REQUIRE(ConfigLoader::validate(config).valid);
    }

    SECTION("Logging settings") {
        config.logging.level = "trace";
        config.logging.format = "xml";
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_error_containing(result, "Unknown logging level 'trace'"));
        REQUIRE(has_error_containing(result, "Unknown logging format 'xml'"));
    }

    SECTION("Warnings do not fail validation") {
        config.backends[0].token.clear();
        config.backends[0].enabled = false;
        config.backends[1].enabled = false;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 2);
    }
}

TEST_CASE("Config JSON round trip keeps backend order", "[control][config]") {
    Config config;
    config.backends = {make_backend("first"), make_backend("second"), make_backend("third")};
    config.backends[1].enabled = false;

    std::string json = ConfigLoader::to_json(config);
    auto parsed = ConfigLoader::load_from_json(json);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->backends.size() == 3);
    REQUIRE(parsed->backends[0].name == "first");
    REQUIRE(parsed->backends[1].name == "second");
    REQUIRE_FALSE(parsed->backends[1].enabled);
    REQUIRE(parsed->backends[2].name == "third");
}

TEST_CASE("Runtime backends and breaker settings", "[control][config]") {
    Config config;
    config.backends = {make_backend("native"), make_backend("compat")};
    config.backends[1].platform = "openai";
    config.backends[1].model = "gpt-4o-mini";
    config.failover.circuit_breaker.open_timeout_seconds = 12;
    config.failover.rate_limit.cooldown_seconds = 7;

    auto backends = make_backends(config);
    REQUIRE(backends.size() == 2);
    REQUIRE(backends[0].platform == switchback::gateway::Platform::ANTHROPIC);
    REQUIRE_FALSE(backends[0].needs_conversion());
    REQUIRE(backends[1].platform == switchback::gateway::Platform::OPENAI);
    REQUIRE(backends[1].needs_conversion());
    REQUIRE(backends[1].model == "gpt-4o-mini");

    auto breaker = make_breaker_config(config);
    REQUIRE(breaker.failure_threshold == 3);
    REQUIRE(breaker.open_timeout == 12s);
    REQUIRE(breaker.half_open_requests == 1);
    REQUIRE(breaker.rate_limit_cooldown == 7s);
}
