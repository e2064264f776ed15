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

// Logging Unit Tests

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/logging.hpp"

using namespace switchback::logging;

TEST_CASE("Correlation IDs", "[logging][correlation_id]") {
    SECTION("Shape is uuid#counter") {
        std::string id = generate_correlation_id();
        REQUIRE(std::count(id.begin(), id.end(), '#') == 1);
        REQUIRE(is_valid_uuid(id));

        std::string uuid = id.substr(0, id.find('#'));
        REQUIRE(uuid.size() == 36);
        REQUIRE(uuid[14] == '4');
    }

    SECTION("Same thread shares the base and counts up") {
        std::string first = generate_correlation_id();
        std::string second = generate_correlation_id();
        REQUIRE(first != second);
        REQUIRE(first.substr(0, first.find('#')) == second.substr(0, second.find('#')));

        uint64_t n1 = std::stoull(first.substr(first.find('#') + 1));
        uint64_t n2 = std::stoull(second.substr(second.find('#') + 1));
        REQUIRE(n2 == n1 + 1);
    }

    SECTION("Threads get distinct bases") {
        std::vector<std::string> ids(4);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < ids.size(); ++i) {
            threads.emplace_back([&ids, i] { ids[i] = generate_correlation_id(); });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        std::set<std::string> bases;
        for (const auto& id : ids) {
            REQUIRE(is_valid_uuid(id));
            bases.insert(id.substr(0, id.find('#')));
        }
        REQUIRE(bases.size() == ids.size());
    }
}

TEST_CASE("is_valid_uuid rejects malformed IDs", "[logging][correlation_id]") {
    REQUIRE(is_valid_uuid("123e4567-e89b-42d3-a456-426614174000#0"));
    REQUIRE_FALSE(is_valid_uuid("123e4567-e89b-42d3-a456-426614174000"));
    REQUIRE_FALSE(is_valid_uuid("123e4567-e89b-42d3-a456-426614174000#"));
    REQUIRE_FALSE(is_valid_uuid("123e4567-e89b-42d3-a456-426614174000#x1"));
    REQUIRE_FALSE(is_valid_uuid("123e4567-e89b-12d3-a456-426614174000#1"));  // version 1
    REQUIRE_FALSE(is_valid_uuid("123e4567-e89b-42d3-c456-426614174000#1"));  // variant
    REQUIRE_FALSE(is_valid_uuid("123e4567e89b42d3a456426614174000#1"));
    REQUIRE_FALSE(is_valid_uuid("g23e4567-e89b-42d3-a456-426614174000#1"));
    REQUIRE_FALSE(is_valid_uuid(""));
}

TEST_CASE("Logger access", "[logging]") {
    REQUIRE(get_logger() != nullptr);
    REQUIRE(get_logger() == get_logger());

    REQUIRE(set_log_level("debug"));
    REQUIRE(get_logger()->get_log_level() == quill::LogLevel::Debug);
    REQUIRE(set_log_level("WARN"));
    REQUIRE(get_logger()->get_log_level() == quill::LogLevel::Warning);
    REQUIRE_FALSE(set_log_level("verbose"));
    REQUIRE(get_logger()->get_log_level() == quill::LogLevel::Warning);
}
