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

// Switchback Logging - Implementation

#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>

#include "../control/config.hpp"
#include "string_utils.hpp"

namespace switchback::logging {

namespace {

std::atomic<quill::Logger*> g_logger{nullptr};

constexpr const char* LOGGER_NAME = "switchback";

quill::Logger* create_console_logger() {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    return quill::Frontend::create_or_get_logger(LOGGER_NAME, std::move(console_sink));
}

bool parse_level(std::string_view level, quill::LogLevel& out) {
    using core::iequals;

    if (iequals(level, "debug")) {
        out = quill::LogLevel::Debug;
    } else if (iequals(level, "info")) {
        out = quill::LogLevel::Info;
    } else if (iequals(level, "warning") || iequals(level, "warn")) {
        out = quill::LogLevel::Warning;
    } else if (iequals(level, "error")) {
        out = quill::LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

}  // namespace

void init_logging_system() {
    quill::Backend::start();
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    quill::Logger* logger = nullptr;

    if (log_config.format == "console") {
        logger = create_console_logger();
    } else {
        std::filesystem::create_directories(log_config.output);

        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        std::string log_path = fmt::format("{}/switchback.log", log_config.output);

        if (log_config.format == "json") {
            auto json_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger("switchback_json", std::move(json_sink));
        } else {
            auto file_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger("switchback_file", std::move(file_sink));
        }
    }

    quill::LogLevel level;
    if (!parse_level(log_config.level, level)) {
        level = quill::LogLevel::Info;
    }
    logger->set_log_level(level);

    g_logger.store(logger, std::memory_order_release);
    return logger;
}

bool set_log_level(std::string_view level) {
    quill::LogLevel parsed;
    if (!parse_level(level, parsed)) {
        return false;
    }
    get_logger()->set_log_level(parsed);
    return true;
}

void shutdown_logging() {
    quill::Backend::stop();
}

quill::Logger* get_logger() {
    quill::Logger* logger = g_logger.load(std::memory_order_acquire);
    if (logger) {
        return logger;
    }

    // create_or_get_logger is idempotent, so racing callers get the same logger
    quill::Logger* fallback = create_console_logger();
    quill::Logger* expected = nullptr;
    if (!g_logger.compare_exchange_strong(expected, fallback, std::memory_order_acq_rel)) {
        return expected;
    }
    return fallback;
}

namespace {

// Random v4 uuid, generated once per thread as the correlation id base
std::string generate_base_uuid() {
    std::mt19937_64 rng(std::random_device{}() ^
                        static_cast<uint64_t>(
                            std::chrono::steady_clock::now().time_since_epoch().count()));
    uint64_t high = rng();
    uint64_t low = rng();

    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // RFC 4122 variant

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", high >> 32, (high >> 16) & 0xFFFF,
                       high & 0xFFFF, low >> 48, low & 0xFFFFFFFFFFFFULL);
}

bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}  // namespace

std::string generate_correlation_id() {
    static thread_local const std::string base_uuid = generate_base_uuid();
    static thread_local uint64_t counter = 0;

    return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_uuid(std::string_view id) {
    size_t hash_pos = id.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    // xxxxxxxx-xxxx-4xxx-Vxxx-xxxxxxxxxxxx with V in [89abAB]
    constexpr std::string_view pattern = "xxxxxxxx-xxxx-4xxx-Vxxx-xxxxxxxxxxxx";
    std::string_view uuid = id.substr(0, hash_pos);
    if (uuid.size() != pattern.size()) {
        return false;
    }
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = uuid[i];
        switch (pattern[i]) {
            case '-':
            case '4':
                if (c != pattern[i]) {
                    return false;
                }
                break;
            case 'V':
                if (std::string_view{"89abAB"}.find(c) == std::string_view::npos) {
                    return false;
                }
                break;
            default:
                if (!is_hex_digit(c)) {
                    return false;
                }
        }
    }

    std::string_view counter = id.substr(hash_pos + 1);
    return !counter.empty() &&
           std::all_of(counter.begin(), counter.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace switchback::logging
