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

// Switchback Logging - Header
// Quill backend setup, sink selection and correlation IDs

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace switchback::control {
struct LogConfig;
}

namespace switchback::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the process logger from config (console, text or json sink)
// Replaces the fallback console logger returned by get_logger()
quill::Logger* init_logger(const switchback::control::LogConfig& config);

// Apply a level name (debug, info, warning, error) to the process logger
// Returns false for an unknown name, leaving the level unchanged
bool set_log_level(std::string_view level);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 base plus per-thread counter: {uuid}#{n}
std::string generate_correlation_id();

// Validate correlation ID format ({8-4-4-4-12}#{digits})
bool is_valid_uuid(std::string_view uuid);

// Process logger; falls back to a console logger before init_logger() runs
quill::Logger* get_logger();

// Attempt logging: backend, target and masked credential
#define LOG_ATTEMPT(logger, request_id, attempt, backend, method, target, token_preview) \
    LOG_INFO(logger, "[{}] attempt #{} {} - {} {} (token: {})", request_id, attempt,     \
             backend, method, target, token_preview)

// Upstream error body logging (body already truncated by caller)
#define LOG_UPSTREAM_ERROR(logger, request_id, backend, status, body)                  \
    LOG_WARNING(logger, "[{}] {} - HTTP {} - response: {}", request_id, backend, status, \
                body)

}  // namespace switchback::logging
