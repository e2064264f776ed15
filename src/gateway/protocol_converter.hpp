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

// Switchback Protocol Converter - Header
// Translation between the native messages API and the chat-completions API

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace switchback::gateway {

// ============================================================================
// Native request shape (only the fields the converter reads)
// ============================================================================

struct NativeImageSource {
    std::string type;  // "base64" or "url"
    std::string media_type;
    std::string data;
    std::string url;
};

struct NativeContentBlock {
    std::string type;  // text, image, tool_use, tool_result
    std::string text;
    std::string id;
    std::string name;
    nlohmann::json input;  // tool_use arguments
    std::string tool_use_id;
    nlohmann::json content;  // tool_result payload (string or blocks)
    std::optional<NativeImageSource> source;
};

struct NativeMessage {
    std::string role;
    std::optional<std::string> text;  // Set when content is a plain string
    std::vector<NativeContentBlock> blocks;
};

struct NativeTool {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct NativeRequest {
    std::string model;
    std::vector<NativeMessage> messages;
    std::string system;  // String form, or text blocks joined with '\n'
    std::optional<int64_t> max_tokens;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<bool> stream;
    std::vector<std::string> stop_sequences;
    std::vector<NativeTool> tools;
    nlohmann::json tool_choice;  // null when absent
};

// ============================================================================
// Foreign response shapes
// ============================================================================

struct ForeignToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments;  // Usually a JSON-encoded string
};

struct ForeignChoice {
    std::optional<std::string> content;
    std::vector<ForeignToolCall> tool_calls;
    std::string finish_reason;
};

struct ForeignUsage {
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t cached_tokens = 0;
};

struct ForeignResponse {
    std::string id;
    std::string model;
    std::vector<ForeignChoice> choices;
    std::optional<ForeignUsage> usage;
};

/// Tool call fragment inside a streaming delta
struct ForeignToolCallDelta {
    int64_t index = 0;
    std::string id;  // Present on the first fragment of a call
    std::string name;
    std::string arguments;
};

/// One parsed "data:" payload of a chat-completions stream (first choice only)
struct ForeignStreamChunk {
    bool has_choice = false;
    std::optional<std::string> content;
    std::vector<ForeignToolCallDelta> tool_calls;
    std::optional<std::string> finish_reason;
    std::optional<ForeignUsage> usage;
};

void from_json(const nlohmann::json& j, NativeImageSource& source);
void from_json(const nlohmann::json& j, NativeContentBlock& block);
void from_json(const nlohmann::json& j, NativeMessage& message);
void from_json(const nlohmann::json& j, NativeTool& tool);
void from_json(const nlohmann::json& j, NativeRequest& request);
void from_json(const nlohmann::json& j, ForeignUsage& usage);
void from_json(const nlohmann::json& j, ForeignResponse& response);
void from_json(const nlohmann::json& j, ForeignStreamChunk& chunk);

// ============================================================================
// Whole-body conversion
// ============================================================================

/// Conversion outcome; `error` is set when `ok` is false
struct ConversionResult {
    bool ok = false;
    std::string body;
    std::string error;

    explicit operator bool() const noexcept { return ok; }

    static ConversionResult success(std::string body) { return {true, std::move(body), {}}; }
    static ConversionResult failure(std::string error) { return {false, {}, std::move(error)}; }
};

/// Native model identifier to chat-completions model.
/// Names outside the native family (for example a backend override) pass through.
[[nodiscard]] std::string map_model(std::string_view model);

/// Chat-completions finish_reason to native stop_reason
[[nodiscard]] constexpr std::string_view map_finish_reason(std::string_view reason) noexcept {
    if (reason == "length") {
        return "max_tokens";
    }
    if (reason == "tool_calls") {
        return "tool_use";
    }
    if (reason == "content_filter") {
        return "stop_sequence";
    }
    return "end_turn";
}

/// Native request body to chat-completions request body
[[nodiscard]] ConversionResult convert_request(std::string_view body);

/// Chat-completions response body to native response body.
/// Bodies already carrying "type": "message" are returned unchanged.
[[nodiscard]] ConversionResult convert_response(std::string_view body);

/// Fields the forwarder inspects before sending a request
struct RequestProbe {
    bool is_object = false;
    bool stream = false;
    std::string model;
};

/// Inspect a request body; non-JSON bodies yield a default probe
[[nodiscard]] RequestProbe probe_request(std::string_view body);

/// Replace the top-level "model" field; nullopt if the body is not a JSON object
[[nodiscard]] std::optional<std::string> override_model(std::string_view body,
                                                        std::string_view model);

/// Native stream event names
[[nodiscard]] bool is_native_event_type(std::string_view type) noexcept;

/// Text carried by a native content_block_delta payload, if any
[[nodiscard]] std::optional<std::string> native_text_delta(std::string_view payload);

// ============================================================================
// Streaming conversion
// ============================================================================

struct StreamStats {
    uint64_t chunks = 0;
    uint64_t text_chars = 0;  // UTF-8 code points
    std::string finish_reason;
    bool saw_done = false;
};

/// Converts a chat-completions event stream into a native event stream,
/// one line at a time.
///
/// message_start is emitted when the first data line arrives. If that line
/// already carries a native event type the stream is relayed verbatim from
/// then on. finish() closes the stream: the open block is stopped, a default
/// end_turn message_delta is added when no finish_reason was seen, and
/// message_stop is written.
class StreamConverter {
public:
    explicit StreamConverter(std::string model);

    /// Feed one line without its terminator; returns bytes for the client
    [[nodiscard]] std::string on_line(std::string_view line);

    /// Closing events; empty after the first call
    [[nodiscard]] std::string finish();

    /// The [DONE] sentinel was seen; later lines are ignored
    [[nodiscard]] bool done() const noexcept { return stats_.saw_done; }

    [[nodiscard]] bool native_passthrough() const noexcept { return mode_ == Mode::NATIVE; }

    [[nodiscard]] const StreamStats& stats() const noexcept { return stats_; }

    /// Assistant text assembled so far
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    enum class Mode : uint8_t { UNDECIDED, CONVERT, NATIVE };

    std::string start_message();
    std::string close_block();
    std::string open_block(const nlohmann::json& content_block);
    std::string message_delta(std::string_view stop_reason, const ForeignUsage& usage);
    std::string convert_chunk(const ForeignStreamChunk& chunk);

    std::string model_;
    Mode mode_ = Mode::UNDECIDED;
    std::vector<std::string> pending_;  // Lines seen before the mode was decided

    bool started_ = false;
    bool finished_ = false;
    bool stop_sent_ = false;
    int64_t next_index_ = 0;
    int64_t current_index_ = -1;
    std::string current_type_;       // "text" or "tool_use" while a block is open
    int64_t current_tool_call_ = -1;  // Foreign tool call index of the open tool_use block

    StreamStats stats_;
    std::string text_;
};

}  // namespace switchback::gateway
