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

// Switchback Protocol Converter - Implementation

#include "protocol_converter.hpp"

#include <fmt/format.h>

#include <array>
#include <chrono>

#include "../core/logging.hpp"
#include "../http/sse.hpp"

namespace switchback::gateway {

using json = nlohmann::json;

namespace {

// String field or empty; wrong types are treated as absent
std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

int64_t integer_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return 0;
    }
    return it->get<int64_t>();
}

bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

std::string join_text_blocks(const std::vector<NativeContentBlock>& blocks) {
    std::string out;
    for (const auto& block : blocks) {
        if (block.type != "text" || block.text.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += block.text;
    }
    return out;
}

size_t utf8_length(std::string_view s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// tool_result blocks become tool messages ahead of the user's text and images
void convert_user_blocks(const std::vector<NativeContentBlock>& blocks, json& out) {
    for (const auto& block : blocks) {
        if (block.type != "tool_result" || is_blank(block.tool_use_id)) {
            continue;
        }
        std::string content;
        if (block.content.is_string()) {
            content = block.content.get<std::string>();
        } else if (!block.content.is_null()) {
            content = block.content.dump();
        }
        out.push_back(
            {{"role", "tool"}, {"tool_call_id", block.tool_use_id}, {"content", content}});
    }

    json parts = json::array();
    for (const auto& block : blocks) {
        if (block.type == "text") {
            if (!block.text.empty()) {
                parts.push_back({{"type", "text"}, {"text", block.text}});
            }
        } else if (block.type == "image" && block.source) {
            std::string url;
            if (block.source->type == "base64") {
                if (!block.source->media_type.empty() && !block.source->data.empty()) {
                    url = fmt::format("data:{};base64,{}", block.source->media_type,
                                      block.source->data);
                }
            } else if (block.source->type == "url") {
                url = block.source->url;
            }
            if (!url.empty()) {
                parts.push_back({{"type", "image_url"}, {"image_url", {{"url", url}}}});
            }
        }
    }

    if (parts.empty()) {
        return;
    }
    if (parts.size() == 1 && parts[0]["type"] == "text") {
        out.push_back({{"role", "user"}, {"content", parts[0]["text"]}});
        return;
    }
    out.push_back({{"role", "user"}, {"content", std::move(parts)}});
}

void convert_assistant_blocks(const std::vector<NativeContentBlock>& blocks, json& out) {
    json message = {{"role", "assistant"}};

    std::string text = join_text_blocks(blocks);
    if (!text.empty()) {
        message["content"] = text;
    }

    json tool_calls = json::array();
    for (const auto& block : blocks) {
        if (block.type != "tool_use" || is_blank(block.id) || is_blank(block.name)) {
            continue;
        }
        std::string arguments = block.input.is_null() ? "{}" : block.input.dump();
        tool_calls.push_back({{"id", block.id},
                              {"type", "function"},
                              {"function", {{"name", block.name}, {"arguments", arguments}}}});
    }
    if (!tool_calls.empty()) {
        message["tool_calls"] = std::move(tool_calls);
    }

    out.push_back(std::move(message));
}

void convert_message(const NativeMessage& message, json& out) {
    if (is_blank(message.role)) {
        return;
    }

    if (message.text) {
        out.push_back({{"role", message.role}, {"content", *message.text}});
        return;
    }

    if (message.role == "user") {
        convert_user_blocks(message.blocks, out);
    } else if (message.role == "assistant") {
        convert_assistant_blocks(message.blocks, out);
    } else {
        out.push_back({{"role", message.role}, {"content", join_text_blocks(message.blocks)}});
    }
}

json convert_tool_choice(const json& choice) {
    if (!choice.is_object()) {
        return choice;
    }
    std::string type = string_field(choice, "type");
    if (type == "auto" || type == "none" || type == "required") {
        return type;
    }
    if (type == "any") {
        return "required";
    }
    if (type == "tool") {
        std::string name = string_field(choice, "name");
        if (name.empty()) {
            return "auto";
        }
        return {{"type", "function"}, {"function", {{"name", name}}}};
    }
    return choice;
}

json usage_json(const ForeignUsage& usage) {
    return {{"input_tokens", usage.prompt_tokens - usage.cached_tokens},
            {"output_tokens", usage.completion_tokens},
            {"cache_read_input_tokens", usage.cached_tokens}};
}

// Tool arguments arrive as JSON text; objects are accepted as-is
json parse_tool_arguments(const json& arguments) {
    if (arguments.is_string()) {
        json parsed = json::parse(arguments.get<std::string>(), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return json::object();
        }
        return parsed;
    }
    if (arguments.is_object()) {
        return arguments;
    }
    if (arguments.is_null()) {
        return json::object();
    }
    return {{"value", arguments.dump()}};
}

}  // namespace

// ============================================================================
// JSON decoding
// ============================================================================

void from_json(const json& j, NativeImageSource& source) {
    source.type = string_field(j, "type");
    source.media_type = string_field(j, "media_type");
    source.data = string_field(j, "data");
    source.url = string_field(j, "url");
}

void from_json(const json& j, NativeContentBlock& block) {
    block.type = string_field(j, "type");
    block.text = string_field(j, "text");
    block.id = string_field(j, "id");
    block.name = string_field(j, "name");
    block.tool_use_id = string_field(j, "tool_use_id");
    if (j.contains("input")) {
        block.input = j["input"];
    }
    if (j.contains("content")) {
        block.content = j["content"];
    }
    if (j.contains("source") && j["source"].is_object()) {
        block.source = j["source"].get<NativeImageSource>();
    }
}

void from_json(const json& j, NativeMessage& message) {
    message.role = string_field(j, "role");
    auto it = j.find("content");
    if (it == j.end()) {
        return;
    }
    if (it->is_string()) {
        message.text = it->get<std::string>();
    } else if (it->is_array()) {
        for (const auto& block : *it) {
            if (block.is_object()) {
                message.blocks.push_back(block.get<NativeContentBlock>());
            }
        }
    }
}

void from_json(const json& j, NativeTool& tool) {
    tool.name = string_field(j, "name");
    tool.description = string_field(j, "description");
    if (j.contains("input_schema")) {
        tool.input_schema = j["input_schema"];
    }
}

void from_json(const json& j, NativeRequest& request) {
    request.model = string_field(j, "model");

    if (auto it = j.find("messages"); it != j.end() && it->is_array()) {
        for (const auto& message : *it) {
            if (message.is_object()) {
                request.messages.push_back(message.get<NativeMessage>());
            }
        }
    }

    if (auto it = j.find("system"); it != j.end()) {
        if (it->is_string()) {
            request.system = it->get<std::string>();
        } else if (it->is_array()) {
            std::vector<NativeContentBlock> blocks;
            for (const auto& block : *it) {
                if (block.is_object()) {
                    blocks.push_back(block.get<NativeContentBlock>());
                }
            }
            request.system = join_text_blocks(blocks);
        }
    }

    if (auto it = j.find("max_tokens"); it != j.end() && it->is_number()) {
        request.max_tokens = it->get<int64_t>();
    }
    if (auto it = j.find("temperature"); it != j.end() && it->is_number()) {
        request.temperature = it->get<double>();
    }
    if (auto it = j.find("top_p"); it != j.end() && it->is_number()) {
        request.top_p = it->get<double>();
    }
    if (auto it = j.find("stream"); it != j.end() && it->is_boolean()) {
        request.stream = it->get<bool>();
    }
    if (auto it = j.find("stop_sequences"); it != j.end() && it->is_array()) {
        for (const auto& stop : *it) {
            if (stop.is_string()) {
                request.stop_sequences.push_back(stop.get<std::string>());
            }
        }
    }
    if (auto it = j.find("tools"); it != j.end() && it->is_array()) {
        for (const auto& tool : *it) {
            if (tool.is_object()) {
                request.tools.push_back(tool.get<NativeTool>());
            }
        }
    }
    if (j.contains("tool_choice")) {
        request.tool_choice = j["tool_choice"];
    }
}

void from_json(const json& j, ForeignUsage& usage) {
    usage.prompt_tokens = integer_field(j, "prompt_tokens");
    usage.completion_tokens = integer_field(j, "completion_tokens");
    if (auto it = j.find("prompt_tokens_details"); it != j.end() && it->is_object()) {
        usage.cached_tokens = integer_field(*it, "cached_tokens");
    }
}

void from_json(const json& j, ForeignResponse& response) {
    response.id = string_field(j, "id");
    response.model = string_field(j, "model");

    if (auto it = j.find("choices"); it != j.end() && it->is_array()) {
        for (const auto& c : *it) {
            if (!c.is_object()) {
                continue;
            }
            ForeignChoice choice;
            choice.finish_reason = string_field(c, "finish_reason");
            if (auto msg = c.find("message"); msg != c.end() && msg->is_object()) {
                if (auto content = msg->find("content"); content != msg->end() && content->is_string()) {
                    choice.content = content->get<std::string>();
                }
                if (auto calls = msg->find("tool_calls"); calls != msg->end() && calls->is_array()) {
                    for (const auto& call : *calls) {
                        if (!call.is_object()) {
                            continue;
                        }
                        ForeignToolCall tool_call;
                        tool_call.id = string_field(call, "id");
                        if (auto fn = call.find("function"); fn != call.end() && fn->is_object()) {
                            tool_call.name = string_field(*fn, "name");
                            if (fn->contains("arguments")) {
                                tool_call.arguments = (*fn)["arguments"];
                            }
                        }
                        choice.tool_calls.push_back(std::move(tool_call));
                    }
                }
            }
            response.choices.push_back(std::move(choice));
        }
    }

    if (auto it = j.find("usage"); it != j.end() && it->is_object()) {
        response.usage = it->get<ForeignUsage>();
    }
}

void from_json(const json& j, ForeignStreamChunk& chunk) {
    if (auto it = j.find("usage"); it != j.end() && it->is_object()) {
        chunk.usage = it->get<ForeignUsage>();
    }

    auto choices = j.find("choices");
    if (choices == j.end() || !choices->is_array() || choices->empty() ||
        !choices->front().is_object()) {
        return;
    }
    const json& choice = choices->front();
    chunk.has_choice = true;

    if (auto reason = choice.find("finish_reason"); reason != choice.end() && reason->is_string()) {
        chunk.finish_reason = reason->get<std::string>();
    }

    auto delta = choice.find("delta");
    if (delta == choice.end() || !delta->is_object()) {
        return;
    }
    if (auto content = delta->find("content"); content != delta->end() && content->is_string()) {
        chunk.content = content->get<std::string>();
    }
    if (auto calls = delta->find("tool_calls"); calls != delta->end() && calls->is_array()) {
        for (const auto& call : *calls) {
            if (!call.is_object()) {
                continue;
            }
            ForeignToolCallDelta fragment;
            fragment.index = integer_field(call, "index");
            fragment.id = string_field(call, "id");
            if (auto fn = call.find("function"); fn != call.end() && fn->is_object()) {
                fragment.name = string_field(*fn, "name");
                fragment.arguments = string_field(*fn, "arguments");
            }
            chunk.tool_calls.push_back(std::move(fragment));
        }
    }
}

// ============================================================================
// Whole-body conversion
// ============================================================================

std::string map_model(std::string_view model) {
    struct ModelMapping {
        std::string_view native;
        std::string_view foreign;
    };
    static constexpr std::array<ModelMapping, 6> MODEL_TABLE = {{
        {"claude-3-5-sonnet-20241022", "gpt-4o"},
        {"claude-sonnet-4-5", "gpt-4o"},
        {"claude-sonnet-4-5-thinking", "gpt-4o"},
        {"claude-3-opus-20240229", "gpt-4-turbo"},
        {"claude-3-sonnet-20240229", "gpt-4"},
        {"claude-3-haiku-20240307", "gpt-3.5-turbo"},
    }};

    for (const auto& mapping : MODEL_TABLE) {
        if (mapping.native == model) {
            return std::string{mapping.foreign};
        }
    }
    if (model.starts_with("claude")) {
        return "gpt-4o";
    }
    return std::string{model};
}

ConversionResult convert_request(std::string_view body) {
    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            return ConversionResult::failure("request body is not a JSON object");
        }
        auto request = j.get<NativeRequest>();

        json out = json::object();
        if (!request.model.empty()) {
            out["model"] = map_model(request.model);
        }

        json messages = json::array();
        if (!request.system.empty()) {
            messages.push_back({{"role", "system"}, {"content", request.system}});
        }
        for (const auto& message : request.messages) {
            convert_message(message, messages);
        }
        out["messages"] = std::move(messages);

        if (request.max_tokens) {
            out["max_tokens"] = *request.max_tokens;
        }
        if (request.temperature) {
            out["temperature"] = *request.temperature;
        }
        if (request.top_p) {
            out["top_p"] = *request.top_p;
        }
        if (request.stream) {
            out["stream"] = *request.stream;
        }
        if (!request.stop_sequences.empty()) {
            out["stop"] = request.stop_sequences;
        }

        if (!request.tools.empty()) {
            json tools = json::array();
            for (const auto& tool : request.tools) {
                json function = {{"name", tool.name}, {"description", tool.description}};
                if (!tool.input_schema.is_null()) {
                    function["parameters"] = tool.input_schema;
                }
                tools.push_back({{"type", "function"}, {"function", std::move(function)}});
            }
            out["tools"] = std::move(tools);
        }
        if (!request.tool_choice.is_null()) {
            out["tool_choice"] = convert_tool_choice(request.tool_choice);
        }

        return ConversionResult::success(out.dump());
    } catch (const json::exception& e) {
        return ConversionResult::failure(fmt::format("invalid request body: {}", e.what()));
    }
}

ConversionResult convert_response(std::string_view body) {
    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            return ConversionResult::failure("response body is not a JSON object");
        }
        if (string_field(j, "type") == "message") {
            return ConversionResult::success(std::string{body});
        }

        auto response = j.get<ForeignResponse>();

        json content = json::array();
        std::string finish_reason;
        if (!response.choices.empty()) {
            const auto& choice = response.choices.front();
            finish_reason = choice.finish_reason;
            if (choice.content && !choice.content->empty()) {
                content.push_back({{"type", "text"}, {"text", *choice.content}});
            }
            for (const auto& call : choice.tool_calls) {
                content.push_back({{"type", "tool_use"},
                                   {"id", call.id},
                                   {"name", call.name},
                                   {"input", parse_tool_arguments(call.arguments)}});
            }
        }

        json out = {{"id", response.id},
                    {"type", "message"},
                    {"role", "assistant"},
                    {"model", response.model},
                    {"content", std::move(content)},
                    {"stop_reason", map_finish_reason(finish_reason)},
                    {"stop_sequence", nullptr},
                    {"usage", usage_json(response.usage.value_or(ForeignUsage{}))}};
        return ConversionResult::success(out.dump());
    } catch (const json::exception& e) {
        return ConversionResult::failure(fmt::format("invalid response body: {}", e.what()));
    }
}

RequestProbe probe_request(std::string_view body) {
    RequestProbe probe;
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return probe;
    }
    probe.is_object = true;
    if (auto it = j.find("stream"); it != j.end() && it->is_boolean()) {
        probe.stream = it->get<bool>();
    }
    probe.model = string_field(j, "model");
    return probe;
}

std::optional<std::string> override_model(std::string_view body, std::string_view model) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    j["model"] = model;
    return j.dump();
}

bool is_native_event_type(std::string_view type) noexcept {
    static constexpr std::array<std::string_view, 8> NATIVE_EVENTS = {
        "message_start",       "message_delta",       "message_stop",
        "content_block_start", "content_block_delta", "content_block_stop",
        "ping",                "error",
    };
    for (auto event : NATIVE_EVENTS) {
        if (event == type) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> native_text_delta(std::string_view payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object() || string_field(j, "type") != "content_block_delta") {
        return std::nullopt;
    }
    auto delta = j.find("delta");
    if (delta == j.end() || !delta->is_object() || string_field(*delta, "type") != "text_delta") {
        return std::nullopt;
    }
    return string_field(*delta, "text");
}

// ============================================================================
// StreamConverter
// ============================================================================

StreamConverter::StreamConverter(std::string model) : model_(std::move(model)) {}

std::string StreamConverter::start_message() {
    if (started_) {
        return {};
    }
    started_ = true;

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    json message = {{"id", fmt::format("msg_{}", now_ms)},
                    {"type", "message"},
                    {"role", "assistant"},
                    {"model", model_},
                    {"content", json::array()},
                    {"stop_reason", nullptr},
                    {"stop_sequence", nullptr},
                    {"usage", {{"input_tokens", 0}, {"output_tokens", 0}}}};
    return http::encode_event("message_start",
                              {{"type", "message_start"}, {"message", std::move(message)}});
}

std::string StreamConverter::close_block() {
    if (current_index_ < 0) {
        return {};
    }
    std::string out = http::encode_event(
        "content_block_stop", {{"type", "content_block_stop"}, {"index", current_index_}});
    current_index_ = -1;
    current_type_.clear();
    current_tool_call_ = -1;
    return out;
}

std::string StreamConverter::open_block(const json& content_block) {
    std::string out = close_block();
    current_index_ = next_index_++;
    current_type_ = content_block.value("type", "");
    out += http::encode_event("content_block_start", {{"type", "content_block_start"},
                                                      {"index", current_index_},
                                                      {"content_block", content_block}});
    return out;
}

std::string StreamConverter::message_delta(std::string_view stop_reason,
                                           const ForeignUsage& usage) {
    stop_sent_ = true;
    return http::encode_event(
        "message_delta",
        {{"type", "message_delta"},
         {"delta", {{"stop_reason", stop_reason}, {"stop_sequence", nullptr}}},
         {"usage", usage_json(usage)}});
}

std::string StreamConverter::convert_chunk(const ForeignStreamChunk& chunk) {
    std::string out;
    if (!chunk.has_choice) {
        return out;
    }
    ++stats_.chunks;

    if (chunk.content && !chunk.content->empty()) {
        if (current_type_ != "text") {
            out += open_block({{"type", "text"}, {"text", ""}});
        }
        stats_.text_chars += utf8_length(*chunk.content);
        text_ += *chunk.content;
        out += http::encode_event(
            "content_block_delta",
            {{"type", "content_block_delta"},
             {"index", current_index_},
             {"delta", {{"type", "text_delta"}, {"text", *chunk.content}}}});
    }

    for (const auto& call : chunk.tool_calls) {
        if (!call.id.empty()) {
            out += open_block(
                {{"type", "tool_use"}, {"id", call.id}, {"name", call.name}, {"input", json::object()}});
            current_tool_call_ = call.index;
        }
        if (call.arguments.empty()) {
            continue;
        }
        if (current_type_ != "tool_use" || call.index != current_tool_call_) {
            LOG_DEBUG(logging::get_logger(), "dropping arguments for inactive tool call {}",
                      call.index);
            continue;
        }
        out += http::encode_event(
            "content_block_delta",
            {{"type", "content_block_delta"},
             {"index", current_index_},
             {"delta", {{"type", "input_json_delta"}, {"partial_json", call.arguments}}}});
    }

    if (chunk.finish_reason && !chunk.finish_reason->empty() && !stop_sent_) {
        stats_.finish_reason = *chunk.finish_reason;
        out += close_block();
        out += message_delta(map_finish_reason(*chunk.finish_reason),
                             chunk.usage.value_or(ForeignUsage{}));
    }
    return out;
}

std::string StreamConverter::on_line(std::string_view line) {
    if (finished_ || stats_.saw_done) {
        return {};
    }

    if (mode_ == Mode::NATIVE) {
        if (auto data = http::data_field(line)) {
            if (auto text = native_text_delta(*data)) {
                text_ += *text;
                stats_.text_chars += utf8_length(*text);
            }
        }
        return fmt::format("{}\n", line);
    }

    auto data = http::data_field(line);
    if (!data) {
        // Event names, comments and blank lines are held until the dialect is known
        if (mode_ == Mode::UNDECIDED) {
            pending_.emplace_back(line);
        }
        return {};
    }

    if (*data == http::DONE_SENTINEL) {
        stats_.saw_done = true;
        return {};
    }

    json payload = json::parse(*data, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        LOG_DEBUG(logging::get_logger(), "skipping unparsable stream line: {}", *data);
        return {};
    }

    std::string type = string_field(payload, "type");
    bool native = is_native_event_type(type);

    if (mode_ == Mode::UNDECIDED) {
        if (native) {
            mode_ = Mode::NATIVE;
            std::string out;
            for (const auto& held : pending_) {
                out += held;
                out += '\n';
            }
            pending_.clear();
            return out + on_line(line);
        }
        mode_ = Mode::CONVERT;
        pending_.clear();
    }

    std::string out = start_message();
    if (native) {
        // Stray native event inside a converted stream
        return out + fmt::format("data: {}\n\n", *data);
    }

    try {
        out += convert_chunk(payload.get<ForeignStreamChunk>());
    } catch (const json::exception& e) {
        LOG_DEBUG(logging::get_logger(), "skipping malformed stream chunk: {}", e.what());
    }
    return out;
}

std::string StreamConverter::finish() {
    if (finished_) {
        return {};
    }
    finished_ = true;

    if (mode_ == Mode::NATIVE) {
        return {};
    }

    std::string out = start_message();
    out += close_block();
    if (!stop_sent_) {
        out += message_delta("end_turn", ForeignUsage{});
    }
    out += http::encode_event("message_stop", {{"type", "message_stop"}});
    return out;
}

}  // namespace switchback::gateway
