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

// Switchback Server-Sent Events - Header
// Incremental line framing and event encoding

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace switchback::http {

/// Splits an event stream into lines as bytes arrive.
/// Lines end with "\n" or "\r\n"; a line split across reads is held until
/// its terminator arrives.
class LineSplitter {
public:
    /// Append bytes read from the stream
    void feed(std::string_view chunk);

    /// Pop the next complete line. `line` excludes the terminator;
    /// `raw`, when given, receives the line exactly as it arrived.
    [[nodiscard]] bool next_line(std::string& line, std::string* raw = nullptr);

    /// Take an unterminated final line once the stream has ended
    [[nodiscard]] bool take_remainder(std::string& line);

    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - pos_; }

private:
    std::string buffer_;
    size_t pos_ = 0;
};

/// Payload of a "data:" line with surrounding blanks trimmed, nullopt otherwise
[[nodiscard]] std::optional<std::string_view> data_field(std::string_view line) noexcept;

/// Comment lines start with ':'
[[nodiscard]] constexpr bool is_comment(std::string_view line) noexcept {
    return !line.empty() && line.front() == ':';
}

/// Encode "event: <name>\ndata: <json>\n\n"
[[nodiscard]] std::string encode_event(std::string_view event, const nlohmann::json& payload);

/// Sentinel that ends a chat-completions stream
inline constexpr std::string_view DONE_SENTINEL = "[DONE]";

}  // namespace switchback::http
