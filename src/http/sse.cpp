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

// Switchback Server-Sent Events - Implementation

#include "sse.hpp"

namespace switchback::http {

void LineSplitter::feed(std::string_view chunk) {
    // Compact consumed prefix before growing
    if (pos_ > 0 && pos_ >= buffer_.size() / 2) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    buffer_.append(chunk);
}

bool LineSplitter::next_line(std::string& line, std::string* raw) {
    size_t newline = buffer_.find('\n', pos_);
    if (newline == std::string::npos) {
        return false;
    }

    size_t end = newline;
    if (end > pos_ && buffer_[end - 1] == '\r') {
        --end;
    }
    line.assign(buffer_, pos_, end - pos_);
    if (raw) {
        raw->assign(buffer_, pos_, newline + 1 - pos_);
    }
    pos_ = newline + 1;
    return true;
}

bool LineSplitter::take_remainder(std::string& line) {
    if (pos_ >= buffer_.size()) {
        return false;
    }
    line.assign(buffer_, pos_, std::string::npos);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    buffer_.clear();
    pos_ = 0;
    return true;
}

std::optional<std::string_view> data_field(std::string_view line) noexcept {
    constexpr std::string_view prefix = "data:";
    if (line.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    line.remove_prefix(prefix.size());
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        line.remove_prefix(1);
    }
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }
    return line;
}

std::string encode_event(std::string_view event, const nlohmann::json& payload) {
    std::string out;
    std::string data = payload.dump();
    out.reserve(event.size() + data.size() + 16);
    out += "event: ";
    out += event;
    out += "\ndata: ";
    out += data;
    out += "\n\n";
    return out;
}

}  // namespace switchback::http
