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

// Switchback Upstream - Implementation

#include "upstream.hpp"

#include "../core/string_utils.hpp"

namespace switchback::gateway {

std::optional<Platform> platform_from_string(std::string_view tag) noexcept {
    if (tag.empty() || core::iequals(tag, "anthropic")) {
        return Platform::ANTHROPIC;
    }
    if (core::iequals(tag, "openai")) {
        return Platform::OPENAI;
    }
    return std::nullopt;
}

std::string UpstreamErrorCategory::message(int ev) const {
    switch (static_cast<UpstreamErrc>(ev)) {
        case UpstreamErrc::invalid_url:
            return "invalid backend URL";
        case UpstreamErrc::connection_failed:
            return "connection failed";
        case UpstreamErrc::timeout:
            return "request timed out";
        case UpstreamErrc::read_error:
            return "error reading upstream response";
        case UpstreamErrc::cancelled:
            return "request cancelled";
        case UpstreamErrc::request_conversion_failed:
            return "request conversion failed";
    }
    return "unknown upstream error";
}

const UpstreamErrorCategory& upstream_category() noexcept {
    static UpstreamErrorCategory instance;
    return instance;
}

std::error_code make_error_code(UpstreamErrc errc) noexcept {
    return {static_cast<int>(errc), upstream_category()};
}

bool BufferedBody::read(std::string& chunk, std::error_code& ec) {
    ec.clear();
    if (done_) {
        return false;
    }
    done_ = true;
    if (data_.empty()) {
        return false;
    }
    chunk = std::move(data_);
    return true;
}

std::error_code read_all(UpstreamBody& body, std::string& out) {
    std::string chunk;
    std::error_code ec;
    while (body.read(chunk, ec)) {
        out += chunk;
    }
    return ec;
}

}  // namespace switchback::gateway
