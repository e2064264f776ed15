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

// Switchback HTTP Client Transport - Header
// cpp-httplib backed implementation of UpstreamTransport

#pragma once

#include <chrono>
#include <cstddef>

#include "upstream.hpp"

namespace switchback::gateway {

/// Outbound transport using one httplib::Client per attempt.
///
/// The exchange runs on a worker thread that feeds response chunks into a
/// core::Channel; the returned UpstreamBody is the single consumer. Bodies
/// are passed through undecoded so the compression codec sees raw bytes.
class HttpClientTransport final : public UpstreamTransport {
public:
    struct Options {
        std::chrono::seconds connect_timeout{10};
        /// Socket read timeout for requests without a deadline (streaming)
        std::chrono::seconds stream_read_timeout{std::chrono::hours{24}};
        std::chrono::seconds stream_write_timeout{300};
        /// Chunks read ahead of the consumer before the socket read pauses
        size_t body_queue_chunks = 16;
    };

    HttpClientTransport();
    explicit HttpClientTransport(Options options);

    [[nodiscard]] std::error_code send(const UpstreamRequest& request,
                                       UpstreamResponse& response) override;

private:
    Options options_;
};

}  // namespace switchback::gateway
