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

// Switchback Streaming Relay - Header
// Incremental event-stream forwarding with optional conversion

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "protocol_converter.hpp"
#include "upstream.hpp"

namespace switchback::gateway {

/// Client-facing output of a relay. Both operations are required: the relay
/// flushes after every upstream read. A false return means the client is gone.
class StreamSink {
public:
    virtual ~StreamSink() = default;

    [[nodiscard]] virtual bool write(std::string_view data) = 0;
    [[nodiscard]] virtual bool flush() = 0;
};

enum class RelayMode : uint8_t {
    PASSTHROUGH,  // Relay lines verbatim
    CONVERT       // Chat-completions stream to native events
};

/// How a relay ended
struct RelayResult {
    bool client_disconnected = false;
    std::error_code upstream_error;  // Set when the upstream body broke off
    StreamStats stats;
};

/// Forwards one upstream event stream to one client.
///
/// The relay is the single consumer of the upstream body. Nothing is
/// buffered beyond the current partial line; the assembled text is kept for
/// the end-of-stream log line only.
class StreamRelay {
public:
    StreamRelay(std::unique_ptr<UpstreamBody> body, RelayMode mode, std::string model,
                std::string backend, std::string request_id);
    ~StreamRelay();

    // Non-copyable, non-movable
    StreamRelay(const StreamRelay&) = delete;
    StreamRelay& operator=(const StreamRelay&) = delete;
    StreamRelay(StreamRelay&&) = delete;
    StreamRelay& operator=(StreamRelay&&) = delete;

    /// Pump the stream into `sink` until the upstream ends, the [DONE]
    /// sentinel arrives or the client disconnects. Call once.
    RelayResult run(StreamSink& sink);

    /// Stop the upstream read (safe from any thread)
    void cancel() noexcept;

    [[nodiscard]] RelayMode mode() const noexcept { return mode_; }

private:
    [[nodiscard]] bool emit(StreamSink& sink, std::string_view data);
    [[nodiscard]] bool handle_line(StreamSink& sink, std::string_view line, std::string_view raw);
    void log_summary(const RelayResult& result) const;

    std::unique_ptr<UpstreamBody> body_;
    RelayMode mode_;
    std::string backend_;
    std::string request_id_;
    StreamConverter converter_;

    // Passthrough bookkeeping
    StreamStats passthrough_stats_;
    std::string passthrough_text_;

    std::atomic<bool> finished_{false};
};

}  // namespace switchback::gateway
