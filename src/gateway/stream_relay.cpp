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

// Switchback Streaming Relay - Implementation

#include "stream_relay.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../http/sse.hpp"

namespace switchback::gateway {

StreamRelay::StreamRelay(std::unique_ptr<UpstreamBody> body, RelayMode mode, std::string model,
                         std::string backend, std::string request_id)
    : body_(std::move(body)),
      mode_(mode),
      backend_(std::move(backend)),
      request_id_(std::move(request_id)),
      converter_(std::move(model)) {}

StreamRelay::~StreamRelay() {
    if (!finished_.load(std::memory_order_acquire)) {
        cancel();
    }
}

void StreamRelay::cancel() noexcept {
    if (body_) {
        body_->cancel();
    }
}

bool StreamRelay::emit(StreamSink& sink, std::string_view data) {
    if (data.empty()) {
        return true;
    }
    return sink.write(data);
}

bool StreamRelay::handle_line(StreamSink& sink, std::string_view line, std::string_view raw) {
    if (mode_ == RelayMode::CONVERT) {
        return emit(sink, converter_.on_line(line));
    }

    if (auto data = http::data_field(line)) {
        if (*data == http::DONE_SENTINEL) {
            passthrough_stats_.saw_done = true;
        } else {
            ++passthrough_stats_.chunks;
            if (auto text = native_text_delta(*data)) {
                passthrough_text_ += *text;
                for (unsigned char c : *text) {
                    if ((c & 0xC0) != 0x80) {
                        ++passthrough_stats_.text_chars;
                    }
                }
            }
        }
    }
    return emit(sink, raw);
}

RelayResult StreamRelay::run(StreamSink& sink) {
    RelayResult result;
    http::LineSplitter splitter;
    std::string chunk;
    std::string line;
    std::string raw;

    auto client_gone = [&]() {
        result.client_disconnected = true;
        cancel();
        LOG_INFO(logging::get_logger(), "[{}] client disconnected, stopping stream from {}",
                 request_id_, backend_);
    };

    bool stopped = false;
    while (!stopped) {
        std::error_code ec;
        if (!body_->read(chunk, ec)) {
            result.upstream_error = ec;
            break;
        }

        splitter.feed(chunk);
        while (splitter.next_line(line, &raw)) {
            if (!handle_line(sink, line, raw)) {
                client_gone();
                finished_.store(true, std::memory_order_release);
                return result;
            }
            if (mode_ == RelayMode::CONVERT && converter_.done()) {
                // Nothing after [DONE] is relayed
                stopped = true;
                cancel();
                break;
            }
        }

        if (!sink.flush()) {
            client_gone();
            finished_.store(true, std::memory_order_release);
            return result;
        }
    }

    if (!stopped && splitter.take_remainder(line)) {
        if (!handle_line(sink, line, line)) {
            client_gone();
            finished_.store(true, std::memory_order_release);
            return result;
        }
    }

    if (result.upstream_error) {
        LOG_WARNING(logging::get_logger(), "[{}] stream from {} broke off: {}", request_id_,
                    backend_, result.upstream_error.message());
    }

    // Closing events keep a converted stream well-formed even after an upstream error
    if (mode_ == RelayMode::CONVERT) {
        if (!emit(sink, converter_.finish()) || !sink.flush()) {
            client_gone();
            finished_.store(true, std::memory_order_release);
            return result;
        }
    }

    finished_.store(true, std::memory_order_release);
    result.stats = mode_ == RelayMode::CONVERT ? converter_.stats() : passthrough_stats_;
    log_summary(result);
    return result;
}

void StreamRelay::log_summary(const RelayResult& result) const {
    auto* logger = logging::get_logger();
    const auto& stats = result.stats;
    const std::string& text = mode_ == RelayMode::CONVERT ? converter_.text() : passthrough_text_;

    LOG_INFO(logger, "[{}] stream from {} complete: chunks={} text_chars={} finish_reason={} saw_done={}",
             request_id_, backend_, stats.chunks, stats.text_chars,
             stats.finish_reason.empty() ? "none" : stats.finish_reason, stats.saw_done);
    LOG_DEBUG(logger, "[{}] stream text: {}", request_id_, core::truncate_for_log(text));
}

}  // namespace switchback::gateway
