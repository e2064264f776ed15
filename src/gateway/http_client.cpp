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

// Switchback HTTP Client Transport - Implementation

#include "http_client.hpp"

#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "../core/channel.hpp"
#include "../core/logging.hpp"

namespace switchback::gateway {

namespace {

using Clock = std::chrono::steady_clock;

/// State shared by the caller and the worker thread of one exchange
struct Exchange {
    explicit Exchange(size_t body_chunks) : body(body_chunks) {}

    std::mutex mutex;
    std::condition_variable cv;
    bool headers_ready = false;
    bool finished = false;
    int status = 0;
    http::Headers headers;
    std::error_code error;

    core::Channel<std::string> body;
    std::shared_ptr<httplib::Client> client;
    std::optional<Clock::time_point> deadline;
    std::atomic<bool> timed_out{false};

    [[nodiscard]] bool expired() const noexcept {
        return deadline.has_value() && Clock::now() >= *deadline;
    }

    void abort() noexcept {
        body.cancel();
        client->stop();
    }
};

std::error_code map_error(httplib::Error err, bool timed_out, bool cancelled) {
    if (timed_out) {
        return UpstreamErrc::timeout;
    }
    switch (err) {
        case httplib::Error::Connection:
        case httplib::Error::SSLConnection:
            return UpstreamErrc::connection_failed;
        default:
            return cancelled ? UpstreamErrc::cancelled : UpstreamErrc::read_error;
    }
}

/// Consumer end of an exchange; owns the worker thread
class ExchangeBody final : public UpstreamBody {
public:
    ExchangeBody(std::shared_ptr<Exchange> exchange, std::thread worker)
        : exchange_(std::move(exchange)), worker_(std::move(worker)) {}

    ~ExchangeBody() override {
        cancel();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    ExchangeBody(const ExchangeBody&) = delete;
    ExchangeBody& operator=(const ExchangeBody&) = delete;

    bool read(std::string& chunk, std::error_code& ec) override {
        ec.clear();
        switch (exchange_->body.pop(chunk, exchange_->deadline)) {
            case core::PopStatus::ITEM:
                return true;
            case core::PopStatus::CLOSED:
                ec = exchange_->body.error();
                return false;
            case core::PopStatus::CANCELLED:
                ec = UpstreamErrc::cancelled;
                return false;
            case core::PopStatus::TIMEOUT:
                exchange_->timed_out = true;
                exchange_->abort();
                ec = UpstreamErrc::timeout;
                return false;
        }
        return false;
    }

    void cancel() noexcept override {
        if (!finished_) {
            finished_ = true;
            exchange_->abort();
        }
    }

private:
    std::shared_ptr<Exchange> exchange_;
    std::thread worker_;
    bool finished_ = false;
};

void run_exchange(const std::shared_ptr<Exchange>& ex, httplib::Request req) {
    req.response_handler = [ex](const httplib::Response& upstream) {
        {
            std::lock_guard<std::mutex> lock(ex->mutex);
            ex->status = upstream.status;
            for (const auto& [name, value] : upstream.headers) {
                ex->headers.emplace_back(name, value);
            }
            ex->headers_ready = true;
        }
        ex->cv.notify_all();
        return !ex->body.cancelled();
    };
    req.content_receiver = [ex](const char* data, size_t len, uint64_t, uint64_t) {
        if (ex->expired()) {
            ex->timed_out = true;
            return false;
        }
        return ex->body.push(std::string(data, len));
    };
    req.progress = [ex](uint64_t, uint64_t) {
        if (ex->expired()) {
            ex->timed_out = true;
            return false;
        }
        return true;
    };

    httplib::Response res;
    httplib::Error err = httplib::Error::Success;
    bool ok = ex->client->send(req, res, err);

    std::error_code ec;
    if (!ok) {
        ec = map_error(err, ex->timed_out.load() || ex->expired(), ex->body.cancelled());
        LOG_DEBUG(logging::get_logger(), "upstream exchange ended: {} ({})", ec.message(),
                  httplib::to_string(err));
    }

    {
        std::lock_guard<std::mutex> lock(ex->mutex);
        ex->finished = true;
        ex->error = ec;
    }
    ex->body.close(ec);
    ex->cv.notify_all();
}

}  // namespace

HttpClientTransport::HttpClientTransport() : HttpClientTransport(Options{}) {}

HttpClientTransport::HttpClientTransport(Options options) : options_(options) {}

std::error_code HttpClientTransport::send(const UpstreamRequest& request,
                                          UpstreamResponse& response) {
    if (request.origin.empty()) {
        return UpstreamErrc::invalid_url;
    }

    auto ex = std::make_shared<Exchange>(options_.body_queue_chunks);
    ex->client = std::make_shared<httplib::Client>(request.origin);
    if (!ex->client->is_valid()) {
        return UpstreamErrc::invalid_url;
    }

    // Bodies reach the codec undecoded; redirects are returned to the client
    ex->client->set_decompress(false);
    ex->client->set_follow_location(false);
    ex->client->set_keep_alive(false);

    if (request.timeout) {
        ex->deadline = Clock::now() + *request.timeout;
        ex->client->set_connection_timeout(*request.timeout);
        ex->client->set_read_timeout(*request.timeout);
        ex->client->set_write_timeout(*request.timeout);
    } else {
        ex->client->set_connection_timeout(options_.connect_timeout);
        ex->client->set_read_timeout(options_.stream_read_timeout);
        ex->client->set_write_timeout(options_.stream_write_timeout);
    }

    httplib::Request req;
    req.method = request.method;
    req.path = request.target;
    for (const auto& [name, value] : request.headers) {
        req.headers.emplace(name, value);
    }
    req.body = request.body;

    std::thread worker([ex, req = std::move(req)]() mutable { run_exchange(ex, std::move(req)); });

    std::unique_lock<std::mutex> lock(ex->mutex);
    auto ready = [&ex] { return ex->headers_ready || ex->finished; };
    if (ex->deadline) {
        if (!ex->cv.wait_until(lock, *ex->deadline, ready)) {
            lock.unlock();
            ex->timed_out = true;
            ex->abort();
            worker.join();
            return UpstreamErrc::timeout;
        }
    } else {
        ex->cv.wait(lock, ready);
    }

    if (!ex->headers_ready) {
        std::error_code ec = ex->error ? ex->error : make_error_code(UpstreamErrc::read_error);
        lock.unlock();
        worker.join();
        return ec;
    }

    response.status = ex->status;
    response.headers = ex->headers;
    lock.unlock();

    response.body = std::make_unique<ExchangeBody>(std::move(ex), std::move(worker));
    return {};
}

}  // namespace switchback::gateway
