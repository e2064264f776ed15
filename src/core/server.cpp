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

// Switchback Server - Implementation

#include "server.hpp"

#include <httplib.h>

#include <exception>

#include "logging.hpp"

namespace switchback::core {

namespace {

/// httplib DataSink as a relay sink. Chunks go straight to the socket, so a
/// flush only has to confirm the connection is still writable.
class DataSinkAdapter final : public gateway::StreamSink {
public:
    explicit DataSinkAdapter(httplib::DataSink& sink) : sink_(sink) {}

    [[nodiscard]] bool write(std::string_view data) override {
        return sink_.write(data.data(), data.size());
    }

    [[nodiscard]] bool flush() override { return sink_.is_writable(); }

private:
    httplib::DataSink& sink_;
};

}  // namespace

http::Request to_proxy_request(const httplib::Request& req) {
    http::Request request;
    request.method = req.method;

    std::string_view target = req.target.empty() ? std::string_view{req.path} : req.target;
    size_t query_pos = target.find('?');
    if (query_pos == std::string_view::npos) {
        request.path = std::string{target};
    } else {
        request.path = std::string{target.substr(0, query_pos)};
        request.query = std::string{target.substr(query_pos + 1)};
    }

    request.headers.reserve(req.headers.size());
    for (const auto& [name, value] : req.headers) {
        request.headers.emplace_back(name, value);
    }
    request.body = req.body;
    return request;
}

Server::Server(const control::Config& config, control::ManagementApi& management,
               gateway::Forwarder& forwarder)
    : listen_address_(config.listen_address),
      listen_port_(config.port),
      management_(management),
      forwarder_(forwarder),
      server_(std::make_unique<httplib::Server>()) {
    server_->new_task_queue = [] { return new httplib::ThreadPool(WORKER_THREADS); };

    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    };
    // Every method and path reaches the same handler
    server_->Get(".*", handler);
    server_->Post(".*", handler);
    server_->Put(".*", handler);
    server_->Patch(".*", handler);
    server_->Delete(".*", handler);
    server_->Options(".*", handler);

    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            LOG_ERROR(logging::get_logger(), "unhandled error serving {} {}: {}", req.method,
                      req.path, what);
            res.status = static_cast<int>(http::StatusCode::InternalServerError);
            res.set_content("internal server error", "text/plain");
        });
}

Server::~Server() {
    stop();
}

std::error_code Server::start() {
    if (listen_port_ == 0) {
        bound_port_ = server_->bind_to_any_port(listen_address_);
    } else if (server_->bind_to_port(listen_address_, listen_port_)) {
        bound_port_ = listen_port_;
    }
    if (bound_port_ <= 0) {
        bound_port_ = -1;
        LOG_ERROR(logging::get_logger(), "cannot bind {}:{}", listen_address_, listen_port_);
        return std::make_error_code(std::errc::address_in_use);
    }
    running_.store(true, std::memory_order_relaxed);
    LOG_INFO(logging::get_logger(), "listening on {}:{}", listen_address_, bound_port_);
    return {};
}

void Server::run() {
    if (!running_.load(std::memory_order_relaxed)) {
        return;
    }
    if (!server_->listen_after_bind()) {
        LOG_ERROR(logging::get_logger(), "listener on {}:{} stopped with an error",
                  listen_address_, listen_port_);
    }
    running_.store(false, std::memory_order_relaxed);
}

void Server::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
    running_.store(false, std::memory_order_relaxed);
}

void Server::handle(const httplib::Request& req, httplib::Response& res) {
    if (auto api = management_.handle(req.method, req.path)) {
        LOG_DEBUG(logging::get_logger(), "management {} {} -> {}", req.method, req.path,
                  api->status);
        res.status = api->status;
        res.set_content(api->serialize(), "application/json");
        return;
    }

    std::string request_id = logging::generate_correlation_id();
    write_response(forwarder_.handle(to_proxy_request(req), request_id), res);
}

void Server::write_response(gateway::ProxyResponse response, httplib::Response& res) {
    res.status = response.status;

    std::string content_type{http::get_header(response.headers, "Content-Type")};
    for (const auto& [name, value] : response.headers) {
        if (response.streaming() && http::header_name_equals(name, "Content-Type")) {
            continue;  // Set by the content provider
        }
        res.headers.emplace(name, value);
    }

    if (!response.streaming()) {
        res.body = std::move(response.body);
        return;
    }

    if (content_type.empty()) {
        content_type = "text/event-stream";
    }
    auto relay = response.stream;
    res.set_chunked_content_provider(
        content_type,
        [relay](size_t /*offset*/, httplib::DataSink& sink) {
            DataSinkAdapter adapter(sink);
            auto result = relay->run(adapter);
            if (result.client_disconnected) {
                return false;
            }
            sink.done();
            return true;
        },
        [relay](bool success) {
            if (!success) {
                relay->cancel();
            }
        });
}

}  // namespace switchback::core
