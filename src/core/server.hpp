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

// Switchback Server - Header
// Inbound HTTP listener: management routes first, everything else proxied

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <system_error>

#include "../control/config.hpp"
#include "../control/management_api.hpp"
#include "../gateway/forwarder.hpp"
#include "../http/http.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace switchback::core {

/// Convert an inbound httplib request into the proxy's owned request type.
/// The path keeps its original (undecoded) form from the request target.
[[nodiscard]] http::Request to_proxy_request(const httplib::Request& req);

/// Blocking HTTP server on top of httplib's thread pool (one handler per
/// connection). Streamed responses are pumped by the handler thread through
/// the forwarder's StreamRelay.
class Server {
public:
    /// Worker threads serving client connections (long streams hold one each)
    static constexpr size_t WORKER_THREADS = 64;

    Server(const control::Config& config, control::ManagementApi& management,
           gateway::Forwarder& forwarder);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Bind the listening socket (config listen_address:port)
    [[nodiscard]] std::error_code start();

    /// Accept connections until stop() is called (blocking)
    void run();

    /// Stop accepting and unblock run() (safe from any thread)
    void stop();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    /// Bound port (useful when the configured port is 0)
    [[nodiscard]] int port() const noexcept { return bound_port_; }

private:
    void handle(const httplib::Request& req, httplib::Response& res);
    void write_response(gateway::ProxyResponse response, httplib::Response& res);

    std::string listen_address_;
    uint16_t listen_port_;
    control::ManagementApi& management_;
    gateway::Forwarder& forwarder_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    int bound_port_ = -1;
};

}  // namespace switchback::core
