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

// Request Forwarder Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "../../src/gateway/forwarder.hpp"

using namespace switchback::gateway;
using namespace switchback;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

using Handler = std::function<std::error_code(const UpstreamRequest&, UpstreamResponse&)>;

// Scripted upstream keyed by origin; records every request it receives
class FakeTransport : public UpstreamTransport {
public:
    std::error_code send(const UpstreamRequest& request, UpstreamResponse& response) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            auto it = handlers_.find(request.origin);
            if (it == handlers_.end()) {
                return make_error_code(UpstreamErrc::connection_failed);
            }
            handler = it->second;
        }
        return handler(request, response);
    }

    void on(const std::string& origin, Handler handler) { handlers_[origin] = std::move(handler); }

    [[nodiscard]] std::vector<std::string> origins() const {
        std::vector<std::string> out;
        for (const auto& request : requests_) {
            out.push_back(request.origin);
        }
        return out;
    }

    void clear() { requests_.clear(); }

    std::vector<UpstreamRequest> requests_;

private:
    std::map<std::string, Handler> handlers_;
    std::mutex mutex_;
};

Handler respond(int status, std::string body, http::Headers headers = {}) {
    return [=](const UpstreamRequest&, UpstreamResponse& response) {
        response.status = status;
        response.headers = headers;
        response.body = std::make_unique<BufferedBody>(body);
        return std::error_code{};
    };
}

Handler fail_with(UpstreamErrc errc) {
    return [=](const UpstreamRequest&, UpstreamResponse&) { return make_error_code(errc); };
}

Backend make_backend(std::string name, std::string base_url,
                     Platform platform = Platform::ANTHROPIC) {
    Backend backend;
    backend.name = std::move(name);
    backend.base_url = std::move(base_url);
    backend.token = "sk-" + backend.name + "-secret";
    backend.platform = platform;
    return backend;
}

CircuitBreakerConfig breaker_config() {
    CircuitBreakerConfig config;
    config.failure_threshold = 3;
    config.open_timeout = 30000ms;
    config.half_open_requests = 1;
    config.rate_limit_cooldown = 60000ms;
    return config;
}

http::Request messages_request(bool stream = false) {
    http::Request request;
    request.method = "POST";
    request.path = "/v1/messages";
    request.headers = {{"Content-Type", "application/json"},
                       {"Authorization", "Bearer client-key"},
                       {"anthropic-version", "2023-06-01"},
                       {"Accept-Encoding", "gzip"},
                       {"Connection", "keep-alive"},
                       {"Host", "localhost:8080"}};
    json body = {{"model", "claude-sonnet-4-5"},
                 {"max_tokens", 64},
                 {"messages", {{{"role", "user"}, {"content", "Hello"}}}}};
    if (stream) {
        body["stream"] = true;
    }
    request.body = body.dump();
    return request;
}

const std::string NATIVE_OK =
    R"({"id":"msg_1","type":"message","role":"assistant","content":[{"type":"text","text":"ok"}],"stop_reason":"end_turn"})";

class CollectingSink : public StreamSink {
public:
    bool write(std::string_view data) override {
        output += data;
        return true;
    }
    bool flush() override { return true; }

    std::string output;
};

}  // namespace

TEST_CASE("forwardable_headers drops hop-by-hop headers", "[forwarder]") {
    http::Headers headers = {{"Connection", "close"},  {"Host", "x"},
                             {"Content-Length", "10"}, {"Transfer-Encoding", "chunked"},
                             {"x-api-key", "k"},       {"Content-Encoding", "gzip"}};
    auto out = forwardable_headers(headers);
    REQUIRE(out == http::Headers{{"x-api-key", "k"}, {"Content-Encoding", "gzip"}});
}

TEST_CASE("Forwarder relays a native success", "[forwarder]") {
    CircuitBreaker breaker({make_backend("a", "https://a.test/api")}, breaker_config());
    FakeTransport transport;
    transport.on("https://a.test:443",
                 respond(200, NATIVE_OK,
                         {{"Content-Type", "application/json"}, {"Connection", "keep-alive"}}));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    http::Request request = messages_request();
    request.query = "beta=true";
    ProxyResponse response = forwarder.handle(request, "rid-1");

    REQUIRE(response.status == 200);
    REQUIRE_FALSE(response.streaming());
    REQUIRE(response.body == NATIVE_OK);
    REQUIRE(http::get_header(response.headers, "Content-Type") == "application/json");
    REQUIRE_FALSE(http::has_header(response.headers, "Connection"));

    REQUIRE(transport.requests_.size() == 1);
    const UpstreamRequest& sent = transport.requests_.front();
    REQUIRE(sent.method == "POST");
    REQUIRE(sent.target == "/api/v1/messages?beta=true");
    REQUIRE(sent.body == request.body);
    REQUIRE(http::get_header(sent.headers, "Authorization") == "Bearer sk-a-secret");
    REQUIRE(http::get_header(sent.headers, "anthropic-version") == "2023-06-01");
    REQUIRE(http::get_header(sent.headers, "Accept-Encoding") == "gzip");
    REQUIRE_FALSE(http::has_header(sent.headers, "Host"));
    REQUIRE_FALSE(http::has_header(sent.headers, "Connection"));
}

TEST_CASE("Forwarder timeout policy", "[forwarder][timeout]") {
    CircuitBreaker breaker({make_backend("a", "http://a.test")}, breaker_config());
    FakeTransport transport;
    transport.on("http://a.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{45000ms});

    SECTION("Non-streaming requests carry the configured deadline") {
        (void)forwarder.handle(messages_request(false));
        REQUIRE(transport.requests_.front().timeout ==
                std::optional<std::chrono::milliseconds>{45000ms});
    }

    SECTION("Streaming requests have no deadline") {
        (void)forwarder.handle(messages_request(true));
        REQUIRE_FALSE(transport.requests_.front().timeout.has_value());
    }

    SECTION("Bodies that are not JSON get the deadline") {
        http::Request request = messages_request();
        request.body = "stream: true";
        (void)forwarder.handle(request);
        REQUIRE(transport.requests_.front().timeout.has_value());
    }
}

TEST_CASE("Forwarder fails over on transport errors and 5xx", "[forwarder][failover]") {
    CircuitBreaker breaker({make_backend("a", "http://a.test"), make_backend("b", "http://b.test"),
                            make_backend("c", "http://c.test")},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://a.test:80", fail_with(UpstreamErrc::timeout));
    transport.on("http://b.test:80", respond(503, "overloaded"));
    transport.on("http://c.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    ProxyResponse response = forwarder.handle(messages_request());

    REQUIRE(response.status == 200);
    REQUIRE(transport.origins() ==
            std::vector<std::string>{"http://a.test:80", "http://b.test:80", "http://c.test:80"});
    REQUIRE(breaker.circuit_status("a")->consecutive_failures == 1);
    REQUIRE(breaker.circuit_status("a")->last_error == "HTTP 0");
    REQUIRE(breaker.circuit_status("b")->last_error == "HTTP 503");
    REQUIRE(breaker.circuit_status("c")->consecutive_failures == 0);
}

TEST_CASE("Forwarder returns other statuses without retrying", "[forwarder]") {
    CircuitBreaker breaker({make_backend("a", "http://a.test"), make_backend("b", "http://b.test")},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://b.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    SECTION("Authentication failure") {
        transport.on("http://a.test:80", respond(401, R"({"error":"invalid x-api-key"})"));
        ProxyResponse response = forwarder.handle(messages_request());
        REQUIRE(response.status == 401);
        REQUIRE(response.body == R"({"error":"invalid x-api-key"})");
    }

    SECTION("Bad request") {
        transport.on("http://a.test:80", respond(400, "bad"));
        ProxyResponse response = forwarder.handle(messages_request());
        REQUIRE(response.status == 400);
        REQUIRE(response.body == "bad");
    }

    REQUIRE(transport.origins() == std::vector<std::string>{"http://a.test:80"});
    REQUIRE(breaker.circuit_status("a")->consecutive_failures == 0);
}

TEST_CASE("Forwarder exhaustion yields 502 with the last error", "[forwarder][failover]") {
    CircuitBreaker breaker({make_backend("a", "http://a.test"), make_backend("b", "http://b.test")},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://a.test:80", fail_with(UpstreamErrc::connection_failed));
    transport.on("http://b.test:80", respond(502, "upstream gone"));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    ProxyResponse response = forwarder.handle(messages_request());

    REQUIRE(response.status == 502);
    REQUIRE(response.body == "all backends unavailable: HTTP 502");
    REQUIRE(transport.requests_.size() == 2);

    SECTION("No candidates at all") {
        CircuitBreaker empty({make_backend("x", "http://x.test")}, breaker_config());
        REQUIRE(empty.on_backend_disabled("x"));
        Forwarder idle(empty, transport, ForwarderConfig{});
        ProxyResponse none = idle.handle(messages_request());
        REQUIRE(none.status == 502);
        REQUIRE(none.body == "all backends unavailable");
    }
}

TEST_CASE("Forwarder invalid base URL counts as a failure", "[forwarder][failover]") {
    CircuitBreaker breaker({make_backend("a", "not a url"), make_backend("b", "http://b.test")},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://b.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    REQUIRE(forwarder.handle(messages_request()).status == 200);
    REQUIRE(transport.origins() == std::vector<std::string>{"http://b.test:80"});
    REQUIRE(breaker.circuit_status("a")->consecutive_failures == 1);
}

TEST_CASE("Forwarder open circuit skips the backend", "[forwarder][failover]") {
    CircuitBreaker breaker({make_backend("a", "http://a.test"), make_backend("b", "http://b.test"),
                            make_backend("c", "http://c.test")},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://a.test:80", respond(500, "boom"));
    transport.on("http://b.test:80", respond(200, NATIVE_OK));
    transport.on("http://c.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    for (int i = 0; i < 3; ++i) {
        REQUIRE(forwarder.handle(messages_request()).status == 200);
    }
    REQUIRE(breaker.circuit_status("a")->state == CircuitState::OPEN);

    auto decision = breaker.should_skip(*breaker.find("a"));
    REQUIRE(decision.skip);
    REQUIRE(decision.reason.find("remaining") != std::string::npos);

    transport.clear();
    REQUIRE(forwarder.handle(messages_request()).status == 200);
    REQUIRE(transport.origins() == std::vector<std::string>{"http://b.test:80"});
}

TEST_CASE("Forwarder rate-limited backend is tried last", "[forwarder][rate_limit]") {
    CircuitBreaker breaker({make_backend("a", "http://a.test"), make_backend("b", "http://b.test"),
                            make_backend("c", "http://c.test")},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://a.test:80", respond(429, "slow down", {{"Retry-After", "5"}}));
    transport.on("http://b.test:80", respond(500, "boom"));
    transport.on("http://c.test:80", respond(500, "boom"));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    REQUIRE(forwarder.handle(messages_request()).status == 502);
    REQUIRE(breaker.circuit_status("a")->consecutive_failures == 0);
    REQUIRE(breaker.rate_limit_status("a")->retry_after_until.has_value());

    transport.clear();
    transport.on("http://a.test:80", respond(200, NATIVE_OK));
    REQUIRE(forwarder.handle(messages_request()).status == 200);
    REQUIRE(transport.origins() ==
            std::vector<std::string>{"http://b.test:80", "http://c.test:80", "http://a.test:80"});
}

TEST_CASE("Forwarder applies the backend model override", "[forwarder]") {
    Backend backend = make_backend("a", "http://a.test");
    backend.model = "glm-4.6";
    CircuitBreaker breaker({backend}, breaker_config());
    FakeTransport transport;
    transport.on("http://a.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    (void)forwarder.handle(messages_request());
    json sent = json::parse(transport.requests_.front().body);
    REQUIRE(sent["model"] == "glm-4.6");
    REQUIRE(sent["max_tokens"] == 64);
}

TEST_CASE("Forwarder converts for chat-completions backends", "[forwarder][conversion]") {
    CircuitBreaker breaker({make_backend("oa", "https://oa.test/compat", Platform::OPENAI)},
                           breaker_config());
    FakeTransport transport;
    transport.on("https://oa.test:443",
                 respond(200,
                         R"({"id":"chatcmpl-9","model":"gpt-4o","choices":[{"message":{"content":"Hi!"},"finish_reason":"stop"}],"usage":{"prompt_tokens":3,"completion_tokens":2}})",
                         {{"Content-Type", "application/json"}}));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    ProxyResponse response = forwarder.handle(messages_request());

    const UpstreamRequest& sent = transport.requests_.front();
    REQUIRE(sent.target == "/compat/v1/chat/completions");
    REQUIRE(http::get_header(sent.headers, "Accept-Encoding") == "identity");
    REQUIRE(http::get_header(sent.headers, "Content-Type") == "application/json");
    json body = json::parse(sent.body);
    REQUIRE(body["model"] == "gpt-4o");
    REQUIRE(body["messages"][0] == json({{"role", "user"}, {"content", "Hello"}}));

    REQUIRE(response.status == 200);
    json native = json::parse(response.body);
    REQUIRE(native["type"] == "message");
    REQUIRE(native["content"][0]["text"] == "Hi!");
    REQUIRE(native["stop_reason"] == "end_turn");
    REQUIRE(native["usage"]["output_tokens"] == 2);
}

TEST_CASE("Forwarder conversion failures", "[forwarder][conversion]") {
    CircuitBreaker breaker({make_backend("oa", "http://oa.test", Platform::OPENAI),
                            make_backend("native", "http://native.test")},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://native.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    SECTION("Unconvertible request moves to the next backend") {
        http::Request request = messages_request();
        request.body = "not json";
        ProxyResponse response = forwarder.handle(request);
        REQUIRE(response.status == 200);
        REQUIRE(transport.origins() == std::vector<std::string>{"http://native.test:80"});
        REQUIRE(breaker.circuit_status("oa")->consecutive_failures == 1);
    }

    SECTION("Unconvertible response is a 500") {
        transport.on("http://oa.test:80", respond(200, "<html>oops</html>"));
        ProxyResponse response = forwarder.handle(messages_request());
        REQUIRE(response.status == 500);
        REQUIRE(response.body.starts_with("response conversion failed"));
    }
}

TEST_CASE("Forwarder streams converted chat-completions events", "[forwarder][stream]") {
    CircuitBreaker breaker({make_backend("oa", "http://oa.test", Platform::OPENAI)},
                           breaker_config());
    FakeTransport transport;
    transport.on("http://oa.test:80",
                 respond(200,
                         "data: {\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\n\n"
                         "data: {\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}\n\n"
                         "data: [DONE]\n\n",
                         {{"Content-Type", "text/event-stream"}, {"Content-Encoding", "identity"}}));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    ProxyResponse response = forwarder.handle(messages_request(true));
    REQUIRE(response.streaming());
    REQUIRE(response.status == 200);
    REQUIRE(http::get_header(response.headers, "Content-Type") == "text/event-stream");
    REQUIRE(http::get_header(response.headers, "Cache-Control") == "no-cache");
    REQUIRE_FALSE(http::has_header(response.headers, "Content-Encoding"));
    REQUIRE_FALSE(transport.requests_.front().timeout.has_value());

    CollectingSink sink;
    RelayResult result = response.stream->run(sink);
    REQUIRE_FALSE(result.client_disconnected);

    // Concatenated text deltas reproduce the upstream content
    std::string text;
    size_t pos = 0;
    while ((pos = sink.output.find("data: ", pos)) != std::string::npos) {
        size_t end = sink.output.find('\n', pos);
        json event = json::parse(sink.output.substr(pos + 6, end - pos - 6));
        if (event["type"] == "content_block_delta") {
            text += event["delta"]["text"].get<std::string>();
        }
        pos = end;
    }
    REQUIRE(text == "Hello");
    REQUIRE(sink.output.starts_with("event: message_start\n"));
    REQUIRE(sink.output.ends_with("event: message_stop\ndata: {\"type\":\"message_stop\"}\n\n"));
}

TEST_CASE("Forwarder passes native event streams through", "[forwarder][stream]") {
    const std::string stream =
        "event: message_start\ndata: {\"type\":\"message_start\"}\n\n"
        "event: message_stop\ndata: {\"type\":\"message_stop\"}\n\n";
    CircuitBreaker breaker({make_backend("a", "http://a.test")}, breaker_config());
    FakeTransport transport;
    transport.on("http://a.test:80",
                 respond(200, stream, {{"Content-Type", "text/event-stream; charset=utf-8"}}));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    ProxyResponse response = forwarder.handle(messages_request(true));
    REQUIRE(response.streaming());
    REQUIRE(response.stream->mode() == RelayMode::PASSTHROUGH);
    REQUIRE(http::get_header(response.headers, "Content-Type") == "text/event-stream; charset=utf-8");

    CollectingSink sink;
    (void)response.stream->run(sink);
    REQUIRE(sink.output == stream);
}

TEST_CASE("Forwarder half-open trial closes the circuit", "[forwarder][failover]") {
    auto config = breaker_config();
    config.open_timeout = 50ms;
    CircuitBreaker breaker({make_backend("a", "http://a.test"), make_backend("b", "http://b.test")},
                           config);
    FakeTransport transport;
    transport.on("http://a.test:80", respond(500, "boom"));
    transport.on("http://b.test:80", respond(200, NATIVE_OK));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    for (int i = 0; i < 3; ++i) {
        (void)forwarder.handle(messages_request());
    }
    REQUIRE(breaker.circuit_status("a")->state == CircuitState::OPEN);

    std::this_thread::sleep_for(80ms);
    transport.on("http://a.test:80", respond(200, NATIVE_OK));
    transport.clear();

    REQUIRE(forwarder.handle(messages_request()).status == 200);
    REQUIRE(transport.origins() == std::vector<std::string>{"http://a.test:80"});
    REQUIRE(breaker.circuit_status("a")->state == CircuitState::CLOSED);
}

TEST_CASE("Forwarder inconclusive half-open trial reopens the circuit", "[forwarder][failover]") {
    auto config = breaker_config();
    config.failure_threshold = 1;
    config.open_timeout = 50ms;
    config.rate_limit_cooldown = 10ms;
    CircuitBreaker breaker({make_backend("a", "http://a.test")}, config);
    FakeTransport transport;
    transport.on("http://a.test:80", respond(500, "boom"));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    REQUIRE(forwarder.handle(messages_request()).status == 502);
    REQUIRE(breaker.circuit_status("a")->state == CircuitState::OPEN);
    std::this_thread::sleep_for(80ms);

    SECTION("Trial answered 429") {
        transport.on("http://a.test:80", respond(429, "slow down", {{"Retry-After", "1"}}));
        REQUIRE(forwarder.handle(messages_request()).status == 502);
    }

    SECTION("Trial answered 400") {
        transport.on("http://a.test:80", respond(400, R"({"error":"bad request"})"));
        REQUIRE(forwarder.handle(messages_request()).status == 400);
    }

    // The trial is released: open for a fresh window instead of skipped forever
    auto status = breaker.circuit_status("a");
    REQUIRE(status->state == CircuitState::OPEN);
    REQUIRE(status->half_open_tries == 0);

    transport.clear();
    REQUIRE(forwarder.handle(messages_request()).status == 502);
    REQUIRE(transport.requests_.empty());

    std::this_thread::sleep_for(80ms);
    transport.on("http://a.test:80", respond(200, NATIVE_OK));
    REQUIRE(forwarder.handle(messages_request()).status == 200);
    REQUIRE(breaker.circuit_status("a")->state == CircuitState::CLOSED);
}

TEST_CASE("Forwarder admits one half-open trial across concurrent requests",
          "[forwarder][failover]") {
    auto config = breaker_config();
    config.failure_threshold = 1;
    config.open_timeout = 50ms;
    CircuitBreaker breaker({make_backend("a", "http://a.test")}, config);
    FakeTransport transport;
    transport.on("http://a.test:80", respond(500, "boom"));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    (void)forwarder.handle(messages_request());
    std::this_thread::sleep_for(80ms);

    // Slow failing upstream keeps the trial in flight while the others arrive
    transport.on("http://a.test:80", [](const UpstreamRequest&, UpstreamResponse& response) {
        std::this_thread::sleep_for(20ms);
        response.status = 503;
        response.body = std::make_unique<BufferedBody>("still down");
        return std::error_code{};
    });
    transport.clear();

    std::vector<std::thread> clients;
    for (int i = 0; i < 6; ++i) {
        clients.emplace_back([&] { (void)forwarder.handle(messages_request()); });
    }
    for (auto& client : clients) {
        client.join();
    }

    REQUIRE(transport.requests_.size() == 1);
    REQUIRE(breaker.circuit_status("a")->state == CircuitState::OPEN);
}

TEST_CASE("Forwarder sends bodiless requests to chat-completions backends as-is",
          "[forwarder][conversion]") {
    CircuitBreaker breaker({make_backend("oa", "http://oa.test/compat", Platform::OPENAI)},
                           breaker_config());
    FakeTransport transport;
    const std::string models = R"({"object":"list","data":[{"id":"gpt-4o"}]})";
    transport.on("http://oa.test:80",
                 respond(200, models, {{"Content-Type", "application/json"}}));
    Forwarder forwarder(breaker, transport, ForwarderConfig{});

    http::Request request;
    request.method = "GET";
    request.path = "/v1/models";

    for (int i = 0; i < 4; ++i) {
        ProxyResponse response = forwarder.handle(request);
        REQUIRE(response.status == 200);
        REQUIRE(response.body == models);
    }

    REQUIRE(transport.requests_.size() == 4);
    REQUIRE(transport.requests_[0].target == "/compat/v1/models");
    REQUIRE(transport.requests_[0].body.empty());
    REQUIRE(breaker.circuit_status("oa")->state == CircuitState::CLOSED);
    REQUIRE(breaker.circuit_status("oa")->consecutive_failures == 0);
}
