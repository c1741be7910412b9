#include <catch2/catch_test_macros.hpp>

#include <docmcp/server/text_client.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace docmcp;
using nlohmann::json;

namespace {

// ---------------------------------------------------------------------------
// Helper: runs an httplib::Server on a random port for the lifetime of the
// object.
// ---------------------------------------------------------------------------
class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] int Port() const noexcept { return port_; }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

TextServiceConfig ConfigFor(int port) {
    TextServiceConfig config;
    config.base_url = "http://127.0.0.1:" + std::to_string(port);
    config.api_key = "test-key";
    config.model = "command-test";
    config.timeout = std::chrono::seconds{5};
    return config;
}

} // anonymous namespace

TEST_CASE("CohereTextClient: posts the chat request and returns the text", "[server][text]") {
    httplib::Server svr;
    std::string auth;
    json received;
    svr.Post("/v1/chat", [&](const httplib::Request& req, httplib::Response& res) {
        auth = req.get_header_value("Authorization");
        received = json::parse(req.body);
        res.set_content(R"({"text": "generated", "generation_id": "g1"})", "application/json");
    });
    LocalServer server(svr);

    CohereTextClient client(ConfigFor(server.Port()));
    auto result = client.Generate(TextRequest{"Say hi", 0.5, true});

    REQUIRE(result.IsOk());
    CHECK(result.Value() == "generated");
    CHECK(auth == "Bearer test-key");
    CHECK(received["model"] == "command-test");
    CHECK(received["message"] == "Say hi");
    CHECK(received["temperature"] == 0.5);
    CHECK(received["response_format"]["type"] == "json_object");
}

TEST_CASE("CohereTextClient: plain requests carry no response format", "[server][text]") {
    httplib::Server svr;
    json received;
    svr.Post("/v1/chat", [&](const httplib::Request& req, httplib::Response& res) {
        received = json::parse(req.body);
        res.set_content(R"({"text": "ok"})", "application/json");
    });
    LocalServer server(svr);

    CohereTextClient client(ConfigFor(server.Port()));
    REQUIRE(client.Generate(TextRequest{"p"}).IsOk());
    CHECK_FALSE(received.contains("response_format"));
}

TEST_CASE("CohereTextClient: HTTP errors are Upstream with the status", "[server][text]") {
    httplib::Server svr;
    svr.Post("/v1/chat", [](const httplib::Request&, httplib::Response& res) {
        res.status = 401;
        res.set_content(R"({"message": "invalid api token"})", "application/json");
    });
    LocalServer server(svr);

    CohereTextClient client(ConfigFor(server.Port()));
    auto result = client.Generate(TextRequest{"p"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Upstream);
    CHECK(result.Error().message == "Text service returned HTTP 401: invalid api token");
    CHECK(result.Error().data.value()["status"] == 401);
}

TEST_CASE("CohereTextClient: replies without text are rejected", "[server][text]") {
    httplib::Server svr;
    svr.Post("/v1/chat", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"generation_id": "g1"})", "application/json");
    });
    LocalServer server(svr);

    CohereTextClient client(ConfigFor(server.Port()));
    auto result = client.Generate(TextRequest{"p"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Upstream);
}

TEST_CASE("CohereTextClient: non-JSON replies are rejected", "[server][text]") {
    httplib::Server svr;
    svr.Post("/v1/chat", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("<html>gateway</html>", "text/html");
    });
    LocalServer server(svr);

    CohereTextClient client(ConfigFor(server.Port()));
    auto result = client.Generate(TextRequest{"p"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Upstream);
    CHECK(result.Error().message.find("not JSON") != std::string::npos);
}

TEST_CASE("CohereTextClient: concurrent requests are not serialized", "[server][text]") {
    constexpr auto kDelay = std::chrono::milliseconds(300);
    httplib::Server svr;
    svr.Post("/v1/chat", [&](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(kDelay);
        res.set_content(R"({"text": "slow"})", "application/json");
    });
    LocalServer server(svr);

    CohereTextClient client(ConfigFor(server.Port()));
    auto first = Result<std::string, Error>::Ok("");
    auto second = Result<std::string, Error>::Ok("");

    const auto begin = std::chrono::steady_clock::now();
    std::thread a([&] { first = client.Generate(TextRequest{"a"}); });
    std::thread b([&] { second = client.Generate(TextRequest{"b"}); });
    a.join();
    b.join();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    CHECK(first.Value() == "slow");
    CHECK(second.Value() == "slow");
    CHECK(elapsed < kDelay * 2 - std::chrono::milliseconds(100));
}
