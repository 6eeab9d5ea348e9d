#include <catch2/catch_test_macros.hpp>

#include <toolserve/mcp/http_server.hpp>
#include "../../test/mocks/mock_tool.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace toolserve;
using namespace toolserve::testing;

// ===========================================================================
// Helper: a server on an ephemeral loopback port.
// ===========================================================================
namespace {

constexpr const char* kToolsList = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";

ServerInfo TestInfo() {
    return ServerInfo{"toolserve", "9.9.9", "tester", "2025-11-25", "host-1.0"};
}

ToolInstaller InstallEcho() {
    return [](ToolRegistry& registry) {
        registry.Register(std::make_shared<MockTool>("echo", ResponseType::Text, "pong"));
    };
}

httplib::Client MakeClient(const McpHttpServer& server) {
    httplib::Client client("127.0.0.1", server.Port());
    client.set_connection_timeout(5, 0);
    client.set_read_timeout(5, 0);
    return client;
}

} // anonymous namespace

TEST_CASE("McpHttpServer: start on ephemeral port and stop", "[mcp][http]") {
    ServerContext context(TestInfo());
    McpHttpServer server(context, InstallEcho());

    auto started = server.Start(0);
    REQUIRE(started.IsOk());
    CHECK(server.IsRunning());
    CHECK(server.Port() != 0);
    CHECK(context.Registry().HasTool("echo"));

    server.Stop();
    CHECK_FALSE(server.IsRunning());
}

TEST_CASE("McpHttpServer: serves tools/list over HTTP", "[mcp][http]") {
    ServerContext context(TestInfo());
    McpHttpServer server(context, InstallEcho());
    REQUIRE(server.Start(0).IsOk());

    auto client = MakeClient(server);
    auto res = client.Post("/mcp", kToolsList, "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["result"]["tools"][0]["name"] == "echo");
    CHECK(server.RequestCount() == 1);
}

TEST_CASE("McpHttpServer: health endpoint", "[mcp][http]") {
    ServerContext context(TestInfo());
    McpHttpServer server(context, InstallEcho());
    REQUIRE(server.Start(0).IsOk());

    auto client = MakeClient(server);
    auto res = client.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(nlohmann::json::parse(res->body)["status"] == "ok");
}

TEST_CASE("McpHttpServer: PUT on /mcp is not allowed", "[mcp][http]") {
    ServerContext context(TestInfo());
    McpHttpServer server(context, InstallEcho());
    REQUIRE(server.Start(0).IsOk());

    auto client = MakeClient(server);
    auto res = client.Put("/mcp", "{}", "application/json");
    REQUIRE(res);
    CHECK(res->status == 405);
}

TEST_CASE("McpHttpServer: concurrent calls to different tools keep their own ids", "[mcp][http]") {
    ServerContext context(TestInfo());
    HttpServerOptions options;
    options.worker_threads = 4;
    McpHttpServer server(context, [](ToolRegistry& registry) {
        registry.Register(std::make_shared<MockTool>("echo", ResponseType::Text, "pong"));
        registry.Register(std::make_shared<MockTool>(
            "status", ResponseType::Json, R"({"state":"up"})"));
    }, options);
    REQUIRE(server.Start(0).IsOk());

    constexpr int kClients = 8;
    std::atomic<int> matched{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&server, &matched, i]() {
            const int id = 100 + i;
            const bool use_echo = (i % 2) == 0;
            nlohmann::json request = {
                {"jsonrpc", "2.0"},
                {"id", id},
                {"method", "tools/call"},
                {"params", {{"name", use_echo ? "echo" : "status"},
                            {"arguments", nlohmann::json::object()}}},
            };
            auto client = MakeClient(server);
            auto res = client.Post("/mcp", request.dump(), "application/json");
            if (!res || res->status != 200) return;
            auto body = nlohmann::json::parse(res->body, nullptr, false);
            if (body.is_discarded() || body["id"] != id) return;
            const auto& result = body["result"];
            if (use_echo) {
                if (result["content"][0]["text"] == "pong" &&
                    !result.contains("structuredContent")) {
                    ++matched;
                }
            } else if (result.contains("structuredContent") &&
                       result["structuredContent"]["state"] == "up") {
                ++matched;
            }
        });
    }
    for (auto& th : clients) {
        th.join();
    }

    CHECK(matched.load() == kClients);
    CHECK(server.RequestCount() == kClients);
}

TEST_CASE("McpHttpServer: restart re-runs the installer and drops extra tools", "[mcp][http]") {
    ServerContext context(TestInfo());
    int installs = 0;
    McpHttpServer server(context, [&installs](ToolRegistry& registry) {
        ++installs;
        registry.Register(std::make_shared<MockTool>("echo"));
    });
    REQUIRE(server.Start(0).IsOk());

    server.RegisterTool(std::make_shared<MockTool>("extra"));
    CHECK(context.Registry().HasTool("extra"));

    REQUIRE(server.Restart(0).IsOk());
    CHECK(installs == 2);
    CHECK(server.IsRunning());
    CHECK(context.Registry().HasTool("echo"));
    CHECK_FALSE(context.Registry().HasTool("extra"));

    auto client = MakeClient(server);
    auto res = client.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
}

TEST_CASE("McpHttpServer: ResetRequestCount", "[mcp][http]") {
    ServerContext context(TestInfo());
    McpHttpServer server(context, InstallEcho());
    REQUIRE(server.Start(0).IsOk());

    auto client = MakeClient(server);
    REQUIRE(client.Post("/mcp", kToolsList, "application/json"));
    CHECK(server.RequestCount() == 1);

    server.ResetRequestCount();
    CHECK(server.RequestCount() == 0);
}

TEST_CASE("McpHttpServer: unassignable address is a bind error", "[mcp][http]") {
    ServerContext context(TestInfo());
    HttpServerOptions options;
    options.bind_address = "203.0.113.1";  // TEST-NET-3, never local
    McpHttpServer server(context, InstallEcho(), options);

    auto result = server.Start(0);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Bind);
    CHECK(result.Error().ExitCode() == 3);
    CHECK_FALSE(server.IsRunning());
}

TEST_CASE("McpHttpServer: Stop without Start is harmless", "[mcp][http]") {
    ServerContext context(TestInfo());
    McpHttpServer server(context, InstallEcho());
    server.Stop();
    CHECK_FALSE(server.IsRunning());
}
