#pragma once

#include <toolserve/core/result.hpp>
#include <toolserve/mcp/mcp_endpoint.hpp>
#include <toolserve/mcp/server_context.hpp>
#include <toolserve/mcp/tool.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Server;
} // namespace httplib

namespace toolserve {

struct HttpServerOptions {
    std::string bind_address = "127.0.0.1";
    int worker_threads = 4;
    int read_timeout_seconds = 30;
};

// Called on every (re)start, after the registry was cleared.
using ToolInstaller = std::function<void(ToolRegistry& registry)>;

// ---------------------------------------------------------------------------
// McpHttpServer: owns the HTTP listener serving /mcp and /health.
//
// Requests are handled by a fixed pool of worker threads. Start, Stop and
// Restart are serialized by one lock; Start on a running server stops the
// old listener first, so two listeners never share the port.
// ---------------------------------------------------------------------------
class McpHttpServer {
public:
    McpHttpServer(ServerContext& context, ToolInstaller installer,
                  HttpServerOptions options = {});
    ~McpHttpServer();

    McpHttpServer(const McpHttpServer&) = delete;
    McpHttpServer& operator=(const McpHttpServer&) = delete;

    // Port 0 binds an ephemeral port; Port() reports the one chosen.
    Result<void, Error> Start(uint16_t port);
    void Stop();
    Result<void, Error> Restart(uint16_t port);

    [[nodiscard]] bool IsRunning() const;
    [[nodiscard]] uint16_t Port() const;

    [[nodiscard]] uint64_t RequestCount() const;
    void ResetRequestCount();

    // Adds a tool to the live registry. Tools added this way are dropped on
    // the next restart unless the installer registers them too.
    void RegisterTool(std::shared_ptr<ITool> tool);

private:
    void StopLocked();
    void InstallRoutes(httplib::Server& server);

    ServerContext& context_;
    ToolInstaller installer_;
    HttpServerOptions options_;
    McpEndpoint endpoint_;

    mutable std::mutex lifecycle_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> port_{0};
};

} // namespace toolserve
