#include <toolserve/mcp/http_server.hpp>

#include <toolserve/core/log.hpp>

#include <httplib.h>

#include <utility>

namespace toolserve {

namespace {

constexpr const char* kComponent = "http";

} // anonymous namespace

McpHttpServer::McpHttpServer(ServerContext& context, ToolInstaller installer,
                             HttpServerOptions options)
    : context_(context),
      installer_(std::move(installer)),
      options_(std::move(options)),
      endpoint_(context) {}

McpHttpServer::~McpHttpServer() {
    Stop();
}

Result<void, Error> McpHttpServer::Start(uint16_t port) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (server_) {
        StopLocked();
    }

    auto& registry = context_.Registry();
    registry.Clear();
    if (installer_) {
        installer_(registry);
    }
    LogInfo(kComponent, "Registered " + std::to_string(registry.Count()) +
                            " MCP tools");

    auto server = std::make_unique<httplib::Server>();
    const auto workers = static_cast<size_t>(options_.worker_threads);
    server->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    server->set_read_timeout(options_.read_timeout_seconds, 0);
    server->set_write_timeout(options_.read_timeout_seconds, 0);
    InstallRoutes(*server);

    int bound_port = port;
    if (port == 0) {
        bound_port = server->bind_to_any_port(options_.bind_address);
    } else if (!server->bind_to_port(options_.bind_address, port)) {
        bound_port = -1;
    }
    if (bound_port <= 0) {
        LogError(kComponent, "Failed to bind " + options_.bind_address + ":" +
                                 std::to_string(port));
        return Result<void, Error>::Err(Error::Bind(
            options_.bind_address, port, "Failed to bind MCP listener"));
    }

    server_ = std::move(server);
    port_ = static_cast<uint16_t>(bound_port);
    listener_ = std::thread([srv = server_.get()] {
        if (!srv->listen_after_bind()) {
            LogError(kComponent, "MCP listener terminated unexpectedly");
        }
    });
    // stop() is a no-op until the accept loop runs.
    server_->wait_until_ready();
    running_ = true;

    LogInfo(kComponent, "MCP Server started on " + options_.bind_address + ":" +
                            std::to_string(port_.load()));
    return Result<void, Error>::Ok();
}

void McpHttpServer::Stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    StopLocked();
}

Result<void, Error> McpHttpServer::Restart(uint16_t port) {
    // Start() stops a running listener under the same lock.
    return Start(port);
}

void McpHttpServer::StopLocked() {
    if (!server_) {
        return;
    }
    server_->stop();
    if (listener_.joinable()) {
        listener_.join();
    }
    server_.reset();
    running_ = false;
    LogInfo(kComponent, "MCP Server stopped");
}

bool McpHttpServer::IsRunning() const {
    return running_.load();
}

uint16_t McpHttpServer::Port() const {
    return port_.load();
}

uint64_t McpHttpServer::RequestCount() const {
    return context_.RequestCount();
}

void McpHttpServer::ResetRequestCount() {
    context_.ResetRequestCount();
}

void McpHttpServer::RegisterTool(std::shared_ptr<ITool> tool) {
    context_.Registry().Register(std::move(tool));
}

void McpHttpServer::InstallRoutes(httplib::Server& server) {
    auto mcp = [this](const httplib::Request& req, httplib::Response& res) {
        endpoint_.HandleMcp(req, res);
    };
    server.Post("/mcp", mcp);
    server.Get("/mcp", mcp);
    server.Delete("/mcp", mcp);
    server.Put("/mcp", mcp);
    server.Patch("/mcp", mcp);
    server.Options("/mcp", mcp);

    server.Get("/health", [this](const httplib::Request& req,
                                 httplib::Response& res) {
        endpoint_.HandleHealth(req, res);
    });

    server.set_logger([](const httplib::Request& req,
                         const httplib::Response& res) {
        LogDebug(kComponent, req.method + " " + req.path + " -> " +
                                 std::to_string(res.status));
    });
}

} // namespace toolserve
