#pragma once

#include <toolserve/mcp/tool_registry.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace toolserve {

// Identity advertised by initialize, GET /mcp and /health.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string author;
    std::string protocol_version;
    std::string host_version;

    // Defaults from the generated version header plus the given host version.
    static ServerInfo Default(std::string host_version = "unknown");
};

// ---------------------------------------------------------------------------
// ServerContext: state shared by the protocol handler and the HTTP
// transport: the tool registry, the server identity and the two
// process-wide counters. Tests construct isolated contexts.
// ---------------------------------------------------------------------------
class ServerContext {
public:
    explicit ServerContext(ServerInfo info);

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    [[nodiscard]] ToolRegistry& Registry() noexcept { return registry_; }
    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }

    // Accepted POSTs to /mcp. Returns the new value.
    uint64_t IncrementRequestCount() noexcept;
    [[nodiscard]] uint64_t RequestCount() const noexcept;
    void ResetRequestCount() noexcept;

    // Next SSE event id; strictly increasing, starting at 1.
    uint64_t NextEventId() noexcept;

private:
    ToolRegistry registry_;
    ServerInfo info_;
    std::atomic<uint64_t> request_count_{0};
    std::atomic<uint64_t> event_id_{0};
};

} // namespace toolserve
