#pragma once

#include <toolserve/mcp/protocol_handler.hpp>
#include <toolserve/mcp/server_context.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace httplib {
struct Request;
struct Response;
} // namespace httplib

namespace toolserve {

constexpr const char* kSessionIdHeader = "Mcp-Session-Id";
constexpr const char* kEventStreamMediaType = "text/event-stream";

// Origins allowed to call the endpoint: http(s)://localhost and
// http(s)://127.0.0.1 (with optional port/path), file:// and
// vscode-webview://. Used to block DNS-rebinding from web pages.
bool IsAllowedOrigin(std::string_view origin);

// Frame a JSON payload as one SSE event:
//   id: <event_id>\n
//   data: <payload>\n
//   \n
std::string FormatSseEvent(uint64_t event_id, std::string_view payload);

// Random RFC 4122 version 4 UUID in canonical text form.
std::string GenerateSessionId();

// ---------------------------------------------------------------------------
// McpEndpoint: HTTP request handling for /mcp and /health.
//
// Independent of the listener so it can be exercised with plain
// httplib::Request/Response objects.
// ---------------------------------------------------------------------------
class McpEndpoint {
public:
    explicit McpEndpoint(ServerContext& context);

    // /mcp, any verb.
    void HandleMcp(const httplib::Request& req, httplib::Response& res) const;

    // /health
    void HandleHealth(const httplib::Request& req, httplib::Response& res) const;

private:
    void HandlePost(const httplib::Request& req, httplib::Response& res) const;
    void HandleGet(const httplib::Request& req, httplib::Response& res) const;

    ServerContext& context_;
    ProtocolHandler handler_;
};

} // namespace toolserve
