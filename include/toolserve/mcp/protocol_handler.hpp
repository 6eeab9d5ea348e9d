#pragma once

#include <toolserve/core/result.hpp>
#include <toolserve/mcp/json_rpc.hpp>
#include <toolserve/mcp/server_context.hpp>
#include <toolserve/mcp/tool.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolserve {

// What the transport should send back for one request body.
struct HandlerReply {
    // Serialized JSON-RPC response; nullopt for notifications (202, no body).
    std::optional<std::string> body;
    // True only for a successful initialize; the transport issues a session id.
    bool session_established = false;

    [[nodiscard]] bool HasBody() const { return body.has_value(); }
};

// ---------------------------------------------------------------------------
// ProtocolHandler: MCP JSON-RPC dispatch.
//
// Methods:
//   - initialize
//   - notifications/initialized (no response body)
//   - tools/list
//   - tools/call
//
// Stateless per call and safe to use from many workers at once. Process()
// never throws: protocol errors become JSON-RPC error envelopes and any
// unexpected exception is reported as an internal error.
// ---------------------------------------------------------------------------
class ProtocolHandler {
public:
    explicit ProtocolHandler(ServerContext& context);

    [[nodiscard]] HandlerReply Process(std::string_view body) const;

private:
    Result<nlohmann::json, RpcError> Dispatch(const JsonRpcRequest& request) const;
    Result<nlohmann::json, RpcError> HandleInitialize() const;
    Result<nlohmann::json, RpcError> HandleToolsList() const;
    Result<nlohmann::json, RpcError> HandleToolsCall(
        const JsonRpcRequest& request) const;

    ServerContext& context_;
};

// Convert tools/call arguments to the string map tools receive: strings
// verbatim, numbers and booleans as JSON text, arrays and objects as compact
// JSON, nulls dropped.
ToolParams ToToolParams(const nlohmann::json& arguments);

} // namespace toolserve
