#pragma once

#include <toolserve/core/result.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolserve {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr const char* kMethodInitialize = "initialize";
constexpr const char* kMethodInitialized = "notifications/initialized";
constexpr const char* kMethodToolsList = "tools/list";
constexpr const char* kMethodToolsCall = "tools/call";

// ---------------------------------------------------------------------------
// RpcError: a JSON-RPC error object.
// ---------------------------------------------------------------------------
enum class RpcErrorCode : int {
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    Internal = -32603,
};

struct RpcError {
    RpcErrorCode code = RpcErrorCode::Internal;
    std::string message;

    [[nodiscard]] int Code() const { return static_cast<int>(code); }

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message;
    }
};

// ---------------------------------------------------------------------------
// JsonRpcRequest: a parsed request or notification envelope.
// ---------------------------------------------------------------------------
struct JsonRpcRequest {
    std::string jsonrpc;
    std::string method;
    nlohmann::json id;  // null when absent (notification)
    nlohmann::json params = nlohmann::json::object();

    [[nodiscard]] bool HasId() const { return !id.is_null(); }

    // The id to echo in the response: the request's id, or 1 when absent.
    [[nodiscard]] nlohmann::json ResponseId() const;

    // tools/call helpers; empty name / empty object when missing.
    [[nodiscard]] std::string ToolName() const;
    [[nodiscard]] nlohmann::json Arguments() const;
};

// Failure to parse a request body, with the id to answer under.
struct RequestParseError {
    RpcError error;
    nlohmann::json id;
};

// Parse a raw request body. Syntax errors, non-object bodies and a jsonrpc
// member other than "2.0" all yield InvalidRequest.
Result<JsonRpcRequest, RequestParseError> ParseRequest(std::string_view body);

// Scan text that failed to parse for an "id" member holding a number or
// string. Returns 1 when nothing usable is found.
nlohmann::json RecoverRequestId(std::string_view raw);

// ---------------------------------------------------------------------------
// MCP result shapes
// ---------------------------------------------------------------------------
struct InitializeResult {
    std::string protocol_version;
    std::string server_name;
    std::string server_version;
    std::string author;

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct ToolsListResult {
    std::vector<ToolDescriptor> tools;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// tools/call result: exactly one of text, structured JSON or an embedded
// resource.
class ToolCallResult {
public:
    struct TextContent {
        std::string text;
    };
    struct StructuredContent {
        nlohmann::json value;
    };
    struct ResourceContent {
        std::string uri;
        std::string mime_type;
        std::string text;
    };

    static ToolCallResult Text(std::string text);
    static ToolCallResult Structured(nlohmann::json value);
    static ToolCallResult Resource(std::string uri, std::string mime_type,
                                   std::string text);

    [[nodiscard]] bool IsText() const { return content_.index() == 0; }
    [[nodiscard]] bool IsStructured() const { return content_.index() == 1; }
    [[nodiscard]] bool IsResource() const { return content_.index() == 2; }

    // Structured results also carry a serialized copy as a text block for
    // clients that ignore structuredContent.
    [[nodiscard]] nlohmann::json ToJson() const;

private:
    using Content = std::variant<TextContent, StructuredContent, ResourceContent>;
    explicit ToolCallResult(Content content) : content_(std::move(content)) {}

    Content content_;
};

// ---------------------------------------------------------------------------
// Response envelopes
// ---------------------------------------------------------------------------
nlohmann::json MakeResultResponse(const nlohmann::json& id,
                                  const nlohmann::json& result);
nlohmann::json MakeErrorResponse(const nlohmann::json& id,
                                 const RpcError& error);

} // namespace toolserve
