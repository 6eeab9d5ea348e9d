#include <toolserve/mcp/json_rpc.hpp>

#include <cctype>
#include <optional>

namespace toolserve {

namespace {

constexpr const char* kInvalidVersionMessage = "Invalid JSON-RPC version, expected 2.0";

bool IsValidId(const nlohmann::json& id) {
    return id.is_number() || id.is_string();
}

void SkipSpace(std::string_view s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
        ++i;
    }
}

// Extract a JSON number or string literal starting at s[i].
std::optional<nlohmann::json> ReadScalar(std::string_view s, size_t i) {
    if (i >= s.size()) return std::nullopt;

    size_t end = i;
    if (s[i] == '"') {
        ++end;
        while (end < s.size() && s[end] != '"') {
            end += (s[end] == '\\') ? 2 : 1;
        }
        if (end >= s.size()) return std::nullopt;
        ++end;
    } else if (s[i] == '-' || std::isdigit(static_cast<unsigned char>(s[i]))) {
        while (end < s.size() &&
               (std::isdigit(static_cast<unsigned char>(s[end])) ||
                s[end] == '-' || s[end] == '+' || s[end] == '.' ||
                s[end] == 'e' || s[end] == 'E')) {
            ++end;
        }
    } else {
        return std::nullopt;
    }

    auto value = nlohmann::json::parse(s.substr(i, end - i), nullptr, false);
    if (value.is_discarded() || !IsValidId(value)) return std::nullopt;
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// JsonRpcRequest
// ---------------------------------------------------------------------------
nlohmann::json JsonRpcRequest::ResponseId() const {
    return HasId() ? id : nlohmann::json(1);
}

std::string JsonRpcRequest::ToolName() const {
    if (params.is_object() && params.contains("name") &&
        params["name"].is_string()) {
        return params["name"].get<std::string>();
    }
    return "";
}

nlohmann::json JsonRpcRequest::Arguments() const {
    if (params.is_object() && params.contains("arguments") &&
        params["arguments"].is_object()) {
        return params["arguments"];
    }
    return nlohmann::json::object();
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
nlohmann::json RecoverRequestId(std::string_view raw) {
    constexpr std::string_view kKey = "\"id\"";
    for (auto pos = raw.find(kKey); pos != std::string_view::npos;
         pos = raw.find(kKey, pos + 1)) {
        size_t i = pos + kKey.size();
        SkipSpace(raw, i);
        if (i >= raw.size() || raw[i] != ':') continue;
        ++i;
        SkipSpace(raw, i);
        if (auto id = ReadScalar(raw, i)) {
            return *id;
        }
    }
    return 1;
}

Result<JsonRpcRequest, RequestParseError> ParseRequest(std::string_view body) {
    using R = Result<JsonRpcRequest, RequestParseError>;

    auto message = nlohmann::json::parse(body, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return R::Err(RequestParseError{
            {RpcErrorCode::InvalidRequest, kInvalidVersionMessage},
            RecoverRequestId(body)});
    }

    JsonRpcRequest request;
    if (message.contains("id") && IsValidId(message["id"])) {
        request.id = message["id"];
    }
    if (message.contains("jsonrpc") && message["jsonrpc"].is_string()) {
        request.jsonrpc = message["jsonrpc"].get<std::string>();
    }
    if (request.jsonrpc != kJsonRpcVersion) {
        return R::Err(RequestParseError{
            {RpcErrorCode::InvalidRequest, kInvalidVersionMessage},
            request.ResponseId()});
    }

    if (message.contains("method") && message["method"].is_string()) {
        request.method = message["method"].get<std::string>();
    }
    if (message.contains("params") && message["params"].is_object()) {
        request.params = message["params"];
    }
    return R::Ok(std::move(request));
}

// ---------------------------------------------------------------------------
// Result shapes
// ---------------------------------------------------------------------------
nlohmann::json InitializeResult::ToJson() const {
    return {
        {"protocolVersion", protocol_version},
        {"capabilities", {
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", server_name},
            {"version", server_version},
            {"author", author}
        }}
    };
}

nlohmann::json ToolsListResult::ToJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools) {
        list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return {{"tools", list}};
}

ToolCallResult ToolCallResult::Text(std::string text) {
    return ToolCallResult(TextContent{std::move(text)});
}

ToolCallResult ToolCallResult::Structured(nlohmann::json value) {
    return ToolCallResult(StructuredContent{std::move(value)});
}

ToolCallResult ToolCallResult::Resource(std::string uri, std::string mime_type,
                                        std::string text) {
    return ToolCallResult(ResourceContent{
        std::move(uri), std::move(mime_type), std::move(text)});
}

nlohmann::json ToolCallResult::ToJson() const {
    if (const auto* text = std::get_if<TextContent>(&content_)) {
        return {{"content", nlohmann::json::array({
            {{"type", "text"}, {"text", text->text}}
        })}};
    }
    if (const auto* structured = std::get_if<StructuredContent>(&content_)) {
        return {
            {"content", nlohmann::json::array({
                {{"type", "text"}, {"text", structured->value.dump()}}
            })},
            {"structuredContent", structured->value}
        };
    }
    const auto& resource = std::get<ResourceContent>(content_);
    return {{"content", nlohmann::json::array({
        {{"type", "resource"},
         {"resource", {
             {"uri", resource.uri},
             {"mimeType", resource.mime_type},
             {"text", resource.text}
         }}}
    })}};
}

// ---------------------------------------------------------------------------
// Envelopes
// ---------------------------------------------------------------------------
nlohmann::json MakeResultResponse(const nlohmann::json& id,
                                  const nlohmann::json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeErrorResponse(const nlohmann::json& id,
                                 const RpcError& error) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", error.Code()},
            {"message", error.message}
        }}
    };
}

} // namespace toolserve
