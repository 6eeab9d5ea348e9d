#include <toolserve/mcp/protocol_handler.hpp>

#include <toolserve/core/log.hpp>

#include <exception>
#include <utility>

namespace toolserve {

namespace {

constexpr const char* kComponent = "mcp";
constexpr const char* kMarkdownMimeType = "text/markdown";
constexpr const char* kEmbeddedScheme = "embedded://";

using JsonResult = Result<nlohmann::json, RpcError>;

// Invalid UTF-8 from a tool is replaced rather than failing the whole reply.
std::string Serialize(const nlohmann::json& response) {
    return response.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
}

HandlerReply Reply(const nlohmann::json& response) {
    HandlerReply reply;
    reply.body = Serialize(response);
    return reply;
}

} // anonymous namespace

ToolParams ToToolParams(const nlohmann::json& arguments) {
    ToolParams params;
    if (!arguments.is_object()) {
        return params;
    }
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        const auto& value = it.value();
        if (value.is_null()) {
            continue;
        }
        if (value.is_string()) {
            params[it.key()] = value.get<std::string>();
        } else {
            params[it.key()] = value.dump();
        }
    }
    return params;
}

ProtocolHandler::ProtocolHandler(ServerContext& context) : context_(context) {}

HandlerReply ProtocolHandler::Process(std::string_view body) const {
    nlohmann::json id = 1;
    try {
        auto parsed = ParseRequest(body);
        if (parsed.IsErr()) {
            const auto& failure = parsed.Error();
            LogWarn(kComponent, "Rejected request: " + failure.error.message);
            return Reply(MakeErrorResponse(failure.id, failure.error));
        }

        const auto& request = parsed.Value();
        id = request.ResponseId();

        if (request.method == kMethodInitialized) {
            LogDebug(kComponent, "Client initialized notification");
            return HandlerReply{};
        }

        auto result = Dispatch(request);
        if (result.IsErr()) {
            LogDebug(kComponent, request.method + " failed: " +
                                     result.Error().message);
            return Reply(MakeErrorResponse(id, result.Error()));
        }

        auto reply = Reply(MakeResultResponse(id, result.Value()));
        reply.session_established = request.method == kMethodInitialize;
        return reply;
    } catch (const std::exception& e) {
        LogError(kComponent,
                 std::string("Error processing MCP request: ") + e.what());
        return Reply(MakeErrorResponse(
            id, RpcError{RpcErrorCode::Internal, e.what()}));
    } catch (...) {
        // Tools may call into code that throws non-standard types.
        LogError(kComponent, "Error processing MCP request: unknown exception");
        return Reply(MakeErrorResponse(
            id, RpcError{RpcErrorCode::Internal, "Unknown error"}));
    }
}

JsonResult ProtocolHandler::Dispatch(const JsonRpcRequest& request) const {
    if (request.method == kMethodInitialize) {
        return HandleInitialize();
    }
    if (request.method == kMethodToolsList) {
        return HandleToolsList();
    }
    if (request.method == kMethodToolsCall) {
        return HandleToolsCall(request);
    }
    return JsonResult::Err(
        RpcError{RpcErrorCode::MethodNotFound, "Method not found"});
}

JsonResult ProtocolHandler::HandleInitialize() const {
    const auto& info = context_.Info();
    InitializeResult result{info.protocol_version, info.name, info.version,
                            info.author};
    LogInfo(kComponent, "Initialize handshake, protocol " + info.protocol_version);
    return JsonResult::Ok(result.ToJson());
}

JsonResult ProtocolHandler::HandleToolsList() const {
    ToolsListResult result;
    for (const auto& tool : context_.Registry().GetAllTools()) {
        auto schema = nlohmann::json::parse(tool->InputSchema(), nullptr, false);
        if (schema.is_discarded()) {
            return JsonResult::Err(RpcError{
                RpcErrorCode::Internal,
                "Invalid input schema for tool: " + tool->Name()});
        }
        result.tools.push_back(
            ToolDescriptor{tool->Name(), tool->Description(), std::move(schema)});
    }
    return JsonResult::Ok(result.ToJson());
}

JsonResult ProtocolHandler::HandleToolsCall(const JsonRpcRequest& request) const {
    auto name = request.ToolName();
    auto tool = context_.Registry().GetTool(name);
    if (!tool) {
        return JsonResult::Err(
            RpcError{RpcErrorCode::MethodNotFound, "Tool not found: " + name});
    }

    LogInfo(kComponent, "Processing tools/call: " + name);

    auto params = ToToolParams(request.Arguments());
    auto output = tool->Execute(params);

    switch (tool->GetResponseType()) {
        case ResponseType::Json: {
            auto structured = nlohmann::json::parse(output, nullptr, false);
            if (structured.is_discarded()) {
                return JsonResult::Err(RpcError{
                    RpcErrorCode::Internal,
                    "Tool '" + name + "' returned invalid JSON"});
            }
            return JsonResult::Ok(
                ToolCallResult::Structured(std::move(structured)).ToJson());
        }
        case ResponseType::Markdown:
            return JsonResult::Ok(
                ToolCallResult::Resource(
                    kEmbeddedScheme + tool->ResultFileName(params),
                    kMarkdownMimeType, std::move(output))
                    .ToJson());
        case ResponseType::Text:
            break;
    }
    return JsonResult::Ok(ToolCallResult::Text(std::move(output)).ToJson());
}

} // namespace toolserve
