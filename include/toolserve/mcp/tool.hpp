#pragma once

#include <functional>
#include <map>
#include <string>

namespace toolserve {

// String-keyed tool arguments. Array and object arguments arrive as their
// compact JSON text so tools can parse them back.
using ToolParams = std::map<std::string, std::string>;

// How the protocol handler wraps a tool's result string.
enum class ResponseType {
    Text,      // plain text content block
    Json,      // result is JSON, embedded as structuredContent
    Markdown,  // embedded text/markdown resource
};

// ---------------------------------------------------------------------------
// ITool: contract implemented by every MCP tool.
//
// Execute() runs synchronously on an HTTP worker thread and may be called
// concurrently. It should not throw: failures belong in the result string.
// ---------------------------------------------------------------------------
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual std::string Name() const = 0;
    [[nodiscard]] virtual std::string Description() const = 0;

    // JSON Schema (as text) describing the tool's arguments.
    [[nodiscard]] virtual std::string InputSchema() const = 0;

    [[nodiscard]] virtual ResponseType GetResponseType() const {
        return ResponseType::Text;
    }

    // File name used in the embedded:// URI of Markdown results.
    [[nodiscard]] virtual std::string ResultFileName(
        const ToolParams& /*params*/) const {
        return Name() + ".md";
    }

    virtual std::string Execute(const ToolParams& params) = 0;
};

using ToolHandler = std::function<std::string(const ToolParams& params)>;

// ---------------------------------------------------------------------------
// FunctionTool: ITool built from a handler function.
// ---------------------------------------------------------------------------
class FunctionTool : public ITool {
public:
    FunctionTool(std::string name, std::string description,
                 std::string input_schema, ToolHandler handler,
                 ResponseType response_type = ResponseType::Text);

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string Description() const override { return description_; }
    [[nodiscard]] std::string InputSchema() const override { return input_schema_; }
    [[nodiscard]] ResponseType GetResponseType() const override {
        return response_type_;
    }

    std::string Execute(const ToolParams& params) override;

private:
    std::string name_;
    std::string description_;
    std::string input_schema_;
    ToolHandler handler_;
    ResponseType response_type_;
};

} // namespace toolserve
