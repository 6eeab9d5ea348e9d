#pragma once

#include <toolserve/mcp/server_context.hpp>
#include <toolserve/mcp/tool.hpp>
#include <toolserve/mcp/tool_registry.hpp>

#include <optional>
#include <string>

namespace toolserve {

struct BuiltinToolOptions {
    // Folder holding <checkId>.md files; unset disables the lookup.
    std::optional<std::string> checks_folder;
};

// get_version: host version string (text).
class GetVersionTool : public ITool {
public:
    explicit GetVersionTool(const ServerContext& context);

    [[nodiscard]] std::string Name() const override { return "get_version"; }
    [[nodiscard]] std::string Description() const override;
    [[nodiscard]] std::string InputSchema() const override;
    std::string Execute(const ToolParams& params) override;

private:
    const ServerContext& context_;
};

// get_server_status: identity, request count and tool count (JSON).
class GetServerStatusTool : public ITool {
public:
    explicit GetServerStatusTool(const ServerContext& context);

    [[nodiscard]] std::string Name() const override { return "get_server_status"; }
    [[nodiscard]] std::string Description() const override;
    [[nodiscard]] std::string InputSchema() const override;
    [[nodiscard]] ResponseType GetResponseType() const override { return ResponseType::Json; }
    std::string Execute(const ToolParams& params) override;

private:
    const ServerContext& context_;
};

// get_check_description: Markdown description of a check, read from
// <checks_folder>/<checkId>.md.
class GetCheckDescriptionTool : public ITool {
public:
    explicit GetCheckDescriptionTool(std::optional<std::string> checks_folder);

    [[nodiscard]] std::string Name() const override { return "get_check_description"; }
    [[nodiscard]] std::string Description() const override;
    [[nodiscard]] std::string InputSchema() const override;
    [[nodiscard]] ResponseType GetResponseType() const override {
        return ResponseType::Markdown;
    }
    [[nodiscard]] std::string ResultFileName(
        const ToolParams& params) const override;
    std::string Execute(const ToolParams& params) override;

private:
    std::optional<std::string> checks_folder_;
};

// Register all built-in tools. The context must outlive the registry's tools.
void RegisterBuiltinTools(ToolRegistry& registry,
                          const BuiltinToolOptions& options,
                          const ServerContext& context);

} // namespace toolserve
