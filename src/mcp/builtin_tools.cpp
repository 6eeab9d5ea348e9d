#include <toolserve/mcp/builtin_tools.hpp>

#include <toolserve/core/log.hpp>
#include <toolserve/mcp/schema_builder.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace toolserve {

namespace {

constexpr const char* kComponent = "tools";

namespace fs = std::filesystem;

std::string OptParam(const ToolParams& params, const std::string& key) {
    auto it = params.find(key);
    return it != params.end() ? it->second : "";
}

bool IsValidCheckId(const std::string& id) {
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// get_version
// ---------------------------------------------------------------------------
GetVersionTool::GetVersionTool(const ServerContext& context) : context_(context) {}

std::string GetVersionTool::Description() const {
    return "Get the version of the host application this server runs in";
}

std::string GetVersionTool::InputSchema() const {
    return SchemaBuilder::Object().Build();
}

std::string GetVersionTool::Execute(const ToolParams& /*params*/) {
    return context_.Info().host_version;
}

// ---------------------------------------------------------------------------
// get_server_status
// ---------------------------------------------------------------------------
GetServerStatusTool::GetServerStatusTool(const ServerContext& context)
    : context_(context) {}

std::string GetServerStatusTool::Description() const {
    return "Get MCP server status: name, version, protocol version, "
           "number of requests served and number of registered tools";
}

std::string GetServerStatusTool::InputSchema() const {
    return SchemaBuilder::Object().Build();
}

std::string GetServerStatusTool::Execute(const ToolParams& /*params*/) {
    const auto& info = context_.Info();
    nlohmann::json status = {
        {"name", info.name},
        {"version", info.version},
        {"protocol_version", info.protocol_version},
        {"host_version", info.host_version},
        {"request_count", context_.RequestCount()},
        {"tool_count", context_.Registry().Count()}
    };
    return status.dump();
}

// ---------------------------------------------------------------------------
// get_check_description
// ---------------------------------------------------------------------------
GetCheckDescriptionTool::GetCheckDescriptionTool(
    std::optional<std::string> checks_folder)
    : checks_folder_(std::move(checks_folder)) {}

std::string GetCheckDescriptionTool::Description() const {
    return "Get detailed description of a check by its ID. "
           "Returns markdown content with check explanation, examples, "
           "and how to fix.";
}

std::string GetCheckDescriptionTool::InputSchema() const {
    return SchemaBuilder::Object()
        .StringProperty("checkId",
                        "Check ID (e.g. 'begin-transaction', 'ql-temp-table-index')",
                        true)
        .Build();
}

std::string GetCheckDescriptionTool::ResultFileName(const ToolParams& params) const {
    auto check_id = OptParam(params, "checkId");
    if (!check_id.empty()) {
        return check_id + ".md";
    }
    return Name() + ".md";
}

std::string GetCheckDescriptionTool::Execute(const ToolParams& params) {
    auto check_id = OptParam(params, "checkId");
    if (check_id.empty()) {
        return "**Error:** checkId parameter is required";
    }
    if (!checks_folder_.has_value() || checks_folder_->empty()) {
        return "**Error:** Check descriptions folder is not configured.\n\n"
               "Set `checks_folder` in the config file or pass --checks-folder.";
    }

    std::error_code ec;
    const fs::path folder(*checks_folder_);
    if (!fs::is_directory(folder, ec)) {
        return "**Error:** Check descriptions folder does not exist: " +
               *checks_folder_;
    }

    // Also keeps the lookup inside the folder.
    if (!IsValidCheckId(check_id)) {
        return "**Error:** Invalid checkId format. Only alphanumeric characters, "
               "dashes and underscores are allowed.";
    }

    auto file = folder / (check_id + ".md");
    if (!fs::exists(file, ec)) {
        auto lower = folder / (ToLower(check_id) + ".md");
        if (!fs::exists(lower, ec)) {
            return "**Error:** Check description not found for: " + check_id;
        }
        file = lower;
    }

    auto content = ReadFile(file);
    if (!content.has_value()) {
        LogWarn(kComponent, "Failed to read " + file.string());
        return "**Error:** Failed to read check description for: " + check_id;
    }
    return *content;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
void RegisterBuiltinTools(ToolRegistry& registry,
                          const BuiltinToolOptions& options,
                          const ServerContext& context) {
    registry.Register(std::make_shared<GetVersionTool>(context));
    registry.Register(std::make_shared<GetServerStatusTool>(context));
    registry.Register(std::make_shared<GetCheckDescriptionTool>(options.checks_folder));
}

} // namespace toolserve
