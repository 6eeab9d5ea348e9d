#pragma once

#include <toolserve/mcp/tool.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace toolserve {

// ---------------------------------------------------------------------------
// ToolRegistry: maps tool names to tools; shared by all request workers.
//
// Register/Clear take an exclusive lock and only happen while the server is
// (re)starting; lookups take a shared lock. Returned pointers keep the tool
// alive even if the registry is cleared during a call.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Inserts or replaces the tool registered under tool->Name().
    void Register(std::shared_ptr<ITool> tool);

    void Clear();

    // Returns nullptr when no tool has that name.
    [[nodiscard]] std::shared_ptr<ITool> GetTool(const std::string& name) const;

    // All tools ordered by name.
    [[nodiscard]] std::vector<std::shared_ptr<ITool>> GetAllTools() const;

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] std::size_t Count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<ITool>> tools_;
};

} // namespace toolserve
