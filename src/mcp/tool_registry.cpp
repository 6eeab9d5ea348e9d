#include <toolserve/mcp/tool_registry.hpp>

#include <mutex>

namespace toolserve {

void ToolRegistry::Register(std::shared_ptr<ITool> tool) {
    if (!tool) return;
    auto name = tool->Name();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tools_[name] = std::move(tool);
}

void ToolRegistry::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tools_.clear();
}

std::shared_ptr<ITool> ToolRegistry::GetTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<ITool>> ToolRegistry::GetAllTools() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<ITool>> tools;
    tools.reserve(tools_.size());
    for (const auto& entry : tools_) {
        tools.push_back(entry.second);
    }
    return tools;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

std::size_t ToolRegistry::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

} // namespace toolserve
