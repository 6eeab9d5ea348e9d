#include <toolserve/mcp/tool.hpp>

#include <utility>

namespace toolserve {

FunctionTool::FunctionTool(std::string name, std::string description,
                           std::string input_schema, ToolHandler handler,
                           ResponseType response_type)
    : name_(std::move(name)),
      description_(std::move(description)),
      input_schema_(std::move(input_schema)),
      handler_(std::move(handler)),
      response_type_(response_type) {}

std::string FunctionTool::Execute(const ToolParams& params) {
    return handler_(params);
}

} // namespace toolserve
