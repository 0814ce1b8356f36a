#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <memory>

namespace collab {

// Find a tool by name, or nullptr
Tool* find_tool(const std::string& name,
                const std::vector<std::unique_ptr<Tool>>& tools);

// Execute a single tool call, finding the tool by name
ToolResult dispatch_tool(const std::string& name,
                         const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools);

} // namespace collab
