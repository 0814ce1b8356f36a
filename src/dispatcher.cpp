#include "dispatcher.hpp"
#include "tools/tool_util.hpp"

namespace collab {

Tool* find_tool(const std::string& name,
                const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

ToolResult dispatch_tool(const std::string& name,
                         const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    Tool* tool = find_tool(name, tools);
    if (!tool) {
        return tool_error("unknown_tool", "Unknown tool: " + name);
    }
    return tool->execute(args_json);
}

} // namespace collab
