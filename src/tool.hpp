#pragma once
#include "range_editor.hpp"
#include "workspace.hpp"
#include <string>
#include <memory>
#include <vector>

namespace collab {

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// State shared by all tools of one server. Owned by the caller of
// create_builtin_tools and must outlive the tools.
struct ToolContext {
    Workspace workspace;
    RangeEditor editor;
    Encoding default_encoding = Encoding::Utf8;
    std::string git_binary = "git";
    bool auto_stage = true;
};

// Create all built-in tools
std::vector<std::unique_ptr<Tool>> create_builtin_tools(ToolContext& context);

} // namespace collab
