#pragma once
#include "../tool.hpp"

namespace collab {

enum class GitCommand {
    Status,
    DiffUnstaged,
    DiffStaged,
    Diff,
    Commit,
    Reset,
    Log,
    Checkout,
    Show,
};

// One tool per git command, all operating on a checkout under the
// workspace's checkouts root.
class GitTool : public Tool {
public:
    GitTool(ToolContext& context, GitCommand command)
        : context_(context), command_(command) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override;
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ToolContext& context_;
    GitCommand command_;
};

// All git tools in registration order
std::vector<std::unique_ptr<Tool>> create_git_tools(ToolContext& context);

} // namespace collab
