#pragma once
#include "../tool.hpp"

namespace collab {

// Read line ranges from one or more files, returning the hashes later
// edits use as concurrency tokens.
class GetTextFileContentsTool : public Tool {
public:
    explicit GetTextFileContentsTool(ToolContext& context) : context_(context) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "get_text_file_contents"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ToolContext& context_;
};

} // namespace collab
