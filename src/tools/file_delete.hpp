#pragma once
#include "file_tool.hpp"

namespace collab {

class DeleteTextFileContentsTool : public FileTool {
public:
    using FileTool::FileTool;
    std::string tool_name() const override { return "delete_text_file_contents"; }
    std::string description() const override;
    std::string parameters_json() const override;

protected:
    Operation build_operation(const nlohmann::json& args) const override;
};

} // namespace collab
