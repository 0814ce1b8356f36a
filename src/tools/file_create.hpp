#pragma once
#include "file_tool.hpp"

namespace collab {

class CreateTextFileTool : public FileTool {
public:
    using FileTool::FileTool;
    std::string tool_name() const override { return "create_text_file"; }
    std::string description() const override;
    std::string parameters_json() const override;

protected:
    Operation build_operation(const nlohmann::json& args) const override;
};

} // namespace collab
