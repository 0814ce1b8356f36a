#include "file_append.hpp"
#include "tool_util.hpp"

namespace collab {

Operation AppendTextFileContentsTool::build_operation(const nlohmann::json& args) const {
    AppendOp op;
    op.contents = string_arg(args, "contents");
    op.expected_hash = optional_string(args, "expected_hash");
    return op;
}

std::string AppendTextFileContentsTool::description() const {
    return "Append text after the last line of an existing file. A missing final "
           "newline is added before the new content.";
}

std::string AppendTextFileContentsTool::parameters_json() const {
    return file_tool_schema(
        R"("contents":{"type":"string","description":"Text to append"},)"
        R"("expected_hash":{"type":"string","description":"file_hash from a previous read; the append fails with a conflict if the file changed"})",
        R"("contents")");
}

} // namespace collab
