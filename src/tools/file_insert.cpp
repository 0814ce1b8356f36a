#include "file_insert.hpp"
#include "tool_util.hpp"

namespace collab {

Operation InsertTextFileContentsTool::build_operation(const nlohmann::json& args) const {
    InsertOp op;
    op.line = line_arg(args, "line", 1);
    op.contents = string_arg(args, "contents");
    op.expected_hash = optional_string(args, "expected_hash");
    return op;
}

std::string InsertTextFileContentsTool::description() const {
    return "Insert text before the given line of an existing file. Inserting at "
           "total_lines + 1 appends to the end.";
}

std::string InsertTextFileContentsTool::parameters_json() const {
    return file_tool_schema(
        R"("line":{"type":"integer","minimum":1,"description":"1-based line the text is inserted before"},)"
        R"("contents":{"type":"string","description":"Text to insert"},)"
        R"("expected_hash":{"type":"string","description":"file_hash from a previous read"})",
        R"("line","contents")");
}

} // namespace collab
