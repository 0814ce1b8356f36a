#include "file_create.hpp"
#include "tool_util.hpp"

namespace collab {

Operation CreateTextFileTool::build_operation(const nlohmann::json& args) const {
    CreateOp op;
    op.contents = string_arg(args, "contents");
    if (args.contains("overwrite")) {
        if (!args["overwrite"].is_boolean()) {
            throw EditError(ErrorKind::InvalidArgument, "Parameter must be a boolean: overwrite");
        }
        op.overwrite = args["overwrite"].get<bool>();
    }
    op.expected_hash = optional_string(args, "expected_hash");
    return op;
}

std::string CreateTextFileTool::description() const {
    return "Create a new text file with the given contents. Fails if the file exists "
           "unless overwrite is true; when overwriting, pass the file_hash from a "
           "previous read as expected_hash to avoid clobbering unseen changes.";
}

std::string CreateTextFileTool::parameters_json() const {
    return file_tool_schema(
        R"("contents":{"type":"string","description":"Entire content of the new file"},)"
        R"json("overwrite":{"type":"boolean","description":"Replace an existing file (default false)"},)json"
        R"("expected_hash":{"type":"string","description":"file_hash of the existing file when overwriting"})",
        R"("contents")");
}

} // namespace collab
