#include "file_patch.hpp"
#include "tool_util.hpp"

namespace collab {

Operation PatchTextFileContentsTool::build_operation(const nlohmann::json& args) const {
    if (!args.contains("patches") || !args["patches"].is_array()) {
        throw EditError(ErrorKind::InvalidArgument, "Missing required parameter: patches");
    }
    PatchOp op;
    for (const auto& p : args["patches"]) {
        if (!p.is_object()) {
            throw EditError(ErrorKind::InvalidArgument, "Each patch must be an object");
        }
        Hunk h;
        h.range.start = line_arg(p, "start", 1);
        h.range.end = line_arg(p, "end", 0);
        h.contents = string_arg(p, "contents");
        h.range_hash = optional_string(p, "range_hash");
        op.patches.push_back(std::move(h));
    }
    op.expected_hash = optional_string(args, "expected_hash");
    return op;
}

std::string PatchTextFileContentsTool::description() const {
    return "Replace inclusive line ranges with new text in one atomic step. Line numbers "
           "refer to the file as last read. Use end = start - 1 to insert without "
           "replacing. Each patch should carry the range_hash of its lines from "
           "get_text_file_contents; patches to other parts of the file made in the "
           "meantime do not invalidate it, but changes to or above the range do.";
}

std::string PatchTextFileContentsTool::parameters_json() const {
    return file_tool_schema(
        R"("patches":{"type":"array","items":{"type":"object","properties":{)"
        R"("start":{"type":"integer","minimum":1},"end":{"type":"integer","minimum":0},)"
        R"("contents":{"type":"string","description":"Replacement text"},)"
        R"("range_hash":{"type":"string","description":"range_hash of these lines from a previous read"}},)"
        R"("required":["start","end","contents"]}},)"
        R"("expected_hash":{"type":"string","description":"file_hash from a previous read; do not combine with range_hash"})",
        R"("patches")");
}

} // namespace collab
