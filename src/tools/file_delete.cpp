#include "file_delete.hpp"
#include "tool_util.hpp"

namespace collab {

Operation DeleteTextFileContentsTool::build_operation(const nlohmann::json& args) const {
    if (!args.contains("ranges") || !args["ranges"].is_array()) {
        throw EditError(ErrorKind::InvalidArgument, "Missing required parameter: ranges");
    }
    DeleteOp op;
    for (const auto& r : args["ranges"]) {
        if (!r.is_object()) {
            throw EditError(ErrorKind::InvalidArgument, "Each range must be an object");
        }
        DeleteRange dr;
        dr.range.start = line_arg(r, "start", 1);
        dr.range.end = line_arg(r, "end", 0);
        dr.range_hash = optional_string(r, "range_hash");
        op.ranges.push_back(std::move(dr));
    }
    op.expected_hash = optional_string(args, "expected_hash");
    return op;
}

std::string DeleteTextFileContentsTool::description() const {
    return "Delete one or more inclusive line ranges. Pass the range_hash returned by "
           "get_text_file_contents for each range (or the whole-file expected_hash); "
           "a range whose lines changed since the read fails with a stale range conflict.";
}

std::string DeleteTextFileContentsTool::parameters_json() const {
    return file_tool_schema(
        R"("ranges":{"type":"array","items":{"type":"object","properties":{)"
        R"("start":{"type":"integer","minimum":1},"end":{"type":"integer","minimum":1},)"
        R"("range_hash":{"type":"string","description":"range_hash of these lines from a previous read"}},)"
        R"("required":["start","end"]}},)"
        R"("expected_hash":{"type":"string","description":"file_hash from a previous read; do not combine with range_hash"})",
        R"("ranges")");
}

} // namespace collab
