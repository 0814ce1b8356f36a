#include "file_get.hpp"
#include "file_tool.hpp"
#include "tool_util.hpp"
#include <iostream>

namespace collab {

ToolResult GetTextFileContentsTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "checkout_path")) return *err;
    if (!args.contains("files") || !args["files"].is_array() || args["files"].empty()) {
        return invalid_argument("Missing required parameter: files");
    }

    std::string checkout = args["checkout_path"].get<std::string>();
    nlohmann::json out = nlohmann::json::object();
    std::string file;

    try {
        existing_checkout(context_.workspace, checkout);
        Encoding enc = encoding_arg(args, context_.default_encoding);
        for (const auto& f : args["files"]) {
            if (!f.is_object()) {
                throw EditError(ErrorKind::InvalidArgument, "Each entry of files must be an object");
            }
            file = string_arg(f, "file_path");

            GetOp op;
            if (f.contains("ranges")) {
                if (!f["ranges"].is_array()) {
                    throw EditError(ErrorKind::InvalidArgument, "ranges must be an array");
                }
                for (const auto& r : f["ranges"]) {
                    if (!r.is_object()) {
                        throw EditError(ErrorKind::InvalidArgument, "Each range must be an object");
                    }
                    GetRange gr;
                    gr.start = line_arg(r, "start", 1);
                    if (r.contains("end") && !r["end"].is_null()) gr.end = line_arg(r, "end", 0);
                    op.ranges.push_back(gr);
                }
            }

            EditRequest request{context_.workspace.file_path(checkout, file), enc, op};
            EditResult result = context_.editor.apply(request);

            nlohmann::json entry = {
                {"file_hash", result.file_hash},
                {"encoding", encoding_name(enc)},
                {"total_lines", result.total_lines},
                {"ranges", nlohmann::json::array()}
            };
            for (const auto& rc : result.ranges) {
                entry["ranges"].push_back({
                    {"start", rc.range.start},
                    {"end", rc.range.end},
                    {"content", rc.content},
                    {"range_hash", rc.range_hash},
                    {"content_size", rc.content_size}
                });
            }
            out[file] = std::move(entry);
        }
    } catch (const EditError& e) {
        std::cerr << "[editor] get_text_file_contents " << checkout << "/" << file
                  << " failed (" << error_kind_name(e.kind()) << "): " << e.what() << "\n";
        return tool_error(e);
    }

    return ToolResult{true, out.dump()};
}

std::string GetTextFileContentsTool::description() const {
    return "Read line ranges from text files. Returns each range's content with its "
           "range_hash, plus the file_hash of the whole file. Pass these hashes to the "
           "editing tools so edits fail instead of overwriting changes you have not seen. "
           "Line numbers are 1-based and inclusive; omit end to read to the end of file.";
}

std::string GetTextFileContentsTool::parameters_json() const {
    return R"({"type":"object","properties":{)"
           R"("checkout_path":{"type":"string","description":"Checkout name used with git_checkout"},)"
           R"("files":{"type":"array","items":{"type":"object","properties":{)"
           R"("file_path":{"type":"string","description":"Path of the file relative to the checkout"},)"
           R"("ranges":{"type":"array","items":{"type":"object","properties":{)"
           R"("start":{"type":"integer","minimum":1},"end":{"type":"integer","minimum":0}},)"
           R"("required":["start"]}}},"required":["file_path"]}},)"
           R"("encoding":{"type":"string","description":"Text encoding: utf-8 (default) or latin-1"}},)"
           R"("required":["checkout_path","files"]})";
}

} // namespace collab
