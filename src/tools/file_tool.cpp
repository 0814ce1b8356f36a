#include "file_tool.hpp"
#include "tool_util.hpp"
#include "../git.hpp"
#include <cstdint>
#include <filesystem>
#include <iostream>

namespace collab {

Encoding encoding_arg(const nlohmann::json& args, Encoding fallback) {
    auto name = optional_string(args, "encoding");
    if (!name) return fallback;
    auto enc = parse_encoding(*name);
    if (!enc) {
        throw EditError(ErrorKind::InvalidArgument, "Unsupported encoding: " + *name);
    }
    return *enc;
}

size_t line_arg(const nlohmann::json& obj, const char* field, size_t min_value) {
    if (!obj.contains(field) || !obj[field].is_number_integer()) {
        throw EditError(ErrorKind::InvalidArgument,
                        std::string("Missing required integer parameter: ") + field);
    }
    int64_t v = obj[field].get<int64_t>();
    if (v < static_cast<int64_t>(min_value)) {
        throw EditError(ErrorKind::InvalidArgument,
                        std::string("Parameter ") + field + " must be >= " +
                        std::to_string(min_value));
    }
    return static_cast<size_t>(v);
}

std::string string_arg(const nlohmann::json& obj, const char* field) {
    if (!obj.contains(field) || !obj[field].is_string()) {
        throw EditError(ErrorKind::InvalidArgument,
                        std::string("Missing required parameter: ") + field);
    }
    return obj[field].get<std::string>();
}

std::string existing_checkout(const Workspace& workspace, const std::string& checkout_path) {
    std::string dir = workspace.checkout_dir(checkout_path);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw EditError(ErrorKind::NotFound,
                        "Checkout not found: " + checkout_path + " (run git_checkout first)");
    }
    return dir;
}

nlohmann::json range_json(const LineRange& range) {
    return {{"start", range.start}, {"end", range.end}};
}

std::string file_tool_schema(const std::string& extra_properties,
                             const std::string& extra_required) {
    std::string schema =
        R"({"type":"object","properties":{)"
        R"("checkout_path":{"type":"string","description":"Checkout name used with git_checkout"},)"
        R"("file_path":{"type":"string","description":"Path of the file relative to the checkout"},)"
        R"("encoding":{"type":"string","description":"Text encoding: utf-8 (default) or latin-1"})";
    if (!extra_properties.empty()) schema += "," + extra_properties;
    schema += R"(},"required":["checkout_path","file_path")";
    if (!extra_required.empty()) schema += "," + extra_required;
    schema += "]}";
    return schema;
}

ToolResult FileTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "checkout_path")) return *err;
    if (auto err = require_string(args, "file_path")) return *err;

    std::string checkout = args["checkout_path"].get<std::string>();
    std::string file = args["file_path"].get<std::string>();

    EditResult result;
    try {
        existing_checkout(context_.workspace, checkout);
        EditRequest request;
        request.path = context_.workspace.file_path(checkout, file);
        request.encoding = encoding_arg(args, context_.default_encoding);
        request.operation = build_operation(args);
        result = context_.editor.apply(request);
    } catch (const EditError& e) {
        std::cerr << "[editor] " << tool_name() << " " << checkout << "/" << file
                  << " failed (" << error_kind_name(e.kind()) << "): " << e.what() << "\n";
        return tool_error(e);
    }

    nlohmann::json out = {
        {"status", edit_status_name(result.status)},
        {"file_path", file},
        {"file_hash", result.file_hash},
        {"total_lines", result.total_lines},
        {"affected_ranges", nlohmann::json::array()}
    };
    for (const auto& r : result.affected) {
        out["affected_ranges"].push_back(range_json(r));
    }

    if (context_.auto_stage && result.status != EditStatus::Unchanged) {
        try {
            GitRepo repo(context_.workspace.checkout_dir(checkout), context_.git_binary);
            repo.add({file});
            out["staged"] = true;
        } catch (const GitError& e) {
            // The edit itself is committed; staging is best effort
            std::cerr << "[git] Failed to stage " << file << ": " << e.what() << "\n";
            out["staged"] = false;
            out["stage_error"] = e.what();
        }
    }

    return ToolResult{true, out.dump()};
}

} // namespace collab
