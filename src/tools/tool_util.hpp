#pragma once
#include "../tool.hpp"
#include "../edit_error.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace collab {

// Structured failure payload: {"error":{"kind":...,"message":...}}
inline ToolResult tool_error(const std::string& kind, const std::string& message) {
    nlohmann::json j = {{"error", {{"kind", kind}, {"message", message}}}};
    return ToolResult{false, j.dump()};
}

inline ToolResult tool_error(const EditError& e) {
    nlohmann::json err = {
        {"kind", error_kind_name(e.kind())},
        {"message", e.what()},
        {"retryable", is_retryable(e.kind())}
    };
    if (e.stale_range()) err["stale_range"] = true;
    nlohmann::json j = {{"error", err}};
    return ToolResult{false, j.dump()};
}

inline ToolResult invalid_argument(const std::string& message) {
    return tool_error(error_kind_name(ErrorKind::InvalidArgument), message);
}

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return invalid_argument(std::string("Failed to parse arguments: ") + e.what());
    }
    if (!out.is_object()) {
        return invalid_argument("Arguments must be a JSON object");
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return invalid_argument(std::string("Missing required parameter: ") + field);
    }
    return std::nullopt;
}

// Optional string field: absent or null -> nullopt, wrong type -> EditError
inline std::optional<std::string> optional_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_string()) {
        throw EditError(ErrorKind::InvalidArgument,
                        std::string("Parameter must be a string: ") + field);
    }
    return args[field].get<std::string>();
}

} // namespace collab
