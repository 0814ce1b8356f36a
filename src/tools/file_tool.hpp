#pragma once
#include "../tool.hpp"
#include "../edit_types.hpp"
#include <nlohmann/json.hpp>

namespace collab {

// Base for the mutating text-file tools. Handles argument parsing, path
// resolution, error mapping and staging of the edited file; subclasses only
// turn their arguments into an Operation.
class FileTool : public Tool {
public:
    explicit FileTool(ToolContext& context) : context_(context) {}

    ToolResult execute(const std::string& args_json) override;

protected:
    // Throws EditError(InvalidArgument) for malformed arguments
    virtual Operation build_operation(const nlohmann::json& args) const = 0;

    ToolContext& context_;
};

// ── Argument helpers shared by the file tools ───────────────────

// "encoding" argument, or the configured default
Encoding encoding_arg(const nlohmann::json& args, Encoding fallback);

// Integer field >= min_value; throws EditError(InvalidArgument)
size_t line_arg(const nlohmann::json& obj, const char* field, size_t min_value);

// Required string field; throws EditError(InvalidArgument)
std::string string_arg(const nlohmann::json& obj, const char* field);

nlohmann::json range_json(const LineRange& range);

// Directory of an existing checkout; EditError(NotFound) if git_checkout
// has not created it yet
std::string existing_checkout(const Workspace& workspace, const std::string& checkout_path);

// Common schema fragments
std::string file_tool_schema(const std::string& extra_properties,
                             const std::string& extra_required);

} // namespace collab
