#include "tool.hpp"
#include "tools/file_get.hpp"
#include "tools/file_create.hpp"
#include "tools/file_append.hpp"
#include "tools/file_insert.hpp"
#include "tools/file_delete.hpp"
#include "tools/file_patch.hpp"
#include "tools/git_tools.hpp"

namespace collab {

std::vector<std::unique_ptr<Tool>> create_builtin_tools(ToolContext& context) {
    std::vector<std::unique_ptr<Tool>> tools = create_git_tools(context);
    tools.push_back(std::make_unique<GetTextFileContentsTool>(context));
    tools.push_back(std::make_unique<CreateTextFileTool>(context));
    tools.push_back(std::make_unique<AppendTextFileContentsTool>(context));
    tools.push_back(std::make_unique<DeleteTextFileContentsTool>(context));
    tools.push_back(std::make_unique<InsertTextFileContentsTool>(context));
    tools.push_back(std::make_unique<PatchTextFileContentsTool>(context));
    return tools;
}

} // namespace collab
