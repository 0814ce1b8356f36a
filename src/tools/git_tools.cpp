#include "git_tools.hpp"
#include "tool_util.hpp"
#include "../git.hpp"
#include <cstdint>
#include <filesystem>
#include <iostream>

namespace collab {

namespace {

constexpr int64_t kMaxLogCount = 10000;

constexpr const char* kCheckoutOnlySchema =
    R"({"type":"object","properties":{"checkout_path":{"type":"string","description":"Checkout name used with git_checkout"}},"required":["checkout_path"]})";

ToolResult git_failure(const std::string& message) {
    return tool_error("git_failure", message);
}

// Revision arguments that git would parse as options
bool looks_like_option(const std::string& revision) {
    return !revision.empty() && revision[0] == '-';
}

} // namespace

std::vector<std::unique_ptr<Tool>> create_git_tools(ToolContext& context) {
    std::vector<std::unique_ptr<Tool>> tools;
    for (GitCommand c : {GitCommand::Status, GitCommand::DiffUnstaged, GitCommand::DiffStaged,
                         GitCommand::Diff, GitCommand::Commit, GitCommand::Reset,
                         GitCommand::Log, GitCommand::Checkout, GitCommand::Show}) {
        tools.push_back(std::make_unique<GitTool>(context, c));
    }
    return tools;
}

ToolResult GitTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "checkout_path")) return *err;

    std::string checkout = args["checkout_path"].get<std::string>();
    std::string dir;
    try {
        dir = context_.workspace.checkout_dir(checkout);
    } catch (const EditError& e) {
        return tool_error(e);
    }

    try {
        if (command_ == GitCommand::Checkout) {
            if (std::filesystem::exists(dir)) {
                return tool_error(error_kind_name(ErrorKind::AlreadyExists),
                                  "Checkout already exists: " + checkout);
            }
            GitRepo repo = GitRepo::clone(context_.workspace.repository(), dir,
                                          context_.git_binary);
            repo.checkout_new_branch(checkout);
            std::cerr << "[git] Created checkout " << dir << "\n";
            return ToolResult{true, "Initialized new working checkout path: '" + checkout + "'"};
        }

        if (!std::filesystem::is_directory(dir)) {
            return tool_error(error_kind_name(ErrorKind::NotFound),
                              "Checkout not found: " + checkout + " (run git_checkout first)");
        }
        GitRepo repo(dir, context_.git_binary);

        switch (command_) {
            case GitCommand::Status:
                return ToolResult{true, "Repository status:\n" + repo.status()};
            case GitCommand::DiffUnstaged:
                return ToolResult{true, "Unstaged changes:\n" + repo.diff_unstaged()};
            case GitCommand::DiffStaged:
                return ToolResult{true, "Staged changes:\n" + repo.diff_staged()};
            case GitCommand::Diff: {
                if (auto err = require_string(args, "target")) return *err;
                std::string target = args["target"].get<std::string>();
                if (looks_like_option(target)) {
                    return invalid_argument("target must be a branch or commit, not an option: " +
                                            target);
                }
                return ToolResult{true, "Diff with " + target + ":\n" + repo.diff(target)};
            }
            case GitCommand::Commit: {
                if (auto err = require_string(args, "message")) return *err;
                std::string sha = repo.commit(args["message"].get<std::string>());
                return ToolResult{true, "Changes committed successfully with hash " + sha};
            }
            case GitCommand::Reset:
                repo.reset();
                return ToolResult{true, "All staged changes reset"};
            case GitCommand::Log: {
                int max_count = 10;
                if (args.contains("max_count")) {
                    if (!args["max_count"].is_number_integer() ||
                        args["max_count"].get<int64_t>() < 1 ||
                        args["max_count"].get<int64_t>() > kMaxLogCount) {
                        return invalid_argument("max_count must be an integer between 1 and " +
                                                std::to_string(kMaxLogCount));
                    }
                    max_count = static_cast<int>(args["max_count"].get<int64_t>());
                }
                std::string text = "Commit history:\n";
                auto entries = repo.log(max_count);
                for (size_t i = 0; i < entries.size(); ++i) {
                    if (i > 0) text += "\n";
                    text += entries[i];
                }
                return ToolResult{true, text};
            }
            case GitCommand::Show: {
                if (auto err = require_string(args, "revision")) return *err;
                std::string revision = args["revision"].get<std::string>();
                if (looks_like_option(revision)) {
                    return invalid_argument("revision must be a commit, not an option: " +
                                            revision);
                }
                return ToolResult{true, repo.show(revision)};
            }
            case GitCommand::Checkout:
                break;
        }
    } catch (const GitError& e) {
        std::cerr << "[git] " << tool_name() << " " << checkout << ": " << e.what() << "\n";
        return git_failure(e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        return tool_error(error_kind_name(ErrorKind::IOFailure), e.what());
    }
    return git_failure("Unsupported git command");
}

std::string GitTool::tool_name() const {
    switch (command_) {
        case GitCommand::Status:       return "git_status";
        case GitCommand::DiffUnstaged: return "git_diff_unstaged";
        case GitCommand::DiffStaged:   return "git_diff_staged";
        case GitCommand::Diff:         return "git_diff";
        case GitCommand::Commit:       return "git_commit";
        case GitCommand::Reset:        return "git_reset";
        case GitCommand::Log:          return "git_log";
        case GitCommand::Checkout:     return "git_checkout";
        case GitCommand::Show:         return "git_show";
    }
    return "git_unknown";
}

std::string GitTool::description() const {
    switch (command_) {
        case GitCommand::Status:       return "Shows the working tree status";
        case GitCommand::DiffUnstaged: return "Shows changes in the working directory that are not yet staged";
        case GitCommand::DiffStaged:   return "Shows changes that are staged for commit";
        case GitCommand::Diff:         return "Shows differences between branches or commits";
        case GitCommand::Commit:       return "Records changes to the repository";
        case GitCommand::Reset:        return "Unstages all staged changes";
        case GitCommand::Log:          return "Shows the commit logs";
        case GitCommand::Checkout:
            return "Checks out a new branch to begin work. The checkout path used here "
                   "must be the same as the one used in all other tools.";
        case GitCommand::Show:         return "Shows the contents of a commit";
    }
    return "";
}

std::string GitTool::parameters_json() const {
    switch (command_) {
        case GitCommand::Diff:
            return R"({"type":"object","properties":{"checkout_path":{"type":"string"},"target":{"type":"string","description":"Branch or commit to diff against"}},"required":["checkout_path","target"]})";
        case GitCommand::Commit:
            return R"({"type":"object","properties":{"checkout_path":{"type":"string"},"message":{"type":"string","description":"Commit message"}},"required":["checkout_path","message"]})";
        case GitCommand::Log:
            return R"({"type":"object","properties":{"checkout_path":{"type":"string"},"max_count":{"type":"integer","minimum":1,"default":10}},"required":["checkout_path"]})";
        case GitCommand::Show:
            return R"({"type":"object","properties":{"checkout_path":{"type":"string"},"revision":{"type":"string","description":"Commit to show"}},"required":["checkout_path","revision"]})";
        default:
            return kCheckoutOnlySchema;
    }
}

} // namespace collab
