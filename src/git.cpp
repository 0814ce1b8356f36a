#include "git.hpp"
#include "process.hpp"
#include "util.hpp"

#include <utility>

namespace collab {

namespace {

// git's well-known empty tree object
constexpr const char* kEmptyTree = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

constexpr const char* kCommitFormat =
    "Commit: %H%nAuthor: %an%nDate: %ad%nMessage: %B";

std::string failure_message(const std::vector<std::string>& args, const ProcessResult& r) {
    std::string cmd = "git";
    for (const auto& a : args) cmd += " " + a;
    std::string detail = trim(r.err.empty() ? r.out : r.err);
    if (detail.empty()) detail = "exit code " + std::to_string(r.exit_code);
    return cmd + " failed: " + detail;
}

} // namespace

GitRepo::GitRepo(std::string dir, std::string git_binary)
    : dir_(std::move(dir)), git_binary_(std::move(git_binary)) {}

GitRepo GitRepo::clone(const std::string& source, const std::string& dest,
                       const std::string& git_binary) {
    std::vector<std::string> args = {"clone", "--quiet", source, dest};
    std::vector<std::string> argv = {git_binary};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcessResult r = run_process(argv);
    if (!r.ok()) throw GitError(failure_message(args, r));
    return GitRepo(dest, git_binary);
}

std::string GitRepo::run(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {git_binary_, "-C", dir_};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcessResult r = run_process(argv);
    if (!r.ok()) throw GitError(failure_message(args, r));
    return r.out;
}

std::string GitRepo::status() const {
    return run({"status"});
}

std::string GitRepo::diff_unstaged() const {
    return run({"diff"});
}

std::string GitRepo::diff_staged() const {
    return run({"diff", "--cached"});
}

std::string GitRepo::resolve_commit(const std::string& revision) const {
    if (revision.empty() || revision[0] == '-') {
        throw GitError("Invalid revision: '" + revision + "'");
    }
    return trim(run({"rev-parse", "--verify", "--end-of-options",
                     revision + "^{commit}"}));
}

std::string GitRepo::diff(const std::string& target) const {
    return run({"diff", resolve_commit(target), "--"});
}

std::string GitRepo::commit(const std::string& message) const {
    run({"commit", "--quiet", "-m", message});
    return trim(run({"rev-parse", "HEAD"}));
}

void GitRepo::add(const std::vector<std::string>& paths) const {
    std::vector<std::string> args = {"add", "--"};
    args.insert(args.end(), paths.begin(), paths.end());
    run(args);
}

void GitRepo::reset() const {
    run({"reset", "--quiet"});
}

std::vector<std::string> GitRepo::log(int max_count) const {
    // Record separator in front of each entry, since messages span lines
    std::string out = run({"log", "--max-count=" + std::to_string(max_count),
                           "--date=iso", std::string("--format=%x1e") + kCommitFormat});
    std::vector<std::string> entries;
    for (const auto& entry : split(out, '\x1e')) {
        if (trim(entry).empty()) continue;
        entries.push_back(entry);
    }
    return entries;
}

std::string GitRepo::show(const std::string& revision) const {
    std::string sha = resolve_commit(revision);
    std::string output = run({"show", "--no-patch", "--date=iso",
                              std::string("--format=") + kCommitFormat, sha});

    // "<sha> <parent1> <parent2>..."
    auto parents = split(trim(run({"rev-list", "--parents", "-n", "1", sha})), ' ');
    std::string base = parents.size() > 1 ? parents[1] : kEmptyTree;
    output += "\n";
    output += run({"diff", base, sha});
    return output;
}

void GitRepo::checkout_new_branch(const std::string& branch) const {
    run({"checkout", "--quiet", "-b", branch});
}

} // namespace collab
