#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace collab {

class GitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thin wrapper over the git command line for one working tree.
// Every method runs git synchronously and throws GitError on a non-zero exit,
// carrying git's own output.
class GitRepo {
public:
    explicit GitRepo(std::string dir, std::string git_binary = "git");

    // Clone `source` into `dest` and return the new working tree
    static GitRepo clone(const std::string& source, const std::string& dest,
                         const std::string& git_binary = "git");

    const std::string& dir() const { return dir_; }

    std::string status() const;
    std::string diff_unstaged() const;
    std::string diff_staged() const;
    std::string diff(const std::string& target) const;

    // Commit the index; returns the new commit's hash
    std::string commit(const std::string& message) const;

    void add(const std::vector<std::string>& paths) const;

    // Unstage everything, leaving the working tree as is
    void reset() const;

    // One formatted block per commit, newest first
    std::vector<std::string> log(int max_count = 10) const;

    // Header of `revision` followed by its patch against the first parent
    // (or against the empty tree for a root commit)
    std::string show(const std::string& revision) const;

    void checkout_new_branch(const std::string& branch) const;

    // Full SHA of the commit `revision` names. Names starting with '-' are
    // rejected so they can never reach git as options.
    std::string resolve_commit(const std::string& revision) const;

private:
    std::string run(const std::vector<std::string>& args) const;

    std::string dir_;
    std::string git_binary_;
};

} // namespace collab
