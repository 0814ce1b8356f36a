#pragma once
#include <string>

namespace collab {

// Resolves client-supplied names to paths under the checkouts root.
// Each client works in its own checkout, cloned from one upstream repository.
class Workspace {
public:
    Workspace(std::string repository, std::string checkouts_root);

    const std::string& repository() const { return repository_; }
    const std::string& checkouts_root() const { return checkouts_root_; }

    // Throws EditError(InvalidArgument) for empty, absolute or ".." names
    std::string checkout_dir(const std::string& checkout_path) const;

    // Path of `relative` inside the checkout, validated the same way. Also
    // InvalidArgument if a symlinked directory resolves it outside the checkout.
    std::string file_path(const std::string& checkout_path, const std::string& relative) const;

private:
    std::string repository_;
    std::string checkouts_root_;
};

} // namespace collab
