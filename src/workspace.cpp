#include "workspace.hpp"
#include "edit_error.hpp"
#include "util.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace collab {

Workspace::Workspace(std::string repository, std::string checkouts_root)
    : repository_(std::move(repository)), checkouts_root_(std::move(checkouts_root)) {}

std::string Workspace::checkout_dir(const std::string& checkout_path) const {
    if (!is_safe_relative_path(checkout_path)) {
        throw EditError(ErrorKind::InvalidArgument,
                        "checkout_path must be a relative name without '..': " + checkout_path);
    }
    return (std::filesystem::path(checkouts_root_) / checkout_path).lexically_normal().string();
}

std::string Workspace::file_path(const std::string& checkout_path,
                                 const std::string& relative) const {
    if (!is_safe_relative_path(relative)) {
        throw EditError(ErrorKind::InvalidArgument,
                        "file_path must be relative to the checkout and must not contain '..': " +
                        relative);
    }
    std::filesystem::path root(checkout_dir(checkout_path));
    std::filesystem::path full = (root / relative).lexically_normal();

    // Symlinked directories inside the checkout must not lead out of it.
    // The last component is left to the editor, which refuses symlinks.
    std::error_code ec;
    auto real_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        throw EditError(ErrorKind::IOFailure,
                        "Failed to resolve checkout " + checkout_path + ": " + ec.message());
    }
    auto real_parent = std::filesystem::weakly_canonical(full.parent_path(), ec);
    if (ec) {
        throw EditError(ErrorKind::IOFailure,
                        "Failed to resolve " + relative + ": " + ec.message());
    }
    auto rel = real_parent.lexically_relative(real_root);
    if (rel.empty() || *rel.begin() == "..") {
        throw EditError(ErrorKind::InvalidArgument,
                        "file_path resolves outside the checkout: " + relative);
    }
    return full.string();
}

} // namespace collab
