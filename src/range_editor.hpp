#pragma once
#include "edit_types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace collab {

// Terminator used when an edit has to end a previously unterminated line
enum class LineEndingPolicy {
    Detect, // the file's own terminator, else the payload's, else "\n"
    Lf,
    Crlf,
};

std::optional<LineEndingPolicy> parse_line_ending_policy(const std::string& name);

struct EditorOptions {
    LineEndingPolicy line_ending = LineEndingPolicy::Detect;
    size_t max_file_size = 10 * 1024 * 1024;
    bool require_hash = false;       // reject mutations of existing files without a token
    bool create_directories = true;  // Create makes missing parent directories
};

// Line-range editing engine with content-hash optimistic concurrency.
//
// Every call reads the file fresh, verifies the caller's token against that
// read, computes the new content and commits it through AtomicWriter with a
// compare-and-swap on the hash of what was read. Nothing is cached between
// calls and an edit is either fully visible or not at all.
//
// Tokens: Patch and Delete take a range_hash per range (the digest of the
// target lines as last read), so edits to disjoint ranges derived from the
// same read do not conflict. A whole-file expected_hash is the coarse
// alternative and the only token for Create, Append and Insert. A request
// carries one kind of token, never both.
class RangeEditor {
public:
    explicit RangeEditor(EditorOptions options = {});

    // Throws EditError for every failure in the error taxonomy
    EditResult apply(const EditRequest& request) const;

    EditResult get(const std::string& path, Encoding enc, const GetOp& op) const;
    EditResult create(const std::string& path, Encoding enc, const CreateOp& op) const;
    EditResult append(const std::string& path, Encoding enc, const AppendOp& op) const;
    EditResult insert(const std::string& path, Encoding enc, const InsertOp& op) const;
    EditResult remove(const std::string& path, Encoding enc, const DeleteOp& op) const;
    EditResult patch(const std::string& path, Encoding enc, const PatchOp& op) const;

    const EditorOptions& options() const { return options_; }

private:
    FileSnapshot load(const std::string& path, Encoding enc) const;

    // Validate, verify and apply hunks against one snapshot, then commit.
    // `allow_empty` is false for Delete, whose ranges must select lines.
    EditResult splice(const FileSnapshot& snapshot,
                      std::vector<Hunk> hunks,
                      const std::optional<std::string>& expected_hash,
                      bool allow_empty) const;

    std::string added_terminator(const FileSnapshot& snapshot,
                                 const std::vector<std::string>& payload) const;

    EditorOptions options_;
};

} // namespace collab
