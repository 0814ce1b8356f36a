#pragma once
#include "encoding.hpp"
#include "snapshot.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace collab {

// ── Operations ──────────────────────────────────────────────────
// Payload text in every operation is UTF-8 as received from the client.

struct GetRange {
    size_t start = 1;
    std::optional<size_t> end; // default: last line; clamped to the last line
};

struct GetOp {
    std::vector<GetRange> ranges;
};

struct CreateOp {
    std::string contents;
    bool overwrite = false;
    std::optional<std::string> expected_hash; // only checked when overwriting
};

struct AppendOp {
    std::string contents;
    std::optional<std::string> expected_hash;
};

struct InsertOp {
    size_t line = 1; // payload goes before this line; total + 1 appends
    std::string contents;
    std::optional<std::string> expected_hash;
};

struct DeleteRange {
    LineRange range;
    std::optional<std::string> range_hash;
};

struct DeleteOp {
    std::vector<DeleteRange> ranges;
    std::optional<std::string> expected_hash;
};

struct Hunk {
    LineRange range;
    std::string contents;
    std::optional<std::string> range_hash;
};

struct PatchOp {
    std::vector<Hunk> patches;
    std::optional<std::string> expected_hash;
};

using Operation = std::variant<GetOp, CreateOp, AppendOp, InsertOp, DeleteOp, PatchOp>;

struct EditRequest {
    std::string path;
    Encoding encoding = Encoding::Utf8;
    Operation operation;
};

// ── Results ─────────────────────────────────────────────────────

enum class EditStatus {
    Read,
    Created,
    Overwritten,
    Modified,
    Unchanged,
};

const char* edit_status_name(EditStatus status);

struct RangeContent {
    LineRange range;
    std::string content; // UTF-8
    std::string range_hash;
    size_t content_size = 0; // bytes on disk
};

struct EditResult {
    EditStatus status = EditStatus::Read;
    std::string file_hash;
    size_t total_lines = 0;
    std::vector<LineRange> affected; // line numbers in the resulting file
    std::vector<RangeContent> ranges; // Get only
};

} // namespace collab
