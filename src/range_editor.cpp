#include "range_editor.hpp"
#include "edit_error.hpp"
#include "file_io.hpp"
#include "hash.hpp"
#include "line_index.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <type_traits>
#include <utility>

namespace collab {

namespace {

std::string range_label(const LineRange& r) {
    return std::to_string(r.start) + "-" + std::to_string(r.end);
}

} // namespace

const char* edit_status_name(EditStatus status) {
    switch (status) {
        case EditStatus::Read:        return "read";
        case EditStatus::Created:     return "created";
        case EditStatus::Overwritten: return "overwritten";
        case EditStatus::Modified:    return "modified";
        case EditStatus::Unchanged:   return "unchanged";
    }
    return "unknown";
}

std::optional<LineEndingPolicy> parse_line_ending_policy(const std::string& name) {
    if (name == "detect") return LineEndingPolicy::Detect;
    if (name == "lf") return LineEndingPolicy::Lf;
    if (name == "crlf") return LineEndingPolicy::Crlf;
    return std::nullopt;
}

RangeEditor::RangeEditor(EditorOptions options) : options_(std::move(options)) {}

EditResult RangeEditor::apply(const EditRequest& request) const {
    return std::visit([&](const auto& op) -> EditResult {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, GetOp>) {
            return get(request.path, request.encoding, op);
        } else if constexpr (std::is_same_v<T, CreateOp>) {
            return create(request.path, request.encoding, op);
        } else if constexpr (std::is_same_v<T, AppendOp>) {
            return append(request.path, request.encoding, op);
        } else if constexpr (std::is_same_v<T, InsertOp>) {
            return insert(request.path, request.encoding, op);
        } else if constexpr (std::is_same_v<T, DeleteOp>) {
            return remove(request.path, request.encoding, op);
        } else {
            static_assert(std::is_same_v<T, PatchOp>, "unhandled operation");
            return patch(request.path, request.encoding, op);
        }
    }, request.operation);
}

FileSnapshot RangeEditor::load(const std::string& path, Encoding enc) const {
    std::string bytes = read_file_bytes(path);
    if (bytes.size() > options_.max_file_size) {
        throw EditError(ErrorKind::InvalidArgument,
                        "File exceeds the maximum editable size (" +
                        std::to_string(options_.max_file_size) + " bytes): " + path);
    }
    return FileSnapshot(path, enc, std::move(bytes));
}

// ── Get ─────────────────────────────────────────────────────────

EditResult RangeEditor::get(const std::string& path, Encoding enc, const GetOp& op) const {
    FileSnapshot snapshot = load(path, enc);
    size_t total = snapshot.total_lines();

    EditResult result;
    result.status = EditStatus::Read;
    result.file_hash = snapshot.content_hash();
    result.total_lines = total;

    std::vector<GetRange> ranges = op.ranges;
    if (ranges.empty()) ranges.push_back(GetRange{});

    for (const auto& r : ranges) {
        size_t end = r.end ? std::min(*r.end, total) : total;
        LineRange range{r.start, end};
        if (r.start < 1 || r.start > end + 1) {
            throw EditError(ErrorKind::OutOfRange,
                            "Invalid line range " + std::to_string(r.start) + "-" +
                            (r.end ? std::to_string(*r.end) : std::string("EOF")) +
                            " for file with " + std::to_string(total) + " lines");
        }
        std::string bytes = snapshot.range_bytes(range);
        RangeContent rc;
        rc.range = range;
        rc.content = decode_to_utf8(bytes, enc);
        rc.range_hash = content_digest(bytes);
        rc.content_size = bytes.size();
        result.ranges.push_back(std::move(rc));
    }
    return result;
}

// ── Create ──────────────────────────────────────────────────────

EditResult RangeEditor::create(const std::string& path, Encoding enc, const CreateOp& op) const {
    std::string bytes = encode_from_utf8(op.contents, enc);

    std::error_code ec;
    auto st = std::filesystem::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw EditError(ErrorKind::IOFailure, "Failed to stat " + path + ": " + ec.message());
    }
    if (std::filesystem::is_symlink(st)) {
        throw EditError(ErrorKind::InvalidArgument, "Path is a symbolic link: " + path);
    }
    bool exists = std::filesystem::exists(st);
    if (exists && !op.overwrite) {
        throw EditError(ErrorKind::AlreadyExists, "File already exists: " + path);
    }

    EditResult result;
    if (exists) {
        // Raw bytes: overwriting does not require the old content to be text
        std::string current_hash = content_digest(read_file_bytes(path));
        if (op.expected_hash && *op.expected_hash != current_hash) {
            throw EditError(ErrorKind::Conflict,
                            "File hash mismatch - file has been modified since it was read: " + path);
        }
        if (options_.require_hash && !op.expected_hash) {
            throw EditError(ErrorKind::InvalidArgument,
                            "expected_hash is required to overwrite an existing file");
        }
        AtomicWriter writer(path);
        writer.write(bytes);
        writer.commit_replace(current_hash);
        result.status = EditStatus::Overwritten;
    } else {
        if (op.expected_hash) {
            throw EditError(ErrorKind::Conflict,
                            "File was removed since it was read: " + path);
        }
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty() && options_.create_directories) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw EditError(ErrorKind::IOFailure,
                                "Failed to create directories: " + ec.message());
            }
        }
        AtomicWriter writer(path);
        writer.write(bytes);
        writer.commit_new();
        result.status = EditStatus::Created;
    }

    result.file_hash = content_digest(bytes);
    result.total_lines = index_lines(bytes).lines.size();
    result.affected.push_back(LineRange{1, result.total_lines});
    return result;
}

// ── Append / Insert ─────────────────────────────────────────────

EditResult RangeEditor::append(const std::string& path, Encoding enc, const AppendOp& op) const {
    FileSnapshot snapshot = load(path, enc);
    size_t total = snapshot.total_lines();
    std::vector<Hunk> hunks{Hunk{LineRange{total + 1, total}, op.contents, std::nullopt}};
    return splice(snapshot, std::move(hunks), op.expected_hash, true);
}

EditResult RangeEditor::insert(const std::string& path, Encoding enc, const InsertOp& op) const {
    FileSnapshot snapshot = load(path, enc);
    size_t total = snapshot.total_lines();
    if (op.line < 1 || op.line > total + 1) {
        throw EditError(ErrorKind::OutOfRange,
                        "Insert position " + std::to_string(op.line) +
                        " is outside 1-" + std::to_string(total + 1));
    }
    std::vector<Hunk> hunks{Hunk{LineRange{op.line, op.line - 1}, op.contents, std::nullopt}};
    return splice(snapshot, std::move(hunks), op.expected_hash, true);
}

// ── Delete / Patch ──────────────────────────────────────────────

EditResult RangeEditor::remove(const std::string& path, Encoding enc, const DeleteOp& op) const {
    if (op.ranges.empty()) {
        throw EditError(ErrorKind::InvalidArgument, "At least one range is required");
    }
    FileSnapshot snapshot = load(path, enc);
    std::vector<Hunk> hunks;
    hunks.reserve(op.ranges.size());
    for (const auto& r : op.ranges) {
        hunks.push_back(Hunk{r.range, std::string(), r.range_hash});
    }
    return splice(snapshot, std::move(hunks), op.expected_hash, false);
}

EditResult RangeEditor::patch(const std::string& path, Encoding enc, const PatchOp& op) const {
    if (op.patches.empty()) {
        throw EditError(ErrorKind::InvalidArgument, "At least one patch is required");
    }
    FileSnapshot snapshot = load(path, enc);
    return splice(snapshot, op.patches, op.expected_hash, true);
}

std::string RangeEditor::added_terminator(const FileSnapshot& snapshot,
                                          const std::vector<std::string>& payload) const {
    switch (options_.line_ending) {
        case LineEndingPolicy::Lf:   return "\n";
        case LineEndingPolicy::Crlf: return "\r\n";
        case LineEndingPolicy::Detect: break;
    }
    std::string eol = detect_line_ending(snapshot.lines());
    if (eol.empty()) eol = detect_line_ending(payload);
    return eol.empty() ? "\n" : eol;
}

EditResult RangeEditor::splice(const FileSnapshot& snapshot,
                               std::vector<Hunk> hunks,
                               const std::optional<std::string>& expected_hash,
                               bool allow_empty) const {
    bool any_range_hash = std::any_of(hunks.begin(), hunks.end(),
                                      [](const Hunk& h) { return h.range_hash.has_value(); });
    bool all_range_hash = std::all_of(hunks.begin(), hunks.end(),
                                      [](const Hunk& h) { return h.range_hash.has_value(); });
    if (expected_hash && any_range_hash) {
        throw EditError(ErrorKind::InvalidArgument,
                        "Supply either expected_hash or range_hash, not both");
    }
    if (options_.require_hash && !expected_hash && !all_range_hash) {
        throw EditError(ErrorKind::InvalidArgument,
                        "A file hash or a range_hash for every range is required");
    }

    // Bounds, then overlap. All ranges refer to the snapshot's numbering.
    size_t total = snapshot.total_lines();
    for (const auto& h : hunks) {
        if (!allow_empty && h.range.start > h.range.end) {
            throw EditError(ErrorKind::OutOfRange,
                            "Invalid range " + range_label(h.range) +
                            ": start is greater than end");
        }
        if (!snapshot.contains(h.range)) {
            throw EditError(ErrorKind::OutOfRange,
                            "Invalid line range " + range_label(h.range) +
                            " for file with " + std::to_string(total) + " lines");
        }
    }
    std::sort(hunks.begin(), hunks.end(), [](const Hunk& a, const Hunk& b) {
        if (a.range.start != b.range.start) return a.range.start < b.range.start;
        return a.range.end < b.range.end;
    });
    for (size_t i = 1; i < hunks.size(); ++i) {
        const LineRange& prev = hunks[i - 1].range;
        const LineRange& cur = hunks[i].range;
        if (cur.start <= prev.end || cur.start == prev.start) {
            throw EditError(ErrorKind::OutOfRange,
                            "Overlapping ranges " + range_label(prev) + " and " +
                            range_label(cur));
        }
    }

    // Verify every token against the same read
    if (expected_hash && *expected_hash != snapshot.content_hash()) {
        throw EditError(ErrorKind::Conflict,
                        "File hash mismatch - file has been modified since it was read: " +
                        snapshot.path());
    }
    for (const auto& h : hunks) {
        if (h.range_hash && *h.range_hash != range_digest(snapshot, h.range)) {
            throw EditError(ErrorKind::Conflict,
                            "Stale range " + range_label(h.range) +
                            ": content has changed since it was read, re-read the range",
                            true);
        }
    }

    const auto& lines = snapshot.lines();
    std::vector<std::string> out;
    out.reserve(lines.size());
    std::vector<std::string> payload_lines;
    std::vector<LineRange> affected;
    size_t cursor = 0;

    for (const auto& h : hunks) {
        std::vector<std::string> payload =
            index_lines(encode_from_utf8(h.contents, snapshot.encoding())).lines;

        out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(cursor),
                   lines.begin() + static_cast<std::ptrdiff_t>(h.range.start - 1));
        size_t new_start = out.size() + 1;
        out.insert(out.end(), payload.begin(), payload.end());
        affected.push_back(LineRange{new_start, new_start + payload.size() - 1});
        payload_lines.insert(payload_lines.end(), payload.begin(), payload.end());
        cursor = h.range.end;
    }
    out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(cursor), lines.end());

    // Only the last line may stay unterminated
    std::string eol = added_terminator(snapshot, payload_lines);
    for (size_t i = 0; i + 1 < out.size(); ++i) {
        if (!has_terminator(out[i])) out[i] += eol;
    }

    std::string new_bytes = join_lines(out);

    EditResult result;
    result.total_lines = out.size();
    result.affected = std::move(affected);
    if (new_bytes == snapshot.bytes()) {
        result.status = EditStatus::Unchanged;
        result.file_hash = snapshot.content_hash();
        return result;
    }

    AtomicWriter writer(snapshot.path());
    writer.write(new_bytes);
    writer.commit_replace(snapshot.content_hash());

    result.status = EditStatus::Modified;
    result.file_hash = content_digest(new_bytes);
    return result;
}

} // namespace collab
