#pragma once
#include "encoding.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace collab {

// Inclusive, 1-indexed line span. `end == start - 1` is the empty span
// positioned before line `start`.
struct LineRange {
    size_t start = 1;
    size_t end = 0;

    bool empty() const { return end + 1 == start; }
    size_t count() const { return end + 1 - start; }
};

// Immutable view of a file as read at the start of one operation.
// Never cached across calls; edits build new content instead of
// modifying a snapshot.
class FileSnapshot {
public:
    // Throws EditError(EncodingError) if bytes are not text in `encoding`
    FileSnapshot(std::string path, Encoding encoding, std::string bytes);

    const std::string& path() const { return path_; }
    Encoding encoding() const { return encoding_; }
    const std::string& bytes() const { return bytes_; }
    const std::vector<std::string>& lines() const { return lines_; }
    size_t total_lines() const { return lines_.size(); }
    bool trailing_newline() const { return trailing_newline_; }
    const std::string& content_hash() const { return content_hash_; }

    // True if 1 <= start <= end + 1 <= total_lines + 1
    bool contains(const LineRange& range) const;

    // Raw bytes of the lines in `range`; range must satisfy contains()
    std::string range_bytes(const LineRange& range) const;

private:
    std::string path_;
    Encoding encoding_;
    std::string bytes_;
    std::vector<std::string> lines_;
    bool trailing_newline_ = false;
    std::string content_hash_;
};

} // namespace collab
