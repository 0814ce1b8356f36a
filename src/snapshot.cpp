#include "snapshot.hpp"
#include "hash.hpp"
#include "line_index.hpp"

#include <utility>

namespace collab {

FileSnapshot::FileSnapshot(std::string path, Encoding encoding, std::string bytes)
    : path_(std::move(path)), encoding_(encoding), bytes_(std::move(bytes)) {
    check_decodable(bytes_, encoding_);
    LineIndex index = index_lines(bytes_);
    lines_ = std::move(index.lines);
    trailing_newline_ = index.trailing_newline;
    content_hash_ = content_digest(bytes_);
}

bool FileSnapshot::contains(const LineRange& range) const {
    return range.start >= 1 &&
           range.start <= range.end + 1 &&
           range.end + 1 <= lines_.size() + 1;
}

std::string FileSnapshot::range_bytes(const LineRange& range) const {
    std::string out;
    for (size_t i = range.start; i <= range.end; ++i) {
        out += lines_[i - 1];
    }
    return out;
}

} // namespace collab
