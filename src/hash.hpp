#pragma once
#include <string>

namespace collab {

struct LineRange;
class FileSnapshot;

// Lowercase hex SHA-256 of the given bytes. Used as the optimistic
// concurrency token for whole files and for line ranges.
std::string content_digest(const std::string& bytes);

// Digest of the concatenated bytes of `range` in `snapshot`. An empty span
// hashes the empty string.
std::string range_digest(const FileSnapshot& snapshot, const LineRange& range);

enum class VerifyStatus { Ok, Conflict };

// Re-read `path` and compare its digest with `expected_hash`.
// Throws EditError(NotFound / IOFailure) if the file cannot be read.
VerifyStatus verify_file_hash(const std::string& path, const std::string& expected_hash);

} // namespace collab
