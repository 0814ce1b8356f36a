#include "hash.hpp"
#include "file_io.hpp"
#include "snapshot.hpp"

#include <openssl/sha.h>

namespace collab {

std::string content_digest(const std::string& bytes) {
    static const char* hex = "0123456789abcdef";
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), hash);

    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : hash) {
        out += hex[b >> 4];
        out += hex[b & 0x0F];
    }
    return out;
}

std::string range_digest(const FileSnapshot& snapshot, const LineRange& range) {
    return content_digest(snapshot.range_bytes(range));
}

VerifyStatus verify_file_hash(const std::string& path, const std::string& expected_hash) {
    std::string current = content_digest(read_file_bytes(path));
    return current == expected_hash ? VerifyStatus::Ok : VerifyStatus::Conflict;
}

} // namespace collab
