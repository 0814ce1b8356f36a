#pragma once
#include <optional>
#include <string>

namespace collab {

// Text encodings a file may be edited in. Content is always kept as the
// raw on-disk bytes; conversion only happens at the tool boundary.
enum class Encoding {
    Utf8,
    Latin1,
};

// Accepts "utf-8", "utf8", "latin-1", "latin1", "iso-8859-1" (case-insensitive)
std::optional<Encoding> parse_encoding(const std::string& name);

const char* encoding_name(Encoding enc);

bool is_valid_utf8(const std::string& bytes);

// Throws EditError(EncodingError) if bytes are binary (contain NUL) or not
// valid in the given encoding.
void check_decodable(const std::string& bytes, Encoding enc);

// Raw file bytes -> UTF-8 text for the client
std::string decode_to_utf8(const std::string& bytes, Encoding enc);

// UTF-8 text from the client -> raw bytes in the file encoding.
// Throws EditError(EncodingError) for characters the encoding cannot hold.
std::string encode_from_utf8(const std::string& text, Encoding enc);

} // namespace collab
