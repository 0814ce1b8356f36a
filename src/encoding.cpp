#include "encoding.hpp"
#include "edit_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace collab {

namespace {

std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Decode one UTF-8 sequence at bytes[i]. Returns its length, or 0 if the
// sequence is malformed (overlong, surrogate, truncated or out of range).
size_t decode_utf8_at(const std::string& bytes, size_t i, uint32_t& cp) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(bytes[k]); };
    unsigned char c = byte(i);

    size_t len;
    uint32_t min;
    if (c < 0x80) {
        cp = c;
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        len = 2; cp = c & 0x1F; min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3; cp = c & 0x0F; min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4; cp = c & 0x07; min = 0x10000;
    } else {
        return 0;
    }

    if (i + len > bytes.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = byte(i + k);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    return len;
}

} // namespace

std::optional<Encoding> parse_encoding(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "utf-8" || n == "utf8") return Encoding::Utf8;
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1") return Encoding::Latin1;
    return std::nullopt;
}

const char* encoding_name(Encoding enc) {
    switch (enc) {
        case Encoding::Utf8:   return "utf-8";
        case Encoding::Latin1: return "latin-1";
    }
    return "unknown";
}

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        uint32_t cp = 0;
        size_t n = decode_utf8_at(bytes, i, cp);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

void check_decodable(const std::string& bytes, Encoding enc) {
    if (bytes.find('\0') != std::string::npos) {
        throw EditError(ErrorKind::EncodingError,
                        "File appears to be binary (contains NUL bytes)");
    }
    if (enc == Encoding::Utf8 && !is_valid_utf8(bytes)) {
        throw EditError(ErrorKind::EncodingError,
                        "File content is not valid utf-8");
    }
}

std::string decode_to_utf8(const std::string& bytes, Encoding enc) {
    if (enc == Encoding::Utf8) return bytes;

    std::string out;
    out.reserve(bytes.size() + bytes.size() / 4);
    for (unsigned char c : bytes) {
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

std::string encode_from_utf8(const std::string& text, Encoding enc) {
    if (text.find('\0') != std::string::npos) {
        throw EditError(ErrorKind::EncodingError, "Payload contains NUL bytes");
    }
    if (!is_valid_utf8(text)) {
        throw EditError(ErrorKind::EncodingError, "Payload is not valid utf-8");
    }
    if (enc == Encoding::Utf8) return text;

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = 0;
        i += decode_utf8_at(text, i, cp);
        if (cp > 0xFF) {
            throw EditError(ErrorKind::EncodingError,
                            "Payload contains characters not representable in latin-1");
        }
        out += static_cast<char>(cp);
    }
    return out;
}

} // namespace collab
