#include "line_index.hpp"

namespace collab {

LineIndex index_lines(const std::string& bytes) {
    LineIndex index;
    size_t begin = 0;
    while (begin < bytes.size()) {
        size_t nl = bytes.find('\n', begin);
        if (nl == std::string::npos) {
            index.lines.push_back(bytes.substr(begin));
            break;
        }
        index.lines.push_back(bytes.substr(begin, nl - begin + 1));
        begin = nl + 1;
    }
    index.trailing_newline = !bytes.empty() && bytes.back() == '\n';
    return index;
}

std::string join_lines(const std::vector<std::string>& lines) {
    size_t total = 0;
    for (const auto& l : lines) total += l.size();
    std::string out;
    out.reserve(total);
    for (const auto& l : lines) out += l;
    return out;
}

std::string line_terminator(const std::string& line) {
    if (line.size() >= 2 && line.compare(line.size() - 2, 2, "\r\n") == 0) return "\r\n";
    if (!line.empty() && line.back() == '\n') return "\n";
    return "";
}

bool has_terminator(const std::string& line) {
    return !line.empty() && line.back() == '\n';
}

std::string detect_line_ending(const std::vector<std::string>& lines) {
    for (const auto& l : lines) {
        std::string t = line_terminator(l);
        if (!t.empty()) return t;
    }
    return "";
}

} // namespace collab
