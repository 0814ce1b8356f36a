#pragma once
#include <string>
#include <vector>

namespace collab {

// Lines of a file, each keeping its original terminator ("\n", "\r\n", or
// nothing for an unterminated last line). Concatenating `lines` yields the
// original bytes exactly.
struct LineIndex {
    std::vector<std::string> lines;
    bool trailing_newline = false;
};

// Split raw bytes into lines. A lone '\r' is not a terminator.
LineIndex index_lines(const std::string& bytes);

// Concatenate lines back into file bytes
std::string join_lines(const std::vector<std::string>& lines);

// Terminator of a single line: "\r\n", "\n" or ""
std::string line_terminator(const std::string& line);

bool has_terminator(const std::string& line);

// Terminator of the first terminated line, or "" if no line is terminated
std::string detect_line_ending(const std::vector<std::string>& lines);

} // namespace collab
