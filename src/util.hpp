#pragma once
#include <string>
#include <vector>

namespace collab {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// True for a non-empty relative path without ".." components
bool is_safe_relative_path(const std::string& path);

} // namespace collab
