#pragma once

#include <string>
#include <vector>

// Expand a leading "~" and any $VAR / ${VAR} references in a path.
// Unknown variables are left untouched.
std::string expand_path(const std::string& path);

// Split text into trimmed, non-empty lines.
std::vector<std::string> split_lines(const std::string& text);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
