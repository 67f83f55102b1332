#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace flat_tune::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Entries of a directory in iteration order. Any filesystem failure while
// opening or walking the directory raises IOError naming the directory.
std::vector<fs::directory_entry> list_directory(const fs::path& dir);

// Math utilities
float compute_percentile(const Matrix2Df& data, float percentile);

// String utilities
std::string to_lower(const std::string& s);

// Glob pattern matching. Only the last path component of an expression may
// contain wildcards ('*', '?'); every other character matches literally.
bool glob_match(const std::string& pattern, const std::string& str);
std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern);
std::vector<fs::path> glob_expression(const std::string& expr);

} // namespace flat_tune::core
