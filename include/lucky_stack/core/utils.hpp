#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace lucky_stack::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);

// Shape helpers
bool same_shape(const Matrix2Df& a, const Matrix2Df& b);
std::string shape_string(const Matrix2Df& m);

} // namespace lucky_stack::core
