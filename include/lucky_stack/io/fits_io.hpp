#pragma once

#include "lucky_stack/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lucky_stack::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
};

bool is_fits_image_path(const fs::path& path);

// First image plane of the primary HDU.
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// Every plane of a NAXIS=3 cube (a 2-D file yields one frame).
std::pair<std::vector<Matrix2Df>, FitsHeader> read_fits_cube(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

void write_fits_cube(const fs::path& path, const std::vector<Matrix2Df>& frames,
                     const FitsHeader& header);

} // namespace lucky_stack::io
