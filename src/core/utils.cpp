#include "lucky_stack/core/utils.hpp"
#include "lucky_stack/core/errors.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>

namespace lucky_stack::core {

std::string get_iso_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const long millis =
        static_cast<long>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                  utc.tm_sec, millis);
    return buf;
}

// <local date>_<local time>_<8 hex digits>
std::string get_run_id() {
    const std::time_t secs = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&secs, &local);

    std::random_device rd;
    std::uniform_int_distribution<unsigned> suffix(0, 0xffffffffu);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d_%08x", local.tm_year + 1900,
                  local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec,
                  suffix(rd));
    return buf;
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("cannot read " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("cannot write " + path.string());
    }
    out << text;
    if (!out) {
        throw IOError("write failed for " + path.string());
    }
}

std::string to_lower(const std::string& s) {
    std::string out(s);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

bool same_shape(const Matrix2Df& a, const Matrix2Df& b) {
    return a.rows() == b.rows() && a.cols() == b.cols();
}

std::string shape_string(const Matrix2Df& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

} // namespace lucky_stack::core
