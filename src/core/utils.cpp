#include "flat_tune/core/utils.hpp"
#include "flat_tune/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

namespace flat_tune::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string(), path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string(), path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string(), path.string());
    }
}

std::vector<fs::directory_entry> list_directory(const fs::path& dir) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw IOError("Cannot list directory " + dir.string() + ": " + ec.message(),
                      dir.string());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        throw IOError("Failed listing directory " + dir.string() + ": " + ec.message(),
                      dir.string());
    }
    return entries;
}

// Linear interpolation between closest ranks.
float compute_percentile(const Matrix2Df& data, float percentile) {
    if (data.size() == 0) return 0.0f;

    std::vector<float> values(data.data(), data.data() + data.size());
    float clamped = std::min(std::max(percentile, 0.0f), 100.0f);
    double idx = clamped / 100.0 * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(idx);
    size_t upper = std::min(lower + 1, values.size() - 1);
    double frac = idx - static_cast<double>(lower);

    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(lower),
                     values.end());
    float lo = values[lower];
    float hi = lo;
    if (upper != lower) {
        hi = *std::min_element(values.begin() + static_cast<std::ptrdiff_t>(upper),
                               values.end());
    }
    return static_cast<float>(lo * (1.0 - frac) + hi * frac);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': case '+': case '(': case ')': case '{': case '}':
            case '^': case '$': case '|': case '\\': case '[': case ']':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern);
    return std::regex_match(str, re);
}

std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern) {
    std::vector<fs::path> matches;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return matches;
    }

    for (const auto& entry : list_directory(dir)) {
        std::string filename = entry.path().filename().string();
        if (glob_match(pattern, filename)) {
            matches.push_back(entry.path());
        }
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<fs::path> glob_expression(const std::string& expr) {
    fs::path p(expr);
    fs::path dir = p.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    std::vector<fs::path> files;
    for (const auto& match : glob(dir, p.filename().string())) {
        std::error_code ec;
        if (fs::is_regular_file(match, ec)) {
            files.push_back(match);
        }
    }
    return files;
}

} // namespace flat_tune::core
