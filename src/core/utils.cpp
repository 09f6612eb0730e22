#include "stack_clip/core/utils.hpp"
#include "stack_clip/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace stack_clip::core {

namespace {

std::tm split_time(std::time_t t, bool utc) {
    std::tm out;
    if (utc) {
        gmtime_r(&t, &out);
    } else {
        localtime_r(&t, &out);
    }
    return out;
}

// One alternation for the whole ';'-separated list, so a scan compiles once
std::regex compile_pattern_list(const std::string& pattern) {
    std::string re;
    for (const auto& part : split(pattern, ';')) {
        if (part.empty()) continue;
        if (!re.empty()) re += '|';
        re += "(?:";
        for (char c : part) {
            if (c == '*') {
                re += ".*";
            } else if (c == '?') {
                re += '.';
            } else if (c == '[' || c == ']') {
                re += c;
            } else if (std::string(".+(){}^$|\\").find(c) != std::string::npos) {
                re += '\\';
                re += c;
            } else {
                re += c;
            }
        }
        re += ')';
    }
    // an empty list matches nothing
    if (re.empty()) re = "(?!)";
    return std::regex(re, std::regex::icase);
}

} // namespace

std::string get_iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    const std::tm tm_utc = split_time(std::chrono::system_clock::to_time_t(now), true);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::string get_run_id() {
    const std::tm tm_local =
        split_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()), false);

    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dis;

    std::ostringstream oss;
    oss << std::put_time(&tm_local, "%Y%m%d_%H%M%S") << '_'
        << std::hex << std::setfill('0') << std::setw(8) << dis(rd);
    return oss.str();
}

std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern) {
    std::vector<fs::path> frames;
    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        return frames;
    }

    const std::regex re = compile_pattern_list(pattern);
    for (fs::directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && std::regex_match(it->path().filename().string(), re)) {
            frames.push_back(it->path());
        }
    }

    std::sort(frames.begin(), frames.end());
    return frames;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

bool glob_match(const std::string& pattern, const std::string& str) {
    return std::regex_match(str, compile_pattern_list(pattern));
}

long parse_integer(const std::string& text, long min_value, long max_value,
                   const std::string& what) {
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used, 10);
    } catch (const std::invalid_argument&) {
        throw ValidationError(what + ": not an integer: '" + text + "'");
    } catch (const std::out_of_range&) {
        throw ValidationError(what + ": out of range: '" + text + "'");
    }
    if (used != text.size()) {
        throw ValidationError(what + ": not an integer: '" + text + "'");
    }
    if (value < min_value || value > max_value) {
        throw ValidationError(what + ": " + text + " is outside [" + std::to_string(min_value) +
                              ", " + std::to_string(max_value) + "]");
    }
    return value;
}

int compute_worker_count(int requested, size_t task_count) {
    int workers = std::max(1, requested);
    const int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0 && task_count < static_cast<size_t>(workers)) {
        workers = static_cast<int>(task_count);
    }
    return workers;
}

} // namespace stack_clip::core
