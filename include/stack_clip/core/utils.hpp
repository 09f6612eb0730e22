#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace stack_clip::core {

namespace fs = std::filesystem;

// UTC, millisecond resolution: 2026-01-31T12:00:00.000Z
std::string get_iso_timestamp();
// Local time plus a random suffix: 20260131_120000_1a2b3c4d
std::string get_run_id();

// Regular files of input_dir whose names match the pattern list, sorted by path.
// A missing or unreadable directory yields an empty list.
std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern = "*.fit*");
std::string read_text(const fs::path& path);

std::string to_lower(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

// Case-insensitive glob match; "*.fits;*.fit" lists several patterns
bool glob_match(const std::string& pattern, const std::string& str);

// Whole-string decimal integer in [min_value, max_value]; anything else
// (fractions, exponents, trailing text, out of range) is a ValidationError.
long parse_integer(const std::string& text, long min_value, long max_value,
                   const std::string& what);

// Worker count for a parallel phase: requested, capped by cores and tasks
int compute_worker_count(int requested, size_t task_count);

} // namespace stack_clip::core
