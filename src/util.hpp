#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace memkeep {

// ISO 8601 UTC timestamp with microseconds, e.g. 2024-05-01T12:00:00.123456Z
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Strict base-10 integer parse. Surrounding whitespace is allowed, anything
// else (empty, trailing junk, overflow) yields nullopt.
std::optional<int64_t> parse_int64(const std::string& s);

} // namespace memkeep
