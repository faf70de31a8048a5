#pragma once
#include <string>
#include <cstdint>
#include <optional>

namespace embcache {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Parse a non-negative decimal integer. Returns nullopt on junk or overflow.
std::optional<uint64_t> parse_uint(const std::string& s);

// "1", "true", "yes", "on" (any case) -> true; "0", "false", "no", "off" -> false
std::optional<bool> parse_bool(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace embcache
