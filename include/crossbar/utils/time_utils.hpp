#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace crossbar::utils {

// Parses epoch seconds, "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" or the same with 'T'.
// Text is interpreted as UTC. Trailing fractional seconds and a 'Z' suffix are ignored.
std::optional<int64_t> parse_timestamp(const std::string& text);

// "YYYY-MM-DD HH:MM:SS" in UTC
std::string format_timestamp(int64_t timestamp);

// "YYYY-MM" in UTC
std::string month_key(int64_t timestamp);

} // namespace crossbar::utils
