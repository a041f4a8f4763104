#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace logq {
namespace utils {

// Parses "2006-01-02T15:04:05.999999999Z07:00" style timestamps (fraction
// optional, 1-9 digits; zone 'Z' or +hh:mm / -hh:mm). Returns Unix nanoseconds.
std::optional<int64_t> parseRfc3339Nano(std::string_view text);

// Formats Unix nanoseconds in UTC with trailing zeros of the fraction trimmed,
// e.g. "2019-01-01T00:00:01.5Z" or "2019-01-01T00:00:01Z".
std::string formatRfc3339Nano(int64_t unix_nanos);

} // namespace utils
} // namespace logq
