#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "query/types.h"

namespace logq {
namespace server {

/**
 * @brief Multi-valued query-string parameters of one request.
 *
 * Decodes application/x-www-form-urlencoded text (%XX escapes, '+' as space).
 * Malformed escapes are kept literally.
 */
class QueryValues {
public:
    QueryValues() = default;

    // Accepts a full request target ("/path?a=1&b=2") or a bare query string
    static QueryValues parse(std::string_view target);

    void add(const std::string& name, const std::string& value);

    // First value, or "" when absent
    std::string get(const std::string& name) const;
    const std::vector<std::string>& all(const std::string& name) const;
    bool has(const std::string& name) const { return values_.count(name) > 0; }

private:
    std::map<std::string, std::vector<std::string>> values_;
};

std::string urlDecode(std::string_view text);

// Path part of a request target, without the query string
std::string_view targetPath(std::string_view target);

// The parsers below throw ApiError(InvalidParameter) on malformed input and
// return `def` when the parameter is missing or empty.

// Base-10 integer with optional sign
int64_t intParam(const QueryValues& values, const std::string& name, int64_t def);

/**
 * @brief Timestamp parameter.
 *
 * - contains '.': float seconds since epoch, fraction rounded to milliseconds
 * - integer of up to 10 characters: seconds since epoch
 * - longer integer: nanoseconds since epoch
 * - otherwise RFC3339 with optional fractional seconds
 */
query::Timestamp timestampParam(const QueryValues& values, const std::string& name, query::Timestamp def);

// FORWARD or BACKWARD, case-insensitive
query::Direction directionParam(const QueryValues& values, const std::string& name, query::Direction def);

// max(floor(seconds(end - start) / 250), 1), in seconds
int64_t defaultQueryRangeStep(query::Timestamp start, query::Timestamp end);

} // namespace server
} // namespace logq
