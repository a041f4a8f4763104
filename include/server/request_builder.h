#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "query/types.h"
#include "server/params.h"

namespace logq {
namespace server {

constexpr uint32_t kDefaultQueryLimit = 100;
constexpr std::chrono::hours kDefaultSince{1};
constexpr std::chrono::hours kDefaultLabelSince{6};
constexpr uint32_t kMaxDelayForInTailing = 5;

struct RangeQueryRequest {
    std::string query;
    query::Timestamp start;
    query::Timestamp end;
    std::chrono::nanoseconds step{0};
    uint32_t limit = kDefaultQueryLimit;
    query::Direction direction = query::Direction::BACKWARD;
};

struct InstantQueryRequest {
    std::string query;
    query::Timestamp ts;
    uint32_t limit = kDefaultQueryLimit;
    query::Direction direction = query::Direction::BACKWARD;
};

// limit / start / end shared by range, log and tail requests
struct Lookback {
    uint32_t limit = kDefaultQueryLimit;
    query::Timestamp start;
    query::Timestamp end;
};

// All builders throw ApiError (InvalidParameter / DelayTooLarge)

Lookback buildLookback(const QueryValues& values, query::Timestamp now);
RangeQueryRequest buildRangeQueryRequest(const QueryValues& values);
InstantQueryRequest buildInstantQueryRequest(const QueryValues& values);

// Range request whose query has the legacy `regexp` parameter folded in
RangeQueryRequest buildLogQueryRequest(const QueryValues& values);

query::TailRequest buildTailRequest(const QueryValues& values,
                                    uint32_t max_delay_for = kMaxDelayForInTailing);

// Empty name asks for label names, otherwise for the values of `name`
query::LabelRequest buildLabelRequest(const QueryValues& values, const std::string& name);

/**
 * @brief Appends `regexp` to a log selector as a |~ line filter and returns
 *        the canonical query text. Returns `query` unchanged when regexp is
 *        empty.
 */
std::string combineRegexp(const std::string& query, const std::string& regexp);

} // namespace server
} // namespace logq
