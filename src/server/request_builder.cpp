#include "server/request_builder.h"
#include "query/logql.h"
#include "server/api_error.h"

#include <limits>
#include <regex>

#include <fmt/format.h>

namespace logq {
namespace server {

namespace {

uint32_t limitParam(const QueryValues& values) {
    int64_t limit = intParam(values, "limit", kDefaultQueryLimit);
    if (limit < 0 || limit > std::numeric_limits<uint32_t>::max()) {
        throw ApiError(ErrorKind::InvalidParameter,
            fmt::format("invalid limit '{}': must be between 0 and {}", limit, std::numeric_limits<uint32_t>::max()));
    }
    return static_cast<uint32_t>(limit);
}

} // namespace

Lookback buildLookback(const QueryValues& values, query::Timestamp now) {
    Lookback lb;
    lb.limit = limitParam(values);
    lb.start = timestampParam(values, "start", now - kDefaultSince);
    lb.end = timestampParam(values, "end", now);
    return lb;
}

RangeQueryRequest buildRangeQueryRequest(const QueryValues& values) {
    RangeQueryRequest req;
    req.query = values.get("query");

    auto lb = buildLookback(values, query::now());
    req.limit = lb.limit;
    req.start = lb.start;
    req.end = lb.end;

    int64_t step = intParam(values, "step", defaultQueryRangeStep(req.start, req.end));
    if (step <= 0) {
        throw ApiError(ErrorKind::InvalidParameter,
            "zero or negative query resolution step widths are not accepted. Try a positive integer");
    }
    if (step > std::numeric_limits<int64_t>::max() / 1000000000LL) {
        throw ApiError(ErrorKind::InvalidParameter, fmt::format("invalid step '{}': out of range", step));
    }
    req.step = std::chrono::seconds(step);

    req.direction = directionParam(values, "direction", query::Direction::BACKWARD);
    return req;
}

InstantQueryRequest buildInstantQueryRequest(const QueryValues& values) {
    InstantQueryRequest req;
    req.query = values.get("query");
    req.limit = limitParam(values);
    req.ts = timestampParam(values, "time", query::now());
    req.direction = directionParam(values, "direction", query::Direction::BACKWARD);
    return req;
}

RangeQueryRequest buildLogQueryRequest(const QueryValues& values) {
    RangeQueryRequest req = buildRangeQueryRequest(values);
    req.query = combineRegexp(req.query, values.get("regexp"));
    return req;
}

query::TailRequest buildTailRequest(const QueryValues& values, uint32_t max_delay_for) {
    query::TailRequest req;
    req.query = combineRegexp(values.get("query"), values.get("regexp"));

    auto lb = buildLookback(values, query::now());
    req.limit = lb.limit;
    req.start = lb.start;

    int64_t delay_for = intParam(values, "delay_for", 0);
    if (delay_for < 0) {
        throw ApiError(ErrorKind::InvalidParameter,
            fmt::format("invalid delay_for '{}': must not be negative", delay_for));
    }
    if (delay_for > max_delay_for) {
        throw ApiError(ErrorKind::DelayTooLarge,
            fmt::format("delay_for can't be greater than {}", max_delay_for));
    }
    req.delay_for = static_cast<uint32_t>(delay_for);
    return req;
}

query::LabelRequest buildLabelRequest(const QueryValues& values, const std::string& name) {
    query::LabelRequest req;
    req.name = name;
    req.values = !name.empty();
    req.end = timestampParam(values, "end", query::now());
    req.start = timestampParam(values, "start", query::addSaturating(req.end, -kDefaultLabelSince));
    return req;
}

std::string combineRegexp(const std::string& query, const std::string& regexp) {
    if (regexp.empty()) {
        return query;
    }
    query::LogQLParser parser;
    auto parsed = parser.parseLogSelector(query);
    if (!parsed.success) {
        throw ApiError(ErrorKind::InvalidParameter, parsed.error.toString());
    }
    const auto& selector = static_cast<const query::LogSelectorExpr&>(*parsed.expr);
    try {
        return query::withLineFilter(selector, query::FilterType::Regexp, regexp)->toString();
    } catch (const std::regex_error& e) {
        throw ApiError(ErrorKind::InvalidParameter,
            fmt::format("invalid regexp '{}': {}", regexp, e.what()));
    }
}

} // namespace server
} // namespace logq
