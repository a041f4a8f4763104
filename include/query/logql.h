#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "query/types.h"

namespace logq {
namespace query {

// ============================================================================
// AST
// ============================================================================

enum class ExprType {
    LogSelector,        // {app="x"} |= "err"
    RangeAggregation    // count_over_time({app="x"}[5m])
};

enum class MatchType {
    Equal,      // =
    NotEqual,   // !=
    Regexp,     // =~
    NotRegexp   // !~
};

enum class FilterType {
    Contains,       // |=
    NotContains,    // !=
    Regexp,         // |~
    NotRegexp       // !~
};

enum class RangeOp {
    CountOverTime,
    Rate
};

struct LabelMatcher {
    MatchType type = MatchType::Equal;
    std::string name;
    std::string value;
    std::shared_ptr<const std::regex> re; // anchored, set for (Not)Regexp

    bool matches(const std::string& label_value) const;
    std::string toString() const;
};

struct LineFilter {
    FilterType type = FilterType::Contains;
    std::string match;
    std::shared_ptr<const std::regex> re; // unanchored, set for (Not)Regexp

    bool matches(const std::string& line) const;
    std::string toString() const;
};

struct Expr {
    virtual ~Expr() = default;
    virtual ExprType getType() const = 0;
    // Canonical query text, accepted back by LogQLParser
    virtual std::string toString() const = 0;
};

struct LogSelectorExpr : Expr {
    std::vector<LabelMatcher> matchers;
    std::vector<LineFilter> filters;

    ExprType getType() const override { return ExprType::LogSelector; }
    std::string toString() const override;

    // Missing labels match as the empty string
    bool matchesLabels(const LabelSet& labels) const;
    bool matchesLine(const std::string& line) const;
};

struct RangeAggregationExpr : Expr {
    RangeOp op = RangeOp::CountOverTime;
    std::shared_ptr<LogSelectorExpr> selector;
    std::chrono::nanoseconds range{0};

    ExprType getType() const override { return ExprType::RangeAggregation; }
    std::string toString() const override;
};

// ============================================================================
// Parser
// ============================================================================

struct ParseError {
    std::string message;
    size_t position = 0;

    std::string toString() const {
        return "parse error at position " + std::to_string(position) + ": " + message;
    }
};

struct ParseResult {
    bool success = false;
    std::shared_ptr<Expr> expr;
    ParseError error;

    static ParseResult Success(std::shared_ptr<Expr> e) {
        ParseResult result;
        result.success = true;
        result.expr = std::move(e);
        return result;
    }

    static ParseResult Failure(std::string msg, size_t pos = 0) {
        ParseResult result;
        result.error.message = std::move(msg);
        result.error.position = pos;
        return result;
    }
};

class LogQLParser {
public:
    LogQLParser() = default;

    // Log selector or range aggregation
    ParseResult parse(const std::string& query);

    // Like parse(), but fails on anything other than a log selector
    ParseResult parseLogSelector(const std::string& query);
};

// Copy of `selector` with one more line filter appended
std::shared_ptr<LogSelectorExpr> withLineFilter(
    const LogSelectorExpr& selector, FilterType type, std::string match);

// "5m", "1h30m", "250ms"; the parser accepts d, h, m, s, ms units
std::optional<std::chrono::nanoseconds> parseDuration(std::string_view text);
std::string formatDuration(std::chrono::nanoseconds d);

} // namespace query
} // namespace logq
