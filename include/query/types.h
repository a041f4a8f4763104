#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace logq {
namespace query {

// Nanosecond-resolution wall clock time
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

Timestamp now();
Timestamp fromUnixNanos(int64_t nanos);
int64_t toUnixNanos(Timestamp ts);

// Timestamp arithmetic clamped to the int64 nanosecond range instead of overflowing
Timestamp addSaturating(Timestamp ts, std::chrono::nanoseconds d);
std::chrono::nanoseconds subSaturating(Timestamp a, Timestamp b);

enum class Direction { FORWARD, BACKWARD };

const char* directionName(Direction d);
// Exact, upper-case match against the enum names
std::optional<Direction> directionFromName(std::string_view name);

// Sorted label name -> value
using LabelSet = std::map<std::string, std::string>;

// Double-quoted string with escapes for quote, backslash and control characters
std::string quoteString(std::string_view s);

// Canonical label text: {app="x", env="prod"}
std::string labelsToString(const LabelSet& labels);

struct Entry {
    Timestamp timestamp;
    std::string line;
};

struct Stream {
    LabelSet labels;
    std::vector<Entry> entries;
};
using Streams = std::vector<Stream>;

struct Sample {
    LabelSet metric;
    Timestamp timestamp;
    double value = 0.0;
};
using Vector = std::vector<Sample>;

struct Point {
    Timestamp timestamp;
    double value = 0.0;
};

struct Series {
    LabelSet metric;
    std::vector<Point> points;
};
using Matrix = std::vector<Series>;

// Result of a query: log streams for log selectors, samples for metric queries
using QueryResult = std::variant<Streams, Vector, Matrix>;

const char* resultTypeName(const QueryResult& result);

struct DroppedEntry {
    Timestamp timestamp;
    LabelSet labels;
};

// One frame of a live tail
struct TailResponse {
    Streams streams;
    std::vector<DroppedEntry> dropped_entries;
};

struct TailRequest {
    std::string query;
    Timestamp start;
    uint32_t limit = 100;
    // Seconds the tailer holds entries back so late producers can be ordered
    uint32_t delay_for = 0;
};

struct LabelRequest {
    std::string name;
    bool values = false; // true: values of `name`, false: label names
    Timestamp start;
    Timestamp end;
};

struct LabelResponse {
    std::vector<std::string> values;
};

} // namespace query
} // namespace logq
