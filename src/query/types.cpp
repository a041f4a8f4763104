#include "query/types.h"

#include <cstdio>
#include <limits>

namespace logq {
namespace query {

Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
}

Timestamp fromUnixNanos(int64_t nanos) {
    return Timestamp(std::chrono::nanoseconds(nanos));
}

int64_t toUnixNanos(Timestamp ts) {
    return static_cast<int64_t>(ts.time_since_epoch().count());
}

Timestamp addSaturating(Timestamp ts, std::chrono::nanoseconds d) {
    using Rep = std::chrono::nanoseconds::rep;
    Rep a = ts.time_since_epoch().count();
    Rep b = d.count();
    if (b > 0 && a > std::numeric_limits<Rep>::max() - b) {
        return Timestamp::max();
    }
    if (b < 0 && a < std::numeric_limits<Rep>::min() - b) {
        return Timestamp::min();
    }
    return ts + d;
}

std::chrono::nanoseconds subSaturating(Timestamp a, Timestamp b) {
    using Rep = std::chrono::nanoseconds::rep;
    Rep x = a.time_since_epoch().count();
    Rep y = b.time_since_epoch().count();
    if (y < 0 && x > std::numeric_limits<Rep>::max() + y) {
        return std::chrono::nanoseconds::max();
    }
    if (y > 0 && x < std::numeric_limits<Rep>::min() + y) {
        return std::chrono::nanoseconds::min();
    }
    return a - b;
}

const char* directionName(Direction d) {
    switch (d) {
        case Direction::FORWARD: return "FORWARD";
        case Direction::BACKWARD: return "BACKWARD";
    }
    return "FORWARD";
}

std::optional<Direction> directionFromName(std::string_view name) {
    if (name == "FORWARD") return Direction::FORWARD;
    if (name == "BACKWARD") return Direction::BACKWARD;
    return std::nullopt;
}

std::string quoteString(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
    return out;
}

std::string labelsToString(const LabelSet& labels) {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : labels) {
        if (!first) out += ", ";
        first = false;
        out += name;
        out += '=';
        out += quoteString(value);
    }
    out += '}';
    return out;
}

const char* resultTypeName(const QueryResult& result) {
    switch (result.index()) {
        case 0: return "streams";
        case 1: return "vector";
        case 2: return "matrix";
    }
    return "streams";
}

} // namespace query
} // namespace logq
