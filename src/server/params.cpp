#include "server/params.h"
#include "server/api_error.h"
#include "utils/time_format.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

#include <fmt/format.h>

namespace logq {
namespace server {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseInt64(std::string_view s, int64_t& out) {
    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }
    if (i == s.size()) {
        return false;
    }
    // Accumulate negatively so INT64_MIN is representable
    int64_t acc = 0;
    const int64_t min = std::numeric_limits<int64_t>::min();
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
        int digit = s[i] - '0';
        if (acc < (min + digit) / 10) {
            return false;
        }
        acc = acc * 10 - digit;
    }
    if (!negative) {
        if (acc == min) {
            return false;
        }
        acc = -acc;
    }
    out = acc;
    return true;
}

bool parseFloat(const std::string& s, double& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) {
        return false;
    }
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) {
        return false;
    }
    out = v;
    return true;
}

constexpr int64_t kNanosPerSecond = 1000000000LL;

bool secondsToNanos(int64_t secs, int64_t nanos, int64_t& out) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    if (secs > max / kNanosPerSecond || secs < min / kNanosPerSecond) {
        return false;
    }
    int64_t base = secs * kNanosPerSecond;
    if ((nanos > 0 && base > max - nanos) || (nanos < 0 && base < min - nanos)) {
        return false;
    }
    out = base + nanos;
    return true;
}

} // namespace

QueryValues QueryValues::parse(std::string_view target) {
    QueryValues values;
    auto qpos = target.find('?');
    std::string_view query = qpos == std::string_view::npos ? target : target.substr(qpos + 1);
    if (qpos == std::string_view::npos && !query.empty() && query.front() == '/') {
        return values;
    }
    auto hash = query.find('#');
    if (hash != std::string_view::npos) {
        query = query.substr(0, hash);
    }

    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        std::string name = urlDecode(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string() : urlDecode(pair.substr(eq + 1));
        values.add(name, value);
    }
    return values;
}

void QueryValues::add(const std::string& name, const std::string& value) {
    values_[name].push_back(value);
}

std::string QueryValues::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end() || it->second.empty()) {
        return "";
    }
    return it->second.front();
}

const std::vector<std::string>& QueryValues::all(const std::string& name) const {
    static const std::vector<std::string> empty;
    auto it = values_.find(name);
    return it == values_.end() ? empty : it->second;
}

std::string urlDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string_view targetPath(std::string_view target) {
    auto qpos = target.find('?');
    return qpos == std::string_view::npos ? target : target.substr(0, qpos);
}

int64_t intParam(const QueryValues& values, const std::string& name, int64_t def) {
    std::string value = values.get(name);
    if (value.empty()) {
        return def;
    }
    int64_t parsed = 0;
    if (!parseInt64(value, parsed)) {
        throw ApiError(ErrorKind::InvalidParameter,
            fmt::format("invalid {} '{}': not a base-10 integer", name, value));
    }
    return parsed;
}

query::Timestamp timestampParam(const QueryValues& values, const std::string& name, query::Timestamp def) {
    std::string value = values.get(name);
    if (value.empty()) {
        return def;
    }

    if (value.find('.') != std::string::npos) {
        double t = 0;
        // Out-of-range floats fall through to the integer/RFC3339 attempts
        if (parseFloat(value, t) && std::isfinite(t) && std::fabs(t) < 9.2e9) {
            double whole = 0;
            double frac = std::modf(t, &whole);
            frac = std::round(frac * 1000) / 1000;
            int64_t nanos = 0;
            if (secondsToNanos(static_cast<int64_t>(whole), static_cast<int64_t>(frac * 1e9), nanos)) {
                return query::fromUnixNanos(nanos);
            }
        }
    }

    int64_t n = 0;
    if (!parseInt64(value, n)) {
        if (auto ts = utils::parseRfc3339Nano(value)) {
            return query::fromUnixNanos(*ts);
        }
        throw ApiError(ErrorKind::InvalidParameter,
            fmt::format("invalid {} '{}': not a unix timestamp or RFC3339 time", name, value));
    }

    if (value.size() <= 10) {
        int64_t nanos = 0;
        if (!secondsToNanos(n, 0, nanos)) {
            throw ApiError(ErrorKind::InvalidParameter,
                fmt::format("invalid {} '{}': timestamp out of range", name, value));
        }
        return query::fromUnixNanos(nanos);
    }
    return query::fromUnixNanos(n);
}

query::Direction directionParam(const QueryValues& values, const std::string& name, query::Direction def) {
    std::string value = values.get(name);
    if (value.empty()) {
        return def;
    }
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto d = query::directionFromName(upper);
    if (!d) {
        throw ApiError(ErrorKind::InvalidParameter, fmt::format("invalid direction '{}'", value));
    }
    return *d;
}

int64_t defaultQueryRangeStep(query::Timestamp start, query::Timestamp end) {
    double secs = std::chrono::duration<double>(query::subSaturating(end, start)).count();
    return static_cast<int64_t>(std::max(std::floor(secs / 250), 1.0));
}

} // namespace server
} // namespace logq
