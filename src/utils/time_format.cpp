#include "utils/time_format.h"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace logq {
namespace utils {

static inline time_t portable_mkgmtime(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

static inline void portable_gmtime_r(const time_t* t, std::tm* out) {
#ifdef _WIN32
    gmtime_s(out, t);
#else
    gmtime_r(t, out);
#endif
}

namespace {

constexpr int64_t kNanosPerSecond = 1000000000LL;

bool readDigits(std::string_view s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

bool isLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeap(year)) return 29;
    return days[month - 1];
}

} // namespace

std::optional<int64_t> parseRfc3339Nano(std::string_view s) {
    // Fixed prefix: YYYY-MM-DDTHH:MM:SS
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(s, 0, 4, year) || s.size() < 19 || s[4] != '-' ||
        !readDigits(s, 5, 2, month) || s[7] != '-' ||
        !readDigits(s, 8, 2, day) || s[10] != 'T' ||
        !readDigits(s, 11, 2, hour) || s[13] != ':' ||
        !readDigits(s, 14, 2, minute) || s[16] != ':' ||
        !readDigits(s, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t frac_nanos = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits >= 9) return std::nullopt;
            frac_nanos = frac_nanos * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t i = digits; i < 9; ++i) frac_nanos *= 10;
    }

    if (pos >= s.size()) return std::nullopt;
    int64_t offset_seconds = 0;
    if (s[pos] == 'Z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int oh = 0, om = 0;
        if (!readDigits(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !readDigits(s, pos + 4, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_seconds = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    int64_t secs = static_cast<int64_t>(portable_mkgmtime(&tm)) - offset_seconds;
    return secs * kNanosPerSecond + frac_nanos;
}

std::string formatRfc3339Nano(int64_t unix_nanos) {
    int64_t secs = unix_nanos / kNanosPerSecond;
    int64_t nanos = unix_nanos % kNanosPerSecond;
    if (nanos < 0) {
        nanos += kNanosPerSecond;
        secs -= 1;
    }
    time_t t = static_cast<time_t>(secs);
    std::tm tm{};
    portable_gmtime_r(&t, &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    std::string out(buf);
    if (nanos != 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), "%09lld", static_cast<long long>(nanos));
        std::string f(frac);
        while (!f.empty() && f.back() == '0') f.pop_back();
        out += "." + f;
    }
    out += "Z";
    return out;
}

} // namespace utils
} // namespace logq
