#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace logq {
namespace utils {

namespace detail {

inline spdlog::level::level_enum toSpdlogLevel(Logger::Level level) {
    switch (level) {
        case Logger::Level::TRACE: return spdlog::level::trace;
        case Logger::Level::DEBUG: return spdlog::level::debug;
        case Logger::Level::INFO: return spdlog::level::info;
        case Logger::Level::WARN: return spdlog::level::warn;
        case Logger::Level::ERROR: return spdlog::level::err;
        case Logger::Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace detail

template<typename FormatString, typename... Args>
void Logger::log(Level level, FormatString&& fmt, Args&&... args) {
    auto logger = std::atomic_load(&logger_);
    if (!logger) {
        return;
    }
    auto lvl = detail::toSpdlogLevel(level);
    // Skip formatting below the threshold
    if (!logger->should_log(lvl)) {
        return;
    }
    logger->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace logq
