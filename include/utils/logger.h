#pragma once

#ifdef ERROR
#undef ERROR
#endif

#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace logq {
namespace utils {

/**
 * @brief Process-wide logger behind the LOGQ_* macros.
 *
 * Messages are dropped before init() and after shutdown(), so library code
 * and unit tests log unconditionally. The logger is swapped atomically:
 * tail session threads may still be logging while main() shuts it down.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    // Console sink always; file sink too when log_file is set
    static void init(const std::string& log_file = "", Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized();
    // nullptr while uninitialised
    static std::shared_ptr<spdlog::logger> get();

    static void setLevel(Level level);
    // INFO on unknown names
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void log(Level level, FormatString&& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace logq

#include "utils/logger_impl.h"

#define LOGQ_TRACE(...) ::logq::utils::Logger::log(::logq::utils::Logger::Level::TRACE, __VA_ARGS__)
#define LOGQ_DEBUG(...) ::logq::utils::Logger::log(::logq::utils::Logger::Level::DEBUG, __VA_ARGS__)
#define LOGQ_INFO(...) ::logq::utils::Logger::log(::logq::utils::Logger::Level::INFO, __VA_ARGS__)
#define LOGQ_WARN(...) ::logq::utils::Logger::log(::logq::utils::Logger::Level::WARN, __VA_ARGS__)
#define LOGQ_ERROR(...) ::logq::utils::Logger::log(::logq::utils::Logger::Level::ERROR, __VA_ARGS__)
#define LOGQ_CRITICAL(...) ::logq::utils::Logger::log(::logq::utils::Logger::Level::CRITICAL, __VA_ARGS__)
