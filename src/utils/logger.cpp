#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cctype>
#include <iostream>
#include <vector>

#ifdef ERROR
#undef ERROR
#endif

namespace logq {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        }

        auto logger = std::make_shared<spdlog::logger>("logq", sinks.begin(), sinks.end());
        logger->set_level(detail::toSpdlogLevel(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
        // Errors from streaming sessions are the only signal after an upgrade
        logger->flush_on(spdlog::level::err);

        spdlog::set_default_logger(logger);
        std::atomic_store(&logger_, logger);
        logger->info("Logger initialized (level={}, file='{}')", levelToString(level), log_file);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (logger) {
        logger->flush();
        spdlog::shutdown();
    }
}

bool Logger::isInitialized() {
    return std::atomic_load(&logger_) != nullptr;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    return std::atomic_load(&logger_);
}

void Logger::setLevel(Level level) {
    if (auto logger = get()) {
        logger->set_level(detail::toSpdlogLevel(level));
    }
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s = lvl;
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace logq
