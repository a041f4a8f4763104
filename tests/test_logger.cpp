#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "utils/logger.h"

using logq::utils::Logger;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelFromString("DEBUG"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::levelFromString("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("err"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("crit"), Logger::Level::CRITICAL);
    EXPECT_EQ(Logger::levelFromString("verbose"), Logger::Level::INFO);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::WARN), "warn");
}

TEST(LoggerTest, DropsMessagesWhileUninitialised) {
    ASSERT_FALSE(Logger::isInitialized());
    EXPECT_EQ(Logger::get(), nullptr);
    LOGQ_ERROR("Error in tail session {}: {}", 7, "dropped");
    Logger::setLevel(Logger::Level::TRACE);
    EXPECT_FALSE(Logger::isInitialized());
}

TEST(LoggerTest, FileSinkHonoursLevel) {
    auto path = std::filesystem::temp_directory_path() / "logq_logger_test.log";
    std::filesystem::remove(path);

    Logger::init(path.string(), Logger::Level::INFO);
    ASSERT_TRUE(Logger::isInitialized());

    LOGQ_DEBUG("hidden {}", "debug line");
    LOGQ_ERROR("Error writing to websocket: {}", "broken pipe");

    Logger::setLevel(Logger::Level::DEBUG);
    LOGQ_DEBUG("visible {}", "debug line");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());

    auto text = readFile(path);
    EXPECT_NE(text.find("Logger initialized (level=info"), std::string::npos);
    EXPECT_NE(text.find("Error writing to websocket: broken pipe"), std::string::npos);
    EXPECT_NE(text.find("visible debug line"), std::string::npos);
    EXPECT_EQ(text.find("hidden debug line"), std::string::npos);

    // Logging after shutdown is a no-op again
    LOGQ_INFO("after shutdown");
    EXPECT_EQ(readFile(path).find("after shutdown"), std::string::npos);
    std::filesystem::remove(path);
}
