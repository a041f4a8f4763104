#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace logq {
namespace utils {

/**
 * @brief Process configuration of logq_server.
 *
 * File layout (YAML or JSON):
 *   server:  { host, port, worker_threads }
 *   querier: { query_timeout_ms, tail_ping_period_ms, tail_max_delay_seconds }
 *   logging: { level, file }
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3100;
    size_t worker_threads = 0; // 0 = hardware concurrency

    std::chrono::milliseconds query_timeout{60000};
    std::chrono::milliseconds tail_ping_period{1000};
    uint32_t tail_max_delay_seconds = 5;

    std::string log_level = "info";
    std::string log_file;
};

// Reads a .yaml/.yml (converted to JSON) or JSON file.
// Throws std::runtime_error when the file cannot be read or parsed.
nlohmann::json loadConfigFile(const std::string& path);

// Converts a YAML document to the equivalent JSON value
nlohmann::json yamlToJson(const std::string& yaml_text);

// Overlays the known sections of `cfg` onto `config`. Throws
// std::runtime_error on wrong types or out-of-range values.
void applyConfig(const nlohmann::json& cfg, ServerConfig& config);

// First existing file among ./logq.yaml, ./logq.yml, ./logq.json, /etc/logq/config.yaml
std::optional<std::string> findDefaultConfig();
const std::vector<std::string>& defaultConfigPaths();

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<size_t> threads;
    std::optional<std::string> log_level;
    bool help = false;
};

// Throws std::runtime_error on unknown flags or bad values
CommandLine parseCommandLine(int argc, const char* const argv[]);
void applyCommandLine(const CommandLine& cmd, ServerConfig& config);
std::string usage(const std::string& program);

} // namespace utils
} // namespace logq
