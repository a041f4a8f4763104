#include "utils/config.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace logq {
namespace utils {

using json = nlohmann::json;

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

json nodeToJson(const YAML::Node& n) {
    if (!n || n.IsNull()) {
        return nullptr;
    }
    if (n.IsScalar()) {
        const std::string& text = n.Scalar();
        // Quoted scalars stay strings
        if (n.Tag() == "!") {
            return text;
        }
        auto lower = toLower(text);
        if (lower == "true") return true;
        if (lower == "false") return false;
        long long i = 0;
        if (YAML::convert<long long>::decode(n, i)) return i;
        double d = 0;
        if (YAML::convert<double>::decode(n, d)) return d;
        return text;
    }
    if (n.IsSequence()) {
        json arr = json::array();
        for (const auto& it : n) arr.push_back(nodeToJson(it));
        return arr;
    }
    if (n.IsMap()) {
        json obj = json::object();
        for (auto it = n.begin(); it != n.end(); ++it) {
            obj[it->first.as<std::string>()] = nodeToJson(it->second);
        }
        return obj;
    }
    return nullptr;
}

const json* section(const json& cfg, const char* name) {
    if (!cfg.contains(name)) {
        return nullptr;
    }
    const json& s = cfg.at(name);
    if (!s.is_object()) {
        throw std::runtime_error(std::string("config section '") + name + "' must be a mapping");
    }
    return &s;
}

int64_t integerField(const json& s, const char* sec, const char* key, int64_t min, int64_t max) {
    const json& v = s.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(std::string(sec) + "." + key + " must be an integer");
    }
    auto n = v.get<int64_t>();
    if (n < min || n > max) {
        std::ostringstream os;
        os << sec << "." << key << " must be between " << min << " and " << max << " (got " << n << ")";
        throw std::runtime_error(os.str());
    }
    return n;
}

std::string stringField(const json& s, const char* sec, const char* key) {
    const json& v = s.at(key);
    if (!v.is_string()) {
        throw std::runtime_error(std::string(sec) + "." + key + " must be a string");
    }
    return v.get<std::string>();
}

void validateLevel(const std::string& level) {
    static const char* known[] = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "crit"};
    auto lower = toLower(level);
    for (const char* k : known) {
        if (lower == k) return;
    }
    throw std::runtime_error("unknown log level '" + level + "'");
}

uint64_t parseUnsigned(const std::string& flag, const std::string& value, uint64_t max) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'");
    }
    uint64_t n = 0;
    for (char c : value) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (n > (max - digit) / 10) {
            throw std::runtime_error(flag + " value '" + value + "' is out of range");
        }
        n = n * 10 + digit;
    }
    return n;
}

} // namespace

json yamlToJson(const std::string& yaml_text) {
    try {
        return nodeToJson(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("invalid YAML: ") + e.what());
    }
}

json loadConfigFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
        return yamlToJson(buffer.str());
    }
    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + path + ": " + e.what());
    }
}

void applyConfig(const json& cfg, ServerConfig& config) {
    if (cfg.is_null()) {
        return;
    }
    if (!cfg.is_object()) {
        throw std::runtime_error("config root must be a mapping");
    }

    if (auto s = section(cfg, "server")) {
        if (s->contains("host")) config.host = stringField(*s, "server", "host");
        if (s->contains("port")) config.port = static_cast<uint16_t>(integerField(*s, "server", "port", 1, 65535));
        if (s->contains("worker_threads")) {
            config.worker_threads = static_cast<size_t>(integerField(*s, "server", "worker_threads", 0, 1024));
        }
    }

    if (auto s = section(cfg, "querier")) {
        const int64_t max_ms = std::numeric_limits<int32_t>::max();
        if (s->contains("query_timeout_ms")) {
            config.query_timeout = std::chrono::milliseconds(integerField(*s, "querier", "query_timeout_ms", 1, max_ms));
        }
        if (s->contains("tail_ping_period_ms")) {
            config.tail_ping_period = std::chrono::milliseconds(integerField(*s, "querier", "tail_ping_period_ms", 1, max_ms));
        }
        if (s->contains("tail_max_delay_seconds")) {
            config.tail_max_delay_seconds = static_cast<uint32_t>(
                integerField(*s, "querier", "tail_max_delay_seconds", 0, 3600));
        }
    }

    if (auto s = section(cfg, "logging")) {
        if (s->contains("level")) {
            config.log_level = stringField(*s, "logging", "level");
            validateLevel(config.log_level);
        }
        if (s->contains("file")) config.log_file = stringField(*s, "logging", "file");
    }
}

const std::vector<std::string>& defaultConfigPaths() {
    static const std::vector<std::string> paths = {
        "./logq.yaml", "./logq.yml", "./logq.json", "/etc/logq/config.yaml"
    };
    return paths;
}

std::optional<std::string> findDefaultConfig() {
    std::error_code ec;
    for (const auto& p : defaultConfigPaths()) {
        if (std::filesystem::exists(p, ec)) {
            return p;
        }
    }
    return std::nullopt;
}

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            cmd.config_path = next();
        } else if (arg == "--host") {
            cmd.host = next();
        } else if (arg == "--port") {
            auto port = parseUnsigned(arg, next(), 65535);
            if (port == 0) {
                throw std::runtime_error("--port must be between 1 and 65535");
            }
            cmd.port = static_cast<uint16_t>(port);
        } else if (arg == "--threads") {
            cmd.threads = static_cast<size_t>(parseUnsigned(arg, next(), 1024));
        } else if (arg == "--log-level") {
            cmd.log_level = next();
            validateLevel(*cmd.log_level);
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else {
            throw std::runtime_error("unknown option: " + arg);
        }
    }
    return cmd;
}

void applyCommandLine(const CommandLine& cmd, ServerConfig& config) {
    if (cmd.host) config.host = *cmd.host;
    if (cmd.port) config.port = *cmd.port;
    if (cmd.threads) config.worker_threads = *cmd.threads;
    if (cmd.log_level) config.log_level = *cmd.log_level;
}

std::string usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options]\n"
       << "Options:\n"
       << "  --config FILE     Load config from YAML or JSON file\n"
       << "  --host HOST       Listen address (default: 0.0.0.0)\n"
       << "  --port PORT       Listen port (default: 3100)\n"
       << "  --threads N       Number of worker threads (default: auto)\n"
       << "  --log-level LVL   trace|debug|info|warn|error|critical (default: info)\n"
       << "  --help, -h        Show this help message\n";
    return os.str();
}

} // namespace utils
} // namespace logq
