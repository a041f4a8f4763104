#include "utils/config.h"
#include "utils/logger.h"
#include "query/local_engine.h"
#include "query/memory_store.h"
#include "server/http_server.h"

#include <iostream>
#include <csignal>
#include <memory>
#include <optional>
#include <thread>
#include <atomic>
#include <chrono>

using namespace logq;

namespace {
std::atomic<bool> g_shutdown_requested{false};
}

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

int main(int argc, char* argv[]) {
    utils::ServerConfig config;

    // Command line first so --help and --log-level apply before anything is logged
    utils::CommandLine cmd;
    try {
        cmd = utils::parseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << utils::usage(argv[0]);
        return 1;
    }
    if (cmd.help) {
        std::cout << utils::usage(argv[0]);
        return 0;
    }

    std::optional<std::string> config_path = cmd.config_path;
    if (!config_path) {
        config_path = utils::findDefaultConfig();
    }
    try {
        if (config_path) {
            utils::applyConfig(utils::loadConfigFile(*config_path), config);
        }
        utils::applyCommandLine(cmd, config);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    utils::Logger::init(config.log_file, utils::Logger::levelFromString(config.log_level));

    LOGQ_INFO("=== LogQ Log Query Server ===");
    LOGQ_INFO("Version: 0.1.0");
    if (config_path) {
        LOGQ_INFO("Loaded config from {}", *config_path);
    }

    try {
        auto store = std::make_shared<query::MemoryStore>();
        auto engine = std::make_shared<query::LocalEngine>(store);

        server::HttpServer::Config server_config(config.host, config.port, config.worker_threads);
        server_config.query_timeout = config.query_timeout;
        server_config.tail_ping_period = config.tail_ping_period;
        server_config.tail_max_delay_seconds = config.tail_max_delay_seconds;

        auto http_server = std::make_unique<server::HttpServer>(
            server_config,
            engine,
            store,
            store,
            store
        );

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        http_server->start();
        LOGQ_INFO("Server ready at http://{}:{}", config.host, http_server->port());

        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOGQ_INFO("Received shutdown signal...");
        http_server->stop();
        store->shutdown();

        auto stats = store->getStats();
        LOGQ_INFO("Shutdown complete ({} streams, {} entries held)", stats.streams, stats.entries);
    } catch (const std::exception& e) {
        LOGQ_ERROR("Fatal error: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    }

    utils::Logger::shutdown();
    return 0;
}
