#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <functional>
#include <atomic>
#include <chrono>
#include <optional>

#include "query/engine.h"
#include "query/memory_store.h"
#include "server/request_builder.h"
#include "server/tail_session.h"

namespace logq {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Async HTTP API server for log queries
 *
 * Features:
 * - Thread pool running one io_context
 * - Range, instant and label queries against an Engine / LabelQuerier
 * - Live tails over websocket, one thread per session
 * - Push endpoint feeding the in-memory store
 */
class HttpServer {
public:
    /**
     * @brief Server configuration
     */
    struct Config {
        std::string host = "0.0.0.0";
        uint16_t port = 3100;
        size_t num_threads = std::thread::hardware_concurrency();
        size_t max_request_size_mb = 10;
        std::chrono::milliseconds query_timeout{60000};   // bounds the engine call only
        std::chrono::milliseconds tail_ping_period{1000};
        uint32_t tail_max_delay_seconds = kMaxDelayForInTailing;

        Config() = default;
        Config(std::string h, uint16_t p, size_t threads = 0)
            : host(std::move(h)), port(p) {
            if (threads > 0) num_threads = threads;
        }
    };

    struct Stats {
        uint64_t requests = 0;
        uint64_t errors = 0;
        size_t active_tails = 0;
        uint64_t total_tails = 0;
    };

    /**
     * @brief Construct the server over its query collaborators
     * @param store Receives pushed entries; push is answered 404 when null
     */
    HttpServer(
        const Config& config,
        std::shared_ptr<query::Engine> engine,
        std::shared_ptr<query::Tailer> tailer,
        std::shared_ptr<query::LabelQuerier> labels,
        std::shared_ptr<query::MemoryStore> store
    );

    ~HttpServer();

    /**
     * @brief Start the server (non-blocking)
     */
    void start();

    /**
     * @brief Stop accepting, close live tails and join the workers
     */
    void stop();

    bool isRunning() const { return running_; }

    // Bound port, useful when configured with port 0
    uint16_t port() const { return bound_port_; }

    Stats getStats() const;

    /**
     * @brief Dispatch a plain HTTP request. Tail upgrades are handled by the
     *        connection session before this is reached.
     */
    http::response<http::string_body> routeRequest(
        const http::request<http::string_body>& req
    );

private:
    // Session class for handling individual connections
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, HttpServer* server);
        void start();

    private:
        void doRead();
        void onRead(beast::error_code ec, std::size_t bytes_transferred);
        void processRequest();
        void doWrite();
        void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);

        tcp::socket socket_;
        HttpServer* server_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        http::request<http::string_body> request_;
        http::response<http::string_body> response_;
    };

    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    bool isTailRequest(const http::request<http::string_body>& req) const;

    // Builds the tail request; returns an error response when it is invalid
    std::optional<http::response<http::string_body>> checkTailRequest(
        const http::request<http::string_body>& req,
        query::TailRequest& out
    );

    // Returns a response to write, or nullopt when the socket was handed to
    // a tail session
    std::optional<http::response<http::string_body>> handleTail(
        tcp::socket& socket,
        http::request<http::string_body>& req
    );

    http::response<http::string_body> handleRangeQuery(const http::request<http::string_body>& req);
    http::response<http::string_body> handleInstantQuery(const http::request<http::string_body>& req);
    http::response<http::string_body> handleLogQuery(const http::request<http::string_body>& req);
    http::response<http::string_body> handleLabel(const http::request<http::string_body>& req, const std::string& name);
    http::response<http::string_body> handlePush(const http::request<http::string_body>& req);
    http::response<http::string_body> handleReady(const http::request<http::string_body>& req);

    // Runs the query under a fresh query_timeout deadline.
    // Throws ApiError(EngineExecution) for every engine failure.
    query::QueryResult execQuery(const std::function<std::unique_ptr<query::Query>()>& make);

    http::response<http::string_body> makeResponse(
        http::status status,
        const std::string& body,
        const http::request<http::string_body>& req,
        const char* content_type = "application/json"
    );

    http::response<http::string_body> makeErrorResponse(
        http::status status,
        const std::string& message,
        const http::request<http::string_body>& req
    );

    Config config_;
    std::shared_ptr<query::Engine> engine_;
    std::shared_ptr<query::Tailer> tailer_;
    std::shared_ptr<query::LabelQuerier> labels_;
    std::shared_ptr<query::MemoryStore> store_;

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;

    std::unique_ptr<TailSessionRegistry> tail_sessions_;

    std::atomic<uint64_t> request_count_{0};
    std::atomic<uint64_t> error_count_{0};
};

} // namespace server
} // namespace logq
