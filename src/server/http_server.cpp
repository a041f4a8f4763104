#include "server/http_server.h"
#include "server/api_error.h"
#include "server/encoding.h"
#include "server/params.h"
#include "utils/logger.h"

#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace logq {
namespace server {

using json = nlohmann::json;

HttpServer::HttpServer(
    const Config& config,
    std::shared_ptr<query::Engine> engine,
    std::shared_ptr<query::Tailer> tailer,
    std::shared_ptr<query::LabelQuerier> labels,
    std::shared_ptr<query::MemoryStore> store
)
    : config_(config)
    , engine_(std::move(engine))
    , tailer_(std::move(tailer))
    , labels_(std::move(labels))
    , store_(std::move(store))
    , ioc_(static_cast<int>(std::max<size_t>(1, config.num_threads)))
    , acceptor_(ioc_)
    , tail_sessions_(std::make_unique<TailSessionRegistry>())
{
    if (config_.num_threads == 0) {
        config_.num_threads = 1;
    }
    LOGQ_INFO("HTTP Server configured: {} worker thread(s), query timeout {}ms, tail ping {}ms, max delay_for {}s",
        config_.num_threads, config_.query_timeout.count(),
        config_.tail_ping_period.count(), config_.tail_max_delay_seconds);
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        LOGQ_WARN("Server already running");
        return;
    }

    // Setup acceptor
    tcp::endpoint endpoint{net::ip::make_address(config_.host), config_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    LOGQ_INFO("HTTP Server listening on {}:{}", config_.host, bound_port_);

    running_ = true;

    // Start accepting connections
    doAccept();

    // Start thread pool
    threads_.reserve(config_.num_threads);
    for (size_t i = 0; i < config_.num_threads; ++i) {
        threads_.emplace_back([this, i] {
            LOGQ_DEBUG("Worker thread {} started", i);
            ioc_.run();
            LOGQ_DEBUG("Worker thread {} stopped", i);
        });
    }

    LOGQ_INFO("HTTP Server started successfully");
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOGQ_INFO("Stopping HTTP Server...");

    // Stop accepting new connections
    beast::error_code ec;
    acceptor_.close(ec);

    // Tail sessions need the io_context to deliver their close frames
    tail_sessions_->shutdown();

    ioc_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LOGQ_INFO("HTTP Server stopped");
}

HttpServer::Stats HttpServer::getStats() const {
    Stats s;
    s.requests = request_count_.load(std::memory_order_relaxed);
    s.errors = error_count_.load(std::memory_order_relaxed);
    auto tails = tail_sessions_->getStats();
    s.active_tails = tails.active_sessions;
    s.total_tails = tails.total_sessions;
    return s;
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&HttpServer::onAccept, this)
    );
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec != net::error::operation_aborted) {
            LOGQ_ERROR("Accept error: {}", ec.message());
        }
    } else {
        std::make_shared<Session>(std::move(socket), this)->start();
    }

    // Accept next connection
    if (running_) {
        doAccept();
    }
}

namespace {
    enum class Route {
        RangeQuery,
        InstantQuery,
        LogQuery,       // legacy /api/prom/query
        LabelNames,
        LabelValues,
        Tail,
        Push,
        Ready,
        MethodNotAllowed,
        NotFound
    };

    struct RouteMatch {
        Route route = Route::NotFound;
        std::string label_name;
    };

    bool startsWith(std::string_view s, std::string_view prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    bool endsWith(std::string_view s, std::string_view suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    RouteMatch classifyRoute(const http::request<http::string_body>& req) {
        const auto method = req.method();
        const std::string_view path = targetPath(std::string_view(req.target().data(), req.target().size()));

        RouteMatch m;
        auto only = [&](http::verb verb, Route r) {
            m.route = method == verb ? r : Route::MethodNotAllowed;
            return m;
        };

        if (path == "/loki/api/v1/query_range") return only(http::verb::get, Route::RangeQuery);
        if (path == "/loki/api/v1/query") return only(http::verb::get, Route::InstantQuery);
        if (path == "/api/prom/query") return only(http::verb::get, Route::LogQuery);
        if (path == "/loki/api/v1/label" || path == "/loki/api/v1/labels" || path == "/api/prom/label") {
            return only(http::verb::get, Route::LabelNames);
        }
        if (path == "/loki/api/v1/tail" || path == "/api/prom/tail") return only(http::verb::get, Route::Tail);
        if (path == "/loki/api/v1/push") return only(http::verb::post, Route::Push);
        if (path == "/ready") return only(http::verb::get, Route::Ready);

        // /<prefix>/label/{name}/values
        for (std::string_view prefix : {std::string_view("/loki/api/v1/label/"), std::string_view("/api/prom/label/")}) {
            if (!startsWith(path, prefix) || !endsWith(path, "/values")) {
                continue;
            }
            auto name = path.substr(prefix.size(), path.size() - prefix.size() - 7);
            if (name.empty() || name.find('/') != std::string_view::npos) {
                continue;
            }
            m.label_name = urlDecode(name);
            return only(http::verb::get, Route::LabelValues);
        }

        return m;
    }

    http::status toStatus(const ApiError& e) {
        return static_cast<http::status>(e.statusCode());
    }

    std::string_view requestTarget(const http::request<http::string_body>& req) {
        return std::string_view(req.target().data(), req.target().size());
    }

    std::string_view requestPath(const http::request<http::string_body>& req) {
        return targetPath(requestTarget(req));
    }
}

http::response<http::string_body> HttpServer::routeRequest(
    const http::request<http::string_body>& req
) {
    auto start = std::chrono::steady_clock::now();

    LOGQ_DEBUG("Request: {} {}", std::string(http::to_string(req.method())), std::string(req.target()));

    request_count_.fetch_add(1, std::memory_order_relaxed);

    http::response<http::string_body> response;

    auto match = classifyRoute(req);
    switch (match.route) {
        case Route::RangeQuery:
            response = handleRangeQuery(req);
            break;
        case Route::InstantQuery:
            response = handleInstantQuery(req);
            break;
        case Route::LogQuery:
            response = handleLogQuery(req);
            break;
        case Route::LabelNames:
            response = handleLabel(req, "");
            break;
        case Route::LabelValues:
            response = handleLabel(req, match.label_name);
            break;
        case Route::Tail: {
            // Reached only without an upgrade handshake
            query::TailRequest tail_request;
            if (auto error = checkTailRequest(req, tail_request)) {
                response = std::move(*error);
            } else {
                response = makeErrorResponse(http::status::bad_request, "websocket upgrade required", req);
            }
            break;
        }
        case Route::Push:
            response = handlePush(req);
            break;
        case Route::Ready:
            response = handleReady(req);
            break;
        case Route::MethodNotAllowed:
            response = makeErrorResponse(http::status::method_not_allowed, "Method not allowed", req);
            break;
        case Route::NotFound:
            response = makeErrorResponse(http::status::not_found, "Endpoint not found", req);
            break;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    LOGQ_DEBUG("Response: {} {} -> {} ({}us)", std::string(http::to_string(req.method())),
        std::string(req.target()), response.result_int(), elapsed.count());
    return response;
}

bool HttpServer::isTailRequest(const http::request<http::string_body>& req) const {
    auto path = requestPath(req);
    return req.method() == http::verb::get && (path == "/loki/api/v1/tail" || path == "/api/prom/tail");
}

std::optional<http::response<http::string_body>> HttpServer::checkTailRequest(
    const http::request<http::string_body>& req,
    query::TailRequest& out
) {
    try {
        out = buildTailRequest(QueryValues::parse(requestTarget(req)), config_.tail_max_delay_seconds);
    } catch (const ApiError& e) {
        LOGQ_DEBUG("Rejecting tail request: {}", e.what());
        return makeErrorResponse(toStatus(e), e.what(), req);
    }
    return std::nullopt;
}

std::optional<http::response<http::string_body>> HttpServer::handleTail(
    tcp::socket& socket,
    http::request<http::string_body>& req
) {
    request_count_.fetch_add(1, std::memory_order_relaxed);

    query::TailRequest tail_request;
    if (auto error = checkTailRequest(req, tail_request)) {
        return error;
    }
    if (!websocket::is_upgrade(req)) {
        return makeErrorResponse(http::status::bad_request, "websocket upgrade required", req);
    }

    const auto& encoder = encoderFor(versionFromPath(requestPath(req)));
    auto connection = std::make_unique<WebSocketConnection>(std::move(socket), std::move(req));

    TailSession::Options options;
    options.ping_period = config_.tail_ping_period;
    auto session = std::make_shared<TailSession>(
        std::move(connection), tailer_, std::move(tail_request), encoder, options);

    if (tail_sessions_->start(session) == 0) {
        LOGQ_WARN("Tail request dropped: server is shutting down");
    }
    return std::nullopt;
}

query::QueryResult HttpServer::execQuery(const std::function<std::unique_ptr<query::Query>()>& make) {
    // The deadline starts here so it bounds only the engine call
    auto ctx = query::Context::withTimeout(config_.query_timeout);
    try {
        auto q = make();
        auto result = q->exec(ctx);
        if (ctx.deadlineExceeded()) {
            throw query::EngineError(ctx.err());
        }
        return result;
    } catch (const ApiError&) {
        throw;
    } catch (const std::exception& e) {
        throw ApiError(ErrorKind::EngineExecution, e.what());
    }
}

http::response<http::string_body> HttpServer::handleRangeQuery(
    const http::request<http::string_body>& req
) {
    try {
        auto request = buildRangeQueryRequest(QueryValues::parse(requestTarget(req)));
        auto result = execQuery([&] {
            return engine_->newRangeQuery(request.query, request.start, request.end,
                request.step, request.direction, request.limit);
        });
        const auto& encoder = encoderFor(versionFromPath(requestPath(req)));
        return makeResponse(http::status::ok, encoder.encodeQueryResult(result), req);
    } catch (const ApiError& e) {
        return makeErrorResponse(toStatus(e), e.what(), req);
    }
}

http::response<http::string_body> HttpServer::handleInstantQuery(
    const http::request<http::string_body>& req
) {
    try {
        auto request = buildInstantQueryRequest(QueryValues::parse(requestTarget(req)));
        auto result = execQuery([&] {
            return engine_->newInstantQuery(request.query, request.ts, request.direction, request.limit);
        });
        const auto& encoder = encoderFor(versionFromPath(requestPath(req)));
        return makeResponse(http::status::ok, encoder.encodeQueryResult(result), req);
    } catch (const ApiError& e) {
        return makeErrorResponse(toStatus(e), e.what(), req);
    }
}

http::response<http::string_body> HttpServer::handleLogQuery(
    const http::request<http::string_body>& req
) {
    try {
        auto request = buildLogQueryRequest(QueryValues::parse(requestTarget(req)));
        auto result = execQuery([&] {
            return engine_->newRangeQuery(request.query, request.start, request.end,
                request.step, request.direction, request.limit);
        });
        return makeResponse(http::status::ok, encoderFor(ApiVersion::Legacy).encodeQueryResult(result), req);
    } catch (const ApiError& e) {
        return makeErrorResponse(toStatus(e), e.what(), req);
    }
}

http::response<http::string_body> HttpServer::handleLabel(
    const http::request<http::string_body>& req,
    const std::string& name
) {
    query::LabelRequest request;
    try {
        request = buildLabelRequest(QueryValues::parse(requestTarget(req)), name);
    } catch (const ApiError& e) {
        return makeErrorResponse(toStatus(e), e.what(), req);
    }

    query::LabelResponse labels;
    try {
        labels = labels_->label(query::Context::background(), request);
    } catch (const std::exception& e) {
        LOGQ_ERROR("Label lookup failed: {}", e.what());
        return makeErrorResponse(http::status::internal_server_error, e.what(), req);
    }

    try {
        const auto& encoder = encoderFor(versionFromPath(requestPath(req)));
        return makeResponse(http::status::ok, encoder.encodeLabels(labels), req);
    } catch (const ApiError& e) {
        return makeErrorResponse(toStatus(e), e.what(), req);
    }
}

http::response<http::string_body> HttpServer::handlePush(
    const http::request<http::string_body>& req
) {
    if (!store_) {
        return makeErrorResponse(http::status::not_found, "Push is not enabled", req);
    }
    try {
        auto streams = decodePushRequest(req.body());
        for (const auto& s : streams) {
            if (s.labels.empty()) {
                throw ApiError(ErrorKind::InvalidParameter, "stream labels must not be empty");
            }
        }
        size_t entries = 0;
        for (auto& s : streams) {
            entries += s.entries.size();
            store_->push(s.labels, std::move(s.entries));
        }
        LOGQ_DEBUG("Push: {} stream(s), {} entries", streams.size(), entries);
    } catch (const ApiError& e) {
        return makeErrorResponse(toStatus(e), e.what(), req);
    }
    return makeResponse(http::status::no_content, "", req, nullptr);
}

http::response<http::string_body> HttpServer::handleReady(
    const http::request<http::string_body>& req
) {
    return makeResponse(http::status::ok, "ready", req, "text/plain");
}

http::response<http::string_body> HttpServer::makeResponse(
    http::status status,
    const std::string& body,
    const http::request<http::string_body>& req,
    const char* content_type
) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "LogQ/0.1.0");
    if (content_type) {
        res.set(http::field::content_type, content_type);
    }
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpServer::makeErrorResponse(
    http::status status,
    const std::string& message,
    const http::request<http::string_body>& req
) {
    error_count_.fetch_add(1, std::memory_order_relaxed);

    json error_body = {
        {"error", true},
        {"message", message},
        {"status_code", static_cast<int>(status)}
    };
    return makeResponse(status, error_body.dump(-1, ' ', false, json::error_handler_t::replace), req);
}

// ============================================================================
// Session
// ============================================================================

HttpServer::Session::Session(tcp::socket socket, HttpServer* server)
    : socket_(std::move(socket))
    , server_(server)
{
}

void HttpServer::Session::start() {
    doRead();
}

void HttpServer::Session::doRead() {
    parser_.emplace();
    parser_->body_limit(server_->config_.max_request_size_mb * 1024 * 1024);

    http::async_read(
        socket_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&Session::onRead, shared_from_this())
    );
}

void HttpServer::Session::onRead(
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        // Client closed connection
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    if (ec == http::error::body_limit) {
        request_ = parser_->release();
        request_.keep_alive(false);
        response_ = server_->makeErrorResponse(http::status::payload_too_large, "Request body too large", request_);
        doWrite();
        return;
    }

    if (ec) {
        LOGQ_ERROR("Read error: {}", ec.message());
        return;
    }

    request_ = parser_->release();
    processRequest();
}

void HttpServer::Session::processRequest() {
    if (server_->isTailRequest(request_)) {
        auto response = server_->handleTail(socket_, request_);
        if (!response) {
            // The socket now belongs to a tail session. buffer_ holds nothing
            // past the upgrade request: a websocket client may not send before
            // the handshake response (RFC 6455 section 4.1), and tails never read.
            return;
        }
        response_ = std::move(*response);
    } else {
        response_ = server_->routeRequest(request_);
    }

    doWrite();
}

void HttpServer::Session::doWrite() {
    bool close = response_.need_eof();
    http::async_write(
        socket_,
        response_,
        beast::bind_front_handler(
            &Session::onWrite,
            shared_from_this(),
            close
        )
    );
}

void HttpServer::Session::onWrite(
    bool close,
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        LOGQ_ERROR("Write error: {}", ec.message());
        return;
    }

    if (close) {
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    // Read next request
    doRead();
}

} // namespace server
} // namespace logq
