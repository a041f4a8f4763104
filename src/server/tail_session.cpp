#include "server/tail_session.h"
#include "server/api_error.h"
#include "utils/logger.h"

#include <boost/asio/use_future.hpp>

namespace logq {
namespace server {

const char* tailStateName(TailState state) {
    switch (state) {
        case TailState::Parsing: return "parsing";
        case TailState::Upgrading: return "upgrading";
        case TailState::Subscribing: return "subscribing";
        case TailState::Streaming: return "streaming";
        case TailState::Closed: return "closed";
    }
    return "unknown";
}

std::string truncateCloseReason(const std::string& reason, size_t max_bytes) {
    if (reason.size() <= max_bytes) {
        return reason;
    }
    size_t cut = max_bytes;
    // Back off continuation bytes so the cut lands on a sequence start
    while (cut > 0 && (static_cast<unsigned char>(reason[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return reason.substr(0, cut);
}

// ============================================================================
// WebSocketConnection
// ============================================================================

WebSocketConnection::WebSocketConnection(
    tcp::socket socket,
    http::request<http::string_body> upgrade_request,
    std::chrono::milliseconds io_timeout
)
    : ws_(std::move(socket))
    , upgrade_request_(std::move(upgrade_request))
    , io_timeout_(io_timeout)
{
    websocket::stream_base::timeout opt{
        io_timeout_,                     // handshake and close handshake
        websocket::stream_base::none(),  // no read side, so no idle timeout
        false
    };
    ws_.set_option(opt);
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "LogQ/0.1.0");
    }));
}

void WebSocketConnection::upgrade() {
    ws_.async_accept(upgrade_request_, net::use_future).get();
    // The websocket timeout option owns handshakes from here on
    beast::get_lowest_layer(ws_).expires_never();
}

void WebSocketConnection::writeText(const std::string& frame) {
    ws_.text(true);
    beast::get_lowest_layer(ws_).expires_after(io_timeout_);
    ws_.async_write(net::buffer(frame), net::use_future).get();
    beast::get_lowest_layer(ws_).expires_never();
}

void WebSocketConnection::ping() {
    beast::get_lowest_layer(ws_).expires_after(io_timeout_);
    ws_.async_ping({}, net::use_future).get();
    beast::get_lowest_layer(ws_).expires_never();
}

void WebSocketConnection::close(uint16_t code, const std::string& reason) {
    websocket::close_reason cr(static_cast<websocket::close_code>(code), truncateCloseReason(reason));
    ws_.async_close(cr, net::use_future).get();
}

void WebSocketConnection::release() noexcept {
    beast::error_code ec;
    auto& socket = beast::get_lowest_layer(ws_).socket();
    if (!socket.is_open()) {
        return;
    }
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    if (ec) {
        LOGQ_DEBUG("Tail connection close: {}", ec.message());
    }
}

// ============================================================================
// EventQueue
// ============================================================================

EventQueue::EventQueue(size_t max_pending, size_t max_dropped)
    : max_pending_(max_pending)
    , max_dropped_(max_dropped)
{
}

void EventQueue::push(query::TailResponse response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (data_.size() < max_pending_) {
            data_.push_back(std::move(response));
        } else {
            uint64_t before = dropped_total_;
            for (auto& d : response.dropped_entries) {
                if (dropped_.size() < max_dropped_) {
                    dropped_.push_back(std::move(d));
                }
                ++dropped_total_;
            }
            for (const auto& stream : response.streams) {
                for (const auto& e : stream.entries) {
                    if (dropped_.size() < max_dropped_) {
                        dropped_.push_back(query::DroppedEntry{e.timestamp, stream.labels});
                    }
                    ++dropped_total_;
                }
            }
            LOGQ_DEBUG("Tail queue full ({} frames), dropped {} entries", data_.size(), dropped_total_ - before);
            return;
        }
    }
    cv_.notify_one();
}

void EventQueue::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || error_) {
            return;
        }
        error_ = reason;
    }
    cv_.notify_one();
}

void EventQueue::requestShutdown(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || shutdown_) {
            return;
        }
        shutdown_ = reason;
    }
    cv_.notify_one();
}

EventQueue::Event EventQueue::waitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] {
        return closed_ || shutdown_ || !data_.empty() || error_;
    });

    Event ev;
    if (shutdown_) {
        ev.kind = Event::Kind::Shutdown;
        ev.reason = *shutdown_;
    } else if (!data_.empty()) {
        ev.kind = Event::Kind::Data;
        ev.data = std::move(data_.front());
        data_.pop_front();
        if (!dropped_.empty()) {
            ev.data.dropped_entries.insert(ev.data.dropped_entries.end(),
                std::make_move_iterator(dropped_.begin()), std::make_move_iterator(dropped_.end()));
            dropped_.clear();
        }
    } else if (error_) {
        ev.kind = Event::Kind::Error;
        ev.reason = *error_;
    }
    return ev;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        data_.clear();
        dropped_.clear();
    }
    cv_.notify_all();
}

size_t EventQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

uint64_t EventQueue::droppedTotal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_total_;
}

// ============================================================================
// TailSession
// ============================================================================

TailSession::TailSession(
    std::unique_ptr<TailConnection> connection,
    std::shared_ptr<query::Tailer> tailer,
    query::TailRequest request,
    const ResponseEncoder& encoder,
    Options options
)
    : connection_(std::move(connection))
    , tailer_(std::move(tailer))
    , request_(std::move(request))
    , encoder_(encoder)
    , options_(options)
    , queue_(std::make_shared<EventQueue>(options.max_pending_frames, options.max_dropped_entries))
{
}

TailSession::TailSession(
    std::unique_ptr<TailConnection> connection,
    std::shared_ptr<query::Tailer> tailer,
    query::TailRequest request,
    const ResponseEncoder& encoder
)
    : TailSession(std::move(connection), std::move(tailer), std::move(request), encoder, Options{}) {}

TailSession::~TailSession() {
    teardown();
}

void TailSession::run() {
    struct TeardownGuard {
        TailSession& session;
        ~TeardownGuard() { session.teardown(); }
    } guard{*this};

    state_ = TailState::Upgrading;
    try {
        connection_->upgrade();
    } catch (const std::exception& e) {
        LOGQ_ERROR("Error in upgrading websocket: {}", e.what());
        return;
    }

    state_ = TailState::Subscribing;
    try {
        subscription_ = tailer_->tail(ctx_, request_, queue_);
    } catch (const std::exception& e) {
        LOGQ_ERROR("Error in starting tail for query '{}': {}", request_.query, e.what());
        sendClose(kCloseInternalError, e.what());
        return;
    }

    state_ = TailState::Streaming;
    LOGQ_INFO("Tail session streaming: query='{}', delay_for={}s", request_.query, request_.delay_for);
    streamLoop();
}

void TailSession::shutdown(const std::string& reason) {
    queue_->requestShutdown(reason);
}

TailSession::Stats TailSession::getStats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        s = stats_;
    }
    s.entries_dropped = queue_->droppedTotal();
    return s;
}

void TailSession::streamLoop() {
    using Clock = std::chrono::steady_clock;
    const auto period = options_.ping_period;
    auto next_ping = Clock::now() + period;

    while (true) {
        auto now = Clock::now();
        if (now >= next_ping) {
            try {
                connection_->ping();
            } catch (const std::exception& e) {
                LOGQ_ERROR("Error writing ping message: {}", e.what());
                sendClose(kCloseInternalError, e.what());
                return;
            }
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.pings_sent;
            }
            // Fixed ticker: missed ticks are dropped, not replayed
            while (next_ping <= now) {
                next_ping += period;
            }
            continue;
        }

        auto ev = queue_->waitUntil(next_ping);
        switch (ev.kind) {
            case EventQueue::Event::Kind::Timeout:
                break;

            case EventQueue::Event::Kind::Data: {
                std::string frame;
                try {
                    frame = encoder_.encodeTailResponse(ev.data);
                } catch (const ApiError& e) {
                    LOGQ_ERROR("Error encoding tail response: {}", e.what());
                    sendClose(kCloseInternalError, e.what());
                    return;
                }
                try {
                    connection_->writeText(frame);
                } catch (const std::exception& e) {
                    LOGQ_ERROR("Error writing to websocket: {}", e.what());
                    sendClose(kCloseInternalError, e.what());
                    return;
                }
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.frames_sent;
                break;
            }

            case EventQueue::Event::Kind::Error:
                LOGQ_ERROR("Error from tailer: {}", ev.reason);
                sendClose(kCloseInternalError, ev.reason);
                return;

            case EventQueue::Event::Kind::Shutdown:
                LOGQ_INFO("Tail session closing: {}", ev.reason);
                sendClose(kCloseGoingAway, ev.reason);
                return;
        }
    }
}

void TailSession::sendClose(uint16_t code, const std::string& reason) {
    auto truncated = truncateCloseReason(reason);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (stats_.close_sent) {
            return;
        }
        stats_.close_sent = true;
        stats_.close_code = code;
        stats_.close_reason = truncated;
    }
    try {
        connection_->close(code, truncated);
    } catch (const std::exception& e) {
        LOGQ_ERROR("Error writing close message to websocket: {}", e.what());
    }
}

void TailSession::teardown() noexcept {
    if (state_.exchange(TailState::Closed) == TailState::Closed) {
        return;
    }
    ctx_.cancel();
    queue_->close();

    if (subscription_) {
        try {
            subscription_->close();
        } catch (const std::exception& e) {
            LOGQ_ERROR("Error closing tail subscription: {}", e.what());
        }
        subscription_.reset();
    }
    connection_->release();
    LOGQ_DEBUG("Tail session closed: query='{}'", request_.query);
}

// ============================================================================
// TailSessionRegistry
// ============================================================================

TailSessionRegistry::~TailSessionRegistry() {
    shutdown();
}

uint64_t TailSessionRegistry::start(std::shared_ptr<TailSession> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return 0;
    }
    reapLocked();

    uint64_t id = next_id_++;
    auto& entry = sessions_[id];
    entry.session = session;
    // onFinished takes mutex_, so it cannot run before the thread is stored
    entry.thread = std::thread([this, id, session] {
        session->run();
        onFinished(id);
    });
    ++total_sessions_;
    LOGQ_DEBUG("Tail session registered: id={}, active={}", id, sessions_.size());
    return id;
}

void TailSessionRegistry::onFinished(uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it != sessions_.end()) {
            finished_.push_back(std::move(it->second.thread));
            sessions_.erase(it);
            ++total_closed_;
        }
        LOGQ_DEBUG("Tail session unregistered: id={}", id);
    }
    cv_.notify_all();
}

void TailSessionRegistry::reapLocked() {
    for (auto& t : finished_) {
        if (t.joinable()) {
            t.join();
        }
    }
    finished_.clear();
}

void TailSessionRegistry::shutdown() {
    std::vector<std::thread> finished;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!stopping_) {
            stopping_ = true;
            if (!sessions_.empty()) {
                LOGQ_INFO("Shutting down {} tail session(s)", sessions_.size());
            }
            for (auto& [id, entry] : sessions_) {
                entry.session->shutdown();
            }
        }
        cv_.wait(lock, [this] { return sessions_.empty(); });
        finished.swap(finished_);
    }
    for (auto& t : finished) {
        if (t.joinable()) {
            t.join();
        }
    }
}

TailSessionRegistry::RegistryStats TailSessionRegistry::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RegistryStats s;
    s.active_sessions = sessions_.size();
    s.total_sessions = total_sessions_;
    s.total_closed = total_closed_;
    return s;
}

} // namespace server
} // namespace logq
