#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "query/context.h"
#include "query/engine.h"
#include "server/encoding.h"

namespace logq {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr uint16_t kCloseGoingAway = 1001;
constexpr uint16_t kCloseInternalError = 1011;
constexpr size_t kMaxCloseReasonBytes = 123;
constexpr size_t kDefaultMaxPendingFrames = 10;
constexpr size_t kDefaultMaxDroppedEntries = 1000;

enum class TailState {
    Parsing,
    Upgrading,
    Subscribing,
    Streaming,
    Closed
};

const char* tailStateName(TailState state);

// Cuts `reason` to at most `max_bytes` without splitting a UTF-8 sequence
std::string truncateCloseReason(const std::string& reason, size_t max_bytes = kMaxCloseReasonBytes);

/**
 * @brief The client side of one tail session.
 *
 * Every method except release() throws std::exception on failure. Methods
 * are only ever called from the session's own thread.
 */
class TailConnection {
public:
    virtual ~TailConnection() = default;

    virtual void upgrade() = 0;
    virtual void writeText(const std::string& frame) = 0;
    virtual void ping() = 0;
    virtual void close(uint16_t code, const std::string& reason) = 0;
    // Drops the underlying transport. Never throws.
    virtual void release() noexcept = 0;
};

/**
 * @brief TailConnection over a Beast websocket stream.
 *
 * Operations are started on the stream's executor and awaited from the
 * calling thread; each one is bounded by io_timeout.
 */
class WebSocketConnection : public TailConnection {
public:
    WebSocketConnection(tcp::socket socket,
                        http::request<http::string_body> upgrade_request,
                        std::chrono::milliseconds io_timeout = std::chrono::seconds(10));

    void upgrade() override;
    void writeText(const std::string& frame) override;
    void ping() override;
    void close(uint16_t code, const std::string& reason) override;
    void release() noexcept override;

private:
    websocket::stream<beast::tcp_stream> ws_;
    http::request<http::string_body> upgrade_request_;
    std::chrono::milliseconds io_timeout_;
};

/**
 * @brief Per-session inbox fed by the tailer.
 *
 * Collects data frames, the first terminal error and a shutdown request,
 * and lets the session thread wait for whichever comes first up to a
 * deadline. Input arriving after close() is dropped.
 *
 * push() never blocks. Once max_pending frames are waiting, the entries of
 * further frames are reduced to DroppedEntry records (at most max_dropped
 * are kept) and attached to the next frame handed out.
 */
class EventQueue : public query::TailSink {
public:
    struct Event {
        enum class Kind { Timeout, Data, Error, Shutdown };
        Kind kind = Kind::Timeout;
        query::TailResponse data;
        std::string reason;
    };

    explicit EventQueue(size_t max_pending = kDefaultMaxPendingFrames,
                        size_t max_dropped = kDefaultMaxDroppedEntries);

    void push(query::TailResponse response) override;
    void fail(const std::string& reason) override;

    void requestShutdown(const std::string& reason);

    // Shutdown first, then queued data in arrival order, then the error
    Event waitUntil(std::chrono::steady_clock::time_point deadline);

    void close();
    size_t pending() const;
    // Entries turned into dropped records so far, including those over max_dropped
    uint64_t droppedTotal() const;

private:
    const size_t max_pending_;
    const size_t max_dropped_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<query::TailResponse> data_;
    std::vector<query::DroppedEntry> dropped_;
    uint64_t dropped_total_ = 0;
    std::optional<std::string> error_;
    std::optional<std::string> shutdown_;
    bool closed_ = false;
};

/**
 * @brief One live tail: upgrade, subscribe, then stream frames and pings
 *        until a terminal event.
 *
 * Teardown runs once on every exit path: at most one close frame, the
 * subscription closed once, the connection released once.
 */
class TailSession {
public:
    struct Options {
        std::chrono::milliseconds ping_period{1000};
        size_t max_pending_frames = kDefaultMaxPendingFrames;
        size_t max_dropped_entries = kDefaultMaxDroppedEntries;
    };

    struct Stats {
        uint64_t frames_sent = 0;
        uint64_t pings_sent = 0;
        uint64_t entries_dropped = 0;
        bool close_sent = false;
        uint16_t close_code = 0;
        std::string close_reason;
    };

    TailSession(std::unique_ptr<TailConnection> connection,
                std::shared_ptr<query::Tailer> tailer,
                query::TailRequest request,
                const ResponseEncoder& encoder,
                Options options);
    TailSession(std::unique_ptr<TailConnection> connection,
                std::shared_ptr<query::Tailer> tailer,
                query::TailRequest request,
                const ResponseEncoder& encoder);
    ~TailSession();

    TailSession(const TailSession&) = delete;
    TailSession& operator=(const TailSession&) = delete;

    // Blocks until the session is closed
    void run();

    // Thread-safe; ends the session with a going-away close frame
    void shutdown(const std::string& reason = "server shutting down");

    TailState state() const { return state_.load(); }
    Stats getStats() const;

private:
    void streamLoop();
    void sendClose(uint16_t code, const std::string& reason);
    void teardown() noexcept;

    std::unique_ptr<TailConnection> connection_;
    std::shared_ptr<query::Tailer> tailer_;
    query::TailRequest request_;
    const ResponseEncoder& encoder_;
    Options options_;

    query::Context ctx_;
    std::shared_ptr<EventQueue> queue_;
    std::unique_ptr<query::TailSubscription> subscription_;
    std::atomic<TailState> state_{TailState::Upgrading};

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

/**
 * @brief Tracks live tail sessions, one thread each.
 *
 * shutdown() asks every session to close and waits for all of them.
 */
class TailSessionRegistry {
public:
    struct RegistryStats {
        size_t active_sessions = 0;
        uint64_t total_sessions = 0;
        uint64_t total_closed = 0;
    };

    TailSessionRegistry() = default;
    ~TailSessionRegistry();

    TailSessionRegistry(const TailSessionRegistry&) = delete;
    TailSessionRegistry& operator=(const TailSessionRegistry&) = delete;

    // Runs the session on its own thread. Returns 0 once shutdown has begun.
    uint64_t start(std::shared_ptr<TailSession> session);

    void shutdown();

    RegistryStats getStats() const;

private:
    struct Entry {
        std::shared_ptr<TailSession> session;
        std::thread thread;
    };

    void onFinished(uint64_t id);
    void reapLocked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<uint64_t, Entry> sessions_;
    std::vector<std::thread> finished_;
    uint64_t next_id_ = 1;
    uint64_t total_sessions_ = 0;
    uint64_t total_closed_ = 0;
    bool stopping_ = false;
};

} // namespace server
} // namespace logq
