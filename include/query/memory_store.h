#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "query/engine.h"
#include "query/logql.h"
#include "query/types.h"

namespace logq {
namespace query {

/**
 * @brief Thread-safe in-memory log streams with live tail subscriptions.
 *
 * Responsibilities:
 * - Keep entries per label set in timestamp order (bounded per stream)
 * - Answer label name / value lookups
 * - Fan pushed entries out to tail subscriptions, holding them back by the
 *   subscription's delay_for when asked to
 *
 * The store must outlive every subscription handle it hands out. Sinks are
 * fed while the store's locks are held; they must not block or call back
 * into the store.
 */
class MemoryStore : public Tailer, public LabelQuerier {
public:
    struct Config {
        size_t max_entries_per_stream = 100000;   // oldest dropped beyond this
        uint32_t dispatch_interval_ms = 100;      // delayed tail release cadence
    };

    struct Stats {
        size_t streams = 0;
        uint64_t entries = 0;
        size_t active_subscriptions = 0;
    };

    MemoryStore();
    explicit MemoryStore(const Config& config);
    ~MemoryStore() override;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    void push(const LabelSet& labels, std::vector<Entry> entries);

    /**
     * @brief Entries of matching streams with from <= ts < through that pass
     *        the selector's line filters, in forward order.
     * @throws EngineError when ctx expires during the scan
     */
    Streams select(const Context& ctx, const LogSelectorExpr& selector,
                   Timestamp from, Timestamp through) const;

    LabelResponse label(const Context& ctx, const LabelRequest& request) override;

    std::unique_ptr<TailSubscription> tail(
        const Context& ctx,
        const TailRequest& request,
        std::shared_ptr<TailSink> sink) override;

    Stats getStats() const;

    // Stops the dispatcher and fails all live subscriptions
    void shutdown();

private:
    struct StreamData {
        LabelSet labels;
        std::vector<Entry> entries; // sorted by timestamp
    };

    struct Pending {
        LabelSet labels;
        Entry entry;
    };

    struct Subscription {
        uint64_t id = 0;
        std::shared_ptr<LogSelectorExpr> selector;
        std::shared_ptr<TailSink> sink;
        std::chrono::seconds delay{0};
        std::vector<Pending> pending; // delayed entries, guarded by subs_mutex_
    };

    class Handle : public TailSubscription {
    public:
        Handle(MemoryStore& store, uint64_t id) : store_(store), id_(id) {}
        void close() override;

    private:
        MemoryStore& store_;
        uint64_t id_;
        std::atomic<bool> closed_{false};
    };

    void unsubscribe(uint64_t id);
    void dispatchLoop();
    static TailResponse toResponse(std::vector<Pending> pending);

    Config config_;

    mutable std::mutex streams_mutex_;
    std::map<std::string, StreamData> streams_;
    uint64_t total_entries_ = 0;

    // Lock order: streams_mutex_ before subs_mutex_
    mutable std::mutex subs_mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<Subscription>> subs_;
    std::atomic<uint64_t> next_sub_id_{1};

    std::thread dispatcher_;
    std::condition_variable dispatch_cv_;
    bool stopping_ = false; // guarded by subs_mutex_
};

} // namespace query
} // namespace logq
