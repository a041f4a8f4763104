#include "query/memory_store.h"
#include "utils/logger.h"

#include <algorithm>
#include <set>

namespace logq {
namespace query {

namespace {

bool entryBefore(const Entry& a, const Entry& b) {
    return a.timestamp < b.timestamp;
}

// First index with ts >= t
size_t lowerIndex(const std::vector<Entry>& entries, Timestamp t) {
    auto it = std::lower_bound(entries.begin(), entries.end(), t,
        [](const Entry& e, Timestamp v) { return e.timestamp < v; });
    return static_cast<size_t>(it - entries.begin());
}

} // namespace

MemoryStore::MemoryStore()
    : MemoryStore(Config{})
{
}

MemoryStore::MemoryStore(const Config& config)
    : config_(config)
{
    dispatcher_ = std::thread([this] { dispatchLoop(); });
    LOGQ_DEBUG("MemoryStore started (max_entries_per_stream={}, dispatch_interval={}ms)",
        config_.max_entries_per_stream, config_.dispatch_interval_ms);
}

MemoryStore::~MemoryStore() {
    shutdown();
}

void MemoryStore::push(const LabelSet& labels, std::vector<Entry> entries) {
    if (entries.empty()) {
        return;
    }
    std::stable_sort(entries.begin(), entries.end(), entryBefore);

    std::vector<std::pair<std::shared_ptr<TailSink>, TailResponse>> deliveries;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);

        auto& stream = streams_[labelsToString(labels)];
        if (stream.entries.empty()) {
            stream.labels = labels;
        }
        for (const auto& e : entries) {
            if (stream.entries.empty() || !(e.timestamp < stream.entries.back().timestamp)) {
                stream.entries.push_back(e);
            } else {
                auto pos = std::upper_bound(stream.entries.begin(), stream.entries.end(), e, entryBefore);
                stream.entries.insert(pos, e);
            }
        }
        total_entries_ += entries.size();
        if (config_.max_entries_per_stream > 0 && stream.entries.size() > config_.max_entries_per_stream) {
            auto excess = stream.entries.size() - config_.max_entries_per_stream;
            stream.entries.erase(stream.entries.begin(), stream.entries.begin() + static_cast<std::ptrdiff_t>(excess));
        }

        {
            std::lock_guard<std::mutex> sub_lock(subs_mutex_);
            for (auto& [id, sub] : subs_) {
                if (!sub->selector->matchesLabels(labels)) {
                    continue;
                }
                std::vector<Entry> matched;
                for (const auto& e : entries) {
                    if (sub->selector->matchesLine(e.line)) {
                        matched.push_back(e);
                    }
                }
                if (matched.empty()) {
                    continue;
                }
                if (sub->delay.count() == 0) {
                    TailResponse resp;
                    resp.streams.push_back(Stream{labels, std::move(matched)});
                    deliveries.emplace_back(sub->sink, std::move(resp));
                } else {
                    for (auto& e : matched) {
                        sub->pending.push_back(Pending{labels, std::move(e)});
                    }
                }
            }
        }

        // Still under streams_mutex_: a tail registering concurrently has
        // either delivered its history already or not subscribed yet
        for (auto& [sink, resp] : deliveries) {
            sink->push(std::move(resp));
        }
    }
}

Streams MemoryStore::select(const Context& ctx, const LogSelectorExpr& selector,
                            Timestamp from, Timestamp through) const {
    Streams out;
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (const auto& [key, stream] : streams_) {
        if (ctx.done()) {
            throw EngineError(ctx.err());
        }
        if (!selector.matchesLabels(stream.labels)) {
            continue;
        }
        Stream s;
        s.labels = stream.labels;
        for (size_t i = lowerIndex(stream.entries, from); i < stream.entries.size(); ++i) {
            const auto& e = stream.entries[i];
            if (!(e.timestamp < through)) break;
            if (selector.matchesLine(e.line)) {
                s.entries.push_back(e);
            }
        }
        if (!s.entries.empty()) {
            out.push_back(std::move(s));
        }
    }
    return out;
}

LabelResponse MemoryStore::label(const Context& ctx, const LabelRequest& request) {
    std::set<std::string> values;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (const auto& [key, stream] : streams_) {
            if (ctx.done()) {
                throw EngineError(ctx.err());
            }
            size_t i = lowerIndex(stream.entries, request.start);
            if (i >= stream.entries.size() || request.end < stream.entries[i].timestamp) {
                continue;
            }
            if (request.values) {
                auto it = stream.labels.find(request.name);
                if (it != stream.labels.end()) {
                    values.insert(it->second);
                }
            } else {
                for (const auto& [name, value] : stream.labels) {
                    values.insert(name);
                }
            }
        }
    }
    LabelResponse resp;
    resp.values.assign(values.begin(), values.end());
    return resp;
}

std::unique_ptr<TailSubscription> MemoryStore::tail(
    const Context& ctx,
    const TailRequest& request,
    std::shared_ptr<TailSink> sink)
{
    LogQLParser parser;
    auto parsed = parser.parseLogSelector(request.query);
    if (!parsed.success) {
        throw EngineError(parsed.error.toString());
    }
    if (ctx.done()) {
        throw EngineError(ctx.err());
    }

    auto sub = std::make_shared<Subscription>();
    sub->id = next_sub_id_++;
    sub->selector = std::static_pointer_cast<LogSelectorExpr>(parsed.expr);
    sub->sink = sink;
    sub->delay = std::chrono::seconds(request.delay_for);

    // History is collected, delivered and the subscription published under
    // one hold of streams_mutex_, so every later push lands after it
    size_t history_size = 0;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        std::vector<Pending> history;
        auto through = addSaturating(now(), std::chrono::nanoseconds(1));
        for (const auto& [key, stream] : streams_) {
            if (!sub->selector->matchesLabels(stream.labels)) {
                continue;
            }
            for (size_t i = lowerIndex(stream.entries, request.start); i < stream.entries.size(); ++i) {
                const auto& e = stream.entries[i];
                if (!(e.timestamp < through)) break;
                if (sub->selector->matchesLine(e.line)) {
                    history.push_back(Pending{stream.labels, e});
                }
            }
        }

        std::stable_sort(history.begin(), history.end(),
            [](const Pending& a, const Pending& b) { return a.entry.timestamp < b.entry.timestamp; });
        if (history.size() > request.limit) {
            history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(request.limit));
        }
        std::lock_guard<std::mutex> sub_lock(subs_mutex_);
        if (stopping_) {
            throw EngineError("tail store is shutting down");
        }
        history_size = history.size();
        if (!history.empty()) {
            sink->push(toResponse(std::move(history)));
        }
        subs_[sub->id] = sub;
    }

    LOGQ_DEBUG("Tail subscription {} registered: query='{}', delay_for={}s, history={}",
        sub->id, request.query, request.delay_for, history_size);

    return std::make_unique<Handle>(*this, sub->id);
}

MemoryStore::Stats MemoryStore::getStats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        s.streams = streams_.size();
        s.entries = total_entries_;
    }
    std::lock_guard<std::mutex> lock(subs_mutex_);
    s.active_subscriptions = subs_.size();
    return s;
}

void MemoryStore::shutdown() {
    std::vector<std::shared_ptr<Subscription>> live;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        for (auto& [id, sub] : subs_) {
            live.push_back(sub);
        }
        subs_.clear();
    }
    dispatch_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    for (auto& sub : live) {
        sub->sink->fail("tail store is shutting down");
    }
    LOGQ_DEBUG("MemoryStore shut down ({} live subscriptions failed)", live.size());
}

void MemoryStore::Handle::close() {
    if (closed_.exchange(true)) {
        return;
    }
    store_.unsubscribe(id_);
}

void MemoryStore::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    if (subs_.erase(id) > 0) {
        LOGQ_DEBUG("Tail subscription {} released", id);
    }
}

void MemoryStore::dispatchLoop() {
    std::unique_lock<std::mutex> lock(subs_mutex_);
    while (!stopping_) {
        dispatch_cv_.wait_for(lock, std::chrono::milliseconds(config_.dispatch_interval_ms));
        if (stopping_) {
            break;
        }

        std::vector<std::pair<std::shared_ptr<TailSink>, std::vector<Pending>>> due;
        auto current = now();
        for (auto& [id, sub] : subs_) {
            if (sub->pending.empty()) {
                continue;
            }
            auto cutoff = current - sub->delay;
            std::stable_sort(sub->pending.begin(), sub->pending.end(),
                [](const Pending& a, const Pending& b) { return a.entry.timestamp < b.entry.timestamp; });
            auto split = std::find_if(sub->pending.begin(), sub->pending.end(),
                [&](const Pending& p) { return cutoff < p.entry.timestamp; });
            if (split == sub->pending.begin()) {
                continue;
            }
            std::vector<Pending> ready(std::make_move_iterator(sub->pending.begin()),
                                       std::make_move_iterator(split));
            sub->pending.erase(sub->pending.begin(), split);
            due.emplace_back(sub->sink, std::move(ready));
        }

        if (due.empty()) {
            continue;
        }
        lock.unlock();
        for (auto& [sink, ready] : due) {
            sink->push(toResponse(std::move(ready)));
        }
        lock.lock();
    }
}

TailResponse MemoryStore::toResponse(std::vector<Pending> pending) {
    TailResponse resp;
    std::map<std::string, size_t> index;
    for (auto& p : pending) {
        auto key = labelsToString(p.labels);
        auto it = index.find(key);
        if (it == index.end()) {
            it = index.emplace(key, resp.streams.size()).first;
            resp.streams.push_back(Stream{p.labels, {}});
        }
        resp.streams[it->second].entries.push_back(std::move(p.entry));
    }
    return resp;
}

} // namespace query
} // namespace logq
