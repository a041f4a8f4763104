#include "query/local_engine.h"
#include "utils/logger.h"

#include <algorithm>
#include <map>

namespace logq {
namespace query {

namespace {

struct FlatEntry {
    const LabelSet* labels;
    const Entry* entry;
};

class LocalQuery : public Query {
public:
    LocalQuery(std::shared_ptr<MemoryStore> store, std::string query,
               Timestamp start, Timestamp end, std::chrono::nanoseconds step,
               Direction direction, uint32_t limit, bool instant)
        : store_(std::move(store)), query_(std::move(query)),
          start_(start), end_(end), step_(step),
          direction_(direction), limit_(limit), instant_(instant) {}

    QueryResult exec(const Context& ctx) override {
        LogQLParser parser;
        auto parsed = parser.parse(query_);
        if (!parsed.success) {
            throw EngineError(parsed.error.toString());
        }
        checkContext(ctx);

        if (parsed.expr->getType() == ExprType::LogSelector) {
            auto selector = std::static_pointer_cast<LogSelectorExpr>(parsed.expr);
            if (instant_) {
                return selectLogs(ctx, *selector, start_, addSaturating(start_, std::chrono::nanoseconds(1)));
            }
            return selectLogs(ctx, *selector, start_, end_);
        }

        auto agg = std::static_pointer_cast<RangeAggregationExpr>(parsed.expr);
        if (instant_) {
            return evalVector(ctx, *agg);
        }
        return evalMatrix(ctx, *agg);
    }

private:
    static void checkContext(const Context& ctx) {
        if (ctx.done()) {
            throw EngineError(ctx.err());
        }
    }

    Streams selectLogs(const Context& ctx, const LogSelectorExpr& selector,
                       Timestamp from, Timestamp through) const {
        Streams matched = store_->select(ctx, selector, from, through);

        std::vector<FlatEntry> flat;
        for (const auto& s : matched) {
            for (const auto& e : s.entries) {
                flat.push_back(FlatEntry{&s.labels, &e});
            }
        }
        if (direction_ == Direction::FORWARD) {
            std::stable_sort(flat.begin(), flat.end(), [](const FlatEntry& a, const FlatEntry& b) {
                return a.entry->timestamp < b.entry->timestamp;
            });
        } else {
            std::stable_sort(flat.begin(), flat.end(), [](const FlatEntry& a, const FlatEntry& b) {
                return b.entry->timestamp < a.entry->timestamp;
            });
        }
        if (flat.size() > limit_) {
            flat.resize(limit_);
        }
        checkContext(ctx);

        // Regroup, streams in order of their first entry
        Streams out;
        std::map<const LabelSet*, size_t> index;
        for (const auto& f : flat) {
            auto it = index.find(f.labels);
            if (it == index.end()) {
                it = index.emplace(f.labels, out.size()).first;
                out.push_back(Stream{*f.labels, {}});
            }
            out[it->second].entries.push_back(*f.entry);
        }
        return out;
    }

    static double sampleValue(const RangeAggregationExpr& agg, size_t count) {
        if (agg.op == RangeOp::Rate) {
            double secs = std::chrono::duration<double>(agg.range).count();
            return secs > 0 ? static_cast<double>(count) / secs : 0.0;
        }
        return static_cast<double>(count);
    }

    // Entries with t - range < ts <= t
    static size_t countWindow(const std::vector<Entry>& entries, Timestamp t, std::chrono::nanoseconds range) {
        auto lo = std::upper_bound(entries.begin(), entries.end(), addSaturating(t, -range),
            [](Timestamp v, const Entry& e) { return v < e.timestamp; });
        auto hi = std::upper_bound(entries.begin(), entries.end(), t,
            [](Timestamp v, const Entry& e) { return v < e.timestamp; });
        return static_cast<size_t>(hi - lo);
    }

    Vector evalVector(const Context& ctx, const RangeAggregationExpr& agg) const {
        auto one = std::chrono::nanoseconds(1);
        Streams streams = store_->select(ctx, *agg.selector,
            addSaturating(start_, one - agg.range), addSaturating(start_, one));
        Vector out;
        for (const auto& s : streams) {
            size_t n = countWindow(s.entries, start_, agg.range);
            if (n == 0) continue;
            out.push_back(Sample{s.labels, start_, sampleValue(agg, n)});
        }
        return out;
    }

    Matrix evalMatrix(const Context& ctx, const RangeAggregationExpr& agg) const {
        if (step_.count() <= 0) {
            throw EngineError("zero or negative query resolution step widths are not accepted");
        }
        if (end_ < start_) {
            throw EngineError("end timestamp must not be before start time");
        }
        // A span too wide for int64 nanoseconds saturates and fails the point limit
        auto steps = subSaturating(end_, start_) / step_;
        if (steps >= LocalEngine::kMaxPoints) {
            throw EngineError("exceeded maximum resolution of " +
                std::to_string(LocalEngine::kMaxPoints) +
                " points per timeseries. Try decreasing the query resolution (?step=XX)");
        }

        auto one = std::chrono::nanoseconds(1);
        Streams streams = store_->select(ctx, *agg.selector,
            addSaturating(start_, one - agg.range), addSaturating(end_, one));
        Matrix out;
        for (const auto& s : streams) {
            checkContext(ctx);
            Series series;
            series.metric = s.labels;
            for (int64_t i = 0; i <= steps; ++i) {
                Timestamp t = start_ + step_ * i;
                size_t n = countWindow(s.entries, t, agg.range);
                if (n > 0) {
                    series.points.push_back(Point{t, sampleValue(agg, n)});
                }
            }
            if (!series.points.empty()) {
                out.push_back(std::move(series));
            }
        }
        return out;
    }

    std::shared_ptr<MemoryStore> store_;
    std::string query_;
    Timestamp start_;
    Timestamp end_;
    std::chrono::nanoseconds step_;
    Direction direction_;
    uint32_t limit_;
    bool instant_;
};

} // namespace

LocalEngine::LocalEngine(std::shared_ptr<MemoryStore> store)
    : store_(std::move(store))
{
}

std::unique_ptr<Query> LocalEngine::newRangeQuery(
    const std::string& query,
    Timestamp start,
    Timestamp end,
    std::chrono::nanoseconds step,
    Direction direction,
    uint32_t limit)
{
    LOGQ_TRACE("newRangeQuery: query='{}' step={}ns limit={}", query, step.count(), limit);
    return std::make_unique<LocalQuery>(store_, query, start, end, step, direction, limit, false);
}

std::unique_ptr<Query> LocalEngine::newInstantQuery(
    const std::string& query,
    Timestamp ts,
    Direction direction,
    uint32_t limit)
{
    LOGQ_TRACE("newInstantQuery: query='{}' limit={}", query, limit);
    return std::make_unique<LocalQuery>(store_, query, ts, ts, std::chrono::nanoseconds(0), direction, limit, true);
}

} // namespace query
} // namespace logq
