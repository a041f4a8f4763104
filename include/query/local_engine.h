#pragma once

#include <memory>

#include "query/engine.h"
#include "query/logql.h"
#include "query/memory_store.h"

namespace logq {
namespace query {

/**
 * @brief Engine over a MemoryStore.
 *
 * Log selectors return streams; count_over_time and rate return a vector
 * for instant queries and a matrix for range queries.
 */
class LocalEngine : public Engine {
public:
    // Maximum number of evaluation steps in one range query
    static constexpr int64_t kMaxPoints = 11000;

    explicit LocalEngine(std::shared_ptr<MemoryStore> store);

    std::unique_ptr<Query> newRangeQuery(
        const std::string& query,
        Timestamp start,
        Timestamp end,
        std::chrono::nanoseconds step,
        Direction direction,
        uint32_t limit) override;

    std::unique_ptr<Query> newInstantQuery(
        const std::string& query,
        Timestamp ts,
        Direction direction,
        uint32_t limit) override;

private:
    std::shared_ptr<MemoryStore> store_;
};

} // namespace query
} // namespace logq
