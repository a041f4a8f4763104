#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "query/context.h"
#include "query/types.h"

namespace logq {
namespace query {

// Raised by engines and tailers: bad query text, unsupported expression,
// expired context.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message) : std::runtime_error(message) {}
};

class Query {
public:
    virtual ~Query() = default;
    virtual QueryResult exec(const Context& ctx) = 0;
};

/**
 * @brief Query execution engine boundary.
 *
 * Implementations must be safe for concurrent use; the HTTP layer adds no
 * locking around them.
 */
class Engine {
public:
    virtual ~Engine() = default;

    virtual std::unique_ptr<Query> newRangeQuery(
        const std::string& query,
        Timestamp start,
        Timestamp end,
        std::chrono::nanoseconds step,
        Direction direction,
        uint32_t limit) = 0;

    virtual std::unique_ptr<Query> newInstantQuery(
        const std::string& query,
        Timestamp ts,
        Direction direction,
        uint32_t limit) = 0;
};

// Receiving side of a live tail. A tailer may call it from any thread.
class TailSink {
public:
    virtual ~TailSink() = default;
    virtual void push(TailResponse response) = 0;
    // Terminal: the subscription will deliver nothing after this
    virtual void fail(const std::string& reason) = 0;
};

class TailSubscription {
public:
    virtual ~TailSubscription() = default;
    // Stops delivery to the sink. Throws on failure to release.
    virtual void close() = 0;
};

class Tailer {
public:
    virtual ~Tailer() = default;

    // Throws EngineError when the subscription cannot be started
    virtual std::unique_ptr<TailSubscription> tail(
        const Context& ctx,
        const TailRequest& request,
        std::shared_ptr<TailSink> sink) = 0;
};

class LabelQuerier {
public:
    virtual ~LabelQuerier() = default;
    virtual LabelResponse label(const Context& ctx, const LabelRequest& request) = 0;
};

} // namespace query
} // namespace logq
