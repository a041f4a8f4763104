#include "query/context.h"

namespace logq {
namespace query {

Context::Context()
    : cancelled_(std::make_shared<std::atomic<bool>>(false))
{
}

Context Context::withDeadline(Clock::time_point deadline) {
    Context ctx;
    ctx.deadline_ = deadline;
    ctx.has_deadline_ = true;
    return ctx;
}

Context Context::withTimeout(Clock::duration timeout) {
    return withDeadline(Clock::now() + timeout);
}

std::string Context::err() const {
    if (cancelled()) return "context canceled";
    if (deadlineExceeded()) return "context deadline exceeded";
    return {};
}

} // namespace query
} // namespace logq
