#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace logq {
namespace query {

/**
 * @brief Deadline and cancellation scope for one engine or tailer call.
 *
 * Copies share the cancellation flag, so cancelling any copy cancels all.
 * A default-constructed context never expires.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context();

    static Context background() { return Context(); }
    static Context withDeadline(Clock::time_point deadline);
    static Context withTimeout(Clock::duration timeout);

    bool hasDeadline() const { return has_deadline_; }
    Clock::time_point deadline() const { return deadline_; }

    void cancel() const { cancelled_->store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_->load(std::memory_order_relaxed); }
    bool deadlineExceeded() const { return has_deadline_ && Clock::now() >= deadline_; }
    bool done() const { return cancelled() || deadlineExceeded(); }

    // Empty while the context is live
    std::string err() const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    Clock::time_point deadline_{};
    bool has_deadline_ = false;
};

} // namespace query
} // namespace logq
