#pragma once

#include <stdexcept>
#include <string>

namespace logq {
namespace server {

enum class ErrorKind {
    InvalidParameter,   // malformed client input
    DelayTooLarge,      // tail delay_for above the configured maximum
    EngineExecution,    // query evaluation failed
    Encode,             // response serialization failed
    Upgrade,            // websocket handshake failed
    Subscription,       // tailer refused or lost the subscription
    StreamWrite         // frame write to the client failed
};

const char* errorKindName(ErrorKind kind);

/**
 * @brief Failure raised by the query API layer.
 *
 * InvalidParameter, DelayTooLarge and EngineExecution are attributed to the
 * caller (400); everything else is a server fault (500).
 */
class ApiError : public std::runtime_error {
public:
    ApiError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    unsigned statusCode() const;

private:
    ErrorKind kind_;
};

} // namespace server
} // namespace logq
