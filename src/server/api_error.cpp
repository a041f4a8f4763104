#include "server/api_error.h"

namespace logq {
namespace server {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidParameter: return "invalid_parameter";
        case ErrorKind::DelayTooLarge: return "delay_too_large";
        case ErrorKind::EngineExecution: return "engine_execution";
        case ErrorKind::Encode: return "encode";
        case ErrorKind::Upgrade: return "upgrade";
        case ErrorKind::Subscription: return "subscription";
        case ErrorKind::StreamWrite: return "stream_write";
    }
    return "unknown";
}

unsigned ApiError::statusCode() const {
    switch (kind_) {
        case ErrorKind::InvalidParameter:
        case ErrorKind::DelayTooLarge:
        case ErrorKind::EngineExecution:
            return 400;
        default:
            return 500;
    }
}

} // namespace server
} // namespace logq
