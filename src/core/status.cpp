#include <dspool/core/status.h>

namespace dspool {

std::string_view StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::internal_error: return "internal_error";
        case StatusCode::unknown_strategy: return "unknown_strategy";
        case StatusCode::invalid_policy: return "invalid_policy";
        case StatusCode::invalid_endpoint: return "invalid_endpoint";
        case StatusCode::empty_pool: return "empty_pool";
        case StatusCode::unregistered_connection: return "unregistered_connection";
        case StatusCode::pool_exhausted: return "pool_exhausted";
    }
    return "unknown";
}

std::string Status::ToString() const {
    std::string out(StatusCodeName(code_));
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }
    return out;
}

} // namespace dspool
