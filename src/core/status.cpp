#include <rpclb/core/status.h>

namespace rpclb {

const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::failed_precondition: return "failed_precondition";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

std::string Status::ToString() const {
    if (message_.empty()) {
        return StatusCodeName(code_);
    }
    return std::string(StatusCodeName(code_)) + ": " + message_;
}

} // namespace rpclb
