#include "tracing/span.hpp"

namespace reqtrace {

const char* status_code_name(StatusCode code) {
    switch (code) {
        case StatusCode::OK:                  return "OK";
        case StatusCode::CANCELLED:           return "CANCELLED";
        case StatusCode::UNKNOWN:             return "UNKNOWN";
        case StatusCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case StatusCode::DEADLINE_EXCEEDED:   return "DEADLINE_EXCEEDED";
        case StatusCode::NOT_FOUND:           return "NOT_FOUND";
        case StatusCode::ALREADY_EXISTS:      return "ALREADY_EXISTS";
        case StatusCode::PERMISSION_DENIED:   return "PERMISSION_DENIED";
        case StatusCode::RESOURCE_EXHAUSTED:  return "RESOURCE_EXHAUSTED";
        case StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case StatusCode::ABORTED:             return "ABORTED";
        case StatusCode::OUT_OF_RANGE:        return "OUT_OF_RANGE";
        case StatusCode::UNIMPLEMENTED:       return "UNIMPLEMENTED";
        case StatusCode::INTERNAL:            return "INTERNAL";
        case StatusCode::UNAVAILABLE:         return "UNAVAILABLE";
        case StatusCode::DATA_LOSS:           return "DATA_LOSS";
        case StatusCode::UNAUTHENTICATED:     return "UNAUTHENTICATED";
    }
    return "UNKNOWN";
}

StatusCode http_status_to_trace_status(int http_status) {
    if (http_status >= 200 && http_status < 400) return StatusCode::OK;

    switch (http_status) {
        case 400: return StatusCode::INVALID_ARGUMENT;
        case 401: return StatusCode::UNAUTHENTICATED;
        case 403: return StatusCode::PERMISSION_DENIED;
        case 404: return StatusCode::NOT_FOUND;
        case 429: return StatusCode::RESOURCE_EXHAUSTED;
        case 499: return StatusCode::CANCELLED;
        case 501: return StatusCode::UNIMPLEMENTED;
        case 503: return StatusCode::UNAVAILABLE;
        case 504: return StatusCode::DEADLINE_EXCEEDED;
        default: break;
    }

    if (http_status >= 400 && http_status < 500) return StatusCode::INVALID_ARGUMENT;
    if (http_status >= 500 && http_status < 600) return StatusCode::INTERNAL;
    return StatusCode::UNKNOWN;
}

} // namespace reqtrace
