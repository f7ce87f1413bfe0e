#include "tracing/span_callbacks.hpp"

namespace reqtrace {

std::string DefaultSpanCallbacks::span_name(const RequestContext& request) const {
    const auto query = request.path.find('?');
    return query == std::string::npos ? request.path : request.path.substr(0, query);
}

SpanStatus DefaultSpanCallbacks::span_status(const RequestContext& request) const {
    return SpanStatus(http_status_to_trace_status(request.status), "");
}

std::string CustomSpanCallbacks::span_name(const RequestContext& request) const {
    return name_fn_ ? name_fn_(request) : defaults_.span_name(request);
}

SpanStatus CustomSpanCallbacks::span_status(const RequestContext& request) const {
    return status_fn_ ? status_fn_(request) : defaults_.span_status(request);
}

} // namespace reqtrace
