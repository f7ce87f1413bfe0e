#pragma once

#include "tracing/trace_context.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace reqtrace {

/// Span attributes, iterated in key order
using AttributeMap = std::map<std::string, std::string>;

/**
 * @brief OpenCensus canonical status codes
 */
enum class StatusCode : int32_t {
    OK = 0,
    CANCELLED = 1,
    UNKNOWN = 2,
    INVALID_ARGUMENT = 3,
    DEADLINE_EXCEEDED = 4,
    NOT_FOUND = 5,
    ALREADY_EXISTS = 6,
    PERMISSION_DENIED = 7,
    RESOURCE_EXHAUSTED = 8,
    FAILED_PRECONDITION = 9,
    ABORTED = 10,
    OUT_OF_RANGE = 11,
    UNIMPLEMENTED = 12,
    INTERNAL = 13,
    UNAVAILABLE = 14,
    DATA_LOSS = 15,
    UNAUTHENTICATED = 16
};

[[nodiscard]] const char* status_code_name(StatusCode code);

struct SpanStatus {
    int32_t code = static_cast<int32_t>(StatusCode::OK);
    std::string message;

    SpanStatus() = default;
    SpanStatus(StatusCode c, std::string msg = "")
        : code(static_cast<int32_t>(c)), message(std::move(msg)) {}
    SpanStatus(int32_t c, std::string msg)
        : code(c), message(std::move(msg)) {}

    bool operator==(const SpanStatus&) const = default;
};

/**
 * @brief Map an HTTP response status to a trace status code
 *
 * 2xx/3xx are OK; well-known 4xx/5xx codes map to their canonical
 * counterpart; remaining 4xx are INVALID_ARGUMENT and remaining 5xx are
 * INTERNAL; anything else is UNKNOWN.
 */
[[nodiscard]] StatusCode http_status_to_trace_status(int http_status);

/**
 * @brief Live span handle issued by an ISpanBackend
 *
 * Addressed by its context; `id` is backend-local.
 */
struct SpanHandle {
    uint64_t id = 0;
    TraceContext context;
    std::optional<TraceContext> parent;
};

/**
 * @brief A finished span, as recorded/exported by a backend
 */
struct SpanRecord {
    std::string name;
    TraceContext context;
    std::optional<TraceContext> parent;
    AttributeMap attributes;
    SpanStatus status;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;

    /// Duration in microseconds
    [[nodiscard]] uint64_t duration_us() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                end_time - start_time).count());
    }
};

} // namespace reqtrace
