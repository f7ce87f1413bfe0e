#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reqtrace {

/**
 * @brief 128-bit trace identifier (big-endian halves, as written on the wire)
 */
struct TraceId {
    uint64_t high = 0;
    uint64_t low = 0;

    [[nodiscard]] bool is_zero() const { return high == 0 && low == 0; }

    bool operator==(const TraceId&) const = default;
};

/**
 * @brief W3C Trace Context (traceparent)
 *
 * Identifies one span of one trace. A context with an all-zero trace_id
 * or span_id is the "undefined" sentinel and is never produced by decode().
 *
 * Format: "00-{trace_id}-{span_id}-{options}"
 *   trace_id: 32 hex chars (128-bit)
 *   span_id:  16 hex chars (64-bit)
 *   options:  2 hex chars (8-bit, 01 = sampled)
 */
struct TraceContext {
    TraceId trace_id;
    uint64_t span_id = 0;
    uint8_t trace_options = 0x01; // sampled by default

    /// Propagation header name, written lower-case
    static constexpr std::string_view kHeaderName = "traceparent";

    /// Encoded header length: 2 + 1 + 32 + 1 + 16 + 1 + 2
    static constexpr size_t kEncodedSize = 55;

    static constexpr uint8_t kSampledFlag = 0x01;

    [[nodiscard]] bool is_valid() const { return !trace_id.is_zero() && span_id != 0; }
    [[nodiscard]] bool is_sampled() const { return (trace_options & kSampledFlag) != 0; }

    /// 32 lower-case hex digits, zero-padded
    [[nodiscard]] std::string trace_id_hex() const;

    /// 16 lower-case hex digits, zero-padded
    [[nodiscard]] std::string span_id_hex() const;

    /// Serialize to traceparent header value (lower-case hex)
    [[nodiscard]] std::string encode() const;

    /**
     * @brief Parse a traceparent header value
     * @return nullopt on any malformed input or the undefined sentinel; never throws
     */
    [[nodiscard]] static std::optional<TraceContext> decode(std::string_view header) noexcept;

    /// Fresh root context (new trace_id + span_id, sampled)
    [[nodiscard]] static TraceContext generate();

    /// Context for a new span in the same trace as parent
    [[nodiscard]] static TraceContext child_of(const TraceContext& parent);

    /// Random non-zero 64-bit span ID
    [[nodiscard]] static uint64_t generate_span_id();

    /// Random non-zero 128-bit trace ID
    [[nodiscard]] static TraceId generate_trace_id();

    bool operator==(const TraceContext&) const = default;
};

} // namespace reqtrace
