#pragma once

#include "core/error.hpp"
#include "tracing/span.hpp"
#include <optional>
#include <string>

namespace reqtrace {

/**
 * @brief Abstract span storage/export backend
 *
 * Owns span handles: starts spans, records their status and closes them.
 * Implementations must be safe for concurrent use from independent
 * requests.
 */
class ISpanBackend {
public:
    virtual ~ISpanBackend() = default;

    /**
     * @brief Start a span
     * @param name Span name
     * @param attributes Attributes attached at start
     * @param parent Parent context; nullopt starts a new root trace
     * @return Live handle carrying the span's own context, or an error
     */
    [[nodiscard]] virtual Result<SpanHandle> start_span(
        const std::string& name,
        const AttributeMap& attributes,
        const std::optional<TraceContext>& parent) = 0;

    /**
     * @brief Context of the innermost span started and not yet finished on
     * the calling thread
     */
    [[nodiscard]] virtual std::optional<TraceContext> current_context() const = 0;

    /// @return false if the span is unknown (never started or already finished)
    virtual bool set_status(const SpanHandle& span, const SpanStatus& status) = 0;

    /// @return false if the span is unknown (never started or already finished)
    virtual bool finish_span(const SpanHandle& span) = 0;
};

} // namespace reqtrace
