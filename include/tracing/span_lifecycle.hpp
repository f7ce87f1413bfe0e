#pragma once

#include "core/utils.hpp"
#include "tracing/ispan_backend.hpp"
#include <memory>
#include <optional>
#include <string>

namespace reqtrace {

/**
 * @brief Starts, annotates and finishes the span of one request
 *
 * Backend failures never abort a request: a failed start yields nullopt
 * and a failed status/finish is logged.
 */
class SpanLifecycle {
public:
    static constexpr std::string_view kTraceIdKey = "trace_id";
    static constexpr std::string_view kSpanIdKey = "span_id";
    static constexpr std::string_view kTraceOptionsKey = "trace_options";

    explicit SpanLifecycle(std::shared_ptr<ISpanBackend> backend);

    /**
     * @brief Start a span, as a child of parent when present
     * @return Live handle, or nullopt if the backend could not start it
     */
    [[nodiscard]] std::optional<SpanHandle> start_span(
        const std::string& name,
        const AttributeMap& attributes,
        const std::optional<TraceContext>& parent);

    /**
     * @brief Bind trace_id, span_id and trace_options into the calling
     * thread's log metadata until the returned scope is released
     */
    [[nodiscard]] static utils::log::MetadataScope bind_logging_context(const TraceContext& ctx);

    /// Metadata entries for ctx: 32-hex trace_id, 16-hex span_id, decimal trace_options
    [[nodiscard]] static utils::log::Metadata logging_metadata(const TraceContext& ctx);

    /// Report status onto the span, then close it. Call at most once per span.
    void finish(const SpanHandle& span, const SpanStatus& status);

    [[nodiscard]] const std::shared_ptr<ISpanBackend>& backend() const { return backend_; }

private:
    std::shared_ptr<ISpanBackend> backend_;
};

} // namespace reqtrace
