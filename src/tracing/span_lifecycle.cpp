#include "tracing/span_lifecycle.hpp"
#include <format>
#include <stdexcept>

namespace reqtrace {

SpanLifecycle::SpanLifecycle(std::shared_ptr<ISpanBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("SpanLifecycle requires a span backend");
    }
}

std::optional<SpanHandle> SpanLifecycle::start_span(
        const std::string& name,
        const AttributeMap& attributes,
        const std::optional<TraceContext>& parent) {
    try {
        auto result = backend_->start_span(name, attributes, parent);
        if (result.is_error()) {
            utils::log::warn(std::format("Failed to start span '{}' ({}): {}",
                name, error_category_name(result.error_category()), result.error_message()));
            return std::nullopt;
        }
        return std::move(result.value());
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Span backend threw while starting '{}': {}", name, e.what()));
        return std::nullopt;
    } catch (...) {
        utils::log::warn(std::format("Span backend threw a non-standard exception while starting '{}'",
            name));
        return std::nullopt;
    }
}

utils::log::Metadata SpanLifecycle::logging_metadata(const TraceContext& ctx) {
    return {
        {std::string(kTraceIdKey), ctx.trace_id_hex()},
        {std::string(kSpanIdKey), ctx.span_id_hex()},
        {std::string(kTraceOptionsKey), std::to_string(ctx.trace_options)},
    };
}

utils::log::MetadataScope SpanLifecycle::bind_logging_context(const TraceContext& ctx) {
    return utils::log::MetadataScope(logging_metadata(ctx));
}

void SpanLifecycle::finish(const SpanHandle& span, const SpanStatus& status) {
    try {
        if (!backend_->set_status(span, status)) {
            utils::log::warn(std::format("Span {} unknown to backend when setting status",
                span.context.span_id_hex()));
        }
        if (!backend_->finish_span(span)) {
            utils::log::warn(std::format("Span {} unknown to backend when finishing",
                span.context.span_id_hex()));
        }
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Span backend threw while finishing {}: {}",
            span.context.span_id_hex(), e.what()));
    } catch (...) {
        utils::log::warn(std::format("Span backend threw a non-standard exception while finishing {}",
            span.context.span_id_hex()));
    }
}

} // namespace reqtrace
