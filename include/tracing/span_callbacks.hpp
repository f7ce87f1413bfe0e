#pragma once

#include "core/request_context.hpp"
#include "tracing/span.hpp"
#include <functional>
#include <string>

namespace reqtrace {

/**
 * @brief Span naming and status capability of the embedding module
 *
 * span_name() is called when the span starts; span_status() is called once
 * the response is ready (response fields of the context are filled in).
 */
class ISpanCallbacks {
public:
    virtual ~ISpanCallbacks() = default;

    [[nodiscard]] virtual std::string span_name(const RequestContext& request) const = 0;
    [[nodiscard]] virtual SpanStatus span_status(const RequestContext& request) const = 0;
};

/**
 * @brief Span name = request path, status = HTTP status mapped through
 * http_status_to_trace_status() with an empty message
 */
class DefaultSpanCallbacks : public ISpanCallbacks {
public:
    [[nodiscard]] std::string span_name(const RequestContext& request) const override;
    [[nodiscard]] SpanStatus span_status(const RequestContext& request) const override;
};

/**
 * @brief Callbacks supplied by the embedding module
 *
 * Either function may be left empty, in which case the default behavior is
 * used for it.
 */
class CustomSpanCallbacks : public ISpanCallbacks {
public:
    using NameFn = std::function<std::string(const RequestContext&)>;
    using StatusFn = std::function<SpanStatus(const RequestContext&)>;

    CustomSpanCallbacks(NameFn name_fn, StatusFn status_fn)
        : name_fn_(std::move(name_fn)), status_fn_(std::move(status_fn)) {}

    [[nodiscard]] std::string span_name(const RequestContext& request) const override;
    [[nodiscard]] SpanStatus span_status(const RequestContext& request) const override;

private:
    NameFn name_fn_;
    StatusFn status_fn_;
    DefaultSpanCallbacks defaults_;
};

} // namespace reqtrace
