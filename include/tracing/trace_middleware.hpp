#pragma once

#include "core/pipeline_stage.hpp"
#include "tracing/attribute_resolver.hpp"
#include "tracing/ispan_backend.hpp"
#include "tracing/span_callbacks.hpp"
#include "tracing/span_lifecycle.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace reqtrace {

/**
 * @brief Traces each request passing through the pipeline
 *
 * Per request:
 * 1. Decode the inbound traceparent header (absent/invalid = new root trace)
 * 2. Resolve attributes and start a span named by the callbacks
 * 3. Bind trace_id/span_id/trace_options into the thread's log metadata
 * 4. Write the span's context as the traceparent response header
 * 5. Register a before-send callback that sets the span status and
 *    finishes the span, then unbinds the log metadata
 *
 * A failing attribute function propagates out of process(); the span for
 * that request is finished with INTERNAL status before the error escapes.
 */
class TraceMiddleware : public IPipelineStage {
public:
    struct Options {
        std::shared_ptr<ISpanBackend> backend;                   // Required
        std::shared_ptr<const ISpanCallbacks> callbacks;         // nullptr = defaults
        std::shared_ptr<const AttributeModule> owner;            // Target of local specs
        AttributeModuleRegistry modules = AttributeModuleRegistry::with_builtins();
        std::vector<AttributeSpec> attributes;
    };

    /**
     * @throws std::invalid_argument if the backend is missing or an
     *         attribute spec names an unknown module/function
     */
    explicit TraceMiddleware(Options options);

    [[nodiscard]] Result process(RequestContext& ctx) override;

    [[nodiscard]] std::string_view name() const override { return "trace"; }

    /**
     * @brief Parent context carried by the request, if any
     *
     * Only a single, well-formed traceparent value is accepted.
     */
    [[nodiscard]] static std::optional<TraceContext> load_parent(const RequestContext& ctx);

    [[nodiscard]] const std::shared_ptr<SpanLifecycle>& lifecycle() const { return lifecycle_; }

private:
    /// Header and a finished INTERNAL span for a request whose attributes
    /// could not be resolved
    void record_resolver_failure(RequestContext& ctx, const std::string& span_name,
                                 const std::string& message);

    std::shared_ptr<SpanLifecycle> lifecycle_;
    std::shared_ptr<const ISpanCallbacks> callbacks_;
    AttributeResolver resolver_;
};

/**
 * @brief Builder for TraceMiddleware.
 *
 * Usage:
 *   auto tracing = TraceMiddlewareBuilder()
 *       .with_backend(backend)
 *       .with_owner(app_module)
 *       .with_attribute(AttributeSpec::local("method"))
 *       .with_attribute(AttributeSpec::remote("geo", "region"))
 *       .build();
 */
class TraceMiddlewareBuilder {
public:
    TraceMiddlewareBuilder& with_backend(std::shared_ptr<ISpanBackend> p)            { o_.backend = std::move(p); return *this; }
    TraceMiddlewareBuilder& with_callbacks(std::shared_ptr<const ISpanCallbacks> p)  { o_.callbacks = std::move(p); return *this; }
    TraceMiddlewareBuilder& with_owner(std::shared_ptr<const AttributeModule> p)     { o_.owner = std::move(p); return *this; }
    TraceMiddlewareBuilder& with_module(std::shared_ptr<const AttributeModule> p)    { o_.modules.register_module(std::move(p)); return *this; }
    TraceMiddlewareBuilder& with_attribute(AttributeSpec spec)                       { o_.attributes.push_back(std::move(spec)); return *this; }
    TraceMiddlewareBuilder& with_attributes(std::vector<AttributeSpec> specs)        { o_.attributes = std::move(specs); return *this; }

    /**
     * @brief Build the middleware from accumulated options.
     * @throws std::invalid_argument on missing backend or unresolvable specs.
     */
    [[nodiscard]] std::unique_ptr<TraceMiddleware> build();

private:
    TraceMiddleware::Options o_;
};

} // namespace reqtrace
