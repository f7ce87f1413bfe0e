#include "tracing/trace_middleware.hpp"
#include "core/utils.hpp"
#include <format>

namespace reqtrace {

namespace {

// Backend unavailable: keep propagating a context, untraced
TraceContext untraced_context(const std::optional<TraceContext>& parent) {
    return parent ? TraceContext::child_of(*parent) : TraceContext::generate();
}

} // anonymous namespace

TraceMiddleware::TraceMiddleware(Options options)
    : lifecycle_(std::make_shared<SpanLifecycle>(std::move(options.backend))),
      callbacks_(options.callbacks
                     ? std::move(options.callbacks)
                     : std::shared_ptr<const ISpanCallbacks>(std::make_shared<DefaultSpanCallbacks>())),
      resolver_(std::move(options.attributes), std::move(options.owner), options.modules) {}

std::optional<TraceContext> TraceMiddleware::load_parent(const RequestContext& ctx) {
    const auto values = ctx.get_req_header(TraceContext::kHeaderName);
    if (values.size() != 1) return std::nullopt;
    return TraceContext::decode(values.front());
}

TraceMiddleware::Result TraceMiddleware::process(RequestContext& ctx) {
    ctx.parent_context = load_parent(ctx);
    const std::string span_name = callbacks_->span_name(ctx);

    AttributeMap attributes;
    try {
        attributes = resolver_.resolve(ctx);
    } catch (const std::exception& e) {
        // Still record the failed request before the error escapes
        record_resolver_failure(ctx, span_name, e.what());
        throw;
    } catch (...) {
        record_resolver_failure(ctx, span_name, "non-standard exception");
        throw;
    }

    auto span = lifecycle_->start_span(span_name, attributes, ctx.parent_context);
    ctx.trace_context = span ? span->context : untraced_context(ctx.parent_context);

    auto log_scope = std::make_shared<utils::log::MetadataScope>(
        SpanLifecycle::bind_logging_context(ctx.trace_context));

    ctx.put_resp_header(TraceContext::kHeaderName, ctx.trace_context.encode());

    ctx.register_before_send(
        [lifecycle = lifecycle_, callbacks = callbacks_, span = std::move(span), log_scope]
        (RequestContext& c) {
            if (span) {
                SpanStatus status;
                try {
                    status = callbacks->span_status(c);
                } catch (const std::exception& e) {
                    utils::log::warn(std::format("span_status failed for {}: {}", c.path, e.what()));
                    status = SpanStatus(StatusCode::UNKNOWN, e.what());
                } catch (...) {
                    utils::log::warn(std::format("span_status failed for {}: non-standard exception",
                        c.path));
                    status = SpanStatus(StatusCode::UNKNOWN, "non-standard exception");
                }
                lifecycle->finish(*span, status);
            }
            log_scope->release();
        });

    utils::log::debug(std::format("{} {} traced as {} (parent: {})",
        ctx.method, ctx.path, span_name,
        ctx.parent_context ? ctx.parent_context->span_id_hex() : "none"));

    return Result::CONTINUE;
}

void TraceMiddleware::record_resolver_failure(RequestContext& ctx, const std::string& span_name,
                                              const std::string& message) {
    utils::log::error(std::format("Attribute resolution failed for {} {}: {}",
        ctx.method, ctx.path, message));

    auto span = lifecycle_->start_span(span_name, {}, ctx.parent_context);
    ctx.trace_context = span ? span->context : untraced_context(ctx.parent_context);
    ctx.put_resp_header(TraceContext::kHeaderName, ctx.trace_context.encode());
    if (span) {
        lifecycle_->finish(*span, SpanStatus(StatusCode::INTERNAL, message));
    }
}

std::unique_ptr<TraceMiddleware> TraceMiddlewareBuilder::build() {
    return std::make_unique<TraceMiddleware>(std::move(o_));
}

} // namespace reqtrace
