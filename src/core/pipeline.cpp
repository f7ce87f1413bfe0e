#include "core/pipeline.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace reqtrace {

namespace {

/**
 * @brief Runs the context's before-send callbacks when the request scope
 * ends, however it ends
 */
class BeforeSendGuard {
public:
    explicit BeforeSendGuard(RequestContext& ctx)
        : ctx_(ctx), uncaught_(std::uncaught_exceptions()) {}

    ~BeforeSendGuard() {
        if (std::uncaught_exceptions() > uncaught_ && ctx_.status < 500) {
            ctx_.status = 500;
        }
        ctx_.run_before_send();
    }

    BeforeSendGuard(const BeforeSendGuard&) = delete;
    BeforeSendGuard& operator=(const BeforeSendGuard&) = delete;

private:
    RequestContext& ctx_;
    const int uncaught_;
};

} // anonymous namespace

Pipeline::Pipeline(PipelineComponents components) {
    if (components.tracing) {
        stages_.push_back(std::move(components.tracing));
    }
    for (auto& stage : components.stages) {
        stages_.push_back(std::move(stage));
    }
}

void Pipeline::execute(RequestContext& ctx, const Handler& handler) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    BeforeSendGuard guard(ctx);
    try {
        for (const auto& stage : stages_) {
            const auto result = stage->process(ctx);
            if (result == IPipelineStage::Result::BLOCK) {
                requests_blocked_.fetch_add(1, std::memory_order_relaxed);
                utils::log::info(std::format("{} {} blocked by stage '{}' with status {}",
                    ctx.method, ctx.path, stage->name(), ctx.status));
                return;
            }
            if (result == IPipelineStage::Result::SHORT_CIRCUIT) {
                return;
            }
        }

        if (handler) {
            handler(ctx);
        }
    } catch (const std::exception& e) {
        requests_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("{} {} failed: {}", ctx.method, ctx.path, e.what()));
        throw;
    } catch (...) {
        requests_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("{} {} failed with a non-standard exception",
            ctx.method, ctx.path));
        throw;
    }
}

} // namespace reqtrace
