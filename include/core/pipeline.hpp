#pragma once

#include "core/request_context.hpp"
#include "core/pipeline_builder.hpp"
#include "core/pipeline_stage.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace reqtrace {

/// Route handler: fills in the response fields of the context
using Handler = std::function<void(RequestContext&)>;

/**
 * @brief Pipeline coordinator - runs the stage chain, then the handler
 *
 * Flow:
 * 1. Tracing stage (if configured)
 * 2. Remaining stages in order (BLOCK / SHORT_CIRCUIT stop the chain)
 * 3. Handler
 * 4. Before-send callbacks
 *
 * Step 4 runs exactly once on every exit path, including a stage or the
 * handler throwing. When unwinding, the status is raised to 500 before the
 * callbacks see it; the exception then continues to the caller.
 */
class Pipeline {
public:
    explicit Pipeline(PipelineComponents components);

    /**
     * @brief Execute request through pipeline
     * @param ctx Request context, response fields are filled in place
     * @param handler Route handler, skipped if a stage blocks or short-circuits
     */
    void execute(RequestContext& ctx, const Handler& handler);

    [[nodiscard]] size_t stage_count() const { return stages_.size(); }

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_blocked;
        uint64_t requests_failed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_blocked = requests_blocked_.load(std::memory_order_relaxed),
            .requests_failed = requests_failed_.load(std::memory_order_relaxed),
        };
    }

private:
    /**
     * @brief Ordered chain of stages (tracing first)
     */
    std::vector<std::shared_ptr<IPipelineStage>> stages_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> requests_blocked_{0};
    mutable std::atomic<uint64_t> requests_failed_{0};
};

} // namespace reqtrace
