#pragma once

#include <memory>
#include <vector>

namespace reqtrace {

// Forward declarations
class IPipelineStage;
class Pipeline;

/**
 * @brief All components that Pipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Runs first when set, so every later stage logs with trace metadata
    std::shared_ptr<IPipelineStage> tracing;

    // Remaining stages, in execution order
    std::vector<std::shared_ptr<IPipelineStage>> stages;
};

/**
 * @brief Builder pattern for Pipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_tracing(TraceMiddlewareBuilder().with_backend(backend).build())
 *       .with_stage(auth_stage)   // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_tracing(std::shared_ptr<IPipelineStage> p) { c_.tracing = std::move(p); return *this; }
    PipelineBuilder& with_stage(std::shared_ptr<IPipelineStage> p)   { c_.stages.push_back(std::move(p)); return *this; }

    /**
     * @brief Build the Pipeline from accumulated components.
     * @throws std::runtime_error if a null stage was added.
     */
    [[nodiscard]] std::shared_ptr<Pipeline> build();

private:
    PipelineComponents c_;
};

} // namespace reqtrace
