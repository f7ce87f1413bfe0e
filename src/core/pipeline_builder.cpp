#include "core/pipeline_builder.hpp"
#include "core/pipeline.hpp"

#include <stdexcept>

namespace reqtrace {

std::shared_ptr<Pipeline> PipelineBuilder::build() {
    for (const auto& stage : c_.stages) {
        if (!stage) throw std::runtime_error("PipelineBuilder: null pipeline stage");
    }
    return std::make_shared<Pipeline>(std::move(c_));
}

} // namespace reqtrace
