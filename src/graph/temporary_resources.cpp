#include <vksched/graph/temporary_resources.hpp>

namespace vksched::graph {

void TemporaryResources::destroy(ResourceRegistry& registry) {
    for (const auto& [id, n] : descriptorSets_)
        registry.release(id, n);
    for (const auto& [id, n] : pipelines_)
        registry.release(id, n);
    for (const auto& [id, n] : samplers_)
        registry.release(id, n);
    for (const auto& [id, n] : textures_)
        registry.release(id, n);
    for (const auto& [id, n] : buffers_)
        registry.release(id, n);

    descriptorSets_.clear();
    pipelines_.clear();
    samplers_.clear();
    textures_.clear();
    buffers_.clear();
}

} // namespace vksched::graph
