#pragma once

#include <vksched/graph/resource_id.hpp>
#include <vksched/graph/resource_registry.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace vksched::graph {

// Counting multiset of the resources one executed stream touched. Every
// insert() matches one retain() in the registry; destroy() hands all of them
// back once the GPU work that used them has retired, so a resource released
// by its owner mid-frame stays alive until then.
//
// Thread safety: thread-confined.
class TemporaryResources {
public:
    void insert(BufferId id) { ++buffers_[id]; }
    void insert(TextureId id) { ++textures_[id]; }
    void insert(SamplerId id) { ++samplers_[id]; }
    void insert(PipelineId id) { ++pipelines_[id]; }
    void insert(DescriptorSetId id) { ++descriptorSets_[id]; }

    [[nodiscard]] std::uint32_t count(BufferId id) const { return lookup(buffers_, id); }
    [[nodiscard]] std::uint32_t count(TextureId id) const { return lookup(textures_, id); }
    [[nodiscard]] std::uint32_t count(SamplerId id) const { return lookup(samplers_, id); }
    [[nodiscard]] std::uint32_t count(PipelineId id) const { return lookup(pipelines_, id); }
    [[nodiscard]] std::uint32_t count(DescriptorSetId id) const {
        return lookup(descriptorSets_, id);
    }

    // Distinct resources held.
    [[nodiscard]] std::size_t size() const {
        return buffers_.size() + textures_.size() + samplers_.size() + pipelines_.size() +
               descriptorSets_.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    // Release every held reference, pushing a DeletionEvent for each
    // resource whose count reaches zero, and empty the set. Calling it
    // again is a no-op.
    void destroy(ResourceRegistry& registry);

private:
    template <typename Map, typename Id>
    static std::uint32_t lookup(const Map& map, const Id& id) {
        auto it = map.find(id);
        return it == map.end() ? 0 : it->second;
    }

    std::unordered_map<BufferId, std::uint32_t> buffers_;
    std::unordered_map<TextureId, std::uint32_t> textures_;
    std::unordered_map<SamplerId, std::uint32_t> samplers_;
    std::unordered_map<PipelineId, std::uint32_t> pipelines_;
    std::unordered_map<DescriptorSetId, std::uint32_t> descriptorSets_;
};

} // namespace vksched::graph
