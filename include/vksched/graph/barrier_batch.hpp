#pragma once

#include <vksched/graph/access.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vksched::graph {

// Barriers collected between two executed commands, flushed with a single
// vkCmdPipelineBarrier2. All memory owned by this struct.
struct BarrierBatch {
    std::vector<VkImageMemoryBarrier2> imageBarriers;
    std::vector<VkBufferMemoryBarrier2> bufferBarriers;

    // Build VkDependencyInfo pointing into the vectors above.
    // The returned struct references this batch's storage --
    // BarrierBatch must outlive the VkDependencyInfo.
    [[nodiscard]] VkDependencyInfo dependencyInfo() const;

    [[nodiscard]] bool empty() const { return imageBarriers.empty() && bufferBarriers.empty(); }

    [[nodiscard]] std::uint32_t size() const {
        return static_cast<std::uint32_t>(imageBarriers.size() + bufferBarriers.size());
    }

    void clear();
};

// Pipeline stages that perform the accesses in flags. NONE for an empty set.
[[nodiscard]] VkPipelineStageFlags2 accessStages(AccessFlags flags);

// synchronization2 access mask for flags. NONE for an empty set.
[[nodiscard]] VkAccessFlags2 accessMask(AccessFlags flags);

// Image layout a texture must be in for the accesses in flags.
[[nodiscard]] VkImageLayout accessLayout(AccessFlags flags);

// Append a whole-buffer barrier from src to dst. Always appends: the
// scheduler has already decided the barrier is needed.
void appendBufferBarrier(BarrierBatch& batch, VkBuffer buffer, AccessFlags src, AccessFlags dst);

// Append a single-mip image barrier from src to dst, including the layout
// transition the two accesses imply.
void appendTextureBarrier(BarrierBatch& batch, VkImage image, VkImageAspectFlags aspect,
                          std::uint32_t mipLevel, AccessFlags src, AccessFlags dst);

} // namespace vksched::graph
