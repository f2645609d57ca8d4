#include <vksched/graph/barrier_batch.hpp>

namespace vksched::graph {

VkDependencyInfo BarrierBatch::dependencyInfo() const {
    VkDependencyInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    info.imageMemoryBarrierCount = static_cast<std::uint32_t>(imageBarriers.size());
    info.pImageMemoryBarriers = imageBarriers.data();
    info.bufferMemoryBarrierCount = static_cast<std::uint32_t>(bufferBarriers.size());
    info.pBufferMemoryBarriers = bufferBarriers.data();
    return info;
}

void BarrierBatch::clear() {
    imageBarriers.clear();
    bufferBarriers.clear();
}

VkPipelineStageFlags2 accessStages(AccessFlags flags) {
    VkPipelineStageFlags2 stages = VK_PIPELINE_STAGE_2_NONE;
    if (flags & (Access::TransferRead | Access::TransferWrite))
        stages |= VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT;
    if (flags & Access::Index)
        stages |= VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT;
    if (flags & Access::Indirect)
        stages |= VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT;
    if (flags & (Access::VertexShaderRead | Access::VertexShaderWrite))
        stages |= VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT;
    if (flags & (Access::FragmentShaderRead | Access::FragmentShaderWrite))
        stages |= VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
    if (flags & (Access::ComputeShaderRead | Access::ComputeShaderWrite))
        stages |= VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT;
    if (flags & (Access::ColorAttachmentRead | Access::ColorAttachmentWrite))
        stages |= VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;
    if (flags & (Access::DepthAttachmentRead | Access::DepthAttachmentWrite)) {
        stages |= VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT |
                  VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT;
    }
    // Present is ordered by the presentation engine's semaphores, no stage.
    return stages;
}

VkAccessFlags2 accessMask(AccessFlags flags) {
    VkAccessFlags2 mask = VK_ACCESS_2_NONE;
    if (flags & Access::TransferRead)
        mask |= VK_ACCESS_2_TRANSFER_READ_BIT;
    if (flags & Access::TransferWrite)
        mask |= VK_ACCESS_2_TRANSFER_WRITE_BIT;
    if (flags & Access::Index)
        mask |= VK_ACCESS_2_INDEX_READ_BIT;
    if (flags & Access::Indirect)
        mask |= VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT;
    if (flags & Access::ShaderRead)
        mask |= VK_ACCESS_2_SHADER_READ_BIT;
    if (flags & Access::ShaderWrite)
        mask |= VK_ACCESS_2_SHADER_WRITE_BIT;
    if (flags & Access::ColorAttachmentRead)
        mask |= VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT;
    if (flags & Access::ColorAttachmentWrite)
        mask |= VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT;
    if (flags & Access::DepthAttachmentRead)
        mask |= VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT;
    if (flags & Access::DepthAttachmentWrite)
        mask |= VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
    return mask;
}

VkImageLayout accessLayout(AccessFlags flags) {
    constexpr AccessFlags color = Access::ColorAttachmentRead | Access::ColorAttachmentWrite;
    constexpr AccessFlags depth = Access::DepthAttachmentRead | Access::DepthAttachmentWrite;

    if (flags == Access::None)
        return VK_IMAGE_LAYOUT_UNDEFINED;
    if (flags == Access::Present)
        return VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
    if (flags == Access::TransferRead)
        return VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    if (flags == Access::TransferWrite)
        return VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
    if ((flags & ~color) == 0)
        return VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    if ((flags & ~depth) == 0) {
        return (flags & Access::DepthAttachmentWrite)
                   ? VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL
                   : VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL;
    }
    if ((flags & ~Access::ShaderRead) == 0)
        return VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    return VK_IMAGE_LAYOUT_GENERAL;
}

void appendBufferBarrier(BarrierBatch& batch, VkBuffer buffer, AccessFlags src, AccessFlags dst) {
    VkBufferMemoryBarrier2 barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2;
    barrier.srcStageMask = accessStages(src);
    barrier.srcAccessMask = accessMask(src);
    barrier.dstStageMask = accessStages(dst);
    barrier.dstAccessMask = accessMask(dst);
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.buffer = buffer;
    barrier.offset = 0;
    barrier.size = VK_WHOLE_SIZE;

    batch.bufferBarriers.push_back(barrier);
}

void appendTextureBarrier(BarrierBatch& batch, VkImage image, VkImageAspectFlags aspect,
                          std::uint32_t mipLevel, AccessFlags src, AccessFlags dst) {
    VkImageMemoryBarrier2 barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
    barrier.srcStageMask = accessStages(src);
    barrier.srcAccessMask = accessMask(src);
    barrier.dstStageMask = accessStages(dst);
    barrier.dstAccessMask = accessMask(dst);
    barrier.oldLayout = accessLayout(src);
    // UNDEFINED is not a valid target; an empty dst keeps the layout.
    barrier.newLayout = dst == Access::None ? barrier.oldLayout : accessLayout(dst);
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange = VkImageSubresourceRange{aspect, mipLevel, 1, 0, 1};

    batch.imageBarriers.push_back(barrier);
}

} // namespace vksched::graph
