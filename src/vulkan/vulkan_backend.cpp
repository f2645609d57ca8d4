#include <vksched/error.hpp>
#include <vksched/graph/vulkan_backend.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4100) // unreferenced formal parameter
#pragma warning(disable : 4189) // local variable initialized but not referenced
#pragma warning(disable : 4244) // conversion, possible loss of data
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#endif
#include <vk_mem_alloc.h>
#if defined(_MSC_VER)
#pragma warning(pop)
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include <cstring>
#include <string>

namespace vksched::graph {

VulkanBackend::VulkanBackend(VkDevice device, VmaAllocator allocator,
                             VkCommandBuffer commandBuffer, DescriptorPool& descriptorPool)
    : device_(device), allocator_(allocator), cmd_(commandBuffer),
      descriptorPool_(&descriptorPool) {
    // Null when VK_EXT_mesh_shader is not enabled.
    cmdDrawMeshTasks_ = reinterpret_cast<PFN_vkCmdDrawMeshTasksEXT>(
        vkGetDeviceProcAddr(device_, "vkCmdDrawMeshTasksEXT"));
}

void VulkanBackend::pipelineBarrier(const BarrierBatch& batch) {
    VkDependencyInfo dep = batch.dependencyInfo();
    vkCmdPipelineBarrier2(cmd_, &dep);
}

void VulkanBackend::writeBuffer(const BufferEntry& buffer, VkDeviceSize offset,
                                std::span<const std::byte> data) {
    if (data.empty())
        return;
    if (buffer.allocation == nullptr) {
        fatal("write buffer", "buffer '" + buffer.name + "' has no VMA allocation to map");
    }

    void* mapped = nullptr;
    VkResult vr = vmaMapMemory(allocator_, buffer.allocation, &mapped);
    if (vr != VK_SUCCESS) {
        throwError(Error{"write buffer", static_cast<std::int32_t>(vr),
                         "vmaMapMemory failed for buffer '" + buffer.name + "'"});
    }

    std::memcpy(static_cast<std::byte*>(mapped) + offset, data.data(), data.size());

    VkMemoryPropertyFlags props = 0;
    vmaGetAllocationMemoryProperties(allocator_, buffer.allocation, &props);
    if ((props & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT) == 0) {
        vr = vmaFlushAllocation(allocator_, buffer.allocation, offset, data.size());
    }
    vmaUnmapMemory(allocator_, buffer.allocation);

    if (vr != VK_SUCCESS) {
        throwError(Error{"write buffer", static_cast<std::int32_t>(vr),
                         "vmaFlushAllocation failed for buffer '" + buffer.name + "'"});
    }
}

void VulkanBackend::copyBuffer(VkBuffer src, VkBuffer dst, const VkBufferCopy& region) {
    vkCmdCopyBuffer(cmd_, src, dst, 1, &region);
}

void VulkanBackend::copyBufferToImage(VkBuffer src, VkImage dst, VkImageLayout dstLayout,
                                      const VkBufferImageCopy& region) {
    vkCmdCopyBufferToImage(cmd_, src, dst, dstLayout, 1, &region);
}

void VulkanBackend::copyImage(VkImage src, VkImageLayout srcLayout, VkImage dst,
                              VkImageLayout dstLayout, const VkImageCopy& region) {
    vkCmdCopyImage(cmd_, src, srcLayout, dst, dstLayout, 1, &region);
}

Result<VkImageView> VulkanBackend::createImageView(const TextureEntry& texture,
                                                   std::uint32_t baseMip,
                                                   std::uint32_t mipCount) {
    VkImageViewCreateInfo ci{};
    ci.sType                           = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    ci.image                           = texture.image;
    ci.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
    ci.format                          = texture.format;
    ci.subresourceRange.aspectMask     = texture.aspect;
    ci.subresourceRange.baseMipLevel   = baseMip;
    ci.subresourceRange.levelCount     = mipCount;
    ci.subresourceRange.baseArrayLayer = 0;
    ci.subresourceRange.layerCount     = 1;

    VkImageView view = VK_NULL_HANDLE;
    VkResult vr = vkCreateImageView(device_, &ci, nullptr, &view);
    if (vr != VK_SUCCESS) {
        return Error{"create image view", static_cast<std::int32_t>(vr),
                     "vkCreateImageView failed for texture '" + texture.name + "' mips " +
                         std::to_string(baseMip) + ".." + std::to_string(baseMip + mipCount)};
    }
    return view;
}

Result<VkDescriptorSet> VulkanBackend::allocateDescriptorSet(VkDescriptorSetLayout layout) {
    return descriptorPool_->allocate(layout);
}

void VulkanBackend::updateDescriptorSet(const DescriptorWriter& writer) {
    writer.write(device_);
}

void VulkanBackend::beginRendering(const RenderingInfo& info) {
    VkRenderingInfo ri{};
    ri.sType                = VK_STRUCTURE_TYPE_RENDERING_INFO;
    ri.renderArea           = info.renderArea;
    ri.layerCount           = 1;
    ri.colorAttachmentCount = static_cast<std::uint32_t>(info.colorAttachments.size());
    ri.pColorAttachments    = info.colorAttachments.empty()
                            ? nullptr
                            : info.colorAttachments.data();
    ri.pDepthAttachment     = info.depthAttachment ? &*info.depthAttachment : nullptr;

    vkCmdBeginRendering(cmd_, &ri);

    VkViewport vp{};
    vp.x        = static_cast<float>(info.renderArea.offset.x);
    vp.y        = static_cast<float>(info.renderArea.offset.y);
    vp.width    = static_cast<float>(info.renderArea.extent.width);
    vp.height   = static_cast<float>(info.renderArea.extent.height);
    vp.minDepth = 0.0f;
    vp.maxDepth = 1.0f;
    vkCmdSetViewport(cmd_, 0, 1, &vp);

    VkRect2D scissor = info.renderArea;
    vkCmdSetScissor(cmd_, 0, 1, &scissor);
}

void VulkanBackend::endRendering() {
    vkCmdEndRendering(cmd_);
}

void VulkanBackend::bindPipeline(VkPipelineBindPoint bindPoint, VkPipeline pipeline) {
    vkCmdBindPipeline(cmd_, bindPoint, pipeline);
}

void VulkanBackend::bindDescriptorSet(VkPipelineBindPoint bindPoint, VkPipelineLayout layout,
                                      std::uint32_t set, VkDescriptorSet descriptorSet) {
    vkCmdBindDescriptorSets(cmd_, bindPoint, layout, set, 1, &descriptorSet, 0, nullptr);
}

void VulkanBackend::bindIndexBuffer(VkBuffer buffer, VkDeviceSize offset, VkIndexType indexType) {
    vkCmdBindIndexBuffer(cmd_, buffer, offset, indexType);
}

void VulkanBackend::pushConstants(VkPipelineLayout layout, VkShaderStageFlags stages,
                                  std::uint32_t offset, std::span<const std::byte> data) {
    vkCmdPushConstants(cmd_, layout, stages, offset, static_cast<std::uint32_t>(data.size()),
                       data.data());
}

void VulkanBackend::draw(std::uint32_t vertexCount, std::uint32_t instanceCount,
                         std::uint32_t firstVertex, std::uint32_t firstInstance) {
    vkCmdDraw(cmd_, vertexCount, instanceCount, firstVertex, firstInstance);
}

void VulkanBackend::drawIndexed(std::uint32_t indexCount, std::uint32_t instanceCount,
                                std::uint32_t firstIndex, std::int32_t vertexOffset,
                                std::uint32_t firstInstance) {
    vkCmdDrawIndexed(cmd_, indexCount, instanceCount, firstIndex, vertexOffset, firstInstance);
}

void VulkanBackend::drawIndirect(VkBuffer buffer, VkDeviceSize offset, std::uint32_t drawCount,
                                 std::uint32_t stride) {
    vkCmdDrawIndirect(cmd_, buffer, offset, drawCount, stride);
}

void VulkanBackend::drawIndexedIndirect(VkBuffer buffer, VkDeviceSize offset,
                                        std::uint32_t drawCount, std::uint32_t stride) {
    vkCmdDrawIndexedIndirect(cmd_, buffer, offset, drawCount, stride);
}

void VulkanBackend::drawMeshTasks(std::uint32_t groupCountX, std::uint32_t groupCountY,
                                  std::uint32_t groupCountZ) {
    if (cmdDrawMeshTasks_ == nullptr) {
        fatal("draw mesh tasks", "vkCmdDrawMeshTasksEXT not available -- enable "
                                 "VK_EXT_mesh_shader on the device");
    }
    cmdDrawMeshTasks_(cmd_, groupCountX, groupCountY, groupCountZ);
}

void VulkanBackend::dispatch(std::uint32_t groupCountX, std::uint32_t groupCountY,
                             std::uint32_t groupCountZ) {
    vkCmdDispatch(cmd_, groupCountX, groupCountY, groupCountZ);
}

void VulkanBackend::dispatchIndirect(VkBuffer buffer, VkDeviceSize offset) {
    vkCmdDispatchIndirect(cmd_, buffer, offset);
}

void destroyTextureViews(VkDevice device, TextureEntry& texture) {
    for (const auto& cached : texture.views) {
        if (cached.view != VK_NULL_HANDLE)
            vkDestroyImageView(device, cached.view, nullptr);
    }
    texture.views.clear();
}

} // namespace vksched::graph
