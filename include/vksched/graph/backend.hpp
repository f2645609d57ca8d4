#pragma once

#include <vksched/descriptor_writer.hpp>
#include <vksched/graph/barrier_batch.hpp>
#include <vksched/graph/resource_registry.hpp>
#include <vksched/result.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vksched::graph {

// Attachments and area of one dynamic rendering scope.
struct RenderingInfo {
    VkRect2D renderArea{};
    std::vector<VkRenderingAttachmentInfo> colorAttachments;
    std::optional<VkRenderingAttachmentInfo> depthAttachment;
};

// Native API seam driven by the Executor. Every command the executor issues
// goes through exactly one of these calls, in step order, so an
// implementation can record to a command buffer or just log the calls.
class Backend {
public:
    virtual ~Backend() = default;

    virtual void pipelineBarrier(const BarrierBatch& batch) = 0;

    // Host write into the buffer's memory.
    virtual void writeBuffer(const BufferEntry& buffer, VkDeviceSize offset,
                             std::span<const std::byte> data) = 0;

    virtual void copyBuffer(VkBuffer src, VkBuffer dst, const VkBufferCopy& region) = 0;
    virtual void copyBufferToImage(VkBuffer src, VkImage dst, VkImageLayout dstLayout,
                                   const VkBufferImageCopy& region) = 0;
    virtual void copyImage(VkImage src, VkImageLayout srcLayout, VkImage dst,
                           VkImageLayout dstLayout, const VkImageCopy& region) = 0;

    // View over mips [baseMip, baseMip + mipCount) of the texture.
    [[nodiscard]] virtual Result<VkImageView> createImageView(const TextureEntry& texture,
                                                              std::uint32_t baseMip,
                                                              std::uint32_t mipCount) = 0;

    [[nodiscard]] virtual Result<VkDescriptorSet>
    allocateDescriptorSet(VkDescriptorSetLayout layout) = 0;
    virtual void updateDescriptorSet(const DescriptorWriter& writer) = 0;

    virtual void beginRendering(const RenderingInfo& info) = 0;
    virtual void endRendering() = 0;

    virtual void bindPipeline(VkPipelineBindPoint bindPoint, VkPipeline pipeline) = 0;
    virtual void bindDescriptorSet(VkPipelineBindPoint bindPoint, VkPipelineLayout layout,
                                   std::uint32_t set, VkDescriptorSet descriptorSet) = 0;
    virtual void bindIndexBuffer(VkBuffer buffer, VkDeviceSize offset, VkIndexType indexType) = 0;
    virtual void pushConstants(VkPipelineLayout layout, VkShaderStageFlags stages,
                               std::uint32_t offset, std::span<const std::byte> data) = 0;

    virtual void draw(std::uint32_t vertexCount, std::uint32_t instanceCount,
                      std::uint32_t firstVertex, std::uint32_t firstInstance) = 0;
    virtual void drawIndexed(std::uint32_t indexCount, std::uint32_t instanceCount,
                             std::uint32_t firstIndex, std::int32_t vertexOffset,
                             std::uint32_t firstInstance) = 0;
    virtual void drawIndirect(VkBuffer buffer, VkDeviceSize offset, std::uint32_t drawCount,
                              std::uint32_t stride) = 0;
    virtual void drawIndexedIndirect(VkBuffer buffer, VkDeviceSize offset,
                                     std::uint32_t drawCount, std::uint32_t stride) = 0;
    virtual void drawMeshTasks(std::uint32_t groupCountX, std::uint32_t groupCountY,
                               std::uint32_t groupCountZ) = 0;

    virtual void dispatch(std::uint32_t groupCountX, std::uint32_t groupCountY,
                          std::uint32_t groupCountZ) = 0;
    virtual void dispatchIndirect(VkBuffer buffer, VkDeviceSize offset) = 0;
};

} // namespace vksched::graph
