#pragma once

#include <vksched/descriptor_pool.hpp>
#include <vksched/graph/backend.hpp>
#include <vksched/vma_fwd.hpp>

#include <vulkan/vulkan.h>

namespace vksched::graph {

// Backend recording into one VkCommandBuffer with synchronization2 and
// dynamic rendering (Vulkan 1.3). Host writes go through VMA. Draw mesh
// tasks needs VK_EXT_mesh_shader enabled on the device.
//
// Does not own any handle it is given.
//
// Thread safety: thread-confined.
class VulkanBackend final : public Backend {
public:
    VulkanBackend(VkDevice device, VmaAllocator allocator, VkCommandBuffer commandBuffer,
                  DescriptorPool& descriptorPool);

    [[nodiscard]] VkCommandBuffer vkCommandBuffer() const { return cmd_; }

    void pipelineBarrier(const BarrierBatch& batch) override;
    void writeBuffer(const BufferEntry& buffer, VkDeviceSize offset,
                     std::span<const std::byte> data) override;
    void copyBuffer(VkBuffer src, VkBuffer dst, const VkBufferCopy& region) override;
    void copyBufferToImage(VkBuffer src, VkImage dst, VkImageLayout dstLayout,
                           const VkBufferImageCopy& region) override;
    void copyImage(VkImage src, VkImageLayout srcLayout, VkImage dst, VkImageLayout dstLayout,
                   const VkImageCopy& region) override;

    [[nodiscard]] Result<VkImageView> createImageView(const TextureEntry& texture,
                                                      std::uint32_t baseMip,
                                                      std::uint32_t mipCount) override;
    [[nodiscard]] Result<VkDescriptorSet>
    allocateDescriptorSet(VkDescriptorSetLayout layout) override;
    void updateDescriptorSet(const DescriptorWriter& writer) override;

    void beginRendering(const RenderingInfo& info) override;
    void endRendering() override;

    void bindPipeline(VkPipelineBindPoint bindPoint, VkPipeline pipeline) override;
    void bindDescriptorSet(VkPipelineBindPoint bindPoint, VkPipelineLayout layout,
                           std::uint32_t set, VkDescriptorSet descriptorSet) override;
    void bindIndexBuffer(VkBuffer buffer, VkDeviceSize offset, VkIndexType indexType) override;
    void pushConstants(VkPipelineLayout layout, VkShaderStageFlags stages, std::uint32_t offset,
                       std::span<const std::byte> data) override;

    void draw(std::uint32_t vertexCount, std::uint32_t instanceCount, std::uint32_t firstVertex,
              std::uint32_t firstInstance) override;
    void drawIndexed(std::uint32_t indexCount, std::uint32_t instanceCount,
                     std::uint32_t firstIndex, std::int32_t vertexOffset,
                     std::uint32_t firstInstance) override;
    void drawIndirect(VkBuffer buffer, VkDeviceSize offset, std::uint32_t drawCount,
                      std::uint32_t stride) override;
    void drawIndexedIndirect(VkBuffer buffer, VkDeviceSize offset, std::uint32_t drawCount,
                             std::uint32_t stride) override;
    void drawMeshTasks(std::uint32_t groupCountX, std::uint32_t groupCountY,
                       std::uint32_t groupCountZ) override;

    void dispatch(std::uint32_t groupCountX, std::uint32_t groupCountY,
                  std::uint32_t groupCountZ) override;
    void dispatchIndirect(VkBuffer buffer, VkDeviceSize offset) override;

private:
    VkDevice device_ = VK_NULL_HANDLE;
    VmaAllocator allocator_ = nullptr;
    VkCommandBuffer cmd_ = VK_NULL_HANDLE;
    DescriptorPool* descriptorPool_ = nullptr;
    PFN_vkCmdDrawMeshTasksEXT cmdDrawMeshTasks_ = nullptr;
};

// Destroy the image views the executor cached on a texture. For the
// allocator collaborator, right before it destroys the image.
void destroyTextureViews(VkDevice device, TextureEntry& texture);

} // namespace vksched::graph
