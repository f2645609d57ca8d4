#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <span>
#include <vector>

namespace vksched {

// Fluent helper for writing descriptor set bindings.
// Accumulates writes and issues one vkUpdateDescriptorSets call.
//
// Usage:
//   DescriptorWriter(set)
//       .buffer(0, ubo, VK_WHOLE_SIZE)
//       .image(1, view, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL)
//       .sampler(2, linearSampler)
//       .write(device);
class DescriptorWriter {
public:
    explicit DescriptorWriter(VkDescriptorSet set);

    [[nodiscard]] VkDescriptorSet descriptorSet() const { return set_; }

    // Sampled image without a sampler (pair with a sampler binding).
    DescriptorWriter& image(std::uint32_t binding, VkImageView view, VkImageLayout layout,
                            VkDescriptorType type = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE);

    DescriptorWriter& storageImage(std::uint32_t binding, VkImageView view,
                                   VkImageLayout layout = VK_IMAGE_LAYOUT_GENERAL);

    // Consecutive array elements of one binding, starting at element 0.
    DescriptorWriter& imageArray(std::uint32_t binding, std::span<const VkImageView> views,
                                 VkImageLayout layout,
                                 VkDescriptorType type = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE);

    DescriptorWriter& sampler(std::uint32_t binding, VkSampler sampler);

    // Buffer binding (uniform or storage).
    DescriptorWriter& buffer(std::uint32_t binding, VkBuffer buf, VkDeviceSize size,
                             VkDeviceSize offset = 0,
                             VkDescriptorType type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);

    // The VkWriteDescriptorSet array. Pointers reference this writer's
    // storage, so the writer must outlive the returned vector's use.
    [[nodiscard]] std::vector<VkWriteDescriptorSet> build() const;

    [[nodiscard]] std::uint32_t writeCount() const {
        return static_cast<std::uint32_t>(pending_.size());
    }

    // Issue all accumulated writes in one vkUpdateDescriptorSets call.
    void write(VkDevice device) const;

private:
    VkDescriptorSet set_;

    // Deferred build: stores info structs and pending writes.
    // VkWriteDescriptorSet array is built at build() time to avoid
    // pointer invalidation from push_back during accumulation.
    enum class InfoKind : std::uint8_t { Image, Buffer };

    struct PendingWrite {
        std::uint32_t    binding;
        VkDescriptorType type;
        InfoKind         kind;
        std::uint32_t    infoIndex;
        std::uint32_t    count;
    };

    std::vector<VkDescriptorImageInfo>  imageInfos_;
    std::vector<VkDescriptorBufferInfo> bufferInfos_;
    std::vector<PendingWrite>           pending_;
};

} // namespace vksched
