#include <vksched/descriptor_writer.hpp>

namespace vksched {

DescriptorWriter::DescriptorWriter(VkDescriptorSet set) : set_(set) {}

DescriptorWriter& DescriptorWriter::image(std::uint32_t binding, VkImageView view,
                                          VkImageLayout layout, VkDescriptorType type) {
    VkDescriptorImageInfo info{};
    info.imageView = view;
    info.imageLayout = layout;
    auto idx = static_cast<std::uint32_t>(imageInfos_.size());
    imageInfos_.push_back(info);
    pending_.push_back({binding, type, InfoKind::Image, idx, 1});
    return *this;
}

DescriptorWriter& DescriptorWriter::storageImage(std::uint32_t binding, VkImageView view,
                                                 VkImageLayout layout) {
    return image(binding, view, layout, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE);
}

DescriptorWriter& DescriptorWriter::imageArray(std::uint32_t binding,
                                               std::span<const VkImageView> views,
                                               VkImageLayout layout, VkDescriptorType type) {
    if (views.empty())
        return *this;

    auto idx = static_cast<std::uint32_t>(imageInfos_.size());
    for (VkImageView view : views) {
        VkDescriptorImageInfo info{};
        info.imageView = view;
        info.imageLayout = layout;
        imageInfos_.push_back(info);
    }
    pending_.push_back(
        {binding, type, InfoKind::Image, idx, static_cast<std::uint32_t>(views.size())});
    return *this;
}

DescriptorWriter& DescriptorWriter::sampler(std::uint32_t binding, VkSampler sampler) {
    VkDescriptorImageInfo info{};
    info.sampler = sampler;
    auto idx = static_cast<std::uint32_t>(imageInfos_.size());
    imageInfos_.push_back(info);
    pending_.push_back({binding, VK_DESCRIPTOR_TYPE_SAMPLER, InfoKind::Image, idx, 1});
    return *this;
}

DescriptorWriter& DescriptorWriter::buffer(std::uint32_t binding, VkBuffer buf, VkDeviceSize size,
                                           VkDeviceSize offset, VkDescriptorType type) {
    VkDescriptorBufferInfo info{};
    info.buffer = buf;
    info.offset = offset;
    info.range = size;
    auto idx = static_cast<std::uint32_t>(bufferInfos_.size());
    bufferInfos_.push_back(info);
    pending_.push_back({binding, type, InfoKind::Buffer, idx, 1});
    return *this;
}

std::vector<VkWriteDescriptorSet> DescriptorWriter::build() const {
    std::vector<VkWriteDescriptorSet> writes;
    writes.reserve(pending_.size());

    for (const auto& pw : pending_) {
        VkWriteDescriptorSet w{};
        w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        w.dstSet = set_;
        w.dstBinding = pw.binding;
        w.dstArrayElement = 0;
        w.descriptorCount = pw.count;
        w.descriptorType = pw.type;

        if (pw.kind == InfoKind::Image) {
            w.pImageInfo = &imageInfos_[pw.infoIndex];
        } else {
            w.pBufferInfo = &bufferInfos_[pw.infoIndex];
        }

        writes.push_back(w);
    }

    return writes;
}

void DescriptorWriter::write(VkDevice device) const {
    auto writes = build();
    if (!writes.empty()) {
        vkUpdateDescriptorSets(device, static_cast<std::uint32_t>(writes.size()), writes.data(), 0,
                               nullptr);
    }
}

} // namespace vksched
