#include <vksched/error.hpp>
#include <vksched/graph/resource_registry.hpp>

#include <string>

namespace vksched::graph {

namespace {

std::string describe(const char* category, std::uint32_t index) {
    return std::string(category) + " " + std::to_string(index);
}

template <typename Entry>
void retainEntry(Entry& entry, const char* category, std::uint32_t index) {
    if (entry.refCount == 0) {
        fatal("ResourceRegistry::retain",
              describe(category, index) + " is already queued for deletion");
    }
    ++entry.refCount;
}

// Returns true when the last reference went away.
template <typename Entry>
bool releaseEntry(Entry& entry, std::uint32_t count, const char* category, std::uint32_t index) {
    if (count > entry.refCount) {
        fatal("ResourceRegistry::release",
              describe(category, index) + " has " + std::to_string(entry.refCount) +
                  " references, cannot release " + std::to_string(count));
    }
    if (count == 0)
        return false;
    entry.refCount -= count;
    return entry.refCount == 0;
}

template <typename Entry>
Entry& lookup(SlotTable<Entry>& table, std::uint32_t index, const char* category) {
    Entry* entry = table.get(index);
    if (entry == nullptr)
        fatal("ResourceRegistry::lookup", describe(category, index) + " is not registered");
    return *entry;
}

template <typename Entry>
const Entry& lookup(const SlotTable<Entry>& table, std::uint32_t index, const char* category) {
    const Entry* entry = table.get(index);
    if (entry == nullptr)
        fatal("ResourceRegistry::lookup", describe(category, index) + " is not registered");
    return *entry;
}

} // namespace

void BindingMap::insert(std::uint32_t set, std::uint32_t binding, AccessFlags access) {
    if (set >= sets_.size())
        sets_.resize(set + 1);
    auto& bindings = sets_[set];
    if (binding >= bindings.size())
        bindings.resize(binding + 1);
    bindings[binding] = bindings[binding].value_or(Access::None) | access;
}

std::optional<AccessFlags> BindingMap::get(std::uint32_t set, std::uint32_t binding) const {
    if (set >= sets_.size() || binding >= sets_[set].size())
        return std::nullopt;
    return sets_[set][binding];
}

DescriptorBinding DescriptorBinding::uniformBuffer(std::uint32_t binding, BufferId id) {
    DescriptorBinding b;
    b.binding = binding;
    b.kind = BindingKind::UniformBuffer;
    b.buffer = id;
    return b;
}

DescriptorBinding DescriptorBinding::storageBuffer(std::uint32_t binding, BufferId id) {
    DescriptorBinding b = uniformBuffer(binding, id);
    b.kind = BindingKind::StorageBuffer;
    return b;
}

DescriptorBinding DescriptorBinding::samplerBinding(std::uint32_t binding, SamplerId id) {
    DescriptorBinding b;
    b.binding = binding;
    b.kind = BindingKind::Sampler;
    b.sampler = id;
    return b;
}

DescriptorBinding DescriptorBinding::sampledTexture(std::uint32_t binding, TextureView view) {
    DescriptorBinding b;
    b.binding = binding;
    b.kind = BindingKind::SampledTexture;
    b.textures.push_back(view);
    return b;
}

DescriptorBinding DescriptorBinding::storageTexture(std::uint32_t binding, TextureView view) {
    DescriptorBinding b = sampledTexture(binding, view);
    b.kind = BindingKind::StorageTexture;
    return b;
}

DescriptorBinding DescriptorBinding::textureArray(std::uint32_t binding,
                                                  std::vector<TextureView> views) {
    DescriptorBinding b;
    b.binding = binding;
    b.kind = BindingKind::TextureArray;
    b.textures = std::move(views);
    return b;
}

VkImageView TextureEntry::findView(std::uint32_t baseMip, std::uint32_t mipCount) const {
    for (const auto& cached : views) {
        if (cached.baseMipLevel == baseMip && cached.mipCount == mipCount)
            return cached.view;
    }
    return VK_NULL_HANDLE;
}

std::vector<DeletionEvent> DeletionQueue::drain() {
    std::vector<DeletionEvent> out;
    out.swap(events_);
    return out;
}

BufferId ResourceRegistry::createBuffer(BufferDesc desc) {
    BufferEntry entry;
    entry.buffer = desc.buffer;
    entry.allocation = desc.allocation;
    entry.size = desc.size;
    entry.name = std::move(desc.name);
    return BufferId{buffers_.insert(std::move(entry))};
}

TextureId ResourceRegistry::createTexture(TextureDesc desc) {
    if (desc.mipLevels == 0)
        fatal("ResourceRegistry::createTexture", "mipLevels must be at least 1");

    TextureEntry entry;
    entry.image = desc.image;
    entry.format = desc.format;
    entry.extent = desc.extent;
    entry.mipLevels = desc.mipLevels;
    entry.aspect = desc.aspect != 0 ? desc.aspect : aspectFromFormat(desc.format);
    entry.name = std::move(desc.name);
    entry.mipAccess.assign(desc.mipLevels, Access::None);
    return TextureId{textures_.insert(std::move(entry))};
}

SamplerId ResourceRegistry::createSampler(VkSampler sampler) {
    SamplerEntry entry;
    entry.sampler = sampler;
    return SamplerId{samplers_.insert(entry)};
}

PipelineId ResourceRegistry::createPipeline(PipelineDesc desc) {
    PipelineEntry entry;
    entry.pipeline = desc.pipeline;
    entry.layout = desc.layout;
    entry.bindPoint = desc.bindPoint;
    entry.bindings = std::move(desc.bindings);
    return PipelineId{pipelines_.insert(std::move(entry))};
}

DescriptorSetId ResourceRegistry::createDescriptorSet(DescriptorSetDesc desc) {
    // The set holds a reference on everything it binds.
    for (const auto& b : desc.bindings) {
        switch (b.kind) {
        case BindingKind::UniformBuffer:
        case BindingKind::StorageBuffer:
            retain(b.buffer);
            break;
        case BindingKind::Sampler:
            retain(b.sampler);
            break;
        case BindingKind::SampledTexture:
        case BindingKind::StorageTexture:
        case BindingKind::TextureArray:
            for (const auto& view : b.textures) {
                const TextureEntry& tex = texture(view.texture);
                if (view.mipCount == 0 || view.mipEnd() > tex.mipLevels) {
                    fatal("ResourceRegistry::createDescriptorSet",
                          "view of " + describe("texture", view.texture.index) +
                              " exceeds its mip chain");
                }
                retain(view.texture);
            }
            break;
        }
    }

    DescriptorSetEntry entry;
    entry.layout = desc.layout;
    entry.bindings = std::move(desc.bindings);
    return DescriptorSetId{descriptorSets_.insert(std::move(entry))};
}

BufferEntry& ResourceRegistry::buffer(BufferId id) {
    return lookup(buffers_, id.index, "buffer");
}

const BufferEntry& ResourceRegistry::buffer(BufferId id) const {
    return lookup(buffers_, id.index, "buffer");
}

TextureEntry& ResourceRegistry::texture(TextureId id) {
    return lookup(textures_, id.index, "texture");
}

const TextureEntry& ResourceRegistry::texture(TextureId id) const {
    return lookup(textures_, id.index, "texture");
}

SamplerEntry& ResourceRegistry::sampler(SamplerId id) {
    return lookup(samplers_, id.index, "sampler");
}

const SamplerEntry& ResourceRegistry::sampler(SamplerId id) const {
    return lookup(samplers_, id.index, "sampler");
}

PipelineEntry& ResourceRegistry::pipeline(PipelineId id) {
    return lookup(pipelines_, id.index, "pipeline");
}

const PipelineEntry& ResourceRegistry::pipeline(PipelineId id) const {
    return lookup(pipelines_, id.index, "pipeline");
}

DescriptorSetEntry& ResourceRegistry::descriptorSet(DescriptorSetId id) {
    return lookup(descriptorSets_, id.index, "descriptor set");
}

const DescriptorSetEntry& ResourceRegistry::descriptorSet(DescriptorSetId id) const {
    return lookup(descriptorSets_, id.index, "descriptor set");
}

AccessFlags ResourceRegistry::access(const ResourceId& id) const {
    if (id.isBuffer())
        return buffer(id.bufferId()).access;

    const TextureEntry& tex = texture(id.textureId());
    if (id.mipLevel >= tex.mipLevels) {
        fatal("ResourceRegistry::access", describe("texture", id.index) + " has no mip " +
                                              std::to_string(id.mipLevel));
    }
    return tex.mipAccess[id.mipLevel];
}

void ResourceRegistry::setAccess(const ResourceId& id, AccessFlags access) {
    if (id.isBuffer()) {
        buffer(id.bufferId()).access = access;
        return;
    }

    TextureEntry& tex = texture(id.textureId());
    if (id.mipLevel >= tex.mipLevels) {
        fatal("ResourceRegistry::setAccess", describe("texture", id.index) + " has no mip " +
                                                 std::to_string(id.mipLevel));
    }
    tex.mipAccess[id.mipLevel] = access;
}

void ResourceRegistry::retain(BufferId id) {
    retainEntry(buffer(id), "buffer", id.index);
}

void ResourceRegistry::retain(TextureId id) {
    retainEntry(texture(id), "texture", id.index);
}

void ResourceRegistry::retain(SamplerId id) {
    retainEntry(sampler(id), "sampler", id.index);
}

void ResourceRegistry::retain(PipelineId id) {
    retainEntry(pipeline(id), "pipeline", id.index);
}

void ResourceRegistry::retain(DescriptorSetId id) {
    retainEntry(descriptorSet(id), "descriptor set", id.index);
}

void ResourceRegistry::release(BufferId id, std::uint32_t count) {
    if (releaseEntry(buffer(id), count, "buffer", id.index))
        deletionQueue_.push(DeletionEvent{DeletionEvent::Kind::Buffer, id.index});
}

void ResourceRegistry::release(TextureId id, std::uint32_t count) {
    if (releaseEntry(texture(id), count, "texture", id.index))
        deletionQueue_.push(DeletionEvent{DeletionEvent::Kind::Texture, id.index});
}

void ResourceRegistry::release(SamplerId id, std::uint32_t count) {
    if (releaseEntry(sampler(id), count, "sampler", id.index))
        deletionQueue_.push(DeletionEvent{DeletionEvent::Kind::Sampler, id.index});
}

void ResourceRegistry::release(PipelineId id, std::uint32_t count) {
    if (releaseEntry(pipeline(id), count, "pipeline", id.index))
        deletionQueue_.push(DeletionEvent{DeletionEvent::Kind::Pipeline, id.index});
}

void ResourceRegistry::release(DescriptorSetId id, std::uint32_t count) {
    DescriptorSetEntry& set = descriptorSet(id);
    if (!releaseEntry(set, count, "descriptor set", id.index))
        return;

    deletionQueue_.push(DeletionEvent{DeletionEvent::Kind::DescriptorSet, id.index});

    for (const auto& b : set.bindings) {
        switch (b.kind) {
        case BindingKind::UniformBuffer:
        case BindingKind::StorageBuffer:
            release(b.buffer);
            break;
        case BindingKind::Sampler:
            release(b.sampler);
            break;
        case BindingKind::SampledTexture:
        case BindingKind::StorageTexture:
        case BindingKind::TextureArray:
            for (const auto& view : b.textures)
                release(view.texture);
            break;
        }
    }
}

void ResourceRegistry::reclaim(const DeletionEvent& event) {
    auto check = [&](std::uint32_t refCount, const char* category) {
        if (refCount != 0) {
            fatal("ResourceRegistry::reclaim", describe(category, event.index) + " still has " +
                                                   std::to_string(refCount) + " references");
        }
    };

    switch (event.kind) {
    case DeletionEvent::Kind::Buffer:
        check(refCount(BufferId{event.index}), "buffer");
        buffers_.erase(event.index);
        break;
    case DeletionEvent::Kind::Texture:
        check(refCount(TextureId{event.index}), "texture");
        textures_.erase(event.index);
        break;
    case DeletionEvent::Kind::Sampler:
        check(refCount(SamplerId{event.index}), "sampler");
        samplers_.erase(event.index);
        break;
    case DeletionEvent::Kind::Pipeline:
        check(refCount(PipelineId{event.index}), "pipeline");
        pipelines_.erase(event.index);
        break;
    case DeletionEvent::Kind::DescriptorSet:
        check(refCount(DescriptorSetId{event.index}), "descriptor set");
        descriptorSets_.erase(event.index);
        break;
    }
}

void ResourceRegistry::resetDescriptorSets() {
    descriptorSets_.forEach([](DescriptorSetEntry& entry) { entry.native = VK_NULL_HANDLE; });
}

VkImageAspectFlags aspectFromFormat(VkFormat format) {
    switch (format) {
    case VK_FORMAT_D16_UNORM:
    case VK_FORMAT_D32_SFLOAT:
    case VK_FORMAT_X8_D24_UNORM_PACK32:
        return VK_IMAGE_ASPECT_DEPTH_BIT;

    case VK_FORMAT_D16_UNORM_S8_UINT:
    case VK_FORMAT_D24_UNORM_S8_UINT:
    case VK_FORMAT_D32_SFLOAT_S8_UINT:
        return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;

    case VK_FORMAT_S8_UINT:
        return VK_IMAGE_ASPECT_STENCIL_BIT;

    default:
        return VK_IMAGE_ASPECT_COLOR_BIT;
    }
}

} // namespace vksched::graph
