#pragma once

#include <vksched/graph/access.hpp>
#include <vksched/graph/resource_id.hpp>
#include <vksched/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vksched::graph {

// A contiguous mip range of one texture, as bound to a descriptor or used as
// an attachment.
struct TextureView {
    TextureId texture;
    std::uint32_t baseMipLevel = 0;
    std::uint32_t mipCount = 1;

    [[nodiscard]] std::uint32_t mipEnd() const { return baseMipLevel + mipCount; }
    [[nodiscard]] bool operator==(const TextureView&) const = default;
};

// Per-(set, binding) access a pipeline declares for its shader resources.
// Bindings are usually compact, so slots are indexed directly and padded.
class BindingMap {
public:
    // ORs into any access already declared for the slot.
    void insert(std::uint32_t set, std::uint32_t binding, AccessFlags access);

    [[nodiscard]] std::optional<AccessFlags> get(std::uint32_t set, std::uint32_t binding) const;

private:
    std::vector<std::vector<std::optional<AccessFlags>>> sets_;
};

enum class BindingKind : std::uint8_t {
    UniformBuffer,
    StorageBuffer,
    Sampler,
    SampledTexture,
    StorageTexture,
    TextureArray, // sampled
};

// One logical binding of a descriptor set. Which fields are meaningful
// depends on kind; textures holds one view for the single-texture kinds.
struct DescriptorBinding {
    std::uint32_t binding = 0;
    BindingKind kind = BindingKind::UniformBuffer;
    BufferId buffer;
    SamplerId sampler;
    std::vector<TextureView> textures;

    [[nodiscard]] static DescriptorBinding uniformBuffer(std::uint32_t binding, BufferId id);
    [[nodiscard]] static DescriptorBinding storageBuffer(std::uint32_t binding, BufferId id);
    [[nodiscard]] static DescriptorBinding samplerBinding(std::uint32_t binding, SamplerId id);
    [[nodiscard]] static DescriptorBinding sampledTexture(std::uint32_t binding, TextureView view);
    [[nodiscard]] static DescriptorBinding storageTexture(std::uint32_t binding, TextureView view);
    [[nodiscard]] static DescriptorBinding textureArray(std::uint32_t binding,
                                                        std::vector<TextureView> views);

    [[nodiscard]] bool isBuffer() const {
        return kind == BindingKind::UniformBuffer || kind == BindingKind::StorageBuffer;
    }
    [[nodiscard]] bool isTexture() const {
        return kind == BindingKind::SampledTexture || kind == BindingKind::StorageTexture ||
               kind == BindingKind::TextureArray;
    }
};

struct BufferDesc {
    VkBuffer buffer = VK_NULL_HANDLE;
    VmaAllocation allocation = nullptr; // backing memory, used for host writes
    VkDeviceSize size = 0;
    std::string name;
};

struct TextureDesc {
    VkImage image = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkExtent2D extent{};
    std::uint32_t mipLevels = 1;
    VkImageAspectFlags aspect = 0; // 0 = derive from format
    std::string name;
};

struct PipelineDesc {
    VkPipeline pipeline = VK_NULL_HANDLE;
    VkPipelineLayout layout = VK_NULL_HANDLE;
    VkPipelineBindPoint bindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    BindingMap bindings;
};

struct DescriptorSetDesc {
    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
    std::vector<DescriptorBinding> bindings;
};

struct BufferEntry {
    VkBuffer buffer = VK_NULL_HANDLE;
    VmaAllocation allocation = nullptr;
    VkDeviceSize size = 0;
    std::string name;
    AccessFlags access = Access::None;
    std::uint32_t refCount = 1;
};

// Image view created on demand for a (base mip, mip count) range.
struct CachedView {
    std::uint32_t baseMipLevel = 0;
    std::uint32_t mipCount = 0;
    VkImageView view = VK_NULL_HANDLE;
};

struct TextureEntry {
    VkImage image = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkExtent2D extent{};
    std::uint32_t mipLevels = 1;
    VkImageAspectFlags aspect = VK_IMAGE_ASPECT_COLOR_BIT;
    std::string name;
    std::vector<AccessFlags> mipAccess; // one per mip level
    std::vector<CachedView> views;      // destroyed by the allocator with the image
    std::uint32_t refCount = 1;

    [[nodiscard]] VkImageView findView(std::uint32_t baseMip, std::uint32_t mipCount) const;
};

struct SamplerEntry {
    VkSampler sampler = VK_NULL_HANDLE;
    std::uint32_t refCount = 1;
};

struct PipelineEntry {
    VkPipeline pipeline = VK_NULL_HANDLE;
    VkPipelineLayout layout = VK_NULL_HANDLE;
    VkPipelineBindPoint bindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    BindingMap bindings;
    std::uint32_t refCount = 1;
};

struct DescriptorSetEntry {
    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
    std::vector<DescriptorBinding> bindings;
    VkDescriptorSet native = VK_NULL_HANDLE; // built lazily by the executor
    std::uint32_t refCount = 1;
};

// Pushed when a resource's last reference is released. The allocator
// collaborator destroys the native objects and then calls
// ResourceRegistry::reclaim() with the same event.
struct DeletionEvent {
    enum class Kind : std::uint8_t {
        Buffer,
        Texture,
        DescriptorSet,
        Sampler,
        Pipeline,
    };

    Kind kind = Kind::Buffer;
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool operator==(const DeletionEvent&) const = default;
};

class DeletionQueue {
public:
    void push(DeletionEvent event) { events_.push_back(event); }

    // Returns pending events in push order and empties the queue.
    [[nodiscard]] std::vector<DeletionEvent> drain();

    [[nodiscard]] std::size_t size() const { return events_.size(); }
    [[nodiscard]] bool empty() const { return events_.empty(); }
    [[nodiscard]] const std::vector<DeletionEvent>& pending() const { return events_; }

private:
    std::vector<DeletionEvent> events_;
};

// Read/write view of the last scheduled access per resource. The scheduler
// only ever touches the registry through this interface.
class AccessTable {
public:
    virtual ~AccessTable() = default;

    [[nodiscard]] virtual AccessFlags access(const ResourceId& id) const = 0;
    virtual void setAccess(const ResourceId& id, AccessFlags access) = 0;
};

// Index-stable slot table with an explicit reference count per entry.
// Entries whose count reached zero stay readable until reclaim(), so the
// allocator can still reach their native handles.
template <typename Entry>
class SlotTable {
public:
    std::uint32_t insert(Entry entry) {
        if (!free_.empty()) {
            std::uint32_t index = free_.back();
            free_.pop_back();
            slots_[index] = std::move(entry);
            return index;
        }
        slots_.push_back(std::move(entry));
        return static_cast<std::uint32_t>(slots_.size() - 1);
    }

    [[nodiscard]] Entry* get(std::uint32_t index) {
        if (index >= slots_.size() || !slots_[index].has_value())
            return nullptr;
        return &*slots_[index];
    }

    [[nodiscard]] const Entry* get(std::uint32_t index) const {
        if (index >= slots_.size() || !slots_[index].has_value())
            return nullptr;
        return &*slots_[index];
    }

    // Returns false if the slot was already empty.
    bool erase(std::uint32_t index) {
        if (get(index) == nullptr)
            return false;
        slots_[index].reset();
        free_.push_back(index);
        return true;
    }

    template <typename Fn>
    void forEach(Fn&& fn) {
        for (auto& slot : slots_) {
            if (slot.has_value())
                fn(*slot);
        }
    }

    [[nodiscard]] std::uint32_t liveCount() const {
        return static_cast<std::uint32_t>(slots_.size() - free_.size());
    }

private:
    std::vector<std::optional<Entry>> slots_;
    std::vector<std::uint32_t> free_;
};

// Registry of every resource the command stream can reference: native
// handles, last scheduled access (per mip for textures), reference counts
// and the deletion queue that gates the allocator's reclamation.
//
// Looking up an id that is not in the registry is a fatal error: it means a
// use-after-free or a missing create upstream.
//
// Thread safety: thread-confined.
class ResourceRegistry final : public AccessTable {
public:
    ResourceRegistry() = default;
    ResourceRegistry(ResourceRegistry&&) noexcept = default;
    ResourceRegistry& operator=(ResourceRegistry&&) noexcept = default;
    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    // All create* start with a reference count of one (the caller's handle).
    [[nodiscard]] BufferId createBuffer(BufferDesc desc);
    [[nodiscard]] TextureId createTexture(TextureDesc desc);
    [[nodiscard]] SamplerId createSampler(VkSampler sampler);
    [[nodiscard]] PipelineId createPipeline(PipelineDesc desc);

    // Retains every buffer, texture and sampler bound by the set.
    [[nodiscard]] DescriptorSetId createDescriptorSet(DescriptorSetDesc desc);

    [[nodiscard]] BufferEntry& buffer(BufferId id);
    [[nodiscard]] const BufferEntry& buffer(BufferId id) const;
    [[nodiscard]] TextureEntry& texture(TextureId id);
    [[nodiscard]] const TextureEntry& texture(TextureId id) const;
    [[nodiscard]] SamplerEntry& sampler(SamplerId id);
    [[nodiscard]] const SamplerEntry& sampler(SamplerId id) const;
    [[nodiscard]] PipelineEntry& pipeline(PipelineId id);
    [[nodiscard]] const PipelineEntry& pipeline(PipelineId id) const;
    [[nodiscard]] DescriptorSetEntry& descriptorSet(DescriptorSetId id);
    [[nodiscard]] const DescriptorSetEntry& descriptorSet(DescriptorSetId id) const;

    [[nodiscard]] bool contains(BufferId id) const { return buffers_.get(id.index) != nullptr; }
    [[nodiscard]] bool contains(TextureId id) const { return textures_.get(id.index) != nullptr; }
    [[nodiscard]] bool contains(SamplerId id) const { return samplers_.get(id.index) != nullptr; }
    [[nodiscard]] bool contains(PipelineId id) const { return pipelines_.get(id.index) != nullptr; }
    [[nodiscard]] bool contains(DescriptorSetId id) const {
        return descriptorSets_.get(id.index) != nullptr;
    }

    // AccessTable.
    [[nodiscard]] AccessFlags access(const ResourceId& id) const override;
    void setAccess(const ResourceId& id, AccessFlags access) override;

    // Reference counting. retain() on a resource whose count already
    // reached zero is fatal (it is queued for deletion). release() on a
    // zero count is fatal (the count would go negative). release() of the
    // last reference pushes exactly one DeletionEvent.
    void retain(BufferId id);
    void retain(TextureId id);
    void retain(SamplerId id);
    void retain(PipelineId id);
    void retain(DescriptorSetId id);

    void release(BufferId id, std::uint32_t count = 1);
    void release(TextureId id, std::uint32_t count = 1);
    void release(SamplerId id, std::uint32_t count = 1);
    void release(PipelineId id, std::uint32_t count = 1);
    void release(DescriptorSetId id, std::uint32_t count = 1);

    [[nodiscard]] std::uint32_t refCount(BufferId id) const { return buffer(id).refCount; }
    [[nodiscard]] std::uint32_t refCount(TextureId id) const { return texture(id).refCount; }
    [[nodiscard]] std::uint32_t refCount(SamplerId id) const { return sampler(id).refCount; }
    [[nodiscard]] std::uint32_t refCount(PipelineId id) const { return pipeline(id).refCount; }
    [[nodiscard]] std::uint32_t refCount(DescriptorSetId id) const {
        return descriptorSet(id).refCount;
    }

    // Free the slot named by a drained DeletionEvent so its index can be
    // handed out again. Fatal if the resource is still referenced.
    void reclaim(const DeletionEvent& event);

    // Forget every materialized VkDescriptorSet so the executor rebuilds them
    // on next use. Call after DescriptorPool::reset().
    void resetDescriptorSets();

    [[nodiscard]] DeletionQueue& deletionQueue() { return deletionQueue_; }
    [[nodiscard]] const DeletionQueue& deletionQueue() const { return deletionQueue_; }

    [[nodiscard]] std::uint32_t bufferCount() const { return buffers_.liveCount(); }
    [[nodiscard]] std::uint32_t textureCount() const { return textures_.liveCount(); }

private:
    SlotTable<BufferEntry> buffers_;
    SlotTable<TextureEntry> textures_;
    SlotTable<SamplerEntry> samplers_;
    SlotTable<PipelineEntry> pipelines_;
    SlotTable<DescriptorSetEntry> descriptorSets_;
    DeletionQueue deletionQueue_;
};

// Depth formats -> DEPTH_BIT, depth+stencil -> DEPTH|STENCIL, else COLOR.
[[nodiscard]] VkImageAspectFlags aspectFromFormat(VkFormat format);

} // namespace vksched::graph
