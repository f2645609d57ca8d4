#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace vksched::graph {

// Opaque handles into the ResourceRegistry slot tables. Slots are
// index-stable and reused after the allocator reclaims them.
struct BufferId {
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const BufferId&) const = default;
};

struct TextureId {
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const TextureId&) const = default;
};

struct SamplerId {
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const SamplerId&) const = default;
};

struct PipelineId {
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const PipelineId&) const = default;
};

struct DescriptorSetId {
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const DescriptorSetId&) const = default;
};

enum class ResourceKind : std::uint8_t {
    Buffer,
    Texture,
};

// Key of the dependency graph: a buffer, or one mip level of a texture.
// Textures are tracked per mip because access scopes differ per level
// (mip generation reads mip N while writing mip N+1).
struct ResourceId {
    ResourceKind kind = ResourceKind::Buffer;
    std::uint32_t index = UINT32_MAX;
    std::uint32_t mipLevel = 0; // always 0 for buffers

    [[nodiscard]] static ResourceId buffer(BufferId id) {
        return ResourceId{ResourceKind::Buffer, id.index, 0};
    }
    [[nodiscard]] static ResourceId texture(TextureId id, std::uint32_t mip) {
        return ResourceId{ResourceKind::Texture, id.index, mip};
    }

    [[nodiscard]] bool isBuffer() const { return kind == ResourceKind::Buffer; }
    [[nodiscard]] bool isTexture() const { return kind == ResourceKind::Texture; }
    [[nodiscard]] BufferId bufferId() const { return BufferId{index}; }
    [[nodiscard]] TextureId textureId() const { return TextureId{index}; }

    [[nodiscard]] bool operator==(const ResourceId&) const = default;
};

} // namespace vksched::graph

namespace std {

template <>
struct hash<vksched::graph::ResourceId> {
    std::size_t operator()(const vksched::graph::ResourceId& id) const noexcept {
        std::uint64_t key = (static_cast<std::uint64_t>(id.index) << 32) |
                            (static_cast<std::uint64_t>(id.mipLevel) << 1) |
                            static_cast<std::uint64_t>(id.kind);
        return std::hash<std::uint64_t>{}(key);
    }
};

template <>
struct hash<vksched::graph::BufferId> {
    std::size_t operator()(const vksched::graph::BufferId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.index);
    }
};

template <>
struct hash<vksched::graph::TextureId> {
    std::size_t operator()(const vksched::graph::TextureId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.index);
    }
};

template <>
struct hash<vksched::graph::SamplerId> {
    std::size_t operator()(const vksched::graph::SamplerId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.index);
    }
};

template <>
struct hash<vksched::graph::PipelineId> {
    std::size_t operator()(const vksched::graph::PipelineId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.index);
    }
};

template <>
struct hash<vksched::graph::DescriptorSetId> {
    std::size_t operator()(const vksched::graph::DescriptorSetId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.index);
    }
};

} // namespace std
