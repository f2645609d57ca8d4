#pragma once

#include <vksched/graph/access.hpp>
#include <vksched/graph/resource_id.hpp>
#include <vksched/graph/resource_registry.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vksched::graph {

enum class LoadOp : std::uint8_t {
    Clear,    // Clear to a specified value before the pass.
    Load,     // Preserve previous contents. Reads the attachment.
    DontCare, // Contents undefined -- use when writing every pixel.
};

enum class StoreOp : std::uint8_t {
    Store,
    DontCare,
};

enum class DepthWrite : std::uint8_t {
    Enabled,  // Depth test + write.
    Disabled, // Depth test only.
};

struct ColorAttachment {
    TextureView view;
    LoadOp loadOp = LoadOp::Clear;
    StoreOp storeOp = StoreOp::Store;
    VkClearColorValue clearValue = {{0.0f, 0.0f, 0.0f, 0.0f}};
};

struct DepthAttachment {
    TextureView view;
    LoadOp loadOp = LoadOp::Clear;
    StoreOp storeOp = StoreOp::Store;
    DepthWrite depthWrite = DepthWrite::Enabled;
    float clearDepth = 1.0f;
    std::uint32_t clearStencil = 0;
};

// Sub-commands replayed inside render and compute passes.

struct SetPipeline {
    PipelineId pipeline;
};

struct SetDescriptorSet {
    std::uint32_t set = 0;
    DescriptorSetId descriptorSet;
};

struct SetIndexBuffer {
    BufferId buffer;
    VkDeviceSize offset = 0;
    VkIndexType indexType = VK_INDEX_TYPE_UINT32;
};

struct PushConstants {
    VkShaderStageFlags stages = VK_SHADER_STAGE_ALL;
    std::uint32_t offset = 0;
    std::vector<std::byte> data;
};

struct Draw {
    std::uint32_t vertexCount = 0;
    std::uint32_t instanceCount = 1;
    std::uint32_t firstVertex = 0;
    std::uint32_t firstInstance = 0;
};

struct DrawIndexed {
    std::uint32_t indexCount = 0;
    std::uint32_t instanceCount = 1;
    std::uint32_t firstIndex = 0;
    std::int32_t vertexOffset = 0;
    std::uint32_t firstInstance = 0;
};

struct DrawIndirect {
    BufferId buffer;
    VkDeviceSize offset = 0;
    std::uint32_t drawCount = 1;
    std::uint32_t stride = sizeof(VkDrawIndirectCommand);
};

struct DrawIndexedIndirect {
    BufferId buffer;
    VkDeviceSize offset = 0;
    std::uint32_t drawCount = 1;
    std::uint32_t stride = sizeof(VkDrawIndexedIndirectCommand);
};

struct DrawMeshTasks {
    std::uint32_t groupCountX = 1;
    std::uint32_t groupCountY = 1;
    std::uint32_t groupCountZ = 1;
};

struct Dispatch {
    std::uint32_t groupCountX = 1;
    std::uint32_t groupCountY = 1;
    std::uint32_t groupCountZ = 1;
};

struct DispatchIndirect {
    BufferId buffer;
    VkDeviceSize offset = 0;
};

using DrawCommand = std::variant<SetPipeline, SetDescriptorSet, SetIndexBuffer, PushConstants,
                                 Draw, DrawIndexed, DrawIndirect, DrawIndexedIndirect,
                                 DrawMeshTasks>;

using ComputeCommand =
    std::variant<SetPipeline, SetDescriptorSet, PushConstants, Dispatch, DispatchIndirect>;

// Top-level commands recorded into a CommandStream.

struct WriteBuffer {
    BufferId buffer;
    VkDeviceSize offset = 0;
    std::vector<std::byte> data;
};

struct CopyBufferToBuffer {
    BufferId src;
    VkDeviceSize srcOffset = 0;
    BufferId dst;
    VkDeviceSize dstOffset = 0;
    VkDeviceSize size = 0;
};

struct CopyBufferToTexture {
    BufferId src;
    VkDeviceSize srcOffset = 0;
    std::uint32_t rowLength = 0;   // texels, 0 = tightly packed
    std::uint32_t imageHeight = 0; // texels, 0 = tightly packed
    TextureId dst;
    std::uint32_t mipLevel = 0;
    VkOffset3D offset{};
    VkExtent3D extent{};
};

struct CopyTextureToTexture {
    TextureId src;
    std::uint32_t srcMipLevel = 0;
    VkOffset3D srcOffset{};
    TextureId dst;
    std::uint32_t dstMipLevel = 0;
    VkOffset3D dstOffset{};
    VkExtent3D extent{};
};

// Moves one mip into the given access (e.g. Present) without other work.
struct TextureTransition {
    TextureId texture;
    std::uint32_t mipLevel = 0;
    AccessFlags access = Access::None;
};

struct RenderPass {
    std::string name;
    std::vector<ColorAttachment> colorAttachments;
    std::optional<DepthAttachment> depthAttachment;
    VkRect2D renderArea{}; // zero extent = first attachment's mip extent
    std::vector<DrawCommand> commands;
};

struct ComputePass {
    std::string name;
    std::vector<ComputeCommand> commands;
};

// Pooled slots are reused, so a create touches its resource to order it
// after the previous owner's last use.
struct CreateBuffer {
    BufferId buffer;
};

struct CreateTexture {
    TextureId texture;
};

// Drop the caller's reference once the frame's work has been recorded.
struct DestroyBuffer {
    BufferId buffer;
};

struct DestroyTexture {
    TextureId texture;
};

struct DestroySampler {
    SamplerId sampler;
};

struct DestroyPipeline {
    PipelineId pipeline;
};

struct DestroyDescriptorSet {
    DescriptorSetId descriptorSet;
};

using Command =
    std::variant<WriteBuffer, CopyBufferToBuffer, CopyBufferToTexture, CopyTextureToTexture,
                 TextureTransition, RenderPass, ComputePass, CreateBuffer, CreateTexture,
                 DestroyBuffer, DestroyTexture, DestroySampler, DestroyPipeline,
                 DestroyDescriptorSet>;

// Short type name for logs, e.g. "CopyBufferToTexture".
[[nodiscard]] const char* commandName(const Command& command);

} // namespace vksched::graph
