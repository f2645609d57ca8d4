#pragma once

#include <cstdint>
#include <string>

namespace vksched::graph {

// Bitset of the kinds of GPU use a resource is put to by one command.
// Combine with |. An empty set means "touched, but not accessed" and is
// what create commands declare.
using AccessFlags = std::uint32_t;

namespace Access {

inline constexpr AccessFlags None                 = 0;
inline constexpr AccessFlags TransferRead         = 1u << 0;
inline constexpr AccessFlags TransferWrite        = 1u << 1;
inline constexpr AccessFlags Index                = 1u << 2;
inline constexpr AccessFlags Indirect             = 1u << 3;
inline constexpr AccessFlags VertexShaderRead     = 1u << 4;
inline constexpr AccessFlags VertexShaderWrite    = 1u << 5;
inline constexpr AccessFlags FragmentShaderRead   = 1u << 6;
inline constexpr AccessFlags FragmentShaderWrite  = 1u << 7;
inline constexpr AccessFlags ComputeShaderRead    = 1u << 8;
inline constexpr AccessFlags ComputeShaderWrite   = 1u << 9;
inline constexpr AccessFlags ColorAttachmentRead  = 1u << 10;
inline constexpr AccessFlags ColorAttachmentWrite = 1u << 11;
inline constexpr AccessFlags DepthAttachmentRead  = 1u << 12;
inline constexpr AccessFlags DepthAttachmentWrite = 1u << 13;
inline constexpr AccessFlags Present              = 1u << 14;

// Any graphics or compute shader stage.
inline constexpr AccessFlags ShaderRead  = VertexShaderRead | FragmentShaderRead | ComputeShaderRead;
inline constexpr AccessFlags ShaderWrite = VertexShaderWrite | FragmentShaderWrite | ComputeShaderWrite;

inline constexpr AccessFlags AllWrites =
    TransferWrite | ShaderWrite | ColorAttachmentWrite | DepthAttachmentWrite;

} // namespace Access

// True if any write bit is set.
[[nodiscard]] constexpr bool isWritable(AccessFlags flags) {
    return (flags & Access::AllWrites) != 0;
}

// The empty set is read-only too.
[[nodiscard]] constexpr bool isReadOnly(AccessFlags flags) {
    return !isWritable(flags);
}

// "TRANSFER_WRITE|SHADER_READ", or "NONE" for an empty set. For logs.
[[nodiscard]] std::string formatAccess(AccessFlags flags);

} // namespace vksched::graph
