#include <vksched/graph/access.hpp>

namespace vksched::graph {

std::string formatAccess(AccessFlags flags) {
    if (flags == Access::None)
        return "NONE";

    struct BitName {
        AccessFlags bit;
        const char* name;
    };
    static constexpr BitName names[] = {
        {Access::TransferRead, "TRANSFER_READ"},
        {Access::TransferWrite, "TRANSFER_WRITE"},
        {Access::Index, "INDEX"},
        {Access::Indirect, "INDIRECT"},
        {Access::VertexShaderRead, "VERTEX_SHADER_READ"},
        {Access::VertexShaderWrite, "VERTEX_SHADER_WRITE"},
        {Access::FragmentShaderRead, "FRAGMENT_SHADER_READ"},
        {Access::FragmentShaderWrite, "FRAGMENT_SHADER_WRITE"},
        {Access::ComputeShaderRead, "COMPUTE_SHADER_READ"},
        {Access::ComputeShaderWrite, "COMPUTE_SHADER_WRITE"},
        {Access::ColorAttachmentRead, "COLOR_ATTACHMENT_READ"},
        {Access::ColorAttachmentWrite, "COLOR_ATTACHMENT_WRITE"},
        {Access::DepthAttachmentRead, "DEPTH_ATTACHMENT_READ"},
        {Access::DepthAttachmentWrite, "DEPTH_ATTACHMENT_WRITE"},
        {Access::Present, "PRESENT"},
    };

    std::string out;
    for (const auto& n : names) {
        if ((flags & n.bit) == 0)
            continue;
        if (!out.empty())
            out += '|';
        out += n.name;
    }
    return out;
}

} // namespace vksched::graph
