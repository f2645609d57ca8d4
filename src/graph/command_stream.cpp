#include <vksched/error.hpp>
#include <vksched/graph/command_stream.hpp>

#include <algorithm>
#include <cassert>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace vksched::graph {

const char* commandName(const Command& command) {
    static constexpr const char* kNames[] = {
        "WriteBuffer",   "CopyBufferToBuffer", "CopyBufferToTexture", "CopyTextureToTexture",
        "TextureTransition", "RenderPass",     "ComputePass",         "CreateBuffer",
        "CreateTexture", "DestroyBuffer",      "DestroyTexture",      "DestroySampler",
        "DestroyPipeline", "DestroyDescriptorSet",
    };
    static_assert(std::size(kNames) == std::variant_size_v<Command>);
    return kNames[command.index()];
}

// Walks one command and feeds its accesses into the stream's scratch map.
class AccessCollector {
public:
    AccessCollector(CommandStream& stream, const ResourceRegistry& registry)
        : stream_(stream), registry_(registry) {}

    void operator()(const WriteBuffer& c) {
        stream_.touch(ResourceId::buffer(c.buffer), Access::TransferWrite);
    }

    void operator()(const CopyBufferToBuffer& c) {
        stream_.touch(ResourceId::buffer(c.src), Access::TransferRead);
        stream_.touch(ResourceId::buffer(c.dst), Access::TransferWrite);
    }

    void operator()(const CopyBufferToTexture& c) {
        stream_.touch(ResourceId::buffer(c.src), Access::TransferRead);
        stream_.touch(ResourceId::texture(c.dst, c.mipLevel), Access::TransferWrite);
    }

    void operator()(const CopyTextureToTexture& c) {
        stream_.touch(ResourceId::texture(c.src, c.srcMipLevel), Access::TransferRead);
        stream_.touch(ResourceId::texture(c.dst, c.dstMipLevel), Access::TransferWrite);
    }

    void operator()(const TextureTransition& c) {
        stream_.touch(ResourceId::texture(c.texture, c.mipLevel), c.access);
    }

    void operator()(const RenderPass& c) {
        for (const auto& color : c.colorAttachments) {
            AccessFlags access = Access::ColorAttachmentWrite;
            if (color.loadOp == LoadOp::Load)
                access |= Access::ColorAttachmentRead;
            touchView(color.view, access);
        }

        if (c.depthAttachment) {
            const DepthAttachment& depth = *c.depthAttachment;
            AccessFlags access = depth.depthWrite == DepthWrite::Enabled
                                     ? Access::DepthAttachmentWrite
                                     : Access::DepthAttachmentRead;
            if (depth.loadOp == LoadOp::Load)
                access |= Access::DepthAttachmentRead;
            touchView(depth.view, access);
        }

        for (const auto& sub : c.commands)
            std::visit([this](const auto& cmd) { drawCommand(cmd); }, sub);
    }

    void operator()(const ComputePass& c) {
        for (const auto& sub : c.commands)
            std::visit([this](const auto& cmd) { computeCommand(cmd); }, sub);
    }

    void operator()(const CreateBuffer& c) {
        stream_.touch(ResourceId::buffer(c.buffer), Access::None);
    }

    void operator()(const CreateTexture& c) {
        const TextureEntry& tex = registry_.texture(c.texture);
        for (std::uint32_t mip = 0; mip < tex.mipLevels; ++mip)
            stream_.touch(ResourceId::texture(c.texture, mip), Access::None);
    }

    void operator()(const DestroyBuffer&) {}
    void operator()(const DestroyTexture&) {}
    void operator()(const DestroySampler&) {}
    void operator()(const DestroyPipeline&) {}
    void operator()(const DestroyDescriptorSet&) {}

private:
    void setPipeline(PipelineId id) {
        pipeline_ = &registry_.pipeline(id);
        stream_.usedPipelines_.push_back(id);
    }

    void setDescriptorSet(const SetDescriptorSet& c) {
        if (pipeline_ == nullptr)
            return;

        auto& visited = stream_.visitedSets_;
        if (std::find(visited.begin(), visited.end(), c.descriptorSet) != visited.end())
            return;
        visited.push_back(c.descriptorSet);

        const DescriptorSetEntry& set = registry_.descriptorSet(c.descriptorSet);
        for (const auto& b : set.bindings) {
            std::optional<AccessFlags> access = pipeline_->bindings.get(c.set, b.binding);
            if (!access)
                continue;
            // Storage images are bound in GENERAL, which only a shader write maps to.
            if (b.kind == BindingKind::StorageTexture && (*access & Access::ShaderWrite) == 0) {
                fatal("CommandStream::push",
                      "storage texture binding " + std::to_string(b.binding) +
                          " of descriptor set " + std::to_string(c.descriptorSet.index) +
                          " is declared " + formatAccess(*access) +
                          ", it needs a shader write access");
            }
            if (b.isBuffer()) {
                stream_.touch(ResourceId::buffer(b.buffer), *access);
            } else if (b.isTexture()) {
                for (const auto& view : b.textures)
                    touchView(view, *access);
            }
        }
    }

    void touchView(const TextureView& view, AccessFlags access) {
        for (std::uint32_t mip = view.baseMipLevel; mip < view.mipEnd(); ++mip)
            stream_.touch(ResourceId::texture(view.texture, mip), access);
    }

    template <typename T>
    void drawCommand(const T& cmd) {
        if constexpr (std::is_same_v<T, SetPipeline>) {
            setPipeline(cmd.pipeline);
        } else if constexpr (std::is_same_v<T, SetDescriptorSet>) {
            setDescriptorSet(cmd);
        } else if constexpr (std::is_same_v<T, SetIndexBuffer>) {
            stream_.touch(ResourceId::buffer(cmd.buffer), Access::Index);
        } else if constexpr (std::is_same_v<T, DrawIndirect> ||
                             std::is_same_v<T, DrawIndexedIndirect>) {
            stream_.touch(ResourceId::buffer(cmd.buffer), Access::Indirect);
        }
    }

    template <typename T>
    void computeCommand(const T& cmd) {
        if constexpr (std::is_same_v<T, SetPipeline>) {
            setPipeline(cmd.pipeline);
        } else if constexpr (std::is_same_v<T, SetDescriptorSet>) {
            setDescriptorSet(cmd);
        } else if constexpr (std::is_same_v<T, DispatchIndirect>) {
            stream_.touch(ResourceId::buffer(cmd.buffer), Access::Indirect);
        }
    }

    CommandStream& stream_;
    const ResourceRegistry& registry_;
    const PipelineEntry* pipeline_ = nullptr;
};

void CommandStream::push(const ResourceRegistry& registry, Command command) {
    // A previous push may have failed half way.
    scratch_.clear();
    scratchIndex_.clear();
    visitedSets_.clear();
    usedPipelines_.clear();

    AccessCollector collector(*this, registry);
    std::visit(collector, command);

    // Create commands declare an empty access on purpose. Passes never emit
    // entries that ended up empty.
    bool keepEmpty = std::holds_alternative<CreateBuffer>(command) ||
                     std::holds_alternative<CreateTexture>(command);

    // Nothing is committed until the command passed validation.
    if (destroyValidation_)
        checkNotDestroyed(registry, command, commands_.size());

    Range range;
    range.offset = static_cast<std::uint32_t>(accesses_.size());
    flushScratch(keepEmpty);
    range.count = static_cast<std::uint32_t>(accesses_.size()) - range.offset;

    commands_.push_back(std::move(command));
    ranges_.push_back(range);

    if (destroyValidation_)
        rememberDestroyed(commands_.back());

    visitedSets_.clear();
    usedPipelines_.clear();
}

std::vector<CommandRef> CommandStream::commands() const {
    std::vector<CommandRef> refs;
    refs.reserve(commands_.size());
    for (std::size_t i = 0; i < commands_.size(); ++i)
        refs.push_back(at(i));
    return refs;
}

CommandRef CommandStream::at(std::size_t index) const {
    const Range& r = ranges_[index];
    return CommandRef{&commands_[index],
                      std::span<const ResourceAccess>(accesses_.data() + r.offset, r.count)};
}

void CommandStream::clear() {
    commands_.clear();
    ranges_.clear();
    accesses_.clear();
    scratch_.clear();
    scratchIndex_.clear();
    visitedSets_.clear();
    usedPipelines_.clear();
    destroyedBuffers_.clear();
    destroyedTextures_.clear();
    destroyedSamplers_.clear();
    destroyedPipelines_.clear();
    destroyedSets_.clear();
}

void CommandStream::touch(const ResourceId& id, AccessFlags access) {
    auto [it, inserted] = scratchIndex_.try_emplace(id, scratch_.size());
    if (inserted) {
        scratch_.push_back(ResourceAccess{id, access});
    } else {
        scratch_[it->second].access |= access;
    }
}

void CommandStream::flushScratch(bool keepEmpty) {
    std::size_t first = accesses_.size();
    for (const auto& entry : scratch_) {
        if (entry.access != Access::None || keepEmpty)
            accesses_.push_back(entry);
    }

#ifndef NDEBUG
    for (std::size_t i = first; i < accesses_.size(); ++i) {
        for (std::size_t j = i + 1; j < accesses_.size(); ++j)
            assert(!(accesses_[i].id == accesses_[j].id) && "duplicate access entry");
    }
#else
    (void)first;
#endif

    scratch_.clear();
    scratchIndex_.clear();
}

void CommandStream::checkNotDestroyed(const ResourceRegistry& registry, const Command& command,
                                      std::size_t commandIndex) const {
    std::string prefix =
        std::string(commandName(command)) + " #" + std::to_string(commandIndex);
    auto fail = [&](const std::string& what) {
        fatal("CommandStream::push", prefix + " uses " + what + " after it was destroyed");
    };
    auto failTwice = [&](const char* kind, std::uint32_t index) {
        fatal("CommandStream::push",
              prefix + " destroys " + kind + " " + std::to_string(index) + " twice");
    };

    if (const auto* c = std::get_if<DestroyBuffer>(&command)) {
        if (destroyedBuffers_.count(c->buffer) != 0)
            failTwice("buffer", c->buffer.index);
    } else if (const auto* c = std::get_if<DestroyTexture>(&command)) {
        if (destroyedTextures_.count(c->texture) != 0)
            failTwice("texture", c->texture.index);
    } else if (const auto* c = std::get_if<DestroySampler>(&command)) {
        if (destroyedSamplers_.count(c->sampler) != 0)
            failTwice("sampler", c->sampler.index);
    } else if (const auto* c = std::get_if<DestroyPipeline>(&command)) {
        if (destroyedPipelines_.count(c->pipeline) != 0)
            failTwice("pipeline", c->pipeline.index);
    } else if (const auto* c = std::get_if<DestroyDescriptorSet>(&command)) {
        if (destroyedSets_.count(c->descriptorSet) != 0)
            failTwice("descriptor set", c->descriptorSet.index);
    }

    // Scratch still holds this command's accesses.
    for (const auto& entry : scratch_) {
        if (entry.id.isBuffer() && destroyedBuffers_.count(entry.id.bufferId()) != 0)
            fail("buffer " + std::to_string(entry.id.index));
        if (entry.id.isTexture() && destroyedTextures_.count(entry.id.textureId()) != 0)
            fail("texture " + std::to_string(entry.id.index));
    }
    for (PipelineId id : usedPipelines_) {
        if (destroyedPipelines_.count(id) != 0)
            fail("pipeline " + std::to_string(id.index));
    }
    for (DescriptorSetId id : visitedSets_) {
        if (destroyedSets_.count(id) != 0)
            fail("descriptor set " + std::to_string(id.index));
        for (const auto& b : registry.descriptorSet(id).bindings) {
            if (b.kind == BindingKind::Sampler && destroyedSamplers_.count(b.sampler) != 0)
                fail("sampler " + std::to_string(b.sampler.index));
        }
    }
}

void CommandStream::rememberDestroyed(const Command& command) {
    if (const auto* c = std::get_if<DestroyBuffer>(&command)) {
        destroyedBuffers_.insert(c->buffer);
    } else if (const auto* c = std::get_if<DestroyTexture>(&command)) {
        destroyedTextures_.insert(c->texture);
    } else if (const auto* c = std::get_if<DestroySampler>(&command)) {
        destroyedSamplers_.insert(c->sampler);
    } else if (const auto* c = std::get_if<DestroyPipeline>(&command)) {
        destroyedPipelines_.insert(c->pipeline);
    } else if (const auto* c = std::get_if<DestroyDescriptorSet>(&command)) {
        destroyedSets_.insert(c->descriptorSet);
    }
}

} // namespace vksched::graph
