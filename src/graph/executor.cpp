#include <vksched/error.hpp>
#include <vksched/graph/executor.hpp>

#include <algorithm>
#include <cstdio>
#include <string>
#include <type_traits>
#include <variant>

namespace vksched::graph {

namespace {

VkAttachmentLoadOp toVkLoadOp(LoadOp op) {
    switch (op) {
    case LoadOp::Clear:
        return VK_ATTACHMENT_LOAD_OP_CLEAR;
    case LoadOp::Load:
        return VK_ATTACHMENT_LOAD_OP_LOAD;
    case LoadOp::DontCare:
        return VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    }
    return VK_ATTACHMENT_LOAD_OP_DONT_CARE;
}

VkAttachmentStoreOp toVkStoreOp(StoreOp op) {
    return op == StoreOp::Store ? VK_ATTACHMENT_STORE_OP_STORE : VK_ATTACHMENT_STORE_OP_DONT_CARE;
}

VkExtent2D mipExtent(const TextureEntry& tex, std::uint32_t mip) {
    return VkExtent2D{std::max(1u, tex.extent.width >> mip), std::max(1u, tex.extent.height >> mip)};
}

// Access the node declared for id. Layouts follow from it: the scheduler
// moved the resource into exactly this access before the node.
AccessFlags nodeAccess(const CommandRef& ref, const ResourceId& id) {
    for (const auto& entry : ref.accesses) {
        if (entry.id == id)
            return entry.access;
    }
    return Access::None;
}

} // namespace

// Records one node: resolves ids through the registry, issues backend calls,
// and retains everything it touches.
class NodeRecorder {
public:
    NodeRecorder(Executor& executor, const CommandRef& ref, ResourceRegistry& registry,
                 Backend& backend, TemporaryResources& temporaries)
        : executor_(executor), ref_(ref), registry_(registry), backend_(backend),
          temporaries_(temporaries) {}

    void operator()(const WriteBuffer& c) {
        const BufferEntry& buf = track(c.buffer);
        if (buf.size != 0 && (c.offset > buf.size || c.data.size() > buf.size - c.offset)) {
            fatal("execute WriteBuffer", "write of " + std::to_string(c.data.size()) +
                                             " bytes at offset " + std::to_string(c.offset) +
                                             " overruns buffer " + std::to_string(c.buffer.index));
        }
        backend_.writeBuffer(buf, c.offset, c.data);
    }

    void operator()(const CopyBufferToBuffer& c) {
        VkBuffer src = track(c.src).buffer;
        VkBuffer dst = track(c.dst).buffer;
        backend_.copyBuffer(src, dst, VkBufferCopy{c.srcOffset, c.dstOffset, c.size});
    }

    void operator()(const CopyBufferToTexture& c) {
        VkBuffer src = track(c.src).buffer;
        const TextureEntry& dst = track(c.dst);

        VkBufferImageCopy region{};
        region.bufferOffset = c.srcOffset;
        region.bufferRowLength = c.rowLength;
        region.bufferImageHeight = c.imageHeight;
        region.imageSubresource = {dst.aspect, c.mipLevel, 0, 1};
        region.imageOffset = c.offset;
        region.imageExtent = c.extent;
        if (region.imageExtent.width == 0) {
            VkExtent2D e = mipExtent(dst, c.mipLevel);
            region.imageExtent = {e.width, e.height, 1};
        }

        VkImageLayout layout =
            accessLayout(nodeAccess(ref_, ResourceId::texture(c.dst, c.mipLevel)));
        backend_.copyBufferToImage(src, dst.image, layout, region);
    }

    void operator()(const CopyTextureToTexture& c) {
        const TextureEntry& src = track(c.src);
        const TextureEntry& dst = track(c.dst);

        VkImageCopy region{};
        region.srcSubresource = {src.aspect, c.srcMipLevel, 0, 1};
        region.srcOffset = c.srcOffset;
        region.dstSubresource = {dst.aspect, c.dstMipLevel, 0, 1};
        region.dstOffset = c.dstOffset;
        region.extent = c.extent;
        if (region.extent.width == 0) {
            VkExtent2D e = mipExtent(src, c.srcMipLevel);
            region.extent = {e.width, e.height, 1};
        }

        VkImageLayout srcLayout =
            accessLayout(nodeAccess(ref_, ResourceId::texture(c.src, c.srcMipLevel)));
        VkImageLayout dstLayout =
            accessLayout(nodeAccess(ref_, ResourceId::texture(c.dst, c.dstMipLevel)));
        backend_.copyImage(src.image, srcLayout, dst.image, dstLayout, region);
    }

    void operator()(const TextureTransition& c) { (void)track(c.texture); }

    void operator()(const RenderPass& c) {
        for (const auto& sub : c.commands) {
            if (const auto* set = std::get_if<SetDescriptorSet>(&sub))
                (void)materialize(set->descriptorSet);
        }

        RenderingInfo info;
        for (const auto& color : c.colorAttachments) {
            VkRenderingAttachmentInfo att{};
            att.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
            att.imageView = attachmentView(color.view);
            att.imageLayout = attachmentLayout(color.view);
            att.loadOp = toVkLoadOp(color.loadOp);
            att.storeOp = toVkStoreOp(color.storeOp);
            att.clearValue.color = color.clearValue;
            info.colorAttachments.push_back(att);
        }
        if (c.depthAttachment) {
            const DepthAttachment& depth = *c.depthAttachment;
            VkRenderingAttachmentInfo att{};
            att.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
            att.imageView = attachmentView(depth.view);
            att.imageLayout = attachmentLayout(depth.view);
            att.loadOp = toVkLoadOp(depth.loadOp);
            att.storeOp = toVkStoreOp(depth.storeOp);
            att.clearValue.depthStencil = {depth.clearDepth, depth.clearStencil};
            info.depthAttachment = att;
        }

        info.renderArea = c.renderArea;
        if (info.renderArea.extent.width == 0 || info.renderArea.extent.height == 0) {
            const TextureView* first = !c.colorAttachments.empty() ? &c.colorAttachments[0].view
                                       : c.depthAttachment         ? &c.depthAttachment->view
                                                                   : nullptr;
            if (first != nullptr) {
                info.renderArea.offset = {0, 0};
                info.renderArea.extent =
                    mipExtent(registry_.texture(first->texture), first->baseMipLevel);
            }
        }

#ifndef NDEBUG
        if (info.colorAttachments.empty() && !info.depthAttachment) {
            std::fprintf(stderr, "[vksched::graph] render pass '%s' has no attachments\n",
                         c.name.c_str());
        }
#endif

        backend_.beginRendering(info);
        for (const auto& sub : c.commands)
            std::visit([this](const auto& cmd) { replay(cmd); }, sub);
        backend_.endRendering();
    }

    void operator()(const ComputePass& c) {
        for (const auto& sub : c.commands) {
            if (const auto* set = std::get_if<SetDescriptorSet>(&sub))
                (void)materialize(set->descriptorSet);
        }
        for (const auto& sub : c.commands)
            std::visit([this](const auto& cmd) { replay(cmd); }, sub);
    }

    void operator()(const CreateBuffer& c) { (void)track(c.buffer); }
    void operator()(const CreateTexture& c) { (void)track(c.texture); }

    void operator()(const DestroyBuffer&) { deferDestroy(); }
    void operator()(const DestroyTexture&) { deferDestroy(); }
    void operator()(const DestroySampler&) { deferDestroy(); }
    void operator()(const DestroyPipeline&) { deferDestroy(); }
    void operator()(const DestroyDescriptorSet&) { deferDestroy(); }

private:
    const BufferEntry& track(BufferId id) {
        registry_.retain(id);
        temporaries_.insert(id);
        return registry_.buffer(id);
    }

    TextureEntry& track(TextureId id) {
        registry_.retain(id);
        temporaries_.insert(id);
        return registry_.texture(id);
    }

    const SamplerEntry& track(SamplerId id) {
        registry_.retain(id);
        temporaries_.insert(id);
        return registry_.sampler(id);
    }

    const PipelineEntry& track(PipelineId id) {
        registry_.retain(id);
        temporaries_.insert(id);
        return registry_.pipeline(id);
    }

    // Retains the set and everything bound in it.
    const DescriptorSetEntry& track(DescriptorSetId id) {
        registry_.retain(id);
        temporaries_.insert(id);
        const DescriptorSetEntry& set = registry_.descriptorSet(id);
        for (const auto& b : set.bindings) {
            if (b.isBuffer()) {
                (void)track(b.buffer);
            } else if (b.kind == BindingKind::Sampler) {
                (void)track(b.sampler);
            } else {
                for (const auto& view : b.textures)
                    (void)track(view.texture);
            }
        }
        return set;
    }

    void deferDestroy() { executor_.destroys_.push_back(ref_.command); }

    VkImageView textureView(const TextureView& view) {
        TextureEntry& tex = registry_.texture(view.texture);
        VkImageView cached = tex.findView(view.baseMipLevel, view.mipCount);
        if (cached != VK_NULL_HANDLE)
            return cached;

        VkImageView created =
            backend_.createImageView(tex, view.baseMipLevel, view.mipCount).orThrow();
        tex.views.push_back(CachedView{view.baseMipLevel, view.mipCount, created});
        ++executor_.stats_.imageViewsCreated;
        return created;
    }

    VkImageView attachmentView(const TextureView& view) {
        (void)track(view.texture);
        return textureView(view);
    }

    VkImageLayout attachmentLayout(const TextureView& view) const {
        return accessLayout(nodeAccess(ref_, ResourceId::texture(view.texture, view.baseMipLevel)));
    }

    VkDescriptorSet materialize(DescriptorSetId id) {
        DescriptorSetEntry& set = registry_.descriptorSet(id);
        if (set.native != VK_NULL_HANDLE)
            return set.native;

        VkDescriptorSet native = backend_.allocateDescriptorSet(set.layout).orThrow();

        DescriptorWriter writer(native);
        std::vector<VkImageView> arrayViews;
        for (const auto& b : set.bindings) {
            switch (b.kind) {
            case BindingKind::UniformBuffer:
                writer.buffer(b.binding, registry_.buffer(b.buffer).buffer, VK_WHOLE_SIZE, 0,
                              VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
                break;
            case BindingKind::StorageBuffer:
                writer.buffer(b.binding, registry_.buffer(b.buffer).buffer, VK_WHOLE_SIZE, 0,
                              VK_DESCRIPTOR_TYPE_STORAGE_BUFFER);
                break;
            case BindingKind::Sampler:
                writer.sampler(b.binding, registry_.sampler(b.sampler).sampler);
                break;
            case BindingKind::SampledTexture:
                writer.image(b.binding, textureView(b.textures.at(0)),
                             VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
                break;
            case BindingKind::StorageTexture:
                writer.storageImage(b.binding, textureView(b.textures.at(0)));
                break;
            case BindingKind::TextureArray:
                arrayViews.clear();
                for (const auto& view : b.textures)
                    arrayViews.push_back(textureView(view));
                writer.imageArray(b.binding, arrayViews, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
                break;
            }
        }

        backend_.updateDescriptorSet(writer);
        set.native = native;
        ++executor_.stats_.descriptorSetsBuilt;
        return native;
    }

    template <typename T>
    void replay(const T& cmd) {
        if constexpr (std::is_same_v<T, SetPipeline>) {
            pipeline_ = &track(cmd.pipeline);
            backend_.bindPipeline(pipeline_->bindPoint, pipeline_->pipeline);
        } else if constexpr (std::is_same_v<T, SetDescriptorSet>) {
            if (pipeline_ == nullptr) {
#ifndef NDEBUG
                std::fprintf(stderr,
                             "[vksched::graph] descriptor set %u bound before any pipeline, "
                             "skipped\n",
                             cmd.descriptorSet.index);
#endif
                return;
            }
            const DescriptorSetEntry& set = track(cmd.descriptorSet);
            backend_.bindDescriptorSet(pipeline_->bindPoint, pipeline_->layout, cmd.set,
                                       set.native);
        } else if constexpr (std::is_same_v<T, SetIndexBuffer>) {
            backend_.bindIndexBuffer(track(cmd.buffer).buffer, cmd.offset, cmd.indexType);
        } else if constexpr (std::is_same_v<T, PushConstants>) {
            if (pipeline_ == nullptr)
                fatal("execute PushConstants", "no pipeline bound for the pipeline layout");
            backend_.pushConstants(pipeline_->layout, cmd.stages, cmd.offset, cmd.data);
        } else if constexpr (std::is_same_v<T, Draw>) {
            backend_.draw(cmd.vertexCount, cmd.instanceCount, cmd.firstVertex, cmd.firstInstance);
        } else if constexpr (std::is_same_v<T, DrawIndexed>) {
            backend_.drawIndexed(cmd.indexCount, cmd.instanceCount, cmd.firstIndex,
                                 cmd.vertexOffset, cmd.firstInstance);
        } else if constexpr (std::is_same_v<T, DrawIndirect>) {
            backend_.drawIndirect(track(cmd.buffer).buffer, cmd.offset, cmd.drawCount, cmd.stride);
        } else if constexpr (std::is_same_v<T, DrawIndexedIndirect>) {
            backend_.drawIndexedIndirect(track(cmd.buffer).buffer, cmd.offset, cmd.drawCount,
                                         cmd.stride);
        } else if constexpr (std::is_same_v<T, DrawMeshTasks>) {
            backend_.drawMeshTasks(cmd.groupCountX, cmd.groupCountY, cmd.groupCountZ);
        } else if constexpr (std::is_same_v<T, Dispatch>) {
            backend_.dispatch(cmd.groupCountX, cmd.groupCountY, cmd.groupCountZ);
        } else if constexpr (std::is_same_v<T, DispatchIndirect>) {
            backend_.dispatchIndirect(track(cmd.buffer).buffer, cmd.offset);
        }
    }

    Executor& executor_;
    const CommandRef& ref_;
    ResourceRegistry& registry_;
    Backend& backend_;
    TemporaryResources& temporaries_;
    const PipelineEntry* pipeline_ = nullptr;
};

bool releaseOwner(const Command& command, ResourceRegistry& registry) {
    if (const auto* c = std::get_if<DestroyBuffer>(&command)) {
        registry.release(c->buffer);
    } else if (const auto* c = std::get_if<DestroyTexture>(&command)) {
        registry.release(c->texture);
    } else if (const auto* c = std::get_if<DestroySampler>(&command)) {
        registry.release(c->sampler);
    } else if (const auto* c = std::get_if<DestroyPipeline>(&command)) {
        registry.release(c->pipeline);
    } else if (const auto* c = std::get_if<DestroyDescriptorSet>(&command)) {
        registry.release(c->descriptorSet);
    } else {
        return false;
    }
    return true;
}

void Executor::flushBarriers(Backend& backend) {
    if (batch_.empty())
        return;
    backend.pipelineBarrier(batch_);
    ++stats_.barrierBatchCount;
    stats_.bufferBarrierCount += static_cast<std::uint32_t>(batch_.bufferBarriers.size());
    stats_.imageBarrierCount += static_cast<std::uint32_t>(batch_.imageBarriers.size());
    batch_.clear();
}

TemporaryResources Executor::execute(std::span<const Step> steps,
                                     std::span<const CommandRef> nodes,
                                     ResourceRegistry& registry, Backend& backend) {
    stats_ = {};
    stats_.stepCount = static_cast<std::uint32_t>(steps.size());
    batch_.clear();
    destroys_.clear();

    TemporaryResources temporaries;
    bool replayed = false;

    try {
        for (const auto& step : steps) {
            if (step.isBarrier()) {
                const Barrier& b = step.barrier;
                if (b.resource.isBuffer()) {
                    appendBufferBarrier(batch_, registry.buffer(b.resource.bufferId()).buffer,
                                        b.srcAccess, b.dstAccess);
                } else {
                    const TextureEntry& tex = registry.texture(b.resource.textureId());
                    appendTextureBarrier(batch_, tex.image, tex.aspect, b.resource.mipLevel,
                                         b.srcAccess, b.dstAccess);
                }
                continue;
            }

            if (step.node >= nodes.size() || nodes[step.node].command == nullptr) {
                fatal("execute schedule", "step references command " +
                                              std::to_string(step.node) + " of " +
                                              std::to_string(nodes.size()));
            }

            flushBarriers(backend);

            const CommandRef& ref = nodes[step.node];
            NodeRecorder recorder(*this, ref, registry, backend, temporaries);
            std::visit(recorder, *ref.command);
            ++stats_.nodeCount;
        }

        flushBarriers(backend);
        replayed = true;

        // Owners let go only now, after every use above took its own reference.
        for (const Command* command : destroys_) {
            if (releaseOwner(*command, registry))
                ++stats_.releasedByDestroy;
        }
    } catch (...) {
        // Work recorded by a failed execute is never submitted.
        batch_.clear();
        destroys_.clear();
        temporaries.destroy(registry);
        if (!replayed) {
            for (const auto& ref : nodes) {
                if (ref.command != nullptr)
                    releaseOwner(*ref.command, registry);
            }
        }
        throw;
    }
    destroys_.clear();

    return temporaries;
}

} // namespace vksched::graph
