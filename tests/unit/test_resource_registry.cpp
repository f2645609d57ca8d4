#include <vksched/graph/resource_registry.hpp>

#include "test_util.hpp"

#include <cassert>
#include <cstdio>
#include <string>

using namespace vksched::graph;
using vksched::test::contains;
using vksched::test::fakeHandle;
using vksched::test::fatalMessage;

namespace {

TextureId makeTexture(ResourceRegistry& reg, std::uint32_t mips,
                      VkFormat format = VK_FORMAT_R8G8B8A8_UNORM) {
    TextureDesc desc;
    desc.image = fakeHandle<VkImage>(0x100);
    desc.format = format;
    desc.extent = {256, 128};
    desc.mipLevels = mips;
    return reg.createTexture(desc);
}

BufferId makeBuffer(ResourceRegistry& reg, VkDeviceSize size = 64) {
    BufferDesc desc;
    desc.buffer = fakeHandle<VkBuffer>(0x200);
    desc.size = size;
    return reg.createBuffer(desc);
}

} // namespace

int main() {
    std::printf("resource registry test\n");

    // Fresh resources: one reference, no access.
    {
        ResourceRegistry reg;
        BufferId buf = makeBuffer(reg);
        TextureId tex = makeTexture(reg, 4);

        assert(buf.valid() && tex.valid());
        assert(reg.refCount(buf) == 1);
        assert(reg.refCount(tex) == 1);
        assert(reg.access(ResourceId::buffer(buf)) == Access::None);
        for (std::uint32_t mip = 0; mip < 4; ++mip)
            assert(reg.access(ResourceId::texture(tex, mip)) == Access::None);
        assert(reg.texture(tex).mipAccess.size() == 4);
        assert(reg.texture(tex).aspect == VK_IMAGE_ASPECT_COLOR_BIT);
        assert(reg.bufferCount() == 1);
        assert(reg.textureCount() == 1);
        std::printf("  create: ok\n");
    }

    // Aspect follows the format unless given.
    {
        ResourceRegistry reg;
        TextureId depth = makeTexture(reg, 1, VK_FORMAT_D32_SFLOAT);
        TextureId ds = makeTexture(reg, 1, VK_FORMAT_D24_UNORM_S8_UINT);
        assert(reg.texture(depth).aspect == VK_IMAGE_ASPECT_DEPTH_BIT);
        assert(reg.texture(ds).aspect ==
               (VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT));

        TextureDesc desc;
        desc.format = VK_FORMAT_D32_SFLOAT;
        desc.aspect = VK_IMAGE_ASPECT_COLOR_BIT;
        TextureId forced = reg.createTexture(desc);
        assert(reg.texture(forced).aspect == VK_IMAGE_ASPECT_COLOR_BIT);
        std::printf("  aspect: ok\n");
    }

    // Access is tracked per mip.
    {
        ResourceRegistry reg;
        TextureId tex = makeTexture(reg, 3);
        reg.setAccess(ResourceId::texture(tex, 1), Access::TransferWrite);
        assert(reg.access(ResourceId::texture(tex, 0)) == Access::None);
        assert(reg.access(ResourceId::texture(tex, 1)) == Access::TransferWrite);
        assert(reg.access(ResourceId::texture(tex, 2)) == Access::None);

        std::string msg = fatalMessage([&] { (void)reg.access(ResourceId::texture(tex, 3)); });
        assert(contains(msg, "has no mip 3"));
        msg = fatalMessage([&] { reg.setAccess(ResourceId::texture(tex, 7), Access::None); });
        assert(contains(msg, "has no mip 7"));
        std::printf("  per-mip access: ok\n");
    }

    // Unknown ids are fatal.
    {
        ResourceRegistry reg;
        std::string msg = fatalMessage([&] { (void)reg.buffer(BufferId{5}); });
        assert(contains(msg, "buffer 5 is not registered"));
        msg = fatalMessage([&] { (void)reg.access(ResourceId::texture(TextureId{0}, 0)); });
        assert(contains(msg, "texture 0 is not registered"));
        msg = fatalMessage([&] { reg.retain(PipelineId{2}); });
        assert(contains(msg, "pipeline 2 is not registered"));
        assert(!reg.contains(SamplerId{0}));

        TextureDesc desc;
        desc.mipLevels = 0;
        msg = fatalMessage([&] { (void)reg.createTexture(desc); });
        assert(contains(msg, "mipLevels"));
        std::printf("  unknown ids: ok\n");
    }

    // Last release pushes exactly one deletion event.
    {
        ResourceRegistry reg;
        BufferId buf = makeBuffer(reg);
        reg.retain(buf);
        reg.retain(buf);
        assert(reg.refCount(buf) == 3);

        reg.release(buf);
        assert(reg.deletionQueue().empty());
        reg.release(buf, 2);
        assert(reg.refCount(buf) == 0);
        assert(reg.deletionQueue().size() == 1);
        assert(reg.deletionQueue().pending()[0] ==
               (DeletionEvent{DeletionEvent::Kind::Buffer, buf.index}));

        // Still readable until reclaimed.
        assert(reg.buffer(buf).buffer == fakeHandle<VkBuffer>(0x200));

        std::string msg = fatalMessage([&] { reg.retain(buf); });
        assert(contains(msg, "already queued for deletion"));
        msg = fatalMessage([&] { reg.release(buf); });
        assert(contains(msg, "cannot release 1"));
        assert(reg.deletionQueue().size() == 1);
        std::printf("  release: ok\n");
    }

    // Reclaim frees the slot for reuse.
    {
        ResourceRegistry reg;
        BufferId a = makeBuffer(reg);
        BufferId b = makeBuffer(reg);

        std::string msg = fatalMessage(
            [&] { reg.reclaim(DeletionEvent{DeletionEvent::Kind::Buffer, a.index}); });
        assert(contains(msg, "still has 1 references"));

        reg.release(a);
        auto events = reg.deletionQueue().drain();
        assert(events.size() == 1);
        assert(reg.deletionQueue().empty());
        reg.reclaim(events[0]);
        assert(!reg.contains(a));
        assert(reg.contains(b));
        assert(reg.bufferCount() == 1);

        BufferId c = makeBuffer(reg, 16);
        assert(c.index == a.index);
        assert(reg.refCount(c) == 1);
        assert(reg.buffer(c).size == 16);
        assert(reg.access(ResourceId::buffer(c)) == Access::None);
        std::printf("  reclaim: ok\n");
    }

    // Descriptor sets hold references on their contents.
    {
        ResourceRegistry reg;
        BufferId ubo = makeBuffer(reg);
        TextureId tex = makeTexture(reg, 4);
        SamplerId smp = reg.createSampler(fakeHandle<VkSampler>(0x300));

        DescriptorSetDesc desc;
        desc.bindings.push_back(DescriptorBinding::uniformBuffer(0, ubo));
        desc.bindings.push_back(DescriptorBinding::sampledTexture(1, TextureView{tex, 0, 4}));
        desc.bindings.push_back(DescriptorBinding::samplerBinding(2, smp));
        DescriptorSetId set = reg.createDescriptorSet(desc);

        assert(reg.refCount(set) == 1);
        assert(reg.refCount(ubo) == 2);
        assert(reg.refCount(tex) == 2);
        assert(reg.refCount(smp) == 2);
        assert(reg.descriptorSet(set).native == VK_NULL_HANDLE);

        // Owners let go first: contents survive through the set.
        reg.release(ubo);
        reg.release(tex);
        reg.release(smp);
        assert(reg.deletionQueue().empty());

        // Releasing the set cascades, set event first.
        reg.release(set);
        const auto& pending = reg.deletionQueue().pending();
        assert(pending.size() == 4);
        assert(pending[0] == (DeletionEvent{DeletionEvent::Kind::DescriptorSet, set.index}));
        assert(pending[1] == (DeletionEvent{DeletionEvent::Kind::Buffer, ubo.index}));
        assert(pending[2] == (DeletionEvent{DeletionEvent::Kind::Texture, tex.index}));
        assert(pending[3] == (DeletionEvent{DeletionEvent::Kind::Sampler, smp.index}));

        for (const auto& ev : reg.deletionQueue().drain())
            reg.reclaim(ev);
        assert(!reg.contains(set));
        assert(!reg.contains(tex));
        assert(reg.textureCount() == 0);
        std::printf("  descriptor set references: ok\n");
    }

    // A texture array retains each texture once per view.
    {
        ResourceRegistry reg;
        TextureId a = makeTexture(reg, 1);
        TextureId b = makeTexture(reg, 1);
        DescriptorSetDesc desc;
        desc.bindings.push_back(
            DescriptorBinding::textureArray(0, {TextureView{a}, TextureView{b}, TextureView{a}}));
        DescriptorSetId set = reg.createDescriptorSet(desc);
        assert(reg.refCount(a) == 3);
        assert(reg.refCount(b) == 2);

        reg.release(a);
        reg.release(b);
        reg.release(set);
        assert(reg.refCount(a) == 0);
        assert(reg.refCount(b) == 0);
        assert(reg.deletionQueue().size() == 3);
        std::printf("  texture array references: ok\n");
    }

    // Views outside the mip chain are rejected.
    {
        ResourceRegistry reg;
        TextureId tex = makeTexture(reg, 2);
        DescriptorSetDesc desc;
        desc.bindings.push_back(DescriptorBinding::sampledTexture(0, TextureView{tex, 1, 2}));
        std::string msg = fatalMessage([&] { (void)reg.createDescriptorSet(desc); });
        assert(contains(msg, "exceeds its mip chain"));
        std::printf("  view range check: ok\n");
    }

    // Binding maps OR repeated declarations.
    {
        BindingMap map;
        map.insert(0, 2, Access::FragmentShaderRead);
        map.insert(0, 2, Access::VertexShaderRead);
        map.insert(1, 0, Access::ComputeShaderWrite);

        assert(map.get(0, 2) == (Access::FragmentShaderRead | Access::VertexShaderRead));
        assert(map.get(1, 0) == Access::ComputeShaderWrite);
        assert(!map.get(0, 0).has_value());
        assert(!map.get(0, 9).has_value());
        assert(!map.get(4, 0).has_value());
        std::printf("  binding map: ok\n");
    }

    // Materialized descriptor sets can be forgotten in one go.
    {
        ResourceRegistry reg;
        DescriptorSetId a = reg.createDescriptorSet({});
        DescriptorSetId b = reg.createDescriptorSet({});
        reg.descriptorSet(a).native = fakeHandle<VkDescriptorSet>(1);
        reg.descriptorSet(b).native = fakeHandle<VkDescriptorSet>(2);
        reg.resetDescriptorSets();
        assert(reg.descriptorSet(a).native == VK_NULL_HANDLE);
        assert(reg.descriptorSet(b).native == VK_NULL_HANDLE);
        std::printf("  reset descriptor sets: ok\n");
    }

    // View cache lookup.
    {
        TextureEntry entry;
        entry.views.push_back(CachedView{0, 4, fakeHandle<VkImageView>(10)});
        entry.views.push_back(CachedView{2, 1, fakeHandle<VkImageView>(11)});
        assert(entry.findView(0, 4) == fakeHandle<VkImageView>(10));
        assert(entry.findView(2, 1) == fakeHandle<VkImageView>(11));
        assert(entry.findView(0, 1) == VK_NULL_HANDLE);
        std::printf("  view cache: ok\n");
    }

    std::printf("resource registry test passed\n");
    return 0;
}
