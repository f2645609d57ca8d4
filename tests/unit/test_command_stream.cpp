#include <vksched/graph/command_stream.hpp>

#include "test_util.hpp"

#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using namespace vksched::graph;
using vksched::test::contains;
using vksched::test::fakeHandle;
using vksched::test::fatalMessage;

namespace {

BufferId makeBuffer(ResourceRegistry& reg) {
    BufferDesc desc;
    desc.buffer = fakeHandle<VkBuffer>(0x10);
    desc.size = 256;
    return reg.createBuffer(desc);
}

TextureId makeTexture(ResourceRegistry& reg, std::uint32_t mips,
                      VkFormat format = VK_FORMAT_R8G8B8A8_UNORM) {
    TextureDesc desc;
    desc.image = fakeHandle<VkImage>(0x20);
    desc.format = format;
    desc.extent = {64, 64};
    desc.mipLevels = mips;
    return reg.createTexture(desc);
}

std::vector<ResourceAccess> accessesOf(const CommandStream& stream, std::size_t index) {
    auto span = stream.at(index).accesses;
    return {span.begin(), span.end()};
}

ResourceAccess buf(BufferId id, AccessFlags access) {
    return ResourceAccess{ResourceId::buffer(id), access};
}

ResourceAccess tex(TextureId id, std::uint32_t mip, AccessFlags access) {
    return ResourceAccess{ResourceId::texture(id, mip), access};
}

} // namespace

int main() {
    std::printf("command stream test\n");

    // Transfer commands.
    {
        ResourceRegistry reg;
        BufferId a = makeBuffer(reg);
        BufferId b = makeBuffer(reg);
        TextureId t = makeTexture(reg, 4);

        CommandStream stream;
        stream.push(reg, WriteBuffer{a, 0, std::vector<std::byte>(16)});
        stream.push(reg, CopyBufferToBuffer{a, 0, b, 0, 16});

        CopyBufferToTexture upload;
        upload.src = b;
        upload.dst = t;
        upload.mipLevel = 2;
        stream.push(reg, upload);

        CopyTextureToTexture blit;
        blit.src = t;
        blit.srcMipLevel = 0;
        blit.dst = t;
        blit.dstMipLevel = 1;
        stream.push(reg, blit);

        stream.push(reg, TextureTransition{t, 3, Access::Present});

        assert(stream.size() == 5);
        assert(accessesOf(stream, 0) == (std::vector{buf(a, Access::TransferWrite)}));
        assert(accessesOf(stream, 1) ==
               (std::vector{buf(a, Access::TransferRead), buf(b, Access::TransferWrite)}));
        assert(accessesOf(stream, 2) ==
               (std::vector{buf(b, Access::TransferRead), tex(t, 2, Access::TransferWrite)}));
        assert(accessesOf(stream, 3) ==
               (std::vector{tex(t, 0, Access::TransferRead), tex(t, 1, Access::TransferWrite)}));
        assert(accessesOf(stream, 4) == (std::vector{tex(t, 3, Access::Present)}));
        assert(stream.accessCount() == 8);
        std::printf("  transfer commands: ok\n");
    }

    // A copy within one buffer yields a single merged entry.
    {
        ResourceRegistry reg;
        BufferId a = makeBuffer(reg);
        CommandStream stream;
        stream.push(reg, CopyBufferToBuffer{a, 0, a, 128, 64});
        assert(accessesOf(stream, 0) ==
               (std::vector{buf(a, Access::TransferRead | Access::TransferWrite)}));
        std::printf("  aliasing copy: ok\n");
    }

    // Attachments: load ops add reads, depth write mode picks the bit.
    {
        ResourceRegistry reg;
        TextureId color = makeTexture(reg, 2);
        TextureId depth = makeTexture(reg, 1, VK_FORMAT_D32_SFLOAT);

        RenderPass loaded;
        loaded.name = "loaded";
        loaded.colorAttachments.push_back(ColorAttachment{TextureView{color, 0, 2}, LoadOp::Load});
        DepthAttachment d;
        d.view = TextureView{depth};
        d.loadOp = LoadOp::Load;
        d.depthWrite = DepthWrite::Enabled;
        loaded.depthAttachment = d;

        RenderPass tested;
        tested.name = "depth test only";
        tested.colorAttachments.push_back(ColorAttachment{TextureView{color, 1, 1}});
        d.loadOp = LoadOp::Clear;
        d.depthWrite = DepthWrite::Disabled;
        tested.depthAttachment = d;

        CommandStream stream;
        stream.push(reg, loaded);
        stream.push(reg, tested);

        constexpr AccessFlags colorRW = Access::ColorAttachmentWrite | Access::ColorAttachmentRead;
        assert(accessesOf(stream, 0) ==
               (std::vector{tex(color, 0, colorRW), tex(color, 1, colorRW),
                            tex(depth, 0, Access::DepthAttachmentWrite |
                                              Access::DepthAttachmentRead)}));
        assert(accessesOf(stream, 1) ==
               (std::vector{tex(color, 1, Access::ColorAttachmentWrite),
                            tex(depth, 0, Access::DepthAttachmentRead)}));
        std::printf("  attachments: ok\n");
    }

    // Descriptor set accesses come from the bound pipeline's binding map.
    {
        ResourceRegistry reg;
        BufferId ubo = makeBuffer(reg);
        BufferId unused = makeBuffer(reg);
        TextureId albedo = makeTexture(reg, 3);
        TextureId target = makeTexture(reg, 1);
        SamplerId smp = reg.createSampler(fakeHandle<VkSampler>(0x30));

        PipelineDesc pdesc;
        pdesc.pipeline = fakeHandle<VkPipeline>(0x40);
        pdesc.layout = fakeHandle<VkPipelineLayout>(0x41);
        pdesc.bindings.insert(0, 0, Access::VertexShaderRead);
        pdesc.bindings.insert(0, 1, Access::FragmentShaderRead);
        pdesc.bindings.insert(0, 2, Access::FragmentShaderRead);
        PipelineId pipe = reg.createPipeline(pdesc);

        DescriptorSetDesc sdesc;
        sdesc.bindings.push_back(DescriptorBinding::uniformBuffer(0, ubo));
        sdesc.bindings.push_back(DescriptorBinding::sampledTexture(1, TextureView{albedo, 0, 3}));
        sdesc.bindings.push_back(DescriptorBinding::samplerBinding(2, smp));
        sdesc.bindings.push_back(DescriptorBinding::storageBuffer(3, unused)); // not declared
        sdesc.bindings.push_back(DescriptorBinding::sampledTexture(4, TextureView{target}));
        DescriptorSetId set = reg.createDescriptorSet(sdesc);

        RenderPass pass;
        pass.name = "forward";
        pass.colorAttachments.push_back(ColorAttachment{TextureView{target}});
        pass.commands.push_back(SetDescriptorSet{0, set}); // no pipeline yet: ignored
        pass.commands.push_back(SetPipeline{pipe});
        pass.commands.push_back(SetDescriptorSet{0, set});
        pass.commands.push_back(Draw{3});
        pass.commands.push_back(SetDescriptorSet{0, set}); // already visited
        pass.commands.push_back(Draw{3});

        CommandStream stream;
        stream.push(reg, pass);

        assert(accessesOf(stream, 0) ==
               (std::vector{tex(target, 0, Access::ColorAttachmentWrite),
                            buf(ubo, Access::VertexShaderRead),
                            tex(albedo, 0, Access::FragmentShaderRead),
                            tex(albedo, 1, Access::FragmentShaderRead),
                            tex(albedo, 2, Access::FragmentShaderRead)}));
        std::printf("  descriptor set accesses: ok\n");
    }

    // A texture used as attachment and sampled in the same pass merges.
    {
        ResourceRegistry reg;
        TextureId feedback = makeTexture(reg, 1);

        PipelineDesc pdesc;
        pdesc.bindings.insert(1, 0, Access::FragmentShaderRead);
        PipelineId pipe = reg.createPipeline(pdesc);

        DescriptorSetDesc sdesc;
        sdesc.bindings.push_back(DescriptorBinding::sampledTexture(0, TextureView{feedback}));
        DescriptorSetId set = reg.createDescriptorSet(sdesc);

        RenderPass pass;
        pass.colorAttachments.push_back(ColorAttachment{TextureView{feedback}});
        pass.commands.push_back(SetPipeline{pipe});
        pass.commands.push_back(SetDescriptorSet{1, set});

        CommandStream stream;
        stream.push(reg, pass);
        assert(accessesOf(stream, 0) ==
               (std::vector{tex(feedback, 0,
                                Access::ColorAttachmentWrite | Access::FragmentShaderRead)}));
        std::printf("  merged pass access: ok\n");
    }

    // Index and indirect buffers.
    {
        ResourceRegistry reg;
        BufferId geometry = makeBuffer(reg);
        BufferId args = makeBuffer(reg);

        RenderPass pass;
        pass.commands.push_back(SetIndexBuffer{geometry});
        pass.commands.push_back(DrawIndexedIndirect{geometry, 0});
        pass.commands.push_back(DrawIndirect{args, 0});
        pass.commands.push_back(DrawMeshTasks{});

        CommandStream stream;
        stream.push(reg, pass);
        assert(accessesOf(stream, 0) ==
               (std::vector{buf(geometry, Access::Index | Access::Indirect),
                            buf(args, Access::Indirect)}));
        std::printf("  index and indirect: ok\n");
    }

    // Compute pass.
    {
        ResourceRegistry reg;
        BufferId particles = makeBuffer(reg);
        BufferId args = makeBuffer(reg);
        TextureId image = makeTexture(reg, 1);

        PipelineDesc pdesc;
        pdesc.bindPoint = VK_PIPELINE_BIND_POINT_COMPUTE;
        pdesc.bindings.insert(0, 0, Access::ComputeShaderRead | Access::ComputeShaderWrite);
        pdesc.bindings.insert(0, 1, Access::ComputeShaderWrite);
        PipelineId pipe = reg.createPipeline(pdesc);

        DescriptorSetDesc sdesc;
        sdesc.bindings.push_back(DescriptorBinding::storageBuffer(0, particles));
        sdesc.bindings.push_back(DescriptorBinding::storageTexture(1, TextureView{image}));
        DescriptorSetId set = reg.createDescriptorSet(sdesc);

        ComputePass pass;
        pass.name = "simulate";
        pass.commands.push_back(SetPipeline{pipe});
        pass.commands.push_back(SetDescriptorSet{0, set});
        pass.commands.push_back(Dispatch{64});
        pass.commands.push_back(DispatchIndirect{args});

        CommandStream stream;
        stream.push(reg, pass);
        assert(accessesOf(stream, 0) ==
               (std::vector{buf(particles, Access::ComputeShaderRead | Access::ComputeShaderWrite),
                            tex(image, 0, Access::ComputeShaderWrite),
                            buf(args, Access::Indirect)}));
        std::printf("  compute pass: ok\n");
    }

    // Creates keep their empty access; destroys and empty passes have none.
    {
        ResourceRegistry reg;
        BufferId b = makeBuffer(reg);
        TextureId t = makeTexture(reg, 3);

        RenderPass empty;
        empty.commands.push_back(Draw{3});

        CommandStream stream;
        stream.push(reg, CreateBuffer{b});
        stream.push(reg, CreateTexture{t});
        stream.push(reg, empty);
        stream.push(reg, DestroyBuffer{b});
        stream.push(reg, DestroyTexture{t});

        assert(accessesOf(stream, 0) == (std::vector{buf(b, Access::None)}));
        assert(accessesOf(stream, 1) ==
               (std::vector{tex(t, 0, Access::None), tex(t, 1, Access::None),
                            tex(t, 2, Access::None)}));
        assert(accessesOf(stream, 2).empty());
        assert(accessesOf(stream, 3).empty());
        assert(accessesOf(stream, 4).empty());
        assert(std::string(commandName(*stream.at(1).command)) == "CreateTexture");
        assert(std::string(commandName(*stream.at(4).command)) == "DestroyTexture");
        std::printf("  create and destroy: ok\n");
    }

    // Refs, clear and reuse.
    {
        ResourceRegistry reg;
        BufferId b = makeBuffer(reg);
        CommandStream stream;
        assert(stream.empty());
        stream.push(reg, WriteBuffer{b, 0, std::vector<std::byte>(4)});
        stream.push(reg, WriteBuffer{b, 4, std::vector<std::byte>(4)});

        auto refs = stream.commands();
        assert(refs.size() == 2);
        assert(refs[1].command == stream.at(1).command);
        assert(refs[1].accesses.size() == 1);
        assert(std::get<WriteBuffer>(*refs[1].command).offset == 4);

        stream.clear();
        assert(stream.empty());
        assert(stream.accessCount() == 0);
        stream.push(reg, DestroyBuffer{b});
        stream.clear();
        // Destroyed set is per recording.
        stream.push(reg, WriteBuffer{b, 0, std::vector<std::byte>(4)});
        assert(stream.size() == 1);
        std::printf("  clear: ok\n");
    }

    // Use after destroy within one stream.
    {
        ResourceRegistry reg;
        BufferId b = makeBuffer(reg);
        TextureId t = makeTexture(reg, 1);
        SamplerId smp = reg.createSampler(fakeHandle<VkSampler>(0x50));
        PipelineId pipe = reg.createPipeline(PipelineDesc{});

        DescriptorSetDesc sdesc;
        sdesc.bindings.push_back(DescriptorBinding::samplerBinding(0, smp));
        DescriptorSetId set = reg.createDescriptorSet(sdesc);

        CommandStream stream;
        assert(stream.destroyValidation());
        stream.push(reg, DestroyBuffer{b});
        std::string msg = fatalMessage(
            [&] { stream.push(reg, WriteBuffer{b, 0, std::vector<std::byte>(4)}); });
        assert(contains(msg, "WriteBuffer #1 uses buffer 0 after it was destroyed"));
        // The rejected command left nothing behind.
        assert(stream.size() == 1);
        assert(stream.accessCount() == 0);
        stream.push(reg, TextureTransition{t, 0, Access::TransferWrite});
        assert(stream.size() == 2);
        assert(std::holds_alternative<TextureTransition>(*stream.at(1).command));
        assert(accessesOf(stream, 1) == (std::vector{tex(t, 0, Access::TransferWrite)}));

        stream.clear();
        stream.push(reg, DestroyTexture{t});
        msg = fatalMessage([&] { stream.push(reg, TextureTransition{t, 0, Access::Present}); });
        assert(contains(msg, "texture 0 after it was destroyed"));

        stream.clear();
        stream.push(reg, DestroyPipeline{pipe});
        ComputePass pass;
        pass.commands.push_back(SetPipeline{pipe});
        msg = fatalMessage([&] { stream.push(reg, pass); });
        assert(contains(msg, "pipeline 0 after it was destroyed"));

        stream.clear();
        stream.push(reg, DestroySampler{smp});
        ComputePass other;
        other.commands.push_back(SetPipeline{pipe});
        other.commands.push_back(SetDescriptorSet{0, set});
        msg = fatalMessage([&] { stream.push(reg, other); });
        assert(contains(msg, "sampler 0 after it was destroyed"));

        stream.clear();
        stream.push(reg, DestroyDescriptorSet{set});
        msg = fatalMessage([&] { stream.push(reg, other); });
        assert(contains(msg, "descriptor set 0 after it was destroyed"));
        assert(stream.size() == 1);

        stream.clear();
        stream.setDestroyValidation(false);
        stream.push(reg, DestroyBuffer{b});
        stream.push(reg, WriteBuffer{b, 0, std::vector<std::byte>(4)});
        assert(stream.size() == 2);
        std::printf("  destroy validation: ok\n");
    }

    // A second destroy of the same resource in one stream.
    {
        ResourceRegistry reg;
        BufferId b = makeBuffer(reg);
        TextureId t = makeTexture(reg, 1);
        SamplerId smp = reg.createSampler(fakeHandle<VkSampler>(0x50));
        PipelineId pipe = reg.createPipeline(PipelineDesc{});
        DescriptorSetId set = reg.createDescriptorSet(DescriptorSetDesc{});

        CommandStream stream;
        stream.push(reg, WriteBuffer{b, 0, std::vector<std::byte>(4)});
        stream.push(reg, DestroyBuffer{b});
        std::string msg = fatalMessage([&] { stream.push(reg, DestroyBuffer{b}); });
        assert(contains(msg, "DestroyBuffer #2 destroys buffer 0 twice"));
        assert(stream.size() == 2);

        stream.push(reg, DestroyTexture{t});
        msg = fatalMessage([&] { stream.push(reg, DestroyTexture{t}); });
        assert(contains(msg, "destroys texture 0 twice"));

        stream.push(reg, DestroySampler{smp});
        msg = fatalMessage([&] { stream.push(reg, DestroySampler{smp}); });
        assert(contains(msg, "destroys sampler 0 twice"));

        stream.push(reg, DestroyPipeline{pipe});
        msg = fatalMessage([&] { stream.push(reg, DestroyPipeline{pipe}); });
        assert(contains(msg, "destroys pipeline 0 twice"));

        stream.push(reg, DestroyDescriptorSet{set});
        msg = fatalMessage([&] { stream.push(reg, DestroyDescriptorSet{set}); });
        assert(contains(msg, "destroys descriptor set 0 twice"));
        assert(stream.size() == 6);

        // A new recording starts with nothing destroyed.
        stream.clear();
        stream.push(reg, DestroyBuffer{b});
        assert(stream.size() == 1);
        std::printf("  double destroy: ok
");
    }

    // Storage textures must be declared with a shader write.
    {
        ResourceRegistry reg;
        TextureId image = makeTexture(reg, 1);

        PipelineDesc pdesc;
        pdesc.bindPoint = VK_PIPELINE_BIND_POINT_COMPUTE;
        pdesc.bindings.insert(0, 0, Access::ComputeShaderRead);
        PipelineId readOnly = reg.createPipeline(pdesc);

        DescriptorSetDesc sdesc;
        sdesc.bindings.push_back(DescriptorBinding::storageTexture(0, TextureView{image}));
        DescriptorSetId set = reg.createDescriptorSet(sdesc);

        ComputePass pass;
        pass.commands.push_back(SetPipeline{readOnly});
        pass.commands.push_back(SetDescriptorSet{0, set});
        pass.commands.push_back(Dispatch{1});

        CommandStream stream;
        std::string msg = fatalMessage([&] { stream.push(reg, pass); });
        assert(contains(msg, "storage texture binding 0 of descriptor set 0"));
        assert(contains(msg, "COMPUTE_SHADER_READ"));
        assert(stream.empty());

        // The same image through a sampled binding may stay read-only.
        DescriptorSetDesc sampledDesc;
        sampledDesc.bindings.push_back(DescriptorBinding::sampledTexture(0, TextureView{image}));
        DescriptorSetId sampled = reg.createDescriptorSet(sampledDesc);
        ComputePass reads;
        reads.commands.push_back(SetPipeline{readOnly});
        reads.commands.push_back(SetDescriptorSet{0, sampled});
        reads.commands.push_back(Dispatch{1});
        stream.push(reg, reads);
        assert(accessesOf(stream, 0) == (std::vector{tex(image, 0, Access::ComputeShaderRead)}));

        pdesc.bindings.insert(0, 0, Access::ComputeShaderRead | Access::ComputeShaderWrite);
        PipelineId readWrite = reg.createPipeline(pdesc);
        pass.commands[0] = SetPipeline{readWrite};
        stream.push(reg, pass);
        assert(stream.size() == 2);
        std::printf("  storage texture access: ok
");
    }

    // Unknown resources are fatal at push time.
    {
        ResourceRegistry reg;
        CommandStream stream;
        ComputePass pass;
        pass.commands.push_back(SetPipeline{PipelineId{7}});
        std::string msg = fatalMessage([&] { stream.push(reg, pass); });
        assert(contains(msg, "pipeline 7 is not registered"));

        msg = fatalMessage([&] { stream.push(reg, CreateTexture{TextureId{1}}); });
        assert(contains(msg, "texture 1 is not registered"));
        std::printf("  unknown resources: ok\n");
    }

    std::printf("command stream test passed\n");
    return 0;
}
