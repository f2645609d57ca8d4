#pragma once

#include <vksched/graph/access.hpp>
#include <vksched/graph/commands.hpp>
#include <vksched/graph/resource_id.hpp>
#include <vksched/graph/resource_registry.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vksched::graph {

// One resource touched by a command and how. A command's access list holds
// each ResourceId at most once.
struct ResourceAccess {
    ResourceId id;
    AccessFlags access = Access::None;

    [[nodiscard]] bool operator==(const ResourceAccess&) const = default;
};

// Non-owning view of one recorded command and its access list.
// Valid until the next push() or clear() on the owning stream.
struct CommandRef {
    const Command* command = nullptr;
    std::span<const ResourceAccess> accesses;
};

// Append-only list of commands. Each push derives the command's access list
// once and appends it to a single shared backing vector; clear() keeps the
// capacity so a stream can be reused frame after frame.
//
// Texture accesses are keyed per mip. Render and compute passes merge the
// accesses of all their sub-commands into one entry per resource, in
// first-touch order.
//
// Destroy validation (on by default): once a Destroy* command has been
// pushed, any later command touching the same id is a fatal error.
//
// Thread safety: thread-confined.
class CommandStream {
public:
    // The registry is read for pipelines' binding maps, descriptor set
    // contents and texture mip counts. Missing entries are fatal.
    void push(const ResourceRegistry& registry, Command command);

    [[nodiscard]] std::vector<CommandRef> commands() const;
    [[nodiscard]] CommandRef at(std::size_t index) const;

    [[nodiscard]] std::size_t size() const { return commands_.size(); }
    [[nodiscard]] bool empty() const { return commands_.empty(); }

    // Total entries across all commands.
    [[nodiscard]] std::size_t accessCount() const { return accesses_.size(); }

    void clear();

    void setDestroyValidation(bool enabled) { destroyValidation_ = enabled; }
    [[nodiscard]] bool destroyValidation() const { return destroyValidation_; }

private:
    friend class AccessCollector;

    struct Range {
        std::uint32_t offset = 0;
        std::uint32_t count = 0;
    };

    void touch(const ResourceId& id, AccessFlags access);
    void flushScratch(bool keepEmpty);
    void checkNotDestroyed(const ResourceRegistry& registry, const Command& command,
                           std::size_t commandIndex) const;
    void rememberDestroyed(const Command& command);

    std::vector<Command> commands_;
    std::vector<Range> ranges_;
    std::vector<ResourceAccess> accesses_;

    // Per-push scratch, cleared after each push.
    std::vector<ResourceAccess> scratch_;
    std::unordered_map<ResourceId, std::size_t> scratchIndex_;
    std::vector<DescriptorSetId> visitedSets_;
    std::vector<PipelineId> usedPipelines_;

    bool destroyValidation_ = true;
    std::unordered_set<BufferId> destroyedBuffers_;
    std::unordered_set<TextureId> destroyedTextures_;
    std::unordered_set<SamplerId> destroyedSamplers_;
    std::unordered_set<PipelineId> destroyedPipelines_;
    std::unordered_set<DescriptorSetId> destroyedSets_;
};

} // namespace vksched::graph
