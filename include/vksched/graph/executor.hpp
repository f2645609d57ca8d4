#pragma once

#include <vksched/graph/backend.hpp>
#include <vksched/graph/barrier_batch.hpp>
#include <vksched/graph/command_stream.hpp>
#include <vksched/graph/resource_registry.hpp>
#include <vksched/graph/scheduler.hpp>
#include <vksched/graph/temporary_resources.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace vksched::graph {

struct ExecutionStats {
    std::uint32_t stepCount = 0;
    std::uint32_t nodeCount = 0;
    std::uint32_t barrierBatchCount = 0; // pipelineBarrier calls
    std::uint32_t bufferBarrierCount = 0;
    std::uint32_t imageBarrierCount = 0;
    std::uint32_t descriptorSetsBuilt = 0;
    std::uint32_t imageViewsCreated = 0;
    std::uint32_t releasedByDestroy = 0;
};

// Replays a schedule against a Backend.
//
// Consecutive barrier steps are merged into one pipelineBarrier call, flushed
// right before the next node (and once more at the end). Descriptor sets are
// materialized the first time a pass binds them and reused afterwards; image
// views come from the texture's view cache.
//
// Every resource a node touches is retained and recorded in the returned
// TemporaryResources. Destroy commands drop the owner's reference only after
// the whole schedule has been replayed. Pass the TemporaryResources to
// destroy() once the GPU finished the recorded work. When recording fails,
// those references and the owner references of every destroy command in
// nodes are released before the error propagates, and the partially recorded
// command buffer must not be submitted.
//
// Thread safety: thread-confined.
class Executor {
public:
    [[nodiscard]] TemporaryResources execute(std::span<const Step> steps,
                                             std::span<const CommandRef> nodes,
                                             ResourceRegistry& registry, Backend& backend);

    [[nodiscard]] const ExecutionStats& stats() const { return stats_; }

private:
    friend class NodeRecorder;

    void flushBarriers(Backend& backend);

    BarrierBatch batch_;
    std::vector<const Command*> destroys_;
    ExecutionStats stats_;
};

// Drops the owner's reference for a Destroy* command. Returns false, and
// does nothing, for any other command.
bool releaseOwner(const Command& command, ResourceRegistry& registry);

} // namespace vksched::graph
