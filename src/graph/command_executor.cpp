#include <vksched/graph/command_executor.hpp>

#include <cstdio>

namespace vksched::graph {

TemporaryResources CommandExecutor::execute(Backend& backend) {
    std::vector<CommandRef> nodes = stream_.commands();
    lastNames_.clear();
    for (const auto& ref : nodes)
        lastNames_.push_back(commandName(*ref.command));

    lastSteps_.clear();
    try {
        lastSteps_ = scheduler_.schedule(nodes, *registry_);
    } catch (...) {
        for (const auto& ref : nodes)
            releaseOwner(*ref.command, *registry_);
        stream_.clear();
        throw;
    }

    // The recording is consumed whether or not it executes. Executor already
    // released what a failed replay held.
    try {
        TemporaryResources temporaries =
            executor_.execute(lastSteps_, nodes, *registry_, backend);
        stream_.clear();
        return temporaries;
    } catch (...) {
        stream_.clear();
        throw;
    }
}

void CommandExecutor::dumpLog() const {
    if (lastSteps_.empty() && lastNames_.empty()) {
        std::fprintf(stderr, "[vksched::graph] Nothing executed yet.\n");
        return;
    }

    dumpSteps(lastSteps_, lastNames_);

    const SchedulerStats& s = scheduler_.stats();
    const ExecutionStats& e = executor_.stats();
    std::fprintf(stderr,
                 "[vksched::graph] schedule: %u edges, %u rounds, %u barriers\n"
                 "[vksched::graph] execute: %u barrier batches (%u image, %u buffer), "
                 "%u descriptor sets built, %u image views created\n",
                 s.edgeCount, s.roundCount, s.barrierCount, e.barrierBatchCount,
                 e.imageBarrierCount, e.bufferBarrierCount, e.descriptorSetsBuilt,
                 e.imageViewsCreated);
}

} // namespace vksched::graph
