#pragma once

#include <vksched/graph/backend.hpp>
#include <vksched/graph/command_stream.hpp>
#include <vksched/graph/commands.hpp>
#include <vksched/graph/executor.hpp>
#include <vksched/graph/resource_registry.hpp>
#include <vksched/graph/scheduler.hpp>
#include <vksched/graph/temporary_resources.hpp>

#include <utility>
#include <vector>

namespace vksched::graph {

// Per-frame driver: record commands, then execute() schedules them against
// the registry, replays the schedule on a backend and clears the stream for
// the next frame. Keep the returned TemporaryResources with the frame's
// fence and hand them to destroy() once it signalled.
//
// Usage:
//   CommandExecutor exec(registry);
//   exec.record(WriteBuffer{ubo, 0, bytes});
//   exec.record(RenderPass{...});
//   auto held = exec.execute(backend);
//   // submit, wait for the frame's fence ...
//   exec.destroy(held);
//   for (auto ev : registry.deletionQueue().drain()) { ... registry.reclaim(ev); }
//
// Thread safety: thread-confined.
class CommandExecutor {
public:
    explicit CommandExecutor(ResourceRegistry& registry) : registry_(&registry) {}

    void record(Command command) { stream_.push(*registry_, std::move(command)); }

    [[nodiscard]] TemporaryResources execute(Backend& backend);

    // Release what a finished frame held.
    void destroy(TemporaryResources& temporaries) { temporaries.destroy(*registry_); }

    [[nodiscard]] CommandStream& stream() { return stream_; }
    [[nodiscard]] const CommandStream& stream() const { return stream_; }

    // Steps of the most recent execute().
    [[nodiscard]] const std::vector<Step>& lastSteps() const { return lastSteps_; }
    [[nodiscard]] const SchedulerStats& schedulerStats() const { return scheduler_.stats(); }
    [[nodiscard]] const ExecutionStats& stats() const { return executor_.stats(); }

    // Print the last schedule and its counters to stderr.
    void dumpLog() const;

private:
    ResourceRegistry* registry_;
    CommandStream stream_;
    Scheduler scheduler_;
    Executor executor_;
    std::vector<Step> lastSteps_;
    std::vector<const char*> lastNames_;
};

} // namespace vksched::graph
