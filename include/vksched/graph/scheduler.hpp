#pragma once

#include <vksched/graph/access.hpp>
#include <vksched/graph/command_stream.hpp>
#include <vksched/graph/resource_id.hpp>
#include <vksched/graph/resource_registry.hpp>

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace vksched::graph {

// Make the previous access to a resource visible/ordered before the next one.
struct Barrier {
    ResourceId resource;
    AccessFlags srcAccess = Access::None;
    AccessFlags dstAccess = Access::None;

    [[nodiscard]] bool operator==(const Barrier&) const = default;
};

// One element of a schedule: run a command, or emit a barrier.
struct Step {
    enum class Kind : std::uint8_t {
        Node,
        Barrier,
    };

    Kind kind = Kind::Node;
    std::uint32_t node = UINT32_MAX; // command index, Node steps only
    graph::Barrier barrier;          // Barrier steps only

    [[nodiscard]] static Step forNode(std::uint32_t index) {
        Step s;
        s.kind = Kind::Node;
        s.node = index;
        return s;
    }

    [[nodiscard]] static Step forBarrier(const graph::Barrier& b) {
        Step s;
        s.kind = Kind::Barrier;
        s.barrier = b;
        return s;
    }

    [[nodiscard]] bool isNode() const { return kind == Kind::Node; }
    [[nodiscard]] bool isBarrier() const { return kind == Kind::Barrier; }

    [[nodiscard]] bool operator==(const Step&) const = default;
};

struct SchedulerStats {
    std::uint32_t commandCount = 0;
    std::uint32_t edgeCount = 0;
    std::uint32_t roundCount = 0;
    std::uint32_t barrierCount = 0;
};

// Orders recorded commands and inserts the barriers between them.
//
// Every earlier command touching the same ResourceId (texture mips are
// separate resources) is a predecessor, read-after-read included. Commands
// are then released in topological rounds, lowest index first within a
// round. A round's barriers come as one contiguous batch before its nodes.
//
// A barrier is emitted whenever the required access differs from the
// table's current access, or when the access contains a write. Only an
// identical read-only access is skipped. The table is updated in emission
// order, so after schedule() it holds each resource's final access.
//
// Scratch vectors are kept between calls so a per-frame scheduler stops
// allocating once warmed up.
//
// Thread safety: thread-confined.
class Scheduler {
public:
    [[nodiscard]] std::vector<Step> schedule(std::span<const CommandRef> commands,
                                             AccessTable& table);

    [[nodiscard]] const SchedulerStats& stats() const { return stats_; }

private:
    void buildGraph(std::span<const CommandRef> commands);

    std::vector<std::vector<std::uint32_t>> successors_;
    std::vector<std::uint32_t> remaining_;
    std::vector<std::uint32_t> stamp_;
    std::unordered_map<ResourceId, std::vector<std::uint32_t>> users_;
    std::vector<std::uint32_t> round_;
    std::vector<std::uint32_t> nextRound_;
    SchedulerStats stats_;
};

// Print a schedule to stderr, one step per line.
void dumpSteps(std::span<const Step> steps, std::span<const char* const> commandNames);
void dumpSteps(std::span<const Step> steps, std::span<const CommandRef> commands);

} // namespace vksched::graph
