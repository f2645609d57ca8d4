#include <vksched/error.hpp>
#include <vksched/graph/scheduler.hpp>

#include <algorithm>
#include <cstdio>
#include <string>

namespace vksched::graph {

void Scheduler::buildGraph(std::span<const CommandRef> commands) {
    const auto count = static_cast<std::uint32_t>(commands.size());

    if (successors_.size() < count)
        successors_.resize(count);
    for (std::uint32_t i = 0; i < count; ++i)
        successors_[i].clear();
    remaining_.assign(count, 0);
    stamp_.assign(count, UINT32_MAX);

    // Keep the per-resource vectors' capacity, only drop their contents.
    for (auto& [id, list] : users_)
        list.clear();

    for (std::uint32_t i = 0; i < count; ++i) {
        for (const auto& access : commands[i].accesses) {
            auto& users = users_[access.id];
            for (std::uint32_t pred : users) {
                if (stamp_[pred] == i)
                    continue;
                stamp_[pred] = i;
                successors_[pred].push_back(i);
                ++remaining_[i];
                ++stats_.edgeCount;
            }
            users.push_back(i);
        }
    }
}

std::vector<Step> Scheduler::schedule(std::span<const CommandRef> commands, AccessTable& table) {
    const auto count = static_cast<std::uint32_t>(commands.size());
    stats_ = {};
    stats_.commandCount = count;

    buildGraph(commands);

    std::vector<Step> steps;
    steps.reserve(count * 2);

    round_.clear();
    nextRound_.clear();
    for (std::uint32_t i = 0; i < count; ++i) {
        if (remaining_[i] == 0)
            round_.push_back(i);
    }

    std::uint32_t scheduled = 0;
    while (!round_.empty()) {
        ++stats_.roundCount;
        std::sort(round_.begin(), round_.end());

        for (std::uint32_t node : round_) {
            for (std::uint32_t succ : successors_[node]) {
                if (--remaining_[succ] == 0)
                    nextRound_.push_back(succ);
            }

            for (const auto& access : commands[node].accesses) {
                AccessFlags current = table.access(access.id);
                if (current == access.access && isReadOnly(access.access))
                    continue;
                steps.push_back(Step::forBarrier(Barrier{access.id, current, access.access}));
                table.setAccess(access.id, access.access);
                ++stats_.barrierCount;
            }
        }

        for (std::uint32_t node : round_)
            steps.push_back(Step::forNode(node));
        scheduled += static_cast<std::uint32_t>(round_.size());

        round_.swap(nextRound_);
        nextRound_.clear();
    }

    if (scheduled != count) {
        fatal("schedule commands", "dependency cycle: " + std::to_string(count - scheduled) +
                                       " of " + std::to_string(count) +
                                       " commands never became ready");
    }

    return steps;
}

void dumpSteps(std::span<const Step> steps, std::span<const char* const> commandNames) {
    std::fprintf(stderr, "[vksched::graph] %zu steps:\n", steps.size());
    for (const auto& step : steps) {
        if (step.isNode()) {
            const char* name =
                step.node < commandNames.size() ? commandNames[step.node] : "(unknown)";
            std::fprintf(stderr, "  node    #%-4u %s\n", step.node, name);
            continue;
        }

        const Barrier& b = step.barrier;
        std::string src = formatAccess(b.srcAccess);
        std::string dst = formatAccess(b.dstAccess);
        if (b.resource.isBuffer()) {
            std::fprintf(stderr, "  barrier buffer  %-4u         %s -> %s\n", b.resource.index,
                         src.c_str(), dst.c_str());
        } else {
            std::fprintf(stderr, "  barrier texture %-4u mip %-3u %s -> %s\n", b.resource.index,
                         b.resource.mipLevel, src.c_str(), dst.c_str());
        }
    }
}

void dumpSteps(std::span<const Step> steps, std::span<const CommandRef> commands) {
    std::vector<const char*> names;
    names.reserve(commands.size());
    for (const auto& ref : commands)
        names.push_back(ref.command != nullptr ? commandName(*ref.command) : "(null)");
    dumpSteps(steps, names);
}

} // namespace vksched::graph
