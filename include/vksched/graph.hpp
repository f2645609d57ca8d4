#pragma once

// Scheduler umbrella header: registry, command recording, scheduling and
// execution. Include <vksched/graph/vulkan_backend.hpp> separately to record
// into a real VkCommandBuffer.

#include <vksched/graph/access.hpp>
#include <vksched/graph/backend.hpp>
#include <vksched/graph/barrier_batch.hpp>
#include <vksched/graph/command_executor.hpp>
#include <vksched/graph/command_stream.hpp>
#include <vksched/graph/commands.hpp>
#include <vksched/graph/executor.hpp>
#include <vksched/graph/resource_id.hpp>
#include <vksched/graph/resource_registry.hpp>
#include <vksched/graph/scheduler.hpp>
#include <vksched/graph/temporary_resources.hpp>
