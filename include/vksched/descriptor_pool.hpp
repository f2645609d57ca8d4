#pragma once

#include <vksched/error.hpp>
#include <vksched/result.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vksched {

// Descriptors reserved per set, by type. A set may use fewer; texture arrays
// draw several SAMPLED_IMAGE descriptors from one set.
struct DescriptorBudget {
    std::uint32_t uniformBuffers = 2;
    std::uint32_t storageBuffers = 2;
    std::uint32_t sampledImages = 8;
    std::uint32_t storageImages = 1;
    std::uint32_t samplers = 2;
};

// Backs the descriptor sets the executor materializes with a list of
// VkDescriptorPool pages. Allocation fills the current page, moves on to the
// next one when it is exhausted, and creates a page twice the size of the last
// one only when none is left. Sets are never freed individually: reset()
// recycles every page at once, after which allocation starts again from the
// first page.
//
// Thread safety: thread-confined.
class DescriptorPool {
public:
    [[nodiscard]] static Result<DescriptorPool> create(VkDevice device,
                                                       std::uint32_t firstPageSets = 64,
                                                       DescriptorBudget budget = {});

    ~DescriptorPool();
    DescriptorPool(DescriptorPool&&) noexcept;
    DescriptorPool& operator=(DescriptorPool&&) noexcept;
    DescriptorPool(const DescriptorPool&) = delete;
    DescriptorPool& operator=(const DescriptorPool&) = delete;

    [[nodiscard]] Result<VkDescriptorSet> allocate(VkDescriptorSetLayout layout);

    // Only once no submitted command buffer uses a set from this pool.
    // Follow with ResourceRegistry::resetDescriptorSets().
    void reset();

    // Pool sizes of a page holding maxSets sets.
    [[nodiscard]] static std::array<VkDescriptorPoolSize, 5> pageSizes(const DescriptorBudget& budget,
                                                                       std::uint32_t maxSets);

    [[nodiscard]] VkDevice vkDevice() const { return device_; }
    [[nodiscard]] std::uint32_t allocatedSetCount() const { return allocatedSets_; }
    [[nodiscard]] std::uint32_t pageCount() const {
        return static_cast<std::uint32_t>(pages_.size());
    }

private:
    struct Page {
        VkDescriptorPool pool = VK_NULL_HANDLE;
        std::uint32_t maxSets = 0;
    };

    DescriptorPool() = default;
    void release();
    Result<void> appendPage();

    VkDevice device_ = VK_NULL_HANDLE;
    DescriptorBudget budget_;
    std::uint32_t firstPageSets_ = 64;
    std::vector<Page> pages_;
    std::size_t current_ = 0;
    std::uint32_t allocatedSets_ = 0;
};

} // namespace vksched
