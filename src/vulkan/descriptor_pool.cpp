#include <vksched/descriptor_pool.hpp>

#include <cstdio>
#include <string>
#include <utility>

namespace vksched {

namespace {

bool poolExhausted(VkResult vr) {
    return vr == VK_ERROR_OUT_OF_POOL_MEMORY || vr == VK_ERROR_FRAGMENTED_POOL;
}

} // namespace

std::array<VkDescriptorPoolSize, 5> DescriptorPool::pageSizes(const DescriptorBudget& budget,
                                                              std::uint32_t maxSets) {
    // Vulkan rejects a zero descriptorCount.
    auto size = [maxSets](VkDescriptorType type, std::uint32_t perSet) {
        std::uint32_t n = perSet * maxSets;
        return VkDescriptorPoolSize{type, n == 0 ? 1u : n};
    };
    return {
        size(VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, budget.uniformBuffers),
        size(VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, budget.storageBuffers),
        size(VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE, budget.sampledImages),
        size(VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, budget.storageImages),
        size(VK_DESCRIPTOR_TYPE_SAMPLER, budget.samplers),
    };
}

Result<DescriptorPool> DescriptorPool::create(VkDevice device, std::uint32_t firstPageSets,
                                              DescriptorBudget budget) {
    if (device == VK_NULL_HANDLE)
        return Error{"create descriptor pool", 0, "device is VK_NULL_HANDLE"};
    if (firstPageSets == 0)
        return Error{"create descriptor pool", 0, "firstPageSets must be at least 1"};

    DescriptorPool out;
    out.device_ = device;
    out.budget_ = budget;
    out.firstPageSets_ = firstPageSets;

    Result<void> page = out.appendPage();
    if (!page.ok())
        return page.error();
    return out;
}

DescriptorPool::~DescriptorPool() { release(); }

DescriptorPool::DescriptorPool(DescriptorPool&& o) noexcept
    : device_(std::exchange(o.device_, VK_NULL_HANDLE)), budget_(o.budget_),
      firstPageSets_(o.firstPageSets_), pages_(std::move(o.pages_)),
      current_(std::exchange(o.current_, 0)),
      allocatedSets_(std::exchange(o.allocatedSets_, 0)) {}

DescriptorPool& DescriptorPool::operator=(DescriptorPool&& o) noexcept {
    if (this == &o)
        return *this;
    release();
    device_ = std::exchange(o.device_, VK_NULL_HANDLE);
    budget_ = o.budget_;
    firstPageSets_ = o.firstPageSets_;
    pages_ = std::move(o.pages_);
    current_ = std::exchange(o.current_, 0);
    allocatedSets_ = std::exchange(o.allocatedSets_, 0);
    return *this;
}

void DescriptorPool::release() {
    if (device_ == VK_NULL_HANDLE)
        return;
    for (const Page& page : pages_)
        vkDestroyDescriptorPool(device_, page.pool, nullptr);
    pages_.clear();
    current_ = 0;
    device_ = VK_NULL_HANDLE;
}

Result<void> DescriptorPool::appendPage() {
    std::uint32_t sets = pages_.empty() ? firstPageSets_ : pages_.back().maxSets * 2;
    auto sizes = pageSizes(budget_, sets);

    VkDescriptorPoolCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    ci.maxSets = sets;
    ci.poolSizeCount = static_cast<std::uint32_t>(sizes.size());
    ci.pPoolSizes = sizes.data();

    Page page;
    page.maxSets = sets;
    VkResult vr = vkCreateDescriptorPool(device_, &ci, nullptr, &page.pool);
    if (vr != VK_SUCCESS) {
        return Error{"create descriptor pool", static_cast<std::int32_t>(vr),
                     "page " + std::to_string(pages_.size()) + " of " + std::to_string(sets) +
                         " sets"};
    }
    pages_.push_back(page);
    return {};
}

Result<VkDescriptorSet> DescriptorPool::allocate(VkDescriptorSetLayout layout) {
    VkDescriptorSetAllocateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    info.descriptorSetCount = 1;
    info.pSetLayouts = &layout;

    VkResult vr = VK_ERROR_OUT_OF_POOL_MEMORY;
    for (;;) {
        bool fresh = false;
        if (current_ == pages_.size()) {
            Result<void> page = appendPage();
            if (!page.ok())
                return page.error();
            fresh = true;
#ifndef NDEBUG
            std::fprintf(stderr, "[vksched] descriptor pool grew to %zu pages\n", pages_.size());
#endif
        }

        info.descriptorPool = pages_[current_].pool;
        VkDescriptorSet set = VK_NULL_HANDLE;
        vr = vkAllocateDescriptorSets(device_, &info, &set);
        if (vr == VK_SUCCESS) {
            ++allocatedSets_;
            return set;
        }
        // An empty new page that cannot fit the layout means no page will.
        if (!poolExhausted(vr) || fresh)
            break;
        ++current_;
    }

    return Error{"allocate descriptor set", static_cast<std::int32_t>(vr),
                 "page " + std::to_string(current_) + " of " + std::to_string(pages_.size())};
}

void DescriptorPool::reset() {
    for (const Page& page : pages_)
        vkResetDescriptorPool(device_, page.pool, 0);
    current_ = 0;
    allocatedSets_ = 0;
}

} // namespace vksched
