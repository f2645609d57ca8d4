#pragma once

// VMA handle forward declarations, matching VK_DEFINE_HANDLE in
// vk_mem_alloc.h, so public headers stay free of the VMA include.
struct VmaAllocator_T;
struct VmaAllocation_T;
using VmaAllocator = VmaAllocator_T*;
using VmaAllocation = VmaAllocation_T*;
