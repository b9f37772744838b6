#pragma once

#include <vkfg/error.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

// Forward-declare VMA handles to keep vk_mem_alloc.h out of user code.
struct VmaAllocator_T;
using VmaAllocator = VmaAllocator_T*;
struct VmaAllocation_T;
using VmaAllocation = VmaAllocation_T*;

namespace vkfg {

class Device;

// Per-heap memory budget snapshot.
// usage  -- bytes currently allocated from this heap.
// budget -- bytes the OS estimates are available to this process.
struct HeapBudget {
    std::uint64_t     usage    = 0;
    std::uint64_t     budget   = 0;
    std::uint64_t     heapSize = 0;
    VkMemoryHeapFlags flags    = 0;
};

// Owns the VMA allocator every graph resource is created from.
//
// Thread safety: thread-confined.
class Allocator {
  public:
    // Buffer device address is always enabled: every Vulkan 1.3 driver has it.
    [[nodiscard]] static Result<Allocator> create(const Device& device,
                                                  bool memoryBudget = false);

    ~Allocator();
    Allocator(Allocator&&) noexcept;
    Allocator& operator=(Allocator&&) noexcept;
    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    [[nodiscard]] VmaAllocator native()       const { return allocator_; }
    [[nodiscard]] VmaAllocator vmaAllocator() const { return native(); }
    [[nodiscard]] VkDevice     vkDevice()     const { return device_; }

    // One entry per physical-device heap. Without VK_EXT_memory_budget the
    // values come from VMA statistics.
    [[nodiscard]] std::vector<HeapBudget> queryBudget() const;

    // Bytes VMA has allocated across all heaps.
    [[nodiscard]] std::uint64_t totalUsage() const;

  private:
    Allocator() = default;

    VmaAllocator allocator_ = nullptr;
    VkDevice     device_    = VK_NULL_HANDLE;
};

} // namespace vkfg
