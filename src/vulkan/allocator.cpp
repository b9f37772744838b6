#include <vkfg/allocator.hpp>
#include <vkfg/device.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstdint>

namespace vkfg {

Allocator::~Allocator() {
    if (allocator_ != nullptr) vmaDestroyAllocator(allocator_);
}

Allocator::Allocator(Allocator&& o) noexcept
    : allocator_(o.allocator_), device_(o.device_) {
    o.allocator_ = nullptr;
    o.device_    = VK_NULL_HANDLE;
}

Allocator& Allocator::operator=(Allocator&& o) noexcept {
    if (this != &o) {
        if (allocator_ != nullptr) vmaDestroyAllocator(allocator_);
        allocator_   = o.allocator_;
        device_      = o.device_;
        o.allocator_ = nullptr;
        o.device_    = VK_NULL_HANDLE;
    }
    return *this;
}

Result<Allocator> Allocator::create(const Device& device, bool memoryBudget) {
    VmaAllocatorCreateInfo ci{};
    ci.instance         = device.vkInstance();
    ci.physicalDevice   = device.vkPhysicalDevice();
    ci.device           = device.vkDevice();
    ci.vulkanApiVersion = VK_API_VERSION_1_3;
    ci.flags            = VMA_ALLOCATOR_CREATE_BUFFER_DEVICE_ADDRESS_BIT;
    if (memoryBudget) ci.flags |= VMA_ALLOCATOR_CREATE_EXT_MEMORY_BUDGET_BIT;

    if (ci.instance == VK_NULL_HANDLE) {
        return Error{"create allocator", 0, "device was adopted without a VkInstance"};
    }

    Allocator a;
    a.device_ = device.vkDevice();

    VkResult vr = vmaCreateAllocator(&ci, &a.allocator_);
    if (vr != VK_SUCCESS) {
        return Error{"create allocator", static_cast<std::int32_t>(vr),
                     "vmaCreateAllocator failed"};
    }

    return a;
}

std::vector<HeapBudget> Allocator::queryBudget() const {
    VmaAllocatorInfo info{};
    vmaGetAllocatorInfo(allocator_, &info);

    VkPhysicalDeviceMemoryProperties memProps{};
    vkGetPhysicalDeviceMemoryProperties(info.physicalDevice, &memProps);

    std::uint32_t heapCount = memProps.memoryHeapCount;
    std::vector<VmaBudget> vmaBudgets(heapCount);
    vmaGetHeapBudgets(allocator_, vmaBudgets.data());

    std::vector<HeapBudget> out(heapCount);
    for (std::uint32_t i = 0; i < heapCount; ++i) {
        out[i].usage    = vmaBudgets[i].usage;
        out[i].budget   = vmaBudgets[i].budget;
        out[i].heapSize = memProps.memoryHeaps[i].size;
        out[i].flags    = memProps.memoryHeaps[i].flags;
    }
    return out;
}

std::uint64_t Allocator::totalUsage() const {
    VmaTotalStatistics stats{};
    vmaCalculateStatistics(allocator_, &stats);
    return stats.total.statistics.allocationBytes;
}

} // namespace vkfg
