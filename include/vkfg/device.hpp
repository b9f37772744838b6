#pragma once

#include <vkfg/error.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace vkfg {

enum class QueueType : std::uint8_t {
    Graphics = 0,
    Compute  = 1,
    Transfer = 2,
};

inline constexpr std::uint32_t kQueueTypeCount = 3;

[[nodiscard]] constexpr std::uint32_t queueIndex(QueueType q) {
    return static_cast<std::uint32_t>(q);
}

[[nodiscard]] const char* queueTypeName(QueueType q);

// Queue family indices the caller created the device with.
// UINT32_MAX = no dedicated queue of that kind.
struct QueueFamilies {
    std::uint32_t graphics = UINT32_MAX;
    std::uint32_t compute  = UINT32_MAX;
    std::uint32_t transfer = UINT32_MAX;

    [[nodiscard]] bool hasDedicatedCompute() const {
        return compute != UINT32_MAX && compute != graphics;
    }

    [[nodiscard]] bool hasDedicatedTransfer() const {
        return transfer != UINT32_MAX && transfer != graphics && transfer != compute;
    }
};

// Everything the caller already created. The core never creates or
// destroys instances, devices or queues.
struct DeviceHandles {
    VkInstance       instance       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice         device         = VK_NULL_HANDLE;
    QueueFamilies    families;
    VkQueue          graphicsQueue  = VK_NULL_HANDLE;
    VkQueue          computeQueue   = VK_NULL_HANDLE; // VK_NULL_HANDLE = use graphics
    VkQueue          transferQueue  = VK_NULL_HANDLE; // VK_NULL_HANDLE = use compute/graphics
    bool             debugUtils     = false;          // VK_EXT_debug_utils enabled on the instance
};

// Maps every logical QueueType to the stream that actually executes it.
// Logical queues sharing one VkQueue collapse onto a single stream, so the
// compiler never emits semaphores between work that is already ordered.
struct QueueTopology {
    std::array<QueueType, kQueueTypeCount>     stream{QueueType::Graphics,
                                                      QueueType::Compute,
                                                      QueueType::Transfer};
    std::array<std::uint32_t, kQueueTypeCount> family{0, 0, 0};

    [[nodiscard]] QueueType resolve(QueueType q) const { return stream[queueIndex(q)]; }
    [[nodiscard]] std::uint32_t familyOf(QueueType q) const { return family[queueIndex(q)]; }

    // All three logical queues on their own stream.
    [[nodiscard]] static QueueTopology distinct();

    // Everything on the graphics stream.
    [[nodiscard]] static QueueTopology single();
};

// Non-owning view of a caller-created device with the extension entry
// points the graph uses loaded up front.
//
// Thread safety: immutable after construction. VkQueue handles returned by
// accessors follow Vulkan queue externally-synchronized rules.
class Device {
public:
    [[nodiscard]] static Result<Device> adopt(const DeviceHandles& handles);

    ~Device() = default;
    Device(Device&&) noexcept = default;
    Device& operator=(Device&&) noexcept = default;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] VkDevice         native()           const { return device_; }
    [[nodiscard]] VkDevice         vkDevice()         const { return native(); }
    [[nodiscard]] VkInstance       vkInstance()       const { return instance_; }
    [[nodiscard]] VkPhysicalDevice vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] QueueFamilies    queueFamilies()    const { return families_; }
    [[nodiscard]] const QueueTopology& topology()     const { return topology_; }

    // Queue and family that execute work submitted as q.
    [[nodiscard]] VkQueue       queue(QueueType q)       const { return queues_[queueIndex(topology_.resolve(q))]; }
    [[nodiscard]] std::uint32_t queueFamily(QueueType q) const { return topology_.familyOf(q); }

    // Distinct family indices across active streams, for CONCURRENT sharing.
    [[nodiscard]] std::uint32_t        distinctFamilyCount() const { return distinctCount_; }
    [[nodiscard]] const std::uint32_t* distinctFamilies()    const { return distinct_.data(); }

    [[nodiscard]] bool hasDebugUtils() const { return pfnSetName_ != nullptr; }
    [[nodiscard]] PFN_vkSetDebugUtilsObjectNameEXT setObjectNameFn() const { return pfnSetName_; }
    [[nodiscard]] PFN_vkCmdBeginDebugUtilsLabelEXT beginLabelFn()    const { return pfnBeginLabel_; }
    [[nodiscard]] PFN_vkCmdEndDebugUtilsLabelEXT   endLabelFn()      const { return pfnEndLabel_; }
    [[nodiscard]] PFN_vkDestroyAccelerationStructureKHR destroyAccelerationStructureFn() const {
        return pfnDestroyAS_;
    }

    // Called once per VK_ERROR_DEVICE_LOST seen by submit or wait paths.
    void onDeviceLost(std::function<void()> callback) { lostCallback_ = std::move(callback); }
    void reportDeviceLost() const;

    // VK_EXT_device_fault description, empty when unavailable.
    [[nodiscard]] std::string queryDeviceFault() const;

    [[nodiscard]] Result<void> waitIdle() const;

private:
    Device() = default;

    VkInstance       instance_       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice         device_         = VK_NULL_HANDLE;
    QueueFamilies    families_;
    QueueTopology    topology_;
    std::array<VkQueue, kQueueTypeCount>       queues_{};
    std::array<std::uint32_t, kQueueTypeCount> distinct_{};
    std::uint32_t                              distinctCount_ = 0;

    PFN_vkSetDebugUtilsObjectNameEXT      pfnSetName_    = nullptr;
    PFN_vkCmdBeginDebugUtilsLabelEXT      pfnBeginLabel_ = nullptr;
    PFN_vkCmdEndDebugUtilsLabelEXT        pfnEndLabel_   = nullptr;
    PFN_vkDestroyAccelerationStructureKHR pfnDestroyAS_  = nullptr;
    PFN_vkGetDeviceFaultInfoEXT           pfnFault_      = nullptr;
    std::function<void()>                 lostCallback_;
};

} // namespace vkfg
