#pragma once
#include <vulkan/vulkan.h>

#include <vkfg/device.hpp>

namespace vkfg::detail {

// Check if vr is VK_ERROR_DEVICE_LOST and hand it to the device's lost callback.
// Returns true if the device was lost (caller should propagate the error).
inline bool checkDeviceLost(const Device* device, VkResult vr) {
    if (vr == VK_ERROR_DEVICE_LOST) {
        if (device) device->reportDeviceLost();
        return true;
    }
    return false;
}

} // namespace vkfg::detail
