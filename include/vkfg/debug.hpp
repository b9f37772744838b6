#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string_view>

namespace vkfg {

class Device;

// Tag Vulkan objects with debug names visible in validation layers and
// GPU debuggers. No-op when the device was adopted without debug utils.

void debugName(const Device& device, VkObjectType type, std::uint64_t handle,
               std::string_view name);

void debugName(const Device& device, VkImage image, std::string_view name);
void debugName(const Device& device, VkImageView view, std::string_view name);
void debugName(const Device& device, VkBuffer buffer, std::string_view name);
void debugName(const Device& device, VkCommandBuffer cmd, std::string_view name);
void debugName(const Device& device, VkSemaphore semaphore, std::string_view name);

// Command buffer label scope. No-op without debug utils.
void beginLabel(const Device& device, VkCommandBuffer cmd, std::string_view name);
void endLabel(const Device& device, VkCommandBuffer cmd);

} // namespace vkfg
