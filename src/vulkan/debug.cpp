#include <vkfg/debug.hpp>
#include <vkfg/device.hpp>

#include <string>

namespace vkfg {

void debugName(const Device& device, VkObjectType type, std::uint64_t handle,
               std::string_view name) {
    auto pfn = device.setObjectNameFn();
    if (!pfn) return;

    std::string nameStr(name);

    VkDebugUtilsObjectNameInfoEXT info{};
    info.sType        = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
    info.objectType   = type;
    info.objectHandle = handle;
    info.pObjectName  = nameStr.c_str();

    // Naming is best effort; a failure only loses a debugger label.
    (void)pfn(device.vkDevice(), &info);
}

void debugName(const Device& device, VkImage image, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_IMAGE, reinterpret_cast<std::uint64_t>(image), name);
}

void debugName(const Device& device, VkImageView view, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_IMAGE_VIEW, reinterpret_cast<std::uint64_t>(view), name);
}

void debugName(const Device& device, VkBuffer buffer, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_BUFFER, reinterpret_cast<std::uint64_t>(buffer), name);
}

void debugName(const Device& device, VkCommandBuffer cmd, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_COMMAND_BUFFER, reinterpret_cast<std::uint64_t>(cmd), name);
}

void debugName(const Device& device, VkSemaphore semaphore, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_SEMAPHORE, reinterpret_cast<std::uint64_t>(semaphore), name);
}

void beginLabel(const Device& device, VkCommandBuffer cmd, std::string_view name) {
    auto pfn = device.beginLabelFn();
    if (!pfn) return;

    std::string nameStr(name);

    VkDebugUtilsLabelEXT label{};
    label.sType      = VK_STRUCTURE_TYPE_DEBUG_UTILS_LABEL_EXT;
    label.pLabelName = nameStr.c_str();
    pfn(cmd, &label);
}

void endLabel(const Device& device, VkCommandBuffer cmd) {
    auto pfn = device.endLabelFn();
    if (pfn) pfn(cmd);
}

} // namespace vkfg
