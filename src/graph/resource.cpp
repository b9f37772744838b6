#include <vkfg/graph/resource.hpp>

#include <atomic>

namespace vkfg::graph {

ExternalImage swapchainImage(VkImage image, VkImageView view, VkFormat format,
                             VkExtent2D extent, VkSemaphore available,
                             VkSemaphore rendered) {
    ExternalImage ext;
    ext.handle.image  = image;
    ext.handle.view   = view;
    ext.handle.format = format;
    ext.handle.extent = VkExtent3D{extent.width, extent.height, 1};

    ext.desc.format = format;
    ext.desc.width  = extent.width;
    ext.desc.height = extent.height;

    // Acquired images have undefined contents.
    ext.initial = AccessInfo{VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, VK_ACCESS_2_NONE,
                             VK_IMAGE_LAYOUT_UNDEFINED};
    // Presentation engine reads after the semaphore; no further access masks.
    ext.final   = AccessInfo{VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_NONE,
                             VK_IMAGE_LAYOUT_PRESENT_SRC_KHR};

    if (available != VK_NULL_HANDLE) {
        ext.wait.push_back(
            {available, 0, VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT});
    }
    if (rendered != VK_NULL_HANDLE) {
        ext.signal.push_back({rendered, 0, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT});
    }
    return ext;
}

PersistId nextPersistId() {
    static std::atomic<std::uint64_t> counter{0};
    return PersistId{counter.fetch_add(1, std::memory_order_relaxed) + 1};
}

} // namespace vkfg::graph
