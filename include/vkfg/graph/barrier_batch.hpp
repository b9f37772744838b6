#pragma once

#include <vkfg/graph/access.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vkfg::graph {

// Barriers recorded as one vkCmdPipelineBarrier2 at a pass boundary.
//
// Dependencies without a layout change or ownership transfer collapse into
// one global VkMemoryBarrier2 per (srcStages, dstStages) pair with access
// masks OR'd, which is what drivers handle best. Image barriers are kept
// only for layout transitions and queue family transfers.
struct BarrierBatch {
    std::vector<VkImageMemoryBarrier2>  imageBarriers;
    std::vector<VkBufferMemoryBarrier2> bufferBarriers;
    std::vector<VkMemoryBarrier2>       memoryBarriers;

    // Build VkDependencyInfo pointing into the vectors above.
    // BarrierBatch must outlive the returned struct.
    [[nodiscard]] VkDependencyInfo dependencyInfo() const;

    [[nodiscard]] bool empty() const {
        return imageBarriers.empty() && bufferBarriers.empty() && memoryBarriers.empty();
    }

    [[nodiscard]] std::uint32_t count() const {
        return static_cast<std::uint32_t>(imageBarriers.size() + bufferBarriers.size() +
                                          memoryBarriers.size());
    }

    void clear();

    // Execution + memory dependency. An empty dst stage mask becomes
    // ALL_COMMANDS.
    void addMemory(const AccessInfo& src, const AccessInfo& dst);

    // Image dependency. Falls back to addMemory() when the layout is
    // unchanged and no ownership moves. A second transition of an image
    // already in the batch is a programmer error.
    void addImage(VkImage image, const VkImageSubresourceRange& range, const AccessInfo& src,
                  const AccessInfo& dst,
                  std::uint32_t srcFamily = VK_QUEUE_FAMILY_IGNORED,
                  std::uint32_t dstFamily = VK_QUEUE_FAMILY_IGNORED);

    // Buffer dependency. Only kept as a buffer barrier for ownership
    // transfers; otherwise global.
    void addBuffer(VkBuffer buffer, const AccessInfo& src, const AccessInfo& dst,
                   std::uint32_t srcFamily = VK_QUEUE_FAMILY_IGNORED,
                   std::uint32_t dstFamily = VK_QUEUE_FAMILY_IGNORED);

    // Merge another batch in, combining global barriers by stage pair.
    void append(const BarrierBatch& other);
};

} // namespace vkfg::graph
