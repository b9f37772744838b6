#include <vkfg/error.hpp>
#include <vkfg/graph/barrier_batch.hpp>

#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <string>

namespace vkfg::graph {

static VkPipelineStageFlags2 dstStagesOrAll(VkPipelineStageFlags2 stages) {
    return stages == VK_PIPELINE_STAGE_2_NONE ? VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT : stages;
}

static bool familiesTransfer(std::uint32_t srcFamily, std::uint32_t dstFamily) {
    return srcFamily != dstFamily && srcFamily != VK_QUEUE_FAMILY_IGNORED &&
           dstFamily != VK_QUEUE_FAMILY_IGNORED;
}

VkDependencyInfo BarrierBatch::dependencyInfo() const {
    VkDependencyInfo info{};
    info.sType                    = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    info.imageMemoryBarrierCount  = static_cast<std::uint32_t>(imageBarriers.size());
    info.pImageMemoryBarriers     = imageBarriers.data();
    info.bufferMemoryBarrierCount = static_cast<std::uint32_t>(bufferBarriers.size());
    info.pBufferMemoryBarriers    = bufferBarriers.data();
    info.memoryBarrierCount       = static_cast<std::uint32_t>(memoryBarriers.size());
    info.pMemoryBarriers          = memoryBarriers.data();
    return info;
}

void BarrierBatch::clear() {
    imageBarriers.clear();
    bufferBarriers.clear();
    memoryBarriers.clear();
}

void BarrierBatch::addMemory(const AccessInfo& src, const AccessInfo& dst) {
    VkPipelineStageFlags2 dstStages = dstStagesOrAll(dst.stages);

    for (auto& b : memoryBarriers) {
        if (b.srcStageMask == src.stages && b.dstStageMask == dstStages) {
            b.srcAccessMask |= src.access;
            b.dstAccessMask |= dst.access;
            return;
        }
    }

    VkMemoryBarrier2 barrier{};
    barrier.sType         = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
    barrier.srcStageMask  = src.stages;
    barrier.srcAccessMask = src.access;
    barrier.dstStageMask  = dstStages;
    barrier.dstAccessMask = dst.access;
    memoryBarriers.push_back(barrier);
}

void BarrierBatch::addImage(VkImage image, const VkImageSubresourceRange& range,
                            const AccessInfo& src, const AccessInfo& dst,
                            std::uint32_t srcFamily, std::uint32_t dstFamily) {
    bool transfer = familiesTransfer(srcFamily, dstFamily);
    if (src.layout == dst.layout && !transfer) {
        addMemory(src, dst);
        return;
    }

    for (const auto& b : imageBarriers) {
        if (b.image == image) {
            std::uint64_t handle{};
            std::memcpy(&handle, &image, sizeof(image));
            char buf[32];
            std::snprintf(buf, sizeof(buf), "0x%" PRIx64, handle);
            fatal(Error{"record barrier", 0,
                        std::string("image ") + buf +
                            " transitioned twice at one pass boundary"});
        }
    }

    VkImageMemoryBarrier2 barrier{};
    barrier.sType               = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
    barrier.srcStageMask        = src.stages;
    barrier.srcAccessMask       = src.access;
    barrier.dstStageMask        = dstStagesOrAll(dst.stages);
    barrier.dstAccessMask       = dst.access;
    barrier.oldLayout           = src.layout;
    barrier.newLayout           = dst.layout;
    barrier.srcQueueFamilyIndex = transfer ? srcFamily : VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = transfer ? dstFamily : VK_QUEUE_FAMILY_IGNORED;
    barrier.image               = image;
    barrier.subresourceRange    = range;
    imageBarriers.push_back(barrier);
}

void BarrierBatch::addBuffer(VkBuffer buffer, const AccessInfo& src, const AccessInfo& dst,
                             std::uint32_t srcFamily, std::uint32_t dstFamily) {
    if (!familiesTransfer(srcFamily, dstFamily)) {
        addMemory(src, dst);
        return;
    }

    VkBufferMemoryBarrier2 barrier{};
    barrier.sType               = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2;
    barrier.srcStageMask        = src.stages;
    barrier.srcAccessMask       = src.access;
    barrier.dstStageMask        = dstStagesOrAll(dst.stages);
    barrier.dstAccessMask       = dst.access;
    barrier.srcQueueFamilyIndex = srcFamily;
    barrier.dstQueueFamilyIndex = dstFamily;
    barrier.buffer              = buffer;
    barrier.offset              = 0;
    barrier.size                = VK_WHOLE_SIZE;
    bufferBarriers.push_back(barrier);
}

void BarrierBatch::append(const BarrierBatch& other) {
    for (const auto& m : other.memoryBarriers) {
        addMemory(AccessInfo{m.srcStageMask, m.srcAccessMask, VK_IMAGE_LAYOUT_UNDEFINED},
                  AccessInfo{m.dstStageMask, m.dstAccessMask, VK_IMAGE_LAYOUT_UNDEFINED});
    }
    imageBarriers.insert(imageBarriers.end(), other.imageBarriers.begin(),
                         other.imageBarriers.end());
    bufferBarriers.insert(bufferBarriers.end(), other.bufferBarriers.begin(),
                          other.bufferBarriers.end());
}

} // namespace vkfg::graph
