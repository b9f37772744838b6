#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>

namespace vkfg::graph {

// Pipeline stages, access mask and (for images) layout of one use of a
// resource. Also used for the state a resource is left in.
struct AccessInfo {
    VkPipelineStageFlags2 stages = VK_PIPELINE_STAGE_2_NONE;
    VkAccessFlags2        access = VK_ACCESS_2_NONE;
    VkImageLayout         layout = VK_IMAGE_LAYOUT_UNDEFINED;

    [[nodiscard]] bool operator==(const AccessInfo&) const = default;

    // Stages and access OR together. Layouts must already agree.
    AccessInfo& operator|=(const AccessInfo& o) {
        stages |= o.stages;
        access |= o.access;
        return *this;
    }
};

// A contiguous range of mip levels and array layers. The default covers
// every subresource of whatever image it is applied to.
struct SubresourceRange {
    std::uint32_t baseMipLevel   = 0;
    std::uint32_t levelCount     = VK_REMAINING_MIP_LEVELS;
    std::uint32_t baseArrayLayer = 0;
    std::uint32_t layerCount     = VK_REMAINING_ARRAY_LAYERS;

    [[nodiscard]] bool contains(const SubresourceRange& other) const;
    [[nodiscard]] bool overlaps(const SubresourceRange& other) const;
    [[nodiscard]] bool operator==(const SubresourceRange&) const = default;

    // End indices (exclusive). VK_REMAINING_* counts saturate.
    [[nodiscard]] std::uint32_t mipEnd()   const;
    [[nodiscard]] std::uint32_t layerEnd() const;

    // Smallest range covering both.
    [[nodiscard]] SubresourceRange merge(const SubresourceRange& other) const;

    // Replaces VK_REMAINING_* with concrete counts for an image.
    [[nodiscard]] SubresourceRange clamp(std::uint32_t mipLevels, std::uint32_t arrayLayers) const;

    [[nodiscard]] VkImageSubresourceRange vk(VkImageAspectFlags aspect) const {
        return VkImageSubresourceRange{aspect, baseMipLevel, levelCount, baseArrayLayer,
                                       layerCount};
    }
};

// Check if an access mask contains any write operations.
[[nodiscard]] bool isWriteAccess(VkAccessFlags2 access);

// Check if an access mask contains any read operations.
[[nodiscard]] bool isReadAccess(VkAccessFlags2 access);

// Depth formats -> DEPTH_BIT, depth+stencil -> DEPTH|STENCIL, else COLOR.
[[nodiscard]] VkImageAspectFlags aspectFromFormat(VkFormat format);

// Human-readable names for logs.
[[nodiscard]] const char* layoutName(VkImageLayout layout);
[[nodiscard]] const char* formatName(VkFormat format);
void appendStageBits(std::string& out, VkPipelineStageFlags2 flags);
void appendAccessBits(std::string& out, VkAccessFlags2 flags);

} // namespace vkfg::graph
