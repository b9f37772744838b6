#include <vkfg/graph/access.hpp>

#include <algorithm>
#include <cinttypes>
#include <cstdio>

namespace vkfg::graph {

namespace {

constexpr VkAccessFlags2 kWriteBits =
    VK_ACCESS_2_SHADER_WRITE_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT |
    VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT | VK_ACCESS_2_TRANSFER_WRITE_BIT |
    VK_ACCESS_2_HOST_WRITE_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT |
    VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT | VK_ACCESS_2_ACCELERATION_STRUCTURE_WRITE_BIT_KHR;

std::uint32_t saturatingEnd(std::uint32_t base, std::uint32_t count) {
    if (count == VK_REMAINING_MIP_LEVELS) return UINT32_MAX;
    return base + count;
}

std::uint32_t countFrom(std::uint32_t base, std::uint32_t end) {
    if (end == UINT32_MAX) return VK_REMAINING_MIP_LEVELS;
    return end - base;
}

} // namespace

std::uint32_t SubresourceRange::mipEnd() const {
    return saturatingEnd(baseMipLevel, levelCount);
}

std::uint32_t SubresourceRange::layerEnd() const {
    return saturatingEnd(baseArrayLayer, layerCount);
}

bool SubresourceRange::contains(const SubresourceRange& other) const {
    return other.baseMipLevel >= baseMipLevel && other.mipEnd() <= mipEnd() &&
           other.baseArrayLayer >= baseArrayLayer && other.layerEnd() <= layerEnd();
}

bool SubresourceRange::overlaps(const SubresourceRange& other) const {
    if (other.baseMipLevel >= mipEnd() || baseMipLevel >= other.mipEnd())
        return false;
    if (other.baseArrayLayer >= layerEnd() || baseArrayLayer >= other.layerEnd())
        return false;
    return true;
}

SubresourceRange SubresourceRange::merge(const SubresourceRange& other) const {
    SubresourceRange out;
    out.baseMipLevel   = std::min(baseMipLevel, other.baseMipLevel);
    out.baseArrayLayer = std::min(baseArrayLayer, other.baseArrayLayer);
    out.levelCount     = countFrom(out.baseMipLevel, std::max(mipEnd(), other.mipEnd()));
    out.layerCount     = countFrom(out.baseArrayLayer, std::max(layerEnd(), other.layerEnd()));
    return out;
}

SubresourceRange SubresourceRange::clamp(std::uint32_t mipLevels,
                                         std::uint32_t arrayLayers) const {
    SubresourceRange out = *this;
    out.baseMipLevel   = std::min(baseMipLevel, mipLevels ? mipLevels - 1 : 0);
    out.baseArrayLayer = std::min(baseArrayLayer, arrayLayers ? arrayLayers - 1 : 0);
    out.levelCount     = std::min(mipEnd(), mipLevels) - out.baseMipLevel;
    out.layerCount     = std::min(layerEnd(), arrayLayers) - out.baseArrayLayer;
    return out;
}

bool isWriteAccess(VkAccessFlags2 access) {
    return (access & kWriteBits) != 0;
}

bool isReadAccess(VkAccessFlags2 access) {
    return (access & ~kWriteBits) != 0;
}

VkImageAspectFlags aspectFromFormat(VkFormat format) {
    switch (format) {
    case VK_FORMAT_D16_UNORM:
    case VK_FORMAT_D32_SFLOAT:
    case VK_FORMAT_X8_D24_UNORM_PACK32:
        return VK_IMAGE_ASPECT_DEPTH_BIT;

    case VK_FORMAT_D16_UNORM_S8_UINT:
    case VK_FORMAT_D24_UNORM_S8_UINT:
    case VK_FORMAT_D32_SFLOAT_S8_UINT:
        return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;

    case VK_FORMAT_S8_UINT:
        return VK_IMAGE_ASPECT_STENCIL_BIT;

    default:
        return VK_IMAGE_ASPECT_COLOR_BIT;
    }
}

const char* layoutName(VkImageLayout layout) {
    switch (layout) {
    case VK_IMAGE_LAYOUT_UNDEFINED:                        return "UNDEFINED";
    case VK_IMAGE_LAYOUT_GENERAL:                          return "GENERAL";
    case VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL:         return "COLOR_ATTACHMENT";
    case VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL: return "DEPTH_STENCIL_ATTACHMENT";
    case VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL:  return "DEPTH_STENCIL_READ_ONLY";
    case VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL:         return "SHADER_READ_ONLY";
    case VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL:             return "TRANSFER_SRC";
    case VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL:             return "TRANSFER_DST";
    case VK_IMAGE_LAYOUT_PRESENT_SRC_KHR:                  return "PRESENT_SRC";
    default:                                               return "(other)";
    }
}

const char* formatName(VkFormat format) {
    switch (format) {
    case VK_FORMAT_R8G8B8A8_UNORM:       return "R8G8B8A8_UNORM";
    case VK_FORMAT_R8G8B8A8_SRGB:        return "R8G8B8A8_SRGB";
    case VK_FORMAT_B8G8R8A8_UNORM:       return "B8G8R8A8_UNORM";
    case VK_FORMAT_B8G8R8A8_SRGB:        return "B8G8R8A8_SRGB";
    case VK_FORMAT_R16G16B16A16_SFLOAT:  return "R16G16B16A16_SFLOAT";
    case VK_FORMAT_R32G32B32A32_SFLOAT:  return "R32G32B32A32_SFLOAT";
    case VK_FORMAT_R32_UINT:             return "R32_UINT";
    case VK_FORMAT_D32_SFLOAT:           return "D32_SFLOAT";
    case VK_FORMAT_D24_UNORM_S8_UINT:    return "D24_UNORM_S8_UINT";
    case VK_FORMAT_D32_SFLOAT_S8_UINT:   return "D32_SFLOAT_S8_UINT";
    case VK_FORMAT_D16_UNORM:            return "D16_UNORM";
    default:                             return "(other format)";
    }
}

void appendStageBits(std::string& out, VkPipelineStageFlags2 flags) {
    if (flags == VK_PIPELINE_STAGE_2_NONE) {
        out += "(none)";
        return;
    }

    bool first = true;
    auto add = [&](VkPipelineStageFlags2 bit, const char* name) {
        if (flags & bit) {
            if (!first) out += "|";
            out += name;
            first = false;
        }
    };

    add(VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT, "TOP_OF_PIPE");
    add(VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT, "DRAW_INDIRECT");
    add(VK_PIPELINE_STAGE_2_VERTEX_INPUT_BIT, "VERTEX_INPUT");
    add(VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT, "INDEX_INPUT");
    add(VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT, "VERTEX_SHADER");
    add(VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT, "FRAGMENT_SHADER");
    add(VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT, "EARLY_FRAG");
    add(VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT, "LATE_FRAG");
    add(VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, "COLOR_ATTACHMENT_OUTPUT");
    add(VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, "COMPUTE_SHADER");
    add(VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT, "ALL_TRANSFER");
    add(VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT, "BOTTOM_OF_PIPE");
    add(VK_PIPELINE_STAGE_2_ALL_GRAPHICS_BIT, "ALL_GRAPHICS");
    add(VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, "ALL_COMMANDS");
    add(VK_PIPELINE_STAGE_2_RAY_TRACING_SHADER_BIT_KHR, "RT_SHADER");
    add(VK_PIPELINE_STAGE_2_ACCELERATION_STRUCTURE_BUILD_BIT_KHR, "AS_BUILD");

    if (first) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "0x%" PRIx64, static_cast<std::uint64_t>(flags));
        out += buf;
    }
}

void appendAccessBits(std::string& out, VkAccessFlags2 flags) {
    if (flags == VK_ACCESS_2_NONE) {
        out += "(none)";
        return;
    }

    bool first = true;
    auto add = [&](VkAccessFlags2 bit, const char* name) {
        if (flags & bit) {
            if (!first) out += "|";
            out += name;
            first = false;
        }
    };

    add(VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT, "INDIRECT_READ");
    add(VK_ACCESS_2_INDEX_READ_BIT, "INDEX_READ");
    add(VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT, "VERTEX_READ");
    add(VK_ACCESS_2_UNIFORM_READ_BIT, "UNIFORM_READ");
    add(VK_ACCESS_2_INPUT_ATTACHMENT_READ_BIT, "INPUT_ATTACHMENT_READ");
    add(VK_ACCESS_2_SHADER_READ_BIT, "SHADER_READ");
    add(VK_ACCESS_2_SHADER_WRITE_BIT, "SHADER_WRITE");
    add(VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT, "COLOR_ATTACHMENT_READ");
    add(VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT, "COLOR_ATTACHMENT_WRITE");
    add(VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT, "DEPTH_STENCIL_READ");
    add(VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT, "DEPTH_STENCIL_WRITE");
    add(VK_ACCESS_2_TRANSFER_READ_BIT, "TRANSFER_READ");
    add(VK_ACCESS_2_TRANSFER_WRITE_BIT, "TRANSFER_WRITE");
    add(VK_ACCESS_2_HOST_READ_BIT, "HOST_READ");
    add(VK_ACCESS_2_HOST_WRITE_BIT, "HOST_WRITE");
    add(VK_ACCESS_2_MEMORY_READ_BIT, "MEMORY_READ");
    add(VK_ACCESS_2_MEMORY_WRITE_BIT, "MEMORY_WRITE");
    add(VK_ACCESS_2_SHADER_SAMPLED_READ_BIT, "SHADER_SAMPLED_READ");
    add(VK_ACCESS_2_SHADER_STORAGE_READ_BIT, "SHADER_STORAGE_READ");
    add(VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT, "SHADER_STORAGE_WRITE");
    add(VK_ACCESS_2_ACCELERATION_STRUCTURE_READ_BIT_KHR, "AS_READ");
    add(VK_ACCESS_2_ACCELERATION_STRUCTURE_WRITE_BIT_KHR, "AS_WRITE");

    if (first) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "0x%" PRIx64, static_cast<std::uint64_t>(flags));
        out += buf;
    }
}

} // namespace vkfg::graph
