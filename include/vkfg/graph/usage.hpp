#pragma once

#include <vkfg/graph/access.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace vkfg::graph {

// Shader stage a descriptor access happens in.
enum class ShaderStage : std::uint8_t {
    Vertex,
    Fragment,
    Graphics, // vertex + fragment
    Compute,
    RayTracing,
};

[[nodiscard]] VkPipelineStageFlags2 stageFlags(ShaderStage stage);

// How one pass uses a buffer. `usage` is OR'd into the create flags of the
// physical buffer backing a graph-created resource.
struct BufferUsage {
    VkPipelineStageFlags2 stages = VK_PIPELINE_STAGE_2_NONE;
    VkAccessFlags2        access = VK_ACCESS_2_NONE;
    VkBufferUsageFlags    usage  = 0;

    [[nodiscard]] bool isWrite() const { return isWriteAccess(access); }
    [[nodiscard]] AccessInfo info() const { return AccessInfo{stages, access, VK_IMAGE_LAYOUT_UNDEFINED}; }
};

// How one pass uses an image. A usage with write access but no read access
// discards previous contents, so the transition starts from UNDEFINED.
struct ImageUsage {
    VkPipelineStageFlags2 stages     = VK_PIPELINE_STAGE_2_NONE;
    VkAccessFlags2        access     = VK_ACCESS_2_NONE;
    VkImageLayout         layout     = VK_IMAGE_LAYOUT_UNDEFINED;
    VkImageUsageFlags     usage      = 0;
    SubresourceRange      range      = {};
    VkFormat              viewFormat = VK_FORMAT_UNDEFINED; // UNDEFINED = image format

    [[nodiscard]] bool isWrite()   const { return isWriteAccess(access); }
    [[nodiscard]] bool discards()  const { return isWriteAccess(access) && !isReadAccess(access); }
    [[nodiscard]] AccessInfo info() const { return AccessInfo{stages, access, layout}; }

    [[nodiscard]] ImageUsage subresource(SubresourceRange r) const {
        ImageUsage u = *this;
        u.range = r;
        return u;
    }

    [[nodiscard]] ImageUsage format(VkFormat f) const {
        ImageUsage u = *this;
        u.viewFormat = f;
        return u;
    }
};

// Common usages. Custom combinations can always be spelled out directly.
namespace usage {

// Buffers.
[[nodiscard]] BufferUsage uniformRead(ShaderStage stage);
[[nodiscard]] BufferUsage storageRead(ShaderStage stage);
[[nodiscard]] BufferUsage storageWrite(ShaderStage stage);
[[nodiscard]] BufferUsage storageReadWrite(ShaderStage stage);
[[nodiscard]] BufferUsage vertexRead();
[[nodiscard]] BufferUsage indexRead();
[[nodiscard]] BufferUsage indirectRead();
[[nodiscard]] BufferUsage transferSrc();
[[nodiscard]] BufferUsage transferDst();
[[nodiscard]] BufferUsage accelerationStructureInput();
[[nodiscard]] BufferUsage accelerationStructureStorage();

// Images.
[[nodiscard]] ImageUsage sampled(ShaderStage stage);
[[nodiscard]] ImageUsage storageImageRead(ShaderStage stage);
[[nodiscard]] ImageUsage storageImageWrite(ShaderStage stage);
[[nodiscard]] ImageUsage storageImageReadWrite(ShaderStage stage);
[[nodiscard]] ImageUsage colorAttachmentWrite();
[[nodiscard]] ImageUsage colorAttachmentReadWrite();
[[nodiscard]] ImageUsage depthAttachmentWrite();
[[nodiscard]] ImageUsage depthAttachmentRead();
[[nodiscard]] ImageUsage inputAttachment();
[[nodiscard]] ImageUsage transferSrcImage();
[[nodiscard]] ImageUsage transferDstImage();

} // namespace usage

} // namespace vkfg::graph
