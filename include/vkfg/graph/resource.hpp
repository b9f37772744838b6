#pragma once

#include <vkfg/graph/access.hpp>
#include <vkfg/graph/hash.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace vkfg::graph {

// Where a buffer's memory lives.
enum class BufferLocation : std::uint8_t {
    GpuOnly,  // device local
    Upload,   // host visible, persistently mapped, CPU writes
    Readback, // host visible, persistently mapped, CPU reads
};

struct BufferDesc {
    VkDeviceSize   size     = 0;
    BufferLocation location = BufferLocation::GpuOnly;

    [[nodiscard]] static BufferDesc gpu(VkDeviceSize size)      { return {size, BufferLocation::GpuOnly}; }
    [[nodiscard]] static BufferDesc upload(VkDeviceSize size)   { return {size, BufferLocation::Upload}; }
    [[nodiscard]] static BufferDesc readback(VkDeviceSize size) { return {size, BufferLocation::Readback}; }

    [[nodiscard]] bool operator==(const BufferDesc&) const = default;
};

struct ImageDesc {
    VkImageType           type        = VK_IMAGE_TYPE_2D;
    VkFormat              format      = VK_FORMAT_UNDEFINED;
    std::uint32_t         width       = 0;
    std::uint32_t         height      = 0;
    std::uint32_t         depth       = 1;
    std::uint32_t         mipLevels   = 1;
    std::uint32_t         arrayLayers = 1;
    VkSampleCountFlagBits samples     = VK_SAMPLE_COUNT_1_BIT;
    VkImageCreateFlags    flags       = 0;

    [[nodiscard]] VkExtent3D extent() const { return VkExtent3D{width, height, depth}; }
    [[nodiscard]] SubresourceRange fullRange() const { return {0, mipLevels, 0, arrayLayers}; }

    [[nodiscard]] bool operator==(const ImageDesc&) const = default;
};

// Cache keys: the user-facing desc plus the OR of every usage in the frame.
struct BufferCreateDesc {
    BufferDesc         desc;
    VkBufferUsageFlags usage = 0;

    [[nodiscard]] bool operator==(const BufferCreateDesc&) const = default;
};

struct ImageCreateDesc {
    ImageDesc         desc;
    VkImageUsageFlags usage = 0;

    [[nodiscard]] bool operator==(const ImageCreateDesc&) const = default;
};

struct ImageViewDesc {
    VkImage            image  = VK_NULL_HANDLE;
    VkImageViewType    type   = VK_IMAGE_VIEW_TYPE_2D;
    VkFormat           format = VK_FORMAT_UNDEFINED;
    VkImageAspectFlags aspect = VK_IMAGE_ASPECT_COLOR_BIT;
    SubresourceRange   range  = {0, 1, 0, 1};

    [[nodiscard]] bool operator==(const ImageViewDesc&) const = default;
};

// What a pass sees when it resolves a resource. Plain data, non-owning.
struct BufferHandle {
    VkBuffer        buffer  = VK_NULL_HANDLE;
    VkDeviceAddress address = 0;       // 0 when the buffer has no device address
    void*           mapped  = nullptr; // non-null for Upload and Readback
    VkDeviceSize    size    = 0;
};

struct ImageHandle {
    VkImage       image       = VK_NULL_HANDLE;
    VkImageView   view        = VK_NULL_HANDLE; // full-resource view, may be null
    VkFormat      format      = VK_FORMAT_UNDEFINED;
    VkExtent3D    extent      = {0, 0, 0};
    std::uint32_t mipLevels   = 1;
    std::uint32_t arrayLayers = 1;
};

// Typed reference to a virtual resource of one frame. generation is the
// frame it was declared in; using it in any later frame is a programmer error.
template <typename T>
struct Res {
    std::uint32_t index      = UINT32_MAX;
    std::uint64_t generation = 0;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const Res&) const = default;
};

using BufferRes = Res<BufferHandle>;
using ImageRes  = Res<ImageHandle>;

// CPU-side data produced by one pass and read by later passes.
template <typename T>
struct SetId {
    std::uint32_t index      = UINT32_MAX;
    std::uint64_t generation = 0;
};

template <typename T>
struct GetId {
    std::uint32_t index      = UINT32_MAX;
    std::uint64_t generation = 0;
};

// A semaphore owned by the caller. value == 0 means binary.
struct ExternalSemaphore {
    VkSemaphore           semaphore = VK_NULL_HANDLE;
    std::uint64_t         value     = 0;
    VkPipelineStageFlags2 stages    = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
};

// A caller-owned buffer the frame reads or writes. `initial` is the access
// that last touched it before this frame; `final` (if stages are set) is
// the access that will touch it after. Semaphores are waited before first
// use and signaled after last use.
struct ExternalBuffer {
    BufferHandle                   handle;
    AccessInfo                     initial;
    AccessInfo                     final;
    std::vector<ExternalSemaphore> wait;
    std::vector<ExternalSemaphore> signal;
    std::uint32_t                  ownerFamily = VK_QUEUE_FAMILY_IGNORED;
    bool                           concurrent  = true; // false = EXCLUSIVE, needs ownership transfer
};

// Same as ExternalBuffer for images. initial.layout is the layout the image
// is in; final.layout (if not UNDEFINED) is the layout it must be left in.
struct ExternalImage {
    ImageHandle                    handle;
    ImageDesc                      desc;
    AccessInfo                     initial;
    AccessInfo                     final;
    std::vector<ExternalSemaphore> wait;
    std::vector<ExternalSemaphore> signal;
    std::uint32_t                  ownerFamily = VK_QUEUE_FAMILY_IGNORED;
    bool                           concurrent  = true;
};

// Presentation hand-off: wait `available` before the first color write,
// signal `rendered` once the image is in PRESENT_SRC.
[[nodiscard]] ExternalImage swapchainImage(VkImage image, VkImageView view, VkFormat format,
                                           VkExtent2D extent, VkSemaphore available,
                                           VkSemaphore rendered);

// Key of a graph-owned resource that survives across frames.
struct PersistId {
    std::uint64_t value = 0;

    [[nodiscard]] bool valid() const { return value != 0; }
    [[nodiscard]] bool operator==(const PersistId&) const = default;
};

// Process-unique, never 0. Thread-safe.
[[nodiscard]] PersistId nextPersistId();

} // namespace vkfg::graph

template <>
struct std::hash<vkfg::graph::BufferCreateDesc> {
    std::size_t operator()(const vkfg::graph::BufferCreateDesc& d) const noexcept {
        using namespace vkfg::graph;
        std::uint64_t h = hashField(kFnvOffset, d.desc.size);
        h = hashField(h, static_cast<std::uint8_t>(d.desc.location));
        h = hashField(h, d.usage);
        return static_cast<std::size_t>(h);
    }
};

template <>
struct std::hash<vkfg::graph::ImageCreateDesc> {
    std::size_t operator()(const vkfg::graph::ImageCreateDesc& d) const noexcept {
        using namespace vkfg::graph;
        std::uint64_t h = hashField(kFnvOffset, d.desc.type);
        h = hashField(h, d.desc.format);
        h = hashField(h, d.desc.width);
        h = hashField(h, d.desc.height);
        h = hashField(h, d.desc.depth);
        h = hashField(h, d.desc.mipLevels);
        h = hashField(h, d.desc.arrayLayers);
        h = hashField(h, d.desc.samples);
        h = hashField(h, d.desc.flags);
        h = hashField(h, d.usage);
        return static_cast<std::size_t>(h);
    }
};

template <>
struct std::hash<vkfg::graph::ImageViewDesc> {
    std::size_t operator()(const vkfg::graph::ImageViewDesc& d) const noexcept {
        using namespace vkfg::graph;
        std::uint64_t h = hashField(kFnvOffset, d.image);
        h = hashField(h, d.type);
        h = hashField(h, d.format);
        h = hashField(h, d.aspect);
        h = hashField(h, d.range.baseMipLevel);
        h = hashField(h, d.range.levelCount);
        h = hashField(h, d.range.baseArrayLayer);
        h = hashField(h, d.range.layerCount);
        return static_cast<std::size_t>(h);
    }
};

template <>
struct std::hash<vkfg::graph::PersistId> {
    std::size_t operator()(const vkfg::graph::PersistId& id) const noexcept {
        return static_cast<std::size_t>(vkfg::graph::hashField(vkfg::graph::kFnvOffset, id.value));
    }
};
