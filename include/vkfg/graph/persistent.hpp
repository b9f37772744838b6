#pragma once

#include <vkfg/graph/deleter.hpp>
#include <vkfg/graph/physical.hpp>
#include <vkfg/graph/render_graph.hpp>
#include <vkfg/graph/resource.hpp>
#include <vkfg/graph/usage.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <utility>

namespace vkfg::graph {

// Two buffers that swap roles every frame: one frame writes what the next
// one reads. Owned by the caller and imported into each frame.
//
// Usage:
//   auto history = PersistentBuffer::create(graph.resourceContext(), desc).orThrow();
//   auto [prev, curr] = history.next(pass, usage::storageRead(ShaderStage::Compute),
//                                    usage::storageWrite(ShaderStage::Compute));
//
// next() imports both buffers and records the accesses as what the next
// frame starts from, so the frame it declares into must run.
//
// Thread safety: thread-confined.
class PersistentBuffer {
public:
    [[nodiscard]] static Result<PersistentBuffer> create(const ResourceContext& ctx,
                                                         const BufferCreateDesc& desc);

    ~PersistentBuffer() = default;
    PersistentBuffer(PersistentBuffer&& o) noexcept;
    PersistentBuffer& operator=(PersistentBuffer&& o) noexcept;
    PersistentBuffer(const PersistentBuffer&) = delete;
    PersistentBuffer& operator=(const PersistentBuffer&) = delete;

    // Flip and import both into pass. first = written by the previous
    // frame, second = to write now.
    [[nodiscard]] std::pair<BufferRes, BufferRes> next(PassBuilder& pass, const BufferUsage& read,
                                                       const BufferUsage& write);

    [[nodiscard]] const BufferCreateDesc& desc()    const { return desc_; }
    [[nodiscard]] std::uint32_t           current() const { return current_; }
    [[nodiscard]] bool                    live()    const { return live_; }

    // Hand both buffers to the deletion queue. Use while frames are in flight.
    void retire(Deleter& deleter);
    // Destroy both now. The caller guarantees the GPU is done with them.
    void destroy(const ResourceContext& ctx);

private:
    PersistentBuffer() = default;

    std::array<PhysicalBuffer, 2> buffers_{};
    std::array<AccessInfo, 2>     access_{}; // last access of each, from the previous next()
    BufferCreateDesc              desc_;
    std::uint32_t                 current_ = 0;
    bool                          live_    = false;
};

// Image version of PersistentBuffer. Both images are left in `layout` at the
// end of every frame, so the reader of the next frame finds them there.
// Call next() once per frame that imports the pair; that frame must run.
// Until the first next() both images are UNDEFINED.
//
// Thread safety: thread-confined.
class PersistentImage {
public:
    [[nodiscard]] static Result<PersistentImage> create(
        const ResourceContext& ctx, const ImageCreateDesc& desc,
        VkImageLayout layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

    ~PersistentImage() = default;
    PersistentImage(PersistentImage&& o) noexcept;
    PersistentImage& operator=(PersistentImage&& o) noexcept;
    PersistentImage(const PersistentImage&) = delete;
    PersistentImage& operator=(const PersistentImage&) = delete;

    [[nodiscard]] std::pair<ImageRes, ImageRes> next(PassBuilder& pass, const ImageUsage& read,
                                                     const ImageUsage& write);

    [[nodiscard]] const ImageCreateDesc& desc()    const { return desc_; }
    [[nodiscard]] std::uint32_t          current() const { return current_; }
    [[nodiscard]] bool                   live()    const { return live_; }
    [[nodiscard]] VkImageLayout          layout(std::uint32_t index) const { return layouts_[index]; }

    void retire(Deleter& deleter);
    void destroy(const ResourceContext& ctx);

private:
    PersistentImage() = default;

    [[nodiscard]] ExternalImage external(std::uint32_t index) const;

    std::array<PhysicalImage, 2> images_{};
    std::array<VkImageLayout, 2> layouts_{VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_UNDEFINED};
    ImageCreateDesc              desc_;
    VkImageLayout                finalLayout_ = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    std::uint32_t                current_     = 0;
    bool                         live_        = false;
};

} // namespace vkfg::graph
