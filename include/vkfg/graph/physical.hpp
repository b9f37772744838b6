#pragma once

#include <vkfg/allocator.hpp>
#include <vkfg/error.hpp>
#include <vkfg/graph/resource.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>

namespace vkfg {
class Device;
} // namespace vkfg

namespace vkfg::graph {

// Everything needed to create or destroy a physical resource. Cheap to copy.
struct ResourceContext {
    VkDevice      device    = VK_NULL_HANDLE;
    VmaAllocator  allocator = nullptr;
    const Device* owner     = nullptr; // debug names, optional entry points

    // Queue families graph resources are shared between. More than one
    // means CONCURRENT sharing, so no ownership transfers are ever needed.
    std::array<std::uint32_t, 3> families{};
    std::uint32_t                familyCount = 0;

    PFN_vkDestroyAccelerationStructureKHR destroyAccelerationStructure = nullptr;

    [[nodiscard]] static ResourceContext from(const Device& device, const Allocator& allocator);
};

// Physical resources are plain handle bundles. Their owner (a cache, the
// deletion queue or a Persistent* wrapper) calls destroy() exactly once.
//
// Every type follows the same shape so caches can be generic over them:
//   Desc, Handle, Context, create(ctx, desc), handle(), destroy(ctx).

class PhysicalBuffer {
public:
    using Desc    = BufferCreateDesc;
    using Handle  = BufferHandle;
    using Context = ResourceContext;

    [[nodiscard]] static Result<PhysicalBuffer> create(const Context& ctx, const Desc& desc);

    [[nodiscard]] Handle        handle()     const { return handle_; }
    [[nodiscard]] VmaAllocation allocation() const { return allocation_; }

    void destroy(const Context& ctx);

private:
    Handle        handle_;
    VmaAllocation allocation_ = nullptr;
};

class PhysicalImage {
public:
    using Desc    = ImageCreateDesc;
    using Handle  = ImageHandle;
    using Context = ResourceContext;

    [[nodiscard]] static Result<PhysicalImage> create(const Context& ctx, const Desc& desc);

    [[nodiscard]] Handle        handle()     const { return handle_; }
    [[nodiscard]] VmaAllocation allocation() const { return allocation_; }

    void destroy(const Context& ctx);

private:
    Handle        handle_;
    VmaAllocation allocation_ = nullptr;
};

class PhysicalImageView {
public:
    using Desc    = ImageViewDesc;
    using Handle  = VkImageView;
    using Context = ResourceContext;

    [[nodiscard]] static Result<PhysicalImageView> create(const Context& ctx, const Desc& desc);

    [[nodiscard]] Handle handle() const { return view_; }

    void destroy(const Context& ctx);

private:
    VkImageView view_ = VK_NULL_HANDLE;
};

// View type matching an image's shape: 1D/2D/3D, array, or cube.
[[nodiscard]] VkImageViewType defaultViewType(const ImageDesc& desc);

// Whether an image with these usage flags can have a view at all.
[[nodiscard]] bool viewable(VkImageUsageFlags usage);

} // namespace vkfg::graph
