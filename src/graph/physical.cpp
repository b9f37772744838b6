#include <vkfg/device.hpp>
#include <vkfg/graph/physical.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <string>

namespace vkfg::graph {

ResourceContext ResourceContext::from(const Device& device, const Allocator& allocator) {
    ResourceContext ctx;
    ctx.device    = device.vkDevice();
    ctx.allocator = allocator.vmaAllocator();
    ctx.owner     = &device;
    ctx.destroyAccelerationStructure = device.destroyAccelerationStructureFn();

    ctx.familyCount = device.distinctFamilyCount();
    for (std::uint32_t i = 0; i < ctx.familyCount; ++i) {
        ctx.families[i] = device.distinctFamilies()[i];
    }
    return ctx;
}

static void applySharing(const ResourceContext& ctx, VkSharingMode& mode,
                         std::uint32_t& count, const std::uint32_t*& indices) {
    if (ctx.familyCount > 1) {
        mode    = VK_SHARING_MODE_CONCURRENT;
        count   = ctx.familyCount;
        indices = ctx.families.data();
    } else {
        mode = VK_SHARING_MODE_EXCLUSIVE;
    }
}

Result<PhysicalBuffer> PhysicalBuffer::create(const Context& ctx, const Desc& desc) {
    if (desc.desc.size == 0) {
        return Error{"create graph buffer", 0, "buffer size must be non-zero"};
    }

    VkBufferCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    ci.size  = desc.desc.size;
    ci.usage = desc.usage;
    applySharing(ctx, ci.sharingMode, ci.queueFamilyIndexCount, ci.pQueueFamilyIndices);

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;
    switch (desc.desc.location) {
    case BufferLocation::GpuOnly:
        allocCI.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
        break;
    // Passes write and read `mapped` directly, so host memory must be
    // coherent: no flush or invalidate calls anywhere.
    case BufferLocation::Upload:
        allocCI.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                        VMA_ALLOCATION_CREATE_MAPPED_BIT;
        allocCI.requiredFlags = VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        break;
    case BufferLocation::Readback:
        allocCI.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT |
                        VMA_ALLOCATION_CREATE_MAPPED_BIT;
        allocCI.requiredFlags = VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        break;
    }

    PhysicalBuffer b;
    VmaAllocationInfo info{};
    VkResult vr = vmaCreateBuffer(ctx.allocator, &ci, &allocCI, &b.handle_.buffer,
                                  &b.allocation_, &info);
    if (vr != VK_SUCCESS) {
        return Error{"allocate graph buffer", static_cast<std::int32_t>(vr),
                     "vmaCreateBuffer failed for " + std::to_string(desc.desc.size) + " bytes"};
    }

    b.handle_.size   = desc.desc.size;
    b.handle_.mapped = info.pMappedData;

    if (desc.usage & VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT) {
        VkBufferDeviceAddressInfo addrInfo{};
        addrInfo.sType  = VK_STRUCTURE_TYPE_BUFFER_DEVICE_ADDRESS_INFO;
        addrInfo.buffer = b.handle_.buffer;
        b.handle_.address = vkGetBufferDeviceAddress(ctx.device, &addrInfo);
    }

    return b;
}

void PhysicalBuffer::destroy(const Context& ctx) {
    if (handle_.buffer == VK_NULL_HANDLE) return;
    vmaDestroyBuffer(ctx.allocator, handle_.buffer, allocation_);
    handle_     = {};
    allocation_ = nullptr;
}

VkImageViewType defaultViewType(const ImageDesc& desc) {
    switch (desc.type) {
    case VK_IMAGE_TYPE_1D:
        return desc.arrayLayers > 1 ? VK_IMAGE_VIEW_TYPE_1D_ARRAY : VK_IMAGE_VIEW_TYPE_1D;
    case VK_IMAGE_TYPE_3D:
        return VK_IMAGE_VIEW_TYPE_3D;
    default:
        break;
    }
    if ((desc.flags & VK_IMAGE_CREATE_CUBE_COMPATIBLE_BIT) && desc.arrayLayers % 6 == 0) {
        return desc.arrayLayers == 6 ? VK_IMAGE_VIEW_TYPE_CUBE : VK_IMAGE_VIEW_TYPE_CUBE_ARRAY;
    }
    return desc.arrayLayers > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D;
}

bool viewable(VkImageUsageFlags usage) {
    constexpr VkImageUsageFlags viewBits =
        VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_STORAGE_BIT |
        VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT |
        VK_IMAGE_USAGE_INPUT_ATTACHMENT_BIT;
    return (usage & viewBits) != 0;
}

Result<PhysicalImage> PhysicalImage::create(const Context& ctx, const Desc& desc) {
    const ImageDesc& d = desc.desc;
    if (d.width == 0 || d.height == 0 || d.format == VK_FORMAT_UNDEFINED) {
        return Error{"create graph image", 0, "image needs a non-zero extent and a format"};
    }

    VkImageCreateInfo ci{};
    ci.sType         = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    ci.flags         = d.flags;
    ci.imageType     = d.type;
    ci.format        = d.format;
    ci.extent        = d.extent();
    ci.mipLevels     = d.mipLevels;
    ci.arrayLayers   = d.arrayLayers;
    ci.samples       = d.samples;
    ci.tiling        = VK_IMAGE_TILING_OPTIMAL;
    ci.usage         = desc.usage;
    ci.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    applySharing(ctx, ci.sharingMode, ci.queueFamilyIndexCount, ci.pQueueFamilyIndices);

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;

    PhysicalImage img;
    VkResult vr = vmaCreateImage(ctx.allocator, &ci, &allocCI, &img.handle_.image,
                                 &img.allocation_, nullptr);
    if (vr != VK_SUCCESS) {
        return Error{"allocate graph image", static_cast<std::int32_t>(vr),
                     std::string("vmaCreateImage failed for ") + formatName(d.format) + " " +
                         std::to_string(d.width) + "x" + std::to_string(d.height)};
    }

    img.handle_.format      = d.format;
    img.handle_.extent      = d.extent();
    img.handle_.mipLevels   = d.mipLevels;
    img.handle_.arrayLayers = d.arrayLayers;

    if (viewable(desc.usage)) {
        VkImageViewCreateInfo viewCI{};
        viewCI.sType            = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewCI.image            = img.handle_.image;
        viewCI.viewType         = defaultViewType(d);
        viewCI.format           = d.format;
        viewCI.subresourceRange = d.fullRange().vk(aspectFromFormat(d.format));

        vr = vkCreateImageView(ctx.device, &viewCI, nullptr, &img.handle_.view);
        if (vr != VK_SUCCESS) {
            vmaDestroyImage(ctx.allocator, img.handle_.image, img.allocation_);
            return Error{"create graph image view", static_cast<std::int32_t>(vr),
                         "vkCreateImageView failed for full-resource view"};
        }
    }

    return img;
}

void PhysicalImage::destroy(const Context& ctx) {
    if (handle_.image == VK_NULL_HANDLE) return;
    if (handle_.view != VK_NULL_HANDLE) vkDestroyImageView(ctx.device, handle_.view, nullptr);
    vmaDestroyImage(ctx.allocator, handle_.image, allocation_);
    handle_     = {};
    allocation_ = nullptr;
}

Result<PhysicalImageView> PhysicalImageView::create(const Context& ctx, const Desc& desc) {
    VkImageViewCreateInfo ci{};
    ci.sType            = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    ci.image            = desc.image;
    ci.viewType         = desc.type;
    ci.format           = desc.format;
    ci.subresourceRange = desc.range.vk(desc.aspect);

    PhysicalImageView v;
    VkResult vr = vkCreateImageView(ctx.device, &ci, nullptr, &v.view_);
    if (vr != VK_SUCCESS) {
        return Error{"create image view", static_cast<std::int32_t>(vr),
                     "vkCreateImageView failed"};
    }
    return v;
}

void PhysicalImageView::destroy(const Context& ctx) {
    if (view_ == VK_NULL_HANDLE) return;
    vkDestroyImageView(ctx.device, view_, nullptr);
    view_ = VK_NULL_HANDLE;
}

} // namespace vkfg::graph
