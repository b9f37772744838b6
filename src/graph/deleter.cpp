#include <vkfg/graph/deleter.hpp>

#include <cstdio>

namespace vkfg::graph {

void RetiredAccelerationStructure::destroy(const ResourceContext& ctx) {
    if (handle != VK_NULL_HANDLE) {
        if (ctx.destroyAccelerationStructure) {
            ctx.destroyAccelerationStructure(ctx.device, handle, nullptr);
        } else {
            // Leaks the handle; the buffer is still freed below.
            std::fprintf(stderr, "[vkfg::graph] acceleration structure retired without "
                                 "VK_KHR_acceleration_structure loaded\n");
        }
        handle = VK_NULL_HANDLE;
    }
    buffer.destroy(ctx);
}

void Retired::destroy(const ResourceContext& ctx) {
    std::visit([&](auto& item) { item.destroy(ctx); }, item_);
}

} // namespace vkfg::graph
