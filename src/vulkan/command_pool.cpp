#include <vkfg/command_pool.hpp>
#include <vkfg/device.hpp>

namespace vkfg {

void CommandPool::destroy() {
    if (device_ == VK_NULL_HANDLE) return;

    // Destroying the pool frees its buffers.
    if (pool_ != VK_NULL_HANDLE)
        vkDestroyCommandPool(device_, pool_, nullptr);

    device_ = VK_NULL_HANDLE;
    pool_   = VK_NULL_HANDLE;
    buffers_.clear();
    cursor_ = 0;
}

CommandPool::~CommandPool() { destroy(); }

CommandPool::CommandPool(CommandPool&& o) noexcept
    : device_(o.device_), pool_(o.pool_),
      buffers_(std::move(o.buffers_)), cursor_(o.cursor_) {
    o.device_ = VK_NULL_HANDLE;
    o.pool_   = VK_NULL_HANDLE;
    o.cursor_ = 0;
}

CommandPool& CommandPool::operator=(CommandPool&& o) noexcept {
    if (this != &o) {
        destroy();
        device_  = o.device_;
        pool_    = o.pool_;
        buffers_ = std::move(o.buffers_);
        cursor_  = o.cursor_;
        o.device_ = VK_NULL_HANDLE;
        o.pool_   = VK_NULL_HANDLE;
        o.cursor_ = 0;
    }
    return *this;
}

Result<CommandPool> CommandPool::create(const Device& device,
                                         std::uint32_t queueFamily) {
    CommandPool cp;
    cp.device_ = device.vkDevice();

    VkCommandPoolCreateInfo poolCI{};
    poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolCI.flags            = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT |
                              VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    poolCI.queueFamilyIndex = queueFamily;

    VkResult vr = vkCreateCommandPool(cp.device_, &poolCI, nullptr, &cp.pool_);
    if (vr != VK_SUCCESS) {
        return Error{"create command pool", static_cast<std::int32_t>(vr),
                     "vkCreateCommandPool failed"};
    }

    return cp;
}

Result<VkCommandBuffer> CommandPool::next() {
    if (cursor_ < buffers_.size()) return buffers_[cursor_++];

    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool        = pool_;
    allocInfo.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkResult vr = vkAllocateCommandBuffers(device_, &allocInfo, &cmd);
    if (vr != VK_SUCCESS) {
        return Error{"allocate command buffer", static_cast<std::int32_t>(vr),
                     "vkAllocateCommandBuffers failed"};
    }

    buffers_.push_back(cmd);
    ++cursor_;
    return cmd;
}

Result<void> CommandPool::reset() {
    cursor_ = 0;
    if (pool_ == VK_NULL_HANDLE) return {};

    VkResult vr = vkResetCommandPool(device_, pool_, 0);
    if (vr != VK_SUCCESS) {
        return Error{"reset command pool", static_cast<std::int32_t>(vr),
                     "vkResetCommandPool failed"};
    }
    return {};
}

} // namespace vkfg
