#pragma once

#include <vkfg/error.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vkfg {

class Device;

// RAII wrapper for VkCommandPool. Created with TRANSIENT + RESET bits.
// Buffers handed out by next() are kept and reused after reset(), so a
// steady-state frame allocates nothing.
//
// Thread safety: thread-confined. Each frame slot and stream owns one pool.
class CommandPool {
public:
    [[nodiscard]] static Result<CommandPool> create(
        const Device& device, std::uint32_t queueFamily);

    ~CommandPool();
    CommandPool(CommandPool&&) noexcept;
    CommandPool& operator=(CommandPool&&) noexcept;
    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

    [[nodiscard]] VkCommandPool native()        const { return pool_; }
    [[nodiscard]] VkCommandPool vkCommandPool() const { return native(); }

    // A primary buffer not yet handed out since the last reset(); allocated
    // on demand.
    [[nodiscard]] Result<VkCommandBuffer> next();

    // Recycles every buffer. Only valid once the GPU finished with them.
    [[nodiscard]] Result<void> reset();

    [[nodiscard]] std::uint32_t allocated() const { return static_cast<std::uint32_t>(buffers_.size()); }
    [[nodiscard]] std::uint32_t inUse()     const { return cursor_; }

private:
    CommandPool() = default;
    void destroy();

    VkDevice                     device_ = VK_NULL_HANDLE;
    VkCommandPool                pool_   = VK_NULL_HANDLE;
    std::vector<VkCommandBuffer> buffers_;
    std::uint32_t                cursor_ = 0;
};

} // namespace vkfg
