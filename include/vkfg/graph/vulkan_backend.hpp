#pragma once

#include <vkfg/command_pool.hpp>
#include <vkfg/config.hpp>
#include <vkfg/device.hpp>
#include <vkfg/error.hpp>
#include <vkfg/graph/submitter.hpp>
#include <vkfg/result.hpp>
#include <vkfg/timeline.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace vkfg::graph {

// SubmitBackend over the device's real queues: one timeline semaphore per
// stream and one command pool per (frame slot, stream).
//
// Thread safety: thread-confined. Owns queue submission for every stream.
class VulkanBackend final : public SubmitBackend {
public:
    [[nodiscard]] static Result<VulkanBackend> create(
        const Device& device, std::uint32_t framesInFlight = kFramesInFlight,
        bool labels = true);

    ~VulkanBackend() override = default;
    VulkanBackend(VulkanBackend&&) noexcept = default;
    VulkanBackend& operator=(VulkanBackend&&) noexcept = default;
    VulkanBackend(const VulkanBackend&) = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;

    // Switch to a slot's pools and recycle their buffers. Only after the
    // slot's previous frame completed (FrameRing::beginFrame).
    [[nodiscard]] Result<void> beginSlot(std::uint32_t slot);

    [[nodiscard]] Result<VkCommandBuffer> beginCommands(QueueType stream) override;
    void pipelineBarrier(VkCommandBuffer cmd, const BarrierBatch& batch) override;
    void beginLabel(VkCommandBuffer cmd, std::string_view name) override;
    void endLabel(VkCommandBuffer cmd) override;
    [[nodiscard]] Result<SyncPoint> submit(const Submission& submission) override;
    [[nodiscard]] Result<void> waitFor(const SyncPoint& point) override;

    [[nodiscard]] const QueueTimeline& timeline(QueueType stream) const {
        return timelines_[queueIndex(stream)];
    }

    [[nodiscard]] std::uint32_t slot() const { return slot_; }

    // VKFG_BLOCKING_WAIT: waits for the last value signaled on every stream.
    [[nodiscard]] Result<void> waitAll() const;

private:
    VulkanBackend() = default;

    [[nodiscard]] CommandPool& pool(QueueType stream) {
        return pools_[slot_ * kQueueTypeCount + queueIndex(stream)];
    }

    const Device*              device_ = nullptr;
    std::vector<QueueTimeline> timelines_; // indexed by stream
    std::vector<CommandPool>   pools_;     // slot * kQueueTypeCount + stream
    std::uint32_t              slot_   = 0;
    bool                       labels_ = true;
};

} // namespace vkfg::graph
