#include <vkfg/debug.hpp>
#include <vkfg/graph/vulkan_backend.hpp>
#include "../vulkan/device_lost.hpp"

#include <string>
#include <utility>

namespace vkfg::graph {

Result<VulkanBackend> VulkanBackend::create(const Device& device, std::uint32_t framesInFlight,
                                            bool labels) {
    if (framesInFlight == 0) {
        return Error{"create submit backend", 0, "framesInFlight must be at least 1"};
    }

    VulkanBackend b;
    b.device_ = &device;
    b.labels_ = labels && device.hasDebugUtils();

    b.timelines_.reserve(kQueueTypeCount);
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        auto stream   = static_cast<QueueType>(q);
        auto timeline = QueueTimeline::create(device, stream);
        if (!timeline.ok()) return timeline.error();
        debugName(device, timeline->vkSemaphore(),
                  std::string("vkfg timeline ") + queueTypeName(stream));
        b.timelines_.push_back(std::move(timeline).value());
    }

    b.pools_.reserve(static_cast<std::size_t>(framesInFlight) * kQueueTypeCount);
    for (std::uint32_t slot = 0; slot < framesInFlight; ++slot) {
        for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
            auto pool = CommandPool::create(device, device.queueFamily(static_cast<QueueType>(q)));
            if (!pool.ok()) return pool.error();
            b.pools_.push_back(std::move(pool).value());
        }
    }

    return b;
}

Result<void> VulkanBackend::beginSlot(std::uint32_t slot) {
    slot_ = slot;
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        if (auto r = pool(static_cast<QueueType>(q)).reset(); !r.ok()) return r;
    }
    return {};
}

Result<VkCommandBuffer> VulkanBackend::beginCommands(QueueType stream) {
    auto cmd = pool(stream).next();
    if (!cmd.ok()) return cmd.error();

    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

    VkResult vr = vkBeginCommandBuffer(cmd.value(), &beginInfo);
    if (vr != VK_SUCCESS) {
        return Error{"begin command buffer", static_cast<std::int32_t>(vr),
                     std::string("vkBeginCommandBuffer failed on ") + queueTypeName(stream)};
    }
    return cmd;
}

void VulkanBackend::pipelineBarrier(VkCommandBuffer cmd, const BarrierBatch& batch) {
    if (batch.empty()) return;
    VkDependencyInfo dep = batch.dependencyInfo();
    vkCmdPipelineBarrier2(cmd, &dep);
}

void VulkanBackend::beginLabel(VkCommandBuffer cmd, std::string_view name) {
    if (labels_) vkfg::beginLabel(*device_, cmd, name);
}

void VulkanBackend::endLabel(VkCommandBuffer cmd) {
    if (labels_) vkfg::endLabel(*device_, cmd);
}

static VkSemaphoreSubmitInfo semaphoreInfo(VkSemaphore semaphore, std::uint64_t value,
                                           VkPipelineStageFlags2 stages) {
    VkSemaphoreSubmitInfo info{};
    info.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    info.semaphore = semaphore;
    info.value     = value;
    info.stageMask = stages;
    return info;
}

Result<SyncPoint> VulkanBackend::submit(const Submission& s) {
    if (s.commands != VK_NULL_HANDLE) {
        VkResult vr = vkEndCommandBuffer(s.commands);
        if (vr != VK_SUCCESS) {
            return Error{"end command buffer", static_cast<std::int32_t>(vr),
                         std::string("vkEndCommandBuffer failed on ") + queueTypeName(s.stream)};
        }
    }

    std::vector<VkSemaphoreSubmitInfo> waits;
    waits.reserve(s.waits.size() + s.externalWaits.size());
    for (const auto& w : s.waits) {
        waits.push_back(semaphoreInfo(timeline(w.point.queue).vkSemaphore(), w.point.value,
                                      w.stages));
    }
    for (const auto& e : s.externalWaits) {
        waits.push_back(semaphoreInfo(e.semaphore, e.value, e.stages));
    }

    SyncPoint point;
    std::vector<VkSemaphoreSubmitInfo> signals;
    signals.reserve(1 + s.externalSignals.size());
    if (s.signalStages != VK_PIPELINE_STAGE_2_NONE) {
        point = timeline(s.stream).pendingValue();
        signals.push_back(semaphoreInfo(timeline(s.stream).vkSemaphore(), point.value,
                                        s.signalStages));
    }
    for (const auto& e : s.externalSignals) {
        signals.push_back(semaphoreInfo(e.semaphore, e.value, e.stages));
    }

    VkCommandBufferSubmitInfo cmdInfo{};
    cmdInfo.sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmdInfo.commandBuffer = s.commands;

    VkSubmitInfo2 submitInfo{};
    submitInfo.sType                    = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submitInfo.waitSemaphoreInfoCount   = static_cast<std::uint32_t>(waits.size());
    submitInfo.pWaitSemaphoreInfos      = waits.data();
    submitInfo.commandBufferInfoCount   = s.commands != VK_NULL_HANDLE ? 1u : 0u;
    submitInfo.pCommandBufferInfos      = &cmdInfo;
    submitInfo.signalSemaphoreInfoCount = static_cast<std::uint32_t>(signals.size());
    submitInfo.pSignalSemaphoreInfos    = signals.data();

    VkResult vr = vkQueueSubmit2(device_->queue(s.stream), 1, &submitInfo, VK_NULL_HANDLE);
    if (vr != VK_SUCCESS) {
        detail::checkDeviceLost(device_, vr);
        return Error{"submit frame batch", static_cast<std::int32_t>(vr),
                     std::string("vkQueueSubmit2 failed on ") + queueTypeName(s.stream)};
    }
    if (point.valid()) timelines_[queueIndex(s.stream)].commit(point);
    return point;
}

Result<void> VulkanBackend::waitFor(const SyncPoint& point) {
    return timeline(point.queue).wait(point.value);
}

Result<void> VulkanBackend::waitAll() const {
    for (const auto& t : timelines_) {
        // VKFG_BLOCKING_WAIT: teardown and explicit waitIdle only.
        if (auto r = t.wait(t.lastValue()); !r.ok()) return r;
    }
    return {};
}

} // namespace vkfg::graph
