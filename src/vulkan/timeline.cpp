#include <vkfg/timeline.hpp>
#include "device_lost.hpp"

#include <cstdint>
#include <string>

namespace vkfg {

void QueueTimeline::destroy() {
    if (device_ == VK_NULL_HANDLE) return;

    if (semaphore_ != VK_NULL_HANDLE)
        vkDestroySemaphore(device_, semaphore_, nullptr);

    device_    = VK_NULL_HANDLE;
    semaphore_ = VK_NULL_HANDLE;
}

QueueTimeline::~QueueTimeline() { destroy(); }

QueueTimeline::QueueTimeline(QueueTimeline&& o) noexcept
    : device_(o.device_), devicePtr_(o.devicePtr_), semaphore_(o.semaphore_),
      stream_(o.stream_), counter_(o.counter_) {
    o.device_    = VK_NULL_HANDLE;
    o.devicePtr_ = nullptr;
    o.semaphore_ = VK_NULL_HANDLE;
}

QueueTimeline& QueueTimeline::operator=(QueueTimeline&& o) noexcept {
    if (this != &o) {
        destroy();
        device_    = o.device_;
        devicePtr_ = o.devicePtr_;
        semaphore_ = o.semaphore_;
        stream_    = o.stream_;
        counter_   = o.counter_;
        o.device_    = VK_NULL_HANDLE;
        o.devicePtr_ = nullptr;
        o.semaphore_ = VK_NULL_HANDLE;
    }
    return *this;
}

Result<QueueTimeline> QueueTimeline::create(const Device& device, QueueType stream) {
    QueueTimeline t;
    t.device_    = device.vkDevice();
    t.devicePtr_ = &device;
    t.stream_    = stream;

    VkSemaphoreTypeCreateInfo timelineCI{};
    timelineCI.sType         = VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO;
    timelineCI.semaphoreType = VK_SEMAPHORE_TYPE_TIMELINE;
    timelineCI.initialValue  = 0;

    VkSemaphoreCreateInfo semCI{};
    semCI.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    semCI.pNext = &timelineCI;

    VkResult vr = vkCreateSemaphore(t.device_, &semCI, nullptr, &t.semaphore_);
    if (vr != VK_SUCCESS) {
        return Error{"create timeline semaphore", static_cast<std::int32_t>(vr),
                     std::string("vkCreateSemaphore failed for ") + queueTypeName(stream)};
    }

    return t;
}

Result<void> QueueTimeline::wait(std::uint64_t value) const {
    if (value == 0) return {};

    VkSemaphoreWaitInfo waitInfo{};
    waitInfo.sType          = VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO;
    waitInfo.semaphoreCount = 1;
    waitInfo.pSemaphores    = &semaphore_;
    waitInfo.pValues        = &value;

    // VKFG_BLOCKING_WAIT: frame-slot timeline wait before command pool reuse.
    VkResult vr = vkWaitSemaphores(device_, &waitInfo, UINT64_MAX);
    if (vr != VK_SUCCESS) {
        detail::checkDeviceLost(devicePtr_, vr);
        return Error{"wait for timeline semaphore", static_cast<std::int32_t>(vr),
                     std::string("vkWaitSemaphores failed on ") + queueTypeName(stream_) +
                         " value " + std::to_string(value)};
    }
    return {};
}

} // namespace vkfg
