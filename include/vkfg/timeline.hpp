#pragma once

#include <vkfg/device.hpp>
#include <vkfg/error.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace vkfg {

// A point on one stream's timeline semaphore. value == 0 means nothing was
// submitted, so there is nothing to wait for.
struct SyncPoint {
    QueueType     queue = QueueType::Graphics;
    std::uint64_t value = 0;

    [[nodiscard]] bool valid() const { return value != 0; }
    bool operator==(const SyncPoint&) const = default;
};

// Host-side value bookkeeping for one timeline. A value is only committed
// once the submission that signals it was accepted by the queue, so a failed
// submit never leaves a value behind that no one will ever signal.
class TimelineCounter {
public:
    // Value the next submission on this timeline signals.
    [[nodiscard]] std::uint64_t pending() const { return committed_ + 1; }

    // Records that a submission signaling value was accepted.
    void commit(std::uint64_t value) {
        if (value > committed_) committed_ = value;
    }

    // Highest value a successful submission signals.
    [[nodiscard]] std::uint64_t lastValue() const { return committed_; }

private:
    std::uint64_t committed_ = 0;
};

// One timeline semaphore per queue stream. Every submit on the stream
// signals the next value, so "frame N done on this queue" is a single
// monotonic number instead of a fence per slot.
//
// Thread safety: thread-confined (render loop thread).
class QueueTimeline {
public:
    [[nodiscard]] static Result<QueueTimeline> create(const Device& device,
                                                       QueueType stream);

    ~QueueTimeline();
    QueueTimeline(QueueTimeline&&) noexcept;
    QueueTimeline& operator=(QueueTimeline&&) noexcept;
    QueueTimeline(const QueueTimeline&) = delete;
    QueueTimeline& operator=(const QueueTimeline&) = delete;

    [[nodiscard]] VkSemaphore   vkSemaphore() const { return semaphore_; }
    [[nodiscard]] QueueType     stream()      const { return stream_; }
    [[nodiscard]] std::uint64_t lastValue()   const { return counter_.lastValue(); }

    // Value the next submission signals. Not consumed until commit().
    [[nodiscard]] SyncPoint pendingValue() const {
        return SyncPoint{stream_, counter_.pending()};
    }

    // Call once the submit signaling point returned VK_SUCCESS.
    void commit(const SyncPoint& point) { counter_.commit(point.value); }

    // Blocks until the semaphore reaches value.
    [[nodiscard]] Result<void> wait(std::uint64_t value) const;

private:
    QueueTimeline() = default;
    void destroy();

    VkDevice      device_    = VK_NULL_HANDLE;
    const Device* devicePtr_ = nullptr;
    VkSemaphore   semaphore_ = VK_NULL_HANDLE;
    QueueType     stream_    = QueueType::Graphics;
    TimelineCounter counter_;
};

} // namespace vkfg
