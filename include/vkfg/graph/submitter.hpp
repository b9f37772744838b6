#pragma once

#include <vkfg/config.hpp>
#include <vkfg/device.hpp>
#include <vkfg/error.hpp>
#include <vkfg/graph/compiler.hpp>
#include <vkfg/result.hpp>
#include <vkfg/timeline.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace vkfg::graph {

// Timeline points one frame left on each stream. A point with value 0
// means the frame did not touch that stream.
struct FrameSlotState {
    std::array<SyncPoint, kQueueTypeCount> points{};

    [[nodiscard]] bool empty() const {
        for (const auto& p : points) {
            if (p.valid()) return false;
        }
        return true;
    }
};

struct TimelineWait {
    SyncPoint             point;
    VkPipelineStageFlags2 stages = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
};

// One vkQueueSubmit2 batch. commands may be null for a sync-only submit.
struct Submission {
    QueueType                      stream   = QueueType::Graphics;
    VkCommandBuffer                commands = VK_NULL_HANDLE;
    std::vector<TimelineWait>      waits;
    std::vector<ExternalSemaphore> externalWaits;
    std::vector<ExternalSemaphore> externalSignals;
    VkPipelineStageFlags2          signalStages = VK_PIPELINE_STAGE_2_NONE; // NONE = no signal
};

// What the executor needs from the GPU. VulkanBackend drives real queues;
// tests substitute a recorder.
class SubmitBackend {
public:
    virtual ~SubmitBackend() = default;

    // A begun primary command buffer for the stream's next batch.
    [[nodiscard]] virtual Result<VkCommandBuffer> beginCommands(QueueType stream) = 0;

    virtual void pipelineBarrier(VkCommandBuffer cmd, const BarrierBatch& batch) = 0;
    virtual void beginLabel(VkCommandBuffer cmd, std::string_view name) = 0;
    virtual void endLabel(VkCommandBuffer cmd) = 0;

    // Ends commands (if any) and submits. When signalStages is set the
    // stream's timeline is signaled and the returned point is valid.
    [[nodiscard]] virtual Result<SyncPoint> submit(const Submission& submission) = 0;

    // Blocks until point has completed.
    [[nodiscard]] virtual Result<void> waitFor(const SyncPoint& point) = 0;
};

// Records and submits one stream's steps. Every boundary falls into one
// of four cases:
//   NoSync     - barriers go into the open command buffer
//   SignalOnly - barriers, then submit with the signal
//   WaitOnly   - submit what is open, then start a batch with the wait
//   Both       - submit with the signal, then start a batch with the wait
//
// Thread safety: thread-confined.
class QueueStream {
public:
    QueueStream(SubmitBackend& backend, QueueType stream);

    // Added to the first submission (cross-frame ordering).
    void waitBefore(const TimelineWait& wait);

    // passSignals maps pass index to the point signaled after it.
    [[nodiscard]] Result<void> boundary(const Sync& sync, std::vector<SyncPoint>& passSignals);

    // The open command buffer, begun on demand.
    [[nodiscard]] Result<VkCommandBuffer> commands();

    // Last boundary of the frame. Always signals so the frame leaves a
    // point on every stream it used.
    [[nodiscard]] Result<SyncPoint> finish(const Sync& sync, std::vector<SyncPoint>& passSignals);

    // Abandons unsubmitted work after a failure. If a submission already
    // went out without a full-pipeline signal after it, a sync-only signal
    // is submitted so the returned point covers everything this stream
    // handed to the queue. Invalid if nothing was submitted.
    [[nodiscard]] Result<SyncPoint> settle(std::vector<SyncPoint>& passSignals);

    [[nodiscard]] QueueType     stream()          const { return stream_; }
    [[nodiscard]] std::uint32_t submissionCount() const { return submissions_; }
    [[nodiscard]] SyncPoint     lastSignal()      const { return lastSignal_; }

private:
    [[nodiscard]] Result<void> emit(const BarrierBatch& batch);
    [[nodiscard]] Result<SyncPoint> flush(const QueueSignal* signal,
                                          std::vector<SyncPoint>& passSignals);
    [[nodiscard]] Result<void> addWaits(const QueueWait& wait,
                                        const std::vector<SyncPoint>& passSignals);

    SubmitBackend&  backend_;
    QueueType       stream_;
    VkCommandBuffer open_ = VK_NULL_HANDLE;
    Submission      next_;
    std::uint32_t   submissions_ = 0;
    SyncPoint       lastSignal_;
    bool            unsignaled_ = false; // submitted work not yet covered by an ALL_COMMANDS signal
};

// Records one pass into cmd.
using RecordPass = std::function<Result<void>(std::uint32_t pass, VkCommandBuffer cmd)>;

struct ExecuteOptions {
    bool labels = true; // debug label per pass
};

// Walks the schedule: boundary, record, repeat; then finishes every stream.
// The first submission on each stream waits for everything `previous`
// submitted.
//
// If submitted is non-null it receives the points the frame left on each
// stream, on failure too: a failed frame may already have work on the GPU,
// and the caller must still wait on it before reusing the slot.
[[nodiscard]] Result<FrameSlotState> executeFrame(const CompiledFrame& frame,
                                                  std::span<const PassNode> passes,
                                                  SubmitBackend& backend,
                                                  const FrameSlotState& previous,
                                                  const RecordPass& record,
                                                  const ExecuteOptions& options = {},
                                                  FrameSlotState* submitted = nullptr);

// framesInFlight slots of timeline points. A slot is reused only after
// the GPU finished the frame that last used it.
//
// Thread safety: thread-confined.
class FrameRing {
public:
    explicit FrameRing(std::uint32_t framesInFlight = kFramesInFlight);

    [[nodiscard]] std::uint32_t slot()           const { return current_; }
    [[nodiscard]] std::uint32_t slotCount()      const { return static_cast<std::uint32_t>(slots_.size()); }
    [[nodiscard]] std::uint64_t frameIndex()     const { return frame_; }
    [[nodiscard]] const FrameSlotState& previous() const { return previous_; }
    [[nodiscard]] const FrameSlotState& state(std::uint32_t slot) const { return slots_[slot]; }

    // VKFG_BLOCKING_WAIT: waits for the frame submitted framesInFlight
    // frames ago from this slot.
    [[nodiscard]] Result<void> beginFrame(SubmitBackend& backend);

    // Stores the submitted frame's points and moves to the next slot.
    // Streams the frame did not touch keep the previous frame's point, so
    // an empty or partial frame never drops cross-frame ordering.
    void complete(const FrameSlotState& state);

    // VKFG_BLOCKING_WAIT: waits for every slot.
    [[nodiscard]] Result<void> drain(SubmitBackend& backend);

private:
    std::vector<FrameSlotState> slots_;
    FrameSlotState              previous_;
    std::uint32_t               current_ = 0;
    std::uint64_t               frame_   = 0;
};

} // namespace vkfg::graph
