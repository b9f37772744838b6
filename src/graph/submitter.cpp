#include <vkfg/graph/submitter.hpp>

#include <cstdio>
#include <string>

namespace vkfg::graph {

QueueStream::QueueStream(SubmitBackend& backend, QueueType stream)
    : backend_(backend), stream_(stream) {
    next_.stream = stream;
}

void QueueStream::waitBefore(const TimelineWait& wait) {
    if (wait.point.valid()) next_.waits.push_back(wait);
}

Result<VkCommandBuffer> QueueStream::commands() {
    if (open_ == VK_NULL_HANDLE) {
        auto cmd = backend_.beginCommands(stream_);
        if (!cmd.ok()) return cmd.error();
        open_ = cmd.value();
    }
    return open_;
}

Result<void> QueueStream::emit(const BarrierBatch& batch) {
    if (batch.empty()) return {};
    auto cmd = commands();
    if (!cmd.ok()) return cmd.error();
    backend_.pipelineBarrier(cmd.value(), batch);
    return {};
}

Result<SyncPoint> QueueStream::flush(const QueueSignal* signal,
                                     std::vector<SyncPoint>& passSignals) {
    next_.commands = open_;
    if (signal) {
        next_.signalStages = signal->stages != VK_PIPELINE_STAGE_2_NONE
                                 ? signal->stages
                                 : VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        next_.externalSignals = signal->external;
    }

    auto point = backend_.submit(next_);
    if (!point.ok()) return point.error();

    ++submissions_;
    unsignaled_  = next_.signalStages != VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    open_        = VK_NULL_HANDLE;
    next_        = Submission{};
    next_.stream = stream_;

    if (signal) {
        lastSignal_ = point.value();
        if (signal->pass != kNoPass) passSignals[signal->pass] = point.value();
    }
    return point;
}

Result<void> QueueStream::addWaits(const QueueWait& wait,
                                   const std::vector<SyncPoint>& passSignals) {
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        const PassWait& w = wait.queues[q];
        if (!w.valid()) continue;

        const SyncPoint& point = passSignals[w.pass];
        if (!point.valid()) {
            return Error{"execute frame", 0,
                         std::string(queueTypeName(stream_)) + " waits on pass " +
                             std::to_string(w.pass) + " before its signal was submitted"};
        }
        next_.waits.push_back(TimelineWait{point, w.stages});
    }
    next_.externalWaits.insert(next_.externalWaits.end(), wait.external.begin(),
                               wait.external.end());
    return {};
}

Result<void> QueueStream::boundary(const Sync& sync, std::vector<SyncPoint>& passSignals) {
    const CrossQueueSync& cq = sync.crossQueue;

    switch (sync.kind()) {
    case SyncKind::NoSync: {
        if (auto r = emit(sync.queue); !r.ok()) return r;
        if (auto r = emit(cq.signalBarriers); !r.ok()) return r;
        return emit(cq.waitBarriers);
    }

    case SyncKind::SignalOnly: {
        if (auto r = emit(sync.queue); !r.ok()) return r;
        if (auto r = emit(cq.signalBarriers); !r.ok()) return r;
        auto point = flush(&cq.signal, passSignals);
        if (!point.ok()) return point.error();
        return emit(cq.waitBarriers);
    }

    case SyncKind::WaitOnly: {
        // Work already recorded does not need the wait; let it run.
        if (open_ != VK_NULL_HANDLE) {
            auto point = flush(nullptr, passSignals);
            if (!point.ok()) return point.error();
        }
        if (auto r = addWaits(cq.wait, passSignals); !r.ok()) return r;
        if (auto r = emit(sync.queue); !r.ok()) return r;
        if (auto r = emit(cq.signalBarriers); !r.ok()) return r;
        return emit(cq.waitBarriers);
    }

    case SyncKind::Both: {
        if (auto r = emit(sync.queue); !r.ok()) return r;
        if (auto r = emit(cq.signalBarriers); !r.ok()) return r;
        auto point = flush(&cq.signal, passSignals);
        if (!point.ok()) return point.error();
        if (auto r = addWaits(cq.wait, passSignals); !r.ok()) return r;
        return emit(cq.waitBarriers);
    }
    }
    return {};
}

Result<SyncPoint> QueueStream::finish(const Sync& sync, std::vector<SyncPoint>& passSignals) {
    const CrossQueueSync& cq = sync.crossQueue;

    if (!cq.wait.empty()) {
        if (open_ != VK_NULL_HANDLE) {
            auto point = flush(nullptr, passSignals);
            if (!point.ok()) return point.error();
        }
        if (auto r = addWaits(cq.wait, passSignals); !r.ok()) return r.error();
    }
    if (auto r = emit(sync.queue); !r.ok()) return r.error();
    if (auto r = emit(cq.signalBarriers); !r.ok()) return r.error();
    if (auto r = emit(cq.waitBarriers); !r.ok()) return r.error();

    QueueSignal signal = cq.signal;
    signal.stages = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    return flush(&signal, passSignals);
}

Result<SyncPoint> QueueStream::settle(std::vector<SyncPoint>& passSignals) {
    // The open buffer belongs to the slot's pool and is reset with it.
    open_        = VK_NULL_HANDLE;
    next_        = Submission{};
    next_.stream = stream_;
    if (!unsignaled_) return lastSignal_;

    QueueSignal signal;
    signal.stages = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    return flush(&signal, passSignals);
}

Result<FrameSlotState> executeFrame(const CompiledFrame& frame, std::span<const PassNode> passes,
                                    SubmitBackend& backend, const FrameSlotState& previous,
                                    const RecordPass& record, const ExecuteOptions& options,
                                    FrameSlotState* submitted) {
    std::vector<SyncPoint> passSignals(passes.size());

    std::array<QueueStream, kQueueTypeCount> streams{
        QueueStream(backend, QueueType::Graphics),
        QueueStream(backend, QueueType::Compute),
        QueueStream(backend, QueueType::Transfer),
    };
    for (auto& stream : streams) {
        for (const auto& point : previous.points) {
            stream.waitBefore(TimelineWait{point, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT});
        }
    }

    auto abandon = [&](Error error) -> Result<FrameSlotState> {
        FrameSlotState partial;
        for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
            auto point = streams[q].settle(passSignals);
            if (!point.ok()) {
#ifndef NDEBUG
                std::fprintf(stderr, "[vkfg::graph] %s: could not settle after failed frame: %s\n",
                             queueTypeName(static_cast<QueueType>(q)),
                             point.error().format().c_str());
#endif
                partial.points[q] = streams[q].lastSignal();
                continue;
            }
            partial.points[q] = point.value();
        }
        if (submitted) *submitted = partial;
        return error;
    };

    for (const auto& step : frame.steps) {
        QueueStream& stream = streams[queueIndex(step.queue)];
        if (auto r = stream.boundary(step.sync, passSignals); !r.ok()) return abandon(r.error());
        if (step.pass == kNoPass) continue;

        auto cmd = stream.commands();
        if (!cmd.ok()) return abandon(cmd.error());

        if (options.labels) backend.beginLabel(cmd.value(), passes[step.pass].name);
        auto recorded = record(step.pass, cmd.value());
        if (options.labels) backend.endLabel(cmd.value());
        if (!recorded.ok()) return abandon(recorded.error());
    }

    FrameSlotState state;
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        if (!frame.streamUsed[q]) continue;
        auto point = streams[q].finish(frame.finish[q], passSignals);
        if (!point.ok()) return abandon(point.error());
        state.points[q] = point.value();
    }
    if (submitted) *submitted = state;
    return state;
}

FrameRing::FrameRing(std::uint32_t framesInFlight)
    : slots_(framesInFlight == 0 ? 1 : framesInFlight) {}

Result<void> FrameRing::beginFrame(SubmitBackend& backend) {
    for (const auto& point : slots_[current_].points) {
        if (!point.valid()) continue;
        if (auto r = backend.waitFor(point); !r.ok()) return r;
    }
    return {};
}

void FrameRing::complete(const FrameSlotState& state) {
    FrameSlotState merged = state;
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        if (!merged.points[q].valid()) merged.points[q] = previous_.points[q];
    }
    slots_[current_] = merged;
    previous_        = merged;
    current_         = (current_ + 1) % static_cast<std::uint32_t>(slots_.size());
    ++frame_;
}

Result<void> FrameRing::drain(SubmitBackend& backend) {
    for (const auto& slot : slots_) {
        for (const auto& point : slot.points) {
            if (!point.valid()) continue;
            if (auto r = backend.waitFor(point); !r.ok()) return r;
        }
    }
    return {};
}

} // namespace vkfg::graph
