#pragma once

// Test doubles for the frame compiler and executor: a resource provider
// that hands out made-up handles, and a backend that records what would
// have been submitted.

#include <vkfg/graph/compiler.hpp>
#include <vkfg/graph/submitter.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace vkfg::test {

using namespace vkfg::graph;

template <typename H>
H fakeHandle(std::uint64_t value) {
    H h{};
    std::memcpy(&h, &value, sizeof(h));
    return h;
}

template <typename H>
std::uint64_t handleValue(H h) {
    std::uint64_t value = 0;
    std::memcpy(&value, &h, sizeof(h));
    return value;
}

class FakeProvider final : public ResourceProvider {
public:
    Result<Acquired<BufferHandle>> buffer(const BufferCreateDesc& desc) override {
        ++bufferRequests;
        BufferHandle h;
        h.buffer = fakeHandle<VkBuffer>(next_++);
        h.size   = desc.desc.size;
        return Acquired<BufferHandle>{h, true};
    }

    Result<Acquired<ImageHandle>> image(const ImageCreateDesc& desc) override {
        ++imageRequests;
        if (failImages) return Error{"create graph image", -2, "out of device memory"};
        return Acquired<ImageHandle>{makeImage(desc), true};
    }

    Result<PersistentAcquired<BufferHandle>> persistentBuffer(
        PersistId id, const BufferCreateDesc& desc) override {
        auto& e = persistent_[id.value];
        if (!e.created) {
            e.created = true;
            e.buffer.buffer = fakeHandle<VkBuffer>(next_++);
            e.buffer.size   = desc.desc.size;
        }
        return PersistentAcquired<BufferHandle>{e.buffer, e.fresh, e.last, e.queue};
    }

    Result<PersistentAcquired<ImageHandle>> persistentImage(
        PersistId id, const ImageCreateDesc& desc) override {
        auto& e = persistent_[id.value];
        if (!e.created) {
            e.created = true;
            e.image   = makeImage(desc);
        }
        return PersistentAcquired<ImageHandle>{e.image, e.fresh, e.last, e.queue};
    }

    // What RenderGraph does with the cache after a frame ran.
    void record(const PhysicalResource& p) {
        auto& e = persistent_[p.persist.value];
        e.fresh = false;
        e.last  = p.finalAccess;
        e.queue = p.finalQueue;
    }

    std::uint32_t bufferRequests = 0;
    std::uint32_t imageRequests  = 0;
    bool          failImages     = false;

private:
    struct Entry {
        bool         created = false;
        bool         fresh   = true;
        BufferHandle buffer;
        ImageHandle  image;
        AccessInfo   last;
        QueueType    queue = QueueType::Graphics;
    };

    ImageHandle makeImage(const ImageCreateDesc& desc) {
        ImageHandle h;
        h.image       = fakeHandle<VkImage>(next_++);
        h.format      = desc.desc.format;
        h.extent      = desc.desc.extent();
        h.mipLevels   = desc.desc.mipLevels;
        h.arrayLayers = desc.desc.arrayLayers;
        return h;
    }

    std::uint64_t                             next_ = 0x1000;
    std::unordered_map<std::uint64_t, Entry> persistent_;
};

// Records every backend call. Command buffers are numbered per begin;
// each stream's timeline counts up from 1.
class RecordingBackend final : public SubmitBackend {
public:
    struct Event {
        enum Kind { Begin, Barrier, Label, Submit, Wait } kind;
        QueueType     stream = QueueType::Graphics;
        std::uint64_t cmd    = 0;
        std::string   label;
    };

    Result<VkCommandBuffer> beginCommands(QueueType stream) override {
        std::uint64_t id = ++commandBuffers_;
        streamOf_[id]    = stream;
        events.push_back(Event{Event::Begin, stream, id, {}});
        return fakeHandle<VkCommandBuffer>(id);
    }

    void pipelineBarrier(VkCommandBuffer cmd, const BarrierBatch& batch) override {
        std::uint64_t id = handleValue(cmd);
        barrierCount += batch.count();
        events.push_back(Event{Event::Barrier, streamOf_[id], id, {}});
    }

    void beginLabel(VkCommandBuffer cmd, std::string_view name) override {
        std::uint64_t id = handleValue(cmd);
        events.push_back(Event{Event::Label, streamOf_[id], id, std::string(name)});
    }

    void endLabel(VkCommandBuffer) override {}

    Result<SyncPoint> submit(const Submission& submission) override {
        std::uint32_t attempt = attempts++;
        if (failSubmit || attempt == failAttempt) return Error{"submit frame", -4, "device lost"};
        submissions.push_back(submission);
        events.push_back(Event{Event::Submit, submission.stream,
                               submission.commands ? handleValue(submission.commands) : 0, {}});
        if (submission.signalStages == VK_PIPELINE_STAGE_2_NONE) return SyncPoint{};
        return SyncPoint{submission.stream, ++timeline[queueIndex(submission.stream)]};
    }

    Result<void> waitFor(const SyncPoint& point) override {
        waited.push_back(point);
        events.push_back(Event{Event::Wait, point.queue, 0, {}});
        return {};
    }

    // Submissions on one stream, in order.
    [[nodiscard]] std::vector<const Submission*> on(QueueType stream) const {
        std::vector<const Submission*> out;
        for (const auto& s : submissions) {
            if (s.stream == stream) out.push_back(&s);
        }
        return out;
    }

    std::vector<Event>                         events;
    std::vector<Submission>                    submissions;
    std::vector<SyncPoint>                     waited;
    std::array<std::uint64_t, kQueueTypeCount> timeline{};
    std::uint32_t                              barrierCount = 0;
    bool                                       failSubmit   = false;
    std::uint32_t                              failAttempt  = UINT32_MAX; // fail only this submit
    std::uint32_t                              attempts     = 0;          // submit calls, failed included

private:
    std::uint64_t                                commandBuffers_ = 0;
    std::unordered_map<std::uint64_t, QueueType> streamOf_;
};

// Frame declaration helpers.
inline UsageRecord use(std::uint32_t pass, const BufferUsage& u) {
    UsageRecord r;
    r.pass        = pass;
    r.access      = u.info();
    r.createUsage = u.usage;
    return r;
}

inline UsageRecord use(std::uint32_t pass, const ImageUsage& u) {
    UsageRecord r;
    r.pass        = pass;
    r.access      = u.info();
    r.createUsage = u.usage;
    r.range       = u.range;
    r.viewFormat  = u.viewFormat;
    return r;
}

inline VirtualResource transientBuffer(VkDeviceSize size, std::initializer_list<UsageRecord> uses,
                                       BufferLocation location = BufferLocation::GpuOnly) {
    VirtualResource v;
    v.kind       = ResourceKind::Buffer;
    v.origin     = ResourceOrigin::Transient;
    v.bufferDesc = BufferDesc{size, location};
    v.usages     = uses;
    return v;
}

inline VirtualResource transientImage(const ImageDesc& desc,
                                      std::initializer_list<UsageRecord> uses) {
    VirtualResource v;
    v.kind      = ResourceKind::Image;
    v.origin    = ResourceOrigin::Transient;
    v.imageDesc = desc;
    v.usages    = uses;
    return v;
}

inline ImageDesc colorTarget(std::uint32_t width = 1280, std::uint32_t height = 720) {
    ImageDesc d;
    d.format = VK_FORMAT_R16G16B16A16_SFLOAT;
    d.width  = width;
    d.height = height;
    return d;
}

} // namespace vkfg::test
