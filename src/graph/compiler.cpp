#include <vkfg/graph/compiler.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <functional>
#include <queue>
#include <string>

namespace vkfg::graph {

// ---------------------------------------------------------------------------
// Sync types
// ---------------------------------------------------------------------------

bool QueueWait::empty() const {
    for (const auto& w : queues) {
        if (w.valid()) return false;
    }
    return external.empty();
}

void QueueWait::merge(const QueueWait& other) {
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        const PassWait& o = other.queues[q];
        if (!o.valid()) continue;
        PassWait& w = queues[q];
        if (!w.valid() || o.pass > w.pass) w.pass = o.pass;
        w.stages |= o.stages;
    }
    external.insert(external.end(), other.external.begin(), other.external.end());
}

void QueueSignal::merge(const QueueSignal& other) {
    stages |= other.stages;
    if (other.pass != kNoPass && (pass == kNoPass || other.pass > pass)) pass = other.pass;
    external.insert(external.end(), other.external.begin(), other.external.end());
}

const char* syncKindName(SyncKind kind) {
    switch (kind) {
    case SyncKind::NoSync:     return "none";
    case SyncKind::SignalOnly: return "signal";
    case SyncKind::WaitOnly:   return "wait";
    case SyncKind::Both:       return "signal+wait";
    }
    return "?";
}

SyncKind Sync::kind() const {
    bool signal = !crossQueue.signal.empty();
    bool wait   = !crossQueue.wait.empty();
    if (signal && wait) return SyncKind::Both;
    if (signal) return SyncKind::SignalOnly;
    if (wait) return SyncKind::WaitOnly;
    return SyncKind::NoSync;
}

bool Sync::empty() const {
    return kind() == SyncKind::NoSync && queue.empty() && crossQueue.signalBarriers.empty() &&
           crossQueue.waitBarriers.empty();
}

void Sync::merge(const Sync& other) {
    queue.append(other.queue);
    crossQueue.signal.merge(other.crossQueue.signal);
    crossQueue.signalBarriers.append(other.crossQueue.signalBarriers);
    crossQueue.wait.merge(other.crossQueue.wait);
    crossQueue.waitBarriers.append(other.crossQueue.waitBarriers);
}

namespace {

constexpr VkPipelineStageFlags2 kNoStages = VK_PIPELINE_STAGE_2_NONE;

VkPipelineStageFlags2 stagesOrAll(VkPipelineStageFlags2 stages) {
    return stages == kNoStages ? VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT : stages;
}

bool covers(const AccessInfo& have, const AccessInfo& want) {
    return (want.stages & ~have.stages) == 0 && (want.access & ~have.access) == 0;
}

// Who last touched a resource. pass == kNoPass is whatever ran before the
// frame (external initial state, persistent state from an earlier frame).
struct Producer {
    std::uint32_t pass   = kNoPass;
    QueueType     stream = QueueType::Graphics;
    AccessInfo    access;
};

// Reads on one stream since the last write.
struct StreamReads {
    std::uint32_t lastPass = kNoPass;
    AccessInfo    access;

    [[nodiscard]] bool any() const { return lastPass != kNoPass; }
};

// Whole-resource state while walking one physical resource's uses.
struct Tracker {
    bool                                     hasWriter = false;
    Producer                                 writer;
    std::array<StreamReads, kQueueTypeCount> reads{};
    VkImageLayout                            layout = VK_IMAGE_LAYOUT_UNDEFINED;
    std::uint32_t                            family = VK_QUEUE_FAMILY_IGNORED; // exclusive owner
    const std::vector<ExternalSemaphore>*    externalWait = nullptr; // waited before first use
};

struct UseRef {
    std::uint32_t pass         = kNoPass;
    std::uint32_t virtualIndex = 0;
    std::uint32_t usageIndex   = 0;
    bool          first        = false; // first use of this virtual resource
};

// ---------------------------------------------------------------------------
// Usage collection
// ---------------------------------------------------------------------------

void mergeUsages(std::span<const PassNode> passes, std::span<VirtualResource> resources) {
    for (std::uint32_t v = 0; v < resources.size(); ++v) {
        auto& usages = resources[v].usages;
        for (const auto& u : usages) {
            if (u.pass >= passes.size()) {
                fatal(Error{"compile frame", 0,
                            "resource " + std::to_string(v) + " used by unknown pass " +
                                std::to_string(u.pass)});
            }
        }

        std::stable_sort(usages.begin(), usages.end(),
                         [](const UsageRecord& a, const UsageRecord& b) { return a.pass < b.pass; });

        std::size_t out = 0;
        for (std::size_t i = 0; i < usages.size(); ++i) {
            if (out > 0 && usages[out - 1].pass == usages[i].pass) {
                UsageRecord& m = usages[out - 1];
                const UsageRecord& u = usages[i];
                if (resources[v].kind == ResourceKind::Image &&
                    m.access.layout != u.access.layout) {
                    fatal(Error{"compile frame", 0,
                                "pass '" + std::string(passes[u.pass].name) +
                                    "' uses image resource " + std::to_string(v) + " as both " +
                                    layoutName(m.access.layout) + " and " +
                                    layoutName(u.access.layout)});
                }
                m.access |= u.access;
                m.createUsage |= u.createUsage;
                m.range = m.range.merge(u.range);
                if (m.viewFormat == VK_FORMAT_UNDEFINED) m.viewFormat = u.viewFormat;
                continue;
            }
            usages[out++] = usages[i];
        }
        usages.resize(out);
    }
}

// ---------------------------------------------------------------------------
// Aliasing: transient resources whose lifetimes do not overlap share one
// physical resource. Buffers need the same location (GpuOnly only) and take
// the larger size; images need identical descriptions.
// ---------------------------------------------------------------------------

bool aliasable(const VirtualResource& v) {
    if (v.origin != ResourceOrigin::Transient) return false;
    if (v.kind == ResourceKind::Buffer) return v.bufferDesc.location == BufferLocation::GpuOnly;
    return v.kind == ResourceKind::Image;
}

bool compatible(const PhysicalResource& p, const VirtualResource& v) {
    if (p.origin != ResourceOrigin::Transient || p.kind != v.kind) return false;
    if (v.kind == ResourceKind::Buffer) {
        return p.bufferDesc.desc.location == BufferLocation::GpuOnly;
    }
    return p.imageDesc.desc == v.imageDesc;
}

void assignPhysical(std::span<VirtualResource> resources, bool aliasTransients,
                    CompiledFrame& out) {
    std::vector<std::uint32_t> byFirstUse;
    byFirstUse.reserve(resources.size());
    for (std::uint32_t v = 0; v < resources.size(); ++v) byFirstUse.push_back(v);

    auto firstPass = [&](std::uint32_t v) {
        return resources[v].usages.empty() ? kNoPass : resources[v].usages.front().pass;
    };
    std::stable_sort(byFirstUse.begin(), byFirstUse.end(),
                     [&](std::uint32_t a, std::uint32_t b) { return firstPass(a) < firstPass(b); });

    out.resourceMap.assign(resources.size(), kNoResource);

    for (std::uint32_t v : byFirstUse) {
        const VirtualResource& res = resources[v];
        if (res.usages.empty()) continue;

        std::uint32_t first = res.usages.front().pass;
        std::uint32_t last  = res.usages.back().pass;

        std::uint32_t usage = 0;
        for (const auto& u : res.usages) usage |= u.createUsage;

        if (aliasTransients && aliasable(res)) {
            bool joined = false;
            for (std::uint32_t p = 0; p < out.resources.size(); ++p) {
                PhysicalResource& phys = out.resources[p];
                if (!compatible(phys, res) || phys.lastPass >= first) continue;

                phys.lastPass = last;
                if (res.kind == ResourceKind::Buffer) {
                    phys.bufferDesc.desc.size = std::max(phys.bufferDesc.desc.size,
                                                         res.bufferDesc.size);
                    phys.bufferDesc.usage |= usage;
                } else {
                    phys.imageDesc.usage |= usage;
                }
                out.stats.aliasedCount += phys.virtualCount == 1 ? 2 : 1;
                ++phys.virtualCount;
                out.resourceMap[v] = p;
                joined = true;
                break;
            }
            if (joined) continue;
        }

        PhysicalResource phys;
        phys.kind         = res.kind;
        phys.origin       = res.origin;
        phys.firstPass    = first;
        phys.lastPass     = last;
        phys.virtualCount = 1;
        phys.persist      = res.persist;
        if (res.kind == ResourceKind::Buffer) {
            phys.bufferDesc = BufferCreateDesc{res.bufferDesc, usage};
        } else {
            ImageDesc desc = res.origin == ResourceOrigin::External ? res.externalImage.desc
                                                                    : res.imageDesc;
            if (desc.format == VK_FORMAT_UNDEFINED) desc.format = res.externalImage.handle.format;
            phys.imageDesc = ImageCreateDesc{desc, usage};
            phys.aspect    = aspectFromFormat(desc.format);
        }
        out.resourceMap[v] = static_cast<std::uint32_t>(out.resources.size());
        out.resources.push_back(phys);
    }
}

// ---------------------------------------------------------------------------
// Resolution through the provider
// ---------------------------------------------------------------------------

Result<void> resolvePhysical(std::span<VirtualResource> resources, ResourceProvider& provider,
                             CompiledFrame& out) {
    // First virtual resource per physical, for external/persistent payloads.
    std::vector<std::uint32_t> owner(out.resources.size(), kNoResource);
    for (std::uint32_t v = 0; v < resources.size(); ++v) {
        std::uint32_t p = out.resourceMap[v];
        if (p != kNoResource && owner[p] == kNoResource) owner[p] = v;
    }

    for (std::uint32_t p = 0; p < out.resources.size(); ++p) {
        PhysicalResource&      phys = out.resources[p];
        const VirtualResource& res  = resources[owner[p]];

        switch (phys.origin) {
        case ResourceOrigin::External:
            if (phys.kind == ResourceKind::Buffer) {
                phys.buffer = res.externalBuffer.handle;
            } else {
                phys.image = res.externalImage.handle;
            }
            break;

        case ResourceOrigin::Transient:
            if (phys.kind == ResourceKind::Buffer) {
                auto r = provider.buffer(phys.bufferDesc);
                if (!r.ok()) return r.error();
                phys.buffer = r->handle;
                phys.fresh  = r->fresh;
            } else {
                auto r = provider.image(phys.imageDesc);
                if (!r.ok()) return r.error();
                phys.image = r->handle;
                phys.fresh = r->fresh;
            }
            break;

        case ResourceOrigin::Persistent:
            if (phys.kind == ResourceKind::Buffer) {
                auto r = provider.persistentBuffer(phys.persist, phys.bufferDesc);
                if (!r.ok()) return r.error();
                phys.buffer      = r->handle;
                phys.fresh       = r->fresh;
                phys.finalAccess = r->lastAccess;
                phys.finalQueue  = r->lastQueue;
            } else {
                auto r = provider.persistentImage(phys.persist, phys.imageDesc);
                if (!r.ok()) return r.error();
                phys.image       = r->handle;
                phys.fresh       = r->fresh;
                phys.finalAccess = r->lastAccess;
                phys.finalQueue  = r->lastQueue;
            }
            break;
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// Dependency walk
// ---------------------------------------------------------------------------

class SyncBuilder {
public:
    SyncBuilder(Arena& arena, std::span<const PassNode> passes, const QueueTopology& topology)
        : passes_(passes),
          topology_(topology),
          before_(passes.size(), Sync{}, ArenaAllocator<Sync>(arena)),
          after_(passes.size(), Sync{}, ArenaAllocator<Sync>(arena)) {}

    void walk(PhysicalResource& res, std::span<const UseRef> uses,
              std::span<const VirtualResource> virtuals);

    void schedule(std::span<const std::uint32_t> order, CompiledFrame& out);

    [[nodiscard]] std::vector<std::pair<std::uint32_t, std::uint32_t>> takeEdges() {
        std::sort(edges_.begin(), edges_.end());
        edges_.erase(std::unique(edges_.begin(), edges_.end()), edges_.end());
        return std::move(edges_);
    }

private:
    [[nodiscard]] QueueType streamOf(std::uint32_t pass) const {
        return topology_.resolve(passes_[pass].queue);
    }

    [[nodiscard]] std::uint32_t familyOf(QueueType stream) const {
        return topology_.familyOf(stream);
    }

    void edge(std::uint32_t from, std::uint32_t to) {
        if (from != kNoPass && from != to) edges_.emplace_back(from, to);
    }

    void crossQueue(const Producer& src, std::uint32_t dstPass, VkPipelineStageFlags2 dstStages);

    void initialize(Tracker& t, const PhysicalResource& res, const VirtualResource& v,
                    QueueType firstStream) const;

    void read(Tracker& t, const PhysicalResource& res, std::uint32_t pass, QueueType stream,
              const AccessInfo& access, bool waited, std::span<const UseRef> ahead,
              std::span<const VirtualResource> virtuals);

    void write(Tracker& t, const PhysicalResource& res, std::uint32_t pass, QueueType stream,
               AccessInfo access, bool discard, bool transfer, bool waited);

    void handOff(Tracker& t, PhysicalResource& res, const VirtualResource& v);

    static void record(BarrierBatch& batch, const PhysicalResource& res, const AccessInfo& src,
                       const AccessInfo& dst, std::uint32_t srcFamily = VK_QUEUE_FAMILY_IGNORED,
                       std::uint32_t dstFamily = VK_QUEUE_FAMILY_IGNORED);

    std::span<const PassNode>                           passes_;
    const QueueTopology&                                topology_;
    ArenaVector<Sync>                                   before_;
    ArenaVector<Sync>                                   after_;
    std::vector<std::pair<std::uint32_t, std::uint32_t>> edges_;
};

void SyncBuilder::record(BarrierBatch& batch, const PhysicalResource& res, const AccessInfo& src,
                         const AccessInfo& dst, std::uint32_t srcFamily,
                         std::uint32_t dstFamily) {
    if (res.kind == ResourceKind::Image) {
        batch.addImage(res.image.image, SubresourceRange{}.vk(res.aspect), src, dst, srcFamily,
                       dstFamily);
    } else {
        batch.addBuffer(res.buffer.buffer, src, dst, srcFamily, dstFamily);
    }
}

void SyncBuilder::crossQueue(const Producer& src, std::uint32_t dstPass,
                             VkPipelineStageFlags2 dstStages) {
    QueueSignal& signal = after_[src.pass].crossQueue.signal;
    signal.stages |= stagesOrAll(src.access.stages);
    signal.pass = src.pass;

    PassWait& wait = before_[dstPass].crossQueue.wait.queues[queueIndex(src.stream)];
    if (!wait.valid() || wait.pass < src.pass) wait.pass = src.pass;
    wait.stages |= stagesOrAll(dstStages);

    edge(src.pass, dstPass);
}

void SyncBuilder::initialize(Tracker& t, const PhysicalResource& res, const VirtualResource& v,
                             QueueType firstStream) const {
    if (res.origin == ResourceOrigin::External) {
        bool image = res.kind == ResourceKind::Image;
        const AccessInfo& initial = image ? v.externalImage.initial : v.externalBuffer.initial;
        const auto& wait = image ? v.externalImage.wait : v.externalBuffer.wait;
        bool concurrent  = image ? v.externalImage.concurrent : v.externalBuffer.concurrent;
        std::uint32_t owner = image ? v.externalImage.ownerFamily : v.externalBuffer.ownerFamily;

        t.hasWriter     = true;
        t.writer.pass   = kNoPass;
        t.writer.stream = firstStream;
        t.writer.access = initial;
        t.layout        = image ? initial.layout : VK_IMAGE_LAYOUT_UNDEFINED;
        if (!wait.empty()) {
            // The first barrier must sit inside the semaphore wait's scope.
            VkPipelineStageFlags2 stages = kNoStages;
            for (const auto& s : wait) stages |= s.stages;
            t.writer.access.stages = stages;
            t.writer.access.access = VK_ACCESS_2_NONE;
            t.externalWait         = &wait;
        }
        if (!concurrent) {
            t.family = owner != VK_QUEUE_FAMILY_IGNORED ? owner : familyOf(firstStream);
        }
        return;
    }

    if (res.origin == ResourceOrigin::Persistent && !res.fresh) {
        t.hasWriter     = true;
        t.writer.pass   = kNoPass;
        t.writer.stream = firstStream;
        t.writer.access = res.finalAccess;
        t.layout = res.kind == ResourceKind::Image ? res.finalAccess.layout
                                                   : VK_IMAGE_LAYOUT_UNDEFINED;
        if (topology_.resolve(res.finalQueue) != firstStream) {
            // Ordered by the wait on the previous frame; only the layout
            // transition remains, and the old stages may not exist here.
            t.writer.access.stages = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            t.writer.access.access = VK_ACCESS_2_NONE;
        }
    }
}

void SyncBuilder::read(Tracker& t, const PhysicalResource& res, std::uint32_t pass,
                       QueueType stream, const AccessInfo& access, bool waited,
                       std::span<const UseRef> ahead, std::span<const VirtualResource> virtuals) {
    StreamReads& reads = t.reads[queueIndex(stream)];
    bool image = res.kind == ResourceKind::Image;

    if (reads.any() && covers(reads.access, access)) {
        edge(t.writer.pass, pass);
        reads.lastPass = pass;
        return;
    }

    if (!t.hasWriter) {
        reads.lastPass = pass;
        reads.access |= access;
        return;
    }

    // Later reads on this stream in the same layout share this dependency.
    AccessInfo merged = access;
    for (const UseRef& next : ahead) {
        const AccessInfo& a = virtuals[next.virtualIndex].usages[next.usageIndex].access;
        if (next.first || streamOf(next.pass) != stream || isWriteAccess(a.access)) break;
        if (image && a.layout != t.layout) break;
        merged |= a;
    }

    const Producer& w = t.writer;
    if (w.pass != kNoPass && w.stream != stream) {
        crossQueue(w, pass, merged.stages);
    } else {
        edge(w.pass, pass);
        if (w.access.stages != kNoStages || w.access.access != VK_ACCESS_2_NONE) {
            AccessInfo src = w.access;
            AccessInfo dst = merged;
            src.layout = image ? t.layout : VK_IMAGE_LAYOUT_UNDEFINED;
            dst.layout = src.layout;
            Sync& sync = before_[pass];
            record(waited ? sync.crossQueue.waitBarriers : sync.queue, res, src, dst);
        }
    }

    reads.lastPass = pass;
    reads.access |= merged;
}

void SyncBuilder::write(Tracker& t, const PhysicalResource& res, std::uint32_t pass,
                        QueueType stream, AccessInfo access, bool discard, bool transfer,
                        bool waited) {
    bool image = res.kind == ResourceKind::Image;
    VkImageLayout oldLayout = discard ? VK_IMAGE_LAYOUT_UNDEFINED : t.layout;
    if (!image) {
        oldLayout     = VK_IMAGE_LAYOUT_UNDEFINED;
        access.layout = VK_IMAGE_LAYOUT_UNDEFINED;
    }

    VkPipelineStageFlags2 localStages = kNoStages;
    VkAccessFlags2        localAccess = VK_ACCESS_2_NONE;
    Producer              owner; // last user on the owning family, for a release

    auto consume = [&](const Producer& src) {
        if (src.pass == kNoPass || src.stream == stream) {
            localStages |= src.access.stages;
            localAccess |= src.access.access;
            edge(src.pass, pass);
        } else {
            crossQueue(src, pass, access.stages);
            waited = true;
        }
        if (transfer && src.pass != kNoPass && src.stream != stream &&
            (owner.pass == kNoPass || src.pass > owner.pass)) {
            owner = src;
        }
    };

    bool anyReads = false;
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        const StreamReads& r = t.reads[q];
        if (!r.any()) continue;
        anyReads = true;
        consume(Producer{r.lastPass, static_cast<QueueType>(q),
                         AccessInfo{r.access.stages, VK_ACCESS_2_NONE, r.access.layout}});
    }
    if (!anyReads && t.hasWriter) consume(t.writer);

    std::uint32_t srcFamily = VK_QUEUE_FAMILY_IGNORED;
    std::uint32_t dstFamily = VK_QUEUE_FAMILY_IGNORED;
    if (transfer) {
        srcFamily = t.family;
        dstFamily = familyOf(stream);
        if (owner.pass != kNoPass) {
            // Release on the owning stream right after its last use.
            record(after_[owner.pass].crossQueue.signalBarriers, res,
                   AccessInfo{owner.access.stages, owner.access.access, oldLayout},
                   AccessInfo{kNoStages, VK_ACCESS_2_NONE, access.layout}, srcFamily, dstFamily);
        }
    }

    bool transition = image && oldLayout != access.layout;
    if (transition || transfer || localStages != kNoStages) {
        AccessInfo src{localStages, localAccess, oldLayout};
        Sync& sync = before_[pass];
        if (waited) {
            src.stages |= stagesOrAll(access.stages);
            record(sync.crossQueue.waitBarriers, res, src, access, srcFamily, dstFamily);
        } else {
            record(sync.queue, res, src, access, srcFamily, dstFamily);
        }
    }

    t.hasWriter = true;
    t.writer    = Producer{pass, stream, access};
    t.reads     = {};
    t.layout    = access.layout;
    if (t.family != VK_QUEUE_FAMILY_IGNORED) t.family = familyOf(stream);
}

void SyncBuilder::walk(PhysicalResource& res, std::span<const UseRef> uses,
                       std::span<const VirtualResource> virtuals) {
    if (uses.empty()) return;

    Tracker t;
    initialize(t, res, virtuals[uses.front().virtualIndex], streamOf(uses.front().pass));
    bool image = res.kind == ResourceKind::Image;

    for (std::size_t i = 0; i < uses.size(); ++i) {
        const UseRef&          use = uses[i];
        const VirtualResource& v   = virtuals[use.virtualIndex];
        const UsageRecord&     u   = v.usages[use.usageIndex];
        QueueType stream = streamOf(use.pass);

        bool waited = false;
        if (t.externalWait) {
            auto& external = before_[use.pass].crossQueue.wait.external;
            external.insert(external.end(), t.externalWait->begin(), t.externalWait->end());
            t.externalWait = nullptr;
            waited         = true;
        }

        // Contents the pass does not read are discarded: first use of a
        // transient, first use of a freshly created persistent, or an image
        // written in full without reading.
        bool discard = use.first && (v.origin == ResourceOrigin::Transient ||
                                     (v.origin == ResourceOrigin::Persistent && res.fresh));
        if (image && !discard && isWriteAccess(u.access.access) &&
            !isReadAccess(u.access.access)) {
            const ImageDesc& desc = res.imageDesc.desc;
            discard = u.range.clamp(desc.mipLevels, desc.arrayLayers) == desc.fullRange();
        }

        bool transfer = !discard && t.family != VK_QUEUE_FAMILY_IGNORED &&
                        t.family != familyOf(stream);
        bool layoutChange = image && (discard || t.layout != u.access.layout);

        if (isWriteAccess(u.access.access) || layoutChange || transfer || discard) {
            write(t, res, use.pass, stream, u.access, discard, transfer, waited);
        } else {
            read(t, res, use.pass, stream, u.access, waited, uses.subspan(i + 1), virtuals);
        }
    }

    handOff(t, res, virtuals[uses.back().virtualIndex]);
}

// End-of-frame state: external final access and signals, persistent record.
void SyncBuilder::handOff(Tracker& t, PhysicalResource& res, const VirtualResource& v) {
    std::uint32_t last   = res.lastPass;
    QueueType     stream = streamOf(last);
    bool          image  = res.kind == ResourceKind::Image;

    AccessInfo local;
    if (t.writer.pass != kNoPass && t.writer.stream == stream) local = t.writer.access;
    local |= t.reads[queueIndex(stream)].access;
    local.layout = image ? t.layout : VK_IMAGE_LAYOUT_UNDEFINED;

    res.finalAccess = local;
    res.finalQueue  = stream;

    if (res.origin != ResourceOrigin::External) return;

    const AccessInfo& final = image ? v.externalImage.final : v.externalBuffer.final;
    const auto& signal      = image ? v.externalImage.signal : v.externalBuffer.signal;
    bool hasFinal = final.stages != kNoStages ||
                    (image && final.layout != VK_IMAGE_LAYOUT_UNDEFINED);
    if (!hasFinal && signal.empty()) return;

    // Readers on other streams finish before the hand-off.
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        const StreamReads& r = t.reads[q];
        if (!r.any() || static_cast<QueueType>(q) == stream) continue;
        crossQueue(Producer{r.lastPass, static_cast<QueueType>(q),
                            AccessInfo{r.access.stages, VK_ACCESS_2_NONE, r.access.layout}},
                   last, local.stages);
    }

    Sync& sync = after_[last];
    if (hasFinal) {
        AccessInfo dst = final;
        dst.layout = !image ? VK_IMAGE_LAYOUT_UNDEFINED
                     : final.layout != VK_IMAGE_LAYOUT_UNDEFINED ? final.layout
                                                                 : t.layout;
        record(signal.empty() ? sync.queue : sync.crossQueue.signalBarriers, res, local, dst);
        res.finalAccess = dst;
    }
    auto& external = sync.crossQueue.signal.external;
    external.insert(external.end(), signal.begin(), signal.end());
}

// ---------------------------------------------------------------------------
// Schedule
// ---------------------------------------------------------------------------

void SyncBuilder::schedule(std::span<const std::uint32_t> order, CompiledFrame& out) {
    std::array<Sync, kQueueTypeCount> pending{};

    // waited[s][q]: latest pass of stream q stream s already waited for.
    std::array<std::array<PassWait, kQueueTypeCount>, kQueueTypeCount> waited{};

    for (std::uint32_t pass : order) {
        std::uint32_t s      = queueIndex(streamOf(pass));
        Sync&         before = before_[pass];

        for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
            PassWait& w = before.crossQueue.wait.queues[q];
            if (!w.valid()) continue;

            const PassWait& done = waited[s][q];
            if (done.valid() && done.pass >= w.pass && (w.stages & ~done.stages) == 0) {
                w = PassWait{};
                continue;
            }

            // The producer's signal is still pending on its stream: submit it.
            const QueueSignal& signal = pending[q].crossQueue.signal;
            if (q != s && signal.pass != kNoPass && signal.pass >= w.pass) {
                out.steps.push_back(ScheduleStep{static_cast<QueueType>(q), kNoPass,
                                                 std::move(pending[q])});
                pending[q] = Sync{};
            }
        }

        for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
            const PassWait& w = before.crossQueue.wait.queues[q];
            if (!w.valid()) continue;
            PassWait& done = waited[s][q];
            if (!done.valid() || w.pass > done.pass) {
                done.pass   = w.pass;
                done.stages = w.stages;
            } else {
                done.stages |= w.stages;
            }
        }

        Sync sync = std::move(pending[s]);
        sync.merge(before);
        pending[s] = std::move(after_[pass]);

        out.steps.push_back(ScheduleStep{static_cast<QueueType>(s), pass, std::move(sync)});
        out.streamUsed[s] = true;
    }

    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) out.finish[q] = std::move(pending[q]);
}

// ---------------------------------------------------------------------------
// Ordering: Kahn's algorithm, smallest declaration index first.
// ---------------------------------------------------------------------------

Result<std::vector<std::uint32_t>> topologicalOrder(
    std::uint32_t passCount, const std::vector<std::pair<std::uint32_t, std::uint32_t>>& edges) {
    std::vector<std::vector<std::uint32_t>> adj(passCount);
    std::vector<std::uint32_t> inDegree(passCount, 0);
    for (const auto& [from, to] : edges) {
        adj[from].push_back(to);
        ++inDegree[to];
    }

    std::priority_queue<std::uint32_t, std::vector<std::uint32_t>, std::greater<>> ready;
    for (std::uint32_t i = 0; i < passCount; ++i) {
        if (inDegree[i] == 0) ready.push(i);
    }

    std::vector<std::uint32_t> order;
    order.reserve(passCount);
    while (!ready.empty()) {
        std::uint32_t node = ready.top();
        ready.pop();
        order.push_back(node);
        for (std::uint32_t next : adj[node]) {
            if (--inDegree[next] == 0) ready.push(next);
        }
    }

    if (order.size() != passCount) {
        return Error{"compile frame", 0, "cycle detected in pass dependencies"};
    }
    return order;
}

void countStats(const Sync& sync, CompileStats& stats) {
    const BarrierBatch* batches[] = {&sync.queue, &sync.crossQueue.signalBarriers,
                                     &sync.crossQueue.waitBarriers};
    for (const BarrierBatch* b : batches) {
        stats.memoryBarrierCount += static_cast<std::uint32_t>(b->memoryBarriers.size());
        stats.imageBarrierCount  += static_cast<std::uint32_t>(b->imageBarriers.size());
        stats.bufferBarrierCount += static_cast<std::uint32_t>(b->bufferBarriers.size());
    }
    if (!sync.crossQueue.signal.empty()) ++stats.signalCount;
    for (const auto& w : sync.crossQueue.wait.queues) {
        if (w.valid()) ++stats.waitCount;
    }
    stats.waitCount += static_cast<std::uint32_t>(sync.crossQueue.wait.external.size());
}

} // namespace

// ---------------------------------------------------------------------------
// compileFrame
// ---------------------------------------------------------------------------

Result<CompiledFrame> compileFrame(Arena& arena, std::span<const PassNode> passes,
                                   std::span<VirtualResource> resources,
                                   const QueueTopology& topology, ResourceProvider& provider,
                                   const CompileOptions& options) {
    auto start = std::chrono::steady_clock::now();

    CompiledFrame out;
    out.stats.passCount = static_cast<std::uint32_t>(passes.size());

    mergeUsages(passes, resources);
    assignPhysical(resources, options.aliasTransients, out);

    auto resolved = resolvePhysical(resources, provider, out);
    if (!resolved.ok()) return resolved.error();

    // Uses of each physical resource in pass order.
    std::vector<ArenaVector<UseRef>> uses;
    uses.reserve(out.resources.size());
    for (std::size_t p = 0; p < out.resources.size(); ++p) {
        uses.emplace_back(ArenaAllocator<UseRef>(arena));
    }
    for (std::uint32_t v = 0; v < resources.size(); ++v) {
        std::uint32_t p = out.resourceMap[v];
        if (p == kNoResource) continue;
        const auto& usages = resources[v].usages;
        for (std::uint32_t u = 0; u < usages.size(); ++u) {
            uses[p].push_back(UseRef{usages[u].pass, v, u, u == 0});
        }
    }

    SyncBuilder builder(arena, passes, topology);
    for (std::uint32_t p = 0; p < out.resources.size(); ++p) {
        std::stable_sort(uses[p].begin(), uses[p].end(),
                         [](const UseRef& a, const UseRef& b) { return a.pass < b.pass; });
        builder.walk(out.resources[p], uses[p], resources);
    }

    out.edges = builder.takeEdges();
    auto order = topologicalOrder(static_cast<std::uint32_t>(passes.size()), out.edges);
    if (!order.ok()) return order.error();
    out.order = std::move(order).value();

    builder.schedule(out.order, out);

    out.stats.stepCount     = static_cast<std::uint32_t>(out.steps.size());
    out.stats.physicalCount = static_cast<std::uint32_t>(out.resources.size());
    for (const auto& step : out.steps) countStats(step.sync, out.stats);
    for (const auto& sync : out.finish) countStats(sync, out.stats);

    auto end = std::chrono::steady_clock::now();
    out.stats.compileTimeUs = std::chrono::duration<double, std::micro>(end - start).count();
    return out;
}

// ---------------------------------------------------------------------------
// Debug dump
// ---------------------------------------------------------------------------

static void dumpBatch(const char* label, const BarrierBatch& batch) {
    for (const auto& m : batch.memoryBarriers) {
        std::string line;
        appendStageBits(line, m.srcStageMask);
        line += " -> ";
        appendStageBits(line, m.dstStageMask);
        line += " (";
        appendAccessBits(line, m.srcAccessMask);
        line += " -> ";
        appendAccessBits(line, m.dstAccessMask);
        line += ")";
        std::fprintf(stderr, "      %s memory: %s\n", label, line.c_str());
    }
    for (const auto& b : batch.imageBarriers) {
        std::string stages;
        appendStageBits(stages, b.srcStageMask);
        stages += " -> ";
        appendStageBits(stages, b.dstStageMask);
        std::fprintf(stderr, "      %s image: %s -> %s [%s]", label, layoutName(b.oldLayout),
                     layoutName(b.newLayout), stages.c_str());
        if (b.srcQueueFamilyIndex != b.dstQueueFamilyIndex) {
            std::fprintf(stderr, " family %u -> %u", b.srcQueueFamilyIndex,
                         b.dstQueueFamilyIndex);
        }
        std::fprintf(stderr, "\n");
    }
    for (const auto& b : batch.bufferBarriers) {
        std::fprintf(stderr, "      %s buffer: family %u -> %u\n", label, b.srcQueueFamilyIndex,
                     b.dstQueueFamilyIndex);
    }
}

static void dumpSync(const Sync& sync, std::span<const PassNode> passes) {
    const auto& cq = sync.crossQueue;
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        const PassWait& w = cq.wait.queues[q];
        if (!w.valid()) continue;
        std::string stages;
        appendStageBits(stages, w.stages);
        std::fprintf(stderr, "      wait %s after '%.*s' at %s\n",
                     queueTypeName(static_cast<QueueType>(q)),
                     static_cast<int>(passes[w.pass].name.size()), passes[w.pass].name.data(),
                     stages.c_str());
    }
    for (const auto& e : cq.wait.external) {
        std::fprintf(stderr, "      wait external semaphore (value %llu)\n",
                     static_cast<unsigned long long>(e.value));
    }
    dumpBatch("queue", sync.queue);
    dumpBatch("release", cq.signalBarriers);
    if (!cq.signal.empty()) {
        std::string stages;
        appendStageBits(stages, cq.signal.stages);
        std::fprintf(stderr, "      signal at %s (+%zu external)\n", stages.c_str(),
                     cq.signal.external.size());
    }
    dumpBatch("acquire", cq.waitBarriers);
}

void dumpCompiledFrame(const CompiledFrame& frame, std::span<const PassNode> passes) {
    const CompileStats& s = frame.stats;
    std::fprintf(stderr,
                 "[vkfg::graph] compiled %u passes into %u steps (%.1f us)\n"
                 "[vkfg::graph]   %u physical resources, %u aliased\n"
                 "[vkfg::graph]   barriers: %u memory, %u image, %u buffer; "
                 "%u signals, %u waits\n",
                 s.passCount, s.stepCount, s.compileTimeUs, s.physicalCount, s.aliasedCount,
                 s.memoryBarrierCount, s.imageBarrierCount, s.bufferBarrierCount, s.signalCount,
                 s.waitCount);

    for (std::uint32_t r = 0; r < frame.resources.size(); ++r) {
        const PhysicalResource& p = frame.resources[r];
        std::fprintf(stderr, "  resource %u: %s, passes %u..%u, %u virtual%s\n", r,
                     p.kind == ResourceKind::Buffer ? "buffer" : "image", p.firstPass,
                     p.lastPass, p.virtualCount, p.fresh ? ", fresh" : "");
    }
    for (const auto& step : frame.steps) {
        std::string_view name = step.pass == kNoPass ? std::string_view("<flush>")
                                                     : passes[step.pass].name;
        std::fprintf(stderr, "  [%-8s] %.*s  sync=%s\n", queueTypeName(step.queue),
                     static_cast<int>(name.size()), name.data(), syncKindName(step.sync.kind()));
        dumpSync(step.sync, passes);
    }
    for (std::uint32_t q = 0; q < kQueueTypeCount; ++q) {
        if (!frame.streamUsed[q]) continue;
        std::fprintf(stderr, "  [%-8s] <finish>  sync=%s\n",
                     queueTypeName(static_cast<QueueType>(q)),
                     syncKindName(frame.finish[q].kind()));
        dumpSync(frame.finish[q], passes);
    }
}

} // namespace vkfg::graph
