#include <vkfg/graph/render_graph.hpp>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

namespace vkfg::graph {

// ---------------------------------------------------------------------------
// Provider: serves the compiler from the graph's caches
// ---------------------------------------------------------------------------

class RenderGraph::Provider final : public ResourceProvider {
public:
    Provider(RenderGraph& graph, std::uint32_t slot) : graph_(graph), slot_(slot) {}

    Result<Acquired<BufferHandle>> buffer(const BufferCreateDesc& desc) override {
        // Host-visible buffers are per slot: the CPU writes them while the
        // previous frame may still be reading its own copy.
        if (desc.desc.location != BufferLocation::GpuOnly) {
            return graph_.hostBuffers_[slot_].getOrCreate(graph_.ctx_, desc);
        }
        return graph_.buffers_.getOrCreate(graph_.ctx_, desc);
    }

    Result<Acquired<ImageHandle>> image(const ImageCreateDesc& desc) override {
        return graph_.images_.getOrCreate(graph_.ctx_, desc);
    }

    Result<PersistentAcquired<BufferHandle>> persistentBuffer(
        PersistId id, const BufferCreateDesc& desc) override {
        return graph_.persistentBuffers_.get(graph_.ctx_, id, desc);
    }

    Result<PersistentAcquired<ImageHandle>> persistentImage(
        PersistId id, const ImageCreateDesc& desc) override {
        return graph_.persistentImages_.get(graph_.ctx_, id, desc);
    }

private:
    RenderGraph&  graph_;
    std::uint32_t slot_;
};

// ---------------------------------------------------------------------------
// PassBuilder
// ---------------------------------------------------------------------------

static UsageRecord usageRecord(const BufferUsage& usage) {
    UsageRecord r;
    r.access      = usage.info();
    r.createUsage = usage.usage;
    return r;
}

static UsageRecord usageRecord(const ImageUsage& usage) {
    UsageRecord r;
    r.access      = usage.info();
    r.createUsage = usage.usage;
    r.range       = usage.range;
    r.viewFormat  = usage.viewFormat;
    return r;
}

// Views in another format need a mutable-format image.
static void requireViewFormat(ImageDesc& desc, const ImageUsage& usage) {
    if (usage.viewFormat != VK_FORMAT_UNDEFINED && usage.viewFormat != desc.format) {
        desc.flags |= VK_IMAGE_CREATE_MUTABLE_FORMAT_BIT;
    }
}

std::uint32_t PassBuilder::addResource(VirtualResource resource) {
    auto index = static_cast<std::uint32_t>(frame_->resources_.size());
    frame_->resources_.push_back(std::move(resource));
    return index;
}

void PassBuilder::addUsage(std::uint32_t resource, UsageRecord record) {
    record.pass = pass_;
    frame_->resources_[resource].usages.push_back(record);
}

BufferRes PassBuilder::resource(const BufferDesc& desc, const BufferUsage& usage) {
    VirtualResource v;
    v.kind       = ResourceKind::Buffer;
    v.origin     = ResourceOrigin::Transient;
    v.bufferDesc = desc;

    std::uint32_t index = addResource(std::move(v));
    addUsage(index, usageRecord(usage));
    return BufferRes{index, frame_->generation_};
}

ImageRes PassBuilder::resource(const ImageDesc& desc, const ImageUsage& usage) {
    VirtualResource v;
    v.kind      = ResourceKind::Image;
    v.origin    = ResourceOrigin::Transient;
    v.imageDesc = desc;
    requireViewFormat(v.imageDesc, usage);

    std::uint32_t index = addResource(std::move(v));
    addUsage(index, usageRecord(usage));
    return ImageRes{index, frame_->generation_};
}

void PassBuilder::reference(BufferRes res, const BufferUsage& usage) {
    (void)frame_->checked(res.index, res.generation, ResourceKind::Buffer, "reference buffer");
    addUsage(res.index, usageRecord(usage));
}

void PassBuilder::reference(ImageRes res, const ImageUsage& usage) {
    VirtualResource& v =
        frame_->checked(res.index, res.generation, ResourceKind::Image, "reference image");
    if (v.origin != ResourceOrigin::External) requireViewFormat(v.imageDesc, usage);
    addUsage(res.index, usageRecord(usage));
}

BufferRes PassBuilder::import(const ExternalBuffer& external, const BufferUsage& usage) {
    VirtualResource v;
    v.kind           = ResourceKind::Buffer;
    v.origin         = ResourceOrigin::External;
    v.externalBuffer = external;
    v.bufferDesc     = BufferDesc::gpu(external.handle.size);

    std::uint32_t index = addResource(std::move(v));
    addUsage(index, usageRecord(usage));
    return BufferRes{index, frame_->generation_};
}

ImageRes PassBuilder::import(const ExternalImage& external, const ImageUsage& usage) {
    VirtualResource v;
    v.kind          = ResourceKind::Image;
    v.origin        = ResourceOrigin::External;
    v.externalImage = external;

    // Fill what the caller left out from the handle.
    ImageDesc& d = v.externalImage.desc;
    if (d.format == VK_FORMAT_UNDEFINED) d.format = external.handle.format;
    if (d.width == 0) {
        d.width       = external.handle.extent.width;
        d.height      = external.handle.extent.height;
        d.depth       = external.handle.extent.depth == 0 ? 1 : external.handle.extent.depth;
        d.mipLevels   = external.handle.mipLevels;
        d.arrayLayers = external.handle.arrayLayers;
    }
    v.imageDesc = d;

    std::uint32_t index = addResource(std::move(v));
    addUsage(index, usageRecord(usage));
    return ImageRes{index, frame_->generation_};
}

static void checkPersistId(const Frame& frame, const std::vector<VirtualResource>& resources,
                           PersistId id) {
    if (!id.valid()) {
        fatal(Error{"declare persistent resource", 0, "invalid PersistId (use nextPersistId())"});
    }
    for (const auto& r : resources) {
        if (r.origin == ResourceOrigin::Persistent && r.persist == id) {
            fatal(Error{"declare persistent resource", 0,
                        "PersistId " + std::to_string(id.value) + " declared twice in frame " +
                            std::to_string(frame.generation()) +
                            "; reference() the first handle instead"});
        }
    }
}

BufferRes PassBuilder::persistent(PersistId id, const BufferDesc& desc, const BufferUsage& usage) {
    checkPersistId(*frame_, frame_->resources_, id);

    VirtualResource v;
    v.kind       = ResourceKind::Buffer;
    v.origin     = ResourceOrigin::Persistent;
    v.bufferDesc = desc;
    v.persist    = id;

    std::uint32_t index = addResource(std::move(v));
    addUsage(index, usageRecord(usage));
    return BufferRes{index, frame_->generation_};
}

ImageRes PassBuilder::persistent(PersistId id, const ImageDesc& desc, const ImageUsage& usage) {
    checkPersistId(*frame_, frame_->resources_, id);

    VirtualResource v;
    v.kind      = ResourceKind::Image;
    v.origin    = ResourceOrigin::Persistent;
    v.imageDesc = desc;
    v.persist   = id;
    requireViewFormat(v.imageDesc, usage);

    std::uint32_t index = addResource(std::move(v));
    addUsage(index, usageRecord(usage));
    return ImageRes{index, frame_->generation_};
}

const BufferDesc& PassBuilder::desc(BufferRes res) const {
    return frame_->checked(res.index, res.generation, ResourceKind::Buffer, "query buffer desc")
        .bufferDesc;
}

const ImageDesc& PassBuilder::desc(ImageRes res) const {
    const VirtualResource& v =
        frame_->checked(res.index, res.generation, ResourceKind::Image, "query image desc");
    return v.origin == ResourceOrigin::External ? v.externalImage.desc : v.imageDesc;
}

void PassBuilder::build(RecordFn record) {
    frame_->passes_[pass_].record = std::move(record);
}

// ---------------------------------------------------------------------------
// Frame
// ---------------------------------------------------------------------------

Frame::~Frame() {
    if (graph_ && !ran_) graph_->frameOpen_ = false;
}

Frame::Frame(Frame&& o) noexcept
    : graph_(o.graph_), generation_(o.generation_), arena_(o.arena_),
      passes_(std::move(o.passes_)), nodes_(std::move(o.nodes_)),
      resources_(std::move(o.resources_)), data_(std::move(o.data_)),
      regions_(std::move(o.regions_)), retired_(std::move(o.retired_)),
      endSignals_(std::move(o.endSignals_)), externalViews_(std::move(o.externalViews_)),
      ran_(o.ran_) {
    o.graph_ = nullptr;
}

PassBuilder Frame::pass(std::string_view name, QueueType queue) {
    if (ran_) fatal(Error{"declare pass", 0, "frame already ran"});

    Arena& arena = *arena_;
    std::string_view copied = arena.copyString(name);
    std::string_view label  = copied;
    if (!regions_.empty()) {
        std::string path;
        for (auto region : regions_) {
            path += region;
            path += '/';
        }
        path += name;
        label = arena.copyString(path);
    }

    auto index = static_cast<std::uint32_t>(passes_.size());
    passes_.push_back(PassDecl{copied, label, queue, {}});
    nodes_.push_back(PassNode{label, queue});
    return PassBuilder(*this, index);
}

void Frame::startRegion(std::string_view name) {
    regions_.push_back(arena_->copyString(name));
}

void Frame::endRegion() {
    if (regions_.empty()) fatal(Error{"end region", 0, "endRegion() without startRegion()"});
    regions_.pop_back();
}

void Frame::deleteLater(Retired item) {
    retired_.push_back(std::move(item));
}

void Frame::signalAtEnd(QueueType queue, const ExternalSemaphore& semaphore) {
    endSignals_.emplace_back(queue, semaphore);
}

std::span<const std::byte> Frame::copyBytes(std::span<const std::byte> data) {
    if (data.empty()) fatal(Error{"stage data", 0, "nothing to upload"});
    std::byte* out = arena_->allocateArray<std::byte>(data.size());
    if (!out) {
        fatal(Error{"stage data", 0,
                    "arena exhausted copying " + std::to_string(data.size()) + " bytes"});
    }
    std::memcpy(out, data.data(), data.size());
    return {out, data.size()};
}

void Frame::recordBufferStage(PassBuilder& pass, BufferRes dst, VkDeviceSize offset,
                              std::span<const std::byte> data) {
    if (offset + data.size() > pass.desc(dst).size) {
        fatal(Error{"stage buffer", 0,
                    std::to_string(data.size()) + " bytes at offset " + std::to_string(offset) +
                        " overrun a " + std::to_string(pass.desc(dst).size) + " byte buffer"});
    }

    BufferRes staging = pass.resource(BufferDesc::upload(data.size()), usage::transferSrc());
    pass.build([staging, dst, offset, data](PassContext& ctx, VkCommandBuffer cmd) {
        BufferHandle src = ctx.get(staging);
        std::memcpy(src.mapped, data.data(), data.size());

        VkBufferCopy region{};
        region.srcOffset = 0;
        region.dstOffset = offset;
        region.size      = data.size();
        vkCmdCopyBuffer(cmd, src.buffer, ctx.get(dst).buffer, 1, &region);
    });
}

void Frame::recordImageStage(PassBuilder& pass, ImageRes dst, const ImageStage& stage,
                             std::span<const std::byte> data) {
    BufferRes staging = pass.resource(BufferDesc::upload(data.size()), usage::transferSrc());
    pass.build([staging, dst, stage, data](PassContext& ctx, VkCommandBuffer cmd) {
        BufferHandle src = ctx.get(staging);
        std::memcpy(src.mapped, data.data(), data.size());

        ImageHandle      target = ctx.get(dst);
        SubresourceRange range  = stage.range.clamp(target.mipLevels, target.arrayLayers);

        // Buffer copies address one aspect; depth-stencil uploads write depth.
        VkImageAspectFlags aspect = aspectFromFormat(target.format);
        if (aspect & VK_IMAGE_ASPECT_DEPTH_BIT) aspect = VK_IMAGE_ASPECT_DEPTH_BIT;

        VkExtent3D extent = stage.extent;
        if (extent.width == 0 || extent.height == 0 || extent.depth == 0) {
            auto edge = [&](std::uint32_t size, std::int32_t offset) {
                std::uint32_t mip = std::max(size >> range.baseMipLevel, 1u);
                return mip - static_cast<std::uint32_t>(offset);
            };
            extent.width  = edge(target.extent.width, stage.offset.x);
            extent.height = edge(target.extent.height, stage.offset.y);
            extent.depth  = edge(std::max(target.extent.depth, 1u), stage.offset.z);
        }

        VkBufferImageCopy region{};
        region.bufferOffset                    = 0;
        region.bufferRowLength                 = stage.rowLength;
        region.bufferImageHeight               = stage.imageHeight;
        region.imageSubresource.aspectMask     = aspect;
        region.imageSubresource.mipLevel       = range.baseMipLevel;
        region.imageSubresource.baseArrayLayer = range.baseArrayLayer;
        region.imageSubresource.layerCount     = range.layerCount;
        region.imageOffset                     = stage.offset;
        region.imageExtent                     = extent;
        vkCmdCopyBufferToImage(cmd, src.buffer, target.image,
                               VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
    });
}

static void checkImageStage(const ImageStage& stage) {
    if (stage.range.levelCount != 1) {
        fatal(Error{"stage image", 0,
                    "one mip level per copy, got levelCount " +
                        std::to_string(stage.range.levelCount)});
    }
}

void Frame::stageBuffer(std::string_view name, BufferRes dst, VkDeviceSize offset,
                        std::span<const std::byte> data, QueueType queue) {
    std::span<const std::byte> bytes = copyBytes(data);
    PassBuilder p = pass(name, queue);
    p.reference(dst, usage::transferDst());
    recordBufferStage(p, dst, offset, bytes);
}

BufferRes Frame::stageBuffer(std::string_view name, const BufferDesc& desc, VkDeviceSize offset,
                             std::span<const std::byte> data, QueueType queue) {
    std::span<const std::byte> bytes = copyBytes(data);
    PassBuilder p = pass(name, queue);
    BufferRes dst = p.resource(desc, usage::transferDst());
    recordBufferStage(p, dst, offset, bytes);
    return dst;
}

void Frame::stageImage(std::string_view name, ImageRes dst, const ImageStage& stage,
                       std::span<const std::byte> data, QueueType queue) {
    checkImageStage(stage);
    std::span<const std::byte> bytes = copyBytes(data);
    PassBuilder p = pass(name, queue);
    p.reference(dst, usage::transferDstImage().subresource(stage.range));
    recordImageStage(p, dst, stage, bytes);
}

ImageRes Frame::stageImage(std::string_view name, const ImageDesc& desc, const ImageStage& stage,
                           std::span<const std::byte> data, QueueType queue) {
    checkImageStage(stage);
    std::span<const std::byte> bytes = copyBytes(data);
    PassBuilder p = pass(name, queue);
    ImageRes dst = p.resource(desc, usage::transferDstImage().subresource(stage.range));
    recordImageStage(p, dst, stage, bytes);
    return dst;
}

const VirtualResource& Frame::checked(std::uint32_t index, std::uint64_t generation,
                                      ResourceKind kind, const char* operation) const {
    if (generation != generation_ || index >= resources_.size()) {
        fatal(Error{operation, 0,
                    "stale resource handle " + std::to_string(index) + " from frame " +
                        std::to_string(generation) + " used in frame " +
                        std::to_string(generation_)});
    }
    if (resources_[index].kind != kind) {
        fatal(Error{operation, 0,
                    "resource handle " + std::to_string(index) + " has the wrong kind"});
    }
    return resources_[index];
}

VirtualResource& Frame::checked(std::uint32_t index, std::uint64_t generation, ResourceKind kind,
                                const char* operation) {
    const Frame& self = *this;
    return const_cast<VirtualResource&>(self.checked(index, generation, kind, operation));
}

void Frame::checkData(std::uint32_t index, std::uint64_t generation,
                      const char* operation) const {
    if (generation != generation_ || index >= data_.size()) {
        fatal(Error{operation, 0,
                    "stale data handle " + std::to_string(index) + " from frame " +
                        std::to_string(generation)});
    }
}

Result<void> Frame::run() {
    if (!graph_) fatal(Error{"run frame", 0, "frame was moved from"});
    return graph_->run(*this);
}

// ---------------------------------------------------------------------------
// PassContext
// ---------------------------------------------------------------------------

const PhysicalResource& PassContext::physical(std::uint32_t index, std::uint64_t generation,
                                              ResourceKind kind) const {
    (void)frame_->checked(index, generation, kind, "resolve resource");
    std::uint32_t p = compiled_->resourceMap[index];
    if (p == kNoResource) {
        fatal(Error{"resolve resource", 0,
                    "resource " + std::to_string(index) + " was never bound"});
    }
    return compiled_->resources[p];
}

BufferHandle PassContext::get(BufferRes res) const {
    return physical(res.index, res.generation, ResourceKind::Buffer).buffer;
}

ImageHandle PassContext::get(ImageRes res) const {
    return physical(res.index, res.generation, ResourceKind::Image).image;
}

bool PassContext::isUninit(BufferRes res) const {
    const PhysicalResource& p = physical(res.index, res.generation, ResourceKind::Buffer);
    const VirtualResource&  v = frame_->resources_[res.index];
    if (v.origin == ResourceOrigin::Transient) return true;
    return v.origin == ResourceOrigin::Persistent && p.fresh;
}

bool PassContext::isUninit(ImageRes res) const {
    const PhysicalResource& p = physical(res.index, res.generation, ResourceKind::Image);
    const VirtualResource&  v = frame_->resources_[res.index];
    if (v.origin == ResourceOrigin::Transient) return true;
    return v.origin == ResourceOrigin::Persistent && p.fresh;
}

Result<VkImageView> PassContext::view(ImageRes res, const ImageViewRequest& request) {
    const PhysicalResource& p = physical(res.index, res.generation, ResourceKind::Image);

    ImageViewDesc desc;
    desc.image  = p.image.image;
    desc.format = request.format != VK_FORMAT_UNDEFINED ? request.format : p.image.format;
    desc.range  = request.range.clamp(p.image.mipLevels, p.image.arrayLayers);

    desc.aspect = request.aspect;
    if (desc.aspect == 0) {
        desc.aspect = aspectFromFormat(desc.format);
        if (desc.aspect & VK_IMAGE_ASPECT_DEPTH_BIT) desc.aspect = VK_IMAGE_ASPECT_DEPTH_BIT;
    }

    if (request.type != VK_IMAGE_VIEW_TYPE_MAX_ENUM) {
        desc.type = request.type;
    } else {
        ImageDesc shape   = p.imageDesc.desc;
        shape.arrayLayers = desc.range.layerCount;
        desc.type         = defaultViewType(shape);
    }

    if (frame_->resources_[res.index].origin == ResourceOrigin::External) {
        for (const auto& [made, handle] : frame_->externalViews_) {
            if (made == desc) return handle;
        }
        auto created = PhysicalImageView::create(graph_->ctx_, desc);
        if (!created.ok()) return created.error();
        VkImageView handle = created->handle();
        frame_->externalViews_.emplace_back(desc, handle);
        graph_->deleter_.push(created.value());
        return handle;
    }

    auto view = graph_->views_.get(graph_->ctx_, desc);
    if (!view.ok()) return view.error();
    return view->handle;
}

void PassContext::deleteLater(Retired item) {
    graph_->deleter_.push(std::move(item));
}

QueueType PassContext::queue() const {
    return frame_->passes_[pass_].queue;
}

std::string_view PassContext::name() const {
    return frame_->passes_[pass_].name;
}

// ---------------------------------------------------------------------------
// RenderGraph
// ---------------------------------------------------------------------------

Result<RenderGraph> RenderGraph::create(const Device& device, const Allocator& allocator,
                                        const GraphConfig& config) {
    if (allocator.native() == nullptr) {
        return Error{"create render graph", 0, "allocator was moved from"};
    }

    RenderGraph g;
    g.device_ = &device;
    g.ctx_    = ResourceContext::from(device, allocator);
    g.config_ = config;
    g.hostBuffers_.resize(kFramesInFlight);

    auto backend = VulkanBackend::create(device, kFramesInFlight, config.debugLabels);
    if (!backend.ok()) return backend.error();
    g.backend_.emplace(std::move(backend).value());

    return g;
}

RenderGraph::~RenderGraph() { destroy(); }

RenderGraph::RenderGraph(RenderGraph&& o) noexcept
    : device_(o.device_), ctx_(o.ctx_), config_(o.config_), arena_(std::move(o.arena_)),
      buffers_(std::move(o.buffers_)), hostBuffers_(std::move(o.hostBuffers_)),
      images_(std::move(o.images_)), views_(std::move(o.views_)),
      persistentBuffers_(std::move(o.persistentBuffers_)),
      persistentImages_(std::move(o.persistentImages_)), deleter_(std::move(o.deleter_)),
      backend_(std::move(o.backend_)), ring_(std::move(o.ring_)), lastStats_(o.lastStats_),
      generation_(o.generation_), frameOpen_(o.frameOpen_) {
    o.device_ = nullptr;
    o.backend_.reset();
}

RenderGraph& RenderGraph::operator=(RenderGraph&& o) noexcept {
    if (this != &o) {
        destroy();
        device_            = o.device_;
        ctx_               = o.ctx_;
        config_            = o.config_;
        arena_             = std::move(o.arena_);
        buffers_           = std::move(o.buffers_);
        hostBuffers_       = std::move(o.hostBuffers_);
        images_            = std::move(o.images_);
        views_             = std::move(o.views_);
        persistentBuffers_ = std::move(o.persistentBuffers_);
        persistentImages_  = std::move(o.persistentImages_);
        deleter_           = std::move(o.deleter_);
        backend_           = std::move(o.backend_);
        ring_              = std::move(o.ring_);
        lastStats_         = o.lastStats_;
        generation_        = o.generation_;
        frameOpen_         = o.frameOpen_;
        o.device_ = nullptr;
        o.backend_.reset();
    }
    return *this;
}

void RenderGraph::destroy() {
    if (device_ == nullptr) return;

    if (backend_) {
        // VKFG_BLOCKING_WAIT: teardown waits for every stream before freeing.
        auto idle = backend_->waitAll();
        if (!idle.ok()) {
            std::fprintf(stderr, "[vkfg::graph] destroying graph: %s\n",
                         idle.error().format().c_str());
        }
    }

    // Views reference images, so they go first.
    views_.destroy(ctx_);
    images_.destroy(ctx_);
    buffers_.destroy(ctx_);
    for (auto& cache : hostBuffers_) cache.destroy(ctx_);
    persistentImages_.destroy(ctx_);
    persistentBuffers_.destroy(ctx_);
    deleter_.destroy(ctx_);

    backend_.reset();
    device_ = nullptr;
}

Frame RenderGraph::frame() {
    if (!frameOpen_) arena_.reset();
    return frame(arena_);
}

Frame RenderGraph::frame(Arena& arena) {
    if (frameOpen_) {
        fatal(Error{"begin frame", 0, "previous frame is still open; run() or drop it first"});
    }
    frameOpen_ = true;
    return Frame(*this, generation_++, arena);
}

Result<void> RenderGraph::waitIdle() {
    if (!backend_) return {};
    return backend_->waitAll();
}

void RenderGraph::deleteLater(Retired item) {
    deleter_.push(std::move(item));
}

GraphStats RenderGraph::stats() const {
    GraphStats s;
    s.frameIndex    = ring_.frameIndex();
    s.lastFrame     = lastStats_;
    s.cachedBuffers = buffers_.liveCount();
    for (const auto& cache : hostBuffers_) s.cachedHostBuffers += cache.liveCount();
    s.cachedImages        = images_.liveCount();
    s.cachedViews         = views_.size();
    s.persistentResources = persistentBuffers_.size() + persistentImages_.size();
    s.pendingDeletes      = deleter_.pending();
    s.arenaBytes          = arena_.bytesUsed();
    return s;
}

Result<void> RenderGraph::run(Frame& frame) {
    if (frame.ran_) fatal(Error{"run frame", 0, "Frame::run() called twice"});
    if (!frame.regions_.empty()) {
        fatal(Error{"run frame", 0,
                    "region '" + std::string(frame.regions_.back()) + "' never ended"});
    }
    frame.ran_ = true;
    frameOpen_ = false;

    std::uint32_t slot = ring_.slot();
    if (auto r = ring_.beginFrame(*backend_); !r.ok()) return r;

    // Everything the slot's previous frame used is idle now.
    deleter_.next(ctx_);
    for (auto& item : frame.retired_) deleter_.push(std::move(item));
    frame.retired_.clear();

    // From here on the slot is consumed: every exit completes the ring so
    // whatever reached the GPU is waited on before the slot comes back.
    if (auto r = backend_->beginSlot(slot); !r.ok()) {
        ring_.complete(FrameSlotState{});
        return r;
    }

    views_.reset(ctx_);
    images_.reset(ctx_);
    buffers_.reset(ctx_);
    hostBuffers_[slot].reset(ctx_);
    persistentImages_.reset(ctx_);
    persistentBuffers_.reset(ctx_);

#ifndef NDEBUG
    for (const auto& pass : frame.passes_) {
        if (!pass.record) {
            std::fprintf(stderr, "[vkfg::graph] pass '%.*s' has no build(); records nothing\n",
                         static_cast<int>(pass.label.size()), pass.label.data());
        }
    }
#endif

    Provider provider(*this, slot);
    CompileOptions options;
    options.aliasTransients = config_.aliasTransients;

    auto compiled = compileFrame(*frame.arena_, frame.nodes_, frame.resources_,
                                 device_->topology(), provider, options);
    if (!compiled.ok()) {
        ring_.complete(FrameSlotState{});
        return compiled.error();
    }
    CompiledFrame& cf = compiled.value();

    for (const auto& [queue, semaphore] : frame.endSignals_) {
        std::uint32_t s = queueIndex(device_->topology().resolve(queue));
        cf.finish[s].crossQueue.signal.external.push_back(semaphore);
        cf.streamUsed[s] = true;
    }

    if (config_.verbose) dumpCompiledFrame(cf, frame.nodes_);

    RecordPass record = [&](std::uint32_t pass, VkCommandBuffer cmd) -> Result<void> {
        const RecordFn& fn = frame.passes_[pass].record;
        if (!fn) return {};
        PassContext ctx(*this, frame, cf, pass);
        fn(ctx, cmd);
        return {};
    };

    ExecuteOptions exec;
    exec.labels = config_.debugLabels;

    FrameSlotState submitted;
    auto state = executeFrame(cf, frame.nodes_, *backend_, ring_.previous(), record, exec,
                              &submitted);
    if (!state.ok()) {
        ring_.complete(submitted);
        return state.error();
    }

    for (const auto& p : cf.resources) {
        if (p.origin != ResourceOrigin::Persistent) continue;
        if (p.kind == ResourceKind::Buffer) {
            persistentBuffers_.record(p.persist, p.finalAccess, p.finalQueue);
        } else {
            persistentImages_.record(p.persist, p.finalAccess, p.finalQueue);
        }
    }

    ring_.complete(state.value());
    lastStats_ = cf.stats;
    return {};
}

} // namespace vkfg::graph
