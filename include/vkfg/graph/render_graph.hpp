#pragma once

#include <vkfg/allocator.hpp>
#include <vkfg/arena.hpp>
#include <vkfg/config.hpp>
#include <vkfg/device.hpp>
#include <vkfg/error.hpp>
#include <vkfg/graph/cache.hpp>
#include <vkfg/graph/compiler.hpp>
#include <vkfg/graph/deleter.hpp>
#include <vkfg/graph/physical.hpp>
#include <vkfg/graph/resource.hpp>
#include <vkfg/graph/submitter.hpp>
#include <vkfg/graph/usage.hpp>
#include <vkfg/graph/vulkan_backend.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vkfg::graph {

class Frame;
class PassBuilder;
class PassContext;
class RenderGraph;

// Records one pass. Runs during Frame::run(), after every barrier and wait
// the pass needs has been placed.
using RecordFn = std::function<void(PassContext&, VkCommandBuffer)>;

// How a pass wants to look at an image. Unset fields follow the image.
struct ImageViewRequest {
    VkImageViewType    type   = VK_IMAGE_VIEW_TYPE_MAX_ENUM; // MAX_ENUM = from shape
    VkFormat           format = VK_FORMAT_UNDEFINED;         // UNDEFINED = image format
    VkImageAspectFlags aspect = 0;                           // 0 = depth or color
    SubresourceRange   range  = {};
};

// Where staged bytes land in an image. rowLength and imageHeight are in
// texels, 0 meaning tightly packed. A zero extent covers the mip level from
// offset to its edge. Exactly one mip level per copy.
struct ImageStage {
    std::uint32_t    rowLength   = 0;
    std::uint32_t    imageHeight = 0;
    SubresourceRange range       = {0, 1, 0, VK_REMAINING_ARRAY_LAYERS};
    VkOffset3D       offset      = {0, 0, 0};
    VkExtent3D       extent      = {0, 0, 0};
};

struct GraphStats {
    std::uint64_t frameIndex          = 0;
    CompileStats  lastFrame;
    std::size_t   cachedBuffers       = 0;
    std::size_t   cachedHostBuffers   = 0; // upload + readback, all slots
    std::size_t   cachedImages        = 0;
    std::size_t   cachedViews         = 0;
    std::size_t   persistentResources = 0;
    std::size_t   pendingDeletes      = 0;
    std::size_t   arenaBytes          = 0;
};

// Declared pass: compile input plus what to record.
struct PassDecl {
    std::string_view name;  // arena copy
    std::string_view label; // region path + name, arena copy
    QueueType        queue = QueueType::Graphics;
    RecordFn         record;
};

// Declares the resources one pass uses. Returned by Frame::pass(); the
// pass exists from that call on, build() attaches what it records.
//
// Thread safety: thread-confined.
class PassBuilder {
public:
    // New graph-created resource, undefined contents, valid for this frame.
    [[nodiscard]] BufferRes resource(const BufferDesc& desc, const BufferUsage& usage);
    [[nodiscard]] ImageRes  resource(const ImageDesc& desc, const ImageUsage& usage);

    // Use a resource an earlier pass of this frame declared.
    void reference(BufferRes res, const BufferUsage& usage);
    void reference(ImageRes res, const ImageUsage& usage);

    // Caller-owned resource, bound as-is.
    [[nodiscard]] BufferRes import(const ExternalBuffer& external, const BufferUsage& usage);
    [[nodiscard]] ImageRes  import(const ExternalImage& external, const ImageUsage& usage);

    // Graph-owned resource whose contents survive into later frames.
    [[nodiscard]] BufferRes persistent(PersistId id, const BufferDesc& desc,
                                       const BufferUsage& usage);
    [[nodiscard]] ImageRes  persistent(PersistId id, const ImageDesc& desc,
                                       const ImageUsage& usage);

    // CPU value this pass produces for later passes.
    template <typename T>
    [[nodiscard]] std::pair<SetId<T>, GetId<T>> dataOutput();

    [[nodiscard]] const BufferDesc& desc(BufferRes res) const;
    [[nodiscard]] const ImageDesc&  desc(ImageRes res) const;

    void build(RecordFn record);

    [[nodiscard]] std::uint32_t index() const { return pass_; }

private:
    friend class Frame;

    PassBuilder(Frame& frame, std::uint32_t pass) : frame_(&frame), pass_(pass) {}

    [[nodiscard]] std::uint32_t addResource(VirtualResource resource);
    void addUsage(std::uint32_t resource, UsageRecord record);

    Frame*        frame_;
    std::uint32_t pass_;
};

// One frame's declarations. Obtained from RenderGraph::frame(); run()
// compiles, records and submits it. Res handles are valid until run().
//
// Thread safety: thread-confined. One open frame per graph.
class Frame {
public:
    ~Frame();
    Frame(Frame&& o) noexcept;
    Frame& operator=(Frame&&) = delete;
    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

    [[nodiscard]] PassBuilder pass(std::string_view name, QueueType queue = QueueType::Graphics);

    // Nested debug-label scope; passes declared inside are labeled
    // "region/name".
    void startRegion(std::string_view name);
    void endRegion();

    // Destroyed once no in-flight frame can still use it.
    void deleteLater(Retired item);

    // Extra semaphore signaled by the frame's last submission on queue.
    void signalAtEnd(QueueType queue, const ExternalSemaphore& semaphore);

    // Upload helpers. Each declares one transfer pass that copies data
    // through a per-slot upload buffer into the destination. data is
    // copied at the call, so the caller's storage may go away.
    void stageBuffer(std::string_view name, BufferRes dst, VkDeviceSize offset,
                     std::span<const std::byte> data, QueueType queue = QueueType::Transfer);
    [[nodiscard]] BufferRes stageBuffer(std::string_view name, const BufferDesc& desc,
                                        VkDeviceSize offset, std::span<const std::byte> data,
                                        QueueType queue = QueueType::Transfer);
    void stageImage(std::string_view name, ImageRes dst, const ImageStage& stage,
                    std::span<const std::byte> data, QueueType queue = QueueType::Transfer);
    [[nodiscard]] ImageRes stageImage(std::string_view name, const ImageDesc& desc,
                                      const ImageStage& stage, std::span<const std::byte> data,
                                      QueueType queue = QueueType::Transfer);

    template <typename T>
    [[nodiscard]] bool owns(Res<T> res) const {
        return res.generation == generation_ && res.index < resources_.size();
    }

    [[nodiscard]] std::uint64_t generation()    const { return generation_; }
    [[nodiscard]] std::uint32_t passCount()     const { return static_cast<std::uint32_t>(passes_.size()); }
    [[nodiscard]] std::uint32_t resourceCount() const { return static_cast<std::uint32_t>(resources_.size()); }

    // Compile, record and submit. Once per frame.
    [[nodiscard]] Result<void> run();

private:
    friend class PassBuilder;
    friend class PassContext;
    friend class RenderGraph;

    Frame(RenderGraph& graph, std::uint64_t generation, Arena& arena)
        : graph_(&graph), generation_(generation), arena_(&arena) {}

    [[nodiscard]] std::span<const std::byte> copyBytes(std::span<const std::byte> data);
    void recordBufferStage(PassBuilder& pass, BufferRes dst, VkDeviceSize offset,
                           std::span<const std::byte> data);
    void recordImageStage(PassBuilder& pass, ImageRes dst, const ImageStage& stage,
                          std::span<const std::byte> data);

    const VirtualResource& checked(std::uint32_t index, std::uint64_t generation,
                                   ResourceKind kind, const char* operation) const;
    VirtualResource&       checked(std::uint32_t index, std::uint64_t generation,
                                   ResourceKind kind, const char* operation);
    void checkData(std::uint32_t index, std::uint64_t generation, const char* operation) const;

    RenderGraph*                                    graph_;
    std::uint64_t                                   generation_;
    Arena*                                          arena_; // names, staged bytes, compile scratch
    std::vector<PassDecl>                           passes_;
    std::vector<PassNode>                           nodes_; // parallel to passes_
    std::vector<VirtualResource>                    resources_;
    std::vector<std::any>                           data_;
    std::vector<std::string_view>                   regions_;
    std::vector<Retired>                            retired_;
    std::vector<std::pair<QueueType, ExternalSemaphore>> endSignals_;
    std::vector<std::pair<ImageViewDesc, VkImageView>>   externalViews_;
    bool                                            ran_ = false;
};

// Handed to RecordFn. Resolves the frame's resources to Vulkan handles.
//
// Thread safety: thread-confined, valid only inside the RecordFn call.
class PassContext {
public:
    [[nodiscard]] BufferHandle get(BufferRes res) const;
    [[nodiscard]] ImageHandle  get(ImageRes res) const;

    // True when the contents are undefined: every graph-created resource,
    // and persistent resources on their first frame.
    [[nodiscard]] bool isUninit(BufferRes res) const;
    [[nodiscard]] bool isUninit(ImageRes res) const;

    // Cached view; lives as long as the image stays in use. Views of
    // imported images are never cached: the caller may destroy the image
    // and the driver may hand the handle out again. They are created once
    // per frame and retired with it.
    [[nodiscard]] Result<VkImageView> view(ImageRes res, const ImageViewRequest& request = {});

    template <typename T>
    void setData(SetId<T> id, T value);

    template <typename T>
    [[nodiscard]] T getData(GetId<T> id) const {
        return getDataRef(id);
    }

    template <typename T>
    [[nodiscard]] const T& getDataRef(GetId<T> id) const;

    void deleteLater(Retired item);

    [[nodiscard]] QueueType        queue() const;
    [[nodiscard]] std::string_view name()  const;
    [[nodiscard]] std::uint32_t    index() const { return pass_; }

private:
    friend class RenderGraph;

    PassContext(RenderGraph& graph, Frame& frame, const CompiledFrame& compiled,
                std::uint32_t pass)
        : graph_(&graph), frame_(&frame), compiled_(&compiled), pass_(pass) {}

    [[nodiscard]] const PhysicalResource& physical(std::uint32_t index, std::uint64_t generation,
                                                   ResourceKind kind) const;

    RenderGraph*         graph_;
    Frame*               frame_;
    const CompiledFrame* compiled_;
    std::uint32_t        pass_;
};

// Frame graph over an adopted device. Each frame: declare passes, run().
// The graph orders passes, allocates and reuses transient memory, places
// every barrier and cross-queue semaphore, and submits.
//
// Usage:
//   auto graph = RenderGraph::create(device, allocator).orThrow();
//   auto frame = graph.frame();
//   auto p = frame.pass("lighting", QueueType::Compute);
//   auto hdr = p.resource(desc, usage::storageImageWrite(ShaderStage::Compute));
//   p.build([=](PassContext& ctx, VkCommandBuffer cmd) { ... });
//   frame.run().orThrow();
//
// Thread safety: thread-confined. Do not move while a Frame is open.
class RenderGraph {
public:
    [[nodiscard]] static Result<RenderGraph> create(const Device& device,
                                                    const Allocator& allocator,
                                                    const GraphConfig& config = {});

    ~RenderGraph();
    RenderGraph(RenderGraph&& o) noexcept;
    RenderGraph& operator=(RenderGraph&& o) noexcept;
    RenderGraph(const RenderGraph&) = delete;
    RenderGraph& operator=(const RenderGraph&) = delete;

    // Begin declaring the next frame. Pass names and compile scratch go
    // into the graph's own arena, rewound here.
    [[nodiscard]] Frame frame();

    // Same, with a caller-owned arena. The graph never resets it; it must
    // stay alive and untouched until run() returns.
    [[nodiscard]] Frame frame(Arena& arena);

    // VKFG_BLOCKING_WAIT: every stream idle.
    [[nodiscard]] Result<void> waitIdle();

    // Destroyed once no in-flight frame can still use it.
    void deleteLater(Retired item);

    [[nodiscard]] const ResourceContext& resourceContext() const { return ctx_; }
    [[nodiscard]] const GraphConfig&     config()          const { return config_; }
    [[nodiscard]] std::uint64_t          frameIndex()      const { return ring_.frameIndex(); }
    [[nodiscard]] GraphStats             stats()           const;

private:
    friend class Frame;
    friend class PassContext;

    class Provider;

    RenderGraph() = default;
    void destroy();

    [[nodiscard]] Result<void> run(Frame& frame);

    const Device*   device_ = nullptr;
    ResourceContext ctx_;
    GraphConfig     config_;
    Arena           arena_;

    ResourceCache<PhysicalBuffer>              buffers_;
    std::vector<ResourceCache<PhysicalBuffer>> hostBuffers_; // per frame slot
    ResourceCache<PhysicalImage>               images_;
    UniqueCache<PhysicalImageView>             views_;
    PersistentCache<PhysicalBuffer>            persistentBuffers_;
    PersistentCache<PhysicalImage>             persistentImages_;
    Deleter                                    deleter_;

    std::optional<VulkanBackend> backend_;
    FrameRing                    ring_;
    CompileStats                 lastStats_;
    std::uint64_t                generation_ = 1;
    bool                         frameOpen_  = false;
};

// ---------------------------------------------------------------------------
// Templates
// ---------------------------------------------------------------------------

template <typename T>
std::pair<SetId<T>, GetId<T>> PassBuilder::dataOutput() {
    auto index = static_cast<std::uint32_t>(frame_->data_.size());
    frame_->data_.emplace_back();
    return {SetId<T>{index, frame_->generation_}, GetId<T>{index, frame_->generation_}};
}

template <typename T>
void PassContext::setData(SetId<T> id, T value) {
    frame_->checkData(id.index, id.generation, "set pass data");
    frame_->data_[id.index] = std::move(value);
}

template <typename T>
const T& PassContext::getDataRef(GetId<T> id) const {
    frame_->checkData(id.index, id.generation, "get pass data");
    const T* value = std::any_cast<T>(&frame_->data_[id.index]);
    if (!value) {
        fatal(Error{"get pass data", 0,
                    "data " + std::to_string(id.index) + " read before any pass set it"});
    }
    return *value;
}

} // namespace vkfg::graph
