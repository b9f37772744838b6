#pragma once

#include <vkfg/arena.hpp>
#include <vkfg/device.hpp>
#include <vkfg/error.hpp>
#include <vkfg/graph/access.hpp>
#include <vkfg/graph/barrier_batch.hpp>
#include <vkfg/graph/cache.hpp>
#include <vkfg/graph/resource.hpp>
#include <vkfg/graph/usage.hpp>
#include <vkfg/result.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace vkfg::graph {

inline constexpr std::uint32_t kNoPass     = UINT32_MAX;
inline constexpr std::uint32_t kNoResource = UINT32_MAX;

enum class ResourceKind : std::uint8_t {
    Buffer,
    Image,
};

enum class ResourceOrigin : std::uint8_t {
    Transient,  // graph-created for this frame, served from the caches
    External,   // caller-owned, bound as-is
    Persistent, // graph-owned, contents kept across frames
};

// One pass's use of one virtual resource. A pass using the same resource
// several times ends up with a single merged record.
struct UsageRecord {
    std::uint32_t    pass        = kNoPass;
    AccessInfo       access;
    std::uint32_t    createUsage = 0; // VkBufferUsageFlags or VkImageUsageFlags
    SubresourceRange range;
    VkFormat         viewFormat  = VK_FORMAT_UNDEFINED;
};

// A resource as declared by the passes of one frame.
struct VirtualResource {
    ResourceKind   kind   = ResourceKind::Buffer;
    ResourceOrigin origin = ResourceOrigin::Transient;

    BufferDesc     bufferDesc;
    ImageDesc      imageDesc;
    ExternalBuffer externalBuffer; // origin == External, kind == Buffer
    ExternalImage  externalImage;  // origin == External, kind == Image
    PersistId      persist;        // origin == Persistent

    std::vector<UsageRecord> usages;
};

// What the compiler needs from a declared pass.
struct PassNode {
    std::string_view name;
    QueueType        queue = QueueType::Graphics;
};

// Where physical resources come from. RenderGraph serves these from its
// caches; tests serve them from a fake.
class ResourceProvider {
public:
    virtual ~ResourceProvider() = default;

    [[nodiscard]] virtual Result<Acquired<BufferHandle>> buffer(const BufferCreateDesc& desc) = 0;
    [[nodiscard]] virtual Result<Acquired<ImageHandle>>  image(const ImageCreateDesc& desc) = 0;
    [[nodiscard]] virtual Result<PersistentAcquired<BufferHandle>> persistentBuffer(
        PersistId id, const BufferCreateDesc& desc) = 0;
    [[nodiscard]] virtual Result<PersistentAcquired<ImageHandle>> persistentImage(
        PersistId id, const ImageCreateDesc& desc) = 0;
};

// A physical resource bound for this frame. Several virtual resources may
// share one when their lifetimes do not overlap.
struct PhysicalResource {
    ResourceKind   kind   = ResourceKind::Buffer;
    ResourceOrigin origin = ResourceOrigin::Transient;

    BufferCreateDesc bufferDesc;
    ImageCreateDesc  imageDesc;
    BufferHandle     buffer;
    ImageHandle      image;
    VkImageAspectFlags aspect = VK_IMAGE_ASPECT_COLOR_BIT;
    bool             fresh    = false; // contents undefined at first use
    PersistId        persist;

    // Lifetime over the frame's passes, merged across aliased virtuals.
    std::uint32_t firstPass = kNoPass;
    std::uint32_t lastPass  = kNoPass;
    std::uint32_t virtualCount = 0;

    // State at the end of the frame (recorded for persistent resources).
    AccessInfo finalAccess;
    QueueType  finalQueue = QueueType::Graphics;
};

// Wait on one stream's timeline at the value signaled after `pass`.
struct PassWait {
    std::uint32_t         pass   = kNoPass;
    VkPipelineStageFlags2 stages = VK_PIPELINE_STAGE_2_NONE;

    [[nodiscard]] bool valid() const { return pass != kNoPass; }
};

struct QueueWait {
    std::array<PassWait, kQueueTypeCount> queues{};
    std::vector<ExternalSemaphore>        external;

    [[nodiscard]] bool empty() const;
    void merge(const QueueWait& other);
};

// Signal this stream's timeline after `pass` (and any external semaphores).
struct QueueSignal {
    VkPipelineStageFlags2          stages = VK_PIPELINE_STAGE_2_NONE;
    std::uint32_t                  pass   = kNoPass;
    std::vector<ExternalSemaphore> external;

    [[nodiscard]] bool empty() const { return stages == VK_PIPELINE_STAGE_2_NONE && external.empty(); }
    void merge(const QueueSignal& other);
};

// Signals happen before waits. signalBarriers run before the signal;
// waitBarriers run after the wait.
struct CrossQueueSync {
    QueueSignal  signal;
    BarrierBatch signalBarriers;
    QueueWait    wait;
    BarrierBatch waitBarriers;
};

enum class SyncKind : std::uint8_t {
    NoSync,
    SignalOnly,
    WaitOnly,
    Both,
};

[[nodiscard]] const char* syncKindName(SyncKind kind);

// Synchronization at one pass boundary of one stream. `queue` barriers
// depend only on earlier work of the same stream.
struct Sync {
    BarrierBatch   queue;
    CrossQueueSync crossQueue;

    [[nodiscard]] SyncKind kind() const;
    [[nodiscard]] bool empty() const;
    void merge(const Sync& other);
};

// One boundary + pass on one stream. pass == kNoPass is a flush-only step
// that submits a pending signal before another stream waits on it.
struct ScheduleStep {
    QueueType     queue = QueueType::Graphics;
    std::uint32_t pass  = kNoPass;
    Sync          sync;
};

struct CompileStats {
    std::uint32_t passCount            = 0;
    std::uint32_t stepCount            = 0;
    std::uint32_t memoryBarrierCount   = 0;
    std::uint32_t imageBarrierCount    = 0;
    std::uint32_t bufferBarrierCount   = 0;
    std::uint32_t signalCount          = 0;
    std::uint32_t waitCount            = 0;
    std::uint32_t physicalCount        = 0;
    std::uint32_t aliasedCount         = 0; // virtual resources that share memory
    double        compileTimeUs        = 0.0;
};

struct CompiledFrame {
    std::vector<std::uint32_t>                            order;
    std::vector<std::pair<std::uint32_t, std::uint32_t>>  edges;
    std::vector<std::uint32_t>                            resourceMap; // virtual -> physical
    std::vector<PhysicalResource>                         resources;
    std::vector<ScheduleStep>                             steps;
    std::array<Sync, kQueueTypeCount>                     finish{};
    std::array<bool, kQueueTypeCount>                     streamUsed{};
    CompileStats                                          stats;

    [[nodiscard]] const PhysicalResource& physical(std::uint32_t virtualIndex) const {
        return resources[resourceMap[virtualIndex]];
    }
};

struct CompileOptions {
    bool aliasTransients = true;
};

// Orders the passes, binds every virtual resource to a physical one and
// works out every barrier, semaphore signal and wait the frame needs.
// Same declarations in, same CompiledFrame out.
[[nodiscard]] Result<CompiledFrame> compileFrame(Arena& arena,
                                                 std::span<const PassNode> passes,
                                                 std::span<VirtualResource> resources,
                                                 const QueueTopology& topology,
                                                 ResourceProvider& provider,
                                                 const CompileOptions& options = {});

// Pass order, per-step sync and barrier detail to stderr.
void dumpCompiledFrame(const CompiledFrame& frame, std::span<const PassNode> passes);

} // namespace vkfg::graph
