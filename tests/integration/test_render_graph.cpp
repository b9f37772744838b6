#include "../support/death.hpp"

#include <vkfg/graph.hpp>
#include <vulkan/vulkan.h>

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <utility>
#include <vector>

namespace {

// Headless Vulkan 1.3 device with one queue per distinct family.
struct TestDevice {
    VkInstance       instance       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice         device         = VK_NULL_HANDLE;
    vkfg::DeviceHandles handles;

    ~TestDevice() {
        if (device) vkDestroyDevice(device, nullptr);
        if (instance) vkDestroyInstance(instance, nullptr);
    }
};

std::uint32_t findFamily(const std::vector<VkQueueFamilyProperties>& families,
                         VkQueueFlags want, VkQueueFlags avoid) {
    for (std::uint32_t i = 0; i < families.size(); ++i) {
        if ((families[i].queueFlags & want) == want && (families[i].queueFlags & avoid) == 0) {
            return i;
        }
    }
    return UINT32_MAX;
}

bool createDevice(TestDevice& t) {
    VkApplicationInfo app{VK_STRUCTURE_TYPE_APPLICATION_INFO};
    app.pApplicationName = "test_render_graph";
    app.apiVersion       = VK_API_VERSION_1_3;

    VkInstanceCreateInfo ici{VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO};
    ici.pApplicationInfo = &app;
    if (vkCreateInstance(&ici, nullptr, &t.instance) != VK_SUCCESS) return false;

    std::uint32_t count = 0;
    vkEnumeratePhysicalDevices(t.instance, &count, nullptr);
    std::vector<VkPhysicalDevice> gpus(count);
    vkEnumeratePhysicalDevices(t.instance, &count, gpus.data());
    for (VkPhysicalDevice gpu : gpus) {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(gpu, &props);
        if (props.apiVersion >= VK_API_VERSION_1_3) {
            t.physicalDevice = gpu;
            break;
        }
    }
    if (!t.physicalDevice) return false;

    vkGetPhysicalDeviceQueueFamilyProperties(t.physicalDevice, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(t.physicalDevice, &count, families.data());

    vkfg::QueueFamilies qf;
    qf.graphics = findFamily(families, VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT, 0);
    qf.compute  = findFamily(families, VK_QUEUE_COMPUTE_BIT, VK_QUEUE_GRAPHICS_BIT);
    qf.transfer = findFamily(families, VK_QUEUE_TRANSFER_BIT,
                             VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT);
    if (qf.graphics == UINT32_MAX) return false;

    float priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queues;
    for (std::uint32_t family : {qf.graphics, qf.compute, qf.transfer}) {
        if (family == UINT32_MAX) continue;
        VkDeviceQueueCreateInfo q{VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO};
        q.queueFamilyIndex = family;
        q.queueCount       = 1;
        q.pQueuePriorities = &priority;
        queues.push_back(q);
    }

    VkPhysicalDeviceVulkan12Features f12{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES};
    f12.timelineSemaphore   = VK_TRUE;
    f12.bufferDeviceAddress = VK_TRUE;
    VkPhysicalDeviceVulkan13Features f13{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES};
    f13.synchronization2 = VK_TRUE;
    f13.pNext            = &f12;

    VkDeviceCreateInfo dci{VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO};
    dci.pNext                = &f13;
    dci.queueCreateInfoCount = static_cast<std::uint32_t>(queues.size());
    dci.pQueueCreateInfos    = queues.data();
    if (vkCreateDevice(t.physicalDevice, &dci, nullptr, &t.device) != VK_SUCCESS) return false;

    t.handles.instance       = t.instance;
    t.handles.physicalDevice = t.physicalDevice;
    t.handles.device         = t.device;
    t.handles.families       = qf;
    vkGetDeviceQueue(t.device, qf.graphics, 0, &t.handles.graphicsQueue);
    if (qf.compute != UINT32_MAX) vkGetDeviceQueue(t.device, qf.compute, 0, &t.handles.computeQueue);
    if (qf.transfer != UINT32_MAX) {
        vkGetDeviceQueue(t.device, qf.transfer, 0, &t.handles.transferQueue);
    }
    return true;
}

} // namespace

int main() {
    using namespace vkfg;
    using namespace vkfg::graph;

    TestDevice t;
    if (!createDevice(t)) {
        std::printf("no Vulkan 1.3 device, skipping render graph tests\n");
        return 0;
    }

    auto device = Device::adopt(t.handles);
    assert(device.ok());
    std::printf("  dedicated compute: %s, dedicated transfer: %s\n",
                device.value().queueFamilies().hasDedicatedCompute() ? "yes" : "no",
                device.value().queueFamilies().hasDedicatedTransfer() ? "yes" : "no");

    auto allocator = Allocator::create(device.value());
    assert(allocator.ok());

    {
        std::vector<HeapBudget> budget = allocator.value().queryBudget();
        assert(!budget.empty());
        for (const auto& heap : budget) assert(heap.heapSize > 0);

        bool lost = false;
        device.value().onDeviceLost([&] { lost = true; });
        device.value().reportDeviceLost();
        assert(lost);
        device.value().onDeviceLost({});
        std::printf("  heap budget and device-lost callback: ok\n");
    }

    {
        auto graph = RenderGraph::create(device.value(), allocator.value());
        assert(graph.ok());
        auto& g = graph.value();

        const PersistId history = nextPersistId();
        std::vector<bool> historyUninit;
        std::uint32_t uploaded = 0;

        constexpr int kFrames = 5;
        for (int i = 0; i < kFrames; ++i) {
            auto frame = g.frame();

            // Transfer queue fills a buffer the graphics queue later overwrites.
            auto fill = frame.pass("fill", QueueType::Transfer);
            BufferRes target = fill.resource(BufferDesc::gpu(4096), usage::transferDst());
            fill.build([=](PassContext& ctx, VkCommandBuffer cmd) {
                vkCmdFillBuffer(cmd, ctx.get(target).buffer, 0, VK_WHOLE_SIZE, 0u);
            });

            frame.startRegion("scene");

            auto clear = frame.pass("clear");
            ImageDesc color;
            color.format = VK_FORMAT_R8G8B8A8_UNORM;
            color.width  = 256;
            color.height = 256;
            ImageRes image = clear.resource(color, usage::transferDstImage());
            auto ids = clear.dataOutput<std::uint32_t>();
            SetId<std::uint32_t> setValue = ids.first;
            GetId<std::uint32_t> getValue = ids.second;
            clear.build([=](PassContext& ctx, VkCommandBuffer cmd) {
                assert(ctx.isUninit(image));
                assert(ctx.name() == "clear");
                VkClearColorValue value{};
                value.float32[0] = 1.0f;
                VkImageSubresourceRange range{VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
                vkCmdClearColorImage(cmd, ctx.get(image).image,
                                     VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, &value, 1, &range);
                ctx.setData(setValue, 0xC0FFEEu);
            });

            auto copy = frame.pass("copy");
            BufferRes staging = copy.resource(BufferDesc::upload(4096), usage::transferSrc());
            copy.reference(target, usage::transferDst());
            copy.reference(image, usage::sampled(ShaderStage::Fragment));
            copy.build([=, &uploaded](PassContext& ctx, VkCommandBuffer cmd) {
                BufferHandle src = ctx.get(staging);
                assert(src.mapped != nullptr);
                std::uint32_t word = ctx.getData(getValue);
                std::memcpy(src.mapped, &word, sizeof(word));
                ++uploaded;

                VkBufferCopy region{0, 0, 4096};
                vkCmdCopyBuffer(cmd, src.buffer, ctx.get(target).buffer, 1, &region);

                auto view = ctx.view(image);
                assert(view.ok() && view.value() != VK_NULL_HANDLE);
            });

            frame.endRegion();

            // Compute queue accumulates into a buffer that outlives the frame.
            auto accumulate = frame.pass("accumulate", QueueType::Compute);
            BufferRes acc = accumulate.persistent(history, BufferDesc::gpu(256),
                                                  usage::transferDst());
            accumulate.reference(target, usage::transferSrc());
            accumulate.build([=, &historyUninit](PassContext& ctx, VkCommandBuffer cmd) {
                historyUninit.push_back(ctx.isUninit(acc));
                VkBufferCopy region{0, 0, 256};
                vkCmdCopyBuffer(cmd, ctx.get(target).buffer, ctx.get(acc).buffer, 1, &region);
            });

            // Declared but never built: contributes nothing.
            auto unused = frame.pass("unused");
            (void)unused.resource(BufferDesc::gpu(64), usage::transferDst());

            auto ran = frame.run();
            if (!ran.ok()) std::printf("  frame %d: %s\n", i, ran.error().format().c_str());
            assert(ran.ok());
        }

        assert(uploaded == kFrames);
        assert(historyUninit.size() == static_cast<std::size_t>(kFrames));
        assert(historyUninit[0]);
        for (int i = 1; i < kFrames; ++i) assert(!historyUninit[i]);
        std::printf("  frames with transient, upload and persistent resources: ok\n");

        auto idle = g.waitIdle();
        assert(idle.ok());

        GraphStats stats = g.stats();
        assert(stats.frameIndex == kFrames);
        assert(stats.persistentResources == 1);
        assert(stats.cachedImages >= 1);
        assert(stats.cachedViews >= 1);
        assert(stats.cachedHostBuffers >= 1);
        assert(stats.lastFrame.passCount == 5);
        std::printf("  stats: %zu buffers, %zu images, %zu views, %u barriers, %u waits\n",
                    stats.cachedBuffers, stats.cachedImages, stats.cachedViews,
                    stats.lastFrame.imageBarrierCount + stats.lastFrame.bufferBarrierCount +
                        stats.lastFrame.memoryBarrierCount,
                    stats.lastFrame.waitCount);
    }

    // Persistent pair imported across frames. next() imports both images,
    // and the layouts it hands the following frame match what the frame
    // leaves behind.
    {
        auto graph = RenderGraph::create(device.value(), allocator.value());
        assert(graph.ok());
        auto& g = graph.value();

        ImageCreateDesc desc;
        desc.desc.format = VK_FORMAT_R8G8B8A8_UNORM;
        desc.desc.width  = 64;
        desc.desc.height = 64;
        desc.usage       = VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;

        auto pair = PersistentImage::create(g.resourceContext(), desc);
        assert(pair.ok());
        auto& images = pair.value();
        assert(images.layout(0) == VK_IMAGE_LAYOUT_UNDEFINED);
        assert(images.layout(1) == VK_IMAGE_LAYOUT_UNDEFINED);

        VkImage lastWritten = VK_NULL_HANDLE;
        for (int i = 0; i < 3; ++i) {
            auto frame = g.frame();
            auto p = frame.pass("write history");
            auto imported = images.next(p, usage::sampled(ShaderStage::Fragment),
                                        usage::transferDstImage());
            ImageRes prev = imported.first;
            ImageRes dst  = imported.second;
            assert(images.layout(0) == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
            assert(images.layout(1) == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

            p.build([=, &lastWritten](PassContext& ctx, VkCommandBuffer cmd) {
                assert(!ctx.isUninit(prev) && !ctx.isUninit(dst));
                assert(ctx.get(prev).image != ctx.get(dst).image);
                if (lastWritten != VK_NULL_HANDLE) assert(ctx.get(prev).image == lastWritten);
                lastWritten = ctx.get(dst).image;

                VkClearColorValue value{};
                VkImageSubresourceRange range{VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
                vkCmdClearColorImage(cmd, ctx.get(dst).image,
                                     VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, &value, 1, &range);
            });
            auto ran = frame.run();
            assert(ran.ok());
        }

        // Buffer pair: each frame reads what the previous one wrote.
        BufferCreateDesc bufferDesc{BufferDesc::gpu(256),
                                    VK_BUFFER_USAGE_TRANSFER_SRC_BIT |
                                        VK_BUFFER_USAGE_TRANSFER_DST_BIT};
        auto buffers = PersistentBuffer::create(g.resourceContext(), bufferDesc);
        assert(buffers.ok());
        VkBuffer lastBuffer = VK_NULL_HANDLE;
        for (int i = 0; i < 2; ++i) {
            auto frame = g.frame();
            auto p = frame.pass("carry");
            auto imported = buffers.value().next(p, usage::transferSrc(), usage::transferDst());
            BufferRes prev = imported.first;
            BufferRes curr = imported.second;
            p.build([=, &lastBuffer](PassContext& ctx, VkCommandBuffer cmd) {
                if (lastBuffer != VK_NULL_HANDLE) assert(ctx.get(prev).buffer == lastBuffer);
                lastBuffer = ctx.get(curr).buffer;
                VkBufferCopy region{0, 0, 256};
                vkCmdCopyBuffer(cmd, ctx.get(prev).buffer, ctx.get(curr).buffer, 1, &region);
            });
            auto ran = frame.run();
            assert(ran.ok());
        }

        // Moving onto a live pair would leak it.
        auto spare = PersistentBuffer::create(g.resourceContext(), bufferDesc);
        assert(spare.ok());
        auto spareImages = PersistentImage::create(g.resourceContext(), desc);
        assert(spareImages.ok());
        assert(aborts([&] { buffers.value() = std::move(spare.value()); }));
        assert(aborts([&] { images = std::move(spareImages.value()); }));
        std::printf("  move onto live pair aborts: ok\n");

        Deleter deleter;
        images.retire(deleter);
        buffers.value().retire(deleter);
        spareImages.value().retire(deleter);
        assert(!images.live() && !buffers.value().live());
        assert(deleter.pending() == 6);

        // Moving onto a retired pair is fine.
        buffers.value() = std::move(spare.value());
        assert(buffers.value().live() && !spare.value().live());
        buffers.value().retire(deleter);

        auto idle = g.waitIdle();
        assert(idle.ok());
        deleter.destroy(g.resourceContext());
        assert(deleter.pending() == 0);
        std::printf("  persistent pairs: ok\n");
    }

    // Upload helpers, declared into a caller-owned arena, checked through
    // persistent readback buffers on the next frame.
    {
        auto graph = RenderGraph::create(device.value(), allocator.value());
        assert(graph.ok());
        auto& g = graph.value();

        const PersistId bufferReadback = nextPersistId();
        const PersistId imageReadback  = nextPersistId();
        constexpr std::uint32_t kSize  = 16;

        std::vector<std::byte> pattern(256);
        for (std::size_t i = 0; i < pattern.size(); ++i) pattern[i] = std::byte(i);
        std::vector<std::byte> patch(128, std::byte{0xAB});
        std::vector<std::byte> pixels(kSize * kSize * 4, std::byte{0x11});
        std::vector<std::byte> corner(4 * 4 * 4, std::byte{0x77});

        ImageDesc texture;
        texture.format = VK_FORMAT_R8G8B8A8_UNORM;
        texture.width  = kSize;
        texture.height = kSize;

        Arena arena;
        BufferRes uploaded;
        {
            auto frame = g.frame(arena);
            uploaded = frame.stageBuffer("upload constants", BufferDesc::gpu(256), 0, pattern);
            frame.stageBuffer("patch constants", uploaded, 128, patch);
            ImageRes tex = frame.stageImage("upload texture", texture, ImageStage{}, pixels);

            ImageStage region;
            region.extent = VkExtent3D{4, 4, 1};
            frame.stageImage("patch texture", tex, region, corner, QueueType::Graphics);
            assert(frame.owns(uploaded) && frame.owns(tex));
            assert(arena.bytesUsed() >= pattern.size() + patch.size() + pixels.size());

            // The caller's storage may go away once declared.
            std::fill(pattern.begin(), pattern.end(), std::byte{0});

            auto p = frame.pass("read back");
            p.reference(uploaded, usage::transferSrc());
            p.reference(tex, usage::transferSrcImage());
            BufferRes out = p.persistent(bufferReadback, BufferDesc::readback(256),
                                         usage::transferDst());
            BufferRes outImage = p.persistent(imageReadback,
                                              BufferDesc::readback(pixels.size()),
                                              usage::transferDst());
            p.build([=](PassContext& ctx, VkCommandBuffer cmd) {
                VkBufferCopy copy{0, 0, 256};
                vkCmdCopyBuffer(cmd, ctx.get(uploaded).buffer, ctx.get(out).buffer, 1, &copy);

                VkBufferImageCopy image{};
                image.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
                image.imageExtent      = VkExtent3D{kSize, kSize, 1};
                vkCmdCopyImageToBuffer(cmd, ctx.get(tex).image,
                                       VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                                       ctx.get(outImage).buffer, 1, &image);
            });

            auto ran = frame.run();
            assert(ran.ok());
            assert(g.stats().lastFrame.passCount == 5);
        }
        arena.reset();

        auto idle = g.waitIdle();
        assert(idle.ok());

        bool checked = false;
        {
            auto frame = g.frame();
            assert(!frame.owns(uploaded));
            auto p = frame.pass("inspect", QueueType::Transfer);
            BufferRes out = p.persistent(bufferReadback, BufferDesc::readback(256),
                                         usage::transferDst());
            BufferRes outImage = p.persistent(imageReadback,
                                              BufferDesc::readback(pixels.size()),
                                              usage::transferDst());
            p.build([=, &checked](PassContext& ctx, VkCommandBuffer) {
                const auto* bytes = static_cast<const std::uint8_t*>(ctx.get(out).mapped);
                assert(bytes[0] == 0 && bytes[127] == 127);
                assert(bytes[128] == 0xAB && bytes[255] == 0xAB);

                const auto* texels = static_cast<const std::uint8_t*>(ctx.get(outImage).mapped);
                assert(texels[0] == 0x77);
                assert(texels[(3 * kSize + 3) * 4] == 0x77);
                assert(texels[(4 * kSize + 4) * 4] == 0x11);
                assert(texels[(kSize * kSize - 1) * 4] == 0x11);
                checked = true;
            });
            auto ran = frame.run();
            assert(ran.ok());
        }
        assert(checked);
        std::printf("  staged uploads: ok\n");

        // Handles never outlive their frame, and a copy covers one mip.
        assert(aborts([&] {
            auto frame = g.frame();
            auto p = frame.pass("late");
            p.reference(uploaded, usage::transferSrc());
        }));

        assert(aborts([&] {
            BufferRes dropped;
            {
                auto frame = g.frame();
                dropped = frame.pass("dropped").resource(BufferDesc::gpu(64),
                                                         usage::transferDst());
            }
            auto frame = g.frame();
            auto p = frame.pass("after drop");
            p.reference(dropped, usage::transferSrc());
        }));

        assert(aborts([&] {
            ImageStage mips;
            mips.range.levelCount = 2;
            auto frame = g.frame();
            (void)frame.stageImage("mipmapped", texture, mips, pixels);
        }));
        std::printf("  misuse aborts: ok\n");

        idle = g.waitIdle();
        assert(idle.ok());
    }

    // Views of imported images are created per frame and retired, never
    // cached under a handle the caller may free and the driver reuse.
    {
        ImageCreateDesc desc;
        desc.desc.format = VK_FORMAT_R8G8B8A8_UNORM;
        desc.desc.width  = 32;
        desc.desc.height = 32;
        desc.usage       = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;

        ResourceContext ctx = ResourceContext::from(device.value(), allocator.value());
        auto owned = PhysicalImage::create(ctx, desc);
        assert(owned.ok());

        {
            auto graph = RenderGraph::create(device.value(), allocator.value());
            assert(graph.ok());
            auto& g = graph.value();

            ExternalImage external;
            external.handle         = owned.value().handle();
            external.desc           = desc.desc;
            external.initial.layout = VK_IMAGE_LAYOUT_UNDEFINED;

            for (int i = 0; i < 2; ++i) {
                std::size_t pendingBefore = g.stats().pendingDeletes;
                auto frame = g.frame();
                auto p = frame.pass("sample imported");
                ImageRes img = p.import(external, usage::sampled(ShaderStage::Fragment));
                p.build([=](PassContext& pc, VkCommandBuffer) {
                    auto first  = pc.view(img);
                    auto second = pc.view(img);
                    assert(first.ok() && second.ok());
                    assert(first.value() == second.value());
                });
                auto ran = frame.run();
                assert(ran.ok());

                GraphStats stats = g.stats();
                assert(stats.cachedViews == 0);
                if (i == 0) assert(stats.pendingDeletes == pendingBefore + 1);
                external.initial = usage::sampled(ShaderStage::Fragment).info();
            }
            auto idle = g.waitIdle();
            assert(idle.ok());
        }

        owned.value().destroy(ctx);
        std::printf("  imported image views: ok\n");
    }

    std::printf("all render graph tests passed\n");
    return 0;
}
