#pragma once

#include <vkfg/config.hpp>
#include <vkfg/graph/physical.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

namespace vkfg::graph {

// Ring of kDeletionSlots buckets. push() files an item under the current
// bucket; next() advances and destroys whatever is in the bucket it lands
// on, i.e. items pushed slotCount() advances ago. With one advance per
// frame and the frame-slot wait done first, nothing is destroyed while a
// frame that might reference it is still executing.
//
// Item must provide `void destroy(const Context&)`.
//
// Thread safety: thread-confined.
template <typename Item, typename Context, std::size_t Slots = kDeletionSlots>
class DeletionQueue {
public:
    static_assert(Slots >= 2, "a deletion queue needs at least two slots");

    void push(Item item) { queues_[current_].push_back(std::move(item)); }

    void next(const Context& ctx) {
        current_ = (current_ + 1) % Slots;
        for (auto& item : queues_[current_]) item.destroy(ctx);
        queues_[current_].clear();
    }

    // Destroys everything. Only valid once the device is idle.
    void destroy(const Context& ctx) {
        for (auto& queue : queues_) {
            for (auto& item : queue) item.destroy(ctx);
            queue.clear();
        }
    }

    [[nodiscard]] std::size_t pending() const {
        std::size_t n = 0;
        for (const auto& queue : queues_) n += queue.size();
        return n;
    }

    [[nodiscard]] std::size_t current() const { return current_; }
    [[nodiscard]] static constexpr std::size_t slotCount() { return Slots; }

private:
    std::array<std::vector<Item>, Slots> queues_;
    std::size_t                          current_ = 0;
};

// An acceleration structure and the buffer backing it.
struct RetiredAccelerationStructure {
    VkAccelerationStructureKHR handle = VK_NULL_HANDLE;
    PhysicalBuffer             buffer;

    void destroy(const ResourceContext& ctx);
};

// Anything the graph can destroy later.
class Retired {
public:
    Retired(PhysicalBuffer b) : item_(b) {}                  // NOLINT implicit
    Retired(PhysicalImage i) : item_(i) {}                   // NOLINT implicit
    Retired(PhysicalImageView v) : item_(v) {}               // NOLINT implicit
    Retired(RetiredAccelerationStructure a) : item_(a) {}    // NOLINT implicit

    void destroy(const ResourceContext& ctx);

private:
    std::variant<PhysicalBuffer, PhysicalImage, PhysicalImageView,
                 RetiredAccelerationStructure> item_;
};

using Deleter = DeletionQueue<Retired, ResourceContext>;

} // namespace vkfg::graph
