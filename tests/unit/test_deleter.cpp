#include <vkfg/graph/deleter.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace {

struct Context {
    std::vector<int>* destroyed = nullptr;
};

struct Item {
    int id = 0;
    void destroy(const Context& ctx) { ctx.destroyed->push_back(id); }
};

} // namespace

int main() {
    // An item is destroyed by the Slots-th advance after it was pushed.
    {
        std::vector<int> destroyed;
        Context ctx{&destroyed};
        vkfg::graph::DeletionQueue<Item, Context, 3> queue;

        queue.push(Item{1});
        assert(queue.pending() == 1);

        queue.next(ctx);
        queue.push(Item{2});
        queue.next(ctx);
        assert(destroyed.empty());

        queue.next(ctx);
        assert(destroyed.size() == 1 && destroyed[0] == 1);
        assert(queue.pending() == 1);

        queue.next(ctx);
        assert(destroyed.size() == 2 && destroyed[1] == 2);
        assert(queue.pending() == 0);
        std::printf("  retirement after slot count advances: ok\n");
    }

    // The default slot count is frames in flight + 1.
    {
        static_assert(vkfg::graph::Deleter::slotCount() == vkfg::kFramesInFlight + 1);

        std::vector<int> destroyed;
        Context ctx{&destroyed};
        vkfg::graph::DeletionQueue<Item, Context> queue;
        queue.push(Item{7});
        for (std::uint32_t i = 0; i < vkfg::kFramesInFlight; ++i) {
            queue.next(ctx);
            assert(destroyed.empty());
        }
        queue.next(ctx);
        assert(destroyed.size() == 1 && destroyed[0] == 7);
        std::printf("  default slot count: ok\n");
    }

    // destroy() drains every slot.
    {
        std::vector<int> destroyed;
        Context ctx{&destroyed};
        vkfg::graph::DeletionQueue<Item, Context, 4> queue;
        queue.push(Item{1});
        queue.next(ctx);
        queue.push(Item{2});
        queue.push(Item{3});
        queue.destroy(ctx);
        assert(destroyed.size() == 3);
        assert(queue.pending() == 0);
        queue.next(ctx);
        assert(destroyed.size() == 3);
        std::printf("  destroy drains all: ok\n");
    }

    std::printf("all deleter tests passed\n");
    return 0;
}
