#include <vkfg/timeline.hpp>

#include <cassert>
#include <cstdio>

using vkfg::TimelineCounter;

int main() {
    // A value is offered until a submission commits it.
    {
        TimelineCounter counter;
        assert(counter.lastValue() == 0);
        assert(counter.pending() == 1);

        // A failed submit commits nothing: the same value is offered again
        // and nobody waits on a value the GPU will never signal.
        assert(counter.pending() == 1);

        counter.commit(counter.pending());
        assert(counter.lastValue() == 1);
        assert(counter.pending() == 2);

        counter.commit(counter.pending());
        counter.commit(counter.pending());
        assert(counter.lastValue() == 3);
        std::printf("  commit after success: ok\n");
    }

    // Committing an older value never moves the counter back.
    {
        TimelineCounter counter;
        counter.commit(5);
        counter.commit(2);
        assert(counter.lastValue() == 5);
        assert(counter.pending() == 6);
        std::printf("  monotonic: ok\n");
    }

    {
        vkfg::SyncPoint none;
        assert(!none.valid());
        vkfg::SyncPoint point{vkfg::QueueType::Compute, 1};
        assert(point.valid());
        assert(point != none);
        std::printf("  sync point: ok\n");
    }

    std::printf("all timeline tests passed\n");
    return 0;
}
