#include <vkfg/result.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <memory>
#ifndef VKFG_ENABLE_EXCEPTIONS
#define VKFG_ENABLE_EXCEPTIONS 1
#endif
#if VKFG_ENABLE_EXCEPTIONS
#include <stdexcept>
#endif
#include <string>
#include <utility>

namespace {

struct Handle {
    std::uint32_t index = 0;
};

vkfg::Result<Handle> acquire(bool succeed) {
    if (!succeed) return vkfg::Error{"acquire handle", -2, "device out of memory"};
    return Handle{7};
}

// Propagates the inner error unchanged.
vkfg::Result<void> useHandle(bool succeed) {
    auto h = acquire(succeed);
    if (!h.ok()) return h.error();
    return {};
}

} // namespace

int main() {
    {
        auto r = acquire(true);
        assert(r.ok());
        assert(r);
        assert(r->index == 7);
        assert(r.value().index == 7);
        std::printf("  value result: ok\n");
    }

    {
        auto r = acquire(false);
        assert(!r.ok());
        assert(r.error().operation == "acquire handle");
        assert(r.error().vkResult == -2);
        assert(r.valueOr(Handle{3}).index == 3);
        std::printf("  error result: ok\n");
    }

    {
        assert(useHandle(true).ok());
        auto bad = useHandle(false);
        assert(!bad.ok());
        assert(bad.error().message == "device out of memory");
        std::printf("  early-return propagation: ok\n");
    }

    // Move-only payloads survive the rvalue path.
    {
        vkfg::Result<std::unique_ptr<int>> r = std::make_unique<int>(5);
        std::unique_ptr<int> p = std::move(r).value();
        assert(p && *p == 5);
        std::printf("  move-only value: ok\n");
    }

    {
        auto make = []() -> vkfg::Result<int> { return 11; };
        assert(make().orThrow() == 11);
        vkfg::Result<void> fine;
        std::move(fine).orThrow();
        std::printf("  orThrow success: ok\n");
    }

#if VKFG_ENABLE_EXCEPTIONS
    {
        bool caught = false;
        try {
            (void)acquire(false).orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            std::string msg = e.what();
            assert(msg.find("acquire handle") != std::string::npos);
            assert(msg.find("VkResult -2") != std::string::npos);
        }
        assert(caught);

        caught = false;
        try {
            useHandle(false).orThrow();
        } catch (const std::runtime_error&) {
            caught = true;
        }
        assert(caught);
        std::printf("  orThrow error: ok\n");
    }
#endif

    std::printf("all result tests passed\n");
    return 0;
}
