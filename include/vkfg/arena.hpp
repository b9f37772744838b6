#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace vkfg {

// What Arena::allocate does when maxBytes would be exceeded.
enum class ArenaExhaustion {
    Abort,      // print and std::abort()
    ReturnNull, // return nullptr; caller decides
};

struct ArenaConfig {
    std::size_t     blockSize    = std::size_t{1} << 20; // 1 MiB
    std::size_t     maxBytes     = 0;                    // 0 = unlimited
    ArenaExhaustion onExhaustion = ArenaExhaustion::Abort;
};

// Per-frame bump allocator. Allocation is a pointer bump inside the current
// block; reset() rewinds to the first block in O(1) and keeps every block for
// reuse. No destructors run on reset, so only trivially destructible objects
// (or arena-backed containers that are dropped before reset) belong here.
//
// Thread safety: thread-confined. One arena per frame being recorded.
class Arena {
public:
    explicit Arena(ArenaConfig config = {});
    ~Arena() = default;
    Arena(Arena&&) noexcept = default;
    Arena& operator=(Arena&&) noexcept = default;
    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    // size bytes aligned to align (power of two). Never returns nullptr
    // unless onExhaustion == ReturnNull and the byte limit was hit.
    [[nodiscard]] void* allocate(std::size_t size,
                                 std::size_t align = alignof(std::max_align_t));

    template <typename T, typename... Args>
    [[nodiscard]] T* make(Args&&... args) {
        static_assert(std::is_trivially_destructible_v<T>,
                      "Arena never runs destructors");
        void* p = allocate(sizeof(T), alignof(T));
        if (!p) return nullptr;
        return ::new (p) T(std::forward<Args>(args)...);
    }

    template <typename T>
    [[nodiscard]] T* allocateArray(std::size_t count) {
        static_assert(std::is_trivially_destructible_v<T>,
                      "Arena never runs destructors");
        if (count == 0) return nullptr;
        void* p = allocate(sizeof(T) * count, alignof(T));
        if (!p) return nullptr;
        T* out = static_cast<T*>(p);
        for (std::size_t i = 0; i < count; ++i) ::new (out + i) T();
        return out;
    }

    // Copies s into the arena with a trailing '\0'.
    [[nodiscard]] std::string_view copyString(std::string_view s);

    // Invalidates everything handed out since the last reset.
    void reset();

    [[nodiscard]] std::size_t   memoryUsage() const { return reserved_; }
    [[nodiscard]] std::size_t   bytesUsed()   const { return used_; }
    [[nodiscard]] std::size_t   blockCount()  const { return blocks_.size(); }
    [[nodiscard]] std::uint64_t generation()  const { return generation_; }
    [[nodiscard]] const ArenaConfig& config() const { return config_; }

private:
    struct Block {
        std::unique_ptr<std::byte[]> data;
        std::size_t                  size   = 0;
        std::size_t                  offset = 0;
    };

    void* bump(Block& block, std::size_t size, std::size_t align);
    void* exhausted(std::size_t size);

    ArenaConfig        config_;
    std::vector<Block> blocks_;
    std::size_t        current_    = 0;
    std::size_t        reserved_   = 0;
    std::size_t        used_       = 0;
    std::uint64_t      generation_ = 0;
};

// Standard allocator over an Arena. deallocate() is a no-op; memory comes
// back on Arena::reset().
template <typename T>
class ArenaAllocator {
public:
    using value_type = T;

    explicit ArenaAllocator(Arena& arena) noexcept : arena_(&arena) {}

    template <typename U>
    ArenaAllocator(const ArenaAllocator<U>& o) noexcept : arena_(o.arena()) {} // NOLINT implicit

    [[nodiscard]] T* allocate(std::size_t n) {
        void* p = arena_->allocate(sizeof(T) * n, alignof(T));
        if (!p) throw std::bad_alloc();
        return static_cast<T*>(p);
    }

    void deallocate(T*, std::size_t) noexcept {}

    [[nodiscard]] Arena* arena() const noexcept { return arena_; }

    template <typename U>
    bool operator==(const ArenaAllocator<U>& o) const noexcept { return arena_ == o.arena(); }

private:
    Arena* arena_;
};

template <typename T>
using ArenaVector = std::vector<T, ArenaAllocator<T>>;

} // namespace vkfg
