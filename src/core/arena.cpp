#include <vkfg/arena.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace vkfg {

Arena::Arena(ArenaConfig config) : config_(config) {
    if (config_.blockSize == 0) config_.blockSize = std::size_t{1} << 20;
}

void* Arena::bump(Block& block, std::size_t size, std::size_t align) {
    auto base    = reinterpret_cast<std::uintptr_t>(block.data.get());
    auto aligned = (base + block.offset + (align - 1)) & ~(std::uintptr_t(align) - 1);
    std::size_t start = static_cast<std::size_t>(aligned - base);
    if (start + size > block.size) return nullptr;

    used_ += (start + size) - block.offset;
    block.offset = start + size;
    return block.data.get() + start;
}

void* Arena::exhausted(std::size_t size) {
    if (config_.onExhaustion == ArenaExhaustion::ReturnNull) return nullptr;
    std::fprintf(stderr,
                 "vkfg: arena exhausted: request of %zu bytes exceeds limit of %zu "
                 "(%zu reserved)\n",
                 size, config_.maxBytes, reserved_);
    std::abort();
}

void* Arena::allocate(std::size_t size, std::size_t align) {
    if (size == 0) size = 1;
    if (align == 0) align = 1;

    // Blocks past current_ were used before the last reset; their cursor is
    // rewound when they become current again.
    while (current_ < blocks_.size()) {
        if (void* p = bump(blocks_[current_], size, align)) return p;
        ++current_;
        if (current_ < blocks_.size()) blocks_[current_].offset = 0;
    }

    std::size_t blockSize = config_.blockSize;
    if (size + align > blockSize) blockSize = size + align;

    if (config_.maxBytes != 0 && reserved_ + blockSize > config_.maxBytes) {
        return exhausted(size);
    }

    Block block;
    block.data = std::make_unique<std::byte[]>(blockSize);
    block.size = blockSize;
    reserved_ += blockSize;
    blocks_.push_back(std::move(block));
    current_ = blocks_.size() - 1;

    return bump(blocks_[current_], size, align);
}

std::string_view Arena::copyString(std::string_view s) {
    char* p = static_cast<char*>(allocate(s.size() + 1, alignof(char)));
    if (!p) return {};
    if (!s.empty()) std::memcpy(p, s.data(), s.size());
    p[s.size()] = '\0';
    return {p, s.size()};
}

void Arena::reset() {
    current_ = 0;
    if (!blocks_.empty()) blocks_[0].offset = 0;
    used_ = 0;
    ++generation_;
}

} // namespace vkfg
