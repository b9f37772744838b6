#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace vkfg::graph {

inline constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;

// FNV-1a over raw bytes. Chain calls by passing the previous result as h.
inline std::uint64_t fnv1a(const void* data, std::size_t len, std::uint64_t h = kFnvOffset) {
    auto p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= p[i];
        h *= 1099511628211ULL;
    }
    return h;
}

// Hash one scalar field. Structs are hashed field by field so padding
// never reaches the hash.
template <typename T>
std::uint64_t hashField(std::uint64_t h, const T& v) {
    static_assert(std::is_scalar_v<T>, "hash structs field by field");
    return fnv1a(&v, sizeof(T), h);
}

} // namespace vkfg::graph
