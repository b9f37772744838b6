#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vkfg {

// What we tried, what Vulkan said, and a human message.
// VkResult is stored as int32_t to keep <vulkan/vulkan.h> out of this header.
struct Error {
    std::string operation; // e.g. "compile frame"
    std::int32_t vkResult; // 0 (VK_SUCCESS) when not a Vulkan error
    std::string message;

    // Format as a single readable string.
    [[nodiscard]] std::string format() const;
};

// Error unwrap hook used by Result<T>::orThrow().
// When VKFG_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When VKFG_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

// Programmer errors (stale handles, contradictory declarations).
// Prints and aborts in every build; never recoverable.
[[noreturn]] void fatal(const Error& e);

} // namespace vkfg
