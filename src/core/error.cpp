#include <vkfg/error.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace vkfg {

#ifndef VKFG_ENABLE_EXCEPTIONS
#define VKFG_ENABLE_EXCEPTIONS 1
#endif

std::string Error::format() const {
    std::string out = "vkfg: " + operation + " failed";

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult) + ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

void throwError(const Error& e) {
#if VKFG_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

void fatal(const Error& e) {
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::fflush(stderr);
    std::abort();
}

} // namespace vkfg
