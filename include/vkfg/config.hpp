#pragma once

#include <cstdint>

#ifndef VKFG_FRAMES_IN_FLIGHT
#define VKFG_FRAMES_IN_FLIGHT 2
#endif

namespace vkfg {

// Frames the CPU may record ahead of the GPU. Frame N reuses the slot of
// frame N - kFramesInFlight and waits on its sync points first.
inline constexpr std::uint32_t kFramesInFlight = VKFG_FRAMES_IN_FLIGHT;

// Resets a cached resource may sit unused before it is destroyed.
// Must be >= kFramesInFlight so no in-flight frame can still reference it.
inline constexpr std::uint32_t kDestroyLag = kFramesInFlight;

// Deletion queue slots. One more than frames in flight: an item pushed
// during frame N is destroyed once frame N can no longer be executing.
inline constexpr std::uint32_t kDeletionSlots = kFramesInFlight + 1;

static_assert(kFramesInFlight >= 1, "VKFG_FRAMES_IN_FLIGHT must be at least 1");
static_assert(kDestroyLag >= kFramesInFlight);

// Runtime knobs for a RenderGraph.
struct GraphConfig {
    bool aliasTransients = true;  // share memory between non-overlapping transients
    bool debugLabels     = true;  // wrap each pass in a debug utils label
    bool verbose         = false; // dump every compiled frame to stderr
};

} // namespace vkfg
