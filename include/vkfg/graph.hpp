#pragma once

// Frame graph umbrella header. Device plumbing (device, allocator,
// timelines) lives in <vkfg/vkfg.hpp>; this pulls in everything a frame
// declaration needs on top of it.

#include <vkfg/vkfg.hpp>

#include <vkfg/graph/access.hpp>
#include <vkfg/graph/persistent.hpp>
#include <vkfg/graph/render_graph.hpp>
#include <vkfg/graph/resource.hpp>
#include <vkfg/graph/usage.hpp>
