#pragma once

#include <vkfg/allocator.hpp>
#include <vkfg/arena.hpp>
#include <vkfg/command_pool.hpp>
#include <vkfg/config.hpp>
#include <vkfg/debug.hpp>
#include <vkfg/device.hpp>
#include <vkfg/error.hpp>
#include <vkfg/result.hpp>
#include <vkfg/timeline.hpp>
