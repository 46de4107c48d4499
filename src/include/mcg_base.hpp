#pragma once
/**
 * @file mcg_base.hpp
 * @brief Layer 1: Basic modules built on mcg_platform.
 *
 * Provides format_tools, debug_info (MCG_PANIC, MCG_DEBUG, stack traces), scope_guard,
 * and module_def for lifecycle module registration.
 * Include this when you need formatting, debug utilities, or basic RAII guards.
 */
#include "mcg_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
