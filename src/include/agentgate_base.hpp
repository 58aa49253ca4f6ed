#pragma once
/**
 * @file agentgate_base.hpp
 * @brief Layer 1: Basic modules.
 *
 * Provides format_tools and the foundational RAII/error helpers (ScopeGuard,
 * Result). Include this when you need formatting or basic guards.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
