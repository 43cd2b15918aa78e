//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/VMConfig.hpp
// Purpose: Defines compile-time and runtime configuration for the evaluator
//          and the engine.
// Key invariants: Defaults yield an untraced engine with a 32-entry URI cache.
// Ownership/Lifetime: Shared header; configuration is held by value.
// Links: vm/RulesEngine.hpp, vm/Trace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Trace.hpp"

#include <cstddef>

// -----------------------------------------------------------------------------
// Trace hook toggle
// -----------------------------------------------------------------------------
// When 0 the per-instruction trace hook is compiled out of the dispatch loop.
#ifndef RULESVM_VM_TRACE
#define RULESVM_VM_TRACE 1
#endif

namespace rulesvm::vm
{

/// @brief Default number of parsed URIs retained per resolver.
constexpr size_t kDefaultUriCacheCapacity = 32;

/// @brief Initial operand stack capacity; grows by doubling.
constexpr size_t kInitialStackSize = 16;

/// @brief Runtime options applied to every resolver an engine creates.
struct EngineConfig
{
    size_t uriCacheCapacity = kDefaultUriCacheCapacity; ///< 0 disables URI caching.
    TraceConfig trace{};                                ///< Evaluator tracing.
};

} // namespace rulesvm::vm
