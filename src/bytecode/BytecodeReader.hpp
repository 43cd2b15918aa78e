//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeReader.hpp
// Purpose: Decodes and validates a binary rules image into a Bytecode.
// Key invariants: No byte outside the image is ever read; every structural
//                 problem is a Format error, every unresolved function a
//                 Compile error.
// Ownership/Lifetime: Stateless; the returned program copies what it needs
//                     from the image.
// Links: bytecode/BytecodeWriter.hpp (serialize() is the inverse)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/RulesFunction.hpp"
#include "support/Expected.hpp"

#include <cstdint>
#include <span>

namespace rulesvm::bytecode
{

/// @brief Loader options.
struct ReadOptions
{
    /// @brief Keep function names without implementations instead of failing.
    /// @details Used by tooling that only inspects an image.
    bool allowUnresolvedFunctions = false;
};

class BytecodeReader
{
  public:
    /// @brief Decode @p image and link its function table against @p functions.
    static support::Expected<Bytecode> read(std::span<const uint8_t> image,
                                            const FunctionRegistry &functions,
                                            ReadOptions options = {});
};

} // namespace rulesvm::bytecode
