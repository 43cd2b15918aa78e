//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
// File: vm/RegisterFiller.hpp
// Purpose: Initialise the register file for one evaluation from parameters,
//          builtin providers and static defaults.
// Key invariants: Precedence is supplied parameter, then a non-null builtin
//                 value, then the default, then null. Temporary registers are
//                 never filled from parameters.
//                 Both strategies produce identical register files and errors.
// Ownership/Lifetime: A filler borrows the program it was created for; the
//                     program must outlive it. Fillers are immutable and safe
//                     to share between threads.
// Links: vm/BytecodeEvaluator.hpp, bytecode/Bytecode.hpp
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "support/Expected.hpp"
#include "vm/Context.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace rulesvm::vm
{

/// @brief Abstract register initialisation strategy.
/// @details Strategies differ only in how they track which registers have
///          already been filled; the fill order itself is shared.
class RegisterFiller
{
  public:
    virtual ~RegisterFiller() = default;

    /// @brief Strategy identifier for diagnostics and tests.
    enum class Kind
    {
        Bitmask, ///< 64-bit filled mask, for fewer than 64 registers.
        Array    ///< Per-register flags, for any register count.
    };

    /// @brief Register count below which create() picks the bitmask strategy.
    static constexpr uint32_t kBitmaskLimit = 64;

    virtual Kind getKind() const = 0;

    /// @brief Overwrite @p registers with the initial register file.
    /// @param registers Destination, resized to the program's register count.
    /// @param context Ambient context handed to builtin providers.
    /// @param params Caller-supplied parameters by register name.
    /// @param builtins Builtin providers by builtin name.
    /// @return Evaluation error "Missing required parameter: NAME" when a
    ///         required register is left null.
    virtual support::Expected<void> fill(std::vector<Value> &registers,
                                         const Context &context,
                                         const ParamMap &params,
                                         const BuiltinProviders &builtins) const = 0;

    /// @brief Pick the strategy for @p program.
    static std::unique_ptr<RegisterFiller> create(const bytecode::Bytecode &program);

    /// @brief Create a specific strategy, used by tests to compare both.
    /// @note The bitmask strategy requires fewer than kBitmaskLimit registers;
    ///       larger programs fall back to the array strategy.
    static std::unique_ptr<RegisterFiller> create(const bytecode::Bytecode &program, Kind kind);
};

} // namespace rulesvm::vm
