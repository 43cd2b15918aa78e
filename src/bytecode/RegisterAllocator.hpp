//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/RegisterAllocator.hpp
// Purpose: Assigns register indices to parameter and temporary names while a
//          program is being built.
// Key invariants: Names are unique; indices are dense and follow allocation
//                 order; at most kMaxRegisters registers exist.
// Ownership/Lifetime: Owns the register definitions until registry() is copied
//                     into the program.
// Links: bytecode/Bytecode.hpp, bytecode/BytecodeWriter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "support/Expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rulesvm::bytecode
{

class RegisterAllocator
{
  public:
    /// @brief Allocate a new register.
    /// @return Its index, or a compile error for a duplicate name or when all
    ///         256 registers are taken.
    support::Expected<uint8_t> allocate(std::string name,
                                        bool required = false,
                                        std::optional<Value> defaultValue = std::nullopt,
                                        std::optional<std::string> builtin = std::nullopt,
                                        bool temporary = false);

    /// @brief Index of @p name, allocating a temporary register on first use.
    support::Expected<uint8_t> getOrAllocateRegister(std::string_view name);

    /// @brief Index of an existing register.
    /// @return Compile error when @p name was never allocated.
    support::Expected<uint8_t> getRegister(std::string_view name) const;

    /// @brief Definitions in index order.
    const std::vector<RegisterDefinition> &registry() const
    {
        return registry_;
    }

  private:
    std::vector<RegisterDefinition> registry_;
    std::unordered_map<std::string, uint8_t> indices_;
};

} // namespace rulesvm::bytecode
