//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Bytecode.hpp
// Purpose: Immutable in-memory rules program and the register metadata views
//          derived from it at load time.
// Key invariants: Condition and result offsets index into code().
//                 A body ends at the next higher body offset, or at the end
//                 of code() for the last body.
//                 The BDD has been validated against the condition and result
//                 counts, and every call site names an existing function with
//                 a matching arity.
//                 Register indices fit in a u8 operand.
// Ownership: Bytecode owns its code, tables and constant pool. Function
//            implementations are shared with the registry that linked them.
// Lifetime: Created by BytecodeWriter::build or BytecodeReader::read; shared by
//           resolvers through std::shared_ptr<const Bytecode>.
// Links: bytecode/BytecodeWriter.hpp, bytecode/BytecodeReader.hpp,
//        vm/BytecodeEvaluator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bdd.hpp"
#include "bytecode/Opcode.hpp"
#include "bytecode/RulesFunction.hpp"
#include "bytecode/Value.hpp"
#include "support/Expected.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace rulesvm::bytecode
{

/// @brief Static description of one register.
struct RegisterDefinition
{
    std::string name;                   ///< Parameter or temporary name.
    bool required = false;              ///< Evaluation fails if the register stays null.
    bool temporary = false;             ///< Scratch register never filled from parameters.
    std::optional<Value> defaultValue;  ///< Value used when nothing else fills it.
    std::optional<std::string> builtin; ///< Builtin provider name, if any.

    bool operator==(const RegisterDefinition &) const = default;
};

/// @brief Entry of the function table.
struct FunctionSlot
{
    std::string name;                               ///< Name stored in the image.
    std::shared_ptr<const RulesFunction> function;  ///< Null when loaded unlinked.
};

/// @brief Loaded rules program.
class Bytecode
{
  public:
    /// @brief Raw components handed to create().
    struct Parts
    {
        std::vector<uint8_t> code;              ///< Instruction section.
        std::vector<uint32_t> conditionOffsets; ///< Body start per condition.
        std::vector<uint32_t> resultOffsets;    ///< Body start per result.
        std::vector<RegisterDefinition> registers;
        std::vector<Value> constants;
        std::vector<FunctionSlot> functions;
        Bdd bdd;
        uint16_t version = kBytecodeVersion;
    };

    /// @brief Validate @p parts and compute the derived register views.
    /// @return The program, a format error for inconsistent tables, or a
    ///         compile error for a call site that cannot be linked.
    static support::Expected<Bytecode> create(Parts parts);

    uint16_t version() const
    {
        return parts_.version;
    }

    std::span<const uint8_t> code() const
    {
        return parts_.code;
    }

    uint32_t conditionCount() const
    {
        return static_cast<uint32_t>(parts_.conditionOffsets.size());
    }

    uint32_t conditionOffset(uint32_t index) const
    {
        return parts_.conditionOffsets[index];
    }

    const std::vector<uint32_t> &conditionOffsets() const
    {
        return parts_.conditionOffsets;
    }

    /// @brief One past the last byte of condition @p index's body.
    uint32_t conditionEnd(uint32_t index) const
    {
        return conditionEnds_[index];
    }

    uint32_t resultCount() const
    {
        return static_cast<uint32_t>(parts_.resultOffsets.size());
    }

    uint32_t resultOffset(uint32_t index) const
    {
        return parts_.resultOffsets[index];
    }

    const std::vector<uint32_t> &resultOffsets() const
    {
        return parts_.resultOffsets;
    }

    /// @brief One past the last byte of result @p index's body.
    uint32_t resultEnd(uint32_t index) const
    {
        return resultEnds_[index];
    }

    const std::vector<RegisterDefinition> &registers() const
    {
        return parts_.registers;
    }

    uint32_t registerCount() const
    {
        return static_cast<uint32_t>(parts_.registers.size());
    }

    const std::vector<Value> &constants() const
    {
        return parts_.constants;
    }

    const std::vector<FunctionSlot> &functions() const
    {
        return parts_.functions;
    }

    const Bdd &bdd() const
    {
        return parts_.bdd;
    }

    /// @brief Initial register file: each register's default, or null.
    const std::vector<Value> &registerTemplate() const
    {
        return registerTemplate_;
    }

    /// @brief Name to index map of the registers that accept parameters.
    const std::unordered_map<std::string, uint16_t> &inputRegisters() const
    {
        return inputRegisters_;
    }

    /// @brief Registers that name a builtin provider, in index order.
    const std::vector<uint16_t> &builtinRegisters() const
    {
        return builtinRegisters_;
    }

    /// @brief Required non-temporary registers, in index order.
    const std::vector<uint16_t> &requiredRegisters() const
    {
        return requiredRegisters_;
    }

    /// @brief Required registers with neither a default nor a builtin.
    /// @details Only a supplied parameter can satisfy these.
    const std::vector<uint16_t> &hardRequiredRegisters() const
    {
        return hardRequiredRegisters_;
    }

  private:
    explicit Bytecode(Parts parts) : parts_(std::move(parts)) {}

    void buildRegisterViews();

    Parts parts_;
    std::vector<uint32_t> conditionEnds_;
    std::vector<uint32_t> resultEnds_;
    std::vector<Value> registerTemplate_;
    std::unordered_map<std::string, uint16_t> inputRegisters_;
    std::vector<uint16_t> builtinRegisters_;
    std::vector<uint16_t> requiredRegisters_;
    std::vector<uint16_t> hardRequiredRegisters_;
};

} // namespace rulesvm::bytecode
