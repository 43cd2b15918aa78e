//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeWriter.hpp
// Purpose: Builder that emits instruction bytes, records body starts,
//          resolves forward jumps and assembles a Bytecode; plus the
//          serializer producing the on-disk image.
// Key invariants: Jumps are forward only and fit in 16 bits.
//                 Constants and function names are deduplicated.
//                 The first construction error is latched and reported by
//                 build().
// Ownership: The writer owns everything it emits until build() moves it
//            into the program.
// Lifetime: Single use; build() leaves the writer empty.
// Links: bytecode/Bytecode.hpp, bytecode/BytecodeReader.hpp
//
//===----------------------------------------------------------------------===//
//
// Image layout written by serialize():
//   header (44 bytes) | condition table | result table | function table |
//   register table | BDD table | instructions | constant pool
// Condition and result tables hold absolute file offsets.

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/ConstantPool.hpp"
#include "support/Expected.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rulesvm::bytecode
{

class BytecodeWriter
{
  public:
    /// @brief Handle returned by createLabel().
    using Label = uint32_t;

    void writeByte(uint8_t value);

    /// @brief Append a big-endian 16-bit value.
    void writeShort(uint16_t value);

    void writeOpcode(Opcode op)
    {
        writeByte(static_cast<uint8_t>(op));
    }

    /// @brief Offset at which the next byte will be written.
    uint32_t position() const
    {
        return static_cast<uint32_t>(code_.size());
    }

    /// @brief Pool index of @p value, adding it when new.
    uint32_t getConstantIndex(const Value &value);

    /// @brief Function table index of @p name, adding it when new.
    uint32_t registerFunction(std::string_view name);

    /// @brief Record the current position as the start of the next condition body.
    void markConditionStart();

    /// @brief Record the current position as the start of the next result body.
    void markResultStart();

    Label createLabel();

    /// @brief Reserve a 16-bit jump offset patched when @p label is marked.
    void writeJumpPlaceholder(Label label);

    /// @brief Bind @p label to the current position and patch its placeholders.
    void markLabel(Label label);

    /// @brief Assemble the program.
    /// @param registers Register definitions, usually RegisterAllocator::registry().
    /// @param functions Implementations for every registered function name.
    /// @param bddNodes Flat (variable, high, low) node table.
    /// @param bddRoot Root reference.
    /// @return The program, or the first construction, linking or validation error.
    support::Expected<Bytecode> build(std::vector<RegisterDefinition> registers,
                                      const std::vector<std::shared_ptr<const RulesFunction>> &functions,
                                      std::vector<int32_t> bddNodes,
                                      int32_t bddRoot);

    /// @brief Produce the binary image of @p program.
    /// @return The image, or a compile error for values that cannot be encoded.
    static support::Expected<std::vector<uint8_t>> serialize(const Bytecode &program);

  private:
    struct LabelState
    {
        std::optional<uint32_t> position;      ///< Bound position once marked.
        std::vector<uint32_t> placeholders;    ///< Offsets of unpatched jumps.
    };

    void patch(uint32_t placeholder, uint32_t target);
    void fail(support::TrapKind kind, std::string message);

    std::vector<uint8_t> code_;
    std::vector<uint32_t> conditionOffsets_;
    std::vector<uint32_t> resultOffsets_;
    ConstantPool constants_;
    std::vector<std::string> functionNames_;
    std::vector<LabelState> labels_;
    std::optional<support::RulesError> error_;
};

} // namespace rulesvm::bytecode
