//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeWalker.hpp
// Purpose: Forward cursor over an instruction section that decodes one
//          instruction at a time.
// Key invariants: The walker never reads outside the span it was given; a
//                 truncated instruction reports an error instead.
// Ownership/Lifetime: Borrows the instruction span, which must outlive it.
// Links: bytecode/Opcode.hpp, bytecode/Disassembler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Opcode.hpp"
#include "support/Expected.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace rulesvm::bytecode
{

/// @brief Sequential instruction decoder used by the disassembler and the
///        call-site verifier.
class BytecodeWalker
{
  public:
    /// @param code Instruction section.
    /// @param start Offset of the first instruction to decode.
    explicit BytecodeWalker(std::span<const uint8_t> code, uint32_t start = 0)
        : code_(code), pc_(start)
    {
    }

    /// @brief True while the cursor points inside the section.
    bool hasNext() const
    {
        return pc_ < code_.size();
    }

    /// @brief Offset of the current instruction.
    uint32_t position() const
    {
        return pc_;
    }

    /// @brief Raw opcode byte at the cursor; requires hasNext().
    uint8_t rawOpcode() const
    {
        return code_[pc_];
    }

    /// @brief Decoded opcode, or empty at the end or on an unknown byte.
    std::optional<Opcode> currentOpcode() const;

    /// @brief Length of the current instruction, or -1 when it cannot be decoded.
    int instructionLength() const;

    /// @brief Number of operands of the current instruction (0 when unknown).
    int operandCount() const;

    /// @brief Decode operand @p index of the current instruction.
    /// @return The operand value, or an error when @p index is out of range or
    ///         the operand bytes run past the end of the section.
    support::Expected<int32_t> operand(int index) const;

    /// @brief Absolute target of the current jump instruction.
    /// @return Error when the instruction is not a jump.
    support::Expected<uint32_t> jumpTarget() const;

    /// @brief True when the current instruction ends a body.
    bool isReturn() const;

    /// @brief Step past the current instruction.
    /// @return False at the end of the section or on an unknown opcode.
    bool advance();

  private:
    std::span<const uint8_t> code_;
    uint32_t pc_;
};

} // namespace rulesvm::bytecode
