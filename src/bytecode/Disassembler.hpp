//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Disassembler.hpp
// Purpose: Human-readable listing of a rules program.
// Key invariants: Output is deterministic for a given program.
//                 A malformed instruction stops its body's listing but never
//                 the report.
// Ownership/Lifetime: Stateless functions over a borrowed program.
// Links: bytecode/BytecodeWalker.hpp, tools/rules-dis/main.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/BytecodeWalker.hpp"

#include <ostream>
#include <string>

namespace rulesvm::bytecode
{

/// @brief Write the full report for @p program to @p os.
void disassemble(const Bytecode &program, std::ostream &os);

/// @brief Full report as a string.
std::string disassemble(const Bytecode &program);

/// @brief One instruction: address, mnemonic, operands and a "; " annotation
///        naming the register, function, constant or jump target it uses.
/// @pre walker.hasNext().
std::string formatInstruction(const Bytecode &program, const BytecodeWalker &walker);

/// @brief Short rendering of a constant: quoted strings (truncated past 50
///        characters), Integer[n], Boolean[b], List[n items], Map[n entries].
std::string formatConstant(const Value &value);

} // namespace rulesvm::bytecode
