//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.cpp
// Purpose: Implement deterministic tracing for BDD traversal and bytecode
//          execution.
// Key invariants: Each event produces at most one flushed line; nothing is
//                 written when TraceConfig::mode is Off.
// Ownership/Lifetime: Trace sinks borrow the program and emit to externally
//                     owned streams.
// Links: vm/Trace.hpp, bytecode/Disassembler.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements evaluator tracing.
/// @details Instruction lines reuse the disassembler's formatting so a trace
///          can be read side by side with a `rules-dis` listing. The
///          disassembler pads the mnemonic column; trace lines collapse that
///          padding to keep records compact.

#include "vm/Trace.hpp"

#include "bytecode/BytecodeWalker.hpp"
#include "bytecode/Disassembler.hpp"

#include <iostream>
#include <string>

namespace rulesvm::vm
{

/// @brief Determine whether tracing output should be emitted.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

namespace
{

/// @brief Collapse runs of spaces introduced by column padding.
std::string compact(const std::string &line)
{
    std::string out;
    out.reserve(line.size());
    for (char c : line)
    {
        if (c == ' ' && !out.empty() && out.back() == ' ')
            continue;
        out.push_back(c);
    }
    return out;
}

} // namespace

void TraceSink::onStep(const bytecode::Bytecode &program,
                       BodyKind body,
                       uint32_t index,
                       uint32_t pc)
{
    if (cfg.mode != TraceConfig::Instructions)
        return;
    bytecode::BytecodeWalker walker(program.code(), pc);
    stream() << "[rules] " << (body == BodyKind::Condition ? "cond " : "result ") << index << ' '
             << compact(bytecode::formatInstruction(program, walker)) << '\n'
             << std::flush;
}

void TraceSink::onCondition(uint32_t index, bool holds)
{
    if (!cfg.enabled())
        return;
    stream() << "[rules] condition " << index << " -> " << (holds ? "true" : "false") << '\n'
             << std::flush;
}

void TraceSink::onOutcome(const bytecode::BddOutcome &outcome)
{
    if (!cfg.enabled())
        return;
    stream() << "[rules] bdd -> ";
    if (outcome.hasResult())
        stream() << "result[" << outcome.resultIndex << "]";
    else
        stream() << (outcome.terminalValue ? "TRUE" : "FALSE");
    stream() << '\n' << std::flush;
}

} // namespace rulesvm::vm
