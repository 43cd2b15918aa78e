//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Bytecode.cpp
// Purpose: Validation and derived register views of a rules program.
// Key invariants: create() is the only way to obtain a Bytecode, so every
//                 instance has passed table validation and call-site linking.
// Ownership/Lifetime: See Bytecode.hpp.
// Links: bytecode/Bytecode.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/Bytecode.hpp"

#include "bytecode/BytecodeWalker.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace rulesvm::bytecode
{

namespace
{

support::Expected<void> checkBodyOffsets(const std::vector<uint32_t> &offsets,
                                         size_t codeSize,
                                         const char *what)
{
    for (size_t i = 0; i < offsets.size(); ++i)
    {
        if (offsets[i] >= codeSize)
            return support::makeFormatError(std::string("Invalid ") + what + " offset at index " +
                                            std::to_string(i));
    }
    return {};
}

/// @brief End offset of each body in @p starts.
/// @details A body runs up to the nearest body offset above its own start,
///          whichever table that offset comes from.
std::vector<uint32_t> bodyEnds(const std::vector<uint32_t> &starts,
                               const std::vector<uint32_t> &sortedOffsets,
                               uint32_t codeSize)
{
    std::vector<uint32_t> ends;
    ends.reserve(starts.size());
    for (uint32_t start : starts)
    {
        auto next = std::upper_bound(sortedOffsets.begin(), sortedOffsets.end(), start);
        ends.push_back(next == sortedOffsets.end() ? codeSize : *next);
    }
    return ends;
}

/// @brief Check every call instruction in the body [start, end).
/// @details The walk continues past returns, since a forward jump can reach
///          code behind them. It stops at the first undecodable byte; that
///          is left to the evaluator to report.
support::Expected<void> verifyCallSites(std::span<const uint8_t> code,
                                        uint32_t start,
                                        uint32_t end,
                                        const std::vector<FunctionSlot> &functions)
{
    BytecodeWalker walker(code, start);
    while (walker.hasNext() && walker.position() < end)
    {
        auto op = walker.currentOpcode();
        if (!op)
            return {};
        if (isCall(*op))
        {
            auto index = walker.operand(0);
            if (!index)
                return {};
            const auto fn = static_cast<uint32_t>(index.value());
            if (fn >= functions.size())
                return support::makeCompileError(support::TrapKind::Bounds,
                                                 "Function index " + std::to_string(fn) +
                                                     " out of range at address " +
                                                     std::to_string(walker.position()));
            const auto &slot = functions[fn];
            auto arity = fixedCallArity(*op);
            if (arity && slot.function && slot.function->argumentCount() != *arity)
                return support::makeCompileError(
                    support::TrapKind::ArityMismatch,
                    "Function " + slot.name + " expects " +
                        std::to_string(slot.function->argumentCount()) + " arguments but " +
                        opcodeName(*op) + " passes " + std::to_string(*arity) + " at address " +
                        std::to_string(walker.position()));
        }
        if (!walker.advance())
            return {};
    }
    return {};
}

} // namespace

support::Expected<Bytecode> Bytecode::create(Parts parts)
{
    if (parts.registers.size() > kMaxRegisters)
        return support::makeFormatError("Too many registers: " +
                                        std::to_string(parts.registers.size()));
    if (parts.constants.size() > 0xFFFF)
        return support::makeFormatError("Too many constants: " +
                                        std::to_string(parts.constants.size()));
    if (parts.functions.size() > 0xFF + 1)
        return support::makeFormatError("Too many functions: " +
                                        std::to_string(parts.functions.size()));
    if (parts.conditionOffsets.size() > 0xFFFF || parts.resultOffsets.size() > 0xFFFF)
        return support::makeFormatError("Too many condition or result bodies");

    std::unordered_set<std::string> names;
    for (const auto &reg : parts.registers)
    {
        if (!names.insert(reg.name).second)
            return support::makeFormatError("Duplicate register name: " + reg.name);
    }

    if (auto ok = checkBodyOffsets(parts.conditionOffsets, parts.code.size(), "condition"); !ok)
        return ok.error();
    if (auto ok = checkBodyOffsets(parts.resultOffsets, parts.code.size(), "result"); !ok)
        return ok.error();

    const auto conditions = static_cast<uint32_t>(parts.conditionOffsets.size());
    const auto results = static_cast<uint32_t>(parts.resultOffsets.size());
    if (auto ok = parts.bdd.validate(conditions, results); !ok)
        return ok.error();

    std::vector<uint32_t> sorted = parts.conditionOffsets;
    sorted.insert(sorted.end(), parts.resultOffsets.begin(), parts.resultOffsets.end());
    std::sort(sorted.begin(), sorted.end());
    const auto codeSize = static_cast<uint32_t>(parts.code.size());
    auto conditionEnds = bodyEnds(parts.conditionOffsets, sorted, codeSize);
    auto resultEnds = bodyEnds(parts.resultOffsets, sorted, codeSize);

    for (uint32_t i = 0; i < conditions; ++i)
    {
        if (auto ok = verifyCallSites(
                parts.code, parts.conditionOffsets[i], conditionEnds[i], parts.functions);
            !ok)
            return ok.error();
    }
    for (uint32_t i = 0; i < results; ++i)
    {
        if (auto ok =
                verifyCallSites(parts.code, parts.resultOffsets[i], resultEnds[i], parts.functions);
            !ok)
            return ok.error();
    }

    Bytecode program(std::move(parts));
    program.conditionEnds_ = std::move(conditionEnds);
    program.resultEnds_ = std::move(resultEnds);
    program.buildRegisterViews();
    return program;
}

void Bytecode::buildRegisterViews()
{
    const auto &regs = parts_.registers;
    registerTemplate_.assign(regs.size(), Value());
    for (size_t i = 0; i < regs.size(); ++i)
    {
        const auto &reg = regs[i];
        const auto idx = static_cast<uint16_t>(i);
        if (reg.defaultValue)
            registerTemplate_[i] = *reg.defaultValue;
        if (!reg.temporary)
            inputRegisters_.emplace(reg.name, idx);
        if (reg.builtin)
            builtinRegisters_.push_back(idx);
        if (reg.required && !reg.temporary)
        {
            requiredRegisters_.push_back(idx);
            if (!reg.defaultValue && !reg.builtin)
                hardRequiredRegisters_.push_back(idx);
        }
    }
}

} // namespace rulesvm::bytecode
