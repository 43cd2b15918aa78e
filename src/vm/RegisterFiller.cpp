//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/RegisterFiller.cpp
// Purpose: Bitmask and array register filling strategies.
//
// Fill order (shared by both strategies):
//   1. Copy the program's register template (defaults, else null).
//   2. Apply supplied parameters to non-temporary registers; a null
//      parameter counts as absent and unknown names are ignored.
//   3. For each builtin register not filled in step 2, call its provider.
//      A missing provider or a null result keeps the default.
//   4. Fail on the first required register that is still null.
//
// Key invariants: Step 3 never overwrites a supplied parameter.
// Ownership/Lifetime: Strategies borrow the program.
// Links: vm/RegisterFiller.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/RegisterFiller.hpp"

#include <cstdint>

namespace rulesvm::vm
{

namespace detail
{

/// @brief Filled-set over a 64-bit mask.
class MaskSet
{
  public:
    explicit MaskSet(size_t) {}

    void set(size_t i)
    {
        bits_ |= uint64_t{1} << i;
    }

    bool test(size_t i) const
    {
        return (bits_ >> i) & 1u;
    }

  private:
    uint64_t bits_ = 0;
};

/// @brief Filled-set over a flag array.
class FlagSet
{
  public:
    explicit FlagSet(size_t n) : flags_(n, false) {}

    void set(size_t i)
    {
        flags_[i] = true;
    }

    bool test(size_t i) const
    {
        return flags_[i];
    }

  private:
    std::vector<bool> flags_;
};

/// @brief Shared fill loop parameterised on the filled-set representation.
template <class FilledSet>
support::Expected<void> fillRegisters(const bytecode::Bytecode &program,
                                      std::vector<Value> &registers,
                                      const Context &context,
                                      const ParamMap &params,
                                      const BuiltinProviders &builtins)
{
    registers = program.registerTemplate();
    FilledSet filled(registers.size());

    const auto &inputs = program.inputRegisters();
    for (const auto &[name, value] : params)
    {
        if (value.isNull())
            continue;
        auto it = inputs.find(name);
        if (it == inputs.end())
            continue;
        registers[it->second] = value;
        filled.set(it->second);
    }

    const auto &defs = program.registers();
    for (uint16_t idx : program.builtinRegisters())
    {
        if (filled.test(idx))
            continue;
        auto provider = builtins.find(*defs[idx].builtin);
        if (provider == builtins.end() || !provider->second)
            continue;
        Value v = provider->second(context);
        if (v.isSet())
        {
            registers[idx] = std::move(v);
            filled.set(idx);
        }
    }

    for (uint16_t idx : program.requiredRegisters())
    {
        if (registers[idx].isNull())
            return support::makeEvaluationError(support::TrapKind::MissingParameter,
                                                "Missing required parameter: " + defs[idx].name);
    }
    return {};
}

class BitmaskFiller final : public RegisterFiller
{
  public:
    explicit BitmaskFiller(const bytecode::Bytecode &program) : program_(program) {}

    Kind getKind() const override
    {
        return Kind::Bitmask;
    }

    support::Expected<void> fill(std::vector<Value> &registers,
                                 const Context &context,
                                 const ParamMap &params,
                                 const BuiltinProviders &builtins) const override
    {
        return fillRegisters<MaskSet>(program_, registers, context, params, builtins);
    }

  private:
    const bytecode::Bytecode &program_;
};

class ArrayFiller final : public RegisterFiller
{
  public:
    explicit ArrayFiller(const bytecode::Bytecode &program) : program_(program) {}

    Kind getKind() const override
    {
        return Kind::Array;
    }

    support::Expected<void> fill(std::vector<Value> &registers,
                                 const Context &context,
                                 const ParamMap &params,
                                 const BuiltinProviders &builtins) const override
    {
        return fillRegisters<FlagSet>(program_, registers, context, params, builtins);
    }

  private:
    const bytecode::Bytecode &program_;
};

} // namespace detail

std::unique_ptr<RegisterFiller> RegisterFiller::create(const bytecode::Bytecode &program)
{
    return create(program,
                  program.registerCount() < kBitmaskLimit ? Kind::Bitmask : Kind::Array);
}

std::unique_ptr<RegisterFiller> RegisterFiller::create(const bytecode::Bytecode &program,
                                                       Kind kind)
{
    switch (kind)
    {
        case Kind::Bitmask:
            if (program.registerCount() < kBitmaskLimit)
                return std::make_unique<detail::BitmaskFiller>(program);
            break;
        case Kind::Array:
            break;
    }
    return std::make_unique<detail::ArrayFiller>(program);
}

} // namespace rulesvm::vm
