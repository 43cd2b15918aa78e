// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/RegisterAllocator.hpp"

#include <utility>

namespace rulesvm::bytecode
{

support::Expected<uint8_t> RegisterAllocator::allocate(std::string name,
                                                       bool required,
                                                       std::optional<Value> defaultValue,
                                                       std::optional<std::string> builtin,
                                                       bool temporary)
{
    if (indices_.count(name) != 0)
        return support::makeCompileError(support::TrapKind::DuplicateRegister,
                                         "Register already allocated: " + name);
    if (registry_.size() >= kMaxRegisters)
        return support::makeCompileError(support::TrapKind::RegisterOverflow,
                                         "Too many registers: limit is " +
                                             std::to_string(kMaxRegisters));

    const auto idx = static_cast<uint8_t>(registry_.size());
    indices_.emplace(name, idx);
    registry_.push_back(RegisterDefinition{
        std::move(name), required, temporary, std::move(defaultValue), std::move(builtin)});
    return idx;
}

support::Expected<uint8_t> RegisterAllocator::getOrAllocateRegister(std::string_view name)
{
    if (auto it = indices_.find(std::string(name)); it != indices_.end())
        return it->second;
    return allocate(std::string(name), false, std::nullopt, std::nullopt, true);
}

support::Expected<uint8_t> RegisterAllocator::getRegister(std::string_view name) const
{
    auto it = indices_.find(std::string(name));
    if (it == indices_.end())
        return support::makeCompileError(support::TrapKind::UnknownRegister,
                                         "Register not allocated: " + std::string(name));
    return it->second;
}

} // namespace rulesvm::bytecode
