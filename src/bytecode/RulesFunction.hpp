//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/RulesFunction.hpp
// Purpose: Interface of extension functions callable through FN0..FN3 and FN.
// Key invariants: argumentCount() is fixed for the lifetime of the function;
//                 apply() receives exactly that many arguments.
// Ownership/Lifetime: Functions are shared (std::shared_ptr<const RulesFunction>)
//                     between the registry, loaded programs and resolvers.
// Links: bytecode/Bytecode.hpp, vm/RulesExtension.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Value.hpp"
#include "support/Expected.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rulesvm::bytecode
{

/// @brief Callable extension function.
/// @details Implementations must be safe to call concurrently from several
///          evaluators.
class RulesFunction
{
  public:
    virtual ~RulesFunction() = default;

    /// @brief Name used in the function table of a bytecode image.
    virtual std::string_view name() const = 0;

    /// @brief Declared number of arguments.
    virtual uint32_t argumentCount() const = 0;

    /// @brief Invoke the function.
    /// @param args Arguments in push order.
    /// @return Result value, or an error message carried by RulesError.
    virtual support::Expected<Value> apply(std::span<const Value> args) const = 0;
};

/// @brief Name to implementation map consulted when linking a loaded image.
using FunctionRegistry = std::unordered_map<std::string, std::shared_ptr<const RulesFunction>>;

/// @brief Signature of the callable wrapped by makeFunction().
using FunctionBody = std::function<support::Expected<Value>(std::span<const Value>)>;

/// @brief Wrap a callable into a RulesFunction.
std::shared_ptr<const RulesFunction> makeFunction(std::string name,
                                                  uint32_t argumentCount,
                                                  FunctionBody body);

} // namespace rulesvm::bytecode
