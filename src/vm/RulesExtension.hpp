//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/RulesExtension.hpp
// Purpose: Plug-in point contributing functions, builtin providers and an
//          endpoint post-processing hook.
// Key invariants: Extensions are immutable once registered and must tolerate
//                 concurrent calls from independent evaluations.
// Ownership/Lifetime: Shared by the engine and every resolver it creates.
// Links: vm/RulesEngine.hpp, vm/Stdlib.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/RulesFunction.hpp"
#include "vm/Context.hpp"

#include <memory>
#include <vector>

namespace rulesvm::vm
{

class RulesExtension
{
  public:
    virtual ~RulesExtension() = default;

    /// @brief Functions made callable from bytecode.
    virtual std::vector<std::shared_ptr<const bytecode::RulesFunction>> functions() const
    {
        return {};
    }

    /// @brief Builtin register providers keyed by builtin name.
    virtual BuiltinProviders builtinProviders() const
    {
        return {};
    }

    /// @brief Adjust a freshly resolved endpoint.
    /// @param endpoint Endpoint with URI, headers and properties already set.
    /// @param context Ambient call context of the resolution.
    /// @param properties Property map returned by the rule.
    /// @param headers Header map returned by the rule.
    virtual void extractEndpointProperties(Endpoint &endpoint,
                                           const Context &context,
                                           const Value::Map &properties,
                                           const HeaderMap &headers) const
    {
        (void)endpoint;
        (void)context;
        (void)properties;
        (void)headers;
    }
};

} // namespace rulesvm::vm
