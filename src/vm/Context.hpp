//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Context.hpp
// Purpose: Ambient call context, parameter maps, builtin providers and the
//          resolved endpoint shape shared by the filler, the evaluator and
//          extensions.
// Key invariants: Context keys are unique; later put() calls overwrite.
// Ownership/Lifetime: Plain value types owned by the caller of a resolution.
// Links: vm/RegisterFiller.hpp, vm/RulesExtension.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Uri.hpp"
#include "bytecode/Value.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rulesvm::vm
{

using bytecode::Value;

/// @brief String-keyed bag describing the ambient call (client settings,
///        operation metadata) consulted by builtin providers and extensions.
class Context
{
  public:
    void put(std::string key, Value value)
    {
        entries_.insert_or_assign(std::move(key), std::move(value));
    }

    /// @brief Look up @p key.
    /// @return Pointer to the stored value, or nullptr.
    const Value *get(std::string_view key) const
    {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool contains(std::string_view key) const
    {
        return get(key) != nullptr;
    }

  private:
    std::map<std::string, Value, std::less<>> entries_;
};

/// @brief Caller-supplied parameter values keyed by register name.
using ParamMap = std::unordered_map<std::string, Value>;

/// @brief Provider of a builtin register value; returns null when it has none.
using BuiltinFn = std::function<Value(const Context &)>;

/// @brief Builtin providers keyed by builtin name.
using BuiltinProviders = std::unordered_map<std::string, BuiltinFn>;

/// @brief Header name to values.
using HeaderMap = std::map<std::string, std::vector<std::string>>;

/// @brief Resolved service endpoint.
struct Endpoint
{
    std::shared_ptr<const bytecode::Uri> uri; ///< Endpoint URL.
    HeaderMap headers;                        ///< Headers to attach to requests.
    Value::Map properties;                    ///< Arbitrary property bag.
};

/// @brief Outcome of running the BDD and the selected result body.
struct RunResult
{
    int32_t resultIndex = -1;         ///< Selected result, -1 for a BDD terminal.
    bool terminalValue = false;       ///< Terminal outcome when resultIndex is -1.
    std::optional<Endpoint> endpoint; ///< Set when the body returned an endpoint.
    Value value;                      ///< Payload of RETURN_VALUE.

    bool matched() const
    {
        return resultIndex >= 0;
    }
};

} // namespace rulesvm::vm
