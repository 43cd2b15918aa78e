//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/RulesEngine.hpp
// Purpose: Public entry point: collects functions, extensions and builtin
//          providers, loads bytecode, and produces resolvers.
//
// Key invariants:
//   - The standard-library extension is always registered first.
//   - Builtin providers registered under one name are consulted in
//     registration order; the first non-null value wins.
//   - A RulesResolver is immutable once built and safe to use from several
//     threads; each call creates its own evaluator.
//
// Ownership/Lifetime:
//   - RulesResolver shares ownership of its program, filler, extensions and
//     URI cache, so copies stay valid after the engine is destroyed.
//
// Links: vm/BytecodeEvaluator.hpp, bytecode/BytecodeReader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/BytecodeReader.hpp"
#include "bytecode/RulesFunction.hpp"
#include "support/Expected.hpp"
#include "vm/BytecodeEvaluator.hpp"
#include "vm/Context.hpp"
#include "vm/RegisterFiller.hpp"
#include "vm/RulesExtension.hpp"
#include "vm/UriCache.hpp"
#include "vm/VMConfig.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace rulesvm::vm
{

/// @brief Evaluates one loaded program against caller parameters.
class RulesResolver
{
  public:
    /// @brief Resolve an endpoint.
    /// @return Evaluation error NoMatch when the BDD ends on a terminal or
    ///         the selected result returns a plain value.
    support::Expected<Endpoint> resolveEndpoint(const Context &context,
                                                const ParamMap &params) const;

    /// @brief Evaluate and return whatever the selected result produced.
    support::Expected<RunResult> run(const Context &context, const ParamMap &params) const;

    const bytecode::Bytecode &program() const
    {
        return *program_;
    }

    UriCache &uriCache() const
    {
        return *uriCache_;
    }

  private:
    friend class RulesEngine;

    RulesResolver(std::shared_ptr<const bytecode::Bytecode> program,
                  ExtensionList extensions,
                  BuiltinProviders builtins,
                  const EngineConfig &config);

    std::shared_ptr<const bytecode::Bytecode> program_;
    std::shared_ptr<const RegisterFiller> filler_;
    std::shared_ptr<const ExtensionList> extensions_;
    std::shared_ptr<const BuiltinProviders> builtins_;
    std::shared_ptr<UriCache> uriCache_;
    TraceConfig trace_;
};

class RulesEngine
{
  public:
    explicit RulesEngine(EngineConfig config = {});

    /// @brief Register @p fn; replaces an earlier function of the same name.
    RulesEngine &addFunction(std::shared_ptr<const bytecode::RulesFunction> fn);

    /// @brief Register the functions, builtin providers and endpoint hook of @p ext.
    RulesEngine &addExtension(std::shared_ptr<const RulesExtension> ext);

    /// @brief Add a provider for builtin @p name after any existing ones.
    RulesEngine &addBuiltinProvider(std::string name, BuiltinFn provider);

    const bytecode::FunctionRegistry &functions() const
    {
        return functions_;
    }

    const EngineConfig &config() const
    {
        return config_;
    }

    /// @brief Decode @p image and link it against the registered functions.
    support::Expected<bytecode::Bytecode> load(std::span<const uint8_t> image,
                                               bytecode::ReadOptions options = {}) const;

    /// @brief Read @p path and load it; unreadable files yield an IOError.
    support::Expected<bytecode::Bytecode> loadFile(const std::string &path,
                                                   bytecode::ReadOptions options = {}) const;

    /// @brief Create a resolver owning @p program.
    RulesResolver makeResolver(bytecode::Bytecode program) const;

  private:
    /// @brief Combine chained providers into one provider per name.
    BuiltinProviders combinedProviders() const;

    EngineConfig config_;
    bytecode::FunctionRegistry functions_;
    ExtensionList extensions_;
    std::vector<std::pair<std::string, BuiltinFn>> providers_; ///< Registration order.
};

} // namespace rulesvm::vm
