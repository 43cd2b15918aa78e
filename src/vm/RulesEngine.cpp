// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "vm/RulesEngine.hpp"

#include "vm/Stdlib.hpp"

#include <fstream>
#include <iterator>
#include <unordered_map>

namespace rulesvm::vm
{

RulesResolver::RulesResolver(std::shared_ptr<const bytecode::Bytecode> program,
                             ExtensionList extensions,
                             BuiltinProviders builtins,
                             const EngineConfig &config)
    : program_(std::move(program)),
      filler_(RegisterFiller::create(*program_)),
      extensions_(std::make_shared<const ExtensionList>(std::move(extensions))),
      builtins_(std::make_shared<const BuiltinProviders>(std::move(builtins))),
      uriCache_(std::make_shared<UriCache>(config.uriCacheCapacity)),
      trace_(config.trace)
{
}

support::Expected<RunResult> RulesResolver::run(const Context &context,
                                                const ParamMap &params) const
{
    BytecodeEvaluator evaluator(
        *program_, *filler_, *extensions_, *builtins_, uriCache_.get(), trace_);
    return evaluator.run(context, params);
}

support::Expected<Endpoint> RulesResolver::resolveEndpoint(const Context &context,
                                                           const ParamMap &params) const
{
    auto result = run(context, params);
    if (!result)
        return result.error();
    RunResult &r = result.value();
    if (!r.matched())
        return support::makeEvaluationError(support::TrapKind::NoMatch,
                                            "No rule matched the supplied parameters");
    if (!r.endpoint)
        return support::makeEvaluationError(support::TrapKind::NoMatch,
                                            "Result " + std::to_string(r.resultIndex) +
                                                " returned a value instead of an endpoint");
    return std::move(*r.endpoint);
}

RulesEngine::RulesEngine(EngineConfig config) : config_(config)
{
    addExtension(std::make_shared<const stdlib::StdExtension>());
}

RulesEngine &RulesEngine::addFunction(std::shared_ptr<const bytecode::RulesFunction> fn)
{
    std::string name(fn->name());
    functions_.insert_or_assign(std::move(name), std::move(fn));
    return *this;
}

RulesEngine &RulesEngine::addExtension(std::shared_ptr<const RulesExtension> ext)
{
    for (auto &fn : ext->functions())
        addFunction(std::move(fn));
    for (auto &[name, provider] : ext->builtinProviders())
        addBuiltinProvider(name, provider);
    extensions_.push_back(std::move(ext));
    return *this;
}

RulesEngine &RulesEngine::addBuiltinProvider(std::string name, BuiltinFn provider)
{
    providers_.emplace_back(std::move(name), std::move(provider));
    return *this;
}

BuiltinProviders RulesEngine::combinedProviders() const
{
    std::unordered_map<std::string, std::vector<BuiltinFn>> chains;
    for (const auto &[name, provider] : providers_)
    {
        if (provider)
            chains[name].push_back(provider);
    }

    BuiltinProviders out;
    for (auto &[name, chain] : chains)
    {
        if (chain.size() == 1)
        {
            out.emplace(name, std::move(chain.front()));
            continue;
        }
        out.emplace(name,
                    [chain = std::move(chain)](const Context &ctx)
                    {
                        for (const auto &provider : chain)
                        {
                            Value v = provider(ctx);
                            if (v.isSet())
                                return v;
                        }
                        return Value();
                    });
    }
    return out;
}

support::Expected<bytecode::Bytecode> RulesEngine::load(std::span<const uint8_t> image,
                                                        bytecode::ReadOptions options) const
{
    return bytecode::BytecodeReader::read(image, functions_, options);
}

support::Expected<bytecode::Bytecode> RulesEngine::loadFile(const std::string &path,
                                                            bytecode::ReadOptions options) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return support::makeFormatError("Cannot open bytecode file: " + path,
                                        support::TrapKind::IOError);
    std::vector<uint8_t> image((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad())
        return support::makeFormatError("Failed to read bytecode file: " + path,
                                        support::TrapKind::IOError);
    return load(image, options);
}

RulesResolver RulesEngine::makeResolver(bytecode::Bytecode program) const
{
    return RulesResolver(std::make_shared<const bytecode::Bytecode>(std::move(program)),
                         extensions_,
                         combinedProviders(),
                         config_);
}

} // namespace rulesvm::vm
