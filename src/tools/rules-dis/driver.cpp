//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `rules-dis` workflow: load a bytecode file through a default
// engine, then either print its disassembly or resolve an endpoint from
// name=value parameters.
//
//===----------------------------------------------------------------------===//

#include "tools/rules-dis/driver.hpp"

#include "bytecode/Disassembler.hpp"
#include "support/Error.hpp"
#include "vm/RulesEngine.hpp"

#include <cstdlib>
#include <ostream>
#include <string>
#include <string_view>

namespace rulesvm::tools::dis
{

namespace
{

void printUsage(std::ostream &err)
{
    err << "Usage: rules-dis [--no-link] <file.rbc>\n"
        << "       rules-dis --resolve <file.rbc> [name=value...]\n";
}

/// @brief Trace configuration requested through RULESVM_TRACE.
vm::TraceConfig traceFromEnvironment(std::ostream &err)
{
    vm::TraceConfig cfg;
    if (const char *mode = std::getenv("RULESVM_TRACE"))
    {
        const std::string_view m(mode);
        if (m == "bdd")
            cfg.mode = vm::TraceConfig::Bdd;
        else if (m == "instructions")
            cfg.mode = vm::TraceConfig::Instructions;
    }
    cfg.out = &err;
    return cfg;
}

int disassembleFile(const std::string &path, bool link, std::ostream &out, std::ostream &err)
{
    vm::RulesEngine engine;
    bytecode::ReadOptions options;
    options.allowUnresolvedFunctions = !link;
    auto program = engine.loadFile(path, options);
    if (!program)
    {
        support::printError(program.error(), err);
        return 1;
    }
    bytecode::disassemble(program.value(), out);
    return 0;
}

int resolveFile(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    vm::ParamMap params;
    for (int i = 3; i < argc; ++i)
    {
        const std::string arg(argv[i]);
        const auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            err << "rules-dis: expected name=value, got '" << arg << "'\n";
            return 1;
        }
        params.insert_or_assign(arg.substr(0, eq), vm::Value::string(arg.substr(eq + 1)));
    }

    vm::EngineConfig config;
    config.trace = traceFromEnvironment(err);
    vm::RulesEngine engine(config);
    auto program = engine.loadFile(argv[2]);
    if (!program)
    {
        support::printError(program.error(), err);
        return 1;
    }
    const auto resolver = engine.makeResolver(std::move(program.value()));
    auto endpoint = resolver.resolveEndpoint(vm::Context{}, params);
    if (!endpoint)
    {
        support::printError(endpoint.error(), err);
        return 1;
    }

    const vm::Endpoint &ep = endpoint.value();
    out << "URI: " << ep.uri->text() << '\n';
    for (const auto &[name, values] : ep.headers)
    {
        out << "Header: " << name << ':';
        for (size_t i = 0; i < values.size(); ++i)
            out << (i ? ", " : " ") << values[i];
        out << '\n';
    }
    for (const auto &[key, value] : ep.properties)
        out << "Property: " << key << " = " << value.toDisplayString() << '\n';
    return 0;
}

} // namespace

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    if (argc == 2 && std::string_view(argv[1]) == "--version")
    {
        out << "rules-dis (bytecode 1.1)\n";
        return 0;
    }
    if (argc >= 3 && std::string_view(argv[1]) == "--resolve")
        return resolveFile(argc, argv, out, err);
    if (argc == 2 && argv[1][0] != '-')
        return disassembleFile(argv[1], true, out, err);
    if (argc == 3 && std::string_view(argv[1]) == "--no-link")
        return disassembleFile(argv[2], false, out, err);
    printUsage(err);
    return 1;
}

} // namespace rulesvm::tools::dis
