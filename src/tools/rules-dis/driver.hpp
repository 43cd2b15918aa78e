//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the routine powering the standalone `rules-dis` CLI. The entry
// point is factored into a separate unit so tests can drive the tool with
// in-memory streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Exposes the `rules-dis` command-line workflow.

#pragma once

#include <iosfwd>

namespace rulesvm::tools::dis
{

/// @brief Execute the rules-dis CLI with injectable streams.
/// @details Supported invocations:
///          - `rules-dis --version`
///          - `rules-dis [--no-link] FILE` prints the disassembly of FILE;
///            `--no-link` tolerates functions the engine does not provide.
///          - `rules-dis --resolve FILE [name=value...]` resolves an endpoint
///            with string parameters. The RULESVM_TRACE environment variable
///            ("bdd" or "instructions") enables tracing on @p err.
/// @return Zero on success; one on usage, load or evaluation failure.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace rulesvm::tools::dis
