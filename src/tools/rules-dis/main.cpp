//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for the `rules-dis` binary.
//
//===----------------------------------------------------------------------===//

#include "tools/rules-dis/driver.hpp"

#include <iostream>

#ifndef RULESVM_RULES_DIS_SKIP_MAIN
int main(int argc, char **argv)
{
    return rulesvm::tools::dis::runCLI(argc, argv, std::cout, std::cerr);
}
#endif
