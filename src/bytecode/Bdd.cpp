// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/Bdd.hpp"

#include <limits>

namespace rulesvm::bytecode
{

std::string Bdd::formatReference(int32_t ref)
{
    if (ref == kTrueRef)
        return "TRUE";
    if (ref == kFalseRef)
        return "FALSE";
    if (isResult(ref))
        return "result[" + std::to_string(ref - kResultOffset) + "]";
    if (ref < 0)
        return "!node[" + std::to_string(static_cast<int64_t>(-static_cast<int64_t>(ref)) - 1) +
               "]";
    return "node[" + std::to_string(ref - 1) + "]";
}

namespace
{

bool validReference(int32_t ref, uint32_t nodeCount, uint32_t resultCount)
{
    if (ref == 0 || ref == std::numeric_limits<int32_t>::min())
        return false;
    if (Bdd::isResult(ref))
        return static_cast<uint32_t>(ref - Bdd::kResultOffset) < resultCount;
    if (Bdd::isTerminal(ref))
        return true;
    const int64_t idx = (ref < 0 ? -static_cast<int64_t>(ref) : ref) - 1;
    return idx < static_cast<int64_t>(nodeCount);
}

} // namespace

support::Expected<void> Bdd::validate(uint32_t conditionCount, uint32_t resultCount) const
{
    if (nodes_.size() % 3 != 0)
        return support::makeFormatError("BDD node table length is not a multiple of 3");

    const uint32_t count = nodeCount();
    if (!validReference(root_, count, resultCount))
        return support::makeFormatError("Invalid BDD root reference: " + std::to_string(root_));

    for (uint32_t i = 1; i < count; ++i)
    {
        const int32_t var = variable(i);
        if (var < 0 || static_cast<uint32_t>(var) >= conditionCount)
            return support::makeFormatError("BDD node " + std::to_string(i) +
                                            " references unknown condition " +
                                            std::to_string(var));
        if (!validReference(high(i), count, resultCount) ||
            !validReference(low(i), count, resultCount))
            return support::makeFormatError("BDD node " + std::to_string(i) +
                                            " has an invalid child reference");
    }
    return {};
}

} // namespace rulesvm::bytecode
