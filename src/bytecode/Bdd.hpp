//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Bdd.hpp
// Purpose: Binary decision diagram selecting which result body runs.
// Key invariants: Nodes are stored as flat (variable, high, low) triples.
//                 Reference 1 is TRUE, -1 is FALSE, n >= 2 names node n-1,
//                 negative references are complemented, and references at or
//                 above kResultOffset name result bodies.
//                 Node 0 is the terminal node and is never evaluated.
// Ownership/Lifetime: Owns its node table; immutable after construction.
// Links: bytecode/Bytecode.hpp, vm/BytecodeEvaluator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/Expected.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace rulesvm::bytecode
{

/// @brief Outcome of a BDD traversal.
struct BddOutcome
{
    int32_t resultIndex = -1;   ///< Selected result, or -1 when a terminal was reached.
    bool terminalValue = false; ///< Boolean outcome when resultIndex is -1.

    bool hasResult() const
    {
        return resultIndex >= 0;
    }
};

/// @brief Reduced ordered BDD over condition indices.
class Bdd
{
  public:
    static constexpr int32_t kTrueRef = 1;
    static constexpr int32_t kFalseRef = -1;
    static constexpr int32_t kResultOffset = 100'000'000;

    Bdd() = default;

    /// @param nodes Flat node table, three entries per node.
    /// @param root Root reference.
    Bdd(std::vector<int32_t> nodes, int32_t root) : nodes_(std::move(nodes)), root_(root) {}

    uint32_t nodeCount() const
    {
        return static_cast<uint32_t>(nodes_.size() / 3);
    }

    int32_t root() const
    {
        return root_;
    }

    const std::vector<int32_t> &nodes() const
    {
        return nodes_;
    }

    int32_t variable(uint32_t node) const
    {
        return nodes_[node * 3];
    }

    int32_t high(uint32_t node) const
    {
        return nodes_[node * 3 + 1];
    }

    int32_t low(uint32_t node) const
    {
        return nodes_[node * 3 + 2];
    }

    static bool isTerminal(int32_t ref)
    {
        return ref == kTrueRef || ref == kFalseRef;
    }

    static bool isResult(int32_t ref)
    {
        return ref >= kResultOffset;
    }

    /// @brief Render a reference as TRUE, FALSE, result[i], node[i] or !node[i].
    static std::string formatReference(int32_t ref);

    /// @brief Check table shape and every reference against the program's counts.
    support::Expected<void> validate(uint32_t conditionCount, uint32_t resultCount) const;

    /// @brief Walk from the root, asking @p test for each visited condition.
    /// @tparam ConditionFn Callable `support::Expected<bool>(uint32_t condition)`.
    /// @details Requires a validated table. A walk longer than nodeCount()
    ///          steps means the table is cyclic and fails with BddCycle.
    template <class ConditionFn> support::Expected<BddOutcome> evaluate(ConditionFn &&test) const
    {
        int32_t ref = root_;
        uint32_t steps = 0;
        while (true)
        {
            if (isResult(ref))
                return BddOutcome{ref - kResultOffset, false};
            if (isTerminal(ref))
                return BddOutcome{-1, ref == kTrueRef};
            if (++steps > nodeCount())
                return support::makeEvaluationError(support::TrapKind::BddCycle,
                                                    "BDD traversal did not terminate");

            const bool complemented = ref < 0;
            const uint32_t idx = static_cast<uint32_t>(std::abs(ref)) - 1;
            auto holds = test(static_cast<uint32_t>(variable(idx)));
            if (!holds)
                return holds.error();
            int32_t next = holds.value() ? high(idx) : low(idx);
            if (complemented && !isResult(next))
                next = -next;
            ref = next;
        }
    }

  private:
    std::vector<int32_t> nodes_;
    int32_t root_ = kFalseRef;
};

} // namespace rulesvm::bytecode
