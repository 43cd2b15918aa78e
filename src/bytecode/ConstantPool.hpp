//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/ConstantPool.hpp
// Purpose: Deduplicating constant pool used while building a program.
// Key invariants: Structurally equal values share one index.
//                 Indices are stable once assigned.
// Ownership: The pool owns its values.
// Lifetime: Lives inside a BytecodeWriter; moved into the Bytecode at build().
// Links: bytecode/BytecodeWriter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Value.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace rulesvm::bytecode
{

namespace detail
{
/// @brief Find or add a value to a pool with deduplication.
/// @details Linear scan for an existing match; appends when none is found.
/// @return Index of the value in the pool (existing or newly appended).
template <typename T, typename Eq>
inline uint32_t findOrAddToPool(std::vector<T> &pool, const T &value, Eq eq)
{
    for (size_t i = 0; i < pool.size(); ++i)
    {
        if (eq(pool[i], value))
        {
            return static_cast<uint32_t>(i);
        }
    }
    uint32_t idx = static_cast<uint32_t>(pool.size());
    pool.push_back(value);
    return idx;
}
} // namespace detail

/// @brief Append-only pool of constant values.
class ConstantPool
{
  public:
    /// @brief Index of @p value, appending it when not already present.
    uint32_t indexOf(const Value &value)
    {
        return detail::findOrAddToPool(values_, value, [](const Value &a, const Value &b) {
            return a == b;
        });
    }

    uint32_t size() const
    {
        return static_cast<uint32_t>(values_.size());
    }

    const std::vector<Value> &values() const
    {
        return values_;
    }

    /// @brief Surrender the pool contents.
    std::vector<Value> take()
    {
        return std::move(values_);
    }

  private:
    std::vector<Value> values_;
};

} // namespace rulesvm::bytecode
