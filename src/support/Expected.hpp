//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/Expected.hpp
// Purpose: Lightweight Expected container pairing a value with a RulesError.
// Key invariants: Exactly one of value or error is engaged.
// Ownership/Lifetime: Owns its payload by value.
// Links: support/Error.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/Error.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace rulesvm::support
{

/// @brief Expected-style container holding either a value or a RulesError.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors the subset of std::expected the library needs.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, RulesError> &&
                                       std::is_constructible_v<T, U &&>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(RulesError error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error; requires !hasValue().
    const RulesError &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<RulesError> error_;
};

/// @brief Expected specialization for operations with no success payload.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(RulesError error);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    /// @brief Access the error; requires !hasValue().
    const RulesError &error() const &;

  private:
    std::optional<RulesError> error_;
};

} // namespace rulesvm::support
