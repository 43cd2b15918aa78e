//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Stdlib.hpp
// Purpose: String and URI helpers behind the inlined standard-library opcodes,
//          and the extension exposing them as callable functions.
// Key invariants: Helpers are pure; "null" results are modelled as empty
//                 optionals or null Values, never as errors.
// Ownership/Lifetime: Stateless.
// Links: vm/BytecodeEvaluator.cpp, vm/RulesEngine.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Uri.hpp"
#include "bytecode/Value.hpp"
#include "support/Expected.hpp"
#include "vm/RulesExtension.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rulesvm::vm::stdlib
{

/// @brief ASCII substring between @p start and @p end.
/// @param reverse Count both bounds from the end of the string.
/// @return Empty when start >= end, end exceeds the length, a bound is
///         negative, or the input contains a non-ASCII byte.
std::optional<std::string> substring(std::string_view input,
                                     int64_t start,
                                     int64_t end,
                                     bool reverse);

/// @brief Validate a DNS host label of 1-63 characters from [A-Za-z0-9-]
///        starting with an alphanumeric character.
/// @param allowDots Validate every dot-separated segment instead.
bool isValidHostLabel(std::string_view label, bool allowDots);

/// @brief Percent-encode every byte outside A-Z a-z 0-9 - . _ ~ with
///        upper-case hex digits.
std::string uriEncode(std::string_view input);

/// @brief Split @p input on @p delimiter.
/// @param limit 0 for no limit, otherwise the maximum number of parts; the
///        last part holds the unsplit remainder.
/// @pre !delimiter.empty() and limit >= 0.
std::vector<std::string> split(std::string_view input, std::string_view delimiter, int64_t limit);

/// @name Checked operations
/// @brief Argument checking shared by the SUBSTRING, IS_VALID_HOST_LABEL and
///        SPLIT opcodes and the std functions of the same name.
/// @details @p fn names the caller in TypeError messages. A null input string
///          yields null, or false for the host label check.
/// @{
support::Expected<bytecode::Value> checkedSubstring(std::string_view fn,
                                                    const bytecode::Value &input,
                                                    const bytecode::Value &start,
                                                    const bytecode::Value &end,
                                                    const bytecode::Value &reverse);

support::Expected<bytecode::Value> checkedIsValidHostLabel(std::string_view fn,
                                                           const bytecode::Value &label,
                                                           const bytecode::Value &allowDots);

support::Expected<bytecode::Value> checkedSplit(std::string_view fn,
                                                const bytecode::Value &input,
                                                const bytecode::Value &delimiter,
                                                const bytecode::Value &limit);
/// @}

/// @brief Property of a URI: scheme, authority, path, normalizedPath or isIp.
/// @return Null for unknown names.
bytecode::Value uriProperty(const bytecode::Uri &uri, std::string_view name);

/// @brief Property lookup on a map (by key) or a URI; null for anything else.
bytecode::Value getProperty(const bytecode::Value &target, std::string_view name);

/// @brief Element @p index of a list; null when out of range or not a list.
bytecode::Value getIndex(const bytecode::Value &target, int64_t index);

/// @brief Extension publishing the standard library as callable functions:
///        substring, isValidHostLabel, parseURL, uriEncode, split,
///        stringEquals, booleanEquals, isSet and not.
class StdExtension final : public RulesExtension
{
  public:
    std::vector<std::shared_ptr<const bytecode::RulesFunction>> functions() const override;
};

} // namespace rulesvm::vm::stdlib
