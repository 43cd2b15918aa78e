//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Stdlib.cpp
// Purpose: Standard-library helpers and the StdExtension function table.
// Key invariants: Checked operations type-check their arguments and report
//                 mismatches as TypeError; null string inputs yield null.
//                 Opcodes and std functions share the checked operations.
// Ownership/Lifetime: Stateless.
// Links: vm/Stdlib.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Stdlib.hpp"

#include <cctype>
#include <memory>

namespace rulesvm::vm::stdlib
{

using bytecode::Value;

std::optional<std::string> substring(std::string_view input,
                                     int64_t start,
                                     int64_t end,
                                     bool reverse)
{
    const auto len = static_cast<int64_t>(input.size());
    if (start < 0 || start >= end || end > len)
        return std::nullopt;
    for (char c : input)
    {
        if (static_cast<unsigned char>(c) > 0x7F)
            return std::nullopt;
    }
    if (reverse)
        return std::string(input.substr(static_cast<size_t>(len - end),
                                        static_cast<size_t>(end - start)));
    return std::string(input.substr(static_cast<size_t>(start), static_cast<size_t>(end - start)));
}

namespace
{

bool isAlnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isSingleLabel(std::string_view label)
{
    if (label.empty() || label.size() > 63 || !isAlnum(label.front()))
        return false;
    for (char c : label)
    {
        if (!isAlnum(c) && c != '-')
            return false;
    }
    return true;
}

} // namespace

bool isValidHostLabel(std::string_view label, bool allowDots)
{
    if (!allowDots)
        return isSingleLabel(label);
    size_t pos = 0;
    while (true)
    {
        const size_t dot = label.find('.', pos);
        if (!isSingleLabel(label.substr(pos, dot == std::string_view::npos ? dot : dot - pos)))
            return false;
        if (dot == std::string_view::npos)
            return true;
        pos = dot + 1;
    }
}

std::string uriEncode(std::string_view input)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (char ch : input)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (isAlnum(ch) || c == '-' || c == '.' || c == '_' || c == '~')
        {
            out.push_back(ch);
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[c >> 4]);
        out.push_back(kHex[c & 0x0F]);
    }
    return out;
}

std::vector<std::string> split(std::string_view input, std::string_view delimiter, int64_t limit)
{
    std::vector<std::string> parts;
    size_t pos = 0;
    while (true)
    {
        if (limit > 0 && static_cast<int64_t>(parts.size()) == limit - 1)
            break;
        const size_t found = input.find(delimiter, pos);
        if (found == std::string_view::npos)
            break;
        parts.emplace_back(input.substr(pos, found - pos));
        pos = found + delimiter.size();
    }
    parts.emplace_back(input.substr(pos));
    return parts;
}

Value uriProperty(const bytecode::Uri &uri, std::string_view name)
{
    if (name == "scheme")
        return Value::string(uri.scheme());
    if (name == "authority")
        return Value::string(uri.authority());
    if (name == "path")
        return Value::string(uri.path());
    if (name == "normalizedPath")
        return Value::string(uri.normalizedPath());
    if (name == "isIp")
        return Value::boolean(uri.isIp());
    return Value();
}

Value getProperty(const Value &target, std::string_view name)
{
    if (const auto *map = target.asMap())
    {
        auto it = map->find(name);
        return it == map->end() ? Value() : it->second;
    }
    if (const auto *uri = target.asUri())
        return uriProperty(*uri, name);
    return Value();
}

Value getIndex(const Value &target, int64_t index)
{
    const auto *list = target.asList();
    if (!list || index < 0 || index >= static_cast<int64_t>(list->size()))
        return Value();
    return (*list)[static_cast<size_t>(index)];
}

//===----------------------------------------------------------------------===//
// Checked operations
//===----------------------------------------------------------------------===//

namespace
{

support::RulesError typeError(std::string_view fn, const char *expected, const Value &got)
{
    return support::makeEvaluationError(support::TrapKind::TypeError,
                                        std::string(fn) + " expected " + expected + " but got " +
                                            bytecode::kindName(got.kind()));
}

/// @brief String argument, or nullptr for null; sets @p error on a type mismatch.
const std::string *stringArg(std::string_view fn,
                             const Value &v,
                             std::optional<support::RulesError> &error)
{
    if (v.isNull())
        return nullptr;
    if (const auto *s = v.asString())
        return s;
    error = typeError(fn, "a string", v);
    return nullptr;
}

} // namespace

support::Expected<Value> checkedSubstring(std::string_view fn,
                                          const Value &input,
                                          const Value &start,
                                          const Value &end,
                                          const Value &reverse)
{
    std::optional<support::RulesError> error;
    const std::string *s = stringArg(fn, input, error);
    if (error)
        return *error;
    const auto *from = start.asInteger();
    const auto *to = end.asInteger();
    const auto *backwards = reverse.asBoolean();
    if (!from || !to)
        return typeError(fn, "integer bounds", from ? end : start);
    if (!backwards)
        return typeError(fn, "a boolean", reverse);
    if (!s)
        return Value();
    auto out = substring(*s, *from, *to, *backwards);
    return out ? Value::string(std::move(*out)) : Value();
}

support::Expected<Value> checkedIsValidHostLabel(std::string_view fn,
                                                 const Value &label,
                                                 const Value &allowDots)
{
    std::optional<support::RulesError> error;
    const std::string *s = stringArg(fn, label, error);
    if (error)
        return *error;
    bool dots = false;
    if (allowDots.isSet())
    {
        const auto *b = allowDots.asBoolean();
        if (!b)
            return typeError(fn, "a boolean", allowDots);
        dots = *b;
    }
    return Value::boolean(s && isValidHostLabel(*s, dots));
}

support::Expected<Value> checkedSplit(std::string_view fn,
                                      const Value &input,
                                      const Value &delimiter,
                                      const Value &limit)
{
    std::optional<support::RulesError> error;
    const std::string *s = stringArg(fn, input, error);
    if (error)
        return *error;
    const auto *delim = delimiter.asString();
    if (!delim || delim->empty())
        return typeError(fn, "a non-empty delimiter", delimiter);
    const auto *n = limit.asInteger();
    if (!n || *n < 0)
        return typeError(fn, "a non-negative integer limit", limit);
    if (!s)
        return Value();
    Value::List items;
    for (auto &part : split(*s, *delim, *n))
        items.push_back(Value::string(std::move(part)));
    return Value::list(std::move(items));
}

//===----------------------------------------------------------------------===//
// StdExtension
//===----------------------------------------------------------------------===//

namespace
{

support::Expected<Value> callSubstring(std::span<const Value> args)
{
    return checkedSubstring("substring", args[0], args[1], args[2], args[3]);
}

support::Expected<Value> callIsValidHostLabel(std::span<const Value> args)
{
    return checkedIsValidHostLabel("isValidHostLabel", args[0], args[1]);
}

support::Expected<Value> callParseUrl(std::span<const Value> args)
{
    std::optional<support::RulesError> error;
    const std::string *text = stringArg("parseURL", args[0], error);
    if (error)
        return *error;
    if (!text)
        return Value();
    auto uri = bytecode::Uri::parse(*text);
    if (!uri || uri->hasQuery())
        return Value();
    return Value::uri(std::make_shared<const bytecode::Uri>(std::move(*uri)));
}

support::Expected<Value> callUriEncode(std::span<const Value> args)
{
    std::optional<support::RulesError> error;
    const std::string *text = stringArg("uriEncode", args[0], error);
    if (error)
        return *error;
    return text ? Value::string(uriEncode(*text)) : Value();
}

support::Expected<Value> callSplit(std::span<const Value> args)
{
    return checkedSplit("split", args[0], args[1], args[2]);
}

/// @brief Shared body of stringEquals and booleanEquals.
template <class T>
support::Expected<Value> typedEquals(std::string_view fn,
                                     const char *expected,
                                     std::span<const Value> args,
                                     const T *(Value::*get)() const)
{
    if (args[0].isNull() || args[1].isNull())
        return Value::boolean(false);
    const T *a = (args[0].*get)();
    const T *b = (args[1].*get)();
    if (!a)
        return typeError(fn, expected, args[0]);
    if (!b)
        return typeError(fn, expected, args[1]);
    return Value::boolean(*a == *b);
}

} // namespace

std::vector<std::shared_ptr<const bytecode::RulesFunction>> StdExtension::functions() const
{
    using bytecode::makeFunction;
    return {
        makeFunction("substring", 4, callSubstring),
        makeFunction("isValidHostLabel", 2, callIsValidHostLabel),
        makeFunction("parseURL", 1, callParseUrl),
        makeFunction("uriEncode", 1, callUriEncode),
        makeFunction("split", 3, callSplit),
        makeFunction("stringEquals",
                     2,
                     [](std::span<const Value> args) {
                         return typedEquals<std::string>(
                             "stringEquals", "strings", args, &Value::asString);
                     }),
        makeFunction("booleanEquals",
                     2,
                     [](std::span<const Value> args) {
                         return typedEquals<bool>(
                             "booleanEquals", "booleans", args, &Value::asBoolean);
                     }),
        makeFunction("isSet",
                     1,
                     [](std::span<const Value> args) -> support::Expected<Value> {
                         return Value::boolean(args[0].isSet());
                     }),
        makeFunction("not",
                     1,
                     [](std::span<const Value> args) -> support::Expected<Value> {
                         return Value::boolean(args[0].isFalse());
                     }),
    };
}

} // namespace rulesvm::vm::stdlib
