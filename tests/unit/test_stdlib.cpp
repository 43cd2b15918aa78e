// File: tests/unit/test_stdlib.cpp
// Purpose: Verify the standard-library helpers and the functions exposed by
//          the standard extension.
// Key invariants: String helpers return null rather than failing on bad
//                 bounds; checked operations and callable variants report
//                 kind mismatches as TypeError.
// Ownership/Lifetime: Standalone unit test executable.
// Links: vm/Stdlib.hpp

#include <gtest/gtest.h>

#include "bytecode/RulesFunction.hpp"
#include "bytecode/Uri.hpp"
#include "bytecode/Value.hpp"
#include "vm/Stdlib.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using rulesvm::bytecode::RulesFunction;
using rulesvm::bytecode::Uri;
using rulesvm::bytecode::Value;
using rulesvm::support::TrapKind;
namespace stdlib = rulesvm::vm::stdlib;

namespace
{

std::shared_ptr<const RulesFunction> stdFunction(std::string_view name)
{
    for (auto &fn : stdlib::StdExtension().functions())
    {
        if (fn->name() == name)
            return fn;
    }
    ADD_FAILURE() << "no standard function " << name;
    return nullptr;
}

rulesvm::support::Expected<Value> call(std::string_view name, std::vector<Value> args)
{
    auto fn = stdFunction(name);
    if (!fn)
        return rulesvm::support::makeEvaluationError(TrapKind::MissingFunction, std::string(name));
    return fn->apply(args);
}

} // namespace

TEST(Stdlib, Substring)
{
    EXPECT_TRUE(stdlib::substring("abcdef", 0, 3, false) == std::optional<std::string>("abc"));
    EXPECT_TRUE(stdlib::substring("abcdef", 0, 3, true) == std::optional<std::string>("def"));
    EXPECT_TRUE(stdlib::substring("abcdef", 2, 6, false) == std::optional<std::string>("cdef"));
    EXPECT_FALSE(stdlib::substring("abcdef", 3, 3, false));
    EXPECT_FALSE(stdlib::substring("abcdef", 0, 7, false));
    EXPECT_FALSE(stdlib::substring("abcdef", -1, 2, false));
    EXPECT_FALSE(stdlib::substring("ab\xC3\xA9xyz", 0, 2, false));
}

TEST(Stdlib, HostLabels)
{
    EXPECT_TRUE(stdlib::isValidHostLabel("us-east-1", false));
    EXPECT_FALSE(stdlib::isValidHostLabel("-leading", false));
    EXPECT_FALSE(stdlib::isValidHostLabel("", false));
    EXPECT_FALSE(stdlib::isValidHostLabel("under_score", false));
    EXPECT_FALSE(stdlib::isValidHostLabel("a.b", false));
    EXPECT_TRUE(stdlib::isValidHostLabel("a.b", true));
    EXPECT_FALSE(stdlib::isValidHostLabel("a..b", true));
    EXPECT_FALSE(stdlib::isValidHostLabel("a.", true));
    EXPECT_TRUE(stdlib::isValidHostLabel(std::string(63, 'a'), false));
    EXPECT_FALSE(stdlib::isValidHostLabel(std::string(64, 'a'), false));
}

TEST(Stdlib, UriEncode)
{
    EXPECT_EQ(stdlib::uriEncode("AZaz09-._~"), "AZaz09-._~");
    EXPECT_EQ(stdlib::uriEncode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(stdlib::uriEncode("\xC3\xA9"), "%C3%A9");
    EXPECT_EQ(stdlib::uriEncode(""), "");
}

TEST(Stdlib, Split)
{
    using Parts = std::vector<std::string>;
    EXPECT_EQ(stdlib::split("a--b--c", "--", 0), (Parts{"a", "b", "c"}));
    EXPECT_EQ(stdlib::split("a--b--c", "--", 2), (Parts{"a", "b--c"}));
    EXPECT_EQ(stdlib::split("a--b--c", "--", 1), (Parts{"a--b--c"}));
    EXPECT_EQ(stdlib::split("abc", ",", 0), (Parts{"abc"}));
    EXPECT_EQ(stdlib::split("a,", ",", 0), (Parts{"a", ""}));
    EXPECT_EQ(stdlib::split("", ",", 0), (Parts{""}));
}

TEST(Stdlib, UriProperties)
{
    auto uri = Uri::parse("https://example.com:8443/a/b");
    ASSERT_TRUE(uri);
    EXPECT_EQ(stdlib::uriProperty(*uri, "scheme"), Value::string("https"));
    EXPECT_EQ(stdlib::uriProperty(*uri, "authority"), Value::string("example.com:8443"));
    EXPECT_EQ(stdlib::uriProperty(*uri, "path"), Value::string("/a/b"));
    EXPECT_EQ(stdlib::uriProperty(*uri, "normalizedPath"), Value::string("/a/b/"));
    EXPECT_EQ(stdlib::uriProperty(*uri, "isIp"), Value::boolean(false));
    EXPECT_TRUE(stdlib::uriProperty(*uri, "port").isNull());
}

TEST(Stdlib, PropertyAndIndexAccess)
{
    const Value map = Value::map({{"name", Value::string("x")}});
    EXPECT_EQ(stdlib::getProperty(map, "name"), Value::string("x"));
    EXPECT_TRUE(stdlib::getProperty(map, "other").isNull());
    EXPECT_TRUE(stdlib::getProperty(Value::string("s"), "name").isNull());

    auto uri = std::make_shared<const Uri>(*Uri::parse("http://10.0.0.1/"));
    EXPECT_EQ(stdlib::getProperty(Value::uri(uri), "isIp"), Value::boolean(true));

    const Value list = Value::list({Value::integer(1), Value::integer(2)});
    EXPECT_EQ(stdlib::getIndex(list, 1), Value::integer(2));
    EXPECT_TRUE(stdlib::getIndex(list, 2).isNull());
    EXPECT_TRUE(stdlib::getIndex(list, -1).isNull());
    EXPECT_TRUE(stdlib::getIndex(map, 0).isNull());
}

TEST(StdExtension, ExposesFunctionsWithArities)
{
    const std::vector<std::pair<std::string, uint32_t>> expected{
        {"substring", 4}, {"isValidHostLabel", 2}, {"parseURL", 1},
        {"uriEncode", 1}, {"split", 3},            {"stringEquals", 2},
        {"booleanEquals", 2}, {"isSet", 1},        {"not", 1}};
    for (const auto &[name, arity] : expected)
    {
        auto fn = stdFunction(name);
        ASSERT_TRUE(fn);
        EXPECT_EQ(fn->argumentCount(), arity) << name;
    }
}

TEST(StdExtension, TypedEquality)
{
    auto same = call("stringEquals", {Value::string("a"), Value::string("a")});
    ASSERT_TRUE(same);
    EXPECT_EQ(same.value(), Value::boolean(true));

    auto withNull = call("booleanEquals", {Value(), Value::boolean(false)});
    ASSERT_TRUE(withNull);
    EXPECT_EQ(withNull.value(), Value::boolean(false));

    auto mismatch = call("stringEquals", {Value::string("a"), Value::integer(1)});
    ASSERT_FALSE(mismatch);
    EXPECT_EQ(mismatch.error().kind, TrapKind::TypeError);
    EXPECT_EQ(mismatch.error().message, "stringEquals expected strings but got integer");
}

TEST(StdExtension, StringFunctions)
{
    auto sub = call("substring",
                    {Value::string("us-west-2"), Value::integer(0), Value::integer(2), Value::boolean(false)});
    ASSERT_TRUE(sub);
    EXPECT_EQ(sub.value(), Value::string("us"));

    auto nullInput = call("substring",
                          {Value(), Value::integer(0), Value::integer(2), Value::boolean(false)});
    ASSERT_TRUE(nullInput);
    EXPECT_TRUE(nullInput.value().isNull());

    auto badBounds = call("substring",
                          {Value::string("x"), Value::string("0"), Value::integer(2), Value::boolean(false)});
    ASSERT_FALSE(badBounds);
    EXPECT_EQ(badBounds.error().kind, TrapKind::TypeError);

    auto encoded = call("uriEncode", {Value::string("a/b")});
    ASSERT_TRUE(encoded);
    EXPECT_EQ(encoded.value(), Value::string("a%2Fb"));

    auto label = call("isValidHostLabel", {Value::string("a.b"), Value::boolean(true)});
    ASSERT_TRUE(label);
    EXPECT_EQ(label.value(), Value::boolean(true));

    auto parts = call("split", {Value::string("a:b"), Value::string(":"), Value::integer(0)});
    ASSERT_TRUE(parts);
    EXPECT_EQ(parts.value(), Value::list({Value::string("a"), Value::string("b")}));

    auto badDelimiter = call("split", {Value::string("a"), Value::string(""), Value::integer(0)});
    ASSERT_FALSE(badDelimiter);
    EXPECT_EQ(badDelimiter.error().kind, TrapKind::TypeError);
}

TEST(Stdlib, CheckedOperationsNameTheirCaller)
{
    auto sub = stdlib::checkedSubstring(
        "SUBSTRING", Value::integer(3), Value::integer(0), Value::integer(1), Value::boolean(false));
    ASSERT_FALSE(sub);
    EXPECT_EQ(sub.error().message, "SUBSTRING expected a string but got integer");

    auto fnSub = call("substring",
                      {Value::integer(3), Value::integer(0), Value::integer(1), Value::boolean(false)});
    ASSERT_FALSE(fnSub);
    EXPECT_EQ(fnSub.error().message, "substring expected a string but got integer");

    auto label = stdlib::checkedIsValidHostLabel("isValidHostLabel", Value(), Value());
    ASSERT_TRUE(label);
    EXPECT_EQ(label.value(), Value::boolean(false));

    auto limit = call("split", {Value::string("a"), Value::string(","), Value::integer(-1)});
    ASSERT_FALSE(limit);
    EXPECT_EQ(limit.error().kind, TrapKind::TypeError);
    EXPECT_EQ(limit.error().message, "split expected a non-negative integer limit but got integer");

    auto nullInput = stdlib::checkedSplit("SPLIT", Value(), Value::string(","), Value::integer(0));
    ASSERT_TRUE(nullInput);
    EXPECT_TRUE(nullInput.value().isNull());
}

TEST(StdExtension, ParseUrl)
{
    auto parsed = call("parseURL", {Value::string("https://example.com/path")});
    ASSERT_TRUE(parsed);
    ASSERT_NE(parsed.value().asUri(), nullptr);
    EXPECT_EQ(parsed.value().asUri()->authority(), "example.com");

    auto withQuery = call("parseURL", {Value::string("https://example.com/?a=b")});
    ASSERT_TRUE(withQuery);
    EXPECT_TRUE(withQuery.value().isNull());

    auto invalid = call("parseURL", {Value::string("not a url")});
    ASSERT_TRUE(invalid);
    EXPECT_TRUE(invalid.value().isNull());
}

TEST(StdExtension, Predicates)
{
    auto set = call("isSet", {Value::integer(0)});
    ASSERT_TRUE(set);
    EXPECT_EQ(set.value(), Value::boolean(true));

    auto unset = call("isSet", {Value()});
    ASSERT_TRUE(unset);
    EXPECT_EQ(unset.value(), Value::boolean(false));

    auto notFalse = call("not", {Value::boolean(false)});
    ASSERT_TRUE(notFalse);
    EXPECT_EQ(notFalse.value(), Value::boolean(true));

    auto notNull = call("not", {Value()});
    ASSERT_TRUE(notNull);
    EXPECT_EQ(notNull.value(), Value::boolean(false));
}
