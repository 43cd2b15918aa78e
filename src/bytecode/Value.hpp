//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Value.hpp
// Purpose: Dynamically typed runtime value manipulated by the evaluator and
//          stored in the constant pool.
// Key invariants: Kind order matches the variant alternative order.
//                 Aggregates (list, map, template, URI) are immutable once
//                 wrapped, so copies share storage.
// Ownership/Lifetime: Values own their payload through value semantics or
//                     shared ownership of immutable aggregates.
// Links: bytecode/ConstantPool.hpp, vm/BytecodeEvaluator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace rulesvm::bytecode
{

class Uri;
class Value;

/// @brief String template made of literal segments and expression placeholders.
/// @details RESOLVE_TEMPLATE pops one string per placeholder and interleaves
///          them with the literal segments in order.
struct StringTemplate
{
    /// @brief One template segment.
    struct Part
    {
        bool placeholder = false; ///< True for an expression slot.
        std::string text;         ///< Literal text; empty for placeholders.

        bool operator==(const Part &) const = default;
    };

    std::vector<Part> parts; ///< Segments in output order.

    /// @brief Number of expression slots in the template.
    size_t placeholderCount() const;

    bool operator==(const StringTemplate &) const = default;
};

/// @brief Runtime value: null, string, integer, boolean, list, map, template or URI.
class Value
{
  public:
    /// @brief Discriminator in variant alternative order.
    enum class Kind : uint8_t
    {
        Null = 0,
        String,
        Integer,
        Boolean,
        List,
        Map,
        Template,
        Uri
    };

    using List = std::vector<Value>;
    using Map = std::map<std::string, Value, std::less<>>;

    /// @brief Construct null.
    Value() = default;

    static Value null()
    {
        return Value();
    }

    static Value string(std::string s);
    static Value integer(int64_t v);
    static Value boolean(bool b);
    static Value list(List items);
    static Value map(Map entries);
    static Value stringTemplate(StringTemplate tpl);
    static Value uri(std::shared_ptr<const Uri> uri);

    Kind kind() const
    {
        return static_cast<Kind>(data_.index());
    }

    bool isNull() const
    {
        return kind() == Kind::Null;
    }

    /// @brief True for every value except null.
    bool isSet() const
    {
        return !isNull();
    }

    /// @brief True only for the boolean true.
    bool isTrue() const;

    /// @brief True only for the boolean false.
    bool isFalse() const;

    /// @brief Condition truthiness: neither null nor boolean false.
    bool truthy() const
    {
        return !isNull() && !isFalse();
    }

    /// @name Typed accessors
    /// @brief Return a pointer to the payload, or nullptr for another kind.
    /// @{
    const std::string *asString() const;
    const int64_t *asInteger() const;
    const bool *asBoolean() const;
    const List *asList() const;
    const Map *asMap() const;
    const StringTemplate *asTemplate() const;
    const Uri *asUri() const;
    /// @}

    /// @brief Shared handle of a URI value, or null for another kind.
    std::shared_ptr<const Uri> uriHandle() const;

    /// @brief Render for messages and traces: strings raw, aggregates JSON-like.
    std::string toDisplayString() const;

    /// @brief Structural equality; URIs compare by text.
    friend bool operator==(const Value &lhs, const Value &rhs);

  private:
    using Storage = std::variant<std::monostate,
                                 std::string,
                                 int64_t,
                                 bool,
                                 std::shared_ptr<const List>,
                                 std::shared_ptr<const Map>,
                                 std::shared_ptr<const StringTemplate>,
                                 std::shared_ptr<const Uri>>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/// @brief Human-readable kind name ("null", "string", ...).
const char *kindName(Value::Kind kind);

} // namespace rulesvm::bytecode
