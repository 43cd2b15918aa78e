// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/Value.hpp"

#include "bytecode/Uri.hpp"

#include <utility>

namespace rulesvm::bytecode
{

size_t StringTemplate::placeholderCount() const
{
    size_t n = 0;
    for (const auto &part : parts)
    {
        if (part.placeholder)
            ++n;
    }
    return n;
}

Value Value::string(std::string s)
{
    return Value(Storage(std::in_place_index<1>, std::move(s)));
}

Value Value::integer(int64_t v)
{
    return Value(Storage(std::in_place_index<2>, v));
}

Value Value::boolean(bool b)
{
    return Value(Storage(std::in_place_index<3>, b));
}

Value Value::list(List items)
{
    return Value(Storage(std::make_shared<const List>(std::move(items))));
}

Value Value::map(Map entries)
{
    return Value(Storage(std::make_shared<const Map>(std::move(entries))));
}

Value Value::stringTemplate(StringTemplate tpl)
{
    return Value(Storage(std::make_shared<const StringTemplate>(std::move(tpl))));
}

Value Value::uri(std::shared_ptr<const Uri> uri)
{
    if (!uri)
        return Value();
    return Value(Storage(std::move(uri)));
}

bool Value::isTrue() const
{
    const bool *b = asBoolean();
    return b && *b;
}

bool Value::isFalse() const
{
    const bool *b = asBoolean();
    return b && !*b;
}

const std::string *Value::asString() const
{
    return std::get_if<std::string>(&data_);
}

const int64_t *Value::asInteger() const
{
    return std::get_if<int64_t>(&data_);
}

const bool *Value::asBoolean() const
{
    return std::get_if<bool>(&data_);
}

const Value::List *Value::asList() const
{
    auto *p = std::get_if<std::shared_ptr<const List>>(&data_);
    return p ? p->get() : nullptr;
}

const Value::Map *Value::asMap() const
{
    auto *p = std::get_if<std::shared_ptr<const Map>>(&data_);
    return p ? p->get() : nullptr;
}

const StringTemplate *Value::asTemplate() const
{
    auto *p = std::get_if<std::shared_ptr<const StringTemplate>>(&data_);
    return p ? p->get() : nullptr;
}

const Uri *Value::asUri() const
{
    auto *p = std::get_if<std::shared_ptr<const Uri>>(&data_);
    return p ? p->get() : nullptr;
}

std::shared_ptr<const Uri> Value::uriHandle() const
{
    auto *p = std::get_if<std::shared_ptr<const Uri>>(&data_);
    return p ? *p : nullptr;
}

namespace
{

void appendQuoted(std::string &out, const std::string &s)
{
    out.push_back('"');
    for (char c : s)
    {
        if (c == '"' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
}

void appendDisplay(std::string &out, const Value &v, bool nested)
{
    switch (v.kind())
    {
        case Value::Kind::Null:
            out += "null";
            break;
        case Value::Kind::String:
            if (nested)
                appendQuoted(out, *v.asString());
            else
                out += *v.asString();
            break;
        case Value::Kind::Integer:
            out += std::to_string(*v.asInteger());
            break;
        case Value::Kind::Boolean:
            out += *v.asBoolean() ? "true" : "false";
            break;
        case Value::Kind::List:
        {
            out.push_back('[');
            bool first = true;
            for (const auto &item : *v.asList())
            {
                if (!first)
                    out += ", ";
                first = false;
                appendDisplay(out, item, true);
            }
            out.push_back(']');
            break;
        }
        case Value::Kind::Map:
        {
            out.push_back('{');
            bool first = true;
            for (const auto &[key, item] : *v.asMap())
            {
                if (!first)
                    out += ", ";
                first = false;
                appendQuoted(out, key);
                out += ": ";
                appendDisplay(out, item, true);
            }
            out.push_back('}');
            break;
        }
        case Value::Kind::Template:
            for (const auto &part : v.asTemplate()->parts)
                out += part.placeholder ? std::string("{}") : part.text;
            break;
        case Value::Kind::Uri:
            out += v.asUri()->text();
            break;
    }
}

} // namespace

std::string Value::toDisplayString() const
{
    std::string out;
    appendDisplay(out, *this, false);
    return out;
}

bool operator==(const Value &lhs, const Value &rhs)
{
    if (lhs.kind() != rhs.kind())
        return false;
    switch (lhs.kind())
    {
        case Value::Kind::Null:
            return true;
        case Value::Kind::String:
            return *lhs.asString() == *rhs.asString();
        case Value::Kind::Integer:
            return *lhs.asInteger() == *rhs.asInteger();
        case Value::Kind::Boolean:
            return *lhs.asBoolean() == *rhs.asBoolean();
        case Value::Kind::List:
            return *lhs.asList() == *rhs.asList();
        case Value::Kind::Map:
            return *lhs.asMap() == *rhs.asMap();
        case Value::Kind::Template:
            return *lhs.asTemplate() == *rhs.asTemplate();
        case Value::Kind::Uri:
            return *lhs.asUri() == *rhs.asUri();
    }
    return false;
}

const char *kindName(Value::Kind kind)
{
    switch (kind)
    {
        case Value::Kind::Null:
            return "null";
        case Value::Kind::String:
            return "string";
        case Value::Kind::Integer:
            return "integer";
        case Value::Kind::Boolean:
            return "boolean";
        case Value::Kind::List:
            return "list";
        case Value::Kind::Map:
            return "map";
        case Value::Kind::Template:
            return "template";
        case Value::Kind::Uri:
            return "uri";
    }
    return "unknown";
}

} // namespace rulesvm::bytecode
