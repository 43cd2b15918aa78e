//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Uri.cpp
// Purpose: RFC 3986 style parser for absolute URIs with an authority.
// Key invariants: Rejects whitespace, control characters and the characters
//                 RFC 3986 never allows unescaped; percent signs must be
//                 followed by two hex digits.
// Ownership/Lifetime: Stateless helpers.
// Links: bytecode/Uri.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/Uri.hpp"

#include <cctype>

namespace rulesvm::bytecode
{

namespace
{

bool isSchemeChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool isHexDigit(char c)
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

/// @brief Check the characters of a URI component.
/// @details Brackets are only legal inside the authority (IPv6 literals).
bool validComponent(std::string_view part, bool allowBrackets)
{
    for (size_t i = 0; i < part.size(); ++i)
    {
        const unsigned char c = static_cast<unsigned char>(part[i]);
        if (c <= 0x20 || c == 0x7F)
            return false;
        switch (c)
        {
            case '"':
            case '<':
            case '>':
            case '\\':
            case '^':
            case '`':
            case '{':
            case '|':
            case '}':
                return false;
            case '[':
            case ']':
                if (!allowBrackets)
                    return false;
                break;
            case '%':
                if (i + 2 >= part.size() || !isHexDigit(part[i + 1]) || !isHexDigit(part[i + 2]))
                    return false;
                i += 2;
                break;
            default:
                break;
        }
    }
    return true;
}

bool allDigits(std::string_view s)
{
    for (char c : s)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

/// @brief Split the host out of @p authority, validating the port if present.
std::optional<std::string> extractHost(std::string_view authority)
{
    const size_t at = authority.rfind('@');
    std::string_view hostPort = at == std::string_view::npos ? authority : authority.substr(at + 1);
    if (hostPort.empty())
        return std::nullopt;

    std::string_view host = hostPort;
    std::string_view port;
    if (hostPort.front() == '[')
    {
        const size_t close = hostPort.find(']');
        if (close == std::string_view::npos)
            return std::nullopt;
        host = hostPort.substr(0, close + 1);
        std::string_view rest = hostPort.substr(close + 1);
        if (!rest.empty())
        {
            if (rest.front() != ':')
                return std::nullopt;
            port = rest.substr(1);
        }
    }
    else
    {
        if (hostPort.find_first_of("[]") != std::string_view::npos)
            return std::nullopt;
        const size_t colon = hostPort.rfind(':');
        if (colon != std::string_view::npos)
        {
            host = hostPort.substr(0, colon);
            port = hostPort.substr(colon + 1);
        }
    }
    if (host.empty() || !allDigits(port))
        return std::nullopt;
    return std::string(host);
}

bool isIpv4(std::string_view host)
{
    int octets = 0;
    size_t pos = 0;
    while (pos <= host.size())
    {
        size_t dot = host.find('.', pos);
        if (dot == std::string_view::npos)
            dot = host.size();
        std::string_view part = host.substr(pos, dot - pos);
        if (part.empty() || part.size() > 3 || !allDigits(part))
            return false;
        int value = 0;
        for (char c : part)
            value = value * 10 + (c - '0');
        if (value > 255)
            return false;
        ++octets;
        pos = dot + 1;
        if (dot == host.size())
            break;
    }
    return octets == 4;
}

} // namespace

std::optional<Uri> Uri::parse(std::string_view text)
{
    const size_t sep = text.find("://");
    if (sep == std::string_view::npos || sep == 0)
        return std::nullopt;
    std::string_view scheme = text.substr(0, sep);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front())))
        return std::nullopt;
    for (char c : scheme)
    {
        if (!isSchemeChar(c))
            return std::nullopt;
    }

    std::string_view rest = text.substr(sep + 3);
    std::string_view fragment;
    bool hasFragment = false;
    if (const size_t hash = rest.find('#'); hash != std::string_view::npos)
    {
        fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
        hasFragment = true;
    }
    std::string_view query;
    bool hasQuery = false;
    if (const size_t q = rest.find('?'); q != std::string_view::npos)
    {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
        hasQuery = true;
    }
    const size_t slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    std::string_view path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);

    if (authority.empty())
        return std::nullopt;
    if (!validComponent(authority, true) || !validComponent(path, false) ||
        !validComponent(query, false))
        return std::nullopt;
    if (hasFragment && !validComponent(fragment, false))
        return std::nullopt;
    if (fragment.find('#') != std::string_view::npos)
        return std::nullopt;

    auto host = extractHost(authority);
    if (!host)
        return std::nullopt;

    Uri uri;
    uri.text_ = std::string(text);
    uri.scheme_ = std::string(scheme);
    uri.authority_ = std::string(authority);
    uri.host_ = std::move(*host);
    uri.path_ = std::string(path);
    uri.query_ = std::string(query);
    uri.fragment_ = std::string(fragment);
    uri.hasQuery_ = hasQuery;
    return uri;
}

std::string Uri::normalizedPath() const
{
    if (path_.empty())
        return "/";
    std::string out;
    out.reserve(path_.size() + 2);
    if (path_.front() != '/')
        out.push_back('/');
    out += path_;
    if (out.back() != '/')
        out.push_back('/');
    return out;
}

bool Uri::isIp() const
{
    if (host_.size() >= 2 && host_.front() == '[' && host_.back() == ']')
        return true;
    return isIpv4(host_);
}

} // namespace rulesvm::bytecode
