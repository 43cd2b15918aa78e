//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Uri.hpp
// Purpose: Parsed absolute URI used by PARSE_URL, GET_PROPERTY and endpoints.
// Key invariants: A Uri always has a scheme and a non-empty authority.
//                 text() is the exact string the Uri was parsed from.
// Ownership/Lifetime: Immutable value; shared via std::shared_ptr<const Uri>
//                     inside runtime values and the URI cache.
// Links: bytecode/Value.hpp, vm/UriCache.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rulesvm::bytecode
{

/// @brief Absolute hierarchical URI of the form scheme://authority[path][?query][#fragment].
class Uri
{
  public:
    /// @brief Parse @p text.
    /// @return The parsed URI, or empty when the text is not a valid absolute URI.
    static std::optional<Uri> parse(std::string_view text);

    const std::string &text() const
    {
        return text_;
    }

    const std::string &scheme() const
    {
        return scheme_;
    }

    /// @brief Authority component including user info and port.
    const std::string &authority() const
    {
        return authority_;
    }

    /// @brief Host portion of the authority; IPv6 literals keep their brackets.
    const std::string &host() const
    {
        return host_;
    }

    /// @brief Raw path, possibly empty.
    const std::string &path() const
    {
        return path_;
    }

    const std::string &query() const
    {
        return query_;
    }

    /// @brief True when a '?' was present, even with an empty query.
    bool hasQuery() const
    {
        return hasQuery_;
    }

    const std::string &fragment() const
    {
        return fragment_;
    }

    /// @brief Path guaranteed to start and end with '/'; "/" for an empty path.
    std::string normalizedPath() const;

    /// @brief True when the host is an IPv4 dotted quad or a bracketed IPv6 literal.
    bool isIp() const;

    bool operator==(const Uri &other) const
    {
        return text_ == other.text_;
    }

  private:
    Uri() = default;

    std::string text_;
    std::string scheme_;
    std::string authority_;
    std::string host_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    bool hasQuery_ = false;
};

} // namespace rulesvm::bytecode
