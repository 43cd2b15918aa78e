//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/UriCache.hpp
// Purpose: Thread-safe string-keyed LRU cache of parsed URIs shared by the
//          evaluators of one resolver.
//
// Key invariants:
//   - At most capacity() entries; the least-recently-used entry is evicted.
//   - get() counts as use and promotes the entry.
//   - Unparsable strings are never cached.
//   - Capacity 0 disables caching; every call parses.
//
// Ownership/Lifetime:
//   - Parsed URIs are shared with callers via std::shared_ptr and outlive
//     eviction.
//
// Links: bytecode/Uri.hpp, vm/BytecodeEvaluator.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Uri.hpp"

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace rulesvm::vm
{

class UriCache
{
  public:
    /// @brief Create a cache holding at most @p capacity URIs.
    explicit UriCache(size_t capacity);

    /// @brief Parsed URI for @p text, from the cache or freshly parsed.
    /// @return Null when @p text is not a valid URI.
    std::shared_ptr<const bytecode::Uri> get(std::string_view text);

    /// @brief Number of cached entries.
    size_t size() const;

    size_t capacity() const
    {
        return capacity_;
    }

    /// @brief True when @p text is cached; does not promote it.
    bool contains(std::string_view text) const;

  private:
    using Entry = std::pair<std::string, std::shared_ptr<const bytecode::Uri>>;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> order_; ///< Front is most recently used.
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace rulesvm::vm
