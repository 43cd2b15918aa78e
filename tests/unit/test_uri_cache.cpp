// File: tests/unit/test_uri_cache.cpp
// Purpose: Verify the bounded LRU cache of parsed endpoint URIs.
// Key invariants: Hits promote entries; the least recently used entry is
//                 evicted first; unparsable text is never cached.
// Ownership/Lifetime: Standalone unit test executable.
// Links: vm/UriCache.hpp

#include <gtest/gtest.h>

#include "vm/UriCache.hpp"

#include <string>
#include <thread>
#include <vector>

using rulesvm::vm::UriCache;

TEST(UriCache, ReturnsSameInstanceOnHit)
{
    UriCache cache(4);
    auto first = cache.get("https://a.example.com/x");
    ASSERT_TRUE(first);
    EXPECT_EQ(first->text(), "https://a.example.com/x");
    auto second = cache.get("https://a.example.com/x");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(cache.size(), 1u);
}

TEST(UriCache, EvictsLeastRecentlyUsed)
{
    UriCache cache(2);
    ASSERT_TRUE(cache.get("https://a"));
    ASSERT_TRUE(cache.get("https://b"));
    ASSERT_TRUE(cache.get("https://a"));
    ASSERT_TRUE(cache.get("https://c"));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains("https://a"));
    EXPECT_FALSE(cache.contains("https://b"));
    EXPECT_TRUE(cache.contains("https://c"));
}

TEST(UriCache, DoesNotCacheInvalidText)
{
    UriCache cache(4);
    EXPECT_FALSE(cache.get("not a uri"));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains("not a uri"));
}

TEST(UriCache, ZeroCapacityDisablesCaching)
{
    UriCache cache(0);
    auto uri = cache.get("https://a");
    ASSERT_TRUE(uri);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_NE(cache.get("https://a").get(), uri.get());
}

TEST(UriCache, ConcurrentLookupsStayBounded)
{
    UriCache cache(8);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t)
    {
        workers.emplace_back(
            [&cache, t]
            {
                for (int i = 0; i < 200; ++i)
                {
                    auto uri = cache.get("https://host" + std::to_string((i + t) % 16) + ".example");
                    EXPECT_TRUE(uri);
                }
            });
    }
    for (auto &w : workers)
        w.join();
    EXPECT_LE(cache.size(), 8u);
}
