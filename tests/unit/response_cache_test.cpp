#include "delivery/response_cache.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace avatarlink::delivery;
using std::chrono::milliseconds;

class ResponseCacheTest : public ::testing::Test {
protected:
    const ResponseCache::Clock::time_point t0 = ResponseCache::Clock::now();
};

TEST_F(ResponseCacheTest, HitWithinTtl) {
    ResponseCache cache(16, milliseconds(5000));
    cache.put("fp1", "duix", R"({"video":"a"})", t0);

    auto hit = cache.get("fp1", t0 + milliseconds(2000));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->provider, "duix");
    EXPECT_EQ(hit->response_body, R"({"video":"a"})");
}

TEST_F(ResponseCacheTest, MissAfterTtl) {
    ResponseCache cache(16, milliseconds(5000));
    cache.put("fp1", "duix", "body", t0);

    EXPECT_FALSE(cache.get("fp1", t0 + milliseconds(5000)).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResponseCacheTest, MissForUnknownFingerprint) {
    ResponseCache cache(16, milliseconds(5000));
    EXPECT_FALSE(cache.get("nope", t0).has_value());
}

TEST_F(ResponseCacheTest, PerEntryTtlOverridesDefault) {
    ResponseCache cache(16, milliseconds(5000));
    cache.put("short", "p", "body", milliseconds(100), t0);
    cache.put("long", "p", "body", t0);

    EXPECT_FALSE(cache.get("short", t0 + milliseconds(150)).has_value());
    EXPECT_TRUE(cache.get("long", t0 + milliseconds(150)).has_value());
}

TEST_F(ResponseCacheTest, NonPositiveTtlIsNotStored) {
    ResponseCache cache(16, milliseconds(5000));
    cache.put("fp", "p", "body", milliseconds(0), t0);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResponseCacheTest, OverwriteRefreshesEntry) {
    ResponseCache cache(16, milliseconds(1000));
    cache.put("fp", "a", "old", t0);
    cache.put("fp", "b", "new", t0 + milliseconds(900));

    auto hit = cache.get("fp", t0 + milliseconds(1500));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->provider, "b");
    EXPECT_EQ(hit->response_body, "new");
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResponseCacheTest, EvictsLeastRecentlyUsed) {
    ResponseCache cache(2, milliseconds(60000), 1);
    cache.put("a", "p", "A", t0);
    cache.put("b", "p", "B", t0);

    // Touch "a" so "b" becomes the LRU victim
    ASSERT_TRUE(cache.get("a", t0).has_value());
    cache.put("c", "p", "C", t0);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get("a", t0).has_value());
    EXPECT_FALSE(cache.get("b", t0).has_value());
    EXPECT_TRUE(cache.get("c", t0).has_value());
}

TEST_F(ResponseCacheTest, CapacityBoundsWholeCache) {
    ResponseCache cache(10, milliseconds(5000), 4);
    EXPECT_EQ(cache.capacity(), 10u);

    for (int i = 0; i < 1000; ++i) {
        cache.put("fp" + std::to_string(i), "p", "body", t0);
        ASSERT_LE(cache.size(), 10u) << "after put " << i;
    }
    EXPECT_EQ(cache.size(), 10u);
}

TEST_F(ResponseCacheTest, NoEvictionBelowCapacity) {
    // One entry per shard on average; hashing will pile several into one shard
    ResponseCache cache(8, milliseconds(5000), 8);
    for (int i = 0; i < 8; ++i) {
        cache.put("fp" + std::to_string(i), "p", "body" + std::to_string(i), t0);
    }

    EXPECT_EQ(cache.size(), 8u);
    for (int i = 0; i < 8; ++i) {
        auto entry = cache.get("fp" + std::to_string(i), t0);
        ASSERT_TRUE(entry.has_value()) << "fp" << i;
        EXPECT_EQ(entry->response_body, "body" + std::to_string(i));
    }
}

TEST_F(ResponseCacheTest, ExpiredEntriesFreeCapacity) {
    ResponseCache cache(2, milliseconds(1000), 2);
    cache.put("a", "p", "A", t0);
    cache.put("b", "p", "B", t0);

    // Lazy expiry on get releases the slot
    EXPECT_FALSE(cache.get("a", t0 + milliseconds(2000)).has_value());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.get("b", t0 + milliseconds(2000)).has_value());
    EXPECT_EQ(cache.size(), 0u);

    cache.put("c", "p", "C", milliseconds(5000), t0 + milliseconds(2000));
    cache.put("d", "p", "D", milliseconds(5000), t0 + milliseconds(2000));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get("c", t0 + milliseconds(2000)).has_value());
    EXPECT_TRUE(cache.get("d", t0 + milliseconds(2000)).has_value());
}

TEST_F(ResponseCacheTest, ClearAndPurge) {
    ResponseCache cache(16, milliseconds(1000));
    cache.put("a", "p", "A", t0);
    cache.put("b", "p", "B", milliseconds(5000), t0);

    EXPECT_EQ(cache.purge_expired(t0 + milliseconds(2000)), 1u);
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResponseCacheTest, ConcurrentPutAndGet) {
    ResponseCache cache(256, milliseconds(60000));
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                const std::string key = "fp" + std::to_string((t * 31 + i) % 64);
                cache.put(key, "p" + std::to_string(t), "body");
                auto hit = cache.get(key);
                if (hit) {
                    EXPECT_EQ(hit->response_body, "body");
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.size(), 64u);
}
