#include "FakeStore.hpp"

#include "resilink/cache/TieredCacheManager.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace resilink;
using namespace std::chrono_literals;

namespace {

boost::json::value sampleGame() {
    return boost::json::parse(R"({"id":42,"teams":["NYJ","BUF"],"odds":{"spread":-3.5},"final":false})");
}

class TieredCacheManagerTest : public ::testing::Test {
protected:
    test::FakeStore store;
    cache::TieredCacheManager cache{store};
};

} // namespace

TEST_F(TieredCacheManagerTest, SetThenGetReturnsEqualValue) {
    ASSERT_TRUE(cache.set("game:42", sampleGame(), {}, "nfl"));

    auto cached = cache.get("game:42", "nfl");
    ASSERT_TRUE(cached);
    EXPECT_EQ(*cached, sampleGame());
    EXPECT_TRUE(store.exists("nfl:game:42"));
    EXPECT_FALSE(cache.get("game:42"));
}

TEST_F(TieredCacheManagerTest, StoreHitIsPromotedToLocalTier) {
    store.set("scores", R"([1,2,3])", 60s);

    auto first = cache.get("scores");
    ASSERT_TRUE(first);
    EXPECT_EQ(first->as_array().size(), 3u);
    EXPECT_EQ(cache.getStats().keyCount, 1u);

    store.setDown(true);
    auto second = cache.get("scores");
    ASSERT_TRUE(second);
    EXPECT_EQ(*second, *first);
}

TEST_F(TieredCacheManagerTest, ExpiredEntriesMiss) {
    ASSERT_TRUE(cache.set("short", boost::json::value("lived"), cache::CacheOptions{1s, {}}));
    EXPECT_TRUE(cache.get("short"));

    std::this_thread::sleep_for(1100ms);

    EXPECT_FALSE(cache.get("short"));
    EXPECT_FALSE(cache.exists("short"));
}

TEST_F(TieredCacheManagerTest, InvalidateByTagRemovesTaggedKeysOnly) {
    cache::CacheOptions tagged{std::nullopt, {"week-7"}};
    cache.set("a", 1, tagged);
    cache.set("b", 2, tagged);
    cache.set("c", 3);

    EXPECT_EQ(cache.invalidateByTag("week-7"), 2u);
    EXPECT_FALSE(cache.get("a"));
    EXPECT_FALSE(cache.get("b"));
    EXPECT_TRUE(cache.get("c"));
    EXPECT_FALSE(store.exists("tag:week-7"));
    EXPECT_EQ(cache.invalidateByTag("week-7"), 0u);
}

TEST_F(TieredCacheManagerTest, ShortLivedTaggedWriteKeepsLongerMembersIndexed) {
    cache.set("season", 1, cache::CacheOptions{300s, {"team:nyj"}});
    cache.set("live", 2, cache::CacheOptions{1s, {"team:nyj"}});
    EXPECT_GE(store.ttl("tag:team:nyj"), 299);

    std::this_thread::sleep_for(1100ms);

    EXPECT_EQ(cache.invalidateByTag("team:nyj"), 1u);
    EXPECT_FALSE(cache.get("season"));
}

TEST_F(TieredCacheManagerTest, TagSetWithPersistentMemberDoesNotExpire) {
    cache.set("window", 1, cache::CacheOptions{60s, {"odds"}});
    cache.set("archive", 2, cache::CacheOptions{0s, {"odds"}});
    EXPECT_EQ(store.ttl("tag:odds"), -1);

    cache.set("later", 3, cache::CacheOptions{5s, {"odds"}});
    EXPECT_EQ(store.ttl("tag:odds"), -1);
    EXPECT_EQ(cache.invalidateByTag("odds"), 3u);
}

TEST_F(TieredCacheManagerTest, StoreOutageDegradesGracefully) {
    cache::CacheOptions tagged{std::nullopt, {"live"}};
    ASSERT_TRUE(cache.set("kept", boost::json::value("local"), tagged));
    store.setDown(true);

    EXPECT_FALSE(cache.set("lost", 1));
    EXPECT_FALSE(cache.get("lost"));
    EXPECT_FALSE(cache.remove("kept"));
    EXPECT_EQ(cache.getTTL("kept"), -1);
    EXPECT_FALSE(cache.extend("kept", 10s));

    auto health = cache.healthCheck();
    EXPECT_FALSE(health.storeStatus);
    EXPECT_EQ(health.storeError, "store unavailable");
    EXPECT_TRUE(health.localStatus);

    auto memory = cache.getMemoryInfo();
    EXPECT_EQ(memory.store.used, 0);
    EXPECT_EQ(cache.clear(), 0u);
}

TEST_F(TieredCacheManagerTest, TagInvalidationFallsBackToLocalTier) {
    cache::CacheOptions tagged{std::nullopt, {"live"}};
    cache.set("x", 1, tagged);
    cache.set("y", 2);
    store.setDown(true);

    EXPECT_EQ(cache.invalidateByTag("live"), 1u);
    EXPECT_FALSE(cache.get("x"));
    EXPECT_TRUE(cache.get("y"));
}

TEST_F(TieredCacheManagerTest, LocalTierEvictsLeastRecentlyUsed) {
    cache::CacheManagerOptions options;
    options.maxLocalEntries = 3;
    cache::TieredCacheManager small{store, options};

    for (const char* key : {"k1", "k2", "k3"}) {
        small.set(key, key);
        std::this_thread::sleep_for(2ms);
    }
    small.get("k1");
    std::this_thread::sleep_for(2ms);
    small.set("k4", "k4");

    EXPECT_EQ(small.getStats().keyCount, 3u);
    store.setDown(true);
    EXPECT_TRUE(small.get("k1"));
    EXPECT_FALSE(small.get("k2"));
    EXPECT_TRUE(small.get("k4"));
}

TEST_F(TieredCacheManagerTest, OversizedValuesStayOutOfLocalTier) {
    cache::CacheManagerOptions options;
    options.maxLocalValueSize = 8;
    cache::TieredCacheManager limited{store, options};

    ASSERT_TRUE(limited.set("big", boost::json::value("a long string value")));
    EXPECT_EQ(limited.getStats().keyCount, 0u);
    EXPECT_TRUE(limited.get("big"));
    EXPECT_EQ(limited.getStats().keyCount, 0u);
}

TEST_F(TieredCacheManagerTest, TtlAndExtend) {
    cache.set("odds", 1, cache::CacheOptions{60s, {}});
    EXPECT_EQ(cache.getTTL("odds"), 60);

    EXPECT_TRUE(cache.extend("odds", 30s));
    EXPECT_EQ(cache.getTTL("odds"), 90);

    EXPECT_FALSE(cache.extend("missing", 30s));
    EXPECT_EQ(cache.getTTL("missing"), -2);

    cache.set("forever", 1, cache::CacheOptions{0s, {}});
    EXPECT_EQ(cache.getTTL("forever"), -1);
    EXPECT_FALSE(cache.extend("forever", 30s));
}

TEST_F(TieredCacheManagerTest, ClearNamespaceLeavesOtherKeys) {
    cache.set("1", 1, {}, "nfl");
    cache.set("2", 2, {}, "nfl");
    cache.set("1", 3, {}, "nba");

    EXPECT_EQ(cache.clear("nfl"), 2u);
    EXPECT_FALSE(cache.exists("1", "nfl"));
    EXPECT_TRUE(cache.exists("1", "nba"));

    EXPECT_EQ(cache.clear(), 1u);
    EXPECT_FALSE(cache.exists("1", "nba"));
    EXPECT_EQ(cache.getStats().keyCount, 0u);
}

TEST_F(TieredCacheManagerTest, StatsTrackHitRate) {
    cache.set("hit", 1);
    cache.get("hit");
    cache.get("hit");
    cache.get("miss");
    cache.remove("hit");

    auto stats = cache.getStats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.sets, 1u);
    EXPECT_EQ(stats.deletes, 1u);
    EXPECT_NEAR(stats.hitRate, 66.666, 0.01);

    auto json = cache::toJson(stats);
    EXPECT_EQ(json.at("hits").as_uint64(), 2u);
}

TEST_F(TieredCacheManagerTest, MemoryInfoCombinesBothTiers) {
    cache.set("m", boost::json::value("abc"));
    auto info = cache.getMemoryInfo();
    EXPECT_EQ(info.store.used, 2048);
    EXPECT_EQ(info.store.peak, 4096);
    EXPECT_DOUBLE_EQ(info.store.fragmentation, 1.25);
    EXPECT_EQ(info.localKeyCount, 1u);
    EXPECT_EQ(info.localUsed, 5u);

    auto json = cache::toJson(info);
    EXPECT_EQ(json.at("redis").as_object().at("used").as_int64(), 2048);
}

TEST(ParseMemoryInfoTest, ReadsKnownFieldsAndKeepsDefaults) {
    auto parsed = cache::parseMemoryInfo("used_memory:1024\r\nused_memory_human:1K\r\nused_memory_peak:oops\r\n");
    EXPECT_EQ(parsed.used, 1024);
    EXPECT_EQ(parsed.peak, 0);
    EXPECT_DOUBLE_EQ(parsed.fragmentation, 1.0);
}
