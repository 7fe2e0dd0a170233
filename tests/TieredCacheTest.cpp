#include <gtest/gtest.h>
#include <tiercache/TieredCache.hpp>
#include <tiercache/eviction/TTLPolicy.hpp>
#include "support/RecordingListener.hpp"

#include <chrono>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Тесты для TieredCache с одним быстрым тиром
 *
 * Проверяем:
 * - Бюджет байт и записей, вытеснение по политике
 * - Атомарность set() при нехватке места
 * - TTL: истечение при чтении и фоновая очистка
 * - Инвалидацию по тегам
 * - Метрики и статистику
 */

using namespace std::chrono_literals;

namespace {

using StringCache = TieredCache<std::string, std::string>;

/// Значение ровно из size байт
std::string bytes(size_t size, char fill = 'x') {
    return std::string(size, fill);
}

CacheConfig smallConfig(size_t maxBytes = 100) {
    CacheConfig config;
    config.fastTierMaxBytes = maxBytes;
    config.defaultTtl = std::nullopt;
    config.enableBackgroundTasks = false;
    return config;
}

SetOptions withTtl(CacheDuration ttl) {
    SetOptions options;
    options.ttl = ttl;
    return options;
}

SetOptions withTags(std::vector<std::string> tags) {
    SetOptions options;
    options.tags = std::move(tags);
    return options;
}

}  // namespace

// ==================== Базовые операции ====================

TEST(TieredCacheTest, SetAndGet) {
    StringCache cache(smallConfig());
    cache.set("key", "value");

    auto value = cache.get("key");

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "value");
    EXPECT_TRUE(cache.contains("key"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.bytes(), 5u);
}

TEST(TieredCacheTest, GetMissing) {
    StringCache cache(smallConfig());

    EXPECT_FALSE(cache.get("missing").has_value());
    EXPECT_FALSE(cache.contains("missing"));
}

TEST(TieredCacheTest, UpdateReplacesValueAndSize) {
    StringCache cache(smallConfig());
    cache.set("key", bytes(60));
    cache.set("key", bytes(80, 'y'));

    EXPECT_EQ(cache.get("key"), bytes(80, 'y'));
    EXPECT_EQ(cache.bytes(), 80u);
    EXPECT_EQ(cache.stats().evictions(), 0u);  // старое значение не мешает новому
}

TEST(TieredCacheTest, UsableThroughICache) {
    StringCache tiered(smallConfig());
    ICache<std::string, std::string>& cache = tiered;

    cache.set("a", "1");
    EXPECT_EQ(cache.get("a"), std::optional<std::string>("1"));
    EXPECT_TRUE(cache.remove("a"));
    EXPECT_EQ(cache.clear(), 0u);
}

TEST(TieredCacheTest, RemoveIsIdempotent) {
    StringCache cache(smallConfig());
    cache.set("key", "value");

    EXPECT_TRUE(cache.remove("key"));
    EXPECT_FALSE(cache.remove("key"));
    EXPECT_FALSE(cache.get("key").has_value());
}

TEST(TieredCacheTest, RejectsInvalidConfiguration) {
    CacheConfig config = smallConfig();
    config.fastTierMaxBytes = 0;

    EXPECT_THROW(StringCache{config}, InvalidConfigurationError);
}

// ==================== Вытеснение ====================

TEST(TieredCacheTest, LruEvictsLeastRecentlyUsed) {
    // Бюджет 100 байт, записи по 40: A, B, get(A), C -> вытеснен B
    StringCache cache(smallConfig(100));
    cache.set("A", bytes(40));
    cache.set("B", bytes(40));
    cache.get("A");
    cache.set("C", bytes(40));

    EXPECT_TRUE(cache.contains("A"));
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_TRUE(cache.contains("C"));
    EXPECT_EQ(cache.bytes(), 80u);
    EXPECT_EQ(cache.stats().evictions(), 1u);
}

TEST(TieredCacheTest, EvictsSeveralEntriesForLargeValue) {
    StringCache cache(smallConfig(100));
    cache.set("A", bytes(30));
    cache.set("B", bytes(30));
    cache.set("C", bytes(30));

    cache.set("big", bytes(90));

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains("big"));
    EXPECT_EQ(cache.stats().evictions(), 3u);
}

TEST(TieredCacheTest, EntryLimit) {
    CacheConfig config = smallConfig(1000);
    config.fastTierMaxEntries = 2;
    StringCache cache(config);

    cache.set("A", "1");
    cache.set("B", "2");
    cache.set("C", "3");

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.contains("A"));
}

TEST(TieredCacheTest, LfuPolicyFromConfig) {
    CacheConfig config = smallConfig(1000);
    config.fastTierMaxEntries = 2;
    config.evictionPolicy = EvictionPolicyType::LFU;
    StringCache cache(config);

    cache.set("A", "1");
    cache.set("B", "2");
    cache.get("A");
    cache.get("A");
    cache.get("B");
    cache.set("C", "3");

    EXPECT_TRUE(cache.contains("A"));
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_EQ(cache.stats().evictionPolicy, "lfu");
}

TEST(TieredCacheTest, CapacityInvariantUnderRandomLoad) {
    StringCache cache(smallConfig(500));
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> keyDist(0, 50);
    std::uniform_int_distribution<size_t> sizeDist(1, 120);

    for (int i = 0; i < 2000; ++i) {
        std::string key = "k" + std::to_string(keyDist(rng));
        if (i % 3 == 0) {
            cache.get(key);
        } else {
            cache.set(key, bytes(sizeDist(rng)));
        }
        ASSERT_LE(cache.bytes(), 500u);
    }
}

TEST(TieredCacheTest, TooLargeValueThrowsAndKeepsState) {
    StringCache cache(smallConfig(100));
    cache.set("A", bytes(40));

    try {
        cache.set("huge", bytes(101));
        FAIL() << "Expected CapacityExceededError";
    } catch (const CapacityExceededError& e) {
        EXPECT_EQ(e.requiredBytes(), 101u);
        EXPECT_EQ(e.budgetBytes(), 100u);
    }

    EXPECT_FALSE(cache.contains("huge"));
    EXPECT_TRUE(cache.contains("A"));
    EXPECT_EQ(cache.bytes(), 40u);
}

TEST(TieredCacheTest, NotEnoughVictimsLeavesCacheUntouched) {
    // TTL без fallback не вытесняет живые записи
    StringCache cache(smallConfig(100), {}, std::make_unique<TTLPolicy<std::string>>());
    cache.set("A", bytes(40), withTtl(1h));
    cache.set("B", bytes(40), withTtl(1h));

    EXPECT_THROW(cache.set("C", bytes(40), withTtl(1h)), CapacityExceededError);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains("A"));
    EXPECT_TRUE(cache.contains("B"));
    EXPECT_FALSE(cache.contains("C"));
    EXPECT_EQ(cache.stats().evictions(), 0u);
}

TEST(TieredCacheTest, TtlPolicyEvictsExpiredEntries) {
    StringCache cache(smallConfig(100), {}, std::make_unique<TTLPolicy<std::string>>());
    cache.set("short", bytes(40), withTtl(20ms));
    cache.set("long", bytes(40), withTtl(1h));
    std::this_thread::sleep_for(50ms);

    cache.set("new", bytes(40), withTtl(1h));

    EXPECT_FALSE(cache.contains("short"));
    EXPECT_TRUE(cache.contains("long"));
    EXPECT_TRUE(cache.contains("new"));
}

TEST(TieredCacheTest, CustomSizeFunction) {
    TieredCache<std::string, int> cache(smallConfig(100), {}, nullptr,
                                        [](const int&) { return size_t{40}; });
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("C", 3);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.bytes(), 80u);
}

// ==================== TTL ====================

TEST(TieredCacheTest, ExpiredEntryIsMiss) {
    StringCache cache(smallConfig());
    auto listener = std::make_shared<RecordingListener<std::string, std::string>>();
    cache.addListener(listener);

    cache.set("key", "value", withTtl(50ms));
    EXPECT_EQ(cache.get("key"), std::optional<std::string>("value"));

    std::this_thread::sleep_for(100ms);

    EXPECT_FALSE(cache.get("key").has_value());
    EXPECT_EQ(listener->count("expire:key"), 1u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(TieredCacheTest, LazyExpiryReleasesTags) {
    StringCache cache(smallConfig());
    SetOptions options = withTags({"t"});
    options.ttl = 50ms;
    cache.set("Z", "value", options);

    std::this_thread::sleep_for(100ms);

    EXPECT_FALSE(cache.get("Z").has_value());
    EXPECT_EQ(cache.invalidateByTags({"t"}), 0u);
    EXPECT_FALSE(cache.remove("Z"));
}

TEST(TieredCacheTest, DefaultTtlApplied) {
    CacheConfig config = smallConfig();
    config.defaultTtl = 10s;
    StringCache cache(config);

    cache.set("key", "value");

    auto ttl = cache.timeToLive("key");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_LE(*ttl, CacheDuration(10s));
    EXPECT_GT(*ttl, CacheDuration(9s));
}

TEST(TieredCacheTest, NoTtlMeansNoExpiry) {
    StringCache cache(smallConfig());
    cache.set("key", "value");

    EXPECT_FALSE(cache.timeToLive("key").has_value());
    EXPECT_TRUE(cache.contains("key"));
}

TEST(TieredCacheTest, RejectsNonPositiveTtl) {
    StringCache cache(smallConfig());

    EXPECT_THROW(cache.set("key", "value", withTtl(CacheDuration::zero())), std::invalid_argument);
    EXPECT_THROW(cache.set("key", "value", withTtl(-1s)), std::invalid_argument);
    EXPECT_FALSE(cache.contains("key"));
}

TEST(TieredCacheTest, RemoveExpiredSweepsAndDropsTags) {
    StringCache cache(smallConfig(1000));
    for (int i = 0; i < 3; ++i) {
        SetOptions options = withTtl(20ms);
        options.tags = {"batch"};
        cache.set("k" + std::to_string(i), "v", options);
    }
    cache.set("alive", "v", withTtl(1h));
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(cache.removeExpired(), 3u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.invalidateByTags({"batch"}), 0u);
}

TEST(TieredCacheTest, RemoveExpiredInSmallBatches) {
    CacheConfig config = smallConfig(10000);
    config.sweepBatchSize = 2;
    StringCache cache(config);
    for (int i = 0; i < 7; ++i) {
        cache.set("k" + std::to_string(i), "v", withTtl(10ms));
    }
    std::this_thread::sleep_for(40ms);

    EXPECT_EQ(cache.removeExpired(), 7u);
    EXPECT_EQ(cache.size(), 0u);
}

// ==================== Теги ====================

TEST(TieredCacheTest, InvalidateByTags) {
    StringCache cache(smallConfig());
    cache.set("X", "1", withTags({"t1", "t2"}));
    cache.set("Y", "2", withTags({"t2"}));
    cache.set("Z", "3", withTags({"t3"}));

    EXPECT_EQ(cache.invalidateByTags({"t2"}), 2u);

    EXPECT_FALSE(cache.get("X").has_value());
    EXPECT_FALSE(cache.get("Y").has_value());
    EXPECT_TRUE(cache.get("Z").has_value());
}

TEST(TieredCacheTest, InvalidateUnknownTag) {
    StringCache cache(smallConfig());
    cache.set("X", "1", withTags({"t1"}));

    EXPECT_EQ(cache.invalidateByTags({"nope"}), 0u);
    EXPECT_TRUE(cache.contains("X"));
}

TEST(TieredCacheTest, OverwriteReplacesTags) {
    StringCache cache(smallConfig());
    cache.set("X", "1", withTags({"old"}));
    cache.set("X", "2", withTags({"new"}));

    EXPECT_EQ(cache.invalidateByTags({"old"}), 0u);
    EXPECT_EQ(cache.invalidateByTags({"new"}), 1u);
}

TEST(TieredCacheTest, EvictionDropsTagsOfFastOnlyEntries) {
    StringCache cache(smallConfig(100));
    cache.set("A", bytes(40), withTags({"t"}));
    cache.set("B", bytes(40));
    cache.set("C", bytes(40));  // вытесняет A

    EXPECT_FALSE(cache.contains("A"));
    EXPECT_EQ(cache.invalidateByTags({"t"}), 0u);
}

// ==================== Метрики ====================

TEST(TieredCacheTest, HitRate) {
    // 3 hits, 1 miss -> 0.75
    StringCache cache(smallConfig());
    cache.set("key", "value");
    cache.get("key");
    cache.get("key");
    cache.get("key");
    cache.get("missing");

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits(), 3u);
    EXPECT_EQ(stats.misses(), 1u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.75);
    EXPECT_GE(stats.meanLatencyMs(), 0.0);
}

TEST(TieredCacheTest, OperationsCounted) {
    StringCache cache(smallConfig());
    cache.set("a", "1");    // 1
    cache.get("a");         // 2
    cache.remove("a");      // 3
    cache.invalidateByTags({"t"});  // 4

    EXPECT_EQ(cache.stats().operations(), 4u);
}

TEST(TieredCacheTest, StatsDescribeConfiguration) {
    CacheConfig config = smallConfig(4096);
    config.fastTierMaxEntries = 16;
    config.defaultTtl = 5min;
    StringCache cache(config);
    cache.set("a", "12345");

    auto stats = cache.stats();

    EXPECT_EQ(stats.fastTierMaxBytes, 4096u);
    EXPECT_EQ(stats.fastTierMaxEntries, 16u);
    EXPECT_EQ(stats.evictionPolicy, "lru");
    ASSERT_TRUE(stats.defaultTtl.has_value());
    EXPECT_EQ(*stats.defaultTtl, CacheDuration(5min));
    ASSERT_EQ(stats.tiers.size(), 1u);
    EXPECT_EQ(stats.tiers[0].level, TierLevel::L1);
    EXPECT_EQ(stats.tiers[0].entries, 1u);
    EXPECT_EQ(stats.tiers[0].bytes, 5u);
}

TEST(TieredCacheTest, ClearResetsWindowButKeepsLifetime) {
    StringCache cache(smallConfig());
    cache.set("a", "1");
    cache.set("b", "2");
    cache.get("a");

    EXPECT_EQ(cache.clear(), 2u);

    auto stats = cache.stats();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(stats.recent.hits, 0u);
    EXPECT_EQ(stats.lifetime.hits, 1u);
}

TEST(TieredCacheTest, ClearCanResetLifetime) {
    StringCache cache(smallConfig());
    cache.set("a", "1");
    cache.get("a");

    cache.clear(true);

    EXPECT_EQ(cache.stats().lifetime.totalRequests(), 0u);
}

// ==================== getOrCompute / warm ====================

TEST(TieredCacheTest, GetOrComputeCallsOnce) {
    StringCache cache(smallConfig());
    int calls = 0;
    auto compute = [&calls]() { ++calls; return std::string("computed"); };

    EXPECT_EQ(cache.getOrCompute("key", compute), "computed");
    EXPECT_EQ(cache.getOrCompute("key", compute), "computed");
    EXPECT_EQ(calls, 1);
}

TEST(TieredCacheTest, GetOrComputeReturnsValueThatDoesNotFit) {
    StringCache cache(smallConfig(10));

    auto value = cache.getOrCompute("key", []() { return bytes(50); });

    EXPECT_EQ(value.size(), 50u);
    EXPECT_FALSE(cache.contains("key"));
}

TEST(TieredCacheTest, WarmLoadsEntries) {
    StringCache cache(smallConfig(100));
    std::vector<std::pair<std::string, std::string>> entries = {
        {"a", bytes(10)},
        {"b", bytes(10)},
        {"huge", bytes(500)},
        {"c", bytes(10)},
    };

    EXPECT_EQ(cache.warm(entries, withTags({"warm"})), 3u);
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.invalidateByTags({"warm"}), 3u);
}

// ==================== Дедлайн ====================

TEST(TieredCacheTest, PastDeadlineTimesOut) {
    StringCache cache(smallConfig());
    cache.set("key", "value");

    CallOptions options;
    options.deadline = CacheClock::now() - 1ms;
    EXPECT_THROW(cache.get("key", options), CacheTimeoutError);

    SetOptions setOptions;
    setOptions.deadline = CacheClock::now() - 1ms;
    EXPECT_THROW(cache.set("other", "value", setOptions), CacheTimeoutError);
    EXPECT_FALSE(cache.contains("other"));

    EXPECT_EQ(cache.stats().misses(), 1u);
}

// ==================== Фоновые задачи ====================

TEST(TieredCacheTest, BackgroundSweepRemovesExpired) {
    CacheConfig config = smallConfig();
    config.enableBackgroundTasks = true;
    config.sweepInterval = 20ms;
    StringCache cache(config);
    cache.start();

    cache.set("key", "value", withTtl(10ms));
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(cache.size(), 0u);  // без единого get()
    EXPECT_GT(cache.maintenanceRuns("expiry-sweep"), 0u);
    cache.shutdown();
    EXPECT_FALSE(cache.running());
}

TEST(TieredCacheTest, BackgroundMetricsReset) {
    CacheConfig config = smallConfig();
    config.enableBackgroundTasks = true;
    config.metricsResetInterval = 20ms;
    StringCache cache(config);
    cache.start();

    cache.get("missing");
    std::this_thread::sleep_for(200ms);

    auto stats = cache.stats();
    EXPECT_EQ(stats.recent.misses, 0u);
    EXPECT_EQ(stats.lifetime.misses, 1u);
}

TEST(TieredCacheTest, BackgroundTasksDisabled) {
    CacheConfig config = smallConfig();
    config.enableBackgroundTasks = false;
    StringCache cache(config);

    cache.start();

    EXPECT_FALSE(cache.running());
}
