#include <gtest/gtest.h>
#include <tiercache/eviction/EvictionPolicyFactory.hpp>
#include <tiercache/eviction/LRUPolicy.hpp>
#include <tiercache/eviction/TTLPolicy.hpp>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Тесты для TTLPolicy и фабрики политик
 *
 * Проверяем:
 * - Вытесняются только просроченные записи, раньше истёкшие: первыми
 * - Без fallback живые записи не трогаются
 * - С fallback недостающее место добирается из живых записей
 */

namespace {

using Candidate = EvictionCandidate<std::string>;

const CacheTimePoint T0 = CacheClock::now();

Candidate makeCandidate(const std::string& key, std::optional<int> expiresAtMs, int accessedAtMs = 0) {
    Candidate c;
    c.key = key;
    c.sizeBytes = 10;
    c.createdAt = T0;
    c.lastAccessedAt = T0 + std::chrono::milliseconds(accessedAtMs);
    if (expiresAtMs) {
        c.expiresAt = T0 + std::chrono::milliseconds(*expiresAtMs);
    }
    return c;
}

}  // namespace

// ==================== Только TTL ====================

TEST(TTLPolicyTest, EvictsExpiredSoonestFirst) {
    TTLPolicy<std::string> policy;
    std::vector<Candidate> candidates = {
        makeCandidate("late", 50),
        makeCandidate("early", 10),
        makeCandidate("alive", 1000),
    };
    auto now = T0 + std::chrono::milliseconds(100);

    auto victims = policy.selectVictims(candidates, EvictionRequest{0, 2}, now);

    EXPECT_EQ(victims, (std::vector<std::string>{"early", "late"}));
}

TEST(TTLPolicyTest, DoesNotEvictAliveEntries) {
    TTLPolicy<std::string> policy;
    std::vector<Candidate> candidates = {
        makeCandidate("expired", 10),
        makeCandidate("alive", 1000),
        makeCandidate("eternal", std::nullopt),
    };
    auto now = T0 + std::chrono::milliseconds(100);

    auto victims = policy.selectVictims(candidates, EvictionRequest{30, 0}, now);

    EXPECT_EQ(victims, (std::vector<std::string>{"expired"}));
}

TEST(TTLPolicyTest, NothingExpiredNothingEvicted) {
    TTLPolicy<std::string> policy;
    std::vector<Candidate> candidates = {
        makeCandidate("a", 1000),
        makeCandidate("b", std::nullopt),
    };

    auto victims = policy.selectVictims(candidates, EvictionRequest{10, 0}, T0);

    EXPECT_TRUE(victims.empty());
    EXPECT_STREQ(policy.name(), "ttl");
}

// ==================== С fallback ====================

TEST(TTLPolicyTest, FallbackCoversRemainingRequest) {
    TTLPolicy<std::string> policy(std::make_unique<LRUPolicy<std::string>>());
    std::vector<Candidate> candidates = {
        makeCandidate("fresh", 1000, 30),
        makeCandidate("expired", 10, 50),
        makeCandidate("stale", 1000, 5),
    };
    auto now = T0 + std::chrono::milliseconds(100);

    // 25 байт: expired (10) + два живых по LRU: stale, fresh
    auto victims = policy.selectVictims(candidates, EvictionRequest{25, 0}, now);

    EXPECT_EQ(victims, (std::vector<std::string>{"expired", "stale", "fresh"}));
    EXPECT_STREQ(policy.name(), "ttl+fallback");
}

TEST(TTLPolicyTest, FallbackNotUsedWhenExpiredSuffice) {
    TTLPolicy<std::string> policy(std::make_unique<LRUPolicy<std::string>>());
    std::vector<Candidate> candidates = {
        makeCandidate("alive", 1000, 0),
        makeCandidate("expired", 10, 50),
    };
    auto now = T0 + std::chrono::milliseconds(100);

    auto victims = policy.selectVictims(candidates, EvictionRequest{0, 1}, now);

    EXPECT_EQ(victims, (std::vector<std::string>{"expired"}));
}

// ==================== Фабрика ====================

TEST(EvictionPolicyFactoryTest, CreatesPolicyByType) {
    EXPECT_STREQ(makeEvictionPolicy<std::string>(EvictionPolicyType::LRU)->name(), "lru");
    EXPECT_STREQ(makeEvictionPolicy<std::string>(EvictionPolicyType::LFU)->name(), "lfu");
    EXPECT_STREQ(makeEvictionPolicy<std::string>(EvictionPolicyType::TTL)->name(), "ttl");
    EXPECT_STREQ(makeEvictionPolicy<std::string>(EvictionPolicyType::Size)->name(), "size");
}
