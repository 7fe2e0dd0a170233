#include <gtest/gtest.h>
#include <tiercache/eviction/SizePolicy.hpp>
#include <string>
#include <vector>

/**
 * @brief Тесты для SizePolicy
 *
 * Крупные записи вытесняются первыми, при равном размере -
 * давно использованная.
 */

namespace {

using Candidate = EvictionCandidate<std::string>;

const CacheTimePoint T0 = CacheClock::now();

Candidate makeCandidate(const std::string& key, size_t size, int accessedAtMs = 0) {
    Candidate c;
    c.key = key;
    c.sizeBytes = size;
    c.createdAt = T0;
    c.lastAccessedAt = T0 + std::chrono::milliseconds(accessedAtMs);
    return c;
}

}  // namespace

TEST(SizePolicyTest, EvictsLargestFirst) {
    SizePolicy<std::string> policy;
    std::vector<Candidate> candidates = {
        makeCandidate("small", 10),
        makeCandidate("large", 500),
        makeCandidate("medium", 100),
    };

    auto victims = policy.selectVictims(candidates, EvictionRequest{50, 0}, T0);

    EXPECT_EQ(victims, (std::vector<std::string>{"large"}));
}

TEST(SizePolicyTest, FreesWithFewestEntries) {
    SizePolicy<std::string> policy;
    std::vector<Candidate> candidates = {
        makeCandidate("a", 10),
        makeCandidate("b", 10),
        makeCandidate("c", 10),
        makeCandidate("d", 60),
    };

    auto victims = policy.selectVictims(candidates, EvictionRequest{65, 0}, T0);

    EXPECT_EQ(victims, (std::vector<std::string>{"d", "a"}));
}

TEST(SizePolicyTest, EqualSizeEvictsLeastRecentlyUsed) {
    SizePolicy<std::string> policy;
    std::vector<Candidate> candidates = {
        makeCandidate("recent", 40, 20),
        makeCandidate("stale", 40, 5),
    };

    auto victims = policy.selectVictims(candidates, EvictionRequest{1, 0}, T0);

    EXPECT_EQ(victims, (std::vector<std::string>{"stale"}));
}

TEST(SizePolicyTest, Name) {
    SizePolicy<std::string> policy;
    EXPECT_STREQ(policy.name(), "size");
}
