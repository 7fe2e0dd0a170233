#include <tiercache/TieredCache.hpp>
#include <tiercache/ICacheListener.hpp>
#include <tiercache/tiers/MemoryTier.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк для TieredCache
 *
 * Измеряем:
 * - Throughput операций set/get (ops/sec)
 * - Hit rate политик вытеснения на Zipf-нагрузке
 * - Масштабирование при нескольких потоках
 * - Стоимость промаха L1 с продвижением из медленного тира
 * - Влияние слушателей на производительность
 */

// ==================== Утилиты ====================

namespace {

using IntCache = TieredCache<int, int>;

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

/**
 * @brief Конфигурация с бюджетом на entries записей по sizeof(int)
 */
CacheConfig benchConfig(size_t entries) {
    CacheConfig config;
    config.fastTierMaxBytes = entries * sizeof(int);
    config.fastTierMaxEntries = entries;
    config.defaultTtl = std::nullopt;
    config.enableBackgroundTasks = false;
    return config;
}

/**
 * @brief Ключи с распределением Zipf: p(k) ~ 1/k^s
 *
 * При s=1.0 примерно 20% ключей получают 80% обращений.
 */
std::vector<int> zipfKeys(size_t keyRange, size_t count, double s = 1.0, uint32_t seed = 42) {
    std::vector<double> cumulative(keyRange);
    double sum = 0.0;
    for (size_t i = 0; i < keyRange; ++i) {
        sum += 1.0 / std::pow(static_cast<double>(i + 1), s);
        cumulative[i] = sum;
    }
    for (auto& value : cumulative) {
        value /= sum;
    }

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    std::vector<int> keys;
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto it = std::lower_bound(cumulative.begin(), cumulative.end(), dist(rng));
        int key = static_cast<int>(std::distance(cumulative.begin(), it));
        keys.push_back(std::min(key, static_cast<int>(keyRange) - 1));
    }
    return keys;
}

// ==================== Базовые бенчмарки ====================

void benchmarkSequentialSet(size_t cacheSize, size_t numOperations) {
    IntCache cache(benchConfig(cacheSize));

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache.set(static_cast<int>(i), static_cast<int>(i * 10));
        }
    });

    printResult("Sequential set (size=" + std::to_string(cacheSize) + ")",
                timeMs, numOperations);
}

void benchmarkSequentialGet(size_t cacheSize, size_t numOperations) {
    IntCache cache(benchConfig(cacheSize));

    for (size_t i = 0; i < cacheSize; ++i) {
        cache.set(static_cast<int>(i), static_cast<int>(i));
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache.get(static_cast<int>(i % cacheSize));
        }
    });

    printResult("Sequential get (100% hit)", timeMs, numOperations);
}

void benchmarkTaggedSet(size_t cacheSize, size_t numOperations) {
    IntCache cache(benchConfig(cacheSize));

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            SetOptions options;
            options.tags = {"group" + std::to_string(i % 16)};
            cache.set(static_cast<int>(i % (cacheSize * 2)), static_cast<int>(i), options);
        }
    });

    printResult("Tagged set (16 tags)", timeMs, numOperations);
}

// ==================== Политики вытеснения ====================

/**
 * @brief Hit rate политик на одной и той же Zipf-нагрузке
 *
 * Кэш вмещает 10% ключей; при промахе значение записывается.
 * TTL-политике даётся LRU как запасная: без TTL у записей
 * «чистая» TTL-политика не может освободить место.
 */
void benchmarkPolicies(size_t cacheSize, size_t numOperations) {
    auto keys = zipfKeys(cacheSize * 10, numOperations);

    std::vector<std::function<std::unique_ptr<IEvictionPolicy<int>>()>> policies = {
        []() { return std::make_unique<LRUPolicy<int>>(); },
        []() { return std::make_unique<LFUPolicy<int>>(); },
        []() { return std::make_unique<SizePolicy<int>>(); },
        []() { return std::make_unique<TTLPolicy<int>>(std::make_unique<LRUPolicy<int>>()); },
    };

    for (const auto& makePolicy : policies) {
        IntCache cache(benchConfig(cacheSize), {}, makePolicy());

        double timeMs = measureMs([&]() {
            for (int key : keys) {
                if (!cache.get(key).has_value()) {
                    cache.set(key, key * 10);
                }
            }
        });

        auto stats = cache.stats();
        printResult(std::string("Zipf get-or-set (") + cache.evictionPolicyName() + ")",
                    timeMs, numOperations);
        std::cout << "   Hit rate: " << std::fixed << std::setprecision(2)
                  << (stats.hitRate() * 100) << "%, evictions: " << stats.evictions() << "\n";
    }
}

// ==================== Многопоточность ====================

/**
 * @brief Смешанная нагрузка (80% get, 20% set) из нескольких потоков
 */
void benchmarkConcurrentMixed(size_t cacheSize, size_t opsPerThread) {
    std::vector<int> threadCounts = {1, 2, 4, 8};
    double baselineOps = 0;

    for (int threadCount : threadCounts) {
        IntCache cache(benchConfig(cacheSize));
        for (size_t i = 0; i < cacheSize; ++i) {
            cache.set(static_cast<int>(i), static_cast<int>(i));
        }

        double timeMs = measureMs([&]() {
            std::vector<std::thread> threads;
            for (int t = 0; t < threadCount; ++t) {
                threads.emplace_back([&, t]() {
                    std::mt19937 rng(42 + t);
                    std::uniform_int_distribution<int> keyDist(0, static_cast<int>(cacheSize * 2));
                    std::uniform_int_distribution<int> opDist(0, 99);
                    for (size_t i = 0; i < opsPerThread; ++i) {
                        int key = keyDist(rng);
                        if (opDist(rng) < 80) {
                            cache.get(key);
                        } else {
                            cache.set(key, key);
                        }
                    }
                });
            }
            for (auto& thread : threads) {
                thread.join();
            }
        });

        size_t totalOps = opsPerThread * threadCount;
        double opsPerSec = (totalOps / timeMs) * 1000.0;
        if (baselineOps == 0) {
            baselineOps = opsPerSec;
        }
        printResult("Mixed 80/20, threads=" + std::to_string(threadCount), timeMs, totalOps);
        std::cout << "   Speedup: " << std::fixed << std::setprecision(2)
                  << (opsPerSec / baselineOps) << "x\n";
    }
}

// ==================== Медленные тиры ====================

/**
 * @brief Стоимость чтения через L2
 *
 * Быстрый тир вмещает 1% ключей, все ключи лежат в L2.
 * Почти каждый get: промах L1, чтение L2 через пул и продвижение.
 */
void benchmarkPromotion(size_t keyRange, size_t numOperations) {
    auto l2 = std::make_shared<MemoryTier<int, int>>(TierLevel::L2, "l2");
    IntCache cache(benchConfig(keyRange / 100), {l2});

    for (size_t i = 0; i < keyRange; ++i) {
        l2->write(CacheEntry<int, int>(static_cast<int>(i), static_cast<int>(i), sizeof(int),
                                       std::nullopt, {}, TierLevel::L2));
    }

    auto keys = zipfKeys(keyRange, numOperations);
    double timeMs = measureMs([&]() {
        for (int key : keys) {
            cache.get(key);
        }
    });

    auto stats = cache.stats();
    printResult("Zipf get through L2 (L1 = 1% of keys)", timeMs, numOperations);
    std::cout << "   Hit rate: " << std::fixed << std::setprecision(2)
              << (stats.hitRate() * 100) << "%, mean latency: "
              << std::setprecision(4) << stats.meanLatencyMs() << " ms\n";
}

// ==================== Слушатели ====================

/**
 * @brief Лёгкий слушатель: только счётчик событий
 */
class CountingListener : public ICacheListener<int, int> {
public:
    void onHit(const int&, TierLevel) override { ++events; }
    void onMiss(const int&) override { ++events; }
    void onInsert(const int&, const int&) override { ++events; }
    void onUpdate(const int&, const int&, const int&) override { ++events; }
    void onEvict(const int&, const int&) override { ++events; }

    std::atomic<uint64_t> events{0};
};

void benchmarkListenerOverhead(size_t cacheSize, size_t numOperations) {
    double baseline = 0;
    for (int listeners : {0, 1, 4}) {
        IntCache cache(benchConfig(cacheSize));
        for (int i = 0; i < listeners; ++i) {
            cache.addListener(std::make_shared<CountingListener>());
        }

        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                int key = static_cast<int>(i % (cacheSize * 2));
                cache.set(key, key);
                cache.get(key);
            }
        });

        if (listeners == 0) {
            baseline = timeMs;
        }
        printResult("set+get, listeners=" + std::to_string(listeners), timeMs, numOperations * 2);
        if (listeners > 0) {
            std::cout << "   Overhead: +" << std::fixed << std::setprecision(1)
                      << ((timeMs - baseline) / baseline) * 100 << "%\n";
        }
    }
}

}  // namespace

// ==================== Main ====================

int main() {
    const size_t SMALL_CACHE = 1000;
    const size_t LARGE_CACHE = 100000;
    const size_t NUM_OPS = 1000000;

    std::cout << "=== Tiered Cache Benchmark ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n";
    std::cout << "Hardware threads: " << std::thread::hardware_concurrency() << "\n\n";

    std::cout << "--- Basic operations ---\n";
    benchmarkSequentialSet(SMALL_CACHE, NUM_OPS);
    benchmarkSequentialSet(LARGE_CACHE, NUM_OPS);
    benchmarkSequentialGet(LARGE_CACHE, NUM_OPS);
    benchmarkTaggedSet(SMALL_CACHE, NUM_OPS / 10);

    std::cout << "\n--- Eviction policies (Zipf, cache = 10% of keys) ---\n";
    benchmarkPolicies(SMALL_CACHE, NUM_OPS / 10);

    std::cout << "\n--- Concurrency ---\n";
    benchmarkConcurrentMixed(LARGE_CACHE, NUM_OPS / 4);

    std::cout << "\n--- Slower tier ---\n";
    benchmarkPromotion(LARGE_CACHE, NUM_OPS / 10);

    std::cout << "\n--- Listener overhead ---\n";
    benchmarkListenerOverhead(LARGE_CACHE, NUM_OPS / 2);

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
