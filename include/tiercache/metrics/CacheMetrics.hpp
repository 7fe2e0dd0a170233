#pragma once

#include <tiercache/CacheEntry.hpp>
#include <tiercache/tiers/ITier.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Счётчики одного окна наблюдения
 */
struct MetricsCounters {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t operations = 0;
    /// Средняя задержка get() в миллисекундах
    double meanLatencyMs = 0.0;

    uint64_t totalRequests() const { return hits + misses; }

    /**
     * @brief Процент попаданий (0.0 - 1.0), 0.0 если запросов не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits) / static_cast<double>(total);
    }
};

/**
 * @brief Занятость одного тира в снимке статистики
 */
struct TierStats {
    TierLevel level = TierLevel::L1;
    std::string name;
    size_t entries = 0;
    size_t bytes = 0;
    /// false, если тир не ответил на запрос занятости
    bool available = true;
};

/**
 * @brief Снимок статистики TieredCache
 *
 * lifetime: с момента создания (или clear(true)).
 * recent: текущее окно, сбрасывается фоновой задачей каждые
 * metricsResetInterval, поэтому показывает «недавний» hit rate.
 */
struct CacheStats {
    MetricsCounters lifetime;
    MetricsCounters recent;

    std::vector<TierStats> tiers;

    size_t fastTierMaxBytes = 0;
    size_t fastTierMaxEntries = 0;
    std::string evictionPolicy;
    std::optional<CacheDuration> defaultTtl;

    uint64_t hits() const { return lifetime.hits; }
    uint64_t misses() const { return lifetime.misses; }
    uint64_t evictions() const { return lifetime.evictions; }
    uint64_t operations() const { return lifetime.operations; }
    double hitRate() const { return lifetime.hitRate(); }
    double meanLatencyMs() const { return lifetime.meanLatencyMs; }
};

/**
 * @brief Сборщик метрик кэша
 *
 * Собирает:
 * - hits/misses: для расчёта hit rate
 * - evictions: вытеснения при нехватке места
 * - operations: все публичные операции кэша
 * - суммарную задержку get(): для средней задержки
 *
 * Каждая метрика ведётся в двух экземплярах: lifetime и окно (recent).
 * resetWindow() обнуляет только окно.
 *
 * Счётчики atomic: запись из любых потоков без блокировок.
 * Снимок не атомарен как целое: отдельные счётчики могут разойтись
 * на одну-две операции, идущие параллельно со snapshot().
 */
class CacheMetrics {
public:
    void recordHit(std::chrono::nanoseconds latency) {
        lifetime_.hits.fetch_add(1, std::memory_order_relaxed);
        window_.hits.fetch_add(1, std::memory_order_relaxed);
        recordLatency(latency);
        recordOperation();
    }

    void recordMiss(std::chrono::nanoseconds latency) {
        lifetime_.misses.fetch_add(1, std::memory_order_relaxed);
        window_.misses.fetch_add(1, std::memory_order_relaxed);
        recordLatency(latency);
        recordOperation();
    }

    void recordEvictions(uint64_t count) {
        lifetime_.evictions.fetch_add(count, std::memory_order_relaxed);
        window_.evictions.fetch_add(count, std::memory_order_relaxed);
    }

    void recordOperation() {
        lifetime_.operations.fetch_add(1, std::memory_order_relaxed);
        window_.operations.fetch_add(1, std::memory_order_relaxed);
    }

    MetricsCounters lifetime() const { return lifetime_.load(); }

    MetricsCounters recent() const { return window_.load(); }

    /**
     * @brief Сбросить текущее окно (lifetime не затрагивается)
     */
    void resetWindow() { window_.reset(); }

    /**
     * @brief Сбросить все счётчики
     */
    void resetAll() {
        window_.reset();
        lifetime_.reset();
    }

private:
    struct AtomicCounters {
        std::atomic<uint64_t> hits{0};
        std::atomic<uint64_t> misses{0};
        std::atomic<uint64_t> evictions{0};
        std::atomic<uint64_t> operations{0};
        std::atomic<uint64_t> latencyNanos{0};

        MetricsCounters load() const {
            MetricsCounters result;
            result.hits = hits.load(std::memory_order_relaxed);
            result.misses = misses.load(std::memory_order_relaxed);
            result.evictions = evictions.load(std::memory_order_relaxed);
            result.operations = operations.load(std::memory_order_relaxed);

            uint64_t requests = result.totalRequests();
            if (requests > 0) {
                double totalMs = static_cast<double>(latencyNanos.load(std::memory_order_relaxed)) / 1e6;
                result.meanLatencyMs = totalMs / static_cast<double>(requests);
            }
            return result;
        }

        void reset() {
            hits = 0;
            misses = 0;
            evictions = 0;
            operations = 0;
            latencyNanos = 0;
        }
    };

    void recordLatency(std::chrono::nanoseconds latency) {
        auto nanos = static_cast<uint64_t>(latency.count() > 0 ? latency.count() : 0);
        lifetime_.latencyNanos.fetch_add(nanos, std::memory_order_relaxed);
        window_.latencyNanos.fetch_add(nanos, std::memory_order_relaxed);
    }

private:
    AtomicCounters lifetime_;
    AtomicCounters window_;
};
