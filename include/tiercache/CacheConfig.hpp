#pragma once

#include <tiercache/CacheEntry.hpp>
#include <tiercache/CacheErrors.hpp>
#include <chrono>
#include <cstddef>
#include <optional>

/**
 * @brief Политика вытеснения для быстрого тира
 */
enum class EvictionPolicyType {
    LRU,
    LFU,
    TTL,
    Size
};

inline const char* toString(EvictionPolicyType type) {
    switch (type) {
        case EvictionPolicyType::LRU:  return "lru";
        case EvictionPolicyType::LFU:  return "lfu";
        case EvictionPolicyType::TTL:  return "ttl";
        case EvictionPolicyType::Size: return "size";
    }
    return "unknown";
}

/**
 * @brief Конфигурация TieredCache
 *
 * Читается один раз в конструкторе, в runtime не перечитывается.
 * Набор включённых медленных тиров задаётся объектами ITier,
 * переданными в конструктор TieredCache.
 *
 * @code
 *   CacheConfig config;
 *   config.fastTierMaxBytes = 64 * 1024 * 1024;
 *   config.defaultTtl = std::chrono::minutes(10);
 *   config.evictionPolicy = EvictionPolicyType::LFU;
 * @endcode
 */
struct CacheConfig {
    /// Бюджет быстрого тира в байтах (сумма sizeBytes всех записей)
    size_t fastTierMaxBytes = 100 * 1024 * 1024;

    /// Максимальное количество записей в быстром тире
    size_t fastTierMaxEntries = 10000;

    /// TTL для записей без явного TTL. nullopt: бессрочно
    std::optional<CacheDuration> defaultTtl = std::chrono::hours(1);

    EvictionPolicyType evictionPolicy = EvictionPolicyType::LRU;

    /// Период фоновой очистки просроченных записей
    std::chrono::milliseconds sweepInterval = std::chrono::minutes(5);

    /// Сколько записей удаляется за один захват блокировки при очистке
    size_t sweepBatchSize = 256;

    /// Период сброса «скользящих» счётчиков метрик
    std::chrono::milliseconds metricsResetInterval = std::chrono::hours(1);

    /// Максимальное время ожидания одной операции медленного тира
    std::chrono::milliseconds tierTimeout = std::chrono::milliseconds(250);

    /// Потоки для операций с медленными тирами
    size_t tierWorkerThreads = 4;

    /// Сколько операций медленных тиров может ждать свободного потока.
    /// Сверх этого операция сразу считается сбоем тира. 0: без ограничения
    size_t tierQueueCapacity = 1024;

    /// Запускать ли фоновые задачи в TieredCache::start()
    bool enableBackgroundTasks = true;

    /**
     * @brief Проверить конфигурацию
     * @throws InvalidConfigurationError при некорректных значениях
     */
    void validate() const {
        if (fastTierMaxBytes == 0) {
            throw InvalidConfigurationError("fastTierMaxBytes must be greater than 0");
        }
        if (fastTierMaxEntries == 0) {
            throw InvalidConfigurationError("fastTierMaxEntries must be greater than 0");
        }
        if (defaultTtl.has_value() && defaultTtl.value() <= CacheDuration::zero()) {
            throw InvalidConfigurationError("defaultTtl must be positive");
        }
        if (sweepInterval <= std::chrono::milliseconds::zero()) {
            throw InvalidConfigurationError("sweepInterval must be positive");
        }
        if (sweepBatchSize == 0) {
            throw InvalidConfigurationError("sweepBatchSize must be greater than 0");
        }
        if (metricsResetInterval <= std::chrono::milliseconds::zero()) {
            throw InvalidConfigurationError("metricsResetInterval must be positive");
        }
        if (tierTimeout <= std::chrono::milliseconds::zero()) {
            throw InvalidConfigurationError("tierTimeout must be positive");
        }
        if (tierWorkerThreads == 0) {
            throw InvalidConfigurationError("tierWorkerThreads must be greater than 0");
        }
    }
};
