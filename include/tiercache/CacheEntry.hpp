#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Уровень (тир) кэша
 *
 * L1: быстрый in-process тир, обязателен.
 * L2, L3: более медленные тиры (удалённое хранилище, БД и т.п.),
 * подключаются через ITier.
 */
enum class TierLevel {
    L1,
    L2,
    L3
};

inline const char* toString(TierLevel level) {
    switch (level) {
        case TierLevel::L1: return "L1";
        case TierLevel::L2: return "L2";
        case TierLevel::L3: return "L3";
    }
    return "unknown";
}

/// Часы, общие для всех компонентов кэша
using CacheClock = std::chrono::steady_clock;
using CacheTimePoint = CacheClock::time_point;
using CacheDuration = CacheClock::duration;

/**
 * @brief Запись кэша: единица хранения
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Чистые данные: ключ, значение и метаданные, по которым работают
 * политики вытеснения, TTL и индекс тегов.
 *
 * Запись считается просроченной, когда now - createdAt > ttl.
 * ttl = nullopt: запись не истекает по времени (но может быть вытеснена).
 */
template<typename K, typename V>
struct CacheEntry {
    K key{};
    V value{};
    CacheTimePoint createdAt{};
    CacheTimePoint lastAccessedAt{};
    uint64_t accessCount = 0;
    std::optional<CacheDuration> ttl;
    size_t sizeBytes = 0;
    /// Тир, в котором лежит авторитетная копия записи
    TierLevel tier = TierLevel::L1;
    /// Отсортированы и без дубликатов
    std::vector<std::string> tags;

    CacheEntry() = default;

    CacheEntry(K k, V v, size_t size,
               std::optional<CacheDuration> timeToLive = std::nullopt,
               std::vector<std::string> entryTags = {},
               TierLevel level = TierLevel::L1,
               CacheTimePoint now = CacheClock::now())
        : key(std::move(k))
        , value(std::move(v))
        , createdAt(now)
        , lastAccessedAt(now)
        , ttl(timeToLive)
        , sizeBytes(size)
        , tier(level)
        , tags(normalizeTags(std::move(entryTags)))
    {}

    bool isExpired(CacheTimePoint now = CacheClock::now()) const {
        if (!ttl.has_value()) {
            return false;
        }
        return now - createdAt > ttl.value();
    }

    std::optional<CacheTimePoint> expiresAt() const {
        if (!ttl.has_value()) {
            return std::nullopt;
        }
        return createdAt + ttl.value();
    }

    /**
     * @brief Оставшееся время жизни
     * @return nullopt для бессрочной записи, zero для уже истёкшей
     */
    std::optional<CacheDuration> remainingTtl(CacheTimePoint now = CacheClock::now()) const {
        auto deadline = expiresAt();
        if (!deadline.has_value()) {
            return std::nullopt;
        }
        if (now >= deadline.value()) {
            return CacheDuration::zero();
        }
        return deadline.value() - now;
    }

    bool hasTag(const std::string& tag) const {
        return std::binary_search(tags.begin(), tags.end(), tag);
    }

    static std::vector<std::string> normalizeTags(std::vector<std::string> raw) {
        std::sort(raw.begin(), raw.end());
        raw.erase(std::unique(raw.begin(), raw.end()), raw.end());
        return raw;
    }
};
