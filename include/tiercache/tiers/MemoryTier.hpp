#pragma once

#include "ITier.hpp"
#include <tiercache/eviction/IEvictionPolicy.hpp>
#include <iterator>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief In-process тир: упорядоченная хэш-таблица
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Структуры данных:
 * - std::list<Entry> order_: записи в порядке использования
 *   front() = самая давно использованная, back() = самая свежая
 * - std::unordered_map<K, iterator> index_: ключ → позиция в списке
 *
 * Сложность: поиск, вставка, удаление и перенос в конец за O(1).
 * std::list::splice переносит узел без копирования и аллокации.
 *
 * Используется как быстрый тир TieredCache (L1), а также как простой
 * медленный тир внутри процесса (например, в тестах и демо).
 *
 * Потокобезопасен: все методы под одним mutex.
 */
template<typename K, typename V>
class MemoryTier : public ITier<K, V> {
public:
    using Entry = CacheEntry<K, V>;

    explicit MemoryTier(TierLevel level = TierLevel::L1, std::string name = "memory")
        : level_(level)
        , name_(std::move(name))
    {}

    MemoryTier(const MemoryTier&) = delete;
    MemoryTier& operator=(const MemoryTier&) = delete;

    // ==================== ITier ====================

    /**
     * @brief Прочитать запись без обновления статистики доступа
     */
    std::optional<Entry> read(const K& key) override {
        return peek(key);
    }

    /**
     * @brief Вставить или заменить запись
     *
     * Запись становится самой свежей (back).
     */
    void write(const Entry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        eraseLocked(entry.key);
        order_.push_back(entry);
        index_[entry.key] = std::prev(order_.end());
        bytes_ += entry.sizeBytes;
    }

    bool remove(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return eraseLocked(key).has_value();
    }

    size_t clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = order_.size();
        order_.clear();
        index_.clear();
        bytes_ = 0;
        return count;
    }

    TierUsage usage() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return TierUsage{order_.size(), bytes_};
    }

    TierLevel level() const override { return level_; }

    std::string name() const override { return name_; }

    // ==================== Операции быстрого тира ====================

    /**
     * @brief Зафиксировать обращение к записи
     * @return Копия записи после обновления или nullopt, если ключа нет
     *
     * Обновляет lastAccessedAt, увеличивает accessCount и переносит
     * запись в конец списка (самая свежая).
     */
    std::optional<Entry> touch(const K& key, CacheTimePoint now = CacheClock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        it->second->lastAccessedAt = now;
        ++it->second->accessCount;
        order_.splice(order_.end(), order_, it->second);
        return *it->second;
    }

    /**
     * @brief Удалить запись и вернуть её
     */
    std::optional<Entry> take(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return eraseLocked(key);
    }

    /**
     * @brief Копия записи без обновления статистики доступа (const-версия read)
     */
    std::optional<Entry> peek(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return *it->second;
    }

    bool contains(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    /**
     * @brief Размер записи или nullopt, если ключа нет
     */
    std::optional<size_t> sizeOf(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second->sizeBytes;
    }

    /**
     * @brief Снимок метаданных для политики вытеснения
     * @param exclude Ключ, который нельзя предлагать в жертвы
     *
     * Кандидаты идут в порядке использования: от давнего к свежему.
     */
    std::vector<EvictionCandidate<K>> candidates(const K* exclude = nullptr) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EvictionCandidate<K>> result;
        result.reserve(order_.size());
        for (const auto& entry : order_) {
            if (exclude && entry.key == *exclude) {
                continue;
            }
            result.push_back(EvictionCandidate<K>{
                entry.key,
                entry.sizeBytes,
                entry.createdAt,
                entry.lastAccessedAt,
                entry.accessCount,
                entry.expiresAt()
            });
        }
        return result;
    }

    /**
     * @brief Собрать ключи просроченных записей
     */
    std::vector<K> collectExpired(CacheTimePoint now = CacheClock::now()) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<K> expired;
        for (const auto& entry : order_) {
            if (entry.isExpired(now)) {
                expired.push_back(entry.key);
            }
        }
        return expired;
    }

    /**
     * @brief Удалить запись, только если она всё ещё просрочена
     * @return Удалённая запись или nullopt
     *
     * Между сбором просроченных ключей и удалением ключ мог быть
     * перезаписан свежим значением: такую запись не трогаем.
     */
    std::optional<Entry> takeIfExpired(const K& key, CacheTimePoint now = CacheClock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end() || !it->second->isExpired(now)) {
            return std::nullopt;
        }
        return eraseLocked(key);
    }

    /**
     * @brief Сменить тир-владельца записи
     * @param createdAt Время создания ожидаемой записи: если ключ успели
     *        перезаписать, запись не меняется
     */
    bool setOwner(const K& key, CacheTimePoint createdAt, TierLevel owner) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end() || it->second->createdAt != createdAt) {
            return false;
        }
        it->second->tier = owner;
        return true;
    }

    /**
     * @brief Ключи в порядке использования (для отладки и тестов)
     */
    std::vector<K> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<K> result;
        result.reserve(order_.size());
        for (const auto& entry : order_) {
            result.push_back(entry.key);
        }
        return result;
    }

private:
    std::optional<Entry> eraseLocked(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        Entry removed = std::move(*it->second);
        bytes_ -= removed.sizeBytes;
        order_.erase(it->second);
        index_.erase(it);
        return removed;
    }

private:
    TierLevel level_;
    std::string name_;

    /// Порядок использования: front() = давний, back() = свежий
    std::list<Entry> order_;
    std::unordered_map<K, typename std::list<Entry>::iterator> index_;
    size_t bytes_ = 0;
    mutable std::mutex mutex_;
};
