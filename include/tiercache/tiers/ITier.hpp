#pragma once

#include <tiercache/CacheEntry.hpp>
#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Занятость тира
 */
struct TierUsage {
    size_t entries = 0;
    size_t bytes = 0;
};

/**
 * @brief Интерфейс тира кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Быстрый тир (L1): MemoryTier внутри процесса.
 * Медленные тиры (L2, L3): внешние хранилища за этим же интерфейсом:
 * реализация подключается без изменений в TieredCache.
 *
 * Контракт ошибок:
 * - «Не найдено»: read() возвращает nullopt
 * - Сбой (хранилище недоступно): TierUnavailableError
 *
 * TieredCache различает эти случаи: при сбое переходит к следующему
 * тиру, а не считает временную ошибку постоянным промахом.
 *
 * Вызовы медленных тиров выполняются из пула TierExecutor, поэтому
 * реализация должна быть потокобезопасной.
 */
template<typename K, typename V>
class ITier {
public:
    using Entry = CacheEntry<K, V>;

    virtual ~ITier() = default;

    /**
     * @brief Прочитать запись
     * @return Запись или nullopt, если ключа нет
     * @throws TierUnavailableError при сбое хранилища
     */
    virtual std::optional<Entry> read(const K& key) = 0;

    /**
     * @brief Записать (или заменить) запись
     * @throws TierUnavailableError при сбое хранилища
     */
    virtual void write(const Entry& entry) = 0;

    /**
     * @brief Удалить запись
     * @return true если запись существовала
     * @throws TierUnavailableError при сбое хранилища
     */
    virtual bool remove(const K& key) = 0;

    /**
     * @brief Удалить все записи
     * @return Количество удалённых записей
     */
    virtual size_t clear() = 0;

    virtual TierUsage usage() const = 0;

    virtual TierLevel level() const = 0;

    virtual std::string name() const = 0;
};
