#pragma once

#include <tiercache/CacheEntry.hpp>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Интерфейс слушателя событий кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Все методы имеют пустую реализацию по умолчанию: слушатель
 * переопределяет только интересующие события.
 *
 * Вызывается синхронно из потока, выполняющего операцию (часть событий -
 * под блокировкой быстрого тира), поэтому реализация должна быть быстрой
 * и потокобезопасной. Исключение из слушателя не портит состояние кэша.
 */
template<typename K, typename V>
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(const K& key, TierLevel tier) { (void)key; (void)tier; }
    virtual void onMiss(const K& key) { (void)key; }
    virtual void onInsert(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onUpdate(const K& key, const V& oldValue, const V& newValue) {
        (void)key; (void)oldValue; (void)newValue;
    }
    virtual void onEvict(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onRemove(const K& key) { (void)key; }
    virtual void onExpire(const K& key) { (void)key; }
    virtual void onPromote(const K& key, TierLevel from) { (void)key; (void)from; }
    virtual void onInvalidate(const std::vector<std::string>& tags, size_t count) {
        (void)tags; (void)count;
    }
    virtual void onClear(size_t count) { (void)count; }
    virtual void onTierError(const std::string& tierName, const std::string& error) {
        (void)tierName; (void)error;
    }
    virtual void onMaintenanceError(const std::string& task, const std::string& error) {
        (void)task; (void)error;
    }
};
