#pragma once

#include <tiercache/ICacheListener.hpp>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 * @tparam V Тип значения (должен поддерживать вывод в ostream)
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>("sessions");
 *   cache.addListener(logger);
 *
 * По умолчанию значения не печатаются (могут быть большими);
 * logValues = true включает их вывод.
 *
 * Строки пишутся под собственным mutex: события приходят из потоков
 * вызывающего кода, фоновой очистки и пула тиров.
 */
template<typename K, typename V>
class LoggingListener : public ICacheListener<K, V> {
public:
    /**
     * @param prefix Префикс для всех сообщений (например, имя кэша)
     * @param os Поток вывода (по умолчанию std::cout)
     * @param logValues Печатать ли значения в INSERT/UPDATE/EVICT
     */
    explicit LoggingListener(const std::string& prefix = "Cache",
                             std::ostream& os = std::cout,
                             bool logValues = false)
        : prefix_(prefix)
        , os_(os)
        , logValues_(logValues)
    {}

    void onHit(const K& key, TierLevel tier) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] HIT: " << key << " (" << toString(tier) << ")\n";
    }

    void onMiss(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] MISS: " << key << "\n";
    }

    void onInsert(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] INSERT: " << key;
        if (logValues_) {
            os_ << " = " << value;
        }
        os_ << "\n";
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] UPDATE: " << key;
        if (logValues_) {
            os_ << " (" << oldValue << " -> " << newValue << ")";
        }
        os_ << "\n";
    }

    void onEvict(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] EVICT: " << key;
        if (logValues_) {
            os_ << " = " << value;
        }
        os_ << "\n";
    }

    void onRemove(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] REMOVE: " << key << "\n";
    }

    void onExpire(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] EXPIRE: " << key << "\n";
    }

    void onPromote(const K& key, TierLevel from) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] PROMOTE: " << key << " from " << toString(from) << "\n";
    }

    void onInvalidate(const std::vector<std::string>& tags, size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] INVALIDATE: " << count << " entries by tags [";
        for (size_t i = 0; i < tags.size(); ++i) {
            os_ << (i > 0 ? ", " : "") << tags[i];
        }
        os_ << "]\n";
    }

    void onClear(size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] CLEAR: " << count << " elements\n";
    }

    void onTierError(const std::string& tierName, const std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] TIER ERROR: " << tierName << ": " << error << "\n";
    }

    void onMaintenanceError(const std::string& task, const std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] MAINTENANCE ERROR: " << task << ": " << error << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
    bool logValues_;
    std::mutex mutex_;
};
