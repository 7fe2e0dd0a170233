#pragma once

#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @brief Обратный индекс «тег → ключи» для массовой инвалидации
 * @tparam K Тип ключа (hashable)
 *
 * Структуры данных:
 * - keysByTag_: тег → множество ключей с этим тегом
 * - tagsByKey_: ключ → множество его тегов (для remove() за O(тегов ключа))
 *
 * Пустые корзины удаляются сразу, поэтому tagCount() отражает только
 * используемые теги.
 *
 * Потокобезопасность: shared_mutex. keysForTags() возвращает снимок
 * членства на момент чтения под shared lock: параллельные add/remove
 * не могут показать «разорванную» корзину. Инвалидация по тегам -
 * «best effort на момент снимка».
 */
template<typename K>
class TagIndex {
public:
    using KeySet = std::unordered_set<K>;

    /**
     * @brief Зарегистрировать теги ключа (добавляются к уже имеющимся)
     */
    void add(const K& key, const std::vector<std::string>& tags) {
        if (tags.empty()) {
            return;
        }
        std::unique_lock lock(mutex_);
        auto& keyTags = tagsByKey_[key];
        for (const auto& tag : tags) {
            keysByTag_[tag].insert(key);
            keyTags.insert(tag);
        }
    }

    /**
     * @brief Удалить ключ из всех корзин
     * @return true если ключ был зарегистрирован хотя бы под одним тегом
     */
    bool remove(const K& key) {
        std::unique_lock lock(mutex_);
        auto it = tagsByKey_.find(key);
        if (it == tagsByKey_.end()) {
            return false;
        }

        for (const auto& tag : it->second) {
            auto bucket = keysByTag_.find(tag);
            if (bucket == keysByTag_.end()) {
                continue;
            }
            bucket->second.erase(key);
            if (bucket->second.empty()) {
                keysByTag_.erase(bucket);
            }
        }

        tagsByKey_.erase(it);
        return true;
    }

    /**
     * @brief Объединение ключей, зарегистрированных под любым из тегов
     */
    KeySet keysForTags(const std::vector<std::string>& tags) const {
        KeySet result;
        std::shared_lock lock(mutex_);
        for (const auto& tag : tags) {
            auto bucket = keysByTag_.find(tag);
            if (bucket != keysByTag_.end()) {
                result.insert(bucket->second.begin(), bucket->second.end());
            }
        }
        return result;
    }

    std::unordered_set<std::string> tagsFor(const K& key) const {
        std::shared_lock lock(mutex_);
        auto it = tagsByKey_.find(key);
        if (it == tagsByKey_.end()) {
            return {};
        }
        return it->second;
    }

    bool contains(const std::string& tag) const {
        std::shared_lock lock(mutex_);
        return keysByTag_.find(tag) != keysByTag_.end();
    }

    size_t tagCount() const {
        std::shared_lock lock(mutex_);
        return keysByTag_.size();
    }

    /**
     * @brief Количество ключей, имеющих хотя бы один тег
     */
    size_t keyCount() const {
        std::shared_lock lock(mutex_);
        return tagsByKey_.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        keysByTag_.clear();
        tagsByKey_.clear();
    }

private:
    std::unordered_map<std::string, KeySet> keysByTag_;
    std::unordered_map<K, std::unordered_set<std::string>> tagsByKey_;
    mutable std::shared_mutex mutex_;
};
