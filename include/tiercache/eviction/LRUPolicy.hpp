#pragma once

#include "IEvictionPolicy.hpp"
#include <algorithm>

/**
 * @brief Политика вытеснения LRU (Least Recently Used)
 * @tparam K Тип ключа
 *
 * Вытесняет записи, к которым дольше всего не было обращений.
 * Сортировка по lastAccessedAt; при равенстве решает порядок тира
 * (stable_sort сохраняет его).
 *
 * Пример работы (бюджет 100 байт, записи по 40 байт):
 *   set(A), set(B)  -> [A, B], занято 80
 *   get(A)          -> [B, A]
 *   set(C)          -> нужно 20 байт, жертва B
 */
template<typename K>
class LRUPolicy : public IEvictionPolicy<K> {
public:
    using typename IEvictionPolicy<K>::Candidates;

    std::vector<K> selectVictims(const Candidates& candidates,
                                 const EvictionRequest& request,
                                 CacheTimePoint /*now*/) const override {
        auto ordered = this->pointersTo(candidates);
        std::stable_sort(ordered.begin(), ordered.end(),
            [](const EvictionCandidate<K>* a, const EvictionCandidate<K>* b) {
                return a->lastAccessedAt < b->lastAccessedAt;
            });
        return this->takeUntilSatisfied(ordered, request);
    }

    const char* name() const override { return "lru"; }
};
