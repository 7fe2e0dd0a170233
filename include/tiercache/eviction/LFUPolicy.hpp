#pragma once

#include "IEvictionPolicy.hpp"
#include <algorithm>

/**
 * @brief Политика вытеснения LFU (Least Frequently Used)
 * @tparam K Тип ключа
 *
 * Вытесняет записи с наименьшим количеством обращений.
 * При равной частоте: более старую по времени создания,
 * затем по порядку тира.
 *
 * Пример работы:
 *   set(A), set(B), set(C)   -> accessCount: A=0, B=0, C=0
 *   get(A), get(A), get(B)   -> accessCount: A=2, B=1, C=0
 *   selectVictims(1 запись)  -> [C]
 *
 * @note accessCount сбрасывается при перезаписи ключа через set(),
 *       поэтому новое значение «начинает с нуля».
 */
template<typename K>
class LFUPolicy : public IEvictionPolicy<K> {
public:
    using typename IEvictionPolicy<K>::Candidates;

    std::vector<K> selectVictims(const Candidates& candidates,
                                 const EvictionRequest& request,
                                 CacheTimePoint /*now*/) const override {
        auto ordered = this->pointersTo(candidates);
        std::stable_sort(ordered.begin(), ordered.end(),
            [](const EvictionCandidate<K>* a, const EvictionCandidate<K>* b) {
                if (a->accessCount != b->accessCount) {
                    return a->accessCount < b->accessCount;
                }
                return a->createdAt < b->createdAt;
            });
        return this->takeUntilSatisfied(ordered, request);
    }

    const char* name() const override { return "lfu"; }
};
