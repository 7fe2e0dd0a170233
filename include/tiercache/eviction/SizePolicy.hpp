#pragma once

#include "IEvictionPolicy.hpp"
#include <algorithm>

/**
 * @brief Политика вытеснения по размеру
 * @tparam K Тип ключа
 *
 * Вытесняет самые большие записи, пока освобождённых байт не станет
 * достаточно. При равном размере: давно не использованную (LRU),
 * затем по порядку тира.
 *
 * Освобождает место минимальным числом записей, но крупные
 * «горячие» значения вытесняются первыми.
 */
template<typename K>
class SizePolicy : public IEvictionPolicy<K> {
public:
    using typename IEvictionPolicy<K>::Candidates;

    std::vector<K> selectVictims(const Candidates& candidates,
                                 const EvictionRequest& request,
                                 CacheTimePoint /*now*/) const override {
        auto ordered = this->pointersTo(candidates);
        std::stable_sort(ordered.begin(), ordered.end(),
            [](const EvictionCandidate<K>* a, const EvictionCandidate<K>* b) {
                if (a->sizeBytes != b->sizeBytes) {
                    return a->sizeBytes > b->sizeBytes;
                }
                return a->lastAccessedAt < b->lastAccessedAt;
            });
        return this->takeUntilSatisfied(ordered, request);
    }

    const char* name() const override { return "size"; }
};
