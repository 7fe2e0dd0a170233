#pragma once

#include "IEvictionPolicy.hpp"
#include <algorithm>
#include <memory>

/**
 * @brief Политика вытеснения по TTL
 * @tparam K Тип ключа
 *
 * Отдаёт только просроченные записи (раньше истёкшие: первыми).
 * Непросроченные записи не вытесняются даже при нехватке места:
 * в этом случае set() завершится CapacityExceededError.
 *
 * Чтобы под давлением вытеснять и живые записи, политику комбинируют
 * с запасной (fallback), которая применяется к оставшимся кандидатам:
 * @code
 *   auto policy = std::make_unique<TTLPolicy<std::string>>(
 *       std::make_unique<SizePolicy<std::string>>());
 * @endcode
 */
template<typename K>
class TTLPolicy : public IEvictionPolicy<K> {
public:
    using typename IEvictionPolicy<K>::Candidates;

    explicit TTLPolicy(std::unique_ptr<IEvictionPolicy<K>> fallback = nullptr)
        : fallback_(std::move(fallback))
    {}

    std::vector<K> selectVictims(const Candidates& candidates,
                                 const EvictionRequest& request,
                                 CacheTimePoint now) const override {
        std::vector<const EvictionCandidate<K>*> expired;
        Candidates alive;

        for (const auto& candidate : candidates) {
            if (candidate.expiresAt.has_value() && now > candidate.expiresAt.value()) {
                expired.push_back(&candidate);
            } else if (fallback_) {
                alive.push_back(candidate);
            }
        }

        std::stable_sort(expired.begin(), expired.end(),
            [](const EvictionCandidate<K>* a, const EvictionCandidate<K>* b) {
                return a->expiresAt.value() < b->expiresAt.value();
            });

        std::vector<K> victims = this->takeUntilSatisfied(expired, request);
        if (!fallback_) {
            return victims;
        }

        // victims: префикс expired
        EvictionRequest remaining = request;
        for (size_t i = 0; i < victims.size(); ++i) {
            remaining.bytesNeeded -= std::min(remaining.bytesNeeded, expired[i]->sizeBytes);
            remaining.entriesNeeded -= std::min<size_t>(remaining.entriesNeeded, 1);
        }
        if (remaining.empty()) {
            return victims;
        }

        auto extra = fallback_->selectVictims(alive, remaining, now);
        victims.insert(victims.end(), extra.begin(), extra.end());
        return victims;
    }

    const char* name() const override { return fallback_ ? "ttl+fallback" : "ttl"; }

private:
    std::unique_ptr<IEvictionPolicy<K>> fallback_;
};
