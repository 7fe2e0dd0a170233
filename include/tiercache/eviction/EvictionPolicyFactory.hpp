#pragma once

#include <tiercache/CacheConfig.hpp>
#include "IEvictionPolicy.hpp"
#include "LFUPolicy.hpp"
#include "LRUPolicy.hpp"
#include "SizePolicy.hpp"
#include "TTLPolicy.hpp"
#include <memory>

/**
 * @brief Создать политику вытеснения по её типу из конфигурации
 *
 * EvictionPolicyType::TTL создаёт «чистую» TTL-политику без fallback.
 * Комбинированную политику передают в TieredCache напрямую.
 */
template<typename K>
std::unique_ptr<IEvictionPolicy<K>> makeEvictionPolicy(EvictionPolicyType type) {
    switch (type) {
        case EvictionPolicyType::LRU:
            return std::make_unique<LRUPolicy<K>>();
        case EvictionPolicyType::LFU:
            return std::make_unique<LFUPolicy<K>>();
        case EvictionPolicyType::TTL:
            return std::make_unique<TTLPolicy<K>>();
        case EvictionPolicyType::Size:
            return std::make_unique<SizePolicy<K>>();
    }
    throw InvalidConfigurationError("unknown eviction policy");
}
