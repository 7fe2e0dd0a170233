#pragma once

#include <tiercache/CacheEntry.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/**
 * @brief Метаданные записи, передаваемые политике вытеснения
 * @tparam K Тип ключа
 *
 * Значение не копируется: политике оно не нужно.
 */
template<typename K>
struct EvictionCandidate {
    K key{};
    size_t sizeBytes = 0;
    CacheTimePoint createdAt{};
    CacheTimePoint lastAccessedAt{};
    uint64_t accessCount = 0;
    std::optional<CacheTimePoint> expiresAt;
};

/**
 * @brief Сколько места нужно освободить
 */
struct EvictionRequest {
    size_t bytesNeeded = 0;
    size_t entriesNeeded = 0;

    bool empty() const { return bytesNeeded == 0 && entriesNeeded == 0; }
};

/**
 * @brief Интерфейс политики вытеснения
 * @tparam K Тип ключа
 *
 * Политика не хранит собственного состояния о ключах: она получает
 * снимок кандидатов из быстрого тира (под его блокировкой) и возвращает
 * упорядоченный список жертв. Поэтому рассинхронизация политики и
 * данных тира невозможна.
 *
 * Кандидаты передаются в порядке использования тира. front: самый
 * давно использованный, back: самый свежий. Этот порядок служит
 * последним критерием при равенстве, поэтому результат детерминирован.
 */
template<typename K>
class IEvictionPolicy {
public:
    using Candidates = std::vector<EvictionCandidate<K>>;

    virtual ~IEvictionPolicy() = default;

    /**
     * @brief Выбрать жертвы для вытеснения
     * @param candidates Снимок записей быстрого тира
     * @param request Сколько байт и записей нужно освободить
     * @param now Текущее время (для TTL)
     * @return Ключи в порядке вытеснения. Префикс списка удовлетворяет
     *         request; если политика не может освободить достаточно,
     *         возвращает всё, что готова отдать.
     */
    virtual std::vector<K> selectVictims(const Candidates& candidates,
                                         const EvictionRequest& request,
                                         CacheTimePoint now) const = 0;

    /**
     * @brief Имя политики (для статистики и логов)
     */
    virtual const char* name() const = 0;

protected:
    /**
     * @brief Взять жертвы по порядку, пока запрос не будет удовлетворён
     */
    static std::vector<K> takeUntilSatisfied(const std::vector<const EvictionCandidate<K>*>& ordered,
                                             const EvictionRequest& request) {
        std::vector<K> victims;
        size_t freedBytes = 0;
        size_t freedEntries = 0;

        for (const auto* candidate : ordered) {
            if (freedBytes >= request.bytesNeeded && freedEntries >= request.entriesNeeded) {
                break;
            }
            victims.push_back(candidate->key);
            freedBytes += candidate->sizeBytes;
            ++freedEntries;
        }

        return victims;
    }

    static std::vector<const EvictionCandidate<K>*> pointersTo(const Candidates& candidates) {
        std::vector<const EvictionCandidate<K>*> result;
        result.reserve(candidates.size());
        for (const auto& candidate : candidates) {
            result.push_back(&candidate);
        }
        return result;
    }
};
