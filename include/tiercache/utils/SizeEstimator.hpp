#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Оценка размера значения в байтах для учёта бюджета быстрого тира
 * @tparam T Тип значения
 *
 * Оценивается размер данных в сериализованном виде, а не sizeof объекта:
 * - Арифметические типы: sizeof(T)
 * - std::string: количество байт (UTF-8 как есть)
 * - std::vector<T>: сумма оценок элементов
 * - std::pair<A, B>: сумма оценок
 *
 * Для остальных типов по умолчанию берётся sizeof(T): это оценка снизу,
 * для типов с динамическими данными нужна специализация SizeEstimator
 * или своя функция размера, переданная в TieredCache.
 *
 * @code
 *   template<>
 *   struct SizeEstimator<Document> {
 *       size_t operator()(const Document& d) const { return d.body.size(); }
 *   };
 * @endcode
 */
template<typename T>
struct SizeEstimator {
    size_t operator()(const T&) const { return sizeof(T); }
};

template<>
struct SizeEstimator<std::string> {
    size_t operator()(const std::string& value) const { return value.size(); }
};

template<typename T>
struct SizeEstimator<std::vector<T>> {
    size_t operator()(const std::vector<T>& values) const {
        if constexpr (std::is_arithmetic<T>::value) {
            return values.size() * sizeof(T);
        } else {
            SizeEstimator<T> element;
            size_t total = 0;
            for (const auto& value : values) {
                total += element(value);
            }
            return total;
        }
    }
};

template<typename A, typename B>
struct SizeEstimator<std::pair<A, B>> {
    size_t operator()(const std::pair<A, B>& value) const {
        return SizeEstimator<A>{}(value.first) + SizeEstimator<B>{}(value.second);
    }
};

template<typename T>
size_t estimateSize(const T& value) {
    return SizeEstimator<T>{}(value);
}
