#pragma once

#include <optional>
#include <cstddef>

/**
 * @brief Базовый интерфейс кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Граница, через которую кэш используют внешние слои
 * (HTTP-обработчики, оркестрация вычислений).
 */
template <typename K, typename V>
class ICache
{
public:
    virtual ~ICache() = default;

    /**
     * @brief Получить значение по ключу
     * @return Значение, если ключ найден, иначе std::nullopt
     */
    virtual std::optional<V> get(const K &key) = 0;

    /**
     * @brief Поместить значение в кэш с настройками по умолчанию
     */
    virtual void set(const K &key, const V &value) = 0;

    /**
     * @brief Удалить значение по ключу
     * @return true, если элемент был удален, иначе false
     */
    virtual bool remove(const K &key) = 0;

    /**
     * @brief Очистить кэш
     * @return Количество удалённых элементов
     */
    virtual size_t clear() = 0;

    /**
     * @brief Получить текущий размер кэша
     */
    virtual size_t size() const = 0;

    /**
     * @brief Проверить наличие ключа в кэше
     */
    virtual bool contains(const K &key) const = 0;
};
