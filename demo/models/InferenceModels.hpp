#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <iomanip>

/**
 * @brief Модели данных для демонстрации: кэширование ответов модели
 *
 * Сервис оркестрации отправляет запросы в inference-бэкенд.
 * Одинаковые запросы к одной версии модели дают одинаковый ответ,
 * поэтому ответ можно кэшировать по ключу (модель, версия, вход).
 */

/**
 * @brief Запрос на предсказание
 */
struct PredictionRequest {
    std::string model;      // "sentiment"
    std::string version;    // "v3"
    std::string input;      // Текст для классификации

    /**
     * @brief Ключ кэша: model:version:input
     */
    std::string cacheKey() const {
        return model + ":" + version + ":" + input;
    }

    /**
     * @brief Теги для инвалидации: вся модель и конкретная версия
     */
    std::vector<std::string> tags() const {
        return {"model:" + model, "model:" + model + ":" + version};
    }
};

/**
 * @brief Ответ модели
 *
 * В кэше хранится сериализованный ответ (payload) в том виде,
 * в котором он уходит клиенту по HTTP.
 */
struct Prediction {
    std::string label;      // "positive"
    double score;           // 0.93

    std::string toPayload() const {
        std::ostringstream os;
        os << std::fixed << std::setprecision(3);
        os << "{\"label\":\"" << label << "\",\"score\":" << score << "}";
        return os.str();
    }
};

/**
 * @brief Исключение при перегрузке бэкенда
 *
 * Бэкенд ограничивает количество запросов в минуту.
 */
class BackendOverloaded : public std::runtime_error {
public:
    explicit BackendOverloaded(const std::string& message)
        : std::runtime_error(message) {}
};
