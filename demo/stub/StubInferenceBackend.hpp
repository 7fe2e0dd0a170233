#pragma once

#include "../models/InferenceModels.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

/**
 * @brief Заглушка inference-бэкенда для демонстрации
 *
 * Имитирует поведение реального сервиса моделей:
 * - Ограничение запросов в минуту
 * - Задержки на вычисление (20-60 мс)
 * - Известные модели: sentiment, toxicity
 *
 * Оценка (score) случайная в диапазоне 0.5-1.0, поэтому повторный
 * запрос мимо кэша обычно даёт другое число.
 */
class StubInferenceBackend {
public:
    /**
     * @param requestsPerMinute Лимит запросов
     * @param simulateDelay Имитировать время вычисления
     */
    explicit StubInferenceBackend(int requestsPerMinute = 100, bool simulateDelay = true)
        : requestsPerMinute_(requestsPerMinute)
        , simulateDelay_(simulateDelay)
        , rng_(std::random_device{}())
        , minuteStart_(std::chrono::steady_clock::now())
    {
        labels_["sentiment"] = {"negative", "positive"};
        labels_["toxicity"] = {"clean", "toxic"};
    }

    /**
     * @brief Выполнить предсказание
     * @throws BackendOverloaded если превышен лимит
     * @throws std::runtime_error если модель неизвестна
     */
    Prediction predict(const PredictionRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        checkRateLimit();

        auto it = labels_.find(request.model);
        if (it == labels_.end()) {
            throw std::runtime_error("Unknown model: " + request.model);
        }

        simulateInference();

        std::uniform_real_distribution<double> scoreDist(0.5, 1.0);
        // Метка зависит только от входа
        const auto& label = request.input.size() % 2 == 0 ? it->second.second : it->second.first;
        return Prediction{label, scoreDist(rng_)};
    }

    // ==================== Статистика для демо ====================

    int getTotalRequests() const { return totalRequests_; }
    int getRateLimitHits() const { return rateLimitHits_; }

private:
    void checkRateLimit() {
        ++totalRequests_;

        auto now = std::chrono::steady_clock::now();
        if (now - minuteStart_ >= std::chrono::minutes(1)) {
            minuteStart_ = now;
            requestsInCurrentMinute_ = 0;
        }

        ++requestsInCurrentMinute_;

        if (requestsInCurrentMinute_ > requestsPerMinute_) {
            ++rateLimitHits_;
            throw BackendOverloaded(
                "Rate limit exceeded: " + std::to_string(requestsPerMinute_) +
                " requests per minute"
            );
        }
    }

    void simulateInference() {
        if (!simulateDelay_) return;

        std::uniform_int_distribution<int> dist(20, 60);
        std::this_thread::sleep_for(std::chrono::milliseconds(dist(rng_)));
    }

private:
    int requestsPerMinute_;
    bool simulateDelay_;
    std::mt19937 rng_;
    std::mutex mutex_;

    std::chrono::steady_clock::time_point minuteStart_;
    int requestsInCurrentMinute_ = 0;

    std::atomic<int> totalRequests_{0};
    std::atomic<int> rateLimitHits_{0};

    std::unordered_map<std::string, std::pair<std::string, std::string>> labels_;
};
