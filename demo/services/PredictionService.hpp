#pragma once

#include "../models/InferenceModels.hpp"
#include "../stub/StubInferenceBackend.hpp"
#include <tiercache/TieredCache.hpp>
#include <tiercache/listeners/LoggingListener.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Сервис предсказаний с кэшированием ответов
 *
 * Демонстрирует практическое применение TieredCache в оркестрации моделей.
 *
 * Архитектура:
 * - L1: быстрый тир процесса (бюджет в байтах, LRU)
 * - L2: общий тир, разделяемый несколькими репликами сервиса
 *   (в демо это MemoryTier, в реальной системе: внешнее хранилище)
 * - Ответы помечены тегами модели и версии: при выкатке новой
 *   версии ответы старой сбрасываются invalidateByTags()
 */
class PredictionService {
public:
    using ResponseCache = TieredCache<std::string, std::string>;

    /**
     * @param backend Inference-бэкенд (реальный или заглушка)
     * @param config Конфигурация кэша
     * @param sharedTier Общий тир реплик; nullptr: только быстрый тир
     */
    PredictionService(
        std::shared_ptr<StubInferenceBackend> backend,
        CacheConfig config,
        std::shared_ptr<ITier<std::string, std::string>> sharedTier = nullptr
    )
        : backend_(std::move(backend))
        , cache_(std::move(config), sharedTier ? std::vector<std::shared_ptr<ITier<std::string, std::string>>>{sharedTier}
                                               : std::vector<std::shared_ptr<ITier<std::string, std::string>>>{})
    {
        cache_.start();
    }

    /**
     * @brief Получить ответ модели
     *
     * Стратегия кэширования:
     * - Ищем ответ в L1, затем в общем тире
     * - Если нет: вызываем бэкенд и сохраняем во все тиры
     *
     * @throws BackendOverloaded если ответа нет в кэше, а бэкенд перегружен
     */
    std::string predict(const PredictionRequest& request,
                        std::optional<CacheDuration> ttl = std::nullopt) {
        SetOptions options;
        options.ttl = ttl;
        options.tags = request.tags();
        return cache_.getOrCompute(request.cacheKey(),
                                   [&]() { return backend_->predict(request).toPayload(); },
                                   options);
    }

    /**
     * @brief Ответ из кэша без обращения к бэкенду
     */
    std::optional<std::string> cached(const PredictionRequest& request) {
        return cache_.get(request.cacheKey());
    }

    /**
     * @brief Прогреть кэш заранее известными ответами
     * @return Количество загруженных ответов
     */
    size_t warm(const std::vector<PredictionRequest>& requests) {
        size_t loaded = 0;
        for (const auto& request : requests) {
            SetOptions options;
            options.tags = request.tags();
            loaded += cache_.warm({{request.cacheKey(), backend_->predict(request).toPayload()}}, options);
        }
        return loaded;
    }

    /**
     * @brief Выкатка новой версии модели: сбросить все её ответы
     * @return Количество удалённых записей
     */
    size_t redeploy(const std::string& model) {
        return cache_.invalidateByTags({"model:" + model});
    }

    /**
     * @brief Включить вывод событий кэша
     */
    void enableLogging(const std::string& name) {
        cache_.addListener(std::make_shared<LoggingListener<std::string, std::string>>(name));
    }

    void printStats() const {
        auto stats = cache_.stats();

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "  Cache stats (" << stats.evictionPolicy << "):\n";
        std::cout << "    Hits: " << stats.hits()
                  << ", Misses: " << stats.misses()
                  << ", Hit rate: " << (stats.hitRate() * 100) << "%\n";
        std::cout << "    Evictions: " << stats.evictions()
                  << ", Mean latency: " << std::setprecision(3) << stats.meanLatencyMs() << " ms\n";
        for (const auto& tier : stats.tiers) {
            std::cout << "    " << toString(tier.level) << " " << tier.name << ": ";
            if (!tier.available) {
                std::cout << "unavailable\n";
                continue;
            }
            std::cout << tier.entries << " entries, " << tier.bytes << " bytes";
            if (tier.level == TierLevel::L1) {
                std::cout << " (budget " << stats.fastTierMaxBytes << ")";
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

private:
    std::shared_ptr<StubInferenceBackend> backend_;
    ResponseCache cache_;
};
