#include "services/PredictionService.hpp"
#include <iostream>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация библиотеки кэширования на примере ответов моделей
 *
 * Сценарии:
 * 1. Экономия вызовов бэкенда
 * 2. Общий тир для нескольких реплик сервиса
 * 3. TTL ответов
 * 4. Выкатка новой версии модели: инвалидация по тегам
 * 5. Прогрев и вытеснение при ограниченном бюджете памяти
 */

namespace {

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

CacheConfig demoConfig() {
    CacheConfig config;
    config.fastTierMaxBytes = 64 * 1024;
    config.defaultTtl = std::chrono::minutes(10);
    config.sweepInterval = std::chrono::milliseconds(200);
    return config;
}

/**
 * @brief Демо 1: Экономия вызовов бэкенда
 *
 * 50 одинаковых запросов = 1 вызов модели.
 */
void demoBackendSavings() {
    printSeparator("Demo 1: Backend Call Savings");

    auto backend = std::make_shared<StubInferenceBackend>(100, false);
    PredictionService service(backend, demoConfig());

    PredictionRequest request{"sentiment", "v3", "the service was great"};
    const int requestCount = 50;

    std::cout << "Requesting the same prediction " << requestCount << " times...\n\n";

    for (int i = 0; i < requestCount; ++i) {
        auto payload = service.predict(request);
        if (i == 0) {
            std::cout << "First request (backend call): " << payload << "\n\n";
        }
    }

    service.printStats();

    std::cout << "Result: " << requestCount << " requests, but only "
              << backend->getTotalRequests() << " backend call(s)\n";
}

/**
 * @brief Демо 2: Реплики с общим тиром
 *
 * Реплика A вычисляет ответы и записывает их в общий L2.
 * Реплика B находит их в L2 и продвигает в свой L1.
 */
void demoSharedTier() {
    printSeparator("Demo 2: Replicas Sharing a Slower Tier");

    auto backend = std::make_shared<StubInferenceBackend>(100, false);
    auto shared = std::make_shared<MemoryTier<std::string, std::string>>(TierLevel::L2, "shared");

    PredictionService replicaA(backend, demoConfig(), shared);
    PredictionService replicaB(backend, demoConfig(), shared);
    replicaB.enableLogging("replica-b");

    std::vector<PredictionRequest> requests = {
        {"sentiment", "v3", "fast delivery"},
        {"sentiment", "v3", "broken on arrival"},
        {"toxicity", "v1", "have a nice day"},
    };

    std::cout << "Replica A serves requests (fills L1 and the shared tier):\n";
    for (const auto& request : requests) {
        std::cout << "  " << request.cacheKey() << " -> " << replicaA.predict(request) << "\n";
    }

    std::cout << "\nReplica B serves the same requests twice:\n";
    for (int round = 0; round < 2; ++round) {
        for (const auto& request : requests) {
            replicaB.predict(request);
        }
    }

    std::cout << "\nReplica B:\n";
    replicaB.printStats();

    std::cout << "Backend calls: " << backend->getTotalRequests()
              << " (replica B never called the model)\n";
}

/**
 * @brief Демо 3: TTL ответов
 *
 * - Первый запрос: вызов модели
 * - Повторные запросы в течение TTL: из кэша
 * - После истечения TTL: снова вызов модели
 */
void demoTtlBehavior() {
    printSeparator("Demo 3: TTL Behavior");

    auto backend = std::make_shared<StubInferenceBackend>(100, false);
    PredictionService service(backend, demoConfig());

    PredictionRequest request{"toxicity", "v1", "see you tomorrow"};
    const auto ttl = std::chrono::milliseconds(500);

    std::cout << "Response TTL set to 500ms\n\n";

    std::cout << "Request 1 (t=0ms):   " << service.predict(request, ttl)
              << "  backend calls: " << backend->getTotalRequests() << "\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    std::cout << "Request 2 (t=200ms): " << service.predict(request, ttl)
              << "  backend calls: " << backend->getTotalRequests() << " (from cache)\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    std::cout << "Request 3 (t=600ms): " << service.predict(request, ttl)
              << "  backend calls: " << backend->getTotalRequests() << " (TTL expired)\n\n";

    std::cout << "Notice: the score changed between request 1 and 3\n";
}

/**
 * @brief Демо 4: Выкатка новой версии модели
 *
 * Ответы помечены тегом модели. После выкатки ответы модели sentiment
 * сбрасываются, ответы toxicity остаются в кэше.
 * Заодно показываем поведение при лимите бэкенда: кэш обслуживает
 * запросы, которые бэкенд уже не принял бы.
 */
void demoModelRedeploy() {
    printSeparator("Demo 4: Model Redeploy and Rate Limit");

    auto backend = std::make_shared<StubInferenceBackend>(4, false);
    PredictionService service(backend, demoConfig());

    PredictionRequest sentimentA{"sentiment", "v3", "love it"};
    PredictionRequest sentimentB{"sentiment", "v3", "never again"};
    PredictionRequest toxicity{"toxicity", "v1", "love it"};

    service.predict(sentimentA);
    service.predict(sentimentB);
    service.predict(toxicity);
    std::cout << "Cached 3 responses, backend calls: " << backend->getTotalRequests()
              << " (limit 4 per minute)\n";

    for (int i = 0; i < 10; ++i) {
        service.predict(sentimentA);
    }
    std::cout << "10 more requests served, backend calls: " << backend->getTotalRequests() << "\n\n";

    size_t removed = service.redeploy("sentiment");
    std::cout << "Redeployed 'sentiment': " << removed << " cached responses invalidated\n";
    std::cout << "  toxicity response still cached: "
              << (service.cached(toxicity).has_value() ? "yes" : "no") << "\n";
    std::cout << "  sentiment response still cached: "
              << (service.cached(sentimentA).has_value() ? "yes" : "no") << "\n\n";

    for (const auto& request : {sentimentA, sentimentB}) {
        try {
            std::cout << "Recomputing " << request.cacheKey() << ": " << service.predict(request) << "\n";
        } catch (const BackendOverloaded& e) {
            std::cout << "Recomputing " << request.cacheKey() << ": " << e.what() << "\n";
        }
    }

    std::cout << "\nRate limit hits: " << backend->getRateLimitHits() << "\n";
}

/**
 * @brief Демо 5: Прогрев и вытеснение
 *
 * Бюджет быстрого тира: 512 байт. Прогреваем больше ответов,
 * чем помещается: самые старые вытесняются.
 */
void demoWarmAndEvict() {
    printSeparator("Demo 5: Warming and Eviction");

    auto backend = std::make_shared<StubInferenceBackend>(1000, false);
    CacheConfig config = demoConfig();
    config.fastTierMaxBytes = 512;
    PredictionService service(backend, config);

    std::vector<PredictionRequest> requests;
    for (int i = 0; i < 30; ++i) {
        requests.push_back({"sentiment", "v3", "review #" + std::to_string(i)});
    }

    size_t loaded = service.warm(requests);
    std::cout << "Warmed " << loaded << " responses into a 512-byte fast tier\n\n";

    size_t stillCached = 0;
    for (const auto& request : requests) {
        if (service.cached(request)) {
            ++stillCached;
        }
    }
    std::cout << "Still cached: " << stillCached << " of " << requests.size()
              << " (most recent ones)\n\n";

    service.printStats();
}

}  // namespace

int main() {
    std::cout << "=== Tiered Cache Demo: Model Responses ===\n";
    std::cout << "Demonstrating response caching for an inference backend\n";

    try {
        demoBackendSavings();
        demoSharedTier();
        demoTtlBehavior();
        demoModelRedeploy();
        demoWarmAndEvict();

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
