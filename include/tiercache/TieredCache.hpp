#pragma once

#include <tiercache/CacheConfig.hpp>
#include <tiercache/CacheEntry.hpp>
#include <tiercache/CacheErrors.hpp>
#include <tiercache/ICache.hpp>
#include <tiercache/ICacheListener.hpp>
#include <tiercache/concurrency/TierExecutor.hpp>
#include <tiercache/eviction/EvictionPolicyFactory.hpp>
#include <tiercache/eviction/IEvictionPolicy.hpp>
#include <tiercache/maintenance/MaintenanceScheduler.hpp>
#include <tiercache/metrics/CacheMetrics.hpp>
#include <tiercache/tags/TagIndex.hpp>
#include <tiercache/tiers/ITier.hpp>
#include <tiercache/tiers/MemoryTier.hpp>
#include <tiercache/utils/SizeEstimator.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Параметры чтения
 */
struct CallOptions {
    /// Абсолютный дедлайн операции. nullopt: ограничен только tierTimeout
    std::optional<CacheTimePoint> deadline;
};

/**
 * @brief Параметры записи
 */
struct SetOptions {
    /// TTL записи. nullopt: CacheConfig::defaultTtl
    std::optional<CacheDuration> ttl;

    std::vector<std::string> tags;

    /// Целевой тир:
    /// - nullopt: быстрый тир + сквозная запись во все медленные тиры
    /// - L1: только быстрый тир
    /// - L2/L3: только указанный медленный тир (копия в L1 удаляется)
    std::optional<TierLevel> tier;

    std::optional<CacheTimePoint> deadline;
};

/**
 * @brief Многоуровневый кэш: быстрый in-process тир и цепочка медленных тиров
 * @tparam K Тип ключа (hashable)
 * @tparam V Тип значения
 *
 * Архитектура:
 * - L1: MemoryTier, ограничен бюджетом байт и количеством записей.
 *   Политика вытеснения инжектируется через конструктор (Strategy pattern)
 * - L2/L3: произвольные ITier; все операции с ними идут через
 *   TierExecutor с таймаутом, поэтому зависший тир не блокирует кэш
 * - TagIndex: обратный индекс тегов для invalidateByTags()
 * - CacheMetrics: lifetime и «скользящие» счётчики
 * - MaintenanceScheduler: фоновая очистка просроченных записей
 *   и сброс окна метрик (start()/shutdown())
 * - Слушатели получают уведомления о событиях (Observer pattern)
 *
 * Чтение: L1 → L2 → L3. Попадание в медленном тире продвигает запись
 * в L1 (с оставшимся TTL и тегами) и в более ранние медленные тиры.
 * Сбой или таймаут тира: это промах этого тира, а не ошибка get().
 *
 * Все изменения L1 и индекса тегов выполняются под одним mutex_:
 * вытеснение, вставка и регистрация тегов видны другим потокам
 * только целиком. Ввод-вывод медленных тиров идёт вне блокировки.
 *
 * Слушатели вызываются синхронно, часть событий (HIT, EVICT, EXPIRE) -
 * под mutex_. Вызывать методы кэша из слушателя нельзя.
 *
 * Пример использования:
 * @code
 *   CacheConfig config;
 *   config.fastTierMaxBytes = 64 * 1024 * 1024;
 *
 *   auto remote = std::make_shared<RedisTier>(...);   // ITier<std::string, std::string>
 *   TieredCache<std::string, std::string> cache(config, {remote});
 *   cache.start();
 *
 *   cache.set("user:42", payload, SetOptions{std::chrono::minutes(5), {"user:42", "users"}});
 *   auto value = cache.get("user:42");
 *   cache.invalidateByTags({"users"});
 * @endcode
 */
template<typename K, typename V>
class TieredCache : public ICache<K, V> {
public:
    using Entry = CacheEntry<K, V>;
    using Tier = ITier<K, V>;
    using TierPtr = std::shared_ptr<Tier>;
    using ListenerPtr = std::shared_ptr<ICacheListener<K, V>>;
    using SizeFunction = std::function<size_t(const V&)>;

    /**
     * @param config Конфигурация (проверяется validate())
     * @param slowerTiers Медленные тиры в порядке опроса: уровни L2, L3 по возрастанию
     * @param evictionPolicy Политика вытеснения; nullptr: по config.evictionPolicy
     * @param sizeOf Оценка размера значения; nullptr: SizeEstimator<V>
     * @throws InvalidConfigurationError при некорректной конфигурации или тирах
     */
    explicit TieredCache(CacheConfig config,
                         std::vector<TierPtr> slowerTiers = {},
                         std::unique_ptr<IEvictionPolicy<K>> evictionPolicy = nullptr,
                         SizeFunction sizeOf = nullptr)
        : config_(std::move(config))
        , fast_(TierLevel::L1, "memory")
        , slowerTiers_(std::move(slowerTiers))
        , policy_(std::move(evictionPolicy))
        , sizeOf_(std::move(sizeOf))
        , scheduler_([this](const std::string& task, const std::string& error) {
              notifyMaintenanceError(task, error);
          })
    {
        config_.validate();

        TierLevel previous = TierLevel::L1;
        for (const auto& tier : slowerTiers_) {
            if (!tier) {
                throw InvalidConfigurationError("slower tier cannot be null");
            }
            if (tier->level() <= previous) {
                throw InvalidConfigurationError(
                    "slower tiers must have levels L2, L3 in ascending order, got " +
                    std::string(toString(tier->level())) + " for '" + tier->name() + "'");
            }
            previous = tier->level();
        }

        if (!policy_) {
            policy_ = makeEvictionPolicy<K>(config_.evictionPolicy);
        }
        if (!sizeOf_) {
            sizeOf_ = [](const V& value) { return estimateSize(value); };
        }
        if (!slowerTiers_.empty()) {
            executor_ = std::make_unique<TierExecutor>(config_.tierWorkerThreads, config_.tierQueueCapacity);
        }
    }

    ~TieredCache() override {
        shutdown();
    }

    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;

    // ==================== Чтение ====================

    std::optional<V> get(const K& key) override {
        return get(key, CallOptions{});
    }

    /**
     * @brief Получить значение по ключу
     *
     * Логика:
     * 1. L1: живая запись даёт hit, просроченная удаляется (EXPIRE)
     * 2. Медленные тиры по порядку, каждый с таймаутом
     *    min(tierTimeout, остаток дедлайна). Сбой тира: переход к следующему
     * 3. Найденная запись продвигается в L1 и в более ранние медленные тиры
     *
     * @throws CacheTimeoutError если дедлайн истёк (промах уже учтён в метриках)
     */
    std::optional<V> get(const K& key, const CallOptions& options) {
        const auto started = CacheClock::now();
        if (deadlinePassed(options.deadline)) {
            recordMiss(key, started);
            throw CacheTimeoutError("get");
        }

        uint64_t epoch = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = CacheClock::now();
            auto current = fast_.peek(key);
            if (current) {
                if (current->isExpired(now)) {
                    expireLocked(key);
                } else {
                    auto touched = fast_.touch(key, now);
                    metrics_.recordHit(CacheClock::now() - started);
                    notifyHit(key, TierLevel::L1);
                    return touched->value;
                }
            }
            epoch = mutationEpoch_;
        }

        bool sawExpired = false;
        bool tierFailed = false;
        for (size_t i = 0; i < slowerTiers_.size(); ++i) {
            const TierPtr tier = slowerTiers_[i];
            std::optional<Entry> found;
            try {
                found = callTier(tier, [tier, key]() { return tier->read(key); },
                                 options.deadline, "get");
            } catch (const CacheTimeoutError&) {
                recordMiss(key, started);
                throw;
            } catch (const std::exception& e) {
                notifyTierError(tier->name(), e.what());
                if (deadlinePassed(options.deadline)) {
                    recordMiss(key, started);
                    throw CacheTimeoutError("get");
                }
                tierFailed = true;
                continue;
            }

            if (!found) {
                continue;
            }
            if (found->isExpired(CacheClock::now())) {
                sawExpired = true;
                removeAsync(tier, key);
                continue;
            }

            V value = promote(*found, i, epoch);
            metrics_.recordHit(CacheClock::now() - started);
            notifyHit(key, tier->level());
            return value;
        }

        if (sawExpired && !tierFailed) {
            // Живых копий не осталось ни в одном тире
            std::lock_guard<std::mutex> lock(mutex_);
            if (epoch == mutationEpoch_ && !fast_.peek(key)) {
                forgetTagsLocked(key);
            }
        }

        recordMiss(key, started);
        return std::nullopt;
    }

    /**
     * @brief Получить значение или вычислить и сохранить его
     *
     * Если значение не помещается в быстрый тир, оно всё равно
     * возвращается вызывающему.
     */
    template<typename Compute>
    V getOrCompute(const K& key, Compute&& compute, const SetOptions& options = {}) {
        if (auto cached = get(key, CallOptions{options.deadline})) {
            return *cached;
        }
        V value = compute();
        try {
            set(key, value, options);
        } catch (const CapacityExceededError& e) {
            notifyTierError(fast_.name(), e.what());
        }
        return value;
    }

    /**
     * @brief Есть ли живая запись в быстром тире
     */
    bool contains(const K& key) const override {
        auto entry = fast_.peek(key);
        return entry.has_value() && !entry->isExpired(CacheClock::now());
    }

    /**
     * @brief Оставшееся время жизни записи быстрого тира
     * @return nullopt если записи нет, она просрочена или бессрочна
     */
    std::optional<CacheDuration> timeToLive(const K& key) const {
        auto entry = fast_.peek(key);
        const auto now = CacheClock::now();
        if (!entry || entry->isExpired(now)) {
            return std::nullopt;
        }
        return entry->remainingTtl(now);
    }

    // ==================== Запись ====================

    void set(const K& key, const V& value) override {
        set(key, value, SetOptions{});
    }

    /**
     * @brief Добавить или заменить значение
     *
     * Запись в быстрый тир атомарна: сначала выбираются жертвы, и если
     * даже после их вытеснения запись не помещается, кэш не меняется.
     *
     * Сквозная запись в медленные тиры выполняется после L1 и не
     * откатывает её: сбой тира передаётся слушателям (onTierError),
     * а авторитетным тиром записи становится самый глубокий из успешных.
     * Если дедлайн истёк во время сквозной записи, оставшиеся тиры
     * пропускаются, а запись в L1 сохраняется.
     *
     * @throws CapacityExceededError запись больше бюджета или не хватает жертв
     * @throws TierUnavailableError явно указанный медленный тир недоступен
     * @throws CacheTimeoutError дедлайн истёк до записи или во время
     *         сквозной записи (значение уже лежит в L1)
     * @throws std::invalid_argument неположительный TTL
     */
    void set(const K& key, const V& value, const SetOptions& options) {
        metrics_.recordOperation();
        if (deadlinePassed(options.deadline)) {
            throw CacheTimeoutError("set");
        }
        if (options.ttl.has_value() && options.ttl.value() <= CacheDuration::zero()) {
            throw std::invalid_argument("TTL must be positive");
        }

        const auto ttl = options.ttl.has_value() ? options.ttl : config_.defaultTtl;
        const size_t size = sizeOf_(value);

        if (options.tier.has_value() && options.tier.value() != TierLevel::L1) {
            writeAround(Entry(key, value, size, ttl, options.tags, options.tier.value()),
                        options.deadline);
            return;
        }

        const bool writeThrough = !options.tier.has_value() && !slowerTiers_.empty();
        Entry entry(key, value, size, ttl, options.tags,
                    writeThrough ? slowerTiers_.back()->level() : TierLevel::L1);

        std::optional<Entry> previous;
        uint64_t epoch = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = insertLocked(entry, entry.createdAt);
            epoch = mutationEpoch_;
        }

        if (previous) {
            notifyUpdate(key, previous->value, value);
        } else {
            notifyInsert(key, value);
        }

        if (writeThrough) {
            mirror(entry, options.deadline, epoch);
        }
    }

    /**
     * @brief Прогрев кэша набором значений
     * @return Сколько записей загружено
     *
     * Записи, не поместившиеся в быстрый тир, пропускаются.
     */
    size_t warm(const std::vector<std::pair<K, V>>& entries, const SetOptions& options = {}) {
        size_t loaded = 0;
        for (const auto& [key, value] : entries) {
            try {
                set(key, value, options);
                ++loaded;
            } catch (const CapacityExceededError& e) {
                notifyTierError(fast_.name(), e.what());
            }
        }
        return loaded;
    }

    // ==================== Удаление ====================

    /**
     * @brief Удалить ключ из всех тиров
     * @return true если ключ был хотя бы в одном тире
     *
     * Повторный вызов возвращает false.
     */
    bool remove(const K& key) override {
        metrics_.recordOperation();
        const bool removed = removeEverywhere(key);
        if (removed) {
            notifyRemove(key);
        }
        return removed;
    }

    /**
     * @brief Удалить все записи, у которых есть хотя бы один из тегов
     * @return Количество удалённых ключей
     *
     * Ключи берутся снимком индекса; ключ, добавленный с тегом во время
     * инвалидации, может остаться в кэше.
     */
    size_t invalidateByTags(const std::vector<std::string>& tags) {
        metrics_.recordOperation();
        const auto keys = tagIndex_.keysForTags(tags);

        size_t count = 0;
        for (const auto& key : keys) {
            if (removeEverywhere(key)) {
                ++count;
            }
        }

        notifyInvalidate(tags, count);
        return count;
    }

    size_t clear() override {
        return clear(false);
    }

    /**
     * @brief Очистить все тиры
     * @param resetLifetimeMetrics Сбросить и lifetime-счётчики (окно сбрасывается всегда)
     * @return Количество записей, удалённых из быстрого тира
     */
    size_t clear(bool resetLifetimeMetrics) {
        size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++mutationEpoch_;
            count = fast_.clear();
            tagIndex_.clear();
            detachedExpiry_.clear();
        }

        for (const auto& tier : slowerTiers_) {
            try {
                callTier(tier, [tier]() { return tier->clear(); }, std::nullopt, "clear");
            } catch (const std::exception& e) {
                notifyTierError(tier->name(), e.what());
            }
        }

        if (resetLifetimeMetrics) {
            metrics_.resetAll();
        } else {
            metrics_.resetWindow();
        }

        notifyClear(count);
        return count;
    }

    /**
     * @brief Удалить просроченные записи быстрого тира
     * @return Количество удалённых записей
     *
     * Удаление идёт пачками по sweepBatchSize: mutex_ отпускается между
     * пачками, чтобы очистка большого тира не останавливала get/set.
     * Запись, перезаписанная между сбором и удалением, не трогается.
     */
    size_t removeExpired() {
        const auto expired = fast_.collectExpired(CacheClock::now());
        size_t removed = 0;

        for (size_t offset = 0; offset < expired.size(); offset += config_.sweepBatchSize) {
            const size_t end = std::min(expired.size(), offset + config_.sweepBatchSize);
            std::vector<K> batch;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto now = CacheClock::now();
                for (size_t i = offset; i < end; ++i) {
                    if (fast_.takeIfExpired(expired[i], now)) {
                        forgetTagsLocked(expired[i]);
                        batch.push_back(expired[i]);
                    }
                }
            }
            for (const auto& key : batch) {
                notifyExpire(key);
            }
            removed += batch.size();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pruneDetachedLocked(CacheClock::now());
        }
        return removed;
    }

    // ==================== Статистика ====================

    /**
     * @brief Снимок статистики
     *
     * Занятость медленных тиров запрашивается с тем же таймаутом, что
     * и остальные операции; не ответивший тир помечается available = false.
     */
    CacheStats stats() const {
        CacheStats result;
        result.lifetime = metrics_.lifetime();
        result.recent = metrics_.recent();

        const TierUsage fastUsage = fast_.usage();
        result.tiers.push_back(TierStats{TierLevel::L1, fast_.name(), fastUsage.entries, fastUsage.bytes, true});

        for (const auto& tier : slowerTiers_) {
            TierStats tierStats{tier->level(), tier->name(), 0, 0, true};
            try {
                const TierUsage usage = callTier(tier, [tier]() { return tier->usage(); },
                                                 std::nullopt, "stats");
                tierStats.entries = usage.entries;
                tierStats.bytes = usage.bytes;
            } catch (const std::exception& e) {
                tierStats.available = false;
                notifyTierError(tier->name(), e.what());
            }
            result.tiers.push_back(tierStats);
        }

        result.fastTierMaxBytes = config_.fastTierMaxBytes;
        result.fastTierMaxEntries = config_.fastTierMaxEntries;
        result.evictionPolicy = policy_->name();
        result.defaultTtl = config_.defaultTtl;
        return result;
    }

    /**
     * @brief Количество записей в быстром тире
     */
    size_t size() const override {
        return fast_.usage().entries;
    }

    /**
     * @brief Занятый объём быстрого тира в байтах
     */
    size_t bytes() const {
        return fast_.usage().bytes;
    }

    const CacheConfig& config() const { return config_; }

    const char* evictionPolicyName() const { return policy_->name(); }

    // ==================== Жизненный цикл ====================

    /**
     * @brief Запустить фоновые задачи: очистку просроченных записей
     *        и сброс окна метрик
     *
     * Ничего не делает, если enableBackgroundTasks = false
     * или задачи уже запущены.
     */
    void start() {
        if (!config_.enableBackgroundTasks) {
            return;
        }
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (scheduler_.running()) {
            return;
        }
        if (scheduler_.taskCount() == 0) {
            scheduler_.schedule("expiry-sweep", config_.sweepInterval, [this] { removeExpired(); });
            scheduler_.schedule("metrics-reset", config_.metricsResetInterval, [this] { metrics_.resetWindow(); });
        }
        scheduler_.start();
    }

    /**
     * @brief Остановить фоновые задачи
     *
     * Кэш остаётся рабочим; start() запускает задачи снова.
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        scheduler_.stop();
    }

    bool running() const {
        return scheduler_.running();
    }

    /**
     * @brief Сколько раз выполнилась фоновая задача
     *        ("expiry-sweep" или "metrics-reset")
     */
    uint64_t maintenanceRuns(const std::string& task) const {
        return scheduler_.runCount(task);
    }

    // ==================== Управление слушателями ====================

    /**
     * @brief Добавить слушателя событий
     */
    void addListener(ListenerPtr listener) {
        if (!listener) {
            return;
        }
        std::lock_guard<std::mutex> lock(listenersMutex_);
        auto updated = std::make_shared<std::vector<ListenerPtr>>(*listeners_);
        updated->push_back(std::move(listener));
        listeners_ = std::move(updated);
    }

    /**
     * @brief Удалить слушателя
     */
    void removeListener(const ListenerPtr& listener) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        auto updated = std::make_shared<std::vector<ListenerPtr>>(*listeners_);
        updated->erase(std::remove(updated->begin(), updated->end(), listener), updated->end());
        listeners_ = std::move(updated);
    }

private:
    static bool deadlinePassed(const std::optional<CacheTimePoint>& deadline) {
        return deadline.has_value() && CacheClock::now() >= deadline.value();
    }

    /**
     * @brief Выполнить операцию медленного тира через пул
     *
     * Таймаут: min(tierTimeout, остаток дедлайна).
     * @throws CacheTimeoutError если дедлайн уже истёк
     * @throws TierUnavailableError если тир не ответил вовремя
     */
    template<typename Func>
    auto callTier(const TierPtr& tier, Func&& operation,
                  const std::optional<CacheTimePoint>& deadline,
                  const char* operationName) const
        -> typename std::invoke_result<Func>::type {
        auto timeout = config_.tierTimeout;
        if (deadline.has_value()) {
            // ceil: ожидание не должно закончиться раньше самого дедлайна
            auto left = std::chrono::ceil<std::chrono::milliseconds>(
                deadline.value() - CacheClock::now());
            if (left <= std::chrono::milliseconds::zero()) {
                throw CacheTimeoutError(operationName);
            }
            timeout = std::min(timeout, left);
        }
        return executor_->call(tier->name(), std::forward<Func>(operation), timeout);
    }

    /**
     * @brief Вставить запись в быстрый тир, вытеснив жертвы
     * @return Заменённая запись с тем же ключом, если была
     *
     * Вызывается под mutex_.
     */
    std::optional<Entry> insertLocked(const Entry& entry, CacheTimePoint now) {
        const size_t budget = config_.fastTierMaxBytes;
        if (entry.sizeBytes > budget) {
            throw CapacityExceededError(entry.sizeBytes, budget);
        }

        // Старое значение того же ключа будет заменено, его место не считается занятым
        const TierUsage usage = fast_.usage();
        const auto existing = fast_.sizeOf(entry.key);
        const size_t otherBytes = usage.bytes - existing.value_or(0);
        const size_t otherEntries = usage.entries - (existing.has_value() ? 1 : 0);

        EvictionRequest request;
        if (otherBytes + entry.sizeBytes > budget) {
            request.bytesNeeded = otherBytes + entry.sizeBytes - budget;
        }
        if (otherEntries + 1 > config_.fastTierMaxEntries) {
            request.entriesNeeded = otherEntries + 1 - config_.fastTierMaxEntries;
        }

        std::vector<K> victims;
        if (!request.empty()) {
            victims = chooseVictims(entry, request, now);
        }

        for (const auto& victim : victims) {
            evictLocked(victim);
        }
        if (!victims.empty()) {
            metrics_.recordEvictions(victims.size());
        }

        auto previous = fast_.take(entry.key);
        fast_.write(entry);
        forgetTagsLocked(entry.key);
        tagIndex_.add(entry.key, entry.tags);
        return previous;
    }

    /**
     * @brief Спросить политику о жертвах и проверить, что их хватает
     * @throws CapacityExceededError если политика не может освободить место
     */
    std::vector<K> chooseVictims(const Entry& entry, const EvictionRequest& request,
                                 CacheTimePoint now) const {
        const auto candidates = fast_.candidates(&entry.key);

        std::unordered_map<K, size_t> sizes;
        sizes.reserve(candidates.size());
        for (const auto& candidate : candidates) {
            sizes.emplace(candidate.key, candidate.sizeBytes);
        }

        std::vector<K> victims;
        size_t freedBytes = 0;
        size_t freedEntries = 0;
        for (const auto& key : policy_->selectVictims(candidates, request, now)) {
            if (freedBytes >= request.bytesNeeded && freedEntries >= request.entriesNeeded) {
                break;
            }
            auto it = sizes.find(key);
            if (it == sizes.end()) {
                continue;  // неизвестный или повторный ключ
            }
            freedBytes += it->second;
            ++freedEntries;
            victims.push_back(key);
            sizes.erase(it);
        }

        if (freedBytes < request.bytesNeeded || freedEntries < request.entriesNeeded) {
            throw CapacityExceededError(entry.sizeBytes, config_.fastTierMaxBytes);
        }
        return victims;
    }

    /**
     * @brief Вытеснить запись из быстрого тира (под mutex_)
     *
     * Теги остаются, если авторитетная копия лежит в медленном тире.
     * Срок такой копии запоминается: removeExpired() снимет теги,
     * когда он истечёт.
     */
    void evictLocked(const K& key) {
        auto removed = fast_.take(key);
        if (!removed) {
            return;
        }
        if (removed->tier == TierLevel::L1) {
            forgetTagsLocked(key);
        } else if (auto expiresAt = removed->expiresAt()) {
            detachedExpiry_[key] = *expiresAt;
        }
        notifyEvict(key, removed->value);
    }

    void expireLocked(const K& key) {
        if (fast_.take(key)) {
            forgetTagsLocked(key);
            notifyExpire(key);
        }
    }

    void forgetTagsLocked(const K& key) {
        tagIndex_.remove(key);
        detachedExpiry_.erase(key);
    }

    /**
     * @brief Снять теги ключей, чьи копии вне L1 уже просрочены (под mutex_)
     */
    void pruneDetachedLocked(CacheTimePoint now) {
        for (auto it = detachedExpiry_.begin(); it != detachedExpiry_.end();) {
            if (it->second <= now && !fast_.peek(it->first)) {
                tagIndex_.remove(it->first);
                it = detachedExpiry_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /**
     * @brief Продвинуть запись, найденную в медленном тире с индексом tierIndex
     * @param epoch mutationEpoch_ на момент промаха в L1: если с тех пор
     *        ключи удалялись, запись не продвигается, чтобы не воскресить
     *        удалённое значение
     * @return Значение для вызывающего
     */
    V promote(const Entry& found, size_t tierIndex, uint64_t epoch) {
        const auto now = CacheClock::now();
        const TierLevel source = slowerTiers_[tierIndex]->level();

        Entry promoted(found.key, found.value, sizeOf_(found.value),
                       found.ttl.has_value() ? found.remainingTtl(now) : config_.defaultTtl,
                       found.tags, source, now);
        promoted.accessCount = 1;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto current = fast_.peek(found.key);
            if (current && !current->isExpired(now)) {
                // Пока шло чтение, ключ записали заново: свежее значение важнее
                fast_.touch(found.key, now);
                return current->value;
            }
            if (epoch != mutationEpoch_) {
                return found.value;
            }
            try {
                insertLocked(promoted, now);
                notifyPromote(found.key, source);
            } catch (const CapacityExceededError& e) {
                notifyTierError(fast_.name(), std::string("promotion skipped: ") + e.what());
            }
        }

        // Синхронно: иначе отложенная запись могла бы вернуть ключ,
        // удалённый сразу после этого get()
        for (size_t i = 0; i < tierIndex; ++i) {
            const TierPtr tier = slowerTiers_[i];
            try {
                callTier(tier, [tier, promoted]() { tier->write(promoted); }, std::nullopt, "get");
            } catch (const std::exception& e) {
                notifyTierError(tier->name(), e.what());
            }
        }
        return found.value;
    }

    /**
     * @brief Сквозная запись во все медленные тиры
     * @param epoch mutationEpoch_ сразу после вставки в L1
     * @throws CacheTimeoutError дедлайн истёк, оставшиеся тиры пропущены
     */
    void mirror(const Entry& entry, const std::optional<CacheTimePoint>& deadline,
                uint64_t epoch) {
        std::optional<TierLevel> owner;
        bool timedOut = false;
        for (const auto& tier : slowerTiers_) {
            try {
                callTier(tier, [tier, entry]() { tier->write(entry); }, deadline, "set");
                owner = tier->level();
            } catch (const CacheTimeoutError&) {
                timedOut = true;
                break;
            } catch (const std::exception& e) {
                notifyTierError(tier->name(), e.what());
                if (deadlinePassed(deadline)) {
                    timedOut = true;
                    break;
                }
            }
        }

        const TierLevel actual = owner.value_or(TierLevel::L1);
        if (actual != entry.tier) {
            std::lock_guard<std::mutex> lock(mutex_);
            const bool updated = fast_.setOwner(entry.key, entry.createdAt, actual);
            // Запись уже вытеснена из L1, а копий в других тирах нет
            if (!updated && !owner && epoch == mutationEpoch_ && !fast_.peek(entry.key)) {
                forgetTagsLocked(entry.key);
            }
        }

        if (timedOut) {
            throw CacheTimeoutError("set");
        }
    }

    /**
     * @brief Запись только в медленный тир (write-around)
     *
     * Копия в L1 удаляется, копии в более ранних медленных тирах тоже:
     * иначе get() нашёл бы там старое значение раньше нового.
     */
    void writeAround(const Entry& entry, const std::optional<CacheTimePoint>& deadline) {
        size_t targetIndex = slowerTiers_.size();
        for (size_t i = 0; i < slowerTiers_.size(); ++i) {
            if (slowerTiers_[i]->level() == entry.tier) {
                targetIndex = i;
                break;
            }
        }
        if (targetIndex == slowerTiers_.size()) {
            throw TierUnavailableError(toString(entry.tier), "tier is not configured");
        }

        const TierPtr target = slowerTiers_[targetIndex];
        try {
            callTier(target, [target, entry]() { target->write(entry); }, deadline, "set");
        } catch (const CacheTimeoutError&) {
            throw;
        } catch (const TierUnavailableError& e) {
            notifyTierError(target->name(), e.what());
            if (deadlinePassed(deadline)) {
                throw CacheTimeoutError("set");
            }
            throw;
        } catch (const std::exception& e) {
            notifyTierError(target->name(), e.what());
            throw TierUnavailableError(target->name(), e.what());
        }

        std::optional<Entry> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++mutationEpoch_;
            dropped = fast_.take(entry.key);
            forgetTagsLocked(entry.key);
            tagIndex_.add(entry.key, entry.tags);
            if (auto expiresAt = entry.expiresAt()) {
                detachedExpiry_[entry.key] = *expiresAt;
            }
        }

        for (size_t i = 0; i < targetIndex; ++i) {
            const TierPtr tier = slowerTiers_[i];
            const K key = entry.key;
            try {
                callTier(tier, [tier, key]() { return tier->remove(key); }, std::nullopt, "set");
            } catch (const std::exception& e) {
                notifyTierError(tier->name(), e.what());
            }
        }

        if (dropped) {
            notifyUpdate(entry.key, dropped->value, entry.value);
        } else {
            notifyInsert(entry.key, entry.value);
        }
    }

    bool removeEverywhere(const K& key) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++mutationEpoch_;
            removed = fast_.take(key).has_value();
            forgetTagsLocked(key);
        }

        for (const auto& tier : slowerTiers_) {
            try {
                if (callTier(tier, [tier, key]() { return tier->remove(key); }, std::nullopt, "remove")) {
                    removed = true;
                }
            } catch (const std::exception& e) {
                notifyTierError(tier->name(), e.what());
            }
        }
        return removed;
    }

    /**
     * @brief Фоновое удаление просроченной копии из тира
     *
     * Результат не ждём: копия уже не отдаётся из get().
     */
    void removeAsync(const TierPtr& tier, const K& key) {
        try {
            executor_->submit([this, tier, key]() {
                try {
                    tier->remove(key);
                } catch (const std::exception& e) {
                    notifyTierError(tier->name(), e.what());
                }
            });
        } catch (const TierUnavailableError& e) {
            notifyTierError(tier->name(), e.what());
        }
    }

    void recordMiss(const K& key, CacheTimePoint started) {
        metrics_.recordMiss(CacheClock::now() - started);
        notifyMiss(key);
    }

    // ==================== Уведомления слушателей ====================

    /**
     * @brief Вызвать событие у всех слушателей
     *
     * Список слушателей копируется при изменении (copy-on-write),
     * поэтому рассылка не держит listenersMutex_. Исключение слушателя
     * пишется в std::cerr и не прерывает рассылку.
     */
    template<typename Event>
    void notify(Event&& event) const {
        std::shared_ptr<const std::vector<ListenerPtr>> snapshot;
        {
            std::lock_guard<std::mutex> lock(listenersMutex_);
            snapshot = listeners_;
        }
        for (const auto& listener : *snapshot) {
            try {
                event(*listener);
            } catch (const std::exception& e) {
                std::cerr << "[TieredCache] Listener failed: " << e.what() << std::endl;
            }
        }
    }

    void notifyHit(const K& key, TierLevel tier) const {
        notify([&](ICacheListener<K, V>& l) { l.onHit(key, tier); });
    }

    void notifyMiss(const K& key) const {
        notify([&](ICacheListener<K, V>& l) { l.onMiss(key); });
    }

    void notifyInsert(const K& key, const V& value) const {
        notify([&](ICacheListener<K, V>& l) { l.onInsert(key, value); });
    }

    void notifyUpdate(const K& key, const V& oldValue, const V& newValue) const {
        notify([&](ICacheListener<K, V>& l) { l.onUpdate(key, oldValue, newValue); });
    }

    void notifyEvict(const K& key, const V& value) const {
        notify([&](ICacheListener<K, V>& l) { l.onEvict(key, value); });
    }

    void notifyRemove(const K& key) const {
        notify([&](ICacheListener<K, V>& l) { l.onRemove(key); });
    }

    void notifyExpire(const K& key) const {
        notify([&](ICacheListener<K, V>& l) { l.onExpire(key); });
    }

    void notifyPromote(const K& key, TierLevel from) const {
        notify([&](ICacheListener<K, V>& l) { l.onPromote(key, from); });
    }

    void notifyInvalidate(const std::vector<std::string>& tags, size_t count) const {
        notify([&](ICacheListener<K, V>& l) { l.onInvalidate(tags, count); });
    }

    void notifyClear(size_t count) const {
        notify([&](ICacheListener<K, V>& l) { l.onClear(count); });
    }

    void notifyTierError(const std::string& tierName, const std::string& error) const {
        notify([&](ICacheListener<K, V>& l) { l.onTierError(tierName, error); });
    }

    void notifyMaintenanceError(const std::string& task, const std::string& error) const {
        notify([&](ICacheListener<K, V>& l) { l.onMaintenanceError(task, error); });
    }

private:
    CacheConfig config_;
    MemoryTier<K, V> fast_;
    std::vector<TierPtr> slowerTiers_;
    std::unique_ptr<IEvictionPolicy<K>> policy_;
    SizeFunction sizeOf_;
    TagIndex<K> tagIndex_;
    /// Срок копий вне L1 для ключей, чьи теги остались в tagIndex_
    std::unordered_map<K, CacheTimePoint> detachedExpiry_;
    CacheMetrics metrics_;

    /// Защищает согласованность fast_ и tagIndex_ между собой
    std::mutex mutex_;
    /// Увеличивается при каждом удалении ключей (remove, invalidate, clear, write-around)
    uint64_t mutationEpoch_ = 0;

    std::shared_ptr<const std::vector<ListenerPtr>> listeners_ =
        std::make_shared<std::vector<ListenerPtr>>();
    mutable std::mutex listenersMutex_;

    std::mutex lifecycleMutex_;
    MaintenanceScheduler scheduler_;

    /// Объявлен последним: разрушается первым и дожидается фоновых
    /// команд, пока остальные члены ещё живы
    std::unique_ptr<TierExecutor> executor_;
};
