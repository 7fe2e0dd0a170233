#pragma once

#include <tiercache/CacheErrors.hpp>
#include <tiercache/utils/ThreadSafeQueue.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @brief Пул потоков для операций медленных тиров с ограничением времени
 *
 * Архитектура (паттерн Command):
 * - Операция тира оборачивается в std::packaged_task и кладётся в очередь
 * - Рабочие потоки забирают команды из ThreadSafeQueue и выполняют их
 * - Вызывающий поток ждёт результат через future::wait_for(timeout)
 *
 * Если тир не ответил за timeout, call() бросает TierUnavailableError,
 * а TieredCache переходит к следующему тиру. Зависшая операция продолжает
 * занимать рабочий поток до своего завершения, но вызывающий код
 * никогда не ждёт дольше таймаута.
 *
 * Исключения, брошенные операцией тира, передаются вызывающему через
 * future::get().
 *
 * Очередь команд ограничена queueCapacity: если медленный тир завис
 * и все потоки заняты, новые операции сразу отклоняются с
 * TierUnavailableError, а не копятся без предела.
 *
 * @code
 *   TierExecutor executor(4);
 *   auto entry = executor.call("redis", [&] { return tier->read(key); },
 *                              std::chrono::milliseconds(100));
 * @endcode
 */
class TierExecutor {
public:
    /// Тип команды: лямбда без аргументов
    using Command = std::function<void()>;

    /**
     * @param threadCount Количество рабочих потоков (> 0)
     * @param queueCapacity Сколько команд может ждать свободного потока (0: без ограничения)
     * @param pollInterval Таймаут ожидания команды в рабочем цикле
     */
    explicit TierExecutor(size_t threadCount,
                          size_t queueCapacity = 0,
                          std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50))
        : queue_(queueCapacity)
        , pollInterval_(pollInterval)
    {
        if (threadCount == 0) {
            throw std::invalid_argument("TierExecutor needs at least one thread");
        }
        running_ = true;
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back(&TierExecutor::workerLoop, this);
        }
    }

    ~TierExecutor() {
        stop();
    }

    TierExecutor(const TierExecutor&) = delete;
    TierExecutor& operator=(const TierExecutor&) = delete;

    /**
     * @brief Поставить операцию в очередь
     * @return future с результатом операции
     * @throws TierUnavailableError если пул остановлен или очередь заполнена
     */
    template<typename Func>
    auto submit(Func&& operation) -> std::future<typename std::invoke_result<Func>::type> {
        using Result = typename std::invoke_result<Func>::type;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(operation));
        std::future<Result> future = task->get_future();

        switch (queue_.push([task]() { (*task)(); })) {
            case PushResult::Accepted:
                break;
            case PushResult::Full:
                throw TierUnavailableError("executor",
                    "queue is full (" + std::to_string(queue_.capacity()) + " pending operations)");
            case PushResult::Closed:
                throw TierUnavailableError("executor", "tier executor is stopped");
        }
        return future;
    }

    /**
     * @brief Выполнить операцию тира и дождаться результата
     * @param tierName Имя тира (для сообщения об ошибке)
     * @param operation Операция
     * @param timeout Максимальное время ожидания
     * @throws TierUnavailableError при таймауте
     * @throws любое исключение, брошенное операцией
     */
    template<typename Func>
    auto call(const std::string& tierName, Func&& operation, std::chrono::milliseconds timeout)
        -> typename std::invoke_result<Func>::type {
        auto future = submit(std::forward<Func>(operation));

        if (future.wait_for(timeout) != std::future_status::ready) {
            throw TierUnavailableError(tierName,
                "no response within " + std::to_string(timeout.count()) + " ms");
        }
        return future.get();
    }

    /**
     * @brief Остановить пул и дождаться рабочих потоков
     *
     * Команды, оставшиеся в очереди, выполняются до выхода.
     */
    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        queue_.close();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t threadCount() const { return workers_.size(); }

    size_t pending() const { return queue_.size(); }

private:
    void workerLoop() {
        while (running_) {
            if (auto command = queue_.pop(pollInterval_)) {
                (*command)();
            }
        }

        for (auto& command : queue_.drain()) {
            command();
        }
    }

private:
    ThreadSafeQueue<Command> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::chrono::milliseconds pollInterval_;
};
