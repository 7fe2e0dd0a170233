#include <gtest/gtest.h>
#include <tiercache/concurrency/TierExecutor.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Тесты для TierExecutor
 *
 * Проверяем:
 * - Результат и исключения операции доходят до вызывающего
 * - Таймаут превращается в TierUnavailableError
 * - Зависшая операция не блокирует остальные потоки пула
 * - Остановка дожидается команд из очереди
 */

using namespace std::chrono_literals;

TEST(TierExecutorTest, RequiresThreads) {
    EXPECT_THROW(TierExecutor(0), std::invalid_argument);
}

TEST(TierExecutorTest, ReturnsResult) {
    TierExecutor executor(2);

    int result = executor.call("tier", []() { return 21 * 2; }, 1000ms);

    EXPECT_EQ(result, 42);
    EXPECT_EQ(executor.threadCount(), 2u);
}

TEST(TierExecutorTest, VoidOperation) {
    TierExecutor executor(1);
    std::atomic<int> calls{0};

    executor.call("tier", [&calls]() { ++calls; }, 1000ms);

    EXPECT_EQ(calls, 1);
}

TEST(TierExecutorTest, PropagatesOperationException) {
    TierExecutor executor(1);

    EXPECT_THROW(
        executor.call("tier", []() -> int { throw std::runtime_error("boom"); }, 1000ms),
        std::runtime_error);
}

TEST(TierExecutorTest, TimeoutThrowsTierUnavailable) {
    TierExecutor executor(1);

    auto start = std::chrono::steady_clock::now();
    try {
        executor.call("slow-tier", []() { std::this_thread::sleep_for(300ms); return 1; }, 30ms);
        FAIL() << "Expected TierUnavailableError";
    } catch (const TierUnavailableError& e) {
        EXPECT_EQ(e.tierName(), "slow-tier");
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 250ms);  // не ждали зависшую операцию
}

TEST(TierExecutorTest, HungOperationDoesNotBlockOtherWorkers) {
    TierExecutor executor(2);

    EXPECT_THROW(
        executor.call("slow", []() { std::this_thread::sleep_for(300ms); return 0; }, 10ms),
        TierUnavailableError);

    // Второй поток свободен
    int result = executor.call("fast", []() { return 7; }, 200ms);
    EXPECT_EQ(result, 7);
}

TEST(TierExecutorTest, StopDrainsQueuedCommands) {
    std::atomic<int> executed{0};
    {
        TierExecutor executor(1);
        for (int i = 0; i < 10; ++i) {
            executor.submit([&executed]() {
                std::this_thread::sleep_for(1ms);
                ++executed;
            });
        }
        executor.stop();
    }

    EXPECT_EQ(executed, 10);
}

TEST(TierExecutorTest, FullQueueRejectsOperation) {
    TierExecutor executor(1, 1);
    std::atomic<bool> release{false};

    // Единственный поток занят, одна команда ждёт в очереди
    auto busy = executor.submit([&release]() {
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
    });
    while (executor.pending() > 0) {
        std::this_thread::sleep_for(1ms);
    }
    auto queued = executor.submit([]() { return 1; });

    try {
        executor.call("tier", []() { return 2; }, 1000ms);
        FAIL() << "Expected TierUnavailableError";
    } catch (const TierUnavailableError& e) {
        EXPECT_NE(std::string(e.what()).find("queue is full"), std::string::npos);
    }

    release = true;
    busy.get();
    EXPECT_EQ(queued.get(), 1);
    EXPECT_EQ(executor.call("tier", []() { return 3; }, 1000ms), 3);
}

TEST(TierExecutorTest, SubmitAfterStopThrows) {
    TierExecutor executor(1);
    executor.stop();

    EXPECT_THROW(executor.submit([]() { return 1; }), TierUnavailableError);
}

TEST(TierExecutorTest, ConcurrentCallers) {
    TierExecutor executor(4);
    std::atomic<int> sum{0};

    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&, t]() {
            for (int i = 0; i < 100; ++i) {
                sum += executor.call("tier", [t]() { return t; }, 2000ms);
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    EXPECT_EQ(sum, 100 * (0 + 1 + 2 + 3));
}
