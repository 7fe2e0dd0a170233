#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief Результат постановки в очередь
 */
enum class PushResult
{
    Accepted,
    Full,    ///< Достигнута ёмкость очереди
    Closed   ///< Очередь закрыта через close()
};

/**
 * @brief Ограниченная потокобезопасная очередь с блокирующим извлечением
 * @tparam T Тип элементов (достаточно move-конструктора)
 *
 * Особенности:
 * - push() никогда не блокирует: при заполненной очереди сразу
 *   возвращает PushResult::Full, вызывающий сам решает, что делать
 * - pop() ждёт элемент не дольше таймаута
 * - close() будит всех ожидающих; оставшиеся элементы забираются drain()
 *
 * Ёмкость 0 означает очередь без ограничения.
 *
 * Используется пулом TierExecutor: ёмкость ограничивает число операций
 * медленных тиров, ожидающих свободного рабочего потока.
 */
template <typename T>
class ThreadSafeQueue
{
public:
    explicit ThreadSafeQueue(size_t capacity = 0)
        : capacity_(capacity)
    {
    }

    ThreadSafeQueue(const ThreadSafeQueue &) = delete;
    ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

    PushResult push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
            {
                return PushResult::Closed;
            }
            if (capacity_ != 0 && items_.size() >= capacity_)
            {
                return PushResult::Full;
            }
            items_.push_back(std::move(item));
        }
        available_.notify_one();
        return PushResult::Accepted;
    }

    /**
     * @brief Извлечь элемент, ожидая не дольше timeout
     * @return nullopt при таймауте или если очередь закрыта и пуста
     */
    std::optional<T> pop(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait_for(lock, timeout, [this]
                            { return !items_.empty() || closed_; });

        if (items_.empty())
        {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    /**
     * @brief Забрать все элементы разом, в порядке поступления
     */
    std::vector<T> drain()
    {
        std::vector<T> result;
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(items_.size());
        for (auto &item : items_)
        {
            result.push_back(std::move(item));
        }
        items_.clear();
        return result;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    bool closed_ = false;
};
