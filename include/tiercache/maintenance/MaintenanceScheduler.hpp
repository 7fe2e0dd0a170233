#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Планировщик периодических фоновых задач
 *
 * Каждая задача выполняется в своём потоке с фиксированным интервалом.
 * Ожидание: condition_variable::wait_for, поэтому stop() прерывает
 * паузу немедленно, а не после её окончания.
 *
 * Ошибка одной итерации (исключение из задачи) передаётся в ErrorHandler
 * и не останавливает цикл: следующая итерация выполнится по расписанию.
 *
 * Пример:
 * @code
 *   MaintenanceScheduler scheduler([](const std::string& task, const std::string& error) {
 *       std::cerr << task << ": " << error << "\n";
 *   });
 *   scheduler.schedule("expiry-sweep", std::chrono::seconds(30), [&] { cache.removeExpired(); });
 *   scheduler.start();
 * @endcode
 */
class MaintenanceScheduler {
public:
    using Task = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string& task, const std::string& error)>;

    explicit MaintenanceScheduler(ErrorHandler onError = nullptr)
        : onError_(std::move(onError))
    {}

    ~MaintenanceScheduler() {
        stop();
    }

    MaintenanceScheduler(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

    /**
     * @brief Зарегистрировать задачу
     * @throws std::logic_error если планировщик уже запущен
     * @throws std::invalid_argument при пустой задаче или нулевом интервале
     */
    void schedule(std::string name, std::chrono::milliseconds interval, Task task) {
        if (!task) {
            throw std::invalid_argument("Maintenance task cannot be empty");
        }
        if (interval <= std::chrono::milliseconds::zero()) {
            throw std::invalid_argument("Maintenance interval must be positive");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            throw std::logic_error("Cannot schedule tasks on a running scheduler");
        }
        auto job = std::make_unique<Job>();
        job->name = std::move(name);
        job->interval = interval;
        job->task = std::move(task);
        jobs_.push_back(std::move(job));
    }

    /**
     * @brief Запустить потоки задач (повторный вызов ничего не делает)
     */
    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        stopping_ = false;
        for (auto& job : jobs_) {
            Job* raw = job.get();
            raw->thread = std::thread(&MaintenanceScheduler::jobLoop, this, raw);
        }
    }

    /**
     * @brief Остановить все задачи и дождаться их потоков
     *
     * Текущая итерация задачи доводится до конца.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            stopping_ = true;
        }
        wakeup_.notify_all();

        for (auto& job : jobs_) {
            if (job->thread.joinable()) {
                job->thread.join();
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    /**
     * @brief Сколько итераций задачи выполнено (включая неудачные)
     */
    uint64_t runCount(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& job : jobs_) {
            if (job->name == name) {
                return job->runs.load();
            }
        }
        return 0;
    }

    size_t taskCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

private:
    struct Job {
        std::string name;
        std::chrono::milliseconds interval{0};
        Task task;
        std::thread thread;
        std::atomic<uint64_t> runs{0};
    };

    void jobLoop(Job* job) {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (wakeup_.wait_for(lock, job->interval, [this] { return stopping_; })) {
                    return;
                }
            }
            runOnce(*job);
        }
    }

    void runOnce(Job& job) {
        try {
            job.task();
        } catch (const std::exception& e) {
            reportError(job.name, e.what());
        }
        ++job.runs;
    }

    void reportError(const std::string& task, const std::string& error) {
        if (!onError_) {
            std::cerr << "[MaintenanceScheduler] " << task << ": " << error << std::endl;
            return;
        }
        try {
            onError_(task, error);
        } catch (const std::exception& e) {
            std::cerr << "[MaintenanceScheduler] Error handler failed: "
                      << e.what() << std::endl;
        }
    }

private:
    ErrorHandler onError_;
    std::vector<std::unique_ptr<Job>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    bool running_ = false;
    bool stopping_ = false;
};
