#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace hostlink::adapters::secondary {

/**
 * @brief Фоновый поток, периодически выполняющий задачу
 *
 * Используется для рассылки телеметрии (каждые 2 с) и для очистки
 * устаревших сессий передачи (раз в час).
 *
 * @example
 * ```cpp
 * BackgroundTicker ticker("telemetry", [&] { hub->broadcast(...); });
 * ticker.start(std::chrono::seconds(2));
 * // ...
 * ticker.stop();
 * ```
 *
 * Thread-safe: да. Исключение из задачи логируется, тикер продолжает работу.
 */
class BackgroundTicker {
public:
    BackgroundTicker(std::string name, std::function<void()> task)
        : name_(std::move(name))
        , task_(std::move(task))
        , running_(false)
        , tickCount_(0)
    {}

    ~BackgroundTicker() {
        stop();
    }

    // Non-copyable, non-movable
    BackgroundTicker(const BackgroundTicker&) = delete;
    BackgroundTicker& operator=(const BackgroundTicker&) = delete;

    /**
     * @brief Запустить тикер
     * @param interval Интервал между тиками
     */
    void start(std::chrono::milliseconds interval) {
        if (running_.exchange(true)) {
            return;  // Уже запущен
        }
        interval_ = interval;
        workerThread_ = std::thread([this]() {
            runLoop();
        });
        std::cout << "[BackgroundTicker] " << name_ << " started, every "
                  << interval.count() << " ms" << std::endl;
    }

    /**
     * @brief Остановить и дождаться завершения текущего тика
     */
    void stop() {
        if (!running_.exchange(false)) {
            return;  // Уже остановлен
        }
        wakeup_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[BackgroundTicker] " << name_ << " stopped" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t tickCount() const {
        return tickCount_.load();
    }

    /**
     * @brief Выполнить один тик вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    std::string name_;
    std::function<void()> task_;

    std::atomic<bool> running_;
    std::thread workerThread_;
    std::chrono::milliseconds interval_{1000};
    std::atomic<uint64_t> tickCount_;

    std::mutex mutex_;
    std::condition_variable wakeup_;

    void runLoop() {
        while (running_.load()) {
            auto start = std::chrono::steady_clock::now();

            doTick();

            std::unique_lock<std::mutex> lock(mutex_);
            wakeup_.wait_until(lock, start + interval_, [this]() {
                return !running_.load();
            });
        }
    }

    void doTick() {
        try {
            task_();
        } catch (const std::exception& e) {
            std::cerr << "[BackgroundTicker] " << name_ << " tick failed: " << e.what() << std::endl;
        }
        ++tickCount_;
    }
};

} // namespace hostlink::adapters::secondary
