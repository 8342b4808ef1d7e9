#pragma once

#include "ports/output/ITaskExecutor.hpp"
#include "settings/TransferSettings.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <iostream>
#include <memory>

namespace hostlink::adapters::secondary {

/**
 * @brief Пул потоков для блокирующих вызовов файловой системы
 *
 * Размер задаётся transfer.io_threads. Медленный диск занимает
 * только потоки пула, а не потоки обработки запросов.
 */
class BlockingIoPool : public ports::output::ITaskExecutor {
public:
    explicit BlockingIoPool(std::shared_ptr<settings::TransferSettings> settings)
        : pool_(static_cast<std::size_t>(settings->getIoThreads()))
    {
        std::cout << "[BlockingIoPool] Created with " << settings->getIoThreads() << " threads" << std::endl;
    }

    ~BlockingIoPool() override {
        pool_.join();
    }

    void post(std::function<void()> task) override {
        boost::asio::post(pool_, [task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[BlockingIoPool] Task failed: " << e.what() << std::endl;
            }
        });
    }

private:
    boost::asio::thread_pool pool_;
};

} // namespace hostlink::adapters::secondary
