#pragma once

#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace hostlink::ports::output {

/**
 * @brief Ограниченный пул для блокирующих системных вызовов
 *
 * post() - fire-and-forget, submit() - с результатом через future.
 * Исключение задачи передаётся в future.
 */
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    virtual void post(std::function<void()> task) = 0;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        post([task]() { (*task)(); });
        return future;
    }

    /**
     * @brief Выполнить в пуле и дождаться результата
     */
    template <typename F>
    auto run(F&& fn) -> std::invoke_result_t<std::decay_t<F>> {
        return submit(std::forward<F>(fn)).get();
    }
};

} // namespace hostlink::ports::output
