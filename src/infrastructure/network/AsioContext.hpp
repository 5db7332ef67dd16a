#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace portsy::infra {

/**
 * @brief Bounded worker pool built on an Asio I/O context.
 *
 * Owns an asio::io_context and a fixed number of worker threads. The thread
 * count is the concurrency ceiling: at most that many submitted tasks run at
 * the same time, the rest wait in the context's queue. Separate instances do
 * not share a queue.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @param threadCount Worker count, raised to 1 if zero.
     * @param name Pool label for log output.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency(),
                         std::string name = "asio");

    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the workers. A second call while running is a no-op.
     */
    void start();

    /**
     * @brief Halts the pool and waits for every worker to exit.
     *
     * Queued tasks that never ran are dropped; their futures throw
     * std::future_error with broken_promise.
     */
    void stop();

    /**
     * @brief Runs a nullary callable on the pool.
     * @return Future holding the callable's result or the exception it threw.
     */
    template <typename Task>
    auto submit(Task&& task) -> std::future<std::invoke_result_t<std::decay_t<Task>>> {
        using Result = std::invoke_result_t<std::decay_t<Task>>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Task>(task));
        auto future = packaged->get_future();
        asio::post(ioContext_, [packaged]() { (*packaged)(); });
        return future;
    }

private:
    using KeepAlive = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<KeepAlive> keepAlive_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
    std::string name_;
};

} // namespace portsy::infra
