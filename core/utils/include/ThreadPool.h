#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <cstddef>

namespace CipherLink {

    /**
     * @brief Fixed-size worker pool.
     *
     * The coordinator owns one to run the upload queue and downloads off the
     * caller's thread. Results and exceptions travel back through the future.
     */
    class ThreadPool {
    public:
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Enqueue a task for execution.
         * @return std::future holding the task's result
         * @throws std::runtime_error if the pool is shutting down
         */
        template<typename F>
        auto enqueue(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using ReturnType = std::invoke_result_t<std::decay_t<F>>;
            using TaskType = std::packaged_task<ReturnType()>;

            auto task = std::make_shared<TaskType>(std::forward<F>(func));
            auto fut = task->get_future();

            post([task]() {
                (*task)();
            });

            return fut;
        }

        /**
         * @brief Stop accepting work, finish queued tasks and join workers.
         */
        void shutdown();

        std::size_t size() const { return workers_.size(); }

    private:
        void workerLoop();
        void post(std::function<void()> task);

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_{false};
    };

} // namespace CipherLink
