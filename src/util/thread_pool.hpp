#ifndef DOCREDACT_UTIL_THREAD_POOL_HPP
#define DOCREDACT_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <algorithm>

/**
 * @file thread_pool.hpp
 * @brief A bounded thread pool used for per-page layout analysis.
 *
 * Tasks are queued and executed by a fixed number of worker threads. The
 * queue holds at most `capacity` pending tasks; enqueue() blocks while the
 * queue is full so a thousand-page document never materialises a thousand
 * pending page jobs at once.
 *
 * Usage Example:
 *  @code
 *    docredact::util::ThreadPool pool(4, 16);
 *    auto result = pool.enqueue([](int page) { return page * 2; }, 10);
 *    std::cout << "Result: " << result.get() << std::endl;
 *  @endcode
 *
 * Results are returned through std::future, so callers keep their own
 * ordering regardless of completion order.
 */

namespace docredact {
namespace util {

/**
 * @class ThreadPool
 * @brief Fixed-size, bounded-queue thread pool.
 *
 * - Constructor spawns the worker threads.
 * - enqueue(...) schedules a task, blocking while the queue is at capacity.
 * - Destructor drains the queue and joins all workers.
 */
class ThreadPool
{
public:
    /**
     * @brief Construct a new ThreadPool object.
     * @param threadCount Number of worker threads. Zero uses hardware concurrency.
     * @param capacity Maximum number of queued (not yet running) tasks. Zero means unbounded.
     */
    explicit ThreadPool(size_t threadCount = 0, size_t capacity = 0)
        : capacity_(capacity),
          stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    /**
     * @brief Stop accepting work, finish what is queued and join the workers.
     */
    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        taskReady_.notify_all();
        slotFree_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Number of worker threads.
     */
    size_t threadCount() const
    {
        return workers_.size();
    }

    /**
     * @brief Number of tasks waiting for a worker.
     */
    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return taskQueue_.size();
    }

    /**
     * @brief Enqueue a task for asynchronous execution.
     * @return A future for the task's result. Exceptions thrown by the task
     *         are rethrown from future::get().
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            slotFree_.wait(lock, [this] {
                return stop_ || capacity_ == 0 || taskQueue_.size() < capacity_;
            });
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        taskReady_.notify_one();
        return res;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                taskReady_.wait(lock, [this] {
                    return !taskQueue_.empty() || stop_;
                });

                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            slotFree_.notify_one();
            task();
        }
    }

    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Pending tasks
    size_t capacity_;                                ///< Queue bound, 0 = unbounded
    mutable std::mutex queueMutex_;                  ///< Protects the queue and stop_
    std::condition_variable taskReady_;              ///< Signalled when a task is queued
    std::condition_variable slotFree_;               ///< Signalled when a queue slot frees up
    bool stop_;                                      ///< Set once shutdown begins
};

} // namespace util
} // namespace docredact

#endif // DOCREDACT_UTIL_THREAD_POOL_HPP
