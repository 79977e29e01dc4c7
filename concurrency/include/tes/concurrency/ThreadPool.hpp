/**
 * @file ThreadPool.hpp
 * @brief Fixed-size thread pool for data-parallel batches.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CONCURRENCY_THREAD_POOL_HPP
    #define TES_CONCURRENCY_THREAD_POOL_HPP

    #include <tes/core/NonCopyable.hpp>
    #include <tes/core/Types.hpp>

    #include <atomic>
    #include <condition_variable>
    #include <deque>
    #include <functional>
    #include <future>
    #include <mutex>
    #include <ranges>
    #include <thread>
    #include <type_traits>
    #include <vector>

namespace tes::concurrency {

/**
 * @class ThreadPool
 * @brief Workers pull tasks from a shared FIFO queue protected by a mutex
 *        and a condition variable.
 *
 * Tasks submitted after @ref shutdown run on the submitting thread, so
 * every returned future eventually becomes ready. The destructor calls
 * @c shutdown.
 */
class ThreadPool final : public core::NonCopyable<ThreadPool>
{
public:
    /**
     * @param threadCount Number of workers; 0 means one per hardware thread.
     */
    explicit ThreadPool(core::u32 threadCount = 0);

    /** @brief Drains pending tasks and joins all workers. */
    ~ThreadPool();

    /**
     * @brief Enqueues a callable and returns its future. Exceptions thrown
     *        by @p func are rethrown by @c future::get.
     */
    template <typename F, typename... Args>
    [[nodiscard]] auto enqueue(F &&func, Args &&...args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /** @brief Enqueues a fire-and-forget callable. */
    template <typename F>
    void enqueueDetached(F &&func);

    /**
     * @brief Runs @p fn on every element of @p items across the workers and
     *        returns the results in input order.
     *
     * Blocks until every call has finished. If calls throw, the exception
     * of the first failing element (in input order) is rethrown. Must not
     * be called from one of this pool's own workers.
     */
    template <std::ranges::forward_range R, typename F>
    [[nodiscard]] auto map(const R &items, const F &fn)
        -> std::vector<std::invoke_result_t<const F &, std::ranges::range_reference_t<const R>>>;

    /** @brief Finishes the queued tasks and joins the workers. Idempotent. */
    void shutdown();

    [[nodiscard]] core::u32 threadCount() const noexcept;
    [[nodiscard]] core::usize pendingTasks() const;

private:
    void workerLoop();
    /// Returns false once the pool is stopping; the caller then runs @p task itself.
    bool push(std::function<void()> task);

    std::vector<std::thread>            _workers;
    std::deque<std::function<void()>>   _tasks;
    mutable std::mutex                  _mutex;
    std::condition_variable             _cv;
    std::atomic<bool>                   _stopping{false};
};

template <typename F, typename... Args>
auto ThreadPool::enqueue(F &&func, Args &&...args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using ReturnType = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    std::future<ReturnType> future = task->get_future();

    if (!push([task]() { (*task)(); }))
        (*task)();
    return future;
}

template <typename F>
void ThreadPool::enqueueDetached(F &&func)
{
    std::function<void()> task{std::forward<F>(func)};
    if (!push(task))
        task();
}

template <std::ranges::forward_range R, typename F>
auto ThreadPool::map(const R &items, const F &fn)
    -> std::vector<std::invoke_result_t<const F &, std::ranges::range_reference_t<const R>>>
{
    using Result = std::invoke_result_t<const F &, std::ranges::range_reference_t<const R>>;

    std::vector<std::future<Result>> futures;
    for (const auto &item : items)
        futures.push_back(enqueue([&fn, &item]() -> Result { return fn(item); }));

    // Every task borrows fn and items: wait for all of them before any
    // get() may throw and unwind this frame.
    for (auto &f : futures)
        f.wait();

    std::vector<Result> results;
    results.reserve(futures.size());
    for (auto &f : futures)
        results.push_back(f.get());
    return results;
}

} // namespace tes::concurrency

#endif // TES_CONCURRENCY_THREAD_POOL_HPP
