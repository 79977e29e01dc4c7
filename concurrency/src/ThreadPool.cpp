/**
 * @file ThreadPool.cpp
 * @brief Implementation of the fixed-size thread pool.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tes/concurrency/ThreadPool.hpp>
#include <tes/core/Log.hpp>

#include <algorithm>
#include <format>

namespace tes::concurrency {

ThreadPool::ThreadPool(core::u32 threadCount)
{
    const core::u32 count = (threadCount == 0)
        ? std::max(1u, static_cast<core::u32>(std::thread::hardware_concurrency()))
        : threadCount;

    _workers.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
        _workers.emplace_back(&ThreadPool::workerLoop, this);

    core::Log::debug("concurrency", std::format("thread pool started with {} workers", count));
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_stopping.exchange(true, std::memory_order_acq_rel))
            return;
    }
    _cv.notify_all();

    for (auto &worker : _workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(_workers.size());
}

core::usize ThreadPool::pendingTasks() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _tasks.size();
}

bool ThreadPool::push(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_stopping.load(std::memory_order_relaxed))
            return false;
        _tasks.push_back(std::move(task));
    }
    _cv.notify_one();
    return true;
}

void ThreadPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock{_mutex};
            _cv.wait(lock, [this] {
                return _stopping.load(std::memory_order_relaxed) || !_tasks.empty();
            });

            if (_tasks.empty())
                return;

            task = std::move(_tasks.front());
            _tasks.pop_front();
        }
        task();
    }
}

} // namespace tes::concurrency
