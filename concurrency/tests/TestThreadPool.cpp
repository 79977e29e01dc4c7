/**
 * @file TestThreadPool.cpp
 * @brief Unit tests for the thread pool.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/concurrency/ThreadPool.hpp"

#include <atomic>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace tes::concurrency {

TEST_CASE("ThreadPool runs enqueued tasks and returns their results", "[concurrency][pool]")
{
    ThreadPool pool{4};
    REQUIRE(pool.threadCount() == 4);

    auto sum = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
    auto text = pool.enqueue([] { return std::string{"tessera"}; });
    REQUIRE(sum.get() == 5);
    REQUIRE(text.get() == "tessera");
}

TEST_CASE("ThreadPool zero means one worker per hardware thread", "[concurrency][pool]")
{
    ThreadPool pool;
    REQUIRE(pool.threadCount() >= 1);
}

TEST_CASE("ThreadPool::shutdown drains queued work", "[concurrency][pool]")
{
    std::atomic<int> done{0};
    {
        ThreadPool pool{2};
        for (int i = 0; i < 100; ++i)
            pool.enqueueDetached([&done] { done.fetch_add(1, std::memory_order_relaxed); });
        pool.shutdown();
        REQUIRE(done.load() == 100);
        REQUIRE(pool.pendingTasks() == 0);

        // Late submissions run on the caller.
        auto late = pool.enqueue([] { return 7; });
        REQUIRE(late.get() == 7);
        pool.shutdown();
    }
    REQUIRE(done.load() == 100);
}

TEST_CASE("ThreadPool::map keeps input order", "[concurrency][pool]")
{
    ThreadPool pool{3};
    std::vector<int> items(200);
    std::iota(items.begin(), items.end(), 0);

    const auto squares = pool.map(items, [](int v) { return v * v; });
    REQUIRE(squares.size() == items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
        REQUIRE(squares[i] == items[i] * items[i]);

    REQUIRE(pool.map(std::vector<int>{}, [](int v) { return v; }).empty());
}

TEST_CASE("ThreadPool::map rethrows the first failure", "[concurrency][pool]")
{
    ThreadPool pool{2};
    const std::vector<int> items{1, 2, 3, 4};
    REQUIRE_THROWS_AS(pool.map(items, [](int v) {
        if (v % 2 == 0)
            throw std::runtime_error{"even"};
        return v;
    }), std::runtime_error);

    // The pool is still usable afterwards.
    REQUIRE(pool.enqueue([] { return 1; }).get() == 1);
}

} // namespace tes::concurrency
