#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>
#include "util/thread_pool.hpp"

namespace {

using docredact::util::ThreadPool;

TEST(ThreadPoolTest, FuturesKeepSubmissionOrder) {
    ThreadPool pool(4, 2);
    EXPECT_EQ(pool.threadCount(), (size_t)4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.enqueue([](int page) { return page * page; }, i));
    }
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(futures[static_cast<size_t>(i)].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionsSurfaceThroughFuture) {
    ThreadPool pool(1, 0);
    auto fut = pool.enqueue([]() -> int { throw std::runtime_error("page failed"); });
    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> done(0);
    {
        ThreadPool pool(2, 0);
        for (int i = 0; i < 20; ++i) {
            pool.enqueue([&done]() { done++; });
        }
    }
    EXPECT_EQ(done.load(), 20);
}

TEST(ThreadPoolTest, ZeroThreadsUsesHardware) {
    ThreadPool pool(0, 0);
    EXPECT_GE(pool.threadCount(), (size_t)1);
}

} // anonymous namespace
