//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include "atomic.hpp"

#include <mutex>
#include <thread>
#include <chrono>
#include <vector>

#include <gtest/gtest.h>

TEST(spinlock, lock_unlock) {
    bool written = false;
    bool tested = false;
    kcore::spinlock slk;

    slk.lock();

    std::thread tester([&]{
        slk.lock();
        EXPECT_TRUE(written);
        tested = true;
        slk.unlock();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    written = true;

    slk.unlock();

    tester.join();
    EXPECT_TRUE(tested);
}

TEST(spinlock, try_lock_unlock) {
    kcore::spinlock slk;

    slk.lock();

    std::thread tester([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        slk.unlock();
    });

    for(size_t i=0; i<100; ++i) {
        EXPECT_FALSE(slk.try_lock());
    }

    tester.join();

    EXPECT_TRUE(slk.try_lock());
    slk.unlock();
}

TEST(spinlock, unique_lock_try_to_lock) {
    kcore::spinlock slk;

    {
        std::unique_lock<kcore::spinlock> held(slk);
        std::unique_lock<kcore::spinlock> attempt(slk, std::try_to_lock);
        EXPECT_TRUE(held.owns_lock());
        EXPECT_FALSE(attempt.owns_lock());
    }

    std::unique_lock<kcore::spinlock> attempt(slk, std::try_to_lock);
    EXPECT_TRUE(attempt.owns_lock());
}

TEST(spinlock, contended_counter) {
    const size_t thread_count = 4;
    const size_t increments = 10000;
    kcore::spinlock slk;
    size_t counter = 0;
    std::vector<std::thread> threads;

    for(size_t t=0; t<thread_count; ++t) {
        threads.emplace_back([&]{
            for(size_t i=0; i<increments; ++i) {
                std::lock_guard<kcore::spinlock> lk(slk);
                ++counter;
            }
        });
    }

    for(auto& th : threads) { th.join(); }

    EXPECT_EQ(thread_count * increments, counter);
}

TEST(lockfree, lock_api) {
    kcore::lockfree lf;

    {
        std::lock_guard<kcore::lockfree> lk(lf);
    }

    // never contended
    EXPECT_TRUE(lf.try_lock());
    EXPECT_TRUE(lf.try_lock());
    lf.unlock();
}
