//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <cstdint>
#include <mutex>
#include <thread>

#include "heap.hpp"
#include "allocator.hpp"
#include "task.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace allocator {

template <std::size_t N>
struct arena {
    alignas(64) std::uint8_t bytes[N];
};

kcore::co<void> co_alloc_then_yield(kcore::allocator& a, std::size_t size, bool& got) {
    kcore::allocation m = co_await a.alloc(size, 8);
    got = (bool)m;
    co_await kcore::yield();
    co_return;
}

kcore::co<void> co_alloc(kcore::allocator& a, std::size_t size, int& got) {
    kcore::allocation m = co_await a.alloc(size, 8);
    if(m) { ++got; }
    co_return;
}

}
}

TEST(allocator, try_alloc_and_free) {
    test::allocator::arena<256> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    {
        kcore::allocation m = a.try_alloc(24, 8);
        ASSERT_TRUE(m);
        EXPECT_EQ(24u, m.size());
        EXPECT_EQ(8u, m.align());
        EXPECT_EQ(&a, m.owner());
        EXPECT_TRUE(a.contains(m.data()));

        auto s = a.stats();
        EXPECT_EQ(256u, s.total_bytes);
        EXPECT_EQ(kcore::heap::rounded(24), s.allocated_bytes);
        EXPECT_EQ(1u, s.alloc_success_count);
        EXPECT_EQ(1u, s.live_alloc_count());
    }

    auto s = a.stats();
    EXPECT_EQ(0u, s.allocated_bytes);
    EXPECT_EQ(256u, s.free_bytes());
    EXPECT_EQ(1u, s.dealloc_count);
    EXPECT_EQ(0u, s.live_alloc_count());
    EXPECT_EQ(kcore::heap::rounded(24), s.high_water_bytes);
}

TEST(allocator, allocation_move_and_release) {
    test::allocator::arena<256> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    kcore::allocation m1 = a.try_alloc(16, 8);
    void* p = m1.data();
    kcore::allocation m2(std::move(m1));
    EXPECT_FALSE(m1);
    EXPECT_EQ(p, m2.data());

    // a released pointer has to be freed by hand
    void* raw = m2.release();
    EXPECT_FALSE(m2);
    EXPECT_EQ(16u, a.stats().allocated_bytes);
    a.free(raw, 16, 8);
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(allocator, statistics) {
    test::allocator::arena<256> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    kcore::allocation m1 = a.try_alloc(16, 8);
    kcore::allocation m2 = a.try_alloc(32, 8);
    kcore::allocation m3 = a.try_alloc(1024, 8);
    EXPECT_FALSE(m3);

    m1.reset();

    auto s = a.stats();
    EXPECT_EQ(32u, s.allocated_bytes);
    EXPECT_EQ(48u, s.high_water_bytes);
    EXPECT_EQ(2u, s.alloc_success_count);
    EXPECT_EQ(1u, s.alloc_oom_count);
    EXPECT_EQ(3u, s.alloc_attempt_count());
    EXPECT_EQ(1u, s.dealloc_count);
    EXPECT_EQ(1u, s.live_alloc_count());
}

TEST(allocator, invalid_layout) {
    test::allocator::arena<256> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    EXPECT_THROW(a.try_alloc(0, 8), kcore::invalid_layout);
    EXPECT_THROW(a.try_alloc(8, 0), kcore::invalid_layout);
    EXPECT_THROW(a.try_alloc(8, 3), kcore::invalid_layout);
    EXPECT_THROW(a.alloc(8, 6), kcore::invalid_layout);
    EXPECT_EQ(0u, a.stats().alloc_attempt_count());
}

TEST(allocator, foreign_pointer) {
    test::allocator::arena<256> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    int outside = 0;

    EXPECT_THROW(a.free(&outside, sizeof(outside), alignof(int)), kcore::foreign_pointer);
    EXPECT_EQ(0u, a.stats().dealloc_count);
}

TEST(allocator, oom_inhibits_until_free) {
    test::allocator::arena<64> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    kcore::allocation m1 = a.try_alloc(48, 8);
    ASSERT_TRUE(m1);
    EXPECT_FALSE(a.inhibited());

    EXPECT_FALSE(a.try_alloc(32, 8));
    EXPECT_TRUE(a.inhibited());

    // would fit, but requests are refused until something is freed
    EXPECT_FALSE(a.try_alloc(16, 8));

    m1.reset();
    EXPECT_FALSE(a.inhibited());

    kcore::allocation m2 = a.try_alloc(16, 8);
    EXPECT_TRUE(m2);
}

TEST(allocator, oom_on_empty_arena_not_inhibited) {
    test::allocator::arena<64> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    // nothing allocated, nothing could ever clear the inhibit
    EXPECT_FALSE(a.try_alloc(128, 8));
    EXPECT_FALSE(a.inhibited());
    EXPECT_TRUE(a.try_alloc(64, 8));
}

TEST(allocator, deferred_free_in_critical_section) {
    test::allocator::arena<256> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::allocation m = a.try_alloc(32, 8);
    ASSERT_TRUE(m);

    {
        auto cs = a.critical_section();
        ASSERT_TRUE(cs.owns_lock());

        // the free cannot take the lock so it is queued instead of blocking
        m.reset();
        EXPECT_FALSE(m);
    }

    auto s = a.stats();
    EXPECT_EQ(1u, s.deferred_free_count);
    EXPECT_EQ(32u, s.allocated_bytes);
    EXPECT_EQ(0u, s.dealloc_count);

    EXPECT_EQ(1u, a.poll());
    EXPECT_EQ(0u, a.poll());

    s = a.stats();
    EXPECT_EQ(0u, s.allocated_bytes);
    EXPECT_EQ(1u, s.dealloc_count);
    EXPECT_EQ(256u, a.largest_free_block());
}

TEST(allocator, deferred_free_drained_by_try_alloc) {
    test::allocator::arena<64> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::allocation m = a.try_alloc(64, 8);
    ASSERT_TRUE(m);

    {
        auto cs = a.critical_section();
        m.reset();
    }

    // the queued block is returned before the request is served
    kcore::allocation m2 = a.try_alloc(64, 8);
    EXPECT_TRUE(m2);
    EXPECT_EQ(1u, a.stats().dealloc_count);
}

TEST(allocator, deferred_free_from_other_thread) {
    test::allocator::arena<256> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::allocation m = a.try_alloc(64, 8);
    ASSERT_TRUE(m);

    {
        auto cs = a.critical_section();

        // completes while the lock is held elsewhere
        std::thread freer([&]{ m.reset(); });
        freer.join();
    }

    EXPECT_EQ(1u, a.stats().deferred_free_count);
    EXPECT_EQ(1u, a.poll());
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(allocator, alloc_suspends_until_free) {
    test::allocator::arena<64> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::executor ex;
    bool got1 = false;
    bool got2 = false;

    auto j1 = ex.spawn(test::allocator::co_alloc_then_yield(a, 64, got1));
    auto j2 = ex.spawn(test::allocator::co_alloc_then_yield(a, 64, got2));

    // the first request fits, the second waits for the memory
    EXPECT_EQ(2u, ex.tick());
    EXPECT_TRUE(got1);
    EXPECT_FALSE(got2);
    EXPECT_EQ(1u, a.waiting());
    EXPECT_TRUE(a.inhibited());

    // the first task completes and drops its allocation
    EXPECT_EQ(1u, ex.tick());
    EXPECT_TRUE(j1.done());
    EXPECT_EQ(0u, a.waiting());
    EXPECT_EQ(1u, ex.queued_count());

    ex.run_until_idle();
    EXPECT_TRUE(got2);
    EXPECT_TRUE(j2.done());
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(allocator, deferred_free_wakes_waiter) {
    test::allocator::arena<64> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::executor ex;
    int got = 0;

    kcore::allocation held = a.try_alloc(64, 8);
    ASSERT_TRUE(held);

    auto j = ex.spawn(test::allocator::co_alloc(a, 32, got));
    ex.run_until_idle();
    EXPECT_EQ(1u, a.waiting());
    EXPECT_TRUE(a.inhibited());

    {
        auto cs = a.critical_section();
        held.reset();

        // nothing else would poll an idle executor, so the free wakes the request
        EXPECT_EQ(0u, a.waiting());
        EXPECT_EQ(1u, ex.queued_count());
    }

    EXPECT_EQ(1u, a.stats().deferred_free_count);
    EXPECT_EQ(64u, a.stats().allocated_bytes);

    // the retry drains the queued block before allocating
    ex.run_until_idle();
    EXPECT_TRUE(j.done());
    EXPECT_EQ(1, got);
    EXPECT_FALSE(a.inhibited());

    auto s = a.stats();
    EXPECT_EQ(0u, s.allocated_bytes);
    EXPECT_EQ(2u, s.dealloc_count);
}

TEST(allocator, free_after_inhibit_wakes_all) {
    test::allocator::arena<64> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::executor ex;
    int got = 0;

    kcore::allocation held = a.try_alloc(64, 8);
    ASSERT_TRUE(held);

    for(int i=0; i<3; ++i) {
        ex.spawn(test::allocator::co_alloc(a, 16, got));
    }

    ex.run_until_idle();
    EXPECT_EQ(3u, a.waiting());
    EXPECT_EQ(0, got);

    held.reset();
    EXPECT_EQ(0u, a.waiting());
    EXPECT_EQ(3u, ex.queued_count());

    ex.run_until_idle();
    EXPECT_EQ(3, got);
    EXPECT_EQ(0u, ex.task_count());
}

TEST(allocator, cancel_pending_alloc_unlinks) {
    test::allocator::arena<64> ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::executor ex;
    int got = 0;

    kcore::allocation held = a.try_alloc(64, 8);
    auto j = ex.spawn(test::allocator::co_alloc(a, 16, got));

    ex.run_until_idle();
    EXPECT_EQ(1u, a.waiting());

    EXPECT_TRUE(ex.cancel(j.id()));
    EXPECT_EQ(0u, a.waiting());

    held.reset();
    EXPECT_EQ(0u, ex.queued_count());
    EXPECT_EQ(0, got);
}
