//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "wait_list.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

TEST(wait_list, wake_one_fifo) {
    test::wake_log wl;
    kcore::wait_list l;
    kcore::waiter w1, w2, w3;

    EXPECT_TRUE(l.push(w1, wl.waker(1)));
    EXPECT_TRUE(l.push(w2, wl.waker(2)));
    EXPECT_TRUE(l.push(w3, wl.waker(3)));
    EXPECT_EQ(3u, l.size());

    EXPECT_TRUE(l.wake_one());
    EXPECT_TRUE(l.wake_one());
    EXPECT_TRUE(l.wake_one());
    EXPECT_FALSE(l.wake_one());

    ASSERT_EQ(3u, wl.log.size());
    EXPECT_EQ(1, wl.log[0]);
    EXPECT_EQ(2, wl.log[1]);
    EXPECT_EQ(3, wl.log[2]);

    EXPECT_TRUE(l.empty());
    EXPECT_TRUE(w1.woken());
    EXPECT_FALSE(w1.linked());
}

TEST(wait_list, pop_one_returns_waker) {
    test::wake_log wl;
    kcore::wait_list l;
    kcore::waiter w;

    EXPECT_FALSE(l.pop_one());

    kcore::waker wk = wl.waker(7);
    l.push(w, wk);

    auto popped = l.pop_one();
    ASSERT_TRUE(popped);
    EXPECT_EQ(wk, *popped);
    EXPECT_TRUE(w.woken());
    EXPECT_FALSE(w.linked());

    // popping does not invoke the waker
    EXPECT_TRUE(wl.log.empty());
    popped->wake();
    ASSERT_EQ(1u, wl.log.size());
    EXPECT_EQ(7, wl.log[0]);
}

TEST(wait_list, wake_all_count) {
    test::wake_log wl;
    kcore::wait_list l;
    std::vector<std::unique_ptr<kcore::waiter>> ws;

    for(int i=0; i<10; ++i) {
        ws.emplace_back(new kcore::waiter);
        l.push(*(ws.back()), wl.waker(i));
    }

    EXPECT_EQ(10u, l.wake_all());
    EXPECT_EQ(0u, l.size());
    ASSERT_EQ(10u, wl.log.size());

    for(int i=0; i<10; ++i) {
        EXPECT_EQ(i, wl.log[i]);
        EXPECT_TRUE(ws[i]->woken());
    }

    EXPECT_EQ(0u, l.wake_all());
}

TEST(wait_list, dropped_waiter_unlinks) {
    test::wake_log wl;
    kcore::wait_list l;
    kcore::waiter kept1;
    kcore::waiter kept2;

    l.push(kept1, wl.waker(1));

    {
        kcore::waiter dropped;
        l.push(dropped, wl.waker(2));
        EXPECT_EQ(2u, l.size());
    }

    l.push(kept2, wl.waker(3));
    EXPECT_EQ(2u, l.size());

    // only the live, linked waiters are woken
    EXPECT_EQ(2u, l.wake_all());
    ASSERT_EQ(2u, wl.log.size());
    EXPECT_EQ(1, wl.log[0]);
    EXPECT_EQ(3, wl.log[1]);
}

TEST(wait_list, woken_then_dropped_not_woken_twice) {
    test::wake_log wl;
    kcore::wait_list l;

    {
        kcore::waiter w;
        l.push(w, wl.waker(1));
        EXPECT_TRUE(l.wake_one());
        EXPECT_FALSE(w.linked());
    }

    EXPECT_EQ(0u, l.wake_all());
    EXPECT_EQ(1u, wl.log.size());
}

TEST(wait_list, remove_idempotent) {
    test::wake_log wl;
    kcore::wait_list l;
    kcore::waiter w;

    l.push(w, wl.waker(1));
    EXPECT_TRUE(l.remove(w));
    EXPECT_FALSE(l.remove(w));
    EXPECT_FALSE(w.unlink());
    EXPECT_FALSE(w.woken());
    EXPECT_TRUE(l.empty());
    EXPECT_FALSE(l.wake_one());
    EXPECT_TRUE(wl.log.empty());
}

TEST(wait_list, repush_refreshes_waker) {
    test::wake_log wl;
    kcore::wait_list l;
    kcore::waiter w;

    l.push(w, wl.waker(1));
    l.push(w, wl.waker(2));
    EXPECT_EQ(1u, l.size());

    EXPECT_TRUE(l.wake_one());
    ASSERT_EQ(1u, wl.log.size());
    EXPECT_EQ(2, wl.log[0]);
}

TEST(wait_list, second_list_throws) {
    test::wake_log wl;
    kcore::wait_list l1;
    kcore::wait_list l2;
    kcore::waiter w;

    l1.push(w, wl.waker(1));
    EXPECT_THROW(l2.push(w, wl.waker(2)), kcore::waiter_already_linked);
    EXPECT_EQ(1u, l1.size());
    EXPECT_EQ(0u, l2.size());

    // once unlinked it may move
    w.unlink();
    EXPECT_TRUE(l2.push(w, wl.waker(2)));
}

TEST(wait_list, close) {
    test::wake_log wl;
    kcore::wait_list l;
    kcore::waiter w1, w2, late;

    l.push(w1, wl.waker(1));
    l.push(w2, wl.waker(2));

    EXPECT_FALSE(l.closed());
    EXPECT_EQ(2u, l.close());
    EXPECT_TRUE(l.closed());
    EXPECT_EQ(2u, wl.log.size());

    EXPECT_FALSE(l.push(late, wl.waker(3)));
    EXPECT_FALSE(late.linked());
    EXPECT_EQ(0u, l.close());
    EXPECT_EQ(2u, wl.log.size());
}

TEST(wait_list, destructor_wakes_remaining) {
    test::wake_log wl;
    kcore::waiter w;

    {
        kcore::wait_list l;
        l.push(w, wl.waker(1));
    }

    EXPECT_FALSE(w.linked());
    ASSERT_EQ(1u, wl.log.size());
}

TEST(wait_list, wake_from_other_thread) {
    std::atomic<int> woken{0};
    kcore::wait_list l;
    std::vector<std::unique_ptr<kcore::waiter>> ws;

    auto op = [](void* ctx) { static_cast<std::atomic<int>*>(ctx)->fetch_add(1); };

    for(int i=0; i<100; ++i) {
        ws.emplace_back(new kcore::waiter);
        l.push(*(ws.back()), kcore::waker(op, &woken));
    }

    std::thread waker([&]{
        while(l.wake_one()) { }
    });

    // unlink half concurrently with the waking thread
    for(int i=0; i<100; i+=2) {
        ws[i]->unlink();
    }

    waker.join();

    EXPECT_TRUE(l.empty());

    int removed_before_wake = 0;
    for(int i=0; i<100; ++i) {
        if(!ws[i]->woken()) { ++removed_before_wake; }
    }

    EXPECT_EQ(100, woken.load() + removed_before_wake);
}

namespace test {
namespace wait_list {

// holds its waker inside the call until released
struct gate {
    std::atomic<bool> entered{false};
    std::atomic<bool> released{false};

    static void op(void* ctx) {
        gate* g = static_cast<gate*>(ctx);
        g->entered = true;
        while(!g->released) { std::this_thread::yield(); }
    }
};

}
}

TEST(wait_list, drop_waits_for_wake_in_flight) {
    test::wait_list::gate g;
    kcore::wait_list l;
    std::unique_ptr<kcore::waiter> w(new kcore::waiter);
    std::atomic<bool> dropped{false};

    ASSERT_TRUE(l.push(*w, kcore::waker(&test::wait_list::gate::op, &g)));

    std::thread waker([&]{ EXPECT_TRUE(l.wake_one()); });
    while(!g.entered) { std::this_thread::yield(); }

    EXPECT_FALSE(w->linked());
    EXPECT_TRUE(w->woken());
    EXPECT_TRUE(w->waking());

    std::thread dropper([&]{
        w.reset();
        dropped = true;
    });

    // the waiter outlives the running wake
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(dropped);

    g.released = true;
    waker.join();
    dropper.join();
    EXPECT_TRUE(dropped);
}

TEST(wait_list, pop_one_leaves_delivery_to_caller) {
    test::wake_log wl;
    kcore::wait_list l;
    kcore::waiter w;

    l.push(w, wl.waker(1));
    auto wk = l.pop_one();
    ASSERT_TRUE(wk);
    EXPECT_TRUE(w.woken());
    EXPECT_FALSE(w.waking());

    wk->wake();
    ASSERT_EQ(1u, wl.log.size());
}
