//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "wait_list.hpp"
#include "task.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace executor {

// suspends on a wait list until `open` reads true
struct gate : public kcore::awaitable {
    gate(kcore::wait_list& l, std::atomic<bool>& open) : l_(l), open_(open) { }
    virtual ~gate() { }

    static inline std::string info_name() { return "test::executor::gate"; }
    inline std::string name() const { return gate::info_name(); }

    inline void await_resume() { }

protected:
    inline bool on_ready() { return open_.load(); }

    inline bool on_suspend(const kcore::waker& w) {
        park(l_, w);
        return !on_ready();
    }

private:
    kcore::wait_list& l_;
    std::atomic<bool>& open_;
};

template <typename T>
kcore::co<T> co_return_T(T t) {
    co_return t;
}

kcore::co<void> co_count_yields(int& counter, int count) {
    for(int i=0; i<count; ++i) {
        ++counter;
        co_await kcore::yield();
    }

    co_return;
}

kcore::co<void> co_log_twice(std::vector<std::string>& log, std::string id) {
    log.push_back(id);
    co_await kcore::yield();
    log.push_back(id);
    co_return;
}

kcore::co<void> co_throw() {
    co_await kcore::yield();
    throw std::runtime_error("task failure");
    co_return;
}

kcore::co<void> co_pass_gate(kcore::wait_list& l, std::atomic<bool>& open, int& passed) {
    co_await gate(l, open);
    ++passed;
    co_return;
}

kcore::co<int> co_yield_then_return(int v) {
    co_await kcore::yield();
    co_await kcore::yield();
    co_return v;
}

kcore::co<int> co_join_plus_one(kcore::join<int> j) {
    bool completed = co_await j.wait();
    co_return completed ? j.get() + 1 : -1;
}

kcore::co<bool> co_inside_task(kcore::task::id_type& id) {
    id = kcore::task::local().id();
    co_return kcore::task::in();
}

kcore::co<void> co_stop_after_gate(kcore::wait_list& l, std::atomic<bool>& open) {
    co_await gate(l, open);
    kcore::task::local().owner().stop();
    co_return;
}

template <typename T>
void spawn_tick_returns_T() {
    kcore::executor ex;
    auto j = ex.spawn(test::executor::co_return_T<T>(test::init<T>(3)));

    ASSERT_TRUE(j);
    EXPECT_FALSE(j.finished());
    EXPECT_EQ(1u, ex.task_count());
    EXPECT_EQ(1u, ex.queued_count());

    EXPECT_EQ(1u, ex.tick());
    EXPECT_TRUE(j.done());
    EXPECT_FALSE(j.cancelled());
    EXPECT_EQ((T)test::init<T>(3), j.get());
    EXPECT_EQ(0u, ex.task_count());
    EXPECT_EQ(0u, ex.queued_count());
}

}
}

TEST(executor, spawn_tick_returns_T) {
    test::executor::spawn_tick_returns_T<int>();
    test::executor::spawn_tick_returns_T<std::string>();
    test::executor::spawn_tick_returns_T<test::CustomObject>();
}

TEST(executor, spawn_null_coroutine) {
    kcore::executor ex;
    EXPECT_THROW(ex.spawn(kcore::co<void>()), kcore::executor::null_coroutine_exception);
    EXPECT_EQ(0u, ex.task_count());
}

TEST(executor, tick_polls_each_runnable_once) {
    kcore::executor ex;
    int c1 = 0;
    int c2 = 0;
    auto j1 = ex.spawn(test::executor::co_count_yields(c1, 3));
    auto j2 = ex.spawn(test::executor::co_count_yields(c2, 3));

    EXPECT_EQ(2u, ex.tick());
    EXPECT_EQ(1, c1);
    EXPECT_EQ(1, c2);

    EXPECT_EQ(2u, ex.tick());
    EXPECT_EQ(2, c1);
    EXPECT_EQ(2, c2);

    // third increment, then the final resume completes each task
    EXPECT_EQ(4u, ex.run_until_idle());
    EXPECT_EQ(3, c1);
    EXPECT_EQ(3, c2);
    EXPECT_TRUE(j1.done());
    EXPECT_TRUE(j2.done());
}

TEST(executor, yield_requeues_behind) {
    kcore::executor ex;
    std::vector<std::string> log;
    ex.spawn(test::executor::co_log_twice(log, "a"));
    ex.spawn(test::executor::co_log_twice(log, "b"));
    ex.run_until_idle();

    ASSERT_EQ(4u, log.size());
    EXPECT_EQ("a", log[0]);
    EXPECT_EQ("b", log[1]);
    EXPECT_EQ("a", log[2]);
    EXPECT_EQ("b", log[3]);
}

TEST(executor, exception_escapes_tick) {
    kcore::executor ex;
    auto j = ex.spawn(test::executor::co_throw());

    EXPECT_EQ(1u, ex.tick());
    EXPECT_THROW(ex.tick(), std::runtime_error);
    EXPECT_TRUE(j.cancelled());
    EXPECT_EQ(0u, ex.task_count());
}

TEST(executor, suspend_and_wake) {
    kcore::executor ex;
    kcore::wait_list l;
    std::atomic<bool> open{false};
    int passed = 0;
    auto j = ex.spawn(test::executor::co_pass_gate(l, open, passed));

    ex.run_until_idle();
    EXPECT_EQ(1u, l.size());
    EXPECT_EQ(0u, ex.queued_count());
    EXPECT_FALSE(j.finished());

    // a spurious wake only costs a retry
    EXPECT_TRUE(l.wake_one());
    EXPECT_EQ(1u, ex.queued_count());
    EXPECT_EQ(1u, ex.tick());
    EXPECT_EQ(1u, l.size());
    EXPECT_EQ(0, passed);

    open = true;
    EXPECT_TRUE(l.wake_one());
    ex.run_until_idle();
    EXPECT_EQ(1, passed);
    EXPECT_TRUE(j.done());
    EXPECT_EQ(0u, l.size());
}

TEST(executor, cancel_suspended_unlinks) {
    kcore::executor ex;
    kcore::wait_list l;
    std::atomic<bool> open{false};
    int passed = 0;
    auto j = ex.spawn(test::executor::co_pass_gate(l, open, passed));

    ex.run_until_idle();
    EXPECT_EQ(1u, l.size());

    EXPECT_TRUE(ex.cancel(j.id()));
    EXPECT_TRUE(j.cancelled());
    EXPECT_EQ(0u, l.size());
    EXPECT_EQ(0u, ex.task_count());
    EXPECT_FALSE(ex.cancel(j.id()));

    // nothing is left to wake
    EXPECT_EQ(0u, l.wake_all());
    EXPECT_EQ(0, passed);
}

TEST(executor, cancel_queued) {
    kcore::executor ex;
    int counter = 0;
    auto j = ex.spawn(test::executor::co_count_yields(counter, 1));

    EXPECT_EQ(1u, ex.queued_count());
    EXPECT_TRUE(ex.cancel(j.id()));
    EXPECT_EQ(0u, ex.queued_count());
    EXPECT_EQ(0u, ex.tick());
    EXPECT_EQ(0, counter);
    EXPECT_TRUE(j.cancelled());
}

TEST(executor, cancel_forwards_unconsumed_wake) {
    kcore::executor ex;
    kcore::wait_list l;
    std::atomic<bool> open{false};
    int passed = 0;
    auto j1 = ex.spawn(test::executor::co_pass_gate(l, open, passed));
    auto j2 = ex.spawn(test::executor::co_pass_gate(l, open, passed));

    ex.run_until_idle();
    EXPECT_EQ(2u, l.size());

    open = true;
    EXPECT_TRUE(l.wake_one());
    EXPECT_EQ(1u, ex.queued_count());

    // j1 consumed the wake, dropping it hands the wake to j2
    EXPECT_TRUE(ex.cancel(j1.id()));
    EXPECT_EQ(1u, ex.queued_count());
    EXPECT_EQ(0u, l.size());

    ex.run_until_idle();
    EXPECT_EQ(1, passed);
    EXPECT_TRUE(j1.cancelled());
    EXPECT_TRUE(j2.done());
}

TEST(executor, cancel_races_wake_from_other_thread) {
    for(int i=0; i<200; ++i) {
        kcore::executor ex;
        kcore::wait_list l;
        std::atomic<bool> open{false};
        int passed = 0;
        auto j = ex.spawn(test::executor::co_pass_gate(l, open, passed));

        ex.run_until_idle();
        ASSERT_EQ(1u, l.size());

        open = true;
        std::thread waker([&]{ l.wake_one(); });

        // the frame is only released once the wake has returned
        EXPECT_TRUE(ex.cancel(j.id()));
        waker.join();

        EXPECT_TRUE(j.cancelled());
        EXPECT_EQ(0u, ex.task_count());
        EXPECT_EQ(0u, ex.queued_count());
        EXPECT_EQ(0, passed);
    }
}

TEST(executor, join_wait) {
    kcore::executor ex;
    auto inner = ex.spawn(test::executor::co_yield_then_return(41));
    auto outer = ex.spawn(test::executor::co_join_plus_one(inner));

    ex.run_until_idle();
    ASSERT_TRUE(outer.done());
    EXPECT_EQ(42, outer.get());
}

TEST(executor, join_wait_cancelled) {
    kcore::executor ex;
    auto inner = ex.spawn(test::executor::co_yield_then_return(5));
    auto outer = ex.spawn(test::executor::co_join_plus_one(inner));

    // inner yielded, outer is suspended on the join
    EXPECT_EQ(2u, ex.tick());
    EXPECT_TRUE(ex.cancel(inner.id()));
    ex.run_until_idle();

    EXPECT_TRUE(inner.cancelled());
    ASSERT_TRUE(outer.done());
    EXPECT_EQ(-1, outer.get());
}

TEST(executor, task_local) {
    kcore::executor ex;
    kcore::task::id_type id = 0;
    auto j = ex.spawn(test::executor::co_inside_task(id));

    ex.run_until_idle();
    ASSERT_TRUE(j.done());
    EXPECT_TRUE(j.get());
    EXPECT_EQ(j.id(), id);
    EXPECT_FALSE(kcore::task::in());
}

TEST(executor, destructor_cancels_tasks) {
    kcore::wait_list l;
    std::atomic<bool> open{false};
    int passed = 0;
    kcore::join<void> j;

    {
        kcore::executor ex;
        j = ex.spawn(test::executor::co_pass_gate(l, open, passed));
        ex.run_until_idle();
        EXPECT_EQ(1u, l.size());
    }

    EXPECT_TRUE(j.cancelled());
    EXPECT_EQ(0u, l.size());
}

TEST(executor, run_idles_until_woken) {
    kcore::executor ex;
    kcore::wait_list l;
    std::atomic<bool> open{false};
    auto j = ex.spawn(test::executor::co_stop_after_gate(l, open));

    std::thread waker([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        open = true;
        l.wake_one();
    });

    ex.run();
    waker.join();

    EXPECT_TRUE(j.done());
    EXPECT_EQ(0u, ex.task_count());
}

TEST(executor, stop_before_run) {
    kcore::executor ex;
    int counter = 0;
    ex.spawn(test::executor::co_count_yields(counter, 2));
    ex.stop();
    ex.run();

    // one tick ran before the stop was observed
    EXPECT_EQ(1, counter);
    EXPECT_EQ(1u, ex.task_count());
}
