//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <string>
#include <stdexcept>
#include <coroutine>

#include "coroutine.hpp"
#include "task.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace coroutine {

template <typename T>
kcore::co<T> co_return_T(T t) {
    co_return t;
}

kcore::co<void> co_throw() {
    throw std::runtime_error("coroutine failure");
    co_return;
}

struct destruct_flag {
    destruct_flag(bool& b) : b_(b) { }
    ~destruct_flag() { b_ = true; }
    bool& b_;
};

kcore::co<void> co_hold_flag(bool& destroyed) {
    destruct_flag f(destroyed);
    co_await std::suspend_always{};
    co_return;
}

kcore::co<void> co_yield_once() {
    co_await kcore::yield();
    co_return;
}

template <typename T>
void resume_returns_T() {
    kcore::co<T> c = co_return_T<T>(test::init<T>(3));
    ASSERT_TRUE(c);
    EXPECT_FALSE(c.done());

    c.resume();
    EXPECT_TRUE(c.done());

    auto& p = kcore::get_promise(c);
    ASSERT_TRUE(p.result);
    EXPECT_EQ((T)test::init<T>(3), *(p.result));
}

}
}

TEST(coroutine, resume_returns_T) {
    test::coroutine::resume_returns_T<int>();
    test::coroutine::resume_returns_T<std::string>();
    test::coroutine::resume_returns_T<test::CustomObject>();
}

TEST(coroutine, move_transfers_handle) {
    kcore::co<int> c1 = test::coroutine::co_return_T<int>(1);
    void* addr = c1.address();

    kcore::co<int> c2(std::move(c1));
    EXPECT_FALSE(c1);
    ASSERT_TRUE(c2);
    EXPECT_EQ(addr, c2.address());

    kcore::co<int> c3;
    EXPECT_FALSE(c3);
    c3 = std::move(c2);
    EXPECT_EQ(addr, c3.address());
}

TEST(coroutine, exception_rethrown_by_resume) {
    kcore::co<void> c = test::coroutine::co_throw();
    EXPECT_THROW(c.resume(), std::runtime_error);
    EXPECT_TRUE(c.done());
}

TEST(coroutine, reset_destroys_frame) {
    bool destroyed = false;
    kcore::co<void> c = test::coroutine::co_hold_flag(destroyed);
    c.resume();
    EXPECT_FALSE(c.done());
    EXPECT_FALSE(destroyed);
    c.reset();
    EXPECT_TRUE(destroyed);
    EXPECT_FALSE(c);
}

TEST(coroutine, await_outside_task_throws) {
    EXPECT_FALSE(kcore::task::in());

    kcore::co<void> c = test::coroutine::co_yield_once();
    EXPECT_THROW(c.resume(), kcore::awaitable_outside_task);
    EXPECT_TRUE(c.done());
}
