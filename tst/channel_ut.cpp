//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "channel.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace channel {

const kcore::channel::shape shapes[] = {
    kcore::channel::shape::spsc,
    kcore::channel::shape::mpsc
};

template <typename T>
kcore::co<void> co_recv(kcore::consumer<T>& rx, T& out, kcore::channel::result& r) {
    r = co_await rx.recv(out);
    co_return;
}

template <typename T>
kcore::co<void> co_send(kcore::producer<T> tx, T t, kcore::channel::result& r) {
    r = co_await tx.send(std::move(t));
    co_return;
}

template <typename T>
kcore::co<std::size_t> co_recv_all(kcore::consumer<T> rx, std::vector<T>& out) {
    T t;

    while(co_await rx.recv(t) == kcore::channel::success) {
        out.push_back(std::move(t));
    }

    co_return out.size();
}

template <typename T>
void full_at_capacity_T(kcore::channel::shape s) {
    auto [tx, rx] = kcore::channel::make<T>(4, s);
    EXPECT_EQ(4u, tx.capacity());
    EXPECT_EQ(0u, rx.used());

    for(int i=0; i<4; ++i) {
        EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(i)));
        EXPECT_EQ((std::size_t)(i + 1), tx.used());
    }

    T extra = test::init<T>(4);
    EXPECT_EQ(kcore::channel::full, tx.try_send(std::move(extra)));
    EXPECT_EQ((T)test::init<T>(4), extra);
    EXPECT_EQ(4u, rx.used());

    T t;

    for(int i=0; i<4; ++i) {
        EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
        EXPECT_EQ((T)test::init<T>(i), t);
    }

    EXPECT_EQ(kcore::channel::empty, rx.try_recv(t));
    EXPECT_EQ(0u, rx.used());
}

template <typename T>
void wraps_around_T(kcore::channel::shape s) {
    auto [tx, rx] = kcore::channel::make<T>(2, s);
    T t;

    for(int i=0; i<10; ++i) {
        EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(i)));
        EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(i + 100)));
        EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
        EXPECT_EQ((T)test::init<T>(i), t);
        EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
        EXPECT_EQ((T)test::init<T>(i + 100), t);
    }
}

template <typename T>
void close_drains_T(kcore::channel::shape s) {
    auto [tx, rx] = kcore::channel::make<T>(4, s);
    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(1)));
    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(2)));

    tx.close();
    EXPECT_TRUE(rx.closed());
    EXPECT_EQ(kcore::channel::closed, tx.try_send((T)test::init<T>(3)));

    // queued messages outlive the close
    T t;
    EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
    EXPECT_EQ((T)test::init<T>(1), t);
    EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
    EXPECT_EQ((T)test::init<T>(2), t);
    EXPECT_EQ(kcore::channel::closed, rx.try_recv(t));

    // idempotent
    rx.close();
    EXPECT_EQ(kcore::channel::closed, rx.try_recv(t));
}

template <typename T>
void closed_empty_channel_T(kcore::channel::shape s) {
    std::shared_ptr<kcore::channel::interface<T>> ch;

    if(s == kcore::channel::shape::mpsc) {
        ch = std::make_shared<kcore::channel::mpsc<T>>(2);
    } else {
        ch = std::make_shared<kcore::channel::spsc<T>>(2);
    }

    T t;
    EXPECT_EQ(kcore::channel::empty, ch->try_recv(t));

    ch->close();
    EXPECT_TRUE(ch->closed());

    T moved = test::init<T>(1);
    const T copied = test::init<T>(2);
    EXPECT_EQ(kcore::channel::closed, ch->try_send(std::move(moved)));
    EXPECT_EQ(kcore::channel::closed, ch->try_send(copied));
    EXPECT_EQ(kcore::channel::closed, ch->try_recv(t));
    EXPECT_EQ(0u, ch->used());

    // a refused message is left untouched
    EXPECT_EQ((T)test::init<T>(1), moved);
}

template <typename T>
void recv_suspends_until_send_T(kcore::channel::shape s) {
    kcore::executor ex;
    auto [tx, rx] = kcore::channel::make<T>(2, s);
    T out;
    kcore::channel::result r = kcore::channel::empty;

    auto j = ex.spawn(test::channel::co_recv<T>(rx, out, r));
    ex.run_until_idle();
    EXPECT_FALSE(j.finished());
    EXPECT_EQ(0u, ex.queued_count());

    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(7)));
    EXPECT_EQ(1u, ex.queued_count());

    ex.run_until_idle();
    EXPECT_TRUE(j.done());
    EXPECT_EQ(kcore::channel::success, r);
    EXPECT_EQ((T)test::init<T>(7), out);
}

template <typename T>
void send_suspends_until_recv_T(kcore::channel::shape s) {
    kcore::executor ex;
    auto [tx, rx] = kcore::channel::make<T>(2, s);
    kcore::channel::result r = kcore::channel::full;

    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(1)));
    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(2)));

    auto j = ex.spawn(test::channel::co_send<T>(tx, (T)test::init<T>(3), r));
    ex.run_until_idle();
    EXPECT_FALSE(j.finished());

    T t;
    EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
    EXPECT_EQ((T)test::init<T>(1), t);
    EXPECT_EQ(1u, ex.queued_count());

    ex.run_until_idle();
    EXPECT_TRUE(j.done());
    EXPECT_EQ(kcore::channel::success, r);

    EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
    EXPECT_EQ((T)test::init<T>(2), t);
    EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
    EXPECT_EQ((T)test::init<T>(3), t);
}

template <typename T>
void last_producer_dropped_wakes_receiver_T(kcore::channel::shape s) {
    kcore::executor ex;
    auto [tx, rx] = kcore::channel::make<T>(2, s);
    T out;
    kcore::channel::result r = kcore::channel::empty;

    auto j = ex.spawn(test::channel::co_recv<T>(rx, out, r));
    ex.run_until_idle();

    kcore::producer<T> clone = tx;
    EXPECT_TRUE(clone.same_channel(tx));

    tx.reset();
    EXPECT_FALSE(rx.closed());
    EXPECT_EQ(0u, ex.queued_count());

    clone.reset();
    EXPECT_TRUE(rx.closed());
    EXPECT_EQ(1u, ex.queued_count());

    ex.run_until_idle();
    EXPECT_TRUE(j.done());
    EXPECT_EQ(kcore::channel::closed, r);
}

template <typename T>
void consumer_dropped_wakes_sender_T(kcore::channel::shape s) {
    kcore::executor ex;
    auto [tx, rx] = kcore::channel::make<T>(2, s);
    kcore::channel::result r = kcore::channel::full;

    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(1)));
    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(2)));

    auto j = ex.spawn(test::channel::co_send<T>(tx, (T)test::init<T>(3), r));
    ex.run_until_idle();
    EXPECT_FALSE(j.finished());

    rx.reset();
    EXPECT_TRUE(tx.closed());

    ex.run_until_idle();
    EXPECT_TRUE(j.done());
    EXPECT_EQ(kcore::channel::closed, r);
    EXPECT_EQ(kcore::channel::closed, tx.try_send((T)test::init<T>(4)));
}

template <typename T>
void recv_all_until_closed_T(kcore::channel::shape s) {
    kcore::executor ex;
    auto [tx, rx] = kcore::channel::make<T>(4, s);
    std::vector<T> out;

    auto j = ex.spawn(test::channel::co_recv_all<T>(std::move(rx), out));

    for(int i=0; i<3; ++i) {
        EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(i)));
    }

    tx.reset();
    ex.run_until_idle();

    ASSERT_TRUE(j.done());
    ASSERT_EQ(3u, j.get());

    for(int i=0; i<3; ++i) {
        EXPECT_EQ((T)test::init<T>(i), out[i]);
    }
}

template <typename T>
void cancel_suspended_recv_T(kcore::channel::shape s) {
    kcore::executor ex;
    auto [tx, rx] = kcore::channel::make<T>(2, s);
    T out;
    kcore::channel::result r = kcore::channel::empty;

    auto j = ex.spawn(test::channel::co_recv<T>(rx, out, r));
    ex.run_until_idle();

    EXPECT_TRUE(ex.cancel(j.id()));
    EXPECT_TRUE(j.cancelled());

    // no waiter is left for the send to wake
    EXPECT_EQ(kcore::channel::success, tx.try_send((T)test::init<T>(5)));
    EXPECT_EQ(0u, ex.queued_count());
    EXPECT_EQ(kcore::channel::empty, r);

    T t;
    EXPECT_EQ(kcore::channel::success, rx.try_recv(t));
    EXPECT_EQ((T)test::init<T>(5), t);
}

}
}

#define KCORE_CHANNEL_TEST_ALL_T(fn) \
    for(auto s : test::channel::shapes) { \
        test::channel::fn<int>(s); \
        test::channel::fn<std::string>(s); \
        test::channel::fn<test::CustomObject>(s); \
    }

TEST(channel, full_at_capacity) {
    KCORE_CHANNEL_TEST_ALL_T(full_at_capacity_T)
}

TEST(channel, wraps_around) {
    KCORE_CHANNEL_TEST_ALL_T(wraps_around_T)
}

TEST(channel, close_drains) {
    KCORE_CHANNEL_TEST_ALL_T(close_drains_T)
}

TEST(channel, closed_empty_channel) {
    KCORE_CHANNEL_TEST_ALL_T(closed_empty_channel_T)
}

TEST(channel, recv_suspends_until_send) {
    KCORE_CHANNEL_TEST_ALL_T(recv_suspends_until_send_T)
}

TEST(channel, send_suspends_until_recv) {
    KCORE_CHANNEL_TEST_ALL_T(send_suspends_until_recv_T)
}

TEST(channel, last_producer_dropped_wakes_receiver) {
    KCORE_CHANNEL_TEST_ALL_T(last_producer_dropped_wakes_receiver_T)
}

TEST(channel, consumer_dropped_wakes_sender) {
    KCORE_CHANNEL_TEST_ALL_T(consumer_dropped_wakes_sender_T)
}

TEST(channel, recv_all_until_closed) {
    KCORE_CHANNEL_TEST_ALL_T(recv_all_until_closed_T)
}

TEST(channel, cancel_suspended_recv) {
    KCORE_CHANNEL_TEST_ALL_T(cancel_suspended_recv_T)
}

TEST(channel, invalid_capacity) {
    EXPECT_THROW(kcore::channel::make<int>(0, kcore::channel::shape::spsc),
                 kcore::invalid_capacity);
    EXPECT_THROW(kcore::channel::make<int>(0, kcore::channel::shape::mpsc),
                 kcore::invalid_capacity);
    EXPECT_THROW(kcore::channel::make<int>(1, kcore::channel::shape::mpsc),
                 kcore::invalid_capacity);
    EXPECT_THROW(kcore::channel::make<int>(6, kcore::channel::shape::mpsc),
                 kcore::invalid_capacity);

    // any non-zero capacity is a valid spsc ring
    auto [tx, rx] = kcore::channel::make<int>(3, kcore::channel::shape::spsc);
    EXPECT_EQ(3u, rx.capacity());
}

TEST(channel, default_capacity) {
    auto [tx, rx] = kcore::channel::make<int>();
    EXPECT_EQ(kcore::config::channel::default_capacity(), tx.capacity());
}

TEST(channel, mpsc_claim_order) {
    auto [tx1, rx] = kcore::channel::make<std::string>(4, kcore::channel::shape::mpsc);
    kcore::producer<std::string> tx2 = tx1;

    EXPECT_EQ(kcore::channel::success, tx1.try_send(std::string("a")));
    EXPECT_EQ(kcore::channel::success, tx2.try_send(std::string("b")));
    EXPECT_EQ(kcore::channel::success, tx1.try_send(std::string("c")));

    std::string s;
    EXPECT_EQ(kcore::channel::success, rx.try_recv(s));
    EXPECT_EQ("a", s);
    EXPECT_EQ(kcore::channel::success, rx.try_recv(s));
    EXPECT_EQ("b", s);
    EXPECT_EQ(kcore::channel::success, rx.try_recv(s));
    EXPECT_EQ("c", s);
}

TEST(channel, threaded_producers_preserve_per_producer_order) {
    const int producer_count = 4;
    const int per_producer = 2000;

    for(auto s : test::channel::shapes) {
        auto [tx, rx] = kcore::channel::make<int>(8, s);
        std::vector<std::thread> threads;

        for(int p=0; p<producer_count; ++p) {
            threads.emplace_back([p, tx = tx]() mutable {
                for(int i=0; i<per_producer; ++i) {
                    while(tx.try_send(p * per_producer + i) == kcore::channel::full) {
                        std::this_thread::yield();
                    }
                }
            });
        }

        // the threads hold their own clones
        tx.reset();

        std::vector<int> last(producer_count, -1);
        int received = 0;
        int v;

        while(true) {
            auto r = rx.try_recv(v);

            if(r == kcore::channel::success) {
                int p = v / per_producer;
                int i = v % per_producer;
                EXPECT_EQ(last[p] + 1, i);
                last[p] = i;
                ++received;
            } else if(r == kcore::channel::closed) {
                break;
            } else {
                std::this_thread::yield();
            }
        }

        for(auto& th : threads) { th.join(); }

        EXPECT_EQ(producer_count * per_producer, received);
    }
}
