//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <chrono>
#include <string>
#include <thread>

#include "oneshot.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace oneshot {

template <typename T>
kcore::co<void> co_receive(kcore::oneshot<T>& o, T& out, kcore::oneshot_result::status& st) {
    st = co_await o.receive(out);
    co_return;
}

kcore::co<void> co_receive_then_stop(kcore::oneshot<int>& o, int& out) {
    co_await o.receive(out);
    kcore::task::local().owner().stop();
    co_return;
}

template <typename T>
void round_trip_T() {
    kcore::oneshot<T> o;
    kcore::oneshot_sender<T> tx;
    T v;

    EXPECT_FALSE(o.active());
    EXPECT_EQ(kcore::oneshot<T>::no_sender_active, o.try_receive(v));

    ASSERT_EQ(kcore::oneshot<T>::success, o.sender(tx));
    EXPECT_TRUE(tx);
    EXPECT_TRUE(o.active());
    EXPECT_EQ(kcore::oneshot<T>::empty, o.try_receive(v));

    EXPECT_EQ(kcore::oneshot<T>::success, tx.send((T)test::init<T>(5)));
    EXPECT_FALSE(tx);

    EXPECT_EQ(kcore::oneshot<T>::success, o.try_receive(v));
    EXPECT_EQ((T)test::init<T>(5), v);
    EXPECT_FALSE(o.active());

    // the cell is reusable once the outcome was received
    ASSERT_EQ(kcore::oneshot<T>::success, o.sender(tx));
    EXPECT_EQ(kcore::oneshot<T>::success, tx.send((T)test::init<T>(6)));
    EXPECT_EQ(kcore::oneshot<T>::success, o.try_receive(v));
    EXPECT_EQ((T)test::init<T>(6), v);
}

template <typename T>
void receive_suspends_T() {
    kcore::executor ex;
    kcore::oneshot<T> o;
    kcore::oneshot_sender<T> tx;
    T out;
    kcore::oneshot_result::status st = kcore::oneshot_result::empty;

    ASSERT_EQ(kcore::oneshot<T>::success, o.sender(tx));
    auto j = ex.spawn(test::oneshot::co_receive<T>(o, out, st));

    ex.run_until_idle();
    EXPECT_FALSE(j.finished());

    EXPECT_EQ(kcore::oneshot<T>::success, tx.send((T)test::init<T>(9)));
    EXPECT_EQ(1u, ex.queued_count());

    ex.run_until_idle();
    EXPECT_TRUE(j.done());
    EXPECT_EQ(kcore::oneshot_result::success, st);
    EXPECT_EQ((T)test::init<T>(9), out);
}

}
}

TEST(oneshot, round_trip) {
    test::oneshot::round_trip_T<int>();
    test::oneshot::round_trip_T<std::string>();
    test::oneshot::round_trip_T<test::CustomObject>();
}

TEST(oneshot, receive_suspends) {
    test::oneshot::receive_suspends_T<int>();
    test::oneshot::receive_suspends_T<std::string>();
    test::oneshot::receive_suspends_T<test::CustomObject>();
}

TEST(oneshot, second_sender_refused) {
    kcore::oneshot<int> o;
    kcore::oneshot_sender<int> tx1;
    kcore::oneshot_sender<int> tx2;

    EXPECT_EQ(kcore::oneshot<int>::success, o.sender(tx1));
    EXPECT_EQ(kcore::oneshot<int>::sender_already_active, o.sender(tx2));
    EXPECT_FALSE(tx2);
    EXPECT_EQ(kcore::oneshot<int>::no_sender_active, tx2.send(1));

    // a delivered but unclaimed value keeps the round open
    EXPECT_EQ(kcore::oneshot<int>::success, tx1.send(2));
    EXPECT_EQ(kcore::oneshot<int>::sender_already_active, o.sender(tx2));
}

TEST(oneshot, dropped_sender_closes_round) {
    kcore::oneshot<int> o;
    int v = 0;

    {
        kcore::oneshot_sender<int> tx;
        ASSERT_EQ(kcore::oneshot<int>::success, o.sender(tx));
    }

    EXPECT_EQ(kcore::oneshot<int>::channel_closed, o.try_receive(v));
    EXPECT_FALSE(o.active());

    kcore::oneshot_sender<int> tx;
    EXPECT_EQ(kcore::oneshot<int>::success, o.sender(tx));
}

TEST(oneshot, moved_sender_delivers) {
    kcore::oneshot<int> o;
    kcore::oneshot_sender<int> tx;
    ASSERT_EQ(kcore::oneshot<int>::success, o.sender(tx));

    kcore::oneshot_sender<int> moved(std::move(tx));
    EXPECT_FALSE(tx);

    // dropping the moved-from husk does not close the round
    tx.reset();
    EXPECT_EQ(kcore::oneshot<int>::success, moved.send(3));

    int v = 0;
    EXPECT_EQ(kcore::oneshot<int>::success, o.try_receive(v));
    EXPECT_EQ(3, v);
}

TEST(oneshot, dropped_sender_wakes_receiver) {
    kcore::executor ex;
    kcore::oneshot<int> o;
    kcore::oneshot_sender<int> tx;
    int out = 0;
    kcore::oneshot_result::status st = kcore::oneshot_result::empty;

    ASSERT_EQ(kcore::oneshot<int>::success, o.sender(tx));
    auto j = ex.spawn(test::oneshot::co_receive<int>(o, out, st));
    ex.run_until_idle();

    tx.reset();
    ex.run_until_idle();

    EXPECT_TRUE(j.done());
    EXPECT_EQ(kcore::oneshot_result::channel_closed, st);
}

TEST(oneshot, receive_without_sender) {
    kcore::executor ex;
    kcore::oneshot<int> o;
    int out = 0;
    kcore::oneshot_result::status st = kcore::oneshot_result::empty;

    auto j = ex.spawn(test::oneshot::co_receive<int>(o, out, st));
    EXPECT_EQ(1u, ex.tick());

    EXPECT_TRUE(j.done());
    EXPECT_EQ(kcore::oneshot_result::no_sender_active, st);
}

TEST(oneshot, dropped_receive_abandons_round) {
    kcore::executor ex;
    kcore::oneshot<int> o;
    kcore::oneshot_sender<int> stale;
    int out = 0;
    kcore::oneshot_result::status st = kcore::oneshot_result::empty;

    ASSERT_EQ(kcore::oneshot<int>::success, o.sender(stale));
    auto j = ex.spawn(test::oneshot::co_receive<int>(o, out, st));
    ex.run_until_idle();
    EXPECT_TRUE(o.active());

    EXPECT_TRUE(ex.cancel(j.id()));
    EXPECT_FALSE(o.active());

    // the late reply is discarded rather than left for the next round
    EXPECT_EQ(kcore::oneshot<int>::channel_closed, stale.send(1));

    kcore::oneshot_sender<int> fresh;
    ASSERT_EQ(kcore::oneshot<int>::success, o.sender(fresh));
    EXPECT_EQ(kcore::oneshot<int>::empty, o.try_receive(out));
    EXPECT_EQ(kcore::oneshot<int>::success, fresh.send(2));
    EXPECT_EQ(kcore::oneshot<int>::success, o.try_receive(out));
    EXPECT_EQ(2, out);
}

TEST(oneshot, dropped_owner_invalidates_sender) {
    kcore::oneshot_sender<int> tx;

    {
        kcore::oneshot<int> o;
        ASSERT_EQ(kcore::oneshot<int>::success, o.sender(tx));
    }

    EXPECT_TRUE(tx);
    EXPECT_EQ(kcore::oneshot<int>::channel_closed, tx.send(1));
}

TEST(oneshot, send_from_other_thread) {
    kcore::executor ex;
    kcore::oneshot<int> o;
    kcore::oneshot_sender<int> tx;
    int out = 0;

    ASSERT_EQ(kcore::oneshot<int>::success, o.sender(tx));
    auto j = ex.spawn(test::oneshot::co_receive_then_stop(o, out));

    std::thread sender([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_EQ(kcore::oneshot<int>::success, tx.send(11));
    });

    ex.run();
    sender.join();

    EXPECT_TRUE(j.done());
    EXPECT_EQ(11, out);
}
