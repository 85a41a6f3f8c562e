//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "kcore.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace kernel {

struct pingpong {
    typedef std::string request_type;
    typedef kcore::array<char> response_type;
    static kcore::service_id id() { return "pingpong"; }
};

struct reverse {
    typedef std::string request_type;
    typedef std::string response_type;
    static kcore::service_id id() { return "reverse"; }
};

// registers itself, then answers every request with "pong" in kernel memory
kcore::co<void> co_pong_driver(kcore::kernel& k) {
    auto [tx, rx] = k.make_channel<kcore::message<pingpong>>(1);

    if(k.register_service<pingpong>(std::move(tx)) != kcore::registry::success) {
        co_return;
    }

    kcore::message<pingpong> m;

    while(co_await rx.recv(m) == kcore::channel::success) {
        kcore::array<char> pong = co_await kcore::array<char>::make(k.heap(), 4);
        const std::string text("pong");
        std::copy(text.begin(), text.end(), pong.begin());
        EXPECT_EQ(kcore::channel::success, m.reply.reply(std::move(pong)));
    }

    co_return;
}

kcore::co<std::string> co_ping(kcore::kernel& k, std::size_t& free_while_held) {
    auto service = k.get_service<pingpong>();
    if(!service) { co_return std::string(); }

    kcore::oneshot<kcore::array<char>> reply;
    kcore::oneshot_sender<kcore::array<char>> tx;
    if(reply.sender(tx) != kcore::oneshot_result::success) { co_return std::string(); }

    kcore::message<pingpong> m{ "ping", kcore::reply_to<kcore::array<char>>(std::move(tx)) };

    if(co_await service->send(std::move(m)) != kcore::channel::success) {
        co_return std::string();
    }

    kcore::array<char> pong;

    if(co_await reply.receive(pong) != kcore::oneshot_result::success) {
        co_return std::string();
    }

    free_while_held = k.heap().stats().free_bytes();
    co_return std::string(pong.begin(), pong.end());
}

kcore::co<void> co_reverse_driver(kcore::consumer<kcore::message<reverse>> rx) {
    kcore::message<reverse> m;

    while(co_await rx.recv(m) == kcore::channel::success) {
        EXPECT_EQ(kcore::channel::success,
                  m.reply.reply(std::string(m.request.rbegin(), m.request.rend())));
    }

    co_return;
}

kcore::co<void> co_yield_then_stop(kcore::kernel& k, int& polls) {
    ++polls;
    co_await kcore::yield();
    ++polls;
    k.stop();
    co_return;
}

kcore::co<void> co_alloc_then_stop(kcore::kernel& k, std::size_t size, std::atomic<bool>& done) {
    kcore::allocation m = co_await k.heap().alloc(size, 8);
    done = (bool)m;
    k.stop();
    co_return;
}

// sleep until `ready()` or the deadline passes
template <typename F>
bool wait_until(F&& ready) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    while(!ready()) {
        if(std::chrono::steady_clock::now() > deadline) { return false; }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    return true;
}

}
}

TEST(kernel, settings_defaults) {
    kcore::kernel::settings s;
    EXPECT_EQ(nullptr, s.heap_start);
    EXPECT_EQ(kcore::config::kernel::heap_size(), s.heap_size);
    EXPECT_EQ(kcore::config::channel::default_capacity(), s.default_capacity);
    EXPECT_EQ(kcore::config::registry::max_services(), s.max_services);
    EXPECT_EQ(kcore::config::logging::default_log_level(), s.log_level);

    kcore::kernel k;
    const std::size_t block = kcore::config::heap::block_size();
    auto stats = k.heap().stats();

    // an owned arena loses at most its unaligned edges
    EXPECT_LE(stats.total_bytes, s.heap_size);
    EXPECT_GE(stats.total_bytes + block, s.heap_size);
    EXPECT_EQ(0u, stats.allocated_bytes);
    EXPECT_EQ(0u, k.services().size());
    EXPECT_EQ(s.max_services, k.services().max_services());
    EXPECT_EQ(0u, k.tasks().task_count());
}

TEST(kernel, external_arena) {
    alignas(64) static std::uint8_t arena[4096];
    kcore::kernel::settings s;
    s.heap_start = arena;
    s.heap_size = sizeof(arena);
    s.default_capacity = 8;
    s.max_services = 1;

    kcore::kernel k(s);
    std::uint8_t* base = arena;
    EXPECT_EQ((void*)base, k.get_settings().heap_start);
    EXPECT_EQ(sizeof(arena), k.heap().stats().total_bytes);
    EXPECT_EQ(1u, k.services().max_services());

    kcore::allocation m = k.heap().try_alloc(16, 8);
    ASSERT_TRUE(m);
    EXPECT_TRUE(k.heap().contains(m.data()));
    EXPECT_GE(m.bytes(), base);
    EXPECT_LT(m.bytes(), base + sizeof(arena));

    auto [tx, rx] = k.make_channel<int>();
    EXPECT_EQ(8u, tx.capacity());

    auto [mtx, mrx] = k.make_channel<int>(4, kcore::channel::shape::mpsc);
    EXPECT_EQ(4u, mtx.capacity());
}

TEST(kernel, duplicate_registration_throws) {
    kcore::kernel k;
    auto [tx1, rx1] = k.make_channel<kcore::message<test::kernel::reverse>>(1);
    auto [tx2, rx2] = k.make_channel<kcore::message<test::kernel::reverse>>(1);

    EXPECT_EQ(kcore::registry::success, k.register_service<test::kernel::reverse>(tx1));
    EXPECT_THROW(k.register_service<test::kernel::reverse>(tx2),
                 kcore::service_already_registered);
    EXPECT_THROW(k.register_userspace_service<test::kernel::reverse>(tx2),
                 kcore::service_already_registered);

    auto got = k.get_service<test::kernel::reverse>();
    ASSERT_TRUE(got);
    EXPECT_TRUE(got->same_channel(tx1));
}

TEST(kernel, full_registry_reports_full) {
    kcore::kernel::settings s;
    s.max_services = 0;
    kcore::kernel k(s);
    auto [tx, rx] = k.make_channel<kcore::message<test::kernel::reverse>>(1);

    EXPECT_EQ(kcore::registry::full, k.register_service<test::kernel::reverse>(tx));
    EXPECT_FALSE(k.get_service<test::kernel::reverse>());
}

TEST(kernel, ping_pong_through_registry) {
    kcore::kernel k;
    const std::size_t free_before = k.heap().stats().free_bytes();
    std::size_t free_while_held = 0;

    k.spawn(test::kernel::co_pong_driver(k));
    auto ping = k.spawn(test::kernel::co_ping(k, free_while_held));

    k.run_until_idle();

    ASSERT_TRUE(ping.done());
    EXPECT_EQ("pong", ping.get());

    // the reply lived in kernel memory until the requester dropped it
    EXPECT_EQ(free_before - kcore::heap::rounded(4), free_while_held);
    EXPECT_EQ(free_before, k.heap().stats().free_bytes());
    EXPECT_EQ(1u, k.heap().stats().alloc_success_count);
    EXPECT_EQ(1u, k.heap().stats().dealloc_count);

    // the driver stays parked on its empty channel
    EXPECT_EQ(1u, k.tasks().task_count());
}

TEST(kernel, userspace_request) {
    auto [out_tx, out_rx] = kcore::channel::make<kcore::user_response>(4);
    kcore::channel_sink sink(out_tx);
    kcore::kernel k;

    {
        auto [tx, rx] = k.make_channel<kcore::message<test::kernel::reverse>>(2);
        ASSERT_EQ(kcore::registry::success,
                  k.register_userspace_service<test::kernel::reverse>(std::move(tx)));
        k.spawn(test::kernel::co_reverse_driver(std::move(rx)));
    }

    auto handle = k.get_userspace_service("reverse");
    ASSERT_TRUE(handle);
    EXPECT_FALSE(k.get_userspace_service("missing"));

    kcore::user_request req{ "reverse", 42, kcore::codec<std::string>::encode("abc") };
    ASSERT_EQ(kcore::registry::userspace_handle::success, handle->process(std::move(req), sink));

    k.run_until_idle();

    kcore::user_response resp;
    ASSERT_EQ(kcore::channel::success, out_rx.try_recv(resp));
    EXPECT_EQ("reverse", resp.id);
    EXPECT_EQ(42u, resp.nonce);
    EXPECT_TRUE(resp.ok);

    std::string decoded;
    ASSERT_TRUE(kcore::codec<std::string>::decode(resp.bytes, decoded));
    EXPECT_EQ("cba", decoded);
}

TEST(kernel, run_until_stopped) {
    kcore::kernel k;
    int polls = 0;
    auto j = k.spawn(test::kernel::co_yield_then_stop(k, polls));

    k.run();

    EXPECT_TRUE(j.done());
    EXPECT_EQ(2, polls);
}

TEST(kernel, destruction_cancels_drivers) {
    kcore::join<void> driver;
    kcore::producer<kcore::message<test::kernel::reverse>> service;

    {
        kcore::kernel k;
        auto [tx, rx] = k.make_channel<kcore::message<test::kernel::reverse>>(2);
        service = tx;
        driver = k.spawn(test::kernel::co_reverse_driver(std::move(rx)));
        k.run_until_idle();
        EXPECT_FALSE(driver.finished());
    }

    // the driver's consumer went with it
    EXPECT_TRUE(driver.cancelled());
    EXPECT_TRUE(service.closed());
}

TEST(kernel, deferred_free_resumes_parked_kernel) {
    alignas(64) static std::uint8_t arena[64];
    kcore::kernel::settings s;
    s.heap_start = arena;
    s.heap_size = sizeof(arena);
    kcore::kernel k(s);

    kcore::allocation held = k.heap().try_alloc(64, 8);
    ASSERT_TRUE(held);

    std::atomic<bool> done{false};
    auto j = k.spawn(test::kernel::co_alloc_then_stop(k, 32, done));
    std::thread runner([&]{ k.run(); });

    EXPECT_TRUE(test::kernel::wait_until([&]{ return k.heap().waiting() == 1; }));

    {
        // the free is queued instead of returned while the arena is locked
        auto cs = k.heap().critical_section();
        held.reset();
    }

    EXPECT_TRUE(test::kernel::wait_until([&]{ return done.load(); }));

    if(!done) { k.stop(); }
    runner.join();

    EXPECT_TRUE(done);
    EXPECT_TRUE(j.done());

    auto stats = k.heap().stats();
    EXPECT_EQ(1u, stats.deferred_free_count);
    EXPECT_EQ(0u, stats.allocated_bytes);
}
