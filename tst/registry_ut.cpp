//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <cstdint>
#include <string>
#include <vector>

#include "channel.hpp"
#include "oneshot.hpp"
#include "registry.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace registry {

struct ping {
    typedef int request_type;
    typedef int response_type;
    static kcore::service_id id() { return "ping"; }
};

// same id and types as `ping`
struct ping_alias {
    typedef int request_type;
    typedef int response_type;
    static kcore::service_id id() { return "ping"; }
};

// same id as `ping`, different response type
struct ping_mismatch {
    typedef int request_type;
    typedef std::string response_type;
    static kcore::service_id id() { return "ping"; }
};

struct echo {
    typedef std::string request_type;
    typedef std::string response_type;
    static kcore::service_id id() { return "echo"; }
};

template <int N>
struct numbered {
    typedef int request_type;
    typedef int response_type;
    static kcore::service_id id() { return std::string("svc") + std::to_string(N); }
};

inline kcore::user_request echo_request(std::uint64_t nonce, const std::string& s) {
    return kcore::user_request{ echo::id(), nonce, kcore::codec<std::string>::encode(s) };
}

}
}

TEST(registry, set_and_get) {
    kcore::registry r;
    auto [tx, rx] = kcore::channel::make<kcore::message<test::registry::ping>>(4);

    EXPECT_EQ(kcore::registry::success, r.set_konly<test::registry::ping>(tx));
    EXPECT_TRUE(r.contains("ping"));
    EXPECT_EQ(1u, r.size());

    auto got = r.get<test::registry::ping>();
    ASSERT_TRUE(got);
    EXPECT_TRUE(got->same_channel(tx));

    // a message through the looked up handle arrives at the service
    kcore::message<test::registry::ping> m{ 5, {} };
    EXPECT_EQ(kcore::channel::success, got->try_send(std::move(m)));

    kcore::message<test::registry::ping> in;
    EXPECT_EQ(kcore::channel::success, rx.try_recv(in));
    EXPECT_EQ(5, in.request);
    EXPECT_FALSE(in.reply);
}

TEST(registry, duplicate_id) {
    kcore::registry r;
    auto [tx1, rx1] = kcore::channel::make<kcore::message<test::registry::ping>>(4);
    auto [tx2, rx2] = kcore::channel::make<kcore::message<test::registry::ping>>(4);

    EXPECT_EQ(kcore::registry::success, r.set_konly<test::registry::ping>(tx1));
    EXPECT_EQ(kcore::registry::already_registered, r.set_konly<test::registry::ping>(tx2));
    EXPECT_EQ(1u, r.size());

    // the original binding is untouched
    auto got = r.get<test::registry::ping>();
    ASSERT_TRUE(got);
    EXPECT_TRUE(got->same_channel(tx1));
}

TEST(registry, full) {
    kcore::registry r(2);
    EXPECT_EQ(2u, r.max_services());

    auto [tx0, rx0] = kcore::channel::make<kcore::message<test::registry::numbered<0>>>(2);
    auto [tx1, rx1] = kcore::channel::make<kcore::message<test::registry::numbered<1>>>(2);
    auto [tx2, rx2] = kcore::channel::make<kcore::message<test::registry::numbered<2>>>(2);

    EXPECT_EQ(kcore::registry::success, r.set_konly<test::registry::numbered<0>>(tx0));
    EXPECT_EQ(kcore::registry::success, r.set<test::registry::numbered<1>>(tx1));
    EXPECT_EQ(kcore::registry::full, r.set_konly<test::registry::numbered<2>>(tx2));
    EXPECT_EQ(2u, r.size());
    EXPECT_FALSE(r.contains("svc2"));
}

TEST(registry, get_unknown) {
    kcore::registry r;
    EXPECT_FALSE(r.get<test::registry::ping>());
    EXPECT_FALSE(r.get_userspace("ping"));
    EXPECT_FALSE(r.contains("ping"));
}

TEST(registry, get_checks_types) {
    kcore::registry r;
    auto [tx, rx] = kcore::channel::make<kcore::message<test::registry::ping>>(4);
    ASSERT_EQ(kcore::registry::success, r.set_konly<test::registry::ping>(tx));

    EXPECT_FALSE(r.get<test::registry::ping_mismatch>());

    // traits with identical types and id resolve to the same service
    auto got = r.get<test::registry::ping_alias>();
    ASSERT_TRUE(got);
    EXPECT_TRUE(got->same_channel(tx));
}

TEST(registry, kernel_only_has_no_userspace_handle) {
    kcore::registry r;
    auto [tx, rx] = kcore::channel::make<kcore::message<test::registry::echo>>(4);
    ASSERT_EQ(kcore::registry::success, r.set_konly<test::registry::echo>(tx));

    EXPECT_TRUE(r.get<test::registry::echo>());
    EXPECT_FALSE(r.get_userspace("echo"));
}

TEST(registry, userspace_round_trip) {
    auto [out_tx, out_rx] = kcore::channel::make<kcore::user_response>(4);
    kcore::channel_sink sink(out_tx);
    kcore::registry r;
    auto [tx, rx] = kcore::channel::make<kcore::message<test::registry::echo>>(4);

    ASSERT_EQ(kcore::registry::success, r.set<test::registry::echo>(tx));

    auto h = r.get_userspace("echo");
    ASSERT_TRUE(h);
    EXPECT_EQ("echo", h->id());
    EXPECT_EQ(kcore::registry::userspace_handle::success,
              h->process(test::registry::echo_request(7, "hello"), sink));

    kcore::message<test::registry::echo> m;
    ASSERT_EQ(kcore::channel::success, rx.try_recv(m));
    EXPECT_EQ("hello", m.request);
    EXPECT_TRUE(m.reply.userspace());
    EXPECT_EQ(kcore::channel::success, m.reply.reply("olleh"));
    EXPECT_FALSE(m.reply);

    kcore::user_response resp;
    ASSERT_EQ(kcore::channel::success, out_rx.try_recv(resp));
    EXPECT_EQ("echo", resp.id);
    EXPECT_EQ(7u, resp.nonce);
    EXPECT_TRUE(resp.ok);

    std::string decoded;
    ASSERT_TRUE(kcore::codec<std::string>::decode(resp.bytes, decoded));
    EXPECT_EQ("olleh", decoded);

    // exactly one response per request
    EXPECT_EQ(kcore::channel::empty, out_rx.try_recv(resp));
}

TEST(registry, userspace_decode_error) {
    auto [out_tx, out_rx] = kcore::channel::make<kcore::user_response>(4);
    kcore::channel_sink sink(out_tx);
    kcore::registry r;
    auto [tx, rx] = kcore::channel::make<kcore::message<test::registry::echo>>(4);
    ASSERT_EQ(kcore::registry::success, r.set<test::registry::echo>(tx));

    auto h = r.get_userspace("echo");
    ASSERT_TRUE(h);

    kcore::user_request bad{ "echo", 1, { 9, 0, 0, 0, 'x' } };
    EXPECT_EQ(kcore::registry::userspace_handle::decode_error, h->process(std::move(bad), sink));

    kcore::message<test::registry::echo> m;
    EXPECT_EQ(kcore::channel::empty, rx.try_recv(m));

    kcore::user_response resp;
    EXPECT_EQ(kcore::channel::empty, out_rx.try_recv(resp));
}

TEST(registry, userspace_dropped_reply_fails_request) {
    auto [out_tx, out_rx] = kcore::channel::make<kcore::user_response>(4);
    kcore::channel_sink sink(out_tx);
    kcore::registry r;
    auto [tx, rx] = kcore::channel::make<kcore::message<test::registry::echo>>(4);
    ASSERT_EQ(kcore::registry::success, r.set<test::registry::echo>(tx));

    auto h = r.get_userspace("echo");
    ASSERT_TRUE(h);
    ASSERT_EQ(kcore::registry::userspace_handle::success,
              h->process(test::registry::echo_request(3, "lost"), sink));

    {
        kcore::message<test::registry::echo> m;
        ASSERT_EQ(kcore::channel::success, rx.try_recv(m));
    }

    kcore::user_response resp;
    ASSERT_EQ(kcore::channel::success, out_rx.try_recv(resp));
    EXPECT_EQ(3u, resp.nonce);
    EXPECT_FALSE(resp.ok);
    EXPECT_TRUE(resp.bytes.empty());
}

TEST(registry, userspace_full_and_closed) {
    // the sink outlives every queued reply route
    auto [out_tx, out_rx] = kcore::channel::make<kcore::user_response>(4);
    kcore::channel_sink sink(out_tx);
    kcore::registry r;
    auto [tx, rx] = kcore::channel::make<kcore::message<test::registry::echo>>(1);
    ASSERT_EQ(kcore::registry::success, r.set<test::registry::echo>(tx));

    auto h = r.get_userspace("echo");
    ASSERT_TRUE(h);
    EXPECT_EQ(kcore::registry::userspace_handle::success,
              h->process(test::registry::echo_request(1, "a"), sink));
    EXPECT_EQ(kcore::registry::userspace_handle::full,
              h->process(test::registry::echo_request(2, "b"), sink));

    // a refused request is reported to the caller, not through the sink
    kcore::user_response resp;
    EXPECT_EQ(kcore::channel::empty, out_rx.try_recv(resp));

    // the service goes away with request 1 still queued
    rx.reset();
    EXPECT_EQ(kcore::registry::userspace_handle::closed,
              h->process(test::registry::echo_request(3, "c"), sink));
}

TEST(registry, reply_to_routes) {
    // channel route
    {
        auto [tx, rx] = kcore::channel::make<int>(2);
        kcore::reply_to<int> route(tx);
        EXPECT_TRUE(route);
        EXPECT_FALSE(route.userspace());
        EXPECT_EQ(kcore::channel::success, route.reply(4));
        EXPECT_FALSE(route);

        int v = 0;
        EXPECT_EQ(kcore::channel::success, rx.try_recv(v));
        EXPECT_EQ(4, v);
    }

    // oneshot route
    {
        kcore::oneshot<int> o;
        kcore::oneshot_sender<int> s;
        ASSERT_EQ(kcore::oneshot<int>::success, o.sender(s));

        kcore::reply_to<int> route(std::move(s));
        kcore::reply_to<int> moved(std::move(route));
        EXPECT_FALSE(route);
        EXPECT_TRUE(moved);
        EXPECT_EQ(kcore::channel::success, moved.reply(8));

        int v = 0;
        EXPECT_EQ(kcore::oneshot<int>::success, o.try_receive(v));
        EXPECT_EQ(8, v);
    }

    // dropped oneshot route closes the round
    {
        kcore::oneshot<int> o;
        kcore::oneshot_sender<int> s;
        ASSERT_EQ(kcore::oneshot<int>::success, o.sender(s));

        {
            kcore::reply_to<int> route(std::move(s));
        }

        int v = 0;
        EXPECT_EQ(kcore::oneshot<int>::channel_closed, o.try_receive(v));
    }

    // no route
    {
        kcore::reply_to<int> route;
        EXPECT_FALSE(route);
        EXPECT_EQ(kcore::channel::closed, route.reply(1));
    }
}

TEST(codec, trivially_copyable) {
    struct point {
        std::int32_t x;
        std::int32_t y;
    };

    point p{ 3, -4 };
    auto bytes = kcore::codec<point>::encode(p);
    EXPECT_EQ(sizeof(point), bytes.size());

    point q{ 0, 0 };
    ASSERT_TRUE(kcore::codec<point>::decode(bytes, q));
    EXPECT_EQ(3, q.x);
    EXPECT_EQ(-4, q.y);

    bytes.pop_back();
    EXPECT_FALSE(kcore::codec<point>::decode(bytes, q));
}

TEST(codec, string) {
    auto bytes = kcore::codec<std::string>::encode("abc");
    ASSERT_EQ(7u, bytes.size());
    EXPECT_EQ(3u, bytes[0]);
    EXPECT_EQ(0u, bytes[1]);
    EXPECT_EQ('a', bytes[4]);

    std::string s;
    ASSERT_TRUE(kcore::codec<std::string>::decode(bytes, s));
    EXPECT_EQ("abc", s);

    // trailing or missing bytes are rejected
    bytes.push_back('d');
    EXPECT_FALSE(kcore::codec<std::string>::decode(bytes, s));
    EXPECT_FALSE(kcore::codec<std::string>::decode({ 1, 0 }, s));

    std::string empty;
    ASSERT_TRUE(kcore::codec<std::string>::decode(kcore::codec<std::string>::encode(empty), s));
    EXPECT_TRUE(s.empty());
}

TEST(codec, bytes) {
    std::vector<std::uint8_t> in{ 0, 255, 7 };
    auto bytes = kcore::codec<std::vector<std::uint8_t>>::encode(in);
    EXPECT_EQ(7u, bytes.size());

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(kcore::codec<std::vector<std::uint8_t>>::decode(bytes, out));
    EXPECT_EQ(in, out);
}
