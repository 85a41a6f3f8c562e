//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <cstdint>
#include <limits>
#include <string>

#include "heap.hpp"
#include "allocator.hpp"
#include "containers.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace containers {

struct arena {
    alignas(64) std::uint8_t bytes[512];
};

// counts its own destructions
struct tracked {
    tracked(int& d, int v) : destroyed(d), value(v) { }
    ~tracked() { ++destroyed; }

    int& destroyed;
    int value;
};

kcore::co<int> co_make_box(kcore::allocator& a, int v) {
    kcore::box<int> b = co_await kcore::box<int>::make(a, v);
    co_return *b;
}

kcore::co<std::size_t> co_make_array(kcore::allocator& a, std::size_t n, char fill) {
    kcore::array<char> arr = co_await kcore::array<char>::make(a, n, fill);
    std::size_t matching = 0;
    for(char c : arr) { if(c == fill) { ++matching; } }
    co_return matching;
}

kcore::co<std::size_t> co_make_arc(kcore::allocator& a, kcore::arc<std::string>& out) {
    out = co_await kcore::arc<std::string>::make(a, "shared");
    co_return out.use_count();
}

template <typename T>
void fixed_vec_T() {
    arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    {
        auto v = kcore::fixed_vec<T>::try_make(a, 2);
        ASSERT_TRUE(v);
        EXPECT_EQ(2u, v.capacity());
        EXPECT_TRUE(v.empty());

        EXPECT_TRUE(v.try_push((T)test::init<T>(1)));
        EXPECT_TRUE(v.try_push((T)test::init<T>(2)));
        EXPECT_TRUE(v.full());

        T extra = test::init<T>(3);
        EXPECT_FALSE(v.try_push(std::move(extra)));
        EXPECT_EQ((T)test::init<T>(3), extra);

        EXPECT_EQ((T)test::init<T>(1), v[0]);

        auto last = v.pop();
        ASSERT_TRUE(last);
        EXPECT_EQ((T)test::init<T>(2), *last);
        EXPECT_EQ(1u, v.size());

        v.clear();
        EXPECT_TRUE(v.empty());
        EXPECT_FALSE(v.pop());
    }

    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

}
}

TEST(containers, box_try_make) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    int destroyed = 0;

    {
        auto b = kcore::box<test::containers::tracked>::try_make(a, destroyed, 5);
        ASSERT_TRUE(b);
        EXPECT_EQ(5, b->value);
        EXPECT_EQ(kcore::heap::rounded(sizeof(test::containers::tracked)),
                  a.stats().allocated_bytes);

        kcore::box<test::containers::tracked> moved(std::move(b));
        EXPECT_FALSE(b);
        EXPECT_EQ(5, (*moved).value);
        EXPECT_EQ(0, destroyed);
    }

    EXPECT_EQ(1, destroyed);
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(containers, box_try_make_out_of_memory) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::allocation held = a.try_alloc(512, 8);
    ASSERT_TRUE(held);

    auto b = kcore::box<int>::try_make(a, 1);
    EXPECT_FALSE(b);
}

TEST(containers, box_make) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::executor ex;

    auto j = ex.spawn(test::containers::co_make_box(a, 9));
    ex.run_until_idle();

    ASSERT_TRUE(j.done());
    EXPECT_EQ(9, j.get());
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(containers, arc_shares_value) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    int destroyed = 0;

    {
        auto r1 = kcore::arc<test::containers::tracked>::try_make(a, destroyed, 3);
        ASSERT_TRUE(r1);
        EXPECT_EQ(1u, r1.use_count());

        {
            auto r2 = r1;
            EXPECT_EQ(2u, r1.use_count());
            EXPECT_EQ(r1.get(), r2.get());
            r2->value = 4;
        }

        EXPECT_EQ(1u, r1.use_count());
        EXPECT_EQ(4, r1->value);
        EXPECT_EQ(0, destroyed);

        kcore::arc<test::containers::tracked> r3(std::move(r1));
        EXPECT_FALSE(r1);
        EXPECT_EQ(0u, r1.use_count());
        EXPECT_EQ(1u, r3.use_count());
    }

    EXPECT_EQ(1, destroyed);
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(containers, arc_make) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::executor ex;
    kcore::arc<std::string> out;

    auto j = ex.spawn(test::containers::co_make_arc(a, out));
    ex.run_until_idle();

    ASSERT_TRUE(j.done());
    EXPECT_EQ(1u, j.get());
    ASSERT_TRUE(out);
    EXPECT_EQ("shared", *out);
    EXPECT_LT(0u, a.stats().allocated_bytes);

    out.reset();
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(containers, array_try_make) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    {
        auto arr = kcore::array<int>::try_make(a, 4, 7);
        ASSERT_TRUE(arr);
        EXPECT_EQ(4u, arr.size());
        for(int i : arr) { EXPECT_EQ(7, i); }

        arr[2] = 1;
        EXPECT_EQ(1, arr.data()[2]);

        auto zeroed = kcore::array<int>::try_make(a, 3);
        ASSERT_TRUE(zeroed);
        for(int i : zeroed) { EXPECT_EQ(0, i); }
    }

    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(containers, array_make) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));
    kcore::executor ex;

    auto j = ex.spawn(test::containers::co_make_array(a, 16, 'k'));
    ex.run_until_idle();

    ASSERT_TRUE(j.done());
    EXPECT_EQ(16u, j.get());
    EXPECT_EQ(0u, a.stats().allocated_bytes);
}

TEST(containers, fixed_vec) {
    test::containers::fixed_vec_T<int>();
    test::containers::fixed_vec_T<std::string>();
    test::containers::fixed_vec_T<test::CustomObject>();
}

TEST(containers, element_count_overflow) {
    test::containers::arena ar;
    kcore::allocator a(ar.bytes, sizeof(ar.bytes));

    // a count whose byte size wraps around to a small request
    const std::size_t huge = std::numeric_limits<std::size_t>::max() / sizeof(std::uint64_t) + 2;

    EXPECT_THROW(kcore::array<std::uint64_t>::try_make(a, huge), kcore::invalid_layout);
    EXPECT_THROW(kcore::array<std::uint64_t>::try_make(a, huge, 1), kcore::invalid_layout);
    EXPECT_THROW(kcore::array<std::uint64_t>::make(a, huge), kcore::invalid_layout);
    EXPECT_THROW(kcore::fixed_vec<std::uint64_t>::try_make(a, huge), kcore::invalid_layout);
    EXPECT_THROW(kcore::fixed_vec<std::uint64_t>::make(a, huge), kcore::invalid_layout);

    auto s = a.stats();
    EXPECT_EQ(0u, s.allocated_bytes);
    EXPECT_EQ(0u, s.alloc_attempt_count());

    // a small count is still an ordinary request
    auto fits = kcore::array<std::uint64_t>::try_make(a, 4);
    EXPECT_TRUE(fits);
}
