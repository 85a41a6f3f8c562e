//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <cstdint>
#include <random>
#include <vector>
#include <utility>

#include "heap.hpp"

#include <gtest/gtest.h>

namespace test {
namespace heap {

const std::size_t arena_size = 1024;

struct arena {
    alignas(64) std::uint8_t bytes[arena_size];
};

inline bool aligned(void* p, std::size_t align) {
    return (reinterpret_cast<std::uintptr_t>(p) % align) == 0;
}

}
}

TEST(heap, empty_heap) {
    kcore::heap h;
    EXPECT_EQ(0u, h.total_bytes());
    EXPECT_EQ(0u, h.free_block_count());
    EXPECT_EQ(nullptr, h.allocate(8, 8));

    // an arena too small for one block is empty too
    std::uint8_t small[4];
    h.init(small, sizeof(small));
    EXPECT_EQ(0u, h.total_bytes());
    EXPECT_EQ(nullptr, h.allocate(1, 1));
}

TEST(heap, init_whole_arena) {
    test::heap::arena a;
    kcore::heap h(a.bytes, test::heap::arena_size);

    EXPECT_EQ(test::heap::arena_size, h.total_bytes());
    EXPECT_EQ(0u, h.used_bytes());
    EXPECT_EQ(test::heap::arena_size, h.free_bytes());
    EXPECT_EQ(1u, h.free_block_count());
    EXPECT_EQ(test::heap::arena_size, h.largest_free_block());
    EXPECT_TRUE(h.contains(a.bytes));
    EXPECT_FALSE(h.contains(a.bytes + test::heap::arena_size));
}

TEST(heap, misaligned_arena_trimmed) {
    test::heap::arena a;
    const std::size_t block = kcore::config::heap::block_size();
    kcore::heap h(a.bytes + 1, test::heap::arena_size - 1);

    // the unaligned head and tail are given up
    EXPECT_EQ(test::heap::arena_size - block, h.total_bytes());
    EXPECT_FALSE(h.contains(a.bytes));
    EXPECT_TRUE(h.contains(a.bytes + block));
}

TEST(heap, rounded) {
    const std::size_t block = kcore::config::heap::block_size();
    EXPECT_EQ(2 * sizeof(void*), block);
    EXPECT_EQ(block, kcore::heap::rounded(0));
    EXPECT_EQ(block, kcore::heap::rounded(1));
    EXPECT_EQ(block, kcore::heap::rounded(block));
    EXPECT_EQ(2 * block, kcore::heap::rounded(block + 1));
}

TEST(heap, allocate_deallocate_accounting) {
    test::heap::arena a;
    kcore::heap h(a.bytes, test::heap::arena_size);

    void* p = h.allocate(1, 1);
    ASSERT_NE(nullptr, p);
    EXPECT_EQ(kcore::heap::rounded(1), h.used_bytes());
    EXPECT_EQ(h.total_bytes(), h.used_bytes() + h.free_bytes());

    h.deallocate(p, 1);
    EXPECT_EQ(0u, h.used_bytes());
    EXPECT_EQ(1u, h.free_block_count());
}

TEST(heap, exhaustion) {
    test::heap::arena a;
    const std::size_t block = kcore::config::heap::block_size();
    kcore::heap h(a.bytes, test::heap::arena_size);
    std::vector<void*> ps;

    for(std::size_t i=0; i < test::heap::arena_size / block; ++i) {
        void* p = h.allocate(block, 1);
        ASSERT_NE(nullptr, p);
        ps.push_back(p);
    }

    EXPECT_EQ(0u, h.free_bytes());
    EXPECT_EQ(0u, h.free_block_count());
    EXPECT_EQ(nullptr, h.allocate(1, 1));

    for(auto p : ps) { h.deallocate(p, block); }

    EXPECT_EQ(0u, h.used_bytes());
    EXPECT_EQ(1u, h.free_block_count());
    EXPECT_EQ(test::heap::arena_size, h.largest_free_block());
}

TEST(heap, coalesce_out_of_order) {
    test::heap::arena a;
    const std::size_t block = kcore::config::heap::block_size();
    kcore::heap h(a.bytes, test::heap::arena_size);

    void* p0 = h.allocate(block, 1);
    void* p1 = h.allocate(block, 1);
    void* p2 = h.allocate(block, 1);
    void* p3 = h.allocate(block, 1);
    ASSERT_NE(nullptr, p3);

    h.deallocate(p2, block);
    EXPECT_EQ(2u, h.free_block_count());

    h.deallocate(p0, block);
    EXPECT_EQ(3u, h.free_block_count());

    // joins p0 and p2 into one block
    h.deallocate(p1, block);
    EXPECT_EQ(2u, h.free_block_count());
    EXPECT_EQ(h.total_bytes() - block, h.free_bytes());

    // joins everything with the remainder of the arena
    h.deallocate(p3, block);
    EXPECT_EQ(1u, h.free_block_count());
    EXPECT_EQ(test::heap::arena_size, h.largest_free_block());
}

TEST(heap, alignment) {
    test::heap::arena a;
    const std::size_t block = kcore::config::heap::block_size();
    kcore::heap h(a.bytes, test::heap::arena_size);

    // offset the next free address away from a 64 byte boundary
    void* pad = h.allocate(block, 1);
    ASSERT_NE(nullptr, pad);

    void* p = h.allocate(8, 64);
    ASSERT_NE(nullptr, p);
    EXPECT_TRUE(test::heap::aligned(p, 64));

    // the skipped prefix remains usable
    EXPECT_EQ(2u, h.free_block_count());
    void* q = h.allocate(block, 1);
    ASSERT_NE(nullptr, q);
    EXPECT_LT(q, p);

    h.deallocate(p, 8);
    h.deallocate(q, block);
    h.deallocate(pad, block);
    EXPECT_EQ(0u, h.used_bytes());
    EXPECT_EQ(1u, h.free_block_count());
}

TEST(heap, no_aligned_fit) {
    test::heap::arena a;
    const std::size_t block = kcore::config::heap::block_size();
    kcore::heap h(a.bytes, 4 * block);

    // the arena is shorter than the requested alignment allows
    void* pad = h.allocate(block, 1);
    ASSERT_NE(nullptr, pad);
    EXPECT_EQ(nullptr, h.allocate(block, 4 * block));
    h.deallocate(pad, block);
}

TEST(heap, invalid_free) {
    test::heap::arena a;
    const std::size_t block = kcore::config::heap::block_size();
    kcore::heap h(a.bytes, test::heap::arena_size);

    void* p = h.allocate(block, 1);
    ASSERT_NE(nullptr, p);
    h.deallocate(p, block);

    EXPECT_THROW(h.deallocate(p, block), kcore::heap::invalid_free);
    EXPECT_EQ(0u, h.used_bytes());
    EXPECT_EQ(1u, h.free_block_count());
}

TEST(heap, random_sequence_accounting) {
    test::heap::arena a;
    kcore::heap h(a.bytes, test::heap::arena_size);
    std::mt19937 gen(7);
    std::uniform_int_distribution<std::size_t> size_dist(1, 96);
    std::uniform_int_distribution<int> align_dist(0, 3);
    std::vector<std::pair<void*,std::size_t>> live;

    for(int i=0; i<2000; ++i) {
        if(live.empty() || gen() % 2) {
            std::size_t size = size_dist(gen);
            std::size_t align = std::size_t(1) << (align_dist(gen) * 2);
            void* p = h.allocate(size, align);

            if(p) {
                EXPECT_TRUE(test::heap::aligned(p, align));
                live.emplace_back(p, size);
            }
        } else {
            std::size_t idx = gen() % live.size();
            h.deallocate(live[idx].first, live[idx].second);
            live.erase(live.begin() + idx);
        }

        std::size_t expected = 0;
        for(auto& l : live) { expected += kcore::heap::rounded(l.second); }
        ASSERT_EQ(expected, h.used_bytes());
        ASSERT_EQ(h.total_bytes(), h.used_bytes() + h.free_bytes());
    }

    for(auto& l : live) { h.deallocate(l.first, l.second); }
    EXPECT_EQ(0u, h.used_bytes());
    EXPECT_EQ(1u, h.free_block_count());
}
