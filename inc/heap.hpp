//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_HEAP
#define KCORE_HEAP

// c++
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"

namespace kcore {
namespace config {
namespace heap {

/// the allocation granularity of `kcore::heap`, two machine words
std::size_t block_size();

}
}

/// raised for zero sized, zero aligned or non power of two aligned requests
struct invalid_layout : public std::exception {
    invalid_layout(std::size_t size, std::size_t align) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "invalid allocation layout, size:"
               << size
               << ", align:"
               << align;
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/// raised when memory outside of the arena is freed into it
struct foreign_pointer : public std::exception {
    foreign_pointer(const void* ptr, const printable* arena) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << ptr << " was not allocated from " << arena;
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/**
 @brief first fit free-list allocator over a fixed byte range

 Free blocks are kept in a singly linked list ordered by address, with each
 block's header stored inside the free memory itself. Every size is rounded up
 to `config::heap::block_size()` and the arena is trimmed to that alignment,
 so `used_bytes() + free_bytes() == total_bytes()` holds at all times.

 The heap is not synchronized, `kcore::allocator` provides the locking.
 */
struct heap : public printable {
    /// raised when a free overlaps memory which is already free
    struct invalid_free : public std::exception {
        invalid_free(const void* ptr, std::size_t size) :
            estr([&]() -> std::string {
                std::stringstream ss;
                ss << "free of " << size << " bytes at " << ptr
                   << " overlaps a free block";
                return ss.str();
            }())
        { }

        inline const char* what() const noexcept { return estr.c_str(); }

    private:
        const std::string estr;
    };

    /// an empty heap, every allocation fails
    heap() { KCORE_MED_CONSTRUCTOR(); }

    /// a heap managing the bytes `[start, start + size)`
    heap(void* start, std::size_t size) {
        KCORE_MED_CONSTRUCTOR(start, size);
        init(start, size);
    }

    heap(const heap&) = delete;
    heap& operator=(const heap&) = delete;

    virtual ~heap() { KCORE_MED_DESTRUCTOR(); }

    static inline std::string info_name() { return "kcore::heap"; }
    inline std::string name() const { return heap::info_name(); }
    std::string content() const;

    /**
     @brief take over a new arena, discarding all current state

     Outstanding allocations from the previous arena must not be freed into
     this heap.
     */
    void init(void* start, std::size_t size);

    /**
     @brief allocate `size` bytes aligned to `align`

     @return the allocated memory, or nullptr when no free block fits
     */
    void* allocate(std::size_t size, std::size_t align);

    /**
     @brief return memory previously returned by `allocate()`

     Neighboring free blocks are coalesced.

     @param ptr the allocated memory
     @param size the size originally requested
     */
    void deallocate(void* ptr, std::size_t size);

    /// return true if `ptr` points into the arena
    inline bool contains(const void* ptr) const {
        std::uintptr_t p = reinterpret_cast<std::uintptr_t>(ptr);
        return p >= begin_ && p < end_;
    }

    /// return the size a request is accounted as
    static inline std::size_t rounded(std::size_t size) {
        return align_up(size ? size : 1, config::heap::block_size());
    }

    inline std::size_t total_bytes() const { return end_ - begin_; }
    inline std::size_t used_bytes() const { return used_; }
    inline std::size_t free_bytes() const { return total_bytes() - used_; }

    /// the size of the largest contiguous free block
    std::size_t largest_free_block() const;

    /// the count of blocks in the free list
    std::size_t free_block_count() const;

private:
    struct free_block {
        std::size_t size;
        free_block* next;
    };

    std::uintptr_t begin_ = 0;
    std::uintptr_t end_ = 0;
    std::size_t used_ = 0;
    free_block* head_ = nullptr;
};

}

#endif
