//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_ALLOCATOR
#define KCORE_ALLOCATOR

// c++
#include <cstddef>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "wait_list.hpp"
#include "task.hpp"
#include "heap.hpp"

namespace kcore {

struct allocator;

/**
 @brief owning handle to bytes allocated from a `kcore::allocator`

 The bytes are returned to their allocator when the handle is destroyed.
 */
struct allocation : public printable {
    allocation() { }

    allocation(kcore::allocator* owner, void* ptr, std::size_t size, std::size_t align) :
        owner_(owner),
        ptr_(ptr),
        size_(size),
        align_(align)
    { }

    allocation(const allocation&) = delete;

    allocation(allocation&& rhs) { swap(rhs); }

    virtual ~allocation() { reset(); }

    allocation& operator=(const allocation&) = delete;

    inline allocation& operator=(allocation&& rhs) {
        reset();
        swap(rhs);
        return *this;
    }

    static inline std::string info_name() { return "kcore::allocation"; }
    inline std::string name() const { return allocation::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "ptr:" << ptr_ << ", size:" << size_ << ", align:" << align_;
        return ss.str();
    }

    inline explicit operator bool() const { return ptr_ != nullptr; }

    inline void* data() const { return ptr_; }
    inline std::uint8_t* bytes() const { return static_cast<std::uint8_t*>(ptr_); }
    inline std::size_t size() const { return size_; }
    inline std::size_t align() const { return align_; }
    inline kcore::allocator* owner() const { return owner_; }

    /// give up ownership without freeing, returning the memory
    inline void* release() {
        void* p = ptr_;
        owner_ = nullptr;
        ptr_ = nullptr;
        size_ = 0;
        align_ = 0;
        return p;
    }

    /// free the memory now
    void reset();

    inline void swap(allocation& rhs) noexcept {
        std::swap(owner_, rhs.owner_);
        std::swap(ptr_, rhs.ptr_);
        std::swap(size_, rhs.size_);
        std::swap(align_, rhs.align_);
    }

private:
    kcore::allocator* owner_ = nullptr;
    void* ptr_ = nullptr;
    std::size_t size_ = 0;
    std::size_t align_ = 0;
};

/**
 @brief asynchronous front end over a `kcore::heap`

 Allocation never fails at this layer: a request which does not fit suspends
 the awaiting task on the allocator's out-of-memory wait list until a free
 makes room.

 After an out-of-memory failure the allocator is *inhibited*: every further
 request is refused until the next free, so requests queue in FIFO order and
 a large request cannot be starved by a stream of smaller ones. The free which
 clears the inhibit wakes every waiter, otherwise a free wakes one.

 `free()` never blocks. When the arena lock is unavailable (a nested free
 during allocator work, or a free racing a critical section from another
 context) the block is pushed onto a lock-free multi-producer queue whose
 nodes live inside the freed blocks themselves. A deferred free wakes one
 suspended request, and the queue is drained before every allocation attempt
 and by `poll()`.
 */
struct allocator : public printable {
    /// diagnostics counters, a consistent snapshot
    struct statistics {
        std::size_t total_bytes = 0;
        std::size_t allocated_bytes = 0;
        std::size_t high_water_bytes = 0;
        std::size_t alloc_success_count = 0;
        std::size_t alloc_oom_count = 0;
        std::size_t dealloc_count = 0;
        std::size_t deferred_free_count = 0;

        inline std::size_t free_bytes() const { return total_bytes - allocated_bytes; }
        inline std::size_t live_alloc_count() const { return alloc_success_count - dealloc_count; }
        inline std::size_t alloc_attempt_count() const { return alloc_success_count + alloc_oom_count; }
    };

    /**
     @brief awaitable allocation request

     Resolves to a non-empty `kcore::allocation`.
     */
    struct alloc_awaitable : public awaitable {
        alloc_awaitable(kcore::allocator& a, std::size_t size, std::size_t align) :
            alloc_(a),
            size_(size),
            align_(align)
        { }

        virtual ~alloc_awaitable() { }

        static inline std::string info_name() { return "kcore::allocator::alloc_awaitable"; }
        inline std::string name() const { return alloc_awaitable::info_name(); }

        inline std::string content() const {
            std::stringstream ss;
            ss << "size:" << size_ << ", align:" << align_;
            return ss.str();
        }

        inline kcore::allocation await_resume() { return std::move(result_); }

    protected:
        inline bool on_ready() {
            result_ = alloc_.try_alloc(size_, align_);
            return (bool)result_;
        }

        inline bool on_suspend(const waker& w) {
            // the oom list is never closed
            park(alloc_.oom_waiters_, w);
            return !on_ready();
        }

        kcore::allocator& alloc_;
        const std::size_t size_;
        const std::size_t align_;
        kcore::allocation result_;
    };

    /// an allocator over the bytes `[start, start + size)`
    allocator(void* start, std::size_t size);

    allocator(const allocator&) = delete;
    allocator& operator=(const allocator&) = delete;

    virtual ~allocator();

    static inline std::string info_name() { return "kcore::allocator"; }
    inline std::string name() const { return allocator::info_name(); }
    std::string content() const;

    /**
     @brief allocate `size` bytes aligned to `align`, suspending while out of memory

     The layout is validated immediately, `kcore::invalid_layout` is raised
     before any suspension.

     ```
     kcore::allocation a = co_await k.heap().alloc(64, 8);
     ```
     */
    inline alloc_awaitable alloc(std::size_t size, std::size_t align) {
        allocator::check_layout(size, align);
        return alloc_awaitable(*this, size, align);
    }

    /**
     @brief synchronous allocation attempt

     @return the allocation, or an empty handle when out of memory or inhibited
     */
    kcore::allocation try_alloc(std::size_t size, std::size_t align);

    /**
     @brief return memory to the arena, never blocks

     Called by `kcore::allocation` and the container handles.
     */
    void free(void* ptr, std::size_t size, std::size_t align);

    /**
     @brief drain the deferred free queue

     @return the count of blocks drained
     */
    std::size_t poll();

    /// a snapshot of the diagnostics counters
    statistics stats() const;

    /// return true while allocations are refused after an out-of-memory failure
    inline bool inhibited() const { return inhibit_.load(std::memory_order_acquire); }

    /// the count of suspended allocation requests
    inline std::size_t waiting() const { return oom_waiters_.size(); }

    /// return true if `ptr` points into this allocator's arena
    inline bool contains(const void* ptr) const { return heap_.contains(ptr); }

    /// the size of the largest contiguous free block
    std::size_t largest_free_block() const;

    /**
     @brief hold the arena lock

     Frees performed while the returned lock is held take the deferred path.
     */
    inline std::unique_lock<kcore::spinlock> critical_section() {
        return std::unique_lock<kcore::spinlock>(lk_);
    }

    /// raise `kcore::invalid_layout` for zero sizes and bad alignments
    static void check_layout(std::size_t size, std::size_t align);

private:
    // lives inside a block waiting on the deferred free queue
    struct deferred_block {
        std::size_t size;
        deferred_block* next;
    };

    // return the deferred queue to the heap, lk_ must be held
    std::size_t drain_();

    // account one deallocation, lk_ must be held
    void deallocated_();

    // wake waiters after memory was returned, lk_ must not be held
    void wake_(bool was_inhibited);

    mutable kcore::spinlock lk_;
    kcore::heap heap_;
    kcore::wait_list oom_waiters_;
    std::atomic<bool> inhibit_{false};
    std::atomic<deferred_block*> deferred_{nullptr};
    std::atomic<std::size_t> deferred_free_count_{0};

    // guarded by lk_
    std::size_t high_water_ = 0;
    std::size_t alloc_success_count_ = 0;
    std::size_t alloc_oom_count_ = 0;
    std::size_t dealloc_count_ = 0;
};

}

#endif
