//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_ATOMIC
#define KCORE_ATOMIC

#include <atomic>

#include "logging.hpp"

namespace kcore {

/**
 @brief bounded critical section lock

 Never suspends and never blocks in the operating system sense, so it can be
 taken from interrupt-like wake paths. Critical sections guarded by it must be
 short and must never contain a suspension point.
 */
struct spinlock : public printable {
    spinlock() {
        KCORE_MIN_CONSTRUCTOR();
        lock_.clear();
    }

    spinlock(const spinlock&) = delete;
    spinlock& operator=(const spinlock&) = delete;

    virtual ~spinlock() { KCORE_MIN_DESTRUCTOR(); }

    static inline std::string info_name() { return "kcore::spinlock"; }
    inline std::string name() const { return spinlock::info_name(); }

    inline void lock() {
        KCORE_MIN_METHOD_ENTER("lock");
        while(lock_.test_and_set(std::memory_order_acquire)){ }
    }

    inline bool try_lock() {
        KCORE_MIN_METHOD_ENTER("try_lock");
        return !(lock_.test_and_set(std::memory_order_acquire));
    }

    inline void unlock() {
        KCORE_MIN_METHOD_ENTER("unlock");
        lock_.clear(std::memory_order_release);
    }

private:
    std::atomic_flag lock_;
};

/**
 @brief lockless lockable implementation

 For structures which satisfy the lock API but are only ever touched from the
 executor's own context.
 */
struct lockfree : public printable {
    lockfree() { KCORE_MIN_CONSTRUCTOR(); }
    ~lockfree() { KCORE_MIN_DESTRUCTOR(); }

    static inline std::string info_name() { return "kcore::lockfree"; }
    inline std::string name() const { return lockfree::info_name(); }

    inline void lock() { KCORE_MIN_METHOD_ENTER("lock"); }

    inline bool try_lock() {
        KCORE_MIN_METHOD_ENTER("try_lock");
        return true;
    }

    inline void unlock() { KCORE_MIN_METHOD_ENTER("unlock"); }
};

}

#endif
