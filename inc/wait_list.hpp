//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_WAIT_LIST
#define KCORE_WAIT_LIST

// c++
#include <atomic>
#include <optional>
#include <exception>
#include <sstream>
#include <string>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"

namespace kcore {

struct wait_list;

/**
 @brief a callback capable of marking a suspended operation runnable again

 Wakers are plain function pointer and context pairs so they can be copied
 inside critical sections and invoked from interrupt-like contexts.
 */
struct waker {
    typedef void (*operation)(void*);

    waker() : op_(nullptr), ctx_(nullptr) { }
    waker(operation op, void* ctx) : op_(op), ctx_(ctx) { }

    /// invoke the callback, a default constructed waker does nothing
    inline void wake() const {
        if(op_) [[likely]] { op_(ctx_); }
    }

    inline explicit operator bool() const { return op_ != nullptr; }

    inline bool operator==(const waker& rhs) const {
        return op_ == rhs.op_ && ctx_ == rhs.ctx_;
    }

    inline bool operator!=(const waker& rhs) const { return !(*this == rhs); }

    inline void* context() const { return ctx_; }

private:
    operation op_;
    void* ctx_;
};

/// raised when a waiter is pushed onto a second list while still linked
struct waiter_already_linked : public std::exception {
    waiter_already_linked(const printable* w, const printable* current, const printable* requested) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << w
               << " is linked on "
               << current
               << " and cannot also be linked on "
               << requested;
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/**
 @brief one suspended operation, linked into at most one wait_list

 Waiters are embedded in the state of the suspended operation itself and are
 never allocated separately. They cannot be copied or moved, because a linked
 waiter's address is referenced by its list. Destroying a linked waiter
 unlinks it first.

 A wake delivered by `wake_one()`, `wake_all()` or `close()` runs after the
 list's lock is released. Destroying a waiter blocks until every such wake
 still running on another context has returned, so whatever its waker
 references (a task, its frame) stays alive for the whole call. A waker must
 therefore never destroy its own waiter synchronously.
 */
struct waiter : public printable {
    waiter() { KCORE_TRACE_CONSTRUCTOR(); }
    waiter(const waiter&) = delete;
    waiter(waiter&&) = delete;

    virtual ~waiter() {
        KCORE_TRACE_DESTRUCTOR();
        unlink();
        while(waking()) { }
    }

    waiter& operator=(const waiter&) = delete;
    waiter& operator=(waiter&&) = delete;

    static inline std::string info_name() { return "kcore::waiter"; }
    inline std::string name() const { return waiter::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "list:" << (void*)(list_.load(std::memory_order_acquire))
           << ", woken:" << std::boolalpha << woken();
        return ss.str();
    }

    /// return true if currently linked into a wait_list
    inline bool linked() const {
        return list_.load(std::memory_order_acquire) != nullptr;
    }

    /// return true if this waiter was popped and woken since it was last pushed
    inline bool woken() const { return woken_.load(std::memory_order_acquire); }

    /// return true while a wake popped from a list is still being delivered
    inline bool waking() const {
        return deliveries_.load(std::memory_order_acquire) != 0;
    }

    /// remove this waiter from its list, if any
    bool unlink();

private:
    friend struct wait_list;

    waiter* prev_ = nullptr;
    waiter* next_ = nullptr;
    std::atomic<wait_list*> list_{nullptr};
    std::atomic<bool> woken_{false};
    std::atomic<std::size_t> deliveries_{0};
    kcore::waker waker_;
};

/**
 @brief intrusive FIFO of waiters guarded by a spinlock

 Every operation completes in bounded time and never suspends, so wakes may be
 triggered from contexts which cannot block. Wakers are always invoked after
 the list's lock is released.

 A closed list wakes all of its waiters and refuses further pushes, which lets
 the owner of the list (a channel, for instance) signal a terminal condition
 without racing late registrations.
 */
struct wait_list : public printable {
    wait_list() { KCORE_LOW_CONSTRUCTOR(); }
    wait_list(const wait_list&) = delete;
    wait_list(wait_list&&) = delete;

    /// any remaining waiters are woken so their operations can observe the loss
    virtual ~wait_list();

    wait_list& operator=(const wait_list&) = delete;
    wait_list& operator=(wait_list&&) = delete;

    static inline std::string info_name() { return "kcore::wait_list"; }
    inline std::string name() const { return wait_list::info_name(); }
    std::string content() const;

    /**
     @brief link a waiter at the tail

     Pushing a waiter which is already linked on this list only replaces its
     stored waker. Pushing a waiter linked on a different list raises
     `waiter_already_linked`.

     @param w the waiter to link
     @param wk the waker to invoke when `w` is popped
     @return true if linked, false if the list is closed
     */
    bool push(waiter& w, const waker& wk);

    /**
     @brief unlink the head waiter and return its waker

     The popped waiter is marked woken. The caller is responsible for calling
     `wake()` on the result, and for keeping whatever the waker references
     alive until it does.
     */
    std::optional<waker> pop_one();

    /// pop and wake the head waiter, returning true if one was woken
    bool wake_one();

    /// pop and wake every waiter, returning the count woken
    std::size_t wake_all();

    /**
     @brief unlink a waiter if it is linked on this list

     Idempotent, a waiter which was already popped is left alone.

     @return true if the waiter was unlinked by this call
     */
    bool remove(waiter& w);

    /// wake every waiter and refuse further pushes
    std::size_t close();

    /// return true if close() was called
    bool closed() const;

    /// return the count of linked waiters
    std::size_t size() const;

    inline bool empty() const { return size() == 0; }

private:
    // unlink `w` from the list, lock must be held
    void unlink_(waiter& w);

    // unlink the head waiter and count a delivery on it, lock must be held
    waiter* take_(waker& wk);

    // invoke a waker taken by take_(), then release its waiter
    static void deliver_(waiter& w, const waker& wk);

    // pop and wake at most `limit` waiters, lock must not be held
    std::size_t wake_up_to_(std::size_t limit);

    mutable spinlock lk_;
    waiter* head_ = nullptr;
    waiter* tail_ = nullptr;
    std::size_t size_ = 0;
    bool closed_ = false;
};

}

#endif
