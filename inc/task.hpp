//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_TASK
#define KCORE_TASK

// c++
#include <cstdint>
#include <memory>
#include <coroutine>
#include <exception>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "coroutine.hpp"
#include "wait_list.hpp"

namespace kcore {

struct executor;
struct task;
struct awaitable;

namespace detail {
namespace task {

// always points to the task being polled on this thread
kcore::task*& tl_this_task();

}
}

/**
 @brief one schedulable unit of work owned by an executor

 A task wraps a coroutine plus the bookkeeping the executor needs to drive it:
 its run state, the awaitable it is currently blocked on and an intrusive
 run-queue hook. Tasks are created by `executor::spawn()` and destroyed by the
 executor when they complete or are cancelled, user code only ever holds a
 `kcore::join<T>`.
 */
struct task : public printable {
    enum state {
        spawned, /// created, queued for its first poll
        queued, /// woken, waiting in the run-queue
        running, /// currently being polled
        suspended, /// waiting for a waker
        complete /// finished or cancelled, about to be destroyed
    };

    typedef std::uint64_t id_type;

    task(kcore::executor& ex, id_type id) : exec_(ex), id_(id) {
        KCORE_MED_CONSTRUCTOR((void*)&ex, id);
    }

    task(const task&) = delete;
    task(task&&) = delete;

    virtual ~task() { KCORE_MED_DESTRUCTOR(); }

    task& operator=(const task&) = delete;
    task& operator=(task&&) = delete;

    static inline std::string info_name() { return "kcore::task"; }
    inline std::string name() const { return task::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "id:" << id_ << ", state:" << task::state_name(state_);
        return ss.str();
    }

    static inline const char* state_name(state s) {
        switch(s) {
            case spawned: return "spawned";
            case queued: return "queued";
            case running: return "running";
            case suspended: return "suspended";
            case complete: return "complete";
            default: return "unknown";
        }
    }

    inline id_type id() const { return id_; }

    /// the owning executor
    inline kcore::executor& owner() { return exec_; }

    /// the coroutine this task drives
    virtual kcore::coroutine& body() = 0;

    /// return a waker which marks this task runnable
    inline kcore::waker make_waker() { return kcore::waker(&task::wake_, this); }

    /// return true if called while a task is being polled on this thread
    static inline bool in() { return detail::task::tl_this_task(); }

    /// return the task being polled on this thread
    static inline task& local() { return *(detail::task::tl_this_task()); }

protected:
    /// resolve the join state with the coroutine's result
    virtual void on_complete() = 0;

    /// resolve the join state as cancelled
    virtual void on_cancel() = 0;

private:
    friend kcore::executor;
    friend kcore::awaitable;

    // waker operation, implemented by the executor
    static void wake_(void* ctx);

    kcore::executor& exec_;
    const id_type id_;

    // the following are guarded by the executor's run-queue lock
    state state_ = spawned;
    bool rewake_ = false; // woken while running
    std::uint64_t queued_epoch_ = 0;
    task* rq_prev_ = nullptr;
    task* rq_next_ = nullptr;

    // only touched from the executor's context
    kcore::awaitable* blocked_on_ = nullptr;
};

/// raised when a suspending operation is awaited outside of an executor task
struct awaitable_outside_task : public std::exception {
    awaitable_outside_task(const printable* a) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << a << " was awaited by a coroutine not driven by a kcore::executor";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/**
 @brief base of every suspending operation

 Implementations provide two operations:
 - `on_ready()`: attempt the operation immediately, return true on completion
 - `on_suspend(waker)`: register this awaitable's waiter somewhere a future
   state change will find it (usually with `park()`), then attempt the
   operation once more. Returns true to stay suspended, or false if the
   re-attempt completed the operation.

 The second attempt closes the window between a failed `on_ready()` and the
 registration. After a wake the executor polls the awaitable again before
 resuming the coroutine, so spurious wakes only cost a retry and a fresh
 registration.

 Awaitables live in the awaiting coroutine's frame and cannot be copied or
 moved. Destroying one unlinks its waiter. If it had been woken but never got
 to consume the wake, the wake is forwarded to the next waiter on the same
 list.

 The `keepalive` pointer passed to the constructor is released only after the
 waiter has been unlinked, so the wait list it references outlives it.

 Descendent types also implement `await_resume()`.
 */
struct awaitable : public printable {
    awaitable(std::shared_ptr<void> keepalive = {}) :
        keepalive_(std::move(keepalive))
    { }

    awaitable(const awaitable&) = delete;
    awaitable(awaitable&&) = delete;

    virtual ~awaitable();

    awaitable& operator=(const awaitable&) = delete;
    awaitable& operator=(awaitable&&) = delete;

    inline bool await_ready() {
        KCORE_LOW_METHOD_ENTER("await_ready");

        if(on_ready()) {
            done_ = true;
            return true;
        } else {
            return false;
        }
    }

    bool await_suspend(std::coroutine_handle<> h);

    /**
     @brief retry the operation after a wake

     Called by the executor before resuming a task blocked on this awaitable.

     @return true if the operation completed, false if it was re-registered
     */
    bool poll(const waker& w);

    /// return true once the operation completed
    inline bool done() const { return done_; }

protected:
    virtual bool on_ready() = 0;
    virtual bool on_suspend(const waker& w) = 0;

    /**
     @brief link this awaitable's waiter on a wait list

     @return true if linked, false if the list was closed
     */
    inline bool park(wait_list& l, const waker& w) {
        if(l.push(waiter_, w)) {
            parked_on_ = &l;
            return true;
        } else {
            return false;
        }
    }

private:
    inline void finish_() {
        waiter_.unlink();
        done_ = true;
    }

    // declared first so it is released last
    std::shared_ptr<void> keepalive_;
    waiter waiter_;
    wait_list* parked_on_ = nullptr;
    bool done_ = false;
};

/**
 @brief awaitable which gives up the remainder of the task's turn

 The task is requeued at the back of the run-queue and resumes on the
 executor's next tick:
 ```
 co_await kcore::yield();
 ```
 */
struct yield : public awaitable {
    yield() { }
    virtual ~yield() { }

    static inline std::string info_name() { return "kcore::yield"; }
    inline std::string name() const { return yield::info_name(); }

    inline void await_resume() { }

protected:
    inline bool on_ready() { return yielded_; }

    inline bool on_suspend(const waker& w) {
        yielded_ = true;
        w.wake();
        return true;
    }

private:
    bool yielded_ = false;
};

}

#endif
