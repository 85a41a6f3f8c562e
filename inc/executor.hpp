//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_EXECUTOR
#define KCORE_EXECUTOR

// c++
#include <cstdint>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <optional>
#include <variant>
#include <unordered_map>
#include <exception>
#include <string>
#include <sstream>
#include <type_traits>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "coroutine.hpp"
#include "wait_list.hpp"
#include "task.hpp"

namespace kcore {

template <typename T> struct join;

namespace detail {
namespace executor {

/// storage type of a task's result, `void` tasks store an empty marker
template <typename T>
using result_storage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

/// completion state shared between a task and its join handles
template <typename T>
struct join_state : public printable {
    join_state(kcore::task::id_type id) : id_(id) { }

    static inline std::string info_name() {
        return type::templatize<T>("kcore::detail::executor::join_state");
    }

    inline std::string name() const { return join_state<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "id:" << id_
           << ", done:" << std::boolalpha << done()
           << ", cancelled:" << cancelled();
        return ss.str();
    }

    inline kcore::task::id_type id() const { return id_; }

    inline bool done() const { return finished_.load(std::memory_order_acquire) && result_.has_value(); }
    inline bool cancelled() const { return finished_.load(std::memory_order_acquire) && !result_.has_value(); }
    inline bool finished() const { return finished_.load(std::memory_order_acquire); }

    inline void complete(result_storage<T>&& r) {
        result_.emplace(std::move(r));
        finished_.store(true, std::memory_order_release);
        waiters_.close();
    }

    inline void cancel() {
        finished_.store(true, std::memory_order_release);
        waiters_.close();
    }

    inline std::optional<result_storage<T>>& result() { return result_; }
    inline kcore::wait_list& waiters() { return waiters_; }

private:
    const kcore::task::id_type id_;
    std::atomic<bool> finished_{false};
    std::optional<result_storage<T>> result_;
    kcore::wait_list waiters_;
};

/// the concrete task created by `executor::spawn()`
template <typename T>
struct task_impl : public kcore::task {
    task_impl(kcore::executor& ex,
              kcore::task::id_type id,
              kcore::co<T>&& c,
              std::shared_ptr<join_state<T>> js) :
        kcore::task(ex, id),
        co_(std::move(c)),
        js_(std::move(js))
    { }

    virtual ~task_impl() { }

    static inline std::string info_name() {
        return type::templatize<T>("kcore::detail::executor::task_impl");
    }

    inline std::string name() const { return task_impl<T>::info_name(); }

    inline kcore::coroutine& body() { return co_; }

protected:
    inline void on_complete() {
        if constexpr (std::is_void_v<T>) {
            js_->complete(std::monostate());
        } else {
            auto& p = kcore::get_promise(co_);

            if(p.result) [[likely]] {
                js_->complete(std::move(*(p.result)));
            } else {
                js_->cancel();
            }
        }
    }

    inline void on_cancel() { js_->cancel(); }

private:
    kcore::co<T> co_;
    std::shared_ptr<join_state<T>> js_;
};

}
}

/**
 @brief awaitable which resolves when a spawned task finishes

 Resolves true if the task completed, false if it was cancelled.
 */
template <typename T>
struct join_awaitable : public awaitable {
    join_awaitable(std::shared_ptr<detail::executor::join_state<T>> js) :
        awaitable(js),
        js_(js.get())
    { }

    virtual ~join_awaitable() { }

    static inline std::string info_name() {
        return type::templatize<T>("kcore::join_awaitable");
    }

    inline std::string name() const { return join_awaitable<T>::info_name(); }

    inline bool await_resume() { return js_->done(); }

protected:
    inline bool on_ready() { return js_->finished(); }

    inline bool on_suspend(const waker& w) {
        // a closed list means the task already finished
        return park(js_->waiters(), w) && !js_->finished();
    }

private:
    detail::executor::join_state<T>* js_;
};

/**
 @brief handle to the completion state of a spawned task

 Join handles are cheap to copy. Dropping every join handle does not affect
 the task, it only discards access to its result.
 */
template <typename T>
struct join : public printable {
    typedef detail::executor::result_storage<T> value_type;

    join() { }
    join(std::shared_ptr<detail::executor::join_state<T>> js) : js_(std::move(js)) { }
    join(const join<T>&) = default;
    join(join<T>&&) = default;
    virtual ~join() { }

    join<T>& operator=(const join<T>&) = default;
    join<T>& operator=(join<T>&&) = default;

    static inline std::string info_name() {
        return type::templatize<T>("kcore::join");
    }

    inline std::string name() const { return join<T>::info_name(); }
    inline std::string content() const { return js_ ? js_->content() : std::string(); }

    inline explicit operator bool() const { return (bool)js_; }

    /// the spawned task's id, usable with `executor::cancel()`
    inline kcore::task::id_type id() const { return js_->id(); }

    /// return true if the task ran to completion
    inline bool done() const { return js_->done(); }

    /// return true if the task was cancelled before completing
    inline bool cancelled() const { return js_->cancelled(); }

    /// return true if the task completed or was cancelled
    inline bool finished() const { return js_->finished(); }

    /// return the task's result, only valid when `done()`
    inline value_type& get() { return *(js_->result()); }

    /// return an awaitable resolving when the task finishes
    inline join_awaitable<T> wait() { return join_awaitable<T>(js_); }

private:
    std::shared_ptr<detail::executor::join_state<T>> js_;
};

/**
 @brief single threaded cooperative task executor

 The executor owns every task spawned on it. Each `tick()` polls every task
 which was runnable when the tick began exactly once, a task woken during the
 tick waits for the next one.

 The run-queue is the only executor state which may be touched from other
 contexts: wakers lock it, push the woken task and notify the idle hook. All
 other state belongs to the context driving the executor.

 Will print construction/destruction at verbosity 1, scheduling decisions at
 verbosity 6 and above.
 */
struct executor : public printable {
    /// raised when an empty coroutine is spawned
    struct null_coroutine_exception : public std::exception {
        null_coroutine_exception(const kcore::coroutine* c) :
            estr([&]() -> std::string {
                std::stringstream ss;
                ss << "cannot spawn empty coroutine: " << c;
                return ss.str();
            }())
        { }

        inline const char* what() const noexcept { return estr.c_str(); }

    private:
        const std::string estr;
    };

    executor() { KCORE_HIGH_CONSTRUCTOR(); }
    executor(const executor&) = delete;
    executor(executor&&) = delete;

    /// destroys every remaining task, resolving their joins as cancelled
    virtual ~executor();

    executor& operator=(const executor&) = delete;
    executor& operator=(executor&&) = delete;

    static inline std::string info_name() { return "kcore::executor"; }
    inline std::string name() const { return executor::info_name(); }
    std::string content() const;

    /**
     @brief spawn a task

     The task is queued for its first poll on the next tick.

     @param c the coroutine to drive
     @return a join handle to the task's result
     */
    template <typename T>
    join<T> spawn(co<T>&& c) {
        KCORE_MED_METHOD_ENTER("spawn", c);

        if(!c) [[unlikely]] {
            KCORE_ERROR_METHOD_BODY("spawn", "empty coroutine");
            throw null_coroutine_exception(&c);
        }

        task::id_type id = next_id_.fetch_add(1, std::memory_order_relaxed);
        auto js = std::make_shared<detail::executor::join_state<T>>(id);
        std::unique_ptr<task> t(
            new detail::executor::task_impl<T>(*this, id, std::move(c), js));
        insert_(std::move(t));
        return join<T>(std::move(js));
    }

    /**
     @brief poll every task which is runnable at the start of the call once

     An exception escaping a task's coroutine destroys that task and is
     rethrown to the caller.

     @return the count of tasks polled
     */
    std::size_t tick();

    /// tick until the run-queue is empty, returning the count of polls
    std::size_t run_until_idle();

    /**
     @brief drive tasks until `stop()` is called

     Idles on the host idle hook while the run-queue is empty.
     */
    void run();

    /// request the current or next call to `run()` to return
    void stop();

    /**
     @brief idle until a task is runnable or a stop is requested

     The run-queue is re-checked under its lock before idling, so a wake
     which races this call is never missed.

     @return true if tasks are runnable, false if a stop was requested
     */
    bool wait_for_work();

    /**
     @brief destroy a task which is not currently running

     The task's coroutine frame is destroyed, which unlinks any waiter it
     registered, and its join handles resolve as cancelled.

     @return true if the task was found and cancelled
     */
    bool cancel(task::id_type id);

    /// the count of live tasks
    std::size_t task_count() const;

    /// the count of tasks in the run-queue
    std::size_t queued_count() const;

private:
    friend task;

    // take ownership of a new task and queue it
    void insert_(std::unique_ptr<task> t);

    // waker path, may be called from any context
    void schedule_(task* t);

    // poll one task popped from the run-queue
    void poll_(task* t);

    // remove a finished task and resolve its join state
    void finish_(task* t, bool completed);

    // the following require lk_ to be held
    void rq_push_(task* t);
    task* rq_pop_(std::uint64_t epoch);
    void rq_remove_(task* t);
    void notify_();

    mutable kcore::spinlock lk_;
    std::condition_variable_any cv_;
    bool waiting_ = false;
    bool stop_requested_ = false;
    std::uint64_t epoch_ = 0;
    task* rq_head_ = nullptr;
    task* rq_tail_ = nullptr;
    std::size_t rq_size_ = 0;

    std::atomic<task::id_type> next_id_{1};
    std::unordered_map<task::id_type, std::unique_ptr<task>> tasks_;
};

}

#endif
