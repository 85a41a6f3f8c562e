//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <mutex>
#include <vector>

#include "executor.hpp"

void kcore::task::wake_(void* ctx) {
    kcore::task* t = static_cast<kcore::task*>(ctx);
    t->exec_.schedule_(t);
}

kcore::executor::~executor() {
    KCORE_HIGH_DESTRUCTOR();

    {
        std::lock_guard<kcore::spinlock> lk(lk_);

        // no waker may requeue a task while the executor is torn down
        for(auto& entry : tasks_) {
            entry.second->state_ = task::complete;
        }

        rq_head_ = nullptr;
        rq_tail_ = nullptr;
        rq_size_ = 0;
    }

    while(!tasks_.empty()) {
        auto it = tasks_.begin();
        std::unique_ptr<task> t = std::move(it->second);
        tasks_.erase(it);
        t->on_cancel();
    }
}

std::string kcore::executor::content() const {
    std::stringstream ss;
    std::lock_guard<kcore::spinlock> lk(lk_);
    ss << "tasks:" << tasks_.size() << ", queued:" << rq_size_;
    return ss.str();
}

std::size_t kcore::executor::tick() {
    KCORE_LOW_METHOD_ENTER("tick");
    std::uint64_t epoch;

    {
        // tasks queued from here on wait for the next tick
        std::lock_guard<kcore::spinlock> lk(lk_);
        epoch = ++epoch_;
    }

    std::size_t polled = 0;

    while(true) {
        kcore::task* t;

        {
            std::lock_guard<kcore::spinlock> lk(lk_);
            t = rq_pop_(epoch);
        }

        if(!t) { break; }

        poll_(t);
        ++polled;
    }

    KCORE_MIN_METHOD_BODY("tick", "polled ", polled);
    return polled;
}

std::size_t kcore::executor::run_until_idle() {
    KCORE_LOW_METHOD_ENTER("run_until_idle");
    std::size_t polled = 0;

    while(queued_count()) {
        polled += tick();
    }

    return polled;
}

void kcore::executor::run() {
    KCORE_HIGH_METHOD_ENTER("run");

    do {
        tick();
    } while(wait_for_work());

    KCORE_HIGH_METHOD_BODY("run", "stopped");
}

void kcore::executor::stop() {
    KCORE_HIGH_METHOD_ENTER("stop");
    std::lock_guard<kcore::spinlock> lk(lk_);
    stop_requested_ = true;
    notify_();
}

bool kcore::executor::wait_for_work() {
    KCORE_LOW_METHOD_ENTER("wait_for_work");
    std::unique_lock<kcore::spinlock> lk(lk_);

    while(!rq_head_ && !stop_requested_) {
        waiting_ = true;
        cv_.wait(lk);
    }

    waiting_ = false;

    if(stop_requested_) {
        stop_requested_ = false;
        return false;
    } else {
        return true;
    }
}

bool kcore::executor::cancel(kcore::task::id_type id) {
    KCORE_MED_METHOD_ENTER("cancel", id);
    auto it = tasks_.find(id);

    if(it == tasks_.end()) {
        KCORE_MED_METHOD_BODY("cancel", "no task with id ", id);
        return false;
    }

    kcore::task* t = it->second.get();

    {
        std::lock_guard<kcore::spinlock> lk(lk_);

        if(t->state_ == task::running) [[unlikely]] {
            // a task cannot destroy the frame it is executing in
            KCORE_WARNING_METHOD_BODY("cancel", t, " is running");
            return false;
        }

        if(t->state_ == task::queued || t->state_ == task::spawned) {
            rq_remove_(t);
        }

        t->state_ = task::complete;
    }

    std::unique_ptr<task> owned = std::move(it->second);
    tasks_.erase(it);
    owned->on_cancel();
    return true;
}

std::size_t kcore::executor::task_count() const {
    return tasks_.size();
}

std::size_t kcore::executor::queued_count() const {
    std::lock_guard<kcore::spinlock> lk(lk_);
    return rq_size_;
}

void kcore::executor::insert_(std::unique_ptr<kcore::task> t) {
    kcore::task* raw = t.get();
    tasks_.emplace(raw->id(), std::move(t));

    std::lock_guard<kcore::spinlock> lk(lk_);
    raw->state_ = task::spawned;
    rq_push_(raw);
    notify_();
}

void kcore::executor::schedule_(kcore::task* t) {
    KCORE_TRACE_METHOD_ENTER("schedule_", t);
    std::lock_guard<kcore::spinlock> lk(lk_);

    switch(t->state_) {
        case task::suspended:
            t->state_ = task::queued;
            rq_push_(t);
            notify_();
            break;
        case task::running:
            // requeued when its current poll returns
            t->rewake_ = true;
            break;
        default:
            // already runnable or finished
            break;
    }
}

void kcore::executor::poll_(kcore::task* t) {
    KCORE_LOW_METHOD_ENTER("poll_", t);

    {
        std::lock_guard<kcore::spinlock> lk(lk_);
        t->state_ = task::running;
        t->rewake_ = false;
    }

    auto& tl_task = detail::task::tl_this_task();
    auto parent = tl_task;
    tl_task = t;
    bool finished = false;

    try {
        bool ready = true;

        if(t->blocked_on_) {
            ready = t->blocked_on_->poll(t->make_waker());
        }

        if(ready) {
            t->blocked_on_ = nullptr;
            t->body().resume();
        }

        finished = t->body().done();
    } catch(...) {
        tl_task = parent;
        KCORE_ERROR_METHOD_BODY("poll_", t, " raised an exception");
        finish_(t, false);
        std::rethrow_exception(std::current_exception());
    }

    tl_task = parent;

    if(finished) {
        finish_(t, true);
    } else {
        std::lock_guard<kcore::spinlock> lk(lk_);

        if(t->rewake_) {
            t->state_ = task::queued;
            rq_push_(t);
        } else {
            t->state_ = task::suspended;
        }
    }
}

void kcore::executor::finish_(kcore::task* t, bool completed) {
    KCORE_MED_METHOD_ENTER("finish_", t, completed);

    {
        std::lock_guard<kcore::spinlock> lk(lk_);
        t->state_ = task::complete;
    }

    auto it = tasks_.find(t->id());
    std::unique_ptr<task> owned = std::move(it->second);
    tasks_.erase(it);

    if(completed) { owned->on_complete(); }
    else { owned->on_cancel(); }
}

void kcore::executor::rq_push_(kcore::task* t) {
    t->queued_epoch_ = epoch_;
    t->rq_next_ = nullptr;
    t->rq_prev_ = rq_tail_;

    if(rq_tail_) { rq_tail_->rq_next_ = t; }
    else { rq_head_ = t; }

    rq_tail_ = t;
    ++rq_size_;
}

kcore::task* kcore::executor::rq_pop_(std::uint64_t epoch) {
    kcore::task* t = rq_head_;

    if(t && t->queued_epoch_ < epoch) {
        rq_remove_(t);
        return t;
    } else {
        return nullptr;
    }
}

void kcore::executor::rq_remove_(kcore::task* t) {
    if(t->rq_prev_) { t->rq_prev_->rq_next_ = t->rq_next_; }
    else { rq_head_ = t->rq_next_; }

    if(t->rq_next_) { t->rq_next_->rq_prev_ = t->rq_prev_; }
    else { rq_tail_ = t->rq_prev_; }

    t->rq_prev_ = nullptr;
    t->rq_next_ = nullptr;
    --rq_size_;
}

void kcore::executor::notify_() {
    // only do notify if necessary
    if(waiting_) {
        KCORE_TRACE_METHOD_BODY("notify_");
        waiting_ = false;
        cv_.notify_one();
    }
}
