//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "task.hpp"

kcore::task*& kcore::detail::task::tl_this_task() {
    thread_local kcore::task* t = nullptr;
    return t;
}

kcore::awaitable::~awaitable() {
    if(!done_ && waiter_.woken() && parked_on_) [[unlikely]] {
        // this awaitable consumed a wake it will never act on
        KCORE_LOW_METHOD_BODY("~awaitable", "forwarding wake");
        parked_on_->wake_one();
    }

    waiter_.unlink();
}

bool kcore::awaitable::await_suspend(std::coroutine_handle<> h) {
    KCORE_LOW_METHOD_ENTER("await_suspend", h);
    kcore::task* t = detail::task::tl_this_task();

    if(!t) [[unlikely]] {
        KCORE_ERROR_METHOD_BODY("await_suspend", "not inside a kcore::task");
        throw kcore::awaitable_outside_task(this);
    }

    if(on_suspend(t->make_waker())) {
        KCORE_TRACE_METHOD_BODY("await_suspend", "suspending ", t);
        t->blocked_on_ = this;
        return true;
    } else {
        finish_();
        return false;
    }
}

bool kcore::awaitable::poll(const kcore::waker& w) {
    KCORE_LOW_METHOD_ENTER("poll");

    if(on_ready() || !on_suspend(w)) {
        finish_();
        return true;
    } else {
        return false;
    }
}
