//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <mutex>

#include "wait_list.hpp"

bool kcore::waiter::unlink() {
    kcore::wait_list* l = list_.load(std::memory_order_acquire);
    return l ? l->remove(*this) : false;
}

kcore::wait_list::~wait_list() {
    KCORE_LOW_DESTRUCTOR();
    wake_all();
}

std::string kcore::wait_list::content() const {
    std::stringstream ss;
    std::lock_guard<kcore::spinlock> lk(lk_);
    ss << "size:" << size_ << ", closed:" << std::boolalpha << closed_;
    return ss.str();
}

bool kcore::wait_list::push(kcore::waiter& w, const kcore::waker& wk) {
    KCORE_MIN_METHOD_ENTER("push", &w);
    std::lock_guard<kcore::spinlock> lk(lk_);
    kcore::wait_list* current = w.list_.load(std::memory_order_acquire);

    if(current == this) {
        // re-registration only refreshes the waker
        w.waker_ = wk;
        return true;
    } else if(current) [[unlikely]] {
        KCORE_ERROR_METHOD_BODY("push", &w, " already linked on ", current);
        throw kcore::waiter_already_linked(&w, current, this);
    }

    if(closed_) [[unlikely]] { return false; }

    w.waker_ = wk;
    w.woken_.store(false, std::memory_order_release);
    w.next_ = nullptr;
    w.prev_ = tail_;

    if(tail_) { tail_->next_ = &w; }
    else { head_ = &w; }

    tail_ = &w;
    ++size_;
    w.list_.store(this, std::memory_order_release);
    return true;
}

std::optional<kcore::waker> kcore::wait_list::pop_one() {
    KCORE_MIN_METHOD_ENTER("pop_one");
    std::lock_guard<kcore::spinlock> lk(lk_);

    if(head_) {
        // the waiter may be destroyed once it reads as unlinked
        kcore::waiter* w = head_;
        kcore::waker wk = w->waker_;
        w->woken_.store(true, std::memory_order_release);
        unlink_(*w);
        return { wk };
    } else {
        return {};
    }
}

bool kcore::wait_list::wake_one() {
    KCORE_MIN_METHOD_ENTER("wake_one");
    kcore::waker wk;
    kcore::waiter* w;

    {
        std::lock_guard<kcore::spinlock> lk(lk_);
        w = take_(wk);
    }

    if(w) {
        deliver_(*w, wk);
        return true;
    } else {
        return false;
    }
}

std::size_t kcore::wait_list::wake_all() {
    KCORE_MIN_METHOD_ENTER("wake_all");
    std::size_t limit;

    {
        std::lock_guard<kcore::spinlock> lk(lk_);
        limit = size_;
    }

    return wake_up_to_(limit);
}

bool kcore::wait_list::remove(kcore::waiter& w) {
    KCORE_MIN_METHOD_ENTER("remove", &w);
    std::lock_guard<kcore::spinlock> lk(lk_);

    if(w.list_.load(std::memory_order_acquire) == this) {
        unlink_(w);
        return true;
    } else {
        return false;
    }
}

std::size_t kcore::wait_list::close() {
    KCORE_LOW_METHOD_ENTER("close");
    std::size_t limit;

    {
        std::lock_guard<kcore::spinlock> lk(lk_);
        closed_ = true;
        limit = size_;
    }

    // no further pushes can succeed, so this drains the list
    return wake_up_to_(limit);
}

bool kcore::wait_list::closed() const {
    std::lock_guard<kcore::spinlock> lk(lk_);
    return closed_;
}

std::size_t kcore::wait_list::size() const {
    std::lock_guard<kcore::spinlock> lk(lk_);
    return size_;
}

void kcore::wait_list::unlink_(kcore::waiter& w) {
    if(w.prev_) { w.prev_->next_ = w.next_; }
    else { head_ = w.next_; }

    if(w.next_) { w.next_->prev_ = w.prev_; }
    else { tail_ = w.prev_; }

    w.prev_ = nullptr;
    w.next_ = nullptr;
    w.list_.store(nullptr, std::memory_order_release);
    --size_;
}

kcore::waiter* kcore::wait_list::take_(kcore::waker& wk) {
    kcore::waiter* w = head_;

    if(w) {
        wk = w->waker_;
        w->woken_.store(true, std::memory_order_release);
        w->deliveries_.fetch_add(1, std::memory_order_relaxed);
        unlink_(*w);
    }

    return w;
}

void kcore::wait_list::deliver_(kcore::waiter& w, const kcore::waker& wk) {
    wk.wake();

    // last access, the waiter may be destroyed from here on
    w.deliveries_.fetch_sub(1, std::memory_order_release);
}

std::size_t kcore::wait_list::wake_up_to_(std::size_t limit) {
    // waiters are popped one at a time so waiters linked after the call
    // started are left for the next wake
    std::size_t count = 0;

    while(count < limit) {
        kcore::waker wk;
        kcore::waiter* w;

        {
            std::lock_guard<kcore::spinlock> lk(lk_);
            w = take_(wk);
        }

        if(!w) { break; }
        deliver_(*w, wk);
        ++count;
    }

    return count;
}
