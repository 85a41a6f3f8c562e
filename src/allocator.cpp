//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <new>
#include <mutex>

#include "allocator.hpp"

void kcore::allocation::reset() {
    if(ptr_) {
        KCORE_TRACE_METHOD_BODY("reset", "freeing ", ptr_);
        owner_->free(ptr_, size_, align_);
        release();
    }
}

kcore::allocator::allocator(void* start, std::size_t size) : heap_(start, size) {
    KCORE_HIGH_CONSTRUCTOR(start, size);
}

kcore::allocator::~allocator() {
    KCORE_HIGH_DESTRUCTOR();
    std::lock_guard<kcore::spinlock> lk(lk_);
    drain_();

    KCORE_WARNING_GUARD(heap_.used_bytes(),
        KCORE_WARNING_METHOD_BODY("~allocator", heap_.used_bytes(), " bytes still allocated"));
}

std::string kcore::allocator::content() const {
    auto s = stats();
    std::stringstream ss;
    ss << "total:" << s.total_bytes
       << ", allocated:" << s.allocated_bytes
       << ", inhibited:" << std::boolalpha << inhibited();
    return ss.str();
}

void kcore::allocator::check_layout(std::size_t size, std::size_t align) {
    if(!size || !is_power_of_two(align)) [[unlikely]] {
        KCORE_ERROR_FUNCTION_BODY("kcore::allocator::check_layout", "size:", size, ", align:", align);
        throw kcore::invalid_layout(size, align);
    }
}

kcore::allocation kcore::allocator::try_alloc(std::size_t size, std::size_t align) {
    KCORE_LOW_METHOD_ENTER("try_alloc", size, align);
    allocator::check_layout(size, align);
    void* p = nullptr;
    std::size_t drained;
    bool was_inhibited = false;

    {
        std::lock_guard<kcore::spinlock> lk(lk_);
        drained = drain_();

        if(drained) {
            was_inhibited = inhibit_.exchange(false, std::memory_order_acq_rel);
        }

        if(!inhibit_.load(std::memory_order_acquire)) {
            p = heap_.allocate(size, align);
        }

        if(p) [[likely]] {
            ++alloc_success_count_;

            if(heap_.used_bytes() > high_water_) {
                high_water_ = heap_.used_bytes();
            }
        } else {
            ++alloc_oom_count_;

            // with nothing allocated no free can ever clear the inhibit
            if(heap_.used_bytes()) [[likely]] {
                inhibit_.store(true, std::memory_order_release);
            } else {
                KCORE_WARNING_METHOD_BODY("try_alloc", size, " bytes can never fit");
            }
        }
    }

    if(drained) { wake_(was_inhibited); }

    if(p) [[likely]] {
        return kcore::allocation(this, p, size, align);
    } else {
        return kcore::allocation();
    }
}

void kcore::allocator::free(void* ptr, std::size_t size, std::size_t align) {
    KCORE_LOW_METHOD_ENTER("free", ptr, size, align);

    if(!heap_.contains(ptr)) [[unlikely]] {
        KCORE_ERROR_METHOD_BODY("free", ptr, " is not inside the arena");
        throw kcore::foreign_pointer(ptr, this);
    }

    std::unique_lock<kcore::spinlock> lk(lk_, std::try_to_lock);

    if(lk.owns_lock()) [[likely]] {
        heap_.deallocate(ptr, size);
        deallocated_();
        drain_();
        bool was_inhibited = inhibit_.exchange(false, std::memory_order_acq_rel);
        lk.unlock();
        wake_(was_inhibited);
    } else {
        KCORE_MED_METHOD_BODY("free", "deferring ", ptr);
        deferred_block* node = new(ptr) deferred_block{ size, nullptr };
        deferred_block* head = deferred_.load(std::memory_order_relaxed);

        do {
            node->next = head;
        } while(!deferred_.compare_exchange_weak(head,
                                                 node,
                                                 std::memory_order_release,
                                                 std::memory_order_relaxed));

        deferred_free_count_.fetch_add(1, std::memory_order_relaxed);

        // the woken request drains the queue on its retry, which wakes the
        // rest if the allocator was inhibited
        oom_waiters_.wake_one();
    }
}

std::size_t kcore::allocator::poll() {
    KCORE_LOW_METHOD_ENTER("poll");
    std::size_t drained;
    bool was_inhibited = false;

    {
        std::lock_guard<kcore::spinlock> lk(lk_);
        drained = drain_();

        if(drained) {
            was_inhibited = inhibit_.exchange(false, std::memory_order_acq_rel);
        }
    }

    if(drained) { wake_(was_inhibited); }
    return drained;
}

kcore::allocator::statistics kcore::allocator::stats() const {
    statistics s;
    std::lock_guard<kcore::spinlock> lk(lk_);
    s.total_bytes = heap_.total_bytes();
    s.allocated_bytes = heap_.used_bytes();
    s.high_water_bytes = high_water_;
    s.alloc_success_count = alloc_success_count_;
    s.alloc_oom_count = alloc_oom_count_;
    s.dealloc_count = dealloc_count_;
    s.deferred_free_count = deferred_free_count_.load(std::memory_order_relaxed);
    return s;
}

std::size_t kcore::allocator::largest_free_block() const {
    std::lock_guard<kcore::spinlock> lk(lk_);
    return heap_.largest_free_block();
}

std::size_t kcore::allocator::drain_() {
    deferred_block* node = deferred_.exchange(nullptr, std::memory_order_acquire);
    std::size_t count = 0;

    while(node) {
        deferred_block* next = node->next;
        std::size_t size = node->size;
        heap_.deallocate(node, size);
        deallocated_();
        node = next;
        ++count;
    }

    KCORE_MIN_GUARD(count, KCORE_MIN_METHOD_BODY("drain_", "drained ", count));
    return count;
}

void kcore::allocator::deallocated_() {
    ++dealloc_count_;
}

void kcore::allocator::wake_(bool was_inhibited) {
    if(was_inhibited) {
        oom_waiters_.wake_all();
    } else {
        oom_waiters_.wake_one();
    }
}
