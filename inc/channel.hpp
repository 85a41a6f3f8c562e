//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_CHANNEL
#define KCORE_CHANNEL

// c++
#include <cstddef>
#include <cstdint>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <exception>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "wait_list.hpp"
#include "task.hpp"

namespace kcore {
namespace config {
namespace channel {

/// the capacity of channels constructed without an explicit capacity
std::size_t default_capacity();

}
}

/// raised when a channel is constructed with a capacity it cannot honor
struct invalid_capacity : public std::exception {
    invalid_capacity(const std::string& implementation, std::size_t capacity) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << implementation << " cannot be constructed with capacity " << capacity;
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

namespace channel {

/// result of a channel operation
enum result {
    closed = 0, /// channel is closed
    full, /// no free slot, nothing was sent
    empty, /// no queued message, nothing was received
    success /// channel operation success
};

inline const char* result_name(result r) {
    switch(r) {
        case closed: return "closed";
        case full: return "full";
        case empty: return "empty";
        case success: return "success";
        default: return "unknown";
    }
}

/// selects the implementation constructed by `channel::make()`
enum class shape {
    spsc, /// ring of flagged slots, producers serialized by a lock
    mpsc /// lock-free ring claimed by compare-exchange
};

template <typename T> struct send_awaitable;
template <typename T> struct recv_awaitable;

/**
 @brief interface for bounded channel implementations

 A channel holds at most `capacity()` messages. Every message is delivered to
 the single consumer in the order producers *claimed* slots, which under
 contention is not necessarily the order `send()` was called.

 Closing a channel fails all further sends. Messages already queued remain
 receivable, `closed` is only reported to the consumer once the channel is
 both closed and empty. Closing wakes every waiter on both sides.

 Implementations provide the storage through `push_()` and `pop_()`, the
 interface provides the result semantics and the waking.
 */
template <typename T>
struct interface : public printable, public std::enable_shared_from_this<interface<T>> {
    typedef T value_type;

    interface() { }
    interface(const interface<T>&) = delete;
    interface<T>& operator=(const interface<T>&) = delete;

    virtual ~interface(){ }

    /// the maximum count of queued messages
    virtual std::size_t capacity() const = 0;

    /// the current count of queued messages
    virtual std::size_t used() const = 0;

    inline std::string content() const {
        std::stringstream ss;
        ss << "capacity:" << capacity()
           << ", used:" << used()
           << ", closed:" << std::boolalpha << closed();
        return ss.str();
    }

    /// return true if the channel is closed
    inline bool closed() const { return closed_.load(std::memory_order_acquire); }

    /// close the channel and wake every waiter, idempotent
    inline void close() {
        if(!closed_.exchange(true, std::memory_order_acq_rel)) {
            KCORE_LOW_METHOD_BODY("close", "closing");
            send_waiters_.close();
            recv_waiters_.close();
        }
    }

    /**
     @brief attempt to enqueue a message without suspending

     `t` is only moved from on success.
     */
    inline result try_send(T&& t) {
        KCORE_MIN_METHOD_ENTER("try_send");

        if(closed()) [[unlikely]] { return result::closed; }
        if(!push_(t)) { return full; }

        recv_waiters_.wake_one();
        return success;
    }

    /// attempt to enqueue a copy of a message without suspending
    inline result try_send(const T& t) {
        T copy(t);
        return try_send(std::move(copy));
    }

    /**
     @brief attempt to dequeue a message without suspending

     @return success, or empty while open, or closed once closed and drained
     */
    inline result try_recv(T& t) {
        KCORE_MIN_METHOD_ENTER("try_recv");

        if(pop_(t)) [[likely]] {
            send_waiters_.wake_one();
            return success;
        } else if(closed()) {
            // a send may have completed between the pop and the close
            if(pop_(t)) { return success; }
            return result::closed;
        } else {
            return empty;
        }
    }

    /// awaitable send, suspends while full and resolves success or closed
    send_awaitable<T> send(T t);

    /**
     @brief awaitable receive into `t`

     Suspends while empty and resolves success or, once closed and drained,
     closed.
     */
    recv_awaitable<T> recv(T& t);

    inline kcore::wait_list& send_waiters() { return send_waiters_; }
    inline kcore::wait_list& recv_waiters() { return recv_waiters_; }

    /// account a new producer handle
    inline void attach_producer() {
        producers_.fetch_add(1, std::memory_order_relaxed);
    }

    /// account a dropped producer handle, the last one closes the channel
    inline void detach_producer() {
        if(producers_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            KCORE_LOW_METHOD_BODY("detach_producer", "last producer dropped");
            close();
        }
    }

    /// the count of live producer handles
    inline std::size_t producer_count() const {
        return producers_.load(std::memory_order_acquire);
    }

protected:
    /// store a message, moving from `t` only on success, false when full
    virtual bool push_(T& t) = 0;

    /// remove the oldest message into `t`, false when empty
    virtual bool pop_(T& t) = 0;

private:
    std::atomic<bool> closed_{false};
    std::atomic<std::size_t> producers_{0};
    kcore::wait_list send_waiters_;
    kcore::wait_list recv_waiters_;
};

/// awaitable returned by `interface<T>::send()`
template <typename T>
struct send_awaitable : public kcore::awaitable {
    send_awaitable(std::shared_ptr<interface<T>> ch, T&& t) :
        kcore::awaitable(ch),
        ch_(ch.get()),
        value_(std::move(t))
    { }

    virtual ~send_awaitable() { }

    static inline std::string info_name() {
        return type::templatize<T>("kcore::channel::send_awaitable");
    }

    inline std::string name() const { return send_awaitable<T>::info_name(); }

    inline result await_resume() { return result_; }

protected:
    inline bool on_ready() {
        result_ = ch_->try_send(std::move(value_));
        return result_ != full;
    }

    inline bool on_suspend(const kcore::waker& w) {
        if(!park(ch_->send_waiters(), w)) {
            result_ = closed;
            return false;
        }

        return !on_ready();
    }

private:
    interface<T>* ch_;
    T value_;
    result result_ = full;
};

/// awaitable returned by `interface<T>::recv()`
template <typename T>
struct recv_awaitable : public kcore::awaitable {
    recv_awaitable(std::shared_ptr<interface<T>> ch, T& t) :
        kcore::awaitable(ch),
        ch_(ch.get()),
        dest_(t)
    { }

    virtual ~recv_awaitable() { }

    static inline std::string info_name() {
        return type::templatize<T>("kcore::channel::recv_awaitable");
    }

    inline std::string name() const { return recv_awaitable<T>::info_name(); }

    inline result await_resume() { return result_; }

protected:
    inline bool on_ready() {
        result_ = ch_->try_recv(dest_);
        return result_ != empty;
    }

    inline bool on_suspend(const kcore::waker& w) {
        if(!park(ch_->recv_waiters(), w)) {
            // closed, drain whatever is left
            result_ = ch_->try_recv(dest_);
            return false;
        }

        return !on_ready();
    }

private:
    interface<T>* ch_;
    T& dest_;
    result result_ = empty;
};

template <typename T>
send_awaitable<T> interface<T>::send(T t) {
    return send_awaitable<T>(this->shared_from_this(), std::move(t));
}

template <typename T>
recv_awaitable<T> interface<T>::recv(T& t) {
    return recv_awaitable<T>(this->shared_from_this(), t);
}

/**
 @brief ring of independently flagged slots

 Built for one producer and one consumer. Clones of the producer handle are
 serialized by `LOCK`, so they remain correct but contend. The consumer side
 takes no lock.
 */
template <typename T, typename LOCK = kcore::spinlock>
struct spsc : public interface<T> {
    spsc(std::size_t capacity) : capacity_(capacity) {
        KCORE_LOW_CONSTRUCTOR(capacity);

        if(!capacity_) [[unlikely]] {
            KCORE_ERROR_METHOD_BODY("spsc", "capacity must be at least 1");
            throw kcore::invalid_capacity(spsc<T,LOCK>::info_name(), capacity);
        }

        slots_.reset(new slot[capacity_]);
    }

    virtual ~spsc(){ KCORE_LOW_DESTRUCTOR(); }

    static inline std::string info_name() {
        return type::templatize<T,LOCK>("kcore::channel::spsc");
    }

    inline std::string name() const { return spsc<T,LOCK>::info_name(); }

    inline std::size_t capacity() const { return capacity_; }
    inline std::size_t used() const { return count_.load(std::memory_order_acquire); }

protected:
    inline bool push_(T& t) {
        std::lock_guard<LOCK> lk(lk_);
        slot& s = slots_[tail_];

        if(s.full.load(std::memory_order_acquire)) { return false; }

        s.value.emplace(std::move(t));
        count_.fetch_add(1, std::memory_order_relaxed);
        s.full.store(true, std::memory_order_release);
        tail_ = (tail_ + 1) % capacity_;
        return true;
    }

    inline bool pop_(T& t) {
        slot& s = slots_[head_];

        if(!s.full.load(std::memory_order_acquire)) { return false; }

        t = std::move(*(s.value));
        s.value.reset();
        head_ = (head_ + 1) % capacity_;
        count_.fetch_sub(1, std::memory_order_relaxed);
        s.full.store(false, std::memory_order_release);
        return true;
    }

private:
    struct slot {
        std::optional<T> value;
        std::atomic<bool> full{false};
    };

    const std::size_t capacity_;
    std::unique_ptr<slot[]> slots_;
    LOCK lk_; // producer side
    std::size_t tail_ = 0; // guarded by lk_
    std::size_t head_ = 0; // consumer only
    std::atomic<std::size_t> count_{0};
};

/**
 @brief lock-free multi-producer single-consumer ring

 Cells carry a sequence stamp. A producer claims the cell at the enqueue
 position by advancing the position with a compare-exchange, writes its
 message, then publishes it by bumping the cell's stamp. The consumer only
 takes a cell whose stamp shows it was published, so messages are received
 in claim order.

 The capacity must be a power of two of at least 2.
 */
template <typename T>
struct mpsc : public interface<T> {
    mpsc(std::size_t capacity) : capacity_(capacity), mask_(capacity - 1) {
        KCORE_LOW_CONSTRUCTOR(capacity);

        if(capacity_ < 2 || !is_power_of_two(capacity_)) [[unlikely]] {
            KCORE_ERROR_METHOD_BODY("mpsc", "capacity must be a power of two of at least 2");
            throw kcore::invalid_capacity(mpsc<T>::info_name(), capacity);
        }

        cells_.reset(new cell[capacity_]);

        for(std::size_t i = 0; i < capacity_; ++i) {
            cells_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    virtual ~mpsc(){ KCORE_LOW_DESTRUCTOR(); }

    static inline std::string info_name() {
        return type::templatize<T>("kcore::channel::mpsc");
    }

    inline std::string name() const { return mpsc<T>::info_name(); }

    inline std::size_t capacity() const { return capacity_; }

    inline std::size_t used() const {
        std::size_t enq = enqueue_pos_.load(std::memory_order_acquire);
        std::size_t deq = dequeue_pos_.load(std::memory_order_acquire);
        return enq - deq;
    }

protected:
    inline bool push_(T& t) {
        std::size_t pos = enqueue_pos_.load(std::memory_order_relaxed);
        cell* c;

        while(true) {
            c = &(cells_[pos & mask_]);
            std::size_t seq = c->sequence.load(std::memory_order_acquire);
            std::intptr_t dif = (std::intptr_t)seq - (std::intptr_t)pos;

            if(dif == 0) {
                if(enqueue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if(dif < 0) {
                // the consumer has not freed this cell yet
                return false;
            } else {
                pos = enqueue_pos_.load(std::memory_order_relaxed);
            }
        }

        c->value.emplace(std::move(t));
        c->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    inline bool pop_(T& t) {
        std::size_t pos = dequeue_pos_.load(std::memory_order_relaxed);
        cell& c = cells_[pos & mask_];
        std::size_t seq = c.sequence.load(std::memory_order_acquire);

        // empty, or the claiming producer has not published yet
        if((std::intptr_t)seq - (std::intptr_t)(pos + 1) < 0) { return false; }

        t = std::move(*(c.value));
        c.value.reset();
        dequeue_pos_.store(pos + 1, std::memory_order_release);
        c.sequence.store(pos + capacity_, std::memory_order_release);
        return true;
    }

private:
    struct cell {
        std::atomic<std::size_t> sequence{0};
        std::optional<T> value;
    };

    const std::size_t capacity_;
    const std::size_t mask_;
    std::unique_ptr<cell[]> cells_;
    std::atomic<std::size_t> enqueue_pos_{0};
    std::atomic<std::size_t> dequeue_pos_{0};
};

}

/**
 @brief sending handle of a channel

 Copies are cheap and reference the same channel. When the last producer of
 a channel is dropped the channel closes, so a consumer never waits forever
 on an orphaned channel.
 */
template <typename T>
struct producer : public printable {
    producer() { }

    producer(std::shared_ptr<channel::interface<T>> ch) : ch_(std::move(ch)) {
        if(ch_) { ch_->attach_producer(); }
    }

    producer(const producer<T>& rhs) : ch_(rhs.ch_) {
        if(ch_) { ch_->attach_producer(); }
    }

    producer(producer<T>&& rhs) : ch_(std::move(rhs.ch_)) { }

    virtual ~producer() { reset(); }

    inline producer<T>& operator=(const producer<T>& rhs) {
        if(this != &rhs) {
            reset();
            ch_ = rhs.ch_;
            if(ch_) { ch_->attach_producer(); }
        }

        return *this;
    }

    inline producer<T>& operator=(producer<T>&& rhs) {
        if(this != &rhs) {
            reset();
            ch_ = std::move(rhs.ch_);
        }

        return *this;
    }

    static inline std::string info_name() { return type::templatize<T>("kcore::producer"); }
    inline std::string name() const { return producer<T>::info_name(); }
    inline std::string content() const { return ch_ ? ch_->to_string() : std::string(); }

    inline explicit operator bool() const { return (bool)ch_; }

    inline channel::result try_send(T&& t) { return ch_->try_send(std::move(t)); }
    inline channel::result try_send(const T& t) { return ch_->try_send(t); }
    inline channel::send_awaitable<T> send(T t) { return ch_->send(std::move(t)); }

    inline void close() { ch_->close(); }
    inline bool closed() const { return ch_->closed(); }
    inline std::size_t capacity() const { return ch_->capacity(); }
    inline std::size_t used() const { return ch_->used(); }

    /// drop this handle's reference to the channel
    inline void reset() {
        if(ch_) {
            ch_->detach_producer();
            ch_.reset();
        }
    }

    /// return true if both handles reference the same channel
    inline bool same_channel(const producer<T>& rhs) const { return ch_ == rhs.ch_; }

private:
    std::shared_ptr<channel::interface<T>> ch_;
};

/**
 @brief receiving handle of a channel

 Move-only, there is exactly one consumer per channel. Dropping it closes the
 channel so producers blocked on a full channel observe `closed`.
 */
template <typename T>
struct consumer : public printable {
    consumer() { }
    consumer(std::shared_ptr<channel::interface<T>> ch) : ch_(std::move(ch)) { }
    consumer(const consumer<T>&) = delete;
    consumer(consumer<T>&& rhs) : ch_(std::move(rhs.ch_)) { }

    virtual ~consumer() { reset(); }

    consumer<T>& operator=(const consumer<T>&) = delete;

    inline consumer<T>& operator=(consumer<T>&& rhs) {
        if(this != &rhs) {
            reset();
            ch_ = std::move(rhs.ch_);
        }

        return *this;
    }

    static inline std::string info_name() { return type::templatize<T>("kcore::consumer"); }
    inline std::string name() const { return consumer<T>::info_name(); }
    inline std::string content() const { return ch_ ? ch_->to_string() : std::string(); }

    inline explicit operator bool() const { return (bool)ch_; }

    inline channel::result try_recv(T& t) { return ch_->try_recv(t); }
    inline channel::recv_awaitable<T> recv(T& t) { return ch_->recv(t); }

    inline void close() { ch_->close(); }
    inline bool closed() const { return ch_->closed(); }
    inline std::size_t capacity() const { return ch_->capacity(); }
    inline std::size_t used() const { return ch_->used(); }

    inline void reset() {
        if(ch_) {
            ch_->close();
            ch_.reset();
        }
    }

private:
    std::shared_ptr<channel::interface<T>> ch_;
};

namespace channel {

/**
 @brief construct a channel and return its producer and consumer handles

 ```
 auto [tx, rx] = kcore::channel::make<int>(4, kcore::channel::shape::mpsc);
 ```
 */
template <typename T>
std::pair<kcore::producer<T>, kcore::consumer<T>> make(
        std::size_t capacity = config::channel::default_capacity(),
        shape s = shape::spsc)
{
    KCORE_LOW_FUNCTION_ENTER("kcore::channel::make", capacity, (int)s);
    std::shared_ptr<interface<T>> ch;

    if(s == shape::mpsc) {
        ch = std::make_shared<mpsc<T>>(capacity);
    } else {
        ch = std::make_shared<spsc<T>>(capacity);
    }

    return { kcore::producer<T>(ch), kcore::consumer<T>(ch) };
}

}
}

#endif
