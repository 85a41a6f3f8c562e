//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_ONESHOT
#define KCORE_ONESHOT

// c++
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "wait_list.hpp"
#include "task.hpp"

namespace kcore {

/// outcomes shared by `kcore::oneshot<T>` and `kcore::oneshot_sender<T>`
struct oneshot_result {
    enum status {
        success, /// value delivered
        empty, /// a sender is outstanding but has not delivered yet
        sender_already_active, /// a round is already open
        no_sender_active, /// no round is open
        channel_closed /// the other side of the round went away
    };

    static inline const char* status_name(status s) {
        switch(s) {
            case success: return "success";
            case empty: return "empty";
            case sender_already_active: return "sender_already_active";
            case no_sender_active: return "no_sender_active";
            case channel_closed: return "channel_closed";
            default: return "unknown";
        }
    }
};

namespace detail {
namespace oneshot {

template <typename T>
struct cell : public kcore::oneshot_result {
    enum state {
        idle,
        waiting,
        ready,
        closed
    };

    // take the value if one is ready, reporting the round observed
    inline status take(T& t, std::uint64_t& observed) {
        std::lock_guard<kcore::spinlock> lk(lk_);
        observed = round_;

        switch(state_) {
            case waiting:
                return empty;
            case ready:
                t = std::move(*value_);
                value_.reset();
                state_ = idle;
                return success;
            case closed:
                state_ = idle;
                return channel_closed;
            default:
                return no_sender_active;
        }
    }

    // open a new round, returning its number or 0 if one is open
    inline std::uint64_t open() {
        std::lock_guard<kcore::spinlock> lk(lk_);
        if(state_ != idle) { return 0; }
        state_ = waiting;
        return ++round_;
    }

    inline bool deliver(std::uint64_t round, T&& t) {
        {
            std::lock_guard<kcore::spinlock> lk(lk_);
            if(round != round_ || state_ != waiting) { return false; }
            value_.emplace(std::move(t));
            state_ = ready;
        }

        waiters_.wake_all();
        return true;
    }

    // the sender of `round` went away without delivering
    inline void orphan(std::uint64_t round) {
        {
            std::lock_guard<kcore::spinlock> lk(lk_);
            if(round != round_ || state_ != waiting) { return; }
            state_ = closed;
        }

        waiters_.wake_all();
    }

    // the receiver of `round` went away, discard the round
    inline void abandon(std::uint64_t round) {
        std::lock_guard<kcore::spinlock> lk(lk_);
        if(round != round_ || state_ == idle) { return; }
        value_.reset();
        state_ = idle;
        ++round_;
    }

    // discard whatever round is open
    inline void reset() {
        std::lock_guard<kcore::spinlock> lk(lk_);
        if(state_ == idle) { return; }
        value_.reset();
        state_ = idle;
        ++round_;
    }

    inline state current() const {
        std::lock_guard<kcore::spinlock> lk(lk_);
        return state_;
    }

    inline kcore::wait_list& waiters() { return waiters_; }

private:
    mutable kcore::spinlock lk_;
    state state_ = idle;
    std::uint64_t round_ = 0;
    std::optional<T> value_;
    kcore::wait_list waiters_;
};

}
}

template <typename T> struct oneshot;

/**
 @brief single use sending half of a `kcore::oneshot<T>` round

 Move-only. Dropping a sender which never delivered closes its round, the
 receiver then observes `channel_closed`.
 */
template <typename T>
struct oneshot_sender : public printable, public oneshot_result {
    oneshot_sender() { }
    oneshot_sender(const oneshot_sender<T>&) = delete;

    oneshot_sender(oneshot_sender<T>&& rhs) :
        cell_(std::move(rhs.cell_)),
        round_(rhs.round_)
    { }

    virtual ~oneshot_sender() { reset(); }

    oneshot_sender<T>& operator=(const oneshot_sender<T>&) = delete;

    inline oneshot_sender<T>& operator=(oneshot_sender<T>&& rhs) {
        if(this != &rhs) {
            reset();
            cell_ = std::move(rhs.cell_);
            round_ = rhs.round_;
        }

        return *this;
    }

    static inline std::string info_name() {
        return type::templatize<T>("kcore::oneshot_sender");
    }

    inline std::string name() const { return oneshot_sender<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "round:" << round_ << ", active:" << std::boolalpha << (bool)cell_;
        return ss.str();
    }

    /// return true if this sender can still deliver
    inline explicit operator bool() const { return (bool)cell_; }

    /**
     @brief deliver the value and wake the receiver

     Consumes the sender.

     @return success, channel_closed if the receiver abandoned the round, or no_sender_active for an empty sender
     */
    inline status send(T t) {
        KCORE_LOW_METHOD_ENTER("send");
        if(!cell_) [[unlikely]] { return no_sender_active; }

        auto c = std::move(cell_);
        return c->deliver(round_, std::move(t)) ? success : channel_closed;
    }

    /// drop the sender, closing its round if nothing was delivered
    inline void reset() {
        if(cell_) {
            KCORE_LOW_METHOD_BODY("reset", "orphaning round ", round_);
            auto c = std::move(cell_);
            c->orphan(round_);
        }
    }

private:
    friend struct oneshot<T>;

    oneshot_sender(std::shared_ptr<detail::oneshot::cell<T>> c, std::uint64_t round) :
        cell_(std::move(c)),
        round_(round)
    { }

    std::shared_ptr<detail::oneshot::cell<T>> cell_;
    std::uint64_t round_ = 0;
};

/**
 @brief reusable single value rendezvous, typically a reply slot

 Each call to `sender()` opens a new round and hands out the only sender
 which can complete it. The owner then receives exactly one outcome for the
 round: the value, or `channel_closed` if the sender was dropped. Receiving
 the outcome returns the cell to idle so the next round can open.

 Dropping a pending `receive()` abandons the round: any late value is
 discarded and the round's sender can no longer deliver.

 ```
 kcore::oneshot<int> reply;
 kcore::oneshot_sender<int> tx;
 reply.sender(tx);
 service.try_send(request{ std::move(tx) });
 int v;
 if(co_await reply.receive(v) == kcore::oneshot<int>::success) { ... }
 ```
 */
template <typename T>
struct oneshot : public printable, public oneshot_result {
    /// awaitable returned by `receive()`
    struct receive_awaitable : public kcore::awaitable {
        receive_awaitable(std::shared_ptr<detail::oneshot::cell<T>> c, T& t) :
            kcore::awaitable(c),
            cell_(c.get()),
            dest_(t)
        { }

        virtual ~receive_awaitable() {
            if(!done() && pending_) { cell_->abandon(round_); }
        }

        static inline std::string info_name() {
            return type::templatize<T>("kcore::oneshot::receive_awaitable");
        }

        inline std::string name() const { return receive_awaitable::info_name(); }

        inline status await_resume() { return status_; }

    protected:
        inline bool on_ready() {
            status_ = cell_->take(dest_, round_);
            pending_ = status_ == empty;
            return !pending_;
        }

        inline bool on_suspend(const kcore::waker& w) {
            // the cell never closes its wait list
            park(cell_->waiters(), w);
            return !on_ready();
        }

    private:
        detail::oneshot::cell<T>* cell_;
        T& dest_;
        status status_ = empty;
        std::uint64_t round_ = 0;
        bool pending_ = false;
    };

    oneshot() : cell_(std::make_shared<detail::oneshot::cell<T>>()) {
        KCORE_LOW_CONSTRUCTOR();
    }

    oneshot(const oneshot<T>&) = delete;
    oneshot(oneshot<T>&&) = default;

    virtual ~oneshot() {
        KCORE_LOW_DESTRUCTOR();

        // invalidate any outstanding sender
        if(cell_) { cell_->reset(); }
    }

    oneshot<T>& operator=(const oneshot<T>&) = delete;
    oneshot<T>& operator=(oneshot<T>&&) = default;

    static inline std::string info_name() {
        return type::templatize<T>("kcore::oneshot");
    }

    inline std::string name() const { return oneshot<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "state:" << (int)(cell_->current());
        return ss.str();
    }

    /**
     @brief open a new round

     @param out receives the round's sender on success
     @return success or sender_already_active
     */
    inline status sender(oneshot_sender<T>& out) {
        KCORE_LOW_METHOD_ENTER("sender");
        std::uint64_t round = cell_->open();

        if(!round) {
            KCORE_LOW_METHOD_BODY("sender", "round already open");
            return sender_already_active;
        }

        out = oneshot_sender<T>(cell_, round);
        return success;
    }

    /**
     @brief receive the current round's outcome without suspending

     @return success, empty, no_sender_active or channel_closed
     */
    inline status try_receive(T& t) {
        std::uint64_t round;
        return cell_->take(t, round);
    }

    /// awaitable receive, suspends while the round's sender is outstanding
    inline receive_awaitable receive(T& t) {
        return receive_awaitable(cell_, t);
    }

    /// return true while a round is open or its outcome is unclaimed
    inline bool active() const {
        return cell_->current() != detail::oneshot::cell<T>::idle;
    }

private:
    std::shared_ptr<detail::oneshot::cell<T>> cell_;
};

}

#endif
