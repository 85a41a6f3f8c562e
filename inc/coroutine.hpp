//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_COROUTINE
#define KCORE_COROUTINE

// c++
#include <memory>
#include <coroutine>
#include <exception>
#include <optional>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"

namespace kcore {

/**
 @brief interface coroutine type

 An actual coroutine must be an implementation of descendent type co<T> in order
 to have a valid promise_type.

 Coroutine objects in this library implement unique_ptr-like semantics in order
 to properly destroy handles.

 Will print construction/destruction at verbosity 3, and method calls at
 verbosity 4.
 */
struct coroutine : public printable {
    struct promise_type : public printable {
        promise_type() { }
        virtual ~promise_type(){ }

        inline std::suspend_always initial_suspend() { return {}; }
        inline std::suspend_always final_suspend() noexcept { return {}; }
        inline void unhandled_exception() { eptr = std::current_exception(); }

        /// exception pointer to the most recently raised exception
        std::exception_ptr eptr = nullptr;
    };

    coroutine() { }
    coroutine(const coroutine&) = delete;

    coroutine(coroutine&& rhs) {
        KCORE_MED_GUARD(rhs.handle_, KCORE_MED_CONSTRUCTOR(rhs));
        swap(rhs);
    }

    // construct the coroutine from a type erased handle
    coroutine(std::coroutine_handle<> h) : handle_(h) {
        KCORE_MIN_GUARD(h,KCORE_MIN_CONSTRUCTOR(h));
    }

    inline coroutine& operator=(const coroutine&) = delete;

    inline coroutine& operator=(coroutine&& rhs) {
        KCORE_MED_METHOD_ENTER("operator=",rhs);
        swap(rhs);
        return *this;
    }

    virtual ~coroutine() {
        KCORE_MED_GUARD(handle_,KCORE_MED_DESTRUCTOR());
        reset();
    }

    static inline std::string info_name() { return "kcore::coroutine"; }
    inline std::string name() const { return coroutine::info_name(); }

    /// return our stringified coroutine handle's address
    inline std::string content() const {
        if(handle_) {
            std::stringstream ss;
            ss << handle_;
            return ss.str();
        } else { return std::string(); }
    }

    /// return true if the handle is valid, else false
    inline explicit operator bool() const { return (bool)handle_; }

    /// releases ownership of the managed handle and returns it
    inline std::coroutine_handle<> release() {
        KCORE_LOW_METHOD_ENTER("release");
        auto h = handle_;
        handle_ = std::coroutine_handle<>();
        return h;
    }

    /// destroys the managed frame, running the destructors of its locals
    inline void reset() {
        KCORE_TRACE_METHOD_ENTER("reset");
        if(handle_) [[likely]] { destroy_(); }
        handle_ = std::coroutine_handle<>();
    }

    /// swap two coroutines
    inline void swap(coroutine& rhs) noexcept {
        KCORE_TRACE_METHOD_ENTER("swap", rhs);
        std::coroutine_handle<> h = handle_;
        handle_ = rhs.handle_;
        rhs.handle_ = h;
    }

    /// return true if the coroutine is done, else false
    inline bool done() const {
        bool d = handle_.done();
        KCORE_MIN_METHOD_BODY("done", std::boolalpha, d);
        return d;
    }

    /// return the address of the underlying handle
    inline void* address() const {
        KCORE_MIN_METHOD_ENTER("address");
        return handle_.address();
    }

    /**
     @brief resume the coroutine

     Any exception which escaped the coroutine body is rethrown here, at which
     point the coroutine is suspended at its final suspend point.
     */
    inline void resume() {
        KCORE_MED_METHOD_ENTER("resume");
        handle_.resume();

        auto eptr =
            std::coroutine_handle<promise_type>::from_address(address())
                .promise()
                .eptr;

        // rethrow any caught exceptions from the coroutine
        if(eptr) [[unlikely]] { std::rethrow_exception(eptr); }
    }

protected:
    inline void destroy_() {
        KCORE_MED_METHOD_BODY("destroy", handle_);
        handle_.destroy(); // destruct and deallocate memory
    }

    // the coroutine's managed handle
    std::coroutine_handle<> handle_;
};

/// return the coroutine handle's promise
template <typename COROUTINE>
inline typename COROUTINE::promise_type& get_promise(COROUTINE& c) {
    return std::coroutine_handle<typename COROUTINE::promise_type>::from_address(
        c.address()).promise();
};

/**
 @brief stackless management coroutine object with templated return type

 Task bodies must return this object to specify the coroutine return type and
 select the proper promise_type:
 ```
 kcore::co<int> my_task(kcore::kernel& k) {
     co_return 3;
 }
 ```

 `kcore::coroutine`s and its descendent types act like `std::unique_ptr`s for
 `std::coroutine_handle<>`s.
 */
template <typename T>
struct co : public coroutine {
    typedef T value_type;

    struct promise_type : public coroutine::promise_type {
        promise_type() { }
        virtual ~promise_type() { }

        static inline std::string info_name() {
            return kcore::co<T>::info_name() + "::promise_type";
        }

        virtual inline std::string name() const {
            return kcore::co<T>::promise_type::info_name();
        }

        inline co<T> get_return_object() {
            return { std::coroutine_handle<promise_type>::from_promise(*this) };
        }

        /// store the result of `co_return`
        template <typename TSHADOW>
        inline void return_value(TSHADOW&& t) {
            result.emplace(std::forward<TSHADOW>(t));
        }

        /// the `co_return`ed value of the co<T>
        std::optional<T> result;
    };

    typedef std::coroutine_handle<promise_type> handle_type;

    co() = default;
    co(const co<T>&) = delete;
    co(co<T>&& rhs) = default;

    virtual ~co(){}

    inline co<T>& operator=(const co<T>&) = delete;
    inline co<T>& operator=(co<T>&& rhs) = default;

    static inline std::string info_name() {
        return type::templatize<T>("kcore::co");
    }

    inline std::string name() const { return co<T>::info_name(); }

    co(handle_type h) : coroutine(std::coroutine_handle<>(h)) { }
};

template <>
struct co<void> : public coroutine {
    typedef void value_type;

    struct promise_type : public coroutine::promise_type {
        promise_type() { }
        virtual ~promise_type() { }

        static inline std::string info_name() {
            return co<void>::info_name() + "::promise_type";
        }

        virtual inline std::string name() const {
            return co<void>::promise_type::info_name();
        }

        inline co<void> get_return_object() {
            return { std::coroutine_handle<promise_type>::from_promise(*this) };
        }

        inline void return_void(){ }
    };

    typedef std::coroutine_handle<promise_type> handle_type;

    co() = default;
    co(const co<void>&) = delete;
    co(co<void>&& rhs) = default;

    virtual ~co(){}

    inline co<void>& operator=(const co<void>&) = delete;
    inline co<void>& operator=(co<void>&& rhs) = default;

    static inline std::string info_name() { return "kcore::co<void>"; }

    inline std::string name() const {
        return co<void>::info_name();
    }

    co(handle_type h) : coroutine(std::coroutine_handle<>(h)) { }
};

}

#endif
