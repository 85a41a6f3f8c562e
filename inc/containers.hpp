//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_CONTAINERS
#define KCORE_CONTAINERS

// c++
#include <cstddef>
#include <limits>
#include <atomic>
#include <new>
#include <tuple>
#include <optional>
#include <utility>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "allocator.hpp"

namespace kcore {
namespace detail {
namespace containers {

/// allocation request which builds a handle from the memory once it resolves
template <typename HANDLE, typename BUILD>
struct make_awaitable : public kcore::allocator::alloc_awaitable {
    make_awaitable(kcore::allocator& a, std::size_t size, std::size_t align, BUILD&& b) :
        kcore::allocator::alloc_awaitable(a, size, align),
        build_(std::move(b))
    { }

    virtual ~make_awaitable() { }

    static inline std::string info_name() {
        return type::templatize<HANDLE>("kcore::detail::containers::make_awaitable");
    }

    inline std::string name() const { return make_awaitable<HANDLE,BUILD>::info_name(); }

    inline HANDLE await_resume() {
        return build_(kcore::allocator::alloc_awaitable::await_resume());
    }

private:
    BUILD build_;
};

template <typename HANDLE, typename BUILD>
inline make_awaitable<HANDLE,BUILD> make(kcore::allocator& a,
                                         std::size_t size,
                                         std::size_t align,
                                         BUILD&& b) {
    kcore::allocator::check_layout(size, align);
    return make_awaitable<HANDLE,BUILD>(a, size, align, std::move(b));
}

/// the byte size of `n` elements, `kcore::invalid_layout` when it overflows
template <typename T>
inline std::size_t bytes_for(std::size_t n) {
    if(n > std::numeric_limits<std::size_t>::max() / sizeof(T)) [[unlikely]] {
        KCORE_ERROR_FUNCTION_BODY("kcore::detail::containers::bytes_for", n, " elements overflow");
        throw kcore::invalid_layout(n, alignof(T));
    }

    return sizeof(T) * n;
}

template <typename T>
struct arc_block {
    template <typename... As>
    arc_block(kcore::allocator* o, As&&... as) :
        refs(1),
        owner(o),
        value(std::forward<As>(as)...)
    { }

    std::atomic<std::size_t> refs;
    kcore::allocator* owner;
    T value;
};

}
}

/**
 @brief single value in allocator memory

 Move-only, destroys the value and frees its memory on destruction.
 ```
 kcore::box<int> b = co_await kcore::box<int>::make(k.heap(), 3);
 ```
 */
template <typename T>
struct box : public printable {
    box() { }

    // take ownership of memory holding an already constructed T
    box(kcore::allocation&& m) : mem_(std::move(m)) { }

    box(const box<T>&) = delete;
    box(box<T>&&) = default;

    virtual ~box() { reset(); }

    box<T>& operator=(const box<T>&) = delete;

    inline box<T>& operator=(box<T>&& rhs) {
        reset();
        mem_ = std::move(rhs.mem_);
        return *this;
    }

    static inline std::string info_name() { return type::templatize<T>("kcore::box"); }
    inline std::string name() const { return box<T>::info_name(); }

    /// construct a T in memory awaited from `a`
    template <typename... As>
    static auto make(kcore::allocator& a, As&&... as) {
        auto build = [args = std::make_tuple(std::forward<As>(as)...)](kcore::allocation&& m) mutable {
            std::apply([&](auto&&... xs) {
                new(m.data()) T(std::forward<decltype(xs)>(xs)...);
            }, std::move(args));
            return box<T>(std::move(m));
        };

        return detail::containers::make<box<T>>(a, sizeof(T), alignof(T), std::move(build));
    }

    /// construct a T in memory from `a`, or return an empty box
    template <typename... As>
    static box<T> try_make(kcore::allocator& a, As&&... as) {
        kcore::allocation m = a.try_alloc(sizeof(T), alignof(T));
        if(!m) { return box<T>(); }
        new(m.data()) T(std::forward<As>(as)...);
        return box<T>(std::move(m));
    }

    inline explicit operator bool() const { return (bool)mem_; }
    inline T* get() const { return static_cast<T*>(mem_.data()); }
    inline T& operator*() const { return *get(); }
    inline T* operator->() const { return get(); }

    inline void reset() {
        if(mem_) {
            get()->~T();
            mem_.reset();
        }
    }

private:
    kcore::allocation mem_;
};

/**
 @brief reference counted value in allocator memory

 Copies share the value, the last reference destroys it and frees its memory.
 The count is atomic so references may be dropped from any context.
 */
template <typename T>
struct arc : public printable {
    typedef detail::containers::arc_block<T> block;

    arc() { }

    arc(const arc<T>& rhs) : blk_(rhs.blk_) {
        if(blk_) { blk_->refs.fetch_add(1, std::memory_order_relaxed); }
    }

    arc(arc<T>&& rhs) : blk_(rhs.blk_) { rhs.blk_ = nullptr; }

    virtual ~arc() { reset(); }

    inline arc<T>& operator=(const arc<T>& rhs) {
        if(this != &rhs) {
            reset();
            blk_ = rhs.blk_;
            if(blk_) { blk_->refs.fetch_add(1, std::memory_order_relaxed); }
        }

        return *this;
    }

    inline arc<T>& operator=(arc<T>&& rhs) {
        if(this != &rhs) {
            reset();
            blk_ = rhs.blk_;
            rhs.blk_ = nullptr;
        }

        return *this;
    }

    static inline std::string info_name() { return type::templatize<T>("kcore::arc"); }
    inline std::string name() const { return arc<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "refs:" << use_count();
        return ss.str();
    }

    template <typename... As>
    static auto make(kcore::allocator& a, As&&... as) {
        auto build = [args = std::make_tuple(std::forward<As>(as)...)](kcore::allocation&& m) mutable {
            kcore::allocator* owner = m.owner();
            block* b = std::apply([&](auto&&... xs) {
                return new(m.data()) block(owner, std::forward<decltype(xs)>(xs)...);
            }, std::move(args));
            m.release();
            return arc<T>(b);
        };

        return detail::containers::make<arc<T>>(a, sizeof(block), alignof(block), std::move(build));
    }

    template <typename... As>
    static arc<T> try_make(kcore::allocator& a, As&&... as) {
        kcore::allocation m = a.try_alloc(sizeof(block), alignof(block));
        if(!m) { return arc<T>(); }
        block* b = new(m.data()) block(&a, std::forward<As>(as)...);
        m.release();
        return arc<T>(b);
    }

    inline explicit operator bool() const { return blk_ != nullptr; }
    inline T* get() const { return blk_ ? &(blk_->value) : nullptr; }
    inline T& operator*() const { return blk_->value; }
    inline T* operator->() const { return get(); }

    inline std::size_t use_count() const {
        return blk_ ? blk_->refs.load(std::memory_order_acquire) : 0;
    }

    inline void reset() {
        if(blk_) {
            if(blk_->refs.fetch_sub(1, std::memory_order_acq_rel) == 1) {
                kcore::allocator* owner = blk_->owner;
                blk_->~block();
                owner->free(blk_, sizeof(block), alignof(block));
            }

            blk_ = nullptr;
        }
    }

private:
    arc(block* b) : blk_(b) { }

    block* blk_ = nullptr;
};

/**
 @brief fixed length array in allocator memory

 Elements are default constructed or copied from a fill value.
 */
template <typename T>
struct array : public printable {
    array() { }

    array(const array<T>&) = delete;

    array(array<T>&& rhs) : mem_(std::move(rhs.mem_)), size_(rhs.size_) {
        rhs.size_ = 0;
    }

    virtual ~array() { reset(); }

    array<T>& operator=(const array<T>&) = delete;

    inline array<T>& operator=(array<T>&& rhs) {
        reset();
        mem_ = std::move(rhs.mem_);
        size_ = rhs.size_;
        rhs.size_ = 0;
        return *this;
    }

    static inline std::string info_name() { return type::templatize<T>("kcore::array"); }
    inline std::string name() const { return array<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "size:" << size_;
        return ss.str();
    }

    static auto make(kcore::allocator& a, std::size_t n) {
        auto build = [n](kcore::allocation&& m) {
            return array<T>(std::move(m), n);
        };

        return detail::containers::make<array<T>>(a, detail::containers::bytes_for<T>(n), alignof(T), std::move(build));
    }

    static auto make(kcore::allocator& a, std::size_t n, const T& fill) {
        auto build = [n, fill](kcore::allocation&& m) {
            return array<T>(std::move(m), n, fill);
        };

        return detail::containers::make<array<T>>(a, detail::containers::bytes_for<T>(n), alignof(T), std::move(build));
    }

    static array<T> try_make(kcore::allocator& a, std::size_t n) {
        kcore::allocation m = a.try_alloc(detail::containers::bytes_for<T>(n), alignof(T));
        if(!m) { return array<T>(); }
        return array<T>(std::move(m), n);
    }

    static array<T> try_make(kcore::allocator& a, std::size_t n, const T& fill) {
        kcore::allocation m = a.try_alloc(detail::containers::bytes_for<T>(n), alignof(T));
        if(!m) { return array<T>(); }
        return array<T>(std::move(m), n, fill);
    }

    inline explicit operator bool() const { return (bool)mem_; }
    inline std::size_t size() const { return size_; }
    inline T* data() const { return static_cast<T*>(mem_.data()); }
    inline T& operator[](std::size_t i) const { return data()[i]; }
    inline T* begin() const { return data(); }
    inline T* end() const { return data() + size_; }

    inline void reset() {
        if(mem_) {
            for(std::size_t i = 0; i < size_; ++i) { data()[i].~T(); }
            mem_.reset();
            size_ = 0;
        }
    }

private:
    array(kcore::allocation&& m, std::size_t n) : mem_(std::move(m)), size_(n) {
        for(std::size_t i = 0; i < size_; ++i) { new(data() + i) T(); }
    }

    array(kcore::allocation&& m, std::size_t n, const T& fill) : mem_(std::move(m)), size_(n) {
        for(std::size_t i = 0; i < size_; ++i) { new(data() + i) T(fill); }
    }

    kcore::allocation mem_;
    std::size_t size_ = 0;
};

/**
 @brief vector with a fixed capacity in allocator memory

 Never reallocates, a push beyond the capacity fails and leaves the value with
 the caller.
 */
template <typename T>
struct fixed_vec : public printable {
    fixed_vec() { }

    fixed_vec(const fixed_vec<T>&) = delete;

    fixed_vec(fixed_vec<T>&& rhs) :
        mem_(std::move(rhs.mem_)),
        capacity_(rhs.capacity_),
        size_(rhs.size_)
    {
        rhs.capacity_ = 0;
        rhs.size_ = 0;
    }

    virtual ~fixed_vec() { reset(); }

    fixed_vec<T>& operator=(const fixed_vec<T>&) = delete;

    inline fixed_vec<T>& operator=(fixed_vec<T>&& rhs) {
        reset();
        mem_ = std::move(rhs.mem_);
        capacity_ = rhs.capacity_;
        size_ = rhs.size_;
        rhs.capacity_ = 0;
        rhs.size_ = 0;
        return *this;
    }

    static inline std::string info_name() { return type::templatize<T>("kcore::fixed_vec"); }
    inline std::string name() const { return fixed_vec<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "size:" << size_ << ", capacity:" << capacity_;
        return ss.str();
    }

    static auto make(kcore::allocator& a, std::size_t capacity) {
        auto build = [capacity](kcore::allocation&& m) {
            return fixed_vec<T>(std::move(m), capacity);
        };

        return detail::containers::make<fixed_vec<T>>(
            a, detail::containers::bytes_for<T>(capacity), alignof(T), std::move(build));
    }

    static fixed_vec<T> try_make(kcore::allocator& a, std::size_t capacity) {
        kcore::allocation m = a.try_alloc(detail::containers::bytes_for<T>(capacity), alignof(T));
        if(!m) { return fixed_vec<T>(); }
        return fixed_vec<T>(std::move(m), capacity);
    }

    inline explicit operator bool() const { return (bool)mem_; }
    inline std::size_t size() const { return size_; }
    inline std::size_t capacity() const { return capacity_; }
    inline bool empty() const { return size_ == 0; }
    inline bool full() const { return size_ == capacity_; }
    inline T* data() const { return static_cast<T*>(mem_.data()); }
    inline T& operator[](std::size_t i) const { return data()[i]; }
    inline T* begin() const { return data(); }
    inline T* end() const { return data() + size_; }

    /// append a value, return false and leave `t` untouched when full
    inline bool try_push(T&& t) {
        if(full()) { return false; }
        new(data() + size_) T(std::move(t));
        ++size_;
        return true;
    }

    inline bool try_push(const T& t) {
        if(full()) { return false; }
        new(data() + size_) T(t);
        ++size_;
        return true;
    }

    /// remove and return the last value
    inline std::optional<T> pop() {
        if(empty()) { return {}; }
        --size_;
        std::optional<T> t(std::move(data()[size_]));
        data()[size_].~T();
        return t;
    }

    inline void clear() {
        while(size_) {
            --size_;
            data()[size_].~T();
        }
    }

    inline void reset() {
        clear();
        mem_.reset();
        capacity_ = 0;
    }

private:
    fixed_vec(kcore::allocation&& m, std::size_t capacity) :
        mem_(std::move(m)),
        capacity_(capacity)
    { }

    kcore::allocation mem_;
    std::size_t capacity_ = 0;
    std::size_t size_ = 0;
};

}

#endif
