//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#ifndef KCORE_TEST_HELPERS
#define KCORE_TEST_HELPERS

#include <string>
#include <vector>
#include <memory>
#include <ostream>

#include "logging.hpp"
#include "wait_list.hpp"

namespace test {

/*
 Init is a special type created for the sole purpose of standardizing
 initialization in templates from a number to type `T`.

 With primitives normal initialization is no problem, but when using the same
 template with `std::string`, for instance, it does cause problems (because
 normally a conversion function like `std::to_string` would be required).

 `init<T>`, and its specializations, provide a place for templates to get the
 necessary conversions implicitly.
 */
template <typename T>
struct init {
    template <typename... As>
    init(As&&... as) : t_(std::forward<As>(as)...) { }

    inline operator T() { return std::move(t_); }

private:
    T t_;
};

template <>
struct init<std::string> {
    template <typename... As>
    init(As&&... as) : t_(std::to_string(std::forward<As>(as)...)) { }

    inline operator std::string() { return std::move(t_); }

private:
    std::string t_;
};

struct CustomObject {
    CustomObject() : i_(0) {}
    CustomObject(const CustomObject&) = default;
    CustomObject(CustomObject&&) = default;

    CustomObject(int i) : i_(i) {}

    CustomObject& operator=(const CustomObject&) = default;
    CustomObject& operator=(CustomObject&&) = default;

    inline bool operator==(const CustomObject& rhs) const {
        return i_ == rhs.i_;
    }

    inline bool operator!=(const CustomObject& rhs) const {
        return !(*this == rhs);
    }

    inline int value() const { return i_; }

private:
    int i_;
};

inline std::ostream& operator<<(std::ostream& out, const CustomObject& o) {
    return out << "CustomObject(" << o.value() << ")";
}

/*
 Records the order wakers fire in. Each `waker(id)` appends `id` to `log`
 when invoked.
 */
struct wake_log {
    struct entry {
        wake_log* parent;
        int id;
    };

    inline kcore::waker waker(int id) {
        entries.push_back(std::unique_ptr<entry>(new entry{ this, id }));
        return kcore::waker(&wake_log::record, entries.back().get());
    }

    static inline void record(void* ctx) {
        entry* p = static_cast<entry*>(ctx);
        p->parent->log.push_back(p->id);
    }

    std::vector<int> log;
    std::vector<std::unique_ptr<entry>> entries;
};

}

#endif
