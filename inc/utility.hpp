//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_UTILITY
#define KCORE_UTILITY

#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>

namespace kcore {

/// type with no qualifiers
template <typename T>
using unqualified = typename std::decay<T>::type;

/// return true if `v` is a non-zero power of two
constexpr bool is_power_of_two(std::size_t v) {
    return v && !(v & (v - 1));
}

/// round `v` up to a multiple of power of two `align`
constexpr std::size_t align_up(std::size_t v, std::size_t align) {
    return (v + (align - 1)) & ~(align - 1);
}

/// round `v` down to a multiple of power of two `align`
constexpr std::size_t align_down(std::size_t v, std::size_t align) {
    return v & ~(align - 1);
}

}

#endif
