#pragma once

#include <iterator>
#include <type_traits>

namespace puzlib {

/// Greatest common divisor. gcd(0, b) == |b|.
template <typename T>
T gcd(T a, T b) {
    static_assert(std::is_integral_v<T>, "gcd requires an integral type");
    if constexpr (std::is_signed_v<T>) {
        if (a < 0) a = -a;
        if (b < 0) b = -b;
    }
    while (b != 0) {
        T r = a % b;
        a = b;
        b = r;
    }
    return a;
}

/// Least common multiple. lcm(0, b) == 0.
template <typename T>
T lcm(T a, T b) {
    static_assert(std::is_integral_v<T>, "lcm requires an integral type");
    if (a == 0 || b == 0) return 0;
    T result = a / gcd(a, b) * b;
    if constexpr (std::is_signed_v<T>) {
        if (result < 0) result = -result;
    }
    return result;
}

/// GCD of every element of a range; 0 for an empty range.
template <typename Range>
auto gcdAll(const Range& values) {
    using T = std::decay_t<decltype(*std::begin(values))>;
    T result = 0;
    for (const auto& v : values) result = gcd<T>(result, v);
    return result;
}

/// LCM of every element of a range, e.g. the period of several cycles.
/// 1 for an empty range.
template <typename Range>
auto lcmAll(const Range& values) {
    using T = std::decay_t<decltype(*std::begin(values))>;
    T result = 1;
    for (const auto& v : values) result = lcm<T>(result, v);
    return result;
}

} // namespace puzlib
