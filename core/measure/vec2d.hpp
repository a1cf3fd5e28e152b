#pragma once

#include "util/hash.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <ostream>

namespace puzlib {

/// 2D vector. On character grids x is the row and y the column.
template <typename T>
struct Vec2D {
    T x{};
    T y{};

    Vec2D() = default;
    Vec2D(T x, T y) : x(x), y(y) {}

    Vec2D operator+(const Vec2D& other) const { return Vec2D(x + other.x, y + other.y); }
    Vec2D operator-(const Vec2D& other) const { return Vec2D(x - other.x, y - other.y); }
    Vec2D operator*(T factor) const { return Vec2D(x * factor, y * factor); }

    Vec2D& operator+=(const Vec2D& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    Vec2D& operator-=(const Vec2D& other) {
        x -= other.x;
        y -= other.y;
        return *this;
    }

    bool operator==(const Vec2D& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2D& other) const { return !(*this == other); }
    bool operator<(const Vec2D& other) const {
        return x < other.x || (x == other.x && y < other.y);
    }

    Vec2D scale(T factor) const { return *this * factor; }

    /// Manhattan (taxicab) distance. Safe for unsigned T.
    T manhattan(const Vec2D& other) const {
        return (std::max(x, other.x) - std::min(x, other.x)) +
               (std::max(y, other.y) - std::min(y, other.y));
    }

    T dot(const Vec2D& other) const { return x * other.x + y * other.y; }

    /// Straight-line distance.
    double distanceTo(const Vec2D& other) const {
        double dx = static_cast<double>(std::max(x, other.x) - std::min(x, other.x));
        double dy = static_cast<double>(std::max(y, other.y) - std::min(y, other.y));
        return std::sqrt(dx * dx + dy * dy);
    }

    /// Apply f to each component.
    template <typename F>
    auto map(F&& f) const -> Vec2D<decltype(f(x))> {
        return {f(x), f(y)};
    }

    /// Convert the component type.
    template <typename U>
    Vec2D<U> as() const {
        return {static_cast<U>(x), static_cast<U>(y)};
    }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Vec2D<T>& v) {
    return os << "(" << v.x << ", " << v.y << ")";
}

} // namespace puzlib

namespace std {

template <typename T>
struct hash<puzlib::Vec2D<T>> {
    size_t operator()(const puzlib::Vec2D<T>& v) const {
        size_t seed = 0;
        puzlib::hashCombine(seed, v.x);
        puzlib::hashCombine(seed, v.y);
        return seed;
    }
};

} // namespace std
