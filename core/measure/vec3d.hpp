#pragma once

#include "measure/vec2d.hpp"
#include "util/hash.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <ostream>

namespace puzlib {

/// Normal axis used when moving between 2D and 3D.
enum class Axis { X, Y, Z };

template <typename T>
struct Vec3D {
    T x{};
    T y{};
    T z{};

    Vec3D() = default;
    Vec3D(T x, T y, T z) : x(x), y(y), z(z) {}

    Vec3D operator+(const Vec3D& other) const { return Vec3D(x + other.x, y + other.y, z + other.z); }
    Vec3D operator-(const Vec3D& other) const { return Vec3D(x - other.x, y - other.y, z - other.z); }
    Vec3D operator*(T factor) const { return Vec3D(x * factor, y * factor, z * factor); }

    Vec3D& operator+=(const Vec3D& other) {
        x += other.x;
        y += other.y;
        z += other.z;
        return *this;
    }

    Vec3D& operator-=(const Vec3D& other) {
        x -= other.x;
        y -= other.y;
        z -= other.z;
        return *this;
    }

    bool operator==(const Vec3D& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Vec3D& other) const { return !(*this == other); }
    bool operator<(const Vec3D& other) const {
        if (x != other.x) return x < other.x;
        if (y != other.y) return y < other.y;
        return z < other.z;
    }

    Vec3D scale(T factor) const { return *this * factor; }

    T manhattan(const Vec3D& other) const {
        return (std::max(x, other.x) - std::min(x, other.x)) +
               (std::max(y, other.y) - std::min(y, other.y)) +
               (std::max(z, other.z) - std::min(z, other.z));
    }

    T dot(const Vec3D& other) const { return x * other.x + y * other.y + z * other.z; }

    double distanceTo(const Vec3D& other) const {
        double dx = static_cast<double>(std::max(x, other.x) - std::min(x, other.x));
        double dy = static_cast<double>(std::max(y, other.y) - std::min(y, other.y));
        double dz = static_cast<double>(std::max(z, other.z) - std::min(z, other.z));
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    /// Projection onto the plane normal to the given axis.
    /// X -> (y, z), Y -> (x, z), Z -> (x, y)
    Vec2D<T> planar(Axis normal) const {
        switch (normal) {
            case Axis::X: return {y, z};
            case Axis::Y: return {x, z};
            case Axis::Z: return {x, y};
        }
        return {x, y};
    }

    template <typename U>
    Vec3D<U> as() const {
        return {static_cast<U>(x), static_cast<U>(y), static_cast<U>(z)};
    }
};

/// Lift a 2D point into 3D with the normal axis set to zero. Points in
/// the same plane keep their relative positions.
template <typename T>
Vec3D<T> toVec3D(const Vec2D<T>& v, Axis normal = Axis::Z) {
    switch (normal) {
        case Axis::X: return {T{}, v.x, v.y};
        case Axis::Y: return {v.x, T{}, v.y};
        case Axis::Z: return {v.x, v.y, T{}};
    }
    return {v.x, v.y, T{}};
}

template <typename T>
std::ostream& operator<<(std::ostream& os, const Vec3D<T>& v) {
    return os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}

} // namespace puzlib

namespace std {

template <typename T>
struct hash<puzlib::Vec3D<T>> {
    size_t operator()(const puzlib::Vec3D<T>& v) const {
        size_t seed = 0;
        puzlib::hashCombine(seed, v.x);
        puzlib::hashCombine(seed, v.y);
        puzlib::hashCombine(seed, v.z);
        return seed;
    }
};

} // namespace std
