#pragma once

#include "measure/vec2d.hpp"
#include "measure/vec3d.hpp"

namespace puzlib {

template <typename T>
Vec3D<T> cross(const Vec3D<T>& a, const Vec3D<T>& b) {
    return Vec3D<T>(
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x
    );
}

/// Cross product of two vectors in the XY plane; only z is non-zero.
template <typename T>
Vec3D<T> cross(const Vec2D<T>& a, const Vec2D<T>& b) {
    return cross(toVec3D(a), toVec3D(b));
}

} // namespace puzlib
