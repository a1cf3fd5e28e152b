#pragma once

#include "measure/vec2d.hpp"

#include <array>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace puzlib {

// ─── Grid Directions ───────────────────────────────────────────
// Neighbors of a grid cell where x is the row (growing downwards) and
// y the column (growing rightwards).
//
//   cardinals: N, E, S, W
//   ordinals:  NE, SE, SW, NW
//   compass:   N, NE, E, SE, S, SW, W, NW
//
// The checked variants return an empty optional for any neighbor whose
// coordinate would overflow or underflow T (e.g. row -1 with unsigned T).

template <typename T>
class Dir {
public:
    using Cell = Vec2D<T>;

    static std::array<std::optional<Cell>, 4> cardinals(const Cell& from) {
        return {
            step(from, -1, 0),
            step(from, 0, 1),
            step(from, 1, 0),
            step(from, 0, -1)
        };
    }

    static std::array<std::optional<Cell>, 4> ordinals(const Cell& from) {
        return {
            step(from, -1, 1),
            step(from, 1, 1),
            step(from, 1, -1),
            step(from, -1, -1)
        };
    }

    static std::array<std::optional<Cell>, 8> compass(const Cell& from) {
        auto c = cardinals(from);
        auto o = ordinals(from);
        return {c[0], o[0], c[1], o[1], c[2], o[2], c[3], o[3]};
    }

    /// Neighbors without overflow checks; unsigned coordinates wrap.
    static std::array<Cell, 4> cardinalsUnchecked(const Cell& from) {
        return {
            offset(from, -1, 0),
            offset(from, 0, 1),
            offset(from, 1, 0),
            offset(from, 0, -1)
        };
    }

    static std::array<Cell, 4> ordinalsUnchecked(const Cell& from) {
        return {
            offset(from, -1, 1),
            offset(from, 1, 1),
            offset(from, 1, -1),
            offset(from, -1, -1)
        };
    }

    static std::array<Cell, 8> compassUnchecked(const Cell& from) {
        auto c = cardinalsUnchecked(from);
        auto o = ordinalsUnchecked(from);
        return {c[0], o[0], c[1], o[1], c[2], o[2], c[3], o[3]};
    }

private:
    static std::optional<T> checkedStep(T value, int delta) {
        if (delta > 0 && value == std::numeric_limits<T>::max()) return std::nullopt;
        if (delta < 0 && value == std::numeric_limits<T>::lowest()) return std::nullopt;
        return shift(value, delta);
    }

    static std::optional<Cell> step(const Cell& from, int dx, int dy) {
        auto x = checkedStep(from.x, dx);
        auto y = checkedStep(from.y, dy);
        if (!x || !y) return std::nullopt;
        return Cell(*x, *y);
    }

    static Cell offset(const Cell& from, int dx, int dy) {
        return Cell(shift(from.x, dx), shift(from.y, dy));
    }

    static T shift(T value, int delta) {
        if (delta > 0) return static_cast<T>(value + T(1));
        if (delta < 0) return static_cast<T>(value - T(1));
        return value;
    }
};

/// Unit step for a direction character: N U ^ (up), S D v (down),
/// E R > (right), W L < (left).
template <typename T>
Vec2D<T> directionFromChar(char c) {
    static_assert(std::is_signed_v<T>, "direction offsets need a signed type");
    switch (c) {
        case 'N': case 'U': case '^': return Vec2D<T>(-1, 0);
        case 'S': case 'D': case 'v': return Vec2D<T>(1, 0);
        case 'E': case 'R': case '>': return Vec2D<T>(0, 1);
        case 'W': case 'L': case '<': return Vec2D<T>(0, -1);
    }
    throw std::invalid_argument(std::string("Unknown direction: '") + c + "'");
}

} // namespace puzlib
