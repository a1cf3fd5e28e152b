#pragma once

#include <cstddef>
#include <vector>

namespace puzlib {

/// Middle element(s) of a sequence: one for odd lengths, two for even.
/// Sequences of length <= 2 are returned whole. On sorted input this is
/// the median.
template <typename T>
std::vector<T> mid(const std::vector<T>& values) {
    size_t len = values.size();
    if (len <= 2) return values;
    size_t midpoint = len / 2;
    if (len % 2 == 1) {
        return {values[midpoint]};
    }
    return {values[midpoint - 1], values[midpoint]};
}

} // namespace puzlib
