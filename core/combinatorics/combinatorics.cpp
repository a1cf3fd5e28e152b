#include "combinatorics/combinatorics.hpp"
#include "math/number_theory.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace puzlib {

uint64_t choose(uint64_t n, uint64_t k) {
    if (k > n) return 0;
    uint64_t steps = std::min(k, n - k);

    // result * (n - i) / (i + 1) stays integral at every step; divide out
    // common factors first so the multiplication overflows as late as possible.
    uint64_t result = 1;
    for (uint64_t i = 0; i < steps; i++) {
        uint64_t num = n - i;
        uint64_t den = i + 1;
        uint64_t g = gcd(result, den);
        result /= g;
        den /= g;
        num /= den;     // den now divides num
        if (num != 0 && result > std::numeric_limits<uint64_t>::max() / num) {
            throw std::overflow_error("choose(" + std::to_string(n) + ", " +
                                      std::to_string(k) + ") overflows 64 bits");
        }
        result *= num;
    }
    return result;
}

} // namespace puzlib
