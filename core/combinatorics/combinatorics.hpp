#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>

namespace puzlib {

// ─── Combinatorics ─────────────────────────────────────────────

/// All distinct orderings of a multiset. Repeated items only produce
/// distinct sequences once, e.g. {1, 1, 2} -> 3 sequences.
/// Iterative Heap's algorithm; swaps of equal items are skipped.
template <typename T>
std::set<std::vector<T>> permutationsWithDuplicates(std::vector<T> items) {
    std::set<std::vector<T>> perms;
    perms.insert(items);

    std::vector<size_t> state(items.size(), 0);
    size_t idx = 1;
    while (idx < items.size()) {
        if (state[idx] < idx) {
            size_t other = (idx % 2 == 0) ? 0 : state[idx];
            if (!(items[other] == items[idx])) {
                std::swap(items[other], items[idx]);
                perms.insert(items);
            }
            state[idx]++;
            idx = 1;
        } else {
            state[idx] = 0;
            idx++;
        }
    }
    return perms;
}

/// Every k-element selection of items, preserving their relative order,
/// listed in lexicographic order of positions. k == 0 yields one empty
/// selection; k > items.size() yields none.
template <typename T>
std::vector<std::vector<T>> combinations(const std::vector<T>& items, size_t k) {
    std::vector<std::vector<T>> result;
    size_t n = items.size();
    if (k > n) return result;

    std::vector<size_t> positions(k);
    for (size_t i = 0; i < k; i++) positions[i] = i;

    while (true) {
        std::vector<T> pick;
        pick.reserve(k);
        for (size_t p : positions) pick.push_back(items[p]);
        result.push_back(std::move(pick));

        // Rightmost position that can still advance.
        size_t i = k;
        while (i > 0 && positions[i - 1] == n - k + (i - 1)) i--;
        if (i == 0) break;

        positions[i - 1]++;
        for (size_t j = i; j < k; j++) positions[j] = positions[j - 1] + 1;
    }
    return result;
}

/// Binomial coefficient C(n, k). Throws std::overflow_error when the
/// result does not fit in 64 bits.
uint64_t choose(uint64_t n, uint64_t k);

} // namespace puzlib
