#pragma once

#include <cstddef>
#include <vector>

namespace puzlib {

/// How DisjointSet picks the surviving root when merging two trees.
enum class UnionStrategy {
    BY_SIZE,    // larger tree becomes the root
    BY_RANK     // taller (by rank bound) tree becomes the root
};

// ─── Disjoint Set ──────────────────────────────────────────────
// Union-find over the indices [0, n). Path compression on every
// findRoot(). Indices outside the range throw std::out_of_range.

class DisjointSet {
public:
    explicit DisjointSet(size_t node_count, UnionStrategy strategy = UnionStrategy::BY_SIZE);

    /// Root of the tree containing idx.
    size_t findRoot(size_t idx);

    /// Merge the sets containing left and right.
    /// Returns true if they were previously disconnected.
    bool unite(size_t left, size_t right);

    bool connected(size_t left, size_t right);

    /// Number of elements in the set containing idx.
    size_t setSize(size_t idx);

    /// Number of disjoint sets.
    size_t setCount() const { return set_count_; }

    /// Number of elements.
    size_t size() const { return nodes_.size(); }

    UnionStrategy strategy() const { return strategy_; }

private:
    struct Entry {
        size_t parent;
        size_t size = 1;
        size_t rank = 0;
    };

    void checkIndex(size_t idx) const;

    std::vector<Entry> nodes_;
    UnionStrategy strategy_;
    size_t set_count_;
};

} // namespace puzlib
