#include "graph/disjoint_set.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace puzlib {

DisjointSet::DisjointSet(size_t node_count, UnionStrategy strategy)
    : strategy_(strategy), set_count_(node_count) {
    nodes_.reserve(node_count);
    for (size_t i = 0; i < node_count; i++) {
        nodes_.push_back(Entry{i});
    }
}

void DisjointSet::checkIndex(size_t idx) const {
    if (idx >= nodes_.size()) {
        throw std::out_of_range("DisjointSet index " + std::to_string(idx) +
                                " out of range (size " + std::to_string(nodes_.size()) + ")");
    }
}

size_t DisjointSet::findRoot(size_t idx) {
    checkIndex(idx);

    size_t root = idx;
    while (nodes_[root].parent != root) {
        root = nodes_[root].parent;
    }
    // Compress: point every node on the walked path at the root.
    while (nodes_[idx].parent != root) {
        size_t next = nodes_[idx].parent;
        nodes_[idx].parent = root;
        idx = next;
    }
    return root;
}

bool DisjointSet::unite(size_t left, size_t right) {
    size_t left_root = findRoot(left);
    size_t right_root = findRoot(right);
    if (left_root == right_root) return false;

    bool swap_roots = false;
    switch (strategy_) {
        case UnionStrategy::BY_SIZE:
            swap_roots = nodes_[left_root].size < nodes_[right_root].size;
            break;
        case UnionStrategy::BY_RANK:
            swap_roots = nodes_[left_root].rank < nodes_[right_root].rank;
            break;
    }
    if (swap_roots) std::swap(left_root, right_root);

    nodes_[right_root].parent = left_root;
    nodes_[left_root].size += nodes_[right_root].size;
    if (nodes_[left_root].rank == nodes_[right_root].rank) {
        nodes_[left_root].rank++;
    }
    set_count_--;
    return true;
}

bool DisjointSet::connected(size_t left, size_t right) {
    return findRoot(left) == findRoot(right);
}

size_t DisjointSet::setSize(size_t idx) {
    return nodes_[findRoot(idx)].size;
}

} // namespace puzlib
