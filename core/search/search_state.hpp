#pragma once

#include <cstddef>
#include <vector>

namespace puzlib {

/// Ordered sequence of states from start to goal, both inclusive.
template <typename State>
using Path = std::vector<State>;

/// Result of a weighted search: the cheapest path and its total cost.
template <typename State, typename Cost>
struct WeightedPath {
    Path<State> path;
    Cost cost{};
};

/// Per-call search limits.
struct SearchConfig {
    int max_expansions = 0;         // 0 = unlimited
    double budget_seconds = 0.0;    // 0 = unlimited
    bool validate_costs = false;    // throw on negative edge costs / heuristics
};

/// Counters filled in by a search when the caller asks for them.
struct SearchStats {
    int expansions = 0;
    size_t visited = 0;             // distinct states discovered
    size_t max_frontier = 0;
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;
    bool found = false;
};

} // namespace puzlib
