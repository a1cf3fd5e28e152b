#pragma once

#include "search/search_run.hpp"
#include "search/search_state.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// ─── Graph Search ──────────────────────────────────────────────
// DFS, BFS, Dijkstra and A* over a caller-defined state space.
//
// A State must be copyable, equality comparable and have a
// std::hash<State> specialization. The graph is never materialized:
// it is described by a neighbor function called on each expanded state.
//
//   unweighted:  State -> iterable of State
//   weighted:    State -> iterable of std::pair<State, Cost>
//
// Cost is deduced from the pair and must be arithmetic. Not finding the
// goal is a normal outcome and yields an empty optional.

namespace puzlib {

namespace detail {

template <typename State, typename NeighborFn>
using NeighborRange = std::invoke_result_t<NeighborFn&, const State&>;

template <typename State, typename NeighborFn>
using EdgeOf = std::decay_t<decltype(*std::begin(std::declval<NeighborRange<State, NeighborFn>&>()))>;

template <typename State, typename NeighborFn>
using CostOf = std::decay_t<typename EdgeOf<State, NeighborFn>::second_type>;

template <typename State, typename Cost>
struct FrontierEntry {
    Cost priority;
    Cost cost;
    uint64_t order;     // push sequence, breaks priority ties first-in first-out
    State state;
};

template <typename State, typename Cost>
struct FrontierGreater {
    bool operator()(const FrontierEntry<State, Cost>& a,
                    const FrontierEntry<State, Cost>& b) const {
        if (a.priority != b.priority) return b.priority < a.priority;
        return a.order > b.order;
    }
};

template <typename State, typename Cost>
using MinFrontier = std::priority_queue<FrontierEntry<State, Cost>,
                                        std::vector<FrontierEntry<State, Cost>>,
                                        FrontierGreater<State, Cost>>;

template <typename Cost>
void checkNonNegative(const SearchRun& run, Cost value, const char* what) {
    if constexpr (std::is_signed_v<Cost>) {
        if (value < Cost{}) {
            throw std::invalid_argument(std::string(run.algorithm()) + ": negative " + what +
                                        " (" + std::to_string(value) + ")");
        }
    }
}

struct NoGoal {
    template <typename State>
    bool operator()(const State&) const { return false; }
};

template <typename Cost>
struct ZeroHeuristic {
    template <typename State>
    Cost operator()(const State&) const { return Cost{}; }
};

// Shared skeleton of Dijkstra and A*. best_cost ends up holding the
// cheapest known cost of every discovered state.
template <typename State, typename Cost, typename NeighborFn, typename GoalFn,
          typename HeuristicFn>
std::optional<WeightedPath<State, Cost>> bestFirst(
    SearchRun& run,
    const State& start,
    NeighborFn& neighbors,
    GoalFn& is_goal,
    HeuristicFn& heuristic,
    bool validate,
    std::unordered_map<State, Cost>& best_cost
);

} // namespace detail

// ─── Path Reconstruction ───────────────────────────────────────

/// Walk predecessors back from goal until reaching a state with none
/// (the start), and return the path from start to goal.
template <typename State>
Path<State> reconstructPath(const std::unordered_map<State, State>& predecessors, State goal) {
    Path<State> path;
    path.push_back(std::move(goal));
    auto it = predecessors.find(path.back());
    // A valid predecessor chain is never longer than the map.
    while (it != predecessors.end() && path.size() <= predecessors.size()) {
        path.push_back(it->second);
        it = predecessors.find(path.back());
    }
    std::reverse(path.begin(), path.end());
    return path;
}

/// Goal predicate matching a single explicit goal state.
template <typename State>
auto goalIs(State goal) {
    return [goal = std::move(goal)](const State& state) { return state == goal; };
}

// ─── Depth-First Search ────────────────────────────────────────

/// Depth-first search with an explicit stack.
/// Returns some path to a goal state, not necessarily the shortest.
template <typename State, typename NeighborFn, typename GoalFn>
std::optional<Path<State>> dfs(
    const State& start,
    NeighborFn&& neighbors,
    GoalFn&& is_goal,
    const SearchConfig& config = {},
    SearchStats* stats = nullptr
) {
    SearchRun run("dfs", config, stats);

    // Each entry carries the state it was pushed from.
    std::vector<std::pair<State, std::optional<State>>> stack;
    std::unordered_set<State> visited;
    std::unordered_map<State, State> predecessors;

    stack.emplace_back(start, std::nullopt);

    while (!stack.empty()) {
        auto [node, parent] = std::move(stack.back());
        stack.pop_back();

        if (!visited.insert(node).second) continue;
        if (parent) predecessors.emplace(node, std::move(*parent));

        if (is_goal(node)) {
            run.finish(true, visited.size());
            return reconstructPath(predecessors, std::move(node));
        }
        if (!run.tryExpand()) break;

        for (auto&& next : neighbors(node)) {
            if (!visited.count(next)) {
                stack.emplace_back(next, node);
            }
        }
        run.trackFrontier(stack.size());
    }

    run.finish(false, visited.size());
    return std::nullopt;
}

// ─── Breadth-First Search ──────────────────────────────────────

/// Breadth-first search. The returned path has the fewest edges of any
/// path from start to a goal state. States are marked visited when
/// enqueued, so each one enters the queue at most once.
template <typename State, typename NeighborFn, typename GoalFn>
std::optional<Path<State>> bfs(
    const State& start,
    NeighborFn&& neighbors,
    GoalFn&& is_goal,
    const SearchConfig& config = {},
    SearchStats* stats = nullptr
) {
    SearchRun run("bfs", config, stats);

    std::deque<State> queue;
    std::unordered_set<State> visited;
    std::unordered_map<State, State> predecessors;

    queue.push_back(start);
    visited.insert(start);

    while (!queue.empty()) {
        State node = std::move(queue.front());
        queue.pop_front();

        if (is_goal(node)) {
            run.finish(true, visited.size());
            return reconstructPath(predecessors, std::move(node));
        }
        if (!run.tryExpand()) break;

        for (auto&& next : neighbors(node)) {
            if (visited.insert(next).second) {
                predecessors.emplace(next, node);
                queue.push_back(next);
            }
        }
        run.trackFrontier(queue.size());
    }

    run.finish(false, visited.size());
    return std::nullopt;
}

// ─── Dijkstra ──────────────────────────────────────────────────

/// Lowest-cost path from start to a goal state.
///
/// Precondition: every edge cost is non-negative. This is not checked
/// unless config.validate_costs is set, in which case a negative cost
/// throws std::invalid_argument. With negative costs the result is
/// unspecified.
///
/// Stale queue entries (pushed before a cheaper path to the same state
/// was found) are skipped when popped instead of being removed.
template <typename State, typename NeighborFn, typename GoalFn>
std::optional<WeightedPath<State, detail::CostOf<State, NeighborFn>>> dijkstra(
    const State& start,
    NeighborFn&& neighbors,
    GoalFn&& is_goal,
    const SearchConfig& config = {},
    SearchStats* stats = nullptr
) {
    using Cost = detail::CostOf<State, NeighborFn>;
    static_assert(std::is_arithmetic_v<Cost>, "edge costs must be arithmetic");

    SearchRun run("dijkstra", config, stats);
    detail::ZeroHeuristic<Cost> heuristic;
    std::unordered_map<State, Cost> best_cost;
    return detail::bestFirst<State, Cost>(run, start, neighbors, is_goal, heuristic,
                                          config.validate_costs, best_cost);
}

/// Exhaustive Dijkstra: minimum cost from start to every reachable
/// state, start included at cost 0. Same preconditions as dijkstra().
/// If the budget runs out, states still queued map to upper bounds.
template <typename State, typename NeighborFn>
std::unordered_map<State, detail::CostOf<State, NeighborFn>> dijkstraDistances(
    const State& start,
    NeighborFn&& neighbors,
    const SearchConfig& config = {},
    SearchStats* stats = nullptr
) {
    using Cost = detail::CostOf<State, NeighborFn>;
    static_assert(std::is_arithmetic_v<Cost>, "edge costs must be arithmetic");

    SearchRun run("dijkstra-distances", config, stats);
    detail::NoGoal never;
    detail::ZeroHeuristic<Cost> heuristic;
    std::unordered_map<State, Cost> best_cost;
    detail::bestFirst<State, Cost>(run, start, neighbors, never, heuristic,
                                   config.validate_costs, best_cost);
    return best_cost;
}

// ─── A* ────────────────────────────────────────────────────────

/// A* search: Dijkstra with the queue keyed by cost so far plus
/// heuristic(state).
///
/// Preconditions (caller obligations, not verified):
/// - edge costs are non-negative;
/// - the heuristic is admissible (never overestimates the remaining
///   cost), otherwise the returned path may not be the cheapest;
/// - ideally the heuristic is also consistent. An admissible but
///   inconsistent heuristic still gives the optimal cost, at the price
///   of re-expanding states.
/// config.validate_costs turns negative edge costs and negative
/// heuristic values into std::invalid_argument.
template <typename State, typename NeighborFn, typename GoalFn, typename HeuristicFn>
std::optional<WeightedPath<State, detail::CostOf<State, NeighborFn>>> astar(
    const State& start,
    NeighborFn&& neighbors,
    GoalFn&& is_goal,
    HeuristicFn&& heuristic,
    const SearchConfig& config = {},
    SearchStats* stats = nullptr
) {
    using Cost = detail::CostOf<State, NeighborFn>;
    static_assert(std::is_arithmetic_v<Cost>, "edge costs must be arithmetic");

    SearchRun run("astar", config, stats);
    std::unordered_map<State, Cost> best_cost;
    return detail::bestFirst<State, Cost>(run, start, neighbors, is_goal, heuristic,
                                          config.validate_costs, best_cost);
}

// ─── Best-first skeleton ───────────────────────────────────────

namespace detail {

template <typename State, typename Cost, typename NeighborFn, typename GoalFn,
          typename HeuristicFn>
std::optional<WeightedPath<State, Cost>> bestFirst(
    SearchRun& run,
    const State& start,
    NeighborFn& neighbors,
    GoalFn& is_goal,
    HeuristicFn& heuristic,
    bool validate,
    std::unordered_map<State, Cost>& best_cost
) {
    auto estimate = [&](const State& state) {
        Cost h = static_cast<Cost>(heuristic(state));
        if (validate) checkNonNegative(run, h, "heuristic estimate");
        return h;
    };

    std::unordered_map<State, State> predecessors;
    MinFrontier<State, Cost> frontier;
    uint64_t order = 0;

    best_cost.clear();
    best_cost.emplace(start, Cost{});
    frontier.push({estimate(start), Cost{}, order++, start});

    while (!frontier.empty()) {
        FrontierEntry<State, Cost> entry = frontier.top();
        frontier.pop();

        // A cheaper path to this state was queued after this entry.
        auto known = best_cost.find(entry.state);
        if (known != best_cost.end() && known->second < entry.cost) continue;

        if (is_goal(entry.state)) {
            run.finish(true, best_cost.size());
            return WeightedPath<State, Cost>{reconstructPath(predecessors, entry.state),
                                             entry.cost};
        }
        if (!run.tryExpand()) break;

        for (auto&& [next, edge_cost] : neighbors(entry.state)) {
            Cost step = static_cast<Cost>(edge_cost);
            if (validate) checkNonNegative(run, step, "edge cost");

            Cost next_cost = entry.cost + step;
            auto it = best_cost.find(next);
            if (it != best_cost.end()) {
                if (!(next_cost < it->second)) continue;
                it->second = next_cost;
            } else {
                best_cost.emplace(next, next_cost);
            }
            predecessors.insert_or_assign(next, entry.state);
            frontier.push({static_cast<Cost>(next_cost + estimate(next)), next_cost, order++, next});
        }
        run.trackFrontier(frontier.size());
    }

    run.finish(false, best_cost.size());
    return std::nullopt;
}

} // namespace detail

} // namespace puzlib
