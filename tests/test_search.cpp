#include <gtest/gtest.h>
#include "search/graph_search.hpp"
#include "search/budget_manager.hpp"
#include "measure/direction.hpp"
#include "measure/vec2d.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace puzlib;

namespace {

using Cell = Vec2D<int>;

// Adjacency-list graph over node indices with weighted directed edges.
struct Layout {
    std::vector<std::vector<std::pair<int, int>>> edges;

    std::vector<std::pair<int, int>> weighted(int node) const { return edges[node]; }

    std::vector<int> unweighted(int node) const {
        std::vector<int> out;
        for (const auto& [next, _] : edges[node]) out.push_back(next);
        return out;
    }
};

// Five-node directed graph with a cheap detour around the direct edges.
Layout docExample() {
    Layout g;
    g.edges = {
        {{2, 10}, {1, 1}},          // 0
        {{3, 2}},                   // 1
        {{1, 1}, {3, 3}, {4, 1}},   // 2
        {{0, 7}, {4, 2}},           // 3
        {},                         // 4
    };
    return g;
}

// Square grid with unit edges between 4-adjacent cells, except entering
// a cell listed in expensive costs the listed amount.
struct Grid {
    int size = 3;
    std::map<Cell, int> expensive;

    bool inBounds(const Cell& c) const {
        return c.x >= 0 && c.y >= 0 && c.x < size && c.y < size;
    }

    std::vector<Cell> neighbors(const Cell& c) const {
        std::vector<Cell> out;
        for (const auto& next : Dir<int>::cardinals(c)) {
            if (next && inBounds(*next)) out.push_back(*next);
        }
        return out;
    }

    std::vector<std::pair<Cell, int>> weighted(const Cell& c) const {
        std::vector<std::pair<Cell, int>> out;
        for (const auto& next : neighbors(c)) {
            auto it = expensive.find(next);
            out.emplace_back(next, it == expensive.end() ? 1 : it->second);
        }
        return out;
    }
};

bool isAdjacentChain(const Path<Cell>& path) {
    for (size_t i = 1; i < path.size(); i++) {
        if (path[i - 1].manhattan(path[i]) != 1) return false;
    }
    return true;
}

// Exhaustive enumeration of simple paths, as reference for small graphs.
void enumeratePaths(const Layout& g, int node, int goal, std::vector<bool>& on_path,
                    int edges, int cost, int& best_edges, int& best_cost) {
    if (node == goal) {
        best_edges = std::min(best_edges, edges);
        best_cost = std::min(best_cost, cost);
        return;
    }
    on_path[node] = true;
    for (const auto& [next, w] : g.edges[node]) {
        if (!on_path[next]) {
            enumeratePaths(g, next, goal, on_path, edges + 1, cost + w, best_edges, best_cost);
        }
    }
    on_path[node] = false;
}

Layout randomLayout(std::mt19937& rng, int nodes, double density) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<int> weight(0, 9);
    Layout g;
    g.edges.resize(nodes);
    for (int a = 0; a < nodes; a++) {
        for (int b = 0; b < nodes; b++) {
            if (a != b && coin(rng) < density) g.edges[a].emplace_back(b, weight(rng));
        }
    }
    return g;
}

} // namespace

// ─── Concrete grid scenarios ───────────────────────────────────

TEST(SearchTest, BfsShortestPathOnGrid) {
    Grid grid;
    auto path = bfs(Cell(0, 0),
                    [&](const Cell& c) { return grid.neighbors(c); },
                    goalIs(Cell(2, 2)));
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 5u);  // 4 edges
    EXPECT_EQ(path->front(), Cell(0, 0));
    EXPECT_EQ(path->back(), Cell(2, 2));
    EXPECT_TRUE(isAdjacentChain(*path));
}

TEST(SearchTest, DijkstraUnitGridCost) {
    Grid grid;
    auto result = dijkstra(Cell(0, 0),
                           [&](const Cell& c) { return grid.weighted(c); },
                           goalIs(Cell(2, 2)));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cost, 4);
    EXPECT_EQ(result->path.size(), 5u);
    EXPECT_TRUE(isAdjacentChain(result->path));
}

TEST(SearchTest, AStarManhattanUnitGridCost) {
    Grid grid;
    Cell goal(2, 2);
    auto result = astar(Cell(0, 0),
                        [&](const Cell& c) { return grid.weighted(c); },
                        goalIs(goal),
                        [&](const Cell& c) { return c.manhattan(goal); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cost, 4);
    EXPECT_EQ(result->path.front(), Cell(0, 0));
    EXPECT_EQ(result->path.back(), goal);
}

TEST(SearchTest, ExpensiveCellIsAvoidedWhenAlternativeExists) {
    Grid grid;
    grid.expensive[Cell(1, 1)] = 10;
    Cell goal(2, 2);

    auto d = dijkstra(Cell(0, 0), [&](const Cell& c) { return grid.weighted(c); }, goalIs(goal));
    auto a = astar(Cell(0, 0), [&](const Cell& c) { return grid.weighted(c); }, goalIs(goal),
                   [&](const Cell& c) { return c.manhattan(goal); });
    ASSERT_TRUE(d.has_value());
    ASSERT_TRUE(a.has_value());

    // Same cost as the unweighted grid: the centre is routed around.
    EXPECT_EQ(d->cost, 4);
    EXPECT_EQ(a->cost, 4);
    EXPECT_EQ(std::count(d->path.begin(), d->path.end(), Cell(1, 1)), 0);
    EXPECT_EQ(std::count(a->path.begin(), a->path.end(), Cell(1, 1)), 0);
}

TEST(SearchTest, ExpensiveCellForcesLongerDetour) {
    Grid grid;
    grid.expensive[Cell(0, 1)] = 10;
    Cell goal(0, 2);

    auto hops = bfs(Cell(0, 0), [&](const Cell& c) { return grid.neighbors(c); }, goalIs(goal));
    auto d = dijkstra(Cell(0, 0), [&](const Cell& c) { return grid.weighted(c); }, goalIs(goal));
    auto a = astar(Cell(0, 0), [&](const Cell& c) { return grid.weighted(c); }, goalIs(goal),
                   [&](const Cell& c) { return c.manhattan(goal); });
    ASSERT_TRUE(hops && d && a);

    EXPECT_EQ(hops->size(), 3u);    // straight through the expensive cell
    EXPECT_EQ(d->cost, 4);          // around it, instead of 10 + 1
    EXPECT_EQ(a->cost, 4);
    EXPECT_EQ(d->path.size(), 5u);
    EXPECT_EQ(std::count(d->path.begin(), d->path.end(), Cell(0, 1)), 0);
}

TEST(SearchTest, AStarWithDigitWeightsMatchesKnownAnswer) {
    // Dial-lock chamber: stepping between digits a and b costs the
    // rotation distance on a 10-digit dial plus one.
    std::vector<std::string> rows = {
        "#######",
        "#6769##",
        "S50505E",
        "#97434#",
        "#######",
    };
    std::map<Cell, int> values;
    Cell start, end;
    for (int r = 0; r < static_cast<int>(rows.size()); r++) {
        for (int c = 0; c < static_cast<int>(rows[r].size()); c++) {
            char ch = rows[r][c];
            if (ch == 'S') start = Cell(r, c);
            if (ch == 'E') end = Cell(r, c);
            if (ch == 'S' || ch == 'E') values[Cell(r, c)] = 0;
            if (ch >= '0' && ch <= '9') values[Cell(r, c)] = ch - '0';
        }
    }

    auto moves = [&](const Cell& cur) {
        std::vector<std::pair<Cell, int>> out;
        for (const auto& next : Dir<int>::cardinals(cur)) {
            if (!next || !values.count(*next)) continue;
            int diff = std::abs(values.at(cur) - values.at(*next));
            out.emplace_back(*next, std::min(diff, 10 - diff) + 1);
        }
        return out;
    };

    auto a = astar(start, moves, goalIs(end), [&](const Cell& c) { return c.manhattan(end); });
    auto d = dijkstra(start, moves, goalIs(end));
    ASSERT_TRUE(a && d);
    EXPECT_EQ(a->cost, 28);
    EXPECT_EQ(d->cost, 28);
}

// ─── Small adjacency graphs ────────────────────────────────────

TEST(SearchTest, DijkstraDocExample) {
    Layout g = docExample();
    auto moves = [&](int n) { return g.weighted(n); };

    auto r1 = dijkstra(3, moves, goalIs(0));
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1->cost, 7);
    EXPECT_EQ(r1->path, (Path<int>{3, 0}));

    auto r2 = dijkstra(0, moves, goalIs(4));
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2->cost, 5);
    EXPECT_EQ(r2->path, (Path<int>{0, 1, 3, 4}));
}

TEST(SearchTest, DijkstraDistancesToAllReachable) {
    Layout g = docExample();
    auto dist = dijkstraDistances(0, [&](int n) { return g.weighted(n); });

    ASSERT_EQ(dist.size(), 5u);
    EXPECT_EQ(dist.at(0), 0);
    EXPECT_EQ(dist.at(1), 1);
    EXPECT_EQ(dist.at(2), 10);
    EXPECT_EQ(dist.at(3), 3);
    EXPECT_EQ(dist.at(4), 5);

    auto from_four = dijkstraDistances(4, [&](int n) { return g.weighted(n); });
    ASSERT_EQ(from_four.size(), 1u);
    EXPECT_EQ(from_four.at(4), 0);
}

TEST(SearchTest, StaleQueueEntriesAreSkipped) {
    // 1 is first queued at cost 10, then relaxed to 2 via node 2.
    Layout g;
    g.edges = {
        {{1, 10}, {2, 1}},
        {{3, 1}},
        {{1, 1}},
        {},
    };

    SearchStats stats;
    auto result = dijkstra(0, [&](int n) { return g.weighted(n); }, goalIs(3), {}, &stats);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cost, 3);
    EXPECT_EQ(result->path, (Path<int>{0, 2, 1, 3}));
    EXPECT_EQ(stats.expansions, 3);  // 0, 2, 1; the stale entry for 1 is not expanded
    EXPECT_TRUE(stats.found);
}

TEST(SearchTest, FloatingPointCosts) {
    auto moves = [](int n) {
        std::vector<std::pair<int, double>> out;
        if (n == 0) out = {{1, 0.5}, {2, 2.0}};
        if (n == 1) out = {{2, 0.25}};
        return out;
    };
    auto result = dijkstra(0, moves, goalIs(2));
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->cost, 0.75);
    EXPECT_EQ(result->path, (Path<int>{0, 1, 2}));
}

TEST(SearchTest, GoalPredicateAcceptsAnyMatchingState) {
    Grid grid;
    auto path = bfs(Cell(0, 0),
                    [&](const Cell& c) { return grid.neighbors(c); },
                    [](const Cell& c) { return c.x == 2; });
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 3u);
    EXPECT_EQ(path->back().x, 2);
}

// ─── Boundaries ────────────────────────────────────────────────

TEST(SearchTest, StartIsGoalForEveryAlgorithm) {
    Layout g = docExample();
    auto weighted = [&](int n) { return g.weighted(n); };
    auto unweighted = [&](int n) { return g.unweighted(n); };

    auto d = dfs(2, unweighted, goalIs(2));
    auto b = bfs(2, unweighted, goalIs(2));
    auto dj = dijkstra(2, weighted, goalIs(2));
    auto a = astar(2, weighted, goalIs(2), [](int) { return 0; });

    ASSERT_TRUE(d && b && dj && a);
    EXPECT_EQ(*d, (Path<int>{2}));
    EXPECT_EQ(*b, (Path<int>{2}));
    EXPECT_EQ(dj->path, (Path<int>{2}));
    EXPECT_EQ(dj->cost, 0);
    EXPECT_EQ(a->path, (Path<int>{2}));
    EXPECT_EQ(a->cost, 0);
}

TEST(SearchTest, UnreachableGoalForEveryAlgorithm) {
    // Two components: {0, 1} and {2, 3}.
    Layout g;
    g.edges = {
        {{1, 1}},
        {{0, 1}},
        {{3, 1}},
        {{2, 1}},
    };
    auto weighted = [&](int n) { return g.weighted(n); };
    auto unweighted = [&](int n) { return g.unweighted(n); };

    SearchStats stats;
    EXPECT_FALSE(dfs(0, unweighted, goalIs(3)).has_value());
    EXPECT_FALSE(bfs(0, unweighted, goalIs(3), {}, &stats).has_value());
    EXPECT_FALSE(stats.found);
    EXPECT_FALSE(stats.budget_exhausted);
    EXPECT_EQ(stats.visited, 2u);
    EXPECT_FALSE(dijkstra(0, weighted, goalIs(3)).has_value());
    EXPECT_FALSE(astar(0, weighted, goalIs(3), [](int) { return 0; }).has_value());
}

// ─── Properties against brute force ────────────────────────────

TEST(SearchTest, RandomGraphsMatchExhaustiveEnumeration) {
    std::mt19937 rng(20240517);
    const int nodes = 7;
    int checked = 0;

    for (int trial = 0; trial < 60; trial++) {
        Layout g = randomLayout(rng, nodes, 0.3);
        auto weighted = [&](int n) { return g.weighted(n); };
        auto unweighted = [&](int n) { return g.unweighted(n); };

        // Exact remaining cost from every node, halved: admissible.
        std::vector<int> remaining(nodes, 0);
        const int goal = nodes - 1;
        for (int v = 0; v < nodes; v++) {
            std::vector<bool> on_path(nodes, false);
            int best_edges = std::numeric_limits<int>::max();
            int best_cost = std::numeric_limits<int>::max();
            enumeratePaths(g, v, goal, on_path, 0, 0, best_edges, best_cost);
            remaining[v] = best_cost == std::numeric_limits<int>::max() ? 0 : best_cost / 2;
        }

        std::vector<bool> on_path(nodes, false);
        int best_edges = std::numeric_limits<int>::max();
        int best_cost = std::numeric_limits<int>::max();
        enumeratePaths(g, 0, goal, on_path, 0, 0, best_edges, best_cost);

        auto b = bfs(0, unweighted, goalIs(goal));
        auto d = dfs(0, unweighted, goalIs(goal));
        auto dj = dijkstra(0, weighted, goalIs(goal));
        auto a = astar(0, weighted, goalIs(goal), [&](int n) { return remaining[n]; });

        if (best_edges == std::numeric_limits<int>::max()) {
            EXPECT_FALSE(b.has_value());
            EXPECT_FALSE(d.has_value());
            EXPECT_FALSE(dj.has_value());
            EXPECT_FALSE(a.has_value());
            continue;
        }

        checked++;
        ASSERT_TRUE(b && d && dj && a);
        EXPECT_EQ(static_cast<int>(b->size()) - 1, best_edges);
        EXPECT_EQ(dj->cost, best_cost);
        EXPECT_EQ(a->cost, dj->cost);
        EXPECT_EQ(d->front(), 0);
        EXPECT_EQ(d->back(), goal);

        // The returned path is made of real edges summing to the cost.
        int sum = 0;
        for (size_t i = 1; i < dj->path.size(); i++) {
            int w = std::numeric_limits<int>::max();
            for (const auto& [next, cost] : g.edges[dj->path[i - 1]]) {
                if (next == dj->path[i]) w = std::min(w, cost);
            }
            ASSERT_NE(w, std::numeric_limits<int>::max());
            sum += w;
        }
        EXPECT_EQ(sum, dj->cost);
    }
    EXPECT_GT(checked, 0);
}

TEST(SearchTest, RepeatedSearchIsIdempotent) {
    Grid grid;
    grid.expensive[Cell(1, 0)] = 3;
    grid.expensive[Cell(0, 1)] = 3;
    Cell goal(2, 2);
    auto moves = [&](const Cell& c) { return grid.weighted(c); };
    auto h = [&](const Cell& c) { return c.manhattan(goal); };

    auto first = dijkstra(Cell(0, 0), moves, goalIs(goal));
    auto second = dijkstra(Cell(0, 0), moves, goalIs(goal));
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->cost, second->cost);
    EXPECT_EQ(first->path, second->path);

    auto third = astar(Cell(0, 0), moves, goalIs(goal), h);
    auto fourth = astar(Cell(0, 0), moves, goalIs(goal), h);
    ASSERT_TRUE(third && fourth);
    EXPECT_EQ(third->cost, first->cost);
    EXPECT_EQ(third->cost, fourth->cost);
}

// ─── Depth-first specifics ─────────────────────────────────────

TEST(SearchTest, DfsHandlesLongChainsWithoutRecursion) {
    const int length = 200000;
    auto next = [&](int n) {
        std::vector<int> out;
        if (n < length) out.push_back(n + 1);
        return out;
    };
    auto path = dfs(0, next, goalIs(length));
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), static_cast<size_t>(length) + 1);
    EXPECT_EQ(path->front(), 0);
    EXPECT_EQ(path->back(), length);
}

TEST(SearchTest, DfsPathFollowsEdges) {
    Grid grid;
    grid.size = 5;
    auto path = dfs(Cell(0, 0), [&](const Cell& c) { return grid.neighbors(c); }, goalIs(Cell(4, 4)));
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->front(), Cell(0, 0));
    EXPECT_EQ(path->back(), Cell(4, 4));
    EXPECT_TRUE(isAdjacentChain(*path));

    // No state repeats along the path.
    auto sorted = *path;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
}

TEST(SearchTest, BfsEnqueuesEachStateOnce) {
    // Complete graph on 6 nodes: every state is reachable from every other.
    const int nodes = 6;
    int calls = 0;
    auto all = [&](int n) {
        calls++;
        std::vector<int> out;
        for (int i = 0; i < nodes; i++) {
            if (i != n) out.push_back(i);
        }
        return out;
    };

    SearchStats stats;
    auto path = bfs(0, all, [](int) { return false; }, {}, &stats);
    EXPECT_FALSE(path.has_value());
    EXPECT_EQ(calls, nodes);
    EXPECT_EQ(stats.expansions, nodes);
    EXPECT_EQ(stats.visited, static_cast<size_t>(nodes));
    EXPECT_LE(stats.max_frontier, static_cast<size_t>(nodes - 1));
}

// ─── Path reconstruction ───────────────────────────────────────

TEST(SearchTest, ReconstructPathWalksPredecessors) {
    std::unordered_map<int, int> predecessors = {{2, 1}, {1, 0}, {5, 2}};
    EXPECT_EQ(reconstructPath(predecessors, 5), (Path<int>{0, 1, 2, 5}));
    EXPECT_EQ(reconstructPath(predecessors, 0), (Path<int>{0}));
}

// ─── Limits and validation ─────────────────────────────────────

TEST(SearchTest, ExpansionBudgetStopsSearch) {
    auto next = [](int n) { return std::vector<std::pair<int, int>>{{n + 1, 1}}; };
    SearchConfig config;
    config.max_expansions = 3;

    SearchStats stats;
    auto result = dijkstra(0, next, goalIs(100), config, &stats);
    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(stats.budget_exhausted);
    EXPECT_EQ(stats.expansions, 3);

    // Enough budget: the same search succeeds.
    config.max_expansions = 1000;
    result = dijkstra(0, next, goalIs(100), config, &stats);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cost, 100);
    EXPECT_FALSE(stats.budget_exhausted);
}

TEST(SearchTest, TimeBudgetStopsSearch) {
    // Unbounded chain, so only the clock can end the search.
    auto next = [](int64_t n) { return std::vector<int64_t>{n + 1}; };
    SearchConfig config;
    config.budget_seconds = 0.01;

    SearchStats stats;
    auto result = bfs(int64_t{0}, next, goalIs(int64_t{-1}), config, &stats);
    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(stats.budget_exhausted);
    EXPECT_FALSE(stats.found);
    EXPECT_GE(stats.elapsed_seconds, 0.01);
    EXPECT_GT(stats.expansions, 0);
    EXPECT_EQ(stats.expansions % BudgetManager::kClockStride, 0);
}

TEST(SearchTest, DistancesUnderBudgetAreUpperBounds) {
    // 0 -> 2 directly costs 10, through 1 it costs 2.
    auto edges = [](int n) {
        std::vector<std::pair<int, int>> out;
        if (n == 0) out = {{1, 1}, {2, 10}};
        if (n == 1) out = {{2, 1}};
        return out;
    };
    SearchConfig config;
    config.max_expansions = 1;

    SearchStats stats;
    auto partial = dijkstraDistances(0, edges, config, &stats);
    EXPECT_TRUE(stats.budget_exhausted);
    ASSERT_EQ(partial.size(), 3u);
    EXPECT_EQ(partial.at(0), 0);
    EXPECT_EQ(partial.at(1), 1);
    EXPECT_EQ(partial.at(2), 10);

    auto full = dijkstraDistances(0, edges);
    EXPECT_EQ(full.at(2), 2);
    for (const auto& [state, bound] : partial) {
        EXPECT_GE(bound, full.at(state)) << "state " << state;
    }
}

TEST(SearchTest, NegativeCostsRejectedWhenValidating) {
    auto moves = [](int n) {
        std::vector<std::pair<int, int>> out;
        if (n == 0) out = {{1, -2}};
        return out;
    };
    SearchConfig config;
    config.validate_costs = true;

    EXPECT_THROW(dijkstra(0, moves, goalIs(1), config), std::invalid_argument);
    EXPECT_THROW(astar(0, moves, goalIs(1), [](int) { return 0; }, config),
                 std::invalid_argument);
    EXPECT_THROW(dijkstraDistances(0, moves, config), std::invalid_argument);

    // Without validation the precondition is simply not checked.
    EXPECT_NO_THROW(dijkstra(0, moves, goalIs(1)));
}

TEST(SearchTest, NegativeHeuristicRejectedWhenValidating) {
    auto moves = [](int n) {
        std::vector<std::pair<int, int>> out;
        if (n == 0) out = {{1, 1}};
        return out;
    };
    SearchConfig config;
    config.validate_costs = true;
    EXPECT_THROW(astar(0, moves, goalIs(1), [](int) { return -1; }, config),
                 std::invalid_argument);
}

// ─── Budget Manager ────────────────────────────────────────────

TEST(SearchTest, BudgetManagerExpansionLimit) {
    SearchConfig config;
    config.max_expansions = 5;
    BudgetManager budget(config);
    budget.start();

    for (int i = 0; i < 5; i++) {
        EXPECT_TRUE(budget.canContinue());
        budget.recordExpansion();
    }
    EXPECT_FALSE(budget.canContinue());
    EXPECT_EQ(budget.limitHit(), BudgetManager::Limit::EXPANSIONS);
}

TEST(SearchTest, BudgetManagerUnlimited) {
    BudgetManager budget(SearchConfig{});
    budget.start();
    for (int i = 0; i < 1000; i++) budget.recordExpansion();
    EXPECT_TRUE(budget.canContinue());
    EXPECT_EQ(budget.limitHit(), BudgetManager::Limit::NONE);
    EXPECT_GE(budget.elapsedSeconds(), 0.0);
}

TEST(SearchTest, BudgetManagerTimeLimit) {
    SearchConfig config;
    config.budget_seconds = 1e-9;
    BudgetManager budget(config);
    budget.start();

    // The clock is first sampled at expansion zero.
    while (budget.elapsedSeconds() < 1e-6) {}
    EXPECT_FALSE(budget.canContinue());
    EXPECT_EQ(budget.limitHit(), BudgetManager::Limit::TIME);
}
