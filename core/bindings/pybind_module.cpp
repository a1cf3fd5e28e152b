// PyBind11 bindings for puzlib.
// Exposes grid search, search limits, number theory and the disjoint set to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "combinatorics/combinatorics.hpp"
#include "graph/disjoint_set.hpp"
#include "math/number_theory.hpp"
#include "measure/vec2d.hpp"
#include "search/graph_search.hpp"
#include "search/grid.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <sstream>

namespace py = pybind11;

namespace {

using Cell = puzlib::CharGrid::Cell;

// Manhattan distance scaled by the cheapest cell in the grid, so the
// estimate stays admissible for digit costs (including zero).
int64_t cheapestCell(const puzlib::CharGrid& grid) {
    int64_t cheapest = 1;
    for (const auto& row : grid.rows()) {
        for (char c : row) {
            if (c >= '0' && c <= '9') cheapest = std::min<int64_t>(cheapest, c - '0');
        }
    }
    return cheapest;
}

} // namespace

PYBIND11_MODULE(puzlib_bindings, m) {
    m.doc() = "puzlib C++ puzzle helper bindings";

    // ── Cell ──
    py::class_<Cell>(m, "Cell")
        .def(py::init<>())
        .def(py::init<int64_t, int64_t>(), py::arg("row"), py::arg("col"))
        .def_readwrite("row", &Cell::x)
        .def_readwrite("col", &Cell::y)
        .def("manhattan", &Cell::manhattan)
        .def(py::self == py::self)
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def("__hash__", [](const Cell& c) { return std::hash<Cell>{}(c); })
        .def("__repr__", [](const Cell& c) {
            std::ostringstream os;
            os << "Cell" << c;
            return os.str();
        });

    // ── SearchConfig ──
    py::class_<puzlib::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("max_expansions", &puzlib::SearchConfig::max_expansions)
        .def_readwrite("budget_seconds", &puzlib::SearchConfig::budget_seconds)
        .def_readwrite("validate_costs", &puzlib::SearchConfig::validate_costs);

    // ── SearchStats ──
    py::class_<puzlib::SearchStats>(m, "SearchStats")
        .def(py::init<>())
        .def_readonly("expansions", &puzlib::SearchStats::expansions)
        .def_readonly("visited", &puzlib::SearchStats::visited)
        .def_readonly("max_frontier", &puzlib::SearchStats::max_frontier)
        .def_readonly("elapsed_seconds", &puzlib::SearchStats::elapsed_seconds)
        .def_readonly("budget_exhausted", &puzlib::SearchStats::budget_exhausted)
        .def_readonly("found", &puzlib::SearchStats::found);

    // ── WeightedPath ──
    using GridPath = puzlib::WeightedPath<Cell, int64_t>;
    py::class_<GridPath>(m, "WeightedPath")
        .def_readonly("path", &GridPath::path)
        .def_readonly("cost", &GridPath::cost);

    // ── CharGrid ──
    py::class_<puzlib::CharGrid>(m, "CharGrid")
        .def(py::init<std::vector<std::string>>(), py::arg("rows"))
        .def_static("from_text", &puzlib::CharGrid::fromText, py::arg("source"))
        .def("height", &puzlib::CharGrid::height)
        .def("width", &puzlib::CharGrid::width)
        .def("rows", &puzlib::CharGrid::rows)
        .def("in_bounds", &puzlib::CharGrid::inBounds)
        .def("at", &puzlib::CharGrid::at)
        .def("set", &puzlib::CharGrid::set)
        .def("find", &puzlib::CharGrid::find)
        .def("find_all", &puzlib::CharGrid::findAll)
        .def("neighbors", &puzlib::CharGrid::neighbors,
             py::arg("cell"), py::arg("walls") = "#")
        .def("digit_cost", &puzlib::CharGrid::digitCost);

    // ── Grid searches ──
    m.def("grid_bfs", [](const puzlib::CharGrid& grid, const Cell& start, const Cell& goal,
                         const std::string& walls, const puzlib::SearchConfig& config) {
        return puzlib::bfs(start,
                           [&](const Cell& c) { return grid.neighbors(c, walls); },
                           puzlib::goalIs(goal), config);
    }, py::arg("grid"), py::arg("start"), py::arg("goal"),
       py::arg("walls") = "#", py::arg("config") = puzlib::SearchConfig{});

    m.def("grid_dfs", [](const puzlib::CharGrid& grid, const Cell& start, const Cell& goal,
                         const std::string& walls, const puzlib::SearchConfig& config) {
        return puzlib::dfs(start,
                           [&](const Cell& c) { return grid.neighbors(c, walls); },
                           puzlib::goalIs(goal), config);
    }, py::arg("grid"), py::arg("start"), py::arg("goal"),
       py::arg("walls") = "#", py::arg("config") = puzlib::SearchConfig{});

    m.def("grid_dijkstra", [](const puzlib::CharGrid& grid, const Cell& start, const Cell& goal,
                              const std::string& walls, const puzlib::SearchConfig& config) {
        return puzlib::dijkstra(start,
                                [&](const Cell& c) { return grid.weightedNeighbors(c, walls); },
                                puzlib::goalIs(goal), config);
    }, py::arg("grid"), py::arg("start"), py::arg("goal"),
       py::arg("walls") = "#", py::arg("config") = puzlib::SearchConfig{});

    m.def("grid_astar", [](const puzlib::CharGrid& grid, const Cell& start, const Cell& goal,
                           const std::string& walls, const puzlib::SearchConfig& config) {
        int64_t scale = cheapestCell(grid);
        return puzlib::astar(start,
                             [&](const Cell& c) { return grid.weightedNeighbors(c, walls); },
                             puzlib::goalIs(goal),
                             [&](const Cell& c) { return scale * c.manhattan(goal); },
                             config);
    }, py::arg("grid"), py::arg("start"), py::arg("goal"),
       py::arg("walls") = "#", py::arg("config") = puzlib::SearchConfig{});

    // ── Number theory / combinatorics ──
    m.def("gcd", &puzlib::gcd<int64_t>, py::arg("a"), py::arg("b"));
    m.def("lcm", &puzlib::lcm<int64_t>, py::arg("a"), py::arg("b"));
    m.def("lcm_all", [](const std::vector<int64_t>& values) { return puzlib::lcmAll(values); });
    m.def("choose", &puzlib::choose, py::arg("n"), py::arg("k"));

    // ── DisjointSet ──
    py::enum_<puzlib::UnionStrategy>(m, "UnionStrategy")
        .value("BY_SIZE", puzlib::UnionStrategy::BY_SIZE)
        .value("BY_RANK", puzlib::UnionStrategy::BY_RANK);

    py::class_<puzlib::DisjointSet>(m, "DisjointSet")
        .def(py::init<size_t, puzlib::UnionStrategy>(),
             py::arg("node_count"), py::arg("strategy") = puzlib::UnionStrategy::BY_SIZE)
        .def("find_root", &puzlib::DisjointSet::findRoot)
        .def("unite", &puzlib::DisjointSet::unite)
        .def("connected", &puzlib::DisjointSet::connected)
        .def("set_size", &puzlib::DisjointSet::setSize)
        .def("set_count", &puzlib::DisjointSet::setCount)
        .def("__len__", &puzlib::DisjointSet::size);

    // ── Logging ──
    m.def("set_log_level", [](const std::string& level) {
        puzlib::logging::setLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
