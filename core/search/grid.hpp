#pragma once

#include "measure/vec2d.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace puzlib {

// ─── CharGrid ──────────────────────────────────────────────────
// A rectangular character grid, typically a puzzle map, that supplies
// neighbor functions for the graph searches. Cells are (row, column).
//
//   CharGrid grid = CharGrid::fromText("input.txt");
//   auto path = bfs(*grid.find('S'),
//                   [&](const CharGrid::Cell& c) { return grid.neighbors(c); },
//                   goalIs(*grid.find('E')));

class CharGrid {
public:
    using Cell = Vec2D<int64_t>;

    CharGrid() = default;

    /// Throws std::invalid_argument if rows differ in length.
    explicit CharGrid(std::vector<std::string> rows);

    /// Build from a path or literal text (see contents()).
    static CharGrid fromText(const std::string& source);

    size_t height() const { return rows_.size(); }
    size_t width() const { return rows_.empty() ? 0 : rows_.front().size(); }
    const std::vector<std::string>& rows() const { return rows_; }

    bool inBounds(const Cell& cell) const;

    /// Throws std::out_of_range outside the grid.
    char at(const Cell& cell) const;
    void set(const Cell& cell, char value);

    /// First cell holding c, scanning rows top to bottom.
    std::optional<Cell> find(char c) const;
    std::vector<Cell> findAll(char c) const;

    /// In-bounds cardinal neighbors whose character is not in walls.
    std::vector<Cell> neighbors(const Cell& cell, std::string_view walls = "#") const;

    /// Cost of entering a cell: its digit value, or 1 for non-digits.
    int64_t digitCost(const Cell& cell) const;

    /// neighbors() paired with digitCost() of the neighbor.
    std::vector<std::pair<Cell, int64_t>> weightedNeighbors(const Cell& cell,
                                                            std::string_view walls = "#") const;

private:
    std::vector<std::string> rows_;
};

} // namespace puzlib
