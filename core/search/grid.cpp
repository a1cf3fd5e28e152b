#include "search/grid.hpp"
#include "measure/direction.hpp"
#include "reader/reader.hpp"

#include <stdexcept>

namespace puzlib {

CharGrid::CharGrid(std::vector<std::string> rows) : rows_(std::move(rows)) {
    for (size_t r = 0; r < rows_.size(); r++) {
        if (rows_[r].size() != rows_.front().size()) {
            throw std::invalid_argument("CharGrid: row " + std::to_string(r) + " has length " +
                                        std::to_string(rows_[r].size()) + ", expected " +
                                        std::to_string(rows_.front().size()));
        }
    }
}

CharGrid CharGrid::fromText(const std::string& source) {
    return CharGrid(readGrid(source));
}

bool CharGrid::inBounds(const Cell& cell) const {
    return cell.x >= 0 && cell.y >= 0 &&
           static_cast<size_t>(cell.x) < height() &&
           static_cast<size_t>(cell.y) < width();
}

char CharGrid::at(const Cell& cell) const {
    if (!inBounds(cell)) {
        throw std::out_of_range("CharGrid: cell (" + std::to_string(cell.x) + ", " +
                                std::to_string(cell.y) + ") outside grid");
    }
    return rows_[cell.x][cell.y];
}

void CharGrid::set(const Cell& cell, char value) {
    if (!inBounds(cell)) {
        throw std::out_of_range("CharGrid: cell (" + std::to_string(cell.x) + ", " +
                                std::to_string(cell.y) + ") outside grid");
    }
    rows_[cell.x][cell.y] = value;
}

std::optional<CharGrid::Cell> CharGrid::find(char c) const {
    for (size_t r = 0; r < rows_.size(); r++) {
        size_t col = rows_[r].find(c);
        if (col != std::string::npos) {
            return Cell(static_cast<int64_t>(r), static_cast<int64_t>(col));
        }
    }
    return std::nullopt;
}

std::vector<CharGrid::Cell> CharGrid::findAll(char c) const {
    std::vector<Cell> cells;
    for (size_t r = 0; r < rows_.size(); r++) {
        for (size_t col = 0; col < rows_[r].size(); col++) {
            if (rows_[r][col] == c) {
                cells.emplace_back(static_cast<int64_t>(r), static_cast<int64_t>(col));
            }
        }
    }
    return cells;
}

std::vector<CharGrid::Cell> CharGrid::neighbors(const Cell& cell, std::string_view walls) const {
    std::vector<Cell> result;
    for (const auto& next : Dir<int64_t>::cardinals(cell)) {
        if (!next || !inBounds(*next)) continue;
        if (walls.find(at(*next)) != std::string_view::npos) continue;
        result.push_back(*next);
    }
    return result;
}

int64_t CharGrid::digitCost(const Cell& cell) const {
    char c = at(cell);
    if (c >= '0' && c <= '9') return c - '0';
    return 1;
}

std::vector<std::pair<CharGrid::Cell, int64_t>> CharGrid::weightedNeighbors(
    const Cell& cell, std::string_view walls) const {
    std::vector<std::pair<Cell, int64_t>> result;
    for (const auto& next : neighbors(cell, walls)) {
        result.emplace_back(next, digitCost(next));
    }
    return result;
}

} // namespace puzlib
