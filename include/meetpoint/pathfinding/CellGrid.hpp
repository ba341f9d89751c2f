#pragma once
#include "GridTypes.hpp"
#include <cstddef>
#include <vector>

namespace meetpoint::pf {

using RawGrid = std::vector<std::vector<int>>;

// Immutable row-major grid of cell classifications.
// 4-direction movement; Obstacle cells can never be entered.
class CellGrid {
public:
    CellGrid() = default;

    // kinds.size() must equal rows*cols; throws std::invalid_argument otherwise.
    CellGrid(int rows, int cols, std::vector<CellKind> kinds);

    // Classifies raw values (0 = empty, 1 = house, anything else = obstacle).
    // No rows, or a zero-length first row, gives an empty grid.
    // Throws std::invalid_argument if a later row differs in length from the first.
    [[nodiscard]] static CellGrid from_rows(const RawGrid& raw);

    [[nodiscard]] const Bounds& bounds() const noexcept { return _b; }
    [[nodiscard]] int rows() const noexcept { return _b.rows; }
    [[nodiscard]] int cols() const noexcept { return _b.cols; }
    [[nodiscard]] bool empty() const noexcept { return _b.rows == 0 || _b.cols == 0; }
    [[nodiscard]] std::size_t cell_count() const noexcept { return _kinds.size(); }

    [[nodiscard]] CellKind at(int r, int c) const { return _kinds[to_id(r, c, _b.cols)]; }
    [[nodiscard]] CellKind at(Cell c) const { return at(c.row, c.col); }
    [[nodiscard]] CellKind at(NodeId id) const { return _kinds[id]; }

    [[nodiscard]] bool in_bounds(Cell c) const noexcept { return _b.contains(c.row, c.col); }

    // In bounds and not an obstacle.
    [[nodiscard]] bool enterable(int r, int c) const {
        return _b.contains(r, c) && _kinds[to_id(r, c, _b.cols)] != CellKind::Obstacle;
    }

    // Row-major list of house coordinates.
    [[nodiscard]] std::vector<Cell> houses() const;
    [[nodiscard]] bool has_obstacles() const;
    [[nodiscard]] std::size_t count(CellKind kind) const;

private:
    Bounds _b{};
    std::vector<CellKind> _kinds;
};

// What the dispatcher needs to know before picking an algorithm.
struct GridClassification {
    int rows = 0;
    int cols = 0;
    std::vector<Cell> houses;
    bool has_obstacles = false;
};

[[nodiscard]] GridClassification classify_grid(const CellGrid& grid);

} // namespace meetpoint::pf
