#pragma once
#include "CellGrid.hpp"
#include <vector>

namespace meetpoint::pf {

// Closed-form total distance for grids without obstacles.
//
// Every empty cell is reachable from every house when nothing blocks the way,
// so the travel distance is the Manhattan distance and splits into a row part
// and a column part. Each part is tallied once per row / column, and a cell
// then costs rowCost[row] + colCost[col]. O(M*N + H).
//
// Precondition: grid has no Obstacle cells. This is not checked; use solve()
// unless the caller already knows the grid is obstacle-free.
//
// Returns the smallest total over all empty cells, or kNoMeetingPoint when
// houses is empty, any house lies outside the grid, or the grid has no empty
// cell.
[[nodiscard]] Distance scan_no_obstacles(const CellGrid& grid, const std::vector<Cell>& houses);

// Sum of |p - i| over every p in positions, for each i in [0, extent).
// Positions outside [0, extent) are ignored.
[[nodiscard]] std::vector<Distance> axis_displacement(int extent, const std::vector<int>& positions);

} // namespace meetpoint::pf
