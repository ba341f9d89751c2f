#pragma once
#include "CellGrid.hpp"
#include <cstddef>
#include <queue>
#include <vector>

namespace meetpoint::pf {

// Breadth-first distance accumulation, one house at a time.
//
// Each accumulate_from() call floods outward from a house through non-obstacle
// cells and adds the step count to every empty cell it reaches, together with
// a per-cell reach counter. Visited state is a generation tag per cell: a cell
// is visited in the current flood iff its tag equals generation(). The
// generation advances once per house, so the tag array is never cleared
// between floods.
//
// The grid must outlive the traversal.
class ReachabilityTraversal {
public:
    explicit ReachabilityTraversal(const CellGrid& grid);

    // Floods from one house. Returns false (and accumulates nothing) if the
    // start cell is out of bounds or an obstacle.
    bool accumulate_from(Cell house);

    // Smallest distance sum among empty cells reached by exactly house_count
    // floods, or kNoMeetingPoint if none qualify or house_count is 0.
    [[nodiscard]] Distance best_total(std::size_t house_count) const;

    [[nodiscard]] Distance distance_sum(Cell c) const { return _sum[to_id(c.row, c.col, _g.cols())]; }
    [[nodiscard]] u32 reach_count(Cell c) const { return _reach[to_id(c.row, c.col, _g.cols())]; }
    [[nodiscard]] u32 generation() const noexcept { return _gen; }

private:
    struct QN { NodeId id; u32 dist; };

    void next_generation();

    const CellGrid& _g;
    std::vector<Distance> _sum;
    std::vector<u32> _reach;
    std::vector<u32> _mark;  // generation of the last flood that visited the cell
    u32 _gen = 0;
    std::queue<QN> _open;
};

// Minimum total distance to an empty cell reachable from every house.
// Correct with or without obstacles. O(H*M*N).
[[nodiscard]] Distance traverse_with_obstacles(const CellGrid& grid, const std::vector<Cell>& houses);

} // namespace meetpoint::pf
