#include "meetpoint/pathfinding/SeparableScan.hpp"

#include <algorithm>
#include <limits>

namespace meetpoint::pf {

std::vector<Distance> axis_displacement(int extent, const std::vector<int>& positions)
{
    std::vector<Distance> cost(static_cast<std::size_t>(std::max(extent, 0)), 0);
    if (extent <= 0)
        return cost;

    std::vector<Distance> tally(cost.size(), 0);
    Distance atZero = 0;
    for (int p : positions) {
        if (p < 0 || p >= extent)
            continue;
        ++tally[static_cast<std::size_t>(p)];
        atZero += p;
    }

    // Stepping from i to i+1 moves one unit away from everything at or before i
    // and one unit closer to everything after it.
    const auto total = static_cast<Distance>(positions.size());
    Distance before = 0;
    cost[0] = atZero;
    for (int i = 0; i + 1 < extent; ++i) {
        before += tally[static_cast<std::size_t>(i)];
        cost[static_cast<std::size_t>(i) + 1] = cost[static_cast<std::size_t>(i)] + before - (total - before);
    }
    return cost;
}

Distance scan_no_obstacles(const CellGrid& grid, const std::vector<Cell>& houses)
{
    if (grid.empty() || houses.empty())
        return kNoMeetingPoint;

    std::vector<int> houseRows, houseCols;
    houseRows.reserve(houses.size());
    houseCols.reserve(houses.size());
    for (const Cell& h : houses) {
        if (!grid.in_bounds(h))
            return kNoMeetingPoint;
        houseRows.push_back(h.row);
        houseCols.push_back(h.col);
    }

    const auto rowCost = axis_displacement(grid.rows(), houseRows);
    const auto colCost = axis_displacement(grid.cols(), houseCols);

    Distance best = std::numeric_limits<Distance>::max();
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            if (grid.at(r, c) != CellKind::Empty) continue;
            best = std::min(best, rowCost[static_cast<std::size_t>(r)] + colCost[static_cast<std::size_t>(c)]);
        }
    }
    return best == std::numeric_limits<Distance>::max() ? kNoMeetingPoint : best;
}

} // namespace meetpoint::pf
