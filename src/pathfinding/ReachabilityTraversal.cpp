#include "meetpoint/pathfinding/ReachabilityTraversal.hpp"

#include <algorithm>
#include <limits>

namespace meetpoint::pf {

ReachabilityTraversal::ReachabilityTraversal(const CellGrid& grid)
    : _g(grid),
      _sum(grid.cell_count(), 0),
      _reach(grid.cell_count(), 0),
      _mark(grid.cell_count(), 0)
{
}

void ReachabilityTraversal::next_generation()
{
    ++_gen;
    if (_gen == 0) {
        // Wrapped: clear tags so no stale cell matches the new generation.
        std::fill(_mark.begin(), _mark.end(), 0u);
        _gen = 1;
    }
}

bool ReachabilityTraversal::accumulate_from(Cell house)
{
    if (!_g.enterable(house.row, house.col))
        return false;

    next_generation();

    const int cols = _g.cols();
    const NodeId sid = to_id(house.row, house.col, cols);
    _mark[sid] = _gen;
    _open.push({ sid, 0 });

    while (!_open.empty()) {
        const QN cur = _open.front();
        _open.pop();

        // The house itself and other houses are passed through, never counted.
        if (_g.at(cur.id) == CellKind::Empty) {
            _sum[cur.id] += cur.dist;
            ++_reach[cur.id];
        }

        const Cell C = from_id(cur.id, cols);
        for (int dir = 0; dir < kDirs; ++dir) {
            const int nr = C.row + kDirRow[dir], nc = C.col + kDirCol[dir];
            if (!_g.enterable(nr, nc)) continue;

            const NodeId nid = to_id(nr, nc, cols);
            if (_mark[nid] == _gen) continue;

            _mark[nid] = _gen;
            _open.push({ nid, cur.dist + 1 });
        }
    }
    return true;
}

Distance ReachabilityTraversal::best_total(std::size_t house_count) const
{
    if (house_count == 0)
        return kNoMeetingPoint;

    Distance best = std::numeric_limits<Distance>::max();
    for (NodeId id = 0; id < static_cast<NodeId>(_sum.size()); ++id) {
        if (_g.at(id) != CellKind::Empty) continue;
        if (_reach[id] != house_count) continue;  // some house cannot get here
        best = std::min(best, _sum[id]);
    }
    return best == std::numeric_limits<Distance>::max() ? kNoMeetingPoint : best;
}

Distance traverse_with_obstacles(const CellGrid& grid, const std::vector<Cell>& houses)
{
    if (grid.empty() || houses.empty())
        return kNoMeetingPoint;

    ReachabilityTraversal traversal(grid);
    for (const Cell& h : houses) {
        // A house standing on an obstacle or off the grid reaches nothing.
        if (!traversal.accumulate_from(h))
            return kNoMeetingPoint;
    }
    return traversal.best_total(houses.size());
}

} // namespace meetpoint::pf
