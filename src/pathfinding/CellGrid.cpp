#include "meetpoint/pathfinding/CellGrid.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace meetpoint::pf {

CellGrid::CellGrid(int rows, int cols, std::vector<CellKind> kinds)
    : _b{rows, cols}, _kinds(std::move(kinds))
{
    if (rows < 0 || cols < 0)
        throw std::invalid_argument("CellGrid: negative dimensions");
    if (_kinds.size() != static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols))
        throw std::invalid_argument("CellGrid: cell count does not match " +
                                    std::to_string(rows) + "x" + std::to_string(cols));
    if (rows == 0 || cols == 0) {
        // Normalise degenerate shapes so empty() and bounds() agree.
        _b = Bounds{};
        _kinds.clear();
    }
}

CellGrid CellGrid::from_rows(const RawGrid& raw)
{
    if (raw.empty() || raw.front().empty())
        return {};

    const int rows = static_cast<int>(raw.size());
    const int cols = static_cast<int>(raw.front().size());

    std::vector<CellKind> kinds;
    kinds.reserve(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols));

    for (int r = 0; r < rows; ++r) {
        const auto& row = raw[static_cast<std::size_t>(r)];
        if (static_cast<int>(row.size()) != cols)
            throw std::invalid_argument("CellGrid: row " + std::to_string(r) + " has " +
                                        std::to_string(row.size()) + " cells, expected " +
                                        std::to_string(cols));
        for (int v : row)
            kinds.push_back(classify(v));
    }
    return CellGrid(rows, cols, std::move(kinds));
}

std::vector<Cell> CellGrid::houses() const
{
    std::vector<Cell> out;
    for (NodeId id = 0; id < static_cast<NodeId>(_kinds.size()); ++id) {
        if (_kinds[id] == CellKind::House)
            out.push_back(from_id(id, _b.cols));
    }
    return out;
}

bool CellGrid::has_obstacles() const
{
    return std::find(_kinds.begin(), _kinds.end(), CellKind::Obstacle) != _kinds.end();
}

std::size_t CellGrid::count(CellKind kind) const
{
    return static_cast<std::size_t>(std::count(_kinds.begin(), _kinds.end(), kind));
}

GridClassification classify_grid(const CellGrid& grid)
{
    GridClassification out;
    out.rows = grid.rows();
    out.cols = grid.cols();
    if (grid.empty())
        return out;
    out.houses = grid.houses();
    if (out.houses.empty())
        return out;
    out.has_obstacles = grid.has_obstacles();
    return out;
}

} // namespace meetpoint::pf
