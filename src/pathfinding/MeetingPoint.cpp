#include "meetpoint/pathfinding/MeetingPoint.hpp"

#include <spdlog/spdlog.h>

namespace meetpoint::pf {

std::string_view to_string(Algorithm a) noexcept
{
    switch (a) {
    case Algorithm::SeparableScan:         return "separable-scan";
    case Algorithm::ReachabilityTraversal: return "reachability-traversal";
    }
    return "unknown";
}

Algorithm select_algorithm(const GridClassification& info) noexcept
{
    return info.has_obstacles ? Algorithm::ReachabilityTraversal : Algorithm::SeparableScan;
}

Distance solve(const CellGrid& grid)
{
    if (grid.empty())
        return kNoMeetingPoint;

    const GridClassification info = classify_grid(grid);
    if (info.houses.empty())
        return kNoMeetingPoint;

    const Algorithm algo = select_algorithm(info);
    spdlog::debug("meetpoint: {}x{} grid, {} houses -> {}",
                  info.rows, info.cols, info.houses.size(), to_string(algo));

    switch (algo) {
    case Algorithm::SeparableScan:
        return scan_no_obstacles(grid, info.houses);
    case Algorithm::ReachabilityTraversal:
        return traverse_with_obstacles(grid, info.houses);
    }
    return kNoMeetingPoint;
}

Distance solve(const RawGrid& raw)
{
    return solve(CellGrid::from_rows(raw));
}

Distance run_algorithm(Algorithm a, const CellGrid& grid)
{
    const std::vector<Cell> houses = grid.houses();
    if (houses.empty())
        return kNoMeetingPoint;

    switch (a) {
    case Algorithm::SeparableScan:
        return scan_no_obstacles(grid, houses);
    case Algorithm::ReachabilityTraversal:
        return traverse_with_obstacles(grid, houses);
    }
    return kNoMeetingPoint;
}

} // namespace meetpoint::pf
