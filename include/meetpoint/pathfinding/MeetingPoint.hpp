#pragma once
#include "CellGrid.hpp"
#include "ReachabilityTraversal.hpp"
#include "SeparableScan.hpp"
#include <string_view>

namespace meetpoint::pf {

enum class Algorithm {
    SeparableScan,          // obstacle-free grids only
    ReachabilityTraversal,  // any grid
};

[[nodiscard]] std::string_view to_string(Algorithm a) noexcept;

// Obstacle-free grids take the closed-form scan, everything else the traversal.
[[nodiscard]] Algorithm select_algorithm(const GridClassification& info) noexcept;

// Minimum total distance from all houses to one empty cell reachable from
// every house, or kNoMeetingPoint. Empty grids and grids without houses
// return kNoMeetingPoint.
[[nodiscard]] Distance solve(const CellGrid& grid);
[[nodiscard]] Distance solve(const RawGrid& raw);

// Runs one algorithm directly, bypassing selection. The house list is
// derived from the grid. SeparableScan on a grid with obstacles gives a
// meaningless value.
[[nodiscard]] Distance run_algorithm(Algorithm a, const CellGrid& grid);

} // namespace meetpoint::pf
