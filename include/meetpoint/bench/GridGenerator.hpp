#pragma once
#include "meetpoint/pathfinding/CellGrid.hpp"
#include <cstdint>

namespace meetpoint::bench {

struct GridSpec {
    int rows = 0;
    int cols = 0;
    double house_density = 0.1;     // fraction of all cells
    double obstacle_density = 0.0;  // fraction of the cells left empty after placing houses
    std::uint32_t seed = 42;
};

// Deterministic random grid: equal GridSpecs always yield equal grids.
// Places floor(rows*cols*house_density) houses on distinct cells, then
// floor(empty*obstacle_density) obstacles on distinct still-empty cells.
// Densities are clamped to [0, 1]; non-positive dimensions give an empty grid.
[[nodiscard]] pf::CellGrid generate_grid(const GridSpec& spec);

} // namespace meetpoint::bench
