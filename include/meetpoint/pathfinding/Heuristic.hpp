#pragma once
#include "GridTypes.hpp"
#include <cstdlib>

namespace meetpoint::pf {

// Manhattan distance: exact shortest path length on an obstacle-free 4-dir grid.
inline int manhattan(int dr, int dc) {
    return std::abs(dr) + std::abs(dc);
}

inline int manhattan(Cell a, Cell b) {
    return manhattan(b.row - a.row, b.col - a.col);
}

} // namespace meetpoint::pf
