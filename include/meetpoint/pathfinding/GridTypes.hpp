#pragma once
#include <cstdint>
#include <vector>
#include <limits>

namespace meetpoint::pf {

using u8  = std::uint8_t;
using u32 = std::uint32_t;

// Total travel distance. Sums over many houses overflow 32 bits on large grids.
using Distance = std::int64_t;

// Returned when no empty cell is reachable from every house.
inline constexpr Distance kNoMeetingPoint = -1;

// Closed three-way classification; see classify() for the raw mapping.
enum class CellKind : u8 { Empty, House, Obstacle };

inline constexpr int kRawEmpty = 0;
inline constexpr int kRawHouse = 1;

[[nodiscard]] constexpr CellKind classify(int raw) noexcept {
    if (raw == kRawEmpty) return CellKind::Empty;
    if (raw == kRawHouse) return CellKind::House;
    return CellKind::Obstacle;
}

struct Cell {
    int row{}, col{};
    constexpr bool operator==(const Cell&) const = default;
};

struct Bounds {
    int rows{}, cols{};
    [[nodiscard]] constexpr bool contains(int r, int c) const noexcept {
        return (r >= 0 && c >= 0 && r < rows && c < cols);
    }
};

using NodeId = u32; // row-major cell index

// Encode/decode (row,col) <-> NodeId (row-major)
inline NodeId to_id(int r, int c, int cols) { return static_cast<NodeId>(r * cols + c); }
inline Cell   from_id(NodeId id, int cols)  { return { int(id / cols), int(id % cols) }; }

// 4-neighbourhood, unit step cost
inline constexpr int kDirs = 4;
inline constexpr int kDirRow[kDirs] = { 0, 1,  0, -1 };
inline constexpr int kDirCol[kDirs] = { 1, 0, -1,  0 };

} // namespace meetpoint::pf
