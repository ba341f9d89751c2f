#include <doctest/doctest.h>
#include "meetpoint/pathfinding/MeetingPoint.hpp"
#include "meetpoint/bench/GridGenerator.hpp"

#include <cstdint>

using namespace meetpoint;
using namespace meetpoint::pf;

TEST_CASE("MeetingPoint/WorkedExample") {
    // Houses at (0,0), (0,4), (2,2); obstacle at (0,2). Best cell is (1,2): 3 + 3 + 1.
    const RawGrid grid = {
        { 1, 0, 2, 0, 1 },
        { 0, 0, 0, 0, 0 },
        { 0, 0, 1, 0, 0 },
    };
    CHECK(solve(grid) == 7);
}

TEST_CASE("MeetingPoint/ConcreteScenarios") {
    CHECK(solve(RawGrid{ { 0, 0, 0 }, { 0, 1, 0 }, { 0, 0, 0 } }) == 1);
    CHECK(solve(RawGrid{ { 1, 2, 1 }, { 2, 2, 2 }, { 1, 2, 1 } }) == kNoMeetingPoint);
    CHECK(solve(RawGrid{ { 1, 0, 1, 0, 1 } }) == 5);
    CHECK(solve(RawGrid{ { 1, 2, 1 }, { 2, 0, 2 }, { 1, 2, 1 } }) == kNoMeetingPoint);
    CHECK(solve(RawGrid{ { 1, 2, 0 }, { 2, 2, 0 }, { 1, 2, 0 } }) == kNoMeetingPoint);
    CHECK(solve(RawGrid{ { 1, 0, 0, 1 }, { 0, 0, 0, 0 } }) == 3);
    CHECK(solve(RawGrid{ { 1, 0, 1 }, { 0, 0, 0 }, { 1, 0, 1 } }) == 8);
}

TEST_CASE("MeetingPoint/EmptyGrid") {
    CHECK(solve(RawGrid{}) == kNoMeetingPoint);
    CHECK(solve(RawGrid{ {} }) == kNoMeetingPoint);
    CHECK(solve(CellGrid{}) == kNoMeetingPoint);
}

TEST_CASE("MeetingPoint/NoHouses") {
    CHECK(solve(RawGrid{ { 0, 0, 0 }, { 0, 0, 0 }, { 0, 0, 0 } }) == kNoMeetingPoint);
    CHECK(solve(RawGrid{ { 0, 2 }, { 2, 0 } }) == kNoMeetingPoint);
}

TEST_CASE("MeetingPoint/SelectAlgorithm") {
    GridClassification info;
    info.houses = { Cell{0, 0} };

    info.has_obstacles = false;
    CHECK(select_algorithm(info) == Algorithm::SeparableScan);

    info.has_obstacles = true;
    CHECK(select_algorithm(info) == Algorithm::ReachabilityTraversal);

    CHECK(to_string(Algorithm::SeparableScan) == "separable-scan");
    CHECK(to_string(Algorithm::ReachabilityTraversal) == "reachability-traversal");
}

TEST_CASE("MeetingPoint/ObstaclesForceTraversal") {
    // The closed form would say 4 here; dispatch must take the detour into account.
    const CellGrid g = CellGrid::from_rows({
        { 1, 2, 1 },
        { 0, 2, 0 },
        { 0, 0, 0 },
    });
    CHECK(solve(g) == 6);
    CHECK(run_algorithm(Algorithm::ReachabilityTraversal, g) == 6);
}

TEST_CASE("MeetingPoint/RunAlgorithmWithoutHouses") {
    const CellGrid g = CellGrid::from_rows({ { 0, 0 } });
    CHECK(run_algorithm(Algorithm::SeparableScan, g) == kNoMeetingPoint);
    CHECK(run_algorithm(Algorithm::ReachabilityTraversal, g) == kNoMeetingPoint);
}

TEST_CASE("MeetingPoint/Idempotent") {
    const CellGrid g = bench::generate_grid({ 15, 15, 0.1, 0.15, 3 });
    const Distance first = solve(g);
    CHECK(solve(g) == first);
    CHECK(solve(g) == first);
}

TEST_CASE("MeetingPoint/ScanAndTraversalAgreeWithoutObstacles") {
    const struct { int rows, cols; double houses; } shapes[] = {
        { 1, 12, 0.25 }, { 12, 1, 0.25 }, { 6, 9, 0.10 }, { 10, 10, 0.30 }, { 17, 13, 0.05 },
    };
    for (const auto& s : shapes) {
        for (std::uint32_t seed = 1; seed <= 8; ++seed) {
            const CellGrid g = bench::generate_grid({ s.rows, s.cols, s.houses, 0.0, seed });
            REQUIRE_FALSE(g.has_obstacles());
            const auto houses = g.houses();
            if (houses.empty()) continue;
            CAPTURE(s.rows);
            CAPTURE(s.cols);
            CAPTURE(seed);
            CHECK(scan_no_obstacles(g, houses) == traverse_with_obstacles(g, houses));
        }
    }
}

TEST_CASE("MeetingPoint/ObstaclesNeverLowerTheTotal") {
    // Same seed, same houses: the second grid only adds obstacles to empty cells.
    for (std::uint32_t seed = 1; seed <= 20; ++seed) {
        const CellGrid openGrid = bench::generate_grid({ 12, 12, 0.1, 0.0, seed });
        const CellGrid blocked  = bench::generate_grid({ 12, 12, 0.1, 0.2, seed });
        REQUIRE(openGrid.houses() == blocked.houses());

        const Distance before = solve(openGrid);
        const Distance after  = solve(blocked);
        CAPTURE(seed);
        REQUIRE(before != kNoMeetingPoint);
        if (after != kNoMeetingPoint)
            CHECK(after >= before);
    }
}

TEST_CASE("MeetingPoint/SingleObstacleAddedByHand") {
    RawGrid raw = {
        { 1, 0, 0, 0 },
        { 0, 0, 0, 0 },
        { 0, 0, 0, 1 },
    };
    const Distance base = solve(raw);
    CHECK(base == 5);
    for (std::size_t r = 0; r < raw.size(); ++r) {
        for (std::size_t c = 0; c < raw[r].size(); ++c) {
            if (raw[r][c] != 0) continue;
            RawGrid withWall = raw;
            withWall[r][c] = 2;
            const Distance d = solve(withWall);
            if (d != kNoMeetingPoint)
                CHECK(d >= base);
        }
    }
}
