#pragma once
#include "GridGenerator.hpp"
#include "meetpoint/pathfinding/MeetingPoint.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meetpoint::bench {

// What a timing run calls into.
enum class AlgorithmChoice {
    Main,  // solve(): full dispatch
    Fast,  // separable scan only
    Bfs,   // reachability traversal only
};

[[nodiscard]] std::string_view to_string(AlgorithmChoice a) noexcept;

// Evaluates `choice` once on `grid`.
[[nodiscard]] pf::Distance run_once(const pf::CellGrid& grid, AlgorithmChoice choice);

struct TimingSample {
    double mean_s = 0.0;
    double stddev_s = 0.0;     // sample standard deviation; 0 for a single run
    pf::Distance result = pf::kNoMeetingPoint;
    int runs = 0;
};

// Wall-clock timing over `runs` repetitions (clamped to >= 1).
[[nodiscard]] TimingSample time_algorithm(const pf::CellGrid& grid, AlgorithmChoice choice, int runs);

struct Scenario {
    std::string name;
    GridSpec grid;
};

struct ScenarioReport {
    Scenario scenario;
    std::size_t houses = 0;
    std::size_t obstacles = 0;
    std::size_t empty = 0;

    TimingSample main;

    // Only filled for obstacle-free grids with at least one house.
    std::optional<TimingSample> fast;
    std::optional<TimingSample> bfs;
    std::optional<double> speedup;  // bfs mean / fast mean

    [[nodiscard]] bool cross_checked() const noexcept { return fast.has_value() && bfs.has_value(); }
    [[nodiscard]] bool results_match() const noexcept { return !cross_checked() || fast->result == bfs->result; }
};

[[nodiscard]] ScenarioReport run_scenario(const Scenario& s, int runs);
[[nodiscard]] std::vector<ScenarioReport> run_suite(const std::vector<Scenario>& scenarios, int runs);

// The built-in six scenario suite (20x20 up to 100x100).
[[nodiscard]] std::vector<Scenario> default_scenarios();

// Human-readable report blocks and a fixed-width summary table.
[[nodiscard]] std::string format_report(const ScenarioReport& r);
[[nodiscard]] std::string format_summary(const std::vector<ScenarioReport>& reports);

// One header line plus one row per scenario. Missing fast/bfs columns are left blank.
void write_csv(std::ostream& os, const std::vector<ScenarioReport>& reports);
[[nodiscard]] bool write_csv(const std::string& path, const std::vector<ScenarioReport>& reports);

// Exit status of a finished run: 3 when any cross-check disagreed, else 1 when
// the CSV export failed, else 0.
[[nodiscard]] int run_exit_code(const std::vector<ScenarioReport>& reports, bool exportOk);

} // namespace meetpoint::bench
