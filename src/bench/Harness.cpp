#include "meetpoint/bench/Harness.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace meetpoint::bench {

namespace {

using Clock = std::chrono::steady_clock;

std::string size_label(const GridSpec& g)
{
    return std::to_string(g.rows) + "x" + std::to_string(g.cols);
}

void print_timing(std::ostream& os, std::string_view label, const TimingSample& t)
{
    os << label << std::fixed << std::setprecision(4) << t.mean_s << "s +/- "
       << t.stddev_s << "s (result: " << t.result << ")\n";
}

// RFC 4180 field: quoted when it holds a separator, quote or line break.
std::string csv_field(std::string_view s)
{
    if (s.find_first_of(",\"\r\n") == std::string_view::npos)
        return std::string(s);
    std::string out = "\"";
    for (char ch : s) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

} // namespace

std::string_view to_string(AlgorithmChoice a) noexcept
{
    switch (a) {
    case AlgorithmChoice::Main: return "main";
    case AlgorithmChoice::Fast: return "fast";
    case AlgorithmChoice::Bfs:  return "bfs";
    }
    return "unknown";
}

pf::Distance run_once(const pf::CellGrid& grid, AlgorithmChoice choice)
{
    switch (choice) {
    case AlgorithmChoice::Main: return pf::solve(grid);
    case AlgorithmChoice::Fast: return pf::run_algorithm(pf::Algorithm::SeparableScan, grid);
    case AlgorithmChoice::Bfs:  return pf::run_algorithm(pf::Algorithm::ReachabilityTraversal, grid);
    }
    return pf::kNoMeetingPoint;
}

TimingSample time_algorithm(const pf::CellGrid& grid, AlgorithmChoice choice, int runs)
{
    runs = std::max(runs, 1);

    std::vector<double> times;
    times.reserve(static_cast<std::size_t>(runs));

    TimingSample out;
    out.runs = runs;
    for (int i = 0; i < runs; ++i) {
        const auto t0 = Clock::now();
        out.result = run_once(grid, choice);
        const auto t1 = Clock::now();
        times.push_back(std::chrono::duration<double>(t1 - t0).count());
    }

    double sum = 0.0;
    for (double t : times) sum += t;
    out.mean_s = sum / static_cast<double>(times.size());

    if (times.size() > 1) {
        double sq = 0.0;
        for (double t : times) sq += (t - out.mean_s) * (t - out.mean_s);
        out.stddev_s = std::sqrt(sq / static_cast<double>(times.size() - 1));
    }
    return out;
}

ScenarioReport run_scenario(const Scenario& s, int runs)
{
    ScenarioReport r;
    r.scenario = s;

    const pf::CellGrid grid = generate_grid(s.grid);
    r.houses    = grid.count(pf::CellKind::House);
    r.obstacles = grid.count(pf::CellKind::Obstacle);
    r.empty     = grid.count(pf::CellKind::Empty);

    spdlog::debug("{}: {} grid, {} houses, {} obstacles, {} empty",
                  s.name, size_label(s.grid), r.houses, r.obstacles, r.empty);

    r.main = time_algorithm(grid, AlgorithmChoice::Main, runs);

    if (r.obstacles == 0 && r.houses > 0) {
        r.fast = time_algorithm(grid, AlgorithmChoice::Fast, runs);
        r.bfs  = time_algorithm(grid, AlgorithmChoice::Bfs, runs);
        if (r.fast->mean_s > 0.0)
            r.speedup = r.bfs->mean_s / r.fast->mean_s;
        if (!r.results_match())
            spdlog::error("{}: separable scan returned {} but traversal returned {}",
                          s.name, r.fast->result, r.bfs->result);
    }
    return r;
}

std::vector<ScenarioReport> run_suite(const std::vector<Scenario>& scenarios, int runs)
{
    std::vector<ScenarioReport> out;
    out.reserve(scenarios.size());
    for (const Scenario& s : scenarios) {
        spdlog::info("Benchmarking: {} ({})", s.name, size_label(s.grid));
        out.push_back(run_scenario(s, runs));
    }
    return out;
}

std::vector<Scenario> default_scenarios()
{
    return {
        { "Small Dense",           { 20,  20,  0.20, 0.00, 42 } },
        { "Small Sparse",          { 20,  20,  0.05, 0.00, 42 } },
        { "Medium Dense",          { 50,  50,  0.10, 0.00, 42 } },
        { "Medium with Obstacles", { 50,  50,  0.10, 0.10, 42 } },
        { "Large Sparse",          { 100, 100, 0.02, 0.00, 42 } },
        { "Large with Obstacles",  { 100, 100, 0.05, 0.05, 42 } },
    };
}

std::string format_report(const ScenarioReport& r)
{
    std::ostringstream os;
    const GridSpec& g = r.scenario.grid;
    os << "Testing: " << r.scenario.name << " (" << size_label(g) << ")\n";
    os << std::fixed << std::setprecision(1)
       << "House density: " << g.house_density * 100.0 << "%, Obstacle density: "
       << g.obstacle_density * 100.0 << "%\n";
    os << "Grid composition: " << r.houses << " houses, " << r.obstacles << " obstacles, "
       << r.empty << " empty\n";

    print_timing(os, "Main algorithm: ", r.main);
    if (r.cross_checked()) {
        print_timing(os, "Fast algorithm: ", *r.fast);
        print_timing(os, "BFS algorithm:  ", *r.bfs);
        os << (r.results_match() ? "Fast and BFS results match\n" : "Fast and BFS results differ!\n");
        if (r.speedup)
            os << "Fast algorithm speedup: " << std::setprecision(2) << *r.speedup << "x\n";
    }
    os << std::string(60, '-') << "\n";
    return os.str();
}

std::string format_summary(const std::vector<ScenarioReport>& reports)
{
    std::ostringstream os;
    os << "=== Summary ===\n";
    os << std::left
       << std::setw(22) << "Test Case" << ' '
       << std::setw(10) << "Size" << ' '
       << std::setw(8)  << "Houses" << ' '
       << std::setw(16) << "Time (s)" << ' '
       << "Result\n";
    os << std::string(70, '-') << "\n";

    for (const ScenarioReport& r : reports) {
        std::ostringstream t;
        t << std::fixed << std::setprecision(4) << r.main.mean_s << "+-"
          << std::setprecision(3) << r.main.stddev_s;
        os << std::left
           << std::setw(22) << r.scenario.name << ' '
           << std::setw(10) << size_label(r.scenario.grid) << ' '
           << std::setw(8)  << r.houses << ' '
           << std::setw(16) << t.str() << ' '
           << r.main.result << "\n";
    }
    return os.str();
}

void write_csv(std::ostream& os, const std::vector<ScenarioReport>& reports)
{
    os << "name,rows,cols,house_density,obstacle_density,houses,obstacles,"
          "main_mean_s,main_std_s,result,fast_mean_s,bfs_mean_s,speedup\n";
    os << std::setprecision(9);
    for (const ScenarioReport& r : reports) {
        const GridSpec& g = r.scenario.grid;
        os << csv_field(r.scenario.name) << ',' << g.rows << ',' << g.cols << ','
           << g.house_density << ',' << g.obstacle_density << ','
           << r.houses << ',' << r.obstacles << ','
           << r.main.mean_s << ',' << r.main.stddev_s << ',' << r.main.result << ',';
        if (r.fast) os << r.fast->mean_s;
        os << ',';
        if (r.bfs) os << r.bfs->mean_s;
        os << ',';
        if (r.speedup) os << *r.speedup;
        os << '\n';
    }
}

bool write_csv(const std::string& path, const std::vector<ScenarioReport>& reports)
{
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        spdlog::warn("Could not open '{}' for writing", path);
        return false;
    }
    write_csv(f, reports);
    return static_cast<bool>(f);
}

int run_exit_code(const std::vector<ScenarioReport>& reports, bool exportOk)
{
    const bool allMatch = std::all_of(reports.begin(), reports.end(),
        [](const ScenarioReport& r) { return r.results_match(); });
    if (!allMatch)
        return 3;
    return exportOk ? 0 : 1;
}

} // namespace meetpoint::bench
