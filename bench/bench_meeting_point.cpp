#include <benchmark/benchmark.h>
#include "meetpoint/bench/GridGenerator.hpp"
#include "meetpoint/pathfinding/MeetingPoint.hpp"

using namespace meetpoint;

// Size ladder: side length -> house density, sparser as grids grow.
static double house_density_for(int side) {
    switch (side) {
    case 10:  return 0.15;
    case 25:  return 0.10;
    case 50:  return 0.08;
    case 75:  return 0.06;
    case 100: return 0.04;
    default:  return 0.03;
    }
}

static pf::CellGrid make_grid(int side, double obstacles) {
    return bench::generate_grid({ side, side, house_density_for(side), obstacles, 42 });
}

static void bench_solve_open(benchmark::State& st) {
    const pf::CellGrid g = make_grid(static_cast<int>(st.range(0)), 0.0);
    for (auto _ : st) {
        benchmark::DoNotOptimize(pf::solve(g));
    }
}
BENCHMARK(bench_solve_open)->Arg(10)->Arg(25)->Arg(50)->Arg(75)->Arg(100)->Arg(120);

static void bench_solve_obstacles(benchmark::State& st) {
    const pf::CellGrid g = make_grid(static_cast<int>(st.range(0)), 0.05);
    for (auto _ : st) {
        benchmark::DoNotOptimize(pf::solve(g));
    }
}
BENCHMARK(bench_solve_obstacles)->Arg(10)->Arg(25)->Arg(50)->Arg(75)->Arg(100)->Arg(120);

static void bench_separable_scan(benchmark::State& st) {
    const pf::CellGrid g = make_grid(static_cast<int>(st.range(0)), 0.0);
    const auto houses = g.houses();
    for (auto _ : st) {
        benchmark::DoNotOptimize(pf::scan_no_obstacles(g, houses));
    }
    st.counters["houses"] = static_cast<double>(houses.size());
}
BENCHMARK(bench_separable_scan)->Arg(10)->Arg(25)->Arg(50)->Arg(75)->Arg(100)->Arg(120);

static void bench_reachability_traversal(benchmark::State& st) {
    const pf::CellGrid g = make_grid(static_cast<int>(st.range(0)), 0.0);
    const auto houses = g.houses();
    for (auto _ : st) {
        benchmark::DoNotOptimize(pf::traverse_with_obstacles(g, houses));
    }
    st.counters["houses"] = static_cast<double>(houses.size());
}
BENCHMARK(bench_reachability_traversal)->Arg(10)->Arg(25)->Arg(50)->Arg(75)->Arg(100)->Arg(120);

BENCHMARK_MAIN();
