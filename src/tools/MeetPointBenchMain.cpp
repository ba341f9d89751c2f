// src/tools/MeetPointBenchMain.cpp
//
// meetpoint_bench: command-line benchmark runner.
// - Generates seeded random grids for each scenario (built-in suite or JSON config)
// - Times solve() and, on obstacle-free grids, the separable scan and the
//   reachability traversal on their own, checking that both agree
// - Prints a report per scenario plus a summary table; optional CSV export
//
// Exit codes: 0 ok, 1 unexpected failure or failed CSV export, 2 bad command line,
// 3 algorithms disagree.

#include "app/CommandLineArgs.h"
#include "logging/Log.h"
#include "meetpoint/bench/BenchConfig.hpp"
#include "meetpoint/bench/Harness.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

using namespace meetpoint;

namespace
{
    spdlog::level::level_enum LevelFor(const app::CommandLineArgs& args)
    {
        if (args.verbose) return spdlog::level::debug;
        if (args.quiet)   return spdlog::level::warn;
        return spdlog::level::info;
    }

    bench::BenchConfig ResolveConfig(const app::CommandLineArgs& args)
    {
        bench::BenchConfig cfg = args.configPath
            ? bench::BenchConfig::LoadFromFile(*args.configPath)
            : bench::BenchConfig::Defaults();

        if (args.runs)
            cfg.runs = *args.runs;
        if (args.seed)
        {
            cfg.seed = *args.seed;
            for (bench::Scenario& s : cfg.scenarios)
                s.grid.seed = *args.seed;
        }
        return cfg;
    }

    int Run(const app::CommandLineArgs& args)
    {
        if (args.writeDefaultConfig)
        {
            if (!bench::BenchConfig::Defaults().SaveToFile(*args.writeDefaultConfig))
                return 1;
            spdlog::info("Wrote default benchmark config to '{}'", *args.writeDefaultConfig);
            return 0;
        }

        const bench::BenchConfig cfg = ResolveConfig(args);
        if (cfg.scenarios.empty())
        {
            spdlog::warn("No scenarios to run");
            return 0;
        }

        std::cout << "=== Optimal Meeting Point Benchmarks ===\n\n";

        std::vector<bench::ScenarioReport> reports;
        reports.reserve(cfg.scenarios.size());
        for (const bench::Scenario& s : cfg.scenarios)
        {
            reports.push_back(bench::run_scenario(s, cfg.runs));
            std::cout << bench::format_report(reports.back());
        }

        std::cout << '\n' << bench::format_summary(reports);

        bool exportOk = true;
        if (args.csvPath)
        {
            exportOk = bench::write_csv(*args.csvPath, reports);
            if (exportOk)
                spdlog::info("Wrote {} rows to '{}'", reports.size(), *args.csvPath);
            else
                spdlog::error("CSV export to '{}' failed", *args.csvPath);
        }

        const int code = bench::run_exit_code(reports, exportOk);
        if (code == 3)
            spdlog::error("Separable scan and reachability traversal disagree on at least one grid");
        return code;
    }
}

int main(int argc, char** argv)
{
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);

    if (args.logFile)
        logsys::init_file_logs(*args.logFile, LevelFor(args));
    else
        logsys::init_console_logs(LevelFor(args));

    if (!args.unknown.empty())
    {
        for (const std::string& u : args.unknown)
            spdlog::error("Unrecognised or invalid argument: {}", u);
        std::cerr << app::BuildCommandLineHelpText();
        return 2;
    }
    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }

    try
    {
        return Run(args);
    }
    catch (const std::exception& e)
    {
        spdlog::error("meetpoint_bench failed: {}", e.what());
        return 1;
    }
}
