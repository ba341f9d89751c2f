#include <doctest/doctest.h>
#include "meetpoint/bench/Harness.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

using namespace meetpoint;

TEST_CASE("Harness/TimeAlgorithmClampsRuns") {
    const pf::CellGrid g = pf::CellGrid::from_rows({ { 1, 0, 1, 0, 1 } });

    const auto once = bench::time_algorithm(g, bench::AlgorithmChoice::Main, 0);
    CHECK(once.runs == 1);
    CHECK(once.stddev_s == 0.0);
    CHECK(once.mean_s >= 0.0);
    CHECK(once.result == 5);

    const auto many = bench::time_algorithm(g, bench::AlgorithmChoice::Bfs, 4);
    CHECK(many.runs == 4);
    CHECK(many.stddev_s >= 0.0);
    CHECK(many.result == 5);
}

TEST_CASE("Harness/RunOnceRoutes") {
    // Obstacles: the raw separable scan is wrong here, the other two agree.
    const pf::CellGrid g = pf::CellGrid::from_rows({ { 1, 2, 1 }, { 0, 2, 0 }, { 0, 0, 0 } });
    CHECK(bench::run_once(g, bench::AlgorithmChoice::Main) == 6);
    CHECK(bench::run_once(g, bench::AlgorithmChoice::Bfs) == 6);
    CHECK(bench::run_once(g, bench::AlgorithmChoice::Fast) == 4);
    CHECK(bench::to_string(bench::AlgorithmChoice::Fast) == "fast");
}

TEST_CASE("Harness/ObstacleFreeScenarioIsCrossChecked") {
    const bench::Scenario s{ "open", { 12, 12, 0.1, 0.0, 42 } };
    const auto r = bench::run_scenario(s, 2);

    CHECK(r.houses == 14u);
    CHECK(r.obstacles == 0u);
    CHECK(r.empty == 130u);
    REQUIRE(r.cross_checked());
    CHECK(r.results_match());
    CHECK(r.fast->result == r.main.result);
    CHECK(r.bfs->result == r.main.result);
    CHECK(r.main.result > 0);
}

TEST_CASE("Harness/ObstacleScenarioOnlyTimesMain") {
    const bench::Scenario s{ "walls", { 12, 12, 0.1, 0.1, 42 } };
    const auto r = bench::run_scenario(s, 1);
    CHECK(r.obstacles == 13u); // floor(130 * 0.1)
    CHECK_FALSE(r.cross_checked());
    CHECK_FALSE(r.speedup.has_value());
    CHECK(r.results_match());
}

TEST_CASE("Harness/NoHousesScenario") {
    const bench::Scenario s{ "empty", { 5, 5, 0.0, 0.0, 42 } };
    const auto r = bench::run_scenario(s, 1);
    CHECK(r.houses == 0u);
    CHECK(r.main.result == pf::kNoMeetingPoint);
    CHECK_FALSE(r.cross_checked());
}

TEST_CASE("Harness/DefaultSuite") {
    const auto suite = bench::default_scenarios();
    REQUIRE(suite.size() == 6u);
    CHECK(suite.front().name == "Small Dense");
    CHECK(suite[3].grid.obstacle_density == doctest::Approx(0.1));
    CHECK(suite.back().grid.rows == 100);
}

TEST_CASE("Harness/Reporting") {
    const std::vector<bench::Scenario> scenarios = {
        { "tiny open",  { 6, 6, 0.2, 0.0, 1 } },
        { "tiny walls", { 6, 6, 0.2, 0.2, 1 } },
    };
    const auto reports = bench::run_suite(scenarios, 1);
    REQUIRE(reports.size() == 2u);

    const std::string report = bench::format_report(reports[0]);
    CHECK(report.find("Testing: tiny open (6x6)") != std::string::npos);
    CHECK(report.find("Fast and BFS results match") != std::string::npos);

    const std::string walls = bench::format_report(reports[1]);
    CHECK(walls.find("BFS algorithm") == std::string::npos);

    const std::string summary = bench::format_summary(reports);
    CHECK(summary.find("tiny open") != std::string::npos);
    CHECK(summary.find("tiny walls") != std::string::npos);

    std::ostringstream csv;
    bench::write_csv(csv, reports);
    const std::string text = csv.str();
    CHECK(text.rfind("name,rows,cols,", 0) == 0);

    int lines = 0;
    for (char ch : text) lines += (ch == '\n');
    CHECK(lines == 3);
}

TEST_CASE("Harness/CsvQuotesScenarioNames") {
    const std::vector<bench::Scenario> scenarios = {
        { "Dense, \"6x6\"", { 6, 6, 0.2, 0.0, 3 } },
        { "plain",          { 6, 6, 0.2, 0.0, 3 } },
    };
    const auto reports = bench::run_suite(scenarios, 1);

    std::ostringstream csv;
    bench::write_csv(csv, reports);
    const std::string text = csv.str();

    CHECK(text.find("\n\"Dense, \"\"6x6\"\"\",6,6,") != std::string::npos);
    CHECK(text.find("\nplain,6,6,") != std::string::npos);

    // Every data row still has the header's 13 columns once the quoted name
    // is treated as one field.
    std::istringstream lines(text);
    std::string line;
    std::getline(lines, line);
    while (std::getline(lines, line)) {
        int fields = 1;
        bool quoted = false;
        for (char ch : line) {
            if (ch == '"') quoted = !quoted;
            else if (ch == ',' && !quoted) ++fields;
        }
        CHECK(fields == 13);
    }
}

TEST_CASE("Harness/RunExitCode") {
    bench::ScenarioReport agree;
    agree.fast = bench::TimingSample{ 0.0, 0.0, 4, 1 };
    agree.bfs  = bench::TimingSample{ 0.0, 0.0, 4, 1 };

    bench::ScenarioReport disagree = agree;
    disagree.bfs->result = 6;

    const std::vector<bench::ScenarioReport> ok = { agree };
    const std::vector<bench::ScenarioReport> bad = { agree, disagree };

    CHECK(bench::run_exit_code(ok, true) == 0);
    CHECK(bench::run_exit_code(ok, false) == 1);
    CHECK(bench::run_exit_code(bad, true) == 3);
    CHECK(bench::run_exit_code(bad, false) == 3);
    CHECK(bench::run_exit_code({}, true) == 0);
}

TEST_CASE("Harness/CsvExportToMissingDirectoryFails") {
    const std::vector<bench::Scenario> scenarios = { { "tiny", { 4, 4, 0.25, 0.0, 1 } } };
    const auto reports = bench::run_suite(scenarios, 1);

    const auto dir = std::filesystem::temp_directory_path() / "meetpoint_no_such_dir_for_csv";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    const bool written = bench::write_csv((dir / "out.csv").string(), reports);
    CHECK_FALSE(written);
    CHECK(bench::run_exit_code(reports, written) == 1);
}
