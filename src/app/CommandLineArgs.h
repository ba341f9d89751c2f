#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meetpoint::app {

// Parsed command-line arguments for the meetpoint_bench runner.
//
// Notes:
//   - All option names are case-insensitive (values are kept as typed).
//   - "--opt value", "--opt=value" and "--opt:value" are all accepted.
struct CommandLineArgs
{
    bool showHelp = false;          // --help / -h / -?
    bool verbose = false;           // --verbose / -v  (debug logging)
    bool quiet = false;             // --quiet / -q    (warnings and errors only)

    std::optional<std::string> configPath;        // --config <file.json>
    std::optional<std::string> csvPath;           // --csv <file.csv>
    std::optional<std::string> logFile;           // --log-file <file>
    std::optional<std::string> writeDefaultConfig; // --write-default-config <file.json>

    std::optional<int> runs;            // --runs <1..N>
    std::optional<std::uint32_t> seed;  // --seed <n>

    // Unknown options and options with missing/bad values, in argv order.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace meetpoint::app
