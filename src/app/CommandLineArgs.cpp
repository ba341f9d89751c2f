#include "app/CommandLineArgs.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace meetpoint::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Matches "--opt=value" / "--opt:value". `arg` is the lowered form used for
// matching, `raw` the original so the value keeps its case.
[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view raw,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n)
        return false;

    const char sep = arg[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = raw.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<long long> ParseInteger(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 10'000'000'000LL)
            return std::nullopt; // absurd
    }
    return v * sign;
}

[[nodiscard]] std::optional<int> ParseRuns(std::string_view s)
{
    const auto v = ParseInteger(s);
    if (!v || *v < 1 || *v > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(*v);
}

[[nodiscard]] std::optional<std::uint32_t> ParseSeed(std::string_view s)
{
    const auto v = ParseInteger(s);
    if (!v || *v < 0 || *v > std::numeric_limits<std::uint32_t>::max())
        return std::nullopt;
    return static_cast<std::uint32_t>(*v);
}

[[nodiscard]] std::optional<std::string> ParsePath(std::string_view s)
{
    if (s.empty())
        return std::nullopt;
    return std::string(s);
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const std::size_t argc = argv.size();

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Simple flags
        if (arg == "--verbose" || arg == "-v") { out.verbose = true; continue; }
        if (arg == "--quiet" || arg == "-q") { out.quiet = true; continue; }

        // Options with values: "--opt value" or "--opt=value".
        std::string_view value;

        const auto option = [&](std::string_view name, std::string_view alias, auto& dst, auto parse) -> bool {
            if (arg == name || (!alias.empty() && arg == alias)) {
                if (i + 1 >= argc) {
                    addUnknown(raw);
                    return true;
                }
                const auto parsed = parse(argv[i + 1]);
                if (!parsed) {
                    addUnknown(raw);
                    return true;
                }
                dst = *parsed;
                ++i;
                return true;
            }
            if (ConsumeValue(arg, raw, name, value) ||
                (!alias.empty() && ConsumeValue(arg, raw, alias, value))) {
                const auto parsed = parse(value);
                if (!parsed)
                    addUnknown(raw);
                else
                    dst = *parsed;
                return true;
            }
            return false;
        };

        if (option("--config", "-c", out.configPath, ParsePath)) continue;
        if (option("--csv", "", out.csvPath, ParsePath)) continue;
        if (option("--log-file", "--log", out.logFile, ParsePath)) continue;
        if (option("--write-default-config", "", out.writeDefaultConfig, ParsePath)) continue;
        if (option("--runs", "-n", out.runs, ParseRuns)) continue;
        if (option("--seed", "-s", out.seed, ParseSeed)) continue;

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "meetpoint_bench - optimal meeting point benchmarks\n\n";
    oss << "Usage: meetpoint_bench [options]\n\n";

    oss << "Benchmark\n";
    oss << "  --config, -c <file.json>      Load scenarios (default: built-in suite)\n";
    oss << "  --runs, -n <N>                Repetitions per algorithm (default 5)\n";
    oss << "  --seed, -s <N>                Seed for every scenario (overrides config)\n";
    oss << "  --csv <file.csv>              Also write timings as CSV\n";
    oss << "  --write-default-config <file> Write the built-in suite as JSON and exit\n\n";

    oss << "Logging\n";
    oss << "  --log-file <file>             Copy log output to a file\n";
    oss << "  --verbose, -v                 Debug logging\n";
    oss << "  --quiet, -q                   Warnings and errors only\n\n";

    oss << "Misc\n";
    oss << "  --help, -h                    Show this help\n\n";

    oss << "Examples\n";
    oss << "  meetpoint_bench --runs 10 --csv timings.csv\n";
    oss << "  meetpoint_bench --config=bench.json --seed 7\n";
    return oss.str();
}

} // namespace meetpoint::app
