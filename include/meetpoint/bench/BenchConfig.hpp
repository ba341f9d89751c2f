#pragma once
#include "Harness.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace meetpoint::bench {

// Benchmark run description, loadable from JSON:
//
// {
//   "runs": 5,
//   "seed": 42,
//   "scenarios": [
//     { "name": "Small Dense", "rows": 20, "cols": 20,
//       "house_density": 0.2, "obstacle_density": 0.0, "seed": 42 }
//   ]
// }
//
// A scenario without its own "seed" uses the top-level one.
struct BenchConfig {
    int runs = 5;
    std::uint32_t seed = 42;
    std::vector<Scenario> scenarios;

    // Built-in suite, 5 runs each.
    static BenchConfig Defaults();

    // Missing or unparsable file -> Defaults(). Bad fields fall back to their
    // defaults; invalid scenarios are dropped with a warning.
    static BenchConfig LoadFromFile(const std::string& path);
    static BenchConfig LoadFromString(const std::string& text);

    bool SaveToFile(const std::string& path) const;
    std::string ToString() const;
};

// Rows/cols positive, densities within [0, 1].
[[nodiscard]] bool is_valid(const Scenario& s) noexcept;

} // namespace meetpoint::bench
