#include "meetpoint/bench/BenchConfig.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace meetpoint::bench {

namespace
{
    template <typename T>
    T GetOr(const json& j, const char* key, const T& fallback)
    {
        if (!j.is_object())
            return fallback;
        auto it = j.find(key);
        if (it == j.end())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const json::exception&)
        {
            return fallback;
        }
    }

    // Seeds must be non-negative integers that fit in 32 bits. nlohmann converts
    // -1 to 4294967295 without complaint, so check the stored type first.
    std::uint32_t GetSeedOr(const json& j, const char* key, std::uint32_t fallback)
    {
        if (!j.is_object())
            return fallback;
        auto it = j.find(key);
        if (it == j.end())
            return fallback;
        if (!it->is_number_unsigned() ||
            it->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max())
        {
            spdlog::warn("Ignoring '{}': expected an integer in [0, {}], got {}",
                         key, std::numeric_limits<std::uint32_t>::max(), it->dump());
            return fallback;
        }
        return static_cast<std::uint32_t>(it->get<std::uint64_t>());
    }

    BenchConfig FromJson(const json& root)
    {
        const BenchConfig defaults = BenchConfig::Defaults();
        BenchConfig cfg;
        cfg.runs = GetOr<int>(root, "runs", defaults.runs);
        cfg.seed = GetSeedOr(root, "seed", defaults.seed);

        auto it = root.find("scenarios");
        if (it == root.end() || !it->is_array())
        {
            cfg.scenarios = defaults.scenarios;
            for (Scenario& s : cfg.scenarios)
                s.grid.seed = cfg.seed;
            return cfg;
        }

        int index = 0;
        for (const json& entry : *it)
        {
            Scenario s;
            s.name                  = GetOr<std::string>(entry, "name", "Scenario " + std::to_string(index));
            s.grid.rows             = GetOr<int>(entry, "rows", 0);
            s.grid.cols             = GetOr<int>(entry, "cols", 0);
            s.grid.house_density    = GetOr<double>(entry, "house_density", s.grid.house_density);
            s.grid.obstacle_density = GetOr<double>(entry, "obstacle_density", s.grid.obstacle_density);
            s.grid.seed             = GetSeedOr(entry, "seed", cfg.seed);
            ++index;

            if (!is_valid(s))
            {
                spdlog::warn("Skipping scenario '{}': needs positive rows/cols and densities in [0, 1]", s.name);
                continue;
            }
            cfg.scenarios.push_back(std::move(s));
        }
        return cfg;
    }
}

bool is_valid(const Scenario& s) noexcept
{
    const GridSpec& g = s.grid;
    return g.rows > 0 && g.cols > 0 &&
           g.house_density >= 0.0 && g.house_density <= 1.0 &&
           g.obstacle_density >= 0.0 && g.obstacle_density <= 1.0;
}

BenchConfig BenchConfig::Defaults()
{
    BenchConfig cfg;
    cfg.scenarios = default_scenarios();
    return cfg;
}

BenchConfig BenchConfig::LoadFromString(const std::string& text)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        spdlog::warn("Benchmark config parse error ({}), using defaults", e.what());
        return Defaults();
    }
    if (!root.is_object())
    {
        spdlog::warn("Benchmark config is not a JSON object, using defaults");
        return Defaults();
    }
    return FromJson(root);
}

BenchConfig BenchConfig::LoadFromFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
    {
        spdlog::warn("Could not open benchmark config '{}', using defaults", path);
        return Defaults();
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return LoadFromString(ss.str());
}

std::string BenchConfig::ToString() const
{
    json root;
    root["runs"] = runs;
    root["seed"] = seed;
    json list = json::array();
    for (const Scenario& s : scenarios)
    {
        json entry = {
            { "name",             s.name },
            { "rows",             s.grid.rows },
            { "cols",             s.grid.cols },
            { "house_density",    s.grid.house_density },
            { "obstacle_density", s.grid.obstacle_density },
            { "seed",             s.grid.seed },
        };
        list.push_back(std::move(entry));
    }
    root["scenarios"] = std::move(list);
    return root.dump(2);
}

bool BenchConfig::SaveToFile(const std::string& path) const
{
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f)
    {
        spdlog::warn("Could not write benchmark config '{}'", path);
        return false;
    }
    f << ToString() << '\n';
    return static_cast<bool>(f);
}

} // namespace meetpoint::bench
